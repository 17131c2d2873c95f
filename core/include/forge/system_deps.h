#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace forge {

// One non-native binary a plugin needs on PATH.
struct SystemDependencySpec {
    std::string manager;        // "go" | "npm" | "github_release" | any table entry
    std::string package;        // verbatim install argument; "repo@tag" for releases
    std::string binary;         // presence-checked on PATH

    // github_release only
    std::string repo;
    std::string tag;
    std::string asset;          // may contain {os} / {arch}
    std::string install_dir{"~/.local/bin"};
};

struct DependencyInstallResult {
    SystemDependencySpec spec;
    bool already_installed{false};
    bool success{false};
    std::string error_message;  // remediation text when !success
};

using InstallFn = std::function<DependencyInstallResult(const SystemDependencySpec&)>;

// Manager name -> install strategy. New strategies are added here without
// touching the call sites.
class InstallerTable {
public:
    // go, npm and github_release, each bounded by timeout_ms.
    static InstallerTable defaults(int timeout_ms = 600000);

    void add(const std::string& manager, InstallFn fn) { fns_[manager] = std::move(fn); }
    const InstallFn* find(const std::string& manager) const;
    bool contains(const std::string& manager) const { return fns_.count(manager) != 0; }
    std::vector<std::string> names() const;    // sorted

private:
    std::map<std::string, InstallFn> fns_;
};

// Returns true if the binary is already available.
using PresenceCheck = std::function<bool(const std::string& binary)>;

// Default presence check: PATH lookup.
bool binary_on_path(const std::string& binary);

struct DependencyCheck {
    std::string name;
    bool available{false};
    std::string path;           // resolved location when available
};

// PATH lookup for each named tool, in order.
std::vector<DependencyCheck> check_dependencies(const std::vector<std::string>& tools);

// Parse a system_deps JSON array. Malformed entries (missing manager/binary,
// unknown manager, missing package, incomplete release fields) are skipped
// and described in warnings.
std::vector<SystemDependencySpec> parse_system_deps(const std::string& array_json,
                                                    const InstallerTable& table,
                                                    std::vector<std::string>* warnings);

// Parse one spec object (a system_deps element or a binary_source).
// default_manager/default_binary fill in absent fields.
bool parse_dependency_spec(const std::string& object_json,
                           const std::string& default_manager,
                           const std::string& default_binary,
                           const InstallerTable& table,
                           SystemDependencySpec* out,
                           std::string* err);

// Install each spec whose binary is absent. Never throws for one failed
// dependency; a manager missing from the table is a failed result.
std::vector<DependencyInstallResult> install_system_deps(const std::vector<SystemDependencySpec>& specs,
                                                         const InstallerTable& table,
                                                         const PresenceCheck& present = binary_on_path);

// Run "<argv...>" when cli_tool is on PATH; otherwise fail with not_found_msg.
DependencyInstallResult install_via_cli(const SystemDependencySpec& spec,
                                        const std::string& cli_tool,
                                        const std::vector<std::string>& argv,
                                        const std::string& not_found_msg,
                                        int timeout_ms);

DependencyInstallResult install_go(const SystemDependencySpec& spec, int timeout_ms);
DependencyInstallResult install_npm(const SystemDependencySpec& spec, int timeout_ms);
DependencyInstallResult install_github_release(const SystemDependencySpec& spec, int timeout_ms);

} // namespace forge
