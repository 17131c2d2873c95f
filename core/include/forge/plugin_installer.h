#pragma once

#include "forge/catalog.h"
#include "forge/config.h"
#include "forge/system_deps.h"

#include <ostream>
#include <string>
#include <vector>

namespace forge {

// Install, update, remove and list the external plugins of a catalog.
// Every operation returns a process exit code (0 ok, 1 failed). Progress
// goes to out, problems to err.
class PluginInstaller {
public:
    PluginInstaller(const PluginCatalog& catalog,
                    ForgeConfig config,
                    InstallerTable table,
                    std::ostream& out,
                    std::ostream& err);

    // Presence check used for system dependencies. Default: PATH lookup.
    void setPresenceCheck(PresenceCheck check) { present_ = std::move(check); }

    // strict: a failed system dependency makes the result 1 (after
    // everything else still ran).
    int install(const std::string& name, bool strict);
    int update(const std::string& name, bool strict);
    int updateAll(bool strict);
    int remove(const std::string& name);

    std::string formatList(const std::string& tag_filter, bool verbose) const;
    bool isInstalled(const CatalogEntry& e) const;

    // One entry per failed or skipped system dependency.
    const std::vector<std::string>& warnings() const { return warnings_; }

private:
    const CatalogEntry* resolve(const std::string& name);
    std::vector<DependencyInstallResult> installDeps(const CatalogEntry& e);
    int finishDeps(const CatalogEntry& e, const std::vector<DependencyInstallResult>& results, bool strict);

    int installBinary(const CatalogEntry& e);
    int installNative(const CatalogEntry& e, bool strict);
    int installWrapper(const CatalogEntry& e, bool strict);

    int removeBinary(const CatalogEntry& e);
    int removeNative(const CatalogEntry& e);
    int removeWrapper(const CatalogEntry& e);

    bool binarySource(const CatalogEntry& e, SystemDependencySpec* spec, std::string* err) const;
    std::string binaryPath(const SystemDependencySpec& spec) const;
    std::string nativeLibraryPath(const CatalogEntry& e) const;
    void noteSharedDeps(const CatalogEntry& e);

    const PluginCatalog& catalog_;
    ForgeConfig config_;
    InstallerTable table_;
    PresenceCheck present_;
    std::ostream& out_;
    std::ostream& err_;
    std::vector<std::string> warnings_;
};

} // namespace forge
