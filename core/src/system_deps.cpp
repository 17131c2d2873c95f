#include "forge/system_deps.h"
#include "forge/json_mini.h"
#include "forge/log.h"
#include "forge/proc.h"
#include "forge/release_fetch.h"
#include "forge/util.h"

namespace forge {

const InstallFn* InstallerTable::find(const std::string& manager) const {
    auto it = fns_.find(manager);
    if (it == fns_.end()) return nullptr;
    return &it->second;
}

std::vector<std::string> InstallerTable::names() const {
    std::vector<std::string> out;
    for (const auto& kv : fns_) out.push_back(kv.first);
    return out;
}

InstallerTable InstallerTable::defaults(int timeout_ms) {
    InstallerTable t;
    t.add("go", [timeout_ms](const SystemDependencySpec& s) { return install_go(s, timeout_ms); });
    t.add("npm", [timeout_ms](const SystemDependencySpec& s) { return install_npm(s, timeout_ms); });
    t.add("github_release", [timeout_ms](const SystemDependencySpec& s) { return install_github_release(s, timeout_ms); });
    return t;
}

bool binary_on_path(const std::string& binary) {
    return !find_executable(binary).empty();
}

std::vector<DependencyCheck> check_dependencies(const std::vector<std::string>& tools) {
    std::vector<DependencyCheck> out;
    out.reserve(tools.size());
    for (const auto& t : tools) {
        DependencyCheck c;
        c.name = t;
        c.path = find_executable(t);
        c.available = !c.path.empty();
        out.push_back(std::move(c));
    }
    return out;
}

static std::string join_names(const std::vector<std::string>& v) {
    std::string out;
    for (size_t i = 0; i < v.size(); i++) {
        if (i) out += ", ";
        out += v[i];
    }
    return out;
}

bool parse_dependency_spec(const std::string& object_json,
                           const std::string& default_manager,
                           const std::string& default_binary,
                           const InstallerTable& table,
                           SystemDependencySpec* out,
                           std::string* err) {
    json_mini::Doc doc = json_mini::parse_object(object_json);
    if (!doc) {
        if (err) *err = "entry is not an object: " + object_json;
        return false;
    }

    SystemDependencySpec s;
    s.manager = json_mini::get_string(doc.root, "manager").value_or(default_manager);
    s.binary = json_mini::get_string(doc.root, "binary").value_or(default_binary);
    if (s.manager.empty() || s.binary.empty()) {
        if (err) *err = "malformed entry (missing manager/binary): " + object_json;
        return false;
    }
    if (!table.contains(s.manager)) {
        if (err) *err = "unknown manager '" + s.manager + "' (supported: " + join_names(table.names()) + ")";
        return false;
    }

    if (s.manager == "github_release") {
        s.repo = json_mini::get_string(doc.root, "repo").value_or("");
        s.tag = json_mini::get_string(doc.root, "tag").value_or("");
        s.asset = json_mini::get_string(doc.root, "asset").value_or("");
        if (s.repo.empty() || s.tag.empty() || s.asset.empty()) {
            if (err) *err = "github_release entry missing repo/tag/asset: " + object_json;
            return false;
        }
        s.package = s.repo + "@" + s.tag;
        s.install_dir = json_mini::get_string(doc.root, "install_dir").value_or("~/.local/bin");
    } else {
        s.package = json_mini::get_string(doc.root, "package").value_or("");
        if (s.package.empty()) {
            if (err) *err = "entry missing package: " + object_json;
            return false;
        }
        if (auto dir = json_mini::get_string(doc.root, "install_dir")) s.install_dir = *dir;
    }

    if (out) *out = std::move(s);
    return true;
}

std::vector<SystemDependencySpec> parse_system_deps(const std::string& array_json,
                                                    const InstallerTable& table,
                                                    std::vector<std::string>* warnings) {
    std::vector<SystemDependencySpec> specs;
    if (trim(array_json).empty()) return specs;

    json_mini::Doc doc = json_mini::parse(array_json);
    if (!doc || !json_object_is_type(doc.root, json_type_array)) {
        if (warnings) warnings->push_back("system_deps is not a JSON array; ignored");
        return specs;
    }

    for (size_t i = 0; i < json_object_array_length(doc.root); i++) {
        json_object* el = json_object_array_get_idx(doc.root, i);
        SystemDependencySpec s;
        std::string err;
        if (!parse_dependency_spec(json_mini::to_string(el), "", "", table, &s, &err)) {
            if (warnings) warnings->push_back("skipping system_deps entry: " + err);
            continue;
        }
        specs.push_back(std::move(s));
    }
    return specs;
}

std::vector<DependencyInstallResult> install_system_deps(const std::vector<SystemDependencySpec>& specs,
                                                         const InstallerTable& table,
                                                         const PresenceCheck& present) {
    std::vector<DependencyInstallResult> results;
    results.reserve(specs.size());
    for (const auto& spec : specs) {
        if (present && present(spec.binary)) {
            DependencyInstallResult r;
            r.spec = spec;
            r.already_installed = true;
            r.success = true;
            results.push_back(std::move(r));
            continue;
        }

        const InstallFn* fn = table.find(spec.manager);
        if (!fn) {
            DependencyInstallResult r;
            r.spec = spec;
            r.error_message = "no installer for manager '" + spec.manager + "'";
            results.push_back(std::move(r));
            continue;
        }

        log_info("deps", "installing " + spec.binary + " via " + spec.manager);
        try {
            results.push_back((*fn)(spec));
        } catch (const std::exception& e) {
            DependencyInstallResult r;
            r.spec = spec;
            r.error_message = std::string("installer for '") + spec.manager + "' failed: " + e.what();
            results.push_back(std::move(r));
        }
    }
    return results;
}

DependencyInstallResult install_via_cli(const SystemDependencySpec& spec,
                                        const std::string& cli_tool,
                                        const std::vector<std::string>& argv,
                                        const std::string& not_found_msg,
                                        int timeout_ms) {
    DependencyInstallResult r;
    r.spec = spec;

    std::string tool = find_executable(cli_tool);
    if (tool.empty()) {
        r.error_message = not_found_msg;
        return r;
    }

    std::vector<std::string> full = argv;
    full[0] = tool;
    ProcLimits lim;
    lim.timeout_ms = timeout_ms;
    ProcResult pr;
    if (!proc_run_capture(full, "", lim, &pr)) {
        r.error_message = "cannot run " + cli_tool + ": " + pr.error;
        return r;
    }
    if (pr.timed_out) {
        r.error_message = cli_tool + " timed out after " + std::to_string(timeout_ms) + " ms";
        return r;
    }
    if (pr.exit_code == 0) {
        r.success = true;
        return r;
    }
    std::string msg = trim(pr.error_output);
    r.error_message = msg.empty() ? cli_tool + " exited with code " + std::to_string(pr.exit_code) : msg;
    return r;
}

DependencyInstallResult install_go(const SystemDependencySpec& spec, int timeout_ms) {
    return install_via_cli(spec, "go", {"go", "install", spec.package},
                           "Go runtime not found. Install Go from https://go.dev/dl/ then re-run: go install " +
                               spec.package,
                           timeout_ms);
}

DependencyInstallResult install_npm(const SystemDependencySpec& spec, int timeout_ms) {
    return install_via_cli(spec, "npm", {"npm", "install", "-g", spec.package},
                           "npm not found. Install Node.js from https://nodejs.org/ then re-run: npm install -g " +
                               spec.package,
                           timeout_ms);
}

DependencyInstallResult install_github_release(const SystemDependencySpec& spec, int timeout_ms) {
    DependencyInstallResult r;
    r.spec = spec;
    if (spec.repo.empty() || spec.tag.empty() || spec.asset.empty()) {
        r.error_message = "github_release spec is missing repo, tag, or asset";
        return r;
    }

    ReleaseRequest req;
    req.repo = spec.repo;
    req.tag = spec.tag;
    req.asset_name = resolve_asset_name(spec.asset, PlatformInfo::current());
    req.dest_path = expand_user(spec.install_dir) + "/" + spec.binary;
    req.timeout_ms = timeout_ms;

    std::string err;
    if (!fetch_release_asset(req, &err)) {
        r.error_message = err;
        return r;
    }
    r.success = true;
    return r;
}

} // namespace forge
