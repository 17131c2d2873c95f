#include "forge/plugin_installer.h"
#include "forge/introspection.h"
#include "forge/json_mini.h"
#include "forge/log.h"
#include "forge/plugin_loader.h"
#include "forge/proc.h"
#include "forge/state_file.h"
#include "forge/util.h"
#include "forge/wrapper_plugin.h"

#include <cstdio>
#include <filesystem>
#include <sstream>

namespace forge {

static std::string join(const std::vector<std::string>& v, const char* sep) {
    std::string out;
    for (size_t i = 0; i < v.size(); i++) {
        if (i) out += sep;
        out += v[i];
    }
    return out;
}

PluginInstaller::PluginInstaller(const PluginCatalog& catalog,
                                 ForgeConfig config,
                                 InstallerTable table,
                                 std::ostream& out,
                                 std::ostream& err)
    : catalog_(catalog),
      config_(std::move(config)),
      table_(std::move(table)),
      present_(binary_on_path),
      out_(out),
      err_(err) {}

const CatalogEntry* PluginInstaller::resolve(const std::string& name) {
    const CatalogEntry* e = catalog_.find(name);
    if (e) return e;
    err_ << "Error: Plugin '" << name << "' not found in registry\n";
    if (!catalog_.empty()) {
        err_ << "\nAvailable plugins: " << join(catalog_.names(), ", ") << "\n";
    }
    return nullptr;
}

bool PluginInstaller::binarySource(const CatalogEntry& e, SystemDependencySpec* spec, std::string* err) const {
    if (e.binary_source_json.empty()) {
        if (err) *err = std::string(plugin_type_name(e.type)) + " plugin '" + e.name + "' has no 'binary_source' config";
        return false;
    }
    std::string default_binary = e.type == PluginType::NATIVE ? e.name + plugin_library_extension() : e.name;
    return parse_dependency_spec(e.binary_source_json, "github_release", default_binary, table_, spec, err);
}

std::string PluginInstaller::binaryPath(const SystemDependencySpec& spec) const {
    std::string p = expand_user(spec.install_dir) + "/" + spec.binary;
    std::error_code ec;
    if (std::filesystem::exists(p, ec)) return p;
    std::string on_path = find_executable(spec.binary);
    return on_path.empty() ? p : on_path;
}

std::string PluginInstaller::nativeLibraryPath(const CatalogEntry& e) const {
    SystemDependencySpec spec;
    std::string lib = e.name + plugin_library_extension();
    if (binarySource(e, &spec, nullptr)) lib = spec.binary;
    return config_.plugin_dir + "/" + lib;
}

std::vector<DependencyInstallResult> PluginInstaller::installDeps(const CatalogEntry& e) {
    std::vector<std::string> parse_warnings;
    auto specs = parse_system_deps(e.system_deps_json, table_, &parse_warnings);
    for (const auto& w : parse_warnings) {
        err_ << "Warning: " << w << "\n";
        warnings_.push_back(w);
    }
    if (specs.empty()) return {};

    out_ << "\nInstalling system dependencies for '" << e.name << "'...\n";
    auto results = install_system_deps(specs, table_, present_);
    for (const auto& r : results) {
        if (r.already_installed) {
            out_ << "  " << r.spec.binary << ": already installed, skipping\n";
        } else if (r.success) {
            out_ << "  " << r.spec.binary << ": installed via " << r.spec.manager << "\n";
        } else {
            err_ << "  Warning: " << r.spec.binary << ": " << r.error_message << "\n";
            warnings_.push_back(r.spec.binary + " (" + r.spec.manager + "): " + r.error_message);
        }
    }
    return results;
}

int PluginInstaller::finishDeps(const CatalogEntry& e, const std::vector<DependencyInstallResult>& results, bool strict) {
    std::vector<const DependencyInstallResult*> failed;
    for (const auto& r : results) {
        if (!r.success) failed.push_back(&r);
    }
    if (failed.empty()) return 0;

    out_ << "\nWarning: '" << e.name << "' installed but these system deps need manual setup:\n";
    for (const auto* r : failed) {
        out_ << "  " << r->spec.binary << " (" << r->spec.manager << "): " << r->spec.package << "\n";
        std::istringstream lines(r->error_message);
        std::string line;
        while (std::getline(lines, line)) out_ << "    " << line << "\n";
    }
    out_ << "\nThe plugin is installed but may not function until the above are resolved.\n";
    if (strict) {
        err_ << "\nError: system dependency installation failed (--strict mode)\n";
        return 1;
    }
    return 0;
}

int PluginInstaller::install(const std::string& name, bool strict) {
    const CatalogEntry* e = resolve(name);
    if (!e) return 1;

    if (e->is_private) {
        err_ << "\nNote: This is a private repository. Ensure you have access via gh auth or GITHUB_TOKEN.\n";
    }

    switch (e->type) {
        case PluginType::BINARY: {
            auto deps = installDeps(*e);
            int rc = installBinary(*e);
            if (rc != 0) return rc;
            return finishDeps(*e, deps, strict);
        }
        case PluginType::NATIVE:  return installNative(*e, strict);
        case PluginType::WRAPPER: return installWrapper(*e, strict);
    }
    return 1;
}

int PluginInstaller::installBinary(const CatalogEntry& e) {
    SystemDependencySpec spec;
    std::string err;
    if (!binarySource(e, &spec, &err)) {
        err_ << "Error: " << err << "\n";
        return 1;
    }

    out_ << "Installing binary plugin '" << e.name << "'...\n";
    DependencyInstallResult r = install_system_deps({spec}, table_, present_).front();
    if (r.already_installed) {
        out_ << "  " << spec.binary << ": already installed, skipping download\n";
    } else if (r.success) {
        out_ << "  " << spec.binary << ": installed to " << expand_user(spec.install_dir) << "\n";
    } else {
        err_ << "  Error: Failed to install " << spec.binary << ": " << r.error_message << "\n";
        return 1;
    }

    std::string path = binaryPath(spec);
    PluginDescriptor desc;
    if (!introspect_binary(path, config_.introspect_timeout_ms, &desc, &err)) {
        err_ << "Error: " << err << "\n";
        return 1;
    }
    if (desc.name != e.name) {
        log_warn("installer", "binary for '" + e.name + "' introspects as '" + desc.name + "'");
    }

    IntrospectionCache cache(config_.binary_cache_path());
    std::vector<std::string> cache_warnings;
    std::string cerr;
    if (!cache.load(&cache_warnings, &cerr)) {
        err_ << "Warning: " << cerr << "; starting a new cache\n";
    }
    cache.put(e.name, CachedBinaryPlugin{path, desc});
    if (!cache.save(&cerr)) {
        err_ << "Error: cannot write " << cache.path() << ": " << cerr << "\n";
        return 1;
    }

    out_ << "\n✓ Binary plugin '" << e.name << "' installed successfully\n";
    out_ << "\nUsage: forge " << desc.name << " --help\n";
    return 0;
}

int PluginInstaller::installNative(const CatalogEntry& e, bool strict) {
    SystemDependencySpec spec;
    std::string err;
    if (!binarySource(e, &spec, &err)) {
        err_ << "Error: " << err << "\n";
        return 1;
    }
    spec.install_dir = config_.plugin_dir;

    out_ << "Installing plugin '" << e.name << "'...\n";
    auto deps = installDeps(e);

    std::string lib = nativeLibraryPath(e);
    std::error_code ec;
    if (std::filesystem::exists(lib, ec)) {
        out_ << "  " << spec.binary << ": already present in " << config_.plugin_dir << "\n";
    } else {
        const InstallFn* fn = table_.find(spec.manager);
        DependencyInstallResult r;
        if (fn) {
            r = (*fn)(spec);
        } else {
            r.error_message = "no installer for manager '" + spec.manager + "'";
        }
        if (!r.success) {
            err_ << "\nError: Failed to install plugin '" << e.name << "': " << r.error_message << "\n";
            return 1;
        }
        out_ << "  " << spec.binary << ": installed to " << config_.plugin_dir << "\n";
    }

    out_ << "\n✓ Plugin '" << e.name << "' installed successfully\n";
    out_ << "\nUsage: forge " << e.name << " --help\n";
    return finishDeps(e, deps, strict);
}

int PluginInstaller::installWrapper(const CatalogEntry& e, bool strict) {
    if (e.wrapper_json.empty()) {
        err_ << "Error: Wrapper plugin '" << e.name << "' has no 'wrapper' definition\n";
        return 1;
    }

    // name and description default to the catalog's
    json_mini::Doc doc = json_mini::parse_object(e.wrapper_json);
    if (!json_mini::has_key(doc.root, "name")) {
        json_object_object_add(doc.root, "name", json_mini::new_string(e.name));
    }
    if (!json_mini::has_key(doc.root, "description")) {
        json_object_object_add(doc.root, "description", json_mini::new_string(e.description));
    }
    WrapperDefinition def;
    std::string err;
    if (!wrapper_from_json(json_mini::to_string(doc.root), &def, &err)) {
        err_ << "Error: invalid wrapper definition for '" << e.name << "': " << err << "\n";
        return 1;
    }

    out_ << "Installing plugin '" << e.name << "'...\n";
    auto deps = installDeps(e);

    JsonObjectStore store(config_.wrapper_defs_path());
    if (!store.load(&err)) {
        err_ << "Warning: " << err << "; starting a new definitions file\n";
    }
    store.put(e.name, wrapper_to_json(def));
    if (!store.save(&err)) {
        err_ << "Error: cannot write " << store.path() << ": " << err << "\n";
        return 1;
    }

    out_ << "\n✓ Plugin '" << e.name << "' installed successfully\n";
    out_ << "\nUsage: forge " << def.name << " --help\n";
    return finishDeps(e, deps, strict);
}

int PluginInstaller::update(const std::string& name, bool strict) {
    const CatalogEntry* e = resolve(name);
    if (!e) return 1;

    out_ << "Removing current version of '" << name << "'...\n";
    switch (e->type) {
        case PluginType::BINARY:  (void)removeBinary(*e); break;
        case PluginType::NATIVE:  (void)removeNative(*e); break;
        case PluginType::WRAPPER: (void)removeWrapper(*e); break;
    }
    return install(name, strict);
}

int PluginInstaller::updateAll(bool strict) {
    if (catalog_.empty()) {
        out_ << "No external plugins in registry to update\n";
        return 0;
    }
    out_ << "Updating " << catalog_.size() << " external plugin(s)...\n\n";

    std::vector<std::string> failed;
    for (const auto& name : catalog_.names()) {
        if (update(name, strict) != 0) failed.push_back(name);
        out_ << "\n";
    }
    if (!failed.empty()) {
        err_ << "\n✗ Failed to update: " << join(failed, ", ") << "\n";
        return 1;
    }
    out_ << "\n✓ All plugins updated successfully\n";
    return 0;
}

int PluginInstaller::remove(const std::string& name) {
    const CatalogEntry* e = resolve(name);
    if (!e) return 1;

    int rc = 1;
    switch (e->type) {
        case PluginType::BINARY:  rc = removeBinary(*e); break;
        case PluginType::NATIVE:  rc = removeNative(*e); break;
        case PluginType::WRAPPER: rc = removeWrapper(*e); break;
    }
    if (rc == 0) noteSharedDeps(*e);
    return rc;
}

int PluginInstaller::removeBinary(const CatalogEntry& e) {
    out_ << "Removing binary plugin '" << e.name << "'...\n";

    IntrospectionCache cache(config_.binary_cache_path());
    std::vector<std::string> cache_warnings;
    std::string err;
    bool cache_ok = cache.load(&cache_warnings, &err);

    // Only ever delete the file this installer placed: the cached path, or
    // the configured install location.
    std::string path;
    if (auto cached = cache.get(e.name)) path = cached->binary_path;
    SystemDependencySpec spec;
    if (path.empty() && binarySource(e, &spec, nullptr)) path = expand_user(spec.install_dir) + "/" + spec.binary;

    std::error_code ec;
    if (!path.empty() && std::filesystem::exists(path, ec)) {
        std::filesystem::remove(path, ec);
        if (ec) {
            err_ << "  Error: cannot remove " << path << ": " << ec.message() << "\n";
            return 1;
        }
        out_ << "  Removed " << path << "\n";
    } else {
        err_ << "  Warning: Binary not found at " << (path.empty() ? e.name : path) << "\n";
    }

    if (cache_ok && cache.erase(e.name) && !cache.save(&err)) {
        err_ << "  Error: cannot update " << cache.path() << ": " << err << "\n";
        return 1;
    }

    out_ << "\n✓ Binary plugin '" << e.name << "' removed\n";
    return 0;
}

int PluginInstaller::removeNative(const CatalogEntry& e) {
    out_ << "Removing plugin '" << e.name << "'...\n";
    std::string lib = nativeLibraryPath(e);
    std::error_code ec;
    if (!std::filesystem::exists(lib, ec)) {
        err_ << "  Warning: " << lib << " not found\n";
    } else {
        std::filesystem::remove(lib, ec);
        if (ec) {
            err_ << "\nError: Failed to remove plugin '" << e.name << "': " << ec.message() << "\n";
            return 1;
        }
        out_ << "  Removed " << lib << "\n";
    }
    out_ << "\n✓ Plugin '" << e.name << "' removed successfully\n";
    return 0;
}

int PluginInstaller::removeWrapper(const CatalogEntry& e) {
    out_ << "Removing plugin '" << e.name << "'...\n";
    JsonObjectStore store(config_.wrapper_defs_path());
    std::string err;
    if (!store.load(&err)) {
        err_ << "\nError: Failed to remove plugin '" << e.name << "': " << err << "\n";
        return 1;
    }
    if (!store.erase(e.name)) {
        err_ << "  Warning: '" << e.name << "' is not installed\n";
    } else if (!store.save(&err)) {
        err_ << "\nError: Failed to remove plugin '" << e.name << "': " << err << "\n";
        return 1;
    }
    out_ << "\n✓ Plugin '" << e.name << "' removed successfully\n";
    return 0;
}

void PluginInstaller::noteSharedDeps(const CatalogEntry& e) {
    auto specs = parse_system_deps(e.system_deps_json, table_, nullptr);
    if (specs.empty()) return;
    std::vector<std::string> bins;
    for (const auto& s : specs) bins.push_back(s.binary);
    out_ << "\nNote: System dependencies were not removed (they may be shared): " << join(bins, ", ") << "\n";
    out_ << "Remove them manually if no longer needed.\n";
}

bool PluginInstaller::isInstalled(const CatalogEntry& e) const {
    switch (e.type) {
        case PluginType::BINARY: {
            IntrospectionCache cache(config_.binary_cache_path());
            std::string err;
            if (!cache.load(nullptr, &err)) return false;
            return cache.get(e.name).has_value();
        }
        case PluginType::NATIVE: {
            std::error_code ec;
            return std::filesystem::exists(nativeLibraryPath(e), ec);
        }
        case PluginType::WRAPPER: {
            JsonObjectStore store(config_.wrapper_defs_path());
            std::string err;
            if (!store.load(&err)) return false;
            return store.contains(e.name);
        }
    }
    return false;
}

std::string PluginInstaller::formatList(const std::string& tag_filter, bool verbose) const {
    auto entries = catalog_.list(tag_filter);
    if (entries.empty()) return "No external plugins available in registry";

    std::ostringstream os;
    os << "Available external plugins (✓ = installed):\n\n";
    for (const CatalogEntry* e : entries) {
        char name_col[64];
        std::snprintf(name_col, sizeof(name_col), "%-20s", e->name.c_str());
        os << "  " << (isInstalled(*e) ? "✓" : " ") << " " << name_col << " " << e->description
           << " [" << plugin_type_name(e->type) << "]" << (e->is_private ? " [PRIVATE]" : "") << "\n";

        if (!verbose) continue;
        SystemDependencySpec src;
        if (binarySource(*e, &src, nullptr)) {
            os << "    Binary:  " << src.binary << "\n";
            os << "    Repo:    " << src.repo << "\n";
            os << "    Tag:     " << src.tag << "\n";
        }
        if (e->type == PluginType::WRAPPER) {
            json_mini::Doc doc = json_mini::parse_object(e->wrapper_json);
            if (auto bin = json_mini::get_string(doc.root, "binary")) os << "    Wraps:   " << *bin << "\n";
        }
        if (!e->tags.empty()) os << "    Tags:    " << join(e->tags, ", ") << "\n";
        auto specs = parse_system_deps(e->system_deps_json, table_, nullptr);
        if (!specs.empty()) {
            os << "    System deps:\n";
            for (const auto& s : specs) {
                char bin_col[64];
                std::snprintf(bin_col, sizeof(bin_col), "%-20s", s.binary.c_str());
                os << "      " << bin_col << " (" << s.manager << ") " << s.package << "\n";
            }
        }
        os << "\n";
    }
    std::string out = os.str();
    while (!out.empty() && out.back() == '\n') out.pop_back();
    return out;
}

} // namespace forge
