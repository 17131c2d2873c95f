#include "forge/plugin_loader.h"

#include <cstdlib>

#include <dlfcn.h>

namespace forge {

PluginManager::~PluginManager() {
    for (auto it = handles_.rbegin(); it != handles_.rend(); ++it) {
        if (!it->handle) continue;
        dlclose(it->handle);
        it->handle = nullptr;
    }
    handles_.clear();
    loaded_.clear();
}

const char* plugin_library_extension() {
#if defined(__APPLE__)
    return ".dylib";
#else
    return ".so";
#endif
}

static std::string canonical_str(const std::filesystem::path& p) {
    std::error_code ec;
    auto c = std::filesystem::weakly_canonical(p, ec);
    if (ec) return p.string();
    return c.string();
}

bool PluginManager::is_loaded(const std::filesystem::path& path) const {
    auto c = canonical_str(path);
    return loaded_.find(c) != loaded_.end();
}

bool PluginManager::load_plugin(const std::filesystem::path& path,
                                IPluginRegistrar* registrar,
                                std::string* err) {
    if (!registrar) {
        if (err) *err = "registrar is null";
        return false;
    }

    auto canonical = canonical_str(path);
    if (loaded_.count(canonical)) {
        return true; // already loaded
    }

    if (!std::filesystem::exists(path)) {
        if (err) *err = "plugin not found: " + path.string();
        return false;
    }

    void* h = dlopen(path.string().c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!h) {
        const char* dl_err = dlerror();  // call once: dlerror() clears on read
        if (err) *err = std::string("dlopen failed: ") + (dl_err ? dl_err : "(unknown)");
        return false;
    }

    // ABI version check: always enforced unless explicitly relaxed
    dlerror(); // clear
    auto abi_fn = (forge_plugin_abi_version_fn)dlsym(h, "forge_plugin_abi_version");
    dlerror(); // clear: check result, not dlerror
    if (abi_fn) {
        int plugin_abi = abi_fn();
        if (plugin_abi != FORGE_PLUGIN_ABI_VERSION) {
            if (err) *err = "ABI version mismatch: host=" + std::to_string(FORGE_PLUGIN_ABI_VERSION)
                          + " plugin=" + std::to_string(plugin_abi)
                          + " for " + path.string();
            dlclose(h);
            return false;
        }
    } else {
        const char* lax = std::getenv("FORGE_PLUGIN_ABI_LAX");
        if (!lax || std::string(lax) != "1") {
            if (err) *err = "plugin missing forge_plugin_abi_version() export: " + path.string()
                          + " (set FORGE_PLUGIN_ABI_LAX=1 to allow)";
            dlclose(h);
            return false;
        }
    }

    dlerror(); // clear
    auto init = (forge_plugin_init_fn)dlsym(h, "forge_plugin_init");
    const char* sym_err = dlerror();
    if (sym_err != nullptr || !init) {
        if (err) *err = std::string("dlsym(forge_plugin_init) failed: ") + (sym_err ? sym_err : "(null)");
        dlclose(h);
        return false;
    }

    // Record the handle before init so factories registered from it stay
    // valid even if init throws halfway through.
    handles_.push_back({canonical, h});
    loaded_.insert(canonical);
    try {
        init(registrar);
    } catch (const std::exception& e) {
        if (err) *err = "forge_plugin_init threw for " + path.string() + ": " + e.what();
        return false;
    } catch (...) {
        if (err) *err = "forge_plugin_init threw for " + path.string() + ": unknown exception";
        return false;
    }
    return true;
}

} // namespace forge
