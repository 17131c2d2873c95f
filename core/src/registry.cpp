#include "forge/registry.h"
#include "forge/introspection.h"
#include "forge/log.h"
#include "forge/state_file.h"
#include "forge/wrapper_plugin.h"

#include <algorithm>
#include <filesystem>

namespace forge {

const char* plugin_source_name(PluginSource s) {
    switch (s) {
        case PluginSource::NATIVE:  return "native";
        case PluginSource::WRAPPER: return "wrapper";
        case PluginSource::PROCESS: return "process";
    }
    return "native";
}

namespace {

// Host side of forge_plugin_init(): forwards library factories into the registry.
class LibraryRegistrar : public IPluginRegistrar {
public:
    LibraryRegistrar(PluginRegistry* reg, std::string origin) : reg_(reg), origin_(std::move(origin)) {}

    void register_plugin(const std::string& entry_name, PluginFactory factory) override {
        (void)reg_->registerFactory(entry_name, factory, PluginSource::NATIVE, origin_);
    }

private:
    PluginRegistry* reg_;
    std::string origin_;
};

} // namespace

void PluginRegistry::warn(const std::string& msg) {
    warnings_.push_back(msg);
    log_warn("registry", msg);
}

bool PluginRegistry::registerPlugin(std::unique_ptr<IPlugin> plugin, PluginSource source, const std::string& origin) {
    if (!plugin) {
        warn("null plugin from " + origin + "; skipped");
        return false;
    }

    PluginDescriptor d;
    try {
        d = describe(*plugin);
    } catch (const std::exception& e) {
        warn("plugin from " + origin + " failed to describe itself: " + e.what() + "; skipped");
        return false;
    } catch (...) {
        warn("plugin from " + origin + " failed to describe itself: unknown exception; skipped");
        return false;
    }

    std::string err;
    if (!check_conformance(d, &err)) {
        warn("non-conforming plugin from " + origin + ": " + err + "; skipped");
        return false;
    }

    auto it = plugins_.find(d.name);
    if (it != plugins_.end()) {
        warn("plugin '" + d.name + "' from " + origin + " (" + plugin_source_name(source) +
             ") collides with the one from " + it->second.origin + " (" +
             plugin_source_name(it->second.source) + "); keeping the first");
        return false;
    }

    log_debug("registry", "registered '" + d.name + "' " + d.version + " from " + origin);
    Entry e;
    e.plugin = std::move(plugin);
    e.desc = std::move(d);
    e.source = source;
    e.origin = origin;
    std::string key = e.desc.name;
    plugins_.emplace(key, std::move(e));
    return true;
}

bool PluginRegistry::registerFactory(const std::string& entry, const PluginFactory& factory,
                                     PluginSource source, const std::string& origin) {
    if (!factory) {
        warn("entry '" + entry + "' from " + origin + " has no factory; skipped");
        return false;
    }
    std::unique_ptr<IPlugin> p;
    try {
        p = factory();
    } catch (const std::exception& e) {
        warn("failed to load entry '" + entry + "' from " + origin + ": " + e.what());
        return false;
    } catch (...) {
        warn("failed to load entry '" + entry + "' from " + origin + ": unknown exception");
        return false;
    }
    if (!p) {
        warn("factory for entry '" + entry + "' from " + origin + " returned null; skipped");
        return false;
    }
    return registerPlugin(std::move(p), source, origin + ":" + entry);
}

void PluginRegistry::discoverLibraries(const std::string& dir) {
    std::error_code ec;
    if (dir.empty() || !std::filesystem::is_directory(dir, ec)) return;

    std::vector<std::filesystem::path> libs;
    for (const auto& ent : std::filesystem::directory_iterator(dir, ec)) {
        if (ent.is_regular_file() && ent.path().extension() == plugin_library_extension()) {
            libs.push_back(ent.path());
        }
    }
    std::sort(libs.begin(), libs.end());

    for (const auto& p : libs) {
        if (libs_.is_loaded(p)) continue;
        LibraryRegistrar registrar(this, p.filename().string());
        std::string err;
        if (!libs_.load_plugin(p, &registrar, &err)) {
            warn("skipping library " + p.string() + ": " + err);
        }
    }
}

void PluginRegistry::discoverWrappers(const std::string& path, const ProcessRunOptions& opts) {
    if (path.empty()) return;
    JsonObjectStore store(path);
    std::string err;
    std::vector<std::string> skipped;
    if (!store.load(&err, &skipped)) {
        warn("cannot read wrapper definitions: " + err);
        return;
    }
    for (const auto& name : skipped) warn("wrapper definition '" + name + "' is not an object; skipped");

    for (const auto& name : store.names()) {
        WrapperDefinition def;
        std::string werr;
        if (!wrapper_from_json(store.get(name).value_or("{}"), &def, &werr)) {
            warn("wrapper definition '" + name + "': " + werr + "; skipped");
            continue;
        }
        (void)registerPlugin(std::make_unique<WrapperPlugin>(std::move(def), opts),
                             PluginSource::WRAPPER, "wrapper:" + name);
    }
}

void PluginRegistry::discoverProcessCache(const std::string& path, const ProcessRunOptions& opts) {
    if (path.empty()) return;
    IntrospectionCache cache(path);
    std::vector<std::string> warns;
    std::string err;
    if (!cache.load(&warns, &err)) {
        warn("cannot read binary plugin cache: " + err);
        return;
    }
    for (const auto& w : warns) warn(w);

    for (const auto& kv : cache.entries()) {
        (void)registerPlugin(std::make_unique<ProcessPlugin>(kv.second.binary_path, kv.second.descriptor, opts),
                             PluginSource::PROCESS, "binary:" + kv.second.binary_path);
    }
}

void PluginRegistry::discover(const DiscoveryOptions& opts) {
    for (const auto& b : opts.builtins) {
        (void)registerFactory(b.name, b.factory, PluginSource::NATIVE, "builtin");
    }
    discoverLibraries(opts.plugin_dir);
    discoverWrappers(opts.wrapper_defs_path, opts.run_options);
    discoverProcessCache(opts.binary_cache_path, opts.run_options);
}

IPlugin* PluginRegistry::getPlugin(const std::string& name) const {
    auto it = plugins_.find(name);
    if (it == plugins_.end()) return nullptr;
    return it->second.plugin.get();
}

const PluginDescriptor* PluginRegistry::getDescriptor(const std::string& name) const {
    auto it = plugins_.find(name);
    if (it == plugins_.end()) return nullptr;
    return &it->second.desc;
}

std::optional<PluginSource> PluginRegistry::sourceOf(const std::string& name) const {
    auto it = plugins_.find(name);
    if (it == plugins_.end()) return std::nullopt;
    return it->second.source;
}

std::vector<std::string> PluginRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(plugins_.size());
    for (const auto& kv : plugins_) out.push_back(kv.first);
    return out;
}

} // namespace forge
