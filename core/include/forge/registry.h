#pragma once
#include "forge/plugin_api.h"
#include "forge/plugin_loader.h"
#include "forge/process_plugin.h"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace forge {

// WRAPPER is discovered in the native phase, so it ranks with NATIVE
// against PROCESS on a name collision.
enum class PluginSource { NATIVE, WRAPPER, PROCESS };

const char* plugin_source_name(PluginSource s);

// Build-time registration table entry.
struct BuiltinEntry {
    std::string name;
    PluginFactory factory;
};
using BuiltinTable = std::vector<BuiltinEntry>;

struct DiscoveryOptions {
    BuiltinTable builtins;
    std::string plugin_dir;           // *.so scan; empty = skip
    std::string wrapper_defs_path;    // wrapper-plugins.json; empty = skip
    std::string binary_cache_path;    // binary-plugins.json; empty = skip
    ProcessRunOptions run_options;    // for process and wrapper adapters
};

// Name-keyed set of conforming plugins from every discovery source.
// First registration wins; later duplicates are dropped with a warning.
class PluginRegistry {
public:
    PluginRegistry() = default;
    PluginRegistry(const PluginRegistry&) = delete;
    PluginRegistry& operator=(const PluginRegistry&) = delete;

    // Native phase (builtins, plugin_dir libraries, wrapper definitions),
    // then the process phase (introspection cache). Never throws for a bad
    // plugin, library or cache entry; each is recorded in warnings().
    void discover(const DiscoveryOptions& opts);

    // Returns false (with a warning recorded) if the plugin fails the
    // conformance check or its name is already taken.
    bool registerPlugin(std::unique_ptr<IPlugin> plugin, PluginSource source, const std::string& origin);

    // Calls the factory; a throw or null result is a load error for this entry only.
    bool registerFactory(const std::string& entry, const PluginFactory& factory,
                         PluginSource source, const std::string& origin);

    IPlugin* getPlugin(const std::string& name) const;
    const PluginDescriptor* getDescriptor(const std::string& name) const;
    std::optional<PluginSource> sourceOf(const std::string& name) const;

    std::vector<std::string> names() const;     // sorted
    size_t size() const { return plugins_.size(); }
    const std::vector<std::string>& warnings() const { return warnings_; }

private:
    struct Entry {
        std::unique_ptr<IPlugin> plugin;
        PluginDescriptor desc;
        PluginSource source{PluginSource::NATIVE};
        std::string origin;
    };

    void warn(const std::string& msg);
    void discoverLibraries(const std::string& dir);
    void discoverWrappers(const std::string& path, const ProcessRunOptions& opts);
    void discoverProcessCache(const std::string& path, const ProcessRunOptions& opts);

    // Declared before plugins_ so library handles outlive the objects they created.
    PluginManager libs_;
    std::map<std::string, Entry> plugins_;
    std::vector<std::string> warnings_;
};

} // namespace forge
