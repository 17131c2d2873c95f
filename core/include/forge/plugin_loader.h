#pragma once

#include <string>
#include <unordered_set>
#include <vector>
#include <filesystem>

#include "forge/plugin_api.h"

namespace forge {

// Loads shared libraries that export forge_plugin_init(...).
// Keeps handles alive until destruction; plugin objects created from a
// library must be destroyed before its PluginManager.
class PluginManager {
public:
    PluginManager() = default;
    ~PluginManager();

    PluginManager(const PluginManager&) = delete;
    PluginManager& operator=(const PluginManager&) = delete;

    // Load a single plugin library.
    // Returns true on success, false on failure (err is filled).
    bool load_plugin(const std::filesystem::path& path,
                     IPluginRegistrar* registrar,
                     std::string* err);

    bool is_loaded(const std::filesystem::path& path) const;
    size_t loaded_count() const { return handles_.size(); }

private:
    struct Handle {
        std::string canonical;
        void* handle{nullptr};
    };

    std::vector<Handle> handles_;
    std::unordered_set<std::string> loaded_;
};

// File extension of loadable plugin libraries on this platform.
const char* plugin_library_extension();

} // namespace forge
