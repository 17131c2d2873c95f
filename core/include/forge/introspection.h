#pragma once

#include "forge/plugin_api.h"
#include "forge/state_file.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace forge {

// Parse and validate the object a process plugin prints for --introspect.
bool parse_introspection(const std::string& stdout_text, PluginDescriptor* out, std::string* err);

// Run "<binary> --introspect" with its own timeout and parse the result.
bool introspect_binary(const std::string& binary,
                       int timeout_ms,
                       PluginDescriptor* out,
                       std::string* err);

struct CachedBinaryPlugin {
    std::string binary_path;
    PluginDescriptor descriptor;
};

// binary-plugins.json:
//   {"<name>":{"binary_path":"...","introspect_data":{...}}}
// Read on every startup, written only by the installer.
class IntrospectionCache {
public:
    explicit IntrospectionCache(std::string path) : store_(std::move(path)) {}

    // Missing file: empty, true. Unreadable file: false with err.
    // Bad entries are skipped and described in warnings.
    bool load(std::vector<std::string>* warnings, std::string* err);
    bool save(std::string* err) const;

    void put(const std::string& name, const CachedBinaryPlugin& entry);
    bool erase(const std::string& name);

    std::optional<CachedBinaryPlugin> get(const std::string& name) const;
    const std::map<std::string, CachedBinaryPlugin>& entries() const { return entries_; }
    const std::string& path() const { return store_.path(); }

private:
    JsonObjectStore store_;
    std::map<std::string, CachedBinaryPlugin> entries_;
};

} // namespace forge
