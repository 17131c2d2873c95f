#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace forge {

enum class PluginType { NATIVE, BINARY, WRAPPER };

const char* plugin_type_name(PluginType t);
std::optional<PluginType> plugin_type_from_str(const std::string& s);

// One installable external plugin from plugins-registry.json.
struct CatalogEntry {
    std::string name;
    std::string description;
    PluginType type{PluginType::NATIVE};
    std::vector<std::string> tags;
    bool is_private{false};
    std::string system_deps_json{"[]"};   // raw array, parsed by the installer
    std::string binary_source_json;       // raw object; empty when absent
    std::string wrapper_json;             // raw object; empty when absent
};

// {"external_plugins":{"<name>":{...}}}
class PluginCatalog {
public:
    // explicit_path, then FORGE_PLUGIN_REGISTRY, then default_path.
    static std::string resolve_path(const std::string& explicit_path, const std::string& default_path);

    // A missing file is a warning and an empty catalog (returns true).
    // A malformed file is a warning and an empty catalog (returns false).
    // Bad entries are skipped with a warning.
    bool load(const std::string& path, std::vector<std::string>* warnings);

    // Parse from text; same entry rules as load().
    bool loadFromString(const std::string& body, std::vector<std::string>* warnings);

    const CatalogEntry* find(const std::string& name) const;
    std::vector<const CatalogEntry*> list(const std::string& tag_filter = "") const;   // sorted by name
    std::vector<std::string> names() const;
    bool empty() const { return entries_.empty(); }
    size_t size() const { return entries_.size(); }

private:
    std::map<std::string, CatalogEntry> entries_;
};

} // namespace forge
