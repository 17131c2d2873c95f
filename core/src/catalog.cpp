#include "forge/catalog.h"
#include "forge/json_mini.h"
#include "forge/util.h"

#include <algorithm>
#include <cstdlib>
#include <filesystem>

namespace forge {

const char* plugin_type_name(PluginType t) {
    switch (t) {
        case PluginType::NATIVE:  return "native";
        case PluginType::BINARY:  return "binary";
        case PluginType::WRAPPER: return "wrapper";
    }
    return "native";
}

std::optional<PluginType> plugin_type_from_str(const std::string& s) {
    if (s == "native") return PluginType::NATIVE;
    if (s == "binary") return PluginType::BINARY;
    if (s == "wrapper") return PluginType::WRAPPER;
    return std::nullopt;
}

std::string PluginCatalog::resolve_path(const std::string& explicit_path, const std::string& default_path) {
    if (!explicit_path.empty()) return expand_user(explicit_path);
    const char* env = std::getenv("FORGE_PLUGIN_REGISTRY");
    if (env && *env) return expand_user(env);
    return expand_user(default_path);
}

bool PluginCatalog::load(const std::string& path, std::vector<std::string>* warnings) {
    entries_.clear();
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (warnings) warnings->push_back("plugin registry not found at " + path);
        return true;
    }
    std::string body;
    if (!slurp(path, &body)) {
        if (warnings) warnings->push_back("cannot read plugin registry " + path);
        return false;
    }
    return loadFromString(body, warnings);
}

bool PluginCatalog::loadFromString(const std::string& body, std::vector<std::string>* warnings) {
    entries_.clear();
    json_mini::Doc doc = json_mini::parse_object(body);
    if (!doc) {
        if (warnings) warnings->push_back("error loading plugin registry: not a JSON object");
        return false;
    }
    json_object* plugins = json_mini::member(doc.root, "external_plugins");
    if (!plugins) return true;
    if (!json_object_is_type(plugins, json_type_object)) {
        if (warnings) warnings->push_back("error loading plugin registry: external_plugins is not an object");
        return false;
    }

    json_object_object_foreach(plugins, name, info) {
        if (!info || !json_object_is_type(info, json_type_object)) {
            if (warnings) warnings->push_back(std::string("registry entry '") + name + "' is not an object; skipped");
            continue;
        }
        CatalogEntry e;
        e.name = name;
        e.description = json_mini::get_string(info, "description").value_or("No description");
        std::string type = json_mini::get_string(info, "plugin_type").value_or("native");
        auto t = plugin_type_from_str(type);
        if (!t) {
            if (warnings) warnings->push_back(std::string("registry entry '") + name + "' has unknown plugin_type '" +
                                              type + "'; skipped");
            continue;
        }
        e.type = *t;
        e.tags = json_mini::get_array_strings(info, "tags");
        e.is_private = json_mini::get_bool(info, "private").value_or(false);

        json_object* deps = json_mini::member(info, "system_deps");
        if (deps) e.system_deps_json = json_mini::to_string(deps);
        json_object* bs = json_mini::member(info, "binary_source");
        if (bs && json_object_is_type(bs, json_type_object)) e.binary_source_json = json_mini::to_string(bs);
        json_object* w = json_mini::member(info, "wrapper");
        if (w && json_object_is_type(w, json_type_object)) e.wrapper_json = json_mini::to_string(w);

        entries_[e.name] = std::move(e);
    }
    return true;
}

const CatalogEntry* PluginCatalog::find(const std::string& name) const {
    auto it = entries_.find(name);
    if (it == entries_.end()) return nullptr;
    return &it->second;
}

std::vector<const CatalogEntry*> PluginCatalog::list(const std::string& tag_filter) const {
    std::vector<const CatalogEntry*> out;
    for (const auto& kv : entries_) {
        const auto& tags = kv.second.tags;
        if (!tag_filter.empty() && std::find(tags.begin(), tags.end(), tag_filter) == tags.end()) continue;
        out.push_back(&kv.second);
    }
    return out;
}

std::vector<std::string> PluginCatalog::names() const {
    std::vector<std::string> out;
    for (const auto& kv : entries_) out.push_back(kv.first);
    return out;
}

} // namespace forge
