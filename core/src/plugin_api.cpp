#include "forge/plugin_api.h"
#include "forge/json_mini.h"

#include <json-c/json.h>

#include <cctype>
#include <set>

namespace forge {

PluginDescriptor describe(const IPlugin& p) {
    PluginDescriptor d;
    d.name = p.name();
    d.description = p.description();
    d.version = p.version();
    d.requires_auth = p.requires_auth();
    d.capabilities = p.get_capabilities();
    return d;
}

static bool numeric_part(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit((unsigned char)c)) return false;
    }
    return s.size() == 1 || s[0] != '0';
}

static bool ident_part(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!(std::isalnum((unsigned char)c) || c == '-')) return false;
    }
    return true;
}

static bool dotted(const std::string& s, bool numeric) {
    size_t start = 0;
    while (true) {
        size_t dot = s.find('.', start);
        std::string part = s.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (numeric ? !numeric_part(part) : !ident_part(part)) return false;
        if (dot == std::string::npos) return true;
        start = dot + 1;
    }
}

bool is_semver(const std::string& v) {
    std::string core = v;
    std::string build;
    std::string pre;

    auto plus = core.find('+');
    if (plus != std::string::npos) {
        build = core.substr(plus + 1);
        core = core.substr(0, plus);
        if (!dotted(build, false)) return false;
    }
    auto dash = core.find('-');
    if (dash != std::string::npos) {
        pre = core.substr(dash + 1);
        core = core.substr(0, dash);
        if (!dotted(pre, false)) return false;
    }
    if (!dotted(core, true)) return false;
    size_t dots = 0;
    for (char c : core) dots += (c == '.');
    return dots == 2;
}

bool check_conformance(const PluginDescriptor& d, std::string* err) {
    if (d.name.empty()) {
        if (err) *err = "plugin has an empty name";
        return false;
    }
    for (char c : d.name) {
        if (std::isspace((unsigned char)c) || c == '/') {
            if (err) *err = "plugin name '" + d.name + "' contains whitespace or '/'";
            return false;
        }
    }
    if (d.name[0] == '-') {
        if (err) *err = "plugin name '" + d.name + "' starts with '-'";
        return false;
    }
    if (d.description.empty()) {
        if (err) *err = "plugin '" + d.name + "' has an empty description";
        return false;
    }
    if (!is_semver(d.version)) {
        if (err) *err = "plugin '" + d.name + "' version '" + d.version + "' is not semver";
        return false;
    }
    std::set<std::string> seen;
    for (const auto& c : d.capabilities) {
        std::string cerr;
        if (!validate_capability(c, &cerr)) {
            if (err) *err = "plugin '" + d.name + "': " + cerr;
            return false;
        }
        if (!seen.insert(c.name).second) {
            if (err) *err = "plugin '" + d.name + "' declares capability '" + c.name + "' twice";
            return false;
        }
    }
    return true;
}

std::string descriptor_to_json(const PluginDescriptor& d) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "name", json_mini::new_string(d.name));
    json_object_object_add(o, "description", json_mini::new_string(d.description));
    json_object_object_add(o, "version", json_mini::new_string(d.version));
    json_object_object_add(o, "requires_auth", json_object_new_boolean(d.requires_auth ? 1 : 0));
    json_object_object_add(o, "params", capabilities_to_json(d.capabilities));
    std::string out = json_mini::to_string(o);
    json_object_put(o);
    return out;
}

bool descriptor_from_json(const std::string& json, PluginDescriptor* out, std::string* err) {
    if (!out) return false;
    json_mini::Doc doc = json_mini::parse_object(json);
    if (!doc) {
        if (err) *err = "descriptor is not a JSON object";
        return false;
    }

    PluginDescriptor d;
    auto name = json_mini::get_string(doc.root, "name");
    auto description = json_mini::get_string(doc.root, "description");
    auto version = json_mini::get_string(doc.root, "version");
    if (!name || !description || !version) {
        if (err) *err = "descriptor missing name/description/version";
        return false;
    }
    d.name = *name;
    d.description = *description;
    d.version = *version;
    d.requires_auth = json_mini::get_bool(doc.root, "requires_auth").value_or(false);
    if (!capabilities_from_json(json_mini::member(doc.root, "params"), &d.capabilities, err)) {
        return false;
    }
    *out = std::move(d);
    return true;
}

} // namespace forge
