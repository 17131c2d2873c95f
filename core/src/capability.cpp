#include "forge/capability.h"
#include "forge/json_mini.h"

#include <json-c/json.h>

#include <algorithm>
#include <cctype>
#include <sstream>

namespace forge {

static std::string lower_ascii(std::string s) {
    for (auto& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

static bool flag_safe_name(const std::string& name) {
    if (name.empty() || name[0] == '-') return false;
    for (char c : name) {
        if (!(std::isalnum((unsigned char)c) || c == '-' || c == '_')) return false;
    }
    return true;
}

static bool default_matches_kind(const Value& v, ValueKind k) {
    switch (k) {
        case ValueKind::STRING: return std::holds_alternative<std::string>(v);
        case ValueKind::INT:    return std::holds_alternative<int64_t>(v);
        case ValueKind::FLOAT:  return std::holds_alternative<double>(v) || std::holds_alternative<int64_t>(v);
        case ValueKind::BOOL:   return std::holds_alternative<bool>(v);
    }
    return false;
}

bool validate_capability(const CapabilityDescriptor& cap, std::string* err) {
    if (!flag_safe_name(cap.name)) {
        if (err) *err = "capability name '" + cap.name + "' is not a valid flag name";
        return false;
    }
    const bool has_default = value_is_set(cap.default_value);
    if (cap.required && has_default) {
        if (err) *err = "capability '" + cap.name + "' is required but declares a default";
        return false;
    }
    if (has_default && !default_matches_kind(cap.default_value, cap.kind)) {
        if (err) *err = "capability '" + cap.name + "' default does not match type " + valuekind_to_str(cap.kind);
        return false;
    }
    if (has_default && cap.allowed_values) {
        const auto& av = *cap.allowed_values;
        if (std::find(av.begin(), av.end(), value_to_display(cap.default_value)) == av.end()) {
            if (err) *err = "capability '" + cap.name + "' default '" + value_to_display(cap.default_value)
                          + "' is not among its allowed values";
            return false;
        }
    }
    return true;
}

const CapabilityDescriptor* find_subcommand(const CapabilityList& caps) {
    for (const auto& c : caps) {
        if (c.name == "command" && c.allowed_values && !c.allowed_values->empty()) return &c;
    }
    return nullptr;
}

static const CapabilityDescriptor* find_cap(const CapabilityList& caps, const std::string& name) {
    for (const auto& c : caps) {
        if (c.name == name) return &c;
    }
    return nullptr;
}

ParsedCli parse_cli_args(const CapabilityList& caps, const std::vector<std::string>& argv) {
    ParsedCli out;
    size_t i = 0;

    const CapabilityDescriptor* sub = find_subcommand(caps);
    if (sub && !argv.empty() && !argv[0].empty() && argv[0][0] != '-') {
        out.values[sub->name] = argv[0];
        i = 1;
    }

    for (; i < argv.size(); i++) {
        const std::string& a = argv[i];
        if (a == "-h" || a == "--help") {
            out.help = true;
            continue;
        }
        if (a.size() <= 2 || a.rfind("--", 0) != 0) {
            throw UsageError("unexpected argument '" + a + "'");
        }

        std::string key = a.substr(2);
        std::optional<std::string> inline_value;
        auto eq = key.find('=');
        if (eq != std::string::npos) {
            inline_value = key.substr(eq + 1);
            key = key.substr(0, eq);
        }

        const CapabilityDescriptor* cap = find_cap(caps, key);
        if (!cap && key.rfind("no-", 0) == 0 && !inline_value) {
            const CapabilityDescriptor* neg = find_cap(caps, key.substr(3));
            if (neg && neg->kind == ValueKind::BOOL) {
                out.values[neg->name] = "false";
                continue;
            }
        }
        if (!cap) throw UsageError("unknown option '--" + key + "'");

        if (cap->kind == ValueKind::BOOL) {
            out.values[cap->name] = inline_value ? *inline_value : "true";
            continue;
        }
        if (inline_value) {
            out.values[cap->name] = *inline_value;
            continue;
        }
        if (i + 1 >= argv.size()) {
            throw UsageError("option '--" + key + "' expects a value");
        }
        out.values[cap->name] = argv[++i];
    }
    return out;
}

static Value coerce_one(const CapabilityDescriptor& cap, const std::string& text) {
    switch (cap.kind) {
        case ValueKind::STRING:
            return text;
        case ValueKind::INT: {
            size_t pos = 0;
            int64_t v = 0;
            try {
                v = std::stoll(text, &pos);
            } catch (const std::exception&) {
                pos = 0;
            }
            if (text.empty() || pos != text.size()) {
                throw UsageError("argument '--" + cap.name + "' expects an integer, got '" + text + "'");
            }
            return v;
        }
        case ValueKind::FLOAT: {
            size_t pos = 0;
            double v = 0;
            try {
                v = std::stod(text, &pos);
            } catch (const std::exception&) {
                pos = 0;
            }
            if (text.empty() || pos != text.size()) {
                throw UsageError("argument '--" + cap.name + "' expects a number, got '" + text + "'");
            }
            return v;
        }
        case ValueKind::BOOL: {
            std::string t = lower_ascii(text);
            if (t == "true" || t == "1" || t == "yes" || t == "on") return true;
            if (t == "false" || t == "0" || t == "no" || t == "off") return false;
            throw UsageError("argument '--" + cap.name + "' expects true or false, got '" + text + "'");
        }
    }
    return std::monostate{};
}

static std::string join(const std::vector<std::string>& v, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < v.size(); i++) {
        if (i) out += sep;
        out += v[i];
    }
    return out;
}

ArgMap coerce_args(const CapabilityList& caps, const std::map<std::string, std::string>& raw) {
    for (const auto& kv : raw) {
        if (!find_cap(caps, kv.first)) throw UsageError("unknown argument '" + kv.first + "'");
    }

    ArgMap out;
    for (const auto& cap : caps) {
        auto it = raw.find(cap.name);
        if (it == raw.end()) {
            if (cap.required) {
                throw UsageError("missing required argument '--" + cap.name + "'"
                                 + (cap.description.empty() ? "" : " (" + cap.description + ")"));
            }
            if (cap.kind == ValueKind::BOOL) {
                // Presence flag: false unless the declared default is explicitly true.
                out[cap.name] = std::holds_alternative<bool>(cap.default_value) && std::get<bool>(cap.default_value);
            } else if (cap.kind == ValueKind::FLOAT && std::holds_alternative<int64_t>(cap.default_value)) {
                out[cap.name] = (double)std::get<int64_t>(cap.default_value);
            } else {
                out[cap.name] = cap.default_value;
            }
            continue;
        }

        Value v = coerce_one(cap, it->second);
        if (cap.allowed_values && cap.kind != ValueKind::BOOL) {
            const auto& av = *cap.allowed_values;
            const std::string shown = cap.kind == ValueKind::STRING ? it->second : value_to_display(v);
            if (std::find(av.begin(), av.end(), shown) == av.end() &&
                std::find(av.begin(), av.end(), it->second) == av.end()) {
                throw UsageError("invalid value '" + it->second + "' for '--" + cap.name
                                 + "' (choose from: " + join(av, ", ") + ")");
            }
        }
        out[cap.name] = std::move(v);
    }
    return out;
}

std::string usage_text(const std::string& prog, const std::string& description, const CapabilityList& caps) {
    std::ostringstream oss;
    const CapabilityDescriptor* sub = find_subcommand(caps);
    oss << "usage: " << prog;
    if (sub) oss << " <" << join(*sub->allowed_values, "|") << ">";
    if (!caps.empty()) oss << " [options]";
    oss << "\n";
    if (!description.empty()) oss << "\n" << description << "\n";
    if (caps.empty()) return oss.str();

    oss << "\noptions:\n";
    for (const auto& c : caps) {
        if (sub && &c == sub) continue;
        std::string flag = "--" + c.name;
        if (c.kind != ValueKind::BOOL) flag += std::string(" <") + valuekind_to_str(c.kind) + ">";
        oss << "  " << flag;
        if (flag.size() < 28) oss << std::string(28 - flag.size(), ' ');
        else oss << "\n" << std::string(30, ' ');
        oss << c.description;
        if (c.required) oss << " (required)";
        if (value_is_set(c.default_value) && c.kind != ValueKind::BOOL) {
            oss << " [default: " << value_to_display(c.default_value) << "]";
        }
        if (c.allowed_values) oss << " {" << join(*c.allowed_values, ",") << "}";
        oss << "\n";
    }
    oss << "  -h, --help                  show this help\n";
    return oss.str();
}

json_object* capabilities_to_json(const CapabilityList& caps) {
    json_object* arr = json_object_new_array();
    for (const auto& c : caps) {
        json_object* o = json_object_new_object();
        json_object_object_add(o, "name", json_mini::new_string(c.name));
        json_object_object_add(o, "description", json_mini::new_string(c.description));
        json_object_object_add(o, "type", json_object_new_string(valuekind_to_str(c.kind)));
        json_object_object_add(o, "required", json_object_new_boolean(c.required ? 1 : 0));
        json_object_object_add(o, "default", value_to_json(c.default_value));
        json_object_object_add(o, "choices", c.allowed_values ? json_mini::new_string_array(*c.allowed_values) : nullptr);
        json_object_array_add(arr, o);
    }
    return arr;
}

bool capabilities_from_json(json_object* params, CapabilityList* out, std::string* err) {
    if (!out) return false;
    out->clear();
    if (!params) return true; // absent or null: no capabilities
    if (!json_object_is_type(params, json_type_array)) {
        if (err) *err = "params is not a JSON array";
        return false;
    }

    const size_t n = json_object_array_length(params);
    for (size_t i = 0; i < n; i++) {
        json_object* p = json_object_array_get_idx(params, i);
        if (!p || !json_object_is_type(p, json_type_object)) {
            if (err) *err = "params[" + std::to_string(i) + "] is not an object";
            return false;
        }
        CapabilityDescriptor c;
        auto name = json_mini::get_string(p, "name");
        if (!name || name->empty()) {
            if (err) *err = "params[" + std::to_string(i) + "] has no name";
            return false;
        }
        c.name = *name;
        c.description = json_mini::get_string(p, "description").value_or("");

        std::string type = json_mini::get_string(p, "type").value_or("str");
        auto kind = valuekind_from_str(type);
        if (!kind) {
            if (err) *err = "param '" + c.name + "' has unsupported type '" + type + "'";
            return false;
        }
        c.kind = *kind;
        c.required = json_mini::get_bool(p, "required").value_or(false);
        c.default_value = value_from_json(json_mini::member(p, "default"));
        if (c.kind == ValueKind::FLOAT && std::holds_alternative<int64_t>(c.default_value)) {
            c.default_value = (double)std::get<int64_t>(c.default_value);
        }

        json_object* choices = json_mini::member(p, "choices");
        if (choices) {
            if (!json_object_is_type(choices, json_type_array)) {
                if (err) *err = "param '" + c.name + "' choices is not an array";
                return false;
            }
            std::vector<std::string> av;
            const size_t m = json_object_array_length(choices);
            for (size_t k = 0; k < m; k++) {
                json_object* el = json_object_array_get_idx(choices, k);
                if (el && json_object_is_type(el, json_type_string)) av.emplace_back(json_object_get_string(el));
                else av.push_back(value_to_display(value_from_json(el)));
            }
            c.allowed_values = std::move(av);
        }
        out->push_back(std::move(c));
    }
    return true;
}

static const char* schema_type(ValueKind k) {
    switch (k) {
        case ValueKind::STRING: return "string";
        case ValueKind::INT:    return "integer";
        case ValueKind::FLOAT:  return "number";
        case ValueKind::BOOL:   return "boolean";
    }
    return "string";
}

std::string capabilities_to_json_schema(const CapabilityList& caps) {
    json_object* root = json_object_new_object();
    json_object_object_add(root, "type", json_object_new_string("object"));
    json_object* props = json_object_new_object();
    json_object* required = json_object_new_array();

    for (const auto& c : caps) {
        json_object* p = json_object_new_object();
        json_object_object_add(p, "type", json_object_new_string(schema_type(c.kind)));
        if (!c.description.empty()) json_object_object_add(p, "description", json_mini::new_string(c.description));
        if (value_is_set(c.default_value)) json_object_object_add(p, "default", value_to_json(c.default_value));
        if (c.kind == ValueKind::BOOL && !value_is_set(c.default_value)) {
            json_object_object_add(p, "default", json_object_new_boolean(0));
        }
        if (c.allowed_values) {
            json_object* en = json_object_new_array();
            for (const auto& v : *c.allowed_values) {
                try {
                    json_object_array_add(en, value_to_json(coerce_one(c, v)));
                } catch (const UsageError&) {
                    json_object_array_add(en, json_mini::new_string(v));
                }
            }
            json_object_object_add(p, "enum", en);
        }
        json_object_object_add(props, c.name.c_str(), p);
        if (c.required) json_object_array_add(required, json_mini::new_string(c.name));
    }

    json_object_object_add(root, "properties", props);
    json_object_object_add(root, "required", required);
    json_object_object_add(root, "additionalProperties", json_object_new_boolean(0));
    std::string out = json_mini::to_pretty_string(root);
    json_object_put(root);
    return out;
}

} // namespace forge
