#pragma once

// json_mini.h
//
// Small read-mostly helpers over json-c. Doc owns a parsed tree; the getters
// operate on a borrowed json_object* so one parse can serve many lookups.

#include <json-c/json.h>

#include <algorithm>
#include <climits>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace forge::json_mini {

struct Doc {
    json_object* root{nullptr};

    Doc() = default;
    explicit Doc(json_object* r) : root(r) {}
    Doc(const Doc&) = delete;
    Doc& operator=(const Doc&) = delete;

    Doc(Doc&& other) noexcept : root(other.root) { other.root = nullptr; }
    Doc& operator=(Doc&& other) noexcept {
        if (this != &other) {
            if (root) json_object_put(root);
            root = other.root;
            other.root = nullptr;
        }
        return *this;
    }

    ~Doc() {
        if (root) json_object_put(root);
    }

    // Hand ownership to the caller (e.g. to attach to another tree).
    json_object* release() {
        json_object* r = root;
        root = nullptr;
        return r;
    }

    explicit operator bool() const { return root != nullptr; }
};

// Strict parse: trailing garbage or a truncated document yields an empty Doc.
inline Doc parse(const std::string& json) {
    json_tokener* tok = json_tokener_new();
    if (!tok) return Doc{};
    json_object* obj = json_tokener_parse_ex(tok, json.c_str(),
        static_cast<int>(std::min(json.size(), static_cast<size_t>(INT_MAX))));
    json_tokener_error jerr = json_tokener_get_error(tok);
    size_t consumed = static_cast<size_t>(json_tokener_get_parse_end(tok));
    json_tokener_free(tok);
    if (jerr != json_tokener_success) {
        if (obj) json_object_put(obj);
        return Doc{};
    }
    for (size_t i = consumed; i < json.size(); i++) {
        char c = json[i];
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
            if (obj) json_object_put(obj);
            return Doc{};
        }
    }
    return Doc{obj};
}

inline Doc parse_object(const std::string& json) {
    Doc d = parse(json);
    if (d && !json_object_is_type(d.root, json_type_object)) return Doc{};
    return d;
}

inline std::string to_string(json_object* obj) {
    if (!obj) return "null";
    return json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN);
}

inline std::string to_pretty_string(json_object* obj) {
    if (!obj) return "null";
    return json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PRETTY | JSON_C_TO_STRING_NOSLASHESCAPE);
}

inline json_object* member(json_object* obj, const char* key) {
    if (!obj || !json_object_is_type(obj, json_type_object)) return nullptr;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(obj, key, &v)) return nullptr;
    return v;
}

inline bool has_key(json_object* obj, const char* key) {
    if (!obj || !json_object_is_type(obj, json_type_object)) return false;
    json_object* v = nullptr;
    return json_object_object_get_ex(obj, key, &v);
}

inline std::optional<std::string> get_string(json_object* obj, const char* key) {
    json_object* v = member(obj, key);
    if (!v || !json_object_is_type(v, json_type_string)) return std::nullopt;
    return std::string(json_object_get_string(v));
}

inline std::optional<int64_t> get_int(json_object* obj, const char* key) {
    json_object* v = member(obj, key);
    if (!v || !json_object_is_type(v, json_type_int)) return std::nullopt;
    return static_cast<int64_t>(json_object_get_int64(v));
}

inline std::optional<double> get_double(json_object* obj, const char* key) {
    json_object* v = member(obj, key);
    if (!v) return std::nullopt;
    if (!(json_object_is_type(v, json_type_double) || json_object_is_type(v, json_type_int))) return std::nullopt;
    return json_object_get_double(v);
}

inline std::optional<bool> get_bool(json_object* obj, const char* key) {
    json_object* v = member(obj, key);
    if (!v || !json_object_is_type(v, json_type_boolean)) return std::nullopt;
    return json_object_get_boolean(v) != 0;
}

inline std::vector<std::string> get_array_strings(json_object* obj, const char* key) {
    std::vector<std::string> out;
    json_object* arr = member(obj, key);
    if (!arr || !json_object_is_type(arr, json_type_array)) return out;
    const size_t n = json_object_array_length(arr);
    out.reserve(n);
    for (size_t i = 0; i < n; i++) {
        json_object* el = json_object_array_get_idx(arr, i);
        if (el && json_object_is_type(el, json_type_string)) {
            out.emplace_back(json_object_get_string(el));
        }
    }
    return out;
}

// Object members whose values are strings; other members are skipped.
inline std::map<std::string, std::string> get_string_map(json_object* obj, const char* key) {
    std::map<std::string, std::string> out;
    json_object* m = member(obj, key);
    if (!m || !json_object_is_type(m, json_type_object)) return out;
    json_object_object_foreach(m, k, v) {
        if (v && json_object_is_type(v, json_type_string)) out[k] = json_object_get_string(v);
    }
    return out;
}

inline json_object* new_string(const std::string& s) {
    return json_object_new_string_len(s.c_str(), static_cast<int>(s.size()));
}

inline json_object* new_string_array(const std::vector<std::string>& items) {
    json_object* arr = json_object_new_array();
    for (const auto& s : items) json_object_array_add(arr, new_string(s));
    return arr;
}

inline json_object* new_string_map(const std::map<std::string, std::string>& m) {
    json_object* obj = json_object_new_object();
    for (const auto& kv : m) json_object_object_add(obj, kv.first.c_str(), new_string(kv.second));
    return obj;
}

// Quote a string as a JSON string literal (with surrounding quotes).
inline std::string quote(const std::string& s) {
    json_object* js = new_string(s);
    std::string out = json_object_to_json_string_ext(js, JSON_C_TO_STRING_PLAIN | JSON_C_TO_STRING_NOSLASHESCAPE);
    json_object_put(js);
    return out;
}

} // namespace forge::json_mini
