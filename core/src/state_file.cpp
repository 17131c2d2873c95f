#include "forge/state_file.h"
#include "forge/json_mini.h"
#include "forge/util.h"

#include <filesystem>

namespace forge {

bool JsonObjectStore::load(std::string* err, std::vector<std::string>* skipped) {
    entries_.clear();

    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) return true;

    std::string body;
    if (!slurp(path_, &body)) {
        if (err) *err = "cannot read " + path_;
        return false;
    }
    json_mini::Doc doc = json_mini::parse_object(body);
    if (!doc) {
        if (err) *err = path_ + " is not a JSON object";
        return false;
    }

    json_object_object_foreach(doc.root, k, v) {
        if (!v || !json_object_is_type(v, json_type_object)) {
            if (skipped) skipped->push_back(k);
            continue;
        }
        entries_[k] = json_mini::to_string(v);
    }
    return true;
}

bool JsonObjectStore::save(std::string* err) const {
    json_object* root = json_object_new_object();
    for (const auto& kv : entries_) {
        json_mini::Doc v = json_mini::parse_object(kv.second);
        json_object_object_add(root, kv.first.c_str(), v ? v.release() : json_object_new_object());
    }
    std::string body = json_mini::to_pretty_string(root);
    json_object_put(root);
    body += "\n";
    return write_atomic(path_, body, err);
}

std::optional<std::string> JsonObjectStore::get(const std::string& name) const {
    auto it = entries_.find(name);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

void JsonObjectStore::put(const std::string& name, const std::string& object_json) {
    entries_[name] = object_json;
}

bool JsonObjectStore::erase(const std::string& name) {
    return entries_.erase(name) > 0;
}

std::vector<std::string> JsonObjectStore::names() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& kv : entries_) out.push_back(kv.first);
    return out;
}

} // namespace forge
