#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace forge {

// A JSON object file mapping names to JSON object values. Writes go through
// write_atomic so a crash mid-save leaves the previous file intact.
class JsonObjectStore {
public:
    explicit JsonObjectStore(std::string path) : path_(std::move(path)) {}

    // A missing file loads as empty and succeeds. An unreadable or malformed
    // file fails with err set and leaves the store empty. Members whose value
    // is not an object are skipped and reported through skipped.
    bool load(std::string* err, std::vector<std::string>* skipped = nullptr);
    bool save(std::string* err) const;

    std::optional<std::string> get(const std::string& name) const;
    void put(const std::string& name, const std::string& object_json);
    bool erase(const std::string& name);
    bool contains(const std::string& name) const { return entries_.count(name) != 0; }

    std::vector<std::string> names() const;
    size_t size() const { return entries_.size(); }
    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::map<std::string, std::string> entries_;   // name -> compact JSON object
};

} // namespace forge
