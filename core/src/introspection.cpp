#include "forge/introspection.h"
#include "forge/json_mini.h"
#include "forge/proc.h"
#include "forge/util.h"

namespace forge {

bool parse_introspection(const std::string& stdout_text, PluginDescriptor* out, std::string* err) {
    std::string text = trim(stdout_text);
    if (text.empty()) {
        if (err) *err = "introspection produced no output";
        return false;
    }
    PluginDescriptor d;
    std::string perr;
    if (!descriptor_from_json(text, &d, &perr)) {
        if (err) *err = "invalid introspection output: " + perr;
        return false;
    }
    if (!check_conformance(d, &perr)) {
        if (err) *err = "introspected descriptor rejected: " + perr;
        return false;
    }
    if (out) *out = std::move(d);
    return true;
}

bool introspect_binary(const std::string& binary,
                       int timeout_ms,
                       PluginDescriptor* out,
                       std::string* err) {
    ProcLimits lim;
    lim.timeout_ms = timeout_ms;
    lim.stdout_max_bytes = 1024 * 1024;
    lim.kill_grace_ms = 500;

    ProcResult pr;
    if (!proc_run_capture({binary, "--introspect"}, "", lim, &pr)) {
        if (err) *err = "cannot run " + binary + ": " + pr.error;
        return false;
    }
    if (pr.timed_out) {
        if (err) *err = binary + " --introspect timed out after " + std::to_string(timeout_ms) + " ms";
        return false;
    }
    if (pr.exit_code != 0) {
        std::string tail = trim(pr.error_output);
        if (tail.size() > 300) tail = tail.substr(tail.size() - 300);
        if (err) {
            *err = binary + " --introspect exited with code " + std::to_string(pr.exit_code);
            if (!tail.empty()) *err += ": " + tail;
        }
        return false;
    }
    return parse_introspection(pr.output, out, err);
}

bool IntrospectionCache::load(std::vector<std::string>* warnings, std::string* err) {
    entries_.clear();
    std::vector<std::string> skipped;
    if (!store_.load(err, &skipped)) return false;
    for (const auto& name : skipped) {
        if (warnings) warnings->push_back("cache entry '" + name + "' is not an object; skipped");
    }

    for (const auto& name : store_.names()) {
        json_mini::Doc doc = json_mini::parse_object(store_.get(name).value_or("{}"));
        auto bin = json_mini::get_string(doc.root, "binary_path");
        json_object* data = json_mini::member(doc.root, "introspect_data");
        if (!bin || bin->empty() || !data) {
            if (warnings) warnings->push_back("cache entry '" + name + "' lacks binary_path/introspect_data; skipped");
            continue;
        }
        CachedBinaryPlugin e;
        e.binary_path = *bin;
        std::string perr;
        if (!parse_introspection(json_mini::to_string(data), &e.descriptor, &perr)) {
            if (warnings) warnings->push_back("cache entry '" + name + "': " + perr);
            continue;
        }
        entries_[name] = std::move(e);
    }
    return true;
}

bool IntrospectionCache::save(std::string* err) const {
    return store_.save(err);
}

void IntrospectionCache::put(const std::string& name, const CachedBinaryPlugin& entry) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "binary_path", json_mini::new_string(entry.binary_path));
    json_mini::Doc data = json_mini::parse_object(descriptor_to_json(entry.descriptor));
    json_object_object_add(o, "introspect_data", data.release());
    store_.put(name, json_mini::to_string(o));
    json_object_put(o);
    entries_[name] = entry;
}

bool IntrospectionCache::erase(const std::string& name) {
    bool had = store_.erase(name);
    entries_.erase(name);
    return had;
}

std::optional<CachedBinaryPlugin> IntrospectionCache::get(const std::string& name) const {
    auto it = entries_.find(name);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

} // namespace forge
