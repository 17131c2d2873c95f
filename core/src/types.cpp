#include "forge/types.h"
#include "forge/json_mini.h"

#include <json-c/json.h>

#include <sstream>

namespace forge {

const char* valuekind_to_str(ValueKind k) {
    switch (k) {
        case ValueKind::STRING: return "str";
        case ValueKind::INT:    return "int";
        case ValueKind::FLOAT:  return "float";
        case ValueKind::BOOL:   return "bool";
    }
    return "str";
}

std::optional<ValueKind> valuekind_from_str(const std::string& s) {
    if (s == "str" || s == "path") return ValueKind::STRING;
    if (s == "int") return ValueKind::INT;
    if (s == "float") return ValueKind::FLOAT;
    if (s == "bool") return ValueKind::BOOL;
    return std::nullopt;
}

bool value_is_set(const Value& v) {
    return !std::holds_alternative<std::monostate>(v);
}

std::string value_to_display(const Value& v) {
    if (std::holds_alternative<bool>(v)) return std::get<bool>(v) ? "true" : "false";
    if (std::holds_alternative<int64_t>(v)) return std::to_string(std::get<int64_t>(v));
    if (std::holds_alternative<double>(v)) {
        std::ostringstream oss;
        oss << std::get<double>(v);
        return oss.str();
    }
    if (std::holds_alternative<std::string>(v)) return std::get<std::string>(v);
    return "";
}

json_object* value_to_json(const Value& v) {
    if (std::holds_alternative<bool>(v)) return json_object_new_boolean(std::get<bool>(v) ? 1 : 0);
    if (std::holds_alternative<int64_t>(v)) return json_object_new_int64(std::get<int64_t>(v));
    if (std::holds_alternative<double>(v)) return json_object_new_double(std::get<double>(v));
    if (std::holds_alternative<std::string>(v)) return json_mini::new_string(std::get<std::string>(v));
    return nullptr; // json-c represents null as a null pointer
}

Value value_from_json(json_object* v) {
    if (!v) return std::monostate{};
    switch (json_object_get_type(v)) {
        case json_type_boolean: return json_object_get_boolean(v) != 0;
        case json_type_int:     return static_cast<int64_t>(json_object_get_int64(v));
        case json_type_double:  return json_object_get_double(v);
        case json_type_string:  return std::string(json_object_get_string(v));
        default:                return std::monostate{};
    }
}

std::string args_to_json(const ArgMap& args) {
    json_object* obj = json_object_new_object();
    for (const auto& kv : args) {
        json_object_object_add(obj, kv.first.c_str(), value_to_json(kv.second));
    }
    std::string out = json_mini::to_string(obj);
    json_object_put(obj);
    return out;
}

const char* runstatus_to_str(RunStatus s) {
    switch (s) {
        case RunStatus::SUCCESS:   return "success";
        case RunStatus::FAILURE:   return "failure";
        case RunStatus::PARTIAL:   return "partial";
        case RunStatus::CANCELLED: return "cancelled";
    }
    return "failure";
}

std::optional<RunStatus> runstatus_from_str(const std::string& s) {
    if (s == "success") return RunStatus::SUCCESS;
    if (s == "failure") return RunStatus::FAILURE;
    if (s == "partial") return RunStatus::PARTIAL;
    if (s == "cancelled") return RunStatus::CANCELLED;
    return std::nullopt;
}

RunOutcome::RunOutcome(RunStatus status,
                       std::string summary,
                       std::string data_json,
                       std::map<std::string, std::string> artifacts)
    : status_(status),
      summary_(std::move(summary)),
      data_json_(std::move(data_json)),
      artifacts_(std::move(artifacts)) {
    // Normalize: structured data is always an object.
    json_mini::Doc d = json_mini::parse_object(data_json_);
    if (!d) data_json_ = "{}";
}

RunOutcome RunOutcome::success(const std::string& summary, const std::string& data_json) {
    return RunOutcome(RunStatus::SUCCESS, summary, data_json);
}

RunOutcome RunOutcome::failure(const std::string& summary, const std::string& data_json) {
    return RunOutcome(RunStatus::FAILURE, summary, data_json);
}

RunOutcome RunOutcome::cancelled(const std::string& summary) {
    return RunOutcome(RunStatus::CANCELLED, summary);
}

std::optional<std::string> RunOutcome::data_string(const std::string& key) const {
    json_mini::Doc d = json_mini::parse_object(data_json_);
    if (!d) return std::nullopt;
    return json_mini::get_string(d.root, key.c_str());
}

std::string outcome_to_json(const RunOutcome& o) {
    json_object* obj = json_object_new_object();
    json_object_object_add(obj, "status", json_object_new_string(runstatus_to_str(o.status())));
    json_object_object_add(obj, "summary", json_mini::new_string(o.summary()));
    json_mini::Doc data = json_mini::parse_object(o.data_json());
    json_object_object_add(obj, "data", data ? data.release() : json_object_new_object());
    json_object_object_add(obj, "artifacts", json_mini::new_string_map(o.artifacts()));
    std::string out = json_mini::to_string(obj);
    json_object_put(obj);
    return out;
}

} // namespace forge
