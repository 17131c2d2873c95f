#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>

struct json_object;

namespace forge {

// Declared type of a capability value. Wire names: "str", "int", "float", "bool".
enum class ValueKind {
    STRING,
    INT,
    FLOAT,
    BOOL,
};

const char* valuekind_to_str(ValueKind k);
// Accepts the wire names plus the legacy alias "path" (treated as STRING).
std::optional<ValueKind> valuekind_from_str(const std::string& s);

// A typed argument value. std::monostate means "no value".
using Value = std::variant<std::monostate, bool, int64_t, double, std::string>;
using ArgMap = std::map<std::string, Value>;

bool value_is_set(const Value& v);
std::string value_to_display(const Value& v);
json_object* value_to_json(const Value& v);          // caller owns
Value value_from_json(json_object* v);               // null / unsupported -> monostate

// Serialize an argument map as a JSON object.
std::string args_to_json(const ArgMap& args);

enum class RunStatus {
    SUCCESS,
    FAILURE,
    PARTIAL,
    CANCELLED,
};

const char* runstatus_to_str(RunStatus s);
std::optional<RunStatus> runstatus_from_str(const std::string& s);

// Result of one plugin run. Immutable once constructed.
class RunOutcome {
public:
    RunOutcome(RunStatus status,
               std::string summary,
               std::string data_json = "{}",
               std::map<std::string, std::string> artifacts = {});

    static RunOutcome success(const std::string& summary, const std::string& data_json = "{}");
    static RunOutcome failure(const std::string& summary, const std::string& data_json = "{}");
    static RunOutcome cancelled(const std::string& summary = "Cancelled by user");

    RunStatus status() const { return status_; }
    const std::string& summary() const { return summary_; }
    // Always a JSON object.
    const std::string& data_json() const { return data_json_; }
    const std::map<std::string, std::string>& artifacts() const { return artifacts_; }

    std::optional<std::string> data_string(const std::string& key) const;

private:
    RunStatus status_;
    std::string summary_;
    std::string data_json_;
    std::map<std::string, std::string> artifacts_;
};

// {"status":..,"summary":..,"data":{..},"artifacts":{..}}
std::string outcome_to_json(const RunOutcome& o);

} // namespace forge
