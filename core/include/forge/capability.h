#pragma once

#include "forge/types.h"

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace forge {

// Raised for bad or missing arguments and unknown plugins. Always surfaced
// before any plugin code runs.
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& msg) : std::runtime_error(msg) {}
};

// One typed input parameter a plugin declares. Carries no CLI or transport
// specific state, so the same list drives argument parsing and schemas.
struct CapabilityDescriptor {
    std::string name;
    std::string description;
    ValueKind kind{ValueKind::STRING};
    bool required{false};
    Value default_value;                                  // monostate = no default
    std::optional<std::vector<std::string>> allowed_values;

    bool operator==(const CapabilityDescriptor& o) const {
        return name == o.name && description == o.description && kind == o.kind &&
               required == o.required && default_value == o.default_value &&
               allowed_values == o.allowed_values;
    }
    bool operator!=(const CapabilityDescriptor& o) const { return !(*this == o); }
};

using CapabilityList = std::vector<CapabilityDescriptor>;

// Invariants: flag-safe non-empty name, required => no default,
// default in allowed_values when those are set, default matches kind.
bool validate_capability(const CapabilityDescriptor& cap, std::string* err);

// A capability named "command" with allowed values is taken positionally.
const CapabilityDescriptor* find_subcommand(const CapabilityList& caps);

struct ParsedCli {
    bool help{false};
    std::map<std::string, std::string> values;   // capability name -> raw text
};

// Parse "[command] --name value --name=value --flag --no-flag".
// Throws UsageError on unknown flags or a flag missing its value.
ParsedCli parse_cli_args(const CapabilityList& caps, const std::vector<std::string>& argv);

// Coerce raw strings to typed values. Applies defaults, turns booleans into
// presence flags and checks required/allowed_values. Throws UsageError.
// Every declared capability appears in the result (monostate when unset).
ArgMap coerce_args(const CapabilityList& caps, const std::map<std::string, std::string>& raw);

std::string usage_text(const std::string& prog, const std::string& description, const CapabilityList& caps);

// Wire form: the "params" array of the process-plugin introspection object.
json_object* capabilities_to_json(const CapabilityList& caps);   // caller owns
bool capabilities_from_json(json_object* params, CapabilityList* out, std::string* err);

// JSON Schema ("type":"object") describing the argument object.
std::string capabilities_to_json_schema(const CapabilityList& caps);

} // namespace forge
