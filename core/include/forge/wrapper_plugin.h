#pragma once

#include "forge/plugin_api.h"
#include "forge/process_plugin.h"

#include <string>
#include <vector>

namespace forge {

// Declarative description of a legacy CLI (one wrapper-plugins.json value):
//   {"name":..,"description":..,"version":..,"requires_auth":bool,
//    "binary":"tool","args":["prefix",..],"auth_flag":"--token",
//    "params":[...same form as introspection params...]}
struct WrapperDefinition {
    std::string name;
    std::string description;
    std::string version;
    bool requires_auth{false};
    std::string binary;                 // PATH-resolved at run time
    std::vector<std::string> args;      // fixed leading arguments
    std::string auth_flag;              // when set, token is passed as "<flag> <token>"
    CapabilityList params;
};

bool wrapper_from_json(const std::string& json, WrapperDefinition* out, std::string* err);
std::string wrapper_to_json(const WrapperDefinition& w);

// Capabilities map onto the legacy CLI's flags: a "command" capability is
// positional, booleans are presence flags, everything else "--name value".
std::vector<std::string> wrapper_argv(const WrapperDefinition& w, const ArgMap& args, const std::string& token);

class WrapperPlugin : public IPlugin {
public:
    WrapperPlugin(WrapperDefinition def, ProcessRunOptions opts = {});

    std::string name() const override { return def_.name; }
    std::string description() const override { return def_.description; }
    std::string version() const override { return def_.version; }
    bool requires_auth() const override { return def_.requires_auth; }
    CapabilityList get_capabilities() const override { return def_.params; }

    RunOutcome run(const ArgMap& args, ExecutionContext& ctx) override;

private:
    WrapperDefinition def_;
    ProcessRunOptions opts_;
};

} // namespace forge
