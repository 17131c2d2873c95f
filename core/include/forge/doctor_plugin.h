#pragma once

#include "forge/plugin_api.h"

#include <string>
#include <vector>

namespace forge {

// Built-in: checks that binaries are on PATH. With no --tools it checks
// every system dependency the catalog declares.
class DoctorPlugin : public IPlugin {
public:
    explicit DoctorPlugin(std::vector<std::string> catalog_tools = {})
        : catalog_tools_(std::move(catalog_tools)) {}

    std::string name() const override { return "doctor"; }
    std::string description() const override { return "Check that required tools are installed"; }
    std::string version() const override { return FORGE_VERSION; }
    bool requires_auth() const override { return false; }
    CapabilityList get_capabilities() const override;

    RunOutcome run(const ArgMap& args, ExecutionContext& ctx) override;

private:
    std::vector<std::string> catalog_tools_;
};

} // namespace forge
