#pragma once

#include "forge/plugin_api.h"

#include <optional>
#include <string>

namespace forge {

struct ProcessRunOptions {
    int timeout_ms{0};          // 0 = unbounded
    int kill_grace_ms{2000};
};

// Adapter for a binary speaking the stdio protocol:
//   <binary> --execute '<json args>'
//   stderr: {"progress":0.5,"message":"..."} per line
//   stdout: {"status":..,"summary":..,"data":{},"artifacts":{}}
// The descriptor comes from the install-time introspection cache; the binary
// is only spawned by run().
class ProcessPlugin : public IPlugin {
public:
    ProcessPlugin(std::string binary_path, PluginDescriptor desc, ProcessRunOptions opts = {});

    std::string name() const override { return desc_.name; }
    std::string description() const override { return desc_.description; }
    std::string version() const override { return desc_.version; }
    bool requires_auth() const override { return desc_.requires_auth; }
    CapabilityList get_capabilities() const override { return desc_.capabilities; }

    RunOutcome run(const ArgMap& args, ExecutionContext& ctx) override;

    const std::string& binary_path() const { return binary_; }

private:
    std::string binary_;
    PluginDescriptor desc_;
    ProcessRunOptions opts_;
};

// Parse one stderr line as a progress event. Non-JSON or non-progress
// lines return false.
bool parse_progress_line(const std::string& line, double* fraction, std::string* message);

// Parse the terminal result from stdout: the whole text, or failing that its
// last non-empty line. An unknown status maps to failure.
std::optional<RunOutcome> parse_terminal_result(const std::string& stdout_text);

} // namespace forge
