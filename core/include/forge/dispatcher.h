#pragma once

#include "forge/auth.h"
#include "forge/context.h"
#include "forge/log.h"
#include "forge/registry.h"
#include "forge/types.h"

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace forge {

// Process exit codes.
constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILURE_RUN = 1;
constexpr int EXIT_USAGE = 2;
constexpr int EXIT_PARTIAL = 3;
constexpr int EXIT_CANCELLED = 130;

int exit_code_for(RunStatus s);

// Resolves a plugin by name, builds its arguments from the declared
// capabilities, runs it and renders the outcome.
class Dispatcher {
public:
    // tokens may be null when no plugin needs auth.
    Dispatcher(const PluginRegistry& registry,
               ITokenProvider* tokens,
               ConfigMap config,
               std::ostream& out,
               std::ostream& err);

    void setProgressSink(ProgressSink sink) { sink_ = std::move(sink); }
    void setCancelToken(CancelToken token) { cancel_ = std::move(token); }
    // Not owned; null disables the run log.
    void setRunLog(RunLog* log) { runlog_ = log; }

    // argv excludes the plugin name. Returns the process exit code.
    int invoke(const std::string& name, const std::vector<std::string>& argv);

    // Outcome of the last invocation that reached run().
    const std::optional<RunOutcome>& lastOutcome() const { return last_; }
    bool pluginInvoked() const { return invoked_; }

    // "  name<pad>description" per plugin, sorted.
    std::string pluginTable() const;
    // forge version plus every plugin version.
    std::string versionText() const;
    // Descriptor plus the JSON Schema of its capabilities; false if unknown.
    bool schemaJson(const std::string& name, std::string* out) const;

private:
    RunOutcome runGuarded(IPlugin& plugin, const ArgMap& args, ExecutionContext& ctx);
    void render(const RunOutcome& o);
    void logEvent(const std::string& name, const std::string& payload_json);

    const PluginRegistry& registry_;
    ITokenProvider* tokens_;
    ConfigMap config_;
    std::ostream& out_;
    std::ostream& err_;
    ProgressSink sink_;
    CancelToken cancel_;
    RunLog* runlog_{nullptr};
    std::optional<RunOutcome> last_;
    bool invoked_{false};
};

} // namespace forge
