#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace forge {

struct ProcLimits {
    int timeout_ms{0};                      // 0 = unbounded
    size_t stdout_max_bytes{4 * 1024 * 1024};
    size_t stderr_max_bytes{1024 * 1024};
    int kill_grace_ms{2000};                // SIGTERM -> SIGKILL delay on cancel/timeout
};

struct ProcResult {
    int exit_code{127};
    bool timed_out{false};
    bool cancelled{false};
    bool output_truncated{false};
    std::string output;        // child stdout
    std::string error_output;  // child stderr
    std::string error;         // internal runner error, not child stderr
};

struct ProcHooks {
    // Called for each complete stderr line (newline stripped) as it arrives.
    std::function<void(const std::string& line)> on_stderr_line;
    // Polled every slice; true terminates the child's process group.
    std::function<bool()> should_cancel;
    // Set in the child's environment before exec.
    std::map<std::string, std::string> env;
};

// Run a process (argv[0] is executable, PATH-resolved) in its own process
// group. stdout and stderr are captured separately on one poll() loop.
// On timeout or cancel the group gets SIGTERM, then SIGKILL after
// kill_grace_ms; the child is always reaped and every pipe closed.
// Returns true if the process started.
bool proc_run_streaming(const std::vector<std::string>& argv,
                        const std::string& cwd,
                        const ProcLimits& lim,
                        const ProcHooks& hooks,
                        ProcResult* res);

// proc_run_streaming without hooks.
bool proc_run_capture(const std::vector<std::string>& argv,
                      const std::string& cwd,
                      const ProcLimits& lim,
                      ProcResult* res);

// PATH lookup (the "which" presence check). Names containing '/' are checked
// directly. Returns the resolved path, or empty when not found/executable.
std::string find_executable(const std::string& name);

} // namespace forge
