#include "test_common.h"
#include "forge/proc.h"

#include <algorithm>
#include <atomic>
#include <vector>

using namespace forge;

int main() {
    const std::string sh = find_executable("sh");
    expect_true(!sh.empty(), "sh on PATH");

    // 1) separate streams, exit code
    {
        ProcLimits lim;
        ProcResult r;
        expect_true(proc_run_capture({sh, "-c", "echo out; echo err >&2; exit 3"}, "", lim, &r), "started: " + r.error);
        expect_eq_ll(r.exit_code, 3, "exit code");
        expect_eq_str(r.output, "out\n", "stdout");
        expect_eq_str(r.error_output, "err\n", "stderr");
    }

    // 2) stderr lines arrive through the hook; a newline-free flood stays bounded
    {
        ProcLimits lim;
        lim.stderr_max_bytes = 1024;
        ProcHooks hooks;
        std::vector<std::string> lines;
        size_t longest = 0;
        hooks.on_stderr_line = [&](const std::string& l) {
            lines.push_back(l.substr(0, 16));
            longest = std::max(longest, l.size());
        };
        ProcResult r;
        const std::string script =
            "echo first >&2; i=0; while [ $i -lt 2000 ]; do printf xxxxxxxxxx >&2; i=$((i+1)); done; echo >&2; echo last >&2";
        expect_true(proc_run_streaming({sh, "-c", script}, "", lim, hooks, &r), "started: " + r.error);
        expect_eq_ll(r.exit_code, 0, "flood exit code");
        expect_true(lines.size() >= 3, "lines delivered: " + std::to_string(lines.size()));
        expect_eq_str(lines.front(), "first", "first line");
        expect_eq_str(lines.back(), "last", "last line");
        expect_true(longest <= lim.stderr_max_bytes, "pending line capped: " + std::to_string(longest));
        expect_true(r.error_output.size() <= lim.stderr_max_bytes, "captured stderr capped");
    }

    // 3) timeout and cancel terminate the child
    {
        ProcLimits lim;
        lim.timeout_ms = 300;
        lim.kill_grace_ms = 200;
        ProcResult r;
        expect_true(proc_run_capture({sh, "-c", "sleep 30"}, "", lim, &r), "started");
        expect_true(r.timed_out, "timed out");

        ProcLimits open;
        open.kill_grace_ms = 200;
        ProcHooks hooks;
        std::atomic<int> polls{0};
        hooks.should_cancel = [&] { return ++polls > 3; };
        expect_true(proc_run_streaming({sh, "-c", "sleep 30"}, "", open, hooks, &r), "started");
        expect_true(r.cancelled, "cancelled");
    }

    // 4) exec failure is reported, not started
    {
        ProcLimits lim;
        ProcResult r;
        expect_true(!proc_run_capture({"/nonexistent/forge-binary"}, "", lim, &r), "missing binary");
        expect_true(contains(r.error, "failed"), "exec error text: " + r.error);
        expect_true(find_executable("forge-absent-binary").empty(), "absent binary not found");
    }

    std::cerr << "test_proc: ALL PASSED" << std::endl;
    return 0;
}
