#include "forge/auth.h"
#include "forge/proc.h"
#include "forge/util.h"

namespace forge {

std::string ChainctlTokenProvider::token() {
    std::string chainctl = find_executable("chainctl");
    if (chainctl.empty()) {
        throw AuthError("chainctl is not installed. Install from "
                        "https://edu.chainguard.dev/chainguard/administration/how-to-install-chainctl/");
    }

    ProcLimits lim;
    lim.timeout_ms = timeout_ms_;
    lim.stdout_max_bytes = 64 * 1024;
    lim.kill_grace_ms = 500;
    ProcResult pr;
    if (!proc_run_capture({chainctl, "auth", "token"}, "", lim, &pr)) {
        throw AuthError("cannot run chainctl: " + pr.error);
    }
    if (pr.timed_out) {
        throw AuthError("chainctl auth timed out after " + std::to_string(timeout_ms_ / 1000) + "s");
    }
    if (pr.exit_code != 0) {
        throw AuthError("chainctl auth failed. Run 'chainctl auth login' first. Error: " + trim(pr.error_output));
    }
    std::string tok = trim(pr.output);
    if (tok.empty()) {
        throw AuthError("chainctl auth token returned nothing. Run 'chainctl auth login' first.");
    }
    return tok;
}

} // namespace forge
