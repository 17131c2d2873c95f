#include "forge/process_plugin.h"
#include "forge/json_mini.h"
#include "forge/log.h"
#include "forge/proc.h"
#include "forge/util.h"

namespace forge {

ProcessPlugin::ProcessPlugin(std::string binary_path, PluginDescriptor desc, ProcessRunOptions opts)
    : binary_(std::move(binary_path)), desc_(std::move(desc)), opts_(opts) {}

bool parse_progress_line(const std::string& line, double* fraction, std::string* message) {
    std::string t = trim(line);
    if (t.empty() || t[0] != '{') return false;
    json_mini::Doc doc = json_mini::parse_object(t);
    if (!doc) return false;
    auto frac = json_mini::get_double(doc.root, "progress");
    if (!frac) return false;
    if (fraction) *fraction = *frac;
    if (message) *message = json_mini::get_string(doc.root, "message").value_or("");
    return true;
}

static std::optional<RunOutcome> outcome_from_object(json_object* o) {
    auto status_str = json_mini::get_string(o, "status");
    RunStatus status = RunStatus::FAILURE;
    if (status_str) {
        if (auto s = runstatus_from_str(*status_str)) status = *s;
    }
    std::string summary = json_mini::get_string(o, "summary").value_or("");
    if (status_str && !runstatus_from_str(*status_str)) {
        summary = "plugin reported unknown status '" + *status_str + "'" +
                  (summary.empty() ? "" : ": " + summary);
    }

    std::string data = "{}";
    json_object* d = json_mini::member(o, "data");
    if (d && json_object_is_type(d, json_type_object)) data = json_mini::to_string(d);

    std::map<std::string, std::string> artifacts = json_mini::get_string_map(o, "artifacts");
    return RunOutcome(status, summary, data, artifacts);
}

std::optional<RunOutcome> parse_terminal_result(const std::string& stdout_text) {
    std::string text = trim(stdout_text);
    if (text.empty()) return std::nullopt;

    json_mini::Doc doc = json_mini::parse_object(text);
    if (doc) return outcome_from_object(doc.root);

    // Chatty binaries: take the last non-empty line.
    size_t end = text.size();
    while (end > 0) {
        size_t nl = text.rfind('\n', end - 1);
        size_t begin = (nl == std::string::npos) ? 0 : nl + 1;
        std::string line = trim(text.substr(begin, end - begin));
        if (!line.empty()) {
            json_mini::Doc last = json_mini::parse_object(line);
            if (last) return outcome_from_object(last.root);
            return std::nullopt;
        }
        if (nl == std::string::npos) break;
        end = nl;
    }
    return std::nullopt;
}

static std::string raw_output_data(const ProcResult& pr, bool timed_out) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "exit_code", json_object_new_int(pr.exit_code));
    if (timed_out) json_object_object_add(o, "timed_out", json_object_new_boolean(1));
    if (pr.output_truncated) json_object_object_add(o, "truncated", json_object_new_boolean(1));
    json_object_object_add(o, "stdout", json_mini::new_string(pr.output));
    json_object_object_add(o, "stderr", json_mini::new_string(pr.error_output));
    std::string out = json_mini::to_string(o);
    json_object_put(o);
    return out;
}

RunOutcome ProcessPlugin::run(const ArgMap& args, ExecutionContext& ctx) {
    if (ctx.cancelled()) return RunOutcome::cancelled();

    // Declared capabilities missing from args go out as null.
    ArgMap full = args;
    for (const auto& c : desc_.capabilities) {
        if (!full.count(c.name)) full[c.name] = std::monostate{};
    }

    std::vector<std::string> argv{binary_, "--execute", args_to_json(full)};

    ProcLimits lim;
    lim.timeout_ms = opts_.timeout_ms;
    lim.kill_grace_ms = opts_.kill_grace_ms;

    ProcHooks hooks;
    hooks.on_stderr_line = [&ctx](const std::string& line) {
        double frac = 0.0;
        std::string msg;
        if (parse_progress_line(line, &frac, &msg)) ctx.progress(frac, msg);
    };
    hooks.should_cancel = [&ctx]() { return ctx.cancelled(); };
    if (desc_.requires_auth && !ctx.auth_token().empty()) {
        hooks.env["FORGE_AUTH_TOKEN"] = ctx.auth_token();
    }

    log_debug("process", "exec " + binary_ + " --execute ...");
    ProcResult pr;
    if (!proc_run_streaming(argv, "", lim, hooks, &pr)) {
        return RunOutcome::failure("cannot start " + binary_ + ": " + pr.error,
                                   raw_output_data(pr, false));
    }

    if (pr.cancelled || ctx.cancelled()) return RunOutcome::cancelled();

    if (pr.timed_out) {
        return RunOutcome::failure(desc_.name + " timed out after " + std::to_string(opts_.timeout_ms) + " ms",
                                   raw_output_data(pr, true));
    }

    auto parsed = parse_terminal_result(pr.output);
    if (!parsed) {
        std::string head = trim(pr.output).substr(0, 200);
        std::string summary = desc_.name + " exited with code " + std::to_string(pr.exit_code) +
                              " without a valid JSON result";
        if (!head.empty()) summary += ": " + head;
        return RunOutcome::failure(summary, raw_output_data(pr, false));
    }
    return *parsed;
}

} // namespace forge
