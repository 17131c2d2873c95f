#include "forge/wrapper_plugin.h"
#include "forge/json_mini.h"
#include "forge/log.h"
#include "forge/proc.h"
#include "forge/util.h"

namespace forge {

bool wrapper_from_json(const std::string& json, WrapperDefinition* out, std::string* err) {
    json_mini::Doc doc = json_mini::parse_object(json);
    if (!doc) {
        if (err) *err = "wrapper definition is not a JSON object";
        return false;
    }
    WrapperDefinition w;
    w.name = json_mini::get_string(doc.root, "name").value_or("");
    w.description = json_mini::get_string(doc.root, "description").value_or("");
    w.version = json_mini::get_string(doc.root, "version").value_or("");
    w.requires_auth = json_mini::get_bool(doc.root, "requires_auth").value_or(false);
    w.binary = json_mini::get_string(doc.root, "binary").value_or("");
    w.args = json_mini::get_array_strings(doc.root, "args");
    w.auth_flag = json_mini::get_string(doc.root, "auth_flag").value_or("");
    if (w.binary.empty()) {
        if (err) *err = "wrapper definition '" + w.name + "' has no binary";
        return false;
    }
    if (!capabilities_from_json(json_mini::member(doc.root, "params"), &w.params, err)) {
        return false;
    }

    PluginDescriptor d{w.name, w.description, w.version, w.requires_auth, w.params};
    if (!check_conformance(d, err)) return false;

    if (out) *out = std::move(w);
    return true;
}

std::string wrapper_to_json(const WrapperDefinition& w) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "name", json_mini::new_string(w.name));
    json_object_object_add(o, "description", json_mini::new_string(w.description));
    json_object_object_add(o, "version", json_mini::new_string(w.version));
    json_object_object_add(o, "requires_auth", json_object_new_boolean(w.requires_auth ? 1 : 0));
    json_object_object_add(o, "binary", json_mini::new_string(w.binary));
    json_object_object_add(o, "args", json_mini::new_string_array(w.args));
    if (!w.auth_flag.empty()) json_object_object_add(o, "auth_flag", json_mini::new_string(w.auth_flag));
    json_object_object_add(o, "params", capabilities_to_json(w.params));
    std::string s = json_mini::to_string(o);
    json_object_put(o);
    return s;
}

std::vector<std::string> wrapper_argv(const WrapperDefinition& w, const ArgMap& args, const std::string& token) {
    std::vector<std::string> argv{w.binary};
    argv.insert(argv.end(), w.args.begin(), w.args.end());

    const CapabilityDescriptor* sub = find_subcommand(w.params);
    if (sub) {
        auto it = args.find(sub->name);
        if (it != args.end() && value_is_set(it->second)) argv.push_back(value_to_display(it->second));
    }

    for (const auto& c : w.params) {
        if (sub && c.name == sub->name) continue;
        auto it = args.find(c.name);
        if (it == args.end() || !value_is_set(it->second)) continue;
        if (c.kind == ValueKind::BOOL) {
            if (std::get_if<bool>(&it->second) && std::get<bool>(it->second)) argv.push_back("--" + c.name);
            continue;
        }
        argv.push_back("--" + c.name);
        argv.push_back(value_to_display(it->second));
    }

    if (!w.auth_flag.empty() && !token.empty()) {
        argv.push_back(w.auth_flag);
        argv.push_back(token);
    }
    return argv;
}

WrapperPlugin::WrapperPlugin(WrapperDefinition def, ProcessRunOptions opts)
    : def_(std::move(def)), opts_(opts) {}

RunOutcome WrapperPlugin::run(const ArgMap& args, ExecutionContext& ctx) {
    if (ctx.cancelled()) return RunOutcome::cancelled();

    std::string resolved = find_executable(def_.binary);
    if (resolved.empty()) {
        return RunOutcome::failure("'" + def_.binary + "' not found on PATH; reinstall with: forge plugins install " +
                                   def_.name);
    }

    std::vector<std::string> argv = wrapper_argv(def_, args, ctx.auth_token());
    argv[0] = resolved;

    ProcLimits lim;
    lim.timeout_ms = opts_.timeout_ms;
    lim.kill_grace_ms = opts_.kill_grace_ms;

    ProcHooks hooks;
    hooks.should_cancel = [&ctx]() { return ctx.cancelled(); };
    if (def_.requires_auth && !ctx.auth_token().empty()) {
        hooks.env["FORGE_AUTH_TOKEN"] = ctx.auth_token();
    }

    ctx.progress(0.0, "Running " + def_.binary);
    ProcResult pr;
    if (!proc_run_streaming(argv, "", lim, hooks, &pr)) {
        return RunOutcome::failure("cannot start " + resolved + ": " + pr.error);
    }
    if (pr.cancelled || ctx.cancelled()) return RunOutcome::cancelled();

    json_object* data = json_object_new_object();
    json_object_object_add(data, "exit_code", json_object_new_int(pr.exit_code));
    json_object_object_add(data, "output", json_mini::new_string(pr.output));
    json_object_object_add(data, "stderr", json_mini::new_string(pr.error_output));
    if (pr.timed_out) json_object_object_add(data, "timed_out", json_object_new_boolean(1));
    std::string data_json = json_mini::to_string(data);
    json_object_put(data);

    if (pr.timed_out) {
        return RunOutcome::failure(def_.name + " timed out after " + std::to_string(opts_.timeout_ms) + " ms",
                                   data_json);
    }
    if (pr.exit_code != 0) {
        log_debug("wrapper", def_.name + " exited with " + std::to_string(pr.exit_code));
        return RunOutcome::failure(def_.name + " exited with code " + std::to_string(pr.exit_code), data_json);
    }
    ctx.progress(1.0, "Done");
    return RunOutcome::success(def_.name + " completed", data_json);
}

} // namespace forge
