#include "forge/dispatcher.h"
#include "forge/capability.h"
#include "forge/json_mini.h"

#include <json-c/json.h>

#include <cstdio>
#include <sstream>

namespace forge {

int exit_code_for(RunStatus s) {
    switch (s) {
        case RunStatus::SUCCESS:   return EXIT_OK;
        case RunStatus::FAILURE:   return EXIT_FAILURE_RUN;
        case RunStatus::PARTIAL:   return EXIT_PARTIAL;
        case RunStatus::CANCELLED: return EXIT_CANCELLED;
    }
    return EXIT_FAILURE_RUN;
}

Dispatcher::Dispatcher(const PluginRegistry& registry,
                       ITokenProvider* tokens,
                       ConfigMap config,
                       std::ostream& out,
                       std::ostream& err)
    : registry_(registry),
      tokens_(tokens),
      config_(std::move(config)),
      out_(out),
      err_(err) {}

void Dispatcher::logEvent(const std::string& name, const std::string& payload_json) {
    if (runlog_) runlog_->event(name, payload_json);
}

int Dispatcher::invoke(const std::string& name, const std::vector<std::string>& argv) {
    last_.reset();
    invoked_ = false;

    IPlugin* plugin = registry_.getPlugin(name);
    const PluginDescriptor* desc = registry_.getDescriptor(name);
    if (!plugin || !desc) {
        err_ << "Error: unknown plugin '" << name << "'. Run 'forge --help' to list plugins.\n";
        return EXIT_USAGE;
    }

    ArgMap args;
    try {
        ParsedCli cli = parse_cli_args(desc->capabilities, argv);
        if (cli.help) {
            out_ << usage_text("forge " + name, desc->description, desc->capabilities);
            return EXIT_OK;
        }
        args = coerce_args(desc->capabilities, cli.values);
    } catch (const UsageError& e) {
        err_ << "Error: " << e.what() << "\n";
        err_ << "Run 'forge " << name << " --help' for usage.\n";
        return EXIT_USAGE;
    }

    std::string token;
    if (desc->requires_auth) {
        if (!tokens_) {
            err_ << "Error: plugin '" << name << "' requires authentication but no token provider is configured\n";
            return EXIT_FAILURE_RUN;
        }
        try {
            token = tokens_->token();
        } catch (const AuthError& e) {
            err_ << "Error: " << e.what() << "\n";
            return EXIT_FAILURE_RUN;
        }
    }

    {
        json_object* p = json_object_new_object();
        json_object_object_add(p, "plugin", json_mini::new_string(name));
        json_object_object_add(p, "version", json_mini::new_string(desc->version));
        json_object_object_add(p, "args", json_tokener_parse(args_to_json(args).c_str()));
        logEvent("run_start", json_object_to_json_string_ext(p, JSON_C_TO_STRING_PLAIN));
        json_object_put(p);
    }

    ProgressSink sink = [this](double fraction, const std::string& message) {
        if (sink_) sink_(fraction, message);
        if (runlog_) {
            json_object* p = json_object_new_object();
            json_object_object_add(p, "fraction", json_object_new_double(fraction));
            json_object_object_add(p, "message", json_mini::new_string(message));
            runlog_->event("progress", json_object_to_json_string_ext(p, JSON_C_TO_STRING_PLAIN));
            json_object_put(p);
        }
    };
    ExecutionContext ctx(token, config_, sink, cancel_);

    invoked_ = true;
    RunOutcome outcome = runGuarded(*plugin, args, ctx);
    last_ = outcome;

    logEvent("run_end", outcome_to_json(outcome));
    render(outcome);
    return exit_code_for(outcome.status());
}

RunOutcome Dispatcher::runGuarded(IPlugin& plugin, const ArgMap& args, ExecutionContext& ctx) {
    try {
        return plugin.run(args, ctx);
    } catch (const std::exception& e) {
        log_error("dispatcher", "plugin '" + plugin.name() + "' threw: " + e.what());
        return RunOutcome::failure(std::string("Plugin error: ") + e.what());
    } catch (...) {
        log_error("dispatcher", "plugin threw a non-standard exception");
        return RunOutcome::failure("Plugin error: unknown exception");
    }
}

void Dispatcher::render(const RunOutcome& o) {
    std::ostream& os = (o.status() == RunStatus::FAILURE || o.status() == RunStatus::CANCELLED) ? err_ : out_;
    if (auto text = o.data_string("output")) {
        out_ << *text;
        if (!text->empty() && text->back() != '\n') out_ << "\n";
        if (o.status() == RunStatus::FAILURE && !o.summary().empty()) err_ << "Error: " << o.summary() << "\n";
    } else if (!o.summary().empty()) {
        if (o.status() == RunStatus::FAILURE) os << "Error: ";
        os << o.summary() << "\n";
    }

    if (!o.artifacts().empty()) {
        out_ << "\nArtifacts:\n";
        for (const auto& kv : o.artifacts()) out_ << "  " << kv.first << ": " << kv.second << "\n";
    }
}

std::string Dispatcher::pluginTable() const {
    std::ostringstream os;
    for (const auto& n : registry_.names()) {
        const PluginDescriptor* d = registry_.getDescriptor(n);
        char col[64];
        std::snprintf(col, sizeof(col), "%-20s", n.c_str());
        os << "  " << col << " " << (d ? d->description : "") << "\n";
    }
    return os.str();
}

std::string Dispatcher::versionText() const {
    std::ostringstream os;
    os << "forge " << FORGE_VERSION << "\n";
    auto names = registry_.names();
    if (names.empty()) return os.str();
    os << "\nPlugins:\n";
    for (const auto& n : names) {
        const PluginDescriptor* d = registry_.getDescriptor(n);
        auto src = registry_.sourceOf(n);
        char col[64];
        std::snprintf(col, sizeof(col), "%-20s", n.c_str());
        os << "  " << col << " " << (d ? d->version : "?");
        if (src) os << " (" << plugin_source_name(*src) << ")";
        os << "\n";
    }
    return os.str();
}

bool Dispatcher::schemaJson(const std::string& name, std::string* out) const {
    const PluginDescriptor* d = registry_.getDescriptor(name);
    if (!d) return false;
    json_object* o = json_object_new_object();
    json_object_object_add(o, "name", json_mini::new_string(d->name));
    json_object_object_add(o, "description", json_mini::new_string(d->description));
    json_object_object_add(o, "version", json_mini::new_string(d->version));
    json_object_object_add(o, "requires_auth", json_object_new_boolean(d->requires_auth));
    json_object_object_add(o, "input_schema", json_tokener_parse(capabilities_to_json_schema(d->capabilities).c_str()));
    if (out) *out = json_object_to_json_string_ext(o, JSON_C_TO_STRING_PRETTY | JSON_C_TO_STRING_SPACED);
    json_object_put(o);
    return true;
}

} // namespace forge
