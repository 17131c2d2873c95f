#include "test_common.h"
#include "forge/dispatcher.h"
#include "forge/doctor_plugin.h"
#include "forge/json_mini.h"

#include <functional>
#include <sstream>
#include <stdexcept>

using namespace forge;

namespace {

using RunFn = std::function<RunOutcome(const ArgMap&, ExecutionContext&)>;

class ScriptedPlugin : public IPlugin {
public:
    ScriptedPlugin(std::string name, CapabilityList caps, RunFn fn, bool auth = false, int* runs = nullptr)
        : name_(std::move(name)), caps_(std::move(caps)), fn_(std::move(fn)), auth_(auth), runs_(runs) {}

    std::string name() const override { return name_; }
    std::string description() const override { return "scripted " + name_; }
    std::string version() const override { return "1.0.0"; }
    bool requires_auth() const override { return auth_; }
    CapabilityList get_capabilities() const override { return caps_; }

    RunOutcome run(const ArgMap& args, ExecutionContext& ctx) override {
        if (runs_) (*runs_)++;
        return fn_(args, ctx);
    }

private:
    std::string name_;
    CapabilityList caps_;
    RunFn fn_;
    bool auth_;
    int* runs_;
};

class StaticTokens : public ITokenProvider {
public:
    explicit StaticTokens(std::string tok) : tok_(std::move(tok)) {}
    std::string token() override {
        if (tok_.empty()) throw AuthError("chainctl auth failed. Run 'chainctl auth login' first.");
        return tok_;
    }

private:
    std::string tok_;
};

void add(PluginRegistry& reg, ScriptedPlugin* p) {
    expect_true(reg.registerPlugin(std::unique_ptr<IPlugin>(p), PluginSource::NATIVE, "test"), "register " + p->name());
}

CapabilityDescriptor required_image() {
    CapabilityDescriptor c;
    c.name = "image";
    c.description = "image reference";
    c.required = true;
    return c;
}

} // namespace

int main() {
    auto dir = make_temp_dir("dispatcher");
    int runs = 0;
    std::string seen_token;
    std::string seen_config;

    PluginRegistry reg;
    add(reg, new ScriptedPlugin("hello", {}, [](const ArgMap&, ExecutionContext& ctx) {
        ctx.progress(0.5, "halfway");
        return RunOutcome::success("Hello!");
    }, false, &runs));
    add(reg, new ScriptedPlugin("scan", {required_image()}, [](const ArgMap& a, ExecutionContext&) {
        return RunOutcome::success("scanned " + std::get<std::string>(a.at("image")));
    }, false, &runs));
    add(reg, new ScriptedPlugin("boom", {}, [](const ArgMap&, ExecutionContext&) -> RunOutcome {
        throw std::runtime_error("kaboom");
    }));
    add(reg, new ScriptedPlugin("halfdone", {}, [](const ArgMap&, ExecutionContext&) {
        return RunOutcome(RunStatus::PARTIAL, "2 of 3", "{\"output\":\"line one\\nline two\"}",
                          {{"report", "/tmp/report.json"}});
    }));
    add(reg, new ScriptedPlugin("waiter", {}, [](const ArgMap&, ExecutionContext& ctx) {
        return ctx.cancelled() ? RunOutcome::cancelled() : RunOutcome::success("not cancelled");
    }));
    add(reg, new ScriptedPlugin("secure", {}, [&](const ArgMap&, ExecutionContext& ctx) {
        seen_token = ctx.auth_token();
        seen_config = ctx.config_value("org").value_or("");
        return RunOutcome::success("authed");
    }, true, &runs));
    expect_true(reg.registerPlugin(std::unique_ptr<IPlugin>(new DoctorPlugin({"sh"})), PluginSource::NATIVE, "builtin"),
                "register doctor");

    StaticTokens good("tok-123");
    ConfigMap config = {{"org", "acme"}};

    // Scenario A: plugin without capabilities, no arguments
    {
        std::ostringstream out, err;
        Dispatcher d(reg, &good, config, out, err);
        std::vector<double> fractions;
        d.setProgressSink([&](double f, const std::string&) { fractions.push_back(f); });
        expect_eq_ll(d.invoke("hello", {}), 0, "hello exit code");
        expect_true(d.lastOutcome() && d.lastOutcome()->status() == RunStatus::SUCCESS, "hello succeeded");
        expect_true(contains(out.str(), "Hello!"), "summary printed");
        expect_eq_ll((long long)fractions.size(), 1, "progress forwarded");
    }

    // Scenario D: required capability omitted
    {
        std::ostringstream out, err;
        Dispatcher d(reg, &good, config, out, err);
        int before = runs;
        expect_eq_ll(d.invoke("scan", {}), EXIT_USAGE, "usage exit code");
        expect_eq_ll(runs, before, "plugin never ran");
        expect_true(!d.pluginInvoked(), "not invoked");
        expect_true(contains(err.str(), "image"), "error names the capability: " + err.str());

        expect_eq_ll(d.invoke("scan", {"--image", "cgr.dev/x"}), 0, "scan with image");
        expect_true(contains(out.str(), "scanned cgr.dev/x"), "scan output");
    }

    // unknown plugin, help
    {
        std::ostringstream out, err;
        Dispatcher d(reg, &good, config, out, err);
        expect_eq_ll(d.invoke("nosuch", {}), EXIT_USAGE, "unknown plugin is a usage error");
        expect_true(contains(err.str(), "unknown plugin 'nosuch'"), "unknown plugin message");
        expect_eq_ll(d.invoke("scan", {"--help"}), 0, "help exits 0");
        expect_true(contains(out.str(), "usage: forge scan"), "usage printed");
        expect_true(!d.pluginInvoked(), "help does not run the plugin");
    }

    // exceptions, partial results, cancellation
    {
        std::ostringstream out, err;
        Dispatcher d(reg, &good, config, out, err);
        expect_eq_ll(d.invoke("boom", {}), 1, "throwing plugin is a failure");
        expect_true(contains(d.lastOutcome()->summary(), "kaboom"), "exception message kept");
        expect_true(contains(err.str(), "kaboom"), "failure printed");

        expect_eq_ll(d.invoke("halfdone", {}), EXIT_PARTIAL, "partial exit code");
        expect_true(contains(out.str(), "line one\nline two"), "data output printed instead of summary");
        expect_true(!contains(out.str(), "2 of 3"), "summary replaced by output");
        expect_true(contains(out.str(), "report: /tmp/report.json"), "artifacts printed");

        CancelToken c;
        c.cancel();
        d.setCancelToken(c);
        expect_eq_ll(d.invoke("waiter", {}), EXIT_CANCELLED, "cancelled exit code");
    }

    // auth: resolved only for plugins that need it
    {
        std::ostringstream out, err;
        Dispatcher d(reg, &good, config, out, err);
        expect_eq_ll(d.invoke("secure", {}), 0, "authed run");
        expect_eq_str(seen_token, "tok-123", "token handed to plugin");
        expect_eq_str(seen_config, "acme", "config handed to plugin");

        StaticTokens bad("");
        Dispatcher d2(reg, &bad, config, out, err);
        int before = runs;
        expect_eq_ll(d2.invoke("secure", {}), 1, "auth failure exit code");
        expect_eq_ll(runs, before, "plugin not run without a token");
        expect_true(contains(err.str(), "chainctl auth login"), "auth error printed");
        expect_eq_ll(d2.invoke("hello", {}), 0, "no token needed for hello");
    }

    // run log, version text, schema
    {
        const std::string log_path = (dir / "runs.jsonl").string();
        RunLog log(log_path, "run_test");
        expect_true(log.ok(), "run log opened");
        std::ostringstream out, err;
        Dispatcher d(reg, &good, config, out, err);
        d.setRunLog(&log);
        expect_eq_ll(d.invoke("hello", {}), 0, "hello with run log");

        std::ifstream in(log_path);
        std::vector<std::string> lines;
        for (std::string l; std::getline(in, l);) lines.push_back(l);
        expect_eq_ll((long long)lines.size(), 3, "run_start, progress, run_end");
        json_mini::Doc first = json_mini::parse_object(lines[0]);
        expect_eq_str(json_mini::get_string(first.root, "event").value_or(""), "run_start", "first event");
        expect_eq_str(json_mini::get_string(first.root, "run_id").value_or(""), "run_test", "run id");
        expect_true(lines[0].find("\"event\"") < lines[0].find("\"payload\""), "keys sorted");
        json_mini::Doc last = json_mini::parse_object(lines[2]);
        expect_eq_ll(json_mini::get_int(last.root, "seq").value_or(-1), 2, "sequence numbers");

        std::string v = d.versionText();
        expect_true(contains(v, FORGE_VERSION) && contains(v, "hello"), "version text");

        std::string schema;
        expect_true(d.schemaJson("scan", &schema), "schema for scan");
        json_mini::Doc s = json_mini::parse_object(schema);
        json_object* input = json_mini::member(s.root, "input_schema");
        expect_true(json_mini::member(json_mini::member(input, "properties"), "image") != nullptr, "schema property");
        expect_true(!d.schemaJson("nosuch", &schema), "no schema for unknown plugin");
    }

    // built-in doctor
    {
        std::ostringstream out, err;
        Dispatcher d(reg, &good, config, out, err);
        expect_eq_ll(d.invoke("doctor", {}), 0, "sh is on PATH");
        expect_true(contains(out.str(), "ok       sh"), "doctor output");
        expect_eq_ll(d.invoke("doctor", {"--tools", "sh, forge-absent-binary"}), EXIT_PARTIAL, "missing tool is partial");
        expect_true(contains(out.str(), "missing  forge-absent-binary"), "missing tool listed");
    }

    std::filesystem::remove_all(dir);
    std::cerr << "test_dispatcher: ALL PASSED" << std::endl;
    return 0;
}
