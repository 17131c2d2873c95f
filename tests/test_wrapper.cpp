#include "test_common.h"
#include "forge/wrapper_plugin.h"

using namespace forge;

static const char* DEF =
    "{\"name\":\"legacy\",\"description\":\"Legacy scanner\",\"version\":\"1.2.3\","
    "\"binary\":\"echo\",\"args\":[\"legacy-scan\"],\"auth_flag\":\"--token\",\"requires_auth\":true,"
    "\"params\":["
    "{\"name\":\"command\",\"type\":\"str\",\"choices\":[\"scan\",\"list\"]},"
    "{\"name\":\"image\",\"type\":\"str\",\"required\":true},"
    "{\"name\":\"verbose\",\"type\":\"bool\"},"
    "{\"name\":\"limit\",\"type\":\"int\",\"default\":5}]}";

static ExecutionContext make_ctx(const std::string& token, CancelToken cancel = {}) {
    return ExecutionContext(token, {}, nullptr, cancel);
}

int main() {
    // 1) parse + serialize
    WrapperDefinition def;
    std::string err;
    expect_true(wrapper_from_json(DEF, &def, &err), "parse wrapper: " + err);
    expect_eq_str(def.binary, "echo", "binary");
    expect_eq_ll((long long)def.params.size(), 4, "params");
    WrapperDefinition again;
    expect_true(wrapper_from_json(wrapper_to_json(def), &again, &err), "reparse: " + err);
    expect_eq_str(again.auth_flag, "--token", "auth flag survives");
    expect_true(again.params == def.params, "params survive");

    expect_true(!wrapper_from_json("{\"name\":\"x\",\"description\":\"d\",\"version\":\"1.0.0\"}", &again, &err),
                "missing binary accepted");
    expect_true(!wrapper_from_json("{\"name\":\"x\",\"description\":\"d\",\"version\":\"v1\",\"binary\":\"b\"}",
                                   &again, &err),
                "bad version accepted");

    // 2) argv mapping
    ArgMap args;
    args["command"] = std::string("scan");
    args["image"] = std::string("cgr.dev/app");
    args["verbose"] = true;
    args["limit"] = int64_t(5);
    auto argv = wrapper_argv(def, args, "tok");
    std::vector<std::string> want = {"echo", "legacy-scan", "scan", "--image", "cgr.dev/app",
                                     "--verbose", "--limit", "5", "--token", "tok"};
    expect_true(argv == want, "wrapper argv");

    args["verbose"] = false;
    argv = wrapper_argv(def, args, "");
    expect_eq_ll((long long)argv.size(), 7, "false flag and empty token omitted");

    // 3) run against echo
    {
        WrapperPlugin p(def);
        auto ctx = make_ctx("tok");
        args["verbose"] = true;
        RunOutcome o = p.run(args, ctx);
        expect_true(o.status() == RunStatus::SUCCESS, "echo wrapper succeeds: " + o.summary());
        expect_eq_str(o.summary(), "legacy completed", "summary");
        std::string out = o.data_string("output").value_or("");
        expect_true(contains(out, "legacy-scan scan --image cgr.dev/app --verbose"), "output captured: " + out);
        expect_eq_ll((long long)(ctx.last_fraction() * 100), 100, "progress finished");
    }

    // 4) non-zero exit is a failure carrying output
    {
        WrapperDefinition f = def;
        f.binary = "false";
        f.args.clear();
        WrapperPlugin p(f);
        auto ctx = make_ctx("");
        RunOutcome o = p.run(args, ctx);
        expect_true(o.status() == RunStatus::FAILURE, "false wrapper fails");
        expect_true(contains(o.summary(), "exited with code 1"), "exit code in summary: " + o.summary());
    }

    // 5) missing binary names the reinstall command
    {
        WrapperDefinition m = def;
        m.binary = "forge-definitely-not-installed";
        WrapperPlugin p(m);
        auto ctx = make_ctx("");
        RunOutcome o = p.run(args, ctx);
        expect_true(o.status() == RunStatus::FAILURE, "missing binary fails");
        expect_true(contains(o.summary(), "forge plugins install legacy"), "reinstall hint: " + o.summary());
    }

    // 6) cancelled before start
    {
        CancelToken c;
        c.cancel();
        WrapperPlugin p(def);
        auto ctx = make_ctx("", c);
        expect_true(p.run(args, ctx).status() == RunStatus::CANCELLED, "pre-cancelled run");
    }

    std::cerr << "test_wrapper: ALL PASSED" << std::endl;
    return 0;
}
