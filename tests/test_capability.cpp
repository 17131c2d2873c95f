#include "test_common.h"
#include "forge/capability.h"
#include "forge/json_mini.h"

#include <json-c/json.h>

using namespace forge;

static CapabilityDescriptor cap(const std::string& name, ValueKind kind, bool required = false, Value def = {}) {
    CapabilityDescriptor c;
    c.name = name;
    c.description = name + " option";
    c.kind = kind;
    c.required = required;
    c.default_value = std::move(def);
    return c;
}

static bool throws_usage(const CapabilityList& caps, const std::vector<std::string>& argv, std::string* what) {
    try {
        auto cli = parse_cli_args(caps, argv);
        (void)coerce_args(caps, cli.values);
    } catch (const UsageError& e) {
        if (what) *what = e.what();
        return true;
    }
    return false;
}

int main() {
    CapabilityDescriptor command = cap("command", ValueKind::STRING);
    command.allowed_values = std::vector<std::string>{"scan", "match"};

    CapabilityDescriptor format = cap("format", ValueKind::STRING, false, std::string("text"));
    format.allowed_values = std::vector<std::string>{"text", "json"};

    CapabilityList caps = {
        command,
        cap("image", ValueKind::STRING, true),
        cap("limit", ValueKind::INT, false, int64_t(10)),
        cap("ratio", ValueKind::FLOAT),
        cap("verbose", ValueKind::BOOL),
        format,
    };

    // 1) validation rules
    {
        std::string err;
        for (const auto& c : caps) expect_true(validate_capability(c, &err), "valid capability rejected: " + err);
        expect_true(!validate_capability(cap("bad name", ValueKind::STRING), &err), "whitespace in name accepted");
        expect_true(!validate_capability(cap("x", ValueKind::INT, true, int64_t(1)), &err), "required with default accepted");
        expect_true(!validate_capability(cap("x", ValueKind::INT, false, std::string("one")), &err), "default of wrong kind accepted");
        CapabilityDescriptor c = cap("mode", ValueKind::STRING, false, std::string("z"));
        c.allowed_values = std::vector<std::string>{"a", "b"};
        expect_true(!validate_capability(c, &err), "default outside allowed values accepted");
    }

    // 2) subcommand + flags + coercion
    {
        auto cli = parse_cli_args(caps, {"scan", "--image", "cgr.dev/x", "--limit=25", "--ratio", "0.5", "--verbose"});
        expect_true(!cli.help, "no help requested");
        ArgMap args = coerce_args(caps, cli.values);
        expect_true(std::get<std::string>(args["command"]) == "scan", "positional subcommand");
        expect_true(std::get<std::string>(args["image"]) == "cgr.dev/x", "string flag");
        expect_eq_ll(std::get<int64_t>(args["limit"]), 25, "inline int flag");
        expect_true(std::get<double>(args["ratio"]) == 0.5, "float flag");
        expect_true(std::get<bool>(args["verbose"]), "presence flag");
        expect_true(std::get<std::string>(args["format"]) == "text", "default applied");
        expect_eq_ll((long long)args.size(), (long long)caps.size(), "every capability present");
    }

    // 3) unset optional values and boolean negation
    {
        auto cli = parse_cli_args(caps, {"--image", "a", "--no-verbose"});
        ArgMap args = coerce_args(caps, cli.values);
        expect_true(!value_is_set(args["command"]), "unset subcommand is monostate");
        expect_true(!value_is_set(args["ratio"]), "unset float is monostate");
        expect_true(!std::get<bool>(args["verbose"]), "--no-verbose");
        expect_eq_ll(std::get<int64_t>(args["limit"]), 10, "int default");
    }

    // 4) constraint violations are usage errors naming the capability
    {
        std::string what;
        expect_true(throws_usage(caps, {"scan"}, &what), "missing required accepted");
        expect_true(contains(what, "image"), "error names missing capability: " + what);
        expect_true(throws_usage(caps, {"--image", "a", "--limit", "ten"}, &what), "non-integer accepted");
        expect_true(throws_usage(caps, {"--image", "a", "--format", "xml"}, &what), "value outside allowed_values accepted");
        expect_true(contains(what, "text, json"), "allowed values listed: " + what);
        expect_true(throws_usage(caps, {"--image", "a", "--bogus", "1"}, &what), "unknown flag accepted");
        expect_true(throws_usage(caps, {"--image"}, &what), "flag without value accepted");
        expect_true(throws_usage(caps, {"--image", "a", "stray"}, &what), "stray positional accepted");
    }

    // 5) help
    {
        auto cli = parse_cli_args(caps, {"--help"});
        expect_true(cli.help, "--help detected");
        std::string u = usage_text("forge gauge", "Gauge images", caps);
        expect_true(contains(u, "<scan|match>"), "usage lists subcommands");
        expect_true(contains(u, "--image <str>"), "usage lists typed flag");
        expect_true(contains(u, "(required)"), "usage marks required");
    }

    // 6) wire form round-trip and JSON Schema
    {
        json_object* arr = capabilities_to_json(caps);
        CapabilityList back;
        std::string err;
        expect_true(capabilities_from_json(arr, &back, &err), "from_json: " + err);
        json_object_put(arr);
        expect_true(back == caps, "capability list survives the wire form");

        json_mini::Doc bad = json_mini::parse("[{\"name\":\"x\",\"type\":\"blob\"}]");
        expect_true(!capabilities_from_json(bad.root, &back, &err), "unknown type accepted");

        json_mini::Doc schema = json_mini::parse_object(capabilities_to_json_schema(caps));
        expect_true((bool)schema, "schema is a JSON object");
        json_object* props = json_mini::member(schema.root, "properties");
        json_object* limit = json_mini::member(props, "limit");
        expect_eq_str(json_mini::get_string(limit, "type").value_or(""), "integer", "int schema type");
        json_object* req = json_mini::member(schema.root, "required");
        expect_eq_ll((long long)json_object_array_length(req), 1, "one required property");
    }

    std::cerr << "test_capability: ALL PASSED" << std::endl;
    return 0;
}
