#include "test_common.h"
#include "forge/introspection.h"

#include <filesystem>

using namespace forge;

int main(int argc, char** argv) {
    if (argc < 2) die("usage: test_introspection_cache <probe_binary>");
    const std::string probe = argv[1];
    auto dir = make_temp_dir("introspect");
    const std::string cache_path = (dir / "binary-plugins.json").string();

    // 1) introspect the probe binary
    PluginDescriptor desc;
    std::string err;
    expect_true(introspect_binary(probe, 10000, &desc, &err), "introspect: " + err);
    expect_eq_str(desc.name, "probe", "name");
    expect_eq_str(desc.description, "d", "description");
    expect_eq_str(desc.version, "1.0.0", "version");
    expect_true(!desc.requires_auth, "requires_auth");
    expect_true(desc.capabilities.empty(), "no params");

    // 2) cache round-trip reproduces an identical descriptor without the binary
    CapabilityDescriptor mode;
    mode.name = "mode";
    mode.description = "scan mode";
    mode.default_value = std::string("fast");
    mode.allowed_values = std::vector<std::string>{"fast", "deep"};
    CapabilityDescriptor depth;
    depth.name = "depth";
    depth.kind = ValueKind::INT;
    depth.required = true;
    PluginDescriptor rich{"rich", "rich plugin", "2.1.0-rc.1", true, {mode, depth}};
    {
        IntrospectionCache cache(cache_path);
        expect_true(cache.load(nullptr, &err), "load missing cache: " + err);
        expect_true(cache.entries().empty(), "missing cache is empty");
        cache.put("probe", CachedBinaryPlugin{"/nonexistent/probe", desc});
        cache.put("rich", CachedBinaryPlugin{"/nonexistent/rich", rich});
        expect_true(cache.save(&err), "save: " + err);
    }
    {
        IntrospectionCache cache(cache_path);
        std::vector<std::string> warnings;
        expect_true(cache.load(&warnings, &err), "reload: " + err);
        expect_true(warnings.empty(), "no warnings on clean cache");
        auto p = cache.get("probe");
        expect_true(p.has_value(), "probe cached");
        expect_eq_str(p->descriptor.version, "1.0.0", "cached version");
        expect_true(p->descriptor == desc, "probe descriptor identical after reload");
        auto r = cache.get("rich");
        expect_true(r.has_value() && r->descriptor == rich, "rich descriptor identical after reload");
        expect_eq_str(r->binary_path, "/nonexistent/rich", "binary path kept");

        expect_true(cache.erase("rich"), "erase");
        expect_true(!cache.erase("rich"), "second erase is a no-op");
        expect_true(cache.save(&err), "save after erase: " + err);
    }
    expect_true(!std::filesystem::exists(cache_path + ".tmp." + std::to_string(::getpid())), "no temp file left");

    // 3) bad entries are skipped, good ones survive
    write_text(cache_path,
               "{\"probe\":{\"binary_path\":\"/x/probe\",\"introspect_data\":"
               "{\"name\":\"probe\",\"description\":\"d\",\"version\":\"1.0.0\",\"requires_auth\":false,\"params\":[]}},"
               "\"nopath\":{\"introspect_data\":{}},"
               "\"badver\":{\"binary_path\":\"/x/b\",\"introspect_data\":"
               "{\"name\":\"badver\",\"description\":\"d\",\"version\":\"one\",\"params\":[]}},"
               "\"scalar\":42}");
    {
        IntrospectionCache cache(cache_path);
        std::vector<std::string> warnings;
        expect_true(cache.load(&warnings, &err), "load mixed cache: " + err);
        expect_eq_ll((long long)cache.entries().size(), 1, "only the good entry");
        expect_eq_ll((long long)warnings.size(), 3, "one warning per bad entry");
    }

    // 4) a corrupt file is an error, not a crash
    write_text(cache_path, "{\"probe\": {");
    {
        IntrospectionCache cache(cache_path);
        err.clear();
        expect_true(!cache.load(nullptr, &err), "corrupt cache rejected");
        expect_true(!err.empty(), "corrupt cache error text");
    }

    // 5) introspection output validation
    expect_true(!parse_introspection("", &desc, &err), "empty output rejected");
    expect_true(!parse_introspection("{\"name\":\"x\"} trailing", &desc, &err), "trailing garbage rejected");
    expect_true(!parse_introspection("{\"name\":\"\",\"description\":\"d\",\"version\":\"1.0.0\"}", &desc, &err),
                "empty name rejected");
    expect_true(!introspect_binary("/nonexistent/forge-probe", 2000, &desc, &err), "missing binary rejected");

    std::filesystem::remove_all(dir);
    std::cerr << "test_introspection_cache: ALL PASSED" << std::endl;
    return 0;
}
