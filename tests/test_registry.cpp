#include "test_common.h"
#include "forge/introspection.h"
#include "forge/registry.h"

#include <filesystem>
#include <stdexcept>

using namespace forge;

namespace {

class FixedPlugin : public IPlugin {
public:
    FixedPlugin(std::string name, std::string version, std::string description = "fixed")
        : name_(std::move(name)), version_(std::move(version)), description_(std::move(description)) {}

    std::string name() const override { return name_; }
    std::string description() const override { return description_; }
    std::string version() const override { return version_; }
    bool requires_auth() const override { return false; }
    CapabilityList get_capabilities() const override { return {}; }
    RunOutcome run(const ArgMap&, ExecutionContext&) override { return RunOutcome::success(name_); }

private:
    std::string name_;
    std::string version_;
    std::string description_;
};

struct NotAnException {};

// Fails while describing itself with a non-std exception.
class FaultyPlugin : public FixedPlugin {
public:
    FaultyPlugin() : FixedPlugin("faulty", "1.0.0") {}
    std::string name() const override { throw NotAnException(); }
};

PluginFactory fixed(const std::string& name, const std::string& version = "1.0.0") {
    return [name, version] { return std::unique_ptr<IPlugin>(new FixedPlugin(name, version)); };
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 3) die("usage: test_registry <native_plugin.so> <probe_binary>");
    const std::filesystem::path native_so = argv[1];
    const std::filesystem::path probe = argv[2];
    expect_true(std::filesystem::exists(native_so), "native plugin not found: " + native_so.string());
    expect_true(std::filesystem::exists(probe), "probe not found: " + probe.string());

    // 1) bad factories are isolated from good ones
    {
        PluginRegistry reg;
        BuiltinTable table = {
            {"good", fixed("good")},
            {"throws", [] () -> std::unique_ptr<IPlugin> { throw std::runtime_error("init exploded"); }},
            {"weird", [] () -> std::unique_ptr<IPlugin> { throw 42; }},
            {"faulty", [] { return std::unique_ptr<IPlugin>(new FaultyPlugin()); }},
            {"null", [] { return std::unique_ptr<IPlugin>(); }},
            {"nofactory", PluginFactory()},
            {"badversion", fixed("badversion", "latest")},
            {"bad name", fixed("bad name")},
        };
        DiscoveryOptions opts;
        opts.builtins = table;
        reg.discover(opts);
        expect_eq_ll((long long)reg.size(), 1, "only the conforming plugin registered");
        expect_true(reg.getPlugin("good") != nullptr, "good plugin present");
        expect_eq_ll((long long)reg.warnings().size(), 7, "one warning per rejected entry");
        bool saw_msg = false;
        int unknown = 0;
        for (const auto& w : reg.warnings()) {
            saw_msg = saw_msg || contains(w, "init exploded");
            if (contains(w, "unknown exception")) unknown++;
        }
        expect_true(saw_msg, "factory exception message recorded");
        expect_eq_ll(unknown, 2, "non-std throws from factory and describe are contained");
    }

    // 2) first registration wins within a source
    {
        PluginRegistry reg;
        expect_true(reg.registerFactory("a", fixed("dup", "1.0.0"), PluginSource::NATIVE, "first"), "first dup");
        expect_true(!reg.registerFactory("b", fixed("dup", "2.0.0"), PluginSource::NATIVE, "second"), "second dup rejected");
        expect_eq_str(reg.getDescriptor("dup")->version, "1.0.0", "first registration kept");
    }

    // 3) discovery across sources: native library and process cache share "probe"
    auto dir = make_temp_dir("registry");
    auto plugin_dir = dir / "plugins";
    std::filesystem::create_directories(plugin_dir);
    std::filesystem::copy_file(native_so, plugin_dir / ("test_native" + std::string(plugin_library_extension())));
    write_text(plugin_dir / ("broken" + std::string(plugin_library_extension())), "not an ELF file");

    PluginDescriptor probe_desc;
    std::string err;
    expect_true(introspect_binary(probe.string(), 10000, &probe_desc, &err), "introspect probe: " + err);
    PluginDescriptor other = probe_desc;
    other.name = "probe_only";

    IntrospectionCache cache((dir / "binary-plugins.json").string());
    cache.put("probe", CachedBinaryPlugin{probe.string(), probe_desc});
    cache.put("probe_only", CachedBinaryPlugin{probe.string(), other});
    PluginDescriptor shadowed = probe_desc;
    shadowed.name = "shadowed";
    cache.put("shadowed", CachedBinaryPlugin{probe.string(), shadowed});
    expect_true(cache.save(&err), "save cache: " + err);

    write_text(dir / "wrapper-plugins.json",
               "{\"legacy\":{\"name\":\"legacy\",\"description\":\"old cli\",\"version\":\"0.1.0\","
               "\"binary\":\"true\",\"params\":[]},"
               "\"shadowed\":{\"name\":\"shadowed\",\"description\":\"wrapped cli\",\"version\":\"0.2.0\","
               "\"binary\":\"true\",\"params\":[]},\"broken\":{\"name\":\"broken\"}}");

    for (int round = 0; round < 2; round++) {
        PluginRegistry reg;
        DiscoveryOptions opts;
        opts.builtins = {{"good", fixed("good")}};
        opts.plugin_dir = plugin_dir.string();
        opts.wrapper_defs_path = (dir / "wrapper-plugins.json").string();
        opts.binary_cache_path = (dir / "binary-plugins.json").string();
        reg.discover(opts);

        expect_true(reg.sourceOf("probe") == PluginSource::NATIVE, "native plugin wins the name collision");
        expect_eq_str(reg.getDescriptor("probe")->version, "2.0.0", "native descriptor kept for probe");
        expect_true(reg.sourceOf("probe_only") == PluginSource::PROCESS, "process-only plugin registered");
        expect_true(reg.sourceOf("native_hello") == PluginSource::NATIVE, "library plugin registered");
        expect_true(reg.sourceOf("legacy") == PluginSource::WRAPPER, "wrapper plugin registered as wrapper");
        expect_true(reg.sourceOf("shadowed") == PluginSource::WRAPPER, "wrapper wins over the process plugin");
        expect_eq_str(reg.getDescriptor("shadowed")->version, "0.2.0", "wrapper descriptor kept for shadowed");
        expect_true(reg.getPlugin("broken") == nullptr, "incomplete wrapper skipped");
        expect_eq_ll((long long)reg.size(), 6, "good, native_hello, probe, probe_only, legacy, shadowed");
        expect_eq_str(plugin_source_name(PluginSource::WRAPPER), "wrapper", "wrapper source name");

        auto names = reg.names();
        expect_eq_str(names.front(), "good", "names sorted");
        bool saw_collision = false, saw_broken_lib = false;
        for (const auto& w : reg.warnings()) {
            saw_collision = saw_collision || contains(w, "collides");
            saw_broken_lib = saw_broken_lib || contains(w, "broken");
        }
        expect_true(saw_collision, "collision warning recorded");
        expect_true(saw_broken_lib, "unloadable library warning recorded");
    }

    std::filesystem::remove_all(dir);
    std::cerr << "test_registry: ALL PASSED" << std::endl;
    return 0;
}
