#include "builtin_plugins.h"
#include "cmd_plugins.h"

#include "forge/auth.h"
#include "forge/catalog.h"
#include "forge/config.h"
#include "forge/context.h"
#include "forge/dispatcher.h"
#include "forge/log.h"
#include "forge/registry.h"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

static void show_help(const forge::Dispatcher& d) {
    std::cout << "forge " << FORGE_VERSION << " - plugin runtime\n\n";
    std::cout << "Usage: forge <plugin> [command] [options]\n\n";
    std::cout << "Available plugins:\n" << d.pluginTable() << "\n";
    std::cout << "Built-in commands:\n";
    std::cout << "  version              Show forge and plugin versions\n";
    std::cout << "  plugins              List, install, update or remove external plugins\n";
    std::cout << "  schema <plugin>      Print the JSON Schema of a plugin's arguments\n\n";
    std::cout << "Global options:\n";
    std::cout << "  --version, -V        Show version (short)\n";
    std::cout << "  --help, -h           Show this help\n\n";
    std::cout << "Use 'forge <plugin> --help' for plugin-specific options.\n";
}

int main(int argc, char** argv) {
    using namespace forge;

    apply_profile_defaults(detect_profile());
    ForgeConfig cfg = ForgeConfig::from_env();

    std::string cmd = argc >= 2 ? argv[1] : "";
    if (cmd == "-V" || cmd == "--version") {
        std::cout << "forge " << FORGE_VERSION << "\n";
        return 0;
    }
    if (cmd == "plugins") return cmd_plugins(argc, argv, cfg);

    PluginCatalog catalog;
    std::vector<std::string> catalog_warnings;
    (void)catalog.load(PluginCatalog::resolve_path("", cfg.registry_path), &catalog_warnings);
    for (const auto& w : catalog_warnings) log_debug("catalog", w);

    PluginRegistry registry;
    DiscoveryOptions opts;
    opts.builtins = builtin_plugin_table(catalog);
    opts.plugin_dir = cfg.plugin_dir;
    opts.wrapper_defs_path = cfg.wrapper_defs_path();
    opts.binary_cache_path = cfg.binary_cache_path();
    opts.run_options.timeout_ms = cfg.run_timeout_ms;
    opts.run_options.kill_grace_ms = cfg.cancel_grace_ms;
    registry.discover(opts);

    std::string config_warn;
    ConfigMap user_config = load_user_config(cfg.user_config_path(), &config_warn);
    if (!config_warn.empty()) log_warn("config", config_warn);

    ChainctlTokenProvider tokens;
    Dispatcher dispatcher(registry, &tokens, user_config, std::cout, std::cerr);

    if (cmd.empty() || cmd == "-h" || cmd == "--help") {
        show_help(dispatcher);
        return 0;
    }
    if (cmd == "version") {
        std::cout << dispatcher.versionText();
        return 0;
    }
    if (cmd == "schema") {
        if (argc < 3) {
            std::cerr << "usage: forge schema <plugin>\n";
            return EXIT_USAGE;
        }
        std::string schema;
        if (!dispatcher.schemaJson(argv[2], &schema)) {
            std::cerr << "Error: unknown plugin '" << argv[2] << "'\n";
            return EXIT_USAGE;
        }
        std::cout << schema << "\n";
        return 0;
    }

    std::unique_ptr<RunLog> runlog;
    if (!cfg.run_log_path.empty()) {
        runlog.reset(new RunLog(cfg.run_log_path, new_run_id()));
        if (runlog->ok()) {
            dispatcher.setRunLog(runlog.get());
        } else {
            log_warn("runlog", "cannot open " + cfg.run_log_path);
        }
    }

    CancelToken cancel;
    InterruptGuard guard(cancel);
    dispatcher.setCancelToken(cancel);
    dispatcher.setProgressSink(console_progress);

    std::vector<std::string> rest(argv + 2, argv + argc);
    return dispatcher.invoke(cmd, rest);
}
