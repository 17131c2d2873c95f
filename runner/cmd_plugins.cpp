#include "cmd_plugins.h"

#include "forge/catalog.h"
#include "forge/log.h"
#include "forge/plugin_installer.h"
#include "forge/system_deps.h"

#include <iostream>
#include <string>
#include <vector>

namespace forge {

static void plugins_usage() {
    std::cerr << "usage: forge plugins list [--tag TAG] [-v]\n"
              << "       forge plugins install <name> [--strict]\n"
              << "       forge plugins update [<name>|--all] [--strict]\n"
              << "       forge plugins remove <name>\n";
}

int cmd_plugins(int argc, char** argv, const ForgeConfig& cfg) {
    if (argc < 3) {
        plugins_usage();
        return 2;
    }
    const std::string sub = argv[2];

    std::string tag;
    std::string name;
    bool verbose = false;
    bool strict = cfg.install_strict;
    bool all = false;
    for (int i = 3; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--tag" && i + 1 < argc) {
            tag = argv[++i];
        } else if (a == "-v" || a == "--verbose") {
            verbose = true;
        } else if (a == "--strict") {
            strict = true;
        } else if (a == "--all") {
            all = true;
        } else if (!a.empty() && a[0] != '-' && name.empty()) {
            name = a;
        } else {
            std::cerr << "Error: unexpected argument '" << a << "'\n";
            plugins_usage();
            return 2;
        }
    }

    PluginCatalog catalog;
    std::vector<std::string> warnings;
    std::string path = PluginCatalog::resolve_path("", cfg.registry_path);
    bool ok = catalog.load(path, &warnings);
    for (const auto& w : warnings) log_warn("catalog", w);
    if (!ok) {
        std::cerr << "Error: cannot load plugin registry " << path << "\n";
        return 1;
    }

    PluginInstaller installer(catalog, cfg, InstallerTable::defaults(cfg.install_timeout_ms), std::cout, std::cerr);

    if (sub == "list") {
        std::cout << installer.formatList(tag, verbose) << "\n";
        return 0;
    }
    if (sub == "install") {
        if (name.empty()) {
            plugins_usage();
            return 2;
        }
        return installer.install(name, strict);
    }
    if (sub == "update") {
        if (all || name.empty()) return installer.updateAll(strict);
        return installer.update(name, strict);
    }
    if (sub == "remove") {
        if (name.empty()) {
            plugins_usage();
            return 2;
        }
        return installer.remove(name);
    }
    std::cerr << "unknown plugins command: " << sub << "\n";
    plugins_usage();
    return 2;
}

} // namespace forge
