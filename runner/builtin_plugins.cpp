#include "builtin_plugins.h"

#include "forge/doctor_plugin.h"
#include "forge/system_deps.h"

#include <algorithm>

namespace forge {

std::vector<std::string> catalog_dependency_binaries(const PluginCatalog& catalog) {
    InstallerTable table = InstallerTable::defaults();
    std::vector<std::string> out;
    for (const CatalogEntry* e : catalog.list()) {
        for (const auto& spec : parse_system_deps(e->system_deps_json, table, nullptr)) {
            if (std::find(out.begin(), out.end(), spec.binary) == out.end()) out.push_back(spec.binary);
        }
    }
    return out;
}

BuiltinTable builtin_plugin_table(const PluginCatalog& catalog) {
    std::vector<std::string> tools = catalog_dependency_binaries(catalog);
    BuiltinTable t;
    t.push_back({"doctor", [tools]() { return std::unique_ptr<IPlugin>(new DoctorPlugin(tools)); }});
    return t;
}

} // namespace forge
