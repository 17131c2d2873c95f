#pragma once

#include "forge/catalog.h"
#include "forge/registry.h"

#include <string>
#include <vector>

namespace forge {

// Every system dependency binary named in the catalog, deduplicated.
std::vector<std::string> catalog_dependency_binaries(const PluginCatalog& catalog);

// Plugins compiled into the forge binary.
BuiltinTable builtin_plugin_table(const PluginCatalog& catalog);

} // namespace forge
