#pragma once

// Plugin contract (v1).
//
// Every delivery mechanism (compiled-in, dlopen'd shared library, process
// binary, wrapped legacy CLI) is presented to the host as an IPlugin.
// Shared libraries call back into the host through IPluginRegistrar so they
// never need to link against forge_core symbols.

#include "forge/capability.h"
#include "forge/context.h"
#include "forge/types.h"

#include <functional>
#include <memory>
#include <string>
#include <vector>

#define FORGE_VERSION "0.4.0"

// ABI version constant. Shared-library plugins must export
// forge_plugin_abi_version() returning this value.
#define FORGE_PLUGIN_ABI_VERSION 1

namespace forge {

struct PluginDescriptor {
    std::string name;
    std::string description;
    std::string version;
    bool requires_auth{false};
    CapabilityList capabilities;

    bool operator==(const PluginDescriptor& o) const {
        return name == o.name && description == o.description && version == o.version &&
               requires_auth == o.requires_auth && capabilities == o.capabilities;
    }
    bool operator!=(const PluginDescriptor& o) const { return !(*this == o); }
};

class IPlugin {
public:
    virtual ~IPlugin() = default;

    virtual std::string name() const = 0;
    virtual std::string description() const = 0;
    virtual std::string version() const = 0;
    virtual bool requires_auth() const = 0;
    virtual CapabilityList get_capabilities() const = 0;

    // Args are already coerced to the declared kinds; every declared
    // capability has an entry (monostate when unset).
    virtual RunOutcome run(const ArgMap& args, ExecutionContext& ctx) = 0;
};

// Zero-argument factory. May throw or return null; the registry treats both
// as a load error for that entry only.
using PluginFactory = std::function<std::unique_ptr<IPlugin>()>;

// Host callback interface. Shared-library plugins call register_plugin(...)
// from their exported init function.
struct IPluginRegistrar {
    virtual ~IPluginRegistrar() = default;
    virtual void register_plugin(const std::string& entry_name, PluginFactory factory) = 0;
};

// Snapshot the metadata of a plugin. May throw whatever the plugin throws.
PluginDescriptor describe(const IPlugin& p);

// MAJOR.MINOR.PATCH with optional -prerelease and +build parts.
bool is_semver(const std::string& v);

// Conformance check run once at registration.
bool check_conformance(const PluginDescriptor& d, std::string* err);

// Wire form shared with the process-plugin introspection protocol.
std::string descriptor_to_json(const PluginDescriptor& d);
bool descriptor_from_json(const std::string& json, PluginDescriptor* out, std::string* err);

} // namespace forge

// Plugin entry point. A shared library must export with C linkage:
//   extern "C" void forge_plugin_init(forge::IPluginRegistrar* host);
//   extern "C" int forge_plugin_abi_version();
// The ABI export may be omitted only when FORGE_PLUGIN_ABI_LAX=1.
extern "C" {
    typedef void (*forge_plugin_init_fn)(forge::IPluginRegistrar* host);
    typedef int (*forge_plugin_abi_version_fn)();
}
