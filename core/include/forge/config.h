#pragma once
#include "forge/context.h"

#include <string>

namespace forge {

enum class Profile { DEV, PROD };

// Detect profile from FORGE_PROFILE env var. Default: DEV.
Profile detect_profile();

// Returns string name of profile.
const char* profile_name(Profile p);

// Apply profile defaults: sets env vars that are not already set.
// DEV: unbounded runs, warn logging
// PROD: bounded runs, warn logging, strict plugin ABI check
// Neither profile enables strict installs; that stays opt-in.
void apply_profile_defaults(Profile p);

// Resolved paths and limits. Read once at startup, after profile defaults.
struct ForgeConfig {
    std::string config_dir;          // FORGE_CONFIG_DIR or $HOME/.config/forge
    std::string plugin_dir;          // FORGE_PLUGIN_DIR or <config_dir>/plugins
    std::string registry_path;       // FORGE_PLUGIN_REGISTRY or <config_dir>/plugins-registry.json
    std::string run_log_path;        // FORGE_RUN_LOG, empty = off

    int run_timeout_ms{0};           // 0 = unbounded
    int introspect_timeout_ms{10000};
    int cancel_grace_ms{2000};
    int install_timeout_ms{600000};
    bool install_strict{false};

    std::string binary_cache_path() const { return config_dir + "/binary-plugins.json"; }
    std::string wrapper_defs_path() const { return config_dir + "/wrapper-plugins.json"; }
    std::string user_config_path() const { return config_dir + "/config.json"; }

    static ForgeConfig from_env();
};

// Top-level members of a JSON object file. Strings are kept as-is; other
// values as their JSON text. A missing file is an empty map; an unreadable
// or malformed one also sets *warn.
ConfigMap load_user_config(const std::string& path, std::string* warn);

} // namespace forge
