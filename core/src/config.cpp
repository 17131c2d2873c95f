#include "forge/config.h"
#include "forge/json_mini.h"
#include "forge/util.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>

namespace forge {

Profile detect_profile() {
    const char* env = std::getenv("FORGE_PROFILE");
    if (!env) return Profile::DEV;

    std::string val(env);
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    // Must be called before any threads or child processes are started.
    // overwrite=0: won't override existing env vars
    constexpr int NO_OVERWRITE = 0;

    switch (p) {
        case Profile::DEV:
            setenv("FORGE_RUN_TIMEOUT_MS",        "0",      NO_OVERWRITE);
            setenv("FORGE_INTROSPECT_TIMEOUT_MS", "10000",  NO_OVERWRITE);
            setenv("FORGE_CANCEL_GRACE_MS",       "2000",   NO_OVERWRITE);
            setenv("FORGE_INSTALL_TIMEOUT_MS",    "600000", NO_OVERWRITE);
            setenv("FORGE_LOG_LEVEL",             "warn",   NO_OVERWRITE);
            break;

        case Profile::PROD:
            setenv("FORGE_RUN_TIMEOUT_MS",        "3600000", NO_OVERWRITE);
            setenv("FORGE_INTROSPECT_TIMEOUT_MS", "10000",   NO_OVERWRITE);
            setenv("FORGE_CANCEL_GRACE_MS",       "2000",    NO_OVERWRITE);
            setenv("FORGE_INSTALL_TIMEOUT_MS",    "300000",  NO_OVERWRITE);
            setenv("FORGE_LOG_LEVEL",             "warn",    NO_OVERWRITE);
            // Native libraries must export the ABI version
            setenv("FORGE_PLUGIN_ABI_LAX",        "0",       NO_OVERWRITE);
            break;
    }
}

static std::string env_or(const char* key, const std::string& fallback) {
    const char* v = std::getenv(key);
    if (!v || !*v) return fallback;
    return v;
}

static int clamp_ms(long long v, int fallback) {
    if (v < 0 || v > 24LL * 3600 * 1000) return fallback;
    return (int)v;
}

ForgeConfig ForgeConfig::from_env() {
    ForgeConfig c;
    std::string home = env_or("HOME", ".");
    c.config_dir = expand_user(env_or("FORGE_CONFIG_DIR", home + "/.config/forge"));
    c.plugin_dir = expand_user(env_or("FORGE_PLUGIN_DIR", c.config_dir + "/plugins"));
    c.registry_path = expand_user(env_or("FORGE_PLUGIN_REGISTRY", c.config_dir + "/plugins-registry.json"));
    c.run_log_path = env_or("FORGE_RUN_LOG", "");

    c.run_timeout_ms = clamp_ms(getenv_int("FORGE_RUN_TIMEOUT_MS", 0), 0);
    c.introspect_timeout_ms = clamp_ms(getenv_int("FORGE_INTROSPECT_TIMEOUT_MS", 10000), 10000);
    c.cancel_grace_ms = clamp_ms(getenv_int("FORGE_CANCEL_GRACE_MS", 2000), 2000);
    c.install_timeout_ms = clamp_ms(getenv_int("FORGE_INSTALL_TIMEOUT_MS", 600000), 600000);
    c.install_strict = env_true("FORGE_INSTALL_STRICT");
    return c;
}

ConfigMap load_user_config(const std::string& path, std::string* warn) {
    ConfigMap out;
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return out;

    std::string body;
    if (!slurp(path, &body)) {
        if (warn) *warn = "cannot read " + path;
        return out;
    }
    json_mini::Doc doc = json_mini::parse_object(body);
    if (!doc) {
        if (warn) *warn = path + " is not a JSON object; ignoring it";
        return out;
    }
    json_object_object_foreach(doc.root, k, v) {
        if (v && json_object_is_type(v, json_type_string)) {
            out[k] = json_object_get_string(v);
        } else {
            out[k] = json_mini::to_string(v);
        }
    }
    return out;
}

} // namespace forge
