#include "forge/log.h"
#include "forge/json_mini.h"

#include <json-c/json.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <unistd.h>

namespace forge {

LogLevel log_threshold() {
    const char* env = std::getenv("FORGE_LOG_LEVEL");
    if (!env) return LogLevel::WARN;
    std::string v(env);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (v == "debug") return LogLevel::DEBUG;
    if (v == "info") return LogLevel::INFO;
    if (v == "error") return LogLevel::ERROR;
    return LogLevel::WARN;
}

static const char* level_name(LogLevel l) {
    switch (l) {
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO:  return "info";
        case LogLevel::WARN:  return "warn";
        case LogLevel::ERROR: return "error";
    }
    return "warn";
}

void log_line(LogLevel lvl, const std::string& component, const std::string& msg) {
    if ((int)lvl < (int)log_threshold()) return;
    std::cerr << "[" << component << "] " << level_name(lvl) << ": " << msg << "\n";
}

static std::string iso_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// Recursively serialize with sorted object keys.
static void canonical_serialize(json_object* obj, std::ostringstream& out) {
    if (!obj) { out << "null"; return; }

    switch (json_object_get_type(obj)) {
    case json_type_object: {
        std::vector<std::string> keys;
        json_object_object_foreach(obj, k, v) {
            (void)v;
            keys.emplace_back(k);
        }
        std::sort(keys.begin(), keys.end());

        out << "{";
        for (size_t i = 0; i < keys.size(); i++) {
            if (i > 0) out << ",";
            out << json_mini::quote(keys[i]) << ":";
            canonical_serialize(json_mini::member(obj, keys[i].c_str()), out);
        }
        out << "}";
        break;
    }
    case json_type_array: {
        out << "[";
        size_t len = json_object_array_length(obj);
        for (size_t i = 0; i < len; i++) {
            if (i > 0) out << ",";
            canonical_serialize(json_object_array_get_idx(obj, i), out);
        }
        out << "]";
        break;
    }
    default:
        out << json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN | JSON_C_TO_STRING_NOSLASHESCAPE);
        break;
    }
}

std::string new_run_id() {
    using namespace std::chrono;
    auto ms = duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
    return "run_" + std::to_string((long long)ms) + "_" + std::to_string((long long)getpid());
}

RunLog::RunLog(const std::string& path, std::string run_id)
    : path_(path), run_id_(std::move(run_id)), out_(path, std::ios::out | std::ios::app) {}

void RunLog::event(const std::string& name, const std::string& payload_json) {
    json_object* line = json_object_new_object();
    json_object_object_add(line, "event", json_mini::new_string(name));

    json_mini::Doc payload = json_mini::parse(payload_json);
    json_object_object_add(line, "payload", payload ? payload.release() : json_mini::new_string(payload_json));

    json_object_object_add(line, "run_id", json_mini::new_string(run_id_));
    json_object_object_add(line, "seq", json_object_new_int(seq_++));
    json_object_object_add(line, "ts", json_mini::new_string(iso_now()));

    std::ostringstream line_out;
    canonical_serialize(line, line_out);
    json_object_put(line);

    out_ << line_out.str() << "\n";
    out_.flush();
}

} // namespace forge
