#pragma once
#include <fstream>
#include <string>

namespace forge {

enum class LogLevel { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

// Threshold from FORGE_LOG_LEVEL (debug|info|warn|error). Default: warn.
LogLevel log_threshold();

// One "[component] level: message" line on stderr when at or above threshold.
void log_line(LogLevel lvl, const std::string& component, const std::string& msg);

inline void log_debug(const std::string& c, const std::string& m) { log_line(LogLevel::DEBUG, c, m); }
inline void log_info(const std::string& c, const std::string& m)  { log_line(LogLevel::INFO, c, m); }
inline void log_warn(const std::string& c, const std::string& m)  { log_line(LogLevel::WARN, c, m); }
inline void log_error(const std::string& c, const std::string& m) { log_line(LogLevel::ERROR, c, m); }

// Append-only JSON-lines log of one dispatcher invocation.
// Every line: {"event":..,"payload":{..},"run_id":..,"seq":n,"ts":..}
class RunLog {
public:
    RunLog(const std::string& path, std::string run_id);
    bool ok() const { return out_.good(); }
    void event(const std::string& name, const std::string& payload_json);
    const std::string& path() const { return path_; }
    const std::string& run_id() const { return run_id_; }

private:
    std::string path_;
    std::string run_id_;
    std::ofstream out_;
    int seq_{0};
};

// "run_<unix-ms>_<pid>"
std::string new_run_id();

} // namespace forge
