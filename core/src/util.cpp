#include "forge/util.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <unistd.h>

namespace forge {

bool write_atomic(const std::string& path, const std::string& body, std::string* err) {
    std::filesystem::path dst(path);
    std::error_code ec;
    if (dst.has_parent_path()) {
        std::filesystem::create_directories(dst.parent_path(), ec);
        if (ec) {
            if (err) *err = "cannot create " + dst.parent_path().string() + ": " + ec.message();
            return false;
        }
    }

    std::string tmp = path + ".tmp." + std::to_string((long long)getpid());
    {
        std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
        if (!f) {
            if (err) *err = "cannot open " + tmp + " for writing";
            return false;
        }
        f << body;
        f.flush();
        if (!f) {
            if (err) *err = "write failed: " + tmp;
            f.close();
            std::filesystem::remove(tmp, ec);
            return false;
        }
    }

    std::filesystem::rename(tmp, dst, ec);
    if (ec) {
        if (err) *err = "rename " + tmp + " -> " + path + " failed: " + ec.message();
        std::error_code ec2;
        std::filesystem::remove(tmp, ec2);
        return false;
    }
    return true;
}

bool slurp(const std::string& path, std::string* out) {
    std::ifstream f(path, std::ios::binary);
    if (!f) return false;
    std::ostringstream ss;
    ss << f.rdbuf();
    if (out) *out = ss.str();
    return true;
}

std::string expand_user(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    if (path.size() > 1 && path[1] != '/') return path;
    const char* home = std::getenv("HOME");
    if (!home || !*home) return path;
    return std::string(home) + path.substr(1);
}

long long getenv_int(const char* key, long long fallback) {
    const char* v = std::getenv(key);
    if (!v || !*v) return fallback;
    errno = 0;
    char* end = nullptr;
    long long n = std::strtoll(v, &end, 10);
    if (errno != 0 || !end || *end != '\0') return fallback;
    return n;
}

bool env_true(const char* key) {
    const char* v = std::getenv(key);
    if (!v) return false;
    std::string s = v;
    for (auto& c : s) c = (char)std::tolower((unsigned char)c);
    return (s == "1" || s == "true" || s == "yes" || s == "on");
}

std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace((unsigned char)s[b])) b++;
    while (e > b && std::isspace((unsigned char)s[e - 1])) e--;
    return s.substr(b, e - b);
}

} // namespace forge
