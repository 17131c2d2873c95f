#pragma once

#include <string>

namespace forge {

// Write body to a temp file beside path, then rename over path.
// Parent directories are created. Returns false and fills err on failure.
bool write_atomic(const std::string& path, const std::string& body, std::string* err);

// Read a whole file. Returns false if it cannot be opened.
bool slurp(const std::string& path, std::string* out);

// "~" and "~/..." are expanded against $HOME.
std::string expand_user(const std::string& path);

// Integer env var with a fallback for unset or unparseable values.
long long getenv_int(const char* key, long long fallback);

// "1", "true", "yes", "on" (case-insensitive).
bool env_true(const char* key);

std::string trim(const std::string& s);

} // namespace forge
