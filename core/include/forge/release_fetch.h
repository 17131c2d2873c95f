#pragma once

#include <string>
#include <vector>

namespace forge {

struct PlatformInfo {
    std::string os;     // linux | darwin | windows | lowercased uname
    std::string arch;   // amd64 | arm64 | raw machine name

    static PlatformInfo current();
};

// Expand {os} and {arch} in a release asset name template.
std::string resolve_asset_name(const std::string& tmpl, const PlatformInfo& p);

struct ReleaseRequest {
    std::string repo;          // owner/name
    std::string tag;
    std::string asset_name;    // already resolved
    std::string dest_path;     // final file; marked executable
    int timeout_ms{600000};
};

// Fetch one release asset: `gh release download` when gh is on PATH, then the
// GitHub REST API through curl (GITHUB_TOKEN as bearer when set). Returns
// false with a one-line remediation message in err.
bool fetch_release_asset(const ReleaseRequest& req, std::string* err);

// Names of the assets in a GitHub release JSON document.
std::vector<std::string> release_asset_names(const std::string& release_json);

// curl header file (Accept, API version, bearer token from GITHUB_TOKEN),
// mode 0600 from creation on.
bool write_header_file(const std::string& path, const std::string& accept, std::string* err);

// Mark a file executable for user, group and other.
bool chmod_x(const std::string& path, std::string* err);

} // namespace forge
