#include "forge/release_fetch.h"
#include "forge/json_mini.h"
#include "forge/log.h"
#include "forge/proc.h"
#include "forge/util.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/utsname.h>
#include <unistd.h>

namespace forge {

PlatformInfo PlatformInfo::current() {
    PlatformInfo p;
    struct utsname u;
    std::string sys = "linux";
    std::string machine = "x86_64";
    if (uname(&u) == 0) {
        sys = u.sysname;
        machine = u.machine;
    }

    if (sys == "Linux") p.os = "linux";
    else if (sys == "Darwin") p.os = "darwin";
    else if (sys.rfind("MINGW", 0) == 0 || sys.rfind("CYGWIN", 0) == 0 || sys == "Windows") p.os = "windows";
    else {
        p.os = sys;
        for (auto& c : p.os) c = (char)std::tolower((unsigned char)c);
    }

    if (machine == "x86_64" || machine == "amd64") p.arch = "amd64";
    else if (machine == "aarch64" || machine == "arm64") p.arch = "arm64";
    else p.arch = machine;
    return p;
}

static void replace_all(std::string& s, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

std::string resolve_asset_name(const std::string& tmpl, const PlatformInfo& p) {
    std::string out = tmpl;
    replace_all(out, "{os}", p.os);
    replace_all(out, "{arch}", p.arch);
    return out;
}

bool chmod_x(const std::string& path, std::string* err) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        if (err) *err = "stat " + path + ": " + std::strerror(errno);
        return false;
    }
    if (chmod(path.c_str(), st.st_mode | S_IXUSR | S_IXGRP | S_IXOTH) != 0) {
        if (err) *err = "chmod " + path + ": " + std::strerror(errno);
        return false;
    }
    return true;
}

std::vector<std::string> release_asset_names(const std::string& release_json) {
    std::vector<std::string> out;
    json_mini::Doc doc = json_mini::parse_object(release_json);
    json_object* assets = json_mini::member(doc.root, "assets");
    if (!assets || !json_object_is_type(assets, json_type_array)) return out;
    for (size_t i = 0; i < json_object_array_length(assets); i++) {
        auto n = json_mini::get_string(json_object_array_get_idx(assets, i), "name");
        if (n) out.push_back(*n);
    }
    return out;
}

// Created 0600 before anything is written so the token is never readable by others.
bool write_header_file(const std::string& path, const std::string& accept, std::string* err) {
    std::string body = "Accept: " + accept + "\n" + "X-GitHub-Api-Version: 2022-11-28\n";
    const char* token = std::getenv("GITHUB_TOKEN");
    if (token && *token) body += std::string("Authorization: Bearer ") + token + "\n";

    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, S_IRUSR | S_IWUSR);
    if (fd < 0) {
        if (err) *err = "cannot create " + path + ": " + std::strerror(errno);
        return false;
    }
    // an existing file keeps its old mode through O_CREAT
    if (fchmod(fd, S_IRUSR | S_IWUSR) != 0) {
        if (err) *err = "chmod " + path + ": " + std::strerror(errno);
        ::close(fd);
        return false;
    }
    size_t off = 0;
    while (off < body.size()) {
        ssize_t n = ::write(fd, body.data() + off, body.size() - off);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            if (err) *err = "write " + path + ": " + std::strerror(errno);
            ::close(fd);
            return false;
        }
        off += (size_t)n;
    }
    if (::close(fd) != 0) {
        if (err) *err = "close " + path + ": " + std::strerror(errno);
        return false;
    }
    return true;
}

namespace {

// Removes a path (file or directory tree) when it goes out of scope.
struct ScopedPath {
    std::string path;
    ~ScopedPath() {
        if (path.empty()) return;
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
};

std::string join(const std::vector<std::string>& v, const char* sep) {
    std::string out;
    for (size_t i = 0; i < v.size(); i++) {
        if (i) out += sep;
        out += v[i];
    }
    return out;
}

bool install_file(const std::string& from, const std::string& to, std::string* err) {
    std::error_code ec;
    std::filesystem::rename(from, to, ec);
    if (ec) {
        // different filesystem: copy then remove
        std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            if (err) *err = "cannot move " + from + " to " + to + ": " + ec.message();
            return false;
        }
        std::filesystem::remove(from, ec);
    }
    return chmod_x(to, err);
}

bool try_gh(const ReleaseRequest& req, std::string* note) {
    std::string gh = find_executable("gh");
    if (gh.empty()) return false;

    std::filesystem::path dest(req.dest_path);
    ScopedPath tmp{(dest.parent_path() / (".forge-dl-" + std::to_string((long long)getpid()))).string()};
    std::error_code ec;
    std::filesystem::create_directories(tmp.path, ec);
    if (ec) return false;

    ProcLimits lim;
    lim.timeout_ms = req.timeout_ms;
    ProcResult pr;
    bool started = proc_run_capture({gh, "release", "download", req.tag,
                                     "--repo", req.repo,
                                     "--pattern", req.asset_name,
                                     "--dir", tmp.path,
                                     "--clobber"},
                                    "", lim, &pr);
    if (!started || pr.exit_code != 0) {
        if (note) *note = "gh release download failed: " + trim(pr.error_output.empty() ? pr.error : pr.error_output);
        return false;
    }

    std::string downloaded = tmp.path + "/" + req.asset_name;
    if (!std::filesystem::exists(downloaded, ec)) {
        if (note) *note = "gh release download produced no " + req.asset_name;
        return false;
    }
    std::string ierr;
    if (!install_file(downloaded, req.dest_path, &ierr)) {
        if (note) *note = ierr;
        return false;
    }
    return true;
}

// Runs curl; returns the HTTP status (0 when curl itself failed).
int curl_get(const std::string& curl, const std::string& header_file, const std::string& url,
             const std::string& out_file, int timeout_ms, std::string* body, std::string* err) {
    std::vector<std::string> argv{curl, "-sS", "-L", "-H", "@" + header_file, "-w", "\n%{http_code}"};
    if (!out_file.empty()) {
        argv.push_back("-o");
        argv.push_back(out_file);
    }
    argv.push_back(url);

    ProcLimits lim;
    lim.timeout_ms = timeout_ms;
    lim.stdout_max_bytes = 16 * 1024 * 1024;
    ProcResult pr;
    if (!proc_run_capture(argv, "", lim, &pr)) {
        if (err) *err = "cannot run curl: " + pr.error;
        return 0;
    }
    if (pr.timed_out) {
        if (err) *err = "download timed out: " + url;
        return 0;
    }
    if (pr.exit_code != 0) {
        if (err) *err = "curl exited with code " + std::to_string(pr.exit_code) + ": " + trim(pr.error_output);
        return 0;
    }

    std::string out = pr.output;
    size_t nl = out.rfind('\n');
    std::string code = (nl == std::string::npos) ? out : out.substr(nl + 1);
    if (body) *body = (nl == std::string::npos) ? std::string{} : out.substr(0, nl);
    return std::atoi(trim(code).c_str());
}

} // namespace

bool fetch_release_asset(const ReleaseRequest& req, std::string* err) {
    if (req.repo.empty() || req.tag.empty() || req.asset_name.empty() || req.dest_path.empty()) {
        if (err) *err = "release spec is missing repo, tag, or asset";
        return false;
    }

    std::filesystem::path dest(req.dest_path);
    std::error_code ec;
    if (dest.has_parent_path()) {
        std::filesystem::create_directories(dest.parent_path(), ec);
        if (ec) {
            if (err) *err = "cannot create " + dest.parent_path().string() + ": " + ec.message();
            return false;
        }
    }

    std::string gh_note;
    if (try_gh(req, &gh_note)) return true;
    if (!gh_note.empty()) log_info("release", gh_note + "; falling back to the REST API");

    std::string curl = find_executable("curl");
    if (curl.empty()) {
        if (err) *err = "neither gh nor curl found on PATH. Install the GitHub CLI (https://cli.github.com/) "
                        "or download " + req.asset_name + " from https://github.com/" + req.repo +
                        "/releases/tag/" + req.tag + " to " + req.dest_path;
        return false;
    }

    std::string pid = std::to_string((long long)getpid());
    ScopedPath hdr{req.dest_path + ".hdr." + pid};
    if (!write_header_file(hdr.path, "application/vnd.github+json", err)) return false;

    std::string api_url = "https://api.github.com/repos/" + req.repo + "/releases/tags/" + req.tag;
    std::string body;
    std::string cerr;
    int code = curl_get(curl, hdr.path, api_url, "", req.timeout_ms, &body, &cerr);
    if (code == 0) {
        if (err) *err = cerr;
        return false;
    }
    if (code != 200) {
        std::string msg = "GitHub API error " + std::to_string(code) + " for " + req.repo + "@" + req.tag;
        if (code == 401 || code == 403) msg += ": set GITHUB_TOKEN or run `gh auth login`";
        else if (code == 404) msg += ": release not found (check repo/tag and access)";
        if (err) *err = msg;
        return false;
    }

    json_mini::Doc release = json_mini::parse_object(body);
    if (!release) {
        if (err) *err = "GitHub API returned invalid JSON for " + req.repo + "@" + req.tag;
        return false;
    }

    std::string download_url;
    json_object* assets = json_mini::member(release.root, "assets");
    if (assets && json_object_is_type(assets, json_type_array)) {
        for (size_t i = 0; i < json_object_array_length(assets); i++) {
            json_object* a = json_object_array_get_idx(assets, i);
            if (json_mini::get_string(a, "name").value_or("") == req.asset_name) {
                download_url = json_mini::get_string(a, "browser_download_url").value_or("");
                break;
            }
        }
    }
    if (download_url.empty()) {
        if (err) *err = "No asset matching '" + req.asset_name + "' found in " + req.repo + "@" + req.tag +
                        ". Available: " + join(release_asset_names(body), ", ");
        return false;
    }

    ScopedPath part{req.dest_path + ".part." + pid};
    if (!write_header_file(hdr.path, "application/octet-stream", err)) return false;
    code = curl_get(curl, hdr.path, download_url, part.path, req.timeout_ms, nullptr, &cerr);
    if (code == 0) {
        if (err) *err = cerr;
        return false;
    }
    if (code != 200) {
        if (err) *err = "download of " + req.asset_name + " failed with HTTP " + std::to_string(code);
        return false;
    }
    if (!install_file(part.path, req.dest_path, err)) return false;
    part.path.clear();
    return true;
}

} // namespace forge
