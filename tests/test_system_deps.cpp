#include "test_common.h"
#include "forge/release_fetch.h"
#include "forge/system_deps.h"

#include <cstdlib>
#include <iterator>
#include <set>
#include <stdexcept>

#include <sys/stat.h>

using namespace forge;

int main() {
    auto dir = make_temp_dir("deps");
    const std::string saved_path = std::getenv("PATH") ? std::getenv("PATH") : "";

    // 1) parsing skips malformed entries with a warning each
    InstallerTable table = InstallerTable::defaults(5000);
    {
        std::vector<std::string> warnings;
        auto specs = parse_system_deps(
            "[{\"manager\":\"go\",\"package\":\"example.com/tool@latest\",\"binary\":\"tool\"},"
            "{\"manager\":\"npm\",\"binary\":\"nopkg\"},"
            "{\"manager\":\"cargo\",\"package\":\"x\",\"binary\":\"x\"},"
            "{\"manager\":\"github_release\",\"binary\":\"rel\",\"repo\":\"acme/rel\"},"
            "{\"manager\":\"github_release\",\"binary\":\"grype\",\"repo\":\"anchore/grype\",\"tag\":\"v0.80.0\","
            "\"asset\":\"grype_{os}_{arch}.tar.gz\",\"install_dir\":\"/opt/bin\"},"
            "\"not an object\"]",
            table, &warnings);
        expect_eq_ll((long long)specs.size(), 2, "two valid specs");
        expect_eq_ll((long long)warnings.size(), 4, "four skipped entries");
        expect_eq_str(specs[0].package, "example.com/tool@latest", "package verbatim");
        expect_eq_str(specs[1].package, "anchore/grype@v0.80.0", "release package reference");
        expect_eq_str(specs[1].install_dir, "/opt/bin", "install_dir override");
        bool named_cargo = false;
        for (const auto& w : warnings) named_cargo = named_cargo || contains(w, "cargo");
        expect_true(named_cargo, "unknown manager named in warning");

        warnings.clear();
        expect_true(parse_system_deps("{}", table, &warnings).empty() && warnings.size() == 1, "non-array rejected");
        expect_true(parse_system_deps("", table, nullptr).empty(), "empty text is no deps");
    }

    // 2) idempotence: present binaries cause zero install actions, twice
    {
        int calls = 0;
        InstallerTable counting;
        counting.add("fake", [&calls](const SystemDependencySpec& s) {
            calls++;
            DependencyInstallResult r;
            r.spec = s;
            r.success = true;
            return r;
        });
        SystemDependencySpec s;
        s.manager = "fake";
        s.package = "pkg";
        s.binary = "sh";
        for (int i = 0; i < 2; i++) {
            auto res = install_system_deps({s}, counting);
            expect_eq_ll((long long)res.size(), 1, "one result");
            expect_true(res[0].already_installed && res[0].success, "already installed");
        }
        expect_eq_ll(calls, 0, "no install action for a present binary");

        s.binary = "forge-absent-binary";
        auto res = install_system_deps({s}, counting);
        expect_true(res[0].success && !res[0].already_installed, "absent binary installed");
        expect_eq_ll(calls, 1, "exactly one install action");

        std::set<std::string> present = {"forge-absent-binary"};
        res = install_system_deps({s}, counting, [&](const std::string& b) { return present.count(b) > 0; });
        expect_eq_ll(calls, 1, "custom presence check honoured");

        counting.add("throws", [](const SystemDependencySpec&) -> DependencyInstallResult {
            throw std::runtime_error("disk full");
        });
        s.manager = "throws";
        res = install_system_deps({s}, counting);
        expect_true(!res[0].success && contains(res[0].error_message, "disk full"), "throwing installer contained");

        s.manager = "missing";
        res = install_system_deps({s}, counting);
        expect_true(!res[0].success && contains(res[0].error_message, "no installer"), "unknown manager result");
    }

    // 3) a missing toolchain is a remediation message, not an error
    {
        setenv("PATH", dir.c_str(), 1);
        SystemDependencySpec s;
        s.manager = "go";
        s.package = "example.com/tool@latest";
        s.binary = "tool";
        auto res = install_system_deps({s}, table);
        expect_true(!res[0].success, "go install without go fails");
        expect_true(contains(res[0].error_message, "https://go.dev/dl/"), "download page named");
        expect_true(contains(res[0].error_message, "go install example.com/tool@latest"), "exact command named");

        s.manager = "npm";
        s.package = "@acme/cli";
        res = install_system_deps({s}, table);
        expect_true(contains(res[0].error_message, "npm install -g @acme/cli"), "npm command named");

        SystemDependencySpec rel;
        rel.manager = "github_release";
        rel.binary = "rel";
        rel.repo = "acme/rel";
        rel.tag = "v1";
        rel.asset = "rel_{os}_{arch}";
        rel.install_dir = dir.string();
        res = install_system_deps({rel}, table);
        expect_true(!res[0].success, "release fetch without gh/curl fails");
        expect_true(contains(res[0].error_message, "neither gh nor curl"), "fetch tool hint: " + res[0].error_message);
        setenv("PATH", saved_path.c_str(), 1);
    }

    // 4) PATH checks and asset templates
    {
        auto checks = check_dependencies({"sh", "forge-absent-binary"});
        expect_true(checks[0].available && !checks[0].path.empty(), "sh found");
        expect_true(!checks[1].available, "absent binary reported");

        PlatformInfo linux_arm{"linux", "arm64"};
        expect_eq_str(resolve_asset_name("tool_{os}_{arch}.tar.gz", linux_arm), "tool_linux_arm64.tar.gz", "asset template");
        expect_eq_str(resolve_asset_name("static-name", linux_arm), "static-name", "template without placeholders");
        PlatformInfo here = PlatformInfo::current();
        expect_true(here.arch != "x86_64" && here.arch != "aarch64", "arch normalised");

        auto names = release_asset_names("{\"assets\":[{\"name\":\"a.tar.gz\"},{\"name\":\"b.zip\"}]}");
        expect_eq_ll((long long)names.size(), 2, "asset names listed");
    }

    // 5) the curl header file is private from creation, even when it existed before
    {
        setenv("GITHUB_TOKEN", "ghp_secret", 1);
        mode_t old_mask = umask(022);
        const std::string hdr = (dir / "headers").string();
        write_text(hdr, "stale");
        ::chmod(hdr.c_str(), 0644);
        std::string herr;
        expect_true(write_header_file(hdr, "application/octet-stream", &herr), "header file written: " + herr);
        struct stat st;
        expect_true(::stat(hdr.c_str(), &st) == 0, "header file exists");
        expect_eq_ll((long long)(st.st_mode & 0777), 0600, "header file mode");
        std::ifstream in(hdr);
        std::string body((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        expect_true(contains(body, "Authorization: Bearer ghp_secret"), "bearer header");
        expect_true(!contains(body, "stale"), "old content truncated");
        umask(old_mask);
        unsetenv("GITHUB_TOKEN");
    }

    std::filesystem::remove_all(dir);
    std::cerr << "test_system_deps: ALL PASSED" << std::endl;
    return 0;
}
