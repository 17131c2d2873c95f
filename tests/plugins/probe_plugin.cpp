// Process plugin used by the tests. Speaks the stdio protocol; behaviour is
// selected with PROBE_MODE:
//   (unset)      progress 0.5 "half", then success "ok"
//   slow         progress, then sleeps before answering
//   ignore_term  ignores SIGTERM and sleeps
//   garbage      non-JSON output, exit 4
//   echo         returns the received args and auth token in data
//   partial      status partial
//   bogus_status terminal object with an unknown status
// PROBE_PID_FILE, when set, receives the pid before any output.

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

#include <unistd.h>

static const char* INTROSPECT =
    "{\"name\":\"probe\",\"description\":\"d\",\"version\":\"1.0.0\",\"requires_auth\":false,\"params\":[]}";

static std::string env(const char* k) {
    const char* v = std::getenv(k);
    return v ? v : "";
}

static void progress(double f, const char* msg) {
    std::fprintf(stderr, "{\"progress\":%.2f,\"message\":\"%s\"}\n", f, msg);
    std::fflush(stderr);
}

static void answer(const char* status, const char* summary, const std::string& data = "{}") {
    std::printf("{\"status\":\"%s\",\"summary\":\"%s\",\"data\":%s,\"artifacts\":{}}\n", status, summary, data.c_str());
    std::fflush(stdout);
}

int main(int argc, char** argv) {
    if (argc >= 2 && std::strcmp(argv[1], "--introspect") == 0) {
        std::printf("%s\n", INTROSPECT);
        return 0;
    }
    if (argc < 3 || std::strcmp(argv[1], "--execute") != 0) {
        std::fprintf(stderr, "usage: probe --introspect | --execute JSON\n");
        return 2;
    }

    std::string pid_file = env("PROBE_PID_FILE");
    if (!pid_file.empty()) {
        FILE* f = std::fopen(pid_file.c_str(), "w");
        if (f) {
            std::fprintf(f, "%d\n", (int)getpid());
            std::fclose(f);
        }
    }

    std::string mode = env("PROBE_MODE");
    if (mode.empty()) {
        progress(0.5, "half");
        answer("success", "ok");
        return 0;
    }
    if (mode == "slow") {
        progress(0.1, "starting");
        sleep(30);
        answer("success", "late");
        return 0;
    }
    if (mode == "ignore_term") {
        std::signal(SIGTERM, SIG_IGN);
        progress(0.1, "stubborn");
        sleep(30);
        return 0;
    }
    if (mode == "garbage") {
        std::printf("this is not json\n");
        std::fprintf(stderr, "boom\n");
        return 4;
    }
    if (mode == "echo") {
        std::string token = env("FORGE_AUTH_TOKEN");
        answer("success", "echo", std::string("{\"args\":") + argv[2] + ",\"token\":\"" + token + "\"}");
        return 0;
    }
    if (mode == "partial") {
        answer("partial", "some");
        return 0;
    }
    if (mode == "bogus_status") {
        answer("exploded", "what");
        return 0;
    }
    std::fprintf(stderr, "unknown PROBE_MODE %s\n", mode.c_str());
    return 2;
}
