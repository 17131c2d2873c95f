#include "forge/proc.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <sstream>

#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#ifdef __linux__
  #include <sys/prctl.h>
#endif

namespace forge {

static bool is_exec_file(const std::string& p) {
    struct stat st;
    if (stat(p.c_str(), &st) != 0) return false;
    if (!S_ISREG(st.st_mode)) return false;
    return access(p.c_str(), X_OK) == 0;
}

std::string find_executable(const std::string& name) {
    if (name.empty()) return {};
    if (name.find('/') != std::string::npos) {
        return is_exec_file(name) ? name : std::string{};
    }
    const char* path = std::getenv("PATH");
    if (!path || !*path) return {};
    std::stringstream ss(path);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) dir = ".";
        std::string cand = dir + "/" + name;
        if (is_exec_file(cand)) return cand;
    }
    return {};
}

static void set_nonblock(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

namespace {

// One captured stream with a byte cap and optional line splitting.
struct StreamBuf {
    int fd{-1};
    size_t cap{0};
    std::string data;
    std::string partial;     // incomplete trailing line, for the line hook; at most cap bytes kept
    bool truncated{false};
    const std::function<void(const std::string&)>* on_line{nullptr};

    void append(const char* buf, size_t n) {
        size_t can = cap > data.size() ? (cap - data.size()) : 0;
        size_t take = std::min(n, can);
        if (take < n) truncated = true;
        data.append(buf, buf + take);

        if (on_line && *on_line) {
            partial.append(buf, buf + n);
            size_t pos;
            while ((pos = partial.find('\n')) != std::string::npos) {
                std::string line = partial.substr(0, pos);
                if (!line.empty() && line.back() == '\r') line.pop_back();
                partial.erase(0, pos + 1);
                (*on_line)(line);
            }
            // a newline-free run longer than cap is delivered as its own line
            if (partial.size() > cap) {
                (*on_line)(partial.substr(0, cap));
                partial.clear();
            }
        }
    }

    // Read until EAGAIN or EOF. Returns false on EOF.
    bool pump() {
        if (fd < 0) return false;
        char buf[4096];
        while (true) {
            ssize_t n = read(fd, buf, sizeof(buf));
            if (n > 0) { append(buf, (size_t)n); continue; }
            if (n == -1 && errno == EINTR) continue;
            if (n == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) return true;
            // EOF or error
            close(fd);
            fd = -1;
            return false;
        }
    }

    void finish() {
        if (fd >= 0) {
            close(fd);
            fd = -1;
        }
        if (on_line && *on_line && !partial.empty()) {
            (*on_line)(partial);
            partial.clear();
        }
    }
};

int elapsed_ms_since(std::chrono::steady_clock::time_point start) {
    return (int)std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
}

} // namespace

bool proc_run_streaming(const std::vector<std::string>& argv,
                        const std::string& cwd,
                        const ProcLimits& lim,
                        const ProcHooks& hooks,
                        ProcResult* res) {
    if (!res) return false;
    *res = ProcResult{};

    if (argv.empty() || argv[0].empty()) {
        res->error = "empty argv";
        return false;
    }

    int out_pipe[2];
    if (pipe(out_pipe) != 0) {
        res->error = std::string("pipe(out) failed: ") + std::strerror(errno);
        return false;
    }
    int err_pipe[2];
    if (pipe(err_pipe) != 0) {
        close(out_pipe[0]); close(out_pipe[1]);
        res->error = std::string("pipe(err) failed: ") + std::strerror(errno);
        return false;
    }
    // Reports exec failure to the parent; closed by a successful exec.
    int exec_pipe[2];
    if (pipe(exec_pipe) != 0) {
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);
        res->error = std::string("pipe(exec) failed: ") + std::strerror(errno);
        return false;
    }
    (void)fcntl(exec_pipe[1], F_SETFD, FD_CLOEXEC);

    pid_t pid = fork();
    if (pid < 0) {
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);
        close(exec_pipe[0]); close(exec_pipe[1]);
        res->error = std::string("fork failed: ") + std::strerror(errno);
        return false;
    }

    if (pid == 0) {
        // child
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) (void)dup2(devnull, STDIN_FILENO);
        (void)dup2(out_pipe[1], STDOUT_FILENO);
        (void)dup2(err_pipe[1], STDERR_FILENO);

        // isolate process group so cancel/timeout can signal the whole subtree
        (void)setpgid(0, 0);

        // restore default dispositions the host may have changed
        (void)signal(SIGINT, SIG_DFL);
        (void)signal(SIGTERM, SIG_DFL);
        (void)signal(SIGPIPE, SIG_DFL);

        // close inherited fds beyond stdio, keeping the exec-status pipe
        long maxfd = sysconf(_SC_OPEN_MAX);
        if (maxfd < 256 || maxfd > 4096) maxfd = 4096;
        for (int fd = 3; fd < maxfd; fd++) {
            if (fd == exec_pipe[1]) continue;
            (void)close(fd);
        }

        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            int e = errno;
            (void)!write(exec_pipe[1], &e, sizeof(e));
            _exit(127);
        }

        for (const auto& kv : hooks.env) {
            (void)setenv(kv.first.c_str(), kv.second.c_str(), 1);
        }

#ifdef __linux__
        (void)prctl(PR_SET_PDEATHSIG, SIGKILL);
#endif

        std::vector<char*> cargv;
        cargv.reserve(argv.size() + 1);
        for (const auto& s : argv) cargv.push_back(const_cast<char*>(s.c_str()));
        cargv.push_back(nullptr);

        execvp(cargv[0], cargv.data());
        int e = errno;
        (void)!write(exec_pipe[1], &e, sizeof(e));
        _exit(127);
    }

    // parent
    (void)setpgid(pid, pid);
    close(out_pipe[1]);
    close(err_pipe[1]);
    close(exec_pipe[1]);

    int exec_errno = 0;
    {
        ssize_t n;
        do {
            n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
        } while (n == -1 && errno == EINTR);
        if (n != (ssize_t)sizeof(exec_errno)) exec_errno = 0;
        close(exec_pipe[0]);
    }
    if (exec_errno != 0) {
        int status = 0;
        (void)waitpid(pid, &status, 0);
        close(out_pipe[0]);
        close(err_pipe[0]);
        res->exit_code = 127;
        res->error = "exec " + argv[0] + " failed: " + std::strerror(exec_errno);
        return false;
    }

    set_nonblock(out_pipe[0]);
    set_nonblock(err_pipe[0]);

    StreamBuf out;
    out.fd = out_pipe[0];
    out.cap = lim.stdout_max_bytes;
    StreamBuf err;
    err.fd = err_pipe[0];
    err.cap = lim.stderr_max_bytes;
    err.on_line = &hooks.on_stderr_line;

    auto start = std::chrono::steady_clock::now();
    bool child_exited = false;
    int status = 0;

    // Set once the group has been sent SIGTERM.
    bool terminating = false;
    std::chrono::steady_clock::time_point term_sent;

    while (true) {
        struct pollfd fds[2];
        nfds_t nfds = 0;
        if (out.fd >= 0) { fds[nfds].fd = out.fd; fds[nfds].events = POLLIN; nfds++; }
        if (err.fd >= 0) { fds[nfds].fd = err.fd; fds[nfds].events = POLLIN; nfds++; }

        int slice = 50;
        if (!terminating && lim.timeout_ms > 0) {
            int remaining = lim.timeout_ms - elapsed_ms_since(start);
            if (remaining < slice) slice = std::max(1, remaining);
        }
        if (nfds > 0) {
            int pr = poll(fds, nfds, slice);
            if (pr < 0 && errno != EINTR) break;
        } else {
            usleep((useconds_t)slice * 1000);
        }

        out.pump();
        err.pump();

        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            child_exited = true;
            break;
        }

        if (!terminating) {
            bool cancel = hooks.should_cancel && hooks.should_cancel();
            bool timeout = lim.timeout_ms > 0 && elapsed_ms_since(start) >= lim.timeout_ms;
            if (cancel || timeout) {
                if (cancel) res->cancelled = true;
                else res->timed_out = true;
                (void)kill(-pid, SIGTERM);
                (void)kill(pid, SIGTERM);
                terminating = true;
                term_sent = std::chrono::steady_clock::now();
            }
        } else if (elapsed_ms_since(term_sent) >= lim.kill_grace_ms) {
            // grace expired: kill process group first, then the direct pid
            (void)kill(-pid, SIGKILL);
            (void)kill(pid, SIGKILL);
            (void)waitpid(pid, &status, 0);
            child_exited = true;
            break;
        }
    }

    if (!child_exited) {
        // poll failure: make sure nothing outlives the call
        (void)kill(-pid, SIGKILL);
        (void)kill(pid, SIGKILL);
        (void)waitpid(pid, &status, 0);
        child_exited = true;
        res->error = std::string("poll failed: ") + std::strerror(errno);
    }
    if (terminating) {
        // stray grandchildren in the group
        (void)kill(-pid, SIGKILL);
    }

    // Drain what the child wrote before exiting. Descendants that still
    // hold the pipes open must not block us, so stop at EAGAIN.
    out.pump();
    err.pump();
    out.finish();
    err.finish();

    res->output = std::move(out.data);
    res->error_output = std::move(err.data);
    res->output_truncated = out.truncated || err.truncated;

    if (WIFEXITED(status)) res->exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) res->exit_code = 128 + WTERMSIG(status);
    else res->exit_code = 128;

    return true;
}

bool proc_run_capture(const std::vector<std::string>& argv,
                      const std::string& cwd,
                      const ProcLimits& lim,
                      ProcResult* res) {
    return proc_run_streaming(argv, cwd, lim, ProcHooks{}, res);
}

} // namespace forge
