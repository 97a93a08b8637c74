/*
 * codegate - Sandboxed Executor Implementation
 */
#include <codegate/core/sandbox.hpp>
#include <codegate/core/config.hpp>
#include <codegate/core/events.hpp>
#include <codegate/core/logger.hpp>
#include <codegate/core/utils.hpp>

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>

#ifdef __linux__
#include <sys/prctl.h>
#endif

namespace codegate {

namespace {

const size_t DEFAULT_MAX_OUTPUT_BYTES = 1024 * 1024;
const int POLL_SLICE_MS = 50;
const long MAX_FD_TO_CLOSE = 65536;

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

void close_pipe(int fds[2]) {
    close_fd(fds[0]);
    close_fd(fds[1]);
}

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

bool write_all(int fd, const std::string& data) {
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

// Read what is available without blocking, keeping at most `cap` bytes.
// Returns false once the stream is at EOF (or broken).
bool drain(int fd, std::string* out, size_t cap, bool* truncated) {
    char buf[4096];
    while (true) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            size_t room = cap > out->size() ? cap - out->size() : 0;
            size_t take = static_cast<size_t>(n);
            if (take > room) {
                take = room;
                *truncated = true;
            }
            out->append(buf, take);
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
        return false;
    }
}

pid_t wait_blocking(pid_t pid, int* status) {
    pid_t w;
    do {
        w = waitpid(pid, status, 0);
    } while (w < 0 && errno == EINTR);
    return w;
}

} // namespace

// ============================================================================
// ExecutionResult
// ============================================================================

const char* exec_status_name(ExecStatus status) {
    switch (status) {
        case ExecStatus::SUCCESS: return "success";
        case ExecStatus::RUNTIME_ERROR: return "runtime_error";
        case ExecStatus::TIMED_OUT: return "timed_out";
        case ExecStatus::BLOCKED: return "blocked";
        case ExecStatus::LAUNCH_FAILED: return "launch_failed";
        default: return "unknown";
    }
}

std::string ExecutionResult::describe() const {
    switch (status) {
        case ExecStatus::SUCCESS:
            return output_truncated ? output + "\n... [output truncated] ..." : output;
        case ExecStatus::RUNTIME_ERROR: {
            std::string text = "Error: " + (error_output.empty() ? reason : error_output);
            return output_truncated ? text + "\n... [output truncated] ..." : text;
        }
        case ExecStatus::TIMED_OUT:
            return "Execution timed out";
        case ExecStatus::BLOCKED:
            return reason.empty() ? "Code blocked due to security restrictions"
                                  : "Code blocked due to security restrictions (" + reason + ")";
        case ExecStatus::LAUNCH_FAILED:
            return "Execution failed to start: " + reason;
        default:
            return "";
    }
}

// ============================================================================
// SandboxConfig
// ============================================================================

SandboxConfig::SandboxConfig()
    : interpreter("python3")
    , interpreter_args()
    , temp_dir(default_temp_dir())
    , max_output_bytes(DEFAULT_MAX_OUTPUT_BYTES)
{}

SandboxConfig SandboxConfig::from_config(const Config& cfg) {
    SandboxConfig sc;
    sc.interpreter = cfg.get_string("sandbox.interpreter", sc.interpreter);
    sc.interpreter_args = cfg.get_string_array("sandbox.interpreter_args", sc.interpreter_args);
    sc.temp_dir = cfg.get_string("sandbox.temp_dir", sc.temp_dir);

    int64_t max_output = cfg.get_int("sandbox.max_output_bytes",
                                     static_cast<int64_t>(DEFAULT_MAX_OUTPUT_BYTES));
    if (max_output > 0) {
        sc.max_output_bytes = static_cast<size_t>(max_output);
    } else {
        LOG_WARN("[Sandbox] sandbox.max_output_bytes must be positive, keeping %zu",
                 sc.max_output_bytes);
    }
    return sc;
}

// ============================================================================
// TempSourceFile
// ============================================================================

TempSourceFile::~TempSourceFile() {
    if (path_.empty()) return;

    std::string error;
    if (!remove(&error)) {
        LOG_WARN("[Sandbox] Could not delete temporary script %s", error.c_str());
    }
}

bool TempSourceFile::create(const std::string& dir, const std::string& suffix,
                            const std::string& contents, std::string* error) {
    std::string base = dir.empty() ? default_temp_dir() : dir;
    std::string pattern = join_path(base, "codegate-XXXXXX" + suffix);

    std::vector<char> name(pattern.begin(), pattern.end());
    name.push_back('\0');

    int fd = mkstemps(name.data(), static_cast<int>(suffix.size()));
    if (fd < 0) {
        if (error) *error = "cannot create temporary file in " + base + ": " + strerror(errno);
        return false;
    }
    path_ = name.data();

    if (!write_all(fd, contents)) {
        if (error) *error = "cannot write " + path_ + ": " + strerror(errno);
        close(fd);
        remove();
        return false;
    }

    if (close(fd) != 0) {
        if (error) *error = "cannot close " + path_ + ": " + strerror(errno);
        remove();
        return false;
    }

    return true;
}

bool TempSourceFile::remove(std::string* error) {
    if (path_.empty()) return true;

    if (unlink(path_.c_str()) == 0 || errno == ENOENT) {
        path_.clear();
        return true;
    }

    if (error) *error = path_ + ": " + strerror(errno);
    return false;
}

// ============================================================================
// SandboxExecutor
// ============================================================================

SandboxExecutor::SandboxExecutor(const SandboxConfig& config, EventSink* events)
    : config_(config)
    , events_(events)
{}

ExecutionResult SandboxExecutor::execute(const ValidatedCode& code, const Policy& policy) const {
    if (!code.valid()) {
        LOG_ERROR("[Sandbox] Refusing to run code that has not passed validation");
        return ExecutionResult::launch_failed("code has not passed validation");
    }

    int64_t started = monotonic_ms();
    ExecutionResult result;

    {
        TempSourceFile script;
        std::string error;
        if (!script.create(config_.temp_dir, ".py", code.text(), &error)) {
            LOG_ERROR("[Sandbox] %s", error.c_str());
            result = ExecutionResult::launch_failed(error);
        } else {
            result.artifact_path = script.path();
            LOG_DEBUG("[Sandbox] Running %s %s (timeout %d ms)",
                      config_.interpreter.c_str(), script.path().c_str(), policy.timeout_ms());
            run_process(script.path(), policy, &result);
        }

        std::string cleanup_error;
        if (!script.remove(&cleanup_error)) {
            LOG_WARN("[Sandbox] Could not delete temporary script %s", cleanup_error.c_str());
            if (events_) {
                Json fields = Json::object();
                fields["path"] = result.artifact_path;
                fields["error"] = cleanup_error;
                events_->emit("artifact.cleanup_failed", fields);
            }
        }
    }

    result.duration_ms = monotonic_ms() - started;

    if (events_) {
        Json fields = Json::object();
        fields["status"] = exec_status_name(result.status);
        fields["exit_code"] = result.exit_code;
        fields["duration_ms"] = result.duration_ms;
        fields["stdout_bytes"] = result.output.size();
        fields["stderr_bytes"] = result.error_output.size();
        fields["truncated"] = result.output_truncated;
        if (!result.reason.empty()) {
            fields["reason"] = result.reason;
        }
        events_->emit("execution.finished", fields);
    }

    return result;
}

void SandboxExecutor::run_process(const std::string& script_path, const Policy& policy,
                                  ExecutionResult* result) const {
    // Everything the child needs is prepared before fork()
    std::vector<std::string> args;
    args.push_back(config_.interpreter);
    args.insert(args.end(), config_.interpreter_args.begin(), config_.interpreter_args.end());
    args.push_back(script_path);

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (size_t i = 0; i < args.size(); ++i) {
        argv.push_back(const_cast<char*>(args[i].c_str()));
    }
    argv.push_back(nullptr);

    long max_fd = sysconf(_SC_OPEN_MAX);
    if (max_fd < 256) max_fd = 256;
    if (max_fd > MAX_FD_TO_CLOSE) max_fd = MAX_FD_TO_CLOSE;

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};   // carries errno if execvp fails

    if (pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0 ||
        pipe2(exec_pipe, O_CLOEXEC) != 0) {
        std::string reason = std::string("pipe failed: ") + strerror(errno);
        close_pipe(out_pipe);
        close_pipe(err_pipe);
        close_pipe(exec_pipe);
        result->status = ExecStatus::LAUNCH_FAILED;
        result->reason = reason;
        return;
    }

    pid_t pid = fork();
    if (pid < 0) {
        std::string reason = std::string("fork failed: ") + strerror(errno);
        close_pipe(out_pipe);
        close_pipe(err_pipe);
        close_pipe(exec_pipe);
        result->status = ExecStatus::LAUNCH_FAILED;
        result->reason = reason;
        return;
    }

    if (pid == 0) {
        // child: async-signal-safe calls only
        (void)dup2(out_pipe[1], STDOUT_FILENO);
        (void)dup2(err_pipe[1], STDERR_FILENO);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            (void)dup2(devnull, STDIN_FILENO);
        }

        // own process group so a timeout can kill the whole subtree
        (void)setpgid(0, 0);
        (void)signal(SIGPIPE, SIG_DFL);
#ifdef __linux__
        (void)prctl(PR_SET_PDEATHSIG, SIGKILL);
#endif

        for (long fd = 3; fd < max_fd; ++fd) {
            if (fd != exec_pipe[1]) {
                (void)close(static_cast<int>(fd));
            }
        }

        execvp(argv[0], argv.data());

        int err = errno;
        ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // parent
    (void)setpgid(pid, pid);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    // EOF here means exec succeeded (the write end was close-on-exec)
    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        (void)wait_blocking(pid, &status);
        close_pipe(out_pipe);
        close_pipe(err_pipe);
        result->status = ExecStatus::LAUNCH_FAILED;
        result->reason = "cannot execute " + config_.interpreter + ": " + strerror(exec_errno);
        LOG_ERROR("[Sandbox] %s", result->reason.c_str());
        return;
    }

    set_nonblocking(out_pipe[0]);
    set_nonblocking(err_pipe[0]);

    const size_t cap = config_.max_output_bytes;
    const int64_t deadline = monotonic_ms() + policy.timeout_ms();

    std::string out;
    std::string err;
    bool truncated = false;
    bool out_open = true;
    bool err_open = true;
    bool timed_out = false;
    bool lost_child = false;
    int status = 0;

    while (true) {
        if (out_open) out_open = drain(out_pipe[0], &out, cap, &truncated);
        if (err_open) err_open = drain(err_pipe[0], &err, cap, &truncated);

        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            break;
        }
        if (w < 0 && errno == ECHILD) {
            lost_child = true;
            break;
        }

        int64_t remaining = deadline - monotonic_ms();
        if (remaining <= 0) {
            timed_out = true;
            // group first (grandchildren), then the direct child
            (void)kill(-pid, SIGKILL);
            (void)kill(pid, SIGKILL);
            (void)wait_blocking(pid, &status);
            break;
        }

        struct pollfd fds[2];
        nfds_t nfds = 0;
        if (out_open) {
            fds[nfds].fd = out_pipe[0];
            fds[nfds].events = POLLIN;
            fds[nfds].revents = 0;
            ++nfds;
        }
        if (err_open) {
            fds[nfds].fd = err_pipe[0];
            fds[nfds].events = POLLIN;
            fds[nfds].revents = 0;
            ++nfds;
        }
        int slice = remaining < POLL_SLICE_MS ? static_cast<int>(remaining) : POLL_SLICE_MS;
        (void)poll(nfds > 0 ? fds : nullptr, nfds, slice);
    }

    if (!timed_out) {
        // anything the script forked dies with it
        (void)kill(-pid, SIGKILL);

        // output written right before exit
        if (out_open) drain(out_pipe[0], &out, cap, &truncated);
        if (err_open) drain(err_pipe[0], &err, cap, &truncated);
    }
    close_pipe(out_pipe);
    close_pipe(err_pipe);

    if (timed_out) {
        result->status = ExecStatus::TIMED_OUT;
        result->exit_code = 128 + SIGKILL;
        result->reason = "exceeded " + std::to_string(policy.timeout_ms()) + " ms";
        LOG_WARN("[Sandbox] Execution timed out after %d ms, process group %d killed",
                 policy.timeout_ms(), static_cast<int>(pid));
        return;
    }

    result->output = out;
    result->error_output = err;
    result->output_truncated = truncated;

    if (lost_child) {
        result->status = ExecStatus::RUNTIME_ERROR;
        result->reason = "exit status of the child process was lost";
        return;
    }

    if (WIFEXITED(status)) {
        result->exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result->exit_code = 128 + WTERMSIG(status);
        result->reason = "terminated by signal " + std::to_string(WTERMSIG(status));
    } else {
        result->exit_code = 128;
    }

    result->status = result->exit_code == 0 ? ExecStatus::SUCCESS : ExecStatus::RUNTIME_ERROR;
    LOG_DEBUG("[Sandbox] Child %d exited with %d (%zu bytes stdout, %zu bytes stderr)",
              static_cast<int>(pid), result->exit_code, out.size(), err.size());
}

} // namespace codegate
