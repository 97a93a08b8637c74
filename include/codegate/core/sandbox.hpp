/*
 * codegate - Sandboxed Executor
 *
 * Runs validated code as a separate interpreter process:
 *
 *   1. write the code to a fresh mkstemps() file (<temp_dir>/codegate-XXXXXX.py)
 *   2. fork/exec the interpreter in its own process group, stdin from
 *      /dev/null, stdout and stderr captured on separate pipes
 *   3. poll until exit or until Policy::timeout_ms() elapses, in which case
 *      the whole process group is SIGKILLed and reaped. On a normal exit the
 *      rest of the group is SIGKILLed too, so forked children never outlive
 *      the run
 *   4. delete the file, whatever happened
 *
 * Isolation is process separation plus the deadline. The child runs with
 * the same user, filesystem and network access as this process.
 *
 * Config:
 *   sandbox.interpreter       - executable looked up on PATH (default "python3")
 *   sandbox.interpreter_args  - extra arguments placed before the script path
 *   sandbox.temp_dir          - where scripts are written (default $TMPDIR or /tmp)
 *   sandbox.max_output_bytes  - per-stream capture limit (default 1 MiB)
 */
#ifndef codegate_CORE_SANDBOX_HPP
#define codegate_CORE_SANDBOX_HPP

#include "policy.hpp"
#include "validator.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace codegate {

class Config;
class EventSink;

enum class ExecStatus {
    SUCCESS,        // exit code 0
    RUNTIME_ERROR,  // non-zero exit or killed by a signal
    TIMED_OUT,      // deadline hit, process group killed
    BLOCKED,        // rejected by the validator, never executed
    LAUNCH_FAILED   // could not create the script or start the interpreter
};

const char* exec_status_name(ExecStatus status);

struct ExecutionResult {
    ExecStatus status;
    std::string output;         // captured stdout
    std::string error_output;   // captured stderr
    std::string reason;         // BLOCKED / LAUNCH_FAILED detail
    int exit_code;              // 128 + signal when killed, -1 if never ran
    int64_t duration_ms;
    bool output_truncated;
    std::string artifact_path;  // script location (already removed on return)

    ExecutionResult()
        : status(ExecStatus::LAUNCH_FAILED)
        , exit_code(-1)
        , duration_ms(0)
        , output_truncated(false) {}

    static ExecutionResult blocked(const std::string& reason) {
        ExecutionResult r;
        r.status = ExecStatus::BLOCKED;
        r.reason = reason;
        return r;
    }

    static ExecutionResult launch_failed(const std::string& reason) {
        ExecutionResult r;
        r.status = ExecStatus::LAUNCH_FAILED;
        r.reason = reason;
        return r;
    }

    bool ok() const { return status == ExecStatus::SUCCESS; }

    // Text shown to the user for this outcome
    std::string describe() const;
};

struct SandboxConfig {
    std::string interpreter;
    std::vector<std::string> interpreter_args;
    std::string temp_dir;
    size_t max_output_bytes;

    SandboxConfig();

    static SandboxConfig from_config(const Config& cfg);
};

// Scratch source file owned by one execution. The destructor deletes it.
class TempSourceFile {
public:
    TempSourceFile() {}
    ~TempSourceFile();

    // Create <dir>/codegate-XXXXXX<suffix> and write `contents` into it
    bool create(const std::string& dir, const std::string& suffix,
                const std::string& contents, std::string* error);

    // Delete now. Returns false (and keeps the path for the destructor's
    // second attempt) if unlink fails for a reason other than ENOENT.
    bool remove(std::string* error = nullptr);

    const std::string& path() const { return path_; }

private:
    TempSourceFile(const TempSourceFile&);
    TempSourceFile& operator=(const TempSourceFile&);

    std::string path_;
};

class SandboxExecutor {
public:
    explicit SandboxExecutor(const SandboxConfig& config = SandboxConfig(),
                             EventSink* events = nullptr);

    // Run code the validator has accepted. Code that did not come out of
    // CodeValidator (an invalid ValidatedCode) is refused with LAUNCH_FAILED.
    ExecutionResult execute(const ValidatedCode& code, const Policy& policy) const;

    const SandboxConfig& config() const { return config_; }

private:
    void run_process(const std::string& script_path, const Policy& policy,
                     ExecutionResult* result) const;

    SandboxConfig config_;
    EventSink* events_;
};

} // namespace codegate

#endif // codegate_CORE_SANDBOX_HPP
