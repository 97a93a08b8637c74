/*
 * codegate - Application
 *
 * Process lifecycle: command line, .env, configuration, logging, the
 * generation provider, the code gate and the interactive task loop.
 */
#ifndef codegate_CORE_APPLICATION_HPP
#define codegate_CORE_APPLICATION_HPP

#include "agent.hpp"
#include "code_gate.hpp"
#include "config.hpp"
#include "events.hpp"
#include "policy.hpp"
#include "sandbox.hpp"
#include "validator.hpp"
#include <atomic>
#include <iosfwd>
#include <memory>
#include <string>

namespace codegate {

class OpenAIProvider;

struct AppInfo {
    static constexpr const char* NAME = "codegate";
    static constexpr const char* VERSION = "1.0.0";
};

void print_usage(const char* prog);
void print_version();

// Console rendering of one agent step
void render_outcome(std::ostream& out, const StepOutcome& outcome);

class Application {
public:
    static Application& instance();

    // false: stop now and exit with exit_code() (--help, --version, fatal setup error)
    bool init(int argc, char* argv[]);

    // Interactive loop on stdin/stdout; returns the process exit code
    int run();

    void shutdown();
    void stop() { running_ = false; }

    bool is_running() const { return running_.load(); }
    int exit_code() const { return exit_code_; }

    const Config& config() const { return config_; }

private:
    Application();
    ~Application();
    Application(const Application&);
    Application& operator=(const Application&);

    bool parse_args(int argc, char* argv[]);
    bool load_config();
    void setup_logging();
    bool setup_provider();
    void setup_components();

    // One task from submission to the end of its feedback cycles
    void handle_task(const std::string& task);

    bool read_line(const char* prompt, std::string* line);

    Config config_;
    std::string config_file_;
    bool config_explicit_;
    std::atomic<bool> running_;
    int exit_code_;
    bool curl_initialized_;

    LogEventSink events_;
    std::unique_ptr<OpenAIProvider> ai_;
    Policy policy_;
    CodeValidator validator_;
    std::unique_ptr<SandboxExecutor> executor_;
    std::unique_ptr<CodeGate> gate_;
    std::unique_ptr<Agent> agent_;
};

} // namespace codegate

#endif // codegate_CORE_APPLICATION_HPP
