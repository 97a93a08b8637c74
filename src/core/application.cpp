/*
 * codegate - Application Implementation
 *
 * Central application singleton managing the lifecycle of all components.
 */
#include <codegate/core/application.hpp>
#include <codegate/core/logger.hpp>
#include <codegate/core/python_runtime.hpp>
#include <codegate/core/utils.hpp>
#include <codegate/plugins/openai/openai.hpp>

#include <iostream>
#include <csignal>
#include <cstring>
#include <curl/curl.h>

namespace codegate {

// ============================================================================
// Utility Functions
// ============================================================================

void print_usage(const char* prog) {
    std::cout << AppInfo::NAME << " - generate, vet and run code from natural-language tasks\n\n"
              << "Usage: " << prog << " [options]\n\n"
              << "Options:\n"
              << "  -h, --help           Show this help message\n"
              << "  -v, --version        Show version\n"
              << "  --config <path>      Configuration file (default: config.json)\n\n"
              << "Environment:\n"
              << "  OPENAI_API_KEY       API key for the generation service (required)\n\n"
              << "Variables from ./.env are loaded when not already set.\n";
}

void print_version() {
    std::cout << AppInfo::NAME << " v" << AppInfo::VERSION << "\n";
}

namespace {

void display_response(std::ostream& out, const std::string& prefix,
                      const std::string& code, const std::string& explanation,
                      const std::string& result) {
    out << "\n=== " << prefix << "CODE ===\n" << code << "\n";
    out << "\n=== " << prefix << "EXPLANATION ===\n"
        << (explanation.empty() ? "No explanation available" : explanation) << "\n";
    out << "\n=== EXECUTION RESULT ===\n" << result << "\n";
}

void signal_handler(int sig) {
    (void)sig;
    Application::instance().stop();
}

} // namespace

void render_outcome(std::ostream& out, const StepOutcome& outcome) {
    for (size_t i = 0; i < outcome.notes.size(); ++i) {
        out << outcome.notes[i] << "\n";
    }

    const ParsedResponse& response = outcome.response;
    std::string prefix = outcome.improved ? "IMPROVED " : "";

    switch (outcome.kind) {
        case StepKind::CLARIFICATION:
            out << "\nClarification needed: " << response.question << "\n";
            break;
        case StepKind::SOLUTION:
            display_response(out, prefix, response.code, response.explanation,
                             outcome.execution.describe());
            break;
        case StepKind::MALFORMED:
            if (!response.question.empty()) {
                out << "\nAnother clarification was requested: " << response.question << "\n";
            }
            display_response(out, prefix, response.note, response.explanation,
                             "No execution result available");
            break;
        case StepKind::GENERATION_FAILED:
            out << "\nError: " << outcome.message << "\n";
            break;
        case StepKind::EXHAUSTED:
            out << "\nMaximum retry attempts reached. Please refine your query.\n";
            break;
        case StepKind::REJECTED:
            out << "\n" << outcome.message << "\n";
            break;
        default:
            break;
    }
    out.flush();
}

// ============================================================================
// Application Implementation
// ============================================================================

Application& Application::instance() {
    static Application app;
    return app;
}

Application::Application()
    : config_file_("config.json")
    , config_explicit_(false)
    , running_(true)
    , exit_code_(0)
    , curl_initialized_(false)
{}

Application::~Application() {}

bool Application::parse_args(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return false;
        }
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            print_version();
            return false;
        }
        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_file_ = std::string(argv[++i]);
            config_explicit_ = true;
            continue;
        }
        std::cerr << "Unknown argument: " << argv[i] << "\n";
        print_usage(argv[0]);
        exit_code_ = 2;
        return false;
    }
    return true;
}

bool Application::load_config() {
    if (config_.load_file(config_file_)) {
        LOG_INFO("Loaded config from %s", config_file_.c_str());
        return true;
    }

    if (config_explicit_) {
        LOG_ERROR("Failed to load config from %s: %s", config_file_.c_str(),
                  config_.error().c_str());
        return false;
    }

    LOG_DEBUG("No usable %s (%s), using defaults", config_file_.c_str(),
              config_.error().c_str());
    return true;
}

void Application::setup_logging() {
    Logger::instance().set_level(parse_log_level(config_.get_string("log_level", "info")));

    std::string log_file = config_.get_string("log_file", "logs/codegate.log");
    if (!log_file.empty() && !Logger::instance().set_output_file(log_file)) {
        LOG_WARN("Logging to stderr only, could not open %s", log_file.c_str());
    }
}

bool Application::setup_provider() {
    if (OpenAIProvider::resolve_api_key(config_).empty()) {
        LOG_ERROR("OPENAI_API_KEY is not set (environment, .env or openai.api_key in %s)",
                  config_file_.c_str());
        return false;
    }

    ai_.reset(new OpenAIProvider());
    if (!ai_->init(config_)) {
        LOG_ERROR("Failed to initialize AI provider %s", ai_->name());
        return false;
    }

    LOG_INFO("AI provider: %s (%s)", ai_->provider_id().c_str(), ai_->default_model().c_str());
    return true;
}

void Application::setup_components() {
    policy_ = Policy::from_config(config_);
    LOG_INFO("Policy: %zu denied modules, timeout %d ms",
             policy_.denied_modules().size(), policy_.timeout_ms());

    SandboxConfig sandbox_config = SandboxConfig::from_config(config_);
    LOG_INFO("Sandbox: interpreter %s, scripts in %s",
             sandbox_config.interpreter.c_str(), sandbox_config.temp_dir.c_str());

    executor_.reset(new SandboxExecutor(sandbox_config, &events_));
    gate_.reset(new CodeGate(policy_, validator_, *executor_, &events_));

    AgentConfig agent_config = AgentConfig::from_config(config_);
    LOG_INFO("Agent config: max_refinement_attempts=%d, max_tokens=%d",
             agent_config.max_refinement_attempts, agent_config.max_tokens);

    agent_.reset(new Agent(ai_.get(), *gate_, ResponseParser(), agent_config, &events_));
}

bool Application::init(int argc, char* argv[]) {
    if (!parse_args(argc, argv)) {
        return false;
    }

    // Initialize libcurl globally (before anything issues requests)
    curl_global_init(CURL_GLOBAL_ALL);
    curl_initialized_ = true;

    // No SA_RESTART: a pending read on stdin returns so the loop can stop
    struct sigaction sa;
    memset(&sa, 0, sizeof(sa));
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    int exported = load_dotenv(".env");
    if (exported > 0) {
        LOG_DEBUG("Exported %d variables from .env", exported);
    }

    if (!load_config()) {
        exit_code_ = 1;
        return false;
    }

    setup_logging();
    LOG_INFO("%s v%s starting...", AppInfo::NAME, AppInfo::VERSION);

    if (!setup_provider()) {
        exit_code_ = 1;
        return false;
    }

    if (!PythonRuntime::instance().ensure_initialized()) {
        // Not fatal: every solution will be reported as blocked
        LOG_ERROR("Python parser unavailable, generated code cannot be validated");
    }

    setup_components();
    return true;
}

bool Application::read_line(const char* prompt, std::string* line) {
    std::cout << prompt;
    std::cout.flush();
    if (!std::getline(std::cin, *line)) {
        return false;
    }
    return true;
}

void Application::handle_task(const std::string& task) {
    StepOutcome outcome = agent_->submit_task(task);

    while (running_.load()) {
        render_outcome(std::cout, outcome);

        if (outcome.kind == StepKind::CLARIFICATION) {
            std::string answer;
            if (!read_line("Your clarification: ", &answer)) {
                running_ = false;
                break;
            }
            outcome = agent_->answer_clarification(answer);
            continue;
        }

        if (agent_->state() != AgentState::AWAITING_FEEDBACK) {
            break;
        }

        std::string feedback;
        if (!read_line("\nProvide feedback (or press enter to continue): ", &feedback)) {
            running_ = false;
            break;
        }
        if (!trim(feedback).empty()) {
            std::cout << "Feedback received. Improving solution..." << std::endl;
        }
        outcome = agent_->submit_feedback(feedback);
    }

    // Leave the agent ready for the next task whatever happened above
    if (agent_->state() != AgentState::AWAITING_TASK) {
        agent_->reset_task();
    }
}

int Application::run() {
    while (running_.load()) {
        std::string line;
        if (!read_line("\nEnter your coding task (or 'quit' to exit): ", &line)) {
            std::cout << "\n";
            break;
        }

        if (to_lower(trim(line)) == "quit") {
            agent_->quit();
            break;
        }

        if (trim(line).empty()) {
            continue;
        }

        try {
            handle_task(line);
        } catch (const std::exception& e) {
            LOG_ERROR("Task failed: %s", e.what());
            std::cout << "\nError: " << e.what() << std::endl;
            // Drop the interrupted task and keep the session alive
            agent_->reset_task();
        }
    }

    LOG_INFO("%s exiting (%zu interactions recorded)", AppInfo::NAME,
             agent_ ? agent_->history().size() : static_cast<size_t>(0));
    return 0;
}

void Application::shutdown() {
    agent_.reset();
    gate_.reset();
    executor_.reset();

    if (ai_) {
        ai_->shutdown();
        ai_.reset();
    }

    PythonRuntime::instance().shutdown();

    if (curl_initialized_) {
        curl_global_cleanup();
        curl_initialized_ = false;
        LOG_INFO("Shutdown complete");
    }

    Logger::instance().set_output_file("");
}

} // namespace codegate
