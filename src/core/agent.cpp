#include <codegate/core/agent.hpp>
#include <codegate/ai/ai.hpp>
#include <codegate/core/code_gate.hpp>
#include <codegate/core/config.hpp>
#include <codegate/core/events.hpp>
#include <codegate/core/logger.hpp>
#include <codegate/core/utils.hpp>
#include <exception>

namespace codegate {

const char* agent_state_name(AgentState state) {
    switch (state) {
        case AgentState::AWAITING_TASK: return "awaiting_task";
        case AgentState::AWAITING_CLARIFICATION: return "awaiting_clarification";
        case AgentState::HAS_SOLUTION: return "has_solution";
        case AgentState::AWAITING_FEEDBACK: return "awaiting_feedback";
        case AgentState::REFINING: return "refining";
        case AgentState::TERMINAL: return "terminal";
        default: return "unknown";
    }
}

const char* step_kind_name(StepKind kind) {
    switch (kind) {
        case StepKind::CLARIFICATION: return "clarification";
        case StepKind::SOLUTION: return "solution";
        case StepKind::MALFORMED: return "malformed";
        case StepKind::GENERATION_FAILED: return "generation_failed";
        case StepKind::EXHAUSTED: return "exhausted";
        case StepKind::IDLE: return "idle";
        case StepKind::REJECTED: return "rejected";
        case StepKind::TERMINATED: return "terminated";
        default: return "unknown";
    }
}

std::string default_system_prompt() {
    return
        "You are a Python programming assistant. Reply in exactly one of two forms.\n"
        "\n"
        "If the request is ambiguous or missing information you need, ask one question:\n"
        "[CLARIFICATION] <your question>\n"
        "\n"
        "Otherwise give a complete, runnable program followed by a short explanation:\n"
        "[CODE]\n"
        "```python\n"
        "<code>\n"
        "```\n"
        "[EXPLANATION]\n"
        "<how the code works>\n"
        "\n"
        "The program runs non-interactively with a time limit of a few seconds and must print "
        "its results to standard output. It must not import os, sys or subprocess, "
        "read from standard input, or access the network.";
}

AgentConfig AgentConfig::from_config(const Config& cfg) {
    AgentConfig ac;

    int64_t attempts = cfg.get_int("agent.max_refinement_attempts", ac.max_refinement_attempts);
    if (attempts >= 1) {
        ac.max_refinement_attempts = static_cast<int>(attempts);
    } else {
        LOG_WARN("[Agent] agent.max_refinement_attempts must be at least 1, keeping %d",
                 ac.max_refinement_attempts);
    }

    int64_t tokens = cfg.get_int("agent.max_tokens", ac.max_tokens);
    if (tokens > 0) {
        ac.max_tokens = static_cast<int>(tokens);
    }

    std::string prompt = cfg.get_string("system_prompt", "");
    if (!trim(prompt).empty()) {
        ac.system_prompt = prompt;
    }
    return ac;
}

Agent::Agent(AIPlugin* ai,
             const CodeGate& gate,
             const ResponseParser& parser,
             const AgentConfig& config,
             EventSink* events)
    : ai_(ai)
    , gate_(gate)
    , parser_(parser)
    , config_(config)
    , events_(events)
    , state_(AgentState::AWAITING_TASK)
    , attempts_(0)
{
    if (config_.max_refinement_attempts < 1) {
        config_.max_refinement_attempts = 1;
    }
}

// ============================================================================
// Transitions
// ============================================================================

StepOutcome Agent::submit_task(const std::string& task) {
    if (state_ != AgentState::AWAITING_TASK) {
        return rejected("submit_task");
    }

    if (trim(task).empty()) {
        StepOutcome outcome;
        outcome.kind = StepKind::IDLE;
        return outcome;
    }

    task_id_ = generate_uuid();
    task_ = task;
    feedback_.clear();
    last_response_ = ParsedResponse();
    attempts_ = 0;
    LOG_INFO("[Agent] New task %s (%zu chars)", task_id_.c_str(), task_.size());

    ParsedResponse response;
    std::string error;
    if (!generate(task_, &response, &error)) {
        StepOutcome outcome;
        outcome.kind = StepKind::GENERATION_FAILED;
        outcome.message = error;
        state_ = AgentState::AWAITING_TASK;
        return outcome;
    }
    last_response_ = response;

    if (response.is_clarification()) {
        state_ = AgentState::AWAITING_CLARIFICATION;
        StepOutcome outcome;
        outcome.kind = StepKind::CLARIFICATION;
        outcome.response = response;
        return outcome;
    }

    if (response.is_solution()) {
        return finish_solution(response, false);
    }

    state_ = AgentState::AWAITING_FEEDBACK;
    StepOutcome outcome;
    outcome.kind = StepKind::MALFORMED;
    outcome.response = response;
    outcome.message = response.note;
    return outcome;
}

StepOutcome Agent::answer_clarification(const std::string& answer) {
    if (state_ == AgentState::REFINING) {
        // question came up during refinement: fold the answer into the feedback
        feedback_ += "\nUser clarification: " + answer;
        return run_refinement();
    }

    if (state_ != AgentState::AWAITING_CLARIFICATION) {
        return rejected("answer_clarification");
    }

    task_ += "\nUser clarification: " + answer;

    ParsedResponse response;
    std::string error;
    if (!generate(task_, &response, &error)) {
        StepOutcome outcome;
        outcome.kind = StepKind::GENERATION_FAILED;
        outcome.message = error;
        state_ = AgentState::AWAITING_TASK;
        return outcome;
    }

    if (response.is_solution()) {
        last_response_ = response;
        return finish_solution(response, false);
    }

    // No second clarification round: report it as a reply without code
    ParsedResponse reported = response;
    if (response.is_clarification()) {
        reported = ParsedResponse::malformed(response.raw, ResponseParser::NOTE_NO_CODE);
        reported.question = response.question;
    }
    last_response_ = reported;
    state_ = AgentState::AWAITING_FEEDBACK;

    StepOutcome outcome;
    outcome.kind = StepKind::MALFORMED;
    outcome.response = reported;
    outcome.message = reported.note;
    return outcome;
}

StepOutcome Agent::submit_feedback(const std::string& feedback) {
    if (state_ != AgentState::AWAITING_FEEDBACK) {
        return rejected("submit_feedback");
    }

    if (trim(feedback).empty()) {
        state_ = AgentState::AWAITING_TASK;
        StepOutcome outcome;
        outcome.kind = StepKind::IDLE;
        return outcome;
    }

    feedback_ = feedback;
    attempts_ = 0;
    state_ = AgentState::REFINING;
    return run_refinement();
}

StepOutcome Agent::quit() {
    state_ = AgentState::TERMINAL;
    StepOutcome outcome;
    outcome.kind = StepKind::TERMINATED;
    return outcome;
}

void Agent::reset_task() {
    if (state_ == AgentState::TERMINAL) {
        return;
    }
    if (state_ != AgentState::AWAITING_TASK) {
        LOG_DEBUG("[Agent] Task %s abandoned in state %s", task_id_.c_str(), agent_state_name(state_));
    }
    state_ = AgentState::AWAITING_TASK;
    feedback_.clear();
    attempts_ = 0;
}

// ============================================================================
// Internals
// ============================================================================

StepOutcome Agent::run_refinement() {
    std::vector<std::string> notes;

    while (attempts_ < config_.max_refinement_attempts) {
        record(feedback_);

        if (events_) {
            Json fields = Json::object();
            fields["task_id"] = task_id_;
            fields["attempt"] = attempts_ + 1;
            fields["max_attempts"] = config_.max_refinement_attempts;
            events_->emit("refinement.round", fields);
        }

        ParsedResponse response;
        std::string error;
        bool generated = generate(task_ + "\nUser feedback: " + feedback_, &response, &error);

        if (generated && response.is_solution()) {
            last_response_ = response;
            StepOutcome outcome = finish_solution(response, true);
            outcome.notes = notes;
            return outcome;
        }

        ++attempts_;

        if (generated && response.is_clarification()) {
            last_response_ = response;
            if (attempts_ >= config_.max_refinement_attempts) {
                break;
            }
            // stay in REFINING until the answer arrives
            StepOutcome outcome;
            outcome.kind = StepKind::CLARIFICATION;
            outcome.response = response;
            outcome.improved = true;
            outcome.attempts = attempts_;
            outcome.notes = notes;
            return outcome;
        }

        if (generated) {
            last_response_ = response;
            LOG_WARN("[Agent] Refinement round %d produced no usable code: %s",
                     attempts_, response.note.c_str());
            notes.push_back("Failed to generate valid response (" + response.note + "). Retrying...");
        } else {
            LOG_WARN("[Agent] Refinement round %d failed: %s", attempts_, error.c_str());
            notes.push_back("Generation failed (" + error + "). Retrying...");
        }
    }

    StepOutcome outcome = exhausted();
    outcome.notes = notes;
    return outcome;
}

StepOutcome Agent::exhausted() {
    LOG_WARN("[Agent] Task %s: maximum attempts (%d) reached", task_id_.c_str(),
             config_.max_refinement_attempts);

    if (events_) {
        Json fields = Json::object();
        fields["task_id"] = task_id_;
        fields["attempts"] = attempts_;
        events_->emit("refinement.exhausted", fields);
    }

    state_ = AgentState::AWAITING_TASK;

    StepOutcome outcome;
    outcome.kind = StepKind::EXHAUSTED;
    outcome.attempts = attempts_;
    outcome.message = "Maximum retry attempts reached";
    return outcome;
}

StepOutcome Agent::finish_solution(const ParsedResponse& response, bool improved) {
    state_ = AgentState::HAS_SOLUTION;

    StepOutcome outcome;
    outcome.kind = StepKind::SOLUTION;
    outcome.response = response;
    outcome.improved = improved;
    outcome.attempts = attempts_;
    outcome.execution = gate_.run(response.code);

    if (!improved) {
        record("");
    }

    state_ = AgentState::AWAITING_FEEDBACK;
    return outcome;
}

StepOutcome Agent::rejected(const char* operation) const {
    LOG_WARN("[Agent] %s is not valid in state %s", operation, agent_state_name(state_));
    StepOutcome outcome;
    outcome.kind = StepKind::REJECTED;
    outcome.message = std::string(operation) + " is not valid in state " + agent_state_name(state_);
    return outcome;
}

void Agent::record(const std::string& feedback) {
    InteractionRecord rec;
    rec.task_id = task_id_;
    rec.task = task_;
    rec.response = last_response_;
    rec.feedback = feedback;
    rec.timestamp_ms = current_timestamp_ms();
    history_.push_back(rec);
}

bool Agent::generate(const std::string& prompt, ParsedResponse* response, std::string* error) {
    if (!ai_) {
        *error = "No AI provider configured";
        return false;
    }

    if (events_) {
        Json fields = Json::object();
        fields["task_id"] = task_id_;
        fields["state"] = agent_state_name(state_);
        fields["prompt_chars"] = prompt.size();
        events_->emit("generation.request", fields);
    }

    CompletionOptions opts;
    opts.system_prompt = config_.system_prompt;
    opts.max_tokens = config_.max_tokens;

    CompletionResult result;
    try {
        result = ai_->complete(prompt, opts);
    } catch (const std::exception& e) {
        result = CompletionResult::fail(std::string("provider raised: ") + e.what());
    }

    if (!result.success) {
        LOG_ERROR("[Agent] Generation failed: %s", result.error.c_str());
        if (events_) {
            Json fields = Json::object();
            fields["task_id"] = task_id_;
            fields["error"] = result.error;
            events_->emit("generation.failed", fields);
        }
        *error = result.error;
        return false;
    }

    *response = parser_.parse(result.content);

    if (events_) {
        Json fields = Json::object();
        fields["task_id"] = task_id_;
        fields["kind"] = response_kind_name(response->kind);
        if (!response->note.empty()) fields["note"] = response->note;
        fields["reply_chars"] = result.content.size();
        events_->emit("response.parsed", fields);
    }
    return true;
}

} // namespace codegate
