/*
 * codegate - Interaction State Machine
 *
 * Drives one task at a time through clarification, solution and
 * feedback-driven refinement:
 *
 *   AWAITING_TASK --task--> (generate) --clarification--> AWAITING_CLARIFICATION
 *                                      --solution-------> HAS_SOLUTION -> AWAITING_FEEDBACK
 *                                      --malformed------> AWAITING_FEEDBACK
 *
 *   AWAITING_CLARIFICATION --answer--> (generate) -> HAS_SOLUTION | AWAITING_FEEDBACK
 *
 *   AWAITING_FEEDBACK --""-------> AWAITING_TASK
 *                     --feedback-> REFINING -> HAS_SOLUTION -> AWAITING_FEEDBACK
 *                                           -> (clarification, answer) -> REFINING ...
 *                                           -> maximum attempts -> AWAITING_TASK
 *
 *   any --quit--> TERMINAL
 *
 * Every solution goes through CodeGate (validate, then execute) before it
 * is reported, on the first round and on every refinement round.
 *
 * The agent does no terminal I/O. Each call returns a StepOutcome that the
 * caller renders.
 */
#ifndef codegate_CORE_AGENT_HPP
#define codegate_CORE_AGENT_HPP

#include "response_parser.hpp"
#include "sandbox.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace codegate {

class AIPlugin;
class CodeGate;
class Config;
class EventSink;

enum class AgentState {
    AWAITING_TASK,
    AWAITING_CLARIFICATION,
    HAS_SOLUTION,
    AWAITING_FEEDBACK,
    REFINING,
    TERMINAL
};

const char* agent_state_name(AgentState state);

// System instruction describing the [CLARIFICATION] / [CODE] / [EXPLANATION] reply format
std::string default_system_prompt();

struct AgentConfig {
    int max_refinement_attempts;    // non-solution rounds allowed per feedback cycle (default: 3)
    int max_tokens;                 // generation budget per call (default: 1500)
    std::string system_prompt;

    AgentConfig()
        : max_refinement_attempts(3)
        , max_tokens(1500)
        , system_prompt(default_system_prompt()) {}

    static AgentConfig from_config(const Config& cfg);
};

// One append-only history entry
struct InteractionRecord {
    std::string task_id;
    std::string task;
    ParsedResponse response;
    std::string feedback;
    int64_t timestamp_ms;

    InteractionRecord() : timestamp_ms(0) {}
};

enum class StepKind {
    CLARIFICATION,      // question for the user (answer with answer_clarification)
    SOLUTION,           // code was validated and executed (or blocked)
    MALFORMED,          // reply had no usable code; nothing executed
    GENERATION_FAILED,  // the provider call itself failed
    EXHAUSTED,          // refinement hit max_refinement_attempts
    IDLE,               // nothing to do (empty task, empty feedback)
    REJECTED,           // call not valid in the current state
    TERMINATED
};

const char* step_kind_name(StepKind kind);

struct StepOutcome {
    StepKind kind;
    ParsedResponse response;
    ExecutionResult execution;      // SOLUTION only
    bool improved;                  // produced by a refinement round
    int attempts;                   // non-solution refinement rounds so far
    std::string message;            // error text / status line
    std::vector<std::string> notes; // rounds retried inside this step

    StepOutcome() : kind(StepKind::IDLE), improved(false), attempts(0) {}
};

class Agent {
public:
    Agent(AIPlugin* ai,
          const CodeGate& gate,
          const ResponseParser& parser = ResponseParser(),
          const AgentConfig& config = AgentConfig(),
          EventSink* events = nullptr);

    // AWAITING_TASK
    StepOutcome submit_task(const std::string& task);

    // AWAITING_CLARIFICATION, or REFINING after a clarification round
    StepOutcome answer_clarification(const std::string& answer);

    // AWAITING_FEEDBACK; empty feedback ends the task
    StepOutcome submit_feedback(const std::string& feedback);

    StepOutcome quit();

    // Abandon the current task (if any) and go back to AWAITING_TASK.
    // History is kept. No effect once TERMINAL.
    void reset_task();

    AgentState state() const { return state_; }
    const std::string& task() const { return task_; }
    const std::string& task_id() const { return task_id_; }
    int attempts() const { return attempts_; }
    const AgentConfig& config() const { return config_; }
    const std::vector<InteractionRecord>& history() const { return history_; }

private:
    Agent(const Agent&);
    Agent& operator=(const Agent&);

    // One generation call. On failure returns false with *error set.
    bool generate(const std::string& prompt, ParsedResponse* response, std::string* error);

    StepOutcome finish_solution(const ParsedResponse& response, bool improved);
    StepOutcome run_refinement();
    StepOutcome exhausted();
    StepOutcome rejected(const char* operation) const;

    void record(const std::string& feedback);

    AIPlugin* ai_;
    const CodeGate& gate_;
    ResponseParser parser_;
    AgentConfig config_;
    EventSink* events_;

    AgentState state_;
    std::string task_id_;
    std::string task_;
    std::string feedback_;
    ParsedResponse last_response_;
    int attempts_;
    std::vector<InteractionRecord> history_;
};

} // namespace codegate

#endif // codegate_CORE_AGENT_HPP
