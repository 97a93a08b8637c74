#include "test_common.h"
#include <codegate/ai/ai.hpp>
#include <codegate/core/agent.hpp>
#include <codegate/core/code_gate.hpp>
#include <codegate/core/config.hpp>
#include <codegate/core/events.hpp>
#include <codegate/core/python_runtime.hpp>
#include <deque>
#include <stdexcept>
#include <string>
#include <vector>

using namespace codegate;

// Scripted provider: hands out queued replies and records every call
class FakeAI : public AIPlugin {
public:
    FakeAI() : calls(0), throw_next(false) {}

    const char* name() const override { return "fake"; }
    bool init(const Config&) override { return true; }
    void shutdown() override {}
    bool is_initialized() const override { return true; }
    std::string provider_id() const override { return "fake"; }
    std::string default_model() const override { return "fake-model"; }
    bool is_configured() const override { return true; }

    CompletionResult complete(const std::string& prompt, const CompletionOptions& opts) override {
        ++calls;
        prompts.push_back(prompt);
        last_opts = opts;
        if (throw_next) {
            throw_next = false;
            throw std::runtime_error("connection reset");
        }
        if (replies.empty()) {
            return CompletionResult::fail("no scripted reply");
        }
        CompletionResult r = replies.front();
        replies.pop_front();
        return r;
    }

    CompletionResult chat(const std::vector<ConversationMessage>& messages,
                          const CompletionOptions& opts) override {
        return complete(messages.empty() ? std::string() : messages.back().content, opts);
    }

    void reply(const std::string& text) { replies.push_back(CompletionResult::ok(text)); }
    void fail(const std::string& error) { replies.push_back(CompletionResult::fail(error)); }

    int calls;
    bool throw_next;
    std::vector<std::string> prompts;
    CompletionOptions last_opts;
    std::deque<CompletionResult> replies;
};

static std::string solution(const std::string& code, const std::string& explanation = "Done.") {
    return "[CODE]\n```python\n" + code + "\n```\n[EXPLANATION]\n" + explanation;
}

struct Fixture {
    FakeAI ai;
    RecordingEventSink events;
    Policy policy;
    CodeValidator validator;
    SandboxExecutor executor;
    CodeGate gate;
    Agent agent;

    explicit Fixture(const AgentConfig& cfg = AgentConfig())
        : executor(SandboxConfig(), &events)
        , gate(policy, validator, executor, &events)
        , agent(&ai, gate, ResponseParser(), cfg, &events) {}
};

static void test_direct_solution() {
    Fixture f;
    f.ai.reply(solution("print('hi')", "Prints hi."));

    StepOutcome o = f.agent.submit_task("print hi");
    expect_true(o.kind == StepKind::SOLUTION, "solution outcome");
    expect_true(!o.improved, "first solution is not improved");
    expect_eq_str(o.response.code, "print('hi')", "code");
    expect_eq_str(o.response.explanation, "Prints hi.", "explanation");
    expect_true(o.execution.ok(), "executed");
    expect_eq_str(o.execution.output, "hi\n", "output");
    expect_true(f.agent.state() == AgentState::AWAITING_FEEDBACK, "waiting for feedback");
    expect_eq_ll(f.ai.calls, 1, "one generation call");
    expect_eq_str(f.ai.prompts[0], "print hi", "task sent as prompt");
    expect_eq_ll(f.ai.last_opts.max_tokens, 1500, "token budget");
    expect_true(f.ai.last_opts.system_prompt.find("[CODE]") != std::string::npos, "system prompt sent");
    expect_eq_ll(static_cast<long long>(f.agent.history().size()), 1, "solution recorded");
    expect_eq_str(f.agent.history()[0].task, "print hi", "history task");
    expect_eq_ll(static_cast<long long>(f.agent.task_id().size()), 36, "task id assigned");
    expect_eq_str(f.agent.history()[0].task_id, f.agent.task_id(), "history carries task id");

    StepOutcome done = f.agent.submit_feedback("   ");
    expect_true(done.kind == StepKind::IDLE, "empty feedback ends the task");
    expect_true(f.agent.state() == AgentState::AWAITING_TASK, "back to awaiting task");
    expect_eq_ll(f.ai.calls, 1, "no call for empty feedback");
}

static void test_clarification_then_solution() {
    Fixture f;
    f.ai.reply("[CLARIFICATION] Which format, CSV or JSON?");
    f.ai.reply(solution("print('csv')"));

    StepOutcome q = f.agent.submit_task("parse the file");
    expect_true(q.kind == StepKind::CLARIFICATION, "clarification outcome");
    expect_eq_str(q.response.question, "Which format, CSV or JSON?", "question");
    expect_true(f.agent.state() == AgentState::AWAITING_CLARIFICATION, "awaiting clarification");
    expect_true(f.events.count("validation.passed") == 0, "nothing validated for a question");

    StepOutcome o = f.agent.answer_clarification("CSV");
    expect_true(o.kind == StepKind::SOLUTION, "solution after answer");
    expect_eq_str(f.ai.prompts[1], "parse the file\nUser clarification: CSV", "answer appended to task");
    expect_eq_str(f.agent.task(), "parse the file\nUser clarification: CSV", "task text extended");
    expect_true(f.agent.state() == AgentState::AWAITING_FEEDBACK, "awaiting feedback");
}

static void test_second_clarification_is_not_looped() {
    Fixture f;
    f.ai.reply("[CLARIFICATION] Which format?");
    f.ai.reply("[CLARIFICATION] Which delimiter?");

    f.agent.submit_task("parse the file");
    StepOutcome o = f.agent.answer_clarification("CSV");
    expect_true(o.kind == StepKind::MALFORMED, "second clarification reported as malformed");
    expect_eq_str(o.response.note, "No code generated", "placeholder");
    expect_eq_str(o.response.question, "Which delimiter?", "question kept for display");
    expect_true(f.agent.state() == AgentState::AWAITING_FEEDBACK, "moves on to feedback");
    expect_eq_ll(f.ai.calls, 2, "no extra call");
}

static void test_malformed_first_reply() {
    Fixture f;
    f.ai.reply("I cannot help with that.");

    StepOutcome o = f.agent.submit_task("do something");
    expect_true(o.kind == StepKind::MALFORMED, "malformed outcome");
    expect_eq_str(o.message, "No code generated", "note surfaced");
    expect_true(f.agent.state() == AgentState::AWAITING_FEEDBACK, "feedback can still follow");
    expect_eq_ll(static_cast<long long>(f.events.count("validation.passed") +
                                        f.events.count("validation.rejected")), 0,
                 "no validation for malformed reply");
}

static void test_feedback_improves_solution() {
    Fixture f;
    f.ai.reply(solution("print(1)"));
    f.ai.reply(solution("print(2)", "Now prints 2."));

    f.agent.submit_task("print a number");
    StepOutcome o = f.agent.submit_feedback("print 2 instead");
    expect_true(o.kind == StepKind::SOLUTION, "improved solution");
    expect_true(o.improved, "marked improved");
    expect_eq_str(o.execution.output, "2\n", "new code executed");
    expect_eq_str(f.ai.prompts[1], "print a number\nUser feedback: print 2 instead", "feedback prompt");
    expect_eq_ll(static_cast<long long>(f.events.count("validation.passed")), 2, "re-validated");
    expect_true(f.agent.state() == AgentState::AWAITING_FEEDBACK, "another round possible");

    const std::vector<InteractionRecord>& h = f.agent.history();
    expect_eq_ll(static_cast<long long>(h.size()), 2, "initial + one refinement round");
    expect_eq_str(h[1].feedback, "print 2 instead", "feedback recorded");
    expect_eq_str(h[1].response.code, "print(1)", "round records the response being refined");
    expect_eq_str(h[1].task, "print a number", "task unchanged by feedback");
}

static void test_refinement_blocked_code() {
    Fixture f;
    f.ai.reply(solution("print(1)"));
    f.ai.reply(solution("import subprocess\nsubprocess.run(['ls'])"));

    f.agent.submit_task("list files");
    StepOutcome o = f.agent.submit_feedback("use the shell");
    expect_true(o.kind == StepKind::SOLUTION, "still a solution");
    expect_true(o.execution.status == ExecStatus::BLOCKED, "refined code goes through the validator");
    expect_eq_ll(static_cast<long long>(f.events.count("execution.finished")), 1, "only first ran");
}

static void test_exhaustion_stops_generation() {
    Fixture f;
    f.ai.reply(solution("print(1)"));
    f.ai.reply("nothing useful");
    f.ai.reply("[CODE] no fence [EXPLANATION] x");
    f.ai.reply("still nothing");
    f.ai.reply(solution("print('never requested')"));

    f.agent.submit_task("task");
    StepOutcome o = f.agent.submit_feedback("better please");
    expect_true(o.kind == StepKind::EXHAUSTED, "exhausted after three bad rounds");
    expect_eq_ll(o.attempts, 3, "attempt count");
    expect_eq_ll(static_cast<long long>(o.notes.size()), 3, "each bad round noted");
    expect_eq_ll(f.ai.calls, 4, "1 initial + 3 refinement calls, no more");
    expect_eq_ll(static_cast<long long>(f.ai.replies.size()), 1, "last reply never requested");
    expect_true(f.agent.state() == AgentState::AWAITING_TASK, "session continues");
    expect_eq_ll(static_cast<long long>(f.events.count("refinement.exhausted")), 1, "exhausted event");
    expect_eq_ll(static_cast<long long>(f.events.count("refinement.round")), 3, "three rounds");

    StepOutcome again = f.agent.submit_feedback("one more");
    expect_true(again.kind == StepKind::REJECTED, "no feedback after exhaustion");
    expect_eq_ll(f.ai.calls, 4, "still no further call");
}

static void test_clarifications_during_refinement() {
    Fixture f;
    f.ai.reply(solution("print(1)"));
    f.ai.reply("[CLARIFICATION] Which base?");
    f.ai.reply("[CLARIFICATION] Upper case?");
    f.ai.reply("[CLARIFICATION] Padding?");

    f.agent.submit_task("convert numbers");
    StepOutcome q1 = f.agent.submit_feedback("use hex");
    expect_true(q1.kind == StepKind::CLARIFICATION, "question during refinement");
    expect_eq_ll(q1.attempts, 1, "question counts as an attempt");
    expect_true(f.agent.state() == AgentState::REFINING, "still refining");

    StepOutcome q2 = f.agent.answer_clarification("16");
    expect_true(q2.kind == StepKind::CLARIFICATION, "second question");
    expect_eq_str(f.ai.prompts[2], "convert numbers\nUser feedback: use hex\nUser clarification: 16",
                  "answer appended to feedback");

    StepOutcome done = f.agent.answer_clarification("yes");
    expect_true(done.kind == StepKind::EXHAUSTED, "third question exhausts the budget");
    expect_eq_ll(f.ai.calls, 4, "bounded calls");
    expect_true(f.agent.state() == AgentState::AWAITING_TASK, "back to tasks");
}

static void test_generation_failures() {
    Fixture f;
    f.ai.fail("HTTP request failed: timeout");
    StepOutcome o = f.agent.submit_task("anything");
    expect_true(o.kind == StepKind::GENERATION_FAILED, "failure reported");
    expect_eq_str(o.message, "HTTP request failed: timeout", "error text");
    expect_true(f.agent.state() == AgentState::AWAITING_TASK, "ready for another task");
    expect_eq_ll(static_cast<long long>(f.events.count("generation.failed")), 1, "failure event");

    f.ai.throw_next = true;
    StepOutcome t = f.agent.submit_task("again");
    expect_true(t.kind == StepKind::GENERATION_FAILED, "provider exception contained");
    expect_true(t.message.find("connection reset") != std::string::npos, "exception text");

    // failures during refinement count toward the bound
    f.ai.reply(solution("print(1)"));
    f.ai.fail("503");
    f.ai.fail("503");
    f.ai.reply(solution("print(3)"));
    f.agent.submit_task("third");
    StepOutcome r = f.agent.submit_feedback("tweak");
    expect_true(r.kind == StepKind::SOLUTION && r.improved, "recovered on the third round");
    expect_eq_ll(r.attempts, 2, "two failed rounds counted");
    expect_eq_ll(static_cast<long long>(r.notes.size()), 2, "failures noted");
}

static void test_state_guards() {
    AgentConfig cfg;
    cfg.max_refinement_attempts = 1;
    Fixture f(cfg);

    expect_true(f.agent.submit_feedback("x").kind == StepKind::REJECTED, "feedback before task");
    expect_true(f.agent.answer_clarification("x").kind == StepKind::REJECTED, "answer before question");
    expect_true(f.agent.submit_task("  ").kind == StepKind::IDLE, "blank task ignored");
    expect_eq_ll(f.ai.calls, 0, "no calls for rejected input");

    f.ai.reply(solution("print(1)"));
    f.agent.submit_task("t");
    expect_true(f.agent.submit_task("other").kind == StepKind::REJECTED, "task while awaiting feedback");

    f.ai.reply("junk");
    StepOutcome o = f.agent.submit_feedback("fb");
    expect_true(o.kind == StepKind::EXHAUSTED, "bound of one");
    expect_eq_ll(f.ai.calls, 2, "single refinement call");

    f.ai.reply("[CLARIFICATION] ?");
    f.agent.submit_task("t2");
    f.agent.reset_task();
    expect_true(f.agent.state() == AgentState::AWAITING_TASK, "reset abandons the task");

    StepOutcome q = f.agent.quit();
    expect_true(q.kind == StepKind::TERMINATED, "quit");
    expect_true(f.agent.state() == AgentState::TERMINAL, "terminal");
    expect_true(f.agent.submit_task("late").kind == StepKind::REJECTED, "nothing after quit");
    f.agent.reset_task();
    expect_true(f.agent.state() == AgentState::TERMINAL, "reset does not leave terminal");
}

int main() {
    std::cerr << "test_agent: first round...\n";
    test_direct_solution();
    test_clarification_then_solution();
    test_second_clarification_is_not_looped();
    test_malformed_first_reply();

    std::cerr << "test_agent: refinement...\n";
    test_feedback_improves_solution();
    test_refinement_blocked_code();
    test_exhaustion_stops_generation();
    test_clarifications_during_refinement();

    std::cerr << "test_agent: failures and guards...\n";
    test_generation_failures();
    test_state_guards();

    PythonRuntime::instance().shutdown();
    std::cerr << "test_agent: ALL PASSED\n";
    return 0;
}
