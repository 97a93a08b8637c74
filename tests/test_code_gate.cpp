#include "test_common.h"
#include <codegate/core/code_gate.hpp>
#include <codegate/core/events.hpp>
#include <codegate/core/python_runtime.hpp>
#include <string>

using namespace codegate;

static void test_blocked_code_never_executes() {
    RecordingEventSink events;
    Policy policy;
    CodeValidator validator;
    SandboxExecutor executor(SandboxConfig(), &events);
    CodeGate gate(policy, validator, executor, &events);

    ExecutionResult r = gate.run("import os\nprint(os.listdir('/'))\n");
    expect_true(r.status == ExecStatus::BLOCKED, "denied import is blocked");
    expect_eq_str(r.reason, "denied import: os", "block reason");
    expect_eq_str(r.describe(), "Code blocked due to security restrictions (denied import: os)",
                  "blocked display");
    expect_true(r.artifact_path.empty(), "nothing written for blocked code");
    expect_eq_ll(static_cast<long long>(events.count("validation.rejected")), 1, "rejected event");
    expect_eq_ll(static_cast<long long>(events.count("execution.finished")), 0, "executor not invoked");

    std::vector<RecordingEventSink::Entry> entries = events.entries();
    expect_eq_str(entries[0].fields["module"].get<std::string>(), "os", "module in event");
}

static void test_unparseable_is_blocked() {
    RecordingEventSink events;
    Policy policy;
    CodeValidator validator;
    SandboxExecutor executor(SandboxConfig(), &events);
    CodeGate gate(policy, validator, executor, &events);

    ExecutionResult r = gate.run("print('unterminated)\n");
    expect_true(r.status == ExecStatus::BLOCKED, "syntax error is blocked");
    expect_eq_str(r.reason, "unparseable", "unparseable reason");
    expect_eq_ll(static_cast<long long>(events.count("execution.finished")), 0, "not executed");

    std::vector<RecordingEventSink::Entry> entries = events.entries();
    expect_true(entries[0].fields.contains("detail"), "parser detail in event");
}

static void test_safe_code_runs() {
    RecordingEventSink events;
    Policy policy;
    CodeValidator validator;
    SandboxExecutor executor(SandboxConfig(), &events);
    CodeGate gate(policy, validator, executor, &events);

    ExecutionResult r = gate.run("print(sum(range(10)))");
    expect_true(r.ok(), "safe code runs");
    expect_eq_str(r.output, "45\n", "output");

    std::vector<RecordingEventSink::Entry> entries = events.entries();
    expect_eq_ll(static_cast<long long>(entries.size()), 2, "two events");
    expect_eq_str(entries[0].name, "validation.passed", "validation precedes execution");
    expect_eq_str(entries[1].name, "execution.finished", "execution after validation");
}

static void test_each_run_revalidates() {
    RecordingEventSink events;
    Policy policy;
    CodeValidator validator;
    SandboxExecutor executor(SandboxConfig(), &events);
    CodeGate gate(policy, validator, executor, &events);

    expect_true(gate.run("print(1)").ok(), "first round");
    expect_true(gate.run("import subprocess").status == ExecStatus::BLOCKED, "second round blocked");
    expect_true(gate.run("print(1)").ok(), "third round");
    expect_eq_ll(static_cast<long long>(events.count("validation.passed")), 2, "validated every time");
    expect_eq_ll(static_cast<long long>(events.count("validation.rejected")), 1, "one rejection");
    expect_eq_ll(static_cast<long long>(events.count("execution.finished")), 2, "only safe code ran");
}

static void test_policy_timeout_applies() {
    Policy policy(Policy().denied_modules(), 500);
    CodeValidator validator;
    SandboxExecutor executor;
    CodeGate gate(policy, validator, executor);
    expect_eq_ll(gate.policy().timeout_ms(), 500, "gate keeps its policy");

    ExecutionResult r = gate.run("while True:\n    pass\n");
    expect_true(r.status == ExecStatus::TIMED_OUT, "busy loop times out");
}

int main() {
    std::cerr << "test_code_gate: rejection...\n";
    test_blocked_code_never_executes();
    test_unparseable_is_blocked();

    std::cerr << "test_code_gate: execution...\n";
    test_safe_code_runs();
    test_each_run_revalidates();
    test_policy_timeout_applies();

    PythonRuntime::instance().shutdown();
    std::cerr << "test_code_gate: ALL PASSED\n";
    return 0;
}
