/*
 * codegate - Code Gate
 *
 * The one entry point that turns candidate code into an execution result:
 * validate against the policy, then hand the validated code to the
 * sandbox. Code the validator rejects comes back as BLOCKED and never
 * reaches the executor.
 */
#ifndef codegate_CORE_CODE_GATE_HPP
#define codegate_CORE_CODE_GATE_HPP

#include "policy.hpp"
#include "sandbox.hpp"
#include "validator.hpp"
#include <string>

namespace codegate {

class EventSink;

class CodeGate {
public:
    CodeGate(const Policy& policy,
             const CodeValidator& validator,
             const SandboxExecutor& executor,
             EventSink* events = nullptr);

    ExecutionResult run(const std::string& code) const;

    const Policy& policy() const { return policy_; }

private:
    Policy policy_;
    const CodeValidator& validator_;
    const SandboxExecutor& executor_;
    EventSink* events_;
};

} // namespace codegate

#endif // codegate_CORE_CODE_GATE_HPP
