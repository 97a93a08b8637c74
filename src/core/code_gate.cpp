#include <codegate/core/code_gate.hpp>
#include <codegate/core/events.hpp>
#include <codegate/core/logger.hpp>

namespace codegate {

CodeGate::CodeGate(const Policy& policy,
                   const CodeValidator& validator,
                   const SandboxExecutor& executor,
                   EventSink* events)
    : policy_(policy)
    , validator_(validator)
    , executor_(executor)
    , events_(events)
{}

ExecutionResult CodeGate::run(const std::string& code) const {
    ValidationOutcome outcome = validator_.validate(code, policy_);

    if (!outcome.safe) {
        LOG_WARN("[CodeGate] Code blocked: %s", outcome.reason.c_str());
        if (!outcome.detail.empty()) {
            LOG_DEBUG("[CodeGate] Parser said: %s", outcome.detail.c_str());
        }
        if (events_) {
            Json fields = Json::object();
            fields["reason"] = outcome.reason;
            if (!outcome.module.empty()) fields["module"] = outcome.module;
            if (!outcome.detail.empty()) fields["detail"] = outcome.detail;
            events_->emit("validation.rejected", fields);
        }
        return ExecutionResult::blocked(outcome.reason);
    }

    if (events_) {
        Json fields = Json::object();
        fields["code_bytes"] = code.size();
        events_->emit("validation.passed", fields);
    }

    return executor_.execute(outcome.code, policy_);
}

} // namespace codegate
