/*
 * codegate - Execution Policy
 *
 * Immutable rules shared by the validator and the sandbox executor:
 * the denied top-level modules, the wall-clock execution budget and a
 * reserved allow-list of function names (carried, not yet enforced).
 *
 * Config:
 *   sandbox.denied_modules     - array of module names (default ["os","sys","subprocess"])
 *   sandbox.allowed_functions  - array of function names (default [])
 *   sandbox.timeout            - seconds (default 5)
 */
#ifndef codegate_CORE_POLICY_HPP
#define codegate_CORE_POLICY_HPP

#include <set>
#include <string>

namespace codegate {

class Config;

class Policy {
public:
    static constexpr int DEFAULT_TIMEOUT_MS = 5000;
    static constexpr int MAX_TIMEOUT_MS = 24 * 60 * 60 * 1000;

    // os / sys / subprocess, 5 second budget
    Policy();

    Policy(const std::set<std::string>& denied_modules,
           int timeout_ms,
           const std::set<std::string>& allowed_functions = std::set<std::string>());

    static Policy from_config(const Config& cfg);

    const std::set<std::string>& denied_modules() const { return denied_modules_; }
    const std::set<std::string>& allowed_functions() const { return allowed_functions_; }
    int timeout_ms() const { return timeout_ms_; }

    // True if the first dotted segment of `module` is denied.
    // An empty module name is never denied.
    bool is_denied(const std::string& module) const;

private:
    std::set<std::string> denied_modules_;
    std::set<std::string> allowed_functions_;
    int timeout_ms_;
};

} // namespace codegate

#endif // codegate_CORE_POLICY_HPP
