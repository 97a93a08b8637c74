/*
 * codegate - Code Safety Validator
 *
 * Static gate in front of the sandbox. Candidate code is parsed into a
 * syntax tree and every `import a.b` / `from a.b import c` is checked
 * against Policy::denied_modules() by its first dotted segment.
 * Anything that does not parse is rejected.
 *
 * This is a best-effort gate. It does not see __import__(), importlib,
 * reflection, or a denied module reached through an allowed one.
 */
#ifndef codegate_CORE_VALIDATOR_HPP
#define codegate_CORE_VALIDATOR_HPP

#include "policy.hpp"
#include <string>

namespace codegate {

// Code text that has passed validation. Only CodeValidator can produce
// a valid instance, and SandboxExecutor accepts nothing else.
class ValidatedCode {
public:
    ValidatedCode() : valid_(false) {}

    bool valid() const { return valid_; }
    const std::string& text() const { return text_; }

private:
    friend class CodeValidator;
    explicit ValidatedCode(const std::string& text) : text_(text), valid_(true) {}

    std::string text_;
    bool valid_;
};

struct ValidationOutcome {
    bool safe;
    std::string reason;     // why it was rejected (empty when safe)
    std::string module;     // offending module for a denied import
    std::string detail;     // parser message for unparseable code
    ValidatedCode code;     // valid() only when safe

    ValidationOutcome() : safe(false) {}
};

class CodeValidator {
public:
    static const char* const REASON_UNPARSEABLE;
    static const char* const REASON_PARSER_UNAVAILABLE;
    static const char* const REASON_ANALYSIS_FAILED;

    // Deterministic and side-effect free; safe to call from several threads
    ValidationOutcome validate(const std::string& code, const Policy& policy) const;

private:
    static ValidationOutcome reject(const std::string& reason, const std::string& module = "");
};

} // namespace codegate

#endif // codegate_CORE_VALIDATOR_HPP
