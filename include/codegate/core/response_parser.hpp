/*
 * codegate - Response Parser
 *
 * Splits a generation reply into one of three shapes:
 *
 *   [CLARIFICATION] <question>
 *
 *   [CODE]
 *   ```python
 *   <code>
 *   ```
 *   [EXPLANATION]
 *   <explanation>
 *
 *   anything else  -> MALFORMED with a note for the user
 *
 * Matching is textual. Nothing here throws on odd input.
 */
#ifndef codegate_CORE_RESPONSE_PARSER_HPP
#define codegate_CORE_RESPONSE_PARSER_HPP

#include <string>

namespace codegate {

enum class ResponseKind {
    CLARIFICATION,
    SOLUTION,
    MALFORMED
};

const char* response_kind_name(ResponseKind kind);

struct ParsedResponse {
    ResponseKind kind;
    std::string question;       // CLARIFICATION
    std::string code;           // SOLUTION
    std::string explanation;    // SOLUTION, sometimes MALFORMED
    std::string note;           // MALFORMED placeholder
    std::string raw;            // reply as received

    ParsedResponse() : kind(ResponseKind::MALFORMED) {}

    bool is_clarification() const { return kind == ResponseKind::CLARIFICATION; }
    bool is_solution() const { return kind == ResponseKind::SOLUTION; }
    bool is_malformed() const { return kind == ResponseKind::MALFORMED; }

    static ParsedResponse malformed(const std::string& raw, const std::string& note);
};

class ResponseParser {
public:
    static const char* const CLARIFICATION_MARKER;
    static const char* const CODE_MARKER;
    static const char* const EXPLANATION_MARKER;
    static const char* const NOTE_NO_CODE;
    static const char* const NOTE_INVALID_FORMAT;

    ParsedResponse parse(const std::string& reply) const;
};

} // namespace codegate

#endif // codegate_CORE_RESPONSE_PARSER_HPP
