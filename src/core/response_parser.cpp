#include <codegate/core/response_parser.hpp>
#include <codegate/core/utils.hpp>

namespace codegate {

const char* const ResponseParser::CLARIFICATION_MARKER = "[CLARIFICATION]";
const char* const ResponseParser::CODE_MARKER = "[CODE]";
const char* const ResponseParser::EXPLANATION_MARKER = "[EXPLANATION]";
const char* const ResponseParser::NOTE_NO_CODE = "No code generated";
const char* const ResponseParser::NOTE_INVALID_FORMAT = "Invalid code format";

namespace {
const std::string FENCE = "```";
// Only Python is validated and executed, so only Python fences are accepted
const std::string CODE_FENCE = "```python";
}

const char* response_kind_name(ResponseKind kind) {
    switch (kind) {
        case ResponseKind::CLARIFICATION: return "clarification";
        case ResponseKind::SOLUTION: return "solution";
        case ResponseKind::MALFORMED: return "malformed";
        default: return "unknown";
    }
}

ParsedResponse ParsedResponse::malformed(const std::string& raw, const std::string& note) {
    ParsedResponse r;
    r.kind = ResponseKind::MALFORMED;
    r.raw = raw;
    r.note = note;
    return r;
}

ParsedResponse ResponseParser::parse(const std::string& reply) const {
    const std::string clarification(CLARIFICATION_MARKER);
    const std::string code_marker(CODE_MARKER);
    const std::string explanation_marker(EXPLANATION_MARKER);

    // Clarification wins over everything else in the reply
    size_t marker = reply.find(clarification);
    if (marker != std::string::npos) {
        size_t bracket = reply.find(']', marker);
        ParsedResponse r;
        r.kind = ResponseKind::CLARIFICATION;
        r.raw = reply;
        r.question = trim(reply.substr(bracket + 1));
        return r;
    }

    size_t code_start = reply.find(code_marker);
    if (code_start == std::string::npos) {
        return ParsedResponse::malformed(reply, NOTE_NO_CODE);
    }
    code_start += code_marker.size();

    size_t code_end = reply.find(explanation_marker, code_start);
    if (code_end == std::string::npos) {
        return ParsedResponse::malformed(reply, NOTE_NO_CODE);
    }

    size_t last_explanation = reply.rfind(explanation_marker);
    std::string explanation = trim(reply.substr(last_explanation + explanation_marker.size()));

    std::string span = reply.substr(code_start, code_end - code_start);
    size_t fence_start = span.find(CODE_FENCE);
    size_t body_start = fence_start == std::string::npos ? std::string::npos : fence_start + CODE_FENCE.size();
    size_t fence_end = body_start == std::string::npos ? std::string::npos : span.find(FENCE, body_start);
    if (fence_end == std::string::npos) {
        ParsedResponse r = ParsedResponse::malformed(reply, NOTE_INVALID_FORMAT);
        r.explanation = explanation;
        return r;
    }

    ParsedResponse r;
    r.kind = ResponseKind::SOLUTION;
    r.raw = reply;
    r.code = trim(span.substr(body_start, fence_end - body_start));
    r.explanation = explanation;
    return r;
}

} // namespace codegate
