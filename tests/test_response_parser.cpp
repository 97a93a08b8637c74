#include "test_common.h"
#include <codegate/core/response_parser.hpp>
#include <string>

using namespace codegate;

static void test_clarification() {
    ResponseParser parser;
    ParsedResponse r = parser.parse("[CLARIFICATION] What language?");
    expect_true(r.is_clarification(), "clarification kind");
    expect_eq_str(r.question, "What language?", "question text trimmed");

    // Clarification wins even when code markers are present
    ParsedResponse mixed = parser.parse(
        "Some preamble\n[CLARIFICATION]\n  Which input format?  \n[CODE]\n```python\nprint(1)\n```\n[EXPLANATION] x");
    expect_true(mixed.is_clarification(), "clarification takes precedence");
    expect_true(mixed.question.find("Which input format?") == 0, "question starts after marker");
    expect_true(mixed.code.empty(), "no code for clarification");
}

static void test_solution() {
    ResponseParser parser;
    std::string code = "def add(a, b):\n    return a + b\n\nprint(add(2, 3))";
    std::string reply =
        "[CODE]\n"
        "```python\n" + code + "\n```\n"
        "[EXPLANATION]\n"
        "  Adds two numbers.  \n";

    ParsedResponse r = parser.parse(reply);
    expect_true(r.is_solution(), "solution kind");
    expect_eq_str(r.code, code, "inner block reproduced exactly");
    expect_eq_str(r.explanation, "Adds two numbers.", "explanation trimmed");
    expect_eq_str(r.raw, reply, "raw kept");
    expect_true(r.note.empty(), "no note on success");
}

static void test_solution_keeps_inner_indentation() {
    ResponseParser parser;
    ParsedResponse r = parser.parse(
        "[CODE]```python\nfor i in range(2):\n    print(i)\n```[EXPLANATION]loop");
    expect_true(r.is_solution(), "compact markers");
    expect_eq_str(r.code, "for i in range(2):\n    print(i)", "indentation inside kept");
    expect_eq_str(r.explanation, "loop", "explanation without whitespace");
}

static void test_no_code_section() {
    ResponseParser parser;
    ParsedResponse r = parser.parse("Sure! Here is some prose and nothing else.");
    expect_true(r.is_malformed(), "prose is malformed");
    expect_eq_str(r.note, "No code generated", "no code note");
    expect_true(r.explanation.empty(), "no explanation for missing code");

    ParsedResponse only_code = parser.parse("[CODE]\n```python\nprint(1)\n```\n");
    expect_true(only_code.is_malformed(), "code marker without explanation marker");
    expect_eq_str(only_code.note, "No code generated", "span needs both markers");

    ParsedResponse reversed = parser.parse("[EXPLANATION] text [CODE] ```python\nprint(1)\n```");
    expect_true(reversed.is_malformed(), "explanation before code");

    ParsedResponse empty = parser.parse("");
    expect_true(empty.is_malformed(), "empty reply");
}

static void test_invalid_code_format() {
    ResponseParser parser;
    ParsedResponse r = parser.parse("[CODE]\nprint('no fence')\n[EXPLANATION]\nForgot the fence.");
    expect_true(r.is_malformed(), "missing fence is malformed");
    expect_eq_str(r.note, "Invalid code format", "invalid format note");
    expect_eq_str(r.explanation, "Forgot the fence.", "explanation still populated");

    ParsedResponse unclosed = parser.parse("[CODE]\n```python\nprint(1)\n[EXPLANATION]\nx");
    expect_true(unclosed.is_malformed(), "unclosed fence inside span");
    expect_eq_str(unclosed.note, "Invalid code format", "unclosed fence note");

    ParsedResponse other_lang = parser.parse("[CODE]\n```js\nconsole.log(1)\n```\n[EXPLANATION]\nx");
    expect_eq_str(other_lang.note, "Invalid code format", "other language tag not accepted");
}

static void test_multiple_explanations() {
    ResponseParser parser;
    ParsedResponse r = parser.parse(
        "[CODE]\n```python\nprint('a')\n```\n[EXPLANATION]\nfirst\n[EXPLANATION]\nsecond");
    expect_true(r.is_solution(), "solution with two explanation markers");
    expect_eq_str(r.code, "print('a')", "span ends at first explanation marker");
    expect_eq_str(r.explanation, "second", "explanation after the last marker");
}

static void test_only_python_fences() {
    ResponseParser parser;
    ParsedResponse r = parser.parse("[CODE]\n```bash\necho hi\n```\n[EXPLANATION]\nshell");
    expect_true(r.is_malformed(), "shell fence is not runnable code");
    expect_eq_str(r.note, "Invalid code format", "shell fence note");
    expect_eq_str(r.explanation, "shell", "explanation kept for shell fence");

    expect_eq_str(response_kind_name(ResponseKind::SOLUTION), "solution", "kind name");
}

int main() {
    std::cerr << "test_response_parser: well-formed replies...\n";
    test_clarification();
    test_solution();
    test_solution_keeps_inner_indentation();
    test_multiple_explanations();
    test_only_python_fences();

    std::cerr << "test_response_parser: malformed replies...\n";
    test_no_code_section();
    test_invalid_code_format();

    std::cerr << "test_response_parser: ALL PASSED\n";
    return 0;
}
