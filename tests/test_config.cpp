#include "test_common.h"
#include <codegate/core/agent.hpp>
#include <codegate/core/config.hpp>
#include <codegate/core/policy.hpp>
#include <codegate/core/sandbox.hpp>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <unistd.h>

using namespace codegate;

static std::string write_temp(const std::string& contents) {
    char path[] = "/tmp/codegate-test-XXXXXX";
    int fd = mkstemp(path);
    expect_true(fd >= 0, "mkstemp");
    ssize_t n = write(fd, contents.data(), contents.size());
    expect_eq_ll(static_cast<long long>(n), static_cast<long long>(contents.size()), "write temp file");
    close(fd);
    return path;
}

static void test_dotted_lookup() {
    Config cfg;
    expect_true(cfg.load_string(R"({
        "log_level": "debug",
        "openai": {"model": "gpt-4o", "timeout": 30},
        "sandbox": {"timeout": 2.5, "interpreter_args": ["-I", 7, "-B"]},
        "flag": true
    })"), "load_string");

    expect_eq_str(cfg.get_string("openai.model", "x"), "gpt-4o", "nested string");
    expect_eq_ll(cfg.get_int("openai.timeout", 0), 30, "nested int");
    expect_true(cfg.get_double("sandbox.timeout", 0.0) == 2.5, "nested double");
    expect_true(cfg.get_bool("flag", false), "bool");
    expect_true(cfg.has("openai"), "has object");
    expect_true(!cfg.has("openai.api_key"), "missing key");

    // wrong type or missing -> default
    expect_eq_str(cfg.get_string("openai.timeout", "dflt"), "dflt", "int read as string gives default");
    expect_eq_ll(cfg.get_int("log_level", 9), 9, "string read as int gives default");
    expect_eq_str(cfg.get_string("log_level.deeper", "d"), "d", "path through a scalar");

    std::vector<std::string> args = cfg.get_string_array("sandbox.interpreter_args",
                                                         std::vector<std::string>());
    expect_eq_ll(static_cast<long long>(args.size()), 2, "non-string array items skipped");
    expect_eq_str(args[1], "-B", "array order kept");
}

static void test_invalid_json_keeps_previous() {
    Config cfg;
    expect_true(cfg.load_string(R"({"a": {"b": "1"}})"), "first load");
    expect_true(!cfg.load_string("{ not json"), "invalid JSON rejected");
    expect_true(!cfg.error().empty(), "error reported");
    expect_eq_str(cfg.get_string("a.b", ""), "1", "previous contents kept");
    expect_true(!cfg.load_string("[1, 2]"), "non-object rejected");
    expect_true(!cfg.load_file("/nonexistent/codegate/config.json"), "missing file");
}

static void test_policy_from_config() {
    Config empty;
    Policy p = Policy::from_config(empty);
    expect_eq_ll(p.timeout_ms(), 5000, "default timeout");
    expect_eq_ll(static_cast<long long>(p.denied_modules().size()), 3, "default denied set");
    expect_true(p.is_denied("os") && p.is_denied("sys") && p.is_denied("subprocess"), "defaults denied");
    expect_true(p.is_denied("os.path"), "submodule denied by first segment");
    expect_true(!p.is_denied("osx"), "prefix of a name is not a match");
    expect_true(!p.is_denied(""), "empty module never denied");
    expect_true(p.allowed_functions().empty(), "allow-list empty");

    Config cfg;
    expect_true(cfg.load_string(R"({"sandbox": {"timeout": 0.5,
        "denied_modules": ["socket", "ctypes"], "allowed_functions": ["print"]}})"), "policy config");
    Policy q = Policy::from_config(cfg);
    expect_eq_ll(q.timeout_ms(), 500, "fractional seconds");
    expect_true(q.is_denied("socket") && q.is_denied("ctypes.util"), "configured denied");
    expect_true(!q.is_denied("os"), "configured list replaces defaults");
    expect_eq_ll(static_cast<long long>(q.allowed_functions().count("print")), 1, "allow-list carried");

    Config bad;
    expect_true(bad.load_string(R"({"sandbox": {"timeout": -3}})"), "bad timeout config");
    expect_eq_ll(Policy::from_config(bad).timeout_ms(), 5000, "non-positive timeout falls back");

    Config huge;
    expect_true(huge.load_string(R"({"sandbox": {"timeout": 1e7}})"), "huge timeout config");
    expect_eq_ll(Policy::from_config(huge).timeout_ms(), Policy::MAX_TIMEOUT_MS, "huge timeout is clamped");
    expect_eq_ll(Policy(std::set<std::string>(), 0).timeout_ms(), 5000, "constructor falls back");
}

static void test_component_configs() {
    Config cfg;
    expect_true(cfg.load_string(R"({
        "sandbox": {"interpreter": "python3.11", "interpreter_args": ["-I"],
                    "temp_dir": "/var/tmp", "max_output_bytes": 4096},
        "agent": {"max_refinement_attempts": 5, "max_tokens": 800},
        "system_prompt": "Be brief."
    })"), "component config");

    SandboxConfig sc = SandboxConfig::from_config(cfg);
    expect_eq_str(sc.interpreter, "python3.11", "interpreter");
    expect_eq_ll(static_cast<long long>(sc.interpreter_args.size()), 1, "interpreter args");
    expect_eq_str(sc.temp_dir, "/var/tmp", "temp dir");
    expect_eq_ll(static_cast<long long>(sc.max_output_bytes), 4096, "output cap");

    AgentConfig ac = AgentConfig::from_config(cfg);
    expect_eq_ll(ac.max_refinement_attempts, 5, "refinement attempts");
    expect_eq_ll(ac.max_tokens, 800, "max tokens");
    expect_eq_str(ac.system_prompt, "Be brief.", "system prompt override");

    AgentConfig dflt = AgentConfig::from_config(Config());
    expect_eq_ll(dflt.max_refinement_attempts, 3, "default attempts");
    expect_eq_ll(dflt.max_tokens, 1500, "default tokens");
    expect_true(dflt.system_prompt.find("[CLARIFICATION]") != std::string::npos, "default prompt format");

    SandboxConfig sdflt = SandboxConfig::from_config(Config());
    expect_eq_str(sdflt.interpreter, "python3", "default interpreter");
    expect_eq_ll(static_cast<long long>(sdflt.max_output_bytes), 1024 * 1024, "default cap");
}

static void test_dotenv() {
    unsetenv("CODEGATE_TEST_A");
    unsetenv("CODEGATE_TEST_B");
    unsetenv("CODEGATE_TEST_C");
    setenv("CODEGATE_TEST_KEEP", "original", 1);

    std::string path = write_temp(
        "# comment\n"
        "\n"
        "CODEGATE_TEST_A=plain\n"
        "export CODEGATE_TEST_B=\"double quoted\"\n"
        "CODEGATE_TEST_C = 'single'\n"
        "CODEGATE_TEST_KEEP=replaced\n"
        "not a pair\n");

    int exported = load_dotenv(path);
    expect_eq_ll(exported, 3, "three variables exported");
    expect_eq_str(getenv("CODEGATE_TEST_A"), "plain", "plain value");
    expect_eq_str(getenv("CODEGATE_TEST_B"), "double quoted", "export prefix and quotes");
    expect_eq_str(getenv("CODEGATE_TEST_C"), "single", "single quotes, spaces around =");
    expect_eq_str(getenv("CODEGATE_TEST_KEEP"), "original", "existing variable not overridden");

    expect_eq_ll(load_dotenv("/nonexistent/.env"), -1, "missing file");

    std::remove(path.c_str());
    unsetenv("CODEGATE_TEST_A");
    unsetenv("CODEGATE_TEST_B");
    unsetenv("CODEGATE_TEST_C");
    unsetenv("CODEGATE_TEST_KEEP");
}

static void test_load_file() {
    std::string path = write_temp(R"({"openai": {"api_url": "http://localhost:8080/v1"}})");
    Config cfg;
    expect_true(cfg.load_file(path), "load_file");
    expect_eq_str(cfg.get_string("openai.api_url", ""), "http://localhost:8080/v1", "file value");
    std::remove(path.c_str());
}

int main() {
    std::cerr << "test_config: Config...\n";
    test_dotted_lookup();
    test_invalid_json_keeps_previous();
    test_load_file();

    std::cerr << "test_config: Policy / SandboxConfig / AgentConfig...\n";
    test_policy_from_config();
    test_component_configs();

    std::cerr << "test_config: .env...\n";
    test_dotenv();

    std::cerr << "test_config: ALL PASSED\n";
    return 0;
}
