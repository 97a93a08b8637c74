#include <codegate/plugins/openai/openai.hpp>
#include <codegate/core/config.hpp>
#include <codegate/core/http_client.hpp>
#include <codegate/core/logger.hpp>
#include <codegate/core/utils.hpp>
#include <cstdlib>
#include <map>

namespace codegate {

OpenAIProvider::OpenAIProvider()
    : api_key_()
    , default_model_("gpt-4")
    , api_url_("https://api.openai.com/v1")
    , timeout_secs_(120)
    , default_temperature_(0.3)
    , initialized_(false)
{}

const char* OpenAIProvider::name() const { return "OpenAI"; }

std::string OpenAIProvider::resolve_api_key(const Config& cfg) {
    const char* env = getenv("OPENAI_API_KEY");
    if (env && *env) {
        return trim(env);
    }
    return trim(cfg.get_string("openai.api_key", ""));
}

bool OpenAIProvider::init(const Config& cfg) {
    api_key_ = resolve_api_key(cfg);

    std::string model = cfg.get_string("openai.model", "");
    if (!model.empty()) {
        default_model_ = model;
    }

    std::string url = cfg.get_string("openai.api_url", "");
    if (!url.empty()) {
        api_url_ = url;
    }

    // Remove trailing slash from URL
    while (!api_url_.empty() && api_url_[api_url_.length() - 1] == '/') {
        api_url_ = api_url_.substr(0, api_url_.length() - 1);
    }

    int64_t timeout = cfg.get_int("openai.timeout", timeout_secs_);
    if (timeout > 0) {
        timeout_secs_ = static_cast<long>(timeout);
    }
    default_temperature_ = cfg.get_double("openai.temperature", default_temperature_);

    if (api_key_.empty()) {
        LOG_WARN("[OpenAI] No API key configured (set OPENAI_API_KEY or openai.api_key)");
        initialized_ = false;
        return false;
    }

    LOG_INFO("[OpenAI] Provider initialized with model: %s", default_model_.c_str());
    initialized_ = true;
    return true;
}

void OpenAIProvider::shutdown() {
    initialized_ = false;
}

bool OpenAIProvider::is_initialized() const { return initialized_; }

std::string OpenAIProvider::provider_id() const { return "openai"; }

std::string OpenAIProvider::default_model() const { return default_model_; }

bool OpenAIProvider::is_configured() const { return !api_key_.empty(); }

CompletionResult OpenAIProvider::complete(const std::string& prompt,
                                          const CompletionOptions& opts) {
    std::vector<ConversationMessage> messages;
    messages.push_back(ConversationMessage::user(prompt));
    return chat(messages, opts);
}

Json OpenAIProvider::build_request(const std::vector<ConversationMessage>& messages,
                                   const CompletionOptions& opts) const {
    Json request = Json::object();
    request["model"] = opts.model.empty() ? default_model_ : opts.model;

    Json msgs = Json::array();
    if (!opts.system_prompt.empty()) {
        Json sys_msg = Json::object();
        sys_msg["role"] = "system";
        sys_msg["content"] = sanitize_utf8(opts.system_prompt);
        msgs.push_back(sys_msg);
    }

    for (size_t i = 0; i < messages.size(); ++i) {
        const ConversationMessage& msg = messages[i];
        // An explicit system prompt replaces system messages in the list
        if (msg.role == MessageRole::SYSTEM && !opts.system_prompt.empty()) {
            continue;
        }
        Json m = Json::object();
        m["role"] = role_to_string(msg.role);
        m["content"] = sanitize_utf8(msg.content);
        msgs.push_back(m);
    }
    request["messages"] = msgs;

    request["temperature"] = opts.temperature >= 0.0 ? opts.temperature : default_temperature_;
    if (opts.max_tokens > 0) {
        request["max_tokens"] = static_cast<int64_t>(opts.max_tokens);
    }
    return request;
}

CompletionResult OpenAIProvider::parse_response(int status_code, const std::string& body) {
    Json resp;
    try {
        resp = Json::parse(sanitize_utf8(body));
    } catch (const Json::parse_error& e) {
        if (status_code != 200) {
            return CompletionResult::fail("API error (HTTP " + std::to_string(status_code) + ")");
        }
        LOG_ERROR("[OpenAI] Failed to parse JSON response: %s", e.what());
        return CompletionResult::fail("Invalid JSON response: " + std::string(e.what()));
    }

    if (status_code != 200) {
        std::string error_msg = "API error";
        if (resp.is_object() && resp.contains("error") && resp["error"].is_object()) {
            const Json& err = resp["error"];
            std::string msg = err.value("message", std::string(""));
            // code is a string on OpenAI, a number on some compatible servers
            std::string code_str;
            if (err.contains("code")) {
                const Json& code_field = err["code"];
                if (code_field.is_string()) {
                    code_str = code_field.get<std::string>();
                } else if (code_field.is_number_integer()) {
                    code_str = std::to_string(code_field.get<int64_t>());
                }
            }
            if (!msg.empty()) {
                error_msg = code_str.empty() ? msg : (code_str + ": " + msg);
            }
        }
        return CompletionResult::fail(error_msg + " (HTTP " + std::to_string(status_code) + ")");
    }

    if (!resp.is_object() || !resp.contains("choices") || !resp["choices"].is_array() ||
        resp["choices"].empty()) {
        return CompletionResult::fail("Response contains no choices");
    }

    CompletionResult result;
    result.success = true;
    result.model = resp.value("model", std::string(""));

    const Json& first_choice = resp["choices"][0];
    if (first_choice.is_object()) {
        if (first_choice.contains("message") && first_choice["message"].is_object()) {
            const Json& message = first_choice["message"];
            if (message.contains("content") && message["content"].is_string()) {
                result.content = message["content"].get<std::string>();
            }
        }
        if (first_choice.contains("finish_reason") && first_choice["finish_reason"].is_string()) {
            result.stop_reason = first_choice["finish_reason"].get<std::string>();
        }
    }

    if (resp.contains("usage") && resp["usage"].is_object()) {
        const Json& usage = resp["usage"];
        result.usage.prompt_tokens = usage.value("prompt_tokens", static_cast<int64_t>(0));
        result.usage.completion_tokens = usage.value("completion_tokens", static_cast<int64_t>(0));
        result.usage.total_tokens = usage.value("total_tokens", static_cast<int64_t>(0));
    }

    return result;
}

CompletionResult OpenAIProvider::chat(const std::vector<ConversationMessage>& messages,
                                      const CompletionOptions& opts) {
    if (!initialized_) {
        return CompletionResult::fail("OpenAI provider not initialized");
    }

    if (messages.empty()) {
        return CompletionResult::fail("No messages provided");
    }

    Json request = build_request(messages, opts);
    std::string endpoint = api_url_ + "/chat/completions";
    std::string request_body = request.dump(-1, ' ', false, Json::error_handler_t::replace);
    LOG_DEBUG("[OpenAI] Sending request to %s (%zu bytes, model %s)",
              endpoint.c_str(), request_body.size(),
              request["model"].get<std::string>().c_str());

    HttpClient http;
    http.set_timeout(timeout_secs_);
    std::map<std::string, std::string> headers;
    headers["Content-Type"] = "application/json";
    headers["Authorization"] = "Bearer " + api_key_;

    HttpResponse response = http.post_json(endpoint, request_body, headers);

    if (response.status_code == 0) {
        LOG_ERROR("[OpenAI] HTTP request failed: %s", response.error.c_str());
        return CompletionResult::fail("HTTP request failed: " + response.error);
    }

    LOG_DEBUG("[OpenAI] Received response [HTTP %d] (%zu bytes)",
              response.status_code, response.body.size());

    CompletionResult result = parse_response(response.status_code, response.body);
    if (!result.success) {
        LOG_ERROR("[OpenAI] %s", result.error.c_str());
        return result;
    }

    LOG_DEBUG("[OpenAI] Model: %s, stop reason: %s, tokens in/out/total: %lld/%lld/%lld",
              result.model.c_str(), result.stop_reason.c_str(),
              static_cast<long long>(result.usage.prompt_tokens),
              static_cast<long long>(result.usage.completion_tokens),
              static_cast<long long>(result.usage.total_tokens));
    LOG_DEBUG("[OpenAI] Content (%zu chars): %.500s%s",
              result.content.size(), result.content.c_str(),
              result.content.size() > 500 ? "..." : "");

    return result;
}

} // namespace codegate
