/*
 * codegate - OpenAI Provider
 *
 * OpenAI-compatible chat completions (POST <api_url>/chat/completions).
 *
 * Config:
 *   OPENAI_API_KEY       - API key (environment, takes precedence)
 *   openai.api_key       - API key (config file fallback)
 *   openai.model         - Default model (optional, defaults to gpt-4)
 *   openai.api_url       - API base URL (optional, defaults to https://api.openai.com/v1)
 *   openai.timeout       - Request timeout in seconds (optional, defaults to 120)
 *   openai.temperature   - Sampling temperature (optional, defaults to 0.3)
 */
#ifndef codegate_PLUGINS_OPENAI_HPP
#define codegate_PLUGINS_OPENAI_HPP

#include <codegate/ai/ai.hpp>
#include <string>
#include <vector>

namespace codegate {

class OpenAIProvider : public AIPlugin {
public:
    OpenAIProvider();

    const char* name() const override;

    bool init(const Config& cfg) override;
    void shutdown() override;
    bool is_initialized() const override;

    std::string provider_id() const override;
    std::string default_model() const override;
    bool is_configured() const override;

    CompletionResult complete(const std::string& prompt,
                              const CompletionOptions& opts = CompletionOptions()) override;

    CompletionResult chat(const std::vector<ConversationMessage>& messages,
                          const CompletionOptions& opts = CompletionOptions()) override;

    // Credential lookup shared with the application's startup check
    static std::string resolve_api_key(const Config& cfg);

    // Request body for a chat call (exposed for tests)
    Json build_request(const std::vector<ConversationMessage>& messages,
                       const CompletionOptions& opts) const;

    // Decode a chat completions response body
    static CompletionResult parse_response(int status_code, const std::string& body);

private:
    std::string api_key_;
    std::string default_model_;
    std::string api_url_;
    long timeout_secs_;
    double default_temperature_;
    bool initialized_;
};

} // namespace codegate

#endif // codegate_PLUGINS_OPENAI_HPP
