/*
 * codegate - AI Provider Interface
 *
 * Text-completion boundary used by the agent. A provider takes a system
 * instruction, a user prompt and a token budget and returns one reply.
 */
#ifndef codegate_AI_AI_HPP
#define codegate_AI_AI_HPP

#include <codegate/core/types.hpp>
#include <string>
#include <vector>

namespace codegate {

class Config;

enum class MessageRole {
    SYSTEM,
    USER,
    ASSISTANT
};

std::string role_to_string(MessageRole role);
MessageRole string_to_role(const std::string& str);

struct ConversationMessage {
    MessageRole role;
    std::string content;

    ConversationMessage() : role(MessageRole::USER) {}
    ConversationMessage(MessageRole r, const std::string& c) : role(r), content(c) {}

    static ConversationMessage system(const std::string& content) {
        return ConversationMessage(MessageRole::SYSTEM, content);
    }
    static ConversationMessage user(const std::string& content) {
        return ConversationMessage(MessageRole::USER, content);
    }
    static ConversationMessage assistant(const std::string& content) {
        return ConversationMessage(MessageRole::ASSISTANT, content);
    }
};

struct CompletionOptions {
    std::string system_prompt;
    std::string model;          // empty: provider default
    double temperature;         // negative: provider default
    int max_tokens;             // 0: provider default

    CompletionOptions() : temperature(-1.0), max_tokens(0) {}
};

struct CompletionUsage {
    int64_t prompt_tokens;
    int64_t completion_tokens;
    int64_t total_tokens;

    CompletionUsage() : prompt_tokens(0), completion_tokens(0), total_tokens(0) {}
};

struct CompletionResult {
    bool success;
    std::string content;
    std::string error;
    std::string model;
    std::string stop_reason;
    CompletionUsage usage;

    CompletionResult() : success(false) {}

    static CompletionResult ok(const std::string& content) {
        CompletionResult r;
        r.success = true;
        r.content = content;
        return r;
    }

    static CompletionResult fail(const std::string& error) {
        CompletionResult r;
        r.success = false;
        r.error = error;
        return r;
    }
};

class AIPlugin {
public:
    virtual ~AIPlugin() {}

    virtual const char* name() const = 0;

    virtual bool init(const Config& cfg) = 0;
    virtual void shutdown() = 0;
    virtual bool is_initialized() const = 0;

    virtual std::string provider_id() const = 0;
    virtual std::string default_model() const = 0;
    virtual bool is_configured() const = 0;

    // Single prompt; opts.system_prompt is sent as the system message
    virtual CompletionResult complete(const std::string& prompt,
                                      const CompletionOptions& opts = CompletionOptions()) = 0;

    virtual CompletionResult chat(const std::vector<ConversationMessage>& messages,
                                  const CompletionOptions& opts = CompletionOptions()) = 0;
};

} // namespace codegate

#endif // codegate_AI_AI_HPP
