#pragma once

#include "config.hpp"
#include "llm/llm_adapter.hpp"

#include <expected>
#include <string>
#include <string_view>

// Chat-completion client for Ollama (/api/chat) or an OpenAI-compatible
// server (/v1/chat/completions). Each request uses its own curl handle, so
// concurrent calls from the worker pool are fine.
class HttpLlmAdapter : public LlmAdapter {
public:
    explicit HttpLlmAdapter(Config::Llm config, bool verbose = false);
    ~HttpLlmAdapter() override;

    HttpLlmAdapter(const HttpLlmAdapter&) = delete;
    HttpLlmAdapter& operator=(const HttpLlmAdapter&) = delete;

    bool available() const override;
    std::expected<LlmEnrichment, LlmError> enrich(const std::string& prompt) override;
    std::expected<SessionSummary, LlmError> summarize(const std::string& prompt) override;

private:
    // Returns the assistant message content.
    std::expected<std::string, LlmError> chat(const std::string& system_prompt,
                                              const std::string& prompt);
    void log(const std::string& msg) const;

    Config::Llm config_;
    std::string api_key_;
    bool verbose_;
};

// Reply parsing, kept separate from the transport so it can be tested offline.
namespace llm {

// Removes a surrounding ```json ... ``` (or bare ```) fence, then trims.
std::string strip_code_fences(std::string_view content);

// Pulls the assistant content out of a chat-completion response body.
std::expected<std::string, LlmError> extract_content(std::string_view api_format,
                                                     const std::string& body);

std::expected<LlmEnrichment, LlmError> parse_enrichment(std::string_view content);
std::expected<SessionSummary, LlmError> parse_summary(std::string_view content);

} // namespace llm
