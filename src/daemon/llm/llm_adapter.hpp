#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <vector>

// Typed reply to an enrichment prompt.
struct LlmEnrichment {
    std::string refined_text;
    std::string translation;
    bool is_keyword_match = false;
    std::vector<std::string> matched_keywords;
    std::string match_reason;
    bool is_continuation = false;
    std::string continuation_reason;
};

struct SessionSummary {
    std::string scene;
    std::string topic;
    std::vector<std::string> key_points;
    std::string summary;
};

enum class LlmErrorKind {
    Unavailable, // not configured (no endpoint, missing API key)
    Transport,   // connection failure
    Timeout,
    Http,        // non-2xx status
    ParseError,  // reply was not the expected JSON shape
};

struct LlmError {
    LlmErrorKind kind;
    std::string message;
};

inline std::string_view llm_error_kind_name(LlmErrorKind kind) {
    switch (kind) {
        case LlmErrorKind::Unavailable: return "unavailable";
        case LlmErrorKind::Transport: return "transport";
        case LlmErrorKind::Timeout: return "timeout";
        case LlmErrorKind::Http: return "http";
        case LlmErrorKind::ParseError: return "parse error";
    }
    return "unknown";
}

// Inference backend for refinement, translation and summaries. Implementations
// are called from worker threads and must be safe for concurrent use.
class LlmAdapter {
public:
    virtual ~LlmAdapter() = default;
    virtual bool available() const = 0;
    virtual std::expected<LlmEnrichment, LlmError> enrich(const std::string& prompt) = 0;
    virtual std::expected<SessionSummary, LlmError> summarize(const std::string& prompt) = 0;
};
