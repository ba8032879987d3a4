#pragma once

#include "llm/llm_adapter.hpp"
#include "summary_context.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct EnrichmentRequest {
    std::string text;
    std::string source_language;
    std::string target_language;
    std::vector<std::string> history; // most recent last
    std::vector<std::string> keywords;
};

// Always fully populated. A degraded result carries the input text unchanged,
// an empty translation, every flag false, success=false and the error.
struct EnrichmentResult {
    std::string refined_text;
    std::string translation;
    bool is_keyword_match = false;
    std::vector<std::string> matched_keywords;
    std::string match_reason;
    bool is_continuation = false;
    std::string continuation_reason;
    bool context_enhanced = false;
    bool success = false;
    std::optional<std::string> error;

    static EnrichmentResult degraded(const std::string& text, std::string error);
};

// Turns one utterance into refined text, a translation and keyword/continuation
// flags. Holds no per-call state; enrich() may run concurrently.
class EnrichmentPipeline {
public:
    EnrichmentPipeline(LlmAdapter& llm, const SummaryContextStore& context, bool verbose = false);

    // Never throws; failures at the LLM boundary produce a degraded result.
    EnrichmentResult enrich(const EnrichmentRequest& request) const;

    static std::string build_prompt(const EnrichmentRequest& request,
                                    const std::optional<std::string>& context_prompt);

    // Keywords occurring in `text`, ignoring ASCII case, in keyword order.
    static std::vector<std::string> direct_keyword_matches(std::string_view text,
                                                           const std::vector<std::string>& keywords);

private:
    EnrichmentResult run(const EnrichmentRequest& request) const;
    void log(const std::string& msg) const;

    LlmAdapter& llm_;
    const SummaryContextStore& context_;
    bool verbose_;
};
