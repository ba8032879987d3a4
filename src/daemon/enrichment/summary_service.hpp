#pragma once

#include "llm/llm_adapter.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct TranscriptItem {
    std::string text;
    std::string timestamp; // ISO 8601 or free-form
};

// Builds a scene/topic/key points/summary digest of a finished transcript.
class SummaryService {
public:
    explicit SummaryService(LlmAdapter& llm, bool verbose = false);

    // Never throws. Fewer than two items yields a fixed placeholder without
    // asking the LLM; an LLM failure yields a placeholder carrying the error.
    SessionSummary generate(const std::vector<TranscriptItem>& items) const;

    static std::string build_prompt(const std::vector<TranscriptItem>& items);

    // "2024-05-01T09:15:30.123Z" -> "09:15:30". Anything else passes through.
    static std::string format_timestamp(std::string_view timestamp);

    // Seconds since the Unix epoch -> "HH:MM:SS" (UTC). Empty for values that
    // are not finite or fall outside years 1..9999.
    static std::optional<std::string> format_epoch_seconds(double seconds);

    static SessionSummary insufficient_content();
    static SessionSummary processing_error(const std::string& message);

private:
    void log(const std::string& msg) const;

    LlmAdapter& llm_;
    bool verbose_;
};
