#include "enrichment/summary_service.hpp"

#include <cctype>
#include <cmath>
#include <ctime>
#include <exception>
#include <format>
#include <print>

SummaryService::SummaryService(LlmAdapter& llm, bool verbose) : llm_(llm), verbose_(verbose) {}

SessionSummary SummaryService::generate(const std::vector<TranscriptItem>& items) const {
    log(std::format("summary requested for {} item(s)", items.size()));

    if (items.size() < 2) {
        return insufficient_content();
    }

    try {
        auto reply = llm_.summarize(build_prompt(items));
        if (!reply) {
            std::println(stderr, "summary: llm {}: {}",
                         llm_error_kind_name(reply.error().kind), reply.error().message);
            return processing_error(reply.error().message);
        }
        log("summary generated");
        return *reply;
    } catch (const std::exception& e) {
        std::println(stderr, "summary: unexpected failure: {}", e.what());
        return processing_error(e.what());
    }
}

std::string SummaryService::build_prompt(const std::vector<TranscriptItem>& items) {
    std::string prompt = "Below is the transcript of a conversation. Each line carries a "
                         "timestamp and the spoken text:\n\n";
    for (const auto& item : items) {
        prompt += std::format("[{}] {}\n", format_timestamp(item.timestamp), item.text);
    }
    prompt += "\nAnalyse the conversation and produce:\n"
              "1. scene: where and in what setting the conversation probably takes place\n"
              "2. topic: the main subject or purpose\n"
              "3. keyPoints: the 3 to 5 most important points discussed\n"
              "4. summary: a concise summary of the content and conclusions\n"
              "\nReply with this JSON object only:\n"
              "{\n"
              "  \"scene\": \"scene description\",\n"
              "  \"topic\": \"topic\",\n"
              "  \"keyPoints\": [\"point 1\", \"point 2\", \"point 3\"],\n"
              "  \"summary\": \"full summary\"\n"
              "}\n"
              "Use at most 5 key points.\n";
    return prompt;
}

std::string SummaryService::format_timestamp(std::string_view timestamp) {
    auto sep = timestamp.find_first_of("T ");
    if (sep == std::string_view::npos || sep != 10) return std::string(timestamp);

    auto time = timestamp.substr(sep + 1);
    if (time.size() < 8) return std::string(timestamp);

    // HH:MM:SS with digits in every other position.
    for (size_t i = 0; i < 8; i++) {
        bool colon = (i == 2 || i == 5);
        if (colon ? time[i] != ':' : !std::isdigit(static_cast<unsigned char>(time[i]))) {
            return std::string(timestamp);
        }
    }
    return std::string(time.substr(0, 8));
}

std::optional<std::string> SummaryService::format_epoch_seconds(double seconds) {
    // 0001-01-01T00:00:00Z .. 9999-12-31T23:59:59Z
    constexpr double MIN_SECONDS = -62135596800.0;
    constexpr double MAX_SECONDS = 253402300799.0;
    if (!std::isfinite(seconds) || seconds < MIN_SECONDS || seconds >= MAX_SECONDS + 1.0) {
        return std::nullopt;
    }

    std::time_t t = static_cast<std::time_t>(std::floor(seconds));
    std::tm tm{};
    if (!gmtime_r(&t, &tm)) return std::nullopt;
    return std::format("{:02}:{:02}:{:02}", tm.tm_hour, tm.tm_min, tm.tm_sec);
}

SessionSummary SummaryService::insufficient_content() {
    return SessionSummary{
        .scene = "Insufficient content",
        .topic = "Not yet determined",
        .key_points = {"More conversation is needed to extract key points"},
        .summary = "Keep talking to get a meaningful summary",
    };
}

SessionSummary SummaryService::processing_error(const std::string& message) {
    return SessionSummary{
        .scene = "Processing error",
        .topic = "Unknown",
        .key_points = {"An error occurred while generating the summary"},
        .summary = "Sorry, the summary could not be generated: " + message,
    };
}

void SummaryService::log(const std::string& msg) const {
    if (verbose_) {
        std::println(stderr, "[livescribe] summary: {}", msg);
    }
}
