#pragma once

#include <cstdint>
#include <expected>
#include <span>
#include <stop_token>
#include <string>

struct TranscriptResult {
    std::string text;
    double duration_s = 0.0;
    double processing_s = 0.0;
};

// Posts WAV segments to a whisper.cpp server (/inference) or an
// OpenAI-compatible server (/v1/audio/transcriptions).
class WhisperClient {
public:
    // api_format: "whisper.cpp" or "openai"
    WhisperClient(std::string url, std::string api_format, std::string language,
                  std::string model_type);
    ~WhisperClient();

    WhisperClient(const WhisperClient&) = delete;
    WhisperClient& operator=(const WhisperClient&) = delete;

    // Aborts the transfer early once `stop` is requested.
    std::expected<TranscriptResult, std::string>
        transcribe(std::span<const int16_t> audio, uint32_t sample_rate,
                   std::stop_token stop = {});

    static bool is_known_format(const std::string& api_format);

private:
    std::string url_;
    std::string api_format_;
    std::string language_;
    std::string model_type_;
};
