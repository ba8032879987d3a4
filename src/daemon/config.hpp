#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

struct Config {
    struct Server {
        std::string socket; // empty: platform default
    } server;

    struct Engine {
        std::string url = "http://localhost:8080";
        std::string api_format = "whisper.cpp"; // "whisper.cpp" or "openai"
        uint32_t sample_rate = 16000;
        double segment_seconds = 3.0;
        uint32_t buffer_seconds = 30;
        std::string device = "remote";

        // Computed from buffer_seconds and sample_rate (no independent config key).
        size_t ring_buffer_bytes() const {
            return static_cast<size_t>(buffer_seconds) * sample_rate * sizeof(int16_t);
        }

        size_t segment_samples() const {
            return static_cast<size_t>(segment_seconds * sample_rate);
        }
    } engine;

    struct Llm {
        std::string endpoint = "http://localhost:11434/api/chat";
        std::string api_format = "ollama"; // "ollama" or "openai"
        std::string model = "qwen2.5:7b";
        std::string api_key_env = "LIVESCRIBE_LLM_API_KEY";
        int timeout_ms = 15000;
    } llm;

    struct Session {
        std::string language = "zh";
        std::string model_type = "tiny";
        std::string target_language = "en";
        bool debug_mode = false;
        size_t history_size = 5;
        int slow_feed_ms = 100;
        int workers = 4;
    } session;

    static Config load(const std::string& path);
    static Config load_default();
};
