#pragma once

#include "config.hpp"
#include "engine/engine.hpp"
#include "engine/whisper_client.hpp"
#include "ring_buffer.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>

// Streams session audio to a LAN whisper server. process_audio() only queues
// bytes; a dedicated worker thread cuts fixed-length segments and transcribes them.
class LanEngine : public RecognitionEngine {
public:
    LanEngine(EngineConfig config, Config::Engine settings, TextCallback on_text);
    ~LanEngine() override;

    LanEngine(const LanEngine&) = delete;
    LanEngine& operator=(const LanEngine&) = delete;

    bool start() override;
    bool stop() override;
    std::expected<void, std::string> process_audio(std::span<const uint8_t> frame) override;
    EngineStatus status() const override;

    // Validates the language/model combination before constructing.
    static std::expected<std::unique_ptr<RecognitionEngine>, std::string>
        create(const EngineConfig& config, const Config::Engine& settings, TextCallback on_text);

private:
    void worker_loop(std::stop_token stop);
    void transcribe_segment(std::span<const int16_t> segment, std::stop_token stop);
    void log(const std::string& msg);

    EngineConfig config_;
    Config::Engine settings_;
    TextCallback on_text_;
    WhisperClient client_;
    RingBuffer ring_;

    std::mutex wake_mutex_;
    std::condition_variable_any wake_;
    std::atomic<bool> running_{false};
    std::jthread worker_;
};

EngineFactory make_lan_engine_factory(Config::Engine settings);
