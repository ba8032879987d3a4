#include "engine/lan_engine.hpp"

#include "languages.hpp"

#include <chrono>
#include <format>
#include <print>
#include <system_error>

LanEngine::LanEngine(EngineConfig config, Config::Engine settings, TextCallback on_text)
    : config_(std::move(config)), settings_(std::move(settings)),
      on_text_(std::move(on_text)),
      client_(settings_.url, settings_.api_format, config_.language, config_.model_type),
      ring_(settings_.ring_buffer_bytes()) {}

LanEngine::~LanEngine() {
    stop();
}

std::expected<std::unique_ptr<RecognitionEngine>, std::string>
LanEngine::create(const EngineConfig& config, const Config::Engine& settings, TextCallback on_text) {
    if (!is_supported_language(config.language)) {
        return std::unexpected("unsupported language: " + config.language);
    }
    if (!is_supported_model(config.model_type)) {
        return std::unexpected("unsupported model: " + config.model_type);
    }
    if (is_english_only_model(config.model_type) && config.language != "en") {
        return std::unexpected(std::format("model {} only supports English, not {}",
                                           config.model_type, config.language));
    }
    if (!WhisperClient::is_known_format(settings.api_format)) {
        return std::unexpected("unknown engine api_format: " + settings.api_format);
    }
    if (settings.segment_samples() == 0 ||
        settings.ring_buffer_bytes() < settings.segment_samples() * sizeof(int16_t)) {
        return std::unexpected("engine buffer must hold at least one segment");
    }
    return std::make_unique<LanEngine>(config, settings, std::move(on_text));
}

bool LanEngine::start() {
    if (running_.load(std::memory_order_acquire)) return true;

    ring_.reset();
    try {
        worker_ = std::jthread([this](std::stop_token stop) { worker_loop(stop); });
    } catch (const std::system_error& e) {
        std::println(stderr, "engine: failed to start worker: {}", e.what());
        return false;
    }

    running_.store(true, std::memory_order_release);
    log(std::format("started ({}, {})", config_.language, config_.model_type));
    return true;
}

bool LanEngine::stop() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) return true;

    // request_stop() wakes the worker and aborts an in-flight HTTP transfer.
    worker_.request_stop();
    if (worker_.joinable()) {
        worker_.join();
    }
    log("stopped");
    return true;
}

std::expected<void, std::string> LanEngine::process_audio(std::span<const uint8_t> frame) {
    if (!running_.load(std::memory_order_acquire)) {
        return std::unexpected("engine not running");
    }
    if (!ring_.write(frame.data(), frame.size())) {
        return std::unexpected(std::format("audio buffer full, dropped {} bytes", frame.size()));
    }
    // Taking the lock orders the write before the worker's predicate check,
    // so the wakeup cannot fall between its check and its wait.
    { std::lock_guard lock(wake_mutex_); }
    wake_.notify_one();
    return {};
}

EngineStatus LanEngine::status() const {
    return EngineStatus{
        .language = config_.language,
        .model_type = config_.model_type,
        .device = settings_.device,
        .running = running_.load(std::memory_order_acquire),
    };
}

void LanEngine::worker_loop(std::stop_token stop) {
    const size_t segment_samples = settings_.segment_samples();
    std::vector<int16_t> pending;
    pending.reserve(segment_samples * 2);

    while (!stop.stop_requested()) {
        {
            std::unique_lock lock(wake_mutex_);
            wake_.wait_for(lock, stop, std::chrono::milliseconds(200),
                           [this] { return ring_.available() >= sizeof(int16_t); });
        }
        if (stop.stop_requested()) break;

        ring_.drain_samples(pending);

        size_t consumed = 0;
        while (pending.size() - consumed >= segment_samples && !stop.stop_requested()) {
            transcribe_segment(std::span(pending).subspan(consumed, segment_samples), stop);
            consumed += segment_samples;
        }
        pending.erase(pending.begin(), pending.begin() + static_cast<std::ptrdiff_t>(consumed));
    }
}

void LanEngine::transcribe_segment(std::span<const int16_t> segment, std::stop_token stop) {
    auto result = client_.transcribe(segment, settings_.sample_rate, stop);
    if (!result) {
        if (!stop.stop_requested()) {
            std::println(stderr, "engine: transcription failed: {}", result.error());
        }
        return;
    }

    log(std::format("segment {:.1f}s transcribed in {:.2f}s: {} chars",
                    result->duration_s, result->processing_s, result->text.size()));
    if (!result->text.empty()) {
        on_text_(std::move(result->text));
    }
}

void LanEngine::log(const std::string& msg) {
    if (config_.debug_mode) {
        std::println(stderr, "[livescribe] engine: {}", msg);
    }
}

EngineFactory make_lan_engine_factory(Config::Engine settings) {
    return [settings = std::move(settings)](const EngineConfig& config,
                                            RecognitionEngine::TextCallback on_text) {
        return LanEngine::create(config, settings, std::move(on_text));
    };
}
