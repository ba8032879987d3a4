#pragma once

#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <span>
#include <string>

// Read-only diagnostics. Defaults apply when an engine cannot report a field.
struct EngineStatus {
    std::string language = "unknown";
    std::string model_type = "unknown";
    std::string device = "cpu";
    bool running = false;
};

// Per-session recognition settings. Server-level settings (URL, sample rate)
// are bound into the EngineFactory.
struct EngineConfig {
    std::string language;
    std::string model_type;
    bool debug_mode = false;
};

// Speech recognition engine owned by exactly one session.
//
// start()/stop() are idempotent. process_audio() queues one frame and returns
// without waiting for recognition; recognized text is reported through the
// TextCallback, possibly from another thread, zero or more times per frame.
class RecognitionEngine {
public:
    using TextCallback = std::function<void(std::string text)>;

    virtual ~RecognitionEngine() = default;
    virtual bool start() = 0;
    virtual bool stop() = 0;
    virtual std::expected<void, std::string> process_audio(std::span<const uint8_t> frame) = 0;
    virtual EngineStatus status() const = 0;
};

// Builds an engine; an unsupported configuration is reported as an error, not thrown.
using EngineFactory = std::function<std::expected<std::unique_ptr<RecognitionEngine>, std::string>(
    const EngineConfig&, RecognitionEngine::TextCallback)>;
