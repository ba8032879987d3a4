#pragma once

// Test doubles shared by the session, fan-out and daemon tests.

#include "dispatcher.hpp"
#include "engine/engine.hpp"
#include "llm/llm_adapter.hpp"
#include "output/transport_sink.hpp"

#include <chrono>
#include <deque>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

// Shared between a MockEngineFactory and every engine it builds, so tests can
// inspect lifecycle calls after an engine is gone.
struct EngineLog {
    std::vector<std::string> events;   // "start:N", "stop:N", "fail-start:N"
    std::vector<EngineConfig> configs; // one per constructed engine
    std::mutex mutex;                  // guards events across threads
    int constructed = 0;
    int alive = 0;

    // Failure injection, consumed in order of the next start() calls.
    std::deque<bool> start_results;
    bool fail_construct = false;
    bool fail_process = false;
    std::chrono::milliseconds process_delay{0};

    RecognitionEngine::TextCallback last_callback;

    // Runs at the top of start() with the engine id; may block.
    std::function<void(int)> before_start;

    void record(std::string event) {
        std::lock_guard lock(mutex);
        events.push_back(std::move(event));
    }
};

class MockEngine : public RecognitionEngine {
public:
    MockEngine(int id, EngineConfig config, TextCallback on_text, std::shared_ptr<EngineLog> log)
        : id_(id), config_(std::move(config)), on_text_(std::move(on_text)), log_(std::move(log)) {
        log_->alive++;
    }
    ~MockEngine() override { log_->alive--; }

    bool start() override {
        if (log_->before_start) log_->before_start(id_);
        bool ok = true;
        if (!log_->start_results.empty()) {
            ok = log_->start_results.front();
            log_->start_results.pop_front();
        }
        log_->record((ok ? "start:" : "fail-start:") + std::to_string(id_));
        if (ok) running_ = true;
        return ok;
    }

    bool stop() override {
        log_->record("stop:" + std::to_string(id_));
        running_ = false;
        return true;
    }

    std::expected<void, std::string> process_audio(std::span<const uint8_t> frame) override {
        if (log_->process_delay.count() > 0) std::this_thread::sleep_for(log_->process_delay);
        if (log_->fail_process) return std::unexpected("mock engine rejected audio");
        received_ += frame.size();
        return {};
    }

    EngineStatus status() const override {
        return EngineStatus{
            .language = config_.language,
            .model_type = config_.model_type,
            .device = "mock",
            .running = running_,
        };
    }

    void emit(const std::string& text) { on_text_(text); }

    int id() const { return id_; }
    size_t received() const { return received_; }

private:
    int id_;
    EngineConfig config_;
    TextCallback on_text_;
    std::shared_ptr<EngineLog> log_;
    bool running_ = false;
    size_t received_ = 0;
};

inline EngineFactory make_mock_factory(std::shared_ptr<EngineLog> log) {
    return [log](const EngineConfig& config, RecognitionEngine::TextCallback on_text)
               -> std::expected<std::unique_ptr<RecognitionEngine>, std::string> {
        if (log->fail_construct) return std::unexpected("mock construction failure");
        log->constructed++;
        log->configs.push_back(config);
        log->last_callback = on_text;
        return std::make_unique<MockEngine>(log->constructed, config, std::move(on_text), log);
    };
}

class RecordingSink : public TransportSink {
public:
    bool is_open() const override { return open; }

    std::expected<void, SendError> send(const nlohmann::json& message) override {
        attempts++;
        if (partial_next) {
            partial_next = false;
            open = false;
            return std::unexpected(SendError{.message = "mock send cut mid-frame", .partial = true});
        }
        if (fail_next > 0) {
            fail_next--;
            return std::unexpected(SendError{.message = "mock send failure"});
        }
        sent.push_back(message);
        return {};
    }

    bool open = true;
    int fail_next = 0;
    bool partial_next = false; // next send writes part of a frame, then the sink closes
    int attempts = 0;
    std::vector<nlohmann::json> sent;
};

// run_async executes immediately; posted tasks wait for drain().
class InlineDispatcher : public Dispatcher {
public:
    void run_async(Task task) override {
        async_calls++;
        task();
    }

    void post(Task task) override {
        std::lock_guard lock(mutex_);
        posted_.push_back(std::move(task));
    }

    // Runs posted tasks, including ones they post, until the queue is empty.
    int drain() {
        int ran = 0;
        while (true) {
            Task task;
            {
                std::lock_guard lock(mutex_);
                if (posted_.empty()) return ran;
                task = std::move(posted_.front());
                posted_.pop_front();
            }
            task();
            ran++;
        }
    }

    size_t pending() {
        std::lock_guard lock(mutex_);
        return posted_.size();
    }

    int async_calls = 0;

private:
    std::mutex mutex_;
    std::deque<Task> posted_;
};

class ScriptedLlm : public LlmAdapter {
public:
    bool available() const override { return true; }

    std::expected<LlmEnrichment, LlmError> enrich(const std::string& prompt) override {
        prompts.push_back(prompt);
        if (throw_on_enrich) throw std::runtime_error("adapter exploded");
        if (enrich_error) return std::unexpected(*enrich_error);
        return enrich_reply;
    }

    std::expected<SessionSummary, LlmError> summarize(const std::string& prompt) override {
        prompts.push_back(prompt);
        summarize_calls++;
        if (summary_error) return std::unexpected(*summary_error);
        return summary_reply;
    }

    LlmEnrichment enrich_reply;
    std::optional<LlmError> enrich_error;
    bool throw_on_enrich = false;

    SessionSummary summary_reply;
    std::optional<LlmError> summary_error;
    int summarize_calls = 0;

    std::vector<std::string> prompts;
};
