#pragma once

#include "engine/engine.hpp"
#include "errors.hpp"
#include "output/transport_sink.hpp"
#include "session.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

// One recognized utterance, tagged with the registration it belongs to.
struct Utterance {
    std::string session_id;
    uint64_t epoch = 0;
    std::string text;
    std::weak_ptr<TransportSink> sink;
    double timestamp = 0.0; // seconds since the Unix epoch
};

// Everything the enrichment stage needs from a session, copied out at once.
struct UtteranceContext {
    std::string source_language;
    std::string target_language;
    std::vector<std::string> history;
    std::vector<std::string> keywords;
};

// Owns every session: its config, engine, audio statistics and history.
//
// Thread-safe. Lifecycle operations on one session (register, feed,
// update_config, unregister) are serialized by a per-session lock, so a
// second update_config for the same id waits for the first to finish.
// Engines report text through the UtteranceHandler; they never see the registry.
class SessionManager {
public:
    using UtteranceHandler = std::function<void(Utterance)>;

    struct Options {
        size_t history_size = 5;
        std::chrono::milliseconds slow_feed_threshold{100};
        bool verbose = false;
    };

    SessionManager(EngineFactory factory, UtteranceHandler on_utterance, Options options);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    std::expected<EngineStatus, Error> register_session(const std::string& id,
                                                        const SessionConfig& config,
                                                        std::shared_ptr<TransportSink> sink);

    std::expected<void, Error> feed(const std::string& id, std::span<const uint8_t> bytes);

    std::expected<SessionSnapshot, Error> update_config(const std::string& id,
                                                        const SessionUpdate& update);

    // Idempotent: unknown ids succeed without doing anything.
    std::expected<void, Error> unregister(const std::string& id);

    std::expected<SessionSnapshot, Error> get_config(const std::string& id) const;

    // Replaces the keyword list; the engine is left alone.
    std::expected<void, Error> update_keywords(const std::string& id,
                                               std::vector<std::string> keywords);

    // Empty when the session is gone or `epoch` belongs to an earlier registration.
    std::optional<UtteranceContext> utterance_context(const std::string& id,
                                                      uint64_t epoch) const;

    // Records a delivered utterance in the session history. A continuation
    // replaces the latest item. Returns false for stale/unknown sessions.
    bool record_utterance(const std::string& id, uint64_t epoch, std::string text,
                          bool continuation);

    std::vector<SessionSnapshot> snapshot_all() const;
    size_t size() const;
    void unregister_all();

    static std::string generate_id();

private:
    struct Entry;

    std::shared_ptr<Entry> find(const std::string& id) const;
    RecognitionEngine::TextCallback make_callback(const std::string& id, uint64_t epoch,
                                                  std::weak_ptr<TransportSink> sink) const;
    static SessionSnapshot snapshot_locked(const Entry& entry);
    static std::expected<void, Error> validate(const std::optional<std::string>& language,
                                               const std::optional<std::string>& model_type);
    void log(const std::string& msg) const;

    EngineFactory factory_;
    UtteranceHandler on_utterance_;
    Options options_;

    mutable std::mutex registry_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> sessions_;
    std::atomic<uint64_t> next_epoch_{1};
};
