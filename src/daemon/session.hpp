#pragma once

#include "engine/engine.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Starting and Reconfiguring are only observable while a SessionManager
// operation is in progress.
enum class SessionState { Starting, Running, Reconfiguring, Stopped };

inline std::string_view session_state_name(SessionState state) {
    switch (state) {
        case SessionState::Starting: return "starting";
        case SessionState::Running: return "running";
        case SessionState::Reconfiguring: return "reconfiguring";
        case SessionState::Stopped: return "stopped";
    }
    return "unknown";
}

struct SessionConfig {
    std::string language = "zh";
    std::string model_type = "tiny";
    std::string target_language = "en";
    bool debug_mode = false;
    std::vector<std::string> keywords;
};

// Partial reconfiguration request. Unset fields inherit from the session.
struct SessionUpdate {
    std::optional<std::string> language;
    std::optional<std::string> model_type;
    std::optional<std::string> target_language;
    std::optional<bool> debug_mode;
    std::optional<std::vector<std::string>> keywords;
};

struct AudioStats {
    using Clock = std::chrono::system_clock;

    uint64_t total_chunks = 0;
    uint64_t total_bytes = 0;
    std::optional<Clock::time_point> first_chunk_time;
    std::optional<Clock::time_point> last_chunk_time;
    size_t max_chunk_size = 0;
    size_t min_chunk_size = 0; // meaningful once total_chunks > 0
    uint64_t slow_chunks = 0;  // feeds slower than the soft latency threshold

    void record(size_t chunk_size, Clock::time_point now) {
        if (total_chunks == 0) {
            first_chunk_time = now;
            min_chunk_size = chunk_size;
        }
        last_chunk_time = now;
        total_chunks++;
        total_bytes += chunk_size;
        max_chunk_size = std::max(max_chunk_size, chunk_size);
        min_chunk_size = std::min(min_chunk_size, chunk_size);
    }

    double average_chunk_size() const {
        return total_chunks ? static_cast<double>(total_bytes) / total_chunks : 0.0;
    }

    double duration_s() const {
        if (!first_chunk_time || !last_chunk_time) return 0.0;
        return std::chrono::duration<double>(*last_chunk_time - *first_chunk_time).count();
    }
};

// Bounded list of finalized utterances, most recent last.
class HistoryBuffer {
public:
    explicit HistoryBuffer(size_t capacity) : capacity_(capacity) {}

    void push(std::string text) {
        if (capacity_ == 0) return;
        items_.push_back(std::move(text));
        while (items_.size() > capacity_) items_.pop_front();
    }

    // Merges a continuation into the most recent item.
    void replace_last(std::string text) {
        if (items_.empty()) {
            push(std::move(text));
            return;
        }
        items_.back() = std::move(text);
    }

    std::vector<std::string> items() const { return {items_.begin(), items_.end()}; }
    size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }
    size_t capacity() const { return capacity_; }

private:
    std::deque<std::string> items_;
    size_t capacity_;
};

struct Session {
    std::string id;
    SessionConfig config;
    std::chrono::system_clock::time_point registered_at;
    bool running = false;
    SessionState state = SessionState::Starting;
    uint64_t epoch = 0;             // unique per registration; guards reused ids
    uint64_t engine_generation = 0; // bumped on every successful hot-swap
    EngineStatus engine;            // cached after each lifecycle operation
};

// Read-only projection returned by SessionManager::get_config().
struct SessionSnapshot {
    Session session;
    AudioStats stats;
    size_t history_size = 0;
};
