#include "session_manager.hpp"

#include "languages.hpp"

#include <format>
#include <print>
#include <random>

namespace {

double now_seconds() {
    return std::chrono::duration<double>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

EngineConfig engine_config(const SessionConfig& config) {
    return EngineConfig{
        .language = config.language,
        .model_type = config.model_type,
        .debug_mode = config.debug_mode,
    };
}

} // namespace

// Lock order: op_mutex before data_mutex. The registry lock is never held
// while either is acquired.
struct SessionManager::Entry {
    explicit Entry(size_t history_size) : history(history_size) {}

    std::mutex op_mutex;                        // serializes engine lifecycle
    std::unique_ptr<RecognitionEngine> engine;  // guarded by op_mutex
    std::shared_ptr<TransportSink> sink;

    mutable std::mutex data_mutex;              // guards the fields below
    Session session;
    AudioStats stats;
    HistoryBuffer history;
};

SessionManager::SessionManager(EngineFactory factory, UtteranceHandler on_utterance,
                               Options options)
    : factory_(std::move(factory)), on_utterance_(std::move(on_utterance)),
      options_(options) {}

SessionManager::~SessionManager() {
    unregister_all();
}

std::expected<void, Error> SessionManager::validate(const std::optional<std::string>& language,
                                                    const std::optional<std::string>& model_type) {
    if (language && !is_supported_language(*language)) {
        return make_error(ErrorKind::Validation, "unsupported language: " + *language);
    }
    if (model_type && !is_supported_model(*model_type)) {
        return make_error(ErrorKind::Validation, "unsupported model: " + *model_type);
    }
    return {};
}

std::expected<EngineStatus, Error>
SessionManager::register_session(const std::string& id, const SessionConfig& config,
                                 std::shared_ptr<TransportSink> sink) {
    if (id.empty()) {
        return make_error(ErrorKind::Validation, "session id must not be empty");
    }
    if (auto valid = validate(config.language, config.model_type); !valid) {
        return std::unexpected(valid.error());
    }
    if (find(id)) {
        return make_error(ErrorKind::Validation, "session already registered: " + id);
    }

    auto entry = std::make_shared<Entry>(options_.history_size);
    uint64_t epoch = next_epoch_.fetch_add(1, std::memory_order_relaxed);

    auto engine = factory_(engine_config(config), make_callback(id, epoch, sink));
    if (!engine) {
        std::println(stderr, "session: {}: engine construction failed: {}", id, engine.error());
        return make_error(ErrorKind::EngineConstruction, engine.error());
    }
    if (!(*engine)->start()) {
        std::println(stderr, "session: {}: engine failed to start", id);
        return make_error(ErrorKind::EngineConstruction, "engine failed to start");
    }

    entry->engine = std::move(*engine);
    entry->sink = std::move(sink);
    entry->session = Session{
        .id = id,
        .config = config,
        .registered_at = std::chrono::system_clock::now(),
        .running = true,
        .state = SessionState::Running,
        .epoch = epoch,
        .engine_generation = 1,
        .engine = entry->engine->status(),
    };
    auto status = entry->session.engine;

    bool inserted = false;
    size_t count = 0;
    {
        std::lock_guard lock(registry_mutex_);
        inserted = sessions_.try_emplace(id, entry).second;
        count = sessions_.size();
    }
    if (!inserted) {
        // Lost a race with a concurrent registration of the same id.
        entry->engine->stop();
        return make_error(ErrorKind::Validation, "session already registered: " + id);
    }

    log(std::format("registered {} (language={}, model={}, target={}), {} session(s)",
                    id, config.language, config.model_type, config.target_language, count));
    return status;
}

std::expected<void, Error> SessionManager::feed(const std::string& id,
                                                std::span<const uint8_t> bytes) {
    auto entry = find(id);
    if (!entry) {
        return make_error(ErrorKind::NotFound, "unknown session: " + id);
    }

    std::lock_guard op(entry->op_mutex);
    if (!entry->engine) {
        // Unregistered while we waited for the lock.
        return make_error(ErrorKind::NotFound, "unknown session: " + id);
    }

    bool running = false;
    {
        std::lock_guard lock(entry->data_mutex);
        running = entry->session.running;
    }

    if (!running) {
        std::println(stderr, "session: {}: engine not running, restarting", id);
        bool restarted = entry->engine->start();
        std::lock_guard lock(entry->data_mutex);
        entry->session.running = restarted;
        entry->session.engine = entry->engine->status();
        if (!restarted) {
            return make_error(ErrorKind::EngineRuntime, "engine not running and restart failed");
        }
    }

    auto started = std::chrono::steady_clock::now();
    auto forwarded = entry->engine->process_audio(bytes);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (!forwarded) {
        return make_error(ErrorKind::EngineRuntime, forwarded.error());
    }

    AudioStats stats;
    bool slow = elapsed > options_.slow_feed_threshold;
    {
        std::lock_guard lock(entry->data_mutex);
        entry->stats.record(bytes.size(), std::chrono::system_clock::now());
        if (slow) entry->stats.slow_chunks++;
        stats = entry->stats;
    }

    if (slow) {
        std::println(stderr, "session: {}: slow audio feed: {}ms", id, elapsed.count());
    }
    if (stats.total_chunks == 1) {
        log(std::format("{}: first audio chunk, {} bytes", id, bytes.size()));
    } else if (stats.total_chunks % 20 == 0) {
        log(std::format("{}: audio stats: chunks={}, bytes={}, avg chunk={:.1f}, duration={:.1f}s",
                        id, stats.total_chunks, stats.total_bytes,
                        stats.average_chunk_size(), stats.duration_s()));
    }
    return {};
}

std::expected<SessionSnapshot, Error>
SessionManager::update_config(const std::string& id, const SessionUpdate& update) {
    auto entry = find(id);
    if (!entry) {
        return make_error(ErrorKind::NotFound, "unknown session: " + id);
    }
    if (auto valid = validate(update.language, update.model_type); !valid) {
        return std::unexpected(valid.error());
    }

    std::lock_guard op(entry->op_mutex);
    if (!entry->engine) {
        return make_error(ErrorKind::NotFound, "unknown session: " + id);
    }

    SessionConfig merged;
    uint64_t epoch = 0;
    {
        std::lock_guard lock(entry->data_mutex);
        merged = entry->session.config;
        epoch = entry->session.epoch;
        entry->session.state = SessionState::Reconfiguring;
    }
    if (update.language) merged.language = *update.language;
    if (update.model_type) merged.model_type = *update.model_type;
    if (update.target_language) merged.target_language = *update.target_language;
    if (update.debug_mode) merged.debug_mode = *update.debug_mode;
    if (update.keywords) merged.keywords = *update.keywords;

    log(std::format("{}: reconfiguring (language={}, model={}, target={})",
                    id, merged.language, merged.model_type, merged.target_language));

    if (!entry->engine->stop()) {
        std::println(stderr, "session: {}: previous engine did not stop cleanly", id);
    }

    std::string failure;
    auto replacement = factory_(engine_config(merged), make_callback(id, epoch, entry->sink));
    if (!replacement) {
        failure = replacement.error();
    } else if (!(*replacement)->start()) {
        failure = "replacement engine failed to start";
    }

    if (!failure.empty()) {
        std::println(stderr, "session: {}: reconfiguration failed: {}", id, failure);
        bool restored = entry->engine->start();
        {
            std::lock_guard lock(entry->data_mutex);
            entry->session.state = SessionState::Running;
            entry->session.running = restored;
            entry->session.engine = entry->engine->status();
        }
        if (!restored) {
            std::println(stderr, "session: {}: rollback failed, session is not running", id);
            return make_error(ErrorKind::EngineConstruction,
                              failure + "; previous engine could not be restarted");
        }
        return make_error(ErrorKind::EngineConstruction,
                          failure + "; previous engine restored");
    }

    auto previous = std::move(entry->engine);
    entry->engine = std::move(*replacement);

    SessionSnapshot snapshot;
    {
        std::lock_guard lock(entry->data_mutex);
        entry->session.config = merged;
        entry->session.running = true;
        entry->session.state = SessionState::Running;
        entry->session.engine_generation++;
        entry->session.engine = entry->engine->status();
        snapshot = snapshot_locked(*entry);
    }

    // Destroying the old engine joins its worker outside the data lock.
    previous.reset();

    log(std::format("{}: reconfigured, engine generation {}", id,
                    snapshot.session.engine_generation));
    return snapshot;
}

std::expected<void, Error> SessionManager::unregister(const std::string& id) {
    std::shared_ptr<Entry> entry;
    size_t remaining = 0;
    {
        std::lock_guard lock(registry_mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) return {};
        entry = std::move(it->second);
        sessions_.erase(it);
        remaining = sessions_.size();
    }

    std::lock_guard op(entry->op_mutex);
    if (entry->engine && !entry->engine->stop()) {
        std::println(stderr, "session: {}: engine stop failed during unregister", id);
    }

    AudioStats stats;
    {
        std::lock_guard lock(entry->data_mutex);
        entry->session.state = SessionState::Stopped;
        entry->session.running = false;
        stats = entry->stats;
    }
    entry->engine.reset();

    if (stats.total_chunks > 0) {
        log(std::format("{}: session stats: chunks={}, bytes={}, duration={:.1f}s",
                        id, stats.total_chunks, stats.total_bytes, stats.duration_s()));
    }
    log(std::format("unregistered {}, {} session(s) remaining", id, remaining));
    return {};
}

std::expected<SessionSnapshot, Error> SessionManager::get_config(const std::string& id) const {
    auto entry = find(id);
    if (!entry) {
        return make_error(ErrorKind::NotFound, "unknown session: " + id);
    }
    std::lock_guard lock(entry->data_mutex);
    return snapshot_locked(*entry);
}

std::expected<void, Error> SessionManager::update_keywords(const std::string& id,
                                                           std::vector<std::string> keywords) {
    auto entry = find(id);
    if (!entry) {
        return make_error(ErrorKind::NotFound, "unknown session: " + id);
    }
    std::lock_guard lock(entry->data_mutex);
    entry->session.config.keywords = std::move(keywords);
    return {};
}

std::optional<UtteranceContext> SessionManager::utterance_context(const std::string& id,
                                                                  uint64_t epoch) const {
    auto entry = find(id);
    if (!entry) return std::nullopt;

    std::lock_guard lock(entry->data_mutex);
    if (entry->session.epoch != epoch) return std::nullopt;
    return UtteranceContext{
        .source_language = entry->session.config.language,
        .target_language = entry->session.config.target_language,
        .history = entry->history.items(),
        .keywords = entry->session.config.keywords,
    };
}

bool SessionManager::record_utterance(const std::string& id, uint64_t epoch, std::string text,
                                      bool continuation) {
    auto entry = find(id);
    if (!entry) return false;

    std::lock_guard lock(entry->data_mutex);
    if (entry->session.epoch != epoch) return false;
    if (continuation) {
        entry->history.replace_last(std::move(text));
    } else {
        entry->history.push(std::move(text));
    }
    return true;
}

std::vector<SessionSnapshot> SessionManager::snapshot_all() const {
    std::vector<std::shared_ptr<Entry>> entries;
    {
        std::lock_guard lock(registry_mutex_);
        entries.reserve(sessions_.size());
        for (auto& [id, entry] : sessions_) entries.push_back(entry);
    }

    std::vector<SessionSnapshot> out;
    out.reserve(entries.size());
    for (auto& entry : entries) {
        std::lock_guard lock(entry->data_mutex);
        out.push_back(snapshot_locked(*entry));
    }
    return out;
}

size_t SessionManager::size() const {
    std::lock_guard lock(registry_mutex_);
    return sessions_.size();
}

void SessionManager::unregister_all() {
    std::vector<std::string> ids;
    {
        std::lock_guard lock(registry_mutex_);
        for (auto& [id, entry] : sessions_) ids.push_back(id);
    }
    for (auto& id : ids) {
        // unregister() never fails; the result only carries success.
        (void)unregister(id);
    }
}

std::string SessionManager::generate_id() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dist;
    uint64_t hi = dist(rng);
    uint64_t lo = dist(rng);
    return std::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                       hi >> 32, (hi >> 16) & 0xffff, hi & 0xffff,
                       lo >> 48, lo & 0xffffffffffffULL);
}

std::shared_ptr<SessionManager::Entry> SessionManager::find(const std::string& id) const {
    std::lock_guard lock(registry_mutex_);
    auto it = sessions_.find(id);
    return it != sessions_.end() ? it->second : nullptr;
}

RecognitionEngine::TextCallback
SessionManager::make_callback(const std::string& id, uint64_t epoch,
                              std::weak_ptr<TransportSink> sink) const {
    return [handler = on_utterance_, id, epoch, sink = std::move(sink)](std::string text) {
        handler(Utterance{
            .session_id = id,
            .epoch = epoch,
            .text = std::move(text),
            .sink = sink,
            .timestamp = now_seconds(),
        });
    };
}

SessionSnapshot SessionManager::snapshot_locked(const Entry& entry) {
    return SessionSnapshot{
        .session = entry.session,
        .stats = entry.stats,
        .history_size = entry.history.size(),
    };
}

void SessionManager::log(const std::string& msg) const {
    if (options_.verbose) {
        std::println(stderr, "[livescribe] session: {}", msg);
    }
}
