#include "daemon_core.hpp"

#include <chrono>
#include <format>
#include <print>
#include <span>

using json = nlohmann::json;

namespace {

double epoch_seconds(std::chrono::system_clock::time_point t) {
    return std::chrono::duration<double>(t.time_since_epoch()).count();
}

json config_json(const SessionConfig& config) {
    return {
        {"language", config.language},
        {"model_type", config.model_type},
        {"target_language", config.target_language},
        {"debug_mode", config.debug_mode},
        {"keywords", config.keywords},
    };
}

json engine_json(const EngineStatus& status) {
    return {
        {"language", status.language},
        {"model_type", status.model_type},
        {"device", status.device},
        {"running", status.running},
    };
}

json stats_json(const AudioStats& stats) {
    json j = {
        {"total_chunks", stats.total_chunks},
        {"total_bytes", stats.total_bytes},
        {"max_chunk_size", stats.max_chunk_size},
        {"min_chunk_size", stats.min_chunk_size},
        {"avg_chunk_size", stats.average_chunk_size()},
        {"duration", stats.duration_s()},
        {"slow_chunks", stats.slow_chunks},
        {"first_chunk_time", nullptr},
        {"last_chunk_time", nullptr},
    };
    if (stats.first_chunk_time) j["first_chunk_time"] = epoch_seconds(*stats.first_chunk_time);
    if (stats.last_chunk_time) j["last_chunk_time"] = epoch_seconds(*stats.last_chunk_time);
    return j;
}

json session_json(const SessionSnapshot& snap) {
    return {
        {"client_id", snap.session.id},
        {"config", config_json(snap.session.config)},
        {"engine", engine_json(snap.session.engine)},
        {"running", snap.session.running},
        {"state", std::string(session_state_name(snap.session.state))},
        {"engine_generation", snap.session.engine_generation},
        {"registered_at", epoch_seconds(snap.session.registered_at)},
        {"audio_stats", stats_json(snap.stats)},
        {"history_size", snap.history_size},
    };
}

bool read_keywords(const json& value, std::vector<std::string>& out) {
    if (!value.is_array()) return false;
    for (const auto& item : value) {
        if (!item.is_string()) return false;
        out.push_back(item.get<std::string>());
    }
    return true;
}

} // namespace

DaemonCore::DaemonCore(Config config, bool verbose, IpcServer& ipc, Dispatcher& dispatcher,
                       LlmAdapter& llm, EngineFactory engine_factory)
    : config_(std::move(config)), verbose_(verbose),
      ipc_(ipc), dispatcher_(dispatcher),
      pipeline_(llm, summary_context_, verbose),
      summary_service_(llm, verbose),
      sessions_(std::move(engine_factory),
                // Engine worker threads hand utterances to the loop thread.
                [this](Utterance utterance) {
                    dispatcher_.post([this, utterance = std::move(utterance)]() mutable {
                        fanout_.on_utterance(std::move(utterance));
                    });
                },
                SessionManager::Options{
                    .history_size = config_.session.history_size,
                    .slow_feed_threshold = std::chrono::milliseconds(config_.session.slow_feed_ms),
                    .verbose = verbose,
                }),
      fanout_(sessions_, pipeline_, dispatcher_, verbose) {}

DaemonCore::~DaemonCore() {
    shutdown();
}

bool DaemonCore::on_client_connected(int fd) {
    auto sink = std::make_shared<SocketSink>(ipc_, fd);
    auto id = SessionManager::generate_id();

    SessionConfig session_config{
        .language = config_.session.language,
        .model_type = config_.session.model_type,
        .target_language = config_.session.target_language,
        .debug_mode = config_.session.debug_mode,
        .keywords = {},
    };

    auto registered = sessions_.register_session(id, session_config, sink);
    if (!registered) {
        std::println(stderr, "session: registration failed: {}", registered.error().message);
        auto sent = sink->send({
            {"event", "error"},
            {"error", std::string(error_kind_name(registered.error().kind))},
            {"message", registered.error().message},
        });
        if (!sent) {
            std::println(stderr, "ipc: send to client failed: {}", sent.error().message);
        }
        sink->close();
        return false;
    }

    auto& client = clients_[fd];
    client = Client{.session_id = id, .sink = std::move(sink)};
    log(std::format("client connected: {} (fd {})", id, fd));
    send(client, {{"event", "connected"}, {"client_id", id}});
    return true;
}

bool DaemonCore::on_frame(int fd, const frame::Frame& frame) {
    auto it = clients_.find(fd);
    if (it == clients_.end()) return false;

    if (frame.kind == frame::Kind::Binary) {
        handle_audio(it->second, frame.payload);
    } else {
        handle_message(it->second, frame.payload);
    }
    return true;
}

void DaemonCore::on_client_disconnected(int fd) {
    auto it = clients_.find(fd);
    if (it == clients_.end()) return;

    it->second.sink->close();
    auto id = std::move(it->second.session_id);
    clients_.erase(it);

    // unregister() is idempotent and never fails.
    (void)sessions_.unregister(id);
    log(std::format("client disconnected: {}", id));
}

void DaemonCore::shutdown() {
    for (auto& [fd, client] : clients_) {
        client.sink->close();
    }
    clients_.clear();
    sessions_.unregister_all();
}

std::optional<std::string> DaemonCore::session_id(int fd) const {
    auto it = clients_.find(fd);
    if (it == clients_.end()) return std::nullopt;
    return it->second.session_id;
}

void DaemonCore::handle_audio(Client& client, const std::string& payload) {
    auto bytes = std::span(reinterpret_cast<const uint8_t*>(payload.data()), payload.size());
    auto fed = sessions_.feed(client.session_id, bytes);
    if (!fed) {
        std::println(stderr, "session: {}: audio rejected: {}", client.session_id, fed.error().message);
        send_error(client, fed.error());
    }
}

void DaemonCore::handle_message(Client& client, const std::string& payload) {
    json msg;
    try {
        msg = json::parse(payload);
    } catch (const json::exception& e) {
        send_error(client, Error{ErrorKind::Protocol, std::string("invalid JSON: ") + e.what()});
        return;
    }

    if (!msg.is_object() || !msg.contains("event") || !msg["event"].is_string()) {
        send_error(client, Error{ErrorKind::Protocol, "message has no event"});
        return;
    }

    auto event = msg["event"].get<std::string>();
    if (event == "config") return handle_config(client, msg);
    if (event == "keywords") return handle_keywords(client, msg);
    if (event == "status") return handle_status(client);
    if (event == "summary") return handle_summary(client, msg);
    if (event == "summary_context") return handle_summary_context(client, msg);
    if (event == "summary_context_get") return handle_summary_context_get(client);
    if (event == "summary_context_clear") return handle_summary_context_clear(client);

    send_error(client, Error{ErrorKind::Protocol, "unknown event: " + event});
}

void DaemonCore::handle_config(Client& client, const json& msg) {
    if (!msg.contains("config") || !msg["config"].is_object()) {
        send_error(client, Error{ErrorKind::Protocol, "config message requires a config object"});
        return;
    }
    const auto& cfg = msg["config"];

    SessionUpdate update;
    auto read_string = [&](const char* key, std::optional<std::string>& out) {
        if (!cfg.contains(key)) return true;
        if (!cfg[key].is_string()) return false;
        out = cfg[key].get<std::string>();
        return true;
    };

    bool valid = read_string("language", update.language) &&
                 read_string("target_language", update.target_language);
    if (valid && cfg.contains("model_type")) {
        valid = read_string("model_type", update.model_type);
    } else if (valid) {
        valid = read_string("model", update.model_type);
    }
    if (valid && cfg.contains("debug_mode")) {
        valid = cfg["debug_mode"].is_boolean();
        if (valid) update.debug_mode = cfg["debug_mode"].get<bool>();
    }
    if (valid && cfg.contains("keywords")) {
        std::vector<std::string> keywords;
        valid = read_keywords(cfg["keywords"], keywords);
        if (valid) update.keywords = std::move(keywords);
    }
    if (!valid) {
        send_error(client, Error{ErrorKind::Protocol, "config fields have the wrong type"});
        return;
    }

    send(client, {{"event", "config_received"}, {"status", "processing"}});

    auto updated = sessions_.update_config(client.session_id, update);
    if (!updated) {
        std::println(stderr, "session: {}: config update failed: {}", client.session_id,
                     updated.error().message);
        send(client, {
            {"event", "config_updated"},
            {"status", "error"},
            {"error", std::string(error_kind_name(updated.error().kind))},
            {"message", updated.error().message},
        });
        return;
    }

    send(client, {
        {"event", "config_updated"},
        {"status", "success"},
        {"config", config_json(updated->session.config)},
        {"engine", engine_json(updated->session.engine)},
    });
}

void DaemonCore::handle_keywords(Client& client, const json& msg) {
    std::vector<std::string> keywords;
    if (!msg.contains("keywords") || !read_keywords(msg["keywords"], keywords)) {
        send_error(client, Error{ErrorKind::Protocol, "keywords must be a list of strings"});
        return;
    }

    auto updated = sessions_.update_keywords(client.session_id, keywords);
    if (!updated) {
        send_error(client, updated.error());
        return;
    }
    log(std::format("{}: {} keyword(s)", client.session_id, keywords.size()));
    send(client, {{"event", "keywords_updated"}, {"keywords", keywords}});
}

void DaemonCore::handle_status(Client& client) {
    auto own = sessions_.get_config(client.session_id);
    if (!own) {
        send_error(client, own.error());
        return;
    }

    json sessions = json::array();
    for (const auto& snap : sessions_.snapshot_all()) {
        sessions.push_back(session_json(snap));
    }

    send(client, {
        {"event", "status"},
        {"client_id", client.session_id},
        {"config", config_json(own->session.config)},
        {"engine", engine_json(own->session.engine)},
        {"running", own->session.running},
        {"audio_stats", stats_json(own->stats)},
        {"sessions", std::move(sessions)},
    });
}

void DaemonCore::handle_summary(Client& client, const json& msg) {
    if (!msg.contains("transcriptions") || !msg["transcriptions"].is_array()) {
        send_error(client, Error{ErrorKind::Protocol, "summary requires a transcriptions list"});
        return;
    }

    std::vector<TranscriptItem> items;
    for (const auto& entry : msg["transcriptions"]) {
        if (!entry.is_object() || !entry.contains("text") || !entry["text"].is_string()) {
            send_error(client, Error{ErrorKind::Protocol, "transcription items need a text field"});
            return;
        }
        TranscriptItem item{.text = entry["text"].get<std::string>(), .timestamp = ""};
        if (entry.contains("timestamp")) {
            const auto& ts = entry["timestamp"];
            if (ts.is_string()) {
                item.timestamp = ts.get<std::string>();
            } else if (ts.is_number()) {
                auto formatted = SummaryService::format_epoch_seconds(ts.get<double>());
                item.timestamp = formatted ? *formatted : ts.dump();
            }
        }
        items.push_back(std::move(item));
    }

    std::weak_ptr<SocketSink> sink = client.sink;
    dispatcher_.run_async([this, sink, items = std::move(items)] {
        auto summary = summary_service_.generate(items);
        dispatcher_.post([sink, summary = std::move(summary)] {
            auto target = sink.lock();
            if (!target || !target->is_open()) return;
            auto sent = target->send({
                {"event", "summary"},
                {"scene", summary.scene},
                {"topic", summary.topic},
                {"keyPoints", summary.key_points},
                {"summary", summary.summary},
            });
            if (!sent) {
                std::println(stderr, "ipc: summary send failed: {}", sent.error().message);
            }
        });
    });
}

void DaemonCore::handle_summary_context(Client& client, const json& msg) {
    if (!summary_context_.set(msg)) {
        send(client, {
            {"event", "summary_context"},
            {"status", "error"},
            {"message", "scene, topic, keyPoints and summary are all required"},
        });
        return;
    }
    log("summary context updated");
    send(client, {
        {"event", "summary_context"},
        {"status", "success"},
        {"message", "summary context updated"},
    });
}

void DaemonCore::handle_summary_context_get(Client& client) {
    auto context = summary_context_.get();
    send(client, {
        {"event", "summary_context"},
        {"has_context", context.has_context},
        {"context", context.to_json()},
    });
}

void DaemonCore::handle_summary_context_clear(Client& client) {
    summary_context_.clear();
    log("summary context cleared");
    send(client, {
        {"event", "summary_context"},
        {"status", "success"},
        {"message", "summary context cleared"},
    });
}

void DaemonCore::send(Client& client, const json& message) {
    auto sent = client.sink->send(message);
    if (!sent) {
        std::println(stderr, "ipc: {}: send failed: {}", client.session_id, sent.error().message);
    }
}

void DaemonCore::send_error(Client& client, const Error& error) {
    send(client, {
        {"event", "error"},
        {"error", std::string(error_kind_name(error.kind))},
        {"message", error.message},
    });
}

void DaemonCore::log(const std::string& msg) const {
    if (verbose_) {
        std::println(stderr, "[livescribe] {}", msg);
    }
}
