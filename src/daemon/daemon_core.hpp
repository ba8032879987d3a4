#pragma once

#include "common/frame.hpp"
#include "config.hpp"
#include "dispatcher.hpp"
#include "engine/engine.hpp"
#include "enrichment/pipeline.hpp"
#include "enrichment/summary_service.hpp"
#include "llm/llm_adapter.hpp"
#include "output/socket_sink.hpp"
#include "platform/ipc_server.hpp"
#include "result_fanout.hpp"
#include "session_manager.hpp"
#include "summary_context.hpp"

#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>

// Portable daemon logic: one session per connected client, the client
// message protocol and the summary surfaces. Every method runs on the
// event-loop thread.
class DaemonCore {
public:
    DaemonCore(Config config, bool verbose, IpcServer& ipc, Dispatcher& dispatcher,
               LlmAdapter& llm, EngineFactory engine_factory);
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    // Registers a session for a new client. Returns false if the client
    // should be closed.
    bool on_client_connected(int fd);

    // Returns false for a client that was never registered.
    bool on_frame(int fd, const frame::Frame& frame);

    // Unregisters the client's session. The caller closes the fd afterwards.
    void on_client_disconnected(int fd);

    void shutdown();

    std::optional<std::string> session_id(int fd) const;
    SessionManager& sessions() { return sessions_; }
    SummaryContextStore& summary_context() { return summary_context_; }
    const ResultFanout::Counters& fanout_counters() const { return fanout_.counters(); }

private:
    struct Client {
        std::string session_id;
        std::shared_ptr<SocketSink> sink;
    };

    void handle_audio(Client& client, const std::string& payload);
    void handle_message(Client& client, const std::string& payload);
    void handle_config(Client& client, const nlohmann::json& msg);
    void handle_keywords(Client& client, const nlohmann::json& msg);
    void handle_status(Client& client);
    void handle_summary(Client& client, const nlohmann::json& msg);
    void handle_summary_context(Client& client, const nlohmann::json& msg);
    void handle_summary_context_get(Client& client);
    void handle_summary_context_clear(Client& client);

    void send(Client& client, const nlohmann::json& message);
    void send_error(Client& client, const Error& error);

    void log(const std::string& msg) const;

    Config config_;
    bool verbose_;

    IpcServer& ipc_;
    Dispatcher& dispatcher_;

    SummaryContextStore summary_context_;
    EnrichmentPipeline pipeline_;
    SummaryService summary_service_;
    SessionManager sessions_;
    ResultFanout fanout_;

    std::unordered_map<int, Client> clients_;
};
