#pragma once

#include "output/transport_sink.hpp"
#include "platform/ipc_server.hpp"

// TransportSink over one connected IPC client. Loop thread only.
class SocketSink : public TransportSink {
public:
    SocketSink(IpcServer& server, int fd);

    bool is_open() const override { return open_; }
    // A partial write closes the sink; nothing more can be framed on it.
    std::expected<void, SendError> send(const nlohmann::json& message) override;

    // Called before the fd is closed, so a late delivery cannot reach a reused fd.
    void close() { open_ = false; }

    int fd() const { return fd_; }

private:
    IpcServer& server_;
    int fd_;
    bool open_ = true;
};
