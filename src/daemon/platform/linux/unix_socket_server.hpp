#pragma once

#include "platform/ipc_server.hpp"

#include <string>
#include <vector>

class UnixSocketServer : public IpcServer {
public:
    UnixSocketServer();
    ~UnixSocketServer() override;

    UnixSocketServer(const UnixSocketServer&) = delete;
    UnixSocketServer& operator=(const UnixSocketServer&) = delete;

    bool start(const std::string& endpoint) override;
    void stop() override;
    int server_fd() const override { return server_fd_; }
    int accept_client() override;
    bool read_frames(int client_fd, std::vector<frame::Frame>& out) override;
    std::expected<void, SendError> send_message(int client_fd,
                                                const nlohmann::json& message) override;
    void close_client(int client_fd) override;

private:
    int server_fd_ = -1;
    std::string socket_path_;

    struct ClientBuffer {
        int fd;
        frame::Decoder decoder;
    };
    std::vector<ClientBuffer> clients_;

    ClientBuffer* find_client(int fd);
};
