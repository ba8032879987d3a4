#pragma once

#include "common/frame.hpp"
#include "platform/ipc_client.hpp"

#include <deque>

class UnixSocketClient : public IpcClient {
public:
    UnixSocketClient();
    ~UnixSocketClient() override;

    UnixSocketClient(const UnixSocketClient&) = delete;
    UnixSocketClient& operator=(const UnixSocketClient&) = delete;

    bool connect(const std::string& endpoint) override;
    bool send_json(const nlohmann::json& message) override;
    bool send_audio(std::span<const uint8_t> pcm) override;
    bool recv(nlohmann::json& message, int timeout_ms = 30000) override;
    void close() override;

private:
    bool send_all(const std::string& data);

    int fd_ = -1;
    frame::Decoder decoder_;
    std::deque<frame::Frame> pending_;
};
