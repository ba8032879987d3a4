#pragma once

#include "common/frame.hpp"
#include "errors.hpp"

#include <expected>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

class IpcServer {
public:
    virtual ~IpcServer() = default;
    virtual bool start(const std::string& endpoint) = 0;
    virtual void stop() = 0;
    virtual int server_fd() const = 0;
    virtual int accept_client() = 0;

    // Appends every complete frame that is available. Returns false once the
    // client is gone (EOF, read error) or broke the framing; frames decoded
    // before that are still appended.
    virtual bool read_frames(int client_fd, std::vector<frame::Frame>& out) = 0;

    // Writes one framed message. After a partial write the connection is
    // shut down, so the next read reports the client as gone.
    virtual std::expected<void, SendError> send_message(int client_fd,
                                                        const nlohmann::json& message) = 0;
    virtual void close_client(int client_fd) = 0;
};
