#include "output/socket_sink.hpp"

SocketSink::SocketSink(IpcServer& server, int fd) : server_(server), fd_(fd) {}

std::expected<void, SendError> SocketSink::send(const nlohmann::json& message) {
    if (!open_) {
        return std::unexpected(SendError{.message = "connection closed"});
    }
    auto sent = server_.send_message(fd_, message);
    if (!sent && sent.error().partial) {
        open_ = false;
    }
    return sent;
}
