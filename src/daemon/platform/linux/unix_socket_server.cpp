#include "platform/linux/unix_socket_server.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <format>
#include <poll.h>
#include <print>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace {

// Upper bound on how long a send waits for a slow reader.
constexpr int SEND_TIMEOUT_MS = 1000;

// recv() calls per wakeup; epoll is level-triggered, so leftovers are read
// on the next iteration after other clients had their turn.
constexpr int MAX_READS_PER_WAKEUP = 2;

} // namespace

UnixSocketServer::UnixSocketServer() = default;

UnixSocketServer::~UnixSocketServer() {
    stop();
}

bool UnixSocketServer::start(const std::string& socket_path) {
    socket_path_ = socket_path;

    // Remove stale socket
    ::unlink(socket_path.c_str());

    server_fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        std::println(stderr, "ipc: socket() failed: {}", std::strerror(errno));
        return false;
    }

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (socket_path.size() >= sizeof(addr.sun_path)) {
        std::println(stderr, "ipc: socket path too long: {}", socket_path);
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }
    std::strncpy(addr.sun_path, socket_path.c_str(), sizeof(addr.sun_path) - 1);

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::println(stderr, "ipc: bind() failed: {}", std::strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (::listen(server_fd_, 16) < 0) {
        std::println(stderr, "ipc: listen() failed: {}", std::strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    return true;
}

void UnixSocketServer::stop() {
    for (auto& c : clients_) {
        ::close(c.fd);
    }
    clients_.clear();

    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }

    if (!socket_path_.empty()) {
        ::unlink(socket_path_.c_str());
        socket_path_.clear();
    }
}

int UnixSocketServer::accept_client() {
    int fd = ::accept4(server_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (fd < 0) {
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            std::println(stderr, "ipc: accept4() failed: {}", std::strerror(errno));
        }
        return -1;
    }
    clients_.push_back({fd, {}});
    return fd;
}

bool UnixSocketServer::read_frames(int client_fd, std::vector<frame::Frame>& out) {
    auto* client = find_client(client_fd);
    if (!client) return false;

    char buf[16384];
    for (int reads = 0; reads < MAX_READS_PER_WAKEUP;) {
        ssize_t n = ::recv(client_fd, buf, sizeof(buf), 0);
        if (n == 0) return false; // peer closed
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
            std::println(stderr, "ipc: recv() failed: {}", std::strerror(errno));
            return false;
        }

        if (!client->decoder.feed(buf, static_cast<size_t>(n), out)) {
            std::println(stderr, "ipc: client {} sent a malformed frame", client_fd);
            return false;
        }
        reads++;
    }
    return true;
}

std::expected<void, SendError> UnixSocketServer::send_message(int client_fd,
                                                              const nlohmann::json& message) {
    std::string data = frame::encode(frame::Kind::Text, message.dump());

    size_t sent = 0;
    auto fail = [&](std::string reason) {
        SendError error{.message = std::move(reason), .partial = sent > 0};
        if (error.partial) {
            error.message += std::format(" after {}/{} bytes", sent, data.size());
            // The peer holds a truncated frame; the loop sees EOF and disconnects.
            ::shutdown(client_fd, SHUT_RDWR);
        }
        return std::unexpected(std::move(error));
    };

    while (sent < data.size()) {
        ssize_t n = ::send(client_fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n >= 0) {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (errno == EINTR) continue;
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            return fail(std::string("send failed: ") + std::strerror(errno));
        }

        pollfd pfd{.fd = client_fd, .events = POLLOUT, .revents = 0};
        int ready = ::poll(&pfd, 1, SEND_TIMEOUT_MS);
        if (ready == 0) return fail("send timed out");
        if (ready < 0 && errno != EINTR) {
            return fail(std::string("poll failed: ") + std::strerror(errno));
        }
    }
    return {};
}

void UnixSocketServer::close_client(int client_fd) {
    ::close(client_fd);
    std::erase_if(clients_, [client_fd](const ClientBuffer& c) { return c.fd == client_fd; });
}

UnixSocketServer::ClientBuffer* UnixSocketServer::find_client(int fd) {
    auto it = std::ranges::find_if(clients_, [fd](const ClientBuffer& c) { return c.fd == fd; });
    return it != clients_.end() ? &*it : nullptr;
}
