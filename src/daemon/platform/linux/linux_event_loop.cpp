#include "platform/linux/linux_event_loop.hpp"

#include "engine/lan_engine.hpp"
#include "platform/platform_paths.hpp"

#include <cerrno>
#include <cstring>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/signalfd.h>
#include <unistd.h>
#include <vector>

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      dispatcher_(config_.session.workers),
      llm_(config_.llm, verbose_),
      core_(config_, verbose_, ipc_server_, dispatcher_, llm_,
            make_lan_engine_factory(config_.engine)) {}

LinuxEventLoop::~LinuxEventLoop() {
    // Workers may still reference core_; join them before members go away.
    dispatcher_.shutdown();
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
}

bool LinuxEventLoop::init() {
    auto ipc_path = config_.server.socket.empty() ? platform::ipc_endpoint() : config_.server.socket;
    if (!ipc_server_.start(ipc_path)) return false;
    log("IPC listening on " + ipc_path);

    if (!llm_.available()) {
        std::println(stderr, "llm: {} is not usable, transcripts will not be enriched",
                     config_.llm.endpoint);
    }

    if (!dispatcher_.start()) return false;

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    // Signal handling via signalfd
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    auto add_fd = [this](int fd) {
        epoll_event ev{.events = EPOLLIN, .data = {.fd = fd}};
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) < 0) {
            std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
            return false;
        }
        return true;
    };

    if (!add_fd(signal_fd_) || !add_fd(ipc_server_.server_fd()) ||
        !add_fd(dispatcher_.event_fd())) {
        return false;
    }

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 32;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) > 0) {
                    log("Received signal, shutting down");
                }
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == ipc_server_.server_fd()) {
                int client_fd = ipc_server_.accept_client();
                if (client_fd < 0) continue;

                epoll_event ev{.events = EPOLLIN, .data = {.fd = client_fd}};
                if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev) < 0) {
                    std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
                    ipc_server_.close_client(client_fd);
                    continue;
                }
                if (!core_.on_client_connected(client_fd)) {
                    epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, client_fd, nullptr);
                    ipc_server_.close_client(client_fd);
                }
                continue;
            }

            if (fd == dispatcher_.event_fd()) {
                dispatcher_.drain();
                continue;
            }

            // Client fd
            std::vector<frame::Frame> frames;
            bool alive = ipc_server_.read_frames(fd, frames);
            for (const auto& f : frames) {
                if (!core_.on_frame(fd, f)) {
                    alive = false;
                    break;
                }
            }
            if (!alive) {
                disconnect(fd);
            }
        }
    }

    // Clean shutdown
    core_.shutdown();
    dispatcher_.shutdown();
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::disconnect(int fd) {
    epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
    core_.on_client_disconnected(fd);
    ipc_server_.close_client(fd);
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[livescribe] {}", msg);
    }
}
