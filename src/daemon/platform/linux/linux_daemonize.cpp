#include "platform/daemonizer.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <print>
#include <unistd.h>

namespace platform {

bool daemonize(const std::string& log_path) {
    // Opened before forking so a bad path is reported on the terminal.
    int log_fd = open(log_path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0600);
    if (log_fd < 0) {
        std::println(stderr, "daemon: cannot open log {}: {}", log_path, std::strerror(errno));
        return false;
    }

    pid_t pid = fork();
    if (pid < 0) {
        std::println(stderr, "daemon: fork() failed: {}", std::strerror(errno));
        close(log_fd);
        return false;
    }
    if (pid > 0) _exit(0);

    if (setsid() < 0) _exit(1);

    pid = fork();
    if (pid < 0) _exit(1);
    if (pid > 0) _exit(0);

    int null_fd = open("/dev/null", O_RDWR);
    if (null_fd < 0) _exit(1);
    dup2(null_fd, STDIN_FILENO);
    dup2(null_fd, STDOUT_FILENO);
    dup2(log_fd, STDERR_FILENO);
    close(null_fd);
    close(log_fd);

    // stderr is line buffered on a terminal only.
    std::setvbuf(stderr, nullptr, _IOLBF, 0);
    return true;
}

} // namespace platform
