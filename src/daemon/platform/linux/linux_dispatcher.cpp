#include "platform/linux/linux_dispatcher.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <exception>
#include <print>
#include <sys/eventfd.h>
#include <unistd.h>

LinuxDispatcher::LinuxDispatcher(int workers) : worker_count_(workers > 0 ? workers : 1) {}

LinuxDispatcher::~LinuxDispatcher() {
    shutdown();
    if (event_fd_ >= 0) ::close(event_fd_);
}

bool LinuxDispatcher::start() {
    event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (event_fd_ < 0) {
        std::println(stderr, "dispatcher: eventfd failed: {}", std::strerror(errno));
        return false;
    }

    workers_.reserve(worker_count_);
    for (int i = 0; i < worker_count_; i++) {
        workers_.emplace_back([this](std::stop_token stop) { worker_loop(stop); });
    }
    return true;
}

void LinuxDispatcher::shutdown() {
    for (auto& worker : workers_) worker.request_stop();
    jobs_cv_.notify_all();
    workers_.clear(); // joins

    std::lock_guard lock(jobs_mutex_);
    if (!jobs_.empty()) {
        std::println(stderr, "dispatcher: dropping {} queued job(s) at shutdown", jobs_.size());
        jobs_.clear();
    }
}

void LinuxDispatcher::run_async(Task task) {
    {
        std::lock_guard lock(jobs_mutex_);
        jobs_.push_back(std::move(task));
    }
    jobs_cv_.notify_one();
}

void LinuxDispatcher::post(Task task) {
    {
        std::lock_guard lock(posted_mutex_);
        posted_.push_back(std::move(task));
    }
    notify();
}

void LinuxDispatcher::drain() {
    uint64_t val;
    if (::read(event_fd_, &val, sizeof(val)) < 0 && errno != EAGAIN) {
        std::println(stderr, "dispatcher: eventfd read failed: {}", std::strerror(errno));
    }

    std::vector<Task> tasks;
    {
        std::lock_guard lock(posted_mutex_);
        tasks.swap(posted_);
    }
    for (auto& task : tasks) task();
}

void LinuxDispatcher::worker_loop(std::stop_token stop) {
    while (true) {
        Task task;
        {
            std::unique_lock lock(jobs_mutex_);
            if (!jobs_cv_.wait(lock, stop, [this] { return !jobs_.empty(); })) {
                return; // stop requested
            }
            task = std::move(jobs_.front());
            jobs_.pop_front();
        }

        try {
            task();
        } catch (const std::exception& e) {
            std::println(stderr, "dispatcher: job failed: {}", e.what());
        }
    }
}

void LinuxDispatcher::notify() {
    uint64_t val = 1;
    if (::write(event_fd_, &val, sizeof(val)) < 0 && errno != EAGAIN) {
        std::println(stderr, "dispatcher: eventfd write failed: {}", std::strerror(errno));
    }
}
