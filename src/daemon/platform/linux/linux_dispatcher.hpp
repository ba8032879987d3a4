#pragma once

#include "dispatcher.hpp"

#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>

// Fixed worker pool plus a loop-thread queue signalled through an eventfd.
// The event loop watches event_fd() and calls drain() when it is readable.
class LinuxDispatcher : public Dispatcher {
public:
    explicit LinuxDispatcher(int workers);
    ~LinuxDispatcher() override;

    LinuxDispatcher(const LinuxDispatcher&) = delete;
    LinuxDispatcher& operator=(const LinuxDispatcher&) = delete;

    bool start();
    void shutdown();

    void run_async(Task task) override;
    void post(Task task) override;

    int event_fd() const { return event_fd_; }

    // Runs every task posted so far. Loop thread only.
    void drain();

private:
    void worker_loop(std::stop_token stop);
    void notify();

    int worker_count_;
    int event_fd_ = -1;

    std::mutex jobs_mutex_;
    std::condition_variable_any jobs_cv_;
    std::deque<Task> jobs_;
    std::vector<std::jthread> workers_;

    std::mutex posted_mutex_;
    std::vector<Task> posted_;
};
