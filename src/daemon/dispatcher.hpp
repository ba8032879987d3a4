#pragma once

#include <functional>

// Schedules work relative to the daemon's event loop.
class Dispatcher {
public:
    using Task = std::function<void()>;

    virtual ~Dispatcher() = default;

    // Runs `task` on a worker thread, off the event loop.
    virtual void run_async(Task task) = 0;

    // Queues `task` to run on the event-loop thread. Safe from any thread.
    virtual void post(Task task) = 0;
};
