#ifndef EVENT_LOOP_H
#define EVENT_LOOP_H

#include <stdint.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <utility>

// Timer scheduling seam. Monitoring sessions only ever talk to this
// interface so tests can drive time by hand.
class TaskScheduler {
public:
    using TimerId = uint64_t;
    using Task = std::function<void()>;

    static constexpr TimerId INVALID_TIMER = 0;

    virtual ~TaskScheduler() = default;

    virtual TimerId scheduleAfter(std::chrono::milliseconds delay, Task task) = 0;
    // Returns true if the task was still pending. When the task is running on
    // another thread, waits for it to finish before returning false.
    virtual bool cancel(TimerId id) = 0;
};

// Single timer thread running tasks in deadline order.
class EventLoop : public TaskScheduler {
public:
    EventLoop();
    ~EventLoop() override;

    bool start();
    void stop();
    bool isRunning() const { return m_running; }

    TimerId scheduleAfter(std::chrono::milliseconds delay, Task task) override;
    bool cancel(TimerId id) override;

    size_t pendingCount() const;

private:
    using Clock = std::chrono::steady_clock;
    using Key = std::pair<Clock::time_point, TimerId>;

    void run();

    std::atomic<bool> m_running;
    std::thread m_thread;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_doneCv;
    std::map<Key, Task> m_tasks;
    std::map<TimerId, Clock::time_point> m_deadlines;
    TimerId m_nextId = 1;
    TimerId m_runningId = INVALID_TIMER;
};

#endif
