#include "event_loop.h"

#include <exception>
#include <iostream>

EventLoop::EventLoop()
    : m_running(false) {
}

EventLoop::~EventLoop() {
    stop();
}

bool EventLoop::start() {
    if (m_running) {
        return false;
    }
    m_running = true;
    m_thread = std::thread([this]() { run(); });
    return true;
}

void EventLoop::stop() {
    if (!m_running) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_running = false;
    }
    m_cv.notify_all();
    if (m_thread.joinable()) {
        m_thread.join();
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_tasks.clear();
    m_deadlines.clear();
}

TaskScheduler::TimerId EventLoop::scheduleAfter(std::chrono::milliseconds delay, Task task) {
    if (delay.count() < 0) {
        delay = std::chrono::milliseconds(0);
    }
    TimerId id = INVALID_TIMER;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        id = m_nextId++;
        const Clock::time_point due = Clock::now() + delay;
        m_tasks.emplace(Key(due, id), std::move(task));
        m_deadlines[id] = due;
    }
    m_cv.notify_all();
    return id;
}

bool EventLoop::cancel(TimerId id) {
    if (id == INVALID_TIMER) {
        return false;
    }
    std::unique_lock<std::mutex> lock(m_mutex);
    auto it = m_deadlines.find(id);
    if (it != m_deadlines.end()) {
        m_tasks.erase(Key(it->second, id));
        m_deadlines.erase(it);
        return true;
    }

    if (std::this_thread::get_id() != m_thread.get_id()) {
        m_doneCv.wait(lock, [&]() { return m_runningId != id; });
    }
    return false;
}

size_t EventLoop::pendingCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tasks.size();
}

void EventLoop::run() {
    std::unique_lock<std::mutex> lock(m_mutex);
    while (m_running) {
        if (m_tasks.empty()) {
            m_cv.wait(lock);
            continue;
        }

        auto next = m_tasks.begin();
        const Clock::time_point due = next->first.first;
        if (Clock::now() < due) {
            m_cv.wait_until(lock, due);
            continue;
        }

        const TimerId id = next->first.second;
        Task task = std::move(next->second);
        m_tasks.erase(next);
        m_deadlines.erase(id);
        m_runningId = id;

        lock.unlock();
        try {
            task();
        } catch (const std::exception& ex) {
            std::cerr << "[Loop] task " << id << " failed: " << ex.what() << "\n";
        }
        lock.lock();

        m_runningId = INVALID_TIMER;
        m_doneCv.notify_all();
    }
}
