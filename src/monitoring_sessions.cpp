#include "monitoring_sessions.h"

#include <algorithm>
#include <exception>
#include <future>
#include <iostream>
#include <system_error>
#include <thread>

namespace {
bool hasTunedChannel(const std::optional<TunerStatus>& status) {
    return status && !status->channel.empty() && status->channel != "none";
}

const char* modeName(MonitoringMode mode) {
    return mode == MonitoringMode::Antenna ? "antenna" : "single";
}
}  // namespace

MonitoringSessionManager::MonitoringSessionManager(TunerProbe& probe,
                                                   TaskScheduler& scheduler,
                                                   std::chrono::milliseconds interval,
                                                   JobLauncher launcher)
    : m_probe(probe)
    , m_scheduler(scheduler)
    , m_interval(interval.count() > 0 ? interval : DEFAULT_INTERVAL)
    , m_launcher(std::move(launcher))
    , m_verboseLogging(false)
    , m_activeJobs(0) {
}

MonitoringSessionManager::~MonitoringSessionManager() {
    stopAll();

    std::unique_lock<std::mutex> lock(m_jobWaitMutex);
    m_jobWaitCv.wait(lock, [&]() { return m_activeJobs.load() == 0; });
}

void MonitoringSessionManager::setTunerStatusCallback(TunerStatusCallback cb) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_tunerStatusCallback = std::move(cb);
}

void MonitoringSessionManager::setAntennaStatusCallback(AntennaStatusCallback cb) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_antennaStatusCallback = std::move(cb);
}

void MonitoringSessionManager::setVerboseLogging(bool enabled) {
    m_verboseLogging = enabled;
}

void MonitoringSessionManager::startMonitoring(const std::string& clientId, const std::string& deviceId, int tuner) {
    Session session;
    session.clientId = clientId;
    session.mode = MonitoringMode::Single;
    session.deviceId = deviceId;
    session.tuner = tuner;
    std::cout << "[Monitor] client " << clientId << ": monitoring " << deviceId << " tuner " << tuner << "\n";
    startSession(session);
}

void MonitoringSessionManager::startAntennaMode(const std::string& clientId,
                                                const std::string& deviceId,
                                                int tunerCount) {
    const int clamped = std::clamp(tunerCount, 1, TunerProbe::MAX_TUNERS);
    if (clamped != tunerCount) {
        std::cerr << "[Monitor] client " << clientId << ": tuner count " << tunerCount
                  << " out of range, using " << clamped << "\n";
    }

    Session session;
    session.clientId = clientId;
    session.mode = MonitoringMode::Antenna;
    session.deviceId = deviceId;
    session.tunerCount = clamped;
    std::cout << "[Monitor] client " << clientId << ": antenna mode on " << deviceId << " with " << clamped
              << " tuners\n";
    startSession(session);
}

void MonitoringSessionManager::stopMonitoring(const std::string& clientId) {
    bool existed = false;
    TaskScheduler::TimerId timer = TaskScheduler::INVALID_TIMER;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        existed = m_sessions.count(clientId) != 0;
        timer = detachLocked(clientId);
    }
    // Outside the lock: cancel() may wait for a tick that needs it.
    m_scheduler.cancel(timer);

    if (existed) {
        std::cout << "[Monitor] client " << clientId << ": monitoring stopped\n";
    }
}

void MonitoringSessionManager::clientDisconnected(const std::string& clientId) {
    if (m_verboseLogging.load()) {
        std::cout << "[Monitor] client " << clientId << " disconnected\n";
    }
    stopMonitoring(clientId);
}

void MonitoringSessionManager::stopAll() {
    std::vector<TaskScheduler::TimerId> timers;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& entry : m_sessions) {
            timers.push_back(entry.second.timer);
        }
        m_sessions.clear();
    }
    for (TaskScheduler::TimerId timer : timers) {
        m_scheduler.cancel(timer);
    }
}

bool MonitoringSessionManager::isMonitoring(const std::string& clientId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sessions.count(clientId) != 0;
}

std::optional<MonitoringMode> MonitoringSessionManager::sessionMode(const std::string& clientId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_sessions.find(clientId);
    if (it == m_sessions.end()) {
        return std::nullopt;
    }
    return it->second.mode;
}

size_t MonitoringSessionManager::sessionCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sessions.size();
}

void MonitoringSessionManager::startSession(Session session) {
    TaskScheduler::TimerId previous = TaskScheduler::INVALID_TIMER;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        previous = detachLocked(session.clientId);
        session.epoch = m_nextEpoch++;
        Session& live = m_sessions[session.clientId];
        live = session;
        scheduleTickLocked(live, m_interval);
    }
    m_scheduler.cancel(previous);
}

TaskScheduler::TimerId MonitoringSessionManager::detachLocked(const std::string& clientId) {
    auto it = m_sessions.find(clientId);
    if (it == m_sessions.end()) {
        return TaskScheduler::INVALID_TIMER;
    }
    const TaskScheduler::TimerId timer = it->second.timer;
    m_sessions.erase(it);
    return timer;
}

void MonitoringSessionManager::scheduleTickLocked(Session& session, std::chrono::milliseconds delay) {
    const std::string clientId = session.clientId;
    const uint64_t epoch = session.epoch;
    session.timer = m_scheduler.scheduleAfter(delay, [this, clientId, epoch]() { onTimer(clientId, epoch); });
}

void MonitoringSessionManager::onTimer(const std::string& clientId, uint64_t epoch) {
    Session snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_sessions.find(clientId);
        if (it == m_sessions.end() || it->second.epoch != epoch || it->second.tickInFlight) {
            return;
        }
        it->second.timer = TaskScheduler::INVALID_TIMER;
        it->second.tickInFlight = true;
        snapshot = it->second;
    }

    if (launch([this, snapshot]() { runTick(snapshot); })) {
        return;
    }

    // No worker available; try again on the next interval.
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_sessions.find(clientId);
    if (it != m_sessions.end() && it->second.epoch == epoch) {
        it->second.tickInFlight = false;
        scheduleTickLocked(it->second, m_interval);
    }
}

bool MonitoringSessionManager::launch(std::function<void()> job) {
    m_activeJobs.fetch_add(1);
    auto tracked = [this, job]() {
        try {
            job();
        } catch (const std::exception& ex) {
            std::cerr << "[Monitor] tick worker failed: " << ex.what() << "\n";
        }
        finishJob();
    };

    if (m_launcher) {
        m_launcher(tracked);
        return true;
    }

    try {
        std::thread(tracked).detach();
    } catch (const std::system_error& ex) {
        std::cerr << "[Monitor] failed to start tick worker: " << ex.what() << "\n";
        finishJob();
        return false;
    }
    return true;
}

void MonitoringSessionManager::finishJob() {
    std::lock_guard<std::mutex> lock(m_jobWaitMutex);
    m_activeJobs.fetch_sub(1);
    m_jobWaitCv.notify_all();
}

void MonitoringSessionManager::runTick(const Session& snapshot) {
    const auto started = std::chrono::steady_clock::now();

    std::optional<TunerMonitorEvent> single;
    std::optional<std::vector<AntennaTunerStatus>> antenna;
    try {
        if (snapshot.mode == MonitoringMode::Single) {
            single = pollSingle(snapshot);
        } else {
            antenna = pollAntenna(snapshot);
        }
    } catch (const std::exception& ex) {
        std::cerr << "[Monitor] " << modeName(snapshot.mode) << " tick for client " << snapshot.clientId
                  << " failed: " << ex.what() << "\n";
    }

    const auto elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);

    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_sessions.find(snapshot.clientId);
    if (it == m_sessions.end() || it->second.epoch != snapshot.epoch) {
        if (m_verboseLogging.load()) {
            std::cout << "[Monitor] dropping late tick for client " << snapshot.clientId << "\n";
        }
        return;
    }

    Session& live = it->second;
    live.tickInFlight = false;
    try {
        if (single && m_tunerStatusCallback) {
            m_tunerStatusCallback(live.clientId, *single);
        }
        if (antenna && m_antennaStatusCallback) {
            m_antennaStatusCallback(live.clientId, *antenna);
        }
    } catch (const std::exception& ex) {
        std::cerr << "[Monitor] event delivery to client " << live.clientId << " failed: " << ex.what() << "\n";
    }

    // A slow tick pushes the next one back instead of overlapping it.
    const std::chrono::milliseconds delay = std::max(std::chrono::milliseconds(0), m_interval - elapsed);
    scheduleTickLocked(live, delay);
}

TunerMonitorEvent MonitoringSessionManager::pollSingle(const Session& snapshot) {
    TunerMonitorEvent event;
    event.tuner = snapshot.tuner;

    auto program = std::async(std::launch::async, [this, &snapshot]() {
        return m_probe.getCurrentProgram(snapshot.deviceId, snapshot.tuner);
    });
    event.status = m_probe.getTunerStatus(snapshot.deviceId, snapshot.tuner);
    event.currentProgram = program.get();

    // Idle tuners skip the ATSC 3.0 tables.
    if (hasTunedChannel(event.status)) {
        auto l1 = std::async(std::launch::async, [this, &snapshot]() {
            return m_probe.getL1Info(snapshot.deviceId, snapshot.tuner);
        });
        event.plpInfo = m_probe.getPlpInfo(snapshot.deviceId, snapshot.tuner);
        event.l1Info = l1.get();
    }
    return event;
}

std::vector<AntennaTunerStatus> MonitoringSessionManager::pollAntenna(const Session& snapshot) {
    std::vector<std::future<std::optional<TunerStatus>>> pending;
    pending.reserve(static_cast<size_t>(snapshot.tunerCount));
    for (int tuner = 0; tuner < snapshot.tunerCount; tuner++) {
        try {
            pending.push_back(std::async(std::launch::async, [this, &snapshot, tuner]() {
                return m_probe.getTunerStatus(snapshot.deviceId, tuner);
            }));
        } catch (const std::system_error& ex) {
            std::cerr << "[Monitor] cannot poll tuner " << tuner << ": " << ex.what() << "\n";
            pending.emplace_back();
        }
    }

    std::vector<AntennaTunerStatus> tuners;
    tuners.reserve(pending.size());
    for (size_t i = 0; i < pending.size(); i++) {
        AntennaTunerStatus entry;
        entry.tuner = static_cast<int>(i);
        if (pending[i].valid()) {
            try {
                entry.status = pending[i].get();
            } catch (const std::exception& ex) {
                std::cerr << "[Monitor] tuner " << i << " poll failed: " << ex.what() << "\n";
            }
        }
        tuners.push_back(entry);
    }
    return tuners;
}
