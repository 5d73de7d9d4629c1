#ifndef MONITORING_SESSIONS_H
#define MONITORING_SESSIONS_H

#include <stdint.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "event_loop.h"
#include "tuner_probe.h"
#include "tuner_types.h"

enum class MonitoringMode {
    Single,
    Antenna
};

// Payload of one single-tuner tick.
struct TunerMonitorEvent {
    int tuner = 0;
    std::optional<TunerStatus> status;
    std::optional<std::string> currentProgram;
    PlpTable plpInfo;
    L1Info l1Info;
};

struct AntennaTunerStatus {
    int tuner = 0;
    std::optional<TunerStatus> status;
};

// Runs one polling loop per connected client. Starting a session always
// replaces the client's previous one; stopping is idempotent.
//
// Ticks of a session never overlap: the next tick is scheduled once the
// previous one has finished. Every session carries an epoch and a finished
// tick whose epoch no longer matches the live session is dropped.
//
// Event callbacks run with the session lock held and must not call back
// into the manager.
class MonitoringSessionManager {
public:
    using TunerStatusCallback = std::function<void(const std::string& clientId, const TunerMonitorEvent& event)>;
    using AntennaStatusCallback =
        std::function<void(const std::string& clientId, const std::vector<AntennaTunerStatus>& tuners)>;
    using JobLauncher = std::function<void(std::function<void()> job)>;

    static constexpr std::chrono::milliseconds DEFAULT_INTERVAL{1000};

    // Without a launcher each tick runs on its own worker thread so the
    // scheduler thread never waits on device I/O.
    MonitoringSessionManager(TunerProbe& probe,
                             TaskScheduler& scheduler,
                             std::chrono::milliseconds interval = DEFAULT_INTERVAL,
                             JobLauncher launcher = nullptr);
    ~MonitoringSessionManager();

    MonitoringSessionManager(const MonitoringSessionManager&) = delete;
    MonitoringSessionManager& operator=(const MonitoringSessionManager&) = delete;

    void setTunerStatusCallback(TunerStatusCallback cb);
    void setAntennaStatusCallback(AntennaStatusCallback cb);
    void setVerboseLogging(bool enabled);

    void startMonitoring(const std::string& clientId, const std::string& deviceId, int tuner);
    void startAntennaMode(const std::string& clientId, const std::string& deviceId, int tunerCount);
    void stopMonitoring(const std::string& clientId);
    void clientDisconnected(const std::string& clientId);
    void stopAll();

    bool isMonitoring(const std::string& clientId) const;
    std::optional<MonitoringMode> sessionMode(const std::string& clientId) const;
    size_t sessionCount() const;

private:
    struct Session {
        std::string clientId;
        MonitoringMode mode = MonitoringMode::Single;
        std::string deviceId;
        int tuner = 0;
        int tunerCount = 0;
        uint64_t epoch = 0;
        TaskScheduler::TimerId timer = TaskScheduler::INVALID_TIMER;
        bool tickInFlight = false;
    };

    void startSession(Session session);
    TaskScheduler::TimerId detachLocked(const std::string& clientId);
    void scheduleTickLocked(Session& session, std::chrono::milliseconds delay);
    void onTimer(const std::string& clientId, uint64_t epoch);
    void runTick(const Session& snapshot);
    TunerMonitorEvent pollSingle(const Session& snapshot);
    std::vector<AntennaTunerStatus> pollAntenna(const Session& snapshot);
    bool launch(std::function<void()> job);
    void finishJob();

    TunerProbe& m_probe;
    TaskScheduler& m_scheduler;
    std::chrono::milliseconds m_interval;
    JobLauncher m_launcher;
    std::atomic<bool> m_verboseLogging;

    mutable std::mutex m_mutex;
    std::map<std::string, Session> m_sessions;
    uint64_t m_nextEpoch = 1;
    TunerStatusCallback m_tunerStatusCallback;
    AntennaStatusCallback m_antennaStatusCallback;

    std::atomic<int> m_activeJobs;
    std::mutex m_jobWaitMutex;
    std::condition_variable m_jobWaitCv;
};

#endif
