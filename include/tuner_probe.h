#ifndef TUNER_PROBE_H
#define TUNER_PROBE_H

#include <atomic>
#include <chrono>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "device_control.h"
#include "tuner_types.h"

// Raised by user-initiated tuner commands (tune, step, clear) when the
// device rejects them or cannot be reached.
class TunerCommandError : public std::runtime_error {
public:
    explicit TunerCommandError(const std::string& message)
        : std::runtime_error(message) {}
};

struct ProbeTimeouts {
    int statusMs = 750;
    int commandMs = 5000;
    int scanMs = 60000;
};

// Queries one device/tuner and returns parsed results. Reads degrade to
// nullopt or empty containers; commands throw TunerCommandError.
class TunerProbe {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    static constexpr int MAX_TUNERS = 8;

    explicit TunerProbe(DeviceControl& control,
                        ProbeTimeouts timeouts = ProbeTimeouts{},
                        Sleeper sleeper = nullptr);

    void setVerboseLogging(bool enabled);

    // nullopt means "unknown" (status query failed), not "idle".
    std::optional<TunerStatus> getTunerStatus(const std::string& device, int tuner);
    std::optional<std::string> getCurrentProgram(const std::string& device, int tuner);
    PlpTable getPlpInfo(const std::string& device, int tuner);
    L1Info getL1Info(const std::string& device, int tuner);
    std::vector<ProgramEntry> getPrograms(const std::string& device, int tuner);
    // A freshly locked tuner needs a moment before its stream table fills in,
    // so empty answers are retried with a growing back-off.
    std::vector<ProgramEntry> getProgramsWithRetry(const std::string& device, int tuner, int maxRetries = 3);

    DeviceInfo getDeviceInfo(const std::string& device);
    int getTunerCount(const std::string& device);
    std::vector<ChannelScanResult> scanChannels(const std::string& device,
                                                int tuner,
                                                const std::string& channelMap = "us-bcast");

    std::string setChannel(const std::string& device, int tuner, const std::string& channel);
    std::string setAtsc3Channel(const std::string& device,
                                int tuner,
                                const std::string& channel,
                                const std::vector<int>& plps = {});
    std::string incrementChannel(const std::string& device, int tuner);
    std::string decrementChannel(const std::string& device, int tuner);
    std::string clearTuner(const std::string& device, int tuner);

private:
    std::optional<std::string> query(const std::string& device, int tuner, const std::string& item, int timeoutMs);
    std::string command(const std::string& device, int tuner, const std::string& channel);

    DeviceControl& m_control;
    ProbeTimeouts m_timeouts;
    Sleeper m_sleeper;
    std::atomic<bool> m_verboseLogging;
};

#endif
