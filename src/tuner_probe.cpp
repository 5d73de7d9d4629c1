#include "tuner_probe.h"

#include <algorithm>
#include <cctype>
#include <future>
#include <iostream>
#include <sstream>
#include <thread>

#include "signal_estimate.h"
#include "status_parser.h"

namespace {
constexpr std::chrono::milliseconds kFirstRetryDelay(1500);
constexpr std::chrono::milliseconds kLaterRetryDelay(2000);

std::string tunerPath(int tuner, const std::string& item) {
    return "/tuner" + std::to_string(tuner) + "/" + item;
}

std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return value;
}

int tunerCountFromModel(const std::string& model) {
    const std::string upper = toUpper(model);
    if (upper.find("PRIME") != std::string::npos) {
        return 3;
    }
    if (upper.find("QUATTRO") != std::string::npos || upper.find("QUATRO") != std::string::npos) {
        return 4;
    }
    return 2;
}

bool modelSupportsAtsc3(const std::string& model) {
    const std::string upper = toUpper(model);
    return upper.find("ATSC3") != std::string::npos || upper.find("4K") != std::string::npos;
}
}  // namespace

TunerProbe::TunerProbe(DeviceControl& control, ProbeTimeouts timeouts, Sleeper sleeper)
    : m_control(control)
    , m_timeouts(timeouts)
    , m_sleeper(std::move(sleeper))
    , m_verboseLogging(false) {
    if (!m_sleeper) {
        m_sleeper = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
    }
}

void TunerProbe::setVerboseLogging(bool enabled) {
    m_verboseLogging = enabled;
}

std::optional<std::string> TunerProbe::query(const std::string& device,
                                             int tuner,
                                             const std::string& item,
                                             int timeoutMs) {
    const CommandResult result = m_control.get(device, tunerPath(tuner, item), timeoutMs);
    if (!result.ok) {
        if (m_verboseLogging) {
            std::cout << "[Probe] " << device << " tuner" << tuner << " " << item
                      << " failed: " << result.error << "\n";
        }
        return std::nullopt;
    }
    return result.output;
}

std::optional<TunerStatus> TunerProbe::getTunerStatus(const std::string& device, int tuner) {
    auto debugFuture = std::async(std::launch::async, [this, &device, tuner]() {
        return query(device, tuner, "debug", m_timeouts.statusMs);
    });
    const std::optional<std::string> statusText = query(device, tuner, "status", m_timeouts.statusMs);
    const std::optional<std::string> debugText = debugFuture.get();

    if (!statusText) {
        return std::nullopt;
    }

    TunerStatus status = parseStatusLine(*statusText);
    if (status.channel == "none") {
        // Idle tuner; the debug counters carry nothing useful.
        return status;
    }

    if (debugText) {
        const std::optional<DebugCounters> counters = parseDebugCounters(*debugText);
        if (counters) {
            const SignalEstimate estimate = estimateSignal(counters->signalRaw, counters->snrRaw);
            status.ssDb = estimate.ssDb;
            status.snrDb = estimate.snrDb;
            status.debugRaw = std::to_string(counters->signalRaw) + "-" + std::to_string(counters->snrRaw) +
                              "/" + std::to_string(counters->thirdValue);
            if (m_verboseLogging) {
                std::cout << "[Probe] dB estimate: raw " << *status.debugRaw << " -> " << estimate.ssDb
                          << " dBm, " << estimate.snrDb << " dB\n";
            }
        }
    }
    return status;
}

std::optional<std::string> TunerProbe::getCurrentProgram(const std::string& device, int tuner) {
    const std::optional<std::string> program = query(device, tuner, "program", m_timeouts.statusMs);
    if (!program || program->empty() || *program == "none") {
        return std::nullopt;
    }
    return program;
}

PlpTable TunerProbe::getPlpInfo(const std::string& device, int tuner) {
    const std::optional<std::string> text = query(device, tuner, "plpinfo", m_timeouts.statusMs);
    if (!text) {
        return PlpTable();
    }
    return parsePlpTable(*text);
}

L1Info TunerProbe::getL1Info(const std::string& device, int tuner) {
    const std::optional<std::string> text = query(device, tuner, "l1info", m_timeouts.statusMs);
    if (!text) {
        return L1Info();
    }
    return parseL1Table(*text);
}

std::vector<ProgramEntry> TunerProbe::getPrograms(const std::string& device, int tuner) {
    const std::optional<std::string> text = query(device, tuner, "streaminfo", m_timeouts.commandMs);
    if (!text) {
        return {};
    }
    return parsePrograms(*text);
}

std::vector<ProgramEntry> TunerProbe::getProgramsWithRetry(const std::string& device, int tuner, int maxRetries) {
    const std::optional<TunerStatus> status = getTunerStatus(device, tuner);
    if (!status || !status->lock || status->channel.empty() || status->channel == "none") {
        return {};
    }

    for (int attempt = 0;; attempt++) {
        std::vector<ProgramEntry> programs = getPrograms(device, tuner);
        if (!programs.empty()) {
            return programs;
        }
        if (attempt >= maxRetries) {
            break;
        }
        const std::chrono::milliseconds delay = (attempt == 0) ? kFirstRetryDelay : kLaterRetryDelay;
        if (m_verboseLogging) {
            std::cout << "[Probe] no programs yet on " << device << " tuner" << tuner << ", retry "
                      << (attempt + 1) << "/" << maxRetries << " in " << delay.count() << " ms\n";
        }
        m_sleeper(delay);
    }
    return {};
}

int TunerProbe::getTunerCount(const std::string& device) {
    std::vector<std::future<bool>> checks;
    checks.reserve(MAX_TUNERS);
    for (int tuner = 0; tuner < MAX_TUNERS; tuner++) {
        checks.push_back(std::async(std::launch::async, [this, &device, tuner]() {
            // A tuner exists if it answers, even with "none".
            return m_control.get(device, tunerPath(tuner, "status"), m_timeouts.commandMs).ok;
        }));
    }

    int count = 0;
    for (std::future<bool>& check : checks) {
        if (check.get()) {
            count++;
        }
    }
    return count;
}

DeviceInfo TunerProbe::getDeviceInfo(const std::string& device) {
    DeviceInfo info;
    const CommandResult model = m_control.get(device, "/sys/model", m_timeouts.commandMs);
    if (!model.ok) {
        info.model = "Unknown";
        info.tuners = 2;
        info.atsc3Support = false;
        return info;
    }

    info.model = model.output;
    const int counted = getTunerCount(device);
    info.tuners = counted > 0 ? counted : tunerCountFromModel(info.model);
    info.atsc3Support = modelSupportsAtsc3(info.model);
    return info;
}

std::vector<ChannelScanResult> TunerProbe::scanChannels(const std::string& device,
                                                        int tuner,
                                                        const std::string& channelMap) {
    const CommandResult result = m_control.scan(device, tuner, channelMap, m_timeouts.scanMs);
    if (!result.ok) {
        std::cerr << "[Probe] scan of " << device << " tuner" << tuner << " failed: " << result.error << "\n";
        return {};
    }
    return parseScanOutput(result.output);
}

std::string TunerProbe::command(const std::string& device, int tuner, const std::string& channel) {
    const CommandResult result = m_control.set(device, tunerPath(tuner, "channel"), channel, m_timeouts.commandMs);
    if (!result.ok) {
        throw TunerCommandError("set channel " + channel + " on " + device + " tuner" + std::to_string(tuner) +
                                " failed: " + result.error);
    }
    return result.output;
}

std::string TunerProbe::setChannel(const std::string& device, int tuner, const std::string& channel) {
    return command(device, tuner, channel);
}

std::string TunerProbe::setAtsc3Channel(const std::string& device,
                                        int tuner,
                                        const std::string& channel,
                                        const std::vector<int>& plps) {
    std::ostringstream channelStr;
    channelStr << "atsc3:" << channel;
    for (size_t i = 0; i < plps.size(); i++) {
        channelStr << (i == 0 ? ":" : "+") << plps[i];
    }
    return command(device, tuner, channelStr.str());
}

std::string TunerProbe::incrementChannel(const std::string& device, int tuner) {
    return command(device, tuner, "+");
}

std::string TunerProbe::decrementChannel(const std::string& device, int tuner) {
    return command(device, tuner, "-");
}

std::string TunerProbe::clearTuner(const std::string& device, int tuner) {
    return command(device, tuner, "none");
}
