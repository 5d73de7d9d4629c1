#include <iostream>
#include <csignal>
#include <atomic>
#include <chrono>
#include <cstring>
#include <exception>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "cloud_discovery.h"
#include "config.h"
#include "discovery_service.h"
#include "event_loop.h"
#include "hdhr_config_tool.h"
#include "https_client.h"
#include "json_codec.h"
#include "monitoring_sessions.h"
#include "tuner_probe.h"
#include "udp_discovery.h"

static std::atomic<bool> g_running(true);

namespace {
constexpr const char* kConsoleClient = "console";

bool parseIntArg(const std::string& name, const std::string& value, int& out) {
    size_t used = 0;
    try {
        out = std::stoi(value, &used);
    } catch (const std::exception& ex) {
        std::cerr << "[CLI] invalid " << name << ": " << value << " (" << ex.what() << ")\n";
        return false;
    }
    if (used != value.size()) {
        std::cerr << "[CLI] invalid " << name << ": " << value << "\n";
        return false;
    }
    return true;
}

bool parseTunerArg(const std::string& value, int& tuner) {
    if (!parseIntArg("tuner", value, tuner)) {
        return false;
    }
    if (tuner < 0 || tuner >= TunerProbe::MAX_TUNERS) {
        std::cerr << "[CLI] tuner out of range: " << value << "\n";
        return false;
    }
    return true;
}

// "1,2" or "1+2" -> {1, 2}
bool parsePlpList(const std::string& value, std::vector<int>& plps) {
    std::string normalized = value;
    for (char& c : normalized) {
        if (c == ',' || c == '+') {
            c = ' ';
        }
    }
    std::istringstream in(normalized);
    std::string token;
    while (in >> token) {
        int plp = 0;
        if (!parseIntArg("plp", token, plp) || plp < 0 || plp > 63) {
            return false;
        }
        plps.push_back(plp);
    }
    return true;
}

void printJson(const nlohmann::json& value) {
    std::cout << value.dump() << std::endl;
}
}  // namespace

void signalHandler(int) {
    g_running = false;
}

void printUsage(const char* prog) {
    std::cout << "Usage: " << prog << " [options] <command> [args]\n"
              << "Commands:\n"
              << "  list                                   Discover devices\n"
              << "  info <device>                          Model, tuner count and ATSC 3.0 support\n"
              << "  status <device> <tuner>                Tuner status with dB estimates\n"
              << "  programs <device> <tuner>              Programs on the tuned channel\n"
              << "  plp <device> <tuner>                   ATSC 3.0 PLP table\n"
              << "  l1 <device> <tuner>                    ATSC 3.0 L1 parameters\n"
              << "  scan <device> <tuner> [map]            Channel scan (default map: us-bcast)\n"
              << "  set-channel <device> <tuner> <ch>      Tune a channel\n"
              << "  atsc3 <device> <tuner> <ch> [plps]     Tune an ATSC 3.0 channel, plps like 0,1\n"
              << "  channel-up <device> <tuner>            Step to the next channel\n"
              << "  channel-down <device> <tuner>          Step to the previous channel\n"
              << "  clear <device> <tuner>                 Release the tuner\n"
              << "  monitor <device> <tuner>               Stream tuner events until interrupted\n"
              << "  antenna <device> [tuners]              Stream all tuner statuses until interrupted\n"
              << "Options:\n"
              << "  -c, --config <file>    INI config file\n"
              << "      --host <addr>      Manual device host (repeatable)\n"
              << "      --no-auto-discovery  Only use manual hosts\n"
              << "      --tool <path>      hdhomerun_config binary\n"
              << "      --refresh          Bypass discovery caches\n"
              << "  -v, --verbose          Verbose logging\n"
              << "  -h, --help             Show this help\n";
}

int main(int argc, char* argv[]) {
    std::string configPath;
    for (int i = 1; i < argc; i++) {
        const std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            configPath = argv[++i];
            continue;
        }
        static constexpr const char* kConfigPrefix = "--config=";
        if (arg.rfind(kConfigPrefix, 0) == 0) {
            configPath = arg.substr(std::strlen(kConfigPrefix));
        }
    }

    Config config;
    config.loadDefaults();
    if (!configPath.empty() && !config.loadFromFile(configPath)) {
        return 1;
    }

    bool forceRefresh = false;
    std::vector<std::string> positional;

    auto readValue = [&](int& index, const std::string& current, const std::string& longName) -> std::string {
        const std::string prefix = "--" + longName + "=";
        if (current.rfind(prefix, 0) == 0) {
            return current.substr(prefix.length());
        }
        if (index + 1 < argc) {
            index++;
            return argv[index];
        }
        return std::string();
    };

    for (int i = 1; i < argc; i++) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--verbose") {
            config.debug.log_level = 2;
            continue;
        }
        if (arg == "--refresh") {
            forceRefresh = true;
            continue;
        }
        if (arg == "--no-auto-discovery") {
            config.discovery.auto_discovery = false;
            continue;
        }
        if (arg == "-c" || arg == "--config" || arg.rfind("--config=", 0) == 0) {
            if (readValue(i, arg, "config").empty()) {
                std::cerr << "[CLI] missing value for --config\n";
                return 1;
            }
            continue;
        }
        if (arg == "--host" || arg.rfind("--host=", 0) == 0) {
            const std::string value = readValue(i, arg, "host");
            if (value.empty()) {
                std::cerr << "[CLI] missing value for --host\n";
                return 1;
            }
            for (const std::string& host : splitHostList(value)) {
                config.discovery.manual_hosts.push_back(host);
            }
            continue;
        }
        if (arg == "--tool" || arg.rfind("--tool=", 0) == 0) {
            const std::string value = readValue(i, arg, "tool");
            if (value.empty()) {
                std::cerr << "[CLI] missing value for --tool\n";
                return 1;
            }
            config.device.config_tool = value;
            continue;
        }
        if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "[CLI] unknown option: " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        }
        positional.push_back(arg);
    }

    if (positional.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    const bool verboseLogging = config.debug.log_level >= 2;
    if (config.debug.log_level > 0) {
        std::cerr << "[APP] hdhr-signal version " << HDHR_SIGNAL_VERSION << "\n";
    }
    if (verboseLogging && !configPath.empty()) {
        std::cout << "[Config] loaded: " << configPath << "\n";
    }

    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    HdhrConfigTool tool(config.device.config_tool);
    tool.setVerboseLogging(verboseLogging);

    ProbeTimeouts timeouts;
    timeouts.statusMs = config.device.status_timeout_ms;
    timeouts.commandMs = config.device.command_timeout_ms;
    timeouts.scanMs = config.device.scan_timeout_ms;
    TunerProbe probe(tool, timeouts);
    probe.setVerboseLogging(verboseLogging);

    const std::string command = positional[0];
    auto requireArgs = [&](size_t count) -> bool {
        if (positional.size() < count + 1) {
            std::cerr << "[CLI] " << command << ": missing arguments\n";
            printUsage(argv[0]);
            return false;
        }
        return true;
    };

    try {
        if (command == "list") {
            UdpDiscovery udp(config.discovery.broadcast_timeout_ms);
            udp.setVerboseLogging(verboseLogging);
            HttpsClient http;
            CloudDiscovery cloud(http, config.discovery.cloud_url, config.discovery.cloud_timeout_ms);
            cloud.setVerboseLogging(verboseLogging);

            DiscoveryOptions options;
            options.autoDiscovery = config.discovery.auto_discovery;
            options.manualHosts = config.discovery.manual_hosts;
            options.cacheTtl = std::chrono::seconds(config.discovery.cache_ttl_seconds);
            options.queryTimeoutMs = config.device.command_timeout_ms;
            DiscoveryService discovery(
                tool, [&udp]() { return udp.discover(); }, [&cloud]() { return cloud.discover(); }, options);
            discovery.setVerboseLogging(verboseLogging);

            printJson(json_codec::toJson(discovery.discoverDevices(forceRefresh)));
            return 0;
        }

        if (command == "info") {
            if (!requireArgs(1)) {
                return 1;
            }
            printJson(json_codec::toJson(probe.getDeviceInfo(positional[1])));
            return 0;
        }

        if (command == "antenna") {
            if (!requireArgs(1)) {
                return 1;
            }
            int tuners = 0;
            if (positional.size() > 2) {
                if (!parseIntArg("tuner count", positional[2], tuners)) {
                    return 1;
                }
            } else {
                tuners = probe.getDeviceInfo(positional[1]).tuners;
            }

            EventLoop loop;
            loop.start();
            {
                MonitoringSessionManager sessions(
                    probe, loop, std::chrono::milliseconds(config.monitor.poll_interval_ms));
                sessions.setVerboseLogging(verboseLogging);
                sessions.setAntennaStatusCallback(
                    [](const std::string&, const std::vector<AntennaTunerStatus>& statuses) {
                        printJson(json_codec::antennaEvent(statuses));
                    });
                sessions.startAntennaMode(kConsoleClient, positional[1], tuners);
                while (g_running) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(100));
                }
                sessions.clientDisconnected(kConsoleClient);
            }
            loop.stop();
            return 0;
        }

        // Everything below addresses a single tuner.
        if (!requireArgs(2)) {
            return 1;
        }
        const std::string& device = positional[1];
        int tuner = 0;
        if (!parseTunerArg(positional[2], tuner)) {
            return 1;
        }

        if (command == "status") {
            const std::optional<TunerStatus> status = probe.getTunerStatus(device, tuner);
            printJson(status ? json_codec::toJson(*status) : nlohmann::json(nullptr));
            return status ? 0 : 1;
        }
        if (command == "programs") {
            printJson(json_codec::toJson(probe.getProgramsWithRetry(device, tuner, config.monitor.program_retries)));
            return 0;
        }
        if (command == "plp") {
            printJson(json_codec::toJson(probe.getPlpInfo(device, tuner)));
            return 0;
        }
        if (command == "l1") {
            printJson(json_codec::toJson(probe.getL1Info(device, tuner)));
            return 0;
        }
        if (command == "scan") {
            const std::string channelMap = positional.size() > 3 ? positional[3] : "us-bcast";
            std::cerr << "[CLI] scanning " << device << " tuner " << tuner << " (" << channelMap << ")\n";
            printJson(json_codec::toJson(probe.scanChannels(device, tuner, channelMap)));
            return 0;
        }
        if (command == "set-channel") {
            if (!requireArgs(3)) {
                return 1;
            }
            probe.setChannel(device, tuner, positional[3]);
            printJson(nlohmann::json{{"success", true}});
            return 0;
        }
        if (command == "atsc3") {
            if (!requireArgs(3)) {
                return 1;
            }
            std::vector<int> plps;
            if (positional.size() > 4 && !parsePlpList(positional[4], plps)) {
                return 1;
            }
            probe.setAtsc3Channel(device, tuner, positional[3], plps);
            printJson(nlohmann::json{{"success", true}});
            return 0;
        }
        if (command == "channel-up") {
            probe.incrementChannel(device, tuner);
            printJson(nlohmann::json{{"success", true}});
            return 0;
        }
        if (command == "channel-down") {
            probe.decrementChannel(device, tuner);
            printJson(nlohmann::json{{"success", true}});
            return 0;
        }
        if (command == "clear") {
            probe.clearTuner(device, tuner);
            printJson(nlohmann::json{{"success", true}});
            return 0;
        }
        if (command == "monitor") {
            EventLoop loop;
            loop.start();
            {
                MonitoringSessionManager sessions(
                    probe, loop, std::chrono::milliseconds(config.monitor.poll_interval_ms));
                sessions.setVerboseLogging(verboseLogging);
                sessions.setTunerStatusCallback([](const std::string&, const TunerMonitorEvent& event) {
                    printJson(json_codec::monitorEvent(event));
                });
                sessions.startMonitoring(kConsoleClient, device, tuner);
                while (g_running) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(100));
                }
                sessions.clientDisconnected(kConsoleClient);
            }
            loop.stop();
            return 0;
        }
    } catch (const TunerCommandError& ex) {
        std::cerr << "[APP] " << command << " failed: " << ex.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "[APP] fatal: " << ex.what() << "\n";
        return 1;
    }

    std::cerr << "[CLI] unknown command: " << command << "\n";
    printUsage(argv[0]);
    return 1;
}
