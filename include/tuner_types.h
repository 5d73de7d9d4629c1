#ifndef TUNER_TYPES_H
#define TUNER_TYPES_H

#include <map>
#include <optional>
#include <string>
#include <vector>

struct Device {
    std::string id;
    std::string ip;
    std::string name;
    bool online = true;
};

// Raw result of a discovery primitive before model resolution.
struct DiscoveredDevice {
    std::string id;
    std::string ip;
    int tunerCount = 0;
};

struct DeviceInfo {
    std::string model;
    int tuners = 2;
    bool atsc3Support = false;
};

// Fields missing from the device response stay empty; "not locked" and
// "zero signal" are different answers. An empty channel means the response
// carried no ch= token.
struct TunerStatus {
    std::string channel;
    bool lock = false;
    std::optional<int> ss;
    std::optional<int> snq;
    std::optional<int> seq;
    std::optional<long long> bps;
    std::optional<long long> pps;
    std::optional<double> ssDb;
    std::optional<double> snrDb;
    std::optional<std::string> debugRaw;
};

struct DebugCounters {
    int signalRaw = 0;
    int snrRaw = 0;
    int thirdValue = 0;
};

struct PlpEntry {
    std::optional<std::string> sfi;
    std::optional<std::string> modulation;
    std::optional<std::string> coderate;
    std::optional<std::string> layer;
    std::optional<std::string> timeInterleaving;
    std::optional<bool> lls;
    std::optional<bool> lock;
};

using PlpTable = std::map<int, PlpEntry>;
using L1Info = std::map<std::string, std::string>;

struct ProgramEntry {
    std::string programNum;
    std::string virtualChannel;
    std::string name;
    std::string callsign;
    std::string status;
    bool encrypted = false;
    bool atsc3 = false;
};

struct ScanProgram {
    std::string programNum;
    std::string virtualChannel;
    std::string name;
};

struct ChannelScanResult {
    std::string frequency;
    std::string channel;
    std::string modulation;
    int signalStrength = 0;
    int snr = 0;
    int symbolQuality = 0;
    std::vector<ScanProgram> programs;
};

#endif
