#include "status_parser.h"

#include <cctype>
#include <exception>
#include <regex>
#include <sstream>

namespace {
std::string trim(const std::string& value) {
    size_t start = 0;
    while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start])) != 0) {
        start++;
    }

    size_t end = value.size();
    while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1])) != 0) {
        end--;
    }

    return value.substr(start, end - start);
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

bool isDigits(const std::string& value) {
    if (value.empty()) {
        return false;
    }
    for (char c : value) {
        if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
            return false;
        }
    }
    return true;
}

template <typename T>
bool parseNumber(const std::string& raw, T& out) {
    if (!isDigits(raw)) {
        return false;
    }
    try {
        out = static_cast<T>(std::stoll(raw));
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseInt(const std::string& raw, int& out) {
    try {
        size_t idx = 0;
        const int value = std::stoi(raw, &idx);
        if (idx != raw.size()) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool containsText(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

ProgramEntry makeProgram(const std::smatch& match) {
    ProgramEntry program;
    program.programNum = match[1].str();
    program.virtualChannel = match[2].str();
    program.name = trim(match[3].str());
    program.callsign = program.name;
    program.status = match[4].matched ? match[4].str() : std::string();
    program.encrypted = containsText(program.status, "encrypted");
    program.atsc3 = containsText(program.status, "atsc3");
    return program;
}
}  // namespace

TunerStatus parseStatusLine(const std::string& text) {
    TunerStatus status;
    const std::string line = trim(text);
    if (line == "none") {
        status.channel = "none";
        return status;
    }

    std::istringstream tokens(line);
    std::string token;
    bool sawLock = false;
    while (tokens >> token) {
        const size_t eq = token.find('=');
        if (eq == std::string::npos || eq == 0) {
            continue;
        }
        const std::string key = token.substr(0, eq);
        const std::string value = token.substr(eq + 1);

        if (key == "ch") {
            status.channel = value;
        } else if (key == "lock") {
            sawLock = true;
        } else if (key == "ss") {
            int parsed = 0;
            if (parseNumber(value, parsed)) {
                status.ss = parsed;
            }
        } else if (key == "snq") {
            int parsed = 0;
            if (parseNumber(value, parsed)) {
                status.snq = parsed;
            }
        } else if (key == "seq") {
            int parsed = 0;
            if (parseNumber(value, parsed)) {
                status.seq = parsed;
            }
        } else if (key == "bps") {
            long long parsed = 0;
            if (parseNumber(value, parsed)) {
                status.bps = parsed;
            }
        } else if (key == "pps") {
            long long parsed = 0;
            if (parseNumber(value, parsed)) {
                status.pps = parsed;
            }
        }
    }

    status.lock = sawLock;
    return status;
}

std::optional<DebugCounters> parseDebugCounters(const std::string& text) {
    static const std::regex kDebugPattern(R"(dbg=(\d+)-(\d+)/(-?\d+))");
    std::smatch match;
    if (!std::regex_search(text, match, kDebugPattern)) {
        return std::nullopt;
    }

    DebugCounters counters;
    if (!parseInt(match[1].str(), counters.signalRaw) ||
        !parseInt(match[2].str(), counters.snrRaw) ||
        !parseInt(match[3].str(), counters.thirdValue)) {
        return std::nullopt;
    }
    return counters;
}

PlpTable parsePlpTable(const std::string& text) {
    static const std::regex kPlpId(R"(^(\d+):)");
    static const std::regex kSfi(R"(sfi=(\w+))");
    static const std::regex kMod(R"(mod=(\w+))");
    static const std::regex kCod(R"(cod=([0-9/]+))");
    static const std::regex kLayer(R"(layer=(\w+))");
    static const std::regex kTi(R"(ti=(\w+))");
    static const std::regex kLls(R"(lls=(\d+))");
    static const std::regex kLock(R"(lock=(\d+))");

    PlpTable table;
    for (const std::string& line : splitLines(text)) {
        std::smatch idMatch;
        if (!std::regex_search(line, idMatch, kPlpId)) {
            continue;
        }
        int plpId = 0;
        if (!parseInt(idMatch[1].str(), plpId)) {
            continue;
        }

        PlpEntry entry;
        std::smatch m;
        if (std::regex_search(line, m, kSfi)) {
            entry.sfi = m[1].str();
        }
        if (std::regex_search(line, m, kMod)) {
            entry.modulation = m[1].str();
        }
        if (std::regex_search(line, m, kCod)) {
            entry.coderate = m[1].str();
        }
        if (std::regex_search(line, m, kLayer)) {
            entry.layer = m[1].str();
        }
        if (std::regex_search(line, m, kTi)) {
            entry.timeInterleaving = m[1].str();
        }
        if (std::regex_search(line, m, kLls)) {
            entry.lls = (m[1].str() == "1");
        }
        if (std::regex_search(line, m, kLock)) {
            entry.lock = (m[1].str() == "1");
        }
        table[plpId] = entry;
    }
    return table;
}

L1Info parseL1Table(const std::string& text) {
    static const std::regex kKeyValue(R"((\w+)=(\S+))");

    L1Info info;
    for (const std::string& line : splitLines(text)) {
        for (std::sregex_iterator it(line.begin(), line.end(), kKeyValue), end; it != end; ++it) {
            info[(*it)[1].str()] = (*it)[2].str();
        }
    }
    return info;
}

std::vector<ProgramEntry> parsePrograms(const std::string& text) {
    static const std::regex kProgram(
        R"((?:program|service)=(\d+):\s*([\d.]+)\s+(.+?)(?:\s+\(([^)]+)\))?$)");
    // Looser fallback for firmware that drops the program=/service= prefix.
    static const std::regex kLooseProgram(
        R"((\d+):\s*([\d.]+)\s+(.+?)(?:\s+\(([^)]+)\))?$)");

    std::vector<ProgramEntry> programs;
    for (const std::string& line : splitLines(text)) {
        std::smatch match;
        if (std::regex_search(line, match, kProgram) ||
            std::regex_search(line, match, kLooseProgram)) {
            programs.push_back(makeProgram(match));
        }
    }
    return programs;
}

std::vector<ChannelScanResult> parseScanOutput(const std::string& text) {
    static const std::regex kScanning(R"(SCANNING: (\d+) \(([^)]+)\))");
    static const std::regex kLock(R"(LOCK: (\w+) \(ss=(\d+) snq=(\d+) seq=(\d+)\))");
    static const std::regex kProgram(R"(PROGRAM (\d+): ([\d.]+) (.+))");

    std::vector<ChannelScanResult> channels;
    std::optional<ChannelScanResult> pending;
    // PROGRAM lines attach to the last emitted channel until the next SCANNING line.
    bool collectingPrograms = false;

    for (const std::string& line : splitLines(text)) {
        std::smatch match;
        if (std::regex_search(line, match, kScanning)) {
            ChannelScanResult candidate;
            candidate.frequency = match[1].str();
            candidate.channel = match[2].str();
            pending = candidate;
            collectingPrograms = false;
            continue;
        }

        if (std::regex_search(line, match, kLock)) {
            if (pending && match[1].str() != "none") {
                ChannelScanResult channel = *pending;
                channel.modulation = match[1].str();
                if (parseInt(match[2].str(), channel.signalStrength) &&
                    parseInt(match[3].str(), channel.snr) &&
                    parseInt(match[4].str(), channel.symbolQuality)) {
                    channels.push_back(channel);
                    collectingPrograms = true;
                }
            }
            pending.reset();
            continue;
        }

        // Anything else between SCANNING and LOCK breaks the pairing.
        pending.reset();

        if (collectingPrograms && std::regex_search(line, match, kProgram)) {
            ScanProgram program;
            program.programNum = match[1].str();
            program.virtualChannel = match[2].str();
            program.name = trim(match[3].str());
            channels.back().programs.push_back(program);
        }
    }
    return channels;
}

std::vector<DiscoveredDevice> parseDiscoverOutput(const std::string& text) {
    static const std::regex kFound(R"(hdhomerun device ([A-Fa-f0-9-]+) found at ([0-9.]+))");

    std::vector<DiscoveredDevice> devices;
    for (const std::string& line : splitLines(text)) {
        std::smatch match;
        if (!std::regex_search(line, match, kFound)) {
            continue;
        }
        DiscoveredDevice device;
        device.id = match[1].str();
        device.ip = match[2].str();
        bool duplicate = false;
        for (const DiscoveredDevice& seen : devices) {
            if (seen.id == device.id) {
                duplicate = true;
                break;
            }
        }
        if (!duplicate) {
            devices.push_back(device);
        }
    }
    return devices;
}
