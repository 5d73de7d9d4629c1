#include "config.h"

#include <algorithm>
#include <cctype>
#include <exception>
#include <fstream>
#include <iostream>
#include <string>

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

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

bool parseBool(const std::string& raw, bool& out) {
    const std::string value = toLower(trim(raw));
    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        out = true;
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off") {
        out = false;
        return true;
    }
    return false;
}

bool parseInt(const std::string& raw, int& out) {
    try {
        const std::string t = trim(raw);
        size_t idx = 0;
        const int value = std::stoi(t, &idx);
        if (idx != t.size()) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parsePositiveInt(const std::string& raw, int& out) {
    int parsed = 0;
    if (!parseInt(raw, parsed) || parsed <= 0) {
        return false;
    }
    out = parsed;
    return true;
}
}  // namespace

std::vector<std::string> splitHostList(const std::string& value) {
    std::vector<std::string> hosts;
    std::string current;
    for (char c : value) {
        if (c == ',' || c == ';' || std::isspace(static_cast<unsigned char>(c)) != 0) {
            if (!current.empty()) {
                hosts.push_back(current);
                current.clear();
            }
            continue;
        }
        current.push_back(c);
    }
    if (!current.empty()) {
        hosts.push_back(current);
    }
    return hosts;
}

void Config::loadDefaults() {
    device = DeviceSection{};
    discovery = DiscoverySection{};
    monitor = MonitorSection{};
    debug = DebugSection{};
}

bool Config::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Failed to open config file: " << filename << "\n";
        return false;
    }

    std::string section;
    std::string line;
    int lineNo = 0;

    while (std::getline(file, line)) {
        lineNo++;

        line = trim(line);
        // ';' opens a comment only at line start, since host lists use it as a separator.
        if (line.empty() || line.front() == ';') {
            continue;
        }

        const size_t commentPos = line.find('#');
        if (commentPos != std::string::npos) {
            line = trim(line.substr(0, commentPos));
            if (line.empty()) {
                continue;
            }
        }

        if (line.front() == '[' && line.back() == ']') {
            section = toLower(trim(line.substr(1, line.size() - 2)));
            continue;
        }

        const size_t equalsPos = line.find('=');
        if (equalsPos == std::string::npos) {
            std::cerr << "Config parse warning (" << filename << ":" << lineNo
                      << "): expected key=value\n";
            continue;
        }

        const std::string key = toLower(trim(line.substr(0, equalsPos)));
        const std::string value = trim(line.substr(equalsPos + 1));

        if (section == "device") {
            if (key == "config_tool" || key == "tool") {
                if (!value.empty()) {
                    device.config_tool = value;
                }
            } else if (key == "command_timeout_ms") {
                parsePositiveInt(value, device.command_timeout_ms);
            } else if (key == "status_timeout_ms") {
                int parsed = 0;
                // Status polls must stay well inside the one second tick.
                if (parsePositiveInt(value, parsed) && parsed < 1000) {
                    device.status_timeout_ms = parsed;
                }
            } else if (key == "scan_timeout_ms") {
                parsePositiveInt(value, device.scan_timeout_ms);
            }
        } else if (section == "discovery") {
            if (key == "auto_discovery") {
                bool parsed = true;
                if (parseBool(value, parsed)) {
                    discovery.auto_discovery = parsed;
                }
            } else if (key == "manual_hosts" || key == "hosts") {
                discovery.manual_hosts = splitHostList(value);
            } else if (key == "cloud_url") {
                if (value.rfind("https://", 0) == 0) {
                    discovery.cloud_url = value;
                }
            } else if (key == "broadcast_timeout_ms") {
                parsePositiveInt(value, discovery.broadcast_timeout_ms);
            } else if (key == "cloud_timeout_ms") {
                parsePositiveInt(value, discovery.cloud_timeout_ms);
            } else if (key == "cache_ttl_seconds") {
                parsePositiveInt(value, discovery.cache_ttl_seconds);
            }
        } else if (section == "monitor") {
            if (key == "poll_interval_ms") {
                int parsed = 0;
                if (parseInt(value, parsed) && parsed >= 100) {
                    monitor.poll_interval_ms = parsed;
                }
            } else if (key == "program_retries") {
                int parsed = 0;
                if (parseInt(value, parsed) && parsed >= 0) {
                    monitor.program_retries = std::min(parsed, 10);
                }
            }
        } else if (section == "debug") {
            if (key == "log_level") {
                int parsed = 0;
                if (parseInt(value, parsed)) {
                    debug.log_level = std::clamp(parsed, 0, 2);
                }
            }
        }
    }

    return true;
}
