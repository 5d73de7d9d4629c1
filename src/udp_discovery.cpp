#include "udp_discovery.h"

#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <poll.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <iostream>

namespace {
const std::array<uint32_t, 256>& crcTable() {
    static const std::array<uint32_t, 256> kTable = []() {
        std::array<uint32_t, 256> table{};
        for (uint32_t i = 0; i < 256; i++) {
            uint32_t c = i;
            for (int k = 0; k < 8; k++) {
                c = (c & 1U) ? (0xEDB88320U ^ (c >> 1)) : (c >> 1);
            }
            table[i] = c;
        }
        return table;
    }();
    return kTable;
}

void appendU16(std::vector<uint8_t>& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value >> 8));
    out.push_back(static_cast<uint8_t>(value & 0xFF));
}

void appendU32(std::vector<uint8_t>& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>(value >> 24));
    out.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(value & 0xFF));
}

void appendTagU32(std::vector<uint8_t>& out, uint8_t tag, uint32_t value) {
    out.push_back(tag);
    out.push_back(4);
    appendU32(out, value);
}

uint32_t readU32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

void closeSocket(int sock) {
    close(sock);
}
}  // namespace

UdpDiscovery::UdpDiscovery(int timeoutMs)
    : m_timeoutMs(timeoutMs > 0 ? timeoutMs : 1500)
    , m_verboseLogging(false) {
}

void UdpDiscovery::setVerboseLogging(bool enabled) {
    m_verboseLogging = enabled;
}

uint32_t UdpDiscovery::crc32(const uint8_t* data, size_t len) {
    const std::array<uint32_t, 256>& table = crcTable();
    uint32_t crc = 0xFFFFFFFFU;
    for (size_t i = 0; i < len; i++) {
        crc = table[(crc ^ data[i]) & 0xFFU] ^ (crc >> 8);
    }
    return crc ^ 0xFFFFFFFFU;
}

std::vector<uint8_t> UdpDiscovery::buildDiscoverRequest() {
    std::vector<uint8_t> payload;
    appendTagU32(payload, TAG_DEVICE_TYPE, DEVICE_TYPE_WILDCARD);
    appendTagU32(payload, TAG_DEVICE_ID, DEVICE_ID_WILDCARD);

    std::vector<uint8_t> packet;
    appendU16(packet, TYPE_DISCOVER_REQ);
    appendU16(packet, static_cast<uint16_t>(payload.size()));
    packet.insert(packet.end(), payload.begin(), payload.end());

    // Trailer CRC is little endian.
    const uint32_t crc = crc32(packet.data(), packet.size());
    packet.push_back(static_cast<uint8_t>(crc & 0xFF));
    packet.push_back(static_cast<uint8_t>((crc >> 8) & 0xFF));
    packet.push_back(static_cast<uint8_t>((crc >> 16) & 0xFF));
    packet.push_back(static_cast<uint8_t>((crc >> 24) & 0xFF));
    return packet;
}

bool UdpDiscovery::parseDiscoverReply(const uint8_t* data, size_t len, DiscoveredDevice& device) {
    if (!data || len < 8) {
        return false;
    }

    const uint16_t type = static_cast<uint16_t>((data[0] << 8) | data[1]);
    const size_t payloadLen = static_cast<size_t>((data[2] << 8) | data[3]);
    if (type != TYPE_DISCOVER_RPY || 4 + payloadLen + 4 != len) {
        return false;
    }

    const uint32_t expected = crc32(data, 4 + payloadLen);
    const uint8_t* trailer = data + 4 + payloadLen;
    const uint32_t received = static_cast<uint32_t>(trailer[0]) | (static_cast<uint32_t>(trailer[1]) << 8) |
                              (static_cast<uint32_t>(trailer[2]) << 16) |
                              (static_cast<uint32_t>(trailer[3]) << 24);
    if (expected != received) {
        return false;
    }

    bool haveId = false;
    bool isTuner = true;
    const uint8_t* p = data + 4;
    const uint8_t* end = p + payloadLen;
    while (p + 2 <= end) {
        const uint8_t tag = *p++;
        size_t tagLen = *p++;
        if (tagLen & 0x80) {
            if (p >= end) {
                return false;
            }
            tagLen = (tagLen & 0x7F) | (static_cast<size_t>(*p++) << 7);
        }
        if (p + tagLen > end) {
            return false;
        }

        if (tag == TAG_DEVICE_ID && tagLen == 4) {
            char idBuffer[16];
            std::snprintf(idBuffer, sizeof(idBuffer), "%08X", readU32(p));
            device.id = idBuffer;
            haveId = true;
        } else if (tag == TAG_DEVICE_TYPE && tagLen == 4) {
            isTuner = (readU32(p) == DEVICE_TYPE_TUNER);
        } else if (tag == TAG_TUNER_COUNT && tagLen == 1) {
            device.tunerCount = p[0];
        }
        p += tagLen;
    }

    // Storage engines answer wildcard discovery too; they have no tuners.
    return haveId && isTuner;
}

DiscoveryResult UdpDiscovery::discover() {
    DiscoveryResult result;

    const int sock = socket(AF_INET, SOCK_DGRAM, 0);
    if (sock < 0) {
        result.error = std::string("failed to create UDP socket: ") + std::strerror(errno);
        std::cerr << "[UDP] " << result.error << "\n";
        return result;
    }

    int opt = 1;
    if (setsockopt(sock, SOL_SOCKET, SO_BROADCAST, &opt, sizeof(opt)) < 0) {
        result.error = std::string("failed to enable broadcast: ") + std::strerror(errno);
        std::cerr << "[UDP] " << result.error << "\n";
        closeSocket(sock);
        return result;
    }

    struct sockaddr_in local;
    std::memset(&local, 0, sizeof(local));
    local.sin_family = AF_INET;
    local.sin_addr.s_addr = htonl(INADDR_ANY);
    local.sin_port = 0;
    if (bind(sock, reinterpret_cast<struct sockaddr*>(&local), sizeof(local)) < 0) {
        result.error = std::string("failed to bind UDP socket: ") + std::strerror(errno);
        std::cerr << "[UDP] " << result.error << "\n";
        closeSocket(sock);
        return result;
    }

    const std::vector<uint8_t> request = buildDiscoverRequest();
    struct sockaddr_in target;
    std::memset(&target, 0, sizeof(target));
    target.sin_family = AF_INET;
    target.sin_addr.s_addr = htonl(INADDR_BROADCAST);
    target.sin_port = htons(DISCOVER_PORT);
    if (sendto(sock, request.data(), request.size(), 0,
               reinterpret_cast<struct sockaddr*>(&target), sizeof(target)) < 0) {
        result.error = std::string("failed to send discover request: ") + std::strerror(errno);
        std::cerr << "[UDP] " << result.error << "\n";
        closeSocket(sock);
        return result;
    }

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(m_timeoutMs);
    uint8_t buffer[2048];
    while (true) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                                   deadline - std::chrono::steady_clock::now())
                                   .count();
        if (remaining <= 0) {
            break;
        }

        struct pollfd pfd;
        pfd.fd = sock;
        pfd.events = POLLIN;
        pfd.revents = 0;
        const int ready = poll(&pfd, 1, static_cast<int>(remaining));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (ready == 0) {
            break;
        }

        struct sockaddr_in from;
        socklen_t fromLen = sizeof(from);
        const ssize_t n = recvfrom(sock, buffer, sizeof(buffer), 0,
                                   reinterpret_cast<struct sockaddr*>(&from), &fromLen);
        if (n <= 0) {
            continue;
        }

        DiscoveredDevice device;
        if (!parseDiscoverReply(buffer, static_cast<size_t>(n), device)) {
            continue;
        }
        char ipBuffer[INET_ADDRSTRLEN];
        inet_ntop(AF_INET, &from.sin_addr, ipBuffer, sizeof(ipBuffer));
        device.ip = ipBuffer;

        bool duplicate = false;
        for (const DiscoveredDevice& seen : result.devices) {
            if (seen.id == device.id) {
                duplicate = true;
                break;
            }
        }
        if (!duplicate) {
            if (m_verboseLogging.load()) {
                std::cout << "[UDP] device " << device.id << " found at " << device.ip << "\n";
            }
            result.devices.push_back(device);
        }
    }

    closeSocket(sock);
    result.ok = true;
    return result;
}
