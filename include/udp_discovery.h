#ifndef UDP_DISCOVERY_H
#define UDP_DISCOVERY_H

#include <stdint.h>
#include <stddef.h>
#include <atomic>
#include <string>
#include <vector>

#include "tuner_types.h"

struct DiscoveryResult {
    bool ok = false;
    std::vector<DiscoveredDevice> devices;
    std::string error;
};

// Native implementation of the vendor's LAN discovery: a broadcast request
// on UDP 65001, answered by every tuner device on the segment.
class UdpDiscovery {
public:
    static constexpr uint16_t DISCOVER_PORT = 65001;
    static constexpr uint16_t TYPE_DISCOVER_REQ = 0x0002;
    static constexpr uint16_t TYPE_DISCOVER_RPY = 0x0003;
    static constexpr uint8_t TAG_DEVICE_TYPE = 0x01;
    static constexpr uint8_t TAG_DEVICE_ID = 0x02;
    static constexpr uint8_t TAG_TUNER_COUNT = 0x10;
    static constexpr uint32_t DEVICE_TYPE_WILDCARD = 0xFFFFFFFF;
    static constexpr uint32_t DEVICE_TYPE_TUNER = 0x00000001;
    static constexpr uint32_t DEVICE_ID_WILDCARD = 0xFFFFFFFF;

    explicit UdpDiscovery(int timeoutMs = 1500);

    void setVerboseLogging(bool enabled);

    DiscoveryResult discover();

    static std::vector<uint8_t> buildDiscoverRequest();
    // Fills id and tunerCount; the caller supplies the IP from the datagram source.
    static bool parseDiscoverReply(const uint8_t* data, size_t len, DiscoveredDevice& device);
    static uint32_t crc32(const uint8_t* data, size_t len);

private:
    int m_timeoutMs;
    std::atomic<bool> m_verboseLogging;
};

#endif
