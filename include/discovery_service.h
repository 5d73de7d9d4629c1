#ifndef DISCOVERY_SERVICE_H
#define DISCOVERY_SERVICE_H

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "device_control.h"
#include "tuner_types.h"
#include "udp_discovery.h"

struct DiscoveryOptions {
    bool autoDiscovery = true;
    std::vector<std::string> manualHosts;
    std::chrono::seconds cacheTtl{300};
    int queryTimeoutMs = 5000;
    std::string productName = "HDHomeRun";
};

// Builds the device list from LAN broadcast, the cloud fallback and
// manually configured hosts.
//
// Broadcast results win whenever they are non-empty. The cloud fallback is
// called at most once until a forced refresh; its answer is cached even when
// empty. Manual hosts are looked up individually and cached for cacheTtl.
class DiscoveryService {
public:
    using DiscoverCallback = std::function<DiscoveryResult()>;
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    DiscoveryService(DeviceControl& control,
                     DiscoverCallback broadcast,
                     DiscoverCallback cloud,
                     DiscoveryOptions options = DiscoveryOptions{},
                     Clock clock = nullptr);

    void setVerboseLogging(bool enabled);

    std::vector<Device> discoverDevices(bool forceRefresh = false);
    std::vector<Device> autoDiscoverDevices(bool forceRefresh = false);
    Device getDeviceByHost(const std::string& host);

    std::vector<Device> devices() const;
    bool hasCloudCache() const;
    size_t hostCacheSize() const;

private:
    struct HostEntry {
        Device device;
        std::chrono::steady_clock::time_point fetchedAt;
    };

    std::vector<Device> resolveModels(const std::vector<DiscoveredDevice>& found);
    std::optional<std::string> queryModel(const std::string& address);
    std::optional<std::string> recoverDeviceId(const std::string& host);

    DeviceControl& m_control;
    DiscoverCallback m_broadcast;
    DiscoverCallback m_cloud;
    DiscoveryOptions m_options;
    Clock m_clock;
    bool m_verboseLogging;

    mutable std::mutex m_mutex;
    std::vector<Device> m_devices;
    std::optional<std::vector<Device>> m_cloudCache;
    std::map<std::string, HostEntry> m_hostCache;
};

#endif
