#include "discovery_service.h"

#include <future>
#include <iostream>
#include <set>

#include "status_parser.h"

DiscoveryService::DiscoveryService(DeviceControl& control,
                                   DiscoverCallback broadcast,
                                   DiscoverCallback cloud,
                                   DiscoveryOptions options,
                                   Clock clock)
    : m_control(control)
    , m_broadcast(std::move(broadcast))
    , m_cloud(std::move(cloud))
    , m_options(std::move(options))
    , m_clock(std::move(clock))
    , m_verboseLogging(false) {
    if (!m_clock) {
        m_clock = []() { return std::chrono::steady_clock::now(); };
    }
}

void DiscoveryService::setVerboseLogging(bool enabled) {
    m_verboseLogging = enabled;
}

std::vector<Device> DiscoveryService::discoverDevices(bool forceRefresh) {
    if (forceRefresh) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_hostCache.clear();
    }

    std::vector<Device> merged;
    if (m_options.autoDiscovery) {
        merged = autoDiscoverDevices(forceRefresh);
    }

    std::set<std::string> seen;
    for (const Device& device : merged) {
        seen.insert(device.id);
    }
    for (const std::string& host : m_options.manualHosts) {
        Device device = getDeviceByHost(host);
        if (!seen.insert(device.id).second) {
            if (m_verboseLogging) {
                std::cout << "[Discovery] manual host " << host << " already discovered\n";
            }
            continue;
        }
        merged.push_back(device);
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_devices = merged;
    }
    std::cout << "[Discovery] " << merged.size() << " device(s) available\n";
    return merged;
}

std::vector<Device> DiscoveryService::autoDiscoverDevices(bool forceRefresh) {
    if (m_broadcast) {
        const DiscoveryResult broadcast = m_broadcast();
        if (broadcast.ok && !broadcast.devices.empty()) {
            if (m_verboseLogging) {
                std::cout << "[Discovery] broadcast found " << broadcast.devices.size() << " device(s)\n";
            }
            return resolveModels(broadcast.devices);
        }
        if (!broadcast.ok) {
            std::cerr << "[Discovery] broadcast discovery failed: " << broadcast.error << "\n";
        }
    }

    if (!forceRefresh) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_cloudCache) {
            if (m_verboseLogging) {
                std::cout << "[Discovery] using cached cloud result (" << m_cloudCache->size() << " device(s))\n";
            }
            return *m_cloudCache;
        }
    }

    std::vector<Device> devices;
    if (m_cloud) {
        const DiscoveryResult cloud = m_cloud();
        if (!cloud.ok) {
            std::cerr << "[Discovery] cloud discovery failed: " << cloud.error << "\n";
        } else {
            devices = resolveModels(cloud.devices);
        }
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_cloudCache = devices;
    return devices;
}

Device DiscoveryService::getDeviceByHost(const std::string& host) {
    const auto now = m_clock();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_hostCache.find(host);
        if (it != m_hostCache.end() && now - it->second.fetchedAt <= m_options.cacheTtl) {
            return it->second.device;
        }
    }

    Device device;
    device.id = host;
    device.ip = host;

    const std::optional<std::string> model = queryModel(host);
    if (!model) {
        std::cerr << "[Discovery] manual host " << host << " is unreachable\n";
        device.name = m_options.productName + " " + host + " (offline)";
        device.online = false;
    } else {
        // Commands keep addressing the host; the vendor id only decorates the name.
        const std::string displayId = recoverDeviceId(host).value_or(host);
        device.name = m_options.productName + " " + displayId + " (" + *model + ")";
        device.online = true;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_hostCache[host] = HostEntry{device, now};
    return device;
}

std::vector<Device> DiscoveryService::devices() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_devices;
}

bool DiscoveryService::hasCloudCache() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_cloudCache.has_value();
}

size_t DiscoveryService::hostCacheSize() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_hostCache.size();
}

std::vector<Device> DiscoveryService::resolveModels(const std::vector<DiscoveredDevice>& found) {
    std::vector<std::future<std::optional<std::string>>> models;
    models.reserve(found.size());
    for (const DiscoveredDevice& entry : found) {
        const std::string address = entry.ip.empty() ? entry.id : entry.ip;
        models.push_back(std::async(std::launch::async, [this, address]() { return queryModel(address); }));
    }

    std::vector<Device> devices;
    devices.reserve(found.size());
    for (size_t i = 0; i < found.size(); i++) {
        Device device;
        device.id = found[i].id;
        device.ip = found[i].ip;
        const std::optional<std::string> model = models[i].get();
        device.name = m_options.productName + " " + device.id;
        if (model) {
            device.name += " (" + *model + ")";
        }
        devices.push_back(device);
    }
    return devices;
}

std::optional<std::string> DiscoveryService::queryModel(const std::string& address) {
    const CommandResult result = m_control.get(address, "/sys/model", m_options.queryTimeoutMs);
    if (!result.ok || result.output.empty()) {
        if (m_verboseLogging) {
            std::cout << "[Discovery] model query for " << address << " failed: " << result.error << "\n";
        }
        return std::nullopt;
    }
    return result.output;
}

std::optional<std::string> DiscoveryService::recoverDeviceId(const std::string& host) {
    const CommandResult result = m_control.discover(host, m_options.queryTimeoutMs);
    if (!result.ok) {
        return std::nullopt;
    }
    const std::vector<DiscoveredDevice> found = parseDiscoverOutput(result.output);
    if (found.empty()) {
        return std::nullopt;
    }
    return found.front().id;
}
