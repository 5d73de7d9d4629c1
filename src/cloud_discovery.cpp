#include "cloud_discovery.h"

#include <iostream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

CloudDiscovery::CloudDiscovery(const HttpsClient& http, const std::string& url, int timeoutMs)
    : m_http(http)
    , m_url(url)
    , m_timeoutMs(timeoutMs)
    , m_verboseLogging(false) {
}

void CloudDiscovery::setVerboseLogging(bool enabled) {
    m_verboseLogging = enabled;
}

DiscoveryResult CloudDiscovery::parseResponse(const std::string& body) {
    DiscoveryResult result;

    const json doc = json::parse(body, nullptr, false);
    if (doc.is_discarded()) {
        result.error = "cloud discovery returned invalid JSON";
        return result;
    }
    if (!doc.is_array()) {
        result.error = "cloud discovery returned unexpected payload";
        return result;
    }

    for (const json& entry : doc) {
        if (!entry.is_object()) {
            continue;
        }
        const auto id = entry.find("DeviceID");
        const auto ip = entry.find("LocalIP");
        if (id == entry.end() || ip == entry.end() || !id->is_string() || !ip->is_string()) {
            continue;
        }

        DiscoveredDevice device;
        device.id = id->get<std::string>();
        device.ip = ip->get<std::string>();
        const auto tuners = entry.find("TunerCount");
        if (tuners != entry.end() && tuners->is_number_integer()) {
            device.tunerCount = tuners->get<int>();
        }
        if (device.id.empty() || device.ip.empty()) {
            continue;
        }

        bool duplicate = false;
        for (const DiscoveredDevice& seen : result.devices) {
            if (seen.id == device.id) {
                duplicate = true;
                break;
            }
        }
        if (!duplicate) {
            result.devices.push_back(device);
        }
    }

    result.ok = true;
    return result;
}

DiscoveryResult CloudDiscovery::discover() const {
    const HttpResponse response = m_http.get(m_url, m_timeoutMs);
    if (!response.ok) {
        DiscoveryResult failed;
        failed.error = response.error;
        std::cerr << "[Cloud] discovery request failed: " << response.error << "\n";
        return failed;
    }

    DiscoveryResult result = parseResponse(response.body);
    if (!result.ok) {
        std::cerr << "[Cloud] " << result.error << "\n";
    } else if (m_verboseLogging) {
        std::cout << "[Cloud] " << result.devices.size() << " device(s) listed by " << m_url << "\n";
    }
    return result;
}
