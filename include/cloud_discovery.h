#ifndef CLOUD_DISCOVERY_H
#define CLOUD_DISCOVERY_H

#include <string>

#include "https_client.h"
#include "udp_discovery.h"

// Fallback discovery through the vendor's cloud service, which lists the
// devices it has seen behind the caller's public address.
class CloudDiscovery {
public:
    CloudDiscovery(const HttpsClient& http, const std::string& url, int timeoutMs = 10000);

    void setVerboseLogging(bool enabled);

    DiscoveryResult discover() const;

    // Keeps array entries carrying both DeviceID and LocalIP.
    static DiscoveryResult parseResponse(const std::string& body);

private:
    const HttpsClient& m_http;
    std::string m_url;
    int m_timeoutMs;
    bool m_verboseLogging;
};

#endif
