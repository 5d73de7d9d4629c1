#ifndef HTTPS_CLIENT_H
#define HTTPS_CLIENT_H

#include <string>

struct HttpResponse {
    bool ok = false;
    long statusCode = 0;
    std::string body;
    std::string error;
};

// Blocking GET through libcurl. One easy handle per request.
class HttpsClient {
public:
    explicit HttpsClient(const std::string& userAgent = "hdhr-signal/1.0");

    HttpResponse get(const std::string& url, int timeoutMs = 10000) const;

private:
    std::string m_userAgent;
};

#endif
