#include "https_client.h"

#include <curl/curl.h>

#include <mutex>

namespace {
constexpr size_t kMaxResponseBytes = 4 * 1024 * 1024;

std::once_flag g_curlInitFlag;

size_t appendBody(char* data, size_t size, size_t nmemb, void* userdata) {
    std::string* body = static_cast<std::string*>(userdata);
    const size_t bytes = size * nmemb;
    if (body->size() + bytes > kMaxResponseBytes) {
        // Short count makes curl abort with CURLE_WRITE_ERROR.
        return 0;
    }
    body->append(data, bytes);
    return bytes;
}
}

HttpsClient::HttpsClient(const std::string& userAgent)
    : m_userAgent(userAgent) {
    std::call_once(g_curlInitFlag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

HttpResponse HttpsClient::get(const std::string& url, int timeoutMs) const {
    HttpResponse response;

    CURL* curl = curl_easy_init();
    if (!curl) {
        response.error = "curl_easy_init failed";
        return response;
    }

    char errorBuffer[CURL_ERROR_SIZE];
    errorBuffer[0] = '\0';

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_USERAGENT, m_userAgent.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 3L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeoutMs));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeoutMs));
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errorBuffer);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, appendBody);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);

    const CURLcode rc = curl_easy_perform(curl);
    if (rc != CURLE_OK) {
        response.error = errorBuffer[0] != '\0' ? errorBuffer : curl_easy_strerror(rc);
        response.body.clear();
        curl_easy_cleanup(curl);
        return response;
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.statusCode);
    curl_easy_cleanup(curl);

    if (response.statusCode < 200 || response.statusCode >= 300) {
        response.error = "HTTP status " + std::to_string(response.statusCode);
        return response;
    }

    response.ok = true;
    return response;
}
