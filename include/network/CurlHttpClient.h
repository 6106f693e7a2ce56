#pragma once

#include "network/IHttpClient.h"
#include <curl/curl.h>
#include <mutex>

namespace cryptogate {
namespace network {

// libcurl easy handle 하나를 mutex 로 보호해서 공유
class CurlHttpClient : public IHttpClient {
public:
    explicit CurlHttpClient(long timeout_seconds = 30);
    ~CurlHttpClient();

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    HttpResponse get(
        const std::string& url,
        const std::string& query = "",
        const HttpHeaders& headers = {}
    ) override;

    HttpResponse post(
        const std::string& url,
        const std::string& body,
        const HttpHeaders& headers = {}
    ) override;

    HttpResponse del(
        const std::string& url,
        const std::string& query = "",
        const HttpHeaders& headers = {}
    ) override;

private:
    CURL* curl_;
    std::mutex mutex_;
    long timeout_seconds_;

    HttpResponse performRequest(
        const std::string& method,
        const std::string& url,
        const std::string& body_data,
        const HttpHeaders& headers
    );

    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata);
};

} // namespace network
} // namespace cryptogate
