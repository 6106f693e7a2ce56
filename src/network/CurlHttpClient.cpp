#include "network/CurlHttpClient.h"

namespace cryptogate {
namespace network {
namespace {
struct CurlGlobal {
    CurlGlobal() { curl_global_init(CURL_GLOBAL_ALL); }
    ~CurlGlobal() { curl_global_cleanup(); }
};
}

CurlHttpClient::CurlHttpClient(long timeout_seconds)
    : curl_(nullptr)
    , timeout_seconds_(timeout_seconds)
{
    static CurlGlobal curl_global;
    curl_ = curl_easy_init();

    if (!curl_) {
        throw std::runtime_error("Failed to initialize CURL");
    }
}

CurlHttpClient::~CurlHttpClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
}

HttpResponse CurlHttpClient::get(
    const std::string& url,
    const std::string& query,
    const HttpHeaders& headers
) {
    return performRequest("GET", query.empty() ? url : url + "?" + query, "", headers);
}

HttpResponse CurlHttpClient::post(
    const std::string& url,
    const std::string& body,
    const HttpHeaders& headers
) {
    return performRequest("POST", url, body, headers);
}

HttpResponse CurlHttpClient::del(
    const std::string& url,
    const std::string& query,
    const HttpHeaders& headers
) {
    return performRequest("DELETE", query.empty() ? url : url + "?" + query, "", headers);
}

HttpResponse CurlHttpClient::performRequest(
    const std::string& method,
    const std::string& url,
    const std::string& body_data,
    const HttpHeaders& headers
) {
    std::lock_guard<std::mutex> lock(mutex_);

    HttpResponse response;
    std::string response_body;
    HttpHeaders response_headers;

    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl_, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl_, CURLOPT_HEADERDATA, &response_headers);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl_, CURLOPT_USERAGENT, "CryptoGate/1.0");

    if (method == "POST") {
        curl_easy_setopt(curl_, CURLOPT_POST, 1L);
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body_data.c_str());
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body_data.size()));
    } else if (method == "DELETE") {
        curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, "DELETE");
    }

    struct curl_slist* header_list = nullptr;
    for (const auto& [key, value] : headers) {
        std::string header_line = key + ": " + value;
        header_list = curl_slist_append(header_list, header_line.c_str());
    }
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, header_list);

    CURLcode res = curl_easy_perform(curl_);

    if (res != CURLE_OK) {
        curl_slist_free_all(header_list);
        throw TransportError("CURL error: " + std::string(curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);

    curl_slist_free_all(header_list);

    response.status_code = static_cast<int>(http_code);
    response.body = response_body;
    response.headers = response_headers;

    return response;
}

size_t CurlHttpClient::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    std::string* response_body = static_cast<std::string*>(userp);
    response_body->append(static_cast<char*>(contents), total_size);
    return total_size;
}

size_t CurlHttpClient::headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total_size = size * nitems;
    std::string header_line(buffer, total_size);

    size_t colon_pos = header_line.find(':');
    if (colon_pos != std::string::npos) {
        std::string key = header_line.substr(0, colon_pos);
        std::string value = header_line.substr(colon_pos + 1);

        value.erase(0, value.find_first_not_of(" \t\r\n"));
        value.erase(value.find_last_not_of(" \t\r\n") + 1);

        auto* headers = static_cast<HttpHeaders*>(userdata);
        (*headers)[key] = value;
    }

    return total_size;
}

} // namespace network
} // namespace cryptogate
