#pragma once

#include <string>
#include <map>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace cryptogate {
namespace network {

using HttpHeaders = std::map<std::string, std::string>;
using QueryParams = std::map<std::string, std::string>;

struct HttpResponse {
    int status_code = 0;
    std::string body;
    HttpHeaders headers;

    bool isSuccess() const { return status_code >= 200 && status_code < 300; }
    bool isRateLimited() const { return status_code == 429; }
    bool isBlocked() const { return status_code == 418; }
    bool isServerError() const { return status_code >= 500; }

    nlohmann::json json() const {
        return nlohmann::json::parse(body);
    }

    // 헤더 이름은 거래소마다 대소문자가 달라서 case-insensitive 조회
    std::string header(const std::string& name) const;
};

// curl 실패 등 응답 자체를 못 받은 경우
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& message) : std::runtime_error(message) {}
};

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    // url 은 base_url + path 전체, query 는 이미 조립/서명된 문자열
    virtual HttpResponse get(
        const std::string& url,
        const std::string& query = "",
        const HttpHeaders& headers = {}
    ) = 0;

    virtual HttpResponse post(
        const std::string& url,
        const std::string& body,
        const HttpHeaders& headers = {}
    ) = 0;

    virtual HttpResponse del(
        const std::string& url,
        const std::string& query = "",
        const HttpHeaders& headers = {}
    ) = 0;
};

// key=value&... (map 순서 그대로, 서명 대상 문자열과 동일해야 함)
std::string buildQueryString(const QueryParams& params);

// 로그 출력 전 키/서명 마스킹
std::string sanitizeForLog(const std::string& text);

} // namespace network
} // namespace cryptogate
