#include "network/IHttpClient.h"
#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>

namespace cryptogate {
namespace network {
namespace {
bool isSensitiveKey(const std::string& key) {
    static const std::set<std::string> kKeys = {
        "api_key", "apikey", "secret", "api_secret", "signature", "sign",
        "x-mbx-apikey", "x-bapi-api-key", "x-bapi-sign", "authorization", "token"
    };
    std::string lower = key;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return kKeys.find(lower) != kKeys.end();
}

void maskSensitiveJson(nlohmann::json& node) {
    if (node.is_object()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            if (isSensitiveKey(it.key())) {
                it.value() = "***";
            } else {
                maskSensitiveJson(it.value());
            }
        }
        return;
    }
    if (node.is_array()) {
        for (auto& item : node) {
            maskSensitiveJson(item);
        }
    }
}

std::string toLowerCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}
}

std::string HttpResponse::header(const std::string& name) const {
    const std::string wanted = toLowerCopy(name);
    for (const auto& [key, value] : headers) {
        if (toLowerCopy(key) == wanted) {
            return value;
        }
    }
    return "";
}

std::string buildQueryString(const QueryParams& params) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& [key, value] : params) {
        if (!first) oss << "&";
        oss << key << "=" << value;
        first = false;
    }
    return oss.str();
}

std::string sanitizeForLog(const std::string& text) {
    try {
        auto j = nlohmann::json::parse(text);
        maskSensitiveJson(j);
        return j.dump();
    } catch (const nlohmann::json::exception&) {
        // JSON 이 아니면 query string 으로 보고 signature 값만 가림
        std::string out = text;
        const auto pos = out.find("signature=");
        if (pos != std::string::npos) {
            const auto end = out.find('&', pos);
            out.replace(pos, (end == std::string::npos ? out.size() : end) - pos, "signature=***");
        }
        return out;
    }
}

} // namespace network
} // namespace cryptogate
