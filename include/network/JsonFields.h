#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace cryptogate {
namespace network {

// 거래소 응답은 숫자를 문자열("0.0100")로 주기도 하고 숫자로 주기도 한다
inline double toNumber(const nlohmann::json& value, double fallback = 0.0) {
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_string()) {
        const auto& s = value.get_ref<const std::string&>();
        if (s.empty()) {
            return fallback;
        }
        try {
            return std::stod(s);
        } catch (const std::exception&) {
            return fallback;
        }
    }
    return fallback;
}

inline double numberField(const nlohmann::json& j, const char* key, double fallback = 0.0) {
    if (!j.is_object() || !j.contains(key)) {
        return fallback;
    }
    return toNumber(j[key], fallback);
}

// orderId 처럼 숫자/문자열 둘 다 오는 식별자
inline std::string textField(const nlohmann::json& j, const char* key) {
    if (!j.is_object() || !j.contains(key) || j[key].is_null()) {
        return "";
    }
    const auto& v = j[key];
    if (v.is_string()) {
        return v.get<std::string>();
    }
    if (v.is_number_integer()) {
        return std::to_string(v.get<long long>());
    }
    return v.dump();
}

} // namespace network
} // namespace cryptogate
