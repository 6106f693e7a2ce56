#pragma once
// 주문 전송용 수량/가격 문자열
//
// 거래소 REST API 는 지수 표기("1e-05")를 거부하므로 고정 소수점으로 만들고
// 뒤쪽 0 을 잘라낸다. 0.00100000 -> "0.001", 42.0 -> "42"

#include <cmath>
#include <cstdio>
#include <string>

namespace cryptogate {
namespace common {

inline std::string toDecimalString(double value, int max_decimals = 8) {
    if (!std::isfinite(value)) {
        return "0";
    }
    if (max_decimals < 0) max_decimals = 0;
    if (max_decimals > 12) max_decimals = 12;

    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.*f", max_decimals, value);
    std::string text(buffer);

    const auto dot = text.find('.');
    if (dot == std::string::npos) {
        return text;
    }
    auto last = text.find_last_not_of('0');
    if (last == dot) {
        --last;
    }
    text.erase(last + 1);
    if (text == "-0") {
        return "0";
    }
    return text;
}

} // namespace common
} // namespace cryptogate
