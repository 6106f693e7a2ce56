#pragma once

#include "common/Types.h"
#include <optional>
#include <string>

namespace cryptogate {
namespace execution {

// 거래소 응답(상태 문자열 + 체결량)을 Order 에 반영
class OrderStateMapper {
public:
    // 변경이 있었으면 true. updated_at / closed_at 도 함께 갱신
    static bool apply(
        Order& order,
        const std::string& exchange_state,
        double executed_quantity,
        std::optional<double> average_fill_price = std::nullopt
    );
};

} // namespace execution
} // namespace cryptogate
