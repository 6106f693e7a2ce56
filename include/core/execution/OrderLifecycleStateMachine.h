#pragma once

#include <string>

#include "common/Types.h"

namespace cryptogate {
namespace core {
namespace execution {

struct OrderLifecycleTransitionResult {
    OrderStatus status = OrderStatus::OPEN;
    double filled_quantity = 0.0;
    bool terminal = false;
    bool changed = false;
};

// 거래소 이벤트 문자열 -> 주문 상태 전이
// - 체결 수량은 0 <= filled <= quantity 로 고정
// - 종결 상태(FILLED/CANCELLED/REJECTED/EXPIRED)에서는 더 이상 전이하지 않음
class OrderLifecycleStateMachine {
public:
    static OrderLifecycleTransitionResult transition(
        OrderStatus current_status,
        const std::string& event,
        double current_filled_quantity,
        double order_quantity,
        double executed_quantity = 0.0,
        double remaining_quantity = -1.0
    );
};

} // namespace execution
} // namespace core
} // namespace cryptogate
