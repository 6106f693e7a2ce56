#include "core/execution/OrderLifecycleStateMachine.h"

#include <algorithm>
#include <cctype>

namespace cryptogate {
namespace core {
namespace execution {

namespace {
constexpr double kQuantityEpsilon = 1e-12;

// 소문자 + 구분자 제거 ("PARTIALLY_FILLED" == "PartiallyFilled")
std::string normalizeEvent(const std::string& event) {
    std::string out;
    out.reserve(event.size());
    for (unsigned char c : event) {
        if (c == '_' || c == '-' || c == ' ') {
            continue;
        }
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

OrderStatus workingStatus(double filled, double quantity) {
    if (filled >= quantity - kQuantityEpsilon && quantity > 0.0) {
        return OrderStatus::FILLED;
    }
    return filled > 0.0 ? OrderStatus::PARTIALLY_FILLED : OrderStatus::OPEN;
}
} // namespace

OrderLifecycleTransitionResult OrderLifecycleStateMachine::transition(
    OrderStatus current_status,
    const std::string& event,
    double current_filled_quantity,
    double order_quantity,
    double executed_quantity,
    double remaining_quantity
) {
    OrderLifecycleTransitionResult result;
    result.status = current_status;
    result.filled_quantity = std::clamp(current_filled_quantity, 0.0, std::max(order_quantity, 0.0));

    if (isTerminal(current_status)) {
        result.terminal = true;
        return result;
    }

    // 체결량은 줄어들지 않는다
    double filled = result.filled_quantity;
    if (executed_quantity > 0.0) {
        filled = std::max(filled, executed_quantity);
    }
    if (remaining_quantity >= 0.0 && order_quantity > remaining_quantity) {
        filled = std::max(filled, order_quantity - remaining_quantity);
    }
    filled = std::min(filled, order_quantity);

    const std::string e = normalizeEvent(event);
    OrderStatus next = current_status;

    if (e == "filled" || e == "done") {
        next = OrderStatus::FILLED;
        if (filled <= 0.0) {
            filled = order_quantity;
        }
    } else if (e == "cancel" || e == "canceled" || e == "cancelled" ||
               e == "partiallyfilledcanceled" || e == "deactivated") {
        next = OrderStatus::CANCELLED;
    } else if (e == "rejected" || e == "reject") {
        next = OrderStatus::REJECTED;
    } else if (e == "expired" || e == "expiredinmatch") {
        next = OrderStatus::EXPIRED;
    } else if (e == "pending" || e == "created") {
        next = filled > 0.0 ? workingStatus(filled, order_quantity) : OrderStatus::PENDING;
    } else {
        // new / open / partiallyfilled / trade / untriggered / pendingcancel ...
        next = workingStatus(filled, order_quantity);
    }

    result.status = next;
    result.filled_quantity = filled;
    result.terminal = isTerminal(next);
    result.changed = (next != current_status) ||
                     (filled - current_filled_quantity > kQuantityEpsilon);
    return result;
}

} // namespace execution
} // namespace core
} // namespace cryptogate
