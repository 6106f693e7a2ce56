#include "execution/OrderStateMapper.h"

#include "core/execution/OrderLifecycleStateMachine.h"

#include <chrono>

namespace cryptogate {
namespace execution {

bool OrderStateMapper::apply(
    Order& order,
    const std::string& exchange_state,
    double executed_quantity,
    std::optional<double> average_fill_price
) {
    const auto transitioned = core::execution::OrderLifecycleStateMachine::transition(
        order.status,
        exchange_state,
        order.filled_quantity,
        order.quantity,
        executed_quantity
    );

    if (!transitioned.changed) {
        return false;
    }

    const auto now = std::chrono::system_clock::now();
    order.status = transitioned.status;
    order.filled_quantity = transitioned.filled_quantity;
    if (average_fill_price && *average_fill_price > 0.0) {
        order.average_fill_price = average_fill_price;
    }
    order.updated_at = now;
    if (transitioned.terminal && !order.closed_at) {
        order.closed_at = now;
    }
    return true;
}

} // namespace execution
} // namespace cryptogate
