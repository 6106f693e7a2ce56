#include "core/execution/OrderLifecycleStateMachine.h"
#include "execution/OrderStateMapper.h"

#include <cassert>
#include <iostream>

using cryptogate::Order;
using cryptogate::OrderStatus;
using cryptogate::core::execution::OrderLifecycleStateMachine;
using cryptogate::execution::OrderStateMapper;

int main() {
    {
        auto r = OrderLifecycleStateMachine::transition(OrderStatus::PENDING, "NEW", 0.0, 1.0);
        assert(r.status == OrderStatus::OPEN);
        assert(!r.terminal);
        assert(r.changed);
        assert(r.filled_quantity == 0.0);
    }

    {
        auto r = OrderLifecycleStateMachine::transition(OrderStatus::OPEN, "PARTIALLY_FILLED", 0.0, 2.0, 0.5);
        assert(r.status == OrderStatus::PARTIALLY_FILLED);
        assert(!r.terminal);
        assert(r.filled_quantity > 0.49 && r.filled_quantity < 0.51);
    }

    {
        // Bybit 표기
        auto r = OrderLifecycleStateMachine::transition(OrderStatus::OPEN, "PartiallyFilled", 0.0, 2.0, 1.0);
        assert(r.status == OrderStatus::PARTIALLY_FILLED);
    }

    {
        auto r = OrderLifecycleStateMachine::transition(OrderStatus::OPEN, "FILLED", 0.0, 1.0);
        assert(r.status == OrderStatus::FILLED);
        assert(r.terminal);
        assert(r.filled_quantity == 1.0);
    }

    {
        // 체결량은 주문 수량을 넘지 않는다
        auto r = OrderLifecycleStateMachine::transition(OrderStatus::OPEN, "trade", 0.0, 1.0, 3.0);
        assert(r.filled_quantity == 1.0);
        assert(r.status == OrderStatus::FILLED);
    }

    {
        auto r = OrderLifecycleStateMachine::transition(OrderStatus::PARTIALLY_FILLED, "Cancelled", 0.2, 1.0, 0.2);
        assert(r.status == OrderStatus::CANCELLED);
        assert(r.terminal);
        assert(r.filled_quantity > 0.19 && r.filled_quantity < 0.21);
    }

    {
        auto r = OrderLifecycleStateMachine::transition(OrderStatus::PENDING, "REJECTED", 0.0, 1.0);
        assert(r.status == OrderStatus::REJECTED);
        assert(r.terminal);
    }

    {
        auto r = OrderLifecycleStateMachine::transition(OrderStatus::OPEN, "EXPIRED", 0.0, 1.0);
        assert(r.status == OrderStatus::EXPIRED);
    }

    {
        // 종결 상태는 바뀌지 않는다
        auto r = OrderLifecycleStateMachine::transition(OrderStatus::FILLED, "NEW", 1.0, 1.0);
        assert(r.status == OrderStatus::FILLED);
        assert(!r.changed);
        assert(r.terminal);
    }

    {
        Order order;
        order.quantity = 2.0;
        assert(OrderStateMapper::apply(order, "NEW", 0.0));
        assert(order.status == OrderStatus::OPEN);
        assert(!order.closed_at);

        assert(OrderStateMapper::apply(order, "FILLED", 2.0, 101.5));
        assert(order.status == OrderStatus::FILLED);
        assert(order.filled_quantity == 2.0);
        assert(order.average_fill_price && *order.average_fill_price == 101.5);
        assert(order.closed_at.has_value());

        assert(!OrderStateMapper::apply(order, "CANCELED", 2.0));
        assert(order.status == OrderStatus::FILLED);
    }

    std::cout << "[TEST] ExecutionStateMachine PASSED\n";
    return 0;
}
