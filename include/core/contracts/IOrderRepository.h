#pragma once

#include <optional>
#include <string>

#include "common/Types.h"

namespace cryptogate {
namespace core {

struct OrderInsertResult {
    bool inserted = false;
    Order order;   // inserted 면 방금 쓴 주문, 아니면 이미 저장돼 있던 주문
};

// client_order_id 유니크 제약을 가진 저장소
class IOrderRepository {
public:
    virtual ~IOrderRepository() = default;

    // 원자적 조건부 insert. 같은 client_order_id 가 이미 있으면 기존 행을 돌려준다
    virtual OrderInsertResult insertIfAbsent(const Order& order) = 0;

    virtual std::optional<Order> getByClientOrderId(const std::string& client_order_id) = 0;
    virtual std::optional<Order> getById(const std::string& order_id) = 0;

    // 브로커 응답/체결 반영. 없는 주문이면 false
    virtual bool update(const Order& order) = 0;
};

} // namespace core
} // namespace cryptogate
