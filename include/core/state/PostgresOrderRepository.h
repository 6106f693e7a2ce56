#pragma once

#include <string>

#include "core/contracts/IOrderRepository.h"

namespace cryptogate {
namespace core {

// orders 테이블 (sql/001_orders.sql). 유니크 인덱스 uq_orders_client_order_id 가
// 여러 프로세스 간 중복 생성을 막는다: INSERT ... ON CONFLICT DO NOTHING
class PostgresOrderRepository : public IOrderRepository {
public:
    explicit PostgresOrderRepository(std::string connection_string);

    OrderInsertResult insertIfAbsent(const Order& order) override;
    std::optional<Order> getByClientOrderId(const std::string& client_order_id) override;
    std::optional<Order> getById(const std::string& order_id) override;
    bool update(const Order& order) override;

private:
    std::string connection_string_;
};

} // namespace core
} // namespace cryptogate
