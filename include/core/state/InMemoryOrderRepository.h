#pragma once

#include <map>
#include <mutex>

#include "core/contracts/IOrderRepository.h"

namespace cryptogate {
namespace core {

// 단일 프로세스용 (paper 모드/테스트). 조건부 insert 가 하나의 임계 구역
class InMemoryOrderRepository : public IOrderRepository {
public:
    OrderInsertResult insertIfAbsent(const Order& order) override;
    std::optional<Order> getByClientOrderId(const std::string& client_order_id) override;
    std::optional<Order> getById(const std::string& order_id) override;
    bool update(const Order& order) override;

    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, Order> by_client_id_;
    std::map<std::string, std::string> client_id_by_order_id_;
};

} // namespace core
} // namespace cryptogate
