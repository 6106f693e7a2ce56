#include "core/state/InMemoryOrderRepository.h"

#include <stdexcept>

namespace cryptogate {
namespace core {

OrderInsertResult InMemoryOrderRepository::insertIfAbsent(const Order& order) {
    if (order.client_order_id.empty()) {
        throw std::invalid_argument("insertIfAbsent: client_order_id must not be empty");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    OrderInsertResult result;
    auto [it, inserted] = by_client_id_.emplace(order.client_order_id, order);
    result.inserted = inserted;
    result.order = it->second;
    if (inserted) {
        client_id_by_order_id_[order.order_id] = order.client_order_id;
    }
    return result;
}

std::optional<Order> InMemoryOrderRepository::getByClientOrderId(const std::string& client_order_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = by_client_id_.find(client_order_id);
    if (it == by_client_id_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Order> InMemoryOrderRepository::getById(const std::string& order_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id_it = client_id_by_order_id_.find(order_id);
    if (id_it == client_id_by_order_id_.end()) {
        return std::nullopt;
    }
    return by_client_id_.at(id_it->second);
}

bool InMemoryOrderRepository::update(const Order& order) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = by_client_id_.find(order.client_order_id);
    if (it == by_client_id_.end()) {
        return false;
    }
    // 식별자는 불변
    Order next = order;
    next.order_id = it->second.order_id;
    next.client_order_id = it->second.client_order_id;
    next.created_at = it->second.created_at;
    it->second = std::move(next);
    return true;
}

std::size_t InMemoryOrderRepository::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return by_client_id_.size();
}

} // namespace core
} // namespace cryptogate
