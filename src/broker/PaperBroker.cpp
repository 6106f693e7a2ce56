#include "broker/PaperBroker.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "execution/OrderStateMapper.h"

#include <chrono>
#include <cmath>
#include <stdexcept>

namespace cryptogate {
namespace broker {

PaperBroker::PaperBroker(std::shared_ptr<execution::RateLimitedConnector> connector,
                         double initial_quote_balance,
                         std::string quote_currency)
    : quote_currency_(std::move(quote_currency))
    , connector_(std::move(connector)) {
    if (!connector_) {
        throw InvalidConfigurationError("PaperBroker requires a connector");
    }
    Balance cash;
    cash.currency = quote_currency_;
    cash.free = initial_quote_balance;
    balances_[quote_currency_] = cash;
}

void PaperBroker::connect() {
    if (!connector_->beginConnect()) {
        LOG_WARN("[Paper] 이미 연결 중이거나 연결됨");
        return;
    }
    connector_->markConnected();
    LOG_INFO("[Paper] 모의 거래소 연결 (잔고 {} {})", balances_[quote_currency_].free, quote_currency_);
}

void PaperBroker::disconnect() {
    connector_->markDisconnected();
    LOG_INFO("[Paper] 연결 해제");
}

Order PaperBroker::placeOrder(const Order& order) {
    if (order.client_order_id.empty()) {
        throw std::invalid_argument("placeOrder: client_order_id is required");
    }
    connector_->ensureConnected();
    auto permit = connector_->throttle();

    std::lock_guard<std::mutex> lock(mutex_);

    Order ack = order;
    ack.exchange = name_;
    ack.submitted_at = std::chrono::system_clock::now();
    ack.updated_at = *ack.submitted_at;

    if (client_ids_.count(order.client_order_id) > 0) {
        LOG_WARN("[Paper] 중복 client_order_id 거절: {}", order.client_order_id);
        execution::OrderStateMapper::apply(ack, "REJECTED", 0.0);
        return ack;
    }

    ack.exchange_order_id = "paper-" + std::to_string(next_order_id_++);

    const auto price_it = prices_.find(order.symbol);
    if (order.type == OrderType::MARKET) {
        if (price_it == prices_.end()) {
            LOG_WARN("[Paper] {} 시세 없음 - 시장가 주문 거절", order.symbol);
            execution::OrderStateMapper::apply(ack, "REJECTED", 0.0);
            return ack;
        }
        fillLocked(ack, price_it->second);
    } else {
        if (!order.price) {
            throw std::invalid_argument("paper: non-market order requires price");
        }
        execution::OrderStateMapper::apply(ack, "NEW", 0.0);
        if (price_it != prices_.end() && limitCrossed(ack, price_it->second)) {
            fillLocked(ack, *ack.price);
        }
    }

    orders_[ack.exchange_order_id] = ack;
    client_ids_[ack.client_order_id] = ack.exchange_order_id;

    LOG_INFO("[Paper] 주문 {} {} {} -> {} ({})", ack.symbol, toString(ack.side), ack.quantity,
             ack.exchange_order_id, toString(ack.status));
    Logger::getInstance().logOrder(ack);
    return ack;
}

Order PaperBroker::cancelOrder(const std::string& exchange_order_id, const std::string& symbol) {
    connector_->ensureConnected();
    auto permit = connector_->throttle();

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = orders_.find(exchange_order_id);
    if (it == orders_.end() || it->second.symbol != symbol) {
        throw GatewayError("paper order not found: " + exchange_order_id);
    }
    if (isTerminal(it->second.status)) {
        throw GatewayError("paper order already " + std::string(toString(it->second.status)) +
                           ": " + exchange_order_id);
    }
    execution::OrderStateMapper::apply(it->second, "CANCELED", it->second.filled_quantity);
    LOG_INFO("[Paper] 주문 취소 {}", exchange_order_id);
    return it->second;
}

Order PaperBroker::getOrderStatus(const std::string& exchange_order_id, const std::string& symbol) {
    connector_->ensureConnected();
    auto permit = connector_->throttle();

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = orders_.find(exchange_order_id);
    if (it == orders_.end() || it->second.symbol != symbol) {
        throw GatewayError("paper order not found: " + exchange_order_id);
    }
    return it->second;
}

Balance PaperBroker::getBalance(const std::string& currency) {
    connector_->ensureConnected();
    auto permit = connector_->throttle();

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(currency);
    if (it == balances_.end()) {
        Balance empty;
        empty.currency = currency;
        return empty;
    }
    return it->second;
}

std::vector<Position> PaperBroker::getPositions() {
    connector_->ensureConnected();
    auto permit = connector_->throttle();

    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Position> out;
    for (const auto& [symbol, position] : positions_) {
        if (std::abs(position.quantity) < 1e-12) {
            continue;
        }
        Position p = position;
        const auto price_it = prices_.find(symbol);
        if (price_it != prices_.end()) {
            p.current_price = price_it->second;
            p.unrealized_pnl = (p.current_price - p.entry_price) * p.quantity;
        }
        out.push_back(p);
    }
    return out;
}

Price PaperBroker::getMarketPrice(const std::string& symbol) {
    connector_->ensureConnected();
    auto permit = connector_->throttle();

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = prices_.find(symbol);
    if (it == prices_.end()) {
        throw GatewayError("paper: no price for " + symbol);
    }
    return it->second;
}

void PaperBroker::setMarketPrice(const std::string& symbol, Price price) {
    std::lock_guard<std::mutex> lock(mutex_);
    prices_[symbol] = price;

    for (auto& [id, order] : orders_) {
        if (order.symbol != symbol || isTerminal(order.status) || !order.price) {
            continue;
        }
        if (limitCrossed(order, price)) {
            fillLocked(order, *order.price);
            LOG_INFO("[Paper] 지정가 체결 {} @ {}", id, *order.price);
            Logger::getInstance().logOrder(order);
        }
    }
}

std::size_t PaperBroker::openOrderCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = 0;
    for (const auto& [id, order] : orders_) {
        if (!isTerminal(order.status)) {
            ++count;
        }
    }
    return count;
}

void PaperBroker::fillLocked(Order& order, Price price) {
    const double remaining = order.quantity - order.filled_quantity;
    if (remaining <= 0.0) {
        return;
    }
    execution::OrderStateMapper::apply(order, "FILLED", order.quantity, price);

    auto& cash = balances_[quote_currency_];
    cash.currency = quote_currency_;
    auto& position = positions_[order.symbol];
    position.symbol = order.symbol;
    position.exchange = name_;

    const double signed_qty = order.side == OrderSide::BUY ? remaining : -remaining;
    const double next_qty = position.quantity + signed_qty;
    if (std::abs(next_qty) < 1e-12) {
        position.entry_price = 0.0;
    } else if (position.quantity * signed_qty >= 0.0) {
        // 같은 방향으로 늘어나면 평균 단가 갱신
        position.entry_price = (position.entry_price * std::abs(position.quantity) + price * remaining) /
                               std::abs(next_qty);
    } else if (position.quantity * next_qty < 0.0) {
        // 반대 방향으로 넘어가면 새 포지션
        position.entry_price = price;
    }
    position.quantity = next_qty;
    cash.free -= signed_qty * price;
}

bool PaperBroker::limitCrossed(const Order& order, Price price) {
    if (!order.price) {
        return false;
    }
    return order.side == OrderSide::BUY ? price <= *order.price : price >= *order.price;
}

} // namespace broker
} // namespace cryptogate
