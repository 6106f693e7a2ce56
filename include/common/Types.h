#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <cstdint>

namespace cryptogate {

using Timestamp = std::chrono::system_clock::time_point;
using Price = double;
using Quantity = double;

enum class OrderSide { BUY, SELL };
enum class OrderType { MARKET, LIMIT, STOP_LOSS, STOP_LIMIT };
enum class OrderStatus { PENDING, OPEN, PARTIALLY_FILLED, FILLED, CANCELLED, REJECTED, EXPIRED };

// 주문 - 생성은 OrderIdempotencyService, 상태 변경은 브로커 응답/체결만
struct Order {
    std::string order_id;
    std::string client_order_id;
    std::string exchange_order_id;
    std::string symbol;
    std::string exchange;
    OrderSide side = OrderSide::BUY;
    OrderType type = OrderType::MARKET;
    OrderStatus status = OrderStatus::PENDING;
    Quantity quantity = 0.0;
    Quantity filled_quantity = 0.0;
    std::optional<Price> price;
    std::optional<Price> stop_price;
    std::optional<Price> average_fill_price;
    std::string strategy_id;
    Timestamp created_at{};
    Timestamp updated_at{};
    std::optional<Timestamp> submitted_at;
    std::optional<Timestamp> closed_at;
};

// 전략(외부)이 넘기는 주문 의도
struct OrderRequest {
    std::optional<std::string> client_order_id;
    std::string symbol;
    std::string exchange;
    OrderSide side = OrderSide::BUY;
    OrderType type = OrderType::MARKET;
    Quantity quantity = 0.0;
    std::optional<Price> price;
    std::optional<Price> stop_price;
    std::string strategy_id;
};

// OHLCV 1건 (채널 수집 단위)
struct MarketData {
    std::string symbol;
    Timestamp timestamp{};
    Price open = 0.0;
    Price high = 0.0;
    Price low = 0.0;
    Price close = 0.0;
    Quantity volume = 0.0;
    double quote_volume = 0.0;
    long long trades_count = 0;
    std::string source;
};

struct Position {
    std::string symbol;
    std::string exchange;
    Quantity quantity = 0.0;
    Price entry_price = 0.0;
    Price current_price = 0.0;
    double unrealized_pnl = 0.0;
};

inline long long toUnixMillis(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

inline Timestamp fromUnixMillis(long long ms) {
    return Timestamp(std::chrono::milliseconds(ms));
}

inline bool isTerminal(OrderStatus status) {
    return status == OrderStatus::FILLED || status == OrderStatus::CANCELLED ||
           status == OrderStatus::REJECTED || status == OrderStatus::EXPIRED;
}

inline const char* toString(OrderSide side) {
    return side == OrderSide::BUY ? "BUY" : "SELL";
}

inline const char* toString(OrderType type) {
    switch (type) {
        case OrderType::MARKET: return "MARKET";
        case OrderType::LIMIT: return "LIMIT";
        case OrderType::STOP_LOSS: return "STOP_LOSS";
        case OrderType::STOP_LIMIT: return "STOP_LIMIT";
    }
    return "MARKET";
}

inline const char* toString(OrderStatus status) {
    switch (status) {
        case OrderStatus::PENDING: return "PENDING";
        case OrderStatus::OPEN: return "OPEN";
        case OrderStatus::PARTIALLY_FILLED: return "PARTIALLY_FILLED";
        case OrderStatus::FILLED: return "FILLED";
        case OrderStatus::CANCELLED: return "CANCELLED";
        case OrderStatus::REJECTED: return "REJECTED";
        case OrderStatus::EXPIRED: return "EXPIRED";
    }
    return "PENDING";
}

inline OrderSide orderSideFromString(const std::string& value) {
    return value == "SELL" ? OrderSide::SELL : OrderSide::BUY;
}

inline OrderType orderTypeFromString(const std::string& value) {
    if (value == "LIMIT") return OrderType::LIMIT;
    if (value == "STOP_LOSS") return OrderType::STOP_LOSS;
    if (value == "STOP_LIMIT") return OrderType::STOP_LIMIT;
    return OrderType::MARKET;
}

inline OrderStatus orderStatusFromString(const std::string& value) {
    if (value == "OPEN") return OrderStatus::OPEN;
    if (value == "PARTIALLY_FILLED") return OrderStatus::PARTIALLY_FILLED;
    if (value == "FILLED") return OrderStatus::FILLED;
    if (value == "CANCELLED") return OrderStatus::CANCELLED;
    if (value == "REJECTED") return OrderStatus::REJECTED;
    if (value == "EXPIRED") return OrderStatus::EXPIRED;
    return OrderStatus::PENDING;
}

} // namespace cryptogate
