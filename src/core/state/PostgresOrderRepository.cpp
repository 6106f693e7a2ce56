#include "core/state/PostgresOrderRepository.h"
#include "common/Logger.h"

#include <pqxx/pqxx>

namespace cryptogate {
namespace core {

namespace {
const char* kSelectColumns =
    "SELECT order_id, client_order_id, exchange_order_id, symbol, exchange, side, type, status, "
    "quantity, filled_quantity, price, stop_price, average_fill_price, strategy_id, "
    "(EXTRACT(EPOCH FROM created_at) * 1000)::BIGINT AS created_ms, "
    "(EXTRACT(EPOCH FROM updated_at) * 1000)::BIGINT AS updated_ms, "
    "(EXTRACT(EPOCH FROM submitted_at) * 1000)::BIGINT AS submitted_ms, "
    "(EXTRACT(EPOCH FROM closed_at) * 1000)::BIGINT AS closed_ms "
    "FROM orders ";

std::optional<double> optionalDouble(const pqxx::field& f) {
    if (f.is_null()) {
        return std::nullopt;
    }
    return f.as<double>();
}

std::optional<Timestamp> optionalTimestamp(const pqxx::field& f) {
    if (f.is_null()) {
        return std::nullopt;
    }
    return fromUnixMillis(f.as<long long>());
}

std::optional<long long> optionalMillis(const std::optional<Timestamp>& ts) {
    if (!ts) {
        return std::nullopt;
    }
    return toUnixMillis(*ts);
}

std::optional<std::string> optionalText(const std::string& s) {
    if (s.empty()) {
        return std::nullopt;
    }
    return s;
}

Order fromRow(const pqxx::row& row) {
    Order o;
    o.order_id = row["order_id"].as<std::string>();
    o.client_order_id = row["client_order_id"].as<std::string>();
    o.exchange_order_id = row["exchange_order_id"].is_null() ? "" : row["exchange_order_id"].as<std::string>();
    o.symbol = row["symbol"].as<std::string>();
    o.exchange = row["exchange"].as<std::string>();
    o.side = orderSideFromString(row["side"].as<std::string>());
    o.type = orderTypeFromString(row["type"].as<std::string>());
    o.status = orderStatusFromString(row["status"].as<std::string>());
    o.quantity = row["quantity"].as<double>();
    o.filled_quantity = row["filled_quantity"].as<double>();
    o.price = optionalDouble(row["price"]);
    o.stop_price = optionalDouble(row["stop_price"]);
    o.average_fill_price = optionalDouble(row["average_fill_price"]);
    o.strategy_id = row["strategy_id"].is_null() ? "" : row["strategy_id"].as<std::string>();
    o.created_at = fromUnixMillis(row["created_ms"].as<long long>());
    o.updated_at = fromUnixMillis(row["updated_ms"].as<long long>());
    o.submitted_at = optionalTimestamp(row["submitted_ms"]);
    o.closed_at = optionalTimestamp(row["closed_ms"]);
    return o;
}
}

PostgresOrderRepository::PostgresOrderRepository(std::string connection_string)
    : connection_string_(std::move(connection_string)) {
    // 연결만 확인. 스키마는 sql/ 마이그레이션으로 관리
    pqxx::connection c(connection_string_);
    LOG_INFO("[OrderRepo] PostgreSQL 연결 확인 - {}", c.dbname());
}

OrderInsertResult PostgresOrderRepository::insertIfAbsent(const Order& order) {
    pqxx::connection c(connection_string_);
    pqxx::work t(c);

    auto inserted = t.exec_params(
        "INSERT INTO orders (order_id, client_order_id, exchange_order_id, symbol, exchange, side, type, "
        "status, quantity, filled_quantity, price, stop_price, average_fill_price, strategy_id, "
        "created_at, updated_at, submitted_at, closed_at) "
        "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, $14, "
        "to_timestamp($15::DOUBLE PRECISION / 1000.0), to_timestamp($16::DOUBLE PRECISION / 1000.0), "
        "to_timestamp($17::DOUBLE PRECISION / 1000.0), to_timestamp($18::DOUBLE PRECISION / 1000.0)) "
        "ON CONFLICT (client_order_id) DO NOTHING "
        "RETURNING order_id",
        order.order_id, order.client_order_id, optionalText(order.exchange_order_id),
        order.symbol, order.exchange, std::string(toString(order.side)), std::string(toString(order.type)),
        std::string(toString(order.status)), order.quantity, order.filled_quantity,
        order.price, order.stop_price, order.average_fill_price, optionalText(order.strategy_id),
        toUnixMillis(order.created_at), toUnixMillis(order.updated_at),
        optionalMillis(order.submitted_at), optionalMillis(order.closed_at));

    OrderInsertResult result;
    if (!inserted.empty()) {
        t.commit();
        result.inserted = true;
        result.order = order;
        return result;
    }

    // 충돌: 다른 트랜잭션이 커밋한 행을 읽는다 (READ COMMITTED 는 문장마다 새 스냅샷)
    auto existing = t.exec_params(std::string(kSelectColumns) + "WHERE client_order_id = $1",
                                  order.client_order_id);
    t.commit();
    if (existing.empty()) {
        throw std::runtime_error("orders conflict on " + order.client_order_id + " but row not visible");
    }
    result.inserted = false;
    result.order = fromRow(existing[0]);
    return result;
}

std::optional<Order> PostgresOrderRepository::getByClientOrderId(const std::string& client_order_id) {
    pqxx::connection c(connection_string_);
    pqxx::work t(c);
    auto r = t.exec_params(std::string(kSelectColumns) + "WHERE client_order_id = $1", client_order_id);
    if (r.empty()) {
        return std::nullopt;
    }
    return fromRow(r[0]);
}

std::optional<Order> PostgresOrderRepository::getById(const std::string& order_id) {
    pqxx::connection c(connection_string_);
    pqxx::work t(c);
    auto r = t.exec_params(std::string(kSelectColumns) + "WHERE order_id = $1", order_id);
    if (r.empty()) {
        return std::nullopt;
    }
    return fromRow(r[0]);
}

bool PostgresOrderRepository::update(const Order& order) {
    pqxx::connection c(connection_string_);
    pqxx::work t(c);
    auto r = t.exec_params(
        "UPDATE orders SET exchange_order_id = $2, status = $3, filled_quantity = $4, "
        "average_fill_price = $5, updated_at = to_timestamp($6::DOUBLE PRECISION / 1000.0), "
        "submitted_at = to_timestamp($7::DOUBLE PRECISION / 1000.0), "
        "closed_at = to_timestamp($8::DOUBLE PRECISION / 1000.0) "
        "WHERE client_order_id = $1",
        order.client_order_id, optionalText(order.exchange_order_id), std::string(toString(order.status)),
        order.filled_quantity, order.average_fill_price, toUnixMillis(order.updated_at),
        optionalMillis(order.submitted_at), optionalMillis(order.closed_at));
    t.commit();
    return r.affected_rows() > 0;
}

} // namespace core
} // namespace cryptogate
