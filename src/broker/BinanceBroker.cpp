#include "broker/BinanceBroker.h"
#include "common/DecimalFormat.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "execution/OrderStateMapper.h"
#include "network/JsonFields.h"
#include "network/RequestSigner.h"

#include <chrono>
#include <stdexcept>

namespace cryptogate {
namespace broker {

namespace {
const char* kMainnetUrl = "https://api.binance.com";
const char* kTestnetUrl = "https://testnet.binance.vision";

OrderType typeFromBinance(const std::string& type) {
    if (type == "LIMIT" || type == "LIMIT_MAKER") return OrderType::LIMIT;
    if (type == "STOP_LOSS") return OrderType::STOP_LOSS;
    if (type == "STOP_LOSS_LIMIT") return OrderType::STOP_LIMIT;
    return OrderType::MARKET;
}
}

BinanceBroker::BinanceBroker(BrokerConfig config,
                             std::shared_ptr<network::IHttpClient> http,
                             std::shared_ptr<execution::RateLimitedConnector> connector)
    : config_(std::move(config))
    , base_url_(config_.testnet ? kTestnetUrl : kMainnetUrl)
    , http_(std::move(http))
    , connector_(std::move(connector)) {
    if (!http_ || !connector_) {
        throw InvalidConfigurationError("BinanceBroker requires http client and connector");
    }
}

void BinanceBroker::connect() {
    if (!connector_->beginConnect()) {
        LOG_WARN("[Binance] 이미 연결 중이거나 연결됨 ({})", execution::toString(connector_->state()));
        return;
    }

    try {
        auto ping = send("GET", "/api/v3/ping", {}, false);
        if (!ping.isSuccess()) {
            throw BrokerUnavailableError(name_, "ping failed: HTTP " + std::to_string(ping.status_code));
        }
        if (!config_.api_key.empty() && !config_.api_secret.empty()) {
            auto response = send("GET", "/api/v3/account", {}, true);
            if (!response.isSuccess()) {
                throw BrokerUnavailableError(name_, "account check failed: HTTP " +
                                             std::to_string(response.status_code));
            }
        } else {
            LOG_WARN("[Binance] API 키 없음 - 공개 API만 사용 가능");
        }
    } catch (...) {
        connector_->markDisconnected();
        throw;
    }

    connector_->markConnected();
    LOG_INFO("[Binance] 연결 완료 ({})", config_.testnet ? "testnet" : "mainnet");
}

void BinanceBroker::disconnect() {
    connector_->markDisconnected();
    LOG_INFO("[Binance] 연결 해제");
}

Order BinanceBroker::placeOrder(const Order& order) {
    if (order.client_order_id.empty()) {
        throw std::invalid_argument("placeOrder: client_order_id is required");
    }
    connector_->ensureConnected();
    requireCredentials();

    network::QueryParams params;
    params["symbol"] = order.symbol;
    params["side"] = toString(order.side);
    params["quantity"] = common::toDecimalString(order.quantity);
    params["newClientOrderId"] = order.client_order_id;
    params["newOrderRespType"] = "RESULT";

    switch (order.type) {
        case OrderType::MARKET:
            params["type"] = "MARKET";
            break;
        case OrderType::LIMIT:
            if (!order.price) throw std::invalid_argument("LIMIT order requires price");
            params["type"] = "LIMIT";
            params["timeInForce"] = "GTC";
            params["price"] = common::toDecimalString(*order.price);
            break;
        case OrderType::STOP_LOSS:
            if (!order.stop_price) throw std::invalid_argument("STOP_LOSS order requires stop_price");
            params["type"] = "STOP_LOSS";
            params["stopPrice"] = common::toDecimalString(*order.stop_price);
            break;
        case OrderType::STOP_LIMIT:
            if (!order.price || !order.stop_price) {
                throw std::invalid_argument("STOP_LIMIT order requires price and stop_price");
            }
            params["type"] = "STOP_LOSS_LIMIT";
            params["timeInForce"] = "GTC";
            params["price"] = common::toDecimalString(*order.price);
            params["stopPrice"] = common::toDecimalString(*order.stop_price);
            break;
    }

    auto response = send("POST", "/api/v3/order", std::move(params), true);

    Order ack = order;
    ack.exchange = name_;
    ack.submitted_at = std::chrono::system_clock::now();
    ack.updated_at = *ack.submitted_at;

    if (!response.isSuccess()) {
        // 거래소 거절 (잔고 부족, 중복 client id, 필터 위반 ...)
        LOG_WARN("[Binance] 주문 거절 {} - {}", order.client_order_id, network::sanitizeForLog(response.body));
        execution::OrderStateMapper::apply(ack, "REJECTED", 0.0);
        Logger::getInstance().logOrder(ack);
        return ack;
    }

    const auto j = parseBody(response);
    ack.exchange_order_id = network::textField(j, "orderId");
    const double executed = network::numberField(j, "executedQty");
    std::optional<double> avg;
    if (executed > 0.0) {
        avg = network::numberField(j, "cummulativeQuoteQty") / executed;
    }
    execution::OrderStateMapper::apply(ack, j.value("status", "NEW"), executed, avg);

    LOG_INFO("[Binance] 주문 접수 {} {} {} -> {} ({})", order.symbol, toString(order.side),
             order.quantity, ack.exchange_order_id, toString(ack.status));
    Logger::getInstance().logOrder(ack);
    return ack;
}

Order BinanceBroker::cancelOrder(const std::string& exchange_order_id, const std::string& symbol) {
    connector_->ensureConnected();
    requireCredentials();

    network::QueryParams params;
    params["symbol"] = symbol;
    params["orderId"] = exchange_order_id;

    auto response = send("DELETE", "/api/v3/order", std::move(params), true);
    if (!response.isSuccess()) {
        const std::string safe_body = network::sanitizeForLog(response.body);
        LOG_ERROR("[Binance] 주문 취소 실패 {} - {}", exchange_order_id, safe_body);
        throw GatewayError("Failed to cancel order " + exchange_order_id + ": " + safe_body);
    }

    auto cancelled = parseOrder(parseBody(response));
    LOG_INFO("[Binance] 주문 취소 {} ({})", exchange_order_id, toString(cancelled.status));
    return cancelled;
}

Order BinanceBroker::getOrderStatus(const std::string& exchange_order_id, const std::string& symbol) {
    connector_->ensureConnected();
    requireCredentials();

    network::QueryParams params;
    params["symbol"] = symbol;
    params["orderId"] = exchange_order_id;

    auto response = send("GET", "/api/v3/order", std::move(params), true);
    if (!response.isSuccess()) {
        const std::string safe_body = network::sanitizeForLog(response.body);
        LOG_ERROR("[Binance] 주문 조회 실패 {} - {}", exchange_order_id, safe_body);
        throw GatewayError("Failed to get order " + exchange_order_id + ": " + safe_body);
    }
    return parseOrder(parseBody(response));
}

Balance BinanceBroker::getBalance(const std::string& currency) {
    connector_->ensureConnected();
    requireCredentials();

    auto response = send("GET", "/api/v3/account", {}, true);
    if (!response.isSuccess()) {
        throw GatewayError("Failed to get balance: " + network::sanitizeForLog(response.body));
    }

    Balance balance;
    balance.currency = currency;
    const auto j = parseBody(response);
    for (const auto& item : j.value("balances", nlohmann::json::array())) {
        if (item.value("asset", "") == currency) {
            balance.free = network::numberField(item, "free");
            balance.locked = network::numberField(item, "locked");
            break;
        }
    }
    return balance;
}

std::vector<Position> BinanceBroker::getPositions() {
    connector_->ensureConnected();
    return {};
}

Price BinanceBroker::getMarketPrice(const std::string& symbol) {
    connector_->ensureConnected();

    network::QueryParams params;
    params["symbol"] = symbol;
    auto response = send("GET", "/api/v3/ticker/price", std::move(params), false);
    if (!response.isSuccess()) {
        throw GatewayError("Failed to get price for " + symbol + ": " + network::sanitizeForLog(response.body));
    }
    return network::numberField(parseBody(response), "price");
}

Order BinanceBroker::parseOrder(const nlohmann::json& j) {
    Order o;
    o.exchange = "binance";
    o.symbol = j.value("symbol", "");
    o.exchange_order_id = network::textField(j, "orderId");
    // 취소 응답의 clientOrderId 는 취소 요청 id, 원 주문 id 는 origClientOrderId
    o.client_order_id = j.contains("origClientOrderId") ? j.value("origClientOrderId", "")
                                                         : j.value("clientOrderId", "");
    o.side = j.value("side", "BUY") == "SELL" ? OrderSide::SELL : OrderSide::BUY;
    o.type = typeFromBinance(j.value("type", "MARKET"));
    o.quantity = network::numberField(j, "origQty");
    const double price = network::numberField(j, "price");
    if (price > 0.0) {
        o.price = price;
    }
    const double stop = network::numberField(j, "stopPrice");
    if (stop > 0.0) {
        o.stop_price = stop;
    }
    o.created_at = j.contains("time") ? fromUnixMillis(j["time"].get<long long>())
                                      : std::chrono::system_clock::now();
    o.updated_at = o.created_at;
    o.status = OrderStatus::PENDING;

    const double executed = network::numberField(j, "executedQty");
    std::optional<double> avg;
    if (executed > 0.0) {
        avg = network::numberField(j, "cummulativeQuoteQty") / executed;
    }
    execution::OrderStateMapper::apply(o, j.value("status", "NEW"), executed, avg);
    return o;
}

network::HttpResponse BinanceBroker::send(const std::string& method,
                                          const std::string& path,
                                          network::QueryParams params,
                                          bool is_signed) {
    auto permit = connector_->throttle();

    // 대기가 끝난 뒤 서명해야 timestamp 가 recvWindow 안에 든다
    network::HttpHeaders headers;
    std::string query;
    if (is_signed) {
        params["timestamp"] = std::to_string(network::RequestSigner::nowMillis());
        params["recvWindow"] = std::to_string(config_.recv_window_ms);
        query = network::buildQueryString(params);
        query += "&signature=" + network::RequestSigner::hmacSha256Hex(config_.api_secret, query);
        headers["X-MBX-APIKEY"] = config_.api_key;
    } else {
        query = network::buildQueryString(params);
    }

    network::HttpResponse response;
    try {
        if (method == "GET") {
            response = http_->get(base_url_ + path, query, headers);
        } else if (method == "POST") {
            const std::string url = query.empty() ? base_url_ + path : base_url_ + path + "?" + query;
            response = http_->post(url, "", headers);
        } else {
            response = http_->del(base_url_ + path, query, headers);
        }
    } catch (const network::TransportError& e) {
        LOG_ERROR("[Binance] {} {} 전송 실패: {}", method, path, e.what());
        throw BrokerUnavailableError(name_, e.what());
    }

    if (response.isRateLimited() || response.isBlocked() || response.isServerError()) {
        LOG_ERROR("[Binance] {} {} -> HTTP {}", method, path, response.status_code);
        throw BrokerUnavailableError(name_, "HTTP " + std::to_string(response.status_code));
    }

    const std::string weight = response.header("X-MBX-USED-WEIGHT-1M");
    if (!weight.empty()) {
        LOG_DEBUG("[Binance] used weight 1m = {}", weight);
    }
    return response;
}

nlohmann::json BinanceBroker::parseBody(const network::HttpResponse& response) const {
    try {
        return response.json();
    } catch (const nlohmann::json::exception& e) {
        throw BrokerUnavailableError(name_, std::string("malformed response: ") + e.what());
    }
}

void BinanceBroker::requireCredentials() const {
    if (config_.api_key.empty() || config_.api_secret.empty()) {
        throw InvalidConfigurationError("binance: BINANCE_API_KEY / BINANCE_API_SECRET not set");
    }
}

} // namespace broker
} // namespace cryptogate
