#include "broker/BybitBroker.h"
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
const char* kMainnetUrl = "https://api.bybit.com";
const char* kTestnetUrl = "https://api-testnet.bybit.com";
const char* kCategory = "linear";

// 요청 빈도 초과 (HTTP 200 으로 온다)
constexpr int kRetCodeRateLimited = 10006;

const char* sideToBybit(OrderSide side) {
    return side == OrderSide::SELL ? "Sell" : "Buy";
}
}

BybitBroker::BybitBroker(BrokerConfig config,
                         std::shared_ptr<network::IHttpClient> http,
                         std::shared_ptr<execution::RateLimitedConnector> connector)
    : config_(std::move(config))
    , base_url_(config_.testnet ? kTestnetUrl : kMainnetUrl)
    , http_(std::move(http))
    , connector_(std::move(connector)) {
    if (!http_ || !connector_) {
        throw InvalidConfigurationError("BybitBroker requires http client and connector");
    }
}

void BybitBroker::connect() {
    if (!connector_->beginConnect()) {
        LOG_WARN("[Bybit] 이미 연결 중이거나 연결됨 ({})", execution::toString(connector_->state()));
        return;
    }

    try {
        call("GET", "/v5/market/time", {}, nullptr, false);
        if (!config_.api_key.empty() && !config_.api_secret.empty()) {
            network::QueryParams query;
            query["accountType"] = "UNIFIED";
            call("GET", "/v5/account/wallet-balance", query, nullptr, true);
        } else {
            LOG_WARN("[Bybit] API 키 없음 - 공개 API만 사용 가능");
        }
    } catch (const GatewayError& e) {
        connector_->markDisconnected();
        throw BrokerUnavailableError(name_, std::string("connect failed: ") + e.what());
    }

    connector_->markConnected();
    LOG_INFO("[Bybit] 연결 완료 ({})", config_.testnet ? "testnet" : "mainnet");
}

void BybitBroker::disconnect() {
    connector_->markDisconnected();
    LOG_INFO("[Bybit] 연결 해제");
}

Order BybitBroker::placeOrder(const Order& order) {
    if (order.client_order_id.empty()) {
        throw std::invalid_argument("placeOrder: client_order_id is required");
    }
    connector_->ensureConnected();
    requireCredentials();

    nlohmann::json body;
    body["category"] = kCategory;
    body["symbol"] = order.symbol;
    body["side"] = sideToBybit(order.side);
    body["qty"] = common::toDecimalString(order.quantity);
    body["orderLinkId"] = order.client_order_id;

    switch (order.type) {
        case OrderType::MARKET:
            body["orderType"] = "Market";
            break;
        case OrderType::LIMIT:
            if (!order.price) throw std::invalid_argument("LIMIT order requires price");
            body["orderType"] = "Limit";
            body["price"] = common::toDecimalString(*order.price);
            body["timeInForce"] = "GTC";
            break;
        case OrderType::STOP_LOSS:
        case OrderType::STOP_LIMIT:
            if (!order.stop_price) throw std::invalid_argument("stop order requires stop_price");
            body["orderType"] = order.type == OrderType::STOP_LIMIT ? "Limit" : "Market";
            if (order.type == OrderType::STOP_LIMIT) {
                if (!order.price) throw std::invalid_argument("STOP_LIMIT order requires price");
                body["price"] = common::toDecimalString(*order.price);
            }
            body["triggerPrice"] = common::toDecimalString(*order.stop_price);
            // 1: 가격 상승 시 발동, 2: 하락 시 발동
            body["triggerDirection"] = order.side == OrderSide::SELL ? 2 : 1;
            break;
    }

    auto response = send("POST", "/v5/order/create", {}, body, true);

    Order ack = order;
    ack.exchange = name_;
    ack.submitted_at = std::chrono::system_clock::now();
    ack.updated_at = *ack.submitted_at;

    if (!response.isSuccess()) {
        LOG_WARN("[Bybit] 주문 거절 {} - HTTP {} {}", order.client_order_id, response.status_code,
                 network::sanitizeForLog(response.body));
        execution::OrderStateMapper::apply(ack, "Rejected", 0.0);
        Logger::getInstance().logOrder(ack);
        return ack;
    }

    const auto j = parseBody(response);
    const int ret_code = j.value("retCode", -1);
    if (ret_code == kRetCodeRateLimited) {
        throw BrokerUnavailableError(name_, "rate limited (retCode 10006)");
    }
    if (ret_code != 0) {
        LOG_WARN("[Bybit] 주문 거절 {} - retCode {} {}", order.client_order_id, ret_code,
                 j.value("retMsg", ""));
        execution::OrderStateMapper::apply(ack, "Rejected", 0.0);
        Logger::getInstance().logOrder(ack);
        return ack;
    }

    const auto result = j.value("result", nlohmann::json::object());
    ack.exchange_order_id = network::textField(result, "orderId");
    // 생성 응답에는 id 만 온다. 체결 상태는 getOrderStatus 로 확인
    execution::OrderStateMapper::apply(ack, "New", 0.0);

    LOG_INFO("[Bybit] 주문 접수 {} {} {} -> {}", order.symbol, toString(order.side),
             order.quantity, ack.exchange_order_id);
    Logger::getInstance().logOrder(ack);
    return ack;
}

Order BybitBroker::cancelOrder(const std::string& exchange_order_id, const std::string& symbol) {
    connector_->ensureConnected();
    requireCredentials();

    nlohmann::json body;
    body["category"] = kCategory;
    body["symbol"] = symbol;
    body["orderId"] = exchange_order_id;

    const auto result = call("POST", "/v5/order/cancel", {}, body, true);

    Order cancelled;
    cancelled.exchange = name_;
    cancelled.symbol = symbol;
    cancelled.exchange_order_id = network::textField(result, "orderId");
    cancelled.client_order_id = network::textField(result, "orderLinkId");
    cancelled.created_at = std::chrono::system_clock::now();
    cancelled.updated_at = cancelled.created_at;
    execution::OrderStateMapper::apply(cancelled, "Cancelled", 0.0);

    LOG_INFO("[Bybit] 주문 취소 {}", exchange_order_id);
    return cancelled;
}

Order BybitBroker::getOrderStatus(const std::string& exchange_order_id, const std::string& symbol) {
    connector_->ensureConnected();
    requireCredentials();

    network::QueryParams query;
    query["category"] = kCategory;
    query["symbol"] = symbol;
    query["orderId"] = exchange_order_id;

    const auto result = call("GET", "/v5/order/realtime", query, nullptr, true);
    const auto list = result.value("list", nlohmann::json::array());
    if (list.empty()) {
        throw GatewayError("bybit order not found: " + exchange_order_id);
    }
    return parseOrder(list.front());
}

Balance BybitBroker::getBalance(const std::string& currency) {
    connector_->ensureConnected();
    requireCredentials();

    network::QueryParams query;
    query["accountType"] = "UNIFIED";
    query["coin"] = currency;

    const auto result = call("GET", "/v5/account/wallet-balance", query, nullptr, true);

    Balance balance;
    balance.currency = currency;
    for (const auto& account : result.value("list", nlohmann::json::array())) {
        for (const auto& coin : account.value("coin", nlohmann::json::array())) {
            if (coin.value("coin", "") != currency) {
                continue;
            }
            const double wallet = network::numberField(coin, "walletBalance");
            balance.locked = network::numberField(coin, "locked");
            balance.free = wallet - balance.locked;
            return balance;
        }
    }
    return balance;
}

std::vector<Position> BybitBroker::getPositions() {
    connector_->ensureConnected();
    requireCredentials();

    network::QueryParams query;
    query["category"] = kCategory;
    query["settleCoin"] = "USDT";

    const auto result = call("GET", "/v5/position/list", query, nullptr, true);

    std::vector<Position> positions;
    for (const auto& item : result.value("list", nlohmann::json::array())) {
        const double size = network::numberField(item, "size");
        if (size <= 0.0) {
            continue;
        }
        Position p;
        p.symbol = item.value("symbol", "");
        p.exchange = name_;
        p.quantity = item.value("side", "Buy") == "Sell" ? -size : size;
        p.entry_price = network::numberField(item, "avgPrice");
        p.current_price = network::numberField(item, "markPrice");
        p.unrealized_pnl = network::numberField(item, "unrealisedPnl");
        positions.push_back(std::move(p));
    }
    return positions;
}

Price BybitBroker::getMarketPrice(const std::string& symbol) {
    connector_->ensureConnected();

    network::QueryParams query;
    query["category"] = kCategory;
    query["symbol"] = symbol;

    const auto result = call("GET", "/v5/market/tickers", query, nullptr, false);
    const auto list = result.value("list", nlohmann::json::array());
    if (list.empty()) {
        throw GatewayError("bybit ticker not found: " + symbol);
    }
    return network::numberField(list.front(), "lastPrice");
}

Order BybitBroker::parseOrder(const nlohmann::json& item) {
    Order o;
    o.exchange = "bybit";
    o.symbol = item.value("symbol", "");
    o.exchange_order_id = network::textField(item, "orderId");
    o.client_order_id = network::textField(item, "orderLinkId");
    o.side = item.value("side", "Buy") == "Sell" ? OrderSide::SELL : OrderSide::BUY;
    o.type = item.value("orderType", "Market") == "Limit" ? OrderType::LIMIT : OrderType::MARKET;
    o.quantity = network::numberField(item, "qty");
    const double price = network::numberField(item, "price");
    if (price > 0.0) {
        o.price = price;
    }
    const double trigger = network::numberField(item, "triggerPrice");
    if (trigger > 0.0) {
        o.stop_price = trigger;
        o.type = o.type == OrderType::LIMIT ? OrderType::STOP_LIMIT : OrderType::STOP_LOSS;
    }
    const double created_ms = network::numberField(item, "createdTime");
    o.created_at = created_ms > 0.0 ? fromUnixMillis(static_cast<long long>(created_ms))
                                    : std::chrono::system_clock::now();
    o.updated_at = o.created_at;
    o.status = OrderStatus::PENDING;

    const double executed = network::numberField(item, "cumExecQty");
    std::optional<double> avg;
    const double avg_price = network::numberField(item, "avgPrice");
    if (avg_price > 0.0) {
        avg = avg_price;
    }
    execution::OrderStateMapper::apply(o, item.value("orderStatus", "New"), executed, avg);
    return o;
}

nlohmann::json BybitBroker::call(const std::string& method, const std::string& path,
                                 const network::QueryParams& query, const nlohmann::json& body,
                                 bool is_signed) {
    auto response = send(method, path, query, body, is_signed);
    if (!response.isSuccess()) {
        const std::string safe_body = network::sanitizeForLog(response.body);
        LOG_ERROR("[Bybit] {} {} -> HTTP {} {}", method, path, response.status_code, safe_body);
        throw GatewayError("bybit " + path + " failed: HTTP " + std::to_string(response.status_code));
    }

    const auto j = parseBody(response);
    const int ret_code = j.value("retCode", -1);
    if (ret_code == kRetCodeRateLimited) {
        throw BrokerUnavailableError(name_, "rate limited (retCode 10006)");
    }
    if (ret_code != 0) {
        LOG_ERROR("[Bybit] {} {} -> retCode {} {}", method, path, ret_code, j.value("retMsg", ""));
        throw GatewayError("bybit " + path + " failed: " + j.value("retMsg", "unknown error"));
    }
    return j.value("result", nlohmann::json::object());
}

network::HttpResponse BybitBroker::send(const std::string& method, const std::string& path,
                                        const network::QueryParams& query, const nlohmann::json& body,
                                        bool is_signed) {
    auto permit = connector_->throttle();

    const std::string query_string = network::buildQueryString(query);
    const std::string payload = body.is_null() ? "" : body.dump();

    network::HttpHeaders headers;
    headers["Content-Type"] = "application/json";
    if (is_signed) {
        const std::string timestamp = std::to_string(network::RequestSigner::nowMillis());
        const std::string recv_window = std::to_string(config_.recv_window_ms);
        const std::string signed_part = method == "GET" ? query_string : payload;
        headers["X-BAPI-API-KEY"] = config_.api_key;
        headers["X-BAPI-TIMESTAMP"] = timestamp;
        headers["X-BAPI-RECV-WINDOW"] = recv_window;
        headers["X-BAPI-SIGN"] = network::RequestSigner::hmacSha256Hex(
            config_.api_secret, timestamp + config_.api_key + recv_window + signed_part);
    }

    network::HttpResponse response;
    try {
        if (method == "GET") {
            response = http_->get(base_url_ + path, query_string, headers);
        } else {
            response = http_->post(base_url_ + path, payload, headers);
        }
    } catch (const network::TransportError& e) {
        LOG_ERROR("[Bybit] {} {} 전송 실패: {}", method, path, e.what());
        throw BrokerUnavailableError(name_, e.what());
    }

    if (response.isRateLimited() || response.isBlocked() || response.isServerError()) {
        LOG_ERROR("[Bybit] {} {} -> HTTP {}", method, path, response.status_code);
        throw BrokerUnavailableError(name_, "HTTP " + std::to_string(response.status_code));
    }
    return response;
}

nlohmann::json BybitBroker::parseBody(const network::HttpResponse& response) const {
    try {
        return response.json();
    } catch (const nlohmann::json::exception& e) {
        throw BrokerUnavailableError(name_, std::string("malformed response: ") + e.what());
    }
}

void BybitBroker::requireCredentials() const {
    if (config_.api_key.empty() || config_.api_secret.empty()) {
        throw InvalidConfigurationError("bybit: BYBIT_API_KEY / BYBIT_API_SECRET not set");
    }
}

} // namespace broker
} // namespace cryptogate
