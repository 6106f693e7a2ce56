#include "broker/BinanceBroker.h"
#include "broker/BrokerFactory.h"
#include "broker/BybitBroker.h"
#include "common/Errors.h"
#include "execution/RateLimitedConnector.h"
#include "fakes/FakeHttpClient.h"
#include "network/RequestSigner.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>

using namespace cryptogate;
using test::FakeHttpClient;

namespace {

BrokerConfig makeConfig(const std::string& name, bool with_keys) {
    BrokerConfig config;
    config.name = name;
    config.enabled = true;
    config.testnet = true;
    config.min_request_interval_ms = 0;
    config.max_concurrent_requests = 4;
    if (with_keys) {
        config.api_key = "test-key";
        config.api_secret = "test-secret";
    }
    return config;
}

std::shared_ptr<execution::RateLimitedConnector> makeConnector(const std::string& name) {
    return std::make_shared<execution::RateLimitedConnector>(
        execution::ConnectorSettings(name, std::chrono::milliseconds(0), 4));
}

Order makeOrder(const std::string& client_id, OrderType type = OrderType::MARKET) {
    Order order;
    order.order_id = "local-1";
    order.client_order_id = client_id;
    order.symbol = "BTCUSDT";
    order.side = OrderSide::BUY;
    order.type = type;
    order.quantity = 0.5;
    if (type == OrderType::LIMIT) {
        order.price = 95000.5;
    }
    return order;
}

bool near(double a, double b) {
    return std::abs(a - b) < 1e-9;
}

template <typename E, typename F>
bool throwsAs(F&& fn) {
    try {
        fn();
    } catch (const E&) {
        return true;
    }
    return false;
}

void testBinanceLifecycle() {
    auto http = std::make_shared<FakeHttpClient>();
    http->on("/api/v3/ping", 503, "{}");
    http->on("/api/v3/ping", 200, "{}");

    broker::BinanceBroker binance(makeConfig("binance", false), http, makeConnector("binance"));
    assert(!binance.isConnected());
    assert(throwsAs<NotConnectedError>([&]() { binance.placeOrder(makeOrder("AT_1_a")); }));

    // 첫 ping 실패 -> 연결 안 됨, 다시 시도 가능
    assert(throwsAs<BrokerUnavailableError>([&]() { binance.connect(); }));
    assert(!binance.isConnected());

    binance.connect();
    assert(binance.isConnected());

    // 키가 없으면 서명 요청 불가
    assert(throwsAs<InvalidConfigurationError>([&]() { binance.placeOrder(makeOrder("AT_1_a")); }));
    assert(throwsAs<std::invalid_argument>([&]() { binance.placeOrder(makeOrder("")); }));

    binance.disconnect();
    assert(!binance.isConnected());
    assert(throwsAs<NotConnectedError>([&]() { binance.getMarketPrice("BTCUSDT"); }));
    std::cout << "[TEST] binance lifecycle PASSED\n";
}

void testBinanceOrders() {
    auto http = std::make_shared<FakeHttpClient>();
    http->on("/api/v3/ping", 200, "{}");
    http->on("/api/v3/account", 200,
             R"({"balances":[{"asset":"BTC","free":"1.0","locked":"0"},{"asset":"USDT","free":"1500.5","locked":"20"}]})");
    http->on("/api/v3/order", 200,
             R"({"symbol":"BTCUSDT","orderId":28457,"clientOrderId":"AT_1_a","status":"FILLED",)"
             R"("executedQty":"0.50000000","cummulativeQuoteQty":"50000.00000000"})");
    http->on("/api/v3/order", 400, R"({"code":-2010,"msg":"Duplicate order sent."})");
    http->on("/api/v3/ticker/price", 200, R"({"symbol":"BTCUSDT","price":"100123.45"})");

    broker::BinanceBroker binance(makeConfig("binance", true), http, makeConnector("binance"));
    binance.connect();
    assert(http->count("/api/v3/account") == 1);

    auto ack = binance.placeOrder(makeOrder("AT_1_a", OrderType::LIMIT));
    assert(ack.exchange_order_id == "28457");
    assert(ack.status == OrderStatus::FILLED);
    assert(near(ack.filled_quantity, 0.5));
    assert(ack.average_fill_price && near(*ack.average_fill_price, 100000.0));
    assert(ack.exchange == "binance");

    // 서명: query 전체(서명 제외)에 대한 HMAC, 키는 헤더로만
    const auto requests = http->requests();
    const auto& post = requests.back();
    assert(post.method == "POST");
    assert(post.url.find("newClientOrderId=AT_1_a") != std::string::npos);
    assert(post.url.find("type=LIMIT") != std::string::npos);
    assert(post.url.find("price=95000.5") != std::string::npos);
    assert(post.url.find("timeInForce=GTC") != std::string::npos);
    const auto query_start = post.url.find('?') + 1;
    const auto sig_pos = post.url.find("&signature=");
    assert(sig_pos != std::string::npos);
    const std::string signed_part = post.url.substr(query_start, sig_pos - query_start);
    const std::string signature = post.url.substr(sig_pos + 11);
    assert(signature == network::RequestSigner::hmacSha256Hex("test-secret", signed_part));
    assert(post.headers.at("X-MBX-APIKEY") == "test-key");
    assert(post.url.find("test-secret") == std::string::npos);

    // 거래소 4xx -> REJECTED ack (예외 아님)
    auto rejected = binance.placeOrder(makeOrder("AT_1_a"));
    assert(rejected.status == OrderStatus::REJECTED);
    assert(rejected.exchange_order_id.empty());

    auto balance = binance.getBalance("USDT");
    assert(near(balance.free, 1500.5));
    assert(near(balance.locked, 20.0));
    assert(near(balance.total(), 1520.5));

    assert(near(binance.getMarketPrice("BTCUSDT"), 100123.45));
    assert(binance.getPositions().empty());
    std::cout << "[TEST] binance orders PASSED\n";
}

void testBinanceTransportFailures() {
    auto http = std::make_shared<FakeHttpClient>();
    http->on("/api/v3/ping", 200, "{}");
    http->on("/api/v3/ticker/price", 429, R"({"code":-1003})");
    http->failOn("/api/v3/order");

    broker::BinanceBroker binance(makeConfig("binance", true), http, makeConnector("binance"));
    http->on("/api/v3/account", 200, R"({"balances":[]})");
    binance.connect();

    assert(throwsAs<BrokerUnavailableError>([&]() { binance.getMarketPrice("BTCUSDT"); }));
    // 재시도 없음: 전송 실패는 한 번만 시도하고 그대로 올라온다
    const auto before = http->count("/api/v3/order");
    assert(throwsAs<BrokerUnavailableError>([&]() { binance.placeOrder(makeOrder("AT_2_b")); }));
    assert(http->count("/api/v3/order") == before + 1);
    std::cout << "[TEST] binance transport failures PASSED\n";
}

void testBinanceParseOrder() {
    const auto j = nlohmann::json::parse(
        R"({"symbol":"ETHUSDT","orderId":99,"clientOrderId":"cancelReq","origClientOrderId":"AT_9_z",)"
        R"("side":"SELL","type":"LIMIT","origQty":"2.0","price":"3000.0","executedQty":"0.5",)"
        R"("cummulativeQuoteQty":"1500.0","status":"CANCELED","time":1700000000000})");
    auto order = broker::BinanceBroker::parseOrder(j);
    assert(order.client_order_id == "AT_9_z");
    assert(order.exchange_order_id == "99");
    assert(order.side == OrderSide::SELL);
    assert(order.type == OrderType::LIMIT);
    assert(order.status == OrderStatus::CANCELLED);
    assert(near(order.filled_quantity, 0.5));
    assert(order.price && near(*order.price, 3000.0));
    assert(toUnixMillis(order.created_at) == 1700000000000LL);
    std::cout << "[TEST] binance parseOrder PASSED\n";
}

void testBybit() {
    auto http = std::make_shared<FakeHttpClient>();
    http->on("/v5/market/time", 200, R"({"retCode":0,"retMsg":"OK","result":{"timeSecond":"1700000000"}})");
    http->on("/v5/account/wallet-balance", 200,
             R"({"retCode":0,"result":{"list":[{"coin":[{"coin":"USDT","walletBalance":"1000","locked":"100"}]}]}})");
    http->on("/v5/order/create", 200, R"({"retCode":0,"retMsg":"OK","result":{"orderId":"by-1","orderLinkId":"AT_3_c"}})");
    http->on("/v5/order/create", 200, R"({"retCode":110007,"retMsg":"insufficient balance","result":{}})");
    http->on("/v5/order/create", 200, R"({"retCode":10006,"retMsg":"Too many visits!","result":{}})");
    http->on("/v5/order/realtime", 200,
             R"({"retCode":0,"result":{"list":[{"orderId":"by-1","orderLinkId":"AT_3_c","symbol":"BTCUSDT",)"
             R"("side":"Buy","orderType":"Limit","qty":"1","price":"90000","cumExecQty":"0.3",)"
             R"("avgPrice":"89990","orderStatus":"PartiallyFilled","createdTime":"1700000000000"}]}})");
    http->on("/v5/order/cancel", 200, R"({"retCode":0,"result":{"orderId":"by-1","orderLinkId":"AT_3_c"}})");
    http->on("/v5/position/list", 200,
             R"({"retCode":0,"result":{"list":[{"symbol":"ETHUSDT","side":"Sell","size":"2","avgPrice":"3000",)"
             R"("markPrice":"2950","unrealisedPnl":"100"},{"symbol":"XRPUSDT","side":"Buy","size":"0"}]}})");
    http->on("/v5/market/tickers", 200, R"({"retCode":0,"result":{"list":[{"symbol":"BTCUSDT","lastPrice":"90100.5"}]}})");

    broker::BybitBroker bybit(makeConfig("bybit", true), http, makeConnector("bybit"));
    bybit.connect();
    assert(bybit.isConnected());

    auto ack = bybit.placeOrder(makeOrder("AT_3_c", OrderType::LIMIT));
    assert(ack.exchange_order_id == "by-1");
    assert(ack.status == OrderStatus::OPEN);

    const auto requests = http->requests();
    const auto& create = requests.back();
    const auto body = nlohmann::json::parse(create.payload);
    assert(body["orderLinkId"] == "AT_3_c");
    assert(body["category"] == "linear");
    assert(body["side"] == "Buy");
    assert(body["orderType"] == "Limit");
    const auto& h = create.headers;
    const std::string expected_sign = network::RequestSigner::hmacSha256Hex(
        "test-secret", h.at("X-BAPI-TIMESTAMP") + "test-key" + h.at("X-BAPI-RECV-WINDOW") + create.payload);
    assert(h.at("X-BAPI-SIGN") == expected_sign);
    assert(h.at("X-BAPI-API-KEY") == "test-key");

    auto rejected = bybit.placeOrder(makeOrder("AT_3_d"));
    assert(rejected.status == OrderStatus::REJECTED);

    assert(throwsAs<BrokerUnavailableError>([&]() { bybit.placeOrder(makeOrder("AT_3_e")); }));

    auto status = bybit.getOrderStatus("by-1", "BTCUSDT");
    assert(status.status == OrderStatus::PARTIALLY_FILLED);
    assert(near(status.filled_quantity, 0.3));
    assert(status.client_order_id == "AT_3_c");
    assert(status.average_fill_price && near(*status.average_fill_price, 89990.0));

    auto cancelled = bybit.cancelOrder("by-1", "BTCUSDT");
    assert(cancelled.status == OrderStatus::CANCELLED);

    auto positions = bybit.getPositions();
    assert(positions.size() == 1);
    assert(near(positions[0].quantity, -2.0));
    assert(near(positions[0].entry_price, 3000.0));

    auto balance = bybit.getBalance("USDT");
    assert(near(balance.free, 900.0));
    assert(near(balance.locked, 100.0));

    assert(near(bybit.getMarketPrice("BTCUSDT"), 90100.5));
    std::cout << "[TEST] bybit PASSED\n";
}

void testBybitConnectFailure() {
    auto http = std::make_shared<FakeHttpClient>();
    http->on("/v5/market/time", 200, R"({"retCode":0,"result":{}})");
    http->on("/v5/account/wallet-balance", 200, R"({"retCode":10003,"retMsg":"API key is invalid."})");

    broker::BybitBroker bybit(makeConfig("bybit", true), http, makeConnector("bybit"));
    assert(throwsAs<BrokerUnavailableError>([&]() { bybit.connect(); }));
    assert(!bybit.isConnected());
    std::cout << "[TEST] bybit connect failure PASSED\n";
}

void testFactory() {
    auto http = std::make_shared<FakeHttpClient>();
    auto paper = broker::createBroker(makeConfig("paper", false), http);
    assert(paper->name() == "paper");
    auto binance = broker::createBroker(makeConfig("binance", false), http);
    assert(binance->name() == "binance");
    assert(throwsAs<InvalidConfigurationError>([&]() { broker::createBroker(makeConfig("upbit", false), http); }));

    auto bad = makeConfig("bybit", false);
    bad.max_concurrent_requests = 0;
    assert(throwsAs<InvalidConfigurationError>([&]() { broker::createBroker(bad, http); }));
    std::cout << "[TEST] broker factory PASSED\n";
}

}

int main() {
    testBinanceLifecycle();
    testBinanceOrders();
    testBinanceTransportFailures();
    testBinanceParseOrder();
    testBybit();
    testBybitConnectFailure();
    testFactory();

    std::cout << "[TEST] BrokerGateways PASSED\n";
    return 0;
}
