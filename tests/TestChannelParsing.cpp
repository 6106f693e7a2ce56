#include "common/Errors.h"
#include "market/BinanceChannel.h"
#include "market/ChannelFactory.h"
#include "market/CoinbaseChannel.h"
#include "market/KrakenChannel.h"
#include "market/OkxChannel.h"
#include "fakes/FakeHttpClient.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <nlohmann/json.hpp>

using namespace cryptogate;
using namespace cryptogate::market;
using test::FakeHttpClient;

namespace {

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

std::string kline(long long open_time, const char* o, const char* h, const char* l, const char* c) {
    nlohmann::json k = nlohmann::json::array(
        {open_time, o, h, l, c, "12.5", open_time + 59999, "1300.0", 42, "6.0", "600.0", "0"});
    return k.dump();
}

void testBinanceParse() {
    auto body = nlohmann::json::parse(
        "[" + kline(1700000000000LL, "100.0", "110.0", "90.0", "105.0") + "," +
        "[1700000060000, \"105.0\", \"106.0\", \"104.0\"]" + "]");

    auto candles = BinanceChannel::parseKlines(body, "BTCUSDT");
    assert(candles.size() == 1);   // 필드 부족한 행은 건너뜀
    const auto& c = candles[0];
    assert(c.symbol == "BTCUSDT");
    assert(c.source == "binance");
    assert(toUnixMillis(c.timestamp) == 1700000000000LL);
    assert(near(c.open, 100.0) && near(c.high, 110.0) && near(c.low, 90.0) && near(c.close, 105.0));
    assert(near(c.volume, 12.5));
    assert(near(c.quote_volume, 1300.0));
    assert(c.trades_count == 42);

    assert(BinanceChannel::parseKlines(nlohmann::json::object(), "BTCUSDT").empty());
    std::cout << "[TEST] binance klines PASSED\n";
}

void testOkxParse() {
    auto body = nlohmann::json::parse(R"({
        "code": "0", "msg": "",
        "data": [
            ["1700000060000", "101", "103", "100", "102", "3.5", "350", "350", "1"],
            ["1700000000000", "100", "102", "99", "101", "2.0", "200", "200", "1"]
        ]})");

    auto candles = OkxChannel::parseCandles(body, "BTC-USDT");
    assert(candles.size() == 2);
    assert(candles[0].symbol == "BTCUSDT");
    assert(candles[0].source == "okx");
    assert(toUnixMillis(candles[0].timestamp) == 1700000060000LL);
    assert(near(candles[1].open, 100.0));
    assert(near(candles[1].quote_volume, 200.0));

    auto error = nlohmann::json::parse(R"({"code": "51001", "msg": "Instrument ID does not exist", "data": []})");
    assert(throwsAs<VenueError>([&]() { OkxChannel::parseCandles(error, "NOPE-USDT"); }));

    assert(OkxChannel::toBar("1m") == "1m");
    assert(OkxChannel::toBar("1h") == "1H");
    assert(OkxChannel::toBar("4h") == "4H");
    assert(OkxChannel::toBar("1d") == "1D");
    assert(OkxChannel::toBar("7m") == "1m");
    std::cout << "[TEST] okx candles PASSED\n";
}

void testCoinbaseParse() {
    // [time, low, high, open, close, volume]
    auto body = nlohmann::json::parse(R"([[1700000000, 99.0, 102.0, 100.0, 101.0, 2.0]])");
    auto candles = CoinbaseChannel::parseCandles(body, "BTC-USD");
    assert(candles.size() == 1);
    const auto& c = candles[0];
    assert(c.symbol == "BTCUSD");
    assert(c.source == "coinbase");
    assert(toUnixMillis(c.timestamp) == 1700000000000LL);
    assert(near(c.low, 99.0) && near(c.high, 102.0) && near(c.open, 100.0) && near(c.close, 101.0));
    assert(near(c.quote_volume, 202.0));

    assert(CoinbaseChannel::snapGranularity(60) == 60);
    assert(CoinbaseChannel::snapGranularity(120) == 60);
    assert(CoinbaseChannel::snapGranularity(14400) == 21600);   // 4h 는 지원 안 함
    assert(CoinbaseChannel::snapGranularity(604800) == 86400);

    assert(CoinbaseChannel::toIso8601(fromUnixMillis(0)) == "1970-01-01T00:00:00Z");
    assert(CoinbaseChannel::toIso8601(fromUnixMillis(1700000000000LL)) == "2023-11-14T22:13:20Z");
    std::cout << "[TEST] coinbase candles PASSED\n";
}

void testKrakenParse() {
    // result 키는 요청한 pair 와 다를 수 있다
    auto body = nlohmann::json::parse(R"({
        "error": [],
        "result": {
            "XXBTZUSD": [[1700000000, "100.0", "104.0", "98.0", "103.0", "101.0", "2.0", 17]],
            "last": 1700000000
        }})");

    auto candles = KrakenChannel::parseOhlc(body, "XXBTZUSD");
    assert(candles.size() == 1);
    const auto& c = candles[0];
    assert(c.symbol == "BTCUSD");
    assert(c.source == "kraken");
    assert(near(c.close, 103.0));
    assert(near(c.volume, 2.0));
    assert(near(c.quote_volume, 202.0));   // vwap * volume
    assert(c.trades_count == 17);

    auto error = nlohmann::json::parse(R"({"error": ["EQuery:Unknown asset pair"]})");
    assert(throwsAs<VenueError>([&]() { KrakenChannel::parseOhlc(error, "NOPE"); }));

    assert(KrakenChannel::normalizeSymbol("XETHZUSD") == "ETHUSD");
    assert(KrakenChannel::normalizeSymbol("SOLUSD") == "SOLUSD");
    assert(KrakenChannel::snapIntervalMinutes(1) == 1);
    assert(KrakenChannel::snapIntervalMinutes(120) == 60);
    assert(KrakenChannel::snapIntervalMinutes(1440) == 1440);
    std::cout << "[TEST] kraken ohlc PASSED\n";
}

void testCandleRules() {
    assert(RestChannelBase::intervalSeconds("1m") == 60);
    assert(RestChannelBase::intervalSeconds("15m") == 900);
    assert(RestChannelBase::intervalSeconds("4h") == 14400);
    assert(RestChannelBase::intervalSeconds("1H") == 3600);
    assert(RestChannelBase::intervalSeconds("1d") == 86400);
    assert(RestChannelBase::intervalSeconds("1w") == 604800);
    assert(RestChannelBase::intervalSeconds("0m") == 60);
    assert(RestChannelBase::intervalSeconds("15") == 60);
    assert(RestChannelBase::intervalSeconds("") == 60);
    // 자릿수가 긴 값이나 1년을 넘는 간격은 기본값
    assert(RestChannelBase::intervalSeconds("99999999999m") == 60);
    assert(RestChannelBase::intervalSeconds("99999999999999999999999h") == 60);
    assert(RestChannelBase::intervalSeconds("60000w") == 60);
    assert(RestChannelBase::intervalSeconds("52w") == 52 * 604800);

    MarketData c;
    c.symbol = "BTCUSDT";
    c.open = 100.0;
    c.high = 110.0;
    c.low = 90.0;
    c.close = 105.0;
    c.volume = 1.0;
    assert(RestChannelBase::isValidCandle(c));

    auto bad = c;
    bad.close = 111.0;
    assert(!RestChannelBase::isValidCandle(bad));
    bad = c;
    bad.high = 89.0;
    assert(!RestChannelBase::isValidCandle(bad));
    bad = c;
    bad.volume = -1.0;
    assert(!RestChannelBase::isValidCandle(bad));
    bad = c;
    bad.symbol.clear();
    assert(!RestChannelBase::isValidCandle(bad));
    std::cout << "[TEST] candle rules PASSED\n";
}

void testFetchSortsValidatesAndTrims() {
    auto http = std::make_shared<FakeHttpClient>();
    http->on("/api/v3/ping", 200, "{}");
    // 순서 뒤섞임 + high < low 인 캔들 1개
    http->on("/api/v3/klines", 200,
             "[" + kline(1700000120000LL, "102", "103", "101", "102.5") + "," +
             kline(1700000000000LL, "100", "101", "99", "100.5") + "," +
             kline(1700000180000LL, "103", "100", "104", "103") + "," +
             kline(1700000060000LL, "101", "102", "100", "101.5") + "]",
             {{"X-MBX-USED-WEIGHT-1M", "1100"}});

    BinanceChannel channel(http, {"BTCUSDT"});
    channel.start();
    assert(channel.isConnected());

    auto result = channel.fetchData({}, "1m", 2);
    assert(result.outcome == FetchResult::Outcome::OK);
    assert(result.records.size() == 2);
    assert(toUnixMillis(result.records[0].timestamp) == 1700000060000LL);
    assert(toUnixMillis(result.records[1].timestamp) == 1700000120000LL);

    auto requests = http->requests();
    const auto& last = requests.back();
    assert(last.method == "GET");
    assert(last.payload.find("symbol=BTCUSDT") != std::string::npos);
    assert(last.payload.find("limit=2") != std::string::npos);

    auto status = channel.status();
    assert(status.total_messages_received == 2);
    assert(status.last_data_received_at.has_value());
    std::cout << "[TEST] fetch sort/validate/trim PASSED\n";
}

void testSubscriptionState() {
    auto http = std::make_shared<FakeHttpClient>();
    http->on("/api/v3/ping", 200, "{}");
    http->on("/api/v3/klines", 200, "[" + kline(1700000000000LL, "100", "101", "99", "100.5") + "]");

    BinanceChannel channel(http);
    assert(throwsAs<NotConnectedError>([&]() { channel.subscribe({"SOLUSDT"}); }));
    assert(throwsAs<NotConnectedError>([&]() { channel.unsubscribe({"SOLUSDT"}); }));

    channel.start();
    channel.start();   // 두 번째는 no-op
    assert(http->count("/api/v3/ping") == 1);

    channel.subscribe({"SOLUSDT", "SOLUSDT"});
    assert(channel.status().subscribed_symbols.size() == 1);

    auto result = channel.fetchData({}, "5m", 10);
    assert(result.records.size() == 1);
    assert(result.records[0].symbol == "SOLUSDT");
    assert(http->requests().back().payload.find("interval=5m") != std::string::npos);

    // 명시한 심볼이 구독보다 우선
    result = channel.fetchData({"ETHUSDT"}, "1m", 10);
    assert(result.records[0].symbol == "ETHUSDT");

    channel.unsubscribe({"SOLUSDT"});
    assert(channel.status().subscribed_symbols.empty());

    channel.stop();
    assert(!channel.isConnected());
    std::cout << "[TEST] subscription state PASSED\n";
}

void testFetchFailures() {
    // 연결 테스트 실패
    {
        auto http = std::make_shared<FakeHttpClient>();
        http->on("/api/v3/ping", 503, "{}");
        BinanceChannel channel(http, {"BTCUSDT"});
        assert(throwsAs<DataUnavailableError>([&]() { channel.start(); }));
        assert(!channel.isConnected());
    }

    // 모든 심볼이 전송 단계에서 실패 -> ERROR, 연결 상태는 유지
    {
        auto http = std::make_shared<FakeHttpClient>();
        http->on("/api/v3/ping", 200, "{}");
        http->failOn("/api/v3/klines");
        BinanceChannel channel(http, {"BTCUSDT", "ETHUSDT"});
        channel.start();

        auto result = channel.fetchData({}, "1m", 10);
        assert(!result.isSuccess());
        assert(result.outcome == FetchResult::Outcome::ERROR);
        assert(!result.error.empty());
        assert(throwsAs<DataUnavailableError>([&]() { result.recordsOrThrow("binance"); }));
        assert(channel.isConnected());
        assert(http->count("/api/v3/klines") == 2);
    }

    // 5xx 도 전송 실패로 본다
    {
        auto http = std::make_shared<FakeHttpClient>();
        http->on("/api/v3/klines", 502, "bad gateway");
        BinanceChannel channel(http, {"BTCUSDT"});
        assert(channel.fetchData({}, "1m", 10).outcome == FetchResult::Outcome::ERROR);
    }

    // 400 은 거래소가 답한 것이라 ERROR 가 아니라 EMPTY
    {
        auto http = std::make_shared<FakeHttpClient>();
        http->on("/api/v3/klines", 400, R"({"code": -1121, "msg": "Invalid symbol."})");
        BinanceChannel channel(http, {"NOPEUSDT"});
        auto result = channel.fetchData({}, "1m", 10);
        assert(result.isSuccess());
        assert(result.outcome == FetchResult::Outcome::EMPTY);
    }

    // OKX code != "0" 도 EMPTY
    {
        auto http = std::make_shared<FakeHttpClient>();
        http->on("/api/v5/market/candles", 200, R"({"code": "51001", "msg": "bad instId", "data": []})");
        OkxChannel channel(http, {"NOPE-USDT"});
        auto result = channel.fetchData({}, "1h", 10);
        assert(result.outcome == FetchResult::Outcome::EMPTY);
        assert(http->requests().back().payload.find("bar=1H") != std::string::npos);
    }
    std::cout << "[TEST] fetch failures PASSED\n";
}

void testChannelFactory() {
    auto http = std::make_shared<FakeHttpClient>();
    ChannelConfig config;
    for (const char* name : {"binance", "okx", "coinbase", "kraken"}) {
        config.name = name;
        auto channel = createChannel(config, http);
        assert(channel->name() == name);
        assert(!channel->isConnected());
    }
    config.name = "bitfinex";
    assert(throwsAs<InvalidConfigurationError>([&]() { createChannel(config, http); }));
    std::cout << "[TEST] channel factory PASSED\n";
}

}

int main() {
    testBinanceParse();
    testOkxParse();
    testCoinbaseParse();
    testKrakenParse();
    testCandleRules();
    testFetchSortsValidatesAndTrims();
    testSubscriptionState();
    testFetchFailures();
    testChannelFactory();

    std::cout << "[TEST] ChannelParsing PASSED\n";
    return 0;
}
