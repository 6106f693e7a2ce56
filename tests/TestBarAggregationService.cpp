#include "bars/BarAggregationService.h"
#include "common/Errors.h"
#include "fakes/RecordingRepositories.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace cryptogate;
using namespace cryptogate::bars;
using test::RecordingBarRepository;

namespace {

bool near(double a, double b) {
    return std::abs(a - b) < 1e-9;
}

Timestamp minute(int i) {
    return fromUnixMillis(1700000000000LL + i * 60000LL);
}

MarketData candle(const std::string& source, const std::string& symbol, int i, double open,
                  double spread = 2.0) {
    MarketData d;
    d.source = source;
    d.symbol = symbol;
    d.timestamp = minute(i);
    d.open = open;
    d.close = open;
    d.high = open + spread;
    d.low = open - spread;
    d.volume = 1.0;
    return d;
}

Tick tick(const std::string& symbol, int i, double price) {
    Tick t;
    t.symbol = symbol;
    t.price = price;
    t.quantity = 1.0;
    t.timestamp = minute(0) + std::chrono::seconds(i);
    t.is_market_buy = i % 2 == 0;
    return t;
}

BarConfig fixedConfig() {
    BarConfig config;
    config.tick_size = 3;
    config.range_threshold = 5.0;
    config.renko_sizing = "Fixed";
    config.brick_size = 2.0;
    return config;
}

void testGroupsAndHoldsBackNewest() {
    auto repository = std::make_shared<RecordingBarRepository>();
    BarAggregationService service(fixedConfig(), repository);

    // 순서 섞인 배치, 두 소스
    auto summary = service.onCandles({
        candle("binance", "BTCUSDT", 2, 110.0),
        candle("binance", "BTCUSDT", 0, 100.0),
        candle("okx", "BTCUSDT", 0, 100.0),
        candle("binance", "BTCUSDT", 1, 104.0),
        candle("okx", "BTCUSDT", 1, 101.0),
    });

    assert(service.trackedSymbols() == 2);
    assert(summary.candles_fed == 2 + 1);
    assert(summary.range_bars == repository->range_bars.size());
    assert(summary.renko_bricks == repository->renko_bricks.size());
    assert(summary.renko_bricks > 0);
    for (const auto& bar : repository->range_bars) {
        assert(bar.source == "binance" || bar.source == "okx");
        assert(bar.symbol == "BTCUSDT");
    }

    auto binance = service.progress("binance", "BTCUSDT");
    assert(binance && binance->last_processed == minute(1));
    assert(binance->renko_brick_size && near(*binance->renko_brick_size, 2.0));
    auto okx = service.progress("okx", "BTCUSDT");
    assert(okx && okx->last_processed == minute(0));
    assert(!service.progress("kraken", "BTCUSDT"));

    // 보류했던 캔들은 다음 배치에서 처리, 이미 처리한 것은 건너뜀
    summary = service.onCandles({
        candle("binance", "BTCUSDT", 1, 104.0),
        candle("binance", "BTCUSDT", 2, 110.0),
        candle("binance", "BTCUSDT", 3, 111.0),
    });
    assert(summary.candles_fed == 1);
    assert(service.progress("binance", "BTCUSDT")->last_processed == minute(2));

    // 한 개짜리 배치는 전부 보류
    summary = service.onCandles({candle("binance", "BTCUSDT", 4, 112.0)});
    assert(summary.candles_fed == 0);
    std::cout << "[TEST] candle grouping / hold back PASSED\n";
}

void testPerSymbolThresholds() {
    auto config = fixedConfig();
    config.range_thresholds["ETHUSDT"] = 50.0;
    config.brick_sizes["ETHUSDT"] = 25.0;
    auto repository = std::make_shared<RecordingBarRepository>();
    BarAggregationService service(config, repository);

    service.onCandles({
        candle("binance", "BTCUSDT", 0, 100.0, 10.0),
        candle("binance", "BTCUSDT", 1, 100.0, 10.0),
        candle("binance", "ETHUSDT", 0, 2000.0, 10.0),
        candle("binance", "ETHUSDT", 1, 2000.0, 10.0),
    });

    bool saw_btc = false;
    for (const auto& bar : repository->range_bars) {
        assert(bar.symbol == "BTCUSDT");   // ETH 는 폭 20 < 50
        assert(near(bar.range_threshold, 5.0));
        saw_btc = true;
    }
    assert(saw_btc);
    auto eth = service.progress("binance", "ETHUSDT");
    assert(eth && near(*eth->renko_brick_size, 25.0));
    assert(near(eth->current_range, 20.0));
    std::cout << "[TEST] per-symbol thresholds PASSED\n";
}

void testAtrAndPercentageSizing() {
    auto config = fixedConfig();
    config.renko_sizing = "ATR";
    config.atr_period = 2;
    config.atr_multiplier = 1.0;
    BarAggregationService atr_service(config, nullptr);

    // period + 1 개 모이기 전에는 Renko 없음
    atr_service.onCandles({
        candle("binance", "BTCUSDT", 0, 100.0),
        candle("binance", "BTCUSDT", 1, 100.0),
        candle("binance", "BTCUSDT", 2, 100.0),
    });
    auto p = atr_service.progress("binance", "BTCUSDT");
    assert(p && !p->renko_brick_size);

    atr_service.onCandles({
        candle("binance", "BTCUSDT", 2, 100.0),
        candle("binance", "BTCUSDT", 3, 100.0),
    });
    p = atr_service.progress("binance", "BTCUSDT");
    assert(p->renko_brick_size && near(*p->renko_brick_size, 4.0));   // TR = high - low = 4

    config.renko_sizing = "Percentage";
    config.percentage = 2.0;
    BarAggregationService pct_service(config, nullptr);
    pct_service.onCandles({
        candle("binance", "BTCUSDT", 0, 250.0),
        candle("binance", "BTCUSDT", 1, 260.0),
    });
    p = pct_service.progress("binance", "BTCUSDT");
    assert(p->renko_brick_size && near(*p->renko_brick_size, 5.0));
    std::cout << "[TEST] ATR / percentage sizing PASSED\n";
}

void testTicksAndFlush() {
    auto config = fixedConfig();
    config.range_threshold = 1000.0;
    auto repository = std::make_shared<RecordingBarRepository>();
    BarAggregationService service(config, repository);

    AggregationSummary total;
    for (int i = 0; i < 5; ++i) {
        total += service.onTick("binance", tick("BTCUSDT", i, 100.0 + i));
    }
    assert(total.ticks_fed == 5);
    assert(total.tick_bars == 1);
    assert(total.range_bars == 0);
    assert(repository->tick_bars.size() == 1);
    assert(repository->tick_bars[0].tick_count == 3);
    assert(repository->tick_bars[0].source == "binance");

    auto p = service.progress("binance", "BTCUSDT");
    assert(near(p->tick_progress, 2.0 / 3.0));

    auto flushed = service.flush();
    assert(flushed.tick_bars == 1);
    assert(flushed.range_bars == 1);
    assert(repository->tick_bars.size() == 2);
    assert(repository->tick_bars[1].tick_count == 2);
    assert(repository->range_bars[0].tick_count == 5);

    flushed = service.flush();
    assert(flushed.tick_bars == 0 && flushed.range_bars == 0);
    std::cout << "[TEST] ticks / flush PASSED\n";
}

void testRetriesBarsAfterStoreFailure() {
    auto repository = std::make_shared<RecordingBarRepository>();
    repository->range_failures_remaining = 1;
    BarAggregationService service(fixedConfig(), repository);

    const std::vector<MarketData> batch = {
        candle("binance", "BTCUSDT", 0, 100.0, 3.0),
        candle("binance", "BTCUSDT", 1, 100.0, 3.0),
        candle("binance", "BTCUSDT", 2, 100.0, 3.0),
    };

    bool threw = false;
    try {
        service.onCandles(batch);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    assert(repository->range_bars.empty());
    // Range 가 실패하면 Renko 는 시도 전이라 같이 보류
    assert(repository->renko_bricks.empty());
    const std::size_t pending = service.pendingBars();
    assert(pending > 0);

    // 같은 배치가 다시 와도 캔들은 건너뛰지만 보류했던 바는 저장된다
    auto summary = service.onCandles(batch);
    assert(summary.candles_fed == 0);
    assert(service.pendingBars() == 0);
    assert(repository->range_bars.size() + repository->renko_bricks.size() == pending);
    assert(!repository->range_bars.empty());

    // 폭 6 캔들 두 개 -> 캔들마다 Range 바 하나. 첫 바 2/3, 둘째 바 1, 마지막 close 1/3 은 진행 중
    assert(repository->range_bars.size() == 2);
    double volume = 0.0;
    for (const auto& bar : repository->range_bars) {
        volume += bar.volume;
    }
    assert(near(volume, 5.0 / 3.0));
    std::cout << "[TEST] bars retried after store failure PASSED\n";
}

void testInvalidConfig() {
    auto config = fixedConfig();
    config.tick_size = 0;
    bool threw = false;
    try {
        BarAggregationService service(config, nullptr);
    } catch (const InvalidConfigurationError&) {
        threw = true;
    }
    assert(threw);

    config = fixedConfig();
    config.renko_sizing = "Volume";
    threw = false;
    try {
        BarAggregationService service(config, nullptr);
    } catch (const InvalidConfigurationError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[TEST] aggregation invalid config PASSED\n";
}

}

int main() {
    testGroupsAndHoldsBackNewest();
    testPerSymbolThresholds();
    testAtrAndPercentageSizing();
    testTicksAndFlush();
    testRetriesBarsAfterStoreFailure();
    testInvalidConfig();

    std::cout << "[TEST] BarAggregationService PASSED\n";
    return 0;
}
