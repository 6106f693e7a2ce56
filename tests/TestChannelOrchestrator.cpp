#include "core/orchestration/ChannelOrchestrator.h"
#include "common/Errors.h"
#include "fakes/FakeChannel.h"
#include "fakes/RecordingRepositories.h"

#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

using namespace cryptogate;
using test::FakeChannel;
using test::RecordingBarRepository;
using test::RecordingMarketDataRepository;

namespace {

std::vector<MarketData> candles(const std::string& source, const std::string& symbol, int count,
                                double start_price = 100.0) {
    std::vector<MarketData> out;
    for (int i = 0; i < count; ++i) {
        MarketData d;
        d.source = source;
        d.symbol = symbol;
        d.timestamp = fromUnixMillis(1700000000000LL + i * 60000LL);
        d.open = start_price + i;
        d.high = start_price + i + 2.0;
        d.low = start_price + i - 1.0;
        d.close = start_price + i + 1.0;
        d.volume = 1.0;
        out.push_back(d);
    }
    return out;
}

core::OrchestratorConfig quickConfig() {
    core::OrchestratorConfig config;
    config.fetch_interval = std::chrono::seconds(1);
    config.startup_delay = std::chrono::seconds(0);
    config.interval = "5m";
    config.limit = 30;
    return config;
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

void testFailureIsolation() {
    auto ch1 = std::make_shared<FakeChannel>("ch1", candles("ch1", "BTCUSDT", 3));
    auto ch2 = std::make_shared<FakeChannel>("ch2", candles("ch2", "BTCUSDT", 3), FakeChannel::Mode::THROW);
    auto ch3 = std::make_shared<FakeChannel>("ch3", candles("ch3", "ETHUSDT", 2));
    auto ch4 = std::make_shared<FakeChannel>("ch4", std::vector<MarketData>{});
    auto repository = std::make_shared<RecordingMarketDataRepository>();

    core::ChannelOrchestrator orchestrator({ch1, ch2, ch3, ch4}, repository, quickConfig());
    assert(!orchestrator.lastReport());

    auto report = orchestrator.runCycle();
    assert(report.cycle == 1);
    assert(report.results.size() == 4);
    assert(report.results[0].channel == "ch1" && report.results[0].success);
    assert(report.results[0].records_saved == 3);
    assert(report.results[1].channel == "ch2" && !report.results[1].success);
    assert(report.results[1].records_saved == 0);
    assert(report.results[1].error.find("exploded") != std::string::npos);
    assert(report.results[2].records_saved == 2);
    assert(report.results[3].success && report.results[3].records_saved == 0);

    assert(report.total_saved == 5);
    assert(report.successful == 3);
    assert(report.failed == 1);
    assert(report.failed_channels == std::vector<std::string>{"ch2"});

    // 빈 결과는 저장 호출 없음
    assert(repository->batches() == 2);
    assert(repository->records().size() == 5);

    assert(ch1->lastInterval() == "5m");
    assert(ch1->lastLimit() == 30);

    // 다음 사이클: 이미 연결된 채널은 start 다시 안 함, 실패 채널도 계속 시도
    report = orchestrator.runCycle();
    assert(report.cycle == 2);
    assert(ch1->startCalls() == 1);
    assert(ch2->fetchCalls() == 2);
    assert(orchestrator.lastReport()->cycle == 2);
    std::cout << "[TEST] failure isolation PASSED" << std::endl;
}

void testFailureKinds() {
    auto good = std::make_shared<FakeChannel>("good", candles("good", "BTCUSDT", 2));
    auto result_fail = std::make_shared<FakeChannel>("result_fail", candles("result_fail", "BTCUSDT", 2),
                                                     FakeChannel::Mode::FAIL_RESULT);
    auto start_fail = std::make_shared<FakeChannel>("start_fail", candles("start_fail", "BTCUSDT", 2),
                                                    FakeChannel::Mode::FAIL_START);
    auto store_fail = std::make_shared<FakeChannel>("store_fail", candles("store_fail", "BTCUSDT", 2));
    auto repository = std::make_shared<RecordingMarketDataRepository>();
    repository->failForSource("store_fail");

    core::ChannelOrchestrator orchestrator({good, result_fail, start_fail, store_fail}, repository, quickConfig());
    auto report = orchestrator.runCycle();

    assert(report.successful == 1);
    assert(report.failed == 3);
    assert(report.total_saved == 2);
    assert((report.failed_channels == std::vector<std::string>{"result_fail", "start_fail", "store_fail"}));
    assert(start_fail->fetchCalls() == 0);
    for (const auto& r : report.results) {
        if (!r.success) {
            assert(!r.error.empty());
            assert(r.records_saved == 0);
        }
    }
    std::cout << "[TEST] failure kinds PASSED" << std::endl;
}

void testConcurrentFanOut() {
    std::vector<std::shared_ptr<market::IMarketDataChannel>> channels;
    for (int i = 0; i < 4; ++i) {
        const std::string name = "slow" + std::to_string(i);
        auto ch = std::make_shared<FakeChannel>(name, candles(name, "BTCUSDT", 1));
        ch->setDelay(std::chrono::milliseconds(300));
        channels.push_back(ch);
    }
    auto repository = std::make_shared<RecordingMarketDataRepository>();
    core::ChannelOrchestrator orchestrator(channels, repository, quickConfig());

    const auto started = std::chrono::steady_clock::now();
    auto report = orchestrator.runCycle();
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    assert(report.successful == 4);
    // 직렬이면 1200ms
    assert(elapsed.count() < 1000);
    std::cout << "[TEST] concurrent fan-out PASSED (" << elapsed.count() << "ms)" << std::endl;
}

void testAggregatorFeed() {
    BarConfig bars;
    bars.range_threshold = 1.0;
    bars.brick_size = 1.0;
    auto bar_repository = std::make_shared<RecordingBarRepository>();
    auto aggregator = std::make_shared<bars::BarAggregationService>(bars, bar_repository);

    auto ch = std::make_shared<FakeChannel>("ch1", candles("ch1", "BTCUSDT", 3));
    auto failing = std::make_shared<FakeChannel>("ch2", candles("ch2", "BTCUSDT", 3), FakeChannel::Mode::THROW);
    auto repository = std::make_shared<RecordingMarketDataRepository>();
    core::ChannelOrchestrator orchestrator({ch, failing}, repository, quickConfig(), aggregator);

    auto report = orchestrator.runCycle();
    // 최신 캔들 1개는 다음 사이클로
    assert(report.bars.candles_fed == 2);
    assert(report.bars.range_bars > 0);
    assert(report.bars.renko_bricks > 0);
    assert(!bar_repository->range_bars.empty());
    assert(aggregator->trackedSymbols() == 1);
    assert(aggregator->progress("ch1", "BTCUSDT").has_value());
    assert(!aggregator->progress("ch2", "BTCUSDT").has_value());

    // 같은 캔들이 다시 와도 이미 처리한 시각은 건너뜀
    report = orchestrator.runCycle();
    assert(report.bars.candles_fed == 0);
    std::cout << "[TEST] aggregator feed PASSED" << std::endl;
}

void testStartStop() {
    auto ch1 = std::make_shared<FakeChannel>("ch1", candles("ch1", "BTCUSDT", 2));
    auto ch2 = std::make_shared<FakeChannel>("ch2", candles("ch2", "BTCUSDT", 2));
    ch2->throwOnStop(true);
    auto repository = std::make_shared<RecordingMarketDataRepository>();

    core::ChannelOrchestrator orchestrator({ch1, ch2}, repository, quickConfig());
    assert(orchestrator.start());
    assert(orchestrator.isRunning());
    assert(!orchestrator.start());

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (!orchestrator.lastReport() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    assert(orchestrator.lastReport().has_value());

    // 다음 사이클까지 자고 있는 중이어도 바로 깨어나야 한다
    const auto stop_started = std::chrono::steady_clock::now();
    orchestrator.stop();
    const auto stop_elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - stop_started);
    assert(stop_elapsed.count() < 900);
    assert(!orchestrator.isRunning());

    // stop 실패한 채널이 있어도 전부 stop 호출
    assert(ch1->stopCalls() == 1);
    assert(ch2->stopCalls() == 1);
    assert(!ch1->isConnected());

    orchestrator.stop();
    assert(ch1->stopCalls() == 1);

    auto statuses = orchestrator.channelStatuses();
    assert(statuses.size() == 2);
    assert(statuses[0].name == "ch1");
    assert(statuses[0].total_messages_received >= 2);
    std::cout << "[TEST] start/stop PASSED" << std::endl;
}

void testStopAfterManualCycles() {
    auto ch1 = std::make_shared<FakeChannel>("ch1", candles("ch1", "BTCUSDT", 2));
    auto ch2 = std::make_shared<FakeChannel>("ch2", candles("ch2", "BTCUSDT", 2));
    auto repository = std::make_shared<RecordingMarketDataRepository>();

    {
        core::ChannelOrchestrator orchestrator({ch1, ch2}, repository, quickConfig());
        orchestrator.runCycle();
        assert(!orchestrator.isRunning());
        assert(ch1->isConnected() && ch2->isConnected());

        // 워커 없이 runCycle 만 돌렸어도 stop 은 채널을 닫는다
        orchestrator.stop();
        assert(ch1->stopCalls() == 1 && ch2->stopCalls() == 1);
        assert(!ch1->isConnected() && !ch2->isConnected());

        orchestrator.stop();
        assert(ch1->stopCalls() == 1);
    }
    assert(ch1->stopCalls() == 1);

    // 소멸자도 같은 경로
    auto ch3 = std::make_shared<FakeChannel>("ch3", candles("ch3", "BTCUSDT", 2));
    {
        core::ChannelOrchestrator orchestrator({ch3}, repository, quickConfig());
        orchestrator.runCycle();
    }
    assert(ch3->stopCalls() == 1);

    // 한 번도 사이클을 안 돌렸으면 stop 할 것도 없다
    auto idle = std::make_shared<FakeChannel>("idle", candles("idle", "BTCUSDT", 2));
    {
        core::ChannelOrchestrator orchestrator({idle}, repository, quickConfig());
    }
    assert(idle->stopCalls() == 0);
    std::cout << "[TEST] stop after manual cycles PASSED" << std::endl;
}

void testInvalidConfiguration() {
    auto ch = std::make_shared<FakeChannel>("ch1", std::vector<MarketData>{});
    auto repository = std::make_shared<RecordingMarketDataRepository>();

    assert(throwsAs<InvalidConfigurationError>([&]() { core::ChannelOrchestrator o({ch}, nullptr); }));
    assert(throwsAs<InvalidConfigurationError>([&]() { core::ChannelOrchestrator o({ch, nullptr}, repository); }));

    auto config = quickConfig();
    config.fetch_interval = std::chrono::seconds(0);
    assert(throwsAs<InvalidConfigurationError>([&]() { core::ChannelOrchestrator o({ch}, repository, config); }));
    config = quickConfig();
    config.limit = 0;
    assert(throwsAs<InvalidConfigurationError>([&]() { core::ChannelOrchestrator o({ch}, repository, config); }));

    // 채널 0개도 동작은 한다
    core::ChannelOrchestrator empty({}, repository, quickConfig());
    auto report = empty.runCycle();
    assert(report.results.empty() && report.failed == 0);
    std::cout << "[TEST] invalid configuration PASSED" << std::endl;
}

}

int main() {
    testFailureIsolation();
    testFailureKinds();
    testConcurrentFanOut();
    testAggregatorFeed();
    testStartStop();
    testStopAfterManualCycles();
    testInvalidConfiguration();

    std::cout << "[TEST] ChannelOrchestrator PASSED" << std::endl;
    return 0;
}
