#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "bars/BarAggregationService.h"
#include "core/contracts/IMarketDataRepository.h"
#include "market/IMarketDataChannel.h"

namespace cryptogate {
namespace core {

struct OrchestratorConfig {
    std::chrono::seconds fetch_interval{60};
    std::chrono::seconds startup_delay{5};
    std::string interval = "1m";
    int limit = 100;
};

struct ChannelCycleResult {
    std::string channel;
    std::size_t records_saved = 0;
    bool success = false;
    std::string error;
};

struct CycleReport {
    long long cycle = 0;
    std::vector<ChannelCycleResult> results;   // 등록 순서
    std::size_t total_saved = 0;
    std::size_t successful = 0;
    std::size_t failed = 0;
    std::vector<std::string> failed_channels;
    bars::AggregationSummary bars;
    std::chrono::milliseconds duration{0};
};

// 주기적 fan-out / fan-in 시세 수집
//
// 사이클마다 채널 하나당 작업 하나를 동시에 띄우고 전부 끝날 때까지 기다린다.
// 한 채널의 실패(예외 포함)는 (채널, 0, 실패) 결과가 될 뿐 다른 채널과 사이클을 막지 않는다.
class ChannelOrchestrator {
public:
    ChannelOrchestrator(std::vector<std::shared_ptr<market::IMarketDataChannel>> channels,
                        std::shared_ptr<IMarketDataRepository> repository,
                        OrchestratorConfig config = OrchestratorConfig{},
                        std::shared_ptr<bars::BarAggregationService> aggregator = nullptr);
    ~ChannelOrchestrator();

    ChannelOrchestrator(const ChannelOrchestrator&) = delete;
    ChannelOrchestrator& operator=(const ChannelOrchestrator&) = delete;

    // 백그라운드 스레드 시작 (startup_delay 후 첫 사이클). 이미 실행 중이면 false
    bool start();

    // 대기 중인 sleep 을 깨우고 스레드 종료 후 모든 채널 stop() (동시에, 실패는 로그만)
    void stop();

    bool isRunning() const { return running_.load(); }

    // 한 사이클 실행 (스레드와 무관하게 직접 호출 가능)
    CycleReport runCycle();

    std::optional<CycleReport> lastReport() const;
    std::vector<market::ChannelStatus> channelStatuses() const;
    const OrchestratorConfig& config() const { return config_; }

private:
    struct ChannelOutcome {
        ChannelCycleResult result;
        std::vector<MarketData> records;
    };

    void run();
    ChannelOutcome collect(market::IMarketDataChannel& channel);
    void stopChannels();

    // stop() 이 불리면 true
    bool waitUntil(std::chrono::steady_clock::time_point deadline);

    std::vector<std::shared_ptr<market::IMarketDataChannel>> channels_;
    std::shared_ptr<IMarketDataRepository> repository_;
    OrchestratorConfig config_;
    std::shared_ptr<bars::BarAggregationService> aggregator_;

    std::atomic<bool> running_{false};
    // runCycle() 을 직접 부른 경우도 포함해 채널 start 를 시도했는지
    std::atomic<bool> channels_started_{false};
    std::unique_ptr<std::thread> worker_thread_;
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;

    std::mutex cycle_mutex_;
    long long cycle_count_ = 0;

    mutable std::mutex report_mutex_;
    std::optional<CycleReport> last_report_;
};

} // namespace core
} // namespace cryptogate
