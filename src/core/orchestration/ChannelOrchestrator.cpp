#include "core/orchestration/ChannelOrchestrator.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <future>

namespace cryptogate {
namespace core {

namespace {
std::string joinNames(const std::vector<std::string>& names) {
    std::string out;
    for (const auto& n : names) {
        if (!out.empty()) out += ", ";
        out += n;
    }
    return out;
}
}

ChannelOrchestrator::ChannelOrchestrator(std::vector<std::shared_ptr<market::IMarketDataChannel>> channels,
                                         std::shared_ptr<IMarketDataRepository> repository,
                                         OrchestratorConfig config,
                                         std::shared_ptr<bars::BarAggregationService> aggregator)
    : channels_(std::move(channels))
    , repository_(std::move(repository))
    , config_(std::move(config))
    , aggregator_(std::move(aggregator)) {
    if (!repository_) {
        throw InvalidConfigurationError("ChannelOrchestrator requires a market data repository");
    }
    for (const auto& channel : channels_) {
        if (!channel) {
            throw InvalidConfigurationError("ChannelOrchestrator: null channel");
        }
    }
    if (config_.fetch_interval.count() <= 0) {
        throw InvalidConfigurationError("fetch interval must be positive");
    }
    if (config_.startup_delay.count() < 0) {
        throw InvalidConfigurationError("startup delay must not be negative");
    }
    if (config_.limit <= 0) {
        throw InvalidConfigurationError("fetch limit must be positive");
    }
}

ChannelOrchestrator::~ChannelOrchestrator() {
    stop();
}

bool ChannelOrchestrator::start() {
    if (running_.exchange(true)) {
        LOG_WARN("오케스트레이터가 이미 실행 중입니다");
        return false;
    }

    LOG_INFO("========================================");
    LOG_INFO("채널 오케스트레이터 시작 - 채널 {}개, 주기 {}초, 시작 지연 {}초",
             channels_.size(), config_.fetch_interval.count(), config_.startup_delay.count());
    LOG_INFO("========================================");

    worker_thread_ = std::make_unique<std::thread>(&ChannelOrchestrator::run, this);
    return true;
}

void ChannelOrchestrator::stop() {
    const bool was_running = running_.exchange(false);
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
    }
    wake_cv_.notify_all();

    if (worker_thread_ && worker_thread_->joinable()) {
        worker_thread_->join();
    }
    worker_thread_.reset();

    const bool had_started_channels = channels_started_.exchange(false);
    if (!was_running && !had_started_channels) {
        return;
    }

    LOG_INFO("채널 오케스트레이터 중지 - 채널 {}개 stop", channels_.size());
    stopChannels();

    if (aggregator_) {
        try {
            aggregator_->flush();
        } catch (const std::exception& e) {
            LOG_ERROR("종료 시 바 저장 실패: {}", e.what());
        }
    }
}

void ChannelOrchestrator::run() {
    LOG_INFO("수집 루프 대기 ({}초 후 첫 사이클)", config_.startup_delay.count());
    if (waitUntil(std::chrono::steady_clock::now() + config_.startup_delay)) {
        return;
    }

    while (running_.load()) {
        const auto cycle_start = std::chrono::steady_clock::now();
        try {
            runCycle();
        } catch (const std::exception& e) {
            LOG_ERROR("수집 사이클 에러: {}", e.what());
        }

        if (waitUntil(cycle_start + config_.fetch_interval)) {
            break;
        }
    }

    LOG_INFO("수집 루프 종료");
}

CycleReport ChannelOrchestrator::runCycle() {
    std::lock_guard<std::mutex> cycle_lock(cycle_mutex_);
    const auto started = std::chrono::steady_clock::now();

    CycleReport report;
    report.cycle = ++cycle_count_;

    // fan-out: 채널당 작업 하나
    std::vector<std::future<ChannelOutcome>> pending;
    pending.reserve(channels_.size());
    for (const auto& channel : channels_) {
        pending.push_back(std::async(std::launch::async, [this, channel]() {
            return collect(*channel);
        }));
    }

    // fan-in: 실패 여부와 관계없이 전부 기다린다
    std::vector<ChannelOutcome> outcomes;
    outcomes.reserve(pending.size());
    for (auto& f : pending) {
        outcomes.push_back(f.get());
    }

    for (const auto& outcome : outcomes) {
        report.results.push_back(outcome.result);
        if (outcome.result.success) {
            ++report.successful;
            report.total_saved += outcome.result.records_saved;
        } else {
            ++report.failed;
            report.failed_channels.push_back(outcome.result.channel);
        }
    }

    if (aggregator_) {
        for (const auto& outcome : outcomes) {
            if (!outcome.result.success || outcome.records.empty()) {
                continue;
            }
            try {
                report.bars += aggregator_->onCandles(outcome.records);
            } catch (const std::exception& e) {
                LOG_ERROR("[{}] 바 집계 실패: {}", outcome.result.channel, e.what());
            }
        }
    }

    report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (report.failed == 0) {
        LOG_INFO("사이클 #{} 완료 - 저장 {}건, 성공 {}/{} ({}ms)", report.cycle, report.total_saved,
                 report.successful, channels_.size(), report.duration.count());
    } else {
        LOG_WARN("사이클 #{} 완료 - 저장 {}건, 성공 {}/{}, 실패 채널: {} ({}ms)", report.cycle,
                 report.total_saved, report.successful, channels_.size(),
                 joinNames(report.failed_channels), report.duration.count());
    }

    {
        std::lock_guard<std::mutex> lock(report_mutex_);
        last_report_ = report;
    }
    return report;
}

std::optional<CycleReport> ChannelOrchestrator::lastReport() const {
    std::lock_guard<std::mutex> lock(report_mutex_);
    return last_report_;
}

std::vector<market::ChannelStatus> ChannelOrchestrator::channelStatuses() const {
    std::vector<market::ChannelStatus> out;
    out.reserve(channels_.size());
    for (const auto& channel : channels_) {
        out.push_back(channel->status());
    }
    return out;
}

ChannelOrchestrator::ChannelOutcome ChannelOrchestrator::collect(market::IMarketDataChannel& channel) {
    ChannelOutcome outcome;
    outcome.result.channel = channel.name();

    try {
        if (!channel.isConnected()) {
            channels_started_.store(true);
            channel.start();
        }

        auto fetched = channel.fetchData({}, config_.interval, config_.limit);
        if (!fetched.isSuccess()) {
            outcome.result.error = fetched.error;
            LOG_WARN("[{}] 수집 실패: {}", outcome.result.channel, fetched.error);
            return outcome;
        }

        if (!fetched.records.empty()) {
            outcome.result.records_saved = repository_->insertBatch(fetched.records);
        }
        outcome.result.success = true;
        outcome.records = std::move(fetched.records);
        LOG_DEBUG("[{}] {}건 저장", outcome.result.channel, outcome.result.records_saved);
    } catch (const std::exception& e) {
        outcome.result.success = false;
        outcome.result.records_saved = 0;
        outcome.result.error = e.what();
        LOG_ERROR("[{}] 채널 에러: {}", outcome.result.channel, e.what());
    }
    return outcome;
}

void ChannelOrchestrator::stopChannels() {
    std::vector<std::future<void>> pending;
    pending.reserve(channels_.size());
    for (const auto& channel : channels_) {
        pending.push_back(std::async(std::launch::async, [channel]() {
            try {
                channel->stop();
            } catch (const std::exception& e) {
                LOG_ERROR("[{}] stop 실패: {}", channel->name(), e.what());
            }
        }));
    }
    for (auto& f : pending) {
        f.get();
    }
    LOG_INFO("모든 채널 중지 완료");
}

bool ChannelOrchestrator::waitUntil(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(wake_mutex_);
    return wake_cv_.wait_until(lock, deadline, [this]() { return !running_.load(); });
}

} // namespace core
} // namespace cryptogate
