#include "bars/BarAggregationService.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <iterator>

namespace cryptogate {
namespace bars {

namespace {

template <typename BarT>
void append(std::vector<BarT>& pending, std::vector<BarT>&& fresh) {
    pending.insert(pending.end(), std::make_move_iterator(fresh.begin()),
                   std::make_move_iterator(fresh.end()));
}

}

AggregationSummary& AggregationSummary::operator+=(const AggregationSummary& other) {
    candles_fed += other.candles_fed;
    ticks_fed += other.ticks_fed;
    tick_bars += other.tick_bars;
    range_bars += other.range_bars;
    renko_bricks += other.renko_bricks;
    return *this;
}

BarAggregationService::BarAggregationService(BarConfig config,
                                             std::shared_ptr<core::IBarRepository> repository)
    : config_(std::move(config))
    , repository_(std::move(repository)) {
    if (config_.tick_size <= 0) {
        throw InvalidConfigurationError("bars.tick_size must be positive");
    }
    if (!(config_.range_threshold > 0.0)) {
        throw InvalidConfigurationError("bars.range_threshold must be positive");
    }
    if (config_.renko_sizing != "Fixed" && config_.renko_sizing != "ATR" &&
        config_.renko_sizing != "Percentage") {
        throw InvalidConfigurationError("bars.renko_sizing must be Fixed, ATR or Percentage");
    }
    LOG_INFO("BarAggregationService 초기화 - tick {} / range {} / renko {}",
             config_.tick_size, config_.range_threshold, config_.renko_sizing);
}

AggregationSummary BarAggregationService::onCandles(const std::vector<MarketData>& candles) {
    AggregationSummary summary;

    std::map<Key, std::vector<const MarketData*>> groups;
    for (const auto& c : candles) {
        groups[{c.source, c.symbol}].push_back(&c);
    }

    std::vector<RangeBar> range_bars;
    std::vector<RenkoBrick> bricks;

    for (auto& [key, group] : groups) {
        std::sort(group.begin(), group.end(), [](const MarketData* a, const MarketData* b) {
            return a->timestamp < b->timestamp;
        });
        // 최신 캔들은 보류
        group.pop_back();

        auto& b = buildersFor(key.first, key.second);
        for (const MarketData* candle : group) {
            if (b.last_processed && candle->timestamp <= *b.last_processed) {
                continue;
            }

            ensureRenko(b, *candle);

            auto ranges = b.range->processCandle(*candle);
            range_bars.insert(range_bars.end(), ranges.begin(), ranges.end());
            if (b.renko) {
                auto r = b.renko->processCandle(*candle);
                bricks.insert(bricks.end(), r.begin(), r.end());
            }

            b.last_processed = candle->timestamp;
            ++summary.candles_fed;
        }
    }

    summary.range_bars = range_bars.size();
    summary.renko_bricks = bricks.size();
    persist({}, std::move(range_bars), std::move(bricks));

    if (summary.range_bars > 0 || summary.renko_bricks > 0) {
        LOG_INFO("바 집계: 캔들 {}개 -> Range {}개, Renko {}개",
                 summary.candles_fed, summary.range_bars, summary.renko_bricks);
    }
    return summary;
}

AggregationSummary BarAggregationService::onTick(const std::string& source, const Tick& tick) {
    AggregationSummary summary;
    auto& b = buildersFor(source, tick.symbol);

    std::vector<TickBar> tick_bars;
    std::vector<RangeBar> range_bars;
    if (auto bar = b.tick->addTick(tick)) {
        tick_bars.push_back(std::move(*bar));
    }
    if (auto bar = b.range->addTick(tick)) {
        range_bars.push_back(std::move(*bar));
    }
    b.last_processed = tick.timestamp;

    summary.ticks_fed = 1;
    summary.tick_bars = tick_bars.size();
    summary.range_bars = range_bars.size();
    persist(std::move(tick_bars), std::move(range_bars), {});
    return summary;
}

AggregationSummary BarAggregationService::flush() {
    AggregationSummary summary;
    std::vector<TickBar> tick_bars;
    std::vector<RangeBar> range_bars;

    for (auto& [key, b] : builders_) {
        if (auto bar = b.tick->forceComplete()) {
            tick_bars.push_back(std::move(*bar));
        }
        if (auto bar = b.range->forceComplete()) {
            range_bars.push_back(std::move(*bar));
        }
    }

    summary.tick_bars = tick_bars.size();
    summary.range_bars = range_bars.size();
    persist(std::move(tick_bars), std::move(range_bars), {});
    LOG_INFO("바 강제 방출: Tick {}개, Range {}개", summary.tick_bars, summary.range_bars);
    return summary;
}

std::optional<SymbolProgress> BarAggregationService::progress(const std::string& source,
                                                             const std::string& symbol) const {
    auto it = builders_.find({source, symbol});
    if (it == builders_.end()) {
        return std::nullopt;
    }
    const auto& b = it->second;
    SymbolProgress p;
    p.tick_progress = b.tick->getProgress();
    p.current_range = b.range->getCurrentRange();
    if (b.renko) {
        p.renko_anchor = b.renko->getCurrentState().anchor;
        p.renko_brick_size = b.renko->brickSize();
    }
    p.last_processed = b.last_processed;
    return p;
}

BarAggregationService::SymbolBuilders& BarAggregationService::buildersFor(const std::string& source,
                                                                         const std::string& symbol) {
    auto it = builders_.find({source, symbol});
    if (it != builders_.end()) {
        return it->second;
    }

    SymbolBuilders b;
    b.tick = std::make_unique<TickBarBuilder>(symbol, config_.tick_size, source);
    b.range = std::make_unique<RangeBarBuilder>(symbol, rangeThresholdFor(symbol), source);
    if (config_.renko_sizing == "Fixed") {
        b.renko = std::make_unique<RenkoBuilder>(symbol, brickSizeFor(symbol), source);
    }
    LOG_DEBUG("빌더 생성 - {} {}", source, symbol);
    return builders_.emplace(Key{source, symbol}, std::move(b)).first->second;
}

void BarAggregationService::ensureRenko(SymbolBuilders& b, const MarketData& candle) {
    if (b.renko) {
        return;
    }

    if (config_.renko_sizing == "Percentage") {
        // 처음 본 가격 기준
        b.renko = std::make_unique<RenkoBuilder>(RenkoBuilder::createWithPercentage(
            candle.symbol, candle.open, config_.percentage, candle.source));
        return;
    }

    // ATR: atr_period + 1 개가 모일 때까지 이력만 쌓는다 (그동안의 캔들은 벽돌에 반영 안 됨)
    b.atr_history.push_back(candle);
    const std::size_t needed = static_cast<std::size_t>(config_.atr_period) + 1;
    if (b.atr_history.size() > needed) {
        b.atr_history.erase(b.atr_history.begin());
    }
    if (b.atr_history.size() < needed) {
        return;
    }
    try {
        b.renko = std::make_unique<RenkoBuilder>(RenkoBuilder::createWithAtr(
            candle.symbol, b.atr_history, candle.source, config_.atr_period, config_.atr_multiplier));
        b.atr_history.clear();
    } catch (const InvalidConfigurationError& e) {
        // 가격 변동이 없으면 ATR = 0. 다음 캔들로 다시 시도
        LOG_WARN("{} ATR Renko 생성 보류: {}", candle.symbol, e.what());
    }
}

double BarAggregationService::rangeThresholdFor(const std::string& symbol) const {
    auto it = config_.range_thresholds.find(symbol);
    return it == config_.range_thresholds.end() ? config_.range_threshold : it->second;
}

double BarAggregationService::brickSizeFor(const std::string& symbol) const {
    auto it = config_.brick_sizes.find(symbol);
    return it == config_.brick_sizes.end() ? config_.brick_size : it->second;
}

void BarAggregationService::persist(std::vector<TickBar> tick_bars,
                                    std::vector<RangeBar> range_bars,
                                    std::vector<RenkoBrick> bricks) {
    if (!repository_) {
        return;
    }

    const std::size_t fresh = tick_bars.size() + range_bars.size() + bricks.size();
    const std::size_t backlog = pendingBars();
    append(pending_tick_bars_, std::move(tick_bars));
    append(pending_range_bars_, std::move(range_bars));
    append(pending_bricks_, std::move(bricks));

    // 빌더는 이미 진행했으므로 실패한 종류는 대기열에 남겨 두고 다음 호출에서 재시도
    try {
        if (!pending_tick_bars_.empty()) {
            repository_->saveTickBars(pending_tick_bars_);
            pending_tick_bars_.clear();
        }
        if (!pending_range_bars_.empty()) {
            repository_->saveRangeBars(pending_range_bars_);
            pending_range_bars_.clear();
        }
        if (!pending_bricks_.empty()) {
            repository_->saveRenkoBricks(pending_bricks_);
            pending_bricks_.clear();
        }
    } catch (const std::exception& e) {
        LOG_ERROR("바 저장 실패, {}개 보류 (신규 {}): {}", pendingBars(), fresh, e.what());
        throw;
    }

    if (backlog > 0) {
        LOG_INFO("보류했던 바 {}개 저장 완료", backlog);
    }
}

} // namespace bars
} // namespace cryptogate
