#include "bars/RangeBarBuilder.h"
#include "bars/AverageTrueRange.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>

namespace cryptogate {
namespace bars {

namespace {
// 임계값에 비례하는 허용 오차
constexpr double kRelativeTolerance = 1e-9;
}

RangeBarBuilder::RangeBarBuilder(std::string symbol, double range_threshold, std::string source)
    : symbol_(std::move(symbol))
    , range_threshold_(range_threshold)
    , source_(std::move(source))
{
    if (symbol_.empty()) {
        throw InvalidConfigurationError("RangeBarBuilder: symbol must not be empty");
    }
    if (!(range_threshold_ > 0.0)) {
        throw InvalidConfigurationError("RangeBarBuilder: range threshold must be positive, got " +
                                        std::to_string(range_threshold_));
    }
    if (source_.empty()) {
        throw InvalidConfigurationError("RangeBarBuilder: source must not be empty");
    }
}

RangeBarBuilder RangeBarBuilder::createWithAtr(const std::string& symbol,
                                               const std::vector<MarketData>& recent_candles,
                                               const std::string& source,
                                               int atr_period,
                                               double multiplier) {
    if (!(multiplier > 0.0)) {
        throw InvalidConfigurationError("RangeBarBuilder: ATR multiplier must be positive");
    }
    const double atr = calculateAtr(recent_candles, atr_period);
    if (!(atr > 0.0)) {
        throw InvalidConfigurationError("RangeBarBuilder: ATR for " + symbol +
                                        " is zero, need more price movement in history");
    }
    const double threshold = atr * multiplier;
    LOG_INFO("ATR 기반 RangeBarBuilder 생성 - {} threshold {:.4f} (ATR{} x {})",
             symbol, threshold, atr_period, multiplier);
    return RangeBarBuilder(symbol, threshold, source);
}

std::optional<RangeBar> RangeBarBuilder::processPrice(Price price, Quantity volume, double quote_volume,
                                                      Timestamp timestamp, std::optional<bool> is_buy) {
    if (!has_started_) {
        open_ = high_ = low_ = price;
        first_tick_timestamp_ = timestamp;
        has_started_ = true;
    } else {
        high_ = std::max(high_, price);
        low_ = std::min(low_, price);
    }

    close_ = price;
    last_tick_timestamp_ = timestamp;

    volume_ += volume;
    quote_volume_ += quote_volume;
    ++tick_count_;

    if (is_buy) {
        if (*is_buy) {
            buy_volume_ += volume;
        } else {
            sell_volume_ += volume;
        }
    }

    if (high_ - low_ >= range_threshold_ * (1.0 - kRelativeTolerance)) {
        auto bar = buildBar();
        reset();
        return bar;
    }
    return std::nullopt;
}

std::optional<RangeBar> RangeBarBuilder::addTick(const Tick& tick) {
    return processPrice(tick.price, tick.quantity, tick.quote_volume, tick.timestamp, tick.is_market_buy);
}

std::vector<RangeBar> RangeBarBuilder::processCandle(const MarketData& candle) {
    std::vector<RangeBar> completed;

    const Quantity third = candle.volume / 3.0;
    const double quote_third = candle.quote_volume / 3.0;
    // 나머지는 close 에 몰아서 합계가 정확히 candle.volume 이 되도록
    const Quantity close_volume = candle.volume - 2.0 * third;
    const double close_quote = candle.quote_volume - 2.0 * quote_third;

    const struct { Price price; Quantity volume; double quote; } legs[] = {
        {candle.open, 0.0, 0.0},
        {candle.high, third, quote_third},
        {candle.low, third, quote_third},
        {candle.close, close_volume, close_quote},
    };

    for (const auto& leg : legs) {
        if (auto bar = processPrice(leg.price, leg.volume, leg.quote, candle.timestamp)) {
            completed.push_back(std::move(*bar));
        }
    }
    return completed;
}

std::optional<RangeBar> RangeBarBuilder::forceComplete() {
    if (!has_started_) {
        return std::nullopt;
    }
    auto bar = buildBar();
    reset();
    return bar;
}

double RangeBarBuilder::getProgress() const {
    if (!has_started_) {
        return 0.0;
    }
    return std::min(1.0, (high_ - low_) / range_threshold_);
}

RangeBar RangeBarBuilder::buildBar() const {
    RangeBar bar;
    bar.symbol = symbol_;
    bar.timestamp = last_tick_timestamp_;
    bar.open = open_;
    bar.high = high_;
    bar.low = low_;
    bar.close = close_;
    bar.volume = volume_;
    bar.quote_volume = quote_volume_;
    bar.source = source_;
    bar.range_threshold = range_threshold_;
    bar.tick_count = tick_count_;
    bar.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        last_tick_timestamp_ - first_tick_timestamp_);
    bar.buy_volume = buy_volume_;
    bar.sell_volume = sell_volume_;
    return bar;
}

void RangeBarBuilder::reset() {
    has_started_ = false;
    open_ = high_ = low_ = close_ = 0.0;
    volume_ = 0.0;
    quote_volume_ = 0.0;
    tick_count_ = 0;
    buy_volume_ = sell_volume_ = 0.0;
    first_tick_timestamp_ = Timestamp{};
    last_tick_timestamp_ = Timestamp{};
}

} // namespace bars
} // namespace cryptogate
