#include "bars/RenkoBuilder.h"
#include "bars/AverageTrueRange.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <cmath>
#include <sstream>

namespace cryptogate {
namespace bars {

namespace {
// 경계 비교 허용 오차는 벽돌 크기에 비례 (초소형 가격 심볼)
constexpr double kRelativeTolerance = 1e-9;
}

RenkoBuilder::RenkoBuilder(std::string symbol, double brick_size, std::string source,
                           std::string sizing_method)
    : symbol_(std::move(symbol))
    , brick_size_(brick_size)
    , source_(std::move(source))
    , sizing_method_(std::move(sizing_method))
{
    if (symbol_.empty()) {
        throw InvalidConfigurationError("RenkoBuilder: symbol must not be empty");
    }
    if (!(brick_size_ > 0.0) || !std::isfinite(brick_size_)) {
        throw InvalidConfigurationError("RenkoBuilder: brick size must be positive, got " +
                                        std::to_string(brick_size_));
    }
    if (source_.empty()) {
        throw InvalidConfigurationError("RenkoBuilder: source must not be empty");
    }
}

RenkoBuilder RenkoBuilder::createWithAtr(const std::string& symbol,
                                         const std::vector<MarketData>& recent_candles,
                                         const std::string& source,
                                         int atr_period,
                                         double multiplier) {
    if (!(multiplier > 0.0)) {
        throw InvalidConfigurationError("RenkoBuilder: ATR multiplier must be positive");
    }
    const double atr = calculateAtr(recent_candles, atr_period);
    if (!(atr > 0.0)) {
        throw InvalidConfigurationError("RenkoBuilder: ATR for " + symbol +
                                        " is zero, need more price movement in history");
    }
    const double brick = atr * multiplier;
    LOG_INFO("ATR 기반 RenkoBuilder 생성 - {} brick {:.4f} (ATR{})", symbol, brick, atr_period);
    return RenkoBuilder(symbol, brick, source, "ATR(" + std::to_string(atr_period) + ")");
}

RenkoBuilder RenkoBuilder::createWithPercentage(const std::string& symbol,
                                                Price reference_price,
                                                double percentage,
                                                const std::string& source) {
    if (!(percentage > 0.0) || percentage > 100.0) {
        throw InvalidConfigurationError("RenkoBuilder: percentage must be in (0, 100]");
    }
    if (!(reference_price > 0.0)) {
        throw InvalidConfigurationError("RenkoBuilder: reference price must be positive");
    }
    const double brick = reference_price * (percentage / 100.0);

    std::ostringstream method;
    method << "Percentage(" << percentage << "%)";
    LOG_INFO("비율 기반 RenkoBuilder 생성 - {} {}% brick {:.4f}", symbol, percentage, brick);
    return RenkoBuilder(symbol, brick, source, method.str());
}

std::vector<RenkoBrick> RenkoBuilder::processPrice(Price price, Quantity volume, double quote_volume,
                                                   Timestamp timestamp) {
    std::vector<RenkoBrick> completed;

    accumulated_volume_ += volume;
    accumulated_quote_volume_ += quote_volume;
    ++data_points_;

    if (!anchor_) {
        // 첫 가격: 기준가만 잡는다. 거래량은 다음 벽돌로 이월
        anchor_ = roundToNearestBrick(price);
        return completed;
    }

    const double tolerance = brick_size_ * kRelativeTolerance;

    // 가격 기준으로 위/아래 중 한 방향만 성립
    while (price >= *anchor_ + brick_size_ - tolerance) {
        const Price open = *anchor_;
        const Price close = open + brick_size_;
        completed.push_back(createBrick(open, close, true, timestamp));
        anchor_ = close;
    }

    while (price <= *anchor_ - brick_size_ + tolerance) {
        const Price open = *anchor_;
        const Price close = open - brick_size_;
        completed.push_back(createBrick(open, close, false, timestamp));
        anchor_ = close;
    }

    return completed;
}

std::vector<RenkoBrick> RenkoBuilder::addTick(const Tick& tick) {
    return processPrice(tick.price, tick.quantity, tick.quote_volume, tick.timestamp);
}

std::vector<RenkoBrick> RenkoBuilder::processCandle(const MarketData& candle) {
    std::vector<RenkoBrick> all;

    const Quantity third = candle.volume / 3.0;
    const double quote_third = candle.quote_volume / 3.0;

    auto append = [&all](std::vector<RenkoBrick>&& bricks) {
        for (auto& b : bricks) {
            all.push_back(std::move(b));
        }
    };

    append(processPrice(candle.open, 0.0, 0.0, candle.timestamp));
    append(processPrice(candle.high, third, quote_third, candle.timestamp));
    append(processPrice(candle.low, third, quote_third, candle.timestamp));
    append(processPrice(candle.close, candle.volume - 2.0 * third,
                        candle.quote_volume - 2.0 * quote_third, candle.timestamp));
    return all;
}

void RenkoBuilder::reset() {
    anchor_.reset();
    accumulated_volume_ = 0.0;
    accumulated_quote_volume_ = 0.0;
    data_points_ = 0;
    has_prior_brick_ = false;
    last_brick_up_ = false;
}

RenkoBuilder::State RenkoBuilder::getCurrentState() const {
    State state;
    state.anchor = anchor_;
    state.accumulated_volume = accumulated_volume_;
    state.accumulated_quote_volume = accumulated_quote_volume_;
    state.data_points = data_points_;
    state.has_prior_brick = has_prior_brick_;
    state.last_brick_up = last_brick_up_;
    return state;
}

RenkoBrick RenkoBuilder::createBrick(Price open, Price close, bool is_up, Timestamp timestamp) {
    RenkoBrick brick;
    brick.symbol = symbol_;
    brick.timestamp = timestamp;
    brick.open = open;
    brick.close = close;
    brick.high = is_up ? close : open;
    brick.low = is_up ? open : close;
    brick.volume = accumulated_volume_;
    brick.quote_volume = accumulated_quote_volume_;
    brick.source = source_;
    brick.brick_size = brick_size_;
    brick.is_up_brick = is_up;
    brick.is_reversal = has_prior_brick_ && (is_up != last_brick_up_);
    brick.source_data_points = data_points_;
    brick.sizing_method = sizing_method_;

    has_prior_brick_ = true;
    last_brick_up_ = is_up;
    accumulated_volume_ = 0.0;
    accumulated_quote_volume_ = 0.0;
    data_points_ = 0;
    return brick;
}

Price RenkoBuilder::roundToNearestBrick(Price price) const {
    return std::round(price / brick_size_) * brick_size_;
}

} // namespace bars
} // namespace cryptogate
