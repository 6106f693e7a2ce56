#include "bars/TickBarBuilder.h"
#include "common/Errors.h"

#include <algorithm>

namespace cryptogate {
namespace bars {

TickBarBuilder::TickBarBuilder(std::string symbol, int tick_size, std::string source)
    : symbol_(std::move(symbol))
    , tick_size_(tick_size)
    , source_(std::move(source))
{
    if (symbol_.empty()) {
        throw InvalidConfigurationError("TickBarBuilder: symbol must not be empty");
    }
    if (tick_size_ <= 0) {
        throw InvalidConfigurationError("TickBarBuilder: tick size must be positive, got " +
                                        std::to_string(tick_size_));
    }
    if (source_.empty()) {
        throw InvalidConfigurationError("TickBarBuilder: source must not be empty");
    }
}

std::optional<TickBar> TickBarBuilder::addTick(const Tick& tick) {
    if (current_tick_count_ == 0) {
        open_ = tick.price;
        high_ = tick.price;
        low_ = tick.price;
    } else {
        high_ = std::max(high_, tick.price);
        low_ = std::min(low_, tick.price);
    }

    close_ = tick.price;
    last_tick_timestamp_ = tick.timestamp;

    volume_ += tick.quantity;
    quote_volume_ += tick.quote_volume;

    // 방향을 모르면 매도 측으로 집계
    if (tick.is_market_buy.value_or(false)) {
        ++buy_ticks_;
        buy_volume_ += tick.quantity;
    } else {
        ++sell_ticks_;
        sell_volume_ += tick.quantity;
    }

    ++current_tick_count_;

    if (current_tick_count_ >= tick_size_) {
        auto bar = buildBar();
        reset();
        return bar;
    }
    return std::nullopt;
}

std::optional<TickBar> TickBarBuilder::processPrice(Price price, Quantity volume, double quote_volume,
                                                    Timestamp timestamp, bool is_market_buy) {
    Tick tick;
    tick.symbol = symbol_;
    tick.price = price;
    tick.quantity = volume;
    tick.quote_volume = quote_volume;
    tick.timestamp = timestamp;
    tick.is_market_buy = is_market_buy;
    return addTick(tick);
}

std::optional<TickBar> TickBarBuilder::forceComplete() {
    if (current_tick_count_ == 0) {
        return std::nullopt;
    }
    auto bar = buildBar();
    reset();
    return bar;
}

double TickBarBuilder::getProgress() const {
    return static_cast<double>(current_tick_count_) / static_cast<double>(tick_size_);
}

std::optional<TickBar> TickBarBuilder::getCurrentStats() const {
    if (current_tick_count_ == 0) {
        return std::nullopt;
    }
    return buildBar();
}

TickBar TickBarBuilder::buildBar() const {
    TickBar bar;
    bar.symbol = symbol_;
    bar.timestamp = last_tick_timestamp_;
    bar.open = open_;
    bar.high = high_;
    bar.low = low_;
    bar.close = close_;
    bar.volume = volume_;
    bar.quote_volume = quote_volume_;
    bar.source = source_;
    bar.tick_size = tick_size_;
    bar.tick_count = current_tick_count_;
    bar.buy_ticks = buy_ticks_;
    bar.sell_ticks = sell_ticks_;
    bar.buy_volume = buy_volume_;
    bar.sell_volume = sell_volume_;
    return bar;
}

void TickBarBuilder::reset() {
    open_ = high_ = low_ = close_ = 0.0;
    volume_ = 0.0;
    quote_volume_ = 0.0;
    buy_ticks_ = sell_ticks_ = 0;
    buy_volume_ = sell_volume_ = 0.0;
    current_tick_count_ = 0;
    last_tick_timestamp_ = Timestamp{};
}

} // namespace bars
} // namespace cryptogate
