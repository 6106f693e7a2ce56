#pragma once

#include <optional>
#include <string>
#include <vector>

#include "bars/BarTypes.h"

namespace cryptogate {
namespace bars {

// high - low 가 threshold 이상이 되는 순간 바 완성 (호출당 최대 1개)
class RangeBarBuilder {
public:
    RangeBarBuilder(std::string symbol, double range_threshold, std::string source);

    // threshold = ATR(atr_period) * multiplier
    static RangeBarBuilder createWithAtr(const std::string& symbol,
                                         const std::vector<MarketData>& recent_candles,
                                         const std::string& source,
                                         int atr_period = 13,
                                         double multiplier = 1.0);

    std::optional<RangeBar> processPrice(Price price, Quantity volume, double quote_volume,
                                         Timestamp timestamp,
                                         std::optional<bool> is_buy = std::nullopt);
    std::optional<RangeBar> addTick(const Tick& tick);

    // 캔들 1개를 open -> high -> low -> close 순서로 투입.
    // 거래량은 high/low/close 에 1/3 씩 (합계 보존), 완성된 바를 모두 반환
    std::vector<RangeBar> processCandle(const MarketData& candle);

    std::optional<RangeBar> forceComplete();

    double getProgress() const;
    double getCurrentRange() const { return has_started_ ? high_ - low_ : 0.0; }
    int currentTickCount() const { return tick_count_; }
    double rangeThreshold() const { return range_threshold_; }
    const std::string& symbol() const { return symbol_; }

private:
    RangeBar buildBar() const;
    void reset();

    std::string symbol_;
    double range_threshold_;
    std::string source_;

    bool has_started_ = false;
    Price open_ = 0.0;
    Price high_ = 0.0;
    Price low_ = 0.0;
    Price close_ = 0.0;
    Quantity volume_ = 0.0;
    double quote_volume_ = 0.0;
    int tick_count_ = 0;
    Quantity buy_volume_ = 0.0;
    Quantity sell_volume_ = 0.0;
    Timestamp first_tick_timestamp_{};
    Timestamp last_tick_timestamp_{};
};

} // namespace bars
} // namespace cryptogate
