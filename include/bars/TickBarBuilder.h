#pragma once

#include <optional>
#include <string>

#include "bars/BarTypes.h"

namespace cryptogate {
namespace bars {

// N 틱마다 바 1개. 한 심볼 전용, 단일 스레드에서만 사용
class TickBarBuilder {
public:
    TickBarBuilder(std::string symbol, int tick_size, std::string source);

    // tick_size 번째 틱에서만 완성된 바 반환
    std::optional<TickBar> addTick(const Tick& tick);
    std::optional<TickBar> processPrice(Price price, Quantity volume, double quote_volume,
                                        Timestamp timestamp, bool is_market_buy);

    // 미완성 바 강제 방출 (세션 종료 등). 쌓인 틱이 없으면 nullopt
    std::optional<TickBar> forceComplete();

    double getProgress() const;
    int currentTickCount() const { return current_tick_count_; }
    int tickSize() const { return tick_size_; }
    const std::string& symbol() const { return symbol_; }

    // 진행 중 바 스냅샷 (비어 있으면 nullopt)
    std::optional<TickBar> getCurrentStats() const;

private:
    TickBar buildBar() const;
    void reset();

    std::string symbol_;
    int tick_size_;
    std::string source_;

    Price open_ = 0.0;
    Price high_ = 0.0;
    Price low_ = 0.0;
    Price close_ = 0.0;
    Quantity volume_ = 0.0;
    double quote_volume_ = 0.0;
    int buy_ticks_ = 0;
    int sell_ticks_ = 0;
    Quantity buy_volume_ = 0.0;
    Quantity sell_volume_ = 0.0;
    int current_tick_count_ = 0;
    Timestamp last_tick_timestamp_{};
};

} // namespace bars
} // namespace cryptogate
