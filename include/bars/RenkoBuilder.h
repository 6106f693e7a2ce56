#pragma once

#include <optional>
#include <string>
#include <vector>

#include "bars/BarTypes.h"

namespace cryptogate {
namespace bars {

// Renko 벽돌 생성기
//
// 기준가(anchor = 직전 벽돌의 close)에서 brick_size 배수를 넘을 때마다 벽돌 1개.
// 한 번의 가격 갱신으로 여러 벽돌이 나올 수 있다 (갭). 누적 거래량/포인트 수는
// 그 호출의 첫 벽돌에 전부 실리고 이후 벽돌은 0. 누적값은 벽돌이 나올 때만 초기화된다.
class RenkoBuilder {
public:
    struct State {
        std::optional<Price> anchor;
        Quantity accumulated_volume = 0.0;
        double accumulated_quote_volume = 0.0;
        int data_points = 0;
        bool has_prior_brick = false;
        bool last_brick_up = false;
    };

    RenkoBuilder(std::string symbol, double brick_size, std::string source,
                 std::string sizing_method = "Fixed");

    // brick_size = ATR(atr_period) * multiplier, sizing_method "ATR(n)"
    static RenkoBuilder createWithAtr(const std::string& symbol,
                                      const std::vector<MarketData>& recent_candles,
                                      const std::string& source,
                                      int atr_period = 13,
                                      double multiplier = 1.0);

    // brick_size = reference_price * percentage / 100, percentage 는 (0, 100]
    static RenkoBuilder createWithPercentage(const std::string& symbol,
                                             Price reference_price,
                                             double percentage,
                                             const std::string& source);

    std::vector<RenkoBrick> processPrice(Price price, Quantity volume, double quote_volume,
                                         Timestamp timestamp);
    std::vector<RenkoBrick> addTick(const Tick& tick);

    // open -> high -> low -> close, 거래량은 high/low/close 에 1/3 씩
    std::vector<RenkoBrick> processCandle(const MarketData& candle);

    // 빈 상태로 (방출된 벽돌은 건드리지 않음)
    void reset();

    State getCurrentState() const;
    double brickSize() const { return brick_size_; }
    const std::string& sizingMethod() const { return sizing_method_; }
    const std::string& symbol() const { return symbol_; }

private:
    RenkoBrick createBrick(Price open, Price close, bool is_up, Timestamp timestamp);
    Price roundToNearestBrick(Price price) const;

    std::string symbol_;
    double brick_size_;
    std::string source_;
    std::string sizing_method_;

    std::optional<Price> anchor_;
    Quantity accumulated_volume_ = 0.0;
    double accumulated_quote_volume_ = 0.0;
    int data_points_ = 0;
    bool has_prior_brick_ = false;
    bool last_brick_up_ = false;
};

} // namespace bars
} // namespace cryptogate
