#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "common/Types.h"

namespace cryptogate {
namespace bars {

// 체결 1건 (틱 입력)
struct Tick {
    std::string symbol;
    Price price = 0.0;
    Quantity quantity = 0.0;
    double quote_volume = 0.0;
    Timestamp timestamp{};
    std::optional<bool> is_market_buy;   // 모르면 nullopt
};

// 모든 바 공통 필드. timestamp 는 바 종료 시각
struct Bar {
    std::string symbol;
    Timestamp timestamp{};
    Price open = 0.0;
    Price high = 0.0;
    Price low = 0.0;
    Price close = 0.0;
    Quantity volume = 0.0;
    double quote_volume = 0.0;
    std::string source;
};

struct TickBar : Bar {
    int tick_size = 0;
    int tick_count = 0;
    int buy_ticks = 0;
    int sell_ticks = 0;
    Quantity buy_volume = 0.0;
    Quantity sell_volume = 0.0;
};

struct RangeBar : Bar {
    double range_threshold = 0.0;
    int tick_count = 0;
    std::chrono::milliseconds duration{0};
    Quantity buy_volume = 0.0;
    Quantity sell_volume = 0.0;
};

// high/low 는 방향에 따라 open/close 양 끝
struct RenkoBrick : Bar {
    double brick_size = 0.0;
    bool is_up_brick = false;
    bool is_reversal = false;
    int source_data_points = 0;
    std::string sizing_method;
};

} // namespace bars
} // namespace cryptogate
