#pragma once

#include <vector>

#include "common/Types.h"

namespace cryptogate {
namespace bars {

// ATR(period): 최근 period 개 TR 의 단순 평균
// TR = max(high - low, |high - prevClose|, |low - prevClose|)
// 캔들은 시간 오름차순, period + 1 개 이상 필요 (부족하면 InvalidConfigurationError)
double calculateAtr(const std::vector<MarketData>& candles, int period = 13);

} // namespace bars
} // namespace cryptogate
