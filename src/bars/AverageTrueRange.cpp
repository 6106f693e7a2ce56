#include "bars/AverageTrueRange.h"
#include "common/Errors.h"

#include <algorithm>
#include <cmath>
#include <string>

namespace cryptogate {
namespace bars {

double calculateAtr(const std::vector<MarketData>& candles, int period) {
    if (period <= 0) {
        throw InvalidConfigurationError("ATR period must be positive");
    }
    if (candles.size() < static_cast<size_t>(period) + 1) {
        throw InvalidConfigurationError(
            "Need at least " + std::to_string(period + 1) + " candles to calculate ATR(" +
            std::to_string(period) + "), got " + std::to_string(candles.size()));
    }

    double sum = 0.0;
    const size_t first = candles.size() - static_cast<size_t>(period);
    for (size_t i = first; i < candles.size(); ++i) {
        const auto& c = candles[i];
        const double prev_close = candles[i - 1].close;
        const double tr = std::max({
            c.high - c.low,
            std::abs(c.high - prev_close),
            std::abs(c.low - prev_close)
        });
        sum += tr;
    }
    return sum / static_cast<double>(period);
}

} // namespace bars
} // namespace cryptogate
