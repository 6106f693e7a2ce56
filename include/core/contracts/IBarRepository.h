#pragma once

#include <vector>

#include "bars/BarTypes.h"

namespace cryptogate {
namespace core {

// 방출된 바는 불변. append 만 있음
class IBarRepository {
public:
    virtual ~IBarRepository() = default;

    virtual void saveTickBars(const std::vector<bars::TickBar>& bars) = 0;
    virtual void saveRangeBars(const std::vector<bars::RangeBar>& bars) = 0;
    virtual void saveRenkoBricks(const std::vector<bars::RenkoBrick>& bricks) = 0;
};

} // namespace core
} // namespace cryptogate
