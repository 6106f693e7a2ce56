#pragma once

#include <cstddef>
#include <vector>

#include "common/Types.h"

namespace cryptogate {
namespace core {

class IMarketDataRepository {
public:
    virtual ~IMarketDataRepository() = default;

    // 저장된 건수 반환. 실패 시 예외 (호출한 채널 단위로 격리됨)
    virtual std::size_t insertBatch(const std::vector<MarketData>& records) = 0;
};

} // namespace core
} // namespace cryptogate
