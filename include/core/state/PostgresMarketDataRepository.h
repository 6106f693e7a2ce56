#pragma once

#include <string>

#include "core/contracts/IMarketDataRepository.h"

namespace cryptogate {
namespace core {

// market_data_1m 테이블 (sql/002_market_data.sql). 배치당 트랜잭션 1개,
// (symbol, source, timestamp) 중복은 무시
class PostgresMarketDataRepository : public IMarketDataRepository {
public:
    explicit PostgresMarketDataRepository(std::string connection_string);

    std::size_t insertBatch(const std::vector<MarketData>& records) override;

private:
    std::string connection_string_;
};

} // namespace core
} // namespace cryptogate
