#include "core/state/PostgresMarketDataRepository.h"
#include "common/Logger.h"

#include <pqxx/pqxx>

namespace cryptogate {
namespace core {

PostgresMarketDataRepository::PostgresMarketDataRepository(std::string connection_string)
    : connection_string_(std::move(connection_string)) {
    pqxx::connection c(connection_string_);
    LOG_INFO("[MarketDataRepo] PostgreSQL 연결 확인 - {}", c.dbname());
}

std::size_t PostgresMarketDataRepository::insertBatch(const std::vector<MarketData>& records) {
    if (records.empty()) {
        return 0;
    }

    pqxx::connection c(connection_string_);
    pqxx::work t(c);

    std::size_t inserted = 0;
    for (const auto& d : records) {
        auto r = t.exec_params(
            "INSERT INTO market_data_1m (symbol, timestamp, open, high, low, close, volume, "
            "quote_volume, trades_count, source) "
            "VALUES ($1, to_timestamp($2::DOUBLE PRECISION / 1000.0), $3, $4, $5, $6, $7, $8, $9, $10) "
            "ON CONFLICT (symbol, source, timestamp) DO NOTHING",
            d.symbol, toUnixMillis(d.timestamp), d.open, d.high, d.low, d.close, d.volume,
            d.quote_volume, d.trades_count, d.source);
        inserted += static_cast<std::size_t>(r.affected_rows());
    }
    t.commit();

    LOG_DEBUG("[MarketDataRepo] {}건 중 {}건 저장", records.size(), inserted);
    return inserted;
}

} // namespace core
} // namespace cryptogate
