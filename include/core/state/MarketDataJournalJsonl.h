#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <vector>

#include "core/contracts/IMarketDataRepository.h"

namespace cryptogate {
namespace core {

struct JournaledMarketData {
    std::uint64_t seq = 0;
    MarketData data;
};

// 수집 캔들을 JSONL 로 append (한 줄 = 한 캔들)
class MarketDataJournalJsonl : public IMarketDataRepository {
public:
    explicit MarketDataJournalJsonl(std::filesystem::path file_path);

    std::size_t insertBatch(const std::vector<MarketData>& records) override;

    std::vector<JournaledMarketData> readFrom(std::uint64_t seq_inclusive) const;
    std::uint64_t lastSeq() const;

private:
    std::filesystem::path file_path_;
    mutable std::mutex mutex_;
    std::uint64_t last_seq_ = 0;
};

} // namespace core
} // namespace cryptogate
