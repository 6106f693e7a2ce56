#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "core/contracts/IBarRepository.h"

namespace cryptogate {
namespace core {

// 완성 바 JSONL 저장 (kind = TICK / RANGE / RENKO)
class BarJournalJsonl : public IBarRepository {
public:
    explicit BarJournalJsonl(std::filesystem::path file_path);

    void saveTickBars(const std::vector<bars::TickBar>& bars) override;
    void saveRangeBars(const std::vector<bars::RangeBar>& bars) override;
    void saveRenkoBricks(const std::vector<bars::RenkoBrick>& bricks) override;

    std::vector<nlohmann::json> readFrom(std::uint64_t seq_inclusive) const;
    std::uint64_t lastSeq() const;

private:
    void appendLines(std::vector<nlohmann::json> lines);

    std::filesystem::path file_path_;
    mutable std::mutex mutex_;
    std::uint64_t last_seq_ = 0;
};

} // namespace core
} // namespace cryptogate
