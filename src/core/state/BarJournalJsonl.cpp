#include "core/state/BarJournalJsonl.h"

#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace cryptogate {
namespace core {

namespace {
nlohmann::json baseJson(const char* kind, const bars::Bar& bar) {
    nlohmann::json line;
    line["kind"] = kind;
    line["ts_ms"] = toUnixMillis(bar.timestamp);
    line["symbol"] = bar.symbol;
    line["source"] = bar.source;
    line["open"] = bar.open;
    line["high"] = bar.high;
    line["low"] = bar.low;
    line["close"] = bar.close;
    line["volume"] = bar.volume;
    line["quote_volume"] = bar.quote_volume;
    return line;
}
}

BarJournalJsonl::BarJournalJsonl(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }
        try {
            const auto line = nlohmann::json::parse(row);
            last_seq_ = (std::max)(last_seq_, line.value("seq", static_cast<std::uint64_t>(0)));
        } catch (const nlohmann::json::exception&) {
            // 깨진 줄은 건너뜀
        }
    }
}

void BarJournalJsonl::saveTickBars(const std::vector<bars::TickBar>& bars) {
    std::vector<nlohmann::json> lines;
    for (const auto& bar : bars) {
        auto line = baseJson("TICK", bar);
        line["tick_size"] = bar.tick_size;
        line["tick_count"] = bar.tick_count;
        line["buy_ticks"] = bar.buy_ticks;
        line["sell_ticks"] = bar.sell_ticks;
        line["buy_volume"] = bar.buy_volume;
        line["sell_volume"] = bar.sell_volume;
        lines.push_back(std::move(line));
    }
    appendLines(std::move(lines));
}

void BarJournalJsonl::saveRangeBars(const std::vector<bars::RangeBar>& bars) {
    std::vector<nlohmann::json> lines;
    for (const auto& bar : bars) {
        auto line = baseJson("RANGE", bar);
        line["range_threshold"] = bar.range_threshold;
        line["tick_count"] = bar.tick_count;
        line["duration_ms"] = bar.duration.count();
        line["buy_volume"] = bar.buy_volume;
        line["sell_volume"] = bar.sell_volume;
        lines.push_back(std::move(line));
    }
    appendLines(std::move(lines));
}

void BarJournalJsonl::saveRenkoBricks(const std::vector<bars::RenkoBrick>& bricks) {
    std::vector<nlohmann::json> lines;
    for (const auto& brick : bricks) {
        auto line = baseJson("RENKO", brick);
        line["brick_size"] = brick.brick_size;
        line["is_up_brick"] = brick.is_up_brick;
        line["is_reversal"] = brick.is_reversal;
        line["source_data_points"] = brick.source_data_points;
        line["sizing_method"] = brick.sizing_method;
        lines.push_back(std::move(line));
    }
    appendLines(std::move(lines));
}

void BarJournalJsonl::appendLines(std::vector<nlohmann::json> lines) {
    if (lines.empty()) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (file_path_.has_parent_path()) {
        std::filesystem::create_directories(file_path_.parent_path());
    }
    std::ofstream out(file_path_, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot open bar journal: " + file_path_.string());
    }

    std::uint64_t seq = last_seq_;
    for (auto& line : lines) {
        line["seq"] = ++seq;
        out << line.dump() << "\n";
    }
    out.flush();
    if (!out) {
        throw std::runtime_error("Failed to write bar journal: " + file_path_.string());
    }
    last_seq_ = seq;
}

std::vector<nlohmann::json> BarJournalJsonl::readFrom(std::uint64_t seq_inclusive) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<nlohmann::json> out;
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return out;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }
        try {
            auto line = nlohmann::json::parse(row);
            if (line.value("seq", static_cast<std::uint64_t>(0)) >= seq_inclusive) {
                out.push_back(std::move(line));
            }
        } catch (const nlohmann::json::exception&) {
            continue;
        }
    }
    return out;
}

std::uint64_t BarJournalJsonl::lastSeq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_seq_;
}

} // namespace core
} // namespace cryptogate
