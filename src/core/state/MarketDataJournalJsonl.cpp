#include "core/state/MarketDataJournalJsonl.h"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace cryptogate {
namespace core {

namespace {
std::uint64_t parseSeq(const nlohmann::json& line) {
    return line.value("seq", static_cast<std::uint64_t>(0));
}

nlohmann::json toJson(std::uint64_t seq, const MarketData& d) {
    nlohmann::json line;
    line["seq"] = seq;
    line["ts_ms"] = toUnixMillis(d.timestamp);
    line["symbol"] = d.symbol;
    line["source"] = d.source;
    line["open"] = d.open;
    line["high"] = d.high;
    line["low"] = d.low;
    line["close"] = d.close;
    line["volume"] = d.volume;
    line["quote_volume"] = d.quote_volume;
    line["trades_count"] = d.trades_count;
    return line;
}
}

MarketDataJournalJsonl::MarketDataJournalJsonl(std::filesystem::path file_path)
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
            last_seq_ = (std::max)(last_seq_, parseSeq(nlohmann::json::parse(row)));
        } catch (const nlohmann::json::exception&) {
            // 깨진 줄은 건너뜀
        }
    }
}

std::size_t MarketDataJournalJsonl::insertBatch(const std::vector<MarketData>& records) {
    if (records.empty()) {
        return 0;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (file_path_.has_parent_path()) {
        std::filesystem::create_directories(file_path_.parent_path());
    }
    std::ofstream out(file_path_, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot open market data journal: " + file_path_.string());
    }

    std::uint64_t seq = last_seq_;
    for (const auto& record : records) {
        out << toJson(++seq, record).dump() << "\n";
    }
    out.flush();
    if (!out) {
        throw std::runtime_error("Failed to write market data journal: " + file_path_.string());
    }

    last_seq_ = seq;
    return records.size();
}

std::vector<JournaledMarketData> MarketDataJournalJsonl::readFrom(std::uint64_t seq_inclusive) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<JournaledMarketData> out;
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return out;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }

        nlohmann::json line;
        try {
            line = nlohmann::json::parse(row);
        } catch (const nlohmann::json::exception&) {
            continue;
        }

        const auto seq = parseSeq(line);
        if (seq < seq_inclusive) {
            continue;
        }

        JournaledMarketData entry;
        entry.seq = seq;
        entry.data.timestamp = fromUnixMillis(line.value("ts_ms", 0LL));
        entry.data.symbol = line.value("symbol", std::string());
        entry.data.source = line.value("source", std::string());
        entry.data.open = line.value("open", 0.0);
        entry.data.high = line.value("high", 0.0);
        entry.data.low = line.value("low", 0.0);
        entry.data.close = line.value("close", 0.0);
        entry.data.volume = line.value("volume", 0.0);
        entry.data.quote_volume = line.value("quote_volume", 0.0);
        entry.data.trades_count = line.value("trades_count", 0LL);
        out.push_back(std::move(entry));
    }

    return out;
}

std::uint64_t MarketDataJournalJsonl::lastSeq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_seq_;
}

} // namespace core
} // namespace cryptogate
