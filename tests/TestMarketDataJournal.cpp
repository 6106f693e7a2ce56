#include "core/state/BarJournalJsonl.h"
#include "core/state/MarketDataJournalJsonl.h"

#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace cryptogate;

namespace {

std::filesystem::path freshDir(const std::string& name) {
    const auto dir = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove_all(dir);
    return dir;
}

MarketData candle(const std::string& symbol, long long ts_ms, double close) {
    MarketData d;
    d.symbol = symbol;
    d.source = "binance";
    d.timestamp = fromUnixMillis(ts_ms);
    d.open = close - 1.0;
    d.high = close + 1.0;
    d.low = close - 2.0;
    d.close = close;
    d.volume = 3.5;
    d.quote_volume = 3.5 * close;
    d.trades_count = 12;
    return d;
}

void testMarketDataJournal() {
    const auto dir = freshDir("cryptogate_journal_test");
    const auto path = dir / "nested" / "market_data.jsonl";

    {
        core::MarketDataJournalJsonl journal(path);
        assert(journal.lastSeq() == 0);
        assert(journal.readFrom(0).empty());
        assert(journal.insertBatch({}) == 0);

        const std::size_t saved = journal.insertBatch(
            {candle("BTCUSDT", 1700000000000LL, 100.0), candle("ETHUSDT", 1700000000000LL, 2000.0)});
        assert(saved == 2);
        assert(journal.lastSeq() == 2);

        auto tail = journal.readFrom(2);
        assert(tail.size() == 1);
        assert(tail[0].seq == 2);
        const auto& d = tail[0].data;
        assert(d.symbol == "ETHUSDT");
        assert(d.source == "binance");
        assert(toUnixMillis(d.timestamp) == 1700000000000LL);
        assert(std::abs(d.close - 2000.0) < 1e-9);
        assert(std::abs(d.quote_volume - 7000.0) < 1e-9);
        assert(d.trades_count == 12);
    }

    // 깨진 줄이 섞여도 나머지는 읽힌다
    {
        std::ofstream out(path, std::ios::app);
        out << "{ truncated\n";
    }

    {
        core::MarketDataJournalJsonl reopened(path);
        assert(reopened.lastSeq() == 2);
        reopened.insertBatch({candle("BTCUSDT", 1700000060000LL, 101.0)});
        assert(reopened.lastSeq() == 3);

        auto all = reopened.readFrom(0);
        assert(all.size() == 3);
        assert(all[0].seq == 1 && all[2].seq == 3);
        assert(toUnixMillis(all[2].data.timestamp) == 1700000060000LL);
    }

    std::filesystem::remove_all(dir);
    std::cout << "[TEST] market data journal PASSED\n";
}

void testBarJournal() {
    const auto dir = freshDir("cryptogate_bar_journal_test");
    const auto path = dir / "bars.jsonl";

    {
        core::BarJournalJsonl journal(path);

        bars::TickBar tick;
        tick.symbol = "BTCUSDT";
        tick.source = "binance";
        tick.tick_size = 100;
        tick.tick_count = 100;
        tick.buy_ticks = 60;
        tick.sell_ticks = 40;
        journal.saveTickBars({tick});

        bars::RangeBar range;
        range.symbol = "BTCUSDT";
        range.source = "binance";
        range.range_threshold = 10.0;
        range.duration = std::chrono::milliseconds(4500);
        journal.saveRangeBars({range});

        bars::RenkoBrick brick;
        brick.symbol = "BTCUSDT";
        brick.source = "binance";
        brick.brick_size = 10.0;
        brick.is_up_brick = true;
        brick.is_reversal = true;
        brick.sizing_method = "ATR(13)";
        journal.saveRenkoBricks({brick, brick});

        journal.saveTickBars({});
        assert(journal.lastSeq() == 4);

        auto lines = journal.readFrom(1);
        assert(lines.size() == 4);
        assert(lines[0]["kind"] == "TICK");
        assert(lines[0]["buy_ticks"] == 60);
        assert(lines[1]["kind"] == "RANGE");
        assert(lines[1]["duration_ms"] == 4500);
        assert(lines[2]["kind"] == "RENKO");
        assert(lines[2]["sizing_method"] == "ATR(13)");
        assert(lines[3]["is_reversal"] == true);
    }

    core::BarJournalJsonl reopened(path);
    assert(reopened.lastSeq() == 4);
    assert(reopened.readFrom(4).size() == 1);

    std::filesystem::remove_all(dir);
    std::cout << "[TEST] bar journal PASSED\n";
}

}

int main() {
    testMarketDataJournal();
    testBarJournal();

    std::cout << "[TEST] MarketDataJournal PASSED\n";
    return 0;
}
