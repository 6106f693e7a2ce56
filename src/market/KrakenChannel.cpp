#include "market/KrakenChannel.h"
#include "network/JsonFields.h"

#include <cstdlib>
#include <map>
#include <nlohmann/json.hpp>

namespace cryptogate {
namespace market {

namespace {
const int kIntervals[] = {1, 5, 15, 30, 60, 240, 1440, 10080, 21600};

std::string joinErrors(const nlohmann::json& errors) {
    std::string out;
    for (const auto& e : errors) {
        if (!out.empty()) out += ", ";
        out += e.is_string() ? e.get<std::string>() : e.dump();
    }
    return out;
}
}

KrakenChannel::KrakenChannel(std::shared_ptr<network::IHttpClient> http, std::vector<std::string> symbols)
    : RestChannelBase("kraken", "https://api.kraken.com", std::move(http), 1, std::move(symbols)) {}

bool KrakenChannel::testConnection() {
    auto body = get("/0/public/Time").json();
    return body.contains("error") && body["error"].is_array() && body["error"].empty();
}

std::vector<std::string> KrakenChannel::builtInSymbols() const {
    return {"XXBTZUSD", "XETHZUSD", "SOLUSD", "ADAUSD", "XXRPZUSD",
            "DOGEUSD", "DOTUSD", "MATICUSD", "AVAXUSD", "LINKUSD"};
}

int KrakenChannel::snapIntervalMinutes(int minutes) {
    int best = kIntervals[0];
    for (int v : kIntervals) {
        if (std::abs(v - minutes) < std::abs(best - minutes)) {
            best = v;
        }
    }
    return best;
}

std::string KrakenChannel::normalizeSymbol(const std::string& pair) {
    static const std::map<std::string, std::string> kSymbols = {
        {"XXBTZUSD", "BTCUSD"}, {"XETHZUSD", "ETHUSD"}, {"XXRPZUSD", "XRPUSD"}
    };
    auto it = kSymbols.find(pair);
    return it == kSymbols.end() ? pair : it->second;
}

std::vector<MarketData> KrakenChannel::fetchSymbol(const std::string& symbol,
                                                   const std::string& interval,
                                                   int limit) {
    (void)limit;   // Kraken 은 개수 지정 없음 (최대 720개). 잘라내기는 공통 루프에서
    network::QueryParams query;
    query["pair"] = symbol;
    query["interval"] = std::to_string(snapIntervalMinutes(intervalSeconds(interval) / 60));

    auto response = get("/0/public/OHLC", query);
    return parseOhlc(response.json(), symbol);
}

std::vector<MarketData> KrakenChannel::parseOhlc(const nlohmann::json& body, const std::string& pair) {
    if (body.contains("error") && body["error"].is_array() && !body["error"].empty()) {
        throw VenueError("kraken: " + joinErrors(body["error"]));
    }

    std::vector<MarketData> out;
    if (!body.contains("result") || !body["result"].is_object()) {
        return out;
    }

    const nlohmann::json* rows = nullptr;
    for (auto it = body["result"].begin(); it != body["result"].end(); ++it) {
        if (it.key() != "last" && it.value().is_array()) {
            rows = &it.value();
            break;
        }
    }
    if (!rows) {
        return out;
    }

    const std::string symbol = normalizeSymbol(pair);
    out.reserve(rows->size());
    for (const auto& r : *rows) {
        if (!r.is_array() || r.size() < 7) {
            continue;
        }
        MarketData d;
        d.symbol = symbol;
        d.source = "kraken";
        d.timestamp = fromUnixMillis(static_cast<long long>(network::toNumber(r[0])) * 1000);
        d.open = network::toNumber(r[1]);
        d.high = network::toNumber(r[2]);
        d.low = network::toNumber(r[3]);
        d.close = network::toNumber(r[4]);
        const double vwap = network::toNumber(r[5]);
        d.volume = network::toNumber(r[6]);
        d.quote_volume = vwap * d.volume;
        d.trades_count = r.size() > 7 && r[7].is_number() ? r[7].get<long long>() : 0;
        out.push_back(std::move(d));
    }
    return out;
}

} // namespace market
} // namespace cryptogate
