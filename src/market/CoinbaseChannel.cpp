#include "market/CoinbaseChannel.h"
#include "common/Logger.h"
#include "network/JsonFields.h"

#include <algorithm>
#include <cstdlib>
#include <ctime>
#include <nlohmann/json.hpp>

namespace cryptogate {
namespace market {

namespace {
constexpr int kMaxCandles = 300;
const int kGranularities[] = {60, 300, 900, 3600, 21600, 86400};
}

CoinbaseChannel::CoinbaseChannel(std::shared_ptr<network::IHttpClient> http,
                                 std::vector<std::string> symbols)
    : RestChannelBase("coinbase", "https://api.exchange.coinbase.com", std::move(http), 10,
                      std::move(symbols)) {}

bool CoinbaseChannel::testConnection() {
    get("/time");
    return true;
}

std::vector<std::string> CoinbaseChannel::builtInSymbols() const {
    return {"BTC-USD", "ETH-USD", "SOL-USD", "ADA-USD", "XRP-USD",
            "DOGE-USD", "DOT-USD", "MATIC-USD", "AVAX-USD", "LINK-USD"};
}

int CoinbaseChannel::snapGranularity(int seconds) {
    int best = kGranularities[0];
    for (int g : kGranularities) {
        if (std::abs(g - seconds) < std::abs(best - seconds)) {
            best = g;
        }
    }
    return best;
}

std::string CoinbaseChannel::toIso8601(Timestamp ts) {
    const std::time_t t = std::chrono::system_clock::to_time_t(ts);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buffer;
}

std::vector<MarketData> CoinbaseChannel::fetchSymbol(const std::string& symbol,
                                                     const std::string& interval,
                                                     int limit) {
    const int requested = intervalSeconds(interval);
    const int granularity = snapGranularity(requested);
    if (granularity != requested) {
        LOG_DEBUG("[coinbase] granularity {}s -> {}s", requested, granularity);
    }
    const int count = std::min(limit, kMaxCandles);

    const auto end = std::chrono::system_clock::now();
    const auto start = end - std::chrono::seconds(static_cast<long long>(granularity) * count);

    network::QueryParams query;
    query["granularity"] = std::to_string(granularity);
    query["start"] = toIso8601(start);
    query["end"] = toIso8601(end);

    auto response = get("/products/" + symbol + "/candles", query);
    return parseCandles(response.json(), symbol);
}

std::vector<MarketData> CoinbaseChannel::parseCandles(const nlohmann::json& body,
                                                      const std::string& product_id) {
    std::vector<MarketData> out;
    if (!body.is_array()) {
        return out;
    }
    std::string symbol = product_id;
    symbol.erase(std::remove(symbol.begin(), symbol.end(), '-'), symbol.end());

    out.reserve(body.size());
    for (const auto& c : body) {
        if (!c.is_array() || c.size() < 6) {
            continue;
        }
        MarketData d;
        d.symbol = symbol;
        d.source = "coinbase";
        d.timestamp = fromUnixMillis(static_cast<long long>(network::toNumber(c[0])) * 1000);
        d.low = network::toNumber(c[1]);
        d.high = network::toNumber(c[2]);
        d.open = network::toNumber(c[3]);
        d.close = network::toNumber(c[4]);
        d.volume = network::toNumber(c[5]);
        d.quote_volume = d.volume * d.close;
        out.push_back(std::move(d));
    }
    return out;
}

} // namespace market
} // namespace cryptogate
