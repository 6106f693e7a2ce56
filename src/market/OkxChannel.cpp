#include "market/OkxChannel.h"
#include "network/JsonFields.h"

#include <algorithm>
#include <map>
#include <nlohmann/json.hpp>

namespace cryptogate {
namespace market {

namespace {
constexpr int kMaxLimit = 100;

std::string stripDash(std::string symbol) {
    symbol.erase(std::remove(symbol.begin(), symbol.end(), '-'), symbol.end());
    return symbol;
}
}

OkxChannel::OkxChannel(std::shared_ptr<network::IHttpClient> http, std::vector<std::string> symbols)
    : RestChannelBase("okx", "https://www.okx.com", std::move(http), 10, std::move(symbols)) {}

bool OkxChannel::testConnection() {
    auto response = get("/api/v5/public/time");
    return response.json().value("code", "") == "0";
}

std::vector<std::string> OkxChannel::builtInSymbols() const {
    return {"BTC-USDT", "ETH-USDT", "SOL-USDT", "ADA-USDT", "XRP-USDT",
            "DOGE-USDT", "DOT-USDT", "MATIC-USDT", "AVAX-USDT", "LINK-USDT"};
}

std::string OkxChannel::toBar(const std::string& interval) {
    static const std::map<std::string, std::string> kBars = {
        {"1m", "1m"}, {"5m", "5m"}, {"15m", "15m"}, {"30m", "30m"},
        {"1h", "1H"}, {"4h", "4H"}, {"1d", "1D"}, {"1w", "1W"}
    };
    auto it = kBars.find(interval);
    return it == kBars.end() ? "1m" : it->second;
}

std::vector<MarketData> OkxChannel::fetchSymbol(const std::string& symbol,
                                                const std::string& interval,
                                                int limit) {
    network::QueryParams query;
    query["instId"] = symbol;
    query["bar"] = toBar(interval);
    query["limit"] = std::to_string(std::min(limit, kMaxLimit));

    auto response = get("/api/v5/market/candles", query);
    return parseCandles(response.json(), symbol);
}

std::vector<MarketData> OkxChannel::parseCandles(const nlohmann::json& body, const std::string& inst_id) {
    const std::string code = body.value("code", "");
    if (code != "0") {
        throw VenueError("okx code " + code + ": " + body.value("msg", ""));
    }

    std::vector<MarketData> out;
    const auto data = body.value("data", nlohmann::json::array());
    out.reserve(data.size());
    const std::string symbol = stripDash(inst_id);

    // [ts, o, h, l, c, vol, volCcy, volCcyQuote, confirm] 최신순
    for (const auto& c : data) {
        if (!c.is_array() || c.size() < 6) {
            continue;
        }
        MarketData d;
        d.symbol = symbol;
        d.source = "okx";
        d.timestamp = fromUnixMillis(static_cast<long long>(network::toNumber(c[0])));
        d.open = network::toNumber(c[1]);
        d.high = network::toNumber(c[2]);
        d.low = network::toNumber(c[3]);
        d.close = network::toNumber(c[4]);
        d.volume = network::toNumber(c[5]);
        d.quote_volume = c.size() > 6 ? network::toNumber(c[6]) : 0.0;
        out.push_back(std::move(d));
    }
    return out;
}

} // namespace market
} // namespace cryptogate
