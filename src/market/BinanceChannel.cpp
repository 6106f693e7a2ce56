#include "market/BinanceChannel.h"
#include "common/Logger.h"
#include "network/JsonFields.h"

#include <algorithm>
#include <nlohmann/json.hpp>

namespace cryptogate {
namespace market {

namespace {
constexpr int kMaxLimit = 1000;
constexpr int kWeightWarning = 1000;   // 분당 1200 중
}

BinanceChannel::BinanceChannel(std::shared_ptr<network::IHttpClient> http,
                               std::vector<std::string> symbols)
    : RestChannelBase("binance", "https://api.binance.com", std::move(http), 20, std::move(symbols)) {}

bool BinanceChannel::testConnection() {
    get("/api/v3/ping");
    return true;
}

std::vector<std::string> BinanceChannel::builtInSymbols() const {
    return {"BTCUSDT", "ETHUSDT", "BNBUSDT", "SOLUSDT", "ADAUSDT",
            "XRPUSDT", "DOGEUSDT", "DOTUSDT", "MATICUSDT", "AVAXUSDT"};
}

std::vector<MarketData> BinanceChannel::fetchSymbol(const std::string& symbol,
                                                    const std::string& interval,
                                                    int limit) {
    network::QueryParams query;
    query["symbol"] = symbol;
    query["interval"] = interval;
    query["limit"] = std::to_string(std::min(limit, kMaxLimit));

    auto response = get("/api/v3/klines", query);

    const std::string weight = response.header("X-MBX-USED-WEIGHT-1M");
    if (!weight.empty()) {
        const int used = static_cast<int>(network::toNumber(nlohmann::json(weight)));
        if (used > kWeightWarning) {
            LOG_WARN("[binance] 레이트 리밋 사용량 높음: {}/1200", used);
        }
    }

    return parseKlines(response.json(), symbol);
}

std::vector<MarketData> BinanceChannel::parseKlines(const nlohmann::json& body, const std::string& symbol) {
    std::vector<MarketData> out;
    if (!body.is_array()) {
        return out;
    }
    out.reserve(body.size());
    for (const auto& k : body) {
        if (!k.is_array() || k.size() < 6) {
            continue;
        }
        MarketData d;
        d.symbol = symbol;
        d.source = "binance";
        d.timestamp = fromUnixMillis(k[0].get<long long>());
        d.open = network::toNumber(k[1]);
        d.high = network::toNumber(k[2]);
        d.low = network::toNumber(k[3]);
        d.close = network::toNumber(k[4]);
        d.volume = network::toNumber(k[5]);
        if (k.size() > 8) {
            d.quote_volume = network::toNumber(k[7]);
            d.trades_count = k[8].is_number() ? k[8].get<long long>() : 0;
        }
        out.push_back(std::move(d));
    }
    return out;
}

} // namespace market
} // namespace cryptogate
