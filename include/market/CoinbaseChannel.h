#pragma once

#include "market/RestChannelBase.h"

namespace cryptogate {
namespace market {

// Coinbase Exchange /products/{id}/candles (product id 형식 BTC-USD), 공개 한도 10 req/s
class CoinbaseChannel : public RestChannelBase {
public:
    explicit CoinbaseChannel(std::shared_ptr<network::IHttpClient> http,
                             std::vector<std::string> symbols = {});

    // 60/300/900/3600/21600/86400 중 가장 가까운 값
    static int snapGranularity(int seconds);

    // [time(s), low, high, open, close, volume] 최신순. 심볼은 "-" 제거
    static std::vector<MarketData> parseCandles(const nlohmann::json& body, const std::string& product_id);

    static std::string toIso8601(Timestamp ts);

protected:
    bool testConnection() override;
    std::vector<std::string> builtInSymbols() const override;
    std::vector<MarketData> fetchSymbol(const std::string& symbol,
                                        const std::string& interval,
                                        int limit) override;
};

} // namespace market
} // namespace cryptogate
