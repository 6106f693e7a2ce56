#pragma once

#include "market/RestChannelBase.h"

namespace cryptogate {
namespace market {

// OKX /api/v5/market/candles (instId 형식 BTC-USDT), 공개 한도 10 req/s
class OkxChannel : public RestChannelBase {
public:
    explicit OkxChannel(std::shared_ptr<network::IHttpClient> http,
                        std::vector<std::string> symbols = {});

    // 1m/5m/15m/30m 그대로, 1h -> 1H, 4h -> 4H, 1d -> 1D, 1w -> 1W. 그 외 1m
    static std::string toBar(const std::string& interval);

    // code != "0" 이면 VenueError. 심볼은 "-" 제거 (BTC-USDT -> BTCUSDT)
    static std::vector<MarketData> parseCandles(const nlohmann::json& body, const std::string& inst_id);

protected:
    bool testConnection() override;
    std::vector<std::string> builtInSymbols() const override;
    std::vector<MarketData> fetchSymbol(const std::string& symbol,
                                        const std::string& interval,
                                        int limit) override;
};

} // namespace market
} // namespace cryptogate
