#pragma once

#include "market/RestChannelBase.h"

namespace cryptogate {
namespace market {

// Binance 현물 klines (/api/v3/klines), 공개 한도 20 req/s
class BinanceChannel : public RestChannelBase {
public:
    explicit BinanceChannel(std::shared_ptr<network::IHttpClient> http,
                            std::vector<std::string> symbols = {});

    // [openTime, open, high, low, close, volume, closeTime, quoteVolume, trades, ...]
    static std::vector<MarketData> parseKlines(const nlohmann::json& body, const std::string& symbol);

protected:
    bool testConnection() override;
    std::vector<std::string> builtInSymbols() const override;
    std::vector<MarketData> fetchSymbol(const std::string& symbol,
                                        const std::string& interval,
                                        int limit) override;
};

} // namespace market
} // namespace cryptogate
