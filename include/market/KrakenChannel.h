#pragma once

#include "market/RestChannelBase.h"

namespace cryptogate {
namespace market {

// Kraken /0/public/OHLC (pair 형식 XXBTZUSD), 공개 한도 1 req/s
class KrakenChannel : public RestChannelBase {
public:
    explicit KrakenChannel(std::shared_ptr<network::IHttpClient> http,
                           std::vector<std::string> symbols = {});

    // 1/5/15/30/60/240/1440/10080/21600 분 중 가장 가까운 값
    static int snapIntervalMinutes(int minutes);

    // XXBTZUSD -> BTCUSD, XETHZUSD -> ETHUSD, XXRPZUSD -> XRPUSD, 나머지 그대로
    static std::string normalizeSymbol(const std::string& pair);

    // error[] 가 있으면 VenueError. result 의 pair 키는 요청과 다를 수 있어 "last" 외 배열을 찾는다
    // [time(s), open, high, low, close, vwap, volume, count]
    static std::vector<MarketData> parseOhlc(const nlohmann::json& body, const std::string& pair);

protected:
    bool testConnection() override;
    std::vector<std::string> builtInSymbols() const override;
    std::vector<MarketData> fetchSymbol(const std::string& symbol,
                                        const std::string& interval,
                                        int limit) override;
};

} // namespace market
} // namespace cryptogate
