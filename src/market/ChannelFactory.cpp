#include "market/ChannelFactory.h"
#include "common/Errors.h"
#include "market/BinanceChannel.h"
#include "market/CoinbaseChannel.h"
#include "market/KrakenChannel.h"
#include "market/OkxChannel.h"

namespace cryptogate {
namespace market {

std::shared_ptr<IMarketDataChannel> createChannel(const ChannelConfig& config,
                                                  std::shared_ptr<network::IHttpClient> http) {
    if (config.name == "binance") {
        return std::make_shared<BinanceChannel>(std::move(http), config.symbols);
    }
    if (config.name == "okx") {
        return std::make_shared<OkxChannel>(std::move(http), config.symbols);
    }
    if (config.name == "coinbase") {
        return std::make_shared<CoinbaseChannel>(std::move(http), config.symbols);
    }
    if (config.name == "kraken") {
        return std::make_shared<KrakenChannel>(std::move(http), config.symbols);
    }
    throw InvalidConfigurationError("unknown market data channel: " + config.name);
}

} // namespace market
} // namespace cryptogate
