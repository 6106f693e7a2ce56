#include "broker/BrokerFactory.h"
#include "broker/BinanceBroker.h"
#include "broker/BybitBroker.h"
#include "broker/PaperBroker.h"
#include "common/Errors.h"
#include "execution/RateLimitedConnector.h"

namespace cryptogate {
namespace broker {

std::shared_ptr<IBrokerGateway> createBroker(const BrokerConfig& config,
                                             std::shared_ptr<network::IHttpClient> http) {
    auto connector = std::make_shared<execution::RateLimitedConnector>(execution::ConnectorSettings(
        config.name,
        std::chrono::milliseconds(config.min_request_interval_ms),
        config.max_concurrent_requests));

    if (config.name == "binance") {
        return std::make_shared<BinanceBroker>(config, std::move(http), std::move(connector));
    }
    if (config.name == "bybit") {
        return std::make_shared<BybitBroker>(config, std::move(http), std::move(connector));
    }
    if (config.name == "paper") {
        return std::make_shared<PaperBroker>(std::move(connector));
    }
    throw InvalidConfigurationError("unknown broker: " + config.name);
}

} // namespace broker
} // namespace cryptogate
