#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

#include "common/GatewayConfig.h"

namespace cryptogate {

class Config {
public:
    static Config& getInstance();

    // 파일이 없으면 기본값 유지, 값이 잘못되면 InvalidConfigurationError
    void load(const std::string& config_path);
    void loadFromJson(const nlohmann::json& j);

    const GatewayConfig& get() const { return config_; }
    const LoggingConfig& getLogging() const { return config_.logging; }
    const MarketDataConfig& getMarketData() const { return config_.market_data; }
    const OrdersConfig& getOrders() const { return config_.orders; }
    const BarConfig& getBars() const { return config_.bars; }
    const StorageConfig& getStorage() const { return config_.storage; }
    const std::vector<BrokerConfig>& getBrokers() const { return config_.brokers; }
    std::optional<BrokerConfig> getBroker(const std::string& name) const;

private:
    Config() = default;
    static void validate(const GatewayConfig& config);

    GatewayConfig config_;
};

} // namespace cryptogate
