#pragma once

#include <memory>
#include <string>
#include <nlohmann/json.hpp>

#include "broker/IBrokerGateway.h"
#include "common/GatewayConfig.h"
#include "execution/RateLimitedConnector.h"
#include "network/IHttpClient.h"

namespace cryptogate {
namespace broker {

// Binance 현물 REST v3 (HMAC-SHA256 query 서명, newClientOrderId = client_order_id)
class BinanceBroker : public IBrokerGateway {
public:
    BinanceBroker(BrokerConfig config,
                  std::shared_ptr<network::IHttpClient> http,
                  std::shared_ptr<execution::RateLimitedConnector> connector);

    const std::string& name() const override { return name_; }

    void connect() override;
    void disconnect() override;
    bool isConnected() const override { return connector_->isConnected(); }

    Order placeOrder(const Order& order) override;
    Order cancelOrder(const std::string& exchange_order_id, const std::string& symbol) override;
    Order getOrderStatus(const std::string& exchange_order_id, const std::string& symbol) override;
    Balance getBalance(const std::string& currency = "USDT") override;
    std::vector<Position> getPositions() override;
    Price getMarketPrice(const std::string& symbol) override;

    // 거래소 주문 JSON (GET/DELETE /api/v3/order 응답) -> Order
    static Order parseOrder(const nlohmann::json& j);

private:
    network::HttpResponse send(const std::string& method,
                               const std::string& path,
                               network::QueryParams params,
                               bool is_signed);
    nlohmann::json parseBody(const network::HttpResponse& response) const;
    void requireCredentials() const;

    std::string name_ = "binance";
    BrokerConfig config_;
    std::string base_url_;
    std::shared_ptr<network::IHttpClient> http_;
    std::shared_ptr<execution::RateLimitedConnector> connector_;
};

} // namespace broker
} // namespace cryptogate
