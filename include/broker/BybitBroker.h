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

// Bybit v5 REST, category=linear (USDT 무기한)
// 서명: HMAC-SHA256(timestamp + api_key + recv_window + (query | json body)) -> X-BAPI-SIGN
// client_order_id 는 orderLinkId 로 전달
class BybitBroker : public IBrokerGateway {
public:
    BybitBroker(BrokerConfig config,
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

    // /v5/order/realtime 의 list 항목 -> Order
    static Order parseOrder(const nlohmann::json& item);

private:
    // retCode 까지 확인한 result 객체. 실패면 GatewayError / BrokerUnavailableError
    nlohmann::json call(const std::string& method, const std::string& path,
                        const network::QueryParams& query, const nlohmann::json& body,
                        bool is_signed);
    network::HttpResponse send(const std::string& method, const std::string& path,
                               const network::QueryParams& query, const nlohmann::json& body,
                               bool is_signed);
    nlohmann::json parseBody(const network::HttpResponse& response) const;
    void requireCredentials() const;

    std::string name_ = "bybit";
    BrokerConfig config_;
    std::string base_url_;
    std::shared_ptr<network::IHttpClient> http_;
    std::shared_ptr<execution::RateLimitedConnector> connector_;
};

} // namespace broker
} // namespace cryptogate
