#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "broker/IBrokerGateway.h"
#include "execution/RateLimitedConnector.h"

namespace cryptogate {
namespace broker {

// 프로세스 내 모의 거래소 (paper 모드, 테스트)
//  - 시장가: 마지막 setMarketPrice 가격으로 즉시 전량 체결
//  - 지정가: OPEN 으로 대기, 이후 가격이 지정가를 통과하면 체결
//  - 같은 client_order_id 재전송은 거절 (실거래소와 동일)
class PaperBroker : public IBrokerGateway {
public:
    PaperBroker(std::shared_ptr<execution::RateLimitedConnector> connector,
                double initial_quote_balance = 100000.0,
                std::string quote_currency = "USDT");

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

    // 시세 주입. 대기 중인 지정가 주문 체결 판정도 여기서
    void setMarketPrice(const std::string& symbol, Price price);

    std::size_t openOrderCount() const;

private:
    void fillLocked(Order& order, Price price);
    static bool limitCrossed(const Order& order, Price price);

    std::string name_ = "paper";
    std::string quote_currency_;
    std::shared_ptr<execution::RateLimitedConnector> connector_;

    mutable std::mutex mutex_;
    std::map<std::string, Price> prices_;
    std::map<std::string, Order> orders_;                 // exchange_order_id -> order
    std::map<std::string, std::string> client_ids_;       // client_order_id -> exchange_order_id
    std::map<std::string, Balance> balances_;
    std::map<std::string, Position> positions_;
    long long next_order_id_ = 1;
};

} // namespace broker
} // namespace cryptogate
