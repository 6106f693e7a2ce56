#pragma once

#include <string>
#include <vector>

#include "common/Types.h"

namespace cryptogate {
namespace broker {

struct Balance {
    std::string currency;
    double free = 0.0;
    double locked = 0.0;

    double total() const { return free + locked; }
};

// 거래소별 브로커 공통 인터페이스
//
// connect() 외의 모든 연산은 연결 확인(NotConnectedError) -> RateLimitedConnector::throttle()
// 순서로 통과한 뒤 전송된다. 전송 실패/5xx/429 는 BrokerUnavailableError 로 올라가고
// 재시도하지 않는다. 거래소가 주문을 거절(4xx)하면 예외 대신 REJECTED 주문을 돌려준다.
class IBrokerGateway {
public:
    virtual ~IBrokerGateway() = default;

    virtual const std::string& name() const = 0;

    // Disconnected -> Connecting -> Connected. 이미 연결돼 있으면 아무것도 안 함
    virtual void connect() = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // order.client_order_id 필수 (OrderIdempotencyService 를 거친 주문).
    // 반환값: exchange_order_id / 초기 상태 / 체결량이 반영된 주문
    virtual Order placeOrder(const Order& order) = 0;

    // 취소된 주문 (거래소가 알려준 최종 상태 반영)
    virtual Order cancelOrder(const std::string& exchange_order_id, const std::string& symbol) = 0;

    virtual Order getOrderStatus(const std::string& exchange_order_id, const std::string& symbol) = 0;

    virtual Balance getBalance(const std::string& currency = "USDT") = 0;

    // 현물 거래소는 빈 목록
    virtual std::vector<Position> getPositions() = 0;

    virtual Price getMarketPrice(const std::string& symbol) = 0;
};

} // namespace broker
} // namespace cryptogate
