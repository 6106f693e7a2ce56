#pragma once

#include <memory>
#include <string>

#include "broker/IBrokerGateway.h"
#include "common/Types.h"
#include "core/contracts/IOrderRepository.h"

namespace cryptogate {
namespace execution {

// client_order_id 발급 + 주문 1회 생성 보장
//
// id 형식: {prefix}_{13자리 unix ms}_{32자리 소문자 hex (128bit 난수)}
// 유일성은 저장소의 조건부 insert(유니크 인덱스)가 보장한다. 같은 id 로 동시에
// 여러 번 생성해도 커밋되는 주문은 하나이고, 나머지는 DuplicateOrderError 로 기존 주문을 받는다.
class OrderIdempotencyService {
public:
    explicit OrderIdempotencyService(std::shared_ptr<core::IOrderRepository> repository,
                                     std::string prefix = "AT");

    std::string generateClientOrderId() const;

    // 새 주문(PENDING) 저장. 같은 client_order_id 가 이미 있으면 DuplicateOrderError
    Order createOrder(const OrderRequest& request);

    // createOrder 와 같지만 충돌을 예외 대신 결과로 돌려준다
    core::OrderInsertResult createOrGet(const OrderRequest& request);

    // client_order_id 가 비어 있으면 채운 사본, 아니면 그대로
    Order ensureClientOrderId(const Order& order) const;

    // 생성(또는 기존 주문 조회) -> 미전송이면 브로커로 전송 -> 응답 저장
    Order submit(const OrderRequest& request, broker::IBrokerGateway& gateway);

    const std::string& prefix() const { return prefix_; }

private:
    Order buildOrder(const OrderRequest& request) const;

    std::shared_ptr<core::IOrderRepository> repository_;
    std::string prefix_;
};

} // namespace execution
} // namespace cryptogate
