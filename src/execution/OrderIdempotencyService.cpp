#include "execution/OrderIdempotencyService.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "network/RequestSigner.h"

#include <chrono>
#include <stdexcept>

namespace cryptogate {
namespace execution {

namespace {
constexpr std::size_t kRandomBytes = 16;   // 32 hex

bool isBlank(const std::string& value) {
    return value.find_first_not_of(" \t\r\n") == std::string::npos;
}
}

OrderIdempotencyService::OrderIdempotencyService(std::shared_ptr<core::IOrderRepository> repository,
                                                 std::string prefix)
    : repository_(std::move(repository))
    , prefix_(std::move(prefix)) {
    if (!repository_) {
        throw InvalidConfigurationError("OrderIdempotencyService requires an order repository");
    }
    if (prefix_.empty() || prefix_.find('_') != std::string::npos) {
        throw InvalidConfigurationError("client order prefix must be non-empty and contain no '_'");
    }
}

std::string OrderIdempotencyService::generateClientOrderId() const {
    return prefix_ + "_" + std::to_string(network::RequestSigner::nowMillis()) + "_" +
           network::RequestSigner::randomHex(kRandomBytes);
}

Order OrderIdempotencyService::createOrder(const OrderRequest& request) {
    auto result = createOrGet(request);
    if (!result.inserted) {
        throw DuplicateOrderError(std::move(result.order));
    }
    return result.order;
}

core::OrderInsertResult OrderIdempotencyService::createOrGet(const OrderRequest& request) {
    Order order = buildOrder(request);
    auto result = repository_->insertIfAbsent(order);
    if (result.inserted) {
        LOG_INFO("[Idempotency] 주문 생성 {} {} {} {}", order.client_order_id, order.symbol,
                 toString(order.side), order.quantity);
    } else {
        LOG_WARN("[Idempotency] 이미 존재하는 client_order_id {} (order_id {}, {})",
                 result.order.client_order_id, result.order.order_id, toString(result.order.status));
    }
    return result;
}

Order OrderIdempotencyService::ensureClientOrderId(const Order& order) const {
    if (!isBlank(order.client_order_id)) {
        return order;
    }
    Order copy = order;
    copy.client_order_id = generateClientOrderId();
    return copy;
}

Order OrderIdempotencyService::submit(const OrderRequest& request, broker::IBrokerGateway& gateway) {
    auto result = createOrGet(request);
    const Order& order = result.order;

    if (!result.inserted && (!order.exchange_order_id.empty() || order.status != OrderStatus::PENDING)) {
        // 이미 거래소에 전달된 주문: 다시 보내지 않는다
        LOG_INFO("[Idempotency] {} 이미 전송됨 ({}) - 재전송 안 함", order.client_order_id,
                 toString(order.status));
        return order;
    }

    // 새 주문이거나, 이전 시도가 전송 전에 실패해서 PENDING 으로 남은 주문
    Order ack = gateway.placeOrder(order);
    ack.order_id = order.order_id;
    ack.client_order_id = order.client_order_id;
    ack.created_at = order.created_at;

    if (!result.inserted && ack.status == OrderStatus::REJECTED) {
        // 동시에 같은 PENDING 주문을 보낸 경우 거래소가 중복 id 로 거절한다. 기존 행은 건드리지 않음
        LOG_WARN("[Idempotency] {} 재전송 거절 - 저장된 주문 유지", order.client_order_id);
        auto stored = repository_->getByClientOrderId(order.client_order_id);
        return stored ? *stored : order;
    }

    if (!repository_->update(ack)) {
        LOG_ERROR("[Idempotency] {} 응답 저장 실패 (주문 없음)", ack.client_order_id);
    }
    return ack;
}

Order OrderIdempotencyService::buildOrder(const OrderRequest& request) const {
    if (request.symbol.empty()) {
        throw std::invalid_argument("order request requires symbol");
    }
    if (!(request.quantity > 0.0)) {
        throw std::invalid_argument("order quantity must be positive");
    }
    if (request.type != OrderType::MARKET && request.type != OrderType::STOP_LOSS && !request.price) {
        throw std::invalid_argument(std::string(toString(request.type)) + " order requires price");
    }

    const auto now = std::chrono::system_clock::now();

    Order order;
    order.order_id = network::RequestSigner::randomHex(kRandomBytes);
    order.client_order_id = (request.client_order_id && !isBlank(*request.client_order_id))
                                ? *request.client_order_id
                                : generateClientOrderId();
    order.symbol = request.symbol;
    order.exchange = request.exchange;
    order.side = request.side;
    order.type = request.type;
    order.status = OrderStatus::PENDING;
    order.quantity = request.quantity;
    order.filled_quantity = 0.0;
    order.price = request.price;
    order.stop_price = request.stop_price;
    order.strategy_id = request.strategy_id;
    order.created_at = now;
    order.updated_at = now;
    return order;
}

} // namespace execution
} // namespace cryptogate
