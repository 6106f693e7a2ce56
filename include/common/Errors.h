#pragma once

#include <stdexcept>
#include <string>
#include <utility>

#include "common/Types.h"

namespace cryptogate {

// 게이트웨이 공통 예외 계층
class GatewayError : public std::runtime_error {
public:
    explicit GatewayError(const std::string& message) : std::runtime_error(message) {}
};

// connect() 전에 요청한 경우 - 자동 재시도 없음
class NotConnectedError : public GatewayError {
public:
    explicit NotConnectedError(const std::string& component)
        : GatewayError(component + " is not connected. Call connect() first") {}
};

// 거래소/전송 계층 장애 - 재시도는 호출자 판단
class BrokerUnavailableError : public GatewayError {
public:
    BrokerUnavailableError(const std::string& broker, const std::string& reason)
        : GatewayError(broker + " unavailable: " + reason), broker_(broker) {}

    const std::string& broker() const { return broker_; }

private:
    std::string broker_;
};

class DataUnavailableError : public GatewayError {
public:
    DataUnavailableError(const std::string& channel, const std::string& reason)
        : GatewayError(channel + " data unavailable: " + reason), channel_(channel) {}

    const std::string& channel() const { return channel_; }

private:
    std::string channel_;
};

// 같은 client_order_id 로 이미 주문이 존재함 (실패가 아니라 "이미 처리됨")
class DuplicateOrderError : public GatewayError {
public:
    explicit DuplicateOrderError(Order existing)
        : GatewayError("Order already exists for client_order_id " + existing.client_order_id)
        , existing_(std::move(existing)) {}

    const Order& existingOrder() const { return existing_; }

private:
    Order existing_;
};

class InvalidConfigurationError : public GatewayError {
public:
    explicit InvalidConfigurationError(const std::string& message) : GatewayError(message) {}
};

class OperationCancelledError : public GatewayError {
public:
    explicit OperationCancelledError(const std::string& message) : GatewayError(message) {}
};

} // namespace cryptogate
