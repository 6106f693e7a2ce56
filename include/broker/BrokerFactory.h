#pragma once

#include <memory>

#include "broker/IBrokerGateway.h"
#include "common/GatewayConfig.h"
#include "network/IHttpClient.h"

namespace cryptogate {
namespace broker {

// 설정 이름(binance / bybit / paper)으로 브로커 생성.
// 브로커마다 RateLimitedConnector 를 하나씩 만들어 주입한다
std::shared_ptr<IBrokerGateway> createBroker(const BrokerConfig& config,
                                             std::shared_ptr<network::IHttpClient> http);

} // namespace broker
} // namespace cryptogate
