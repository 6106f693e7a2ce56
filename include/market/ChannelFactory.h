#pragma once

#include <memory>

#include "common/GatewayConfig.h"
#include "market/IMarketDataChannel.h"
#include "network/IHttpClient.h"

namespace cryptogate {
namespace market {

// 설정 이름(binance / okx / coinbase / kraken)으로 채널 생성
std::shared_ptr<IMarketDataChannel> createChannel(const ChannelConfig& config,
                                                  std::shared_ptr<network::IHttpClient> http);

} // namespace market
} // namespace cryptogate
