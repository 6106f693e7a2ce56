#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"

namespace cryptogate {
namespace market {

// 채널 fetch 결과. "데이터 없음"(EMPTY)과 "실패"(ERROR)를 구분한다
struct FetchResult {
    enum class Outcome { OK, EMPTY, ERROR };

    Outcome outcome = Outcome::EMPTY;
    std::vector<MarketData> records;
    std::string error;

    static FetchResult ok(std::vector<MarketData> records);   // 비어 있으면 EMPTY
    static FetchResult empty();
    static FetchResult failed(std::string message);

    bool isSuccess() const { return outcome != Outcome::ERROR; }

    // ERROR 면 DataUnavailableError
    const std::vector<MarketData>& recordsOrThrow(const std::string& channel) const;
};

// 상태 스냅샷 (오케스트레이터 헬스 로그용)
struct ChannelStatus {
    std::string name;
    bool is_connected = false;
    std::vector<std::string> subscribed_symbols;
    std::optional<Timestamp> last_data_received_at;
    long long total_messages_received = 0;
};

// 거래소 하나의 시세 채널
class IMarketDataChannel {
public:
    virtual ~IMarketDataChannel() = default;

    virtual const std::string& name() const = 0;

    // 이미 시작돼 있으면 no-op. 연결 테스트 실패 시 DataUnavailableError
    virtual void start() = 0;
    virtual void stop() = 0;
    virtual bool isConnected() const = 0;

    // 시작 전이면 NotConnectedError
    virtual void subscribe(const std::vector<std::string>& symbols) = 0;
    virtual void unsubscribe(const std::vector<std::string>& symbols) = 0;

    // symbols 가 비어 있으면 구독 심볼, 그것도 없으면 채널 기본 심볼.
    // 심볼별 최근 limit 개, 심볼마다 오래된 것부터. 실패해도 isConnected 는 그대로
    virtual FetchResult fetchData(const std::vector<std::string>& symbols,
                                  const std::string& interval,
                                  int limit) = 0;

    virtual ChannelStatus status() const = 0;
};

} // namespace market
} // namespace cryptogate
