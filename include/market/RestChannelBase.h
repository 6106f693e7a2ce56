#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "execution/RateLimiter.h"
#include "market/IMarketDataChannel.h"
#include "network/IHttpClient.h"

namespace cryptogate {
namespace market {

// 2xx 가 아닌 응답
class HttpStatusError : public std::runtime_error {
public:
    HttpStatusError(int status_code, const std::string& message)
        : std::runtime_error(message), status_code_(status_code) {}

    int statusCode() const { return status_code_; }

    // 거래소 도달 실패로 보는 응답 (레이트 리밋 / 서버 오류)
    bool isTransportLevel() const {
        return status_code_ == 429 || status_code_ == 418 || status_code_ >= 500;
    }

private:
    int status_code_;
};

// 거래소가 200 으로 돌려준 오류 (OKX code != "0", Kraken error[])
class VenueError : public std::runtime_error {
public:
    explicit VenueError(const std::string& message) : std::runtime_error(message) {}
};

// REST 시세 채널 공통 부분: 연결 상태, 구독 목록, 심볼 루프, 캔들 검증, 레이트 리밋
// 거래소별 클래스는 연결 테스트 / 기본 심볼 / 심볼 1개 요청+파싱만 구현한다
class RestChannelBase : public IMarketDataChannel {
public:
    ~RestChannelBase() override = default;

    const std::string& name() const override { return name_; }

    void start() override;
    void stop() override;
    bool isConnected() const override { return is_connected_.load(); }

    void subscribe(const std::vector<std::string>& symbols) override;
    void unsubscribe(const std::vector<std::string>& symbols) override;

    FetchResult fetchData(const std::vector<std::string>& symbols,
                          const std::string& interval,
                          int limit) override;

    ChannelStatus status() const override;

    // low <= open, close <= high, volume >= 0
    static bool isValidCandle(const MarketData& candle);

    // "1m" / "4h" / "1H" / "1d" / "1w" -> 초. 모르는 값은 60
    static int intervalSeconds(const std::string& interval);

    const execution::RateLimiter& rateLimiter() const { return rate_limiter_; }

protected:
    RestChannelBase(std::string name,
                    std::string base_url,
                    std::shared_ptr<network::IHttpClient> http,
                    int max_requests_per_second,
                    std::vector<std::string> configured_symbols);

    virtual bool testConnection() = 0;
    virtual std::vector<std::string> builtInSymbols() const = 0;

    // 심볼 하나 요청 + 파싱 (검증 전). 전송 실패는 TransportError / HttpStatusError
    virtual std::vector<MarketData> fetchSymbol(const std::string& symbol,
                                                const std::string& interval,
                                                int limit) = 0;

    // 레이트 리밋 통과 후 GET. 2xx 가 아니면 HttpStatusError (429/418 은 쿨다운도 건다)
    network::HttpResponse get(const std::string& path, const network::QueryParams& query = {});

    const std::string& baseUrl() const { return base_url_; }

private:
    std::vector<std::string> resolveSymbols(const std::vector<std::string>& requested) const;

    std::string name_;
    std::string base_url_;
    std::shared_ptr<network::IHttpClient> http_;
    execution::RateLimiter rate_limiter_;
    std::vector<std::string> configured_symbols_;

    std::atomic<bool> is_connected_{false};
    mutable std::mutex state_mutex_;
    std::vector<std::string> subscribed_symbols_;
    std::optional<Timestamp> last_data_received_at_;
    long long total_messages_received_ = 0;
};

} // namespace market
} // namespace cryptogate
