#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "common/CancellationToken.h"
#include "common/Types.h"

namespace cryptogate {
namespace execution {

enum class ConnectionState { DISCONNECTED, CONNECTING, CONNECTED };

const char* toString(ConnectionState state);

struct ConnectorSettings {
    std::string name;
    std::chrono::milliseconds min_interval{50};   // 연속 요청 사이 최소 간격
    int max_concurrency = 20;                     // 동시 in-flight 요청 상한

    ConnectorSettings() = default;
    ConnectorSettings(std::string n, std::chrono::milliseconds interval, int concurrency)
        : name(std::move(n)), min_interval(interval), max_concurrency(concurrency) {}
};

// 브로커 하나당 하나. 연결 상태 + 요청 간격/동시성 제한
//
// throttle() 은 요청을 버리지 않고 지연만 시킨다. 반환된 Permit 이 살아 있는 동안
// 동시성 슬롯 하나를 점유하고, 소멸 시 반납된다. 취소된 대기자는 슬롯을 잡지 않은
// 상태로 OperationCancelledError 를 던진다.
class RateLimitedConnector {
public:
    class Permit {
    public:
        Permit(Permit&& other) noexcept;
        Permit& operator=(Permit&& other) noexcept;
        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;
        ~Permit();

    private:
        friend class RateLimitedConnector;
        explicit Permit(RateLimitedConnector* owner) : owner_(owner) {}
        void release();

        RateLimitedConnector* owner_;
    };

    struct Stats {
        long long total_admitted = 0;
        long long total_waits = 0;
        long long cancelled_waits = 0;
        int in_flight = 0;
        std::chrono::milliseconds total_wait_time{0};
    };

    explicit RateLimitedConnector(ConnectorSettings settings);

    // Disconnected -> Connecting. 이미 연결 중/연결됨이면 false
    bool beginConnect();
    void markConnected();
    void markDisconnected();

    ConnectionState state() const { return state_.load(); }
    bool isConnected() const { return state_.load() == ConnectionState::CONNECTED; }

    // 연결 안 됐으면 NotConnectedError
    void ensureConnected() const;

    Permit throttle(const CancellationToken* cancel = nullptr);

    std::optional<Timestamp> lastRequestTime() const;
    Stats getStats() const;
    const ConnectorSettings& settings() const { return settings_; }

private:
    void releaseSlot();

    ConnectorSettings settings_;
    std::atomic<ConnectionState> state_{ConnectionState::DISCONNECTED};

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    int in_flight_ = 0;
    bool has_dispatched_ = false;
    std::chrono::steady_clock::time_point last_dispatch_;
    std::optional<Timestamp> last_request_time_;

    long long total_admitted_ = 0;
    long long total_waits_ = 0;
    long long cancelled_waits_ = 0;
    std::chrono::milliseconds total_wait_time_{0};
};

} // namespace execution
} // namespace cryptogate
