#include "execution/RateLimitedConnector.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>

namespace cryptogate {
namespace execution {

namespace {
// 취소 여부를 확인하는 최대 대기 단위
constexpr std::chrono::milliseconds kWaitSlice{20};
}

const char* toString(ConnectionState state) {
    switch (state) {
        case ConnectionState::DISCONNECTED: return "DISCONNECTED";
        case ConnectionState::CONNECTING: return "CONNECTING";
        case ConnectionState::CONNECTED: return "CONNECTED";
    }
    return "DISCONNECTED";
}

RateLimitedConnector::Permit::Permit(Permit&& other) noexcept
    : owner_(other.owner_) {
    other.owner_ = nullptr;
}

RateLimitedConnector::Permit& RateLimitedConnector::Permit::operator=(Permit&& other) noexcept {
    if (this != &other) {
        release();
        owner_ = other.owner_;
        other.owner_ = nullptr;
    }
    return *this;
}

RateLimitedConnector::Permit::~Permit() {
    release();
}

void RateLimitedConnector::Permit::release() {
    if (owner_) {
        owner_->releaseSlot();
        owner_ = nullptr;
    }
}

RateLimitedConnector::RateLimitedConnector(ConnectorSettings settings)
    : settings_(std::move(settings)) {
    if (settings_.max_concurrency <= 0) {
        throw InvalidConfigurationError(settings_.name + ": max_concurrency must be positive");
    }
    if (settings_.min_interval.count() < 0) {
        throw InvalidConfigurationError(settings_.name + ": min_interval must not be negative");
    }
    LOG_INFO("RateLimitedConnector 초기화 - {} (간격 {}ms, 동시 {}건)",
             settings_.name, settings_.min_interval.count(), settings_.max_concurrency);
}

bool RateLimitedConnector::beginConnect() {
    auto expected = ConnectionState::DISCONNECTED;
    return state_.compare_exchange_strong(expected, ConnectionState::CONNECTING);
}

void RateLimitedConnector::markConnected() {
    state_.store(ConnectionState::CONNECTED);
}

void RateLimitedConnector::markDisconnected() {
    state_.store(ConnectionState::DISCONNECTED);
}

void RateLimitedConnector::ensureConnected() const {
    if (state_.load() != ConnectionState::CONNECTED) {
        throw NotConnectedError(settings_.name);
    }
}

RateLimitedConnector::Permit RateLimitedConnector::throttle(const CancellationToken* cancel) {
    std::unique_lock<std::mutex> lock(mutex_);

    const auto wait_start = std::chrono::steady_clock::now();
    bool waited = false;

    while (true) {
        if (cancel && cancel->isCancelled()) {
            ++cancelled_waits_;
            throw OperationCancelledError(settings_.name + ": throttle wait cancelled");
        }

        const auto now = std::chrono::steady_clock::now();
        const bool slot_free = in_flight_ < settings_.max_concurrency;
        const auto next_allowed = has_dispatched_ ? last_dispatch_ + settings_.min_interval : now;

        if (slot_free && now >= next_allowed) {
            // 입장: 슬롯 점유 + 마지막 요청 시각 갱신을 같은 임계 구역에서
            ++in_flight_;
            ++total_admitted_;
            has_dispatched_ = true;
            last_dispatch_ = now;
            last_request_time_ = std::chrono::system_clock::now();
            if (waited) {
                total_wait_time_ += std::chrono::duration_cast<std::chrono::milliseconds>(now - wait_start);
            }
            return Permit(this);
        }

        if (!waited) {
            ++total_waits_;
            waited = true;
        }

        // 간격 대기는 다음 허용 시각까지, 슬롯 대기는 release 알림까지 (둘 다 slice 단위로 끊음)
        auto deadline = now + kWaitSlice;
        if (slot_free) {
            deadline = std::min(deadline, next_allowed);
        }
        cv_.wait_until(lock, deadline);
    }
}

void RateLimitedConnector::releaseSlot() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_flight_ > 0) {
            --in_flight_;
        }
    }
    cv_.notify_all();
}

std::optional<Timestamp> RateLimitedConnector::lastRequestTime() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_request_time_;
}

RateLimitedConnector::Stats RateLimitedConnector::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    Stats stats;
    stats.total_admitted = total_admitted_;
    stats.total_waits = total_waits_;
    stats.cancelled_waits = cancelled_waits_;
    stats.in_flight = in_flight_;
    stats.total_wait_time = total_wait_time_;
    return stats;
}

} // namespace execution
} // namespace cryptogate
