#include "execution/RateLimiter.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <algorithm>

namespace cryptogate {
namespace execution {

RateLimiter::RateLimiter(const std::string& venue, std::vector<RateLimitConfig> groups)
    : venue_(venue)
    , total_requests_(0)
    , rejected_requests_(0)
    , forced_waits_(0)
    , total_wait_time_(std::chrono::milliseconds(0))
    , is_blocked_(false)
{
    if (groups.empty()) {
        throw InvalidConfigurationError(venue + ": RateLimiter needs at least one group");
    }
    for (const auto& group : groups) {
        if (group.max_per_second <= 0) {
            throw InvalidConfigurationError(venue + ": " + group.group_name + " max_per_second must be positive");
        }
        configs_.emplace(group.group_name, group);
    }
    if (configs_.find("default") == configs_.end()) {
        configs_.emplace("default", RateLimitConfig("default", groups.front().max_per_second));
    }

    LOG_DEBUG("RateLimiter 초기화 - {} ({}개 그룹)", venue_, configs_.size());
}

bool RateLimiter::tryAcquire(const std::string& group) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (is_blocked_) {
        auto now = std::chrono::steady_clock::now();
        if (now < block_end_time_) {
            rejected_requests_++;
            return false;
        }
        is_blocked_ = false;
        LOG_INFO("{} API 차단 자동 해제 (tryAcquire)", venue_);
        cv_.notify_all();
    }

    auto& config = findConfig(group);
    resetWindowIfNeeded(config);

    if (config.current_count < config.max_per_second) {
        config.current_count++;
        total_requests_++;
        return true;
    }

    rejected_requests_++;
    return false;
}

void RateLimiter::acquire(const std::string& group) {
    std::unique_lock<std::mutex> lock(mutex_);

    auto& config = findConfig(group);

    while (true) {
        // 1. 차단 상태면 풀릴 때까지 대기
        if (is_blocked_) {
            if (std::chrono::steady_clock::now() >= block_end_time_) {
                is_blocked_ = false;
                cv_.notify_all();
            } else {
                forced_waits_++;
                auto wait_start = std::chrono::steady_clock::now();
                cv_.wait_until(lock, block_end_time_);
                total_wait_time_ += std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - wait_start
                );
                continue;
            }
        }

        // 2. 윈도우 리셋 및 토큰 체크
        resetWindowIfNeeded(config);

        if (config.current_count < config.max_per_second) {
            config.current_count++;
            total_requests_++;
            return;
        }

        // 3. 다음 윈도우 시작 지점까지 대기
        auto wake_time = config.window_start + std::chrono::seconds(1) + std::chrono::milliseconds(1);

        forced_waits_++;
        auto wait_start = std::chrono::steady_clock::now();

        cv_.wait_until(lock, wake_time);

        total_wait_time_ += std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - wait_start
        );
    }
}

int RateLimiter::getRemainingRequests(const std::string& group) {
    std::unique_lock<std::mutex> lock(mutex_);

    auto& config = findConfig(group);
    resetWindowIfNeeded(config);

    return std::max(0, config.max_per_second - config.current_count);
}

void RateLimiter::handleRateLimitError(int status_code) {
    std::unique_lock<std::mutex> lock(mutex_);

    std::chrono::steady_clock::duration cooldown{};
    if (status_code == 429) {
        LOG_WARN("{} 429 Too Many Requests (1초간 요청 중지)", venue_);
        cooldown = std::chrono::seconds(1);
    } else if (status_code == 418) {
        LOG_ERROR("{} 418 IP 차단 감지 (1분간 요청 중지)", venue_);
        cooldown = std::chrono::minutes(1);
    } else {
        return;
    }

    const auto until = std::chrono::steady_clock::now() + cooldown;
    if (!is_blocked_ || until > block_end_time_) {
        block_end_time_ = until;
    }
    is_blocked_ = true;
}

bool RateLimiter::isBlocked() const {
    std::unique_lock<std::mutex> lock(mutex_);
    return is_blocked_ && std::chrono::steady_clock::now() < block_end_time_;
}

RateLimiter::Stats RateLimiter::getStats() const {
    std::unique_lock<std::mutex> lock(mutex_);

    Stats stats;
    stats.total_requests = total_requests_;
    stats.rejected_requests = rejected_requests_;
    stats.forced_waits = forced_waits_;
    stats.total_wait_time = total_wait_time_;

    return stats;
}

RateLimitConfig& RateLimiter::findConfig(const std::string& group) {
    auto it = configs_.find(group);
    if (it == configs_.end()) it = configs_.find("default");
    return it->second;
}

void RateLimiter::resetWindowIfNeeded(RateLimitConfig& config) {
    auto now = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        now - config.window_start
    );

    if (elapsed.count() >= 1000) {
        config.current_count = 0;
        config.window_start = now;
        cv_.notify_all();
    }
}

} // namespace execution
} // namespace cryptogate
