#pragma once

#include <string>
#include <map>
#include <vector>
#include <chrono>
#include <mutex>
#include <condition_variable>

namespace cryptogate {
namespace execution {

// Rate Limit 그룹별 설정
struct RateLimitConfig {
    std::string group_name;
    int max_per_second;           // 초당 최대 요청 수
    int current_count;            // 현재 초의 요청 수
    std::chrono::steady_clock::time_point window_start;

    RateLimitConfig(const std::string& name, int max_req)
        : group_name(name)
        , max_per_second(max_req)
        , current_count(0)
        , window_start(std::chrono::steady_clock::now())
    {}
};

// 거래소 공개 한도 준수용 (시세 채널). 주문용 RateLimitedConnector 와는 별개
class RateLimiter {
public:
    // groups 에 "default" 가 없으면 첫 그룹 한도로 추가됨
    RateLimiter(const std::string& venue, std::vector<RateLimitConfig> groups);

    // 요청 전 호출 - 가능하면 true, 대기 필요하면 false (Non-blocking)
    bool tryAcquire(const std::string& group);

    // 요청 전 호출 - 필요시 자동으로 대기 (Blocking)
    void acquire(const std::string& group);

    int getRemainingRequests(const std::string& group);

    // 429 -> 1초, 418 -> 1분 쿨다운. 여기서 잠들지 않고 acquire 쪽에서 대기
    void handleRateLimitError(int status_code);

    bool isBlocked() const;

    struct Stats {
        int total_requests;
        int rejected_requests;
        int forced_waits;
        std::chrono::milliseconds total_wait_time;
    };
    Stats getStats() const;

private:
    std::string venue_;
    std::map<std::string, RateLimitConfig> configs_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;

    int total_requests_;
    int rejected_requests_;
    int forced_waits_;
    std::chrono::milliseconds total_wait_time_;

    bool is_blocked_;
    std::chrono::steady_clock::time_point block_end_time_;

    RateLimitConfig& findConfig(const std::string& group);
    void resetWindowIfNeeded(RateLimitConfig& config);
};

} // namespace execution
} // namespace cryptogate
