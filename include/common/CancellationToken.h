#pragma once

#include <atomic>

namespace cryptogate {

// 대기 중인 작업을 호출자가 포기할 때 사용 (스레드 간 공유)
class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    bool isCancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace cryptogate
