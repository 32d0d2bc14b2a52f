#include "core/CancellationToken.hpp"

namespace llmgate::core {

void CancellationToken::cancel() {
    {
        std::lock_guard lock(mutex_);
        cancelled_.store(true);
    }
    cv_.notify_all();
}

bool CancellationToken::waitFor(std::chrono::milliseconds delay) {
    if (delay.count() <= 0) {
        return !cancelled();
    }
    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, delay, [this]() { return cancelled_.load(); });
    return !cancelled_.load();
}

}  // namespace llmgate::core
