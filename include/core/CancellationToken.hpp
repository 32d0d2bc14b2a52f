#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace llmgate::core {

// Shared between a request's worker and whoever observes the client going away.
class CancellationToken {
   public:
    using Ptr = std::shared_ptr<CancellationToken>;

    static Ptr create() { return std::make_shared<CancellationToken>(); }

    void cancel();
    [[nodiscard]] bool cancelled() const { return cancelled_.load(); }

    // Sleeps for `delay` unless cancelled first. Returns false when cancelled.
    bool waitFor(std::chrono::milliseconds delay);

   private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};

}  // namespace llmgate::core
