#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace voice_bridge::utils {

// Cooperative cancellation flag shared between a task and its owner.
// Every timed pause inside a task goes through wait_for so that cancel()
// interrupts it.
class CancellationToken {
public:
    void cancel();
    bool is_canceled() const;

    // Returns true when the full duration elapsed, false when canceled.
    bool wait_for(std::chrono::duration<double> duration) const;

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool canceled_ = false;
};

}
