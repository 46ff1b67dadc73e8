#include "voice_bridge/utils/cancellation.hpp"

namespace voice_bridge::utils {

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        canceled_ = true;
    }
    cv_.notify_all();
}

bool CancellationToken::is_canceled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return canceled_;
}

bool CancellationToken::wait_for(std::chrono::duration<double> duration) const {
    std::unique_lock<std::mutex> lock(mutex_);
    if (duration.count() <= 0.0) {
        return !canceled_;
    }
    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::duration_cast<std::chrono::steady_clock::duration>(duration);
    return !cv_.wait_until(lock, deadline, [this]() { return canceled_; });
}

}
