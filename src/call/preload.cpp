#include "voice_bridge/call/preload.hpp"

#include <algorithm>
#include <utility>
#include <vector>

#include "voice_bridge/logging.hpp"

namespace voice_bridge::call {

namespace {

constexpr std::chrono::milliseconds kCancelCheckSlice{20};

}

void PreloadQueue::push(audio::AudioFrame frame) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        frames_.push_back(std::move(frame));
    }
    cv_.notify_all();
}

void PreloadQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool PreloadQueue::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t PreloadQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_.size();
}

PreloadQueue::PopStatus PreloadQueue::pop(audio::AudioFrame& frame,
                                          const utils::CancellationToken& token,
                                          std::chrono::duration<double> max_wait) {
    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::duration_cast<std::chrono::steady_clock::duration>(max_wait);
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        if (token.is_canceled()) {
            return PopStatus::Canceled;
        }
        if (!frames_.empty()) {
            frame = std::move(frames_.front());
            frames_.pop_front();
            return PopStatus::Frame;
        }
        if (closed_) {
            return PopStatus::End;
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return PopStatus::Timeout;
        }
        const auto slice = std::min<std::chrono::steady_clock::duration>(deadline - now,
                                                                        kCancelCheckSlice);
        cv_.wait_for(lock, slice);
    }
}

void PreloadQueue::set_greeting(std::string text) {
    std::lock_guard<std::mutex> lock(mutex_);
    greeting_ = std::move(text);
}

std::optional<std::string> PreloadQueue::greeting() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return greeting_;
}

PreloadBroker::PreloadBroker(std::chrono::seconds ttl) : ttl_(ttl) {}

std::shared_ptr<PreloadQueue> PreloadBroker::create(const std::string& call_id,
                                                    Clock::time_point now) {
    auto queue = std::make_shared<PreloadQueue>();
    attach(call_id, queue, now);
    return queue;
}

void PreloadBroker::attach(const std::string& call_id,
                           std::shared_ptr<PreloadQueue> queue,
                           Clock::time_point now) {
    if (!queue) {
        throw PreloadError("Preload queue must not be null");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    const auto inserted = queues_.emplace(call_id, Entry{std::move(queue), now});
    if (!inserted.second) {
        throw PreloadError("Preload queue already exists for call " + call_id);
    }
    debug("Preload queue attached", {kv("call_id", call_id)});
}

std::shared_ptr<PreloadQueue> PreloadBroker::take(const std::string& call_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = queues_.find(call_id);
    if (it == queues_.end()) {
        return nullptr;
    }
    auto queue = std::move(it->second.queue);
    queues_.erase(it);
    return queue;
}

std::shared_ptr<PreloadQueue> PreloadBroker::wait_for(const std::string& call_id,
                                                      std::chrono::duration<double> ceiling,
                                                      std::chrono::milliseconds poll_interval,
                                                      const utils::CancellationToken& token) {
    const auto deadline = Clock::now() +
                          std::chrono::duration_cast<Clock::duration>(ceiling);
    while (!token.is_canceled()) {
        if (auto queue = take(call_id)) {
            return queue;
        }
        const auto now = Clock::now();
        if (now >= deadline) {
            break;
        }
        const auto remaining = std::chrono::duration<double>(deadline - now);
        if (!token.wait_for(std::min<std::chrono::duration<double>>(remaining, poll_interval))) {
            break;
        }
    }
    return nullptr;
}

bool PreloadBroker::discard(const std::string& call_id) {
    std::shared_ptr<PreloadQueue> queue;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = queues_.find(call_id);
        if (it == queues_.end()) {
            return false;
        }
        queue = std::move(it->second.queue);
        queues_.erase(it);
    }
    queue->close();
    return true;
}

size_t PreloadBroker::evict_expired(Clock::time_point now) {
    std::vector<std::shared_ptr<PreloadQueue>> expired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = queues_.begin(); it != queues_.end();) {
            if (now - it->second.created_at >= ttl_) {
                info("Preload queue expired", {kv("call_id", it->first)});
                expired.push_back(std::move(it->second.queue));
                it = queues_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& queue : expired) {
        queue->close();
    }
    return expired.size();
}

size_t PreloadBroker::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queues_.size();
}

}
