#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

#include "voice_bridge/audio/codec.hpp"
#include "voice_bridge/utils/cancellation.hpp"

namespace voice_bridge {
namespace call {

class PreloadError : public std::runtime_error {
public:
    explicit PreloadError(const std::string& message) : std::runtime_error(message) {}
};

// Closable FIFO of encoded outbound frames produced before the media socket
// exists. close() appends the end marker; pushes after it are ignored.
class PreloadQueue {
public:
    enum class PopStatus {
        Frame,
        End,
        Canceled,
        Timeout
    };

    void push(audio::AudioFrame frame);
    void close();
    bool closed() const;
    size_t size() const;

    PopStatus pop(audio::AudioFrame& frame,
                  const utils::CancellationToken& token,
                  std::chrono::duration<double> max_wait);

    void set_greeting(std::string text);
    std::optional<std::string> greeting() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<audio::AudioFrame> frames_;
    bool closed_ = false;
    std::optional<std::string> greeting_;
};

// Process-wide map from provider call id to its preload queue. At most one
// queue exists per call id.
class PreloadBroker {
public:
    using Clock = std::chrono::steady_clock;

    explicit PreloadBroker(std::chrono::seconds ttl);

    // Both throw PreloadError when a queue already exists for call_id.
    std::shared_ptr<PreloadQueue> create(const std::string& call_id,
                                         Clock::time_point now = Clock::now());
    void attach(const std::string& call_id,
                std::shared_ptr<PreloadQueue> queue,
                Clock::time_point now = Clock::now());

    // Removes and returns the queue, nullptr when absent.
    std::shared_ptr<PreloadQueue> take(const std::string& call_id);

    // Polls take() until the queue appears, the ceiling passes or the token
    // is canceled.
    std::shared_ptr<PreloadQueue> wait_for(const std::string& call_id,
                                           std::chrono::duration<double> ceiling,
                                           std::chrono::milliseconds poll_interval,
                                           const utils::CancellationToken& token);

    bool discard(const std::string& call_id);
    size_t evict_expired(Clock::time_point now = Clock::now());
    size_t size() const;

private:
    struct Entry {
        std::shared_ptr<PreloadQueue> queue;
        Clock::time_point created_at;
    };

    std::chrono::seconds ttl_;
    mutable std::mutex mutex_;
    std::map<std::string, Entry> queues_;
};

}
}
