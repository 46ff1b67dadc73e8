#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

#include "voice_bridge/call/context.hpp"

namespace voice_bridge {
namespace call {

class RegistryError : public std::runtime_error {
public:
    explicit RegistryError(const std::string& message) : std::runtime_error(message) {}
};

// Process-wide one-shot map from stream id to CallContext. An entry is
// consumed by the first resolve() and is never handed out again; entries
// nobody resolves expire after the TTL.
class StreamRegistry {
public:
    using Clock = std::chrono::steady_clock;

    explicit StreamRegistry(std::chrono::seconds ttl);

    // Throws RegistryError when the id is already registered.
    void register_stream(const CallContext& context, Clock::time_point now = Clock::now());
    std::optional<CallContext> resolve(const std::string& stream_id);
    // Fills in the provider call id and record id once dialing returned.
    bool bind_call(const std::string& stream_id,
                   const std::string& call_id,
                   const std::optional<std::string>& record_id);
    bool remove(const std::string& stream_id);
    size_t evict_expired(Clock::time_point now = Clock::now());
    size_t size() const;

    // 128 random bits, hex encoded.
    static std::string generate_stream_id();

private:
    struct Entry {
        CallContext context;
        Clock::time_point registered_at;
    };

    std::chrono::seconds ttl_;
    mutable std::mutex mutex_;
    std::map<std::string, Entry> entries_;
};

}
}
