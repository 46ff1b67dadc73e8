#include "voice_bridge/call/stream_registry.hpp"

#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

#include "voice_bridge/logging.hpp"

namespace voice_bridge::call {

StreamRegistry::StreamRegistry(std::chrono::seconds ttl) : ttl_(ttl) {}

void StreamRegistry::register_stream(const CallContext& context, Clock::time_point now) {
    if (context.stream_id.empty()) {
        throw RegistryError("Stream id must not be empty");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    const auto inserted = entries_.emplace(context.stream_id, Entry{context, now});
    if (!inserted.second) {
        throw RegistryError("Stream id already registered: " + context.stream_id);
    }
    debug("Stream registered",
          {kv("stream_id", context.stream_id), kv("direction", direction_name(context.direction))});
}

std::optional<CallContext> StreamRegistry::resolve(const std::string& stream_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(stream_id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    auto context = std::move(it->second.context);
    entries_.erase(it);
    return context;
}

bool StreamRegistry::bind_call(const std::string& stream_id,
                               const std::string& call_id,
                               const std::optional<std::string>& record_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(stream_id);
    if (it == entries_.end()) {
        return false;
    }
    it->second.context.call_id = call_id;
    if (record_id) {
        it->second.context.record_id = record_id;
    }
    return true;
}

bool StreamRegistry::remove(const std::string& stream_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.erase(stream_id) > 0;
}

size_t StreamRegistry::evict_expired(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t evicted = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (now - it->second.registered_at >= ttl_) {
            info("Stream registration expired", {kv("stream_id", it->first)});
            it = entries_.erase(it);
            ++evicted;
        } else {
            ++it;
        }
    }
    return evicted;
}

size_t StreamRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::string StreamRegistry::generate_stream_id() {
    std::random_device device;
    std::ostringstream out;
    out << std::hex << std::setfill('0');
    for (int i = 0; i < 4; ++i) {
        out << std::setw(8) << static_cast<uint32_t>(device());
    }
    return out.str();
}

}
