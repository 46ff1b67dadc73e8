#include "voice_bridge/call/media.hpp"

#include <algorithm>
#include <cmath>

#include <nlohmann/json.hpp>

#include "voice_bridge/logging.hpp"

namespace voice_bridge::call {

MediaOutput::MediaOutput(MediaSocket& socket, audio::WireCodec codec)
    : socket_(socket), codec_(codec) {}

void MediaOutput::set_stream_id(const std::string& stream_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    stream_id_ = stream_id;
}

std::string MediaOutput::stream_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stream_id_;
}

bool MediaOutput::send_frame(const std::string& encoded) {
    nlohmann::json message = {
        {"event", "media"},
        {"stream_id", stream_id()},
        {"media", {{"payload", audio::encode_base64(encoded)}}},
    };
    if (!socket_.send_text(message.dump())) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    ++frames_sent_;
    return true;
}

bool MediaOutput::send_silence(std::chrono::duration<double> duration,
                               std::chrono::milliseconds spacing,
                               const utils::CancellationToken& token) {
    if (duration.count() <= 0.0 || spacing.count() <= 0) {
        return true;
    }
    const auto frames = std::max<long long>(
        1, std::llround(duration.count() * 1000.0 / static_cast<double>(spacing.count())));
    const auto frame = audio::silence(codec_, spacing);
    for (long long i = 0; i < frames; ++i) {
        if (token.is_canceled()) {
            return false;
        }
        if (!send_frame(frame)) {
            return false;
        }
        if (!token.wait_for(spacing)) {
            return false;
        }
    }
    return true;
}

void MediaOutput::close(int code, const std::string& reason) {
    socket_.close(code, reason);
}

bool MediaOutput::is_open() const {
    return socket_.is_open();
}

size_t MediaOutput::frames_sent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_sent_;
}

}
