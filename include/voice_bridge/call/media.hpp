#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>

#include "voice_bridge/audio/codec.hpp"
#include "voice_bridge/utils/cancellation.hpp"

namespace voice_bridge {
namespace call {

constexpr int kCloseNormal = 1000;
constexpr int kClosePolicyViolation = 1008;

// One provider media connection carrying JSON text frames.
class MediaSocket {
public:
    virtual ~MediaSocket() = default;

    // Blocks until the next text frame arrives. nullopt once the socket is
    // closed and drained.
    virtual std::optional<std::string> receive() = 0;
    // Returns false when the frame could not be sent.
    virtual bool send_text(const std::string& text) = 0;
    // Idempotent.
    virtual void close(int code, const std::string& reason) = 0;
    virtual bool is_open() const = 0;
};

// Outbound side of a session: wraps encoded audio in media events tagged
// with the media-session id. Shared by the sender, the turns and the monitor.
class MediaOutput {
public:
    MediaOutput(MediaSocket& socket, audio::WireCodec codec);

    void set_stream_id(const std::string& stream_id);
    std::string stream_id() const;
    audio::WireCodec codec() const { return codec_; }

    bool send_frame(const std::string& encoded);
    // Sends duration worth of silence in frames of spacing length, one frame
    // per spacing. Returns false when canceled or the socket failed.
    bool send_silence(std::chrono::duration<double> duration,
                      std::chrono::milliseconds spacing,
                      const utils::CancellationToken& token);
    void close(int code, const std::string& reason);
    bool is_open() const;

    size_t frames_sent() const;

private:
    MediaSocket& socket_;
    audio::WireCodec codec_;
    mutable std::mutex mutex_;
    std::string stream_id_;
    size_t frames_sent_ = 0;
};

}
}
