#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "voice_bridge/audio/codec.hpp"
#include "voice_bridge/call/turn_gate.hpp"
#include "voice_bridge/vad/segmenter.hpp"

namespace voice_bridge {
namespace call {

struct Utterance {
    std::vector<int16_t> pcm;
    vad::BoundaryReason reason = vad::BoundaryReason::SilenceDetected;
    double duration_sec = 0.0;
};

// Wire -> segmenter path of one session. Frames arriving while the gate is
// Speaking are dropped before decoding.
class InboundPipeline {
public:
    InboundPipeline(audio::WireCodec codec, vad::SegmenterOptions options, const TurnGate& gate);

    // Returns the finished utterance when this frame closed a turn.
    std::optional<Utterance> on_media(const std::string& base64_payload);
    void reset();

    size_t dropped_frames() const;
    size_t accepted_frames() const;
    size_t discarded_segments() const;

private:
    audio::WireCodec codec_;
    const TurnGate& gate_;
    mutable std::mutex mutex_;
    vad::TurnSegmenter segmenter_;
    std::optional<Utterance> ready_;
    size_t dropped_frames_ = 0;
    size_t accepted_frames_ = 0;
    size_t discarded_segments_ = 0;
};

}
}
