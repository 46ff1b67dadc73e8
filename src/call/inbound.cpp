#include "voice_bridge/call/inbound.hpp"

#include <utility>

#include "voice_bridge/audio/transcoder.hpp"
#include "voice_bridge/logging.hpp"

namespace voice_bridge::call {

InboundPipeline::InboundPipeline(audio::WireCodec codec,
                                 vad::SegmenterOptions options,
                                 const TurnGate& gate)
    : codec_(codec), gate_(gate), segmenter_(options) {
    segmenter_.set_on_utterance(
        [this](const std::vector<int16_t>& audio, vad::BoundaryReason reason, double duration) {
            ready_ = Utterance{audio, reason, duration};
        });
    segmenter_.set_on_discard([this](vad::BoundaryReason reason, double duration) {
        ++discarded_segments_;
        debug("Discarded silent segment",
              {kv("reason", vad::reason_name(reason)), kv("duration", duration)});
    });
}

std::optional<Utterance> InboundPipeline::on_media(const std::string& base64_payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (gate_.is_speaking()) {
        ++dropped_frames_;
        return std::nullopt;
    }
    const auto pcm = audio::decode_inbound_payload(codec_, base64_payload);
    ++accepted_frames_;
    segmenter_.process_samples(pcm);
    std::optional<Utterance> result;
    result.swap(ready_);
    return result;
}

void InboundPipeline::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    segmenter_.reset();
    ready_.reset();
}

size_t InboundPipeline::dropped_frames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_frames_;
}

size_t InboundPipeline::accepted_frames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return accepted_frames_;
}

size_t InboundPipeline::discarded_segments() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return discarded_segments_;
}

}
