#pragma once

#include <cstdint>
#include <functional>
#include <vector>

namespace voice_bridge {
namespace vad {

enum class BoundaryReason {
    SilenceDetected,
    MaxDuration
};

const char* reason_name(BoundaryReason reason);

struct SegmenterOptions {
    int sample_rate = 8000;
    double energy_threshold = 500.0;
    double trailing_silence_sec = 1.2;
    double min_utterance_sec = 0.5;
    double max_utterance_sec = 15.0;
};

// Energy based turn detection over 16-bit PCM chunks.
//
// Every chunk is appended to the turn buffer. A chunk whose RMS is below the
// threshold extends the trailing silence, any louder chunk resets it and
// marks the turn as containing speech. A boundary fires when the buffer
// exceeds max_utterance_sec, or when trailing silence exceeds
// trailing_silence_sec with more than min_utterance_sec buffered. Buffers
// without speech are discarded instead of dispatched. State is cleared
// before either callback runs.
class TurnSegmenter {
public:
    using UtteranceCallback = std::function<void(const std::vector<int16_t>& audio,
                                                 BoundaryReason reason,
                                                 double duration_sec)>;
    using DiscardCallback = std::function<void(BoundaryReason reason, double duration_sec)>;

    explicit TurnSegmenter(SegmenterOptions options);

    void set_on_utterance(UtteranceCallback cb);
    void set_on_discard(DiscardCallback cb);

    void process_samples(const std::vector<int16_t>& samples);
    void reset();

    size_t buffered_samples() const { return buffer_.size(); }
    double buffered_sec() const;
    bool has_speech() const { return has_speech_; }

    static double rms(const std::vector<int16_t>& samples);

private:
    void fire(BoundaryReason reason);

    SegmenterOptions options_;
    size_t trailing_silence_samples_;
    size_t min_utterance_samples_;
    size_t max_utterance_samples_;

    std::vector<int16_t> buffer_;
    size_t silence_samples_ = 0;
    bool has_speech_ = false;

    UtteranceCallback on_utterance_;
    DiscardCallback on_discard_;
};

}
}
