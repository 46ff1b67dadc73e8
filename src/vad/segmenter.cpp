#include "voice_bridge/vad/segmenter.hpp"

#include <cmath>
#include <utility>

namespace voice_bridge::vad {

namespace {

size_t seconds_to_samples(double seconds, int sample_rate) {
    if (seconds <= 0.0) {
        return 0;
    }
    return static_cast<size_t>(std::llround(seconds * sample_rate));
}

}

const char* reason_name(BoundaryReason reason) {
    switch (reason) {
        case BoundaryReason::SilenceDetected:
            return "silence_detected";
        case BoundaryReason::MaxDuration:
            return "max_duration";
    }
    return "unknown";
}

TurnSegmenter::TurnSegmenter(SegmenterOptions options)
    : options_(options),
      trailing_silence_samples_(seconds_to_samples(options.trailing_silence_sec,
                                                   options.sample_rate)),
      min_utterance_samples_(seconds_to_samples(options.min_utterance_sec,
                                                options.sample_rate)),
      max_utterance_samples_(seconds_to_samples(options.max_utterance_sec,
                                                options.sample_rate)) {}

void TurnSegmenter::set_on_utterance(UtteranceCallback cb) {
    on_utterance_ = std::move(cb);
}

void TurnSegmenter::set_on_discard(DiscardCallback cb) {
    on_discard_ = std::move(cb);
}

double TurnSegmenter::rms(const std::vector<int16_t>& samples) {
    if (samples.empty()) {
        return 0.0;
    }
    double sum = 0.0;
    for (auto sample : samples) {
        const double value = sample;
        sum += value * value;
    }
    return std::sqrt(sum / static_cast<double>(samples.size()));
}

double TurnSegmenter::buffered_sec() const {
    return static_cast<double>(buffer_.size()) / options_.sample_rate;
}

void TurnSegmenter::process_samples(const std::vector<int16_t>& samples) {
    if (samples.empty()) {
        return;
    }
    buffer_.insert(buffer_.end(), samples.begin(), samples.end());
    if (rms(samples) < options_.energy_threshold) {
        silence_samples_ += samples.size();
    } else {
        silence_samples_ = 0;
        has_speech_ = true;
    }

    if (buffer_.size() > max_utterance_samples_) {
        fire(BoundaryReason::MaxDuration);
        return;
    }
    if (silence_samples_ > trailing_silence_samples_ &&
        buffer_.size() > min_utterance_samples_) {
        fire(BoundaryReason::SilenceDetected);
    }
}

void TurnSegmenter::reset() {
    buffer_.clear();
    silence_samples_ = 0;
    has_speech_ = false;
}

void TurnSegmenter::fire(BoundaryReason reason) {
    std::vector<int16_t> audio;
    audio.swap(buffer_);
    const bool had_speech = has_speech_;
    reset();
    const double duration = static_cast<double>(audio.size()) / options_.sample_rate;
    if (!had_speech) {
        if (on_discard_) {
            on_discard_(reason, duration);
        }
        return;
    }
    if (on_utterance_) {
        on_utterance_(audio, reason, duration);
    }
}

}
