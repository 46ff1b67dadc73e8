#include "voice_bridge/audio/transcoder.hpp"

#include <algorithm>
#include <stdexcept>

#include "voice_bridge/audio/wav.hpp"
#include "voice_bridge/logging.hpp"
#include "voice_bridge/metrics.hpp"

namespace voice_bridge::audio {

OutboundTranscoder::OutboundTranscoder(TranscoderOptions options, FrameSink sink)
    : options_(options),
      sink_(std::move(sink)) {
    if (options_.block_size == 0 || options_.block_size % 2 != 0) {
        throw std::invalid_argument("transcoder block size must be a positive even number");
    }
}

void OutboundTranscoder::feed(const char* data, size_t size) {
    if (finished_ || size == 0) {
        return;
    }
    if (!header_done_) {
        const size_t needed = kWavHeaderSize - header_.size();
        const size_t take = std::min(needed, size);
        header_.append(data, take);
        data += take;
        size -= take;
        if (header_.size() < kWavHeaderSize) {
            return;
        }
        consume_header();
    }
    pending_.append(data, size);
    drain_blocks();
}

void OutboundTranscoder::finish() {
    if (finished_) {
        return;
    }
    finished_ = true;
    if (!header_done_) {
        if (!header_.empty()) {
            logging::warn(
                "TTS stream ended inside the audio header",
                {kv("bytes", header_.size())});
        }
        return;
    }
    drain_blocks();
    if (pending_.size() % 2 != 0) {
        logging::debug(
            "Dropping trailing odd byte from TTS stream",
            {kv("bytes", pending_.size())});
        pending_.pop_back();
    }
    if (!pending_.empty()) {
        process_block(pending_);
        pending_.clear();
    }
}

void OutboundTranscoder::consume_header() {
    header_done_ = true;
    const auto format = parse_wav_header(header_);
    if (format) {
        source_rate_ = static_cast<int>(format->sample_rate);
    } else {
        // Not a header after all: keep the bytes as audio.
        logging::warn(
            "TTS stream header unreadable, assuming raw PCM",
            {kv("fallback_rate", options_.fallback_sample_rate)});
        source_rate_ = options_.fallback_sample_rate;
        pending_.append(header_);
    }
    if (*source_rate_ == kWireSampleRate) {
        return;
    }
    try {
        resampler_ = std::make_unique<StreamingResampler>(*source_rate_, kWireSampleRate,
                                                          options_.resampler_quality);
    } catch (const ResamplerError& ex) {
        logging::warn(
            "TTS sample rate rejected, using fallback rate",
            {kv("rate", *source_rate_),
             kv("error", ex.what())});
        source_rate_ = options_.fallback_sample_rate;
        resampler_ = std::make_unique<StreamingResampler>(*source_rate_, kWireSampleRate,
                                                          options_.resampler_quality);
    }
}

void OutboundTranscoder::drain_blocks() {
    size_t offset = 0;
    while (pending_.size() - offset >= options_.block_size) {
        process_block(pending_.substr(offset, options_.block_size));
        offset += options_.block_size;
    }
    if (offset > 0) {
        pending_.erase(0, offset);
    }
}

void OutboundTranscoder::process_block(const std::string& block) {
    try {
        auto pcm = pcm_from_bytes(block.data(), block.size());
        if (resampler_) {
            pcm = resampler_->process(pcm);
        }
        if (pcm.empty()) {
            return;
        }
        const auto encoded = encode(options_.codec, pcm);
        emitted_bytes_ += encoded.size();
        sink_(encoded);
    } catch (const std::exception& ex) {
        ++dropped_blocks_;
        Metrics::instance().increment("transcoder_dropped_blocks");
        logging::warn(
            "Dropping outbound audio block",
            {kv("bytes", block.size()),
             kv("error", ex.what())});
    }
}

std::vector<int16_t> decode_inbound_payload(WireCodec codec, const std::string& base64_payload) {
    return decode(codec, decode_base64(base64_payload));
}

}
