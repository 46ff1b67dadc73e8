#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "voice_bridge/audio/codec.hpp"
#include "voice_bridge/audio/resampler.hpp"

namespace voice_bridge {
namespace audio {

struct TranscoderOptions {
    WireCodec codec = WireCodec::Pcmu;
    size_t block_size = 960;
    int resampler_quality = 3;
    int fallback_sample_rate = 24000;
};

// TTS -> wire. Consumes a header-prefixed 16-bit PCM stream in arbitrary
// chunks and hands fixed-size, encoded 8 kHz blocks to the sink in order.
class OutboundTranscoder {
public:
    using FrameSink = std::function<void(const std::string& encoded)>;

    OutboundTranscoder(TranscoderOptions options, FrameSink sink);

    void feed(const char* data, size_t size);
    void feed(const std::string& data) { feed(data.data(), data.size()); }
    // Flushes the remaining whole samples.
    void finish();

    std::optional<int> source_rate() const { return source_rate_; }
    size_t dropped_blocks() const { return dropped_blocks_; }
    size_t emitted_bytes() const { return emitted_bytes_; }

private:
    void consume_header();
    void drain_blocks();
    void process_block(const std::string& block);

    TranscoderOptions options_;
    FrameSink sink_;
    std::string header_;
    std::string pending_;
    bool header_done_ = false;
    bool finished_ = false;
    std::optional<int> source_rate_;
    std::unique_ptr<StreamingResampler> resampler_;
    size_t dropped_blocks_ = 0;
    size_t emitted_bytes_ = 0;
};

// Wire -> linear PCM for one inbound media payload (base64 text).
std::vector<int16_t> decode_inbound_payload(WireCodec codec, const std::string& base64_payload);

}
}
