#include <catch2/catch_test_macros.hpp>

#include "voice_bridge/audio/codec.hpp"
#include "voice_bridge/audio/transcoder.hpp"
#include "voice_bridge/audio/wav.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

using namespace voice_bridge::audio;

namespace {

constexpr double kPi = 3.14159265358979323846;

std::string collect(TranscoderOptions options,
                    const std::string& stream,
                    size_t chunk,
                    std::vector<size_t>* frame_sizes = nullptr) {
    std::string output;
    OutboundTranscoder transcoder(options, [&](const std::string& encoded) {
        output += encoded;
        if (frame_sizes) {
            frame_sizes->push_back(encoded.size());
        }
    });
    for (size_t offset = 0; offset < stream.size(); offset += chunk) {
        transcoder.feed(stream.substr(offset, chunk));
    }
    transcoder.finish();
    return output;
}

}

TEST_CASE("8 kHz stream is re-encoded without resampling") {
    const std::vector<int16_t> pcm(1000, 2000);
    const auto stream = encode_wav(pcm);

    TranscoderOptions options;
    options.codec = WireCodec::Pcmu;
    options.block_size = 320;
    std::vector<size_t> sizes;
    const auto output = collect(options, stream, 7, &sizes);

    REQUIRE(output == encode(WireCodec::Pcmu, pcm));
    // 2000 bytes of PCM: six full 160-sample blocks and a 40-sample tail.
    REQUIRE(sizes.size() == 7);
    REQUIRE(sizes.front() == 160);
    REQUIRE(sizes.back() == 40);
}

TEST_CASE("header is read even when split across chunks") {
    WavFormat format;
    format.sample_rate = 24000;
    const auto stream = encode_wav(std::vector<int16_t>(4800, 1000), format);

    TranscoderOptions options;
    options.codec = WireCodec::L16;
    std::string output;
    OutboundTranscoder transcoder(options, [&](const std::string& encoded) { output += encoded; });
    transcoder.feed(stream.substr(0, 10));
    REQUIRE_FALSE(transcoder.source_rate().has_value());
    transcoder.feed(stream.substr(10));
    transcoder.finish();

    REQUIRE(transcoder.source_rate() == 24000);
    // 0.2 s of audio comes out near 1600 wire samples.
    const auto samples = output.size() / 2;
    REQUIRE(samples > 1500);
    REQUIRE(samples <= 1600);
}

TEST_CASE("24 kHz stream is resampled to the wire rate regardless of chunking") {
    WavFormat format;
    format.sample_rate = 24000;
    std::vector<int16_t> tone(24000);
    for (size_t i = 0; i < tone.size(); ++i) {
        tone[i] = static_cast<int16_t>(8000.0 * std::sin(2.0 * kPi * 440.0 * i / 24000.0));
    }
    const auto stream = encode_wav(tone, format);

    TranscoderOptions options;
    options.codec = WireCodec::Pcmu;
    std::vector<size_t> sizes;
    const auto whole = collect(options, stream, stream.size(), &sizes);
    const auto chunked = collect(options, stream, 333);

    // One second of audio: close to 8000 wire samples, one byte each.
    REQUIRE(whole.size() > 7800);
    REQUIRE(whole.size() <= 8000);
    REQUIRE(chunked == whole);
    // 960-byte blocks are 480 source samples, 160 samples at 8 kHz.
    REQUIRE(sizes.size() > 40);
    REQUIRE(sizes[10] == 160);
}

TEST_CASE("a block that cannot be delivered is dropped and the stream continues") {
    const auto stream = encode_wav(std::vector<int16_t>(800, 1500));

    TranscoderOptions options;
    options.codec = WireCodec::Pcma;
    options.block_size = 320;
    size_t calls = 0;
    std::string output;
    OutboundTranscoder transcoder(options, [&](const std::string& encoded) {
        if (++calls == 2) {
            throw std::runtime_error("socket write failed");
        }
        output += encoded;
    });
    transcoder.feed(stream);
    transcoder.finish();

    // Five 160-sample blocks, the second one lost.
    REQUIRE(calls == 5);
    REQUIRE(transcoder.dropped_blocks() == 1);
    REQUIRE(output.size() == 4 * 160);
    REQUIRE(output == encode(WireCodec::Pcma, std::vector<int16_t>(640, 1500)));
}

TEST_CASE("a trailing odd byte is dropped at finish") {
    auto stream = encode_wav(std::vector<int16_t>(10, 500));
    stream.push_back('\x01');

    TranscoderOptions options;
    options.codec = WireCodec::L16;
    const auto output = collect(options, stream, 1000);
    REQUIRE(output.size() == 20);
}

TEST_CASE("stream without a readable header falls back to the default rate") {
    const std::string raw(4800, '\0');
    TranscoderOptions options;
    options.codec = WireCodec::Pcma;
    options.fallback_sample_rate = 16000;
    std::string output;
    OutboundTranscoder transcoder(options, [&](const std::string& encoded) { output += encoded; });
    transcoder.feed(raw);
    transcoder.finish();
    REQUIRE(transcoder.source_rate() == 16000);
    REQUIRE_FALSE(output.empty());
}

TEST_CASE("odd block sizes are rejected") {
    TranscoderOptions options;
    options.block_size = 961;
    REQUIRE_THROWS_AS(OutboundTranscoder(options, [](const std::string&) {}),
                      std::invalid_argument);
}

TEST_CASE("inbound payload decodes from base64 to linear samples") {
    const std::vector<int16_t> pcm = {0, 1000, -1000};
    const auto payload = encode_base64(encode(WireCodec::L16, pcm));
    REQUIRE(decode_inbound_payload(WireCodec::L16, payload) == pcm);
}
