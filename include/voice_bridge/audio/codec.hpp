#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace voice_bridge {
namespace audio {

// Telephony leg encodings, always at 8 kHz mono.
enum class WireCodec {
    Pcmu,
    Pcma,
    L16
};

constexpr int kWireSampleRate = 8000;

enum class Direction {
    Inbound,
    Outbound
};

struct AudioFrame {
    std::string payload;
    WireCodec codec = WireCodec::Pcmu;
    uint64_t timestamp = 0;
    Direction direction = Direction::Outbound;
};

std::optional<WireCodec> parse_codec(const std::string& name);
const char* codec_name(WireCodec codec);

// Encoded bytes per second of audio on the wire.
int bytes_per_second(WireCodec codec);
size_t frame_bytes(WireCodec codec, std::chrono::milliseconds duration);
double payload_duration_sec(WireCodec codec, size_t bytes);

uint8_t linear_to_ulaw(int16_t sample);
int16_t ulaw_to_linear(uint8_t value);
uint8_t linear_to_alaw(int16_t sample);
int16_t alaw_to_linear(uint8_t value);

std::string encode(WireCodec codec, const std::vector<int16_t>& pcm);
std::vector<int16_t> decode(WireCodec codec, const std::string& payload);

// One frame of codec-correct silence.
std::string silence(WireCodec codec, std::chrono::milliseconds duration);

// Little-endian 16-bit PCM <-> samples. A trailing odd byte is ignored.
std::vector<int16_t> pcm_from_bytes(const char* data, size_t size);
std::string pcm_to_bytes(const std::vector<int16_t>& pcm);

std::string encode_base64(const std::string& data);
std::string decode_base64(const std::string& data);

}
}
