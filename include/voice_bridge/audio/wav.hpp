#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace voice_bridge {
namespace audio {

constexpr size_t kWavHeaderSize = 44;

struct WavFormat {
    uint32_t sample_rate = 8000;
    uint16_t channels = 1;
    uint16_t bits_per_sample = 16;
};

// Canonical 44-byte RIFF/WAVE header followed by the PCM data.
std::string encode_wav(const std::vector<int16_t>& pcm, const WavFormat& format = {});

// Reads the format from a canonical 44-byte header. Returns nullopt when the
// bytes do not look like one.
std::optional<WavFormat> parse_wav_header(const std::string& header);

}
}
