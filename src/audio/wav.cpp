#include "voice_bridge/audio/wav.hpp"

namespace voice_bridge::audio {

namespace {

uint32_t read_u32(const std::string& data, size_t offset) {
    return static_cast<uint32_t>(static_cast<uint8_t>(data[offset])) |
           (static_cast<uint32_t>(static_cast<uint8_t>(data[offset + 1])) << 8) |
           (static_cast<uint32_t>(static_cast<uint8_t>(data[offset + 2])) << 16) |
           (static_cast<uint32_t>(static_cast<uint8_t>(data[offset + 3])) << 24);
}

uint16_t read_u16(const std::string& data, size_t offset) {
    return static_cast<uint16_t>(static_cast<uint8_t>(data[offset]) |
                                 (static_cast<uint8_t>(data[offset + 1]) << 8));
}

}

std::string encode_wav(const std::vector<int16_t>& pcm, const WavFormat& format) {
    const uint16_t block_align =
        static_cast<uint16_t>(format.channels * (format.bits_per_sample / 8));
    const uint32_t byte_rate = format.sample_rate * block_align;
    const uint32_t data_size = static_cast<uint32_t>(pcm.size() * sizeof(int16_t));
    const uint32_t chunk_size = 36 + data_size;

    std::string result;
    result.reserve(kWavHeaderSize + data_size);
    auto append = [&result](const void* data, size_t size) {
        result.append(static_cast<const char*>(data), size);
    };
    auto append_u16 = [&append](uint16_t value) {
        const uint8_t bytes[2] = {
            static_cast<uint8_t>(value & 0xFF),
            static_cast<uint8_t>((value >> 8) & 0xFF)
        };
        append(bytes, sizeof(bytes));
    };
    auto append_u32 = [&append](uint32_t value) {
        const uint8_t bytes[4] = {
            static_cast<uint8_t>(value & 0xFF),
            static_cast<uint8_t>((value >> 8) & 0xFF),
            static_cast<uint8_t>((value >> 16) & 0xFF),
            static_cast<uint8_t>((value >> 24) & 0xFF)
        };
        append(bytes, sizeof(bytes));
    };

    append("RIFF", 4);
    append_u32(chunk_size);
    append("WAVE", 4);
    append("fmt ", 4);
    append_u32(16);
    append_u16(1);
    append_u16(format.channels);
    append_u32(format.sample_rate);
    append_u32(byte_rate);
    append_u16(block_align);
    append_u16(format.bits_per_sample);
    append("data", 4);
    append_u32(data_size);
    for (auto sample : pcm) {
        append_u16(static_cast<uint16_t>(sample));
    }
    return result;
}

std::optional<WavFormat> parse_wav_header(const std::string& header) {
    if (header.size() < kWavHeaderSize) {
        return std::nullopt;
    }
    if (header.compare(0, 4, "RIFF") != 0 || header.compare(8, 4, "WAVE") != 0) {
        return std::nullopt;
    }
    WavFormat format;
    format.channels = read_u16(header, 22);
    format.sample_rate = read_u32(header, 24);
    format.bits_per_sample = read_u16(header, 34);
    if (format.sample_rate == 0) {
        return std::nullopt;
    }
    return format;
}

}
