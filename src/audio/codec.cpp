#include "voice_bridge/audio/codec.hpp"

#include <websocketpp/base64/base64.hpp>

#include "voice_bridge/utils/text.hpp"

namespace voice_bridge::audio {

namespace {

constexpr int kUlawBias = 0x84;

constexpr int kUlawSegmentEnd[8] = {0xFF, 0x1FF, 0x3FF, 0x7FF,
                                    0xFFF, 0x1FFF, 0x3FFF, 0x7FFF};
constexpr int kAlawSegmentEnd[8] = {0x1F, 0x3F, 0x7F, 0xFF,
                                    0x1FF, 0x3FF, 0x7FF, 0xFFF};

int find_segment(int value, const int (&table)[8]) {
    for (int i = 0; i < 8; ++i) {
        if (value <= table[i]) {
            return i;
        }
    }
    return 8;
}

}

std::optional<WireCodec> parse_codec(const std::string& name) {
    const auto normalized = utils::to_upper(utils::trim(name));
    if (normalized == "PCMU") {
        return WireCodec::Pcmu;
    }
    if (normalized == "PCMA") {
        return WireCodec::Pcma;
    }
    if (normalized == "L16") {
        return WireCodec::L16;
    }
    return std::nullopt;
}

const char* codec_name(WireCodec codec) {
    switch (codec) {
        case WireCodec::Pcmu:
            return "PCMU";
        case WireCodec::Pcma:
            return "PCMA";
        case WireCodec::L16:
            return "L16";
    }
    return "PCMU";
}

int bytes_per_second(WireCodec codec) {
    return codec == WireCodec::L16 ? kWireSampleRate * 2 : kWireSampleRate;
}

size_t frame_bytes(WireCodec codec, std::chrono::milliseconds duration) {
    return static_cast<size_t>(bytes_per_second(codec)) *
           static_cast<size_t>(duration.count()) / 1000;
}

double payload_duration_sec(WireCodec codec, size_t bytes) {
    return static_cast<double>(bytes) / static_cast<double>(bytes_per_second(codec));
}

uint8_t linear_to_ulaw(int16_t sample) {
    int pcm_val = sample;
    int mask = 0xFF;
    if (pcm_val < 0) {
        pcm_val = kUlawBias - pcm_val;
        mask = 0x7F;
    } else {
        pcm_val += kUlawBias;
    }
    const int seg = find_segment(pcm_val, kUlawSegmentEnd);
    if (seg >= 8) {
        return static_cast<uint8_t>(0x7F ^ mask);
    }
    const int uval = (seg << 4) | ((pcm_val >> (seg + 3)) & 0x0F);
    return static_cast<uint8_t>(uval ^ mask);
}

int16_t ulaw_to_linear(uint8_t value) {
    const int u_val = ~value & 0xFF;
    int t = ((u_val & 0x0F) << 3) + kUlawBias;
    t <<= (u_val & 0x70) >> 4;
    return static_cast<int16_t>((u_val & 0x80) ? (kUlawBias - t) : (t - kUlawBias));
}

uint8_t linear_to_alaw(int16_t sample) {
    int pcm_val = sample >> 3;
    int mask = 0xD5;
    if (pcm_val < 0) {
        mask = 0x55;
        pcm_val = -pcm_val - 1;
    }
    const int seg = find_segment(pcm_val, kAlawSegmentEnd);
    if (seg >= 8) {
        return static_cast<uint8_t>(0x7F ^ mask);
    }
    int aval = seg << 4;
    if (seg < 2) {
        aval |= (pcm_val >> 1) & 0x0F;
    } else {
        aval |= (pcm_val >> seg) & 0x0F;
    }
    return static_cast<uint8_t>(aval ^ mask);
}

int16_t alaw_to_linear(uint8_t value) {
    const int a_val = value ^ 0x55;
    int t = (a_val & 0x0F) << 4;
    const int seg = (a_val & 0x70) >> 4;
    switch (seg) {
        case 0:
            t += 8;
            break;
        case 1:
            t += 0x108;
            break;
        default:
            t += 0x108;
            t <<= seg - 1;
    }
    return static_cast<int16_t>((a_val & 0x80) ? t : -t);
}

std::string encode(WireCodec codec, const std::vector<int16_t>& pcm) {
    if (codec == WireCodec::L16) {
        return pcm_to_bytes(pcm);
    }
    std::string encoded;
    encoded.reserve(pcm.size());
    for (auto sample : pcm) {
        encoded.push_back(static_cast<char>(
            codec == WireCodec::Pcmu ? linear_to_ulaw(sample) : linear_to_alaw(sample)));
    }
    return encoded;
}

std::vector<int16_t> decode(WireCodec codec, const std::string& payload) {
    if (codec == WireCodec::L16) {
        return pcm_from_bytes(payload.data(), payload.size());
    }
    std::vector<int16_t> pcm;
    pcm.reserve(payload.size());
    for (char byte : payload) {
        const auto value = static_cast<uint8_t>(byte);
        pcm.push_back(codec == WireCodec::Pcmu ? ulaw_to_linear(value) : alaw_to_linear(value));
    }
    return pcm;
}

std::string silence(WireCodec codec, std::chrono::milliseconds duration) {
    const auto size = frame_bytes(codec, duration);
    switch (codec) {
        case WireCodec::Pcmu:
            return std::string(size, static_cast<char>(0xFF));
        case WireCodec::Pcma:
            return std::string(size, static_cast<char>(0xD5));
        case WireCodec::L16:
            return std::string(size, '\0');
    }
    return std::string(size, '\0');
}

std::vector<int16_t> pcm_from_bytes(const char* data, size_t size) {
    std::vector<int16_t> pcm;
    pcm.reserve(size / 2);
    for (size_t i = 0; i + 1 < size; i += 2) {
        const auto low = static_cast<uint8_t>(data[i]);
        const auto high = static_cast<uint8_t>(data[i + 1]);
        pcm.push_back(static_cast<int16_t>(static_cast<uint16_t>(low | (high << 8))));
    }
    return pcm;
}

std::string pcm_to_bytes(const std::vector<int16_t>& pcm) {
    std::string bytes;
    bytes.reserve(pcm.size() * 2);
    for (auto sample : pcm) {
        const auto value = static_cast<uint16_t>(sample);
        bytes.push_back(static_cast<char>(value & 0xFF));
        bytes.push_back(static_cast<char>((value >> 8) & 0xFF));
    }
    return bytes;
}

std::string encode_base64(const std::string& data) {
    return websocketpp::base64_encode(data);
}

std::string decode_base64(const std::string& data) {
    return websocketpp::base64_decode(data);
}

}
