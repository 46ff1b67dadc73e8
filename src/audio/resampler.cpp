#include "voice_bridge/audio/resampler.hpp"

#include <algorithm>

namespace voice_bridge::audio {

void StreamingResampler::StateDeleter::operator()(SpeexResamplerState* state) const {
    if (state) {
        speex_resampler_destroy(state);
    }
}

StreamingResampler::StreamingResampler(int input_rate, int output_rate, int quality)
    : input_rate_(input_rate),
      output_rate_(output_rate) {
    if (input_rate <= 0 || output_rate <= 0) {
        throw ResamplerError("sample rates must be positive");
    }
    int err = 0;
    state_.reset(speex_resampler_init(1,
                                      static_cast<spx_uint32_t>(input_rate),
                                      static_cast<spx_uint32_t>(output_rate),
                                      std::clamp(quality, 0, 10),
                                      &err));
    if (!state_ || err != RESAMPLER_ERR_SUCCESS) {
        throw ResamplerError(std::string("speex resampler init failed: ") +
                             speex_resampler_strerror(err));
    }
}

std::vector<int16_t> StreamingResampler::process(const std::vector<int16_t>& input) {
    std::vector<int16_t> output;
    if (input.empty()) {
        return output;
    }
    const size_t capacity =
        input.size() * static_cast<size_t>(output_rate_) / static_cast<size_t>(input_rate_) + 64;
    std::vector<spx_int16_t> scratch(capacity);

    size_t consumed = 0;
    while (consumed < input.size()) {
        auto in_len = static_cast<spx_uint32_t>(input.size() - consumed);
        auto out_len = static_cast<spx_uint32_t>(scratch.size());
        const int err = speex_resampler_process_int(state_.get(), 0,
                                                    input.data() + consumed, &in_len,
                                                    scratch.data(), &out_len);
        if (err != RESAMPLER_ERR_SUCCESS) {
            throw ResamplerError(std::string("speex resampler failed: ") +
                                 speex_resampler_strerror(err));
        }
        if (in_len == 0 && out_len == 0) {
            break;
        }
        consumed += in_len;
        output.insert(output.end(), scratch.begin(), scratch.begin() + out_len);
    }
    return output;
}

void StreamingResampler::reset() {
    speex_resampler_reset_mem(state_.get());
}

}
