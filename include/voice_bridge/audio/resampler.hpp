#pragma once

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <speex/speex_resampler.h>

namespace voice_bridge {
namespace audio {

class ResamplerError : public std::runtime_error {
public:
    explicit ResamplerError(const std::string& message) : std::runtime_error(message) {}
};

// Mono 16-bit streaming resampler. Filter state is kept between process()
// calls so consecutive blocks form one continuous signal.
class StreamingResampler {
public:
    StreamingResampler(int input_rate, int output_rate, int quality);

    std::vector<int16_t> process(const std::vector<int16_t>& input);
    void reset();

    int input_rate() const { return input_rate_; }
    int output_rate() const { return output_rate_; }

private:
    struct StateDeleter {
        void operator()(SpeexResamplerState* state) const;
    };

    int input_rate_;
    int output_rate_;
    std::unique_ptr<SpeexResamplerState, StateDeleter> state_;
};

}
}
