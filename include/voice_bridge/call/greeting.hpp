#pragma once

#include <optional>
#include <string>

#include "voice_bridge/audio/transcoder.hpp"
#include "voice_bridge/backend/llm.hpp"
#include "voice_bridge/backend/speech.hpp"
#include "voice_bridge/call/preload.hpp"
#include "voice_bridge/utils/cancellation.hpp"

namespace voice_bridge {
namespace call {

struct GreetingOptions {
    std::optional<std::string> deployment_prompt;
    std::string voice_id = "default";
    audio::TranscoderOptions transcoder;
    Seconds llm_timeout{10};
    Seconds tts_timeout{10};
};

// Pre-generates the opening line of a call into a PreloadQueue.
class GreetingGenerator {
public:
    GreetingGenerator(backend::ChatCompletions& llm,
                      backend::TextToSpeech& tts,
                      GreetingOptions options);

    // Returns the greeting text, empty when no text was generated. The text
    // is set on the queue even when synthesis yields no audio. The queue is
    // closed on every path.
    std::string generate(const std::string& goal,
                         PreloadQueue& queue,
                         const utils::CancellationToken& token);

private:
    backend::ChatCompletions& llm_;
    backend::TextToSpeech& tts_;
    GreetingOptions options_;
};

}
}
