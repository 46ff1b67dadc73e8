#include "voice_bridge/call/greeting.hpp"

#include <utility>
#include <vector>

#include "voice_bridge/call/context.hpp"
#include "voice_bridge/logging.hpp"
#include "voice_bridge/utils/text.hpp"

namespace voice_bridge::call {

namespace {

class CloseOnExit {
public:
    explicit CloseOnExit(PreloadQueue& queue) : queue_(queue) {}
    ~CloseOnExit() { queue_.close(); }

    CloseOnExit(const CloseOnExit&) = delete;
    CloseOnExit& operator=(const CloseOnExit&) = delete;

private:
    PreloadQueue& queue_;
};

}

GreetingGenerator::GreetingGenerator(backend::ChatCompletions& llm,
                                     backend::TextToSpeech& tts,
                                     GreetingOptions options)
    : llm_(llm), tts_(tts), options_(std::move(options)) {}

std::string GreetingGenerator::generate(const std::string& goal,
                                        PreloadQueue& queue,
                                        const utils::CancellationToken& token) {
    CloseOnExit closer(queue);

    const std::vector<backend::ChatMessage> messages = {
        {"system", compose_greeting_prompt(options_.deployment_prompt, goal)},
        {"user", "Introduce yourself."},
    };

    std::string greeting;
    try {
        greeting = utils::trim(utils::remove_emojis(
            llm_.complete(messages, false, options_.llm_timeout, token)));
    } catch (const std::exception& ex) {
        error("Greeting generation failed", {kv("stage", "llm"), kv("error", ex.what())});
        return "";
    }
    if (greeting.empty()) {
        warn("Greeting generation returned no text");
        return "";
    }
    // Recorded before any audio so the text reaches the transcript even when
    // synthesis fails.
    queue.set_greeting(greeting);

    uint64_t timestamp = 0;
    size_t frames = 0;
    audio::OutboundTranscoder transcoder(options_.transcoder, [&](const std::string& encoded) {
        audio::AudioFrame frame;
        frame.payload = encoded;
        frame.codec = options_.transcoder.codec;
        frame.timestamp = timestamp++;
        frame.direction = audio::Direction::Outbound;
        queue.push(std::move(frame));
        ++frames;
    });
    try {
        tts_.synthesize(greeting, options_.voice_id, options_.tts_timeout, token,
                        [&](const char* data, size_t size) {
                            transcoder.feed(data, size);
                            return true;
                        });
        transcoder.finish();
    } catch (const std::exception& ex) {
        error("Greeting generation failed", {kv("stage", "tts"), kv("error", ex.what())});
    }
    if (frames == 0) {
        warn("Greeting produced no audio", {kv("chars", greeting.size())});
        return greeting;
    }
    info("Greeting generated", {kv("chars", greeting.size()), kv("frames", frames)});
    return greeting;
}

}
