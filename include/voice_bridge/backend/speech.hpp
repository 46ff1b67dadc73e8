#pragma once

#include <functional>
#include <memory>
#include <string>

#include "voice_bridge/backend/client.hpp"
#include "voice_bridge/utils/cancellation.hpp"

namespace voice_bridge {
namespace backend {

class SpeechToText {
public:
    virtual ~SpeechToText() = default;

    // Returns the transcript of a complete WAV file. Throws BackendError.
    virtual std::string transcribe(const std::string& wav, Seconds timeout) = 0;
};

class TextToSpeech {
public:
    // Returning false stops synthesis early.
    using ChunkHandler = std::function<bool(const char* data, size_t size)>;

    virtual ~TextToSpeech() = default;

    // Streams a header-prefixed 16-bit PCM rendition of text into on_chunk.
    // Throws BackendError, also when token is canceled mid-stream.
    virtual void synthesize(const std::string& text,
                            const std::string& voice,
                            Seconds timeout,
                            const utils::CancellationToken& token,
                            const ChunkHandler& on_chunk) = 0;
};

class HttpSpeechToText : public SpeechToText {
public:
    HttpSpeechToText(std::string base_url, BackendRequestOptions options);

    std::string transcribe(const std::string& wav, Seconds timeout) override;

private:
    BackendClient client_;
};

class HttpTextToSpeech : public TextToSpeech {
public:
    HttpTextToSpeech(std::string base_url, BackendRequestOptions options);

    void synthesize(const std::string& text,
                    const std::string& voice,
                    Seconds timeout,
                    const utils::CancellationToken& token,
                    const ChunkHandler& on_chunk) override;

private:
    BackendClient client_;
};

}
}
