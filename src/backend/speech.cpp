#include "voice_bridge/backend/speech.hpp"

#include <chrono>
#include <utility>

#include "voice_bridge/logging.hpp"
#include "voice_bridge/metrics.hpp"
#include "voice_bridge/utils/text.hpp"

namespace voice_bridge::backend {

namespace {

double elapsed_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

}

HttpSpeechToText::HttpSpeechToText(std::string base_url, BackendRequestOptions options)
    : client_(std::move(base_url), std::nullopt, options) {}

std::string HttpSpeechToText::transcribe(const std::string& wav, Seconds timeout) {
    const auto start = std::chrono::steady_clock::now();
    auto response = client_.post_multipart_file("/transcribe", "file", "audio.wav",
                                                "audio/wav", wav, timeout);
    Metrics::instance().observe_backend_latency("stt", elapsed_since(start));
    if (!response.is_object() || !response.contains("text") || !response["text"].is_string()) {
        debug("STT response without text", {kv("response", response.dump())});
        return "";
    }
    return utils::trim(response["text"].get<std::string>());
}

HttpTextToSpeech::HttpTextToSpeech(std::string base_url, BackendRequestOptions options)
    : client_(std::move(base_url), std::nullopt, options) {}

void HttpTextToSpeech::synthesize(const std::string& text,
                                  const std::string& voice,
                                  Seconds timeout,
                                  const utils::CancellationToken& token,
                                  const ChunkHandler& on_chunk) {
    const nlohmann::json body = {
        {"input", text},
        {"voice", voice},
        {"response_format", "wav"},
    };
    const auto start = std::chrono::steady_clock::now();
    bool first_chunk = true;
    client_.post_stream(
        "/v1/audio/speech/stream",
        body,
        [&](const char* data, size_t size) {
            if (token.is_canceled()) {
                return false;
            }
            if (first_chunk) {
                first_chunk = false;
                Metrics::instance().observe_backend_latency("tts", elapsed_since(start));
            }
            return on_chunk(data, size);
        },
        timeout,
        &token);
}

}
