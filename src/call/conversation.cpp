#include "voice_bridge/call/conversation.hpp"

#include <algorithm>

#include "voice_bridge/audio/transcoder.hpp"
#include "voice_bridge/call/directive.hpp"
#include "voice_bridge/logging.hpp"
#include "voice_bridge/metrics.hpp"
#include "voice_bridge/utils/text.hpp"

namespace voice_bridge::call {

double playback_wait_seconds(audio::WireCodec codec,
                             size_t emitted_bytes,
                             std::optional<double> elapsed_sec,
                             double buffer_sec) {
    if (emitted_bytes == 0) {
        return buffer_sec;
    }
    const double duration = audio::payload_duration_sec(codec, emitted_bytes);
    if (!elapsed_sec) {
        return duration + buffer_sec;
    }
    return std::max(duration - *elapsed_sec, 0.0) + buffer_sec;
}

std::optional<double> SpeechResult::elapsed_sec() const {
    if (!started_at) {
        return std::nullopt;
    }
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - *started_at).count();
}

ConversationEngine::ConversationEngine(const SessionSettings& settings,
                                       ConversationHistory& history,
                                       backend::ChatCompletions& llm,
                                       backend::TextToSpeech& tts,
                                       backend::CallControl& call_control)
    : settings_(settings),
      history_(history),
      llm_(llm),
      tts_(tts),
      call_control_(call_control) {}

std::vector<backend::ChatMessage> ConversationEngine::build_messages(
    const std::string& transcript) const {
    std::vector<backend::ChatMessage> messages;
    messages.push_back({"system", settings_.system_prompt});
    if (settings_.send_context) {
        const auto past = history_.messages();
        messages.insert(messages.end(), past.begin(), past.end());
    } else {
        messages.push_back({"user", transcript});
    }
    return messages;
}

TurnOutcome ConversationEngine::run_turn(const std::string& transcript,
                                         MediaOutput& output,
                                         const std::string& call_id,
                                         const utils::CancellationToken& token) {
    TurnOutcome outcome;
    Metrics::instance().increment("turns");
    history_.add_user(transcript);
    info("Turn started", {kv("call_id", call_id), kv("transcript", transcript)});

    std::string reply;
    try {
        reply = llm_.complete(build_messages(transcript), true, settings_.llm_timeout, token);
    } catch (const std::exception& ex) {
        if (token.is_canceled()) {
            debug("Turn canceled", {kv("call_id", call_id), kv("stage", "llm")});
            return outcome;
        }
        error("Turn failed", {kv("call_id", call_id), kv("stage", "llm"), kv("error", ex.what())});
        outcome.failed = true;
        return outcome;
    }
    if (token.is_canceled()) {
        return outcome;
    }

    const auto parsed = parse_reply(reply);
    outcome.spoken = utils::trim(utils::remove_emojis(parsed.spoken));
    outcome.hangup = parsed.hangup;
    if (parsed.hangup) {
        Metrics::instance().increment("hangup_directives");
        info("Hangup directive received",
             {kv("call_id", call_id), kv("reason", parsed.hangup_reason.value_or(""))});
    }

    SpeechResult speech;
    if (!outcome.spoken.empty()) {
        try {
            speech = speak(outcome.spoken, output, token);
        } catch (const std::exception& ex) {
            if (token.is_canceled()) {
                debug("Turn canceled", {kv("call_id", call_id), kv("stage", "tts")});
            } else {
                error("Turn failed",
                      {kv("call_id", call_id), kv("stage", "tts"), kv("error", ex.what())});
                outcome.failed = true;
            }
        }
        history_.add_assistant(outcome.spoken);
    }
    if (token.is_canceled()) {
        return outcome;
    }

    if (outcome.hangup) {
        end_call(speech, output, call_id, "Call ended", token);
        return outcome;
    }
    token.wait_for(settings_.echo_tail);
    return outcome;
}

SpeechResult ConversationEngine::speak(const std::string& text,
                                       MediaOutput& output,
                                       const utils::CancellationToken& token) {
    SpeechResult result;
    if (!output.send_silence(settings_.speech_pad, settings_.speech_pad_pacing, token)) {
        result.interrupted = true;
        return result;
    }

    audio::TranscoderOptions options;
    options.codec = settings_.codec;
    options.block_size = settings_.tts_block_size;
    options.resampler_quality = settings_.resampler_quality;

    bool stop = false;
    audio::OutboundTranscoder transcoder(options, [&](const std::string& encoded) {
        if (stop || token.is_canceled()) {
            stop = true;
            return;
        }
        if (!result.started_at) {
            result.started_at = std::chrono::steady_clock::now();
        }
        if (!output.send_frame(encoded)) {
            warn("Socket closed during speech");
            stop = true;
            return;
        }
        result.emitted_bytes += encoded.size();
        if (!token.wait_for(settings_.frame_pacing)) {
            stop = true;
        }
    });

    tts_.synthesize(text, settings_.voice_id, settings_.tts_timeout, token,
                    [&](const char* data, size_t size) {
                        transcoder.feed(data, size);
                        return !stop;
                    });
    if (!stop) {
        transcoder.finish();
    }
    result.interrupted = stop;
    debug("Speech emitted",
          {kv("bytes", result.emitted_bytes), kv("interrupted", result.interrupted)});
    return result;
}

bool ConversationEngine::end_call(const SpeechResult& speech,
                                  MediaOutput& output,
                                  const std::string& call_id,
                                  const std::string& close_reason,
                                  const utils::CancellationToken& token) {
    const double wait = playback_wait_seconds(settings_.codec, speech.emitted_bytes,
                                              speech.elapsed_sec(),
                                              settings_.hangup_buffer.count());
    debug("Waiting for playback before hangup", {kv("call_id", call_id), kv("wait_sec", wait)});
    if (!token.wait_for(std::chrono::duration<double>(wait))) {
        return false;
    }
    if (!call_id.empty()) {
        const auto result = call_control_.hangup(call_id);
        if (!result.ok) {
            warn("Provider hangup rejected", {kv("call_id", call_id), kv("error", result.error)});
        }
    }
    output.close(kCloseNormal, close_reason);
    return true;
}

}
