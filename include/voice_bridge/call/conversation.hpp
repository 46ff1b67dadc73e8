#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "voice_bridge/backend/call_control.hpp"
#include "voice_bridge/backend/llm.hpp"
#include "voice_bridge/backend/speech.hpp"
#include "voice_bridge/call/context.hpp"
#include "voice_bridge/call/history.hpp"
#include "voice_bridge/call/media.hpp"
#include "voice_bridge/utils/cancellation.hpp"

namespace voice_bridge {
namespace call {

// Seconds to wait after the last emitted frame so the far end hears all of
// it: buffer when nothing was emitted, otherwise the unplayed remainder of
// bytes at the codec byte rate plus buffer. Without an elapsed time the
// whole duration is assumed unplayed.
double playback_wait_seconds(audio::WireCodec codec,
                             size_t emitted_bytes,
                             std::optional<double> elapsed_sec,
                             double buffer_sec);

struct SpeechResult {
    size_t emitted_bytes = 0;
    std::optional<std::chrono::steady_clock::time_point> started_at;
    bool interrupted = false;

    std::optional<double> elapsed_sec() const;
};

struct TurnOutcome {
    std::string spoken;
    bool hangup = false;
    bool failed = false;
};

// Runs one user-utterance-to-reply cycle. The caller holds the speaking gate
// for the whole call of run_turn().
class ConversationEngine {
public:
    ConversationEngine(const SessionSettings& settings,
                       ConversationHistory& history,
                       backend::ChatCompletions& llm,
                       backend::TextToSpeech& tts,
                       backend::CallControl& call_control);

    TurnOutcome run_turn(const std::string& transcript,
                         MediaOutput& output,
                         const std::string& call_id,
                         const utils::CancellationToken& token);

    // Pads with silence, then streams synthesized text as paced frames.
    SpeechResult speak(const std::string& text,
                       MediaOutput& output,
                       const utils::CancellationToken& token);

    // Waits out playback, hangs up through call control and closes the
    // socket. Returns false when canceled before the hangup was issued.
    bool end_call(const SpeechResult& speech,
                  MediaOutput& output,
                  const std::string& call_id,
                  const std::string& close_reason,
                  const utils::CancellationToken& token);

    std::vector<backend::ChatMessage> build_messages(const std::string& transcript) const;

private:
    const SessionSettings& settings_;
    ConversationHistory& history_;
    backend::ChatCompletions& llm_;
    backend::TextToSpeech& tts_;
    backend::CallControl& call_control_;
};

}
}
