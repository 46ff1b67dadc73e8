#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "voice_bridge/audio/codec.hpp"
#include "voice_bridge/config.hpp"

namespace voice_bridge {
namespace call {

enum class CallDirection {
    Outbound,
    Inbound
};

const char* direction_name(CallDirection direction);

// Per-call data registered before the provider connects the media socket.
struct CallContext {
    std::string stream_id;
    // Empty for an outbound call until dialing has returned its id.
    std::string call_id;
    std::optional<std::string> record_id;
    std::optional<std::string> initial_prompt;
    std::optional<int> max_duration_sec;
    std::optional<std::string> limit_message;
    std::optional<std::string> user_id;
    std::optional<std::string> chat_id;
    CallDirection direction = CallDirection::Outbound;
    bool expects_greeting = false;
    int delay_ms = 0;
};

// Immutable settings for one media session, resolved once when the socket
// attaches.
struct SessionSettings {
    audio::WireCodec codec = audio::WireCodec::Pcmu;
    std::string system_prompt;
    bool send_context = true;
    std::string voice_id = "default";

    std::chrono::duration<double> stt_timeout{10};
    std::chrono::duration<double> tts_timeout{10};
    std::chrono::duration<double> llm_timeout{10};

    double vad_energy_threshold = 500.0;
    double vad_trailing_silence_sec = 1.2;
    double vad_min_utterance_sec = 0.5;
    double vad_max_utterance_sec = 15.0;

    size_t tts_block_size = 960;
    int resampler_quality = 3;

    std::chrono::duration<double> echo_tail{1.0};
    std::chrono::duration<double> greeting_echo_tail{2.0};
    std::chrono::duration<double> hangup_buffer{0.1};
    std::chrono::duration<double> speech_pad{0.1};
    std::chrono::milliseconds speech_pad_pacing{10};
    std::chrono::milliseconds frame_pacing{20};
    int priming_frames = 50;
    std::chrono::milliseconds priming_frame{20};
    std::chrono::duration<double> initial_silence{0.5};
    std::chrono::milliseconds preload_poll{100};

    std::chrono::duration<double> max_duration{600};
    std::string limit_message;
    std::chrono::milliseconds delay{0};
    double cost_per_minute = 0.005;

    bool expects_greeting = false;
};

extern const char* const kDefaultSystemPrompt;
extern const char* const kToolInstructions;

// Deployment prompt + optional call goal + optional context line + tool
// instructions.
std::string compose_system_prompt(const std::optional<std::string>& deployment_prompt,
                                  const std::optional<std::string>& goal,
                                  const std::optional<std::string>& user_id,
                                  const std::optional<std::string>& chat_id);

// Prompt used to pre-generate a greeting: no context line, no tools.
std::string compose_greeting_prompt(const std::optional<std::string>& deployment_prompt,
                                    const std::string& goal);

SessionSettings make_session_settings(const Config& config, const CallContext& context);

}
}
