#include "voice_bridge/call/context.hpp"

#include <stdexcept>

#include "voice_bridge/utils/text.hpp"

namespace voice_bridge::call {

const char* const kDefaultSystemPrompt = "You are a helpful AI assistant.";

const char* const kToolInstructions = R"(
You can control the call by outputting a JSON block at the very end of your response.
Available Tools:
- hangup: Ends the call. Use this when the user says goodbye or wants to stop.

If you decide to hangup, you MUST generate a polite sign-off message (e.g., "Goodbye!", "Have a nice day!") before the JSON block in the "[Your spoken response here]" section.

Format:
[Your spoken response here]
```json
{
  "action": "hangup",
  "reason": "user said goodbye"
}
```
IMPORTANT: Do NOT output any text after the JSON block. Do NOT read the JSON block aloud.
)";

namespace {

bool has_text(const std::optional<std::string>& value) {
    return value && !utils::trim(*value).empty();
}

}

const char* direction_name(CallDirection direction) {
    return direction == CallDirection::Inbound ? "inbound" : "outbound";
}

std::string compose_greeting_prompt(const std::optional<std::string>& deployment_prompt,
                                    const std::string& goal) {
    if (has_text(deployment_prompt)) {
        return *deployment_prompt + "\n\nCurrent Call Goal: " + goal;
    }
    return goal;
}

std::string compose_system_prompt(const std::optional<std::string>& deployment_prompt,
                                  const std::optional<std::string>& goal,
                                  const std::optional<std::string>& user_id,
                                  const std::optional<std::string>& chat_id) {
    std::string prompt;
    if (has_text(goal)) {
        prompt = compose_greeting_prompt(deployment_prompt, *goal);
    } else if (has_text(deployment_prompt)) {
        prompt = *deployment_prompt;
    } else {
        prompt = kDefaultSystemPrompt;
    }
    if (user_id || chat_id) {
        prompt += "\n\n[Context: user_id=" + user_id.value_or("None") +
                  ", chat_id=" + chat_id.value_or("None") + "]";
    }
    return prompt + "\n" + kToolInstructions;
}

SessionSettings make_session_settings(const Config& config, const CallContext& context) {
    SessionSettings settings;
    const auto codec = audio::parse_codec(config.rtp_codec);
    if (!codec) {
        throw std::runtime_error("Unsupported RTP_CODEC: " + config.rtp_codec);
    }
    settings.codec = *codec;
    settings.system_prompt = compose_system_prompt(config.system_prompt, context.initial_prompt,
                                                   context.user_id, context.chat_id);
    settings.send_context = config.send_conversation_context;
    settings.voice_id = config.voice_id;

    settings.stt_timeout = std::chrono::duration<double>(config.stt_timeout);
    settings.tts_timeout = std::chrono::duration<double>(config.tts_timeout);
    settings.llm_timeout = std::chrono::duration<double>(config.llm_timeout);

    settings.vad_energy_threshold = config.vad_energy_threshold;
    settings.vad_trailing_silence_sec = config.vad_trailing_silence_sec;
    settings.vad_min_utterance_sec = config.vad_min_utterance_sec;
    settings.vad_max_utterance_sec = config.vad_max_utterance_sec;

    settings.tts_block_size = static_cast<size_t>(config.tts_block_size);
    settings.resampler_quality = config.resampler_quality;

    settings.echo_tail = std::chrono::duration<double>(config.echo_tail_sec);
    settings.greeting_echo_tail = std::chrono::duration<double>(config.greeting_echo_tail_sec);
    settings.hangup_buffer = std::chrono::duration<double>(config.hangup_buffer_sec);

    settings.max_duration =
        std::chrono::duration<double>(context.max_duration_sec.value_or(config.max_call_duration));
    settings.limit_message = context.limit_message.value_or(config.call_limit_message);
    settings.delay = std::chrono::milliseconds(context.delay_ms > 0 ? context.delay_ms : 0);
    settings.cost_per_minute = config.cost_per_minute;
    settings.expects_greeting = context.expects_greeting;
    return settings;
}

}
