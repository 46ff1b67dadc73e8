#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace voice_bridge {

struct Config {
    std::string log_level = "INFO";
    std::optional<std::string> log_filename;
    std::optional<std::filesystem::path> logs_dir;
    std::string log_name = "voice_bridge";

    std::string bind_address = "0.0.0.0";
    int rest_api_port = 8000;
    int media_ws_port = 8001;
    std::optional<std::string> authorization_token;
    std::string public_stream_url;
    std::string stream_secret;

    std::string provider_api_url = "https://api.telnyx.com/v2";
    std::string provider_api_key;
    std::optional<std::string> provider_app_id;
    std::optional<std::string> provider_from_number;
    bool inbound_enabled = false;
    std::optional<std::string> inbound_system_prompt;
    std::optional<std::string> assigned_user_id;
    std::optional<std::string> assigned_user_label;
    int max_call_duration = 600;
    std::string call_limit_message = "This call has reached its time limit. Goodbye.";

    std::string stt_url = "http://parakeet:8000";
    std::string tts_url = "http://chatterbox:8000";
    std::string llm_url = "http://open-webui:8080/v1";
    std::optional<std::string> llm_api_key;
    std::string llm_model = "gpt-3.5-turbo";
    std::string voice_id = "default";
    int stt_timeout = 10;
    int tts_timeout = 10;
    int llm_timeout = 10;
    std::string rtp_codec = "PCMU";
    std::optional<std::string> system_prompt;
    bool send_conversation_context = true;

    double vad_energy_threshold = 500.0;
    double vad_trailing_silence_sec = 1.2;
    double vad_min_utterance_sec = 0.5;
    double vad_max_utterance_sec = 15.0;
    int tts_block_size = 960;
    int resampler_quality = 3;
    double echo_tail_sec = 1.0;
    double greeting_echo_tail_sec = 2.0;
    double hangup_buffer_sec = 0.1;
    int registry_ttl_sec = 300;

    std::optional<std::string> records_url;
    std::optional<std::string> records_token;
    double cost_per_minute = 0.005;
    std::string open_webui_url;
    std::optional<std::string> open_webui_admin_token;
    std::string alert_channel_name = "LLM-Communications-Gateway Alerts";

    double backend_connect_timeout = 10.0;
    double backend_request_timeout = 60.0;

    static Config load();
    void validate() const;
};

// Base URL of the alert service derived from an OpenAI-style LLM URL.
std::string derive_open_webui_url(const std::string& llm_url);

}
