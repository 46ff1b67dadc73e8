#include "voice_bridge/config.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "voice_bridge/audio/codec.hpp"
#include "voice_bridge/utils/text.hpp"

namespace voice_bridge {

namespace {

std::string get_env_str(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : fallback;
}

std::optional<std::string> get_env_optional(const char* name) {
    const char* value = std::getenv(name);
    if (!value) {
        return std::nullopt;
    }
    std::string result(value);
    if (result.empty()) {
        return std::nullopt;
    }
    return result;
}

std::string get_env_required(const char* name) {
    const char* value = std::getenv(name);
    if (!value || std::string(value).empty()) {
        throw std::runtime_error(std::string(name) + " is required");
    }
    return std::string(value);
}

bool get_env_bool(const char* name, bool fallback) {
    const char* value = std::getenv(name);
    if (!value) {
        return fallback;
    }
    return utils::to_lower(value) == "true";
}

int get_env_int(const char* name, int fallback) {
    const char* value = std::getenv(name);
    return value ? std::stoi(value) : fallback;
}

double get_env_double(const char* name, double fallback) {
    const char* value = std::getenv(name);
    return value ? std::stod(value) : fallback;
}

std::string timestamp_suffix() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_value{};
    localtime_r(&time_t, &tm_value);
    std::ostringstream stream;
    stream << std::put_time(&tm_value, "%Y%m%d_%H%M%S");
    return stream.str();
}

std::string strip_quotes(std::string value) {
    if (value.size() < 2) {
        return value;
    }
    if ((value.front() == '"' && value.back() == '"') ||
        (value.front() == '\'' && value.back() == '\'')) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

void load_dotenv() {
    const std::filesystem::path dotenv_path = std::filesystem::current_path() / ".env";
    if (!std::filesystem::exists(dotenv_path)) {
        return;
    }

    std::ifstream stream(dotenv_path);
    if (!stream.is_open()) {
        return;
    }

    std::string line;
    while (std::getline(stream, line)) {
        line = utils::trim(line);
        if (line.empty() || line.front() == '#') {
            continue;
        }
        if (line.rfind("export ", 0) == 0) {
            line = utils::trim(line.substr(7));
        }

        const auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }
        const std::string key = utils::trim(line.substr(0, eq_pos));
        if (key.empty()) {
            continue;
        }
        const std::string value = strip_quotes(utils::trim(line.substr(eq_pos + 1)));
        // Values already present in the environment win over the file.
        setenv(key.c_str(), value.c_str(), 0);
    }
}

}

std::string derive_open_webui_url(const std::string& llm_url) {
    const std::string fallback = "http://open-webui:8080";
    const auto v1_pos = llm_url.find("/v1");
    if (v1_pos == std::string::npos) {
        return fallback;
    }
    std::string base = llm_url.substr(0, v1_pos);
    const std::string api_suffix = "/api";
    if (base.size() > api_suffix.size() &&
        base.compare(base.size() - api_suffix.size(), api_suffix.size(), api_suffix) == 0) {
        base.resize(base.size() - api_suffix.size());
    }
    return base.empty() ? fallback : base;
}

Config Config::load() {
    load_dotenv();
    Config config;

    config.log_level = get_env_str("LOG_LEVEL", "INFO");
    const auto log_filename_raw = get_env_str("LOG_FILENAME", "");
    if (!log_filename_raw.empty()) {
        const std::filesystem::path log_path(log_filename_raw);
        const auto stamped = log_path.stem().string() + "_" + timestamp_suffix() +
                             log_path.extension().string();
        if (const auto log_dir = get_env_optional("LOGS_DIR")) {
            config.logs_dir = std::filesystem::path(*log_dir);
            config.log_filename = (std::filesystem::path(*log_dir) / stamped).string();
        } else {
            config.log_filename = stamped;
        }
    }
    config.log_name = get_env_str("LOG_NAME", "voice_bridge");

    config.bind_address = get_env_str("BIND_ADDRESS", "0.0.0.0");
    config.rest_api_port = get_env_int("REST_API_PORT", 8000);
    config.media_ws_port = get_env_int("MEDIA_WS_PORT", 8001);
    config.authorization_token = get_env_optional("AUTHORIZATION_TOKEN");
    config.public_stream_url = get_env_required("PUBLIC_STREAM_URL");
    config.stream_secret = get_env_required("STREAM_SECRET");

    config.provider_api_url = get_env_str("PROVIDER_API_URL", "https://api.telnyx.com/v2");
    config.provider_api_key = get_env_required("PROVIDER_API_KEY");
    config.provider_app_id = get_env_optional("PROVIDER_APP_ID");
    config.provider_from_number = get_env_optional("PROVIDER_FROM_NUMBER");
    config.inbound_enabled = get_env_bool("INBOUND_ENABLED", false);
    config.inbound_system_prompt = get_env_optional("INBOUND_SYSTEM_PROMPT");
    config.assigned_user_id = get_env_optional("ASSIGNED_USER_ID");
    config.assigned_user_label = get_env_optional("ASSIGNED_USER_LABEL");
    config.max_call_duration = get_env_int("MAX_CALL_DURATION", 600);
    config.call_limit_message = get_env_str(
        "CALL_LIMIT_MESSAGE", "This call has reached its time limit. Goodbye.");

    config.stt_url = get_env_str("STT_URL", "http://parakeet:8000");
    config.tts_url = get_env_str("TTS_URL", "http://chatterbox:8000");
    config.llm_url = get_env_str("LLM_URL", "http://open-webui:8080/v1");
    config.llm_api_key = get_env_optional("LLM_API_KEY");
    config.llm_model = get_env_str("LLM_MODEL", "gpt-3.5-turbo");
    config.voice_id = get_env_str("VOICE_ID", "default");
    config.stt_timeout = get_env_int("STT_TIMEOUT", 10);
    config.tts_timeout = get_env_int("TTS_TIMEOUT", 10);
    config.llm_timeout = get_env_int("LLM_TIMEOUT", 10);
    config.rtp_codec = utils::to_upper(get_env_str("RTP_CODEC", "PCMU"));
    config.system_prompt = get_env_optional("SYSTEM_PROMPT");
    config.send_conversation_context = get_env_bool("SEND_CONVERSATION_CONTEXT", true);

    config.vad_energy_threshold = get_env_double("VAD_ENERGY_THRESHOLD", 500.0);
    config.vad_trailing_silence_sec = get_env_double("VAD_TRAILING_SILENCE_SEC", 1.2);
    config.vad_min_utterance_sec = get_env_double("VAD_MIN_UTTERANCE_SEC", 0.5);
    config.vad_max_utterance_sec = get_env_double("VAD_MAX_UTTERANCE_SEC", 15.0);
    config.tts_block_size = get_env_int("TTS_BLOCK_SIZE", 960);
    config.resampler_quality = get_env_int("RESAMPLER_QUALITY", 3);
    config.echo_tail_sec = get_env_double("ECHO_TAIL_SEC", 1.0);
    config.greeting_echo_tail_sec = get_env_double("GREETING_ECHO_TAIL_SEC", 2.0);
    config.hangup_buffer_sec = get_env_double("HANGUP_BUFFER_SEC", 0.1);
    config.registry_ttl_sec = get_env_int("REGISTRY_TTL_SEC", 300);

    config.records_url = get_env_optional("RECORDS_URL");
    config.records_token = get_env_optional("RECORDS_TOKEN");
    config.cost_per_minute = get_env_double("COST_PER_MINUTE", 0.005);
    config.open_webui_url =
        get_env_str("OPEN_WEBUI_URL", derive_open_webui_url(config.llm_url));
    config.open_webui_admin_token = get_env_optional("OPEN_WEBUI_ADMIN_TOKEN");
    config.alert_channel_name =
        get_env_str("ALERT_CHANNEL_NAME", "LLM-Communications-Gateway Alerts");

    config.backend_connect_timeout = get_env_double("BACKEND_CONNECT_TIMEOUT", 10.0);
    config.backend_request_timeout = get_env_double("BACKEND_REQUEST_TIMEOUT", 60.0);

    return config;
}

void Config::validate() const {
    if (public_stream_url.empty()) {
        throw std::runtime_error("PUBLIC_STREAM_URL is required");
    }
    if (stream_secret.empty()) {
        throw std::runtime_error("STREAM_SECRET is required");
    }
    if (provider_api_key.empty()) {
        throw std::runtime_error("PROVIDER_API_KEY is required");
    }
    if (rest_api_port <= 0) {
        throw std::runtime_error("REST_API_PORT must be positive");
    }
    if (media_ws_port <= 0) {
        throw std::runtime_error("MEDIA_WS_PORT must be positive");
    }
    if (rest_api_port == media_ws_port) {
        throw std::runtime_error("REST_API_PORT and MEDIA_WS_PORT must differ");
    }
    if (!audio::parse_codec(rtp_codec)) {
        throw std::runtime_error("RTP_CODEC must be one of PCMU, PCMA, L16");
    }
    if (max_call_duration <= 0) {
        throw std::runtime_error("MAX_CALL_DURATION must be positive");
    }
    if (stt_timeout <= 0 || tts_timeout <= 0 || llm_timeout <= 0) {
        throw std::runtime_error("STT_TIMEOUT, TTS_TIMEOUT and LLM_TIMEOUT must be positive");
    }
    if (tts_block_size <= 0 || tts_block_size % 2 != 0) {
        throw std::runtime_error("TTS_BLOCK_SIZE must be a positive even number");
    }
    if (resampler_quality < 0 || resampler_quality > 10) {
        throw std::runtime_error("RESAMPLER_QUALITY must be between 0 and 10");
    }
    if (vad_min_utterance_sec <= 0.0 || vad_max_utterance_sec <= vad_min_utterance_sec) {
        throw std::runtime_error(
            "VAD_MAX_UTTERANCE_SEC must exceed VAD_MIN_UTTERANCE_SEC");
    }
    if (vad_trailing_silence_sec <= 0.0) {
        throw std::runtime_error("VAD_TRAILING_SILENCE_SEC must be positive");
    }
    if (registry_ttl_sec <= 0) {
        throw std::runtime_error("REGISTRY_TTL_SEC must be positive");
    }
}

}
