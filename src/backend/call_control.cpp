#include "voice_bridge/backend/call_control.hpp"

#include <utility>

#include "voice_bridge/logging.hpp"
#include "voice_bridge/utils/http.hpp"
#include "voice_bridge/utils/text.hpp"

namespace voice_bridge::backend {

namespace {

void add_stream_fields(nlohmann::json& payload,
                       const std::optional<std::string>& stream_url,
                       const std::optional<std::string>& mode,
                       const std::optional<std::string>& codec) {
    if (!stream_url || stream_url->empty()) {
        return;
    }
    payload["stream_url"] = *stream_url;
    payload["stream_track"] = "both_tracks";
    payload["stream_bidirectional_mode"] = mode.value_or("rtp");
    if (codec) {
        payload["stream_bidirectional_codec"] = *codec;
    }
}

std::string action_path(const std::string& call_id, const std::string& action) {
    return "/calls/" + utils::url_encode(call_id) + "/actions/" + action;
}

}

TelnyxCallControl::TelnyxCallControl(std::string api_url,
                                     std::string api_key,
                                     BackendRequestOptions options)
    : client_(std::move(api_url), std::move(api_key), options) {}

CallControlResult TelnyxCallControl::dial(const std::string& to,
                                          const std::string& from,
                                          const std::string& app_id,
                                          const std::optional<std::string>& stream_url,
                                          const std::optional<std::string>& codec) {
    nlohmann::json payload = {
        {"connection_id", app_id},
        {"to", utils::trim(to)},
        {"from", utils::trim(from)},
    };
    add_stream_fields(payload, stream_url, std::nullopt, codec);

    CallControlResult result;
    try {
        const auto response = client_.post_json("/calls", payload);
        const auto data = response.value("data", nlohmann::json::object());
        if (data.contains("call_control_id") && data["call_control_id"].is_string()) {
            result.call_id = data["call_control_id"].get<std::string>();
        }
        if (result.call_id.empty()) {
            result.error = "Dial response carried no call_control_id";
            warn("Dial response without call id", {kv("to", to)});
            return result;
        }
        result.ok = true;
        info("Call dialed", {kv("call_id", result.call_id), kv("to", to)});
    } catch (const std::exception& ex) {
        result.error = ex.what();
        error("Dial failed", {kv("to", to), kv("error", ex.what())});
    }
    return result;
}

CallControlResult TelnyxCallControl::answer(const std::string& call_id,
                                            const std::optional<std::string>& stream_url,
                                            const std::optional<std::string>& mode,
                                            const std::optional<std::string>& codec) {
    nlohmann::json payload = nlohmann::json::object();
    add_stream_fields(payload, stream_url, mode, codec);

    CallControlResult result;
    result.call_id = call_id;
    try {
        client_.post_json(action_path(call_id, "answer"), payload);
        result.ok = true;
        info("Call answered", {kv("call_id", call_id)});
    } catch (const std::exception& ex) {
        result.error = ex.what();
        error("Answer failed", {kv("call_id", call_id), kv("error", ex.what())});
    }
    return result;
}

CallControlResult TelnyxCallControl::hangup(const std::string& call_id) {
    const nlohmann::json payload = {
        {"call_control_id", call_id},
        {"command_id", "hangup_command"},
    };

    CallControlResult result;
    result.call_id = call_id;
    try {
        client_.post_json(action_path(call_id, "hangup"), payload);
        result.ok = true;
        info("Hangup sent", {kv("call_id", call_id)});
    } catch (const std::exception& ex) {
        result.error = ex.what();
        warn("Hangup failed", {kv("call_id", call_id), kv("error", ex.what())});
    }
    return result;
}

}
