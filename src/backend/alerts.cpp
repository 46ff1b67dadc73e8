#include "voice_bridge/backend/alerts.hpp"

#include <sstream>

#include "voice_bridge/logging.hpp"
#include "voice_bridge/utils/http.hpp"
#include "voice_bridge/utils/text.hpp"

namespace voice_bridge::backend {

namespace {

constexpr const char* kChannelDescription = "Communications Alerts from LLM Communications Gateway";

std::optional<std::string> channel_id(const nlohmann::json& channel) {
    const auto it = channel.find("id");
    if (it == channel.end()) {
        return std::nullopt;
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    if (it->is_number_integer()) {
        return std::to_string(it->get<int64_t>());
    }
    return std::nullopt;
}

bool is_member(const nlohmann::json& channel, const std::string& user_id) {
    const auto ids = channel.find("user_ids");
    if (ids != channel.end() && ids->is_array()) {
        for (const auto& id : *ids) {
            if (id.is_string() && id.get<std::string>() == user_id) {
                return true;
            }
        }
    }
    const auto owner = channel.find("user_id");
    return owner != channel.end() && owner->is_string() && owner->get<std::string>() == user_id;
}

}

std::string format_call_alert(const CallSummary& summary) {
    std::ostringstream out;
    out << "**Inbound Call Alert**\n\n"
        << "**From:** " << summary.from_number << "\n"
        << "**To:** " << summary.to_number << "\n"
        << "**Duration:** " << summary.duration_seconds << "s\n"
        << "**Status:** " << summary.status << "\n\n"
        << "**Transcription:**\n"
        << (summary.transcript.empty() ? "(No transcription available)" : summary.transcript);
    return out.str();
}

OpenWebUiAlerts::OpenWebUiAlerts(std::string base_url,
                                 std::string admin_token,
                                 std::string channel_name,
                                 BackendRequestOptions options)
    : client_(std::move(base_url), std::move(admin_token), options),
      channel_name_(std::move(channel_name)) {}

bool OpenWebUiAlerts::notify_user(const std::string& user_id, const std::string& message) {
    const auto channel = resolve_channel(user_id);
    if (!channel) {
        warn("No alert channel available", {kv("user_id", user_id)});
        return false;
    }
    try {
        client_.post_json("/api/v1/channels/" + utils::url_encode(*channel) + "/messages/post",
                          {{"content", message}});
        info("Alert delivered", {kv("user_id", user_id), kv("channel_id", *channel)});
        return true;
    } catch (const std::exception& ex) {
        warn("Alert delivery failed", {kv("user_id", user_id), kv("error", ex.what())});
        return false;
    }
}

std::optional<std::string> OpenWebUiAlerts::resolve_channel(const std::string& user_id) {
    const auto key = std::make_pair(user_id, channel_name_);
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        const auto it = channel_cache_.find(key);
        if (it != channel_cache_.end()) {
            return it->second;
        }
    }
    auto channel = find_channel(user_id);
    if (!channel) {
        channel = create_channel(user_id);
    }
    if (channel) {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        channel_cache_[key] = *channel;
    }
    return channel;
}

std::optional<std::string> OpenWebUiAlerts::find_channel(const std::string& user_id) {
    try {
        const auto channels = client_.get_json("/api/v1/channels/");
        if (!channels.is_array()) {
            return std::nullopt;
        }
        const auto wanted = utils::to_lower(channel_name_);
        for (const auto& channel : channels) {
            if (!channel.is_object()) {
                continue;
            }
            const auto name = channel.value("name", "");
            if (utils::to_lower(name) == wanted && is_member(channel, user_id)) {
                debug("Alert channel found", {kv("user_id", user_id), kv("name", name)});
                return channel_id(channel);
            }
        }
    } catch (const std::exception& ex) {
        warn("Alert channel lookup failed", {kv("user_id", user_id), kv("error", ex.what())});
    }
    return std::nullopt;
}

std::optional<std::string> OpenWebUiAlerts::create_channel(const std::string& user_id) {
    const nlohmann::json payload = {
        {"name", channel_name_},
        {"description", kChannelDescription},
        {"is_private", true},
        {"user_ids", nlohmann::json::array({user_id})},
        {"access_control", nlohmann::json::object()},
    };
    try {
        const auto created = client_.post_json("/api/v1/channels/create", payload);
        auto id = channel_id(created);
        if (id) {
            info("Alert channel created", {kv("user_id", user_id), kv("channel_id", *id)});
        }
        return id;
    } catch (const std::exception& ex) {
        warn("Alert channel creation failed", {kv("user_id", user_id), kv("error", ex.what())});
    }
    return std::nullopt;
}

}
