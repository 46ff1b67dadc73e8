#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "voice_bridge/backend/client.hpp"

namespace voice_bridge {
namespace backend {

struct CallSummary {
    std::string from_number;
    std::string to_number;
    int duration_seconds = 0;
    std::string status;
    std::string transcript;
};

std::string format_call_alert(const CallSummary& summary);

class AlertSink {
public:
    virtual ~AlertSink() = default;

    // Best effort. Returns false when the alert could not be delivered.
    virtual bool notify_user(const std::string& user_id, const std::string& message) = 0;
};

// Posts alerts into a private Open WebUI channel per user. Channel ids are
// cached per (user, channel name) for the lifetime of the process.
class OpenWebUiAlerts : public AlertSink {
public:
    OpenWebUiAlerts(std::string base_url,
                    std::string admin_token,
                    std::string channel_name,
                    BackendRequestOptions options);

    bool notify_user(const std::string& user_id, const std::string& message) override;

private:
    std::optional<std::string> find_channel(const std::string& user_id);
    std::optional<std::string> create_channel(const std::string& user_id);
    std::optional<std::string> resolve_channel(const std::string& user_id);

    BackendClient client_;
    std::string channel_name_;
    std::mutex cache_mutex_;
    std::map<std::pair<std::string, std::string>, std::string> channel_cache_;
};

}
}
