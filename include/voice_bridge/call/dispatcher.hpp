#pragma once

#include <functional>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "voice_bridge/backend/call_control.hpp"
#include "voice_bridge/backend/records.hpp"
#include "voice_bridge/call/greeting.hpp"
#include "voice_bridge/call/preload.hpp"
#include "voice_bridge/call/stream_registry.hpp"
#include "voice_bridge/config.hpp"
#include "voice_bridge/utils/cancellation.hpp"

namespace voice_bridge {
namespace call {

struct DispatchResult {
    int status = 200;
    nlohmann::json body;
};

struct DispatcherOptions {
    std::string public_stream_url;
    std::string stream_secret;
    std::optional<std::string> app_id;
    std::optional<std::string> from_number;
    std::string codec = "PCMU";
    bool inbound_enabled = false;
    std::optional<std::string> inbound_system_prompt;
    std::optional<std::string> assigned_user_id;
    std::optional<std::string> assigned_user_label;

    static DispatcherOptions from_config(const Config& config);
};

// Sets up calls before their media socket exists: stream registration,
// greeting preload, provider dial/answer and the initial call record.
class CallDispatcher {
public:
    // Runs a job off the request thread. The owner cancels the token on
    // shutdown and waits for the job.
    using BackgroundJob = std::function<void(const utils::CancellationToken&)>;
    using BackgroundRunner = std::function<void(BackgroundJob)>;

    CallDispatcher(DispatcherOptions options,
                   StreamRegistry& registry,
                   PreloadBroker& preload,
                   backend::CallControl& call_control,
                   backend::CallRecordStore& records,
                   GreetingGenerator& greetings,
                   BackgroundRunner run_in_background);

    // POST /voice/call body.
    DispatchResult initiate_outbound(const nlohmann::json& request);
    // Provider event webhook body.
    DispatchResult handle_webhook(const nlohmann::json& event);

    std::string stream_url(const std::string& stream_id, int delay_ms) const;

private:
    std::optional<std::string> create_record(backend::CallRecord record);

    DispatcherOptions options_;
    StreamRegistry& registry_;
    PreloadBroker& preload_;
    backend::CallControl& call_control_;
    backend::CallRecordStore& records_;
    GreetingGenerator& greetings_;
    BackgroundRunner run_in_background_;
};

}
}
