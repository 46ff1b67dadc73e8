#include "voice_bridge/call/dispatcher.hpp"

#include <algorithm>
#include <memory>
#include <utility>

#include "voice_bridge/logging.hpp"
#include "voice_bridge/metrics.hpp"
#include "voice_bridge/utils/http.hpp"
#include "voice_bridge/utils/text.hpp"

namespace voice_bridge::call {

namespace {

std::optional<std::string> optional_string(const nlohmann::json& body, const char* key) {
    const auto it = body.find(key);
    if (it == body.end() || !it->is_string()) {
        return std::nullopt;
    }
    auto value = utils::trim(it->get<std::string>());
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

DispatchResult message(int status, const std::string& text) {
    return {status, {{"message", text}}};
}

}

DispatcherOptions DispatcherOptions::from_config(const Config& config) {
    DispatcherOptions options;
    options.public_stream_url = config.public_stream_url;
    options.stream_secret = config.stream_secret;
    options.app_id = config.provider_app_id;
    options.from_number = config.provider_from_number;
    options.codec = utils::to_upper(config.rtp_codec);
    options.inbound_enabled = config.inbound_enabled;
    options.inbound_system_prompt = config.inbound_system_prompt;
    options.assigned_user_id = config.assigned_user_id;
    options.assigned_user_label = config.assigned_user_label;
    return options;
}

CallDispatcher::CallDispatcher(DispatcherOptions options,
                               StreamRegistry& registry,
                               PreloadBroker& preload,
                               backend::CallControl& call_control,
                               backend::CallRecordStore& records,
                               GreetingGenerator& greetings,
                               BackgroundRunner run_in_background)
    : options_(std::move(options)),
      registry_(registry),
      preload_(preload),
      call_control_(call_control),
      records_(records),
      greetings_(greetings),
      run_in_background_(std::move(run_in_background)) {}

std::string CallDispatcher::stream_url(const std::string& stream_id, int delay_ms) const {
    std::string base = options_.public_stream_url;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    auto url = base + "/" + stream_id + "?token=" + utils::url_encode(options_.stream_secret);
    if (delay_ms > 0) {
        url += "&delay_ms=" + std::to_string(delay_ms);
    }
    return url;
}

std::optional<std::string> CallDispatcher::create_record(backend::CallRecord record) {
    try {
        return records_.create(record).id;
    } catch (const std::exception& ex) {
        error("Call record creation failed", {kv("call_id", record.call_id), kv("error", ex.what())});
    }
    return std::nullopt;
}

DispatchResult CallDispatcher::initiate_outbound(const nlohmann::json& request) {
    const auto to_number = optional_string(request, "to_number");
    if (!to_number) {
        return message(400, "to_number is required");
    }
    auto from_number = optional_string(request, "from_number");
    if (!from_number) {
        from_number = options_.from_number;
    }
    if (!options_.app_id || !from_number) {
        return message(400, "Provider application id and from number must be configured");
    }
    int delay_ms = 0;
    if (request.contains("delay_ms") && request["delay_ms"].is_number()) {
        delay_ms = std::max(0, request["delay_ms"].get<int>());
    }

    CallContext context;
    context.stream_id = StreamRegistry::generate_stream_id();
    context.initial_prompt = optional_string(request, "prompt");
    context.user_id = optional_string(request, "user_id");
    context.chat_id = optional_string(request, "chat_id");
    context.direction = CallDirection::Outbound;
    context.delay_ms = delay_ms;
    if (request.contains("max_duration_sec") && request["max_duration_sec"].is_number() &&
        request["max_duration_sec"].get<int>() > 0) {
        context.max_duration_sec = request["max_duration_sec"].get<int>();
    }
    context.limit_message = optional_string(request, "limit_message");
    const auto url = stream_url(context.stream_id, delay_ms);
    registry_.register_stream(context);

    std::shared_ptr<PreloadQueue> queue;
    if (context.initial_prompt) {
        queue = std::make_shared<PreloadQueue>();
        utils::CancellationToken token;
        greetings_.generate(*context.initial_prompt, *queue, token);
    }

    const auto dialed = call_control_.dial(*to_number, *from_number, *options_.app_id, url,
                                           options_.codec);

    backend::CallRecord record;
    record.call_id = dialed.call_id;
    record.direction = "outbound";
    record.from_number = *from_number;
    record.to_number = *to_number;
    record.status = dialed.ok ? "initiated" : "failed";
    record.user_id = context.user_id;
    record.chat_id = context.chat_id;
    const auto record_id = create_record(record);

    if (!dialed.ok) {
        registry_.remove(context.stream_id);
        return message(500, dialed.error.empty() ? "Dial failed" : dialed.error);
    }

    registry_.bind_call(context.stream_id, dialed.call_id, record_id);
    if (queue) {
        try {
            preload_.attach(dialed.call_id, queue);
        } catch (const PreloadError& ex) {
            error("Greeting preload rejected", {kv("call_id", dialed.call_id), kv("error", ex.what())});
        }
    }
    Metrics::instance().increment("calls_initiated");
    info("Outbound call initiated",
         {kv("call_id", dialed.call_id), kv("stream_id", context.stream_id), kv("to", *to_number)});

    nlohmann::json body = {
        {"status", "initiated"},
        {"call_id", dialed.call_id},
    };
    body["db_id"] = record_id ? nlohmann::json(*record_id) : nlohmann::json(nullptr);
    return {200, body};
}

DispatchResult CallDispatcher::handle_webhook(const nlohmann::json& event) {
    const auto data = event.value("data", nlohmann::json::object());
    const auto event_type = data.value("event_type", "");
    const auto payload = data.value("payload", nlohmann::json::object());
    const auto direction = utils::to_lower(payload.value("direction", ""));
    debug("Provider event", {kv("event_type", event_type), kv("direction", direction)});

    if (event_type != "call.initiated" || (direction != "inbound" && direction != "incoming")) {
        return {200, {{"status", "ignored"}}};
    }
    if (!options_.inbound_enabled) {
        info("Inbound call rejected, inbound disabled");
        return {200, {{"status", "rejected"}}};
    }
    const auto call_id = payload.value("call_control_id", "");
    if (call_id.empty()) {
        return message(400, "call_control_id is required");
    }

    backend::CallRecord record;
    record.call_id = call_id;
    record.direction = "inbound";
    record.from_number = payload.value("from", "");
    record.to_number = payload.value("to", "");
    record.status = "ringing";
    record.user_id = options_.assigned_user_id;
    record.user_label = options_.assigned_user_label;
    const auto record_id = create_record(record);

    CallContext context;
    context.stream_id = StreamRegistry::generate_stream_id();
    context.call_id = call_id;
    context.record_id = record_id;
    context.initial_prompt = options_.inbound_system_prompt;
    context.user_id = options_.assigned_user_id;
    context.direction = CallDirection::Inbound;
    context.expects_greeting = options_.inbound_system_prompt.has_value();
    registry_.register_stream(context);

    if (options_.inbound_system_prompt) {
        try {
            auto queue = preload_.create(call_id);
            const auto goal = *options_.inbound_system_prompt;
            run_in_background_([this, queue, goal](const utils::CancellationToken& token) {
                greetings_.generate(goal, *queue, token);
            });
        } catch (const PreloadError& ex) {
            error("Greeting preload rejected", {kv("call_id", call_id), kv("error", ex.what())});
        }
    }

    const auto answered = call_control_.answer(call_id, stream_url(context.stream_id, 0),
                                               std::string("rtp"), options_.codec);
    if (!answered.ok) {
        warn("Answer failed, registration left to expire",
             {kv("call_id", call_id), kv("error", answered.error)});
    } else {
        Metrics::instance().increment("calls_answered");
    }
    info("Inbound call answered",
         {kv("call_id", call_id), kv("stream_id", context.stream_id), kv("from", record.from_number)});
    return {200, {{"status", "answered"}, {"stream_id", context.stream_id}}};
}

}
