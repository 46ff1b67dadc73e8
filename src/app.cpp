#include "voice_bridge/app.hpp"

#include <chrono>
#include <thread>
#include <utility>

#include "voice_bridge/audio/codec.hpp"
#include "voice_bridge/call/session.hpp"
#include "voice_bridge/logging.hpp"

namespace voice_bridge {

namespace {

constexpr std::chrono::seconds kEvictionInterval{5};

server::RestResponse to_rest(const call::DispatchResult& result) {
    return {result.status, result.body};
}

}

BridgeApp::BridgeApp(Config config)
    : config_(std::move(config)),
      registry_(std::chrono::seconds(config_.registry_ttl_sec)),
      preload_(std::chrono::seconds(config_.registry_ttl_sec)),
      greeting_tasks_("greetings"),
      background_("background") {}

BridgeApp::~BridgeApp() {
    stop();
}

void BridgeApp::init() {
    backend::BackendRequestOptions options;
    options.connect_timeout = Seconds(config_.backend_connect_timeout);
    options.request_timeout = Seconds(config_.backend_request_timeout);

    stt_ = std::make_unique<backend::HttpSpeechToText>(config_.stt_url, options);
    tts_ = std::make_unique<backend::HttpTextToSpeech>(config_.tts_url, options);
    llm_ = std::make_unique<backend::OpenAiChatClient>(config_.llm_url, config_.llm_api_key,
                                                       config_.llm_model, options);
    call_control_ = std::make_unique<backend::TelnyxCallControl>(
        config_.provider_api_url, config_.provider_api_key, options);
    if (config_.records_url) {
        records_ = std::make_unique<backend::HttpCallRecordStore>(*config_.records_url,
                                                                  config_.records_token, options);
    } else {
        info("No record service configured, keeping call records in memory");
        records_ = std::make_unique<backend::MemoryCallRecordStore>();
    }
    if (config_.open_webui_admin_token) {
        alerts_ = std::make_unique<backend::OpenWebUiAlerts>(
            config_.open_webui_url, *config_.open_webui_admin_token, config_.alert_channel_name,
            options);
    }

    call::GreetingOptions greeting_options;
    greeting_options.deployment_prompt = config_.system_prompt;
    greeting_options.voice_id = config_.voice_id;
    greeting_options.transcoder.codec =
        audio::parse_codec(config_.rtp_codec).value_or(audio::WireCodec::Pcmu);
    greeting_options.transcoder.block_size = static_cast<size_t>(config_.tts_block_size);
    greeting_options.transcoder.resampler_quality = config_.resampler_quality;
    greeting_options.llm_timeout = Seconds(config_.llm_timeout);
    greeting_options.tts_timeout = Seconds(config_.tts_timeout);
    greetings_ = std::make_unique<call::GreetingGenerator>(*llm_, *tts_, greeting_options);

    dispatcher_ = std::make_unique<call::CallDispatcher>(
        call::DispatcherOptions::from_config(config_), registry_, preload_, *call_control_,
        *records_, *greetings_, [this](call::CallDispatcher::BackgroundJob job) {
            if (!greeting_tasks_.spawn("greeting", std::move(job))) {
                warn("Greeting job rejected, shutting down");
            }
        });

    rest_server_ = std::make_unique<server::RestServer>(
        config_,
        [this](const nlohmann::json& body) { return to_rest(dispatcher_->initiate_outbound(body)); },
        [this](const nlohmann::json& body) { return to_rest(dispatcher_->handle_webhook(body)); });
    media_server_ = std::make_unique<server::MediaServer>(
        config_,
        [this](const server::StreamRequest& request,
               std::shared_ptr<server::WsMediaSocket> socket) {
            attach_session(request, std::move(socket));
        });

    rest_server_->start();
    media_server_->start();
    background_.spawn("evict_expired", [this](const utils::CancellationToken& token) {
        evict_expired(token);
    });
}

void BridgeApp::run(const std::atomic<bool>& stop_requested) {
    while (!quitting_ && !stop_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
}

void BridgeApp::stop() {
    if (quitting_.exchange(true)) {
        return;
    }
    info("Shutting down");
    if (rest_server_) {
        rest_server_->stop();
    }
    if (media_server_) {
        media_server_->stop();
    }
    // Both groups use the collaborators, so they finish before ~BridgeApp
    // releases them.
    greeting_tasks_.cancel_and_join();
    background_.cancel_and_join();
}

void BridgeApp::attach_session(const server::StreamRequest& request,
                               std::shared_ptr<server::WsMediaSocket> socket) {
    auto context = registry_.resolve(request.stream_id);
    if (!context) {
        warn("Unknown or consumed stream id", {kv("stream_id", request.stream_id)});
        socket->close(call::kClosePolicyViolation, "Unknown stream");
        return;
    }
    if (request.delay_ms > 0) {
        context->delay_ms = request.delay_ms;
    }

    call::SessionServices services{*stt_, *tts_, *llm_, *call_control_, *records_, preload_,
                                   alerts_.get()};
    auto settings = call::make_session_settings(config_, *context);
    call::CallSession session(std::move(*context), std::move(settings), *socket, services);
    session.run();
}

void BridgeApp::evict_expired(const utils::CancellationToken& token) {
    while (token.wait_for(kEvictionInterval)) {
        const auto streams = registry_.evict_expired();
        const auto queues = preload_.evict_expired();
        if (streams > 0 || queues > 0) {
            info("Expired registrations evicted",
                 {kv("streams", streams), kv("preload_queues", queues)});
        }
    }
}

}
