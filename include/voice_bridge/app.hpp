#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "voice_bridge/backend/alerts.hpp"
#include "voice_bridge/backend/call_control.hpp"
#include "voice_bridge/backend/llm.hpp"
#include "voice_bridge/backend/records.hpp"
#include "voice_bridge/backend/speech.hpp"
#include "voice_bridge/call/dispatcher.hpp"
#include "voice_bridge/call/greeting.hpp"
#include "voice_bridge/call/preload.hpp"
#include "voice_bridge/call/stream_registry.hpp"
#include "voice_bridge/config.hpp"
#include "voice_bridge/server/media_server.hpp"
#include "voice_bridge/server/rest_server.hpp"
#include "voice_bridge/utils/task_group.hpp"

namespace voice_bridge {

class BridgeApp {
public:
    explicit BridgeApp(Config config);
    ~BridgeApp();

    BridgeApp(const BridgeApp&) = delete;
    BridgeApp& operator=(const BridgeApp&) = delete;

    void init();
    // Blocks until stop_requested turns true or stop() is called.
    void run(const std::atomic<bool>& stop_requested);
    void stop();
    const Config& config() const { return config_; }

private:
    void attach_session(const server::StreamRequest& request,
                        std::shared_ptr<server::WsMediaSocket> socket);
    void evict_expired(const utils::CancellationToken& token);

    Config config_;
    std::unique_ptr<backend::SpeechToText> stt_;
    std::unique_ptr<backend::TextToSpeech> tts_;
    std::unique_ptr<backend::ChatCompletions> llm_;
    std::unique_ptr<backend::CallControl> call_control_;
    std::unique_ptr<backend::CallRecordStore> records_;
    std::unique_ptr<backend::AlertSink> alerts_;
    call::StreamRegistry registry_;
    call::PreloadBroker preload_;
    std::unique_ptr<call::GreetingGenerator> greetings_;
    std::unique_ptr<call::CallDispatcher> dispatcher_;
    std::unique_ptr<server::RestServer> rest_server_;
    std::unique_ptr<server::MediaServer> media_server_;
    utils::TaskGroup greeting_tasks_;
    utils::TaskGroup background_;
    std::atomic<bool> quitting_{false};
};

}
