#include "voice_bridge/app.hpp"
#include "voice_bridge/config.hpp"
#include "voice_bridge/logging.hpp"

#include <atomic>
#include <csignal>
#include <string>

namespace {

std::atomic<bool> stop_requested{false};

void handle_signal(int) {
    stop_requested = true;
}

}

int main() {
    try {
        const auto config = voice_bridge::Config::load();
        config.validate();
        voice_bridge::logging::init(config);
        voice_bridge::info(
            "Starting voice-bridge",
            {voice_bridge::kv("rest_port", config.rest_api_port),
             voice_bridge::kv("media_port", config.media_ws_port),
             voice_bridge::kv("codec", config.rtp_codec),
             voice_bridge::kv("inbound_enabled", config.inbound_enabled),
             voice_bridge::kv("llm_url", config.llm_url)});
        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);
        voice_bridge::BridgeApp app(config);
        app.init();
        app.run(stop_requested);
        app.stop();
    } catch (const std::exception& ex) {
        voice_bridge::error(
            "Startup failed",
            {voice_bridge::kv("error", ex.what())});
        return 1;
    }
    return 0;
}
