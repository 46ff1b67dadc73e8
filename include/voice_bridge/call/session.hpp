#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "voice_bridge/backend/alerts.hpp"
#include "voice_bridge/backend/call_control.hpp"
#include "voice_bridge/backend/llm.hpp"
#include "voice_bridge/backend/records.hpp"
#include "voice_bridge/backend/speech.hpp"
#include "voice_bridge/call/context.hpp"
#include "voice_bridge/call/conversation.hpp"
#include "voice_bridge/call/history.hpp"
#include "voice_bridge/call/inbound.hpp"
#include "voice_bridge/call/media.hpp"
#include "voice_bridge/call/preload.hpp"
#include "voice_bridge/call/turn_gate.hpp"
#include "voice_bridge/utils/cancellation.hpp"
#include "voice_bridge/utils/task_group.hpp"

namespace voice_bridge {
namespace call {

// Collaborators shared by every session of the process.
struct SessionServices {
    backend::SpeechToText& stt;
    backend::TextToSpeech& tts;
    backend::ChatCompletions& llm;
    backend::CallControl& call_control;
    backend::CallRecordStore& records;
    PreloadBroker& preload;
    // Optional; inbound alerts are skipped without it.
    backend::AlertSink* alerts = nullptr;
};

// Supervisor of one attached media socket. run() drives the session from the
// provider handshake to the final record update on the calling thread.
class CallSession {
public:
    enum class State {
        Handshaking,
        Active,
        Terminating,
        Closed
    };

    CallSession(CallContext context,
                SessionSettings settings,
                MediaSocket& socket,
                SessionServices services);
    ~CallSession();

    CallSession(const CallSession&) = delete;
    CallSession& operator=(const CallSession&) = delete;

    void run();

    State state() const;
    std::string media_stream_id() const { return output_.stream_id(); }
    const ConversationHistory& history() const { return history_; }
    const InboundPipeline& inbound() const { return inbound_; }
    std::optional<double> duration_sec() const;

private:
    bool handshake();
    void start_tasks();
    void receive_loop();
    void handle_message(const nlohmann::json& message);
    void handle_utterance(Utterance utterance);
    void send_initial_audio(TurnGate::Lease lease, const utils::CancellationToken& token);
    void drain_preload(PreloadQueue& queue, const utils::CancellationToken& token);
    void watch_duration(const utils::CancellationToken& token);
    void teardown();
    void persist(int duration_sec);
    void set_state(State state);

    CallContext context_;
    const SessionSettings settings_;
    MediaSocket& socket_;
    SessionServices services_;

    ConversationHistory history_;
    TurnGate gate_;
    InboundPipeline inbound_;
    MediaOutput output_;
    ConversationEngine engine_;
    utils::CancellationToken session_token_;

    mutable std::mutex state_mutex_;
    State state_ = State::Handshaking;
    std::optional<std::chrono::steady_clock::time_point> active_since_;
    std::optional<std::chrono::steady_clock::time_point> closed_at_;

    utils::TaskGroup sender_tasks_;
    utils::TaskGroup turn_tasks_;
    utils::TaskGroup monitor_tasks_;
    std::atomic<bool> limit_reached_{false};
};

const char* state_name(CallSession::State state);

}
}
