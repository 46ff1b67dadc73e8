#include "voice_bridge/call/session.hpp"

#include <cmath>
#include <utility>

#include "voice_bridge/audio/wav.hpp"
#include "voice_bridge/logging.hpp"
#include "voice_bridge/metrics.hpp"
#include "voice_bridge/utils/text.hpp"

namespace voice_bridge::call {

namespace {

vad::SegmenterOptions segmenter_options(const SessionSettings& settings) {
    vad::SegmenterOptions options;
    options.sample_rate = audio::kWireSampleRate;
    options.energy_threshold = settings.vad_energy_threshold;
    options.trailing_silence_sec = settings.vad_trailing_silence_sec;
    options.min_utterance_sec = settings.vad_min_utterance_sec;
    options.max_utterance_sec = settings.vad_max_utterance_sec;
    return options;
}

std::string string_field(const nlohmann::json& message, const char* key) {
    const auto it = message.find(key);
    if (it == message.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

std::string media_session_id(const nlohmann::json& message) {
    auto id = string_field(message, "stream_id");
    if (id.empty()) {
        const auto start = message.find("start");
        if (start != message.end() && start->is_object()) {
            id = string_field(*start, "stream_id");
        }
    }
    return id;
}

}

const char* state_name(CallSession::State state) {
    switch (state) {
        case CallSession::State::Handshaking:
            return "handshaking";
        case CallSession::State::Active:
            return "active";
        case CallSession::State::Terminating:
            return "terminating";
        case CallSession::State::Closed:
            return "closed";
    }
    return "unknown";
}

CallSession::CallSession(CallContext context,
                         SessionSettings settings,
                         MediaSocket& socket,
                         SessionServices services)
    : context_(std::move(context)),
      settings_(std::move(settings)),
      socket_(socket),
      services_(services),
      inbound_(settings_.codec, segmenter_options(settings_), gate_),
      output_(socket_, settings_.codec),
      engine_(settings_, history_, services_.llm, services_.tts, services_.call_control),
      sender_tasks_("sender"),
      turn_tasks_("turns"),
      monitor_tasks_("monitor") {
    gate_.set_on_release([this]() { inbound_.reset(); });
}

CallSession::~CallSession() {
    session_token_.cancel();
    sender_tasks_.cancel_and_join();
    turn_tasks_.cancel_and_join();
    monitor_tasks_.cancel_and_join();
}

CallSession::State CallSession::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

std::optional<double> CallSession::duration_sec() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!active_since_) {
        return std::nullopt;
    }
    const auto end = closed_at_.value_or(std::chrono::steady_clock::now());
    return std::chrono::duration<double>(end - *active_since_).count();
}

void CallSession::set_state(State state) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_ = state;
    if (state == State::Active) {
        active_since_ = std::chrono::steady_clock::now();
    } else if (state == State::Closed) {
        closed_at_ = std::chrono::steady_clock::now();
    }
}

void CallSession::run() {
    Metrics::instance().session_opened();
    info("Media session attached",
         {kv("stream_id", context_.stream_id),
          kv("call_id", context_.call_id),
          kv("direction", direction_name(context_.direction))});

    bool started = false;
    try {
        started = handshake();
    } catch (const std::exception& ex) {
        error("Handshake failed", {kv("call_id", context_.call_id), kv("error", ex.what())});
    }

    if (!started) {
        session_token_.cancel();
        output_.close(kCloseNormal, "Handshake aborted");
        set_state(State::Closed);
        if (!context_.call_id.empty()) {
            services_.preload.discard(context_.call_id);
        }
        Metrics::instance().session_closed();
        info("Media session closed before start", {kv("call_id", context_.call_id)});
        return;
    }

    set_state(State::Active);
    info("Media session active",
         {kv("call_id", context_.call_id), kv("media_stream_id", output_.stream_id())});
    start_tasks();
    try {
        receive_loop();
    } catch (const std::exception& ex) {
        error("Receive loop failed", {kv("call_id", context_.call_id), kv("error", ex.what())});
    }
    teardown();
}

bool CallSession::handshake() {
    while (true) {
        const auto text = socket_.receive();
        if (!text) {
            info("Socket closed during handshake", {kv("call_id", context_.call_id)});
            return false;
        }
        const auto message = nlohmann::json::parse(*text, nullptr, false);
        if (message.is_discarded() || !message.is_object()) {
            warn("Malformed handshake message", {kv("call_id", context_.call_id)});
            return false;
        }
        const auto event = string_field(message, "event");
        debug("Handshake event", {kv("event", event)});

        if (event == "connected") {
            output_.send_silence(settings_.priming_frame * settings_.priming_frames,
                                 settings_.priming_frame, session_token_);
            continue;
        }
        if (event == "start") {
            const auto id = media_session_id(message);
            if (id.empty()) {
                warn("Start event without stream id", {kv("call_id", context_.call_id)});
                return false;
            }
            output_.set_stream_id(id);
            return true;
        }
        if (event == "media") {
            const auto id = string_field(message, "stream_id");
            if (!id.empty()) {
                debug("Media before start, treating as started", {kv("media_stream_id", id)});
                output_.set_stream_id(id);
                return true;
            }
            continue;
        }
        if (event == "stop") {
            info("Stop received during handshake", {kv("call_id", context_.call_id)});
            return false;
        }
    }
}

void CallSession::start_tasks() {
    auto lease = gate_.try_acquire("initial_audio");
    if (lease) {
        sender_tasks_.spawn("initial_audio",
                            [this, lease = std::move(*lease)](
                                const utils::CancellationToken& token) mutable {
                                send_initial_audio(std::move(lease), token);
                            });
    }
    monitor_tasks_.spawn("duration_monitor", [this](const utils::CancellationToken& token) {
        watch_duration(token);
    });
}

void CallSession::receive_loop() {
    while (true) {
        const auto text = socket_.receive();
        if (!text) {
            info("Media socket closed", {kv("call_id", context_.call_id)});
            return;
        }
        const auto message = nlohmann::json::parse(*text, nullptr, false);
        if (message.is_discarded() || !message.is_object()) {
            warn("Ignoring malformed media message", {kv("call_id", context_.call_id)});
            continue;
        }
        if (string_field(message, "event") == "stop") {
            info("Stop received", {kv("call_id", context_.call_id)});
            return;
        }
        try {
            handle_message(message);
        } catch (const std::exception& ex) {
            error("Media message failed", {kv("call_id", context_.call_id), kv("error", ex.what())});
        }
    }
}

void CallSession::handle_message(const nlohmann::json& message) {
    if (string_field(message, "event") != "media") {
        return;
    }
    const auto media = message.find("media");
    if (media == message.end() || !media->is_object()) {
        return;
    }
    const auto payload = string_field(*media, "payload");
    if (payload.empty()) {
        return;
    }
    auto utterance = inbound_.on_media(payload);
    if (utterance) {
        handle_utterance(std::move(*utterance));
    }
}

void CallSession::handle_utterance(Utterance utterance) {
    info("Utterance detected",
         {kv("call_id", context_.call_id),
          kv("reason", vad::reason_name(utterance.reason)),
          kv("duration", utterance.duration_sec)});

    std::string transcript;
    try {
        const auto wav = audio::encode_wav(utterance.pcm);
        transcript = utils::trim(services_.stt.transcribe(wav, settings_.stt_timeout));
    } catch (const std::exception& ex) {
        error("Transcription failed", {kv("call_id", context_.call_id), kv("error", ex.what())});
        return;
    }
    if (transcript.empty()) {
        debug("Transcription empty", {kv("call_id", context_.call_id)});
        return;
    }

    auto lease = gate_.try_acquire("turn");
    if (!lease) {
        warn("Speaking gate busy, dropping transcript", {kv("call_id", context_.call_id)});
        return;
    }
    const bool spawned = turn_tasks_.spawn(
        "turn",
        [this, lease = std::move(*lease), transcript](const utils::CancellationToken& token) mutable {
            engine_.run_turn(transcript, output_, context_.call_id, token);
            lease.release();
        });
    if (!spawned) {
        debug("Turn rejected, session is terminating", {kv("call_id", context_.call_id)});
    }
}

void CallSession::send_initial_audio(TurnGate::Lease lease,
                                     const utils::CancellationToken& token) {
    if (!output_.send_silence(settings_.initial_silence, settings_.priming_frame, token)) {
        return;
    }
    if (settings_.delay.count() > 0) {
        debug("Applying start delay", {kv("delay_ms", settings_.delay.count())});
        if (!output_.send_silence(settings_.delay, settings_.priming_frame, token)) {
            return;
        }
    }

    std::shared_ptr<PreloadQueue> queue;
    if (!context_.call_id.empty()) {
        const auto ceiling = settings_.expects_greeting
                                 ? settings_.llm_timeout + settings_.tts_timeout
                                 : std::chrono::duration<double>(0);
        queue = services_.preload.wait_for(context_.call_id, ceiling, settings_.preload_poll,
                                           token);
    }
    if (token.is_canceled()) {
        return;
    }
    if (queue) {
        drain_preload(*queue, token);
        if (token.is_canceled()) {
            return;
        }
        if (const auto greeting = queue->greeting()) {
            history_.add_assistant(*greeting);
        }
    } else if (settings_.expects_greeting) {
        warn("Preloaded greeting never appeared", {kv("call_id", context_.call_id)});
    }

    token.wait_for(settings_.greeting_echo_tail);
    lease.release();
}

void CallSession::drain_preload(PreloadQueue& queue, const utils::CancellationToken& token) {
    const auto max_wait = settings_.llm_timeout + settings_.tts_timeout;
    size_t frames = 0;
    audio::AudioFrame frame;
    while (true) {
        const auto status = queue.pop(frame, token, max_wait);
        if (status == PreloadQueue::PopStatus::Frame) {
            if (!output_.send_frame(frame.payload)) {
                warn("Socket closed while sending preload", {kv("call_id", context_.call_id)});
                return;
            }
            ++frames;
            if (!token.wait_for(settings_.frame_pacing)) {
                return;
            }
            continue;
        }
        if (status == PreloadQueue::PopStatus::End) {
            info("Preloaded audio sent", {kv("call_id", context_.call_id), kv("frames", frames)});
        } else if (status == PreloadQueue::PopStatus::Timeout) {
            warn("Preload producer stalled", {kv("call_id", context_.call_id), kv("frames", frames)});
        }
        return;
    }
}

void CallSession::watch_duration(const utils::CancellationToken& token) {
    if (!token.wait_for(settings_.max_duration)) {
        return;
    }
    if (!output_.is_open()) {
        debug("Duration limit reached after the call ended", {kv("call_id", context_.call_id)});
        return;
    }
    limit_reached_.store(true);
    warn("Call duration limit reached",
         {kv("call_id", context_.call_id), kv("limit_sec", settings_.max_duration.count())});
    Metrics::instance().increment("duration_limits");

    sender_tasks_.cancel_and_join();
    turn_tasks_.cancel_and_join();
    if (token.is_canceled()) {
        return;
    }
    // A turn may have hung up while it was being canceled.
    if (!output_.is_open()) {
        debug("Call ended before the limit notice", {kv("call_id", context_.call_id)});
        return;
    }

    auto lease = gate_.try_acquire("duration_monitor");
    SpeechResult speech;
    if (!settings_.limit_message.empty()) {
        try {
            speech = engine_.speak(settings_.limit_message, output_, token);
        } catch (const std::exception& ex) {
            error("Limit message failed", {kv("call_id", context_.call_id), kv("error", ex.what())});
        }
    }
    engine_.end_call(speech, output_, context_.call_id, "Duration Limit Reached", token);
}

void CallSession::teardown() {
    set_state(State::Terminating);
    session_token_.cancel();
    sender_tasks_.cancel_and_join();
    turn_tasks_.cancel_and_join();
    monitor_tasks_.cancel_and_join();
    output_.close(kCloseNormal, "Session ended");
    set_state(State::Closed);

    const auto duration = duration_sec().value_or(0.0);
    try {
        persist(static_cast<int>(duration));
    } catch (const std::exception& ex) {
        error("Call record update failed", {kv("call_id", context_.call_id), kv("error", ex.what())});
    }

    if (!context_.call_id.empty()) {
        services_.preload.discard(context_.call_id);
    }
    Metrics::instance().increment("calls_completed");
    Metrics::instance().session_closed();
    info("Media session closed",
         {kv("call_id", context_.call_id),
          kv("duration_sec", static_cast<int>(duration)),
          kv("limit_reached", limit_reached_.load()),
          kv("dropped_frames", inbound_.dropped_frames())});
}

void CallSession::persist(int duration_sec) {
    std::optional<backend::CallRecord> record;
    if (context_.record_id) {
        record = services_.records.find(*context_.record_id);
    } else if (!context_.call_id.empty()) {
        record = services_.records.find_latest_by_call_id(context_.call_id);
    }
    if (!record) {
        warn("Call record not found",
             {kv("record_id", context_.record_id.value_or("")), kv("call_id", context_.call_id)});
        return;
    }

    record->status = "completed";
    record->duration_seconds = duration_sec;
    record->transcript = history_.transcript();
    record->cost = static_cast<double>(duration_sec) / 60.0 * settings_.cost_per_minute;
    services_.records.update(*record);
    info("Call record updated",
         {kv("record_id", record->id), kv("duration_sec", duration_sec), kv("status", record->status)});

    if (record->direction != "inbound" || !record->user_id || !services_.alerts) {
        return;
    }
    backend::CallSummary summary;
    summary.from_number = record->from_number;
    summary.to_number = record->to_number;
    summary.duration_seconds = record->duration_seconds;
    summary.status = record->status;
    summary.transcript = record->transcript;
    try {
        services_.alerts->notify_user(*record->user_id, backend::format_call_alert(summary));
    } catch (const std::exception& ex) {
        warn("Inbound alert failed", {kv("call_id", context_.call_id), kv("error", ex.what())});
    }
}

}
