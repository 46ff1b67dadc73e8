#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"

#include "voice_bridge/backend/records.hpp"
#include "voice_bridge/call/preload.hpp"
#include "voice_bridge/call/session.hpp"

#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

using voice_bridge::audio::WireCodec;
using voice_bridge::call::CallContext;
using voice_bridge::call::CallDirection;
using voice_bridge::call::CallSession;
using voice_bridge::call::SessionServices;
using voice_bridge::call::SessionSettings;
using voice_bridge::test::wait_until;

namespace {

SessionSettings fast_settings() {
    SessionSettings settings;
    settings.system_prompt = "You are a test agent.";
    settings.echo_tail = std::chrono::duration<double>(0);
    settings.greeting_echo_tail = std::chrono::duration<double>(0);
    settings.hangup_buffer = std::chrono::duration<double>(0);
    settings.speech_pad = std::chrono::duration<double>(0);
    settings.initial_silence = std::chrono::duration<double>(0);
    settings.frame_pacing = std::chrono::milliseconds(0);
    settings.priming_frames = 2;
    settings.max_duration = std::chrono::duration<double>(60);
    settings.limit_message = "Time is up.";
    return settings;
}

nlohmann::json start_event(const std::string& media_stream_id) {
    return {{"event", "start"}, {"start", {{"stream_id", media_stream_id}}}};
}

std::string media_event(const std::string& payload) {
    nlohmann::json message = {{"event", "media"}, {"media", {{"payload", payload}}}};
    return message.dump();
}

std::string loud_payload() {
    std::vector<int16_t> pcm(160);
    for (size_t i = 0; i < pcm.size(); ++i) {
        pcm[i] = (i % 2 == 0) ? 4000 : -4000;
    }
    return voice_bridge::audio::encode_base64(voice_bridge::audio::encode(WireCodec::Pcmu, pcm));
}

std::string quiet_payload() {
    return voice_bridge::audio::encode_base64(
        voice_bridge::audio::silence(WireCodec::Pcmu, std::chrono::milliseconds(20)));
}

// Shared collaborators for one session under test.
struct Harness {
    voice_bridge::test::FakeSocket socket;
    voice_bridge::test::FakeSpeechToText stt;
    voice_bridge::test::FakeTextToSpeech tts;
    voice_bridge::test::FakeChat llm{"Nice to meet you."};
    voice_bridge::test::FakeCallControl control;
    voice_bridge::test::FakeAlerts alerts;
    voice_bridge::backend::MemoryCallRecordStore records;
    voice_bridge::call::PreloadBroker preload{std::chrono::seconds(300)};

    SessionServices services() {
        return SessionServices{stt, tts, llm, control, records, preload, &alerts};
    }

    CallContext context(CallDirection direction = CallDirection::Outbound) {
        voice_bridge::backend::CallRecord record;
        record.call_id = "call-1";
        record.direction = voice_bridge::call::direction_name(direction);
        record.from_number = "+15550001111";
        record.to_number = "+15550002222";
        if (direction == CallDirection::Inbound) {
            record.user_id = "user-9";
        }
        const auto created = records.create(record);

        CallContext result;
        result.stream_id = "stream-1";
        result.call_id = "call-1";
        result.record_id = created.id;
        result.direction = direction;
        return result;
    }
};

}

TEST_CASE("stop before start closes the session without touching the record") {
    Harness harness;
    auto context = harness.context();
    const auto record_id = *context.record_id;
    CallSession session(context, fast_settings(), harness.socket, harness.services());

    harness.socket.push(nlohmann::json{{"event", "connected"}});
    harness.socket.push(nlohmann::json{{"event", "stop"}});
    session.run();

    REQUIRE(session.state() == CallSession::State::Closed);
    REQUIRE(harness.socket.close_reason() == "Handshake aborted");
    // Two priming frames went out for "connected".
    REQUIRE(harness.socket.sent_count() == 2);
    REQUIRE(harness.records.find(record_id)->status == "initiated");
}

TEST_CASE("malformed handshake message aborts the session") {
    Harness harness;
    CallSession session(harness.context(), fast_settings(), harness.socket, harness.services());
    harness.socket.push(std::string("not json"));
    session.run();
    REQUIRE(session.state() == CallSession::State::Closed);
    REQUIRE(harness.socket.close_code() == voice_bridge::call::kCloseNormal);
}

TEST_CASE("preloaded greeting plays first and lands in the transcript") {
    Harness harness;
    auto queue = harness.preload.create("call-1");
    for (const auto* payload : {"one", "two", "three"}) {
        voice_bridge::audio::AudioFrame frame;
        frame.payload = payload;
        queue->push(frame);
    }
    queue->set_greeting("Hello, this is Ava.");
    queue->close();

    auto context = harness.context();
    const auto record_id = *context.record_id;
    CallSession session(context, fast_settings(), harness.socket, harness.services());
    std::thread runner([&session]() { session.run(); });

    harness.socket.push(start_event("media-42"));
    REQUIRE(wait_until([&]() { return session.history().size() == 1; }));
    harness.socket.push(nlohmann::json{{"event", "stop"}});
    runner.join();

    const auto sent = harness.socket.sent();
    REQUIRE(sent.size() == 3);
    const auto first = nlohmann::json::parse(sent[0]);
    REQUIRE(first["stream_id"] == "media-42");
    REQUIRE(voice_bridge::audio::decode_base64(first["media"]["payload"].get<std::string>()) ==
            "one");

    REQUIRE(session.state() == CallSession::State::Closed);
    REQUIRE(harness.socket.close_reason() == "Session ended");
    const auto record = harness.records.find(record_id);
    REQUIRE(record->status == "completed");
    REQUIRE(record->transcript == "Assistant: Hello, this is Ava.");
    REQUIRE(harness.alerts.alerts.empty());
    REQUIRE(harness.preload.size() == 0);
}

TEST_CASE("caller speech is transcribed and answered") {
    Harness harness;
    auto context = harness.context(CallDirection::Inbound);
    const auto record_id = *context.record_id;
    CallSession session(context, fast_settings(), harness.socket, harness.services());
    std::thread runner([&session]() { session.run(); });

    harness.socket.push(start_event("media-1"));
    // Frames sent while the opening audio holds the gate would be dropped.
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    for (int i = 0; i < 30; ++i) {
        harness.socket.push(media_event(loud_payload()));
    }
    for (int i = 0; i < 65; ++i) {
        harness.socket.push(media_event(quiet_payload()));
    }

    REQUIRE(wait_until([&]() { return session.history().size() == 2; }));
    harness.socket.push(nlohmann::json{{"event", "stop"}});
    runner.join();

    REQUIRE(harness.stt.calls == 1);
    REQUIRE(harness.tts.texts() == std::vector<std::string>{"Nice to meet you."});
    REQUIRE(harness.socket.sent_count() >= 4);

    const auto record = harness.records.find(record_id);
    REQUIRE(record->transcript == "User: hello there\nAssistant: Nice to meet you.");
    REQUIRE(harness.alerts.alerts.size() == 1);
    REQUIRE(harness.alerts.alerts[0].first == "user-9");
    REQUIRE(harness.alerts.alerts[0].second.find("**Inbound Call Alert**") == 0);
}

TEST_CASE("duration limit speaks the notice and hangs up exactly once") {
    Harness harness;
    auto settings = fast_settings();
    settings.max_duration = std::chrono::duration<double>(0.3);
    auto context = harness.context();
    const auto record_id = *context.record_id;
    CallSession session(context, settings, harness.socket, harness.services());
    std::thread runner([&session]() { session.run(); });

    harness.socket.push(start_event("media-1"));
    runner.join();

    REQUIRE(harness.tts.texts() == std::vector<std::string>{"Time is up."});
    REQUIRE(harness.control.hangup_count() == 1);
    REQUIRE(harness.control.hangups[0] == "call-1");
    REQUIRE(harness.socket.close_reason() == "Duration Limit Reached");
    // Teardown closes the already-closed socket again without changing it.
    REQUIRE(harness.socket.close_calls() >= 2);
    REQUIRE(harness.socket.close_code() == voice_bridge::call::kCloseNormal);
    REQUIRE(session.state() == CallSession::State::Closed);
    REQUIRE(harness.records.find(record_id)->status == "completed");
}

namespace {

// Feeds one spoken utterance once the opening audio has released the gate.
void speak_utterance(voice_bridge::test::FakeSocket& socket) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    for (int i = 0; i < 30; ++i) {
        socket.push(media_event(loud_payload()));
    }
    for (int i = 0; i < 65; ++i) {
        socket.push(media_event(quiet_payload()));
    }
}

}

TEST_CASE("duration limit interrupts a turn stuck on the text backend") {
    Harness harness;
    harness.llm.stall = true;
    auto settings = fast_settings();
    settings.max_duration = std::chrono::duration<double>(1.0);
    auto context = harness.context();
    const auto record_id = *context.record_id;
    CallSession session(context, settings, harness.socket, harness.services());

    const auto start = std::chrono::steady_clock::now();
    std::thread runner([&session]() { session.run(); });
    harness.socket.push(start_event("media-1"));
    speak_utterance(harness.socket);
    REQUIRE(wait_until([&]() { return harness.llm.stalled.load(); }));
    runner.join();
    const auto elapsed = std::chrono::steady_clock::now() - start;

    // Limit plus the short notice, far below the 30 s the backend would hold.
    REQUIRE(elapsed >= std::chrono::milliseconds(1000));
    REQUIRE(elapsed < std::chrono::milliseconds(4000));
    REQUIRE(harness.tts.texts() == std::vector<std::string>{"Time is up."});
    REQUIRE(harness.control.hangup_count() == 1);
    REQUIRE(harness.socket.close_reason() == "Duration Limit Reached");
    REQUIRE(harness.records.find(record_id)->transcript == "User: hello there");
}

TEST_CASE("remote close does not wait for a stuck text backend") {
    Harness harness;
    harness.llm.stall = true;
    CallSession session(harness.context(), fast_settings(), harness.socket, harness.services());
    std::thread runner([&session]() { session.run(); });

    harness.socket.push(start_event("media-1"));
    speak_utterance(harness.socket);
    REQUIRE(wait_until([&]() { return harness.llm.stalled.load(); }));

    const auto closed_at = std::chrono::steady_clock::now();
    harness.socket.remote_close();
    runner.join();

    REQUIRE(std::chrono::steady_clock::now() - closed_at < std::chrono::seconds(3));
    REQUIRE(session.state() == CallSession::State::Closed);
    REQUIRE(harness.tts.texts().empty());
    REQUIRE(harness.control.hangup_count() == 0);
}

TEST_CASE("remote socket close tears the session down") {
    Harness harness;
    auto context = harness.context();
    CallSession session(context, fast_settings(), harness.socket, harness.services());
    std::thread runner([&session]() { session.run(); });

    harness.socket.push(nlohmann::json{{"event", "media"}, {"stream_id", "media-7"}});
    REQUIRE(wait_until([&]() { return session.state() == CallSession::State::Active; }));
    harness.socket.remote_close();
    runner.join();

    REQUIRE(session.media_stream_id() == "media-7");
    REQUIRE(session.state() == CallSession::State::Closed);
    REQUIRE(session.duration_sec().has_value());
    REQUIRE(harness.control.hangup_count() == 0);
}
