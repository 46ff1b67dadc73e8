#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "fakes.hpp"

#include "voice_bridge/call/conversation.hpp"

#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

using Catch::Matchers::WithinAbs;
using voice_bridge::audio::WireCodec;
using voice_bridge::call::ConversationEngine;
using voice_bridge::call::ConversationHistory;
using voice_bridge::call::MediaOutput;
using voice_bridge::call::SessionSettings;
using voice_bridge::call::playback_wait_seconds;
using voice_bridge::utils::CancellationToken;

namespace {

SessionSettings fast_settings() {
    SessionSettings settings;
    settings.system_prompt = "You are a test agent.";
    settings.echo_tail = std::chrono::duration<double>(0);
    settings.hangup_buffer = std::chrono::duration<double>(0);
    settings.speech_pad = std::chrono::duration<double>(0);
    settings.frame_pacing = std::chrono::milliseconds(0);
    return settings;
}

}

TEST_CASE("playback wait covers unplayed audio plus the buffer") {
    REQUIRE_THAT(playback_wait_seconds(WireCodec::Pcmu, 0, std::nullopt, 0.1),
                 WithinAbs(0.1, 1e-9));
    REQUIRE_THAT(playback_wait_seconds(WireCodec::Pcmu, 16000, std::nullopt, 0.1),
                 WithinAbs(2.1, 1e-9));
    REQUIRE_THAT(playback_wait_seconds(WireCodec::Pcmu, 16000, 0.5, 0.1),
                 WithinAbs(1.6, 1e-9));
    REQUIRE_THAT(playback_wait_seconds(WireCodec::L16, 16000, 0.5, 0.1),
                 WithinAbs(0.6, 1e-9));
    REQUIRE_THAT(playback_wait_seconds(WireCodec::Pcmu, 8000, 3.0, 0.1),
                 WithinAbs(0.1, 1e-9));
}

TEST_CASE("messages carry the whole history when context is enabled") {
    const auto settings = fast_settings();
    ConversationHistory history;
    voice_bridge::test::FakeChat llm;
    voice_bridge::test::FakeTextToSpeech tts;
    voice_bridge::test::FakeCallControl control;
    ConversationEngine engine(settings, history, llm, tts, control);

    history.add_assistant("Hi, this is Ava.");
    history.add_user("Who is this?");
    const auto messages = engine.build_messages("Who is this?");
    REQUIRE(messages.size() == 3);
    REQUIRE(messages[0].role == "system");
    REQUIRE(messages[1].content == "Hi, this is Ava.");
    REQUIRE(messages[2].role == "user");

    auto stateless = settings;
    stateless.send_context = false;
    ConversationEngine engine2(stateless, history, llm, tts, control);
    const auto single = engine2.build_messages("Again?");
    REQUIRE(single.size() == 2);
    REQUIRE(single[1].content == "Again?");
}

TEST_CASE("a turn speaks the reply and returns to listening") {
    const auto settings = fast_settings();
    ConversationHistory history;
    voice_bridge::test::FakeChat llm("Sure thing \xF0\x9F\x98\x80 see you at noon.");
    voice_bridge::test::FakeTextToSpeech tts;
    voice_bridge::test::FakeCallControl control;
    voice_bridge::test::FakeSocket socket;
    MediaOutput output(socket, WireCodec::Pcmu);
    output.set_stream_id("media-1");
    ConversationEngine engine(settings, history, llm, tts, control);
    CancellationToken token;

    const auto outcome = engine.run_turn("Can we meet at noon?", output, "call-1", token);

    REQUIRE_FALSE(outcome.failed);
    REQUIRE_FALSE(outcome.hangup);
    REQUIRE(outcome.spoken == "Sure thing  see you at noon.");
    REQUIRE(tts.texts().size() == 1);
    REQUIRE(llm.streamed().at(0));
    REQUIRE(control.hangups.empty());
    REQUIRE(socket.is_open());

    const auto sent = socket.sent();
    REQUIRE(sent.size() == 4);
    const auto first = nlohmann::json::parse(sent.front());
    REQUIRE(first["event"] == "media");
    REQUIRE(first["stream_id"] == "media-1");
    REQUIRE(voice_bridge::audio::decode_base64(first["media"]["payload"].get<std::string>())
                .size() == 480);

    REQUIRE(history.transcript() ==
            "User: Can we meet at noon?\nAssistant: Sure thing  see you at noon.");
}

TEST_CASE("a hangup directive ends the call after playback") {
    const auto settings = fast_settings();
    ConversationHistory history;
    voice_bridge::test::FakeChat llm(
        "Goodbye, have a nice day!\n```json\n{\"action\": \"hangup\", \"reason\": \"bye\"}\n```");
    voice_bridge::test::FakeTextToSpeech tts;
    voice_bridge::test::FakeCallControl control;
    voice_bridge::test::FakeSocket socket;
    MediaOutput output(socket, WireCodec::Pcmu);
    ConversationEngine engine(settings, history, llm, tts, control);
    CancellationToken token;

    const auto outcome = engine.run_turn("That's all, bye.", output, "call-7", token);

    REQUIRE(outcome.hangup);
    REQUIRE(outcome.spoken == "Goodbye, have a nice day!");
    REQUIRE(tts.texts().at(0) == "Goodbye, have a nice day!");
    REQUIRE(control.hangups == std::vector<std::string>{"call-7"});
    REQUIRE(socket.close_code() == voice_bridge::call::kCloseNormal);
    REQUIRE(socket.close_reason() == "Call ended");
}

TEST_CASE("an llm failure abandons the turn without speaking") {
    const auto settings = fast_settings();
    ConversationHistory history;
    voice_bridge::test::FakeChat llm;
    llm.fail = true;
    voice_bridge::test::FakeTextToSpeech tts;
    voice_bridge::test::FakeCallControl control;
    voice_bridge::test::FakeSocket socket;
    MediaOutput output(socket, WireCodec::Pcmu);
    ConversationEngine engine(settings, history, llm, tts, control);
    CancellationToken token;

    const auto outcome = engine.run_turn("Hello?", output, "call-1", token);

    REQUIRE(outcome.failed);
    REQUIRE(socket.sent().empty());
    REQUIRE(tts.texts().empty());
    REQUIRE(history.size() == 1);
}

TEST_CASE("speech stops when the turn is canceled") {
    auto settings = fast_settings();
    settings.frame_pacing = std::chrono::milliseconds(20);
    ConversationHistory history;
    voice_bridge::test::FakeChat llm;
    voice_bridge::test::FakeTextToSpeech tts(8000 * 5);
    voice_bridge::test::FakeCallControl control;
    voice_bridge::test::FakeSocket socket;
    MediaOutput output(socket, WireCodec::Pcmu);
    ConversationEngine engine(settings, history, llm, tts, control);
    CancellationToken token;

    std::thread canceller([&token]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        token.cancel();
    });
    const auto speech = engine.speak("A long monologue.", output, token);
    canceller.join();

    REQUIRE(speech.interrupted);
    REQUIRE(speech.emitted_bytes < 8000 * 5);
    REQUIRE_FALSE(engine.end_call(speech, output, "call-1", "Call ended", token));
    REQUIRE(control.hangups.empty());
}
