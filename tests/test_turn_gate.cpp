#include <catch2/catch_test_macros.hpp>

#include "voice_bridge/audio/codec.hpp"
#include "voice_bridge/call/inbound.hpp"
#include "voice_bridge/call/turn_gate.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using voice_bridge::audio::WireCodec;
using voice_bridge::call::InboundPipeline;
using voice_bridge::call::TurnGate;
using voice_bridge::vad::BoundaryReason;
using voice_bridge::vad::SegmenterOptions;

namespace {

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

}

TEST_CASE("only one holder may speak at a time") {
    TurnGate gate;
    auto first = gate.try_acquire("initial_audio");
    REQUIRE(first.has_value());
    REQUIRE(gate.is_speaking());
    REQUIRE(gate.holder() == "initial_audio");
    REQUIRE_FALSE(gate.try_acquire("turn").has_value());

    first->release();
    REQUIRE(gate.state() == TurnGate::State::Idle);
    REQUIRE(gate.try_acquire("turn").has_value());
}

TEST_CASE("lease returns the gate to idle when destroyed") {
    TurnGate gate;
    int releases = 0;
    gate.set_on_release([&releases]() { ++releases; });
    {
        auto lease = gate.try_acquire("turn");
        REQUIRE(lease.has_value());
        TurnGate::Lease moved = std::move(*lease);
        REQUIRE(moved.active());
        REQUIRE_FALSE(lease->active());
    }
    REQUIRE_FALSE(gate.is_speaking());
    REQUIRE(releases == 1);
}

TEST_CASE("frames arriving while speaking never reach the segmenter") {
    TurnGate gate;
    InboundPipeline pipeline(WireCodec::Pcmu, SegmenterOptions{}, gate);

    auto lease = gate.try_acquire("turn");
    REQUIRE(lease.has_value());
    for (int i = 0; i < 200; ++i) {
        REQUIRE_FALSE(pipeline.on_media(loud_payload()).has_value());
    }
    REQUIRE(pipeline.dropped_frames() == 200);
    REQUIRE(pipeline.accepted_frames() == 0);
    lease->release();

    // 1.3 s of silence alone must not produce an utterance from the held frames.
    for (int i = 0; i < 65; ++i) {
        REQUIRE_FALSE(pipeline.on_media(quiet_payload()).has_value());
    }
    REQUIRE(pipeline.discarded_segments() == 1);
}

TEST_CASE("pipeline yields an utterance once the caller stops talking") {
    TurnGate gate;
    InboundPipeline pipeline(WireCodec::Pcmu, SegmenterOptions{}, gate);

    for (int i = 0; i < 30; ++i) {
        REQUIRE_FALSE(pipeline.on_media(loud_payload()).has_value());
    }
    std::optional<voice_bridge::call::Utterance> utterance;
    for (int i = 0; i < 70 && !utterance; ++i) {
        utterance = pipeline.on_media(quiet_payload());
    }
    REQUIRE(utterance.has_value());
    REQUIRE(utterance->reason == BoundaryReason::SilenceDetected);
    REQUIRE(utterance->pcm.size() == 91 * 160);
}

TEST_CASE("gate release clears partially buffered speech") {
    TurnGate gate;
    InboundPipeline pipeline(WireCodec::Pcmu, SegmenterOptions{}, gate);
    gate.set_on_release([&pipeline]() { pipeline.reset(); });

    for (int i = 0; i < 30; ++i) {
        pipeline.on_media(loud_payload());
    }
    {
        auto lease = gate.try_acquire("turn");
        REQUIRE(lease.has_value());
    }
    for (int i = 0; i < 65; ++i) {
        REQUIRE_FALSE(pipeline.on_media(quiet_payload()).has_value());
    }
    REQUIRE(pipeline.discarded_segments() == 1);
}
