#include <catch2/catch_test_macros.hpp>

#include "voice_bridge/call/stream_registry.hpp"

#include <chrono>
#include <optional>
#include <set>
#include <string>

using voice_bridge::call::CallContext;
using voice_bridge::call::RegistryError;
using voice_bridge::call::StreamRegistry;

namespace {

CallContext context_for(const std::string& stream_id) {
    CallContext context;
    context.stream_id = stream_id;
    context.initial_prompt = "Confirm the appointment";
    return context;
}

}

TEST_CASE("resolve hands a context out exactly once") {
    StreamRegistry registry(std::chrono::seconds(300));
    registry.register_stream(context_for("s1"));

    const auto first = registry.resolve("s1");
    REQUIRE(first.has_value());
    REQUIRE(first->initial_prompt == std::string("Confirm the appointment"));
    REQUIRE_FALSE(registry.resolve("s1").has_value());
    REQUIRE(registry.size() == 0);
}

TEST_CASE("duplicate and empty stream ids are rejected") {
    StreamRegistry registry(std::chrono::seconds(300));
    registry.register_stream(context_for("s1"));
    REQUIRE_THROWS_AS(registry.register_stream(context_for("s1")), RegistryError);
    REQUIRE_THROWS_AS(registry.register_stream(context_for("")), RegistryError);
}

TEST_CASE("bind_call fills in ids after dialing") {
    StreamRegistry registry(std::chrono::seconds(300));
    registry.register_stream(context_for("s1"));
    REQUIRE(registry.bind_call("s1", "v3:abc", std::string("42")));
    REQUIRE_FALSE(registry.bind_call("missing", "v3:abc", std::nullopt));

    const auto context = registry.resolve("s1");
    REQUIRE(context->call_id == "v3:abc");
    REQUIRE(context->record_id == std::string("42"));
}

TEST_CASE("unresolved registrations expire after the ttl") {
    StreamRegistry registry(std::chrono::seconds(10));
    const auto start = StreamRegistry::Clock::now();
    registry.register_stream(context_for("old"), start);
    registry.register_stream(context_for("new"), start + std::chrono::seconds(8));

    REQUIRE(registry.evict_expired(start + std::chrono::seconds(9)) == 0);
    REQUIRE(registry.evict_expired(start + std::chrono::seconds(12)) == 1);
    REQUIRE_FALSE(registry.resolve("old").has_value());
    REQUIRE(registry.resolve("new").has_value());
}

TEST_CASE("generated stream ids are 128-bit hex and distinct") {
    std::set<std::string> ids;
    for (int i = 0; i < 100; ++i) {
        const auto id = StreamRegistry::generate_stream_id();
        REQUIRE(id.size() == 32);
        REQUIRE(id.find_first_not_of("0123456789abcdef") == std::string::npos);
        ids.insert(id);
    }
    REQUIRE(ids.size() == 100);
}
