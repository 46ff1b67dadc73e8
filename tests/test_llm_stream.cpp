#include <catch2/catch_test_macros.hpp>

#include "voice_bridge/backend/llm.hpp"

#include <string>

using voice_bridge::backend::SseParser;

namespace {

std::string event(const std::string& content) {
    return "data: {\"choices\":[{\"delta\":{\"content\":\"" + content + "\"}}]}\n\n";
}

}

TEST_CASE("sse parser reassembles deltas in order") {
    SseParser parser;
    parser.feed(event("Hello"));
    parser.feed(event(", world"));
    parser.feed("data: [DONE]\n\n");
    REQUIRE(parser.content() == "Hello, world");
    REQUIRE(parser.done());
}

TEST_CASE("sse parser handles lines split across reads") {
    const auto stream = event("Split ") + event("across") + "data: [DONE]\n";
    SseParser parser;
    for (char ch : stream) {
        parser.feed(&ch, 1);
    }
    REQUIRE(parser.content() == "Split across");
    REQUIRE(parser.done());
}

TEST_CASE("sse parser skips role chunks comments and CRLF endings") {
    SseParser parser;
    parser.feed(": keep-alive\r\n");
    parser.feed("data: {\"choices\":[{\"delta\":{\"role\":\"assistant\"}}]}\r\n\r\n");
    parser.feed("data: {\"choices\":[{\"delta\":{\"content\":\"Hi\"}}]}\r\n\r\n");
    parser.feed("data: not json\n");
    REQUIRE(parser.content() == "Hi");
    REQUIRE_FALSE(parser.done());
}

TEST_CASE("sse parser ignores data after done") {
    SseParser parser;
    parser.feed(event("A") + "data: [DONE]\n" + event("B"));
    REQUIRE(parser.content() == "A");
}

TEST_CASE("finish processes an unterminated final line") {
    SseParser parser;
    parser.feed("data: {\"choices\":[{\"delta\":{\"content\":\"tail\"}}]}");
    REQUIRE(parser.content().empty());
    parser.finish();
    REQUIRE(parser.content() == "tail");
}

TEST_CASE("chat messages serialize as role and content") {
    const auto json = voice_bridge::backend::to_json(
        {{"system", "be brief"}, {"user", "hi"}});
    REQUIRE(json.size() == 2);
    REQUIRE(json[0]["role"] == "system");
    REQUIRE(json[1]["content"] == "hi");
}
