#include <catch2/catch_test_macros.hpp>

#include "voice_bridge/server/media_server.hpp"
#include "voice_bridge/server/rest_server.hpp"

#include <optional>
#include <string>

using voice_bridge::server::RestServer;
using voice_bridge::server::parse_stream_resource;

TEST_CASE("stream resource requires the prefix and the shared secret") {
    const auto request = parse_stream_resource("/voice/stream/abc123?token=secret&delay_ms=400",
                                               "secret");
    REQUIRE(request.has_value());
    REQUIRE(request->stream_id == "abc123");
    REQUIRE(request->delay_ms == 400);

    REQUIRE_FALSE(parse_stream_resource("/voice/stream/abc123?token=wrong", "secret"));
    REQUIRE_FALSE(parse_stream_resource("/voice/stream/abc123", "secret"));
    REQUIRE_FALSE(parse_stream_resource("/voice/stream/?token=secret", "secret"));
    REQUIRE_FALSE(parse_stream_resource("/other/abc123?token=secret", "secret"));
    REQUIRE_FALSE(parse_stream_resource("/voice/stream/a/b?token=secret", "secret"));
}

TEST_CASE("malformed or negative delays fall back to zero") {
    REQUIRE(parse_stream_resource("/voice/stream/x?token=s&delay_ms=soon", "s")->delay_ms == 0);
    REQUIRE(parse_stream_resource("/voice/stream/x?token=s&delay_ms=-20", "s")->delay_ms == 0);
}

TEST_CASE("call endpoint authorization distinguishes missing and wrong tokens") {
    httplib::Response response;
    httplib::Request anonymous;
    REQUIRE(RestServer::authorize(std::nullopt, anonymous, response));

    REQUIRE_FALSE(RestServer::authorize(std::string("t0ken"), anonymous, response));
    REQUIRE(response.status == 401);

    httplib::Request wrong;
    wrong.headers.emplace("Authorization", "Bearer nope");
    REQUIRE_FALSE(RestServer::authorize(std::string("t0ken"), wrong, response));
    REQUIRE(response.status == 403);

    httplib::Request good;
    good.headers.emplace("Authorization", "Bearer t0ken");
    REQUIRE(RestServer::authorize(std::string("t0ken"), good, response));
}
