#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"

#include "voice_bridge/backend/client.hpp"
#include "voice_bridge/backend/llm.hpp"
#include "voice_bridge/utils/cancellation.hpp"

#include <atomic>
#include <chrono>
#include <string>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

using voice_bridge::BackendClient;
using voice_bridge::BackendError;
using voice_bridge::Seconds;
using voice_bridge::utils::CancellationToken;

namespace {

const std::string kTokenLine = "data: {\"choices\":[{\"delta\":{\"content\":\"a\"}}]}\n\n";

// Local backend: /trickle sends one SSE token every 200 ms forever, /hang
// sends nothing until released, /reply answers at once.
class LocalBackend {
public:
    LocalBackend() {
        server_.Post("/trickle", [](const httplib::Request&, httplib::Response& res) {
            res.set_chunked_content_provider("text/event-stream",
                                             [](size_t, httplib::DataSink& sink) {
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
                return sink.write(kTokenLine.data(), kTokenLine.size());
            });
        });
        server_.Post("/hang", [this](const httplib::Request&, httplib::Response& res) {
            res.set_chunked_content_provider("text/event-stream",
                                             [this](size_t, httplib::DataSink&) {
                while (!released_) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(10));
                }
                return false;
            });
        });
        server_.Post("/reply/chat/completions", [](const httplib::Request&, httplib::Response& res) {
            res.set_content(kTokenLine + "data: [DONE]\n\n", "text/event-stream");
        });
        port_ = server_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this]() { server_.listen_after_bind(); });
        voice_bridge::test::wait_until([this]() { return server_.is_running(); });
    }

    ~LocalBackend() {
        released_ = true;
        server_.stop();
        thread_.join();
    }

    std::string url(const std::string& path = "") const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

private:
    httplib::Server server_;
    int port_ = 0;
    std::atomic<bool> released_{false};
    std::thread thread_;
};

}

TEST_CASE("streaming request is bounded by its total timeout") {
    LocalBackend backend;
    BackendClient client(backend.url(), std::nullopt, voice_bridge::BackendRequestOptions{});

    size_t chunks = 0;
    const auto start = std::chrono::steady_clock::now();
    REQUIRE_THROWS_AS(client.post_stream("/trickle", nlohmann::json::object(),
                                         [&](const char*, size_t) {
                                             ++chunks;
                                             return true;
                                         },
                                         Seconds(1.0)),
                      BackendError);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    // Each read arrives well within the timeout; only the total limit ends it.
    REQUIRE(chunks >= 2);
    REQUIRE(elapsed >= std::chrono::milliseconds(900));
    REQUIRE(elapsed < std::chrono::seconds(3));
}

TEST_CASE("canceling the token aborts a request waiting for its first byte") {
    LocalBackend backend;
    BackendClient client(backend.url(), std::nullopt, voice_bridge::BackendRequestOptions{});
    CancellationToken token;

    std::thread canceler([&token]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        token.cancel();
    });
    const auto start = std::chrono::steady_clock::now();
    REQUIRE_THROWS_AS(client.post_stream("/hang", nlohmann::json::object(),
                                         [](const char*, size_t) { return true; },
                                         Seconds(30.0), &token),
                      BackendError);
    canceler.join();

    REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(3));
}

TEST_CASE("chat client reassembles a streamed reply") {
    LocalBackend backend;
    voice_bridge::backend::OpenAiChatClient chat(backend.url("/reply"), std::nullopt, "test-model",
                                                 voice_bridge::BackendRequestOptions{});
    CancellationToken token;
    const auto reply = chat.complete({{"user", "hi"}}, true, Seconds(5.0), token);
    REQUIRE(reply == "a");
}

TEST_CASE("chat client reports cancellation as a backend error") {
    LocalBackend backend;
    voice_bridge::backend::OpenAiChatClient chat(backend.url("/reply"), std::nullopt, "test-model",
                                                 voice_bridge::BackendRequestOptions{});
    CancellationToken token;
    token.cancel();
    REQUIRE_THROWS_AS(chat.complete({{"user", "hi"}}, true, Seconds(5.0), token), BackendError);
}
