#include <catch2/catch_test_macros.hpp>

#include "voice_bridge/utils/cancellation.hpp"
#include "voice_bridge/utils/task_group.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using voice_bridge::utils::CancellationToken;
using voice_bridge::utils::TaskGroup;

TEST_CASE("cancel_and_join interrupts a waiting task") {
    TaskGroup group("test");
    std::atomic<bool> interrupted{false};
    group.spawn("sleeper", [&](const CancellationToken& token) {
        interrupted = !token.wait_for(std::chrono::seconds(30));
    });

    const auto start = std::chrono::steady_clock::now();
    group.cancel_and_join();
    REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));
    REQUIRE(interrupted);
}

TEST_CASE("joining a group twice or after its tasks finished is harmless") {
    TaskGroup group("test");
    std::atomic<int> runs{0};
    group.spawn("quick", [&](const CancellationToken&) { ++runs; });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    group.cancel_and_join();
    group.cancel_and_join();
    group.cancel();
    REQUIRE(runs == 1);
    REQUIRE(group.active_count() == 0);
}

TEST_CASE("closed group refuses new tasks") {
    TaskGroup group("test");
    group.cancel_and_join();
    bool ran = false;
    REQUIRE_FALSE(group.spawn("late", [&](const CancellationToken&) { ran = true; }));
    REQUIRE_FALSE(ran);
}

TEST_CASE("a throwing task does not take the group down") {
    TaskGroup group("test");
    std::atomic<bool> second_ran{false};
    group.spawn("bad", [](const CancellationToken&) { throw std::runtime_error("boom"); });
    group.spawn("good", [&](const CancellationToken&) { second_ran = true; });
    group.cancel_and_join();
    REQUIRE(second_ran);
}

TEST_CASE("token wait reports cancellation and elapsed time") {
    CancellationToken token;
    REQUIRE(token.wait_for(std::chrono::milliseconds(1)));
    token.cancel();
    token.cancel();
    REQUIRE(token.is_canceled());
    REQUIRE_FALSE(token.wait_for(std::chrono::seconds(10)));
    REQUIRE_FALSE(token.wait_for(std::chrono::duration<double>(0)));
}
