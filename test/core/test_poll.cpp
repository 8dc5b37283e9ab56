#include <catch2/catch_test_macros.hpp>

#include <erpl_gui/core/poll.hpp>

#include "../mocks/mock_gui.hpp"

#include <chrono>

using namespace erpl_gui;
using namespace erpl_gui::testing;
using namespace std::chrono_literals;

TEST_CASE("PollUntil: satisfied on first attempt does not sleep", "[poll]") {
    FakeClock clock;
    auto stats = PollUntil(clock, PollOptions{500ms, 30000ms}, [] { return true; });

    CHECK(stats.outcome == PollOutcome::Satisfied);
    CHECK(stats.attempts == 1);
    CHECK(clock.sleeps.empty());
    CHECK(stats.elapsed == 0ms);
}

TEST_CASE("PollUntil: sleeps one interval between attempts", "[poll]") {
    FakeClock clock;
    int calls = 0;
    auto stats = PollUntil(clock, PollOptions{1000ms, 30000ms},
                           [&calls] { return ++calls == 4; });

    CHECK(stats.outcome == PollOutcome::Satisfied);
    CHECK(stats.attempts == 4);
    REQUIRE(clock.sleeps.size() == 3);
    for (auto d : clock.sleeps) {
        CHECK(d == 1000ms);
    }
    CHECK(stats.elapsed == 3000ms);
}

TEST_CASE("PollUntil: times out at the deadline", "[poll]") {
    FakeClock clock;
    int calls = 0;
    auto stats = PollUntil(clock, PollOptions{500ms, 1000ms}, [&calls] {
        ++calls;
        return false;
    });

    CHECK(stats.outcome == PollOutcome::TimedOut);
    // t=0, t=500, t=1000 (deadline reached after this one).
    CHECK(calls == 3);
    CHECK(stats.attempts == 3);
    CHECK(stats.elapsed == 1000ms);
}

TEST_CASE("PollUntil: zero timeout still evaluates once", "[poll]") {
    FakeClock clock;
    int calls = 0;
    auto stats = PollUntil(clock, PollOptions{500ms, 0ms}, [&calls] {
        ++calls;
        return false;
    });

    CHECK(stats.outcome == PollOutcome::TimedOut);
    CHECK(calls == 1);
    CHECK(clock.sleeps.empty());
}

TEST_CASE("SystemClock: SleepFor advances Now", "[poll]") {
    SystemClock clock;
    auto before = clock.Now();
    clock.SleepFor(5ms);
    CHECK(clock.Now() - before >= 5ms);
}
