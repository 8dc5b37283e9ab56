#pragma once

#include <chrono>
#include <functional>

namespace erpl_gui {

// ---------------------------------------------------------------------------
// IClock - time source and sleep for every wait in the logon flow.
//
// SAP GUI Scripting offers no readiness notifications, so all waiting is
// polling. Injecting the clock lets tests run the poll loops without real
// delays.
// ---------------------------------------------------------------------------
class IClock {
public:
    using TimePoint = std::chrono::steady_clock::time_point;

    virtual ~IClock() = default;

    [[nodiscard]] virtual TimePoint Now() const = 0;
    virtual void SleepFor(std::chrono::milliseconds duration) = 0;
};

// Wall clock backed by std::chrono::steady_clock and std::this_thread.
class SystemClock : public IClock {
public:
    [[nodiscard]] TimePoint Now() const override;
    void SleepFor(std::chrono::milliseconds duration) override;
};

// ---------------------------------------------------------------------------
// PollOptions - interval between attempts and overall deadline.
// ---------------------------------------------------------------------------
struct PollOptions {
    std::chrono::milliseconds interval{500};
    std::chrono::milliseconds timeout{30000};
};

enum class PollOutcome {
    Satisfied,
    TimedOut,
};

struct PollStats {
    PollOutcome outcome = PollOutcome::TimedOut;
    int attempts = 0;
    std::chrono::milliseconds elapsed{0};
};

// ---------------------------------------------------------------------------
// PollUntil - evaluate `predicate` until it returns true or the deadline
// passes, sleeping `options.interval` between attempts. The predicate runs at
// least once. Each attempt must be self-contained: nothing carries over from a
// failed attempt.
// ---------------------------------------------------------------------------
PollStats PollUntil(IClock& clock,
                    const PollOptions& options,
                    const std::function<bool()>& predicate);

} // namespace erpl_gui
