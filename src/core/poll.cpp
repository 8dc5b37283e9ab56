#include <erpl_gui/core/poll.hpp>

#include <thread>

namespace erpl_gui {

IClock::TimePoint SystemClock::Now() const {
    return std::chrono::steady_clock::now();
}

void SystemClock::SleepFor(std::chrono::milliseconds duration) {
    std::this_thread::sleep_for(duration);
}

PollStats PollUntil(IClock& clock,
                    const PollOptions& options,
                    const std::function<bool()>& predicate) {
    const auto start = clock.Now();
    const auto deadline = start + options.timeout;

    PollStats stats;
    for (;;) {
        ++stats.attempts;
        if (predicate()) {
            stats.outcome = PollOutcome::Satisfied;
            break;
        }
        if (clock.Now() >= deadline) {
            stats.outcome = PollOutcome::TimedOut;
            break;
        }
        clock.SleepFor(options.interval);
    }

    stats.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        clock.Now() - start);
    return stats;
}

} // namespace erpl_gui
