#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>

namespace mcpsse {

/// Single-threaded set of one-shot and repeating timers.
///
/// Time is supplied by the caller, so the owner decides whether it runs on
/// the steady clock or on a manual clock. Callbacks run inside run_due()
/// and may schedule or cancel timers, including their own.
class TimerQueue {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration = std::chrono::milliseconds;
    using TimerId = uint64_t;
    using Callback = std::function<void()>;

    TimerId schedule_once(TimePoint now, Duration delay, Callback cb);
    TimerId schedule_every(TimePoint now, Duration interval, Callback cb);

    /// Returns false when the timer already fired or was cancelled.
    bool cancel(TimerId id);

    /// Cancel everything; returns how many timers were still pending.
    size_t cancel_all();

    /// Fire every timer whose deadline is at or before `now`, earliest
    /// first, ties in scheduling order. Returns the number of callbacks run.
    size_t run_due(TimePoint now);

    [[nodiscard]] std::optional<TimePoint> next_deadline() const;
    [[nodiscard]] bool is_pending(TimerId id) const { return timers_.count(id) > 0; }
    [[nodiscard]] size_t pending() const noexcept { return timers_.size(); }

private:
    struct Timer {
        TimePoint deadline;
        Duration interval{0};   // zero for one-shot timers
        Callback cb;
    };

    std::map<TimerId, Timer>::iterator earliest();

    std::map<TimerId, Timer> timers_;
    TimerId next_id_{1};
};

} // namespace mcpsse
