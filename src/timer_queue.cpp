#include "mcpsse/timer_queue.hpp"
#include <stdexcept>

namespace mcpsse {

TimerQueue::TimerId TimerQueue::schedule_once(TimePoint now, Duration delay, Callback cb) {
    TimerId id = next_id_++;
    timers_[id] = Timer{now + delay, Duration{0}, std::move(cb)};
    return id;
}

TimerQueue::TimerId TimerQueue::schedule_every(TimePoint now, Duration interval, Callback cb) {
    if (interval <= Duration{0}) {
        throw std::invalid_argument("Timer interval must be positive");
    }
    TimerId id = next_id_++;
    timers_[id] = Timer{now + interval, interval, std::move(cb)};
    return id;
}

bool TimerQueue::cancel(TimerId id) {
    return timers_.erase(id) > 0;
}

size_t TimerQueue::cancel_all() {
    size_t n = timers_.size();
    timers_.clear();
    return n;
}

std::map<TimerQueue::TimerId, TimerQueue::Timer>::iterator TimerQueue::earliest() {
    auto best = timers_.end();
    for (auto it = timers_.begin(); it != timers_.end(); ++it) {
        // Map order is scheduling order, so strict < keeps ties stable.
        if (best == timers_.end() || it->second.deadline < best->second.deadline) {
            best = it;
        }
    }
    return best;
}

size_t TimerQueue::run_due(TimePoint now) {
    size_t fired = 0;
    while (true) {
        auto it = earliest();
        if (it == timers_.end() || it->second.deadline > now) break;

        // Copy before the callback runs: it may cancel this very timer.
        Callback cb = it->second.cb;
        if (it->second.interval > Duration{0}) {
            it->second.deadline += it->second.interval;
        } else {
            timers_.erase(it);
        }
        ++fired;
        if (cb) cb();
    }
    return fired;
}

std::optional<TimerQueue::TimePoint> TimerQueue::next_deadline() const {
    std::optional<TimePoint> next;
    for (const auto& entry : timers_) {
        if (!next || entry.second.deadline < *next) next = entry.second.deadline;
    }
    return next;
}

} // namespace mcpsse
