#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <unordered_map>
#include <utility>

using TimerId = uint64_t;
constexpr TimerId kNoTimer = 0;

// Millisecond timer queue driven by an external clock. Callbacks run from
// run_due() on the caller's thread, never while the queue lock is held, so a
// callback may schedule or cancel timers freely.
class Scheduler {
public:
    using Callback = std::function<void()>;

    TimerId schedule_at(uint64_t due_ms, Callback cb);
    TimerId schedule_after(uint64_t delay_ms, Callback cb);
    bool cancel(TimerId id);
    bool is_pending(TimerId id) const;

    // Fires every timer due at or before now_ms, in due order. While a
    // callback runs, now_ms() reports that timer's due time.
    std::size_t run_due(uint64_t now_ms);

    void cancel_all();
    uint64_t now_ms() const;
    std::size_t pending() const;

private:
    using Key = std::pair<uint64_t, TimerId>;

    mutable std::mutex mutex_;
    std::map<Key, Callback> queue_;
    std::unordered_map<TimerId, uint64_t> due_by_id_;
    uint64_t now_ms_ = 0;
    TimerId next_id_ = 1;
};
