#include "scheduler.hpp"

TimerId Scheduler::schedule_at(uint64_t due_ms, Callback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    const TimerId id = next_id_++;
    queue_.emplace(Key{due_ms, id}, std::move(cb));
    due_by_id_[id] = due_ms;
    return id;
}

TimerId Scheduler::schedule_after(uint64_t delay_ms, Callback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    const TimerId id = next_id_++;
    const uint64_t due_ms = now_ms_ + delay_ms;
    queue_.emplace(Key{due_ms, id}, std::move(cb));
    due_by_id_[id] = due_ms;
    return id;
}

bool Scheduler::cancel(TimerId id) {
    if (id == kNoTimer) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = due_by_id_.find(id);
    if (it == due_by_id_.end()) {
        return false;
    }
    queue_.erase(Key{it->second, id});
    due_by_id_.erase(it);
    return true;
}

bool Scheduler::is_pending(TimerId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return due_by_id_.count(id) != 0;
}

std::size_t Scheduler::run_due(uint64_t now_ms) {
    std::size_t fired = 0;
    for (;;) {
        Callback cb;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (queue_.empty() || queue_.begin()->first.first > now_ms) {
                if (now_ms > now_ms_) {
                    now_ms_ = now_ms;
                }
                break;
            }
            auto it = queue_.begin();
            if (it->first.first > now_ms_) {
                now_ms_ = it->first.first;
            }
            cb = std::move(it->second);
            due_by_id_.erase(it->first.second);
            queue_.erase(it);
        }
        if (cb) {
            cb();
        }
        fired++;
    }
    return fired;
}

void Scheduler::cancel_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.clear();
    due_by_id_.clear();
}

uint64_t Scheduler::now_ms() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return now_ms_;
}

std::size_t Scheduler::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}
