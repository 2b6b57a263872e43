#include "tasks.hpp"

#include "logging.hpp"

#include <algorithm>

namespace {
uint32_t default_budget(uint32_t period_ms, uint32_t jitter_ms) {
    return 2 * (period_ms + jitter_ms);
}
} // namespace

std::array<TaskConfig, kTaskCount> mesh_task_plan(const NodeConfig& cfg) {
    return {{
        {"SlotManagerTask", 5, cfg.slot_cycle_ms, cfg.slot_cycle_jitter_ms, true,
         default_budget(cfg.slot_cycle_ms, cfg.slot_cycle_jitter_ms)},
        {"ConnectionRotationTask", 3, cfg.rotation_interval_ms, cfg.rotation_jitter_ms, false, 0},
        {"TopologyGossipTask", 4, cfg.gossip_interval_ms, 0, true, default_budget(cfg.gossip_interval_ms, 0)},
        {"PacketCacheSweepTask", 2, cfg.packet_sweep_interval_ms, 0, true,
         default_budget(cfg.packet_sweep_interval_ms, 0)},
        {"HealingTask", 3, cfg.healing_interval_ms, 0, false, 0},
    }};
}

MeshTaskRunner::MeshTaskRunner(Scheduler& scheduler, const NodeConfig& cfg, std::mt19937& rng)
    : scheduler_(scheduler), rng_(rng), plan_(mesh_task_plan(cfg)) {
    for (std::size_t i = 0; i < kTaskCount; ++i) {
        slots_[i].cfg = plan_[i];
        slots_[i].hb = TaskHeartbeat{plan_[i].name, 0, 0};
        slots_[i].timer = kNoTimer;
    }
}

MeshTaskRunner::~MeshTaskRunner() {
    stop();
}

void MeshTaskRunner::bind(MeshTask task, TaskFn fn) {
    slots_[static_cast<std::size_t>(task)].fn = std::move(fn);
}

void MeshTaskRunner::start() {
    if (running_) {
        return;
    }
    running_ = true;
    // Higher priority tasks are armed first so they win ties on the same due time.
    std::array<std::size_t, kTaskCount> order{};
    for (std::size_t i = 0; i < kTaskCount; ++i) {
        order[i] = i;
    }
    std::sort(order.begin(), order.end(), [this](std::size_t a, std::size_t b) {
        if (slots_[a].cfg.priority == slots_[b].cfg.priority) {
            return slots_[a].cfg.period_ms < slots_[b].cfg.period_ms;
        }
        return slots_[a].cfg.priority > slots_[b].cfg.priority;
    });
    const uint64_t now = scheduler_.now_ms();
    for (std::size_t i : order) {
        slots_[i].hb.last_beat_ms = now;
        if (slots_[i].fn) {
            arm(i);
        }
    }
}

void MeshTaskRunner::stop() {
    running_ = false;
    for (auto& slot : slots_) {
        scheduler_.cancel(slot.timer);
        slot.timer = kNoTimer;
    }
}

void MeshTaskRunner::arm(std::size_t index) {
    TaskSlot& slot = slots_[index];
    uint64_t delay = slot.cfg.period_ms;
    if (slot.cfg.jitter_ms > 0) {
        std::uniform_int_distribution<uint32_t> jitter(0, slot.cfg.jitter_ms);
        delay += jitter(rng_);
    }
    slot.timer = scheduler_.schedule_after(delay, [this, index]() { run(index); });
}

void MeshTaskRunner::run(std::size_t index) {
    TaskSlot& slot = slots_[index];
    slot.timer = kNoTimer;
    if (!running_) {
        return;
    }
    const uint64_t now = scheduler_.now_ms();
    slot.fn(now);
    slot.hb.last_beat_ms = now;
    slot.hb.runs++;
    if (running_) {
        arm(index);
    }
}

bool MeshTaskRunner::check_watchdogs(uint64_t now_ms) {
    bool ok = true;
    for (const auto& slot : slots_) {
        if (!running_ || !slot.cfg.watchdog_protected || !slot.fn) {
            continue;
        }
        if (now_ms > slot.hb.last_beat_ms && now_ms - slot.hb.last_beat_ms > slot.cfg.watchdog_budget_ms) {
            log_warn("[TASK] %s missed its budget (%llums since last run)", slot.cfg.name,
                     static_cast<unsigned long long>(now_ms - slot.hb.last_beat_ms));
            record_fault("Task watchdog expired");
            watchdog_misses_++;
            ok = false;
        }
    }
    return ok;
}

TaskStatus MeshTaskRunner::status() const {
    TaskStatus s{};
    s.slot_manager = slots_[static_cast<std::size_t>(MeshTask::SlotManager)].hb;
    s.rotation = slots_[static_cast<std::size_t>(MeshTask::ConnectionRotation)].hb;
    s.gossip = slots_[static_cast<std::size_t>(MeshTask::TopologyGossip)].hb;
    s.cache_sweep = slots_[static_cast<std::size_t>(MeshTask::PacketCacheSweep)].hb;
    s.healing = slots_[static_cast<std::size_t>(MeshTask::Healing)].hb;
    s.watchdog_misses = watchdog_misses_;
    s.faults = fault_status();
    return s;
}
