#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <random>

#include "config.hpp"
#include "fault.hpp"
#include "scheduler.hpp"

struct TaskConfig {
    const char* name;
    uint8_t priority;
    uint32_t period_ms;
    uint32_t jitter_ms;
    bool watchdog_protected;
    uint32_t watchdog_budget_ms;
};

struct TaskHeartbeat {
    const char* name;
    uint64_t last_beat_ms;
    uint32_t runs;
};

enum class MeshTask : uint8_t {
    SlotManager = 0,
    ConnectionRotation,
    TopologyGossip,
    PacketCacheSweep,
    Healing,
};

constexpr std::size_t kTaskCount = 5;

struct TaskStatus {
    TaskHeartbeat slot_manager;
    TaskHeartbeat rotation;
    TaskHeartbeat gossip;
    TaskHeartbeat cache_sweep;
    TaskHeartbeat healing;
    uint32_t watchdog_misses;
    FaultStatus faults;
};

// Periodic task table for one node, indexed by MeshTask.
std::array<TaskConfig, kTaskCount> mesh_task_plan(const NodeConfig& cfg);

// Runs the periodic tasks on a Scheduler. Each task re-arms itself after its
// body returns, at period plus a uniform jitter.
class MeshTaskRunner {
public:
    using TaskFn = std::function<void(uint64_t now_ms)>;

    MeshTaskRunner(Scheduler& scheduler, const NodeConfig& cfg, std::mt19937& rng);
    ~MeshTaskRunner();

    MeshTaskRunner(const MeshTaskRunner&) = delete;
    MeshTaskRunner& operator=(const MeshTaskRunner&) = delete;

    void bind(MeshTask task, TaskFn fn);
    void start();
    void stop();
    bool running() const { return running_; }

    // Records a fault for every protected task that has not beaten within
    // its budget. Returns false if any did.
    bool check_watchdogs(uint64_t now_ms);
    TaskStatus status() const;
    const std::array<TaskConfig, kTaskCount>& plan() const { return plan_; }

private:
    struct TaskSlot {
        TaskConfig cfg;
        TaskHeartbeat hb;
        TaskFn fn;
        TimerId timer;
    };

    void arm(std::size_t index);
    void run(std::size_t index);

    Scheduler& scheduler_;
    std::mt19937& rng_;
    const std::array<TaskConfig, kTaskCount> plan_;
    std::array<TaskSlot, kTaskCount> slots_;
    uint32_t watchdog_misses_ = 0;
    bool running_ = false;
};
