#pragma once

#include <cstdint>

#include "config.hpp"
#include "connection_orchestrator.hpp"
#include "connection_slots.hpp"
#include "scheduler.hpp"

struct HealingMetrics {
    uint32_t cycles;
    uint32_t foreign_found;
};

// Partition repair: every cycle restarts discovery, keeps a window open for
// fresh endpoints and then restarts advertising. Endpoints unknown to the
// neighbor graph that show up inside the window are prioritized for dialing.
class HealingService {
public:
    HealingService(ConnectionOrchestrator& orchestrator, ConnectionSlotManager& slots,
                   Scheduler& scheduler, const NodeConfig& cfg);
    ~HealingService();

    HealingService(const HealingService&) = delete;
    HealingService& operator=(const HealingService&) = delete;

    void run_cycle();
    void on_endpoint_found(const PeerId& peer_id, const PeerName& name);
    void stop();

    bool window_open() const { return window_open_; }
    HealingMetrics metrics() const { return metrics_; }

private:
    void close_window();

    ConnectionOrchestrator& orchestrator_;
    ConnectionSlotManager& slots_;
    Scheduler& scheduler_;
    const NodeConfig& cfg_;
    TimerId window_timer_ = kNoTimer;
    bool window_open_ = false;
    HealingMetrics metrics_{};
};
