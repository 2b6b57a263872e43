#include "healing.hpp"

#include "logging.hpp"

HealingService::HealingService(ConnectionOrchestrator& orchestrator, ConnectionSlotManager& slots,
                               Scheduler& scheduler, const NodeConfig& cfg)
    : orchestrator_(orchestrator), slots_(slots), scheduler_(scheduler), cfg_(cfg) {}

HealingService::~HealingService() {
    stop();
}

void HealingService::run_cycle() {
    if (!orchestrator_.running() || orchestrator_.restart_pending()) {
        return;
    }
    metrics_.cycles++;
    log_info("[HEAL] cycle %u: restarting discovery for %ums",
             static_cast<unsigned>(metrics_.cycles), static_cast<unsigned>(cfg_.healing_discovery_window_ms));
    slots_.clear_priorities();
    scheduler_.cancel(window_timer_);
    window_open_ = true;
    orchestrator_.stop_discovery();
    orchestrator_.start_discovery();
    window_timer_ = scheduler_.schedule_after(cfg_.healing_discovery_window_ms, [this]() { close_window(); });
}

void HealingService::close_window() {
    window_timer_ = kNoTimer;
    window_open_ = false;
    if (!orchestrator_.running() || orchestrator_.restart_pending()) {
        return;
    }
    log_debug("[HEAL] window closed, restarting advertising");
    orchestrator_.stop_advertising();
    orchestrator_.start_advertising();
}

void HealingService::on_endpoint_found(const PeerId& peer_id, const PeerName& name) {
    if (!window_open_ || name.empty() || name == orchestrator_.local_name()) {
        return;
    }
    if (!slots_.is_foreign(name)) {
        return;
    }
    metrics_.foreign_found++;
    log_info("[HEAL] foreign endpoint %s (%s)", name.c_str(), peer_id.c_str());
    slots_.prioritize(name);
}

void HealingService::stop() {
    scheduler_.cancel(window_timer_);
    window_timer_ = kNoTimer;
    window_open_ = false;
}
