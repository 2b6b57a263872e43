#include "mesh.hpp"

#include "fault.hpp"
#include "logging.hpp"

namespace {
// Bounds one tick when handlers keep producing events for this node.
constexpr std::size_t kMaxEventsPerTick = 4096;

uint32_t seed_from(const NodeConfig& cfg) {
    if (cfg.rng_seed != 0) {
        return cfg.rng_seed;
    }
    std::random_device rd;
    return rd();
}
} // namespace

MeshNode::MeshNode(const NodeConfig& cfg, PeerTransport& transport, IdentityStore& identity)
    : cfg_(cfg),
      transport_(transport),
      identity_(identity),
      rng_(seed_from(cfg)),
      scheduler_(),
      registry_(scheduler_, phase_timeouts_from(cfg_), cfg_.max_connections),
      router_(cfg_.default_ttl, cfg_.packet_cache_ttl_ms, static_cast<uint32_t>(rng_())),
      slots_(registry_, cfg_, rng_),
      orchestrator_(transport_, registry_, scheduler_, router_, slots_, cfg_, rng_),
      gossip_(registry_, orchestrator_),
      healing_(orchestrator_, slots_, scheduler_, cfg_),
      tasks_(scheduler_, cfg_, rng_) {
    orchestrator_.set_application_handler([this](const PeerId&, const MeshPacket& packet) {
        if (app_handler_) {
            app_handler_(packet.payload);
        }
    });
    orchestrator_.set_gossip_handler([this](const PeerId& from, const MeshPacket& packet) {
        gossip_.handle_gossip(from, packet);
    });
    orchestrator_.set_endpoint_observer([this](const PeerId& peer_id, const PeerName& name) {
        healing_.on_endpoint_found(peer_id, name);
    });

    tasks_.bind(MeshTask::SlotManager, [this](uint64_t now) {
        orchestrator_.apply(slots_.plan_management_cycle(now));
    });
    tasks_.bind(MeshTask::ConnectionRotation, [this](uint64_t) {
        orchestrator_.apply(slots_.plan_rotation());
    });
    tasks_.bind(MeshTask::TopologyGossip, [this](uint64_t) { gossip_.gossip_now(); });
    tasks_.bind(MeshTask::PacketCacheSweep, [this](uint64_t now) { router_.sweep(now); });
    tasks_.bind(MeshTask::Healing, [this](uint64_t) { healing_.run_cycle(); });
}

MeshNode::~MeshNode() {
    stop();
}

bool MeshNode::start(uint64_t now_ms) {
    std::lock_guard<std::recursive_mutex> lock(loop_mutex_);
    if (running_) {
        return true;
    }
    if (!validate_config(cfg_)) {
        record_fault("Invalid config");
        return false;
    }
    if (!identity_.get_persistent_name(name_) || name_.empty()) {
        log_error("[MESH] no identity available, not starting");
        record_fault("Identity unavailable");
        return false;
    }
    scheduler_.run_due(now_ms);
    orchestrator_.set_local_name(name_);
    slots_.set_local_name(name_);
    transport_.set_event_sink([this](const TransportEvent& event) { post_event(event); });
    running_ = true;
    tasks_.start();
    if (!orchestrator_.start()) {
        log_warn("[MESH] %s started with transport errors", name_.c_str());
    }
    log_info("[MESH] %s up at t=%llums", name_.c_str(), static_cast<unsigned long long>(now_ms));
    return true;
}

void MeshNode::tick(uint64_t now_ms) {
    std::lock_guard<std::recursive_mutex> lock(loop_mutex_);
    if (!running_) {
        return;
    }
    scheduler_.run_due(now_ms);
    if (drain_events() > 0) {
        scheduler_.run_due(now_ms);
    }
    tasks_.check_watchdogs(now_ms);
}

std::size_t MeshNode::drain_events() {
    std::size_t handled = 0;
    while (handled < kMaxEventsPerTick) {
        std::deque<TransportEvent> batch;
        {
            std::lock_guard<std::mutex> lock(events_mutex_);
            if (events_.empty()) {
                break;
            }
            batch.swap(events_);
        }
        for (const auto& event : batch) {
            orchestrator_.handle_event(event);
            handled++;
        }
    }
    return handled;
}

void MeshNode::stop() {
    std::lock_guard<std::recursive_mutex> lock(loop_mutex_);
    if (!running_) {
        return;
    }
    running_ = false;
    tasks_.stop();
    healing_.stop();
    orchestrator_.stop();
    // The transport dropped every link; nothing in the registry is live now.
    registry_.clear_peers();
    orchestrator_.publish_local_neighbors();
    transport_.set_event_sink(PeerTransport::EventSink());
    scheduler_.cancel_all();
    {
        std::lock_guard<std::mutex> lock(events_mutex_);
        events_.clear();
    }
    log_info("[MESH] %s stopped", name_.c_str());
}

void MeshNode::post_event(const TransportEvent& event) {
    std::lock_guard<std::mutex> lock(events_mutex_);
    events_.push_back(event);
}

std::size_t MeshNode::pending_events() const {
    std::lock_guard<std::mutex> lock(events_mutex_);
    return events_.size();
}

bool MeshNode::broadcast(const Bytes& payload) {
    std::lock_guard<std::recursive_mutex> lock(loop_mutex_);
    if (!running_) {
        return false;
    }
    return orchestrator_.broadcast(payload, PacketKind::Application);
}

std::map<PeerId, PeerConnectionState> MeshNode::peers() const {
    std::map<PeerId, PeerConnectionState> out;
    for (const auto& s : registry_.snapshot()) {
        out[s.peer_id] = s;
    }
    return out;
}
