#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <random>

#include "config.hpp"
#include "connection_orchestrator.hpp"
#include "connection_slots.hpp"
#include "device_registry.hpp"
#include "healing.hpp"
#include "identity_store.hpp"
#include "packet_router.hpp"
#include "peer_transport.hpp"
#include "scheduler.hpp"
#include "tasks.hpp"
#include "topology_gossip.hpp"

// One mesh participant. Transport events may be posted from any thread; all
// protocol work happens inside tick(), driven with a non-decreasing clock.
// start/tick/stop/broadcast serialize on loop_mutex_, which is recursive so
// the application handler may broadcast from inside tick().
class MeshNode {
public:
    using ApplicationHandler = std::function<void(const Bytes& payload)>;

    MeshNode(const NodeConfig& cfg, PeerTransport& transport, IdentityStore& identity);
    ~MeshNode();

    MeshNode(const MeshNode&) = delete;
    MeshNode& operator=(const MeshNode&) = delete;

    bool start(uint64_t now_ms);
    void tick(uint64_t now_ms);
    void stop();
    bool running() const { return running_; }

    void post_event(const TransportEvent& event);
    std::size_t pending_events() const;

    // False when the payload was dropped before leaving the node.
    bool broadcast(const Bytes& payload);
    void set_application_handler(ApplicationHandler handler) { app_handler_ = std::move(handler); }

    const PeerName& name() const { return name_; }
    std::map<PeerId, PeerConnectionState> peers() const;
    uint64_t revision() const { return registry_.revision(); }
    NeighborGraph graph() const { return registry_.graph(); }
    TaskStatus task_status() const { return tasks_.status(); }
    uint64_t now_ms() const { return scheduler_.now_ms(); }

    const NodeConfig& config() const { return cfg_; }
    DeviceRegistry& registry() { return registry_; }
    PacketRouter& router() { return router_; }
    ConnectionSlotManager& slots() { return slots_; }
    ConnectionOrchestrator& orchestrator() { return orchestrator_; }
    TopologyGossipService& gossip() { return gossip_; }
    HealingService& healing() { return healing_; }
    Scheduler& scheduler() { return scheduler_; }

private:
    std::size_t drain_events();

    const NodeConfig cfg_;
    PeerTransport& transport_;
    IdentityStore& identity_;
    std::mt19937 rng_;
    Scheduler scheduler_;
    DeviceRegistry registry_;
    PacketRouter router_;
    ConnectionSlotManager slots_;
    ConnectionOrchestrator orchestrator_;
    TopologyGossipService gossip_;
    HealingService healing_;
    MeshTaskRunner tasks_;

    std::recursive_mutex loop_mutex_;
    mutable std::mutex events_mutex_;
    std::deque<TransportEvent> events_;
    ApplicationHandler app_handler_;
    PeerName name_;
    std::atomic<bool> running_{false};
};
