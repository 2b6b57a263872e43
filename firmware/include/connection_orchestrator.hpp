#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <random>

#include "backoff.hpp"
#include "config.hpp"
#include "connection_slots.hpp"
#include "device_registry.hpp"
#include "packet_router.hpp"
#include "peer_transport.hpp"
#include "scheduler.hpp"

struct OrchestratorMetrics {
    uint32_t connect_requests;
    uint32_t connect_failures;
    uint32_t accepted;
    uint32_t rejected_capacity;
    uint32_t rejected_cooldown;
    uint32_t evictions;
    uint32_t reconnects_scheduled;
    uint32_t given_up;
    uint32_t pings_sent;
    uint32_t pongs_received;
    uint32_t missed_pongs;
    uint32_t malformed_frames;
    uint32_t oversized_drops;
    uint32_t packets_sent;
    uint32_t radio_restarts;
};

// Reacts to transport events, drives the per-peer state machine through the
// registry and owns heartbeats, reconnection and radio recovery. All entry
// points run on the node loop.
class ConnectionOrchestrator {
public:
    using PacketHandler = std::function<void(const PeerId& from, const MeshPacket& packet)>;
    using EndpointObserver = std::function<void(const PeerId& peer_id, const PeerName& name)>;

    ConnectionOrchestrator(PeerTransport& transport,
                           DeviceRegistry& registry,
                           Scheduler& scheduler,
                           PacketRouter& router,
                           ConnectionSlotManager& slots,
                           const NodeConfig& cfg,
                           std::mt19937& rng);
    ~ConnectionOrchestrator();

    ConnectionOrchestrator(const ConnectionOrchestrator&) = delete;
    ConnectionOrchestrator& operator=(const ConnectionOrchestrator&) = delete;

    void set_local_name(const PeerName& name) { local_name_ = name; }
    const PeerName& local_name() const { return local_name_; }
    void set_application_handler(PacketHandler handler) { app_handler_ = std::move(handler); }
    void set_gossip_handler(PacketHandler handler) { gossip_handler_ = std::move(handler); }
    void set_endpoint_observer(EndpointObserver observer) { endpoint_observer_ = std::move(observer); }

    bool start();
    void stop();
    bool running() const { return running_; }

    void handle_event(const TransportEvent& event);

    bool connect_to_peer(const PeerId& peer_id, const PeerName& name);
    // Drops a live link on purpose; the peer is kept out for the eviction cooldown.
    bool evict_peer(const PeerId& peer_id, const char* reason);
    void apply(const SlotAction& action);

    // False when the payload was dropped (oversized).
    bool broadcast(const Bytes& payload, PacketKind kind);
    // Sends an encoded mesh packet to every CONNECTED peer except `except`.
    std::size_t send_to_neighbors(const Bytes& packet_bytes, const PeerId& except = PeerId());

    bool start_advertising();
    bool stop_advertising();
    bool start_discovery();
    bool stop_discovery();
    bool advertising() const { return advertising_; }
    bool discovering() const { return discovering_; }
    bool restart_pending() const { return restart_pending_; }

    void publish_local_neighbors();
    OrchestratorMetrics metrics() const { return metrics_; }

private:
    struct Heartbeat {
        TimerId next_ping;
        TimerId await_pong;
    };

    void on_phase_change(const PhaseChange& change);
    void on_endpoint_found(const TransportEvent& event);
    void on_endpoint_lost(const TransportEvent& event);
    void on_connection_initiated(const TransportEvent& event);
    void on_connection_result(const TransportEvent& event);
    void on_disconnected(const TransportEvent& event);
    void on_payload(const TransportEvent& event);
    void on_ping(const PeerId& peer_id);
    void on_pong(const PeerId& peer_id);
    void on_packet(const PeerId& peer_id, const Bytes& bytes);

    void start_heartbeat(const PeerId& peer_id);
    void stop_heartbeat(const PeerId& peer_id);
    void schedule_ping(const PeerId& peer_id, uint64_t delay_ms);
    void send_ping(const PeerId& peer_id);
    void on_pong_timeout(const PeerId& peer_id);

    void schedule_reconnect(const PeerId& peer_id, const PeerName& name);
    void cancel_reconnect(const PeerId& peer_id);
    void reconnect(const PeerId& peer_id, const PeerName& name);

    bool accept(const PeerId& peer_id, const PeerName& name);
    void reject(const PeerId& peer_id, const PeerName& name, const char* reason);
    void fail_attempt(const PeerId& peer_id, const PeerName& name, bool reconnect);

    bool check_status(TransportStatus status, const char* op, const PeerId& peer_id);
    void escalate_radio_error();
    void restart_radio();

    PeerTransport& transport_;
    DeviceRegistry& registry_;
    Scheduler& scheduler_;
    PacketRouter& router_;
    ConnectionSlotManager& slots_;
    const NodeConfig& cfg_;
    std::mt19937& rng_;
    const BackoffPolicy backoff_;

    PeerName local_name_;
    PacketHandler app_handler_;
    PacketHandler gossip_handler_;
    EndpointObserver endpoint_observer_;

    std::map<PeerId, Heartbeat> heartbeats_;
    std::map<PeerId, TimerId> reconnects_;
    TimerId restart_timer_ = kNoTimer;
    bool running_ = false;
    bool advertising_ = false;
    bool discovering_ = false;
    bool restart_pending_ = false;
    OrchestratorMetrics metrics_{};
};
