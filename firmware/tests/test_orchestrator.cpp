#include "config.hpp"
#include "connection_orchestrator.hpp"
#include "connection_slots.hpp"
#include "device_registry.hpp"
#include "fault.hpp"
#include "mesh_encode.hpp"
#include "mock_transport.hpp"
#include "packet_router.hpp"
#include "scheduler.hpp"

#include <cassert>
#include <random>
#include <vector>

namespace {
NodeConfig make_cfg(std::size_t max_connections) {
    NodeConfig cfg = load_config();
    cfg.max_connections = max_connections;
    cfg.log_level = LogLevel::Off;
    return cfg;
}

struct Rig {
    NodeConfig cfg;
    Scheduler sched;
    DeviceRegistry reg;
    PacketRouter router;
    std::mt19937 rng;
    ConnectionSlotManager slots;
    MockTransport transport;
    ConnectionOrchestrator orch;

    explicit Rig(std::size_t max_connections)
        : cfg(make_cfg(max_connections)),
          reg(sched, phase_timeouts_from(cfg), cfg.max_connections),
          router(cfg.default_ttl, cfg.packet_cache_ttl_ms, 7),
          rng(5),
          slots(reg, cfg, rng),
          orch(transport, reg, sched, router, slots, cfg, rng) {
        set_log_level(LogLevel::Off);
        slots.set_local_name("me");
        orch.set_local_name("me");
        transport.set_event_sink([this](const TransportEvent& e) { orch.handle_event(e); });
        assert(orch.start());
    }

    ConnectionPhase phase(const PeerId& id) const {
        PeerConnectionState st{};
        assert(reg.get_state(id, st));
        return st.phase;
    }

    // Inbound handshake followed by a successful result.
    void link(const PeerId& id, const PeerName& name) {
        transport.emit(connection_initiated_event(id, name));
        transport.emit(connection_result_event(id, ConnectionOutcome::Ok));
        assert(phase(id) == ConnectionPhase::Connected);
    }
};

Bytes frame(FrameType type) {
    return encode_transport_frame(type, Bytes());
}

void found_never_dials() {
    Rig rig(2);
    assert(rig.orch.advertising() && rig.orch.discovering());
    assert(rig.transport.advertised_name() == "me");
    rig.transport.emit(endpoint_found_event("E1", "alpha"));
    rig.transport.emit(endpoint_found_event("E0", "me"));
    assert(rig.phase("E1") == ConnectionPhase::Discovered);
    assert(rig.reg.potential_peers().count("E1") == 1);
    PeerConnectionState st{};
    assert(!rig.reg.get_state("E0", st));
    assert(rig.transport.count("request_connection") == 0);

    rig.transport.emit(endpoint_lost_event("E1"));
    assert(!rig.reg.get_state("E1", st));
}

void outbound_handshake_and_heartbeat() {
    Rig rig(2);
    rig.transport.emit(endpoint_found_event("E1", "alpha"));
    assert(rig.orch.connect_to_peer("E1", "alpha"));
    assert(rig.phase("E1") == ConnectionPhase::Connecting);
    assert(rig.transport.count("request_connection", "E1") == 1);
    // Busy peers are not dialed twice.
    assert(!rig.orch.connect_to_peer("E1", "alpha"));

    rig.transport.emit(connection_initiated_event("E1", "alpha"));
    assert(rig.transport.count("accept_connection", "E1") == 1);
    rig.transport.emit(connection_result_event("E1", ConnectionOutcome::Ok));
    assert(rig.phase("E1") == ConnectionPhase::Connected);
    assert(rig.reg.retry_count("alpha") == 0);
    assert(rig.reg.graph().at("me").count("alpha") == 1);

    rig.sched.run_due(14999);
    assert(rig.transport.frames_to("E1", FrameType::Ping) == 0);
    rig.sched.run_due(15000);
    assert(rig.transport.frames_to("E1", FrameType::Ping) == 1);
    rig.transport.emit(payload_event("E1", frame(FrameType::Pong)));
    assert(rig.orch.metrics().pongs_received == 1);

    rig.sched.run_due(45000);
    assert(rig.transport.frames_to("E1", FrameType::Ping) == 2);
    rig.sched.run_due(65000);
    assert(rig.orch.metrics().missed_pongs == 1);
    assert(rig.phase("E1") == ConnectionPhase::Connected);

    // A PING from the peer is answered and refreshes the link.
    rig.transport.emit(payload_event("E1", frame(FrameType::Ping)));
    assert(rig.transport.frames_to("E1", FrameType::Pong) == 1);
    rig.sched.run_due(80000);
    assert(rig.phase("E1") == ConnectionPhase::Connected);

    // Garbage is counted, not fatal.
    rig.transport.emit(payload_event("E1", Bytes{0xff, 0x00}));
    assert(rig.orch.metrics().malformed_frames == 1);
}

void inbound_rejected_at_capacity() {
    Rig rig(1);
    rig.link("E1", "alpha");
    rig.transport.emit(connection_initiated_event("E2", "bravo"));
    assert(rig.transport.count("reject_connection", "E2") == 1);
    assert(rig.orch.metrics().rejected_capacity == 1);
    PeerConnectionState st{};
    assert(!rig.reg.get_state("E2", st));
    // A handshake from a peer that is already connected is ignored.
    rig.transport.emit(connection_initiated_event("E1", "alpha"));
    assert(rig.transport.count("accept_connection", "E1") == 1);
    assert(rig.transport.count("reject_connection", "E1") == 0);
}

void inbound_evicts_redundant_peer() {
    Rig rig(2);
    rig.link("E1", "alpha");
    rig.link("E2", "bravo");
    rig.reg.merge_graph({{"alpha", {"bravo"}}}, "me");

    rig.transport.emit(connection_initiated_event("E3", "charlie"));
    assert(rig.orch.metrics().evictions == 1);
    assert(rig.phase("E3") == ConnectionPhase::Connecting);
    assert(rig.transport.count("accept_connection", "E3") == 1);

    const PeerId victim = rig.phase("E1") == ConnectionPhase::Disconnected ? "E1" : "E2";
    const PeerName victim_name = victim == "E1" ? "alpha" : "bravo";
    assert(rig.phase(victim) == ConnectionPhase::Disconnected);
    assert(rig.transport.count("disconnect", victim) == 1);
    assert(rig.slots.in_cooldown(victim_name, rig.sched.now_ms()));

    // The evicted peer may not come straight back.
    rig.transport.emit(connection_initiated_event(victim, victim_name));
    assert(rig.transport.count("reject_connection", victim) == 1);
    assert(rig.orch.metrics().rejected_cooldown == 1);
}

void results_rejected_and_error() {
    Rig rig(3);
    rig.transport.emit(endpoint_found_event("E1", "alpha"));
    assert(rig.orch.connect_to_peer("E1", "alpha"));
    rig.transport.emit(connection_result_event("E1", ConnectionOutcome::Rejected));
    assert(rig.phase("E1") == ConnectionPhase::Rejected);
    assert(rig.reg.retry_count("alpha") == 1);
    assert(!rig.reg.retry_ready("alpha", rig.sched.now_ms()));

    rig.transport.emit(endpoint_found_event("E2", "bravo"));
    assert(rig.orch.connect_to_peer("E2", "bravo"));
    rig.transport.emit(connection_result_event("E2", ConnectionOutcome::Error));
    assert(rig.phase("E2") == ConnectionPhase::Error);
    assert(rig.reg.retry_count("bravo") == 1);
    assert(rig.orch.metrics().connect_failures == 1);
    assert(rig.orch.metrics().reconnects_scheduled == 0);
    assert(!rig.reg.retry_ready("bravo", rig.sched.now_ms()));
}

void failed_request_retries_with_backoff() {
    Rig rig(2);
    rig.sched.run_due(1000);
    rig.transport.emit(endpoint_found_event("E1", "alpha"));
    rig.transport.script("request_connection", TransportStatus::Failed);
    assert(!rig.orch.connect_to_peer("E1", "alpha"));
    assert(rig.phase("E1") == ConnectionPhase::Error);
    assert(rig.reg.retry_count("alpha") == 1);
    assert(rig.orch.metrics().reconnects_scheduled == 1);

    // retry 1: 2000ms plus up to 1000ms of jitter.
    rig.sched.run_due(1000 + 2000);
    assert(rig.transport.count("request_connection", "E1") == 1);
    rig.sched.run_due(1000 + 3000);
    assert(rig.transport.count("request_connection", "E1") == 2);
    assert(rig.phase("E1") == ConnectionPhase::Connecting);
}

void already_connected_is_recovered() {
    Rig rig(2);
    rig.reg.increment_retry("alpha");
    rig.transport.emit(endpoint_found_event("E1", "alpha"));
    rig.transport.script("request_connection", TransportStatus::AlreadyConnected);
    assert(rig.orch.connect_to_peer("E1", "alpha"));
    assert(rig.phase("E1") == ConnectionPhase::Connected);
    assert(rig.reg.retry_count("alpha") == 0);
}

void disconnect_schedules_reconnect() {
    Rig rig(2);
    rig.link("E1", "alpha");
    rig.transport.emit(disconnected_event("E1"));
    assert(rig.phase("E1") == ConnectionPhase::Disconnected);
    assert(rig.reg.graph().at("me").empty());
    assert(rig.orch.metrics().reconnects_scheduled == 1);
    rig.sched.run_due(2000);
    assert(rig.transport.count("request_connection", "E1") == 1);
}

void broadcast_and_forwarding() {
    Rig rig(3);
    rig.link("E1", "alpha");
    rig.link("E2", "bravo");

    std::vector<Bytes> delivered;
    rig.orch.set_application_handler([&](const PeerId&, const MeshPacket& p) { delivered.push_back(p.payload); });

    PacketRouter remote(5, 600000, 99);
    const Bytes pkt = remote.create_broadcast(Bytes{1, 2, 3}, PacketKind::Application, 0);
    rig.transport.emit(payload_event("E1", encode_transport_frame(FrameType::Packet, pkt)));
    assert(delivered.size() == 1 && delivered[0] == (Bytes{1, 2, 3}));
    assert(rig.transport.frames_to("E2", FrameType::Packet) == 1);
    assert(rig.transport.frames_to("E1", FrameType::Packet) == 0);
    // Duplicate via the other neighbor.
    rig.transport.emit(payload_event("E2", encode_transport_frame(FrameType::Packet, pkt)));
    assert(delivered.size() == 1);

    assert(rig.orch.broadcast(Bytes(16, 0x42), PacketKind::Application));
    assert(rig.transport.frames_to("E1", FrameType::Packet) == 1);
    assert(rig.transport.frames_to("E2", FrameType::Packet) == 2);

    assert(!rig.orch.broadcast(Bytes(rig.cfg.max_payload_bytes + 1, 0), PacketKind::Application));
    assert(rig.orch.metrics().oversized_drops == 1);
    assert(rig.transport.frames_to("E1", FrameType::Packet) == 1);
}

void radio_error_restarts_transport() {
    Rig rig(2);
    rig.link("E1", "alpha");
    rig.sched.run_due(500);
    rig.transport.script("send", TransportStatus::RadioError);
    assert(rig.orch.broadcast(Bytes{9}, PacketKind::Application));
    assert(rig.orch.restart_pending());
    assert(rig.transport.count("stop_all") == 1);
    assert(!rig.orch.advertising() && !rig.orch.discovering());
    assert(rig.phase("E1") == ConnectionPhase::Disconnected);
    assert(rig.orch.metrics().radio_restarts == 1);
    assert(fault_status().fault_active);
    // No dialing while the radio is down.
    rig.transport.emit(endpoint_found_event("E2", "bravo"));
    assert(!rig.orch.connect_to_peer("E2", "bravo"));

    rig.sched.run_due(500 + rig.cfg.radio_restart_delay_ms);
    assert(!rig.orch.restart_pending());
    assert(rig.orch.advertising() && rig.orch.discovering());
    assert(rig.transport.count("start_advertising") == 2);
    assert(rig.transport.count("start_discovery") == 2);
    // A clean restart clears the radio fault; the counter stays.
    assert(!fault_status().fault_active);
    assert(fault_status().counters.radio_restarts >= 1);
}

void stopped_orchestrator_ignores_events() {
    Rig rig(2);
    rig.orch.stop();
    assert(rig.transport.count("stop_all") == 1);
    rig.transport.emit(endpoint_found_event("E1", "alpha"));
    PeerConnectionState st{};
    assert(!rig.reg.get_state("E1", st));
}
} // namespace

int main() {
    found_never_dials();
    outbound_handshake_and_heartbeat();
    inbound_rejected_at_capacity();
    inbound_evicts_redundant_peer();
    results_rejected_and_error();
    failed_request_retries_with_backoff();
    already_connected_is_recovered();
    disconnect_schedules_reconnect();
    broadcast_and_forwarding();
    radio_error_restarts_transport();
    stopped_orchestrator_ignores_events();
    return 0;
}
