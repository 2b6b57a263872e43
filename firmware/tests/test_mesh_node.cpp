#include "config.hpp"
#include "connection_phase.hpp"
#include "identity_store.hpp"
#include "mesh.hpp"
#include "mock_transport.hpp"

#include <cassert>

namespace {
bool connected(MeshNode& node, const PeerId& id) {
    PeerConnectionState st{};
    return node.registry().get_state(id, st) && st.phase == ConnectionPhase::Connected;
}

void link(MockTransport& transport, MeshNode& node, const PeerId& id, const PeerName& name, uint64_t now_ms) {
    transport.emit(connection_initiated_event(id, name));
    transport.emit(connection_result_event(id, ConnectionOutcome::Ok));
    node.tick(now_ms);
}

// Links dropped by stop() do not survive into the next start().
void restart_forgets_links() {
    NodeConfig cfg = load_config();
    cfg.rng_seed = 23;
    cfg.max_connections = 1;
    cfg.log_level = LogLevel::Off;

    MockTransport transport;
    FixedIdentityStore identity("device-node01");
    MeshNode node(cfg, transport, identity);
    assert(node.start(0));

    link(transport, node, "E1", "device-peer01", 100);
    assert(connected(node, "E1"));
    assert(node.graph().at("device-node01").count("device-peer01") == 1);

    node.stop();
    assert(transport.count("stop_all") == 1);
    assert(node.peers().empty());
    assert(node.registry().count_in_phase(ConnectionPhase::Connected) == 0);
    assert(node.graph().at("device-node01").empty());

    // The only slot is free again after the restart.
    assert(node.start(1000));
    link(transport, node, "E2", "device-peer02", 1100);
    assert(connected(node, "E2"));
    assert(node.peers().count("E1") == 0);
    assert(node.graph().at("device-node01").count("device-peer01") == 0);

    // The new link is heartbeated like any other.
    node.tick(16099);
    assert(transport.frames_to("E2", FrameType::Ping) == 0);
    node.tick(16100);
    assert(transport.frames_to("E2", FrameType::Ping) == 1);
    node.stop();
}

void stop_is_idempotent() {
    NodeConfig cfg = load_config();
    cfg.rng_seed = 29;
    cfg.log_level = LogLevel::Off;

    MockTransport transport;
    FixedIdentityStore identity("device-node02");
    MeshNode node(cfg, transport, identity);
    node.stop();
    assert(transport.count("stop_all") == 0);
    assert(node.start(0));
    node.stop();
    node.stop();
    assert(transport.count("stop_all") == 1);
    assert(!node.broadcast(Bytes{1, 2, 3}));
}
} // namespace

int main() {
    set_log_level(LogLevel::Off);
    restart_forgets_links();
    stop_is_idempotent();
    return 0;
}
