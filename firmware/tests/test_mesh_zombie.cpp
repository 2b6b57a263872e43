#include "config.hpp"
#include "sim_transport.hpp"

#include <cassert>

// A node that stays linked at the radio level but never answers.
int main() {
    NodeConfig cfg = load_config();
    cfg.max_connections = 2;
    cfg.island_break_probability = 0.0;
    cfg.rotation_interval_ms = 60 * 60 * 1000;
    set_log_level(LogLevel::Error);

    SimMesh mesh(cfg, 3, 9);
    mesh.air().set_all_in_range(true);
    assert(mesh.start_all());
    mesh.advance(30000);
    assert(mesh.air().linked(0, 1) && mesh.air().linked(0, 2) && mesh.air().linked(1, 2));
    assert(mesh.connected_count(0) == 2);

    mesh.air().silence(2, true);
    // Links formed after t=5s, so no CONNECTED timeout can fire before t=75s.
    mesh.advance(40000);
    PeerConnectionState zombie{};
    assert(mesh.node(0).registry().get_state("E002", zombie));
    assert(zombie.phase == ConnectionPhase::Connected);

    // Sixty seconds without PING or PONG: ERROR and the link is dropped.
    mesh.advance(95000 - mesh.now_ms());
    assert(mesh.node(0).registry().get_state("E002", zombie));
    assert(zombie.phase == ConnectionPhase::Error);
    assert(mesh.node(1).registry().get_state("E002", zombie));
    assert(zombie.phase == ConnectionPhase::Error);
    assert(!mesh.air().linked(0, 2) && !mesh.air().linked(1, 2));
    assert(mesh.node(0).orchestrator().metrics().missed_pongs >= 1);

    // ERROR expires into removal; the healthy pair is untouched.
    mesh.advance(125000 - mesh.now_ms());
    assert(!mesh.node(0).registry().get_state("E002", zombie));
    assert(!mesh.node(1).registry().get_state("E002", zombie));
    assert(mesh.air().linked(0, 1));
    assert(mesh.connected_count(0) == 1 && mesh.connected_count(1) == 1);
    assert(mesh.air().dropped_frames() > 0);
    return 0;
}
