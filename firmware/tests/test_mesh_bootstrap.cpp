#include "config.hpp"
#include "sim_transport.hpp"

#include <cassert>

int main() {
    NodeConfig cfg = load_config();
    set_log_level(LogLevel::Warn);

    SimMesh mesh(cfg, 2, 1);
    mesh.air().set_all_in_range(true);
    assert(mesh.start_all());
    assert(mesh.node(0).name() == "node-00");
    assert(mesh.node(1).name() == "node-01");

    // Discovery alone never links.
    mesh.advance(1000);
    assert(!mesh.air().linked(0, 1));
    assert(mesh.node(0).peers().at("E001").phase == ConnectionPhase::Discovered);

    // First slot cycle lands within ten seconds plus jitter.
    mesh.advance(11000);
    assert(mesh.air().linked(0, 1));
    assert(mesh.connected_count(0) == 1 && mesh.connected_count(1) == 1);
    assert(mesh.components() == 1);
    assert(mesh.node(0).graph().at("node-00").count("node-01") == 1);

    int received = 0;
    Bytes last;
    mesh.node(1).set_application_handler([&](const Bytes& payload) {
        received++;
        last = payload;
    });
    assert(mesh.node(0).broadcast(Bytes{'h', 'i'}));
    mesh.advance(500);
    assert(received == 1 && last == (Bytes{'h', 'i'}));

    // Heartbeats flow and keep the link alive past the CONNECTED timeout.
    mesh.advance(28000);
    assert(mesh.node(0).orchestrator().metrics().pongs_received >= 1);
    assert(mesh.node(1).orchestrator().metrics().pongs_received >= 1);
    mesh.advance(90000);
    assert(mesh.air().linked(0, 1));
    assert(mesh.connected_count(0) == 1 && mesh.connected_count(1) == 1);
    assert(mesh.node(0).orchestrator().metrics().missed_pongs == 0);

    // Gossip taught each side the other's view.
    assert(mesh.node(0).graph().count("node-01") == 1);
    assert(mesh.node(1).graph().count("node-00") == 1);
    assert(mesh.node(0).gossip().metrics().merged >= 1);
    return 0;
}
