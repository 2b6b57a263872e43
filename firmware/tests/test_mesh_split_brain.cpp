#include "config.hpp"
#include "sim_transport.hpp"

#include <cassert>
#include <cstdio>

namespace {
bool graphs_complete(SimMesh& mesh) {
    for (std::size_t i = 0; i < mesh.size(); ++i) {
        for (std::size_t j = 0; j < mesh.size(); ++j) {
            if (!mesh.node(i).registry().graph_contains(mesh.node(j).name())) {
                return false;
            }
        }
    }
    return true;
}
} // namespace

// Two four-node clusters that can only meet through nodes 3 and 4.
int main() {
    NodeConfig cfg = load_config();
    cfg.max_connections = 3;
    cfg.island_break_probability = 0.0;
    cfg.rotation_interval_ms = 60 * 60 * 1000;
    set_log_level(LogLevel::Warn);

    SimMesh mesh(cfg, 8, 5);
    for (std::size_t a = 0; a < 4; ++a) {
        for (std::size_t b = a + 1; b < 4; ++b) {
            mesh.air().set_range(a, b, true);
            mesh.air().set_range(a + 4, b + 4, true);
        }
    }
    mesh.air().set_range(3, 4, true);
    assert(mesh.start_all());

    bool merged = false;
    while (mesh.now_ms() < 10 * 60 * 1000 && !merged) {
        mesh.advance(5000);
        for (std::size_t i = 0; i < mesh.size(); ++i) {
            assert(mesh.connected_count(i) <= cfg.max_connections);
        }
        merged = mesh.components() == 1 && graphs_complete(mesh);
    }
    std::printf("[TEST] merged at t=%llums\n", static_cast<unsigned long long>(mesh.now_ms()));
    assert(merged);
    assert(mesh.air().linked(3, 4));

    // A packet from one side reaches every node on the other.
    int received[8] = {};
    for (std::size_t i = 0; i < mesh.size(); ++i) {
        mesh.node(i).set_application_handler([&received, i](const Bytes&) { received[i]++; });
    }
    assert(mesh.node(0).broadcast(Bytes{0x5a}));
    mesh.advance(2000);
    assert(received[0] == 0);
    for (std::size_t i = 1; i < mesh.size(); ++i) {
        assert(received[i] == 1);
    }
    return 0;
}
