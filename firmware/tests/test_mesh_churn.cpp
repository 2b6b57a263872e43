#include "config.hpp"
#include "sim_transport.hpp"

#include <cassert>
#include <random>

// Nodes drift in and out of range while links come and go. No node may ever
// hold more links than its limit.
int main() {
    NodeConfig cfg = load_config();
    cfg.max_connections = 2;
    set_log_level(LogLevel::Error);

    const std::size_t kNodes = 6;
    SimMesh mesh(cfg, kNodes, 21);
    mesh.air().set_all_in_range(true);
    assert(mesh.start_all());

    std::mt19937 rng(1234);
    std::uniform_int_distribution<std::size_t> pick(0, kNodes - 1);
    std::uniform_int_distribution<int> coin(0, 3);
    for (int round = 0; round < 150; ++round) {
        const std::size_t a = pick(rng);
        const std::size_t b = pick(rng);
        if (a != b) {
            // Mostly bring pairs back into range so the mesh keeps re-forming.
            mesh.air().set_range(a, b, coin(rng) != 0);
        }
        if (round % 10 == 0) {
            mesh.air().inject_radio_error(pick(rng));
        }
        for (int step = 0; step < 20; ++step) {
            mesh.advance(100);
            for (std::size_t i = 0; i < kNodes; ++i) {
                assert(mesh.connected_count(i) <= cfg.max_connections);
            }
        }
    }

    // Everyone back in range: the mesh settles with links in use.
    mesh.air().set_all_in_range(true);
    mesh.advance(120000);
    std::size_t connected = 0;
    for (std::size_t i = 0; i < kNodes; ++i) {
        assert(mesh.connected_count(i) <= cfg.max_connections);
        connected += mesh.connected_count(i);
    }
    assert(connected > 0);
    assert(mesh.air().total_links() > 0);
    return 0;
}
