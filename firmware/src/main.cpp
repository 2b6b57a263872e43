#include <cstdio>
#include <cstdlib>
#include <string>

#include "config.hpp"
#include "fault.hpp"
#include "logging.hpp"
#include "mesh.hpp"
#include "sim_transport.hpp"

namespace {
constexpr std::size_t kNodeCount = 8;
constexpr uint64_t kRunMs = 15 * 60 * 1000;
constexpr uint64_t kReportEveryMs = 60 * 1000;

// Two clusters joined by a single pair of nodes in range of each other.
void build_two_islands(SimAir& air) {
    const std::size_t half = air.size() / 2;
    for (std::size_t a = 0; a < air.size(); ++a) {
        for (std::size_t b = a + 1; b < air.size(); ++b) {
            const bool same_side = (a < half) == (b < half);
            air.set_range(a, b, same_side);
        }
    }
    air.set_range(half - 1, half, true);
}
} // namespace

int main(int argc, char** argv) {
    init_logging();
    init_fault_monitor();

    NodeConfig cfg = load_config();
    if (argc > 1 && !load_config_file(argv[1], cfg)) {
        log_warn("[SIM] config %s had errors, continuing with what parsed", argv[1]);
    }
    if (!validate_config(cfg)) {
        return 1;
    }
    set_log_level(cfg.log_level);
    const uint32_t seed = cfg.rng_seed != 0 ? cfg.rng_seed : 42u;
    log_info("hopmesh simulation: %zu nodes, seed %u", kNodeCount, static_cast<unsigned>(seed));

    SimMesh mesh(cfg, kNodeCount, seed);
    build_two_islands(mesh.air());

    std::size_t delivered = 0;
    for (std::size_t i = 0; i < mesh.size(); ++i) {
        mesh.node(i).set_application_handler([&delivered](const Bytes&) { delivered++; });
    }
    if (!mesh.start_all()) {
        log_error("[SIM] a node failed to start");
        return 1;
    }

    std::size_t sent = 0;
    for (uint64_t t = 0; t < kRunMs; t += kReportEveryMs) {
        mesh.advance(kReportEveryMs);
        const std::string text = "status t=" + std::to_string(mesh.now_ms());
        if (mesh.node(0).broadcast(Bytes(text.begin(), text.end()))) {
            sent++;
        }
        std::printf("[SIM] t=%llus links=%zu components=%zu delivered=%zu\n",
                    static_cast<unsigned long long>(mesh.now_ms() / 1000), mesh.air().total_links(),
                    mesh.components(), delivered);
    }
    mesh.advance(5000);

    std::printf("\n%-10s %-10s %-9s %-6s %-8s %-8s\n", "node", "connected", "graph", "seen", "retries", "evicts");
    for (std::size_t i = 0; i < mesh.size(); ++i) {
        MeshNode& node = mesh.node(i);
        const OrchestratorMetrics om = node.orchestrator().metrics();
        std::printf("%-10s %-10zu %-9zu %-6zu %-8u %-8u\n",
                    node.name().c_str(),
                    node.registry().count_in_phase(ConnectionPhase::Connected),
                    node.graph().size(),
                    node.router().seen_count(),
                    static_cast<unsigned>(om.reconnects_scheduled),
                    static_cast<unsigned>(om.evictions));
    }
    const FaultStatus faults = fault_status();
    std::printf("\n[SUMMARY] broadcasts=%zu deliveries=%zu components=%zu connect_failures=%u malformed=%u fault_active=%d\n",
                sent, delivered, mesh.components(),
                static_cast<unsigned>(faults.counters.connect_failures),
                static_cast<unsigned>(faults.counters.malformed_frames),
                faults.fault_active ? 1 : 0);
    return 0;
}
