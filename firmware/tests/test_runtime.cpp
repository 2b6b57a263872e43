#include "config.hpp"
#include "identity_store.hpp"
#include "mesh.hpp"
#include "mesh_runtime.hpp"
#include "mock_transport.hpp"

#include <cassert>
#include <chrono>
#include <thread>

int main() {
    NodeConfig cfg = load_config();
    cfg.rng_seed = 17;
    set_log_level(LogLevel::Warn);

    MockTransport transport;
    FixedIdentityStore identity("device-runtm1");
    MeshNode node(cfg, transport, identity);
    {
        MeshRuntime runtime(node, 5);
        assert(runtime.start());
        assert(runtime.running());
        assert(node.running());
        assert(node.name() == "device-runtm1");

        // Events posted from this thread are picked up by the tick thread.
        transport.emit(endpoint_found_event("E1", "device-peer01"));
        bool seen = false;
        for (int i = 0; i < 400 && !seen; ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            seen = node.peers().count("E1") != 0;
        }
        assert(seen);
        assert(runtime.ticks() > 0);

        runtime.stop();
        assert(!runtime.running());
        assert(!node.running());
        runtime.stop();
    }
    assert(transport.count("stop_all") == 1);
    assert(transport.advertised_name() == "device-runtm1");
    assert(transport.count("start_discovery") == 1);

    // A restart picks the node clock up where it left off.
    MockTransport restart_transport;
    FixedIdentityStore restart_identity("device-runtm2");
    MeshNode restarted(cfg, restart_transport, restart_identity);
    {
        MeshRuntime runtime(restarted, 5);
        assert(runtime.start());
        std::this_thread::sleep_for(std::chrono::milliseconds(400));
        runtime.stop();
        const uint64_t stopped_at = restarted.now_ms();
        assert(stopped_at > 0);

        assert(runtime.start());
        bool advanced = false;
        for (int i = 0; i < 20 && !advanced; ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            advanced = restarted.now_ms() > stopped_at;
        }
        assert(advanced);
        runtime.stop();
    }
    assert(restart_transport.count("stop_all") == 2);
    assert(restart_transport.count("start_discovery") == 2);

    // An empty identity keeps the node down.
    FixedIdentityStore none("");
    MeshNode broken(cfg, transport, none);
    MeshRuntime idle(broken, 5);
    assert(!idle.start());
    assert(!idle.running());
    return 0;
}
