#include "config.hpp"
#include "connection_phase.hpp"

#include <cassert>
#include <cstring>

int main() {
    const NodeConfig cfg = load_config();
    const PhaseTimeouts t = phase_timeouts_from(cfg);

    assert(phase_timeout_ms(ConnectionPhase::Discovered, t) == 0);
    assert(phase_timeout_ms(ConnectionPhase::Connecting, t) == 30000);
    assert(phase_timeout_ms(ConnectionPhase::Connected, t) == 60000);
    assert(phase_timeout_ms(ConnectionPhase::Disconnected, t) == 30000);
    assert(phase_timeout_ms(ConnectionPhase::Rejected, t) == 30000);
    assert(phase_timeout_ms(ConnectionPhase::Error, t) == 30000);

    // Every timed phase falls into ERROR; ERROR itself ends in removal.
    const ConnectionPhase timed[] = {
        ConnectionPhase::Connecting,
        ConnectionPhase::Connected,
        ConnectionPhase::Disconnected,
        ConnectionPhase::Rejected,
    };
    for (ConnectionPhase p : timed) {
        ConnectionPhase next = ConnectionPhase::Discovered;
        assert(phase_on_timeout(p, next));
        assert(next == ConnectionPhase::Error);
    }
    ConnectionPhase next = ConnectionPhase::Discovered;
    assert(!phase_on_timeout(ConnectionPhase::Error, next));

    // Busy phases cannot be knocked back by discovery echoes or a second dial.
    assert(is_phase_regression(ConnectionPhase::Connected, ConnectionPhase::Discovered));
    assert(is_phase_regression(ConnectionPhase::Connected, ConnectionPhase::Connecting));
    assert(is_phase_regression(ConnectionPhase::Connecting, ConnectionPhase::Discovered));
    assert(is_phase_regression(ConnectionPhase::Connecting, ConnectionPhase::Connecting));
    assert(!is_phase_regression(ConnectionPhase::Connected, ConnectionPhase::Error));
    assert(!is_phase_regression(ConnectionPhase::Connecting, ConnectionPhase::Connected));
    assert(!is_phase_regression(ConnectionPhase::Error, ConnectionPhase::Discovered));
    assert(!is_phase_regression(ConnectionPhase::Rejected, ConnectionPhase::Connecting));

    assert(is_busy_phase(ConnectionPhase::Connected));
    assert(is_busy_phase(ConnectionPhase::Connecting));
    assert(!is_busy_phase(ConnectionPhase::Disconnected));
    assert(std::strcmp(phase_name(ConnectionPhase::Rejected), "REJECTED") == 0);
    return 0;
}
