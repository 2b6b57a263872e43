#include "connection_phase.hpp"

PhaseTimeouts phase_timeouts_from(const NodeConfig& cfg) {
    PhaseTimeouts t{};
    t.connecting_ms = cfg.connecting_timeout_ms;
    t.connected_ms = cfg.connected_timeout_ms;
    t.disconnected_ms = cfg.disconnected_timeout_ms;
    t.rejected_ms = cfg.rejected_timeout_ms;
    t.error_ms = cfg.error_timeout_ms;
    return t;
}

uint32_t phase_timeout_ms(ConnectionPhase phase, const PhaseTimeouts& timeouts) {
    switch (phase) {
        case ConnectionPhase::Discovered: return 0;
        case ConnectionPhase::Connecting: return timeouts.connecting_ms;
        case ConnectionPhase::Connected: return timeouts.connected_ms;
        case ConnectionPhase::Disconnected: return timeouts.disconnected_ms;
        case ConnectionPhase::Rejected: return timeouts.rejected_ms;
        case ConnectionPhase::Error: return timeouts.error_ms;
    }
    return 0;
}

bool phase_on_timeout(ConnectionPhase phase, ConnectionPhase& next) {
    switch (phase) {
        case ConnectionPhase::Discovered:
        case ConnectionPhase::Connecting:
        case ConnectionPhase::Connected:
        case ConnectionPhase::Disconnected:
        case ConnectionPhase::Rejected:
            next = ConnectionPhase::Error;
            return true;
        case ConnectionPhase::Error:
            return false;
    }
    return false;
}

bool is_phase_regression(ConnectionPhase current, ConnectionPhase next) {
    if (!is_busy_phase(current)) {
        return false;
    }
    return next == ConnectionPhase::Discovered || next == ConnectionPhase::Connecting;
}

bool is_busy_phase(ConnectionPhase phase) {
    return phase == ConnectionPhase::Connected || phase == ConnectionPhase::Connecting;
}

const char* phase_name(ConnectionPhase phase) {
    switch (phase) {
        case ConnectionPhase::Discovered: return "DISCOVERED";
        case ConnectionPhase::Connecting: return "CONNECTING";
        case ConnectionPhase::Connected: return "CONNECTED";
        case ConnectionPhase::Disconnected: return "DISCONNECTED";
        case ConnectionPhase::Rejected: return "REJECTED";
        case ConnectionPhase::Error: return "ERROR";
    }
    return "?";
}
