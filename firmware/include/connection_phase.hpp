#pragma once

#include <cstdint>

#include "config.hpp"

enum class ConnectionPhase : uint8_t {
    Discovered,
    Connecting,
    Connected,
    Disconnected,
    Rejected,
    Error,
};

struct PhaseTimeouts {
    uint32_t connecting_ms;
    uint32_t connected_ms;
    uint32_t disconnected_ms;
    uint32_t rejected_ms;
    uint32_t error_ms;
};

PhaseTimeouts phase_timeouts_from(const NodeConfig& cfg);

// 0 means the phase never times out.
uint32_t phase_timeout_ms(ConnectionPhase phase, const PhaseTimeouts& timeouts);

// Phase entered when a timeout fires. Returns false when the peer should be
// removed from the registry instead.
bool phase_on_timeout(ConnectionPhase phase, ConnectionPhase& next);

// CONNECTED/CONNECTING can never be overwritten by DISCOVERED or CONNECTING.
bool is_phase_regression(ConnectionPhase current, ConnectionPhase next);

bool is_busy_phase(ConnectionPhase phase);
const char* phase_name(ConnectionPhase phase);
