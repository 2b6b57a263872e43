#pragma once

#include <cstdint>

#include "connection_orchestrator.hpp"
#include "device_registry.hpp"

struct GossipMetrics {
    uint32_t sent;
    uint32_t received;
    uint32_t merged;
    uint32_t malformed;
};

// Periodically floods the local view of the neighbor graph and unions the
// views received from others. Only the local node writes its own entry.
class TopologyGossipService {
public:
    TopologyGossipService(DeviceRegistry& registry, ConnectionOrchestrator& orchestrator);

    bool gossip_now();
    bool handle_gossip(const PeerId& from, const MeshPacket& packet);
    GossipMetrics metrics() const { return metrics_; }

private:
    DeviceRegistry& registry_;
    ConnectionOrchestrator& orchestrator_;
    GossipMetrics metrics_{};
};
