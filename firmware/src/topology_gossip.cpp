#include "topology_gossip.hpp"

#include "fault.hpp"
#include "logging.hpp"
#include "mesh_encode.hpp"

TopologyGossipService::TopologyGossipService(DeviceRegistry& registry, ConnectionOrchestrator& orchestrator)
    : registry_(registry), orchestrator_(orchestrator) {}

bool TopologyGossipService::gossip_now() {
    const NeighborGraph graph = registry_.graph();
    if (graph.empty()) {
        return false;
    }
    if (!orchestrator_.broadcast(encode_neighbor_graph(graph), PacketKind::TopologyGossip)) {
        return false;
    }
    metrics_.sent++;
    log_debug("[GOSSIP] sent view of %zu nodes", graph.size());
    return true;
}

bool TopologyGossipService::handle_gossip(const PeerId& from, const MeshPacket& packet) {
    if (packet.kind != PacketKind::TopologyGossip) {
        return false;
    }
    metrics_.received++;
    NeighborGraph remote;
    if (!decode_neighbor_graph(packet.payload, remote)) {
        metrics_.malformed++;
        record_malformed_frame();
        log_warn("[GOSSIP] malformed graph via %s", from.c_str());
        return false;
    }
    if (!registry_.merge_graph(remote, orchestrator_.local_name())) {
        return false;
    }
    metrics_.merged++;
    log_debug("[GOSSIP] merged view via %s, graph now %zu nodes", from.c_str(), registry_.graph().size());
    return true;
}
