#pragma once

#include <cstddef>
#include <cstdint>

#include "mesh_types.hpp"

// Upper bound for any single frame handed to the transport.
constexpr std::size_t kMaxFrameLen = 64 * 1024;

// Transport frame: CBOR [uint frame_type, bytes payload].
Bytes encode_transport_frame(FrameType type, const Bytes& payload);
bool decode_transport_frame(const uint8_t* data, std::size_t len, TransportFrame& out);
inline bool decode_transport_frame(const Bytes& bytes, TransportFrame& out) {
    return decode_transport_frame(bytes.data(), bytes.size(), out);
}

// Mesh packet: CBOR [text id, uint ttl, uint kind, bytes payload].
Bytes encode_mesh_packet(const MeshPacket& packet);
bool decode_mesh_packet(const uint8_t* data, std::size_t len, MeshPacket& out);
inline bool decode_mesh_packet(const Bytes& bytes, MeshPacket& out) {
    return decode_mesh_packet(bytes.data(), bytes.size(), out);
}

// Gossip graph: CBOR {text name: [text neighbor, ...]}.
Bytes encode_neighbor_graph(const NeighborGraph& graph);
bool decode_neighbor_graph(const uint8_t* data, std::size_t len, NeighborGraph& out);
inline bool decode_neighbor_graph(const Bytes& bytes, NeighborGraph& out) {
    return decode_neighbor_graph(bytes.data(), bytes.size(), out);
}
