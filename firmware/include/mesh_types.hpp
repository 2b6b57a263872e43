#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

// Transport-assigned id of one link session. Not stable across reconnects.
using PeerId = std::string;
// Persistent logical identity; the neighbor graph is keyed by it.
using PeerName = std::string;

using Bytes = std::vector<uint8_t>;
using NeighborGraph = std::map<PeerName, std::set<PeerName>>;

constexpr std::size_t kPacketIdLength = 32; // hex chars of a 128-bit id

enum class FrameType : uint8_t {
    Ping = 1,
    Pong = 2,
    Packet = 3,
};

enum class PacketKind : uint8_t {
    Application = 1,
    TopologyGossip = 2,
};

struct TransportFrame {
    FrameType type;
    Bytes payload;
};

struct MeshPacket {
    std::string id;
    uint8_t ttl;
    PacketKind kind;
    Bytes payload;
};
