#include "mesh_encode.hpp"

#include <cstring>

namespace {
// Minimal CBOR writer/reader tailored to the mesh schema.
constexpr uint8_t kMajorUInt = 0u;
constexpr uint8_t kMajorBytes = 2u;
constexpr uint8_t kMajorText = 3u;
constexpr uint8_t kMajorArray = 4u;
constexpr uint8_t kMajorMap = 5u;

// Guards decode against absurd element counts in hostile input.
constexpr std::size_t kMaxGraphNodes = 4096;
constexpr std::size_t kMaxNameLen = 64;

struct CborWriter {
    Bytes& buf;

    void write_type(uint8_t major, uint64_t val) {
        if (val < 24) {
            buf.push_back(static_cast<uint8_t>((major << 5) | val));
        } else if (val <= 0xFF) {
            buf.push_back(static_cast<uint8_t>((major << 5) | 24));
            buf.push_back(static_cast<uint8_t>(val));
        } else if (val <= 0xFFFF) {
            buf.push_back(static_cast<uint8_t>((major << 5) | 25));
            buf.push_back(static_cast<uint8_t>((val >> 8) & 0xFF));
            buf.push_back(static_cast<uint8_t>(val & 0xFF));
        } else if (val <= 0xFFFFFFFF) {
            buf.push_back(static_cast<uint8_t>((major << 5) | 26));
            buf.push_back(static_cast<uint8_t>((val >> 24) & 0xFF));
            buf.push_back(static_cast<uint8_t>((val >> 16) & 0xFF));
            buf.push_back(static_cast<uint8_t>((val >> 8) & 0xFF));
            buf.push_back(static_cast<uint8_t>(val & 0xFF));
        } else {
            buf.push_back(static_cast<uint8_t>((major << 5) | 27));
            for (int shift = 56; shift >= 0; shift -= 8) {
                buf.push_back(static_cast<uint8_t>((val >> shift) & 0xFF));
            }
        }
    }
    void write_uint(uint64_t v) { write_type(kMajorUInt, v); }
    void write_bytes(const uint8_t* data, std::size_t len) {
        write_type(kMajorBytes, len);
        buf.insert(buf.end(), data, data + len);
    }
    void write_text(const std::string& s) {
        write_type(kMajorText, s.size());
        buf.insert(buf.end(), s.begin(), s.end());
    }
    void write_map_start(std::size_t count) { write_type(kMajorMap, count); }
    void write_array_start(std::size_t count) { write_type(kMajorArray, count); }
};

struct CborReader {
    const uint8_t* data;
    std::size_t len;
    std::size_t idx = 0;

    bool at_end() const { return idx == len; }

    bool read_type(uint8_t& major, uint64_t& val) {
        if (idx >= len) return false;
        const uint8_t ib = data[idx++];
        major = ib >> 5;
        const uint8_t ai = ib & 0x1F;
        if (ai < 24) {
            val = ai;
            return true;
        }
        std::size_t extra = 0;
        switch (ai) {
            case 24: extra = 1; break;
            case 25: extra = 2; break;
            case 26: extra = 4; break;
            case 27: extra = 8; break;
            default: return false; // indefinite lengths unsupported
        }
        if (len - idx < extra) return false;
        val = 0;
        for (std::size_t i = 0; i < extra; ++i) {
            val = (val << 8) | data[idx++];
        }
        return true;
    }
    bool read_uint(uint64_t& out) {
        uint8_t major = 0; uint64_t val = 0;
        if (!read_type(major, val)) return false;
        if (major != kMajorUInt) return false;
        out = val;
        return true;
    }
    bool read_bytes(Bytes& out, std::size_t max_len) {
        uint8_t major = 0; uint64_t val = 0;
        if (!read_type(major, val)) return false;
        if (major != kMajorBytes) return false;
        if (val > len - idx || val > max_len) return false;
        out.assign(data + idx, data + idx + val);
        idx += static_cast<std::size_t>(val);
        return true;
    }
    bool read_text(std::string& out, std::size_t max_len) {
        uint8_t major = 0; uint64_t val = 0;
        if (!read_type(major, val)) return false;
        if (major != kMajorText) return false;
        if (val > len - idx || val > max_len) return false;
        out.assign(reinterpret_cast<const char*>(data + idx), static_cast<std::size_t>(val));
        idx += static_cast<std::size_t>(val);
        return true;
    }
    bool read_array_len(std::size_t& out_len) {
        uint8_t major = 0; uint64_t val = 0;
        if (!read_type(major, val)) return false;
        if (major != kMajorArray) return false;
        out_len = static_cast<std::size_t>(val);
        return true;
    }
    bool read_map_len(std::size_t& out_len) {
        uint8_t major = 0; uint64_t val = 0;
        if (!read_type(major, val)) return false;
        if (major != kMajorMap) return false;
        out_len = static_cast<std::size_t>(val);
        return true;
    }
};

bool is_known_frame_type(uint64_t v) {
    return v == static_cast<uint64_t>(FrameType::Ping) ||
           v == static_cast<uint64_t>(FrameType::Pong) ||
           v == static_cast<uint64_t>(FrameType::Packet);
}

bool is_known_packet_kind(uint64_t v) {
    return v == static_cast<uint64_t>(PacketKind::Application) ||
           v == static_cast<uint64_t>(PacketKind::TopologyGossip);
}
} // namespace

Bytes encode_transport_frame(FrameType type, const Bytes& payload) {
    Bytes out;
    out.reserve(payload.size() + 8);
    CborWriter w{out};
    w.write_array_start(2);
    w.write_uint(static_cast<uint8_t>(type));
    w.write_bytes(payload.data(), payload.size());
    return out;
}

bool decode_transport_frame(const uint8_t* data, std::size_t len, TransportFrame& out) {
    if (data == nullptr || len == 0) return false;
    CborReader r{data, len};
    std::size_t arr_len = 0;
    if (!r.read_array_len(arr_len) || arr_len != 2) return false;
    uint64_t type = 0;
    if (!r.read_uint(type) || !is_known_frame_type(type)) return false;
    Bytes payload;
    if (!r.read_bytes(payload, kMaxFrameLen)) return false;
    if (!r.at_end()) return false;
    out.type = static_cast<FrameType>(type);
    out.payload = std::move(payload);
    return true;
}

Bytes encode_mesh_packet(const MeshPacket& packet) {
    Bytes out;
    out.reserve(packet.payload.size() + packet.id.size() + 12);
    CborWriter w{out};
    w.write_array_start(4);
    w.write_text(packet.id);
    w.write_uint(packet.ttl);
    w.write_uint(static_cast<uint8_t>(packet.kind));
    w.write_bytes(packet.payload.data(), packet.payload.size());
    return out;
}

bool decode_mesh_packet(const uint8_t* data, std::size_t len, MeshPacket& out) {
    if (data == nullptr || len == 0) return false;
    CborReader r{data, len};
    std::size_t arr_len = 0;
    if (!r.read_array_len(arr_len) || arr_len != 4) return false;
    MeshPacket p{};
    if (!r.read_text(p.id, kMaxNameLen) || p.id.empty()) return false;
    uint64_t ttl = 0;
    if (!r.read_uint(ttl) || ttl > 0xFF) return false;
    uint64_t kind = 0;
    if (!r.read_uint(kind) || !is_known_packet_kind(kind)) return false;
    if (!r.read_bytes(p.payload, kMaxFrameLen)) return false;
    if (!r.at_end()) return false;
    p.ttl = static_cast<uint8_t>(ttl);
    p.kind = static_cast<PacketKind>(kind);
    out = std::move(p);
    return true;
}

Bytes encode_neighbor_graph(const NeighborGraph& graph) {
    Bytes out;
    CborWriter w{out};
    w.write_map_start(graph.size());
    for (const auto& entry : graph) {
        w.write_text(entry.first);
        w.write_array_start(entry.second.size());
        for (const auto& neighbor : entry.second) {
            w.write_text(neighbor);
        }
    }
    return out;
}

bool decode_neighbor_graph(const uint8_t* data, std::size_t len, NeighborGraph& out) {
    if (data == nullptr || len == 0) return false;
    CborReader r{data, len};
    std::size_t map_len = 0;
    if (!r.read_map_len(map_len) || map_len > kMaxGraphNodes) return false;
    NeighborGraph graph;
    for (std::size_t i = 0; i < map_len; ++i) {
        std::string name;
        if (!r.read_text(name, kMaxNameLen) || name.empty()) return false;
        std::size_t arr_len = 0;
        if (!r.read_array_len(arr_len) || arr_len > kMaxGraphNodes) return false;
        std::set<PeerName>& neighbors = graph[name];
        for (std::size_t j = 0; j < arr_len; ++j) {
            std::string neighbor;
            if (!r.read_text(neighbor, kMaxNameLen) || neighbor.empty()) return false;
            neighbors.insert(std::move(neighbor));
        }
    }
    if (!r.at_end()) return false;
    out = std::move(graph);
    return true;
}
