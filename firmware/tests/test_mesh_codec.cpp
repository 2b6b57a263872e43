#include "mesh_encode.hpp"

#include <cassert>
#include <random>
#include <string>

int main() {
    // Golden bytes for the empty PING frame: array(2) [1, bytes(0)].
    const Bytes ping = encode_transport_frame(FrameType::Ping, Bytes());
    assert((ping == Bytes{0x82, 0x01, 0x40}));

    TransportFrame frame{};
    assert(decode_transport_frame(ping, frame));
    assert(frame.type == FrameType::Ping && frame.payload.empty());

    MeshPacket p{};
    p.id = "00112233445566778899aabbccddeeff";
    p.ttl = 5;
    p.kind = PacketKind::Application;
    p.payload = Bytes(300, 0xAB); // forces a two-byte length
    const Bytes packet_bytes = encode_mesh_packet(p);
    const Bytes wrapped = encode_transport_frame(FrameType::Packet, packet_bytes);
    assert(decode_transport_frame(wrapped, frame));
    assert(frame.type == FrameType::Packet);
    MeshPacket back{};
    assert(decode_mesh_packet(frame.payload, back));
    assert(back.id == p.id && back.ttl == 5 && back.kind == PacketKind::Application);
    assert(back.payload == p.payload);

    // Unknown frame type, unknown packet kind and trailing garbage are rejected.
    assert(!decode_transport_frame(Bytes{0x82, 0x07, 0x40}, frame));
    Bytes trailing = ping;
    trailing.push_back(0x00);
    assert(!decode_transport_frame(trailing, frame));
    assert(!decode_transport_frame(Bytes(), frame));
    MeshPacket bad_kind = p;
    bad_kind.kind = static_cast<PacketKind>(9);
    assert(!decode_mesh_packet(encode_mesh_packet(bad_kind), back));

    // Truncation anywhere must fail cleanly.
    for (std::size_t cut = 0; cut < packet_bytes.size(); ++cut) {
        assert(!decode_mesh_packet(packet_bytes.data(), cut, back));
    }

    // A bytes header that claims more than is present.
    assert(!decode_transport_frame(Bytes{0x82, 0x03, 0x5A, 0xFF, 0xFF, 0xFF, 0xFF}, frame));

    NeighborGraph g;
    g["node-a"] = {"node-b", "node-c"};
    g["node-b"] = {"node-a"};
    g["node-c"] = {};
    NeighborGraph g2;
    assert(decode_neighbor_graph(encode_neighbor_graph(g), g2));
    assert(g2 == g);
    assert(!decode_neighbor_graph(Bytes{0xA1, 0x61, 0x61}, g2)); // value missing

    // Random input never crashes the decoders.
    std::mt19937 rng(7);
    std::uniform_int_distribution<int> byte(0, 255);
    std::uniform_int_distribution<int> len(0, 64);
    for (int i = 0; i < 2000; ++i) {
        Bytes junk(static_cast<std::size_t>(len(rng)));
        for (auto& b : junk) b = static_cast<uint8_t>(byte(rng));
        decode_transport_frame(junk, frame);
        decode_mesh_packet(junk, back);
        decode_neighbor_graph(junk, g2);
    }
    return 0;
}
