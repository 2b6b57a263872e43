#include "mesh_encode.hpp"
#include "packet_router.hpp"

#include <cassert>
#include <set>
#include <string>

int main() {
    PacketRouter origin(5, 600000, 11);
    PacketRouter relay(5, 600000, 12);

    const Bytes payload{'h', 'i'};
    std::string id;
    const Bytes out = origin.create_broadcast(payload, PacketKind::Application, 1000, id);
    assert(id.size() == kPacketIdLength);
    assert(origin.has_seen(id));

    // Our own packet echoed back is a duplicate.
    assert(origin.handle_incoming(out, 1001).outcome == RouteOutcome::Duplicate);

    RouteResult r = relay.handle_incoming(out, 1002);
    assert(r.outcome == RouteOutcome::Delivered);
    assert(r.packet.id == id && r.packet.ttl == 5 && r.packet.payload == payload);
    assert(r.has_forward);
    MeshPacket fwd{};
    assert(decode_mesh_packet(r.forward_bytes, fwd));
    assert(fwd.id == id && fwd.ttl == 4 && fwd.kind == PacketKind::Application);

    // Same id from another neighbor: delivered at most once.
    assert(relay.handle_incoming(out, 1003).outcome == RouteOutcome::Duplicate);
    assert(relay.handle_incoming(r.forward_bytes, 1004).outcome == RouteOutcome::Duplicate);

    // TTL 0 is delivered but not forwarded.
    MeshPacket last{};
    last.id = "ffffffffffffffffffffffffffffffff";
    last.ttl = 0;
    last.kind = PacketKind::TopologyGossip;
    last.payload = Bytes{1, 2, 3};
    r = relay.handle_incoming(encode_mesh_packet(last), 2000);
    assert(r.outcome == RouteOutcome::Delivered);
    assert(!r.has_forward && r.forward_bytes.empty());
    assert(r.packet.kind == PacketKind::TopologyGossip);

    assert(relay.handle_incoming(Bytes{0x01, 0x02}, 2001).outcome == RouteOutcome::Malformed);

    // Fresh ids do not collide.
    std::set<std::string> ids;
    for (int i = 0; i < 500; ++i) {
        std::string next;
        origin.create_broadcast(Bytes(), PacketKind::Application, 3000, next);
        ids.insert(next);
    }
    assert(ids.size() == 500);

    // The cache forgets ids older than its TTL, after which a replay is new again.
    assert(relay.seen_count() == 2);
    assert(relay.sweep(601002) == 0);
    assert(relay.sweep(601003) == 1);
    assert(relay.seen_count() == 1);
    assert(relay.handle_incoming(out, 601004).outcome == RouteOutcome::Delivered);

    const RouterMetrics m = relay.metrics();
    assert(m.delivered == 3);
    assert(m.duplicates == 2);
    assert(m.malformed == 1);
    assert(m.ttl_expired == 1);
    assert(m.forwarded == 2);
    return 0;
}
