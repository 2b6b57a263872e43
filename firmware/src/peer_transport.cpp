#include "peer_transport.hpp"

namespace {
TransportEvent make_event(TransportEventKind kind, const PeerId& peer_id) {
    TransportEvent ev{};
    ev.kind = kind;
    ev.peer_id = peer_id;
    ev.outcome = ConnectionOutcome::Ok;
    return ev;
}
} // namespace

TransportEvent endpoint_found_event(const PeerId& peer_id, const PeerName& name) {
    TransportEvent ev = make_event(TransportEventKind::EndpointFound, peer_id);
    ev.name = name;
    return ev;
}

TransportEvent endpoint_lost_event(const PeerId& peer_id) {
    return make_event(TransportEventKind::EndpointLost, peer_id);
}

TransportEvent connection_initiated_event(const PeerId& peer_id, const PeerName& name) {
    TransportEvent ev = make_event(TransportEventKind::ConnectionInitiated, peer_id);
    ev.name = name;
    return ev;
}

TransportEvent connection_result_event(const PeerId& peer_id, ConnectionOutcome outcome) {
    TransportEvent ev = make_event(TransportEventKind::ConnectionResult, peer_id);
    ev.outcome = outcome;
    return ev;
}

TransportEvent disconnected_event(const PeerId& peer_id) {
    return make_event(TransportEventKind::Disconnected, peer_id);
}

TransportEvent payload_event(const PeerId& peer_id, const Bytes& bytes) {
    TransportEvent ev = make_event(TransportEventKind::PayloadReceived, peer_id);
    ev.bytes = bytes;
    return ev;
}

const char* transport_status_name(TransportStatus status) {
    switch (status) {
        case TransportStatus::Ok: return "ok";
        case TransportStatus::AlreadyRunning: return "already-running";
        case TransportStatus::AlreadyConnected: return "already-connected";
        case TransportStatus::Failed: return "failed";
        case TransportStatus::RadioError: return "radio-error";
    }
    return "unknown";
}

const char* transport_event_name(TransportEventKind kind) {
    switch (kind) {
        case TransportEventKind::EndpointFound: return "endpoint-found";
        case TransportEventKind::EndpointLost: return "endpoint-lost";
        case TransportEventKind::ConnectionInitiated: return "connection-initiated";
        case TransportEventKind::ConnectionResult: return "connection-result";
        case TransportEventKind::Disconnected: return "disconnected";
        case TransportEventKind::PayloadReceived: return "payload";
    }
    return "unknown";
}
