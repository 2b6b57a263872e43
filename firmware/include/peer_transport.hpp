#pragma once

#include <cstdint>
#include <functional>
#include <vector>

#include "mesh_types.hpp"

enum class TransportStatus : uint8_t {
    Ok,
    AlreadyRunning,
    AlreadyConnected,
    Failed,
    RadioError, // radio stack wedged; the node restarts the transport
};

enum class ConnectionOutcome : uint8_t {
    Ok,
    Rejected,
    Error,
};

enum class TransportEventKind : uint8_t {
    EndpointFound,
    EndpointLost,
    ConnectionInitiated,
    ConnectionResult,
    Disconnected,
    PayloadReceived,
};

struct TransportEvent {
    TransportEventKind kind;
    PeerId peer_id;
    PeerName name;             // EndpointFound, ConnectionInitiated
    ConnectionOutcome outcome; // ConnectionResult
    Bytes bytes;               // PayloadReceived
};

TransportEvent endpoint_found_event(const PeerId& peer_id, const PeerName& name);
TransportEvent endpoint_lost_event(const PeerId& peer_id);
TransportEvent connection_initiated_event(const PeerId& peer_id, const PeerName& name);
TransportEvent connection_result_event(const PeerId& peer_id, ConnectionOutcome outcome);
TransportEvent disconnected_event(const PeerId& peer_id);
TransportEvent payload_event(const PeerId& peer_id, const Bytes& bytes);

const char* transport_status_name(TransportStatus status);
const char* transport_event_name(TransportEventKind kind);

// One-hop discovery, connection and byte delivery. Implementations may call
// the event sink from any thread; the node only queues what it receives.
class PeerTransport {
public:
    using EventSink = std::function<void(const TransportEvent&)>;

    virtual ~PeerTransport() = default;

    virtual void set_event_sink(EventSink sink) = 0;

    virtual TransportStatus start_advertising(const PeerName& local_name) = 0;
    virtual TransportStatus stop_advertising() = 0;
    virtual TransportStatus start_discovery() = 0;
    virtual TransportStatus stop_discovery() = 0;

    virtual TransportStatus request_connection(const PeerName& local_name, const PeerId& peer_id) = 0;
    virtual TransportStatus accept_connection(const PeerId& peer_id) = 0;
    virtual TransportStatus reject_connection(const PeerId& peer_id) = 0;
    virtual TransportStatus disconnect(const PeerId& peer_id) = 0;

    virtual TransportStatus send(const PeerId& peer_id, const Bytes& bytes) = 0;
    virtual TransportStatus send(const std::vector<PeerId>& peer_ids, const Bytes& bytes) = 0;

    virtual void stop_all() = 0;
};
