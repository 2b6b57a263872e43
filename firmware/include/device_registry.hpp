#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <vector>

#include "connection_phase.hpp"
#include "mesh_types.hpp"
#include "scheduler.hpp"

struct PeerConnectionState {
    PeerId peer_id;
    PeerName peer_name;
    ConnectionPhase phase;
    uint64_t entered_ms;
    TimerId timeout_timer;
    uint64_t generation;
};

struct RetryState {
    uint32_t retry_count;
    uint64_t not_before_ms;
};

enum class UpdateResult : uint8_t {
    Applied,
    RejectedRegression,
    RejectedCapacity,
};

struct PhaseChange {
    PeerId peer_id;
    PeerName peer_name;
    bool had_previous;
    ConnectionPhase from;
    bool removed;
    ConnectionPhase to; // valid when !removed
    bool timed_out;
};

// Unions remote into graph, skipping the entry for skip_name and self-loops.
// Idempotent and commutative. Returns true if graph changed.
bool merge_neighbor_graph(NeighborGraph& graph, const NeighborGraph& remote, const PeerName& skip_name);

// Single source of truth for per-peer state, retry counters, the potential
// peer set and the neighbor graph. Every mutation holds mutex_ for the whole
// read-modify-write, including the ones fired by phase timers. The listener
// is invoked after the lock is released.
class DeviceRegistry {
public:
    using PhaseListener = std::function<void(const PhaseChange&)>;

    DeviceRegistry(Scheduler& scheduler, const PhaseTimeouts& timeouts, std::size_t max_connections);
    ~DeviceRegistry();

    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    void set_phase_listener(PhaseListener listener);

    bool get_state(const PeerId& peer_id, PeerConnectionState& out) const;
    // An empty new_name keeps the current name ("Unknown" for new peers).
    UpdateResult update_status(const PeerId& peer_id, ConnectionPhase new_phase, const PeerName& new_name = PeerName());
    bool remove(const PeerId& peer_id);
    // Drops every peer state and cancels its timer. Retry state and the graph survive.
    void clear_peers();

    uint32_t retry_count(const PeerName& name) const;
    uint32_t increment_retry(const PeerName& name);
    void reset_retry(const PeerName& name);
    void defer_retry(const PeerName& name, uint64_t not_before_ms);
    bool retry_ready(const PeerName& name, uint64_t now_ms) const;

    void add_potential_peer(const PeerId& peer_id);
    std::set<PeerId> potential_peers() const;

    void update_local_neighbors(const PeerName& local_name, const std::set<PeerName>& neighbors);
    // Unions remote into the local graph. The entry for skip_name is left alone.
    bool merge_graph(const NeighborGraph& remote, const PeerName& skip_name = PeerName());
    NeighborGraph graph() const;
    bool graph_contains(const PeerName& name) const;

    std::vector<PeerConnectionState> snapshot() const;
    std::size_t count_in_phase(ConnectionPhase phase) const;
    std::size_t busy_count() const;
    std::set<PeerName> connected_names() const;
    bool find_peer_by_name(const PeerName& name, PeerId& out) const;
    std::size_t max_connections() const { return max_connections_; }
    uint64_t revision() const;

private:
    void on_phase_timeout(const PeerId& peer_id, uint64_t generation);
    void arm_timeout_locked(PeerConnectionState& state);
    void erase_locked(std::map<PeerId, PeerConnectionState>::iterator it);
    std::size_t count_in_phase_locked(ConnectionPhase phase) const;
    void notify(const PhaseChange& change);

    Scheduler& scheduler_;
    const PhaseTimeouts timeouts_;
    const std::size_t max_connections_;

    mutable std::mutex mutex_;
    std::map<PeerId, PeerConnectionState> peers_;
    std::map<PeerName, RetryState> retries_;
    std::set<PeerId> potential_;
    NeighborGraph graph_;
    uint64_t next_generation_ = 1;
    uint64_t revision_ = 0;
    PhaseListener listener_;
};
