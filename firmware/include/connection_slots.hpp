#pragma once

#include <cstdint>
#include <map>
#include <random>
#include <set>
#include <vector>

#include "config.hpp"
#include "device_registry.hpp"

enum class SlotActionKind : uint8_t {
    None,
    Connect,
    Disconnect,
};

struct SlotAction {
    SlotActionKind kind;
    PeerId peer_id;
    PeerName peer_name;
    const char* reason;
};

// Decides which peers to dial and which links to give up. It never touches
// the transport; the orchestrator carries out the returned actions. Owned by
// the node loop.
class ConnectionSlotManager {
public:
    ConnectionSlotManager(DeviceRegistry& registry, const NodeConfig& cfg, std::mt19937& rng);

    void set_local_name(const PeerName& name) { local_name_ = name; }

    // A CONNECTED neighbor that is also adjacent to another of our CONNECTED
    // neighbors, picked uniformly at random.
    bool find_redundant_peer(PeerConnectionState& out);
    bool select_outbound_candidate(uint64_t now_ms, PeerConnectionState& out);
    bool island_breaking_victim(uint64_t now_ms, PeerConnectionState& out);
    // A CONNECTED neighbor whose only known neighbor is us.
    bool rotation_victim(PeerConnectionState& out);

    SlotAction plan_management_cycle(uint64_t now_ms);
    SlotAction plan_rotation();

    void prioritize(const PeerName& name);
    void clear_priority(const PeerName& name);
    void clear_priorities();
    bool is_prioritized(const PeerName& name) const;

    void note_evicted(const PeerName& name, uint64_t now_ms);
    bool in_cooldown(const PeerName& name, uint64_t now_ms) const;
    // Drops cooldowns that have run out. The management cycle calls this.
    void prune_cooldowns(uint64_t now_ms);
    std::size_t cooldown_count() const { return evicted_at_.size(); }

    // Name unknown to our neighbor graph: likely a bridge to another island.
    bool is_foreign(const PeerName& name) const;

private:
    std::vector<PeerConnectionState> connected_peers() const;
    std::vector<PeerConnectionState> redundant_peers() const;
    std::vector<PeerConnectionState> eligible_candidates(uint64_t now_ms) const;
    bool pick(const std::vector<PeerConnectionState>& pool, PeerConnectionState& out);
    bool has_foreign_candidate(uint64_t now_ms) const;

    DeviceRegistry& registry_;
    const NodeConfig& cfg_;
    std::mt19937& rng_;
    PeerName local_name_;
    std::set<PeerName> prioritized_;
    std::map<PeerName, uint64_t> evicted_at_;
    uint64_t last_starvation_log_ms_ = 0;
    bool starvation_logged_ = false;
};
