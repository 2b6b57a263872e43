#include "connection_slots.hpp"

#include "logging.hpp"

#include <algorithm>

namespace {
constexpr uint64_t kStarvationLogIntervalMs = 30000;

std::set<PeerName> known_neighbors(const NeighborGraph& graph, const PeerName& name) {
    std::set<PeerName> out;
    auto it = graph.find(name);
    if (it != graph.end()) {
        out.insert(it->second.begin(), it->second.end());
    }
    for (const auto& entry : graph) {
        if (entry.second.count(name) != 0) {
            out.insert(entry.first);
        }
    }
    out.erase(name);
    return out;
}

bool adjacent(const NeighborGraph& graph, const PeerName& a, const PeerName& b) {
    auto ia = graph.find(a);
    if (ia != graph.end() && ia->second.count(b) != 0) return true;
    auto ib = graph.find(b);
    return ib != graph.end() && ib->second.count(a) != 0;
}
} // namespace

ConnectionSlotManager::ConnectionSlotManager(DeviceRegistry& registry, const NodeConfig& cfg, std::mt19937& rng)
    : registry_(registry), cfg_(cfg), rng_(rng) {}

std::vector<PeerConnectionState> ConnectionSlotManager::connected_peers() const {
    std::vector<PeerConnectionState> out;
    for (const auto& s : registry_.snapshot()) {
        if (s.phase == ConnectionPhase::Connected) {
            out.push_back(s);
        }
    }
    return out;
}

std::vector<PeerConnectionState> ConnectionSlotManager::redundant_peers() const {
    const std::vector<PeerConnectionState> connected = connected_peers();
    const NeighborGraph graph = registry_.graph();
    std::vector<PeerConnectionState> out;
    for (std::size_t i = 0; i < connected.size(); ++i) {
        for (std::size_t j = 0; j < connected.size(); ++j) {
            if (i == j) continue;
            if (adjacent(graph, connected[i].peer_name, connected[j].peer_name)) {
                out.push_back(connected[i]);
                break;
            }
        }
    }
    return out;
}

bool ConnectionSlotManager::pick(const std::vector<PeerConnectionState>& pool, PeerConnectionState& out) {
    if (pool.empty()) {
        return false;
    }
    std::uniform_int_distribution<std::size_t> dist(0, pool.size() - 1);
    out = pool[dist(rng_)];
    return true;
}

bool ConnectionSlotManager::find_redundant_peer(PeerConnectionState& out) {
    return pick(redundant_peers(), out);
}

std::vector<PeerConnectionState> ConnectionSlotManager::eligible_candidates(uint64_t now_ms) const {
    const std::vector<PeerConnectionState> all = registry_.snapshot();
    const std::set<PeerId> potential = registry_.potential_peers();
    std::set<PeerName> busy_names;
    for (const auto& s : all) {
        if (is_busy_phase(s.phase)) {
            busy_names.insert(s.peer_name);
        }
    }
    std::vector<PeerConnectionState> out;
    for (const auto& s : all) {
        if (s.phase != ConnectionPhase::Discovered) continue;
        if (potential.count(s.peer_id) == 0) continue;
        if (s.peer_name == local_name_) continue;
        if (busy_names.count(s.peer_name) != 0) continue;
        if (in_cooldown(s.peer_name, now_ms)) continue;
        if (!registry_.retry_ready(s.peer_name, now_ms)) continue;
        out.push_back(s);
    }
    return out;
}

bool ConnectionSlotManager::select_outbound_candidate(uint64_t now_ms, PeerConnectionState& out) {
    const std::vector<PeerConnectionState> pool = eligible_candidates(now_ms);
    std::vector<PeerConnectionState> prioritized;
    std::vector<PeerConnectionState> foreign;
    std::vector<PeerConnectionState> fresh;
    for (const auto& s : pool) {
        if (is_prioritized(s.peer_name)) prioritized.push_back(s);
        if (is_foreign(s.peer_name)) foreign.push_back(s);
        if (registry_.retry_count(s.peer_name) == 0) fresh.push_back(s);
    }
    if (pick(prioritized, out) || pick(foreign, out) || pick(fresh, out) || pick(pool, out)) {
        return true;
    }
    if (!starvation_logged_ || now_ms - last_starvation_log_ms_ > kStarvationLogIntervalMs) {
        log_debug("[SLOTS] no suitable candidates (potential=%zu busy=%zu)",
                  registry_.potential_peers().size(), registry_.busy_count());
        last_starvation_log_ms_ = now_ms;
        starvation_logged_ = true;
    }
    return false;
}

bool ConnectionSlotManager::has_foreign_candidate(uint64_t now_ms) const {
    for (const auto& s : eligible_candidates(now_ms)) {
        if (is_prioritized(s.peer_name) || is_foreign(s.peer_name)) {
            return true;
        }
    }
    return false;
}

bool ConnectionSlotManager::island_breaking_victim(uint64_t now_ms, PeerConnectionState& out) {
    if (has_foreign_candidate(now_ms)) {
        std::vector<PeerConnectionState> redundant = redundant_peers();
        if (!redundant.empty()) {
            std::sort(redundant.begin(), redundant.end(),
                      [](const PeerConnectionState& a, const PeerConnectionState& b) {
                          return a.peer_name < b.peer_name;
                      });
            out = redundant.front();
            return true;
        }
    }
    std::uniform_real_distribution<double> coin(0.0, 1.0);
    if (coin(rng_) >= cfg_.island_break_probability) {
        return false;
    }
    return pick(connected_peers(), out);
}

bool ConnectionSlotManager::rotation_victim(PeerConnectionState& out) {
    const NeighborGraph graph = registry_.graph();
    std::vector<PeerConnectionState> leaves;
    for (const auto& s : connected_peers()) {
        std::set<PeerName> neighbors = known_neighbors(graph, s.peer_name);
        neighbors.erase(local_name_);
        if (neighbors.empty()) {
            leaves.push_back(s);
        }
    }
    return pick(leaves, out);
}

SlotAction ConnectionSlotManager::plan_management_cycle(uint64_t now_ms) {
    SlotAction action{SlotActionKind::None, PeerId(), PeerName(), ""};
    prune_cooldowns(now_ms);
    PeerConnectionState chosen{};
    if (registry_.busy_count() < registry_.max_connections()) {
        if (select_outbound_candidate(now_ms, chosen)) {
            action.kind = SlotActionKind::Connect;
            action.peer_id = chosen.peer_id;
            action.peer_name = chosen.peer_name;
            action.reason = is_prioritized(chosen.peer_name) ? "prioritized"
                          : is_foreign(chosen.peer_name)     ? "foreign"
                                                             : "open slot";
        }
        return action;
    }
    if (island_breaking_victim(now_ms, chosen)) {
        action.kind = SlotActionKind::Disconnect;
        action.peer_id = chosen.peer_id;
        action.peer_name = chosen.peer_name;
        action.reason = "island breaker";
    }
    return action;
}

SlotAction ConnectionSlotManager::plan_rotation() {
    SlotAction action{SlotActionKind::None, PeerId(), PeerName(), ""};
    if (registry_.count_in_phase(ConnectionPhase::Connected) < registry_.max_connections()) {
        return action;
    }
    PeerConnectionState chosen{};
    if (rotation_victim(chosen)) {
        action.kind = SlotActionKind::Disconnect;
        action.peer_id = chosen.peer_id;
        action.peer_name = chosen.peer_name;
        action.reason = "rotation";
    }
    return action;
}

void ConnectionSlotManager::prioritize(const PeerName& name) {
    if (prioritized_.insert(name).second) {
        log_info("[SLOTS] prioritizing %s", name.c_str());
    }
}

void ConnectionSlotManager::clear_priority(const PeerName& name) {
    prioritized_.erase(name);
}

void ConnectionSlotManager::clear_priorities() {
    prioritized_.clear();
}

bool ConnectionSlotManager::is_prioritized(const PeerName& name) const {
    return prioritized_.count(name) != 0;
}

void ConnectionSlotManager::note_evicted(const PeerName& name, uint64_t now_ms) {
    evicted_at_[name] = now_ms;
}

bool ConnectionSlotManager::in_cooldown(const PeerName& name, uint64_t now_ms) const {
    auto it = evicted_at_.find(name);
    if (it == evicted_at_.end()) {
        return false;
    }
    return now_ms < it->second + cfg_.eviction_cooldown_ms;
}

void ConnectionSlotManager::prune_cooldowns(uint64_t now_ms) {
    for (auto it = evicted_at_.begin(); it != evicted_at_.end();) {
        if (now_ms >= it->second + cfg_.eviction_cooldown_ms) {
            it = evicted_at_.erase(it);
        } else {
            ++it;
        }
    }
}

bool ConnectionSlotManager::is_foreign(const PeerName& name) const {
    return !registry_.graph_contains(name);
}
