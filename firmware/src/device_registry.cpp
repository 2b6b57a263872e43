#include "device_registry.hpp"

#include "logging.hpp"

#include <utility>

namespace {
const char* const kUnknownName = "Unknown";
} // namespace

bool merge_neighbor_graph(NeighborGraph& graph, const NeighborGraph& remote, const PeerName& skip_name) {
    bool changed = false;
    for (const auto& entry : remote) {
        if (!skip_name.empty() && entry.first == skip_name) {
            continue;
        }
        auto it = graph.find(entry.first);
        if (it == graph.end()) {
            it = graph.emplace(entry.first, std::set<PeerName>()).first;
            changed = true;
        }
        for (const auto& neighbor : entry.second) {
            if (neighbor == entry.first) continue;
            if (it->second.insert(neighbor).second) {
                changed = true;
            }
        }
    }
    return changed;
}

DeviceRegistry::DeviceRegistry(Scheduler& scheduler, const PhaseTimeouts& timeouts, std::size_t max_connections)
    : scheduler_(scheduler), timeouts_(timeouts), max_connections_(max_connections) {}

DeviceRegistry::~DeviceRegistry() {
    clear_peers();
}

void DeviceRegistry::set_phase_listener(PhaseListener listener) {
    listener_ = std::move(listener);
}

bool DeviceRegistry::get_state(const PeerId& peer_id, PeerConnectionState& out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peers_.find(peer_id);
    if (it == peers_.end()) {
        return false;
    }
    out = it->second;
    return true;
}

UpdateResult DeviceRegistry::update_status(const PeerId& peer_id, ConnectionPhase new_phase, const PeerName& new_name) {
    PhaseChange change{};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = peers_.find(peer_id);
        const bool existed = it != peers_.end();
        if (existed && is_phase_regression(it->second.phase, new_phase)) {
            log_debug("[REG] ignored %s -> %s for %s",
                      phase_name(it->second.phase), phase_name(new_phase), peer_id.c_str());
            return UpdateResult::RejectedRegression;
        }
        const bool entering_connected = new_phase == ConnectionPhase::Connected &&
                                        (!existed || it->second.phase != ConnectionPhase::Connected);
        if (entering_connected && count_in_phase_locked(ConnectionPhase::Connected) >= max_connections_) {
            log_warn("[REG] refusing CONNECTED for %s: %zu/%zu slots in use",
                     peer_id.c_str(), max_connections_, max_connections_);
            return UpdateResult::RejectedCapacity;
        }

        PeerConnectionState next{};
        next.peer_id = peer_id;
        if (!new_name.empty()) {
            next.peer_name = new_name;
        } else if (existed) {
            next.peer_name = it->second.peer_name;
        } else {
            next.peer_name = kUnknownName;
        }
        next.phase = new_phase;
        next.entered_ms = scheduler_.now_ms();
        next.generation = next_generation_++;
        next.timeout_timer = kNoTimer;

        change.had_previous = existed;
        change.from = existed ? it->second.phase : new_phase;
        if (existed) {
            // The old timer must be gone before the new one is armed.
            scheduler_.cancel(it->second.timeout_timer);
        }
        arm_timeout_locked(next);
        peers_[peer_id] = next;
        revision_++;

        change.peer_id = peer_id;
        change.peer_name = next.peer_name;
        change.removed = false;
        change.to = new_phase;
        change.timed_out = false;
    }
    notify(change);
    return UpdateResult::Applied;
}

bool DeviceRegistry::remove(const PeerId& peer_id) {
    PhaseChange change{};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        potential_.erase(peer_id);
        auto it = peers_.find(peer_id);
        if (it == peers_.end()) {
            return false;
        }
        change.peer_id = peer_id;
        change.peer_name = it->second.peer_name;
        change.had_previous = true;
        change.from = it->second.phase;
        change.removed = true;
        change.to = it->second.phase;
        change.timed_out = false;
        erase_locked(it);
    }
    notify(change);
    return true;
}

void DeviceRegistry::clear_peers() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& kv : peers_) {
        scheduler_.cancel(kv.second.timeout_timer);
    }
    peers_.clear();
    potential_.clear();
    revision_++;
}

uint32_t DeviceRegistry::retry_count(const PeerName& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = retries_.find(name);
    return it == retries_.end() ? 0 : it->second.retry_count;
}

uint32_t DeviceRegistry::increment_retry(const PeerName& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    RetryState& r = retries_[name];
    r.retry_count += 1;
    revision_++;
    return r.retry_count;
}

void DeviceRegistry::reset_retry(const PeerName& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = retries_.find(name);
    if (it != retries_.end()) {
        it->second.retry_count = 0;
        it->second.not_before_ms = 0;
        revision_++;
    }
}

void DeviceRegistry::defer_retry(const PeerName& name, uint64_t not_before_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    retries_[name].not_before_ms = not_before_ms;
}

bool DeviceRegistry::retry_ready(const PeerName& name, uint64_t now_ms) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = retries_.find(name);
    return it == retries_.end() || now_ms >= it->second.not_before_ms;
}

void DeviceRegistry::add_potential_peer(const PeerId& peer_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (potential_.insert(peer_id).second) {
        revision_++;
    }
}

std::set<PeerId> DeviceRegistry::potential_peers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return potential_;
}

void DeviceRegistry::update_local_neighbors(const PeerName& local_name, const std::set<PeerName>& neighbors) {
    std::lock_guard<std::mutex> lock(mutex_);
    graph_[local_name] = neighbors;
    revision_++;
}

bool DeviceRegistry::merge_graph(const NeighborGraph& remote, const PeerName& skip_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    const bool changed = merge_neighbor_graph(graph_, remote, skip_name);
    if (changed) {
        revision_++;
    }
    return changed;
}

NeighborGraph DeviceRegistry::graph() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return graph_;
}

bool DeviceRegistry::graph_contains(const PeerName& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (graph_.count(name) != 0) {
        return true;
    }
    for (const auto& entry : graph_) {
        if (entry.second.count(name) != 0) {
            return true;
        }
    }
    return false;
}

std::vector<PeerConnectionState> DeviceRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PeerConnectionState> out;
    out.reserve(peers_.size());
    for (const auto& kv : peers_) {
        out.push_back(kv.second);
    }
    return out;
}

std::size_t DeviceRegistry::count_in_phase(ConnectionPhase phase) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_in_phase_locked(phase);
}

std::size_t DeviceRegistry::busy_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_in_phase_locked(ConnectionPhase::Connected) +
           count_in_phase_locked(ConnectionPhase::Connecting);
}

std::set<PeerName> DeviceRegistry::connected_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<PeerName> names;
    for (const auto& kv : peers_) {
        if (kv.second.phase == ConnectionPhase::Connected) {
            names.insert(kv.second.peer_name);
        }
    }
    return names;
}

bool DeviceRegistry::find_peer_by_name(const PeerName& name, PeerId& out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const PeerConnectionState* best = nullptr;
    for (const auto& kv : peers_) {
        const PeerConnectionState& s = kv.second;
        if (s.peer_name != name) continue;
        if (best == nullptr || (is_busy_phase(s.phase) && !is_busy_phase(best->phase)) ||
            (s.phase == ConnectionPhase::Connected && best->phase != ConnectionPhase::Connected)) {
            best = &s;
        }
    }
    if (best == nullptr) {
        return false;
    }
    out = best->peer_id;
    return true;
}

uint64_t DeviceRegistry::revision() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return revision_;
}

void DeviceRegistry::on_phase_timeout(const PeerId& peer_id, uint64_t generation) {
    PhaseChange change{};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = peers_.find(peer_id);
        if (it == peers_.end() || it->second.generation != generation) {
            return;
        }
        PeerConnectionState& state = it->second;
        state.timeout_timer = kNoTimer;
        change.peer_id = peer_id;
        change.peer_name = state.peer_name;
        change.had_previous = true;
        change.from = state.phase;
        change.timed_out = true;

        ConnectionPhase next = ConnectionPhase::Error;
        if (phase_on_timeout(state.phase, next)) {
            log_warn("[REG] timeout: %s (%s) spent >%ums in %s, moving to %s",
                     state.peer_name.c_str(), peer_id.c_str(),
                     static_cast<unsigned>(phase_timeout_ms(state.phase, timeouts_)),
                     phase_name(state.phase), phase_name(next));
            state.phase = next;
            state.entered_ms = scheduler_.now_ms();
            state.generation = next_generation_++;
            arm_timeout_locked(state);
            revision_++;
            change.removed = false;
            change.to = next;
        } else {
            log_info("[REG] timeout: %s (%s) removed after %s",
                     state.peer_name.c_str(), peer_id.c_str(), phase_name(state.phase));
            change.removed = true;
            change.to = state.phase;
            erase_locked(it);
        }
    }
    notify(change);
}

void DeviceRegistry::arm_timeout_locked(PeerConnectionState& state) {
    const uint32_t timeout = phase_timeout_ms(state.phase, timeouts_);
    if (timeout == 0) {
        state.timeout_timer = kNoTimer;
        return;
    }
    const PeerId peer_id = state.peer_id;
    const uint64_t generation = state.generation;
    state.timeout_timer = scheduler_.schedule_after(timeout, [this, peer_id, generation]() {
        on_phase_timeout(peer_id, generation);
    });
}

void DeviceRegistry::erase_locked(std::map<PeerId, PeerConnectionState>::iterator it) {
    scheduler_.cancel(it->second.timeout_timer);
    potential_.erase(it->first);
    peers_.erase(it);
    revision_++;
}

std::size_t DeviceRegistry::count_in_phase_locked(ConnectionPhase phase) const {
    std::size_t n = 0;
    for (const auto& kv : peers_) {
        if (kv.second.phase == phase) {
            n++;
        }
    }
    return n;
}

void DeviceRegistry::notify(const PhaseChange& change) {
    if (listener_) {
        listener_(change);
    }
}
