#include "sim_transport.hpp"

#include <algorithm>
#include <cstdio>
#include <numeric>

SimTransport::SimTransport(SimAir& air, std::size_t index, PeerId endpoint_id)
    : air_(air), index_(index), endpoint_id_(std::move(endpoint_id)) {}

TransportStatus SimTransport::start_advertising(const PeerName& local_name) {
    return air_.start_advertising(index_, local_name);
}

TransportStatus SimTransport::stop_advertising() {
    advertising_ = false;
    return TransportStatus::Ok;
}

TransportStatus SimTransport::start_discovery() {
    return air_.start_discovery(index_);
}

TransportStatus SimTransport::stop_discovery() {
    discovering_ = false;
    return TransportStatus::Ok;
}

TransportStatus SimTransport::request_connection(const PeerName& local_name, const PeerId& peer_id) {
    return air_.request(index_, local_name, peer_id);
}

TransportStatus SimTransport::accept_connection(const PeerId& peer_id) {
    return air_.accept(index_, peer_id);
}

TransportStatus SimTransport::reject_connection(const PeerId& peer_id) {
    return air_.reject(index_, peer_id);
}

TransportStatus SimTransport::disconnect(const PeerId& peer_id) {
    return air_.disconnect(index_, peer_id);
}

TransportStatus SimTransport::send(const PeerId& peer_id, const Bytes& bytes) {
    return air_.send(index_, peer_id, bytes);
}

TransportStatus SimTransport::send(const std::vector<PeerId>& peer_ids, const Bytes& bytes) {
    std::size_t delivered = 0;
    for (const auto& id : peer_ids) {
        const TransportStatus status = air_.send(index_, id, bytes);
        if (status == TransportStatus::RadioError) {
            return status;
        }
        if (status == TransportStatus::Ok) {
            delivered++;
        }
    }
    return delivered > 0 || peer_ids.empty() ? TransportStatus::Ok : TransportStatus::Failed;
}

void SimTransport::stop_all() {
    air_.stop_all(index_);
}

void SimTransport::emit(const TransportEvent& event) {
    if (sink_) {
        sink_(event);
    }
}

SimTransport& SimAir::add_transport() {
    char id[16];
    std::snprintf(id, sizeof(id), "E%03zu", nodes_.size());
    nodes_.push_back(std::unique_ptr<SimTransport>(new SimTransport(*this, nodes_.size(), id)));
    return *nodes_.back();
}

SimAir::Pair SimAir::key(std::size_t a, std::size_t b) {
    return a < b ? Pair(a, b) : Pair(b, a);
}

bool SimAir::lookup(const PeerId& endpoint_id, std::size_t& out) const {
    for (std::size_t i = 0; i < nodes_.size(); ++i) {
        if (nodes_[i]->endpoint_id() == endpoint_id) {
            out = i;
            return true;
        }
    }
    return false;
}

bool SimAir::consume_radio_error(std::size_t index) {
    return radio_errors_.erase(index) != 0;
}

void SimAir::post(std::size_t to, const TransportEvent& event) {
    nodes_[to]->emit(event);
}

bool SimAir::in_range(std::size_t a, std::size_t b) const {
    return a != b && range_.count(key(a, b)) != 0;
}

bool SimAir::linked(std::size_t a, std::size_t b) const {
    return links_.count(key(a, b)) != 0;
}

std::size_t SimAir::link_count(std::size_t index) const {
    std::size_t n = 0;
    for (const auto& l : links_) {
        if (l.first == index || l.second == index) n++;
    }
    return n;
}

void SimAir::set_range(std::size_t a, std::size_t b, bool in) {
    if (a == b || a >= nodes_.size() || b >= nodes_.size()) {
        return;
    }
    const Pair k = key(a, b);
    SimTransport& ta = *nodes_[a];
    SimTransport& tb = *nodes_[b];
    if (in) {
        if (!range_.insert(k).second) {
            return;
        }
        if (ta.discovering_ && tb.advertising_) post(a, endpoint_found_event(tb.endpoint_id(), tb.name_));
        if (tb.discovering_ && ta.advertising_) post(b, endpoint_found_event(ta.endpoint_id(), ta.name_));
        return;
    }
    if (range_.erase(k) == 0) {
        return;
    }
    drop_link(a, b, true, true);
    drop_session(a, b, true, true);
    if (ta.discovering_) post(a, endpoint_lost_event(tb.endpoint_id()));
    if (tb.discovering_) post(b, endpoint_lost_event(ta.endpoint_id()));
}

void SimAir::set_all_in_range(bool in) {
    for (std::size_t a = 0; a < nodes_.size(); ++a) {
        for (std::size_t b = a + 1; b < nodes_.size(); ++b) {
            set_range(a, b, in);
        }
    }
}

void SimAir::silence(std::size_t index, bool silent) {
    if (silent) {
        silenced_.insert(index);
    } else {
        silenced_.erase(index);
    }
}

void SimAir::fail_next_request(std::size_t index) {
    fail_next_.insert(index);
}

void SimAir::inject_radio_error(std::size_t index) {
    radio_errors_.insert(index);
}

void SimAir::drop_link(std::size_t a, std::size_t b, bool notify_a, bool notify_b) {
    if (links_.erase(key(a, b)) == 0) {
        return;
    }
    if (notify_a) post(a, disconnected_event(nodes_[b]->endpoint_id()));
    if (notify_b) post(b, disconnected_event(nodes_[a]->endpoint_id()));
}

void SimAir::drop_session(std::size_t a, std::size_t b, bool notify_a, bool notify_b) {
    if (sessions_.erase(key(a, b)) == 0) {
        return;
    }
    if (notify_a) post(a, connection_result_event(nodes_[b]->endpoint_id(), ConnectionOutcome::Error));
    if (notify_b) post(b, connection_result_event(nodes_[a]->endpoint_id(), ConnectionOutcome::Error));
}

TransportStatus SimAir::start_advertising(std::size_t self, const PeerName& name) {
    if (consume_radio_error(self)) {
        return TransportStatus::RadioError;
    }
    SimTransport& t = *nodes_[self];
    if (t.advertising_) {
        return TransportStatus::AlreadyRunning;
    }
    t.advertising_ = true;
    t.name_ = name;
    for (std::size_t other = 0; other < nodes_.size(); ++other) {
        if (in_range(self, other) && nodes_[other]->discovering_) {
            post(other, endpoint_found_event(t.endpoint_id(), name));
        }
    }
    return TransportStatus::Ok;
}

TransportStatus SimAir::start_discovery(std::size_t self) {
    if (consume_radio_error(self)) {
        return TransportStatus::RadioError;
    }
    SimTransport& t = *nodes_[self];
    if (t.discovering_) {
        return TransportStatus::AlreadyRunning;
    }
    t.discovering_ = true;
    for (std::size_t other = 0; other < nodes_.size(); ++other) {
        if (in_range(self, other) && nodes_[other]->advertising_) {
            post(self, endpoint_found_event(nodes_[other]->endpoint_id(), nodes_[other]->name_));
        }
    }
    return TransportStatus::Ok;
}

TransportStatus SimAir::request(std::size_t self, const PeerName& local_name, const PeerId& peer_id) {
    if (consume_radio_error(self)) {
        return TransportStatus::RadioError;
    }
    if (fail_next_.erase(self) != 0) {
        return TransportStatus::Failed;
    }
    std::size_t target = 0;
    if (!lookup(peer_id, target) || !in_range(self, target) || !nodes_[target]->advertising_) {
        return TransportStatus::Failed;
    }
    if (silenced_.count(self) != 0 || silenced_.count(target) != 0) {
        return TransportStatus::Failed;
    }
    if (linked(self, target)) {
        return TransportStatus::AlreadyConnected;
    }
    const Pair k = key(self, target);
    if (sessions_.count(k) != 0) {
        // Crossing requests share one handshake.
        return TransportStatus::Ok;
    }
    sessions_[k] = Session{self, false, false};
    post(self, connection_initiated_event(peer_id, nodes_[target]->name_));
    post(target, connection_initiated_event(nodes_[self]->endpoint_id(), local_name));
    return TransportStatus::Ok;
}

TransportStatus SimAir::accept(std::size_t self, const PeerId& peer_id) {
    std::size_t other = 0;
    if (!lookup(peer_id, other)) {
        return TransportStatus::Failed;
    }
    const Pair k = key(self, other);
    auto it = sessions_.find(k);
    if (it == sessions_.end()) {
        return TransportStatus::Failed;
    }
    if (it->second.initiator == self) {
        it->second.initiator_accepted = true;
    } else {
        it->second.target_accepted = true;
    }
    if (!it->second.initiator_accepted || !it->second.target_accepted) {
        return TransportStatus::Ok;
    }
    sessions_.erase(it);
    links_.insert(k);
    post(self, connection_result_event(peer_id, ConnectionOutcome::Ok));
    post(other, connection_result_event(nodes_[self]->endpoint_id(), ConnectionOutcome::Ok));
    return TransportStatus::Ok;
}

TransportStatus SimAir::reject(std::size_t self, const PeerId& peer_id) {
    std::size_t other = 0;
    if (!lookup(peer_id, other)) {
        return TransportStatus::Failed;
    }
    if (sessions_.erase(key(self, other)) == 0) {
        return TransportStatus::Failed;
    }
    post(other, connection_result_event(nodes_[self]->endpoint_id(), ConnectionOutcome::Rejected));
    return TransportStatus::Ok;
}

TransportStatus SimAir::disconnect(std::size_t self, const PeerId& peer_id) {
    std::size_t other = 0;
    if (!lookup(peer_id, other)) {
        return TransportStatus::Failed;
    }
    drop_link(self, other, false, true);
    drop_session(self, other, false, true);
    return TransportStatus::Ok;
}

TransportStatus SimAir::send(std::size_t self, const PeerId& peer_id, const Bytes& bytes) {
    if (consume_radio_error(self)) {
        return TransportStatus::RadioError;
    }
    std::size_t other = 0;
    if (!lookup(peer_id, other) || !linked(self, other)) {
        return TransportStatus::Failed;
    }
    if (silenced_.count(self) != 0 || silenced_.count(other) != 0) {
        dropped_frames_++;
        return TransportStatus::Ok;
    }
    post(other, payload_event(nodes_[self]->endpoint_id(), bytes));
    return TransportStatus::Ok;
}

void SimAir::stop_all(std::size_t self) {
    SimTransport& t = *nodes_[self];
    t.advertising_ = false;
    t.discovering_ = false;
    for (std::size_t other = 0; other < nodes_.size(); ++other) {
        if (other == self) continue;
        drop_link(self, other, false, true);
        drop_session(self, other, false, true);
    }
}

SimMesh::SimMesh(const NodeConfig& base, std::size_t count, uint32_t seed) {
    for (std::size_t i = 0; i < count; ++i) {
        NodeConfig cfg = base;
        cfg.rng_seed = seed + static_cast<uint32_t>(i) * 7919u + 1u;
        char name[32];
        std::snprintf(name, sizeof(name), "node-%02zu", i);
        identities_.push_back(std::unique_ptr<FixedIdentityStore>(new FixedIdentityStore(name)));
        SimTransport& transport = air_.add_transport();
        nodes_.push_back(std::unique_ptr<MeshNode>(new MeshNode(cfg, transport, *identities_.back())));
    }
}

SimMesh::~SimMesh() {
    for (auto& node : nodes_) {
        node->stop();
    }
}

bool SimMesh::start_all() {
    bool ok = true;
    for (auto& node : nodes_) {
        ok = node->start(now_ms_) && ok;
    }
    return ok;
}

void SimMesh::advance(uint64_t duration_ms, uint64_t step_ms) {
    if (step_ms == 0) {
        step_ms = 1;
    }
    const uint64_t end = now_ms_ + duration_ms;
    while (now_ms_ < end) {
        now_ms_ = std::min(end, now_ms_ + step_ms);
        for (auto& node : nodes_) {
            node->tick(now_ms_);
        }
    }
}

bool SimMesh::index_of(const PeerName& name, std::size_t& out) const {
    for (std::size_t i = 0; i < nodes_.size(); ++i) {
        if (nodes_[i]->name() == name) {
            out = i;
            return true;
        }
    }
    return false;
}

std::size_t SimMesh::components() const {
    std::vector<std::size_t> parent(nodes_.size());
    std::iota(parent.begin(), parent.end(), 0);
    auto find = [&parent](std::size_t x) {
        while (parent[x] != x) {
            parent[x] = parent[parent[x]];
            x = parent[x];
        }
        return x;
    };
    for (std::size_t a = 0; a < nodes_.size(); ++a) {
        for (std::size_t b = a + 1; b < nodes_.size(); ++b) {
            if (air_.linked(a, b)) {
                parent[find(a)] = find(b);
            }
        }
    }
    std::size_t n = 0;
    for (std::size_t i = 0; i < nodes_.size(); ++i) {
        if (find(i) == i) n++;
    }
    return n;
}

std::size_t SimMesh::connected_count(std::size_t index) {
    return nodes_[index]->registry().count_in_phase(ConnectionPhase::Connected);
}
