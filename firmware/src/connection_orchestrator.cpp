#include "connection_orchestrator.hpp"

#include "fault.hpp"
#include "logging.hpp"
#include "mesh_encode.hpp"

#include <vector>

ConnectionOrchestrator::ConnectionOrchestrator(PeerTransport& transport,
                                               DeviceRegistry& registry,
                                               Scheduler& scheduler,
                                               PacketRouter& router,
                                               ConnectionSlotManager& slots,
                                               const NodeConfig& cfg,
                                               std::mt19937& rng)
    : transport_(transport),
      registry_(registry),
      scheduler_(scheduler),
      router_(router),
      slots_(slots),
      cfg_(cfg),
      rng_(rng),
      backoff_(backoff_policy_from(cfg)) {
    registry_.set_phase_listener([this](const PhaseChange& change) { on_phase_change(change); });
}

ConnectionOrchestrator::~ConnectionOrchestrator() {
    stop();
    registry_.set_phase_listener(DeviceRegistry::PhaseListener());
}

bool ConnectionOrchestrator::start() {
    running_ = true;
    restart_pending_ = false;
    publish_local_neighbors();
    log_info("[ORCH] starting as %s (max %zu links)", local_name_.c_str(), registry_.max_connections());
    const bool adv = start_advertising();
    const bool disc = start_discovery();
    return adv && disc;
}

void ConnectionOrchestrator::stop() {
    const bool was_running = running_;
    running_ = false;
    for (auto& kv : heartbeats_) {
        scheduler_.cancel(kv.second.next_ping);
        scheduler_.cancel(kv.second.await_pong);
    }
    heartbeats_.clear();
    for (auto& kv : reconnects_) {
        scheduler_.cancel(kv.second);
    }
    reconnects_.clear();
    scheduler_.cancel(restart_timer_);
    restart_timer_ = kNoTimer;
    restart_pending_ = false;
    if (was_running) {
        transport_.stop_all();
        log_info("[ORCH] stopped");
    }
    advertising_ = false;
    discovering_ = false;
}

void ConnectionOrchestrator::handle_event(const TransportEvent& event) {
    if (!running_) {
        return;
    }
    switch (event.kind) {
        case TransportEventKind::EndpointFound: on_endpoint_found(event); break;
        case TransportEventKind::EndpointLost: on_endpoint_lost(event); break;
        case TransportEventKind::ConnectionInitiated: on_connection_initiated(event); break;
        case TransportEventKind::ConnectionResult: on_connection_result(event); break;
        case TransportEventKind::Disconnected: on_disconnected(event); break;
        case TransportEventKind::PayloadReceived: on_payload(event); break;
    }
}

void ConnectionOrchestrator::on_phase_change(const PhaseChange& change) {
    const bool was_connected = change.had_previous && change.from == ConnectionPhase::Connected;
    const bool is_connected = !change.removed && change.to == ConnectionPhase::Connected;
    if (!was_connected && is_connected) {
        if (running_) {
            start_heartbeat(change.peer_id);
        }
        slots_.clear_priority(change.peer_name);
    }
    if (was_connected && !is_connected) {
        stop_heartbeat(change.peer_id);
        if (change.timed_out) {
            log_warn("[ORCH] %s (%s) went silent, dropping link",
                     change.peer_name.c_str(), change.peer_id.c_str());
            check_status(transport_.disconnect(change.peer_id), "disconnect", change.peer_id);
        }
    }
    if (was_connected != is_connected) {
        publish_local_neighbors();
    }
}

void ConnectionOrchestrator::on_endpoint_found(const TransportEvent& event) {
    if (event.name == local_name_) {
        return;
    }
    log_debug("[ORCH] found %s (%s)", event.name.c_str(), event.peer_id.c_str());
    registry_.update_status(event.peer_id, ConnectionPhase::Discovered, event.name);
    registry_.add_potential_peer(event.peer_id);
    if (endpoint_observer_) {
        endpoint_observer_(event.peer_id, event.name);
    }
}

void ConnectionOrchestrator::on_endpoint_lost(const TransportEvent& event) {
    PeerConnectionState st{};
    if (!registry_.get_state(event.peer_id, st)) {
        return;
    }
    if (is_busy_phase(st.phase)) {
        log_debug("[ORCH] lost %s while %s, keeping link state", event.peer_id.c_str(), phase_name(st.phase));
        return;
    }
    log_debug("[ORCH] lost %s (%s)", st.peer_name.c_str(), event.peer_id.c_str());
    cancel_reconnect(event.peer_id);
    registry_.remove(event.peer_id);
}

void ConnectionOrchestrator::on_connection_initiated(const TransportEvent& event) {
    const uint64_t now = scheduler_.now_ms();
    PeerConnectionState st{};
    const bool known = registry_.get_state(event.peer_id, st);
    const PeerName name = !event.name.empty() ? event.name : (known ? st.peer_name : PeerName());

    if (known && st.phase == ConnectionPhase::Connecting) {
        // Our own request, or both sides dialed at once.
        accept(event.peer_id, name);
        return;
    }
    if (known && st.phase == ConnectionPhase::Connected) {
        log_debug("[ORCH] ignoring handshake from connected %s", event.peer_id.c_str());
        return;
    }
    if (name.empty() || name == local_name_) {
        reject(event.peer_id, name, "invalid name");
        return;
    }
    if (slots_.in_cooldown(name, now)) {
        metrics_.rejected_cooldown++;
        reject(event.peer_id, name, "recently evicted");
        return;
    }
    PeerId other;
    if (registry_.find_peer_by_name(name, other) && other != event.peer_id) {
        PeerConnectionState other_state{};
        if (registry_.get_state(other, other_state) && is_busy_phase(other_state.phase)) {
            reject(event.peer_id, name, "already linked");
            return;
        }
    }

    if (registry_.busy_count() >= registry_.max_connections()) {
        PeerConnectionState victim{};
        if (!slots_.find_redundant_peer(victim)) {
            metrics_.rejected_capacity++;
            reject(event.peer_id, name, "at capacity");
            return;
        }
        evict_peer(victim.peer_id, "making room");
    }
    if (registry_.update_status(event.peer_id, ConnectionPhase::Connecting, name) != UpdateResult::Applied) {
        reject(event.peer_id, name, "state conflict");
        return;
    }
    accept(event.peer_id, name);
}

bool ConnectionOrchestrator::accept(const PeerId& peer_id, const PeerName& name) {
    log_info("[ORCH] accepting %s (%s)", name.c_str(), peer_id.c_str());
    if (!check_status(transport_.accept_connection(peer_id), "accept", peer_id)) {
        // The connection result or the CONNECTING timeout settles the peer.
        return false;
    }
    metrics_.accepted++;
    return true;
}

void ConnectionOrchestrator::reject(const PeerId& peer_id, const PeerName& name, const char* reason) {
    log_warn("[ORCH] rejecting %s (%s): %s", name.c_str(), peer_id.c_str(), reason);
    check_status(transport_.reject_connection(peer_id), "reject", peer_id);
}

void ConnectionOrchestrator::on_connection_result(const TransportEvent& event) {
    PeerConnectionState st{};
    if (!registry_.get_state(event.peer_id, st)) {
        log_warn("[ORCH] connection result for unknown peer %s", event.peer_id.c_str());
        if (event.outcome == ConnectionOutcome::Ok) {
            check_status(transport_.disconnect(event.peer_id), "disconnect", event.peer_id);
        }
        return;
    }
    switch (event.outcome) {
        case ConnectionOutcome::Ok: {
            const UpdateResult r = registry_.update_status(event.peer_id, ConnectionPhase::Connected);
            if (r == UpdateResult::Applied) {
                registry_.reset_retry(st.peer_name);
                cancel_reconnect(event.peer_id);
                log_info("[ORCH] connected to %s (%s)", st.peer_name.c_str(), event.peer_id.c_str());
            } else {
                log_warn("[ORCH] no slot left for %s, dropping link", st.peer_name.c_str());
                check_status(transport_.disconnect(event.peer_id), "disconnect", event.peer_id);
                registry_.update_status(event.peer_id, ConnectionPhase::Rejected);
            }
            break;
        }
        case ConnectionOutcome::Rejected: {
            const uint32_t retry = registry_.increment_retry(st.peer_name);
            log_warn("[ORCH] %s (%s) rejected us (retry %u)", st.peer_name.c_str(), event.peer_id.c_str(),
                     static_cast<unsigned>(retry));
            registry_.update_status(event.peer_id, ConnectionPhase::Rejected);
            registry_.defer_retry(st.peer_name, scheduler_.now_ms() + backoff_delay_ms(retry, backoff_, rng_));
            break;
        }
        case ConnectionOutcome::Error:
            log_warn("[ORCH] connection to %s (%s) failed", st.peer_name.c_str(), event.peer_id.c_str());
            fail_attempt(event.peer_id, st.peer_name, false);
            break;
    }
}

void ConnectionOrchestrator::fail_attempt(const PeerId& peer_id, const PeerName& name, bool reconnect) {
    metrics_.connect_failures++;
    record_connect_failure();
    const uint32_t retry = registry_.increment_retry(name);
    registry_.update_status(peer_id, ConnectionPhase::Error);
    if (reconnect) {
        schedule_reconnect(peer_id, name);
        return;
    }
    if (backoff_exhausted(retry, backoff_)) {
        log_warn("[ORCH] giving up on %s after %u attempts", name.c_str(), static_cast<unsigned>(retry));
        metrics_.given_up++;
        registry_.remove(peer_id);
        return;
    }
    registry_.defer_retry(name, scheduler_.now_ms() + backoff_delay_ms(retry, backoff_, rng_));
}

void ConnectionOrchestrator::on_disconnected(const TransportEvent& event) {
    PeerConnectionState st{};
    if (!registry_.get_state(event.peer_id, st)) {
        return;
    }
    log_info("[ORCH] disconnected from %s (%s)", st.peer_name.c_str(), event.peer_id.c_str());
    registry_.update_status(event.peer_id, ConnectionPhase::Disconnected);
    if (slots_.in_cooldown(st.peer_name, scheduler_.now_ms())) {
        return;
    }
    schedule_reconnect(event.peer_id, st.peer_name);
}

void ConnectionOrchestrator::on_payload(const TransportEvent& event) {
    TransportFrame frame{};
    if (!decode_transport_frame(event.bytes, frame)) {
        metrics_.malformed_frames++;
        record_malformed_frame();
        log_warn("[ORCH] malformed frame from %s (%zu bytes)", event.peer_id.c_str(), event.bytes.size());
        return;
    }
    switch (frame.type) {
        case FrameType::Ping: on_ping(event.peer_id); break;
        case FrameType::Pong: on_pong(event.peer_id); break;
        case FrameType::Packet: on_packet(event.peer_id, frame.payload); break;
    }
}

void ConnectionOrchestrator::on_ping(const PeerId& peer_id) {
    PeerConnectionState st{};
    if (registry_.get_state(peer_id, st)) {
        if (registry_.update_status(peer_id, ConnectionPhase::Connected) == UpdateResult::RejectedCapacity) {
            check_status(transport_.disconnect(peer_id), "disconnect", peer_id);
            return;
        }
    }
    const TransportStatus status = transport_.send(peer_id, encode_transport_frame(FrameType::Pong, Bytes()));
    if (!check_status(status, "send pong", peer_id)) {
        record_send_failure();
    }
}

void ConnectionOrchestrator::on_pong(const PeerId& peer_id) {
    metrics_.pongs_received++;
    PeerConnectionState st{};
    if (!registry_.get_state(peer_id, st)) {
        return;
    }
    if (registry_.update_status(peer_id, ConnectionPhase::Connected) == UpdateResult::RejectedCapacity) {
        check_status(transport_.disconnect(peer_id), "disconnect", peer_id);
        return;
    }
    auto it = heartbeats_.find(peer_id);
    if (it == heartbeats_.end()) {
        return;
    }
    scheduler_.cancel(it->second.await_pong);
    it->second.await_pong = kNoTimer;
    if (it->second.next_ping == kNoTimer) {
        schedule_ping(peer_id, cfg_.heartbeat_interval_ms);
    }
}

void ConnectionOrchestrator::on_packet(const PeerId& peer_id, const Bytes& bytes) {
    RouteResult result = router_.handle_incoming(bytes, scheduler_.now_ms());
    if (result.outcome != RouteOutcome::Delivered) {
        return;
    }
    if (result.has_forward) {
        send_to_neighbors(result.forward_bytes, peer_id);
    }
    switch (result.packet.kind) {
        case PacketKind::Application:
            if (app_handler_) app_handler_(peer_id, result.packet);
            break;
        case PacketKind::TopologyGossip:
            if (gossip_handler_) gossip_handler_(peer_id, result.packet);
            break;
    }
}

void ConnectionOrchestrator::start_heartbeat(const PeerId& peer_id) {
    stop_heartbeat(peer_id);
    heartbeats_[peer_id] = Heartbeat{kNoTimer, kNoTimer};
    schedule_ping(peer_id, cfg_.heartbeat_initial_ms);
}

void ConnectionOrchestrator::stop_heartbeat(const PeerId& peer_id) {
    auto it = heartbeats_.find(peer_id);
    if (it == heartbeats_.end()) {
        return;
    }
    scheduler_.cancel(it->second.next_ping);
    scheduler_.cancel(it->second.await_pong);
    heartbeats_.erase(it);
}

void ConnectionOrchestrator::schedule_ping(const PeerId& peer_id, uint64_t delay_ms) {
    Heartbeat& hb = heartbeats_[peer_id];
    scheduler_.cancel(hb.next_ping);
    hb.next_ping = scheduler_.schedule_after(delay_ms, [this, peer_id]() { send_ping(peer_id); });
}

void ConnectionOrchestrator::send_ping(const PeerId& peer_id) {
    auto it = heartbeats_.find(peer_id);
    if (it == heartbeats_.end()) {
        return;
    }
    it->second.next_ping = kNoTimer;
    PeerConnectionState st{};
    if (!registry_.get_state(peer_id, st) || st.phase != ConnectionPhase::Connected) {
        stop_heartbeat(peer_id);
        return;
    }
    metrics_.pings_sent++;
    const TransportStatus status = transport_.send(peer_id, encode_transport_frame(FrameType::Ping, Bytes()));
    if (!check_status(status, "send ping", peer_id)) {
        record_send_failure();
    }
    // A radio error above tears heartbeats down.
    it = heartbeats_.find(peer_id);
    if (it == heartbeats_.end()) {
        return;
    }
    it->second.await_pong = scheduler_.schedule_after(cfg_.pong_timeout_ms, [this, peer_id]() {
        on_pong_timeout(peer_id);
    });
}

void ConnectionOrchestrator::on_pong_timeout(const PeerId& peer_id) {
    auto it = heartbeats_.find(peer_id);
    if (it == heartbeats_.end()) {
        return;
    }
    it->second.await_pong = kNoTimer;
    metrics_.missed_pongs++;
    log_warn("[ORCH] no PONG from %s within %ums", peer_id.c_str(), static_cast<unsigned>(cfg_.pong_timeout_ms));
    const uint32_t delay = cfg_.heartbeat_interval_ms > cfg_.pong_timeout_ms
                               ? cfg_.heartbeat_interval_ms - cfg_.pong_timeout_ms
                               : cfg_.heartbeat_interval_ms;
    schedule_ping(peer_id, delay);
}

void ConnectionOrchestrator::schedule_reconnect(const PeerId& peer_id, const PeerName& name) {
    const uint32_t retry = registry_.retry_count(name);
    if (backoff_exhausted(retry, backoff_)) {
        log_warn("[ORCH] giving up on %s after %u attempts", name.c_str(), static_cast<unsigned>(retry));
        metrics_.given_up++;
        cancel_reconnect(peer_id);
        registry_.remove(peer_id);
        return;
    }
    const uint64_t delay = backoff_delay_ms(retry, backoff_, rng_);
    registry_.defer_retry(name, scheduler_.now_ms() + delay);
    cancel_reconnect(peer_id);
    reconnects_[peer_id] = scheduler_.schedule_after(delay, [this, peer_id, name]() { reconnect(peer_id, name); });
    metrics_.reconnects_scheduled++;
    log_info("[ORCH] reconnecting to %s in %llums (retry %u)", name.c_str(),
             static_cast<unsigned long long>(delay), static_cast<unsigned>(retry));
}

void ConnectionOrchestrator::cancel_reconnect(const PeerId& peer_id) {
    auto it = reconnects_.find(peer_id);
    if (it == reconnects_.end()) {
        return;
    }
    scheduler_.cancel(it->second);
    reconnects_.erase(it);
}

void ConnectionOrchestrator::reconnect(const PeerId& peer_id, const PeerName& name) {
    reconnects_.erase(peer_id);
    if (!running_ || restart_pending_) {
        return;
    }
    PeerConnectionState st{};
    if (registry_.get_state(peer_id, st) && is_busy_phase(st.phase)) {
        return;
    }
    if (slots_.in_cooldown(name, scheduler_.now_ms())) {
        return;
    }
    if (registry_.busy_count() >= registry_.max_connections()) {
        log_debug("[ORCH] reconnect to %s skipped, no free slot", name.c_str());
        return;
    }
    connect_to_peer(peer_id, name);
}

bool ConnectionOrchestrator::connect_to_peer(const PeerId& peer_id, const PeerName& name) {
    if (!running_ || restart_pending_ || name == local_name_) {
        return false;
    }
    PeerConnectionState st{};
    if (registry_.get_state(peer_id, st) && is_busy_phase(st.phase)) {
        return false;
    }
    if (registry_.busy_count() >= registry_.max_connections()) {
        return false;
    }
    cancel_reconnect(peer_id);
    if (registry_.update_status(peer_id, ConnectionPhase::Connecting, name) != UpdateResult::Applied) {
        return false;
    }
    metrics_.connect_requests++;
    log_info("[ORCH] requesting connection to %s (%s)", name.c_str(), peer_id.c_str());

    const TransportStatus status = transport_.request_connection(local_name_, peer_id);
    switch (status) {
        case TransportStatus::Ok:
            return true;
        case TransportStatus::AlreadyConnected:
            log_warn("[ORCH] already connected to %s, recovering state", peer_id.c_str());
            if (registry_.update_status(peer_id, ConnectionPhase::Connected) == UpdateResult::Applied) {
                registry_.reset_retry(name);
                return true;
            }
            check_status(transport_.disconnect(peer_id), "disconnect", peer_id);
            registry_.update_status(peer_id, ConnectionPhase::Rejected);
            return false;
        case TransportStatus::RadioError:
            fail_attempt(peer_id, name, false);
            escalate_radio_error();
            return false;
        case TransportStatus::AlreadyRunning:
        case TransportStatus::Failed:
            log_warn("[ORCH] request to %s failed: %s", peer_id.c_str(), transport_status_name(status));
            fail_attempt(peer_id, name, true);
            return false;
    }
    return false;
}

bool ConnectionOrchestrator::evict_peer(const PeerId& peer_id, const char* reason) {
    PeerConnectionState st{};
    if (!registry_.get_state(peer_id, st)) {
        return false;
    }
    log_info("[ORCH] evicting %s (%s): %s", st.peer_name.c_str(), peer_id.c_str(), reason);
    metrics_.evictions++;
    slots_.note_evicted(st.peer_name, scheduler_.now_ms());
    cancel_reconnect(peer_id);
    check_status(transport_.disconnect(peer_id), "disconnect", peer_id);
    registry_.update_status(peer_id, ConnectionPhase::Disconnected);
    return true;
}

void ConnectionOrchestrator::apply(const SlotAction& action) {
    switch (action.kind) {
        case SlotActionKind::None:
            break;
        case SlotActionKind::Connect:
            log_debug("[ORCH] dialing %s (%s)", action.peer_name.c_str(), action.reason);
            connect_to_peer(action.peer_id, action.peer_name);
            break;
        case SlotActionKind::Disconnect:
            evict_peer(action.peer_id, action.reason);
            break;
    }
}

bool ConnectionOrchestrator::broadcast(const Bytes& payload, PacketKind kind) {
    if (payload.size() > cfg_.max_payload_bytes) {
        metrics_.oversized_drops++;
        record_oversized_drop();
        log_error("[ORCH] payload too large (%zu > %zu), dropping", payload.size(), cfg_.max_payload_bytes);
        return false;
    }
    const Bytes packet = router_.create_broadcast(payload, kind, scheduler_.now_ms());
    send_to_neighbors(packet);
    return true;
}

std::size_t ConnectionOrchestrator::send_to_neighbors(const Bytes& packet_bytes, const PeerId& except) {
    std::vector<PeerId> targets;
    for (const auto& s : registry_.snapshot()) {
        if (s.phase == ConnectionPhase::Connected && s.peer_id != except) {
            targets.push_back(s.peer_id);
        }
    }
    if (targets.empty()) {
        return 0;
    }
    const Bytes frame = encode_transport_frame(FrameType::Packet, packet_bytes);
    if (!check_status(transport_.send(targets, frame), "send packet", PeerId())) {
        record_send_failure();
        return 0;
    }
    metrics_.packets_sent += static_cast<uint32_t>(targets.size());
    return targets.size();
}

bool ConnectionOrchestrator::start_advertising() {
    if (advertising_) {
        return true;
    }
    const TransportStatus status = transport_.start_advertising(local_name_);
    if (status == TransportStatus::Ok || status == TransportStatus::AlreadyRunning) {
        advertising_ = true;
        log_debug("[ORCH] advertising as %s", local_name_.c_str());
        return true;
    }
    check_status(status, "start advertising", PeerId());
    return false;
}

bool ConnectionOrchestrator::stop_advertising() {
    if (!advertising_) {
        return true;
    }
    advertising_ = false;
    return check_status(transport_.stop_advertising(), "stop advertising", PeerId());
}

bool ConnectionOrchestrator::start_discovery() {
    if (discovering_) {
        return true;
    }
    const TransportStatus status = transport_.start_discovery();
    if (status == TransportStatus::Ok || status == TransportStatus::AlreadyRunning) {
        discovering_ = true;
        log_debug("[ORCH] discovery started");
        return true;
    }
    check_status(status, "start discovery", PeerId());
    return false;
}

bool ConnectionOrchestrator::stop_discovery() {
    if (!discovering_) {
        return true;
    }
    discovering_ = false;
    return check_status(transport_.stop_discovery(), "stop discovery", PeerId());
}

void ConnectionOrchestrator::publish_local_neighbors() {
    if (local_name_.empty()) {
        return;
    }
    registry_.update_local_neighbors(local_name_, registry_.connected_names());
}

bool ConnectionOrchestrator::check_status(TransportStatus status, const char* op, const PeerId& peer_id) {
    switch (status) {
        case TransportStatus::Ok:
        case TransportStatus::AlreadyRunning:
        case TransportStatus::AlreadyConnected:
            return true;
        case TransportStatus::Failed:
            log_warn("[ORCH] %s %s failed", op, peer_id.c_str());
            return false;
        case TransportStatus::RadioError:
            log_error("[ORCH] %s %s hit a radio error", op, peer_id.c_str());
            escalate_radio_error();
            return false;
    }
    return false;
}

void ConnectionOrchestrator::escalate_radio_error() {
    if (restart_pending_ || !running_) {
        return;
    }
    restart_pending_ = true;
    metrics_.radio_restarts++;
    record_radio_restart();
    log_error("[ORCH] radio failure, restarting transport in %ums",
              static_cast<unsigned>(cfg_.radio_restart_delay_ms));

    for (auto& kv : reconnects_) {
        scheduler_.cancel(kv.second);
    }
    reconnects_.clear();
    transport_.stop_all();
    advertising_ = false;
    discovering_ = false;
    for (const auto& s : registry_.snapshot()) {
        if (is_busy_phase(s.phase)) {
            registry_.update_status(s.peer_id, ConnectionPhase::Disconnected);
        }
    }
    restart_timer_ = scheduler_.schedule_after(cfg_.radio_restart_delay_ms, [this]() { restart_radio(); });
}

void ConnectionOrchestrator::restart_radio() {
    restart_timer_ = kNoTimer;
    restart_pending_ = false;
    if (!running_) {
        return;
    }
    log_info("[ORCH] restarting transport");
    const bool adv = start_advertising();
    const bool disc = start_discovery();
    if (adv && disc) {
        clear_fault();
    } else {
        log_warn("[ORCH] transport restart incomplete (advertising=%d discovery=%d)", adv ? 1 : 0, disc ? 1 : 0);
    }
}
