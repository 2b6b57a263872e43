#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <utility>
#include <vector>

#include "config.hpp"
#include "identity_store.hpp"
#include "mesh.hpp"
#include "peer_transport.hpp"

class SimAir;

// One node's radio on a SimAir.
class SimTransport : public PeerTransport {
public:
    SimTransport(SimAir& air, std::size_t index, PeerId endpoint_id);

    void set_event_sink(EventSink sink) override { sink_ = std::move(sink); }

    TransportStatus start_advertising(const PeerName& local_name) override;
    TransportStatus stop_advertising() override;
    TransportStatus start_discovery() override;
    TransportStatus stop_discovery() override;
    TransportStatus request_connection(const PeerName& local_name, const PeerId& peer_id) override;
    TransportStatus accept_connection(const PeerId& peer_id) override;
    TransportStatus reject_connection(const PeerId& peer_id) override;
    TransportStatus disconnect(const PeerId& peer_id) override;
    TransportStatus send(const PeerId& peer_id, const Bytes& bytes) override;
    TransportStatus send(const std::vector<PeerId>& peer_ids, const Bytes& bytes) override;
    void stop_all() override;

    const PeerId& endpoint_id() const { return endpoint_id_; }
    const PeerName& advertised_name() const { return name_; }
    bool advertising() const { return advertising_; }
    bool discovering() const { return discovering_; }

private:
    friend class SimAir;
    void emit(const TransportEvent& event);

    SimAir& air_;
    const std::size_t index_;
    const PeerId endpoint_id_;
    PeerName name_;
    bool advertising_ = false;
    bool discovering_ = false;
    EventSink sink_;
};

// In-process radio medium shared by simulated nodes. Events are delivered
// synchronously into the receivers' sinks. Single-threaded.
class SimAir {
public:
    SimAir() = default;
    SimAir(const SimAir&) = delete;
    SimAir& operator=(const SimAir&) = delete;

    SimTransport& add_transport();
    std::size_t size() const { return nodes_.size(); }
    SimTransport& transport(std::size_t index) { return *nodes_[index]; }

    void set_range(std::size_t a, std::size_t b, bool in_range);
    void set_all_in_range(bool in_range);
    bool in_range(std::size_t a, std::size_t b) const;
    bool linked(std::size_t a, std::size_t b) const;
    std::size_t link_count(std::size_t index) const;
    std::size_t total_links() const { return links_.size(); }

    // Silenced nodes keep their links but nothing they send or should
    // receive gets through.
    void silence(std::size_t index, bool silent);
    void fail_next_request(std::size_t index);
    // The next start/request/send call on the node reports a radio error.
    void inject_radio_error(std::size_t index);
    uint32_t dropped_frames() const { return dropped_frames_; }

private:
    friend class SimTransport;
    using Pair = std::pair<std::size_t, std::size_t>;

    struct Session {
        std::size_t initiator;
        bool initiator_accepted;
        bool target_accepted;
    };

    static Pair key(std::size_t a, std::size_t b);
    bool lookup(const PeerId& endpoint_id, std::size_t& out) const;
    bool consume_radio_error(std::size_t index);
    void post(std::size_t to, const TransportEvent& event);
    void drop_link(std::size_t a, std::size_t b, bool notify_a, bool notify_b);
    void drop_session(std::size_t a, std::size_t b, bool notify_a, bool notify_b);

    TransportStatus start_advertising(std::size_t self, const PeerName& name);
    TransportStatus start_discovery(std::size_t self);
    TransportStatus request(std::size_t self, const PeerName& local_name, const PeerId& peer_id);
    TransportStatus accept(std::size_t self, const PeerId& peer_id);
    TransportStatus reject(std::size_t self, const PeerId& peer_id);
    TransportStatus disconnect(std::size_t self, const PeerId& peer_id);
    TransportStatus send(std::size_t self, const PeerId& peer_id, const Bytes& bytes);
    void stop_all(std::size_t self);

    std::vector<std::unique_ptr<SimTransport>> nodes_;
    std::set<Pair> range_;
    std::set<Pair> links_;
    std::map<Pair, Session> sessions_;
    std::set<std::size_t> silenced_;
    std::set<std::size_t> fail_next_;
    std::set<std::size_t> radio_errors_;
    uint32_t dropped_frames_ = 0;
};

// A set of MeshNodes on one SimAir, stepped together on virtual time.
class SimMesh {
public:
    SimMesh(const NodeConfig& base, std::size_t count, uint32_t seed);
    ~SimMesh();

    SimAir& air() { return air_; }
    MeshNode& node(std::size_t index) { return *nodes_[index]; }
    std::size_t size() const { return nodes_.size(); }
    uint64_t now_ms() const { return now_ms_; }

    bool start_all();
    void advance(uint64_t duration_ms, uint64_t step_ms = 100);
    bool index_of(const PeerName& name, std::size_t& out) const;

    // Connected components of the live link graph.
    std::size_t components() const;
    std::size_t connected_count(std::size_t index);

private:
    SimAir air_;
    std::vector<std::unique_ptr<FixedIdentityStore>> identities_;
    std::vector<std::unique_ptr<MeshNode>> nodes_;
    uint64_t now_ms_ = 0;
};
