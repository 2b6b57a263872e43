#pragma once

#include "mesh_encode.hpp"
#include "peer_transport.hpp"

#include <cstddef>
#include <deque>
#include <string>
#include <vector>

// Scripted transport for host tests. Records every call, returns queued
// statuses (Ok once the script is empty) and lets the test inject events.
class MockTransport : public PeerTransport {
public:
    struct SentFrame {
        PeerId peer_id;
        Bytes bytes;
    };

    void set_event_sink(EventSink sink) override { sink_ = sink; }

    TransportStatus start_advertising(const PeerName& local_name) override {
        advertised_name_ = local_name;
        return record("start_advertising", "");
    }
    TransportStatus stop_advertising() override { return record("stop_advertising", ""); }
    TransportStatus start_discovery() override { return record("start_discovery", ""); }
    TransportStatus stop_discovery() override { return record("stop_discovery", ""); }

    TransportStatus request_connection(const PeerName&, const PeerId& peer_id) override {
        return record("request_connection", peer_id);
    }
    TransportStatus accept_connection(const PeerId& peer_id) override { return record("accept_connection", peer_id); }
    TransportStatus reject_connection(const PeerId& peer_id) override { return record("reject_connection", peer_id); }
    TransportStatus disconnect(const PeerId& peer_id) override { return record("disconnect", peer_id); }

    TransportStatus send(const PeerId& peer_id, const Bytes& bytes) override {
        sent_.push_back(SentFrame{peer_id, bytes});
        return record("send", peer_id);
    }
    TransportStatus send(const std::vector<PeerId>& peer_ids, const Bytes& bytes) override {
        for (const auto& id : peer_ids) {
            sent_.push_back(SentFrame{id, bytes});
        }
        return record("send", peer_ids.empty() ? PeerId() : peer_ids.front());
    }

    void stop_all() override { record("stop_all", ""); }

    // Status returned by the next call of `op`.
    void script(const std::string& op, TransportStatus status) {
        scripted_.push_back(Scripted{op, status});
    }

    void emit(const TransportEvent& event) {
        if (sink_) {
            sink_(event);
        }
    }

    std::size_t count(const std::string& op) const {
        std::size_t n = 0;
        for (const auto& c : calls_) {
            if (c.op == op) n++;
        }
        return n;
    }
    std::size_t count(const std::string& op, const PeerId& peer_id) const {
        std::size_t n = 0;
        for (const auto& c : calls_) {
            if (c.op == op && c.peer_id == peer_id) n++;
        }
        return n;
    }

    // Frames of the given type sent to peer_id.
    std::size_t frames_to(const PeerId& peer_id, FrameType type) const {
        std::size_t n = 0;
        for (const auto& f : sent_) {
            TransportFrame frame{};
            if (f.peer_id == peer_id && decode_transport_frame(f.bytes, frame) && frame.type == type) n++;
        }
        return n;
    }

    const std::vector<SentFrame>& sent() const { return sent_; }
    const std::string& advertised_name() const { return advertised_name_; }
    void clear() {
        calls_.clear();
        sent_.clear();
    }

private:
    struct Call {
        std::string op;
        PeerId peer_id;
    };
    struct Scripted {
        std::string op;
        TransportStatus status;
    };

    TransportStatus record(const char* op, const PeerId& peer_id) {
        calls_.push_back(Call{op, peer_id});
        for (auto it = scripted_.begin(); it != scripted_.end(); ++it) {
            if (it->op == op) {
                const TransportStatus status = it->status;
                scripted_.erase(it);
                return status;
            }
        }
        return TransportStatus::Ok;
    }

    EventSink sink_;
    std::vector<Call> calls_;
    std::vector<SentFrame> sent_;
    std::deque<Scripted> scripted_;
    std::string advertised_name_;
};
