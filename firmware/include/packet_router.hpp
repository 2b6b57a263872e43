#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>
#include <unordered_map>

#include "mesh_types.hpp"

enum class RouteOutcome : uint8_t {
    Delivered,
    Duplicate,
    Malformed,
};

struct RouteResult {
    RouteOutcome outcome;
    MeshPacket packet;      // valid when Delivered
    bool has_forward;
    Bytes forward_bytes;    // same id and kind, ttl - 1
};

struct RouterMetrics {
    uint32_t originated;
    uint32_t delivered;
    uint32_t forwarded;
    uint32_t duplicates;
    uint32_t malformed;
    uint32_t ttl_expired; // delivered with ttl 0, not forwarded
    uint32_t swept;
};

// Flood router with a TTL-bounded seen-id cache. Thread-safe.
class PacketRouter {
public:
    PacketRouter(uint8_t default_ttl, uint32_t cache_ttl_ms, uint32_t seed);

    // Encoded packet ready to send to every neighbor; the id is marked seen.
    Bytes create_broadcast(const Bytes& payload, PacketKind kind, uint64_t now_ms);
    Bytes create_broadcast(const Bytes& payload, PacketKind kind, uint64_t now_ms, std::string& out_id);
    RouteResult handle_incoming(const Bytes& bytes, uint64_t now_ms);
    // Forgets ids first seen more than cache_ttl_ms before now_ms.
    std::size_t sweep(uint64_t now_ms);

    bool has_seen(const std::string& id) const;
    std::size_t seen_count() const;
    RouterMetrics metrics() const;

private:
    std::string next_packet_id();

    const uint8_t default_ttl_;
    const uint32_t cache_ttl_ms_;

    mutable std::mutex mutex_;
    std::mt19937_64 rng_;
    std::unordered_map<std::string, uint64_t> seen_; // id -> first seen
    RouterMetrics metrics_{};
};
