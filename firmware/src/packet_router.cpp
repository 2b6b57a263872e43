#include "packet_router.hpp"

#include "fault.hpp"
#include "logging.hpp"
#include "mesh_encode.hpp"

#include <cstdio>

PacketRouter::PacketRouter(uint8_t default_ttl, uint32_t cache_ttl_ms, uint32_t seed)
    : default_ttl_(default_ttl), cache_ttl_ms_(cache_ttl_ms) {
    if (seed == 0) {
        std::random_device rd;
        rng_.seed((static_cast<uint64_t>(rd()) << 32) ^ rd());
    } else {
        rng_.seed(seed);
    }
}

std::string PacketRouter::next_packet_id() {
    char buf[kPacketIdLength + 1];
    const uint64_t hi = rng_();
    const uint64_t lo = rng_();
    std::snprintf(buf, sizeof(buf), "%016llx%016llx",
                  static_cast<unsigned long long>(hi), static_cast<unsigned long long>(lo));
    return std::string(buf, kPacketIdLength);
}

Bytes PacketRouter::create_broadcast(const Bytes& payload, PacketKind kind, uint64_t now_ms) {
    std::string id;
    return create_broadcast(payload, kind, now_ms, id);
}

Bytes PacketRouter::create_broadcast(const Bytes& payload, PacketKind kind, uint64_t now_ms, std::string& out_id) {
    MeshPacket packet{};
    packet.ttl = default_ttl_;
    packet.kind = kind;
    packet.payload = payload;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        packet.id = next_packet_id();
        seen_[packet.id] = now_ms;
        metrics_.originated++;
    }
    out_id = packet.id;
    log_debug("[ROUTER] originate %s ttl=%u len=%zu", packet.id.c_str(),
              static_cast<unsigned>(packet.ttl), payload.size());
    return encode_mesh_packet(packet);
}

RouteResult PacketRouter::handle_incoming(const Bytes& bytes, uint64_t now_ms) {
    RouteResult result{};
    result.outcome = RouteOutcome::Malformed;
    result.has_forward = false;

    MeshPacket packet{};
    if (!decode_mesh_packet(bytes, packet)) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            metrics_.malformed++;
        }
        record_malformed_frame();
        log_warn("[ROUTER] dropped malformed packet (%zu bytes)", bytes.size());
        return result;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!seen_.emplace(packet.id, now_ms).second) {
            metrics_.duplicates++;
            result.outcome = RouteOutcome::Duplicate;
            return result;
        }
        metrics_.delivered++;
        if (packet.ttl > 0) {
            metrics_.forwarded++;
        } else {
            metrics_.ttl_expired++;
        }
    }

    if (packet.ttl > 0) {
        MeshPacket forward = packet;
        forward.ttl = static_cast<uint8_t>(packet.ttl - 1);
        result.forward_bytes = encode_mesh_packet(forward);
        result.has_forward = true;
    }
    result.outcome = RouteOutcome::Delivered;
    result.packet = std::move(packet);
    return result;
}

std::size_t PacketRouter::sweep(uint64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t removed = 0;
    for (auto it = seen_.begin(); it != seen_.end();) {
        if (now_ms >= it->second && now_ms - it->second > cache_ttl_ms_) {
            it = seen_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    metrics_.swept += static_cast<uint32_t>(removed);
    if (removed > 0) {
        log_debug("[ROUTER] swept %zu ids, %zu cached", removed, seen_.size());
    }
    return removed;
}

bool PacketRouter::has_seen(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return seen_.count(id) != 0;
}

std::size_t PacketRouter::seen_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return seen_.size();
}

RouterMetrics PacketRouter::metrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metrics_;
}
