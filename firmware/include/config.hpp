#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "logging.hpp"

struct NodeConfig {
    std::string identity_path;
    std::size_t max_connections;

    // Phase timeouts. DISCOVERED never times out.
    uint32_t connecting_timeout_ms;
    uint32_t connected_timeout_ms;
    uint32_t disconnected_timeout_ms;
    uint32_t rejected_timeout_ms;
    uint32_t error_timeout_ms;

    uint32_t heartbeat_initial_ms;
    uint32_t heartbeat_interval_ms;
    uint32_t pong_timeout_ms;

    uint32_t backoff_base_ms;
    uint32_t backoff_max_jitter_ms;
    uint32_t backoff_max_exponent;
    uint32_t max_retries;

    uint32_t slot_cycle_ms;
    uint32_t slot_cycle_jitter_ms;
    double island_break_probability;
    uint32_t rotation_interval_ms;
    uint32_t rotation_jitter_ms;
    uint32_t eviction_cooldown_ms;

    uint32_t gossip_interval_ms;

    uint8_t default_ttl;
    uint32_t packet_cache_ttl_ms;
    uint32_t packet_sweep_interval_ms;
    std::size_t max_payload_bytes;

    uint32_t healing_interval_ms;
    uint32_t healing_discovery_window_ms;
    uint32_t radio_restart_delay_ms;

    uint32_t rng_seed; // 0 = seed from std::random_device
    LogLevel log_level;
};

NodeConfig load_config();
// Overlays `key = value` lines from path onto cfg. Returns false if the file
// cannot be read or any line is rejected; valid lines are still applied.
bool load_config_file(const char* path, NodeConfig& cfg);
bool apply_config_value(NodeConfig& cfg, const std::string& key, const std::string& value);
bool validate_config(const NodeConfig& cfg);
