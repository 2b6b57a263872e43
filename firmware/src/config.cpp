#include "config.hpp"
#include "mesh_encode.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>

namespace {
std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return std::string();
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

bool parse_u32(const std::string& text, uint32_t& out) {
    if (text.empty() || text[0] == '-') return false;
    errno = 0;
    char* end = nullptr;
    const unsigned long long v = std::strtoull(text.c_str(), &end, 10);
    if (errno != 0 || end == text.c_str() || *end != '\0' || v > 0xFFFFFFFFull) {
        return false;
    }
    out = static_cast<uint32_t>(v);
    return true;
}

bool parse_double(const std::string& text, double& out) {
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(text.c_str(), &end);
    if (errno != 0 || end == text.c_str() || *end != '\0') {
        return false;
    }
    out = v;
    return true;
}

struct U32Field {
    const char* key;
    uint32_t NodeConfig::*field;
};

const U32Field kU32Fields[] = {
    {"connecting_timeout_ms", &NodeConfig::connecting_timeout_ms},
    {"connected_timeout_ms", &NodeConfig::connected_timeout_ms},
    {"disconnected_timeout_ms", &NodeConfig::disconnected_timeout_ms},
    {"rejected_timeout_ms", &NodeConfig::rejected_timeout_ms},
    {"error_timeout_ms", &NodeConfig::error_timeout_ms},
    {"heartbeat_initial_ms", &NodeConfig::heartbeat_initial_ms},
    {"heartbeat_interval_ms", &NodeConfig::heartbeat_interval_ms},
    {"pong_timeout_ms", &NodeConfig::pong_timeout_ms},
    {"backoff_base_ms", &NodeConfig::backoff_base_ms},
    {"backoff_max_jitter_ms", &NodeConfig::backoff_max_jitter_ms},
    {"backoff_max_exponent", &NodeConfig::backoff_max_exponent},
    {"max_retries", &NodeConfig::max_retries},
    {"slot_cycle_ms", &NodeConfig::slot_cycle_ms},
    {"slot_cycle_jitter_ms", &NodeConfig::slot_cycle_jitter_ms},
    {"rotation_interval_ms", &NodeConfig::rotation_interval_ms},
    {"rotation_jitter_ms", &NodeConfig::rotation_jitter_ms},
    {"eviction_cooldown_ms", &NodeConfig::eviction_cooldown_ms},
    {"gossip_interval_ms", &NodeConfig::gossip_interval_ms},
    {"packet_cache_ttl_ms", &NodeConfig::packet_cache_ttl_ms},
    {"packet_sweep_interval_ms", &NodeConfig::packet_sweep_interval_ms},
    {"healing_interval_ms", &NodeConfig::healing_interval_ms},
    {"healing_discovery_window_ms", &NodeConfig::healing_discovery_window_ms},
    {"radio_restart_delay_ms", &NodeConfig::radio_restart_delay_ms},
    {"rng_seed", &NodeConfig::rng_seed},
};
} // namespace

NodeConfig load_config() {
    NodeConfig cfg{};
    cfg.identity_path = "hopmesh_identity";
    cfg.max_connections = 4;

    cfg.connecting_timeout_ms = 30000;
    cfg.connected_timeout_ms = 60000;
    cfg.disconnected_timeout_ms = 30000;
    cfg.rejected_timeout_ms = 30000;
    cfg.error_timeout_ms = 30000;

    cfg.heartbeat_initial_ms = 15000;
    cfg.heartbeat_interval_ms = 30000;
    cfg.pong_timeout_ms = 20000;

    cfg.backoff_base_ms = 1000;
    cfg.backoff_max_jitter_ms = 1000;
    cfg.backoff_max_exponent = 5;
    cfg.max_retries = 6;

    cfg.slot_cycle_ms = 5000;
    cfg.slot_cycle_jitter_ms = 5000;
    cfg.island_break_probability = 0.1;
    cfg.rotation_interval_ms = 5 * 60 * 1000;
    cfg.rotation_jitter_ms = 60000;
    cfg.eviction_cooldown_ms = 60000;

    cfg.gossip_interval_ms = 30000;

    cfg.default_ttl = 5;
    cfg.packet_cache_ttl_ms = 10 * 60 * 1000;
    cfg.packet_sweep_interval_ms = 60000;
    cfg.max_payload_bytes = 32 * 1024;

    cfg.healing_interval_ms = 5 * 60 * 1000;
    cfg.healing_discovery_window_ms = 15000;
    cfg.radio_restart_delay_ms = 10000;

    cfg.rng_seed = 0;
    cfg.log_level = LogLevel::Info;
    return cfg;
}

bool apply_config_value(NodeConfig& cfg, const std::string& key, const std::string& value) {
    for (const auto& f : kU32Fields) {
        if (key == f.key) {
            return parse_u32(value, cfg.*(f.field));
        }
    }
    if (key == "identity_path") {
        if (value.empty()) return false;
        cfg.identity_path = value;
        return true;
    }
    if (key == "max_connections") {
        uint32_t v = 0;
        if (!parse_u32(value, v)) return false;
        cfg.max_connections = v;
        return true;
    }
    if (key == "default_ttl") {
        uint32_t v = 0;
        if (!parse_u32(value, v) || v > 255) return false;
        cfg.default_ttl = static_cast<uint8_t>(v);
        return true;
    }
    if (key == "max_payload_bytes") {
        uint32_t v = 0;
        if (!parse_u32(value, v)) return false;
        cfg.max_payload_bytes = v;
        return true;
    }
    if (key == "island_break_probability") {
        return parse_double(value, cfg.island_break_probability);
    }
    if (key == "log_level") {
        return parse_log_level(value.c_str(), cfg.log_level);
    }
    return false;
}

bool load_config_file(const char* path, NodeConfig& cfg) {
    std::ifstream in(path ? path : "");
    if (!in) {
        log_warn("[CFG] cannot open %s", path ? path : "(null)");
        return false;
    }
    bool ok = true;
    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        line_no++;
        const auto hash = line.find('#');
        if (hash != std::string::npos) {
            line.erase(hash);
        }
        line = trim(line);
        if (line.empty()) continue;
        const auto eq = line.find('=');
        if (eq == std::string::npos) {
            log_warn("[CFG] %s:%d: expected key = value", path, line_no);
            ok = false;
            continue;
        }
        const std::string key = trim(line.substr(0, eq));
        const std::string value = trim(line.substr(eq + 1));
        if (!apply_config_value(cfg, key, value)) {
            log_warn("[CFG] %s:%d: rejected %s = '%s'", path, line_no, key.c_str(), value.c_str());
            ok = false;
        }
    }
    return ok;
}

bool validate_config(const NodeConfig& cfg) {
    if (cfg.max_connections == 0) {
        log_error("[CFG] max_connections must be > 0");
        return false;
    }
    if (cfg.connecting_timeout_ms == 0 || cfg.connected_timeout_ms == 0 ||
        cfg.disconnected_timeout_ms == 0 || cfg.rejected_timeout_ms == 0 ||
        cfg.error_timeout_ms == 0) {
        log_error("[CFG] phase timeouts must be > 0");
        return false;
    }
    if (cfg.heartbeat_interval_ms == 0 || cfg.heartbeat_interval_ms >= cfg.connected_timeout_ms) {
        log_error("[CFG] heartbeat_interval_ms must be in (0, connected_timeout_ms)");
        return false;
    }
    if (cfg.island_break_probability < 0.0 || cfg.island_break_probability > 1.0) {
        log_error("[CFG] island_break_probability must be in [0, 1]");
        return false;
    }
    if (cfg.backoff_max_jitter_ms == 0 || cfg.backoff_base_ms == 0) {
        log_error("[CFG] backoff base and jitter must be > 0");
        return false;
    }
    if (cfg.backoff_max_exponent > 20) {
        log_error("[CFG] backoff_max_exponent too large");
        return false;
    }
    if (cfg.slot_cycle_ms == 0 || cfg.gossip_interval_ms == 0 || cfg.packet_sweep_interval_ms == 0 ||
        cfg.rotation_interval_ms == 0 || cfg.healing_interval_ms == 0) {
        log_error("[CFG] task periods must be > 0");
        return false;
    }
    // Room for the packet and frame headers inside one transport frame.
    if (cfg.max_payload_bytes == 0 || cfg.max_payload_bytes > kMaxFrameLen - 1024) {
        log_error("[CFG] max_payload_bytes must be in (0, %zu]", kMaxFrameLen - 1024);
        return false;
    }
    return true;
}
