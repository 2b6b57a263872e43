#include "config.hpp"

#include <cassert>
#include <cstdio>

int main() {
    NodeConfig cfg = load_config();
    assert(cfg.max_connections == 4);
    assert(cfg.heartbeat_interval_ms == 30000 && cfg.pong_timeout_ms == 20000);
    assert(cfg.default_ttl == 5);
    assert(cfg.packet_cache_ttl_ms == 600000);
    assert(validate_config(cfg));

    assert(apply_config_value(cfg, "max_connections", "3"));
    assert(cfg.max_connections == 3);
    assert(apply_config_value(cfg, "island_break_probability", "0.25"));
    assert(cfg.island_break_probability == 0.25);
    assert(apply_config_value(cfg, "log_level", "debug"));
    assert(cfg.log_level == LogLevel::Debug);
    assert(!apply_config_value(cfg, "default_ttl", "300"));
    assert(!apply_config_value(cfg, "slot_cycle_ms", "-5"));
    assert(!apply_config_value(cfg, "slot_cycle_ms", "12abc"));
    assert(!apply_config_value(cfg, "no_such_key", "1"));
    assert(!apply_config_value(cfg, "identity_path", ""));
    assert(cfg.default_ttl == 5);

    const char* path = "hopmesh_test_config.conf";
    FILE* f = std::fopen(path, "w");
    assert(f);
    std::fputs("# overrides\n", f);
    std::fputs("max_connections = 6\n", f);
    std::fputs("  gossip_interval_ms=1000   # faster\n", f);
    std::fputs("\n", f);
    std::fputs("bogus line\n", f);
    std::fputs("default_ttl = 7\n", f);
    std::fclose(f);

    NodeConfig from_file = load_config();
    // The bad line is reported, the good ones still apply.
    assert(!load_config_file(path, from_file));
    assert(from_file.max_connections == 6);
    assert(from_file.gossip_interval_ms == 1000);
    assert(from_file.default_ttl == 7);
    std::remove(path);

    NodeConfig missing = load_config();
    assert(!load_config_file("does/not/exist.conf", missing));

    NodeConfig bad = load_config();
    bad.max_connections = 0;
    assert(!validate_config(bad));
    bad = load_config();
    bad.heartbeat_interval_ms = bad.connected_timeout_ms;
    assert(!validate_config(bad));
    bad = load_config();
    bad.island_break_probability = 1.5;
    assert(!validate_config(bad));
    bad = load_config();
    bad.max_payload_bytes = 1024 * 1024;
    assert(!validate_config(bad));
    bad = load_config();
    bad.backoff_max_jitter_ms = 0;
    assert(!validate_config(bad));
    return 0;
}
