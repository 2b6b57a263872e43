#include "backoff.hpp"

#include <algorithm>

BackoffPolicy backoff_policy_from(const NodeConfig& cfg) {
    BackoffPolicy p{};
    p.base_ms = cfg.backoff_base_ms;
    p.max_jitter_ms = cfg.backoff_max_jitter_ms;
    p.max_exponent = cfg.backoff_max_exponent;
    p.max_retries = cfg.max_retries;
    return p;
}

uint64_t backoff_floor_ms(uint32_t retry_count, const BackoffPolicy& policy) {
    const uint32_t exp = std::min<uint32_t>(std::min(retry_count, policy.max_exponent), 31);
    return static_cast<uint64_t>(policy.base_ms) << exp;
}

uint64_t backoff_ceiling_ms(uint32_t retry_count, const BackoffPolicy& policy) {
    return backoff_floor_ms(retry_count, policy) + std::max<uint32_t>(policy.max_jitter_ms, 1);
}

uint64_t backoff_delay_ms(uint32_t retry_count, const BackoffPolicy& policy, std::mt19937& rng) {
    std::uniform_int_distribution<uint32_t> jitter(1, std::max<uint32_t>(policy.max_jitter_ms, 1));
    return backoff_floor_ms(retry_count, policy) + jitter(rng);
}

bool backoff_exhausted(uint32_t retry_count, const BackoffPolicy& policy) {
    return retry_count > policy.max_retries;
}
