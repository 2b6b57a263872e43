#pragma once

#include <cstdint>
#include <random>

#include "config.hpp"

struct BackoffPolicy {
    uint32_t base_ms;
    uint32_t max_jitter_ms;
    uint32_t max_exponent;
    uint32_t max_retries;
};

BackoffPolicy backoff_policy_from(const NodeConfig& cfg);

// base * 2^min(retry, max_exponent) + uniform[1, max_jitter].
uint64_t backoff_delay_ms(uint32_t retry_count, const BackoffPolicy& policy, std::mt19937& rng);
uint64_t backoff_floor_ms(uint32_t retry_count, const BackoffPolicy& policy);
uint64_t backoff_ceiling_ms(uint32_t retry_count, const BackoffPolicy& policy);

// True once retry_count has gone past max_retries.
bool backoff_exhausted(uint32_t retry_count, const BackoffPolicy& policy);
