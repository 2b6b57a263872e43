#include "backoff.hpp"
#include "config.hpp"

#include <cassert>
#include <random>

int main() {
    const BackoffPolicy policy = backoff_policy_from(load_config());
    assert(policy.base_ms == 1000 && policy.max_jitter_ms == 1000);
    assert(policy.max_exponent == 5 && policy.max_retries == 6);

    assert(backoff_floor_ms(0, policy) == 1000);
    assert(backoff_floor_ms(1, policy) == 2000);
    assert(backoff_floor_ms(5, policy) == 32000);
    assert(backoff_floor_ms(9, policy) == 32000); // capped exponent

    std::mt19937 rng(3);
    uint64_t prev_floor = 0;
    for (uint32_t retry = 0; retry <= 10; ++retry) {
        const uint64_t floor = backoff_floor_ms(retry, policy);
        assert(floor >= prev_floor);
        prev_floor = floor;
        for (int i = 0; i < 200; ++i) {
            const uint64_t d = backoff_delay_ms(retry, policy, rng);
            // Jitter is strictly positive and bounded.
            assert(d > floor);
            assert(d <= backoff_ceiling_ms(retry, policy));
        }
    }
    // Non-decreasing even across a jitter draw: the next floor is at least this ceiling.
    for (uint32_t retry = 0; retry < policy.max_exponent; ++retry) {
        assert(backoff_floor_ms(retry + 1, policy) >= backoff_ceiling_ms(retry, policy));
    }

    assert(!backoff_exhausted(6, policy));
    assert(backoff_exhausted(7, policy));
    return 0;
}
