#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>

namespace atrium {

/**
 * Exponential backoff with jitter, shared by the sync loop and the indexer.
 */
struct BackoffConfig {
    std::chrono::milliseconds initial_delay{1000};
    std::chrono::milliseconds max_delay{300000};
    double multiplier = 2.0;
    double jitter_factor = 0.2;  ///< +/- this fraction of the nominal delay
};

/**
 * Delay before retry number `attempt` (1 based).
 *
 * `jitter_sample` is a uniform sample in [0, 1); 0.5 yields the nominal
 * delay. Passing the sample in keeps this function deterministic.
 */
[[nodiscard]] inline std::chrono::milliseconds backoff_delay(
    const BackoffConfig& config,
    int attempt,
    double jitter_sample
) {
    const double max_ms = static_cast<double>(config.max_delay.count());
    const int exponent = std::max(0, attempt - 1);
    double nominal = static_cast<double>(config.initial_delay.count()) *
                     std::pow(config.multiplier, exponent);
    nominal = std::min(nominal, max_ms);

    const double sample = std::clamp(jitter_sample, 0.0, 1.0);
    const double jittered = nominal * (1.0 + config.jitter_factor * (2.0 * sample - 1.0));

    return std::chrono::milliseconds(std::llround(std::clamp(jittered, 0.0, max_ms)));
}

} // namespace atrium
