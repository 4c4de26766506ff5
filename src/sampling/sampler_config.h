#pragma once

/// @file sampler_config.h
/// @brief Declarative sampling policy configuration

#include <optional>
#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "sampling/types.h"

namespace axonsentry {
class Config;
}  // namespace axonsentry

namespace axonsentry::sampling {

/// Sampler configuration
///
/// Example configurations:
/// @code
///   // Sample 10% of traces
///   SamplerConfig config;
///   config.probability = 0.1;
///
///   // Sample 10% AND limit to 50 per second
///   config.traces_per_second = 50;
///   config.combine_strategy = CombineStrategy::kAnd;
/// @endcode
struct SamplerConfig {
    bool enabled = true;
    std::optional<double> probability;     ///< [0, 1], unset = no probability sampler
    std::optional<int> traces_per_second;  ///< > 0, unset = no rate limit
    std::optional<int> burst_capacity;     ///< > 0, defaults to traces_per_second
    CombineStrategy combine_strategy = CombineStrategy::kAnd;

    /// Check value ranges
    /// @return InvalidArgument describing the first out-of-range field
    absl::Status Validate() const;

    /// True if enabled and at least one strategy is configured
    bool HasSamplingStrategy() const;

    /// Enabled, no strategy: keep everything
    static SamplerConfig Default();

    /// Development: sample all traces
    static SamplerConfig Development();

    /// Production: sample 10% up to 100 traces/sec
    static SamplerConfig Production();

    /// High traffic: sample 1% up to 50 traces/sec
    static SamplerConfig HighTraffic();
};

/// Parse "AND" / "OR" (case-insensitive, surrounding whitespace ignored)
/// @return InvalidArgument naming the value if it is neither
absl::StatusOr<CombineStrategy> ParseCombineStrategy(std::string_view value);

/// Read a sampler configuration from the keys under `prefix`:
/// enabled, probability, traces_per_second, burst_capacity, combine_strategy.
/// Absent keys keep their defaults; malformed or out-of-range values fail.
absl::StatusOr<SamplerConfig> LoadSamplerConfig(const Config& config,
                                                std::string_view prefix = "sampling");

}  // namespace axonsentry::sampling
