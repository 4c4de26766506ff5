/// @file sampler_config.cpp
/// @brief Sampler configuration validation, presets and loading

#include "sampling/sampler_config.h"

#include <cmath>
#include <limits>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>

#include "common/config.h"
#include "common/error.h"

namespace axonsentry::sampling {

namespace {

absl::StatusOr<std::optional<int>> LoadOptionalInt(const Config& config,
                                                   const std::string& key) {
    if (!config.HasKey(key)) {
        return std::optional<int>();
    }
    AXONSENTRY_ASSIGN_OR_RETURN(int64_t value, config.TryGetInt(key));
    if (value > std::numeric_limits<int>::max() || value < std::numeric_limits<int>::min()) {
        return MakeError(ErrorCode::kConfigTypeMismatch,
                         absl::StrCat(key, " is out of range, got ", value));
    }
    return std::optional<int>(static_cast<int>(value));
}

}  // namespace

absl::Status SamplerConfig::Validate() const {
    if (probability.has_value() &&
        (std::isnan(*probability) || *probability < 0.0 || *probability > 1.0)) {
        return MakeError(ErrorCode::kInvalidProbability,
                         absl::StrCat("probability must be between 0.0 and 1.0, got ",
                                      *probability));
    }
    if (traces_per_second.has_value() && *traces_per_second <= 0) {
        return MakeError(ErrorCode::kInvalidRate,
                         absl::StrCat("tracesPerSecond must be positive, got ",
                                      *traces_per_second));
    }
    if (burst_capacity.has_value() && *burst_capacity <= 0) {
        return MakeError(ErrorCode::kInvalidBurstCapacity,
                         absl::StrCat("burstCapacity must be positive, got ",
                                      *burst_capacity));
    }
    return absl::OkStatus();
}

bool SamplerConfig::HasSamplingStrategy() const {
    return enabled && (probability.has_value() || traces_per_second.has_value());
}

SamplerConfig SamplerConfig::Default() {
    return SamplerConfig{};
}

SamplerConfig SamplerConfig::Development() {
    SamplerConfig config;
    config.probability = 1.0;
    return config;
}

SamplerConfig SamplerConfig::Production() {
    SamplerConfig config;
    config.probability = 0.1;
    config.traces_per_second = 100;
    config.combine_strategy = CombineStrategy::kAnd;
    return config;
}

SamplerConfig SamplerConfig::HighTraffic() {
    SamplerConfig config;
    config.probability = 0.01;
    config.traces_per_second = 50;
    config.combine_strategy = CombineStrategy::kAnd;
    return config;
}

absl::StatusOr<CombineStrategy> ParseCombineStrategy(std::string_view value) {
    const std::string normalized =
        absl::AsciiStrToUpper(absl::StripAsciiWhitespace(absl::string_view(value.data(), value.size())));
    if (normalized == "AND") {
        return CombineStrategy::kAnd;
    }
    if (normalized == "OR") {
        return CombineStrategy::kOr;
    }
    return MakeError(ErrorCode::kInvalidCombineStrategy,
                     absl::StrCat("Invalid combine strategy '", absl::string_view(value.data(), value.size()),
                                  "', expected AND or OR"));
}

absl::StatusOr<SamplerConfig> LoadSamplerConfig(const Config& config,
                                                std::string_view prefix) {
    auto key = [&prefix](std::string_view name) { return absl::StrCat(absl::string_view(prefix.data(), prefix.size()), ".",
                                                                absl::string_view(name.data(), name.size())); };

    SamplerConfig result;

    if (config.HasKey(key("enabled"))) {
        AXONSENTRY_ASSIGN_OR_RETURN(result.enabled, config.TryGetBool(key("enabled")));
    }

    if (config.HasKey(key("probability"))) {
        AXONSENTRY_ASSIGN_OR_RETURN(double probability,
                                    config.TryGetDouble(key("probability")));
        result.probability = probability;
    }

    AXONSENTRY_ASSIGN_OR_RETURN(result.traces_per_second,
                                LoadOptionalInt(config, key("traces_per_second")));
    AXONSENTRY_ASSIGN_OR_RETURN(result.burst_capacity,
                                LoadOptionalInt(config, key("burst_capacity")));

    if (config.HasKey(key("combine_strategy"))) {
        AXONSENTRY_ASSIGN_OR_RETURN(
            result.combine_strategy,
            ParseCombineStrategy(config.GetString(key("combine_strategy"))));
    }

    AXONSENTRY_RETURN_IF_ERROR(result.Validate());
    return result;
}

}  // namespace axonsentry::sampling
