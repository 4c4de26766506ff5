#pragma once

/// @file fingerprint_generator.h
/// @brief Deterministic error fingerprints for alert grouping

#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "fingerprint/exception_record.h"

namespace axonsentry::fingerprint {

/// Ordered, de-duplicated grouping tokens
using Fingerprint = std::vector<std::string>;

/// Generates consistent fingerprints for error grouping
///
/// Components, in order:
/// 1. exception type short name
/// 2. Axon category marker ("CommandExecution" followed by the aggregate
///    type, "EventProcessing", or "QueryExecution")
/// 3. aggregate type, unless already added for a command failure
/// 4. normalized message, if non-empty
/// 5. "{declaring_unit}.{operation}" of the most recent stack frame
/// Duplicates are removed keeping the first occurrence.
///
/// The aggregate ID is accepted but never included, so errors are grouped
/// across aggregate instances:
/// - "Account 123 not found" and "Account 456 not found" -> same fingerprint
/// - same message from different exception types -> different fingerprints
///
/// Generation never throws; an internal failure is logged and yields a
/// fingerprint containing only the type name.
class FingerprintGenerator {
public:
    using Normalizer = std::function<std::string(std::string_view)>;

    FingerprintGenerator();

    /// @param normalizer Message normalization pass (NormalizeMessage by default)
    explicit FingerprintGenerator(Normalizer normalizer);

    /// Generate a fingerprint for an exception record
    /// @param exception The exception to fingerprint
    /// @param aggregate_type Optional aggregate type for additional context
    /// @param aggregate_id Optional aggregate ID (not included in the fingerprint)
    /// @return Fingerprint components, never empty
    Fingerprint GenerateFingerprint(
        const ExceptionRecord& exception,
        std::optional<std::string_view> aggregate_type = std::nullopt,
        std::optional<std::string_view> aggregate_id = std::nullopt) const;

    /// Generate a fingerprint for a caught exception
    Fingerprint GenerateFingerprint(
        const std::exception& exception,
        std::optional<std::string_view> aggregate_type = std::nullopt,
        std::optional<std::string_view> aggregate_id = std::nullopt) const;

private:
    Fingerprint BuildComponents(const ExceptionRecord& exception,
                                std::optional<std::string_view> aggregate_type) const;

    Normalizer normalizer_;
};

}  // namespace axonsentry::fingerprint
