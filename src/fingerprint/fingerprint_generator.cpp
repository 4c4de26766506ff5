/// @file fingerprint_generator.cpp
/// @brief Fingerprint generation

#include "fingerprint/fingerprint_generator.h"

#include <unordered_set>
#include <utility>

#include <absl/strings/str_cat.h>

#include "common/logging.h"
#include "fingerprint/message_normalizer.h"

namespace axonsentry::fingerprint {

namespace {

void RemoveDuplicates(Fingerprint& components) {
    std::unordered_set<std::string> seen;
    Fingerprint unique;
    unique.reserve(components.size());
    for (auto& component : components) {
        if (seen.insert(component).second) {
            unique.push_back(std::move(component));
        }
    }
    components = std::move(unique);
}

}  // namespace

FingerprintGenerator::FingerprintGenerator()
    : FingerprintGenerator(Normalizer(&NormalizeMessage)) {}

FingerprintGenerator::FingerprintGenerator(Normalizer normalizer)
    : normalizer_(normalizer ? std::move(normalizer) : Normalizer(&NormalizeMessage)) {}

Fingerprint FingerprintGenerator::BuildComponents(
    const ExceptionRecord& exception,
    std::optional<std::string_view> aggregate_type) const {
    Fingerprint components;

    // 1. Exception type (most important for grouping)
    components.push_back(exception.type_name);

    // 2. Axon-specific context
    const bool is_command_failure =
        exception.category == ErrorCategory::kCommandExecution;
    switch (exception.category) {
        case ErrorCategory::kCommandExecution:
            components.emplace_back("CommandExecution");
            if (aggregate_type) {
                components.emplace_back(*aggregate_type);
            }
            break;
        case ErrorCategory::kEventProcessing:
            components.emplace_back("EventProcessing");
            break;
        case ErrorCategory::kQueryExecution:
            components.emplace_back("QueryExecution");
            break;
        case ErrorCategory::kNone:
            break;
    }

    // 3. Aggregate type for everything but command failures
    if (aggregate_type && !is_command_failure) {
        components.emplace_back(*aggregate_type);
    }

    // 4. Normalized message pattern
    if (exception.message) {
        std::string normalized = normalizer_(*exception.message);
        if (!normalized.empty()) {
            components.push_back(std::move(normalized));
        }
    }

    // 5. Top stack frame
    if (!exception.stack_trace.empty()) {
        const StackFrame& frame = exception.stack_trace.front();
        components.push_back(absl::StrCat(frame.declaring_unit, ".", frame.operation));
    }

    RemoveDuplicates(components);
    return components;
}

Fingerprint FingerprintGenerator::GenerateFingerprint(
    const ExceptionRecord& exception,
    std::optional<std::string_view> aggregate_type,
    std::optional<std::string_view> /*aggregate_id*/) const {
    try {
        return BuildComponents(exception, aggregate_type);
    } catch (const std::exception& e) {
        AXONSENTRY_LOG_WARN("Failed to generate error fingerprint for {}: {}",
                            exception.type_name, e.what());
        return Fingerprint{exception.type_name};
    }
}

Fingerprint FingerprintGenerator::GenerateFingerprint(
    const std::exception& exception,
    std::optional<std::string_view> aggregate_type,
    std::optional<std::string_view> aggregate_id) const {
    try {
        return GenerateFingerprint(ExceptionRecord::FromException(exception), aggregate_type,
                                   aggregate_id);
    } catch (const std::exception& e) {
        AXONSENTRY_LOG_WARN("Failed to record exception for fingerprinting: {}", e.what());
        return Fingerprint{std::string(kUnknownExceptionType)};
    }
}

}  // namespace axonsentry::fingerprint
