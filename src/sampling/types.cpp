#include "sampling/types.h"

namespace axonsentry::sampling {

std::string_view SamplingDecisionToString(SamplingDecision decision) {
    switch (decision) {
        case SamplingDecision::kKeep:
            return "KEEP";
        case SamplingDecision::kDrop:
            return "DROP";
    }
    return "UNKNOWN";
}

std::string_view CombineStrategyToString(CombineStrategy strategy) {
    switch (strategy) {
        case CombineStrategy::kAnd:
            return "AND";
        case CombineStrategy::kOr:
            return "OR";
    }
    return "UNKNOWN";
}

}  // namespace axonsentry::sampling
