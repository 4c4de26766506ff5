#include "config.h"

#include <cstdlib>
#include <functional>
#include <utility>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>

#include "error.h"

namespace axonsentry {

namespace {

template <typename T>
absl::StatusOr<T> ConvertScalar(const std::optional<YAML::Node>& node,
                                std::string_view key) {
    if (!node) {
        return MakeError(ErrorCode::kConfigNotFound,
                         absl::StrCat("Configuration key not found: ", absl::string_view(key.data(), key.size())));
    }
    if (!node->IsScalar()) {
        return MakeError(ErrorCode::kConfigTypeMismatch,
                         absl::StrCat("Configuration key '", absl::string_view(key.data(), key.size()), "' is not a scalar"));
    }
    try {
        return node->as<T>();
    } catch (const YAML::Exception&) {
        return MakeError(ErrorCode::kConfigTypeMismatch,
                         absl::StrCat("Configuration key '", absl::string_view(key.data(), key.size()), "' has malformed value '",
                                      node->Scalar(), "'"));
    }
}

}  // namespace

absl::StatusOr<Config> Config::LoadFromFile(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return MakeError(ErrorCode::kConfigNotFound,
                         absl::StrCat("Configuration file not found: ", path.string()));
    }

    try {
        Config config;
        config.root_ = YAML::LoadFile(path.string());
        return config;
    } catch (const YAML::Exception& e) {
        return MakeError(ErrorCode::kConfigParseError,
                         absl::StrCat("Failed to parse YAML configuration: ", e.what()));
    }
}

absl::StatusOr<Config> Config::LoadFromString(std::string_view yaml_content) {
    try {
        Config config;
        config.root_ = YAML::Load(std::string(yaml_content));
        return config;
    } catch (const YAML::Exception& e) {
        return MakeError(ErrorCode::kConfigParseError,
                         absl::StrCat("Failed to parse YAML content: ", e.what()));
    }
}

Config Config::LoadFromEnvironment(std::string_view prefix) {
    Config config;

    auto get_env = [&prefix](const char* suffix) -> std::optional<std::string> {
        std::string key = absl::StrCat(absl::string_view(prefix.data(), prefix.size()), suffix);
        const char* value = std::getenv(key.c_str());
        if (value != nullptr) {
            return std::string(value);
        }
        return std::nullopt;
    };

    // Values are stored as YAML scalars; typed getters convert on read.
    static constexpr std::pair<const char*, const char*> kMappings[] = {
        {"SAMPLING_ENABLED", "sampling.enabled"},
        {"SAMPLING_PROBABILITY", "sampling.probability"},
        {"SAMPLING_TRACES_PER_SECOND", "sampling.traces_per_second"},
        {"SAMPLING_BURST_CAPACITY", "sampling.burst_capacity"},
        {"SAMPLING_COMBINE_STRATEGY", "sampling.combine_strategy"},
        {"TRACING_ENABLED", "tracing.enabled"},
        {"TRACING_TRACE_COMMANDS", "tracing.trace_commands"},
        {"TRACING_TRACE_EVENTS", "tracing.trace_events"},
        {"TRACING_TRACE_QUERIES", "tracing.trace_queries"},
        {"LOG_LEVEL", "logging.level"},
    };

    for (const auto& [suffix, key] : kMappings) {
        if (auto val = get_env(suffix)) {
            config.Set(key, *val);
        }
    }

    return config;
}

void Config::Merge(const Config& other) {
    // Deep merge YAML nodes
    std::function<void(YAML::Node&, const YAML::Node&)> merge_nodes;
    merge_nodes = [&merge_nodes](YAML::Node& base, const YAML::Node& overlay) {
        if (overlay.IsMap()) {
            for (const auto& kv : overlay) {
                const std::string key = kv.first.as<std::string>();
                if (base[key] && base[key].IsMap() && kv.second.IsMap()) {
                    YAML::Node base_child = base[key];
                    merge_nodes(base_child, kv.second);
                } else {
                    base[key] = kv.second;
                }
            }
        }
    };

    merge_nodes(root_, other.root_);
}

std::optional<YAML::Node> Config::GetNestedNode(std::string_view key) const {
    std::vector<std::string> parts = absl::StrSplit(absl::string_view(key.data(), key.size()), '.');

    // reset() rebinds the handle; operator= would overwrite the tree.
    YAML::Node current;
    current.reset(root_);

    for (const auto& part : parts) {
        if (!current || !current.IsMap()) {
            return std::nullopt;
        }
        const YAML::Node& parent = current;
        YAML::Node child = parent[part];
        if (!child) {
            return std::nullopt;
        }
        current.reset(child);
    }

    if (!current || current.IsNull()) {
        return std::nullopt;
    }

    return current;
}

std::string Config::GetString(std::string_view key, std::string_view default_value) const {
    auto node = GetNestedNode(key);
    if (node && node->IsScalar()) {
        return node->as<std::string>();
    }
    return std::string(default_value);
}

int64_t Config::GetInt(std::string_view key, int64_t default_value) const {
    auto value = TryGetInt(key);
    return value.ok() ? *value : default_value;
}

double Config::GetDouble(std::string_view key, double default_value) const {
    auto value = TryGetDouble(key);
    return value.ok() ? *value : default_value;
}

bool Config::GetBool(std::string_view key, bool default_value) const {
    auto value = TryGetBool(key);
    return value.ok() ? *value : default_value;
}

absl::StatusOr<int64_t> Config::TryGetInt(std::string_view key) const {
    return ConvertScalar<int64_t>(GetNestedNode(key), key);
}

absl::StatusOr<double> Config::TryGetDouble(std::string_view key) const {
    return ConvertScalar<double>(GetNestedNode(key), key);
}

absl::StatusOr<bool> Config::TryGetBool(std::string_view key) const {
    return ConvertScalar<bool>(GetNestedNode(key), key);
}

bool Config::HasKey(std::string_view key) const {
    return GetNestedNode(key).has_value();
}

void Config::Set(std::string_view key, ConfigValue value) {
    std::vector<std::string> parts = absl::StrSplit(absl::string_view(key.data(), key.size()), '.');

    YAML::Node current;
    current.reset(root_);
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        YAML::Node next = current[parts[i]];
        if (!next.IsMap()) {
            next = YAML::Node(YAML::NodeType::Map);
        }
        current.reset(next);
    }

    std::visit([&](const auto& val) { current[parts.back()] = val; }, value);
}

}  // namespace axonsentry
