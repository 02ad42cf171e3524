#include "gpkgsheet/config.hpp"

#include <algorithm>
#include <fstream>
#include <type_traits>

#include "cpl_multiproc.h"

#include "gpkgsheet/errors.hpp"

using nlohmann::json;

namespace gpkgsheet {

const char* tolerance_policy_name(TolerancePolicy p) {
    switch (p) {
        case TolerancePolicy::FractionOfDiagonal: return "fraction_of_diagonal";
        case TolerancePolicy::Absolute: return "absolute";
    }
    return "fraction_of_diagonal";
}

void EngineConfig::validate() const {
    if (code_table_prefix.empty()) throw EnvironmentError("code_table_prefix must not be empty");
    if (max_cardinality_ratio < 0.0 || max_cardinality_ratio > 1.0) {
        throw EnvironmentError("max_cardinality_ratio must be within [0, 1]");
    }
    if (min_distinct_values > max_distinct_values) {
        throw EnvironmentError("min_distinct_values must not exceed max_distinct_values");
    }
    if (tolerance_fraction < 0.0) throw EnvironmentError("tolerance_fraction must be >= 0");
    if (tolerance_absolute < 0.0) throw EnvironmentError("tolerance_absolute must be >= 0");
    if (max_preview_features_per_layer == 0) {
        throw EnvironmentError("max_preview_features_per_layer must be >= 1");
    }
    if (max_preview_features_total == 0) throw EnvironmentError("max_preview_features_total must be >= 1");
    if (coordinate_precision < 0 || coordinate_precision > 15) {
        throw EnvironmentError("coordinate_precision must be within [0, 15]");
    }
    if (canonical_crs.empty()) throw EnvironmentError("canonical_crs must not be empty");
    if (worker_count < 0) throw EnvironmentError("worker_count must be >= 0");
}

int EngineConfig::effective_worker_count() const {
    if (worker_count > 0) return worker_count;
    return std::max(1, CPLGetNumCPUs());
}

namespace {

TolerancePolicy parse_tolerance_policy(const std::string& s) {
    if (s == "fraction_of_diagonal") return TolerancePolicy::FractionOfDiagonal;
    if (s == "absolute") return TolerancePolicy::Absolute;
    throw EnvironmentError("Unknown tolerance_policy: " + s +
                           " (expected fraction_of_diagonal|absolute)");
}

// 型が違えば EnvironmentError にする（nlohmann の type_error をそのまま出さない）
template <typename T>
void read_key(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end()) return;

    // 件数系 (size_t) に負数を入れると get<T>() は黙って巨大値に変換する
    if constexpr (std::is_unsigned_v<T> && !std::is_same_v<T, bool>) {
        if (it->is_number() && it->get<double>() < 0.0) {
            throw EnvironmentError(std::string("Invalid value for config key '") + key +
                                   "': must be >= 0, got " + it->dump());
        }
    }

    try {
        out = it->get<T>();
    } catch (const json::exception& e) {
        throw EnvironmentError(std::string("Invalid value for config key '") + key + "': " + e.what());
    }
}

}  // namespace

void apply_config_json(EngineConfig& c, const json& j) {
    if (!j.is_object()) throw EnvironmentError("Config must be a JSON object");

    static const char* const kKnownKeys[] = {
        "code_table_prefix", "sample_count", "max_text_length", "max_cardinality_ratio",
        "max_distinct_values", "min_distinct_values", "tolerance_policy", "tolerance_fraction",
        "tolerance_absolute", "preserve_topology", "max_preview_features_per_layer",
        "max_preview_features_total", "coordinate_precision", "canonical_crs", "worker_count"};
    for (auto it = j.begin(); it != j.end(); ++it) {
        const bool known = std::any_of(std::begin(kKnownKeys), std::end(kKnownKeys),
                                       [&](const char* k) { return it.key() == k; });
        if (!known) throw EnvironmentError("Unknown config key: " + it.key());
    }

    read_key(j, "code_table_prefix", c.code_table_prefix);
    read_key(j, "sample_count", c.sample_count);
    read_key(j, "max_text_length", c.max_text_length);
    read_key(j, "max_cardinality_ratio", c.max_cardinality_ratio);
    read_key(j, "max_distinct_values", c.max_distinct_values);
    read_key(j, "min_distinct_values", c.min_distinct_values);
    read_key(j, "tolerance_fraction", c.tolerance_fraction);
    read_key(j, "tolerance_absolute", c.tolerance_absolute);
    read_key(j, "preserve_topology", c.preserve_topology);
    read_key(j, "max_preview_features_per_layer", c.max_preview_features_per_layer);
    read_key(j, "max_preview_features_total", c.max_preview_features_total);
    read_key(j, "coordinate_precision", c.coordinate_precision);
    read_key(j, "canonical_crs", c.canonical_crs);
    read_key(j, "worker_count", c.worker_count);

    std::string policy;
    read_key(j, "tolerance_policy", policy);
    if (!policy.empty()) c.tolerance_policy = parse_tolerance_policy(policy);
}

EngineConfig load_config(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs) throw EnvironmentError("Failed to open config file: " + path);

    json j;
    try {
        ifs >> j;
    } catch (const json::exception& e) {
        throw EnvironmentError("Failed to parse config file " + path + ": " + e.what());
    }

    EngineConfig c;
    apply_config_json(c, j);
    c.validate();
    return c;
}

json config_to_json(const EngineConfig& c) {
    return json{
        {"code_table_prefix", c.code_table_prefix},
        {"sample_count", c.sample_count},
        {"max_text_length", c.max_text_length},
        {"max_cardinality_ratio", c.max_cardinality_ratio},
        {"max_distinct_values", c.max_distinct_values},
        {"min_distinct_values", c.min_distinct_values},
        {"tolerance_policy", tolerance_policy_name(c.tolerance_policy)},
        {"tolerance_fraction", c.tolerance_fraction},
        {"tolerance_absolute", c.tolerance_absolute},
        {"preserve_topology", c.preserve_topology},
        {"max_preview_features_per_layer", c.max_preview_features_per_layer},
        {"max_preview_features_total", c.max_preview_features_total},
        {"coordinate_precision", c.coordinate_precision},
        {"canonical_crs", c.canonical_crs},
        {"worker_count", c.worker_count}
    };
}

}  // namespace gpkgsheet
