#pragma once

#include "libkeyscore/metric_params.hpp"
#include "libkeyscore/ngram_mapper.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace libkeyscore {

enum class NormalizationType {
    Fixed,
    WeightFound,
    WeightAll
};

[[nodiscard]] NormalizationType parse_normalization_type(std::string_view name);

[[nodiscard]] std::string_view to_string(NormalizationType type) noexcept;

struct Normalization {
    NormalizationType type{NormalizationType::Fixed};
    double value{1.0};
};

struct MetricSpec {
    std::string name;
    MetricKind kind{MetricKind::KeyCosts};
    bool enabled{true};
    double weight{1.0};
    Normalization normalization{};
    MetricParams params{};
};

// Builds a spec whose kind and parameter alternative follow from the metric name.
[[nodiscard]] MetricSpec make_metric_spec(const std::string& name,
                                          double weight,
                                          Normalization normalization = {},
                                          bool enabled = true);

// Throws std::invalid_argument when an enabled spec is inconsistent.
void validate_metric_spec(const MetricSpec& spec);

struct EvaluationConfig {
    std::vector<MetricSpec> metrics;
    NgramMapperConfig ngram_mapper{};

    [[nodiscard]] const MetricSpec* find(std::string_view name) const noexcept;
};

}  // namespace libkeyscore
