#include "libkeyscore/metric_config.hpp"

#include <cmath>
#include <stdexcept>
#include <type_traits>

namespace libkeyscore {

namespace {
bool params_match_kind(MetricKind kind, const MetricParams& params) {
    const MetricParams expected = default_params(kind);
    if (expected.index() != params.index()) {
        return false;
    }
    if (const auto* oxey = std::get_if<OxeyRollsParams>(&params)) {
        return oxey->direction == std::get<OxeyRollsParams>(expected).direction;
    }
    return true;
}

void require_finite(const MetricSpec& spec, const char* field, double value) {
    if (!std::isfinite(value)) {
        throw std::invalid_argument("metric " + spec.name + ": " + field + " must be finite");
    }
}
}  // namespace

NormalizationType parse_normalization_type(std::string_view name) {
    if (name == "fixed") {
        return NormalizationType::Fixed;
    }
    if (name == "weight_found") {
        return NormalizationType::WeightFound;
    }
    if (name == "weight_all") {
        return NormalizationType::WeightAll;
    }
    throw std::invalid_argument("Unknown normalization type: " + std::string(name));
}

std::string_view to_string(NormalizationType type) noexcept {
    switch (type) {
        case NormalizationType::Fixed:
            return "fixed";
        case NormalizationType::WeightFound:
            return "weight_found";
        case NormalizationType::WeightAll:
            return "weight_all";
    }
    return "unknown";
}

MetricSpec make_metric_spec(const std::string& name, double weight, Normalization normalization, bool enabled) {
    MetricSpec spec;
    spec.name = name;
    spec.kind = metric_kind_from_name(name);
    spec.enabled = enabled;
    spec.weight = weight;
    spec.normalization = normalization;
    spec.params = default_params(spec.kind);
    return spec;
}

void validate_metric_spec(const MetricSpec& spec) {
    if (!spec.enabled) {
        return;
    }
    if (spec.normalization.value == 0.0) {
        throw std::invalid_argument("metric " + spec.name + ": normalization value must not be zero");
    }
    require_finite(spec, "normalization value", spec.normalization.value);
    require_finite(spec, "weight", spec.weight);
    if (!params_match_kind(spec.kind, spec.params)) {
        throw std::invalid_argument("metric " + spec.name + ": parameters do not match metric kind " +
                                    std::string(metric_kind_name(spec.kind)));
    }

    std::visit(
        [&spec](const auto& params) {
            using T = std::decay_t<decltype(params)>;
            if constexpr (std::is_same_v<T, ShortcutKeysParams>) {
                if (params.shortcut_chars.empty()) {
                    throw std::invalid_argument("metric " + spec.name + ": shortcut_chars must not be empty");
                }
            } else if constexpr (std::is_same_v<T, SimilarLetterGroupsParams>) {
                for (const auto& [first, second] : params.letter_group_pairs) {
                    if (first.size() != second.size()) {
                        throw std::invalid_argument("metric " + spec.name +
                                                    ": letter_group_pairs groups must have equal length");
                    }
                }
            } else if constexpr (std::is_same_v<T, FingerBalanceParams>) {
                double non_thumb = 0.0;
                for (std::size_t hand = 0; hand < kHandCount; ++hand) {
                    for (std::size_t finger = 1; finger < kFingerCount; ++finger) {
                        const double load = params.intended_loads(static_cast<Eigen::Index>(hand),
                                                                  static_cast<Eigen::Index>(finger));
                        if (!(load >= 0.0)) {
                            throw std::invalid_argument("metric " + spec.name + ": intended_loads must be non-negative");
                        }
                        non_thumb += load;
                    }
                }
                if (non_thumb <= 0.0) {
                    throw std::invalid_argument("metric " + spec.name + ": intended_loads must not all be zero");
                }
            } else if constexpr (std::is_same_v<T, FingerRepeatsParams>) {
                if (!params.finger_factors.allFinite()) {
                    throw std::invalid_argument("metric " + spec.name + ": finger_factors must be finite");
                }
            }
        },
        spec.params);
}

const MetricSpec* EvaluationConfig::find(std::string_view name) const noexcept {
    for (const auto& metric : metrics) {
        if (metric.name == name) {
            return &metric;
        }
    }
    return nullptr;
}

}  // namespace libkeyscore
