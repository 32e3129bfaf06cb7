#pragma once

#include "libkeyscore/metric.hpp"
#include "libkeyscore/metric_config.hpp"

namespace libkeyscore {

// Rescales a raw metric cost; a zero weight denominator yields 0. Throws on a zero value.
[[nodiscard]] double normalize_cost(const Normalization& normalization, const MetricCost& cost);

}  // namespace libkeyscore
