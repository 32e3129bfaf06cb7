#pragma once

#include "libkeyscore/metric.hpp"
#include "libkeyscore/metric_config.hpp"

#include <memory>
#include <vector>

namespace libkeyscore {

class MetricFactory {
public:
    // The concrete metric follows from the spec's parameter alternative. Trigram metrics that
    // reuse bigram costs receive bigram_metrics.
    static std::unique_ptr<Metric> create(const MetricSpec& spec,
                                          const std::vector<WeightedBigramMetric>& bigram_metrics = {});

    // Throws std::invalid_argument unless the spec describes a bigram metric.
    static std::shared_ptr<const BigramMetric> create_bigram(const MetricSpec& spec);
};

}  // namespace libkeyscore
