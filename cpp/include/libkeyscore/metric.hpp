#pragma once

#include "libkeyscore/layout.hpp"
#include "libkeyscore/metric_params.hpp"
#include "libkeyscore/ngram_mapper.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace libkeyscore {

struct MetricCost {
    double cost{0.0};
    double weight_found{0.0};  // relative weight of ngrams with a non-zero cost
    double weight_all{0.0};    // relative weight of every examined ngram
    std::optional<std::string> message{};
};

// Tables shorter than this are summed serially even when parallel evaluation is requested.
inline constexpr std::size_t kParallelThreshold = 4096;

class Metric {
public:
    virtual ~Metric() = default;

    [[nodiscard]] virtual NgramOrder order() const noexcept = 0;

    [[nodiscard]] virtual MetricCost evaluate(const Layout& layout, const MappedNgrams& ngrams, bool parallel) const = 0;
};

class UnigramMetric : public Metric {
public:
    [[nodiscard]] NgramOrder order() const noexcept override { return NgramOrder::Unigram; }
};

/**
 * Metric defined by a cost per pair of consecutive layer keys.
 *
 * evaluate() sums weight * individual_cost over the mapped bigrams. individual_cost() must not
 * throw since it runs inside a parallel reduction.
 */
class BigramMetric : public Metric {
public:
    [[nodiscard]] NgramOrder order() const noexcept override { return NgramOrder::Bigram; }

    [[nodiscard]] virtual double individual_cost(const Layout& layout, const LayerKey& k1, const LayerKey& k2) const noexcept = 0;

    [[nodiscard]] MetricCost evaluate(const Layout& layout, const MappedNgrams& ngrams, bool parallel) const override;
};

class TrigramMetric : public Metric {
public:
    [[nodiscard]] NgramOrder order() const noexcept override { return NgramOrder::Trigram; }

    [[nodiscard]] virtual double individual_cost(const Layout& layout,
                                                 const LayerKey& k1,
                                                 const LayerKey& k2,
                                                 const LayerKey& k3) const noexcept = 0;

    // Skipped trigrams count neither towards the cost nor towards the examined weight.
    [[nodiscard]] virtual bool skips(const LayerKey& /*k1*/, const LayerKey& /*k2*/, const LayerKey& /*k3*/) const noexcept {
        return false;
    }

    [[nodiscard]] MetricCost evaluate(const Layout& layout, const MappedNgrams& ngrams, bool parallel) const override;
};

struct WeightedBigramMetric {
    double weight{1.0};
    std::shared_ptr<const BigramMetric> metric;
};

// Weighted sum of the individual costs of several bigram metrics for one key pair.
[[nodiscard]] double combined_bigram_cost(const std::vector<WeightedBigramMetric>& metrics,
                                          const Layout& layout,
                                          const LayerKey& k1,
                                          const LayerKey& k2) noexcept;

}  // namespace libkeyscore
