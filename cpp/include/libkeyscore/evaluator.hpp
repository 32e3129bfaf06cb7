#pragma once

#include "libkeyscore/evaluation_result.hpp"
#include "libkeyscore/layout.hpp"
#include "libkeyscore/metric.hpp"
#include "libkeyscore/metric_config.hpp"
#include "libkeyscore/ngram_corpus.hpp"
#include "libkeyscore/ngram_mapper.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace libkeyscore {

/**
 * Scores layouts against a fixed corpus and metric configuration.
 *
 * Construction validates the configuration, applies the common bigram boost to the corpus
 * and builds every enabled metric once; disabled metrics are never built. Bigram metrics are
 * shared with the trigram metrics that combine bigram costs (irregularity, secondary_bigrams),
 * each weighted by its configured metric weight.
 *
 * evaluate() maps the corpus onto the layout, runs the metrics in configuration order and
 * sums weight * normalized cost. It keeps no mutable state and may be called concurrently.
 */
class Evaluator {
public:
    struct Options {
        bool parallel;  // Use OpenMP reductions over large ngram tables
        bool verbose;   // Print the metric breakdown after each evaluation

        Options()
            : parallel(true),
              verbose(false) {}
    };

    Evaluator(EvaluationConfig config, const NgramCorpus& corpus, Options options = Options());

    [[nodiscard]] EvaluationResult evaluate(const Layout& layout) const;

    [[nodiscard]] const EvaluationConfig& config() const noexcept { return config_; }

    [[nodiscard]] const NgramCorpus& corpus() const noexcept { return corpus_; }

    [[nodiscard]] std::size_t metric_count() const noexcept { return metrics_.size(); }

private:
    struct ActiveMetric {
        std::string name;
        MetricKind kind;
        double weight;
        Normalization normalization;
        std::shared_ptr<const Metric> metric;
    };

    EvaluationConfig config_;
    NgramCorpus corpus_;
    NgramMapper mapper_;
    Options options_;
    std::vector<ActiveMetric> metrics_;
};

}  // namespace libkeyscore
