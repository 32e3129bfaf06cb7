#include "libkeyscore/evaluator.hpp"

#include "libkeyscore/metric_factory.hpp"
#include "libkeyscore/normalization.hpp"

#include <iostream>
#include <map>
#include <utility>

namespace libkeyscore {

Evaluator::Evaluator(EvaluationConfig config, const NgramCorpus& corpus, Options options)
    : config_(std::move(config)),
      corpus_(corpus.with_common_bigrams_increased(config_.ngram_mapper.increase_common_ngrams)),
      mapper_(config_.ngram_mapper),
      options_(options) {
    for (const auto& spec : config_.metrics) {
        validate_metric_spec(spec);
    }

    std::vector<WeightedBigramMetric> bigram_metrics;
    std::map<std::string, std::shared_ptr<const BigramMetric>> built_bigrams;
    for (const auto& spec : config_.metrics) {
        if (!spec.enabled || metric_order(spec.kind) != NgramOrder::Bigram) {
            continue;
        }
        auto metric = MetricFactory::create_bigram(spec);
        bigram_metrics.push_back(WeightedBigramMetric{spec.weight, metric});
        built_bigrams.emplace(spec.name, std::move(metric));
    }

    for (const auto& spec : config_.metrics) {
        if (!spec.enabled) {
            continue;
        }
        std::shared_ptr<const Metric> metric;
        if (auto it = built_bigrams.find(spec.name); it != built_bigrams.end()) {
            metric = it->second;
        } else {
            metric = MetricFactory::create(spec, bigram_metrics);
        }
        metrics_.push_back(ActiveMetric{spec.name, spec.kind, spec.weight, spec.normalization, std::move(metric)});
    }

    if (options_.verbose) {
        std::cout << "Evaluator: " << metrics_.size() << " enabled metrics, " << bigram_metrics.size()
                  << " bigram metrics shared with trigram metrics" << std::endl;
    }
}

EvaluationResult Evaluator::evaluate(const Layout& layout) const {
    const MappedNgrams ngrams = mapper_.map(corpus_, layout);

    EvaluationResult result;
    result.unigrams_not_found = ngrams.unigrams_not_found;
    result.bigrams_not_found = ngrams.bigrams_not_found;
    result.trigrams_not_found = ngrams.trigrams_not_found;
    result.metrics.reserve(metrics_.size());

    for (const auto& active : metrics_) {
        MetricCost cost = active.metric->evaluate(layout, ngrams, options_.parallel);

        MetricResult metric;
        metric.name = active.name;
        metric.kind = active.kind;
        metric.order = active.metric->order();
        metric.raw_cost = cost.cost;
        metric.weight_found = cost.weight_found;
        metric.weight_all = cost.weight_all;
        metric.normalized_cost = normalize_cost(active.normalization, cost);
        metric.weight = active.weight;
        metric.weighted_cost = active.weight * metric.normalized_cost;
        metric.message = std::move(cost.message);

        result.total_cost += metric.weighted_cost;
        result.metrics.push_back(std::move(metric));
    }

    if (options_.verbose) {
        std::cout << format_evaluation(result) << std::flush;
    }
    return result;
}

}  // namespace libkeyscore
