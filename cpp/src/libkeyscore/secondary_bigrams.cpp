#include "libkeyscore/secondary_bigrams.hpp"

#include "libkeyscore/unicode.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace libkeyscore {

SecondaryBigrams::SecondaryBigrams(SecondaryBigramsParams params, std::vector<WeightedBigramMetric> bigram_metrics)
    : params_(std::move(params)), bigram_metrics_(std::move(bigram_metrics)) {
    for (const auto& entry : bigram_metrics_) {
        if (!entry.metric) {
            throw std::invalid_argument("secondary_bigrams requires non-null bigram metrics");
        }
    }
}

bool SecondaryBigrams::skips(const LayerKey& k1, const LayerKey& k2, const LayerKey& /*k3*/) const noexcept {
    const auto& indicators = params_.initial_pause_indicators;
    return is_whitespace(k2.symbol) && std::find(indicators.begin(), indicators.end(), k1.symbol) != indicators.end();
}

double SecondaryBigrams::individual_cost(const Layout& layout,
                                         const LayerKey& k1,
                                         const LayerKey& k2,
                                         const LayerKey& k3) const noexcept {
    const double factor = k1.key.hand != k2.key.hand ? params_.factor_handswitch : params_.factor_no_handswitch;
    return factor * combined_bigram_cost(bigram_metrics_, layout, k1, k3);
}

}  // namespace libkeyscore
