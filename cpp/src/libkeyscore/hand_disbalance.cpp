#include "libkeyscore/hand_disbalance.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

namespace libkeyscore {

HandDisbalance::HandDisbalance(HandDisbalanceParams params) : params_(std::move(params)) {}

MetricCost HandDisbalance::evaluate(const Layout& layout, const MappedNgrams& ngrams, bool /*parallel*/) const {
    const auto& layerkeys = layout.layerkeys();
    double left = 0.0;
    double total = 0.0;
    for (const auto& unigram : ngrams.unigrams) {
        if (layerkeys[unigram.keys[0]].key.hand == Hand::Left) {
            left += unigram.weight;
        }
        total += unigram.weight;
    }

    MetricCost result;
    result.weight_all = total;
    result.weight_found = total;
    if (total <= 0.0) {
        return result;
    }
    const double left_fraction = left / total;
    result.cost = apply_deviation(params_.deviation, left_fraction - 0.5);

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << "Hand loads %: " << 100.0 * left_fraction << " - "
        << 100.0 * (1.0 - left_fraction);
    result.message = oss.str();
    return result;
}

}  // namespace libkeyscore
