#include "libkeyscore/finger_balance.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace libkeyscore {

namespace {
// Thumbs occupy column 0 of a FingerMatrix.
constexpr Eigen::Index kNonThumbFingers = 4;

FingerMatrix observed_loads(const Layout& layout, const MappedNgrams& ngrams) {
    FingerMatrix loads = FingerMatrix::Zero();
    const auto& layerkeys = layout.layerkeys();
    for (const auto& unigram : ngrams.unigrams) {
        const Key& key = layerkeys[unigram.keys[0]].key;
        loads(static_cast<Eigen::Index>(hand_index(key.hand)), static_cast<Eigen::Index>(finger_index(key.finger))) +=
            unigram.weight;
    }
    return loads;
}

std::string describe_loads(const FingerMatrix& fractions) {
    std::ostringstream oss;
    oss << "Finger loads %:" << std::fixed << std::setprecision(1);
    for (auto finger = static_cast<Eigen::Index>(kFingerCount) - 1; finger >= 1; --finger) {
        oss << ' ' << 100.0 * fractions(0, finger);
    }
    oss << " |";
    for (Eigen::Index finger = 1; finger < static_cast<Eigen::Index>(kFingerCount); ++finger) {
        oss << ' ' << 100.0 * fractions(1, finger);
    }
    return oss.str();
}
}  // namespace

FingerBalance::FingerBalance(FingerBalanceParams params) : params_(std::move(params)) {
    const double intended = params_.intended_loads.rightCols<kNonThumbFingers>().sum();
    if (!(intended > 0.0) || (params_.intended_loads.array() < 0.0).any()) {
        throw std::invalid_argument("finger_balance intended loads must be non-negative and not all zero");
    }
}

MetricCost FingerBalance::evaluate(const Layout& layout, const MappedNgrams& ngrams, bool /*parallel*/) const {
    const FingerMatrix loads = observed_loads(layout, ngrams);

    MetricCost result;
    result.weight_all = loads.sum();
    result.weight_found = result.weight_all;

    const double observed_total = loads.rightCols<kNonThumbFingers>().sum();
    if (observed_total <= 0.0) {
        return result;
    }
    const FingerMatrix observed = loads / observed_total;
    const FingerMatrix intended = params_.intended_loads / params_.intended_loads.rightCols<kNonThumbFingers>().sum();

    for (Eigen::Index hand = 0; hand < static_cast<Eigen::Index>(kHandCount); ++hand) {
        for (Eigen::Index finger = 1; finger < static_cast<Eigen::Index>(kFingerCount); ++finger) {
            result.cost += apply_deviation(params_.deviation, observed(hand, finger) - intended(hand, finger));
        }
    }
    result.message = describe_loads(observed);
    return result;
}

}  // namespace libkeyscore
