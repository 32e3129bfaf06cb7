#include "libkeyscore/finger_repeats.hpp"

#include <stdexcept>
#include <utility>

namespace libkeyscore {

FingerRepeats::FingerRepeats(FingerRepeatsParams params) : params_(std::move(params)) {
    if (!params_.finger_factors.allFinite()) {
        throw std::invalid_argument("finger_repeats finger factors must be finite");
    }
}

double FingerRepeats::individual_cost(const Layout& /*layout*/, const LayerKey& k1, const LayerKey& k2) const noexcept {
    const Key& from = k1.key;
    const Key& to = k2.key;
    if (from.hand != to.hand || from.finger != to.finger) {
        return 0.0;
    }

    const double base = params_.finger_factors(static_cast<Eigen::Index>(finger_index(from.finger)));
    if (from.index == to.index) {
        return base + params_.same_key_offset;
    }
    if (from.column != to.column) {
        return base * params_.lateral_factor;
    }
    if (to.row < from.row) {
        return base * params_.stretch_factor;
    }
    return base * params_.curl_factor;
}

}  // namespace libkeyscore
