#include "libkeyscore/no_handswitch_after_unbalancing_key.hpp"

#include "libkeyscore/key_geometry.hpp"

#include <utility>

namespace libkeyscore {

NoHandswitchAfterUnbalancingKey::NoHandswitchAfterUnbalancingKey(NoHandswitchAfterUnbalancingKeyParams params)
    : params_(std::move(params)) {}

double NoHandswitchAfterUnbalancingKey::individual_cost(const Layout& /*layout*/,
                                                        const LayerKey& k1,
                                                        const LayerKey& k2) const noexcept {
    const Key& from = k1.key;
    const Key& to = k2.key;
    if (!from.unbalancing || from.hand != to.hand || from.index == to.index) {
        return 0.0;
    }
    double cost = 1.0;
    if (to.unbalancing) {
        cost += params_.unbalancing_after_unbalancing * key_distance(from, to);
    }
    return cost;
}

}  // namespace libkeyscore
