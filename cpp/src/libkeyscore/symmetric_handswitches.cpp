#include "libkeyscore/symmetric_handswitches.hpp"

#include "libkeyscore/key_geometry.hpp"

namespace libkeyscore {

double SymmetricHandswitches::individual_cost(const Layout& layout, const LayerKey& k1, const LayerKey& k2) const noexcept {
    if (k1.key.hand == k2.key.hand) {
        return 0.0;
    }
    return is_mirrored(k1.key, k2.key, layout.symmetry_axis()) ? 0.0 : 1.0;
}

}  // namespace libkeyscore
