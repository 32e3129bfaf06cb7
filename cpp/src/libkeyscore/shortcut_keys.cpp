#include "libkeyscore/shortcut_keys.hpp"

#include <stdexcept>
#include <utility>

namespace libkeyscore {

ShortcutKeys::ShortcutKeys(ShortcutKeysParams params) : params_(std::move(params)) {
    if (params_.shortcut_chars.empty()) {
        throw std::invalid_argument("shortcut_keys requires at least one shortcut symbol");
    }
}

MetricCost ShortcutKeys::evaluate(const Layout& layout, const MappedNgrams& ngrams, bool /*parallel*/) const {
    MetricCost result;
    for (char32_t symbol : params_.shortcut_chars) {
        const auto index = layout.layerkey_index(symbol);
        if (!index) {
            continue;
        }
        const double weight = ngrams.symbol_weight(*index);
        result.weight_found += weight;
        if (layout.layerkeys()[*index].key.column > params_.within_n_leftmost_cols) {
            result.cost += params_.cost * weight;
        }
    }
    result.weight_all = result.weight_found;
    return result;
}

}  // namespace libkeyscore
