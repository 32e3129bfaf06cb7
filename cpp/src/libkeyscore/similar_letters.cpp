#include "libkeyscore/similar_letters.hpp"

#include "libkeyscore/key_geometry.hpp"

#include <algorithm>
#include <utility>

namespace libkeyscore {

namespace {
double pair_cost(const SimilarLettersRating& rating, const Key& a, const Key& b, double symmetry_axis) noexcept {
    if (a.index == b.index) {
        return rating.same_key_cost;
    }
    if (are_neighbors(a, b)) {
        return rating.neighboring_cost;
    }
    if (a.column == b.column) {
        return rating.same_column_cost;
    }
    if (is_mirrored(a, b, symmetry_axis)) {
        return rating.symmetric_cost;
    }
    return 1.0;
}
}  // namespace

SimilarLetters::SimilarLetters(SimilarLettersParams params) : params_(std::move(params)) {}

MetricCost SimilarLetters::evaluate(const Layout& layout, const MappedNgrams& ngrams, bool /*parallel*/) const {
    MetricCost result;
    for (const auto& rating : params_.ratings) {
        for (const auto& [first, second] : rating.letter_pairs) {
            const auto a = layout.layerkey_index(first);
            const auto b = layout.layerkey_index(second);
            if (!a || !b) {
                continue;
            }
            const double weight = std::min(ngrams.symbol_weight(*a), ngrams.symbol_weight(*b));
            const double cost =
                pair_cost(rating, layout.layerkeys()[*a].key, layout.layerkeys()[*b].key, layout.symmetry_axis());
            result.cost += cost * weight;
            result.weight_all += weight;
            if (cost != 0.0) {
                result.weight_found += weight;
            }
        }
    }
    return result;
}

}  // namespace libkeyscore
