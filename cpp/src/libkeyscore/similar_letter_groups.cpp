#include "libkeyscore/similar_letter_groups.hpp"

#include "libkeyscore/key_geometry.hpp"

#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace libkeyscore {

namespace {
struct GroupMember {
    RelativePlacement placement;
    double weight{0.0};  // unigram weight of both symbols
};
}  // namespace

SimilarLetterGroups::SimilarLetterGroups(SimilarLetterGroupsParams params) : params_(std::move(params)) {
    for (const auto& [first, second] : params_.letter_group_pairs) {
        if (first.size() != second.size()) {
            throw std::invalid_argument("similar_letter_groups requires groups of equal length");
        }
    }
}

MetricCost SimilarLetterGroups::evaluate(const Layout& layout, const MappedNgrams& ngrams, bool /*parallel*/) const {
    MetricCost result;
    for (const auto& [first, second] : params_.letter_group_pairs) {
        std::vector<std::optional<GroupMember>> members;
        members.reserve(first.size());
        for (std::size_t i = 0; i < first.size(); ++i) {
            const auto a = layout.layerkey_index(first[i]);
            const auto b = layout.layerkey_index(second[i]);
            if (!a || !b) {
                members.emplace_back(std::nullopt);
                continue;
            }
            GroupMember member;
            member.placement =
                relative_placement(layout.layerkeys()[*a].key, layout.layerkeys()[*b].key, layout.symmetry_axis());
            member.weight = ngrams.symbol_weight(*a) + ngrams.symbol_weight(*b);
            members.emplace_back(member);
        }

        for (std::size_t i = 0; i < members.size(); ++i) {
            if (!members[i]) {
                continue;
            }
            for (std::size_t j = i + 1; j < members.size(); ++j) {
                if (!members[j]) {
                    continue;
                }
                const double deviation = placement_deviation(members[i]->placement, members[j]->placement);
                const double weight = members[i]->weight + members[j]->weight;
                result.cost += deviation * weight;
                result.weight_all += weight;
                if (deviation != 0.0) {
                    result.weight_found += weight;
                }
            }
        }
    }
    return result;
}

}  // namespace libkeyscore
