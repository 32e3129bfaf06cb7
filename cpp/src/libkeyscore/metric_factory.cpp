#include "libkeyscore/metric_factory.hpp"
#include "libkeyscore/shortcut_keys.hpp"
#include "libkeyscore/similar_letters.hpp"
#include "libkeyscore/similar_letter_groups.hpp"
#include "libkeyscore/finger_balance.hpp"
#include "libkeyscore/hand_disbalance.hpp"
#include "libkeyscore/key_costs.hpp"
#include "libkeyscore/row_loads.hpp"
#include "libkeyscore/symmetric_handswitches.hpp"
#include "libkeyscore/finger_repeats.hpp"
#include "libkeyscore/manual_bigram_penalty.hpp"
#include "libkeyscore/movement_pattern.hpp"
#include "libkeyscore/no_handswitch_after_unbalancing_key.hpp"
#include "libkeyscore/irregularity.hpp"
#include "libkeyscore/no_handswitch_in_trigram.hpp"
#include "libkeyscore/secondary_bigrams.hpp"
#include "libkeyscore/trigram_finger_repeats.hpp"
#include "libkeyscore/rolls.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace libkeyscore {

namespace {
template <typename T>
inline constexpr bool kAlwaysFalse = false;
}  // namespace

std::shared_ptr<const BigramMetric> MetricFactory::create_bigram(const MetricSpec& spec) {
    return std::visit(
        [&spec](const auto& params) -> std::shared_ptr<const BigramMetric> {
            using T = std::decay_t<decltype(params)>;
            if constexpr (std::is_same_v<T, SymmetricHandswitchesParams>) {
                return std::make_shared<SymmetricHandswitches>();
            } else if constexpr (std::is_same_v<T, FingerRepeatsParams>) {
                return std::make_shared<FingerRepeats>(params);
            } else if constexpr (std::is_same_v<T, ManualBigramPenaltyParams>) {
                return std::make_shared<ManualBigramPenalty>(params);
            } else if constexpr (std::is_same_v<T, MovementPatternParams>) {
                return std::make_shared<MovementPattern>(params);
            } else if constexpr (std::is_same_v<T, NoHandswitchAfterUnbalancingKeyParams>) {
                return std::make_shared<NoHandswitchAfterUnbalancingKey>(params);
            } else {
                throw std::invalid_argument("Not a bigram metric: " + spec.name);
            }
        },
        spec.params);
}

std::unique_ptr<Metric> MetricFactory::create(const MetricSpec& spec,
                                              const std::vector<WeightedBigramMetric>& bigram_metrics) {
    return std::visit(
        [&bigram_metrics](const auto& params) -> std::unique_ptr<Metric> {
            using T = std::decay_t<decltype(params)>;
            if constexpr (std::is_same_v<T, ShortcutKeysParams>) {
                return std::make_unique<ShortcutKeys>(params);
            } else if constexpr (std::is_same_v<T, SimilarLettersParams>) {
                return std::make_unique<SimilarLetters>(params);
            } else if constexpr (std::is_same_v<T, SimilarLetterGroupsParams>) {
                return std::make_unique<SimilarLetterGroups>(params);
            } else if constexpr (std::is_same_v<T, FingerBalanceParams>) {
                return std::make_unique<FingerBalance>(params);
            } else if constexpr (std::is_same_v<T, HandDisbalanceParams>) {
                return std::make_unique<HandDisbalance>(params);
            } else if constexpr (std::is_same_v<T, KeyCostsParams>) {
                return std::make_unique<KeyCosts>();
            } else if constexpr (std::is_same_v<T, RowLoadsParams>) {
                return std::make_unique<RowLoads>();
            } else if constexpr (std::is_same_v<T, SymmetricHandswitchesParams>) {
                return std::make_unique<SymmetricHandswitches>();
            } else if constexpr (std::is_same_v<T, FingerRepeatsParams>) {
                return std::make_unique<FingerRepeats>(params);
            } else if constexpr (std::is_same_v<T, ManualBigramPenaltyParams>) {
                return std::make_unique<ManualBigramPenalty>(params);
            } else if constexpr (std::is_same_v<T, MovementPatternParams>) {
                return std::make_unique<MovementPattern>(params);
            } else if constexpr (std::is_same_v<T, NoHandswitchAfterUnbalancingKeyParams>) {
                return std::make_unique<NoHandswitchAfterUnbalancingKey>(params);
            } else if constexpr (std::is_same_v<T, IrregularityParams>) {
                return std::make_unique<Irregularity>(bigram_metrics);
            } else if constexpr (std::is_same_v<T, NoHandswitchInTrigramParams>) {
                return std::make_unique<NoHandswitchInTrigram>(params);
            } else if constexpr (std::is_same_v<T, SecondaryBigramsParams>) {
                return std::make_unique<SecondaryBigrams>(params, bigram_metrics);
            } else if constexpr (std::is_same_v<T, TrigramFingerRepeatsParams>) {
                return std::make_unique<TrigramFingerRepeats>(params);
            } else if constexpr (std::is_same_v<T, TrigramRollsParams>) {
                return std::make_unique<TrigramRolls>(params);
            } else if constexpr (std::is_same_v<T, OxeyRollsParams>) {
                return std::make_unique<OxeyRolls>(params);
            } else {
                static_assert(kAlwaysFalse<T>, "unhandled metric parameters");
            }
        },
        spec.params);
}

}  // namespace libkeyscore
