#include "libkeyscore/metric_params.hpp"

#include <array>
#include <stdexcept>
#include <string>

namespace libkeyscore {

namespace {
struct KindName {
    MetricKind kind;
    std::string_view name;
};

constexpr std::array<KindName, 19> kMetricNames{{
    {MetricKind::ShortcutKeys, "shortcut_keys"},
    {MetricKind::SimilarLetters, "similar_letters"},
    {MetricKind::SimilarLetterGroups, "similar_letter_groups"},
    {MetricKind::FingerBalance, "finger_balance"},
    {MetricKind::HandDisbalance, "hand_disbalance"},
    {MetricKind::KeyCosts, "key_costs"},
    {MetricKind::RowLoads, "row_loads"},
    {MetricKind::SymmetricHandswitches, "symmetric_handswitches"},
    {MetricKind::FingerRepeats, "finger_repeats"},
    {MetricKind::ManualBigramPenalty, "manual_bigram_penalty"},
    {MetricKind::MovementPattern, "movement_pattern"},
    {MetricKind::NoHandswitchAfterUnbalancingKey, "no_handswitch_after_unbalancing_key"},
    {MetricKind::Irregularity, "irregularity"},
    {MetricKind::NoHandswitchInTrigram, "no_handswitch_in_trigram"},
    {MetricKind::SecondaryBigrams, "secondary_bigrams"},
    {MetricKind::TrigramFingerRepeats, "trigram_finger_repeats"},
    {MetricKind::TrigramRolls, "trigram_rolls"},
    {MetricKind::OxeyInwardRolls, "oxey_inward_rolls"},
    {MetricKind::OxeyOutwardRolls, "oxey_outward_rolls"},
}};
}  // namespace

MetricKind metric_kind_from_name(std::string_view name) {
    for (const auto& entry : kMetricNames) {
        if (entry.name == name) {
            return entry.kind;
        }
    }
    throw std::invalid_argument("Unknown metric: " + std::string(name));
}

std::string_view metric_kind_name(MetricKind kind) noexcept {
    for (const auto& entry : kMetricNames) {
        if (entry.kind == kind) {
            return entry.name;
        }
    }
    return "unknown";
}

NgramOrder metric_order(MetricKind kind) noexcept {
    switch (kind) {
        case MetricKind::ShortcutKeys:
        case MetricKind::SimilarLetters:
        case MetricKind::SimilarLetterGroups:
        case MetricKind::FingerBalance:
        case MetricKind::HandDisbalance:
        case MetricKind::KeyCosts:
        case MetricKind::RowLoads:
            return NgramOrder::Unigram;
        case MetricKind::SymmetricHandswitches:
        case MetricKind::FingerRepeats:
        case MetricKind::ManualBigramPenalty:
        case MetricKind::MovementPattern:
        case MetricKind::NoHandswitchAfterUnbalancingKey:
            return NgramOrder::Bigram;
        case MetricKind::Irregularity:
        case MetricKind::NoHandswitchInTrigram:
        case MetricKind::SecondaryBigrams:
        case MetricKind::TrigramFingerRepeats:
        case MetricKind::TrigramRolls:
        case MetricKind::OxeyInwardRolls:
        case MetricKind::OxeyOutwardRolls:
            return NgramOrder::Trigram;
    }
    return NgramOrder::Unigram;
}

Deviation parse_deviation(std::string_view name) {
    if (name == "squared") {
        return Deviation::Squared;
    }
    if (name == "absolute") {
        return Deviation::Absolute;
    }
    throw std::invalid_argument("Unknown deviation: " + std::string(name));
}

MetricParams default_params(MetricKind kind) {
    switch (kind) {
        case MetricKind::ShortcutKeys:
            return ShortcutKeysParams{};
        case MetricKind::SimilarLetters:
            return SimilarLettersParams{};
        case MetricKind::SimilarLetterGroups:
            return SimilarLetterGroupsParams{};
        case MetricKind::FingerBalance:
            return FingerBalanceParams{};
        case MetricKind::HandDisbalance:
            return HandDisbalanceParams{};
        case MetricKind::KeyCosts:
            return KeyCostsParams{};
        case MetricKind::RowLoads:
            return RowLoadsParams{};
        case MetricKind::SymmetricHandswitches:
            return SymmetricHandswitchesParams{};
        case MetricKind::FingerRepeats:
            return FingerRepeatsParams{};
        case MetricKind::ManualBigramPenalty:
            return ManualBigramPenaltyParams{};
        case MetricKind::MovementPattern:
            return MovementPatternParams{};
        case MetricKind::NoHandswitchAfterUnbalancingKey:
            return NoHandswitchAfterUnbalancingKeyParams{};
        case MetricKind::Irregularity:
            return IrregularityParams{};
        case MetricKind::NoHandswitchInTrigram:
            return NoHandswitchInTrigramParams{};
        case MetricKind::SecondaryBigrams:
            return SecondaryBigramsParams{};
        case MetricKind::TrigramFingerRepeats:
            return TrigramFingerRepeatsParams{};
        case MetricKind::TrigramRolls:
            return TrigramRollsParams{};
        case MetricKind::OxeyInwardRolls:
            return OxeyRollsParams{RollDirection::Inward, {}};
        case MetricKind::OxeyOutwardRolls:
            return OxeyRollsParams{RollDirection::Outward, {}};
    }
    throw std::invalid_argument("Unknown metric kind");
}

}  // namespace libkeyscore
