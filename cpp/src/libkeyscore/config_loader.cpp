#include "libkeyscore/config_loader.hpp"

#include "libkeyscore/unicode.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace libkeyscore {

namespace {
// Reads typed fields of one YAML map and reports failures with the map's context.
class SectionReader {
public:
    SectionReader(std::string context, YAML::Node node) : context_(std::move(context)), node_(std::move(node)) {}

    [[nodiscard]] bool has(const std::string& key) const {
        if (!node_.IsDefined() || !node_.IsMap()) {
            return false;
        }
        const YAML::Node value = node_[key];
        return value.IsDefined() && !value.IsNull();
    }

    [[nodiscard]] YAML::Node required(const std::string& key) const {
        if (!has(key)) {
            fail(key, "is required");
        }
        return node_[key];
    }

    [[nodiscard]] YAML::Node optional(const std::string& key) const {
        return has(key) ? node_[key] : YAML::Node();
    }

    template <typename T>
    [[nodiscard]] T get(const std::string& key) const {
        const YAML::Node value = required(key);
        return with_context(key, [&value] { return value.as<T>(); });
    }

    template <typename T>
    [[nodiscard]] T get_or(const std::string& key, T fallback) const {
        if (!has(key)) {
            return fallback;
        }
        const YAML::Node value = node_[key];
        return with_context(key, [&value] { return value.as<T>(); });
    }

    template <typename F>
    auto with_context(const std::string& key, F&& parse) const -> decltype(parse()) {
        try {
            return parse();
        } catch (const YAML::Exception& e) {
            fail(key, std::string("is malformed: ") + e.what());
        } catch (const std::invalid_argument& e) {
            fail(key, std::string("is invalid: ") + e.what());
        }
    }

    [[noreturn]] void fail(const std::string& key, const std::string& problem) const {
        throw std::invalid_argument(context_ + " " + key + " " + problem);
    }

private:
    std::string context_;
    YAML::Node node_;
};

char32_t parse_symbol(const std::string& text) {
    const std::u32string decoded = decode_utf8(text);
    if (decoded.size() != 1) {
        throw std::invalid_argument("expected a single symbol, got \"" + text + "\"");
    }
    return decoded.front();
}

std::vector<char32_t> parse_symbol_list(const YAML::Node& node) {
    std::vector<char32_t> symbols;
    if (!node.IsDefined() || node.IsNull()) {
        return symbols;
    }
    if (!node.IsSequence()) {
        throw std::invalid_argument("expected a list of symbols");
    }
    for (const auto& item : node) {
        symbols.push_back(parse_symbol(item.as<std::string>()));
    }
    return symbols;
}

std::pair<Hand, Finger> parse_hand_finger(const YAML::Node& node) {
    if (!node.IsSequence() || node.size() != 2) {
        throw std::invalid_argument("expected [Hand, Finger]");
    }
    return {parse_hand(node[0].as<std::string>()), parse_finger(node[1].as<std::string>())};
}

MatrixPosition parse_position(const YAML::Node& node) {
    if (!node.IsSequence() || node.size() != 2) {
        throw std::invalid_argument("expected [column, row]");
    }
    return MatrixPosition{node[0].as<int>(), node[1].as<int>()};
}

std::string require_map_message(const char* what) {
    return std::string("expected a map of ") + what;
}

void read_params(const SectionReader& reader, ShortcutKeysParams& params) {
    const auto chars = reader.get<std::string>("shortcut_chars");
    params.shortcut_chars = reader.with_context("shortcut_chars", [&chars] { return decode_utf8(chars); });
    params.cost = reader.get<double>("cost");
    params.within_n_leftmost_cols = reader.get<int>("within_n_leftmost_cols");
}

void read_params(const SectionReader& reader, SimilarLettersParams& params) {
    const YAML::Node ratings = reader.required("letter_pairs_ratings");
    params.ratings = reader.with_context("letter_pairs_ratings", [&ratings] {
        if (!ratings.IsSequence()) {
            throw std::invalid_argument("expected a list of ratings");
        }
        std::vector<SimilarLettersRating> parsed;
        for (const auto& node : ratings) {
            SimilarLettersRating rating;
            rating.same_key_cost = node["same_key_cost"].as<double>();
            rating.neighboring_cost = node["neighboring_cost"].as<double>();
            rating.same_column_cost = node["same_column_cost"].as<double>();
            rating.symmetric_cost = node["symmetric_cost"].as<double>();
            const YAML::Node pairs = node["letter_pairs"];
            if (!pairs.IsSequence()) {
                throw std::invalid_argument("letter_pairs must be a list of symbol pairs");
            }
            for (const auto& pair : pairs) {
                if (!pair.IsSequence() || pair.size() != 2) {
                    throw std::invalid_argument("letter pair must hold two symbols");
                }
                rating.letter_pairs.emplace_back(parse_symbol(pair[0].as<std::string>()),
                                                 parse_symbol(pair[1].as<std::string>()));
            }
            parsed.push_back(std::move(rating));
        }
        return parsed;
    });
}

void read_params(const SectionReader& reader, SimilarLetterGroupsParams& params) {
    const YAML::Node groups = reader.required("letter_group_pairs");
    params.letter_group_pairs = reader.with_context("letter_group_pairs", [&groups] {
        if (!groups.IsSequence()) {
            throw std::invalid_argument("expected a list of group pairs");
        }
        std::vector<std::pair<std::u32string, std::u32string>> parsed;
        for (const auto& pair : groups) {
            if (!pair.IsSequence() || pair.size() != 2) {
                throw std::invalid_argument("group pair must hold two groups");
            }
            std::u32string first = decode_utf8(pair[0].as<std::string>());
            std::u32string second = decode_utf8(pair[1].as<std::string>());
            if (first.size() != second.size()) {
                throw std::invalid_argument("groups must have equal length");
            }
            parsed.emplace_back(std::move(first), std::move(second));
        }
        return parsed;
    });
}

void read_params(const SectionReader& reader, FingerBalanceParams& params) {
    const YAML::Node loads = reader.required("intended_loads");
    params.intended_loads = reader.with_context("intended_loads", [&loads] {
        if (!loads.IsMap()) {
            throw std::invalid_argument(require_map_message("[Hand, Finger] to load"));
        }
        FingerMatrix parsed = FingerMatrix::Zero();
        for (const auto& entry : loads) {
            const auto [hand, finger] = parse_hand_finger(entry.first);
            parsed(static_cast<Eigen::Index>(hand_index(hand)), static_cast<Eigen::Index>(finger_index(finger))) =
                entry.second.as<double>();
        }
        return parsed;
    });
    if (reader.has("deviation")) {
        const auto name = reader.get<std::string>("deviation");
        params.deviation = reader.with_context("deviation", [&name] { return parse_deviation(name); });
    }
}

void read_params(const SectionReader& reader, HandDisbalanceParams& params) {
    if (reader.has("deviation")) {
        const auto name = reader.get<std::string>("deviation");
        params.deviation = reader.with_context("deviation", [&name] { return parse_deviation(name); });
    }
}

void read_params(const SectionReader& /*reader*/, KeyCostsParams& /*params*/) {}

void read_params(const SectionReader& /*reader*/, RowLoadsParams& /*params*/) {}

void read_params(const SectionReader& /*reader*/, SymmetricHandswitchesParams& /*params*/) {}

void read_params(const SectionReader& /*reader*/, IrregularityParams& /*params*/) {}

void read_params(const SectionReader& reader, FingerRepeatsParams& params) {
    const YAML::Node factors = reader.required("finger_factors");
    params.finger_factors = reader.with_context("finger_factors", [&factors] {
        if (!factors.IsMap()) {
            throw std::invalid_argument(require_map_message("Finger to factor"));
        }
        Eigen::Matrix<double, 5, 1> parsed = Eigen::Matrix<double, 5, 1>::Zero();
        std::vector<bool> seen(kFingerCount, false);
        for (const auto& entry : factors) {
            const Finger finger = parse_finger(entry.first.as<std::string>());
            parsed(static_cast<Eigen::Index>(finger_index(finger))) = entry.second.as<double>();
            seen[finger_index(finger)] = true;
        }
        for (std::size_t f = 0; f < kFingerCount; ++f) {
            if (!seen[f]) {
                throw std::invalid_argument("missing factor for " + std::string(to_string(static_cast<Finger>(f))));
            }
        }
        return parsed;
    });
    params.stretch_factor = reader.get<double>("stretch_factor");
    params.curl_factor = reader.get<double>("curl_factor");
    params.lateral_factor = reader.get<double>("lateral_factor");
    params.same_key_offset = reader.get<double>("same_key_offset");
}

void read_params(const SectionReader& reader, ManualBigramPenaltyParams& params) {
    params.add_mirrored = reader.get_or<bool>("add_mirrored", false);
    const YAML::Node positions = reader.required("matrix_positions");
    params.matrix_positions = reader.with_context("matrix_positions", [&positions] {
        if (!positions.IsMap()) {
            throw std::invalid_argument(require_map_message("position pairs to cost"));
        }
        std::map<PositionPair, double> parsed;
        for (const auto& entry : positions) {
            const YAML::Node& pair = entry.first;
            if (!pair.IsSequence() || pair.size() != 2) {
                throw std::invalid_argument("expected [[column, row], [column, row]]");
            }
            parsed[PositionPair{parse_position(pair[0]), parse_position(pair[1])}] = entry.second.as<double>();
        }
        return parsed;
    });
}

void read_params(const SectionReader& reader, MovementPatternParams& params) {
    const YAML::Node switches = reader.required("finger_switch_factor");
    params.finger_switch_factor = reader.with_context("finger_switch_factor", [&switches] {
        if (!switches.IsSequence()) {
            throw std::invalid_argument("expected a list of {from, to, cost} entries");
        }
        FingerSwitchMatrix parsed = FingerSwitchMatrix::Zero();
        for (const auto& entry : switches) {
            const auto [from_hand, from_finger] = parse_hand_finger(entry["from"]);
            const auto [to_hand, to_finger] = parse_hand_finger(entry["to"]);
            parsed(static_cast<Eigen::Index>(hand_finger_index(from_hand, from_finger)),
                   static_cast<Eigen::Index>(hand_finger_index(to_hand, to_finger))) = entry["cost"].as<double>();
        }
        return parsed;
    });

    const YAML::Node lengths = reader.required("finger_lengths");
    params.finger_lengths = reader.with_context("finger_lengths", [&lengths] {
        if (!lengths.IsMap()) {
            throw std::invalid_argument(require_map_message("Hand to finger lengths"));
        }
        FingerMatrix parsed = FingerMatrix::Zero();
        for (const auto& hand_entry : lengths) {
            const Hand hand = parse_hand(hand_entry.first.as<std::string>());
            if (!hand_entry.second.IsMap()) {
                throw std::invalid_argument(require_map_message("Finger to length"));
            }
            for (const auto& finger_entry : hand_entry.second) {
                const Finger finger = parse_finger(finger_entry.first.as<std::string>());
                parsed(static_cast<Eigen::Index>(hand_index(hand)), static_cast<Eigen::Index>(finger_index(finger))) =
                    finger_entry.second.as<double>();
            }
        }
        return parsed;
    });

    params.short_down_to_long_or_long_up_to_short_factor =
        reader.get<double>("short_down_to_long_or_long_up_to_short_factor");
    params.same_row_offset = reader.get<double>("same_row_offset");
    params.unbalancing_factor = reader.get<double>("unbalancing_factor");
    params.lateral_stretch_factor = reader.get_or<double>("lateral_stretch_factor", 0.0);
}

void read_params(const SectionReader& reader, NoHandswitchAfterUnbalancingKeyParams& params) {
    params.unbalancing_after_unbalancing = reader.get_or<double>("unbalancing_after_unbalancing", 0.0);
}

void read_params(const SectionReader& reader, NoHandswitchInTrigramParams& params) {
    params.factor_with_direction_change = reader.get<double>("factor_with_direction_change");
    params.factor_without_direction_change = reader.get<double>("factor_without_direction_change");
    params.factor_same_key = reader.get<double>("factor_same_key");
    params.factor_contains_finger_repeat = reader.get<double>("factor_contains_finger_repeat");
    params.factor_same_key_start_end = reader.get<double>("factor_same_key_start_end");
    params.factor_contains_index = reader.get<double>("factor_contains_index");
}

void read_params(const SectionReader& reader, SecondaryBigramsParams& params) {
    params.factor_no_handswitch = reader.get<double>("factor_no_handswitch");
    params.factor_handswitch = reader.get<double>("factor_handswitch");
    const YAML::Node indicators = reader.optional("initial_pause_indicators");
    params.initial_pause_indicators =
        reader.with_context("initial_pause_indicators", [&indicators] { return parse_symbol_list(indicators); });
}

void read_params(const SectionReader& reader, TrigramFingerRepeatsParams& params) {
    params.factor_lateral_movement = reader.get<double>("factor_lateral_movement");
}

void read_filter(const SectionReader& reader, RollFilter& filter) {
    filter.exclude_thumbs = reader.get_or<bool>("exclude_thumbs", false);
    filter.exclude_modifiers = reader.get_or<bool>("exclude_modifiers", false);
    const YAML::Node chars = reader.optional("exclude_chars");
    filter.exclude_chars = reader.with_context("exclude_chars", [&chars] { return parse_symbol_list(chars); });
    filter.exclude_rows = reader.get_or<std::vector<int>>("exclude_rows", {});
}

void read_params(const SectionReader& reader, TrigramRollsParams& params) {
    params.factor_inward = reader.get<double>("factor_inward");
    params.factor_outward = reader.get<double>("factor_outward");
    read_filter(reader, params.filter);
}

void read_params(const SectionReader& reader, OxeyRollsParams& params) {
    read_filter(reader, params.filter);
}

MetricSpec parse_metric(const std::string& name, const YAML::Node& node) {
    MetricSpec spec;
    spec.name = name;
    spec.kind = metric_kind_from_name(name);
    spec.params = default_params(spec.kind);

    if (!node.IsMap()) {
        throw std::invalid_argument("metric " + name + ": expected a map");
    }
    const SectionReader fields("metric " + name + ":", node);
    spec.enabled = fields.get_or<bool>("enabled", true);
    if (!spec.enabled) {
        return spec;
    }

    spec.weight = fields.get<double>("weight");
    const SectionReader normalization("metric " + name + ": normalization", fields.required("normalization"));
    const auto type = normalization.get<std::string>("type");
    spec.normalization.type = normalization.with_context("type", [&type] { return parse_normalization_type(type); });
    spec.normalization.value = normalization.get_or<double>("value", 1.0);

    const SectionReader params("metric " + name + ": parameter", fields.optional("params"));
    std::visit([&params](auto& alternative) { read_params(params, alternative); }, spec.params);

    validate_metric_spec(spec);
    return spec;
}

void parse_ngram_settings(const YAML::Node& root, NgramMapperConfig& config) {
    const SectionReader ngrams("ngrams:", root["ngrams"]);
    const SectionReader increase("ngrams.increase_common_ngrams:", ngrams.optional("increase_common_ngrams"));
    auto& common = config.increase_common_ngrams;
    common.enabled = increase.get_or<bool>("enabled", common.enabled);
    common.critical_fraction = increase.get_or<double>("critical_fraction", common.critical_fraction);
    common.factor = increase.get_or<double>("factor", common.factor);
    common.total_weight_threshold = increase.get_or<double>("total_weight_threshold", common.total_weight_threshold);

    const SectionReader mapper("ngram_mapper:", root["ngram_mapper"]);
    config.exclude_line_breaks = mapper.get_or<bool>("exclude_line_breaks", config.exclude_line_breaks);
    const SectionReader split("ngram_mapper.split_modifiers:", mapper.optional("split_modifiers"));
    config.split_modifiers.enabled = split.get_or<bool>("enabled", config.split_modifiers.enabled);
    config.split_modifiers.same_key_mod_factor =
        split.get_or<double>("same_key_mod_factor", config.split_modifiers.same_key_mod_factor);
    if (!(config.split_modifiers.same_key_mod_factor >= 0.0)) {
        split.fail("same_key_mod_factor", "must be non-negative");
    }
}

EvaluationConfig parse_root(const YAML::Node& root) {
    if (!root.IsMap()) {
        throw std::invalid_argument("evaluation config must be a map");
    }
    const YAML::Node metrics = root["metrics"];
    if (!metrics.IsDefined() || !metrics.IsMap()) {
        throw std::invalid_argument("evaluation config requires a metrics map");
    }

    EvaluationConfig config;
    for (const auto& entry : metrics) {
        const std::string name = entry.first.as<std::string>();
        if (config.find(name) != nullptr) {
            throw std::invalid_argument("duplicate metric: " + name);
        }
        config.metrics.push_back(parse_metric(name, entry.second));
    }
    parse_ngram_settings(root, config.ngram_mapper);
    return config;
}
}  // namespace

EvaluationConfig parse_evaluation_config(const std::string& yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        throw std::invalid_argument(std::string("malformed evaluation config: ") + e.what());
    }
    try {
        return parse_root(root);
    } catch (const YAML::Exception& e) {
        throw std::invalid_argument(std::string("invalid evaluation config: ") + e.what());
    }
}

EvaluationConfig load_evaluation_config(const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        throw std::runtime_error("cannot open evaluation config: " + path);
    }
    std::stringstream buffer;
    buffer << input.rdbuf();
    return parse_evaluation_config(buffer.str());
}

}  // namespace libkeyscore
