#include "libkeyscore/ngram_mapper.hpp"

#include "libkeyscore/unicode.hpp"

#include <algorithm>
#include <functional>
#include <stdexcept>
#include <utility>

namespace libkeyscore {

namespace {
template <std::size_t N>
struct KeyArrayHash {
    std::size_t operator()(const std::array<std::size_t, N>& keys) const noexcept {
        std::size_t seed = 0;
        for (std::size_t key : keys) {
            seed ^= std::hash<std::size_t>{}(key) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        }
        return seed;
    }
};

// Accumulates weights of identical key ngrams; held modifiers repeated back to back are dropped.
template <std::size_t N>
class NgramAccumulator {
public:
    explicit NgramAccumulator(const Layout& layout) : layerkeys_(layout.layerkeys()) {}

    void add(const std::array<std::size_t, N>& keys, double weight) {
        for (std::size_t i = 1; i < N; ++i) {
            if (keys[i] == keys[i - 1] && layerkeys_[keys[i]].is_modifier) {
                return;
            }
        }
        weights_[keys] += weight;
    }

    [[nodiscard]] std::vector<KeyNgram<N>> collect() const {
        std::vector<KeyNgram<N>> ngrams;
        ngrams.reserve(weights_.size());
        for (const auto& [keys, weight] : weights_) {
            ngrams.push_back(KeyNgram<N>{keys, weight});
        }
        std::sort(ngrams.begin(), ngrams.end(),
                  [](const KeyNgram<N>& a, const KeyNgram<N>& b) { return a.keys < b.keys; });
        return ngrams;
    }

private:
    const std::vector<LayerKey>& layerkeys_;
    std::unordered_map<std::array<std::size_t, N>, double, KeyArrayHash<N>> weights_;
};

struct Expansion {
    std::size_t base;
    std::vector<std::size_t> modifiers;

    [[nodiscard]] bool split() const noexcept { return !modifiers.empty(); }
};

[[nodiscard]] Expansion expand(const Layout& layout, std::size_t index, bool split_modifiers) {
    const auto& layerkey = layout.layerkeys()[index];
    if (!split_modifiers || layerkey.modifiers.empty()) {
        return Expansion{index, {}};
    }
    return Expansion{layout.base_layerkey(index), layerkey.modifiers};
}

// The base key and each of its modifiers on their own.
[[nodiscard]] std::vector<std::size_t> take_one(const Expansion& expansion) {
    std::vector<std::size_t> keys;
    keys.reserve(expansion.modifiers.size() + 1);
    keys.push_back(expansion.base);
    keys.insert(keys.end(), expansion.modifiers.begin(), expansion.modifiers.end());
    return keys;
}

// Pairs typed while reaching a single symbol: modifier then base, and modifier pairs in both orders.
[[nodiscard]] std::vector<std::pair<std::array<std::size_t, 2>, double>> take_two(const Expansion& expansion,
                                                                                  double weight,
                                                                                  double same_key_mod_factor) {
    std::vector<std::pair<std::array<std::size_t, 2>, double>> pairs;
    const auto& mods = expansion.modifiers;
    for (std::size_t i = 0; i < mods.size(); ++i) {
        pairs.push_back({{mods[i], expansion.base}, weight});
        for (std::size_t j = i + 1; j < mods.size(); ++j) {
            if (mods[i] != mods[j]) {
                pairs.push_back({{mods[i], mods[j]}, same_key_mod_factor * weight});
                pairs.push_back({{mods[j], mods[i]}, same_key_mod_factor * weight});
            }
        }
    }
    return pairs;
}

[[nodiscard]] std::vector<std::pair<std::array<std::size_t, 3>, double>> take_three(const Expansion& expansion,
                                                                                    double weight,
                                                                                    double same_key_mod_factor) {
    std::vector<std::pair<std::array<std::size_t, 3>, double>> triples;
    const auto& mods = expansion.modifiers;
    const double pair_weight = same_key_mod_factor * weight;
    const double triple_weight = same_key_mod_factor * pair_weight;
    for (std::size_t i = 0; i < mods.size(); ++i) {
        for (std::size_t j = i + 1; j < mods.size(); ++j) {
            triples.push_back({{mods[i], mods[j], expansion.base}, pair_weight});
            triples.push_back({{mods[j], mods[i], expansion.base}, pair_weight});
            for (std::size_t k = j + 1; k < mods.size(); ++k) {
                const std::size_t a = mods[i];
                const std::size_t b = mods[j];
                const std::size_t c = mods[k];
                triples.push_back({{a, b, c}, triple_weight});
                triples.push_back({{a, c, b}, triple_weight});
                triples.push_back({{b, a, c}, triple_weight});
                triples.push_back({{b, c, a}, triple_weight});
                triples.push_back({{c, a, b}, triple_weight});
                triples.push_back({{c, b, a}, triple_weight});
            }
        }
    }
    return triples;
}

[[nodiscard]] bool is_pause(char32_t first, char32_t second) noexcept {
    return first == kLineBreak && second != kLineBreak;
}
}  // namespace

double MappedNgrams::symbol_weight(std::size_t layerkey) const noexcept {
    auto it = symbol_weights.find(layerkey);
    return it == symbol_weights.end() ? 0.0 : it->second;
}

NgramMapper::NgramMapper(NgramMapperConfig config) : config_(std::move(config)) {
    if (!(config_.split_modifiers.same_key_mod_factor >= 0.0)) {
        throw std::invalid_argument("same_key_mod_factor must be non-negative");
    }
}

MappedNgrams NgramMapper::map(const NgramCorpus& corpus, const Layout& layout) const {
    MappedNgrams mapped;
    map_unigrams(corpus, layout, mapped);
    map_bigrams(corpus, layout, mapped);
    map_trigrams(corpus, layout, mapped);
    return mapped;
}

void NgramMapper::map_unigrams(const NgramCorpus& corpus, const Layout& layout, MappedNgrams& mapped) const {
    NgramAccumulator<1> accumulator(layout);
    const bool split = config_.split_modifiers.enabled;
    for (const auto& unigram : corpus.unigrams()) {
        auto index = layout.layerkey_index(unigram.symbols[0]);
        if (!index) {
            mapped.unigrams_not_found += unigram.relative;
            continue;
        }
        mapped.symbol_weights[*index] += unigram.relative;
        for (std::size_t key : take_one(expand(layout, *index, split))) {
            accumulator.add({key}, unigram.relative);
        }
    }
    mapped.unigrams = accumulator.collect();
}

void NgramMapper::map_bigrams(const NgramCorpus& corpus, const Layout& layout, MappedNgrams& mapped) const {
    NgramAccumulator<2> accumulator(layout);
    const bool split = config_.split_modifiers.enabled;
    const double mod_factor = config_.split_modifiers.same_key_mod_factor;
    for (const auto& bigram : corpus.bigrams()) {
        const auto& s = bigram.symbols;
        if (config_.exclude_line_breaks && is_pause(s[0], s[1])) {
            continue;
        }
        auto i1 = layout.layerkey_index(s[0]);
        auto i2 = layout.layerkey_index(s[1]);
        if (!i1 || !i2) {
            mapped.bigrams_not_found += bigram.relative;
            continue;
        }
        const double w = bigram.relative;
        const Expansion e1 = expand(layout, *i1, split);
        const Expansion e2 = expand(layout, *i2, split);
        if (!e1.split() && !e2.split()) {
            accumulator.add({*i1, *i2}, w);
            continue;
        }

        for (std::size_t a : take_one(e1)) {
            for (std::size_t b : take_one(e2)) {
                if (a != b) {
                    accumulator.add({a, b}, w);
                }
            }
        }
        for (const auto& [keys, weight] : take_two(e2, w, mod_factor)) {
            accumulator.add(keys, weight);
        }
    }
    mapped.bigrams = accumulator.collect();
}

void NgramMapper::map_trigrams(const NgramCorpus& corpus, const Layout& layout, MappedNgrams& mapped) const {
    NgramAccumulator<3> accumulator(layout);
    const bool split = config_.split_modifiers.enabled;
    const double mod_factor = config_.split_modifiers.same_key_mod_factor;
    for (const auto& trigram : corpus.trigrams()) {
        const auto& s = trigram.symbols;
        if (config_.exclude_line_breaks && (is_pause(s[0], s[1]) || is_pause(s[1], s[2]))) {
            continue;
        }
        auto i1 = layout.layerkey_index(s[0]);
        auto i2 = layout.layerkey_index(s[1]);
        auto i3 = layout.layerkey_index(s[2]);
        if (!i1 || !i2 || !i3) {
            mapped.trigrams_not_found += trigram.relative;
            continue;
        }
        const double w = trigram.relative;
        const Expansion e1 = expand(layout, *i1, split);
        const Expansion e2 = expand(layout, *i2, split);
        const Expansion e3 = expand(layout, *i3, split);
        if (!e1.split() && !e2.split() && !e3.split()) {
            accumulator.add({*i1, *i2, *i3}, w);
            continue;
        }

        const auto one1 = take_one(e1);
        const auto one2 = take_one(e2);
        const auto one3 = take_one(e3);
        const auto two1 = take_two(e1, w, mod_factor);
        const auto two2 = take_two(e2, w, mod_factor);
        const auto two3 = take_two(e3, w, mod_factor);

        auto add_distinct = [&](std::size_t a, std::size_t b, std::size_t c, double weight) {
            if (a != b && b != c) {
                accumulator.add({a, b, c}, weight);
            }
        };

        for (std::size_t a : one1) {
            for (std::size_t b : one2) {
                for (std::size_t c : one3) {
                    add_distinct(a, b, c, w);
                }
            }
        }
        for (const auto& [ab, weight] : two1) {
            for (std::size_t c : one2) {
                add_distinct(ab[0], ab[1], c, weight);
            }
        }
        for (std::size_t a : one1) {
            for (const auto& [bc, weight] : two2) {
                add_distinct(a, bc[0], bc[1], weight);
            }
        }
        for (const auto& [ab, weight] : two2) {
            for (std::size_t c : one3) {
                add_distinct(ab[0], ab[1], c, weight);
            }
        }
        for (std::size_t a : one2) {
            for (const auto& [bc, weight] : two3) {
                add_distinct(a, bc[0], bc[1], weight);
            }
        }
        for (const Expansion* expansion : {&e1, &e2, &e3}) {
            for (const auto& [keys, weight] : take_three(*expansion, w, mod_factor)) {
                accumulator.add(keys, weight);
            }
        }
    }
    mapped.trigrams = accumulator.collect();
}

}  // namespace libkeyscore
