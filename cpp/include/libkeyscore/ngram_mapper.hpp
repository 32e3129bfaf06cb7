#pragma once

#include "libkeyscore/layout.hpp"
#include "libkeyscore/ngram_corpus.hpp"

#include <array>
#include <cstddef>
#include <unordered_map>
#include <vector>

namespace libkeyscore {

struct SplitModifiersConfig {
    bool enabled{true};
    double same_key_mod_factor{0.03125};
};

struct NgramMapperConfig {
    bool exclude_line_breaks{true};
    SplitModifiersConfig split_modifiers{};
    IncreaseCommonNgramsConfig increase_common_ngrams{};
};

// Ngram over layer key indices of one layout; weight is relative to the corpus table total.
template <std::size_t N>
struct KeyNgram {
    std::array<std::size_t, N> keys{};
    double weight{0.0};
};

using KeyUnigram = KeyNgram<1>;
using KeyBigram = KeyNgram<2>;
using KeyTrigram = KeyNgram<3>;

struct MappedNgrams {
    std::vector<KeyUnigram> unigrams;
    std::vector<KeyBigram> bigrams;
    std::vector<KeyTrigram> trigrams;

    // Relative unigram weight per symbol (by layer key index) before modifiers are split.
    std::unordered_map<std::size_t, double> symbol_weights;

    double unigrams_not_found{0.0};
    double bigrams_not_found{0.0};
    double trigrams_not_found{0.0};

    [[nodiscard]] double symbol_weight(std::size_t layerkey) const noexcept;
};

/**
 * Maps symbol ngrams of a corpus onto layer keys of a layout.
 *
 * Ngrams with a symbol missing from the layout are dropped and their weight is reported as
 * not found. With line break exclusion, ngrams containing a line break that is followed by
 * another symbol are dropped. With modifier splitting, symbols on held layers expand into
 * sequences of their modifiers and base key; ngrams that pair two modifiers of the same
 * symbol are scaled by the same-key modifier factor.
 */
class NgramMapper {
public:
    explicit NgramMapper(NgramMapperConfig config = {});

    [[nodiscard]] const NgramMapperConfig& config() const noexcept { return config_; }

    [[nodiscard]] MappedNgrams map(const NgramCorpus& corpus, const Layout& layout) const;

private:
    void map_unigrams(const NgramCorpus& corpus, const Layout& layout, MappedNgrams& mapped) const;

    void map_bigrams(const NgramCorpus& corpus, const Layout& layout, MappedNgrams& mapped) const;

    void map_trigrams(const NgramCorpus& corpus, const Layout& layout, MappedNgrams& mapped) const;

    NgramMapperConfig config_;
};

}  // namespace libkeyscore
