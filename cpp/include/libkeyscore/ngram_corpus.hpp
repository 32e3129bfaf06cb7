#pragma once

#include <array>
#include <cstddef>
#include <istream>
#include <string>
#include <vector>

namespace libkeyscore {

template <std::size_t N>
struct NgramEntry {
    std::array<char32_t, N> symbols{};
    double weight{0.0};    // absolute occurrence count
    double relative{0.0};  // fraction of the table's total weight
};

template <std::size_t N>
[[nodiscard]] constexpr double relative_weight(const NgramEntry<N>& entry) noexcept {
    return entry.relative;
}

using Unigram = NgramEntry<1>;
using Bigram = NgramEntry<2>;
using Trigram = NgramEntry<3>;

struct IncreaseCommonNgramsConfig {
    bool enabled{false};
    double critical_fraction{0.001};
    double factor{2.0};
    double total_weight_threshold{20.0};
};

/**
 * Frequency tables of unigrams, bigrams and trigrams.
 *
 * Duplicate sequences are merged on construction and relative weights are computed per table,
 * so each table's relative weights sum to one.
 */
class NgramCorpus {
public:
    NgramCorpus() = default;

    NgramCorpus(std::vector<Unigram> unigrams, std::vector<Bigram> bigrams, std::vector<Trigram> trigrams);

    [[nodiscard]] const std::vector<Unigram>& unigrams() const noexcept { return unigrams_; }

    [[nodiscard]] const std::vector<Bigram>& bigrams() const noexcept { return bigrams_; }

    [[nodiscard]] const std::vector<Trigram>& trigrams() const noexcept { return trigrams_; }

    [[nodiscard]] double unigram_total() const noexcept { return unigram_total_; }

    [[nodiscard]] double bigram_total() const noexcept { return bigram_total_; }

    [[nodiscard]] double trigram_total() const noexcept { return trigram_total_; }

    // Multiplies bigrams that are frequent both absolutely and relatively, then renormalizes.
    [[nodiscard]] NgramCorpus with_common_bigrams_increased(const IncreaseCommonNgramsConfig& config) const;

private:
    std::vector<Unigram> unigrams_;
    std::vector<Bigram> bigrams_;
    std::vector<Trigram> trigrams_;
    double unigram_total_{0.0};
    double bigram_total_{0.0};
    double trigram_total_{0.0};
};

// Each line holds "<weight> <ngram>"; "\n", "\t" and "\\" escapes are accepted inside the ngram.
[[nodiscard]] std::vector<Unigram> read_unigrams(std::istream& input);

[[nodiscard]] std::vector<Bigram> read_bigrams(std::istream& input);

[[nodiscard]] std::vector<Trigram> read_trigrams(std::istream& input);

// Reads 1-grams.txt, 2-grams.txt and 3-grams.txt from a directory.
[[nodiscard]] NgramCorpus load_ngram_corpus(const std::string& directory);

}  // namespace libkeyscore
