#include "libkeyscore/ngram_corpus.hpp"

#include "libkeyscore/unicode.hpp"

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <map>
#include <stdexcept>
#include <utility>

namespace libkeyscore {

namespace {
template <std::size_t N>
double merge_and_normalize(std::vector<NgramEntry<N>>& entries, const char* table) {
    std::map<std::array<char32_t, N>, std::size_t> index;
    std::vector<NgramEntry<N>> merged;
    merged.reserve(entries.size());
    double total = 0.0;
    for (const auto& entry : entries) {
        if (!(entry.weight >= 0.0) || !std::isfinite(entry.weight)) {
            throw std::invalid_argument(std::string(table) + " weight must be finite and non-negative: " +
                                        std::to_string(entry.weight));
        }
        auto [it, inserted] = index.emplace(entry.symbols, merged.size());
        if (inserted) {
            merged.push_back(NgramEntry<N>{entry.symbols, entry.weight, 0.0});
        } else {
            merged[it->second].weight += entry.weight;
        }
        total += entry.weight;
    }
    for (auto& entry : merged) {
        entry.relative = total > 0.0 ? entry.weight / total : 0.0;
    }
    entries = std::move(merged);
    return total;
}

[[nodiscard]] std::u32string unescape(std::string_view text) {
    std::string raw;
    raw.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\\' && i + 1 < text.size()) {
            const char next = text[i + 1];
            if (next == 'n') {
                raw.push_back('\n');
                ++i;
                continue;
            }
            if (next == 't') {
                raw.push_back('\t');
                ++i;
                continue;
            }
            if (next == '\\') {
                raw.push_back('\\');
                ++i;
                continue;
            }
        }
        raw.push_back(text[i]);
    }
    return decode_utf8(raw);
}

template <std::size_t N>
std::vector<NgramEntry<N>> read_entries(std::istream& input) {
    std::vector<NgramEntry<N>> entries;
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(input, line)) {
        ++line_number;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }
        const auto separator = line.find(' ');
        if (separator == std::string::npos) {
            throw std::invalid_argument("malformed ngram line " + std::to_string(line_number) + ": missing separator");
        }
        const std::string weight_text = line.substr(0, separator);
        char* end = nullptr;
        const double weight = std::strtod(weight_text.c_str(), &end);
        if (end == weight_text.c_str() || *end != '\0') {
            throw std::invalid_argument("malformed ngram weight on line " + std::to_string(line_number) + ": " + weight_text);
        }

        std::u32string symbols;
        try {
            symbols = unescape(std::string_view(line).substr(separator + 1));
        } catch (const std::invalid_argument& e) {
            throw std::invalid_argument("ngram line " + std::to_string(line_number) + ": " + e.what());
        }
        if (symbols.size() != N) {
            throw std::invalid_argument("ngram line " + std::to_string(line_number) + " holds " +
                                        std::to_string(symbols.size()) + " symbols, expected " + std::to_string(N));
        }

        NgramEntry<N> entry;
        for (std::size_t i = 0; i < N; ++i) {
            entry.symbols[i] = symbols[i];
        }
        entry.weight = weight;
        entries.push_back(entry);
    }
    return entries;
}

template <std::size_t N>
std::vector<NgramEntry<N>> read_file(const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        throw std::runtime_error("cannot open ngram file: " + path);
    }
    return read_entries<N>(input);
}
}  // namespace

NgramCorpus::NgramCorpus(std::vector<Unigram> unigrams, std::vector<Bigram> bigrams, std::vector<Trigram> trigrams)
    : unigrams_(std::move(unigrams)), bigrams_(std::move(bigrams)), trigrams_(std::move(trigrams)) {
    unigram_total_ = merge_and_normalize(unigrams_, "unigram");
    bigram_total_ = merge_and_normalize(bigrams_, "bigram");
    trigram_total_ = merge_and_normalize(trigrams_, "trigram");
}

NgramCorpus NgramCorpus::with_common_bigrams_increased(const IncreaseCommonNgramsConfig& config) const {
    if (!config.enabled) {
        return *this;
    }
    std::vector<Bigram> bigrams = bigrams_;
    for (auto& bigram : bigrams) {
        if (bigram.relative > config.critical_fraction && bigram.weight > config.total_weight_threshold) {
            bigram.weight *= config.factor;
        }
    }
    return NgramCorpus(unigrams_, std::move(bigrams), trigrams_);
}

std::vector<Unigram> read_unigrams(std::istream& input) {
    return read_entries<1>(input);
}

std::vector<Bigram> read_bigrams(std::istream& input) {
    return read_entries<2>(input);
}

std::vector<Trigram> read_trigrams(std::istream& input) {
    return read_entries<3>(input);
}

NgramCorpus load_ngram_corpus(const std::string& directory) {
    return NgramCorpus(read_file<1>(directory + "/1-grams.txt"),
                       read_file<2>(directory + "/2-grams.txt"),
                       read_file<3>(directory + "/3-grams.txt"));
}

}  // namespace libkeyscore
