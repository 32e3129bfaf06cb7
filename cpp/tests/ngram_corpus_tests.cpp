#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <array>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>

#include "libkeyscore/ngram_corpus.hpp"
#include "test_layouts.hpp"

#ifndef KEYSCORE_TEST_DATA_DIR
#define KEYSCORE_TEST_DATA_DIR "data"
#endif

TEST_CASE("NgramCorpus merges duplicates and computes relative weights", "[corpus]") {
    const auto corpus = keyscore_test::make_corpus({{U"a", 2.0}, {U"b", 1.0}, {U"a", 1.0}}, {{U"ab", 1.0}});

    REQUIRE(corpus.unigrams().size() == 2);
    REQUIRE(corpus.unigram_total() == Catch::Approx(4.0));
    REQUIRE(corpus.unigrams()[0].symbols[0] == U'a');
    REQUIRE(corpus.unigrams()[0].weight == Catch::Approx(3.0));
    REQUIRE(libkeyscore::relative_weight(corpus.unigrams()[0]) == Catch::Approx(0.75));
    REQUIRE(corpus.bigrams()[0].relative == Catch::Approx(1.0));
    REQUIRE(corpus.trigrams().empty());
    REQUIRE(corpus.trigram_total() == Catch::Approx(0.0));
}

TEST_CASE("NgramCorpus rejects negative or non-finite weights", "[corpus]") {
    REQUIRE_THROWS_AS(keyscore_test::make_corpus({{U"a", -1.0}}), std::invalid_argument);
    REQUIRE_THROWS_AS(keyscore_test::make_corpus({{U"a", std::numeric_limits<double>::quiet_NaN()}}),
                      std::invalid_argument);
}

TEST_CASE("Ngram tables are read from weight and sequence lines", "[corpus]") {
    std::istringstream input("10 th\n5 he\n\n3 \\nA\n2 e \n");
    const auto bigrams = libkeyscore::read_bigrams(input);

    REQUIRE(bigrams.size() == 4);
    REQUIRE(bigrams[0].symbols == std::array<char32_t, 2>{U't', U'h'});
    REQUIRE(bigrams[0].weight == Catch::Approx(10.0));
    REQUIRE(bigrams[2].symbols == std::array<char32_t, 2>{U'\n', U'A'});
    REQUIRE(bigrams[3].symbols == std::array<char32_t, 2>{U'e', U' '});

    std::istringstream unicode("4 \xc3\xa4\r\n");
    const auto unigrams = libkeyscore::read_unigrams(unicode);
    REQUIRE(unigrams.size() == 1);
    REQUIRE(unigrams[0].symbols[0] == U'\u00E4');
}

TEST_CASE("Malformed ngram lines are rejected", "[corpus]") {
    std::istringstream missing_separator("10\n");
    REQUIRE_THROWS_AS(libkeyscore::read_unigrams(missing_separator), std::invalid_argument);

    std::istringstream bad_weight("x1 ab\n");
    REQUIRE_THROWS_AS(libkeyscore::read_bigrams(bad_weight), std::invalid_argument);

    std::istringstream wrong_length("1 abc\n");
    REQUIRE_THROWS_AS(libkeyscore::read_bigrams(wrong_length), std::invalid_argument);

    std::istringstream bad_utf8("1 \xff\n");
    REQUIRE_THROWS_AS(libkeyscore::read_unigrams(bad_utf8), std::invalid_argument);
}

TEST_CASE("Common bigrams are boosted and renormalized", "[corpus]") {
    const auto corpus = keyscore_test::make_corpus({{U"a", 1.0}}, {{U"th", 30.0}, {U"he", 10.0}, {U"ab", 60.0}});

    libkeyscore::IncreaseCommonNgramsConfig config;
    config.critical_fraction = 0.2;
    config.factor = 2.0;
    config.total_weight_threshold = 20.0;

    SECTION("Disabled boosting leaves the corpus unchanged") {
        const auto same = corpus.with_common_bigrams_increased(config);
        REQUIRE(same.bigram_total() == Catch::Approx(100.0));
        REQUIRE(same.bigrams()[0].relative == Catch::Approx(0.3));
    }

    SECTION("Enabled boosting multiplies frequent bigrams") {
        config.enabled = true;
        const auto boosted = corpus.with_common_bigrams_increased(config);
        REQUIRE(boosted.bigram_total() == Catch::Approx(190.0));
        REQUIRE(boosted.bigrams()[0].weight == Catch::Approx(60.0));
        REQUIRE(boosted.bigrams()[1].weight == Catch::Approx(10.0));
        REQUIRE(boosted.bigrams()[2].weight == Catch::Approx(120.0));
        REQUIRE(boosted.bigrams()[0].relative == Catch::Approx(60.0 / 190.0));
        REQUIRE(boosted.unigrams()[0].relative == Catch::Approx(1.0));
    }
}

TEST_CASE("Loading a corpus from a missing directory fails", "[corpus]") {
    REQUIRE_THROWS_AS(libkeyscore::load_ngram_corpus("/nonexistent/keyscore/corpus"), std::runtime_error);
}

TEST_CASE("Loading a corpus directory reads all three tables", "[corpus]") {
    const auto corpus = libkeyscore::load_ngram_corpus(std::string(KEYSCORE_TEST_DATA_DIR) + "/corpus");
    REQUIRE(corpus.unigrams().size() == 21);
    REQUIRE(corpus.bigrams().size() == 18);
    REQUIRE(corpus.trigrams().size() == 12);
    REQUIRE(corpus.unigram_total() == Catch::Approx(1040.0));
}
