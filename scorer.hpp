/* Word difficulty. A word scores high when it is unusual: rare letters and letter
   pairs relative to the whole lexicon, few vowels, repeated letters, odd shapes
   like ABABA. The score only depends on its inputs, so a lexicon scored twice
   comes out identical.
*/

#pragma once
#include <map>
#include <vector>
#include <utility>
#include "word.hpp"

namespace Scoring {
    // Letter and adjacent-pair counts over every word of the lexicon.
    class Corpus_stats {
    public:
        Corpus_stats();
        static Corpus_stats of_words(const std::vector<Word>& words);

        // log(1/freq), with freq floored at 1e-6. Unseen letters/pairs count once.
        double letter_rarity(char c) const;
        double bigram_rarity(char a, char b) const;

        std::map<char, size_t> letter_count;
        std::map<std::pair<char, char>, size_t> bigram_count;
        double total_letters; // 5 per word
        double total_bigrams; // 4 per word
    };

    struct Weights {
        Weights();

        // corpus
        double rare_letter;      // per letter, log(1/freq)
        double rare_boost;       // extra per letter in jqxzkvwy
        double rare_bigram;      // per bigram, log(1/freq)

        // shape of the word itself
        double no_vowels_y;      // none of aeiouy
        double no_vowels;        // none of aeiou, but has y
        double low_vowel_ratio;  // vowel fraction under 0.2
        double adj_double;       // per adjacent double, "oo"
        double max_cons_cluster; // longest consonant run, y is a vowel here
        double dup_extra;        // per repeat of an already seen letter
        double low_unique;       // per missing unique letter
        double ababa;
        double repeated_bigram;
        double q_without_u;
    };

    double score(const Word& word, const Corpus_stats& stats, const Weights& wt);

    void test();
}
