#include <cmath>
#include <cstring>
#include <set>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include "scorer.hpp"

using std::vector;
using std::pair;
using std::map;
using std::set;

namespace Scoring {
    static const double min_freq = 1e-6;
    static const char rare_letters[] = "jqxzkvwy";

    static bool is_vowel(char c) {
        return c == 'a' || c == 'e' || c == 'i' || c == 'o' || c == 'u';
    }

    static double rarity(size_t count, double total) {
        double f = total > 0 ? static_cast<double>(count) / total : 0.0;
        f = std::max(f, min_freq);
        return std::log(1.0 / f);
    }

    Corpus_stats::Corpus_stats() : total_letters(0), total_bigrams(0) {}

    Corpus_stats Corpus_stats::of_words(const vector<Word>& words) {
        Corpus_stats s;
        for (const Word& w : words) {
            for (int i = 0; i < Word::length; i++) {
                s.letter_count[w[i]]++;
            }
            for (int i = 0; i < Word::length - 1; i++) {
                s.bigram_count[{w[i], w[i + 1]}]++;
            }
        }
        s.total_letters = words.size() * 5.0;
        s.total_bigrams = words.size() * 4.0;
        return s;
    }

    double Corpus_stats::letter_rarity(char c) const {
        auto it = letter_count.find(c);
        return rarity(it == letter_count.end() ? 1 : it->second, total_letters);
    }

    double Corpus_stats::bigram_rarity(char a, char b) const {
        auto it = bigram_count.find({a, b});
        return rarity(it == bigram_count.end() ? 1 : it->second, total_bigrams);
    }

    Weights::Weights() :
        rare_letter(0.35),
        rare_boost(0.25),
        rare_bigram(0.20),
        no_vowels_y(9.0),
        no_vowels(5.0),
        low_vowel_ratio(2.0),
        adj_double(1.0),
        max_cons_cluster(1.0),
        dup_extra(1.6),
        low_unique(0.7),
        ababa(3.0),
        repeated_bigram(1.2),
        q_without_u(2.0)
    {}

    double score(const Word& w, const Corpus_stats& stats, const Weights& wt) {
        bool has_v = false;
        bool has_vy = false;
        int vowels = 0;
        int counts[26] = {0};
        for (int i = 0; i < Word::length; i++) {
            char c = w[i];
            if (is_vowel(c)) {
                has_v = true;
                vowels++;
            }
            if (is_vowel(c) || c == 'y') has_vy = true;
            counts[c - 'a']++;
        }
        double vowel_ratio = vowels / 5.0;

        int unique = 0;
        int dup_total = 0;
        for (int k : counts) {
            if (k > 0) {
                unique++;
                dup_total += k - 1;
            }
        }

        int adj_doubles = 0;
        for (int i = 0; i < Word::length - 1; i++) {
            if (w[i] == w[i + 1]) adj_doubles++;
        }

        int best = 0;
        int cur = 0;
        for (int i = 0; i < Word::length; i++) {
            if (is_vowel(w[i]) || w[i] == 'y') {
                cur = 0;
            } else {
                cur++;
                best = std::max(best, cur);
            }
        }

        bool ababa = w[0] == w[2] && w[2] == w[4] && w[0] != w[1] && w[1] == w[3];

        set<pair<char, char>> seen;
        int repeated_bg = 0;
        for (int i = 0; i < Word::length - 1; i++) {
            if (!seen.insert({w[i], w[i + 1]}).second) repeated_bg++;
        }

        bool q_without_u = w.contains('q') && !w.contains('u');

        double rare_letter_score = 0.0;
        for (int i = 0; i < Word::length; i++) {
            rare_letter_score += stats.letter_rarity(w[i]);
            if (std::strchr(rare_letters, w[i])) rare_letter_score += wt.rare_boost;
        }
        double rare_bigram_score = 0.0;
        for (int i = 0; i < Word::length - 1; i++) {
            rare_bigram_score += stats.bigram_rarity(w[i], w[i + 1]);
        }

        double s = 0.0;
        if (!has_vy) {
            s += wt.no_vowels_y;
        } else if (!has_v) {
            s += wt.no_vowels;
        }
        if (vowel_ratio < 0.2) s += wt.low_vowel_ratio;

        s += wt.rare_letter * rare_letter_score;
        s += wt.rare_bigram * rare_bigram_score;
        s += wt.adj_double * adj_doubles;
        s += wt.max_cons_cluster * best;
        s += wt.dup_extra * dup_total;
        s += wt.low_unique * std::max(5 - unique, 0);
        if (ababa) s += wt.ababa;
        s += wt.repeated_bigram * repeated_bg;
        if (q_without_u) s += wt.q_without_u;
        return s;
    }

    void test() {
        // a uniform corpus makes every letter and pair equally rare, so only the
        // shape features differ between words
        vector<Word> corpus;
        const char* raw[] = { "crane", "nymph", "kayak", "qajaq", "puppy", "lolol", "abcde" };
        for (const char* r : raw) corpus.push_back(Word(r));
        Corpus_stats stats = Corpus_stats::of_words(corpus);
        Weights wt;

        std::stringstream output1;
        std::stringstream expected1;
        output1 << stats.total_letters << " " << stats.total_bigrams << " "
                << stats.letter_count.at('a') << " " << stats.letter_count.at('p') << " "
                << stats.bigram_count.at({'a', 'k'}) << " "
                << stats.bigram_count.at({'l', 'o'}) << std::endl;
        // a: crane 1, kayak 2, qajaq 2, abcde 1
        expected1 << 35 << " " << 28 << " " << 6 << " " << 4 << " " << 1 << " " << 2 << std::endl;

        std::string output1_str = output1.str();
        std::string expected1_str = expected1.str();
        if (output1_str != expected1_str) {
            throw std::runtime_error("Scoring::test() 1 failed, got " + output1_str + ", but expected " + expected1_str);
        }

        // empty stats: only the shape features and the uniform 1e-6 floor contribute
        Corpus_stats empty;
        Weights shape_only;
        shape_only.rare_letter = 0;
        shape_only.rare_bigram = 0;

        std::stringstream output2;
        std::stringstream expected2;
        output2 << std::fixed << std::setprecision(2)
                << score(Word("crane"), empty, shape_only) << " "  // cluster 2 (cr)
                << score(Word("nymph"), empty, shape_only) << " "  // y only, ratio, cluster 3 (mph)
                << score(Word("lolol"), empty, shape_only) << " "  // dup 3, unique 2, ababa, repeated 2, cluster 1
                << score(Word("qajaq"), empty, shape_only) << " "  // dup 2, unique 3, cluster 1, q w/o u
                << score(Word("pffft"), empty, shape_only) << std::endl; // no vowels at all
        // crane : 1*2                                      = 2.00
        // nymph : 5 + 2 + 1*3                              = 10.00
        // lolol : 1*1 + 1.6*3 + 0.7*3 + 3 + 1.2*2          = 13.30
        // qajaq : 1*1 + 1.6*2 + 0.7*2 + 2                  = 7.60
        // pffft : 9 + 2 + 1*2 (ff twice) + 1*5 + 1.6*2 + 0.7*2 + 1.2*1 = 23.80
        expected2 << "2.00 10.00 13.30 7.60 23.80" << std::endl;

        std::string output2_str = output2.str();
        std::string expected2_str = expected2.str();
        if (output2_str != expected2_str) {
            throw std::runtime_error("Scoring::test() 2 failed, got " + output2_str + ", but expected " + expected2_str);
        }

        // same inputs, same score; finite for words the corpus has never seen
        const char* probes[] = { "crane", "zzzzz", "xylyl", "qqqqq", "aeiou" };
        for (const char* p : probes) {
            double s1 = score(Word(p), stats, wt);
            double s2 = score(Word(p), stats, wt);
            double s3 = score(Word(p), empty, wt);
            if (s1 != s2 || !std::isfinite(s1) || !std::isfinite(s3)) {
                throw std::runtime_error(std::string("Scoring::test() 3 failed for ") + p);
            }
        }

        // rare letters and odd shapes beat a plain word
        if (!(score(Word("qajaq"), stats, wt) > score(Word("crane"), stats, wt))) {
            throw std::runtime_error("Scoring::test() 4 failed, qajaq should outscore crane");
        }
    }
}
