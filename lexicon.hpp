/* The candidate words and their difficulty scores.

   Built once at startup from a word list (one word per line, any case, anything
   that isn't exactly five ASCII letters is skipped) and never changed after,
   so it is shared between threads without locking.
*/

#pragma once
#include <map>
#include <string>
#include <vector>
#include <iostream>
#include <boost/optional.hpp>
#include "scorer.hpp"

class Lexicon {
public:
    typedef std::map<std::string, double> Score_map;

    Lexicon();

    // throws Lexicon_load_error if the file can't be read
    static Lexicon of_file(const std::string& filename, const Scoring::Weights& wt = Scoring::Weights());
    static Lexicon of_stream(std::istream& is, const Scoring::Weights& wt = Scoring::Weights());

    // for tests and tools that already have scores
    static Lexicon of_scores(const Score_map& scores);

    bool contains(const std::string& word) const;
    boost::optional<double> score_of(const std::string& word) const;
    const Score_map& entries() const { return scores; }
    size_t size() const { return scores.size(); }
    bool empty() const { return scores.empty(); }

    // the [n] hardest (or easiest) words, ties broken alphabetically
    std::vector<std::pair<std::string, double>> top(size_t n, bool hardest) const;

    static void test();
private:
    Score_map scores;
};
