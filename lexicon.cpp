#include <fstream>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include "lexicon.hpp"
#include "errors.hpp"
#include "log.hpp"

using std::string;
using std::vector;
using std::pair;

Lexicon::Lexicon() {}

Lexicon Lexicon::of_stream(std::istream& is, const Scoring::Weights& wt) {
    vector<Word> words;
    string line;
    while (std::getline(is, line)) {
        boost::optional<Word> w = Word::of_string(line);
        if (w) words.push_back(*w);
    }
    if (is.bad()) {
        throw Lexicon_load_error("Error reading word list");
    }

    Scoring::Corpus_stats stats = Scoring::Corpus_stats::of_words(words);
    Lexicon rv;
    for (const Word& w : words) {
        rv.scores[w.to_string()] = Scoring::score(w, stats, wt);
    }
    return rv;
}

Lexicon Lexicon::of_file(const string& filename, const Scoring::Weights& wt) {
    std::ifstream f(filename.c_str());
    if (!f.is_open()) {
        throw Lexicon_load_error("Can't open word list: " + filename);
    }
    Lexicon rv = of_stream(f, wt);
    Log::info() << "Loaded " << rv.size() << " words from " << filename;
    if (rv.empty()) {
        Log::warn() << "Word list " << filename << " has no five-letter words";
    }
    return rv;
}

Lexicon Lexicon::of_scores(const Score_map& scores) {
    Lexicon rv;
    rv.scores = scores;
    return rv;
}

bool Lexicon::contains(const string& word) const {
    return scores.count(word) > 0;
}

boost::optional<double> Lexicon::score_of(const string& word) const {
    auto it = scores.find(word);
    if (it == scores.end()) return boost::none;
    return it->second;
}

vector<pair<string, double>> Lexicon::top(size_t n, bool hardest) const {
    vector<pair<string, double>> v(scores.begin(), scores.end());
    std::stable_sort
        (v.begin(),
         v.end(),
         [hardest] (const pair<string, double>& lhs, const pair<string, double>& rhs) {
             if (lhs.second == rhs.second) return lhs.first < rhs.first;
             return hardest ? lhs.second > rhs.second : lhs.second < rhs.second;
         });
    if (v.size() > n) v.resize(n);
    return v;
}

void Lexicon::test() {
    std::stringstream source;
    source << "Crane\n"
           << "  nymph  \n"
           << "apple\r\n"
           << "toolong\n"
           << "abc\n"
           << "\n"
           << "fjord\n"
           << "CRANE\n"
           << "sp ry\n"
           << "qajaq\n";
    Lexicon lex = of_stream(source);

    std::stringstream output1;
    std::stringstream expected1;
    for (const auto& kv : lex.entries()) output1 << kv.first << " ";
    output1 << lex.size() << " " << lex.contains("crane") << lex.contains("Crane") << lex.contains("toolong");
    expected1 << "apple crane fjord nymph qajaq 5 100";

    std::string output1_str = output1.str();
    std::string expected1_str = expected1.str();
    if (output1_str != expected1_str) {
        throw std::runtime_error("Lexicon::test() 1 failed, got " + output1_str + ", but expected " + expected1_str);
    }

    // scoring twice gives the same numbers
    std::stringstream again;
    again << "Crane\n  nymph  \napple\r\ntoolong\nabc\n\nfjord\nCRANE\nsp ry\nqajaq\n";
    Lexicon lex2 = of_stream(again);
    if (lex2.entries() != lex.entries()) {
        throw std::runtime_error("Lexicon::test() 2 failed, scores are not deterministic");
    }

    Lexicon fixed = of_scores({{"bbbbb", 1.0}, {"aaaaa", 1.0}, {"ccccc", 3.0}, {"ddddd", 0.5}});
    std::stringstream output3;
    std::stringstream expected3;
    for (const auto& kv : fixed.top(3, true)) output3 << kv.first << ",";
    output3 << " ";
    for (const auto& kv : fixed.top(10, false)) output3 << kv.first << ",";
    expected3 << "ccccc,aaaaa,bbbbb, ddddd,aaaaa,bbbbb,ccccc,";

    std::string output3_str = output3.str();
    std::string expected3_str = expected3.str();
    if (output3_str != expected3_str) {
        throw std::runtime_error("Lexicon::test() 3 failed, got " + output3_str + ", but expected " + expected3_str);
    }

    bool threw = false;
    try {
        of_file("/nonexistent/wordstarter/words.txt");
    } catch (const Lexicon_load_error&) {
        threw = true;
    }
    if (!threw) {
        throw std::runtime_error("Lexicon::test() 4 failed, missing file did not throw");
    }
}
