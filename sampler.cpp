#include <cmath>
#include <sstream>
#include <algorithm>
#include "sampler.hpp"

using std::string;
using std::vector;
using std::set;

namespace Sampler {
    static const double eps = 1e-6;

    System_random::System_random() : dist(0.0, 1.0) {
        std::random_device rd;
        std::seed_seq seq{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
        engine.seed(seq);
    }

    double System_random::uniform() {
        return dist(engine);
    }

    Sequence_random::Sequence_random(const vector<double>& values_) : values(values_), next(0) {
        if (values.empty()) throw std::runtime_error("Sequence_random needs at least one value");
    }

    double Sequence_random::uniform() {
        double v = values[next];
        next = (next + 1) % values.size();
        return v;
    }

    boost::optional<string> pick_weighted(const Lexicon& lexicon,
                                          const set<string>& exclude,
                                          double alpha,
                                          Random_source& rng) {
        vector<const string*> keys;
        vector<double> cumulative;
        keys.reserve(lexicon.size());
        cumulative.reserve(lexicon.size());

        double total = 0.0;
        for (const auto& kv : lexicon.entries()) {
            if (exclude.count(kv.first)) continue;
            double wt = std::pow(std::max(kv.second, 0.0) + eps, alpha);
            if (!std::isfinite(wt) || wt <= 0.0) continue;
            total += wt;
            keys.push_back(&kv.first);
            cumulative.push_back(total);
        }
        if (keys.empty() || !std::isfinite(total)) return boost::none;

        double target = rng.uniform() * total;
        size_t idx = std::upper_bound(cumulative.begin(), cumulative.end(), target) - cumulative.begin();
        // uniform() < 1, but rounding can still put target on the last boundary
        if (idx >= keys.size()) idx = keys.size() - 1;
        return *keys[idx];
    }

    void test() {
        Lexicon lex = Lexicon::of_scores({{"aaaaa", 10.0}, {"bbbbb", 1.0}, {"ccccc", -4.0}});

        // weights: aaaaa ~100, bbbbb ~1, ccccc 1e-12 (negative score clamped to 0)
        std::stringstream output1;
        std::stringstream expected1;
        Sequence_random seq({0.0, 0.5, 0.995, 0.9999999});
        for (int i = 0; i < 4; i++) {
            boost::optional<string> w = pick_weighted(lex, set<string>(), 2.0, seq);
            output1 << (w ? *w : string("-")) << ",";
        }
        expected1 << "aaaaa,aaaaa,bbbbb,bbbbb,";

        std::string output1_str = output1.str();
        std::string expected1_str = expected1.str();
        if (output1_str != expected1_str) {
            throw std::runtime_error("Sampler::test() 1 failed, got " + output1_str + ", but expected " + expected1_str);
        }

        // excluded words are never drawn, whatever the random value
        Sequence_random sweep({0.0, 0.1, 0.3, 0.5, 0.7, 0.9, 0.99, 0.999999});
        for (int i = 0; i < 8; i++) {
            boost::optional<string> w = pick_weighted(lex, {"aaaaa"}, 2.0, sweep);
            if (!w || *w == "aaaaa") throw std::runtime_error("Sampler::test() 2 failed, excluded word drawn");
        }
        for (int i = 0; i < 8; i++) {
            boost::optional<string> w = pick_weighted(lex, {"aaaaa", "bbbbb"}, 2.0, sweep);
            if (!w || *w != "ccccc") throw std::runtime_error("Sampler::test() 3 failed, expected the only candidate");
        }

        // nothing left
        if (pick_weighted(lex, {"aaaaa", "bbbbb", "ccccc"}, 2.0, sweep)) {
            throw std::runtime_error("Sampler::test() 4 failed, everything excluded but got a word");
        }
        if (pick_weighted(Lexicon(), set<string>(), 2.0, sweep)) {
            throw std::runtime_error("Sampler::test() 5 failed, empty lexicon but got a word");
        }
        // a weight that overflows is dropped, not drawn
        Lexicon huge = Lexicon::of_scores({{"aaaaa", 1e300}});
        if (pick_weighted(huge, set<string>(), 2.0, sweep)) {
            throw std::runtime_error("Sampler::test() 6 failed, infinite weight should be discarded");
        }

        // high scores win far more often than half the time
        Lexicon two = Lexicon::of_scores({{"aaaaa", 10.0}, {"bbbbb", 1.0}});
        System_random rng;
        int a_count = 0;
        const int draws = 10000;
        for (int i = 0; i < draws; i++) {
            boost::optional<string> w = pick_weighted(two, set<string>(), default_alpha, rng);
            if (w && *w == "aaaaa") a_count++;
        }
        // expected share is 100/101
        if (a_count < draws * 0.9) {
            throw std::runtime_error("Sampler::test() 7 failed, aaaaa drawn only " + std::to_string(a_count) + " times");
        }
    }
}
