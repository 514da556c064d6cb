/* Weighted random choice of an unused word. Each remaining word gets weight
   (max(score, 0) + 1e-6) ^ alpha and one word is drawn with probability
   proportional to its weight. Bigger alpha leans harder towards high scores.
*/

#pragma once
#include <set>
#include <string>
#include <vector>
#include <random>
#include <boost/optional.hpp>
#include "lexicon.hpp"

namespace Sampler {
    const double default_alpha = 2.0;

    // Source of uniform doubles in [0, 1).
    class Random_source {
    public:
        virtual ~Random_source() {};
        virtual double uniform() = 0;
    };

    // Mersenne twister seeded from std::random_device, nothing reproducible.
    class System_random : public Random_source {
    public:
        System_random();
        virtual double uniform();
    private:
        std::mt19937_64 engine;
        std::uniform_real_distribution<double> dist;
    };

    // Replays [values] in order, then starts over. For tests.
    class Sequence_random : public Random_source {
    public:
        Sequence_random(const std::vector<double>& values);
        virtual double uniform();
    private:
        std::vector<double> values;
        size_t next;
    };

    // boost::none when no word survives the exclusion and weight filters
    boost::optional<std::string> pick_weighted(const Lexicon& lexicon,
                                               const std::set<std::string>& exclude,
                                               double alpha,
                                               Random_source& rng);

    void test();
}
