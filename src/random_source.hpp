#pragma once
/*
RandomSource: seedable uniform sampler shared by mine placement and the
fallback random move. Seed 0 draws a seed from the clock; the seed in use is
kept so a game can be replayed.
*/

#include <chrono>
#include <cstdint>
#include <iterator>
#include <random>
#include <stdexcept>

class RandomSource {
    private:
        uint64_t seed_used;
        std::mt19937_64 engine;

        static uint64_t clock_seed() {
            return static_cast<uint64_t>(
                std::chrono::high_resolution_clock::now().time_since_epoch().count());
        }

    public:
        explicit RandomSource(uint64_t seed = 0)
            : seed_used(seed != 0 ? seed : clock_seed()), engine(seed_used) {}

        uint64_t seed() const { return seed_used; }

        // Uniform integer in [lo, hi].
        int uniform_int(int lo, int hi) {
            std::uniform_int_distribution<int> dist(lo, hi);
            return dist(engine);
        }

        // Uniform element of a non-empty sized container.
        template<typename Container>
        const typename Container::value_type& pick(const Container& items) {
            if (items.empty())
                throw std::invalid_argument("RandomSource::pick: empty container");
            auto it = items.begin();
            std::advance(it, uniform_int(0, static_cast<int>(items.size()) - 1));
            return *it;
        }
};
