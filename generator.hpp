#pragma once
#include <random>
#include <string>
#include <vector>
#include "equation.hpp"

namespace Generator {
    /* Where the generator gets its randomness from. Tests plug in sources that
       force a particular path (always succeeding, always rejected). */
    class Random_source {
    public:
        virtual ~Random_source() {};
        // uniform in [lo, hi], both inclusive
        virtual int uniform(int lo, int hi) = 0;
    };

    class Mt_random_source : public Random_source {
    public:
        // seeded from std::random_device
        Mt_random_source();
        explicit Mt_random_source(unsigned int seed);

        virtual int uniform(int lo, int hi);
    private:
        std::mt19937 engine;
    };

    const int max_attempts = 100;

    // known-valid answers, used once rejection sampling gives up
    extern const std::vector<std::string> fallback_pool;

    // One round of rejection sampling. Returns false if the draw was rejected,
    // [out] is then untouched.
    bool try_generate(Random_source& rng, std::string& out);

    // Retries try_generate up to [attempts] times then falls back to the pool.
    // [attempts_used] (if non-null) gets the number of draws, or -1 when the
    // fallback pool was used.
    Equation generate(Random_source& rng, int attempts = max_attempts, int* attempts_used = nullptr);

    void test();
}
