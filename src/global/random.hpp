#pragma once

#include <random>

using generator_t = std::mt19937;

/* Seed used by make_generator: the given one, or one drawn from system
entropy when seed is -1 */
inline unsigned int resolve_seed(int seed = -1) {
    if (seed == -1) {
        std::random_device rd;
        return rd();
    }
    return static_cast<unsigned int>(seed);
}

inline generator_t make_generator(int seed = -1) { return generator_t(resolve_seed(seed)); }
