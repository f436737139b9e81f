#pragma once

#include <random>
#include <string>
#include <utility>
#include <vector>
#include "global/errors.hpp"

/* Uniform sample of n elements without replacement, in random order.
Fisher-Yates shuffle stopped after n draws: every ordered n-subset of the input is equally likely.
With n == lines.size() the result is a uniform random permutation. */
template <class Gen>
std::vector<std::string> sample_without_replacement(
    std::vector<std::string> lines, long n, Gen& gen) {
    if (n < 0) {
        throw InvalidArgument("Sample size must be non-negative (got " + std::to_string(n) + ")");
    }
    if (static_cast<unsigned long>(n) > lines.size()) {
        throw InvalidArgument("Sample size " + std::to_string(n) + " exceeds the " +
                              std::to_string(lines.size()) + " available lines");
    }
    std::size_t size = n;
    for (std::size_t i = 0; i < size; i++) {
        std::uniform_int_distribution<std::size_t> draw(i, lines.size() - 1);
        std::swap(lines[i], lines[draw(gen)]);
    }
    lines.resize(size);
    return lines;
}
