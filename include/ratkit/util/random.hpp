#pragma once

#include <cstddef>
#include <cstdint>
#include <random>

#include <ratkit/core/bigint.hpp>
#include <ratkit/core/rational.hpp>

namespace ratkit::util {

// Uniform value built from `word_count` random 32-bit words.
inline ratkit::core::bigint random_bigint(std::mt19937_64& generator,
                                          std::size_t word_count,
                                          bool allow_negative = true) {
    if (word_count == 0) {
        return ratkit::core::bigint(0);
    }
    static std::uniform_int_distribution<std::uint32_t> word_dist;
    ratkit::core::bigint value;
    for (std::size_t index = 0; index < word_count; ++index) {
        value <<= 32;
        value += word_dist(generator);
    }
    if (allow_negative) {
        static std::bernoulli_distribution sign_dist(0.5);
        if (sign_dist(generator)) {
            value = -value;
        }
    }
    return value;
}

// Random signed value, not reduced. The denominator is never zero.
inline ratkit::core::rational random_rational(std::mt19937_64& generator,
                                              std::size_t word_count) {
    ratkit::core::bigint numerator = random_bigint(generator, word_count);
    ratkit::core::bigint denominator = random_bigint(generator, word_count);
    if (denominator.is_zero()) {
        denominator = 1;
    }
    return ratkit::core::rational::from_bigint(numerator, denominator);
}

// Small operands so that common factors, zeros and equal values show up often.
inline ratkit::core::rational random_small_rational(std::mt19937_64& generator) {
    static std::uniform_int_distribution<std::int64_t> numerator_dist(-24, 24);
    static std::uniform_int_distribution<std::int64_t> denominator_dist(1, 24);
    static std::bernoulli_distribution flip_dist(0.5);
    std::int64_t denominator = denominator_dist(generator);
    if (flip_dist(generator)) {
        denominator = -denominator;
    }
    return ratkit::core::rational::from_int(numerator_dist(generator), denominator);
}

} // namespace ratkit::util
