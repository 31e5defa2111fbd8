/*
 * CONTROLY PROJECT LICENSE
 * Version 1.0, October 2026
 *
 * Copyright (c) 2026 simbafs and the Controly contributors.
 * Official Repository: Controly (https://github.com/simbafs/controly)
 *
 * This source code is licensed under the Controly Project License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file entropy.cpp
 * @brief Secure random source and bias-free bounded sampling.
 */

#include "controly/infra/entropy.hpp"

#include <limits>

namespace controly::infra {

SystemEntropySource::SystemEntropySource() = default;

std::uint32_t SystemEntropySource::next()
{
    try {
        // random_device::result_type is unsigned int; a 32-bit word on every supported target.
        return static_cast<std::uint32_t>(device_());
    } catch (const std::exception& e) {
        throw EntropyError(std::string("random device failure: ") + e.what());
    }
}

/**
 * @brief Rejection-sampled bounded draw.
 *
 * Implementation Strategy:
 * 1. **Acceptance Window**: `2^32 % bound` words at the top of the range would map
 *    onto the low indices one extra time; they are rejected.
 * 2. **Reduction**: Any accepted word is reduced with `% bound`.
 *
 * The expected number of draws is below 2 for every bound.
 */
std::uint32_t uniform_index(EntropySource& source, std::uint32_t bound)
{
    if (bound == 0) {
        throw std::invalid_argument("uniform_index: bound must be non-zero");
    }
    if (bound == 1) {
        return 0;
    }

    // (2^32 - bound) % bound == 2^32 % bound, computed without 64-bit arithmetic.
    const std::uint32_t tail = (std::numeric_limits<std::uint32_t>::max() - bound + 1) % bound;
    const std::uint32_t limit = std::numeric_limits<std::uint32_t>::max() - tail;

    std::uint32_t word = source.next();
    while (word > limit) {
        word = source.next();
    }
    return word % bound;
}

std::string random_string(std::size_t length, const std::string& alphabet, EntropySource& source)
{
    if (alphabet.empty()) {
        throw std::invalid_argument("random_string: alphabet must not be empty");
    }

    const auto bound = static_cast<std::uint32_t>(alphabet.size());
    std::string out;
    out.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        out.push_back(alphabet[uniform_index(source, bound)]);
    }
    return out;
}

} // namespace controly::infra
