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
 * @file entropy.hpp
 * @brief Random-draw primitives used to compose identifiers.
 *
 * @details
 * Separates the source of randomness from the uniqueness bookkeeping in
 * `IdGenerator`. Production code draws from the operating system's secure random
 * device; tests substitute scripted sources to exercise failure and bias paths.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <stdexcept>
#include <string>

namespace controly::infra {

/**
 * @class EntropyError
 * @brief Raised when an entropy source cannot produce a value.
 */
class EntropyError : public std::runtime_error {
  public:
    explicit EntropyError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @class EntropySource
 * @brief Abstract producer of uniformly distributed 32-bit words.
 *
 * Implementations are not required to be thread-safe; `IdGenerator` serializes
 * access to the source it owns.
 */
class EntropySource {
  public:
    virtual ~EntropySource() = default;

    /**
     * @brief Draws one 32-bit word.
     * @throws EntropyError If the underlying source failed.
     */
    virtual std::uint32_t next() = 0;
};

/**
 * @class SystemEntropySource
 * @brief Entropy backed by `std::random_device`.
 *
 * On Linux the device reads from the kernel CSPRNG (`getrandom`/`/dev/urandom`),
 * so every word is suitable for unguessable tokens. Device failures, reported by
 * the standard library as `std::exception`, are rethrown as `EntropyError`.
 */
class SystemEntropySource : public EntropySource {
  public:
    SystemEntropySource();

    std::uint32_t next() override;

  private:
    std::random_device device_;
};

/**
 * @brief Draws an index uniformly distributed in `[0, bound)`.
 *
 * Uses rejection sampling: words in the tail `[limit, 2^32)`, where `limit` is the
 * largest multiple of @p bound not exceeding `2^32`, are discarded and redrawn, so
 * the final `% bound` carries no modulo bias.
 *
 * @param source The entropy source to draw from.
 * @param bound Exclusive upper bound; must be non-zero.
 * @return std::uint32_t The drawn index. A bound of 1 returns 0 without drawing.
 *
 * @throws std::invalid_argument If @p bound is zero.
 * @throws EntropyError Propagated from @p source.
 */
std::uint32_t uniform_index(EntropySource& source, std::uint32_t bound);

/**
 * @brief Composes a random string of @p length symbols drawn from @p alphabet.
 *
 * Each position is drawn independently through `uniform_index`.
 *
 * @throws std::invalid_argument If @p alphabet is empty.
 * @throws EntropyError Propagated from @p source.
 */
std::string random_string(std::size_t length, const std::string& alphabet, EntropySource& source);

} // namespace controly::infra
