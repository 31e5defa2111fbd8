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
 * @file id_generator.hpp
 * @brief Short, human-friendly, collision-free identifier generation.
 *
 * @details
 * This file declares the `IdGenerator` class, which issues fixed-length random
 * tokens (e.g. `7KQ2M9XA`) for sessions, displays and devices. Every instance
 * remembers the identifiers it has handed out and never returns the same value
 * twice. When a unique value cannot be produced within the retry budget the
 * failure is reported through `IdResult` instead of an empty string.
 */

#pragma once

#include "controly/infra/config.hpp"
#include "controly/infra/entropy.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_set>
#include <utility>

namespace controly::infra {

/**
 * @enum IdError
 * @brief Reasons why an identifier could not be issued.
 */
enum class IdError {
    NONE,                ///< Success.
    ENTROPY_UNAVAILABLE, ///< Every attempt failed to draw from the entropy source.
    SATURATED            ///< The retry budget ran out without finding an unused value.
};

/// @brief Stable name of an error code for logs and CLI output.
const char* to_string(IdError error);

/**
 * @struct IdResult
 * @brief Outcome of a generation call: an identifier or an error, never both.
 */
struct IdResult {
    std::string id;
    IdError error = IdError::NONE;

    bool ok() const { return error == IdError::NONE; }
    explicit operator bool() const { return ok(); }

    static IdResult success(std::string id) { return IdResult{std::move(id), IdError::NONE}; }
    static IdResult failure(IdError error) { return IdResult{std::string(), error}; }
};

/**
 * @brief External predicate reporting whether an identifier is already taken
 * (for instance by a repository of live displays).
 */
using ExistenceChecker = std::function<bool(const std::string&)>;

/**
 * @class IdGenerator
 * @brief Issues identifiers unique within the lifetime of the instance.
 *
 * @details
 * **Thread Safety:** All public methods may be called concurrently. Generation
 * holds the instance lock exclusively for the whole attempt loop, so the
 * duplicate check and the insertion into the issued set are one indivisible
 * step. Membership queries take the lock shared.
 *
 * The issued set only grows. It is sized for a working set that stays small
 * relative to `keyspace_size()`.
 */
class IdGenerator {
  public:
    /**
     * @brief Builds a generator.
     *
     * @param alphabet Distinct single-byte symbols; must be non-empty.
     * @param length Symbols per identifier; must lie in `[1, kMaxIdLength]`.
     * @param max_attempts Upper bound on draws per call; 0 makes every call fail.
     * @param entropy Random source; `nullptr` selects `SystemEntropySource`.
     *
     * @throws std::invalid_argument If the alphabet or length is invalid.
     */
    explicit IdGenerator(std::string alphabet, std::size_t length = kDefaultIdLength,
                         std::size_t max_attempts = kDefaultMaxAttempts,
                         std::shared_ptr<EntropySource> entropy = nullptr);

    /**
     * @brief Builds a generator from a validated configuration.
     * @throws std::invalid_argument If @p config does not validate.
     */
    explicit IdGenerator(const GeneratorConfig& config,
                         std::shared_ptr<EntropySource> entropy = nullptr);

    IdGenerator(const IdGenerator&) = delete;
    IdGenerator& operator=(const IdGenerator&) = delete;

    /**
     * @brief Issues a fresh identifier.
     *
     * Draws up to `max_attempts()` candidates. A failed entropy draw is logged at
     * `WARN` and consumes an attempt. The first candidate not yet issued is
     * recorded and returned.
     *
     * @return IdResult The identifier, or `ENTROPY_UNAVAILABLE` if no draw ever
     * succeeded, or `SATURATED` otherwise. Failures are logged at `ERROR`.
     *
     * @code
     * controly::infra::IdGenerator sessions(controly::infra::kDefaultAlphabet);
     * auto result = sessions.generate();
     * if (!result) {
     *     // result.error tells the caller whether to enlarge the keyspace.
     * }
     * @endcode
     */
    IdResult generate();

    /**
     * @brief Issues an identifier that is also free according to @p is_taken.
     *
     * A candidate rejected by the checker counts as a collision. The checker runs
     * under the instance lock and must not call back into this generator.
     */
    IdResult generate_unique(const ExistenceChecker& is_taken);

    /// @brief True if this instance has issued @p id.
    bool exists(const std::string& id) const;

    /// @brief Number of identifiers issued so far.
    std::size_t issued_count() const;

    /**
     * @brief Number of distinct identifiers: `alphabet().size() ^ length()`.
     *
     * Saturates at `UINT64_MAX` for keyspaces that do not fit in 64 bits.
     */
    std::uint64_t keyspace_size() const;

    const std::string& alphabet() const { return alphabet_; }
    std::size_t length() const { return length_; }
    std::size_t max_attempts() const { return max_attempts_; }

  private:
    IdResult generate_locked(const ExistenceChecker* is_taken);

    const std::string alphabet_;
    const std::size_t length_;
    const std::size_t max_attempts_;

    /// @brief Only drawn from while `lock_` is held exclusively.
    std::shared_ptr<EntropySource> entropy_;

    mutable std::shared_mutex lock_;
    std::unordered_set<std::string> issued_;
};

/**
 * @brief The process-wide generator with the reference settings.
 *
 * Created on first use. New code should prefer constructing its own generator
 * and passing it to collaborators.
 */
IdGenerator& default_generator();

/// @brief `default_generator().generate()`.
IdResult generate_id();

/// @brief `default_generator().exists(id)`.
bool id_exists(const std::string& id);

} // namespace controly::infra
