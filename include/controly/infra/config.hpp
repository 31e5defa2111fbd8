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
 * @file config.hpp
 * @brief JSON-backed configuration for identifier generators.
 *
 * @details
 * A configuration document is a JSON object; every key is optional and missing
 * keys keep their default value:
 *
 * @code
 * {
 *     "alphabet": "0123456789ABCDEFGHJKMNPQRSTUVWXYZ",
 *     "length": 8,
 *     "max_attempts": 1000,
 *     "log_level": "info"
 * }
 * @endcode
 */

#pragma once

#include "controly/infra/logger.hpp"

#include <cstddef>
#include <string>

namespace controly::infra {

/// @brief Reference alphabet: digits and uppercase letters without I, L, O and S.
inline constexpr const char* kDefaultAlphabet = "0123456789ABCDEFGHJKMNPQRSTUVWXYZ";

/// @brief Base58-like alphabet used for display IDs (no 0, O, I or l).
inline constexpr const char* kDisplayAlphabet = "123456789ABCDEFGHJKLMNPQRSTUVWXYZ";

inline constexpr std::size_t kDefaultIdLength = 8;
inline constexpr std::size_t kDefaultMaxAttempts = 1000;

/// @brief Longest identifier a generator accepts.
inline constexpr std::size_t kMaxIdLength = 256;

/**
 * @struct GeneratorConfig
 * @brief Parameters of an `IdGenerator` plus the log level of its host process.
 */
struct GeneratorConfig {
    std::string alphabet = kDefaultAlphabet;
    std::size_t length = kDefaultIdLength;
    std::size_t max_attempts = kDefaultMaxAttempts;
    LogLevel log_level = LogLevel::INFO;

    /// @brief The settings of the process-wide default generator.
    static GeneratorConfig defaults();

    /// @brief The settings used for display identifiers.
    static GeneratorConfig display_ids();

    /**
     * @brief Checks the generator parameters.
     *
     * The alphabet must be non-empty and free of repeated symbols, and the length
     * must lie in `[1, kMaxIdLength]`. `max_attempts` may be zero.
     *
     * @param reason Receives a human-readable explanation on failure.
     * @return true If the configuration can build a generator.
     */
    bool validate(std::string& reason) const;

    /**
     * @brief Parses a JSON document over a copy of @p out.
     *
     * @param text The JSON text.
     * @param out Receives the parsed configuration. Untouched if parsing fails.
     * @return true On success. Failures are logged at `ERROR`.
     */
    static bool parse(const std::string& text, GeneratorConfig& out);

    /**
     * @brief Reads and parses a JSON configuration file.
     *
     * @param path Filesystem path of the document.
     * @param out Receives the parsed configuration. Untouched if loading fails.
     * @return true On success. Failures are logged at `ERROR`.
     */
    static bool load(const std::string& path, GeneratorConfig& out);
};

} // namespace controly::infra
