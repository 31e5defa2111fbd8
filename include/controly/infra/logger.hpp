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
 * @file logger.hpp
 * @brief Thread-safe diagnostic logging facility for the Controly kernel.
 *
 * @details
 * Declares the `Logger` class, the single reporting channel used by the identifier
 * generator, the configuration loader and the command line tool. Output to
 * `stdout`/`stderr` is serialized so that lines from concurrent callers never interleave.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <string>

namespace controly::infra {

/**
 * @enum LogLevel
 * @brief Severity hierarchy for diagnostic messages.
 *
 * The ordering is significant: the minimum level filter and the stream routing
 * both compare levels numerically.
 */
enum class LogLevel {
    TRACE, ///< Per-attempt details of the generation loop.
    DEBUG, ///< Diagnostic information intended for development.
    INFO,  ///< Nominal operational events (startup, configuration in effect).
    WARN,  ///< Recoverable anomalies such as a failed entropy draw.
    ERROR, ///< Failures surfaced to the caller (saturation, bad config).
    FATAL  ///< Failures that end the process.
};

/**
 * @brief Parses a textual severity name.
 *
 * Accepts `trace`, `debug`, `info`, `warn`, `error` and `fatal`, case-insensitive.
 * `warning` is accepted as an alias of `warn`.
 *
 * @param text The name to parse.
 * @param out Receives the level on success; untouched on failure.
 * @return true If @p text named a known level.
 */
bool parse_log_level(const std::string& text, LogLevel& out);

/**
 * @class Logger
 * @brief A static utility class providing process-wide logging.
 *
 * @details
 * Messages below the configured minimum level are discarded before the lock is
 * taken. The minimum level defaults to `LogLevel::INFO`.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message to the console.
     *
     * The output includes a timestamp, the severity tag, and the payload.
     *
     * **Stream Routing Logic:**
     * - `TRACE`, `DEBUG`, `INFO`: Routed to `std::cout`.
     * - `WARN`, `ERROR`, `FATAL`: Routed to `std::cerr`.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * controly::infra::Logger::log(LogLevel::WARN, "IdGenerator: Entropy draw failed.");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /**
     * @brief Sets the minimum severity that will be written.
     */
    static void set_level(LogLevel level);

    /// @brief Returns the current minimum severity.
    static LogLevel level();

  private:
    /// @brief Guards `std::cout`/`std::cerr` against interleaved writes.
    static std::mutex mutex_;

    /// @brief Minimum severity; read on every call without locking.
    static std::atomic<LogLevel> min_level_;
};

} // namespace controly::infra
