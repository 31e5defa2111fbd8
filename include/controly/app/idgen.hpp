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
 * @file idgen.hpp
 * @brief Argument handling and run loop of the `controly-idgen` tool.
 *
 * @details
 * `main` only forwards to `idgen_main`. Keeping the logic here, with output
 * written to caller-supplied streams, lets the test suite check exit codes and
 * printed identifiers without spawning a process.
 */

#pragma once

#include <ostream>
#include <string>

namespace controly::app {

/**
 * @struct IdgenOptions
 * @brief Parsed command line of `controly-idgen`.
 */
struct IdgenOptions {
    std::string config_path; ///< Empty when no `--config` was given.
    bool display = false;    ///< Start from the display ID preset.
    long count = 1;          ///< Identifiers to print.
    bool help = false;       ///< `--help` was requested.
};

/**
 * @brief Parses the command line.
 *
 * @param argc Argument count, including the program name.
 * @param argv Argument vector.
 * @param out Receives the parsed options.
 * @param error Receives a message when parsing fails.
 * @return false On an unknown flag, a flag missing its value, or a `--count`
 * that is not a non-negative integer.
 */
bool parse_idgen_args(int argc, const char* const argv[], IdgenOptions& out, std::string& error);

/// @brief Writes usage instructions to @p out.
void print_idgen_help(const char* binary_name, std::ostream& out);

/**
 * @brief Builds the generator described by @p options and prints identifiers.
 *
 * Applies the configured log level to the Logger.
 *
 * @return int 0 on success, 1 on an invalid config or a generation failure.
 */
int run_idgen(const IdgenOptions& options, std::ostream& out, std::ostream& err);

/**
 * @brief Full tool entry point: parse, then run.
 *
 * Any exception escaping generator construction is logged at `FATAL` and
 * reported as exit code 1.
 */
int idgen_main(int argc, const char* const argv[], std::ostream& out, std::ostream& err);

} // namespace controly::app
