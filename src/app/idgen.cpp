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
 * @file idgen.cpp
 * @brief Implementation of the `controly-idgen` command.
 */

#include "controly/app/idgen.hpp"

#include "controly/infra/config.hpp"
#include "controly/infra/id_generator.hpp"
#include "controly/infra/logger.hpp"

#include <stdexcept>

namespace controly::app {

using infra::GeneratorConfig;
using infra::IdGenerator;
using infra::Logger;
using infra::LogLevel;

namespace {

bool parse_count(const std::string& text, long& out)
{
    try {
        std::size_t consumed = 0;
        long value = std::stol(text, &consumed);
        if (consumed != text.size() || value < 0) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::logic_error&) {
        // std::invalid_argument and std::out_of_range from std::stol.
        return false;
    }
}

} // namespace

bool parse_idgen_args(int argc, const char* const argv[], IdgenOptions& out, std::string& error)
{
    IdgenOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help") {
            options.help = true;
        } else if (arg == "--display") {
            options.display = true;
        } else if (arg == "--config" && i + 1 < argc) {
            options.config_path = argv[++i];
        } else if (arg == "--count" && i + 1 < argc) {
            std::string value = argv[++i];
            if (!parse_count(value, options.count)) {
                error = "--count must be a non-negative integer, got '" + value + "'";
                return false;
            }
        } else {
            error = "Unknown or incomplete argument: " + arg;
            return false;
        }
    }

    out = options;
    return true;
}

void print_idgen_help(const char* binary_name, std::ostream& out)
{
    out << "Usage: " << binary_name << " [--config PATH] [--count N] [--display]\n"
        << "Options:\n"
        << "  --config PATH  JSON file with alphabet, length, max_attempts, log_level\n"
        << "  --count N      Number of identifiers to print (Default: 1)\n"
        << "  --display      Use the display ID alphabet instead of the default one\n"
        << "  --help         Show this help message\n";
}

int run_idgen(const IdgenOptions& options, std::ostream& out, std::ostream& err)
{
    GeneratorConfig config =
        options.display ? GeneratorConfig::display_ids() : GeneratorConfig::defaults();

    // Identifiers go to stdout; keep INFO chatter out of it unless asked for.
    config.log_level = LogLevel::WARN;
    if (!options.config_path.empty() && !GeneratorConfig::load(options.config_path, config)) {
        err << "Invalid configuration: " << options.config_path << "\n";
        return 1;
    }
    Logger::set_level(config.log_level);

    IdGenerator generator(config);
    Logger::log(LogLevel::INFO, "System: Generator ready (alphabet=" + generator.alphabet() +
                                    ", length=" + std::to_string(generator.length()) +
                                    ", keyspace=" + std::to_string(generator.keyspace_size()) +
                                    ").");

    for (long i = 0; i < options.count; ++i) {
        auto result = generator.generate();
        if (!result) {
            err << "Generation failed: " << infra::to_string(result.error) << "\n";
            return 1;
        }
        out << result.id << "\n";
    }
    return 0;
}

int idgen_main(int argc, const char* const argv[], std::ostream& out, std::ostream& err)
{
    const char* binary_name = argc > 0 ? argv[0] : "controly-idgen";

    IdgenOptions options;
    std::string error;
    if (!parse_idgen_args(argc, argv, options, error)) {
        err << error << "\n";
        print_idgen_help(binary_name, err);
        return 1;
    }
    if (options.help) {
        print_idgen_help(binary_name, out);
        return 0;
    }

    try {
        return run_idgen(options, out, err);
    } catch (const std::exception& e) {
        Logger::log(LogLevel::FATAL, "System: Critical Failure: " + std::string(e.what()));
        return 1;
    }
}

} // namespace controly::app
