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
 * @file config_test.cpp
 * @brief Unit tests for JSON generator configuration.
 *
 * @details
 * Verifies defaults, overrides, validation of generator parameters and the
 * guarantee that a rejected document leaves the caller's configuration intact.
 */

#include "controly/infra/config.hpp"
#include "framework.hpp"

#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

using controly::infra::GeneratorConfig;
using controly::infra::LogLevel;

/**
 * @class ConfigFileManager
 * @brief RAII owner of a temporary configuration file.
 */
class ConfigFileManager {
  public:
    const std::string path = "./config_test_generator.json";

    explicit ConfigFileManager(const std::string& contents)
    {
        std::ofstream file(path, std::ios::trunc);
        file << contents;
    }

    ~ConfigFileManager()
    {
        if (fs::exists(path)) {
            fs::remove(path);
        }
    }
};

void test_config_defaults()
{
    GeneratorConfig config = GeneratorConfig::defaults();
    ASSERT_EQ(config.alphabet, std::string("0123456789ABCDEFGHJKMNPQRSTUVWXYZ"));
    ASSERT_EQ(config.length, static_cast<size_t>(8));
    ASSERT_EQ(config.max_attempts, static_cast<size_t>(1000));
    ASSERT_TRUE(config.log_level == LogLevel::INFO);

    std::string reason;
    ASSERT_TRUE(config.validate(reason));
}

void test_config_display_preset()
{
    GeneratorConfig config = GeneratorConfig::display_ids();
    ASSERT_EQ(config.alphabet, std::string("123456789ABCDEFGHJKLMNPQRSTUVWXYZ"));
    ASSERT_EQ(config.length, static_cast<size_t>(8));
}

void test_config_parse_overrides()
{
    GeneratorConfig config;
    bool ok = GeneratorConfig::parse(
        R"({"alphabet": "abcdef", "length": 12, "max_attempts": 0, "log_level": "DEBUG"})",
        config);

    ASSERT_TRUE(ok);
    ASSERT_EQ(config.alphabet, std::string("abcdef"));
    ASSERT_EQ(config.length, static_cast<size_t>(12));
    ASSERT_EQ(config.max_attempts, static_cast<size_t>(0));
    ASSERT_TRUE(config.log_level == LogLevel::DEBUG);
}

/**
 * @brief Keys absent from the document keep the values already in the target.
 */
void test_config_parse_partial_keeps_defaults()
{
    GeneratorConfig config = GeneratorConfig::display_ids();
    ASSERT_TRUE(GeneratorConfig::parse(R"({"length": 10})", config));

    ASSERT_EQ(config.alphabet, std::string("123456789ABCDEFGHJKLMNPQRSTUVWXYZ"));
    ASSERT_EQ(config.length, static_cast<size_t>(10));
    ASSERT_EQ(config.max_attempts, static_cast<size_t>(1000));
}

void test_config_rejects_malformed_json()
{
    GeneratorConfig config;
    ASSERT_FALSE(GeneratorConfig::parse("{\"length\": ", config));
    ASSERT_FALSE(GeneratorConfig::parse("[1, 2, 3]", config));
    ASSERT_EQ(config.length, static_cast<size_t>(8));
}

/**
 * @brief Invalid values are rejected as a whole, with no partial update.
 */
void test_config_rejects_invalid_values()
{
    GeneratorConfig config;

    ASSERT_FALSE(GeneratorConfig::parse(R"({"length": 4, "alphabet": ""})", config));
    ASSERT_FALSE(GeneratorConfig::parse(R"({"alphabet": "ABCA"})", config));
    ASSERT_FALSE(GeneratorConfig::parse(R"({"length": 0})", config));
    ASSERT_FALSE(GeneratorConfig::parse(R"({"length": -3})", config));
    ASSERT_FALSE(GeneratorConfig::parse(R"({"length": 2.5})", config));
    ASSERT_FALSE(GeneratorConfig::parse(R"({"length": "8"})", config));
    ASSERT_FALSE(GeneratorConfig::parse(R"({"alphabet": 42})", config));
    ASSERT_FALSE(GeneratorConfig::parse(R"({"log_level": "verbose"})", config));

    ASSERT_EQ(config.alphabet, std::string("0123456789ABCDEFGHJKMNPQRSTUVWXYZ"));
    ASSERT_EQ(config.length, static_cast<size_t>(8));
}

/**
 * @brief Counts beyond `size_t` and lengths beyond `kMaxIdLength` are rejected.
 */
void test_config_rejects_out_of_range_counts()
{
    GeneratorConfig config;

    ASSERT_FALSE(GeneratorConfig::parse(R"({"length": 1e30})", config));
    ASSERT_FALSE(GeneratorConfig::parse(R"({"max_attempts": 1e30})", config));
    ASSERT_FALSE(GeneratorConfig::parse(R"({"length": 1e19})", config));
    ASSERT_FALSE(GeneratorConfig::parse(R"({"length": 257})", config));
    ASSERT_TRUE(GeneratorConfig::parse(R"({"length": 256})", config));
    ASSERT_EQ(config.length, controly::infra::kMaxIdLength);
}

void test_config_load_file()
{
    ConfigFileManager file(R"({"alphabet": "XYZ", "length": 5, "log_level": "warn"})");

    GeneratorConfig config;
    ASSERT_TRUE(GeneratorConfig::load(file.path, config));
    ASSERT_EQ(config.alphabet, std::string("XYZ"));
    ASSERT_EQ(config.length, static_cast<size_t>(5));
    ASSERT_TRUE(config.log_level == LogLevel::WARN);
}

void test_config_load_missing_file()
{
    GeneratorConfig config;
    ASSERT_FALSE(GeneratorConfig::load("./does_not_exist_generator.json", config));
    ASSERT_EQ(config.length, static_cast<size_t>(8));
}
