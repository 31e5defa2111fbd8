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
 * @file config.cpp
 * @brief cJSON-based loader for `GeneratorConfig`.
 */

#include "controly/infra/config.hpp"

#include <cJSON.h>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <unordered_set>

namespace controly::infra {

namespace {

/**
 * @brief Reads a non-negative integral field.
 *
 * @return false If the field exists but is not a whole, non-negative number.
 */
bool read_count(const cJSON* root, const char* key, std::size_t& out)
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(root, key);
    if (!item) {
        return true;
    }
    if (!cJSON_IsNumber(item)) {
        Logger::log(LogLevel::ERROR,
                    "Config: Field '" + std::string(key) + "' must be a number.");
        return false;
    }
    double value = item->valuedouble;
    if (value < 0 || std::floor(value) != value) {
        Logger::log(LogLevel::ERROR, "Config: Field '" + std::string(key) +
                                         "' must be a non-negative integer.");
        return false;
    }
    // SIZE_MAX converts to 2^64; nothing at or above it survives the cast.
    if (value >= static_cast<double>(std::numeric_limits<std::size_t>::max())) {
        Logger::log(LogLevel::ERROR,
                    "Config: Field '" + std::string(key) + "' is out of range.");
        return false;
    }
    out = static_cast<std::size_t>(value);
    return true;
}

bool read_string(const cJSON* root, const char* key, std::string& out)
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(root, key);
    if (!item) {
        return true;
    }
    if (!cJSON_IsString(item) || item->valuestring == nullptr) {
        Logger::log(LogLevel::ERROR,
                    "Config: Field '" + std::string(key) + "' must be a string.");
        return false;
    }
    out = item->valuestring;
    return true;
}

} // namespace

GeneratorConfig GeneratorConfig::defaults()
{
    return GeneratorConfig{};
}

GeneratorConfig GeneratorConfig::display_ids()
{
    GeneratorConfig config;
    config.alphabet = kDisplayAlphabet;
    return config;
}

bool GeneratorConfig::validate(std::string& reason) const
{
    if (alphabet.empty()) {
        reason = "alphabet must not be empty";
        return false;
    }

    std::unordered_set<char> seen;
    for (char c : alphabet) {
        if (!seen.insert(c).second) {
            reason = std::string("alphabet repeats symbol '") + c + "'";
            return false;
        }
    }

    if (length == 0) {
        reason = "length must be at least 1";
        return false;
    }
    if (length > kMaxIdLength) {
        reason = "length must not exceed " + std::to_string(kMaxIdLength);
        return false;
    }
    return true;
}

/**
 * @brief Parses a configuration document.
 *
 * Parsing happens on a scratch copy so that a document rejected halfway through
 * leaves the caller's configuration intact.
 */
bool GeneratorConfig::parse(const std::string& text, GeneratorConfig& out)
{
    cJSON* root = cJSON_Parse(text.c_str());
    if (!root) {
        Logger::log(LogLevel::ERROR, "Config: Malformed JSON document.");
        return false;
    }
    if (!cJSON_IsObject(root)) {
        Logger::log(LogLevel::ERROR, "Config: Top-level value must be an object.");
        cJSON_Delete(root);
        return false;
    }

    GeneratorConfig scratch = out;
    std::string level_name;
    bool ok = read_string(root, "alphabet", scratch.alphabet) &&
              read_count(root, "length", scratch.length) &&
              read_count(root, "max_attempts", scratch.max_attempts) &&
              read_string(root, "log_level", level_name);
    cJSON_Delete(root);

    if (!ok) {
        return false;
    }

    if (!level_name.empty() && !parse_log_level(level_name, scratch.log_level)) {
        Logger::log(LogLevel::ERROR, "Config: Unknown log level '" + level_name + "'.");
        return false;
    }

    std::string reason;
    if (!scratch.validate(reason)) {
        Logger::log(LogLevel::ERROR, "Config: Invalid generator settings: " + reason + ".");
        return false;
    }

    out = scratch;
    return true;
}

bool GeneratorConfig::load(const std::string& path, GeneratorConfig& out)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        Logger::log(LogLevel::ERROR, "Config: Cannot open '" + path + "'.");
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    Logger::log(LogLevel::DEBUG, "Config: Loading generator settings from '" + path + "'.");
    return parse(buffer.str(), out);
}

} // namespace controly::infra
