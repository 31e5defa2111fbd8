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
 * @file id_generator.cpp
 * @brief Implementation of the unique identifier generator.
 *
 * @details
 * Candidates come from `random_string` (rejection-sampled, bias-free). Uniqueness
 * is tracked in an in-memory set guarded by a reader-writer lock.
 */

#include "controly/infra/id_generator.hpp"

#include "controly/infra/logger.hpp"

#include <limits>
#include <mutex>
#include <stdexcept>

namespace controly::infra {

namespace {

GeneratorConfig make_config(std::string alphabet, std::size_t length, std::size_t max_attempts)
{
    GeneratorConfig config;
    config.alphabet = std::move(alphabet);
    config.length = length;
    config.max_attempts = max_attempts;
    return config;
}

const GeneratorConfig& checked(const GeneratorConfig& config)
{
    std::string reason;
    if (!config.validate(reason)) {
        throw std::invalid_argument("IdGenerator: " + reason);
    }
    return config;
}

} // namespace

const char* to_string(IdError error)
{
    switch (error) {
    case IdError::NONE:
        return "none";
    case IdError::ENTROPY_UNAVAILABLE:
        return "entropy_unavailable";
    case IdError::SATURATED:
        return "saturated";
    }
    return "unknown";
}

IdGenerator::IdGenerator(std::string alphabet, std::size_t length, std::size_t max_attempts,
                         std::shared_ptr<EntropySource> entropy)
    : IdGenerator(make_config(std::move(alphabet), length, max_attempts), std::move(entropy))
{
}

IdGenerator::IdGenerator(const GeneratorConfig& config, std::shared_ptr<EntropySource> entropy)
    : alphabet_(checked(config).alphabet), length_(config.length),
      max_attempts_(config.max_attempts), entropy_(std::move(entropy))
{
    if (!entropy_) {
        entropy_ = std::make_shared<SystemEntropySource>();
    }
}

IdResult IdGenerator::generate()
{
    std::unique_lock<std::shared_mutex> lock(lock_);
    return generate_locked(nullptr);
}

IdResult IdGenerator::generate_unique(const ExistenceChecker& is_taken)
{
    std::unique_lock<std::shared_mutex> lock(lock_);
    return generate_locked(is_taken ? &is_taken : nullptr);
}

/**
 * @brief The bounded attempt loop. Caller holds `lock_` exclusively.
 *
 * Every iteration consumes one attempt whether the draw failed or the candidate
 * collided, so the loop ends after at most `max_attempts_` iterations.
 */
IdResult IdGenerator::generate_locked(const ExistenceChecker* is_taken)
{
    std::size_t draws = 0;

    for (std::size_t attempt = 0; attempt < max_attempts_; ++attempt) {
        std::string candidate;
        try {
            candidate = random_string(length_, alphabet_, *entropy_);
        } catch (const EntropyError& e) {
            Logger::log(LogLevel::WARN, "IdGenerator: Failed to draw random ID (attempt " +
                                            std::to_string(attempt + 1) + "): " + e.what());
            continue;
        }
        ++draws;

        if (issued_.count(candidate) != 0) {
            continue;
        }
        if (is_taken && (*is_taken)(candidate)) {
            Logger::log(LogLevel::TRACE,
                        "IdGenerator: Candidate '" + candidate + "' is taken externally.");
            continue;
        }

        issued_.insert(candidate);
        return IdResult::success(std::move(candidate));
    }

    IdError error =
        (max_attempts_ > 0 && draws == 0) ? IdError::ENTROPY_UNAVAILABLE : IdError::SATURATED;
    Logger::log(LogLevel::ERROR, "IdGenerator: Failed to generate unique ID after " +
                                     std::to_string(max_attempts_) +
                                     " attempts (error=" + to_string(error) + ").");
    return IdResult::failure(error);
}

bool IdGenerator::exists(const std::string& id) const
{
    std::shared_lock<std::shared_mutex> lock(lock_);
    return issued_.count(id) != 0;
}

std::size_t IdGenerator::issued_count() const
{
    std::shared_lock<std::shared_mutex> lock(lock_);
    return issued_.size();
}

std::uint64_t IdGenerator::keyspace_size() const
{
    const std::uint64_t base = alphabet_.size();
    const std::uint64_t cap = std::numeric_limits<std::uint64_t>::max();

    std::uint64_t size = 1;
    for (std::size_t i = 0; i < length_; ++i) {
        if (base != 0 && size > cap / base) {
            return cap;
        }
        size *= base;
    }
    return size;
}

IdGenerator& default_generator()
{
    static IdGenerator instance(GeneratorConfig::defaults());
    return instance;
}

IdResult generate_id()
{
    return default_generator().generate();
}

bool id_exists(const std::string& id)
{
    return default_generator().exists(id);
}

} // namespace controly::infra
