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
 * @file main.cpp
 * @brief Entry point of `controly-idgen`.
 *
 * @details
 * Prints a batch of identifiers to stdout, one per line. See `controly/app/idgen.hpp`.
 */

#include "controly/app/idgen.hpp"
#include "controly/infra/logger.hpp"

#include <iostream>

int main(int argc, char* argv[])
{
    controly::infra::Logger::set_level(controly::infra::LogLevel::WARN);
    return controly::app::idgen_main(argc, argv, std::cout, std::cerr);
}
