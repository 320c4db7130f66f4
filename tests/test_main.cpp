/**
 * @file test_main.cpp
 * @brief Catch2 runner with quiet logging
 */

#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <splice/core/logger.hpp>

int main(int argc, char* argv[]) {
    spl::initLogging("splice-tests", spdlog::level::warn);
    return Catch::Session().run(argc, argv);
}
