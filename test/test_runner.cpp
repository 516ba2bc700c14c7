// test/test_runner.cpp
// -----------------------------------------------------------
// Google Test entry point for the MediGuard chain unit tests (test/unit/*.cpp).

#include <gtest/gtest.h>

#include "util/logger.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    // Keep test output readable; failures are reported by gtest.
    mediguard::util::logger::setLogLevel(mediguard::util::logger::LogLevel::ERROR);

    return RUN_ALL_TESTS();
}
