/**
 * @file test_main.cpp
 * @brief Entry point of the Homog Coefficients unit tests
 */

#include <gtest/gtest.h>

#include "Homog/Core/HomogConfig.h"
#include "Homog/Core/Logger.h"

#include <chrono>
#include <cstring>
#include <iostream>

namespace {

// Library log output is muted unless --verbose is given; tests that check
// log records install their own handlers.
class CoefficientsTestEnvironment : public ::testing::Environment {
public:
    explicit CoefficientsTestEnvironment(bool verbose) : verbose_(verbose) {}

    void SetUp() override {
        std::cout << "========================================\n"
                  << "mshc::Homog Coefficients unit tests (v"
                  << mshc::Homog::config::version_string() << ")\n"
                  << "========================================\n";
        mshc::Homog::Logger::instance().set_console_output(verbose_);
        start_ = std::chrono::steady_clock::now();
    }

    void TearDown() override {
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_);
        std::cout << "========================================\n"
                  << "Coefficients tests finished in " << ms.count() << " ms\n"
                  << "========================================\n";
    }

private:
    bool verbose_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    bool verbose = false;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--help") == 0) {
            std::cout << "Usage: " << argv[0] << " [--verbose] [gtest options]\n"
                      << "  --verbose               Print library log output\n"
                      << "  --gtest_filter=PATTERN  Run only tests matching pattern\n";
            return 0;
        }
        if (std::strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        }
    }

    ::testing::AddGlobalTestEnvironment(new CoefficientsTestEnvironment(verbose));
    return RUN_ALL_TESTS();
}
