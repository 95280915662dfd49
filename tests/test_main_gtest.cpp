/**
 * @file test_main_gtest.cpp
 * @brief Main entry point for GTest test suite
 */

#include <gtest/gtest.h>
#include <iostream>
#include <string>

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);

    // Calibration overrides report on std::cerr; keep test logs quiet
    // unless asked for with --verbose
    bool verbose = false;
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--verbose") {
            verbose = true;
        }
    }
    std::streambuf* cerr_buf = std::cerr.rdbuf();
    if (!verbose) {
        std::cerr.rdbuf(nullptr);
    }

    int result = RUN_ALL_TESTS();

    std::cerr.rdbuf(cerr_buf);
    return result;
}
