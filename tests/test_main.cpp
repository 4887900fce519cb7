#include <gtest/gtest.h>
#include <filesystem>

#include "logging.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    // Components log through the shared logger; keep it quiet during tests
    const auto log_dir = std::filesystem::temp_directory_path() / "spot_backtester_test_logs";
    core::logging::initialize("spot_backtester_tests.log", spdlog::level::off, spdlog::level::off, log_dir.string());

    return RUN_ALL_TESTS();
}
