#pragma once

#include "store_locator/logging.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>

namespace store_locator::test {

inline std::filesystem::path test_log_directory() {
    return std::filesystem::temp_directory_path() / "store_locator_tests_logs";
}

inline void ensure_logger_initialized() {
    static const std::shared_ptr<spdlog::logger> logger_handle = []() {
        return store_locator::initialize_logger(test_log_directory().string());
    }();
    (void)logger_handle;
}

/** @brief Entire contents of the test log file after flushing the logger. */
inline std::string read_log_file() {
    store_locator::get_logger()->flush();
    std::ifstream file(test_log_directory() / store_locator::k_log_file_name);
    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

/** @brief Path of a file under tests/data. */
inline std::filesystem::path test_data_path(const std::string& file_name) {
    return std::filesystem::path{STORE_LOCATOR_TEST_DATA_DIR} / file_name;
}

}  // namespace store_locator::test
