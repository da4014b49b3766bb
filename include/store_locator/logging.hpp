// === Logging =================================================================
//
// Process-wide spdlog logger shared by every module. The console sink writes
// to stderr so stdout stays reserved for the search result. The rotating file
// sink writes one JSON object per line with the message as an escaped string.

#pragma once

#include <memory>
#include <string>

#include <spdlog/logger.h>

namespace store_locator {

inline constexpr char k_log_file_name[] = "store_locator.log";

std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory);

std::shared_ptr<spdlog::logger> get_logger();

void set_log_level(const std::string& str_level);

}  // namespace store_locator
