// === Command Line ============================================================
//
// Parses the store_locator argument vector:
//
//   store_locator (--address <text> | --zip <code>) [--units mi|km] [--output text|json]
//
// Exactly one of --address/--zip is required. Values may follow as the next
// argument or be attached with '='.

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "store_locator/types.hpp"

namespace store_locator {

/** @brief Validated command-line request. */
struct CommandLineOptions final {
    std::optional<std::string> address{};            /**< Free-text street address. */
    std::optional<std::string> zip_code{};           /**< Postal code. */
    UnitSystem units{UnitSystem::Miles};             /**< Distance unit for the report. */
    OutputFormat output_format{OutputFormat::Text};  /**< Presentation of the result. */
    bool show_help{};                                /**< Print usage and exit without searching. */
    bool no_arguments{};                             /**< Invoked bare; usage is printed and the exit status is 1. */

    /** @brief Whichever of address or zip code was supplied. */
    [[nodiscard]] const std::string& search_location() const;
};

/**
 * @brief Parse arguments (excluding the program name).
 *
 * @throws UsageError for unknown options, missing values, invalid choices, or
 *         when not exactly one of --address/--zip is given.
 */
[[nodiscard]] CommandLineOptions parse_command_line(const std::vector<std::string>& args);

/** @brief Convenience overload for `main`. */
[[nodiscard]] CommandLineOptions parse_command_line(int argc, const char* const argv[]);

/** @brief Usage banner listing every option. */
[[nodiscard]] std::string usage_text(std::string_view program_name);

}  // namespace store_locator
