#include "store_locator/command_line.hpp"

#include <stdexcept>

#include <fmt/format.h>

#include "store_locator/errors.hpp"
#include "store_locator/version.hpp"

namespace store_locator {

namespace {

constexpr std::string_view k_option_address{"--address"};
constexpr std::string_view k_option_zip{"--zip"};
constexpr std::string_view k_option_units{"--units"};
constexpr std::string_view k_option_output{"--output"};
constexpr std::string_view k_option_help{"--help"};
constexpr std::string_view k_option_help_short{"-h"};

/** @brief Option name and, when written as --name=value, its inline value. */
struct SplitOption final {
    std::string_view name{};
    std::optional<std::string> inline_value{};
};

SplitOption split_option(std::string_view argument) {
    const std::size_t equals_pos = argument.find('=');
    if (argument.rfind("--", 0) != 0 || equals_pos == std::string_view::npos) {
        return SplitOption{argument, std::nullopt};
    }
    return SplitOption{argument.substr(0, equals_pos), std::string{argument.substr(equals_pos + 1)}};
}

}  // namespace

const std::string& CommandLineOptions::search_location() const {
    if (address.has_value()) {
        return *address;
    }
    if (zip_code.has_value()) {
        return *zip_code;
    }
    throw UsageError("Must specify address or zip");
}

CommandLineOptions parse_command_line(const std::vector<std::string>& args) {
    CommandLineOptions options{};
    if (args.empty()) {
        options.show_help = true;
        options.no_arguments = true;
        return options;
    }

    for (std::size_t index = 0; index < args.size(); ++index) {
        const SplitOption option = split_option(args[index]);

        if (option.name == k_option_help || option.name == k_option_help_short) {
            options.show_help = true;
            return options;
        }

        const bool takes_value = option.name == k_option_address || option.name == k_option_zip
            || option.name == k_option_units || option.name == k_option_output;
        if (!takes_value) {
            throw UsageError(fmt::format("Unrecognized argument: {}", args[index]));
        }

        std::string value;
        if (option.inline_value.has_value()) {
            value = *option.inline_value;
        } else if (index + 1 < args.size()) {
            value = args[++index];
        } else {
            throw UsageError(fmt::format("Argument {}: expected one argument", option.name));
        }

        if (option.name == k_option_address) {
            options.address = value;
        } else if (option.name == k_option_zip) {
            options.zip_code = value;
        } else if (option.name == k_option_units) {
            try {
                options.units = parse_unit_system(value);
            } catch (const std::invalid_argument& exc) {
                throw UsageError(fmt::format("Argument --units: {}", exc.what()));
            }
        } else {
            try {
                options.output_format = parse_output_format(value);
            } catch (const std::invalid_argument& exc) {
                throw UsageError(fmt::format("Argument --output: {}", exc.what()));
            }
        }
    }

    const bool has_address = options.address.has_value() && !options.address->empty();
    const bool has_zip = options.zip_code.has_value() && !options.zip_code->empty();
    if (!has_address && !has_zip) {
        throw UsageError("Must specify address or zip");
    }
    if (has_address && has_zip) {
        throw UsageError("Only one of address or zip is allowed");
    }
    if (!has_address) {
        options.address.reset();
    }
    if (!has_zip) {
        options.zip_code.reset();
    }
    return options;
}

CommandLineOptions parse_command_line(int argc, const char* const argv[]) {
    std::vector<std::string> args;
    for (int index = 1; index < argc; ++index) {
        args.emplace_back(argv[index]);
    }
    return parse_command_line(args);
}

std::string usage_text(std::string_view program_name) {
    return fmt::format(
        "store_locator {}\n"
        "Locate the nearest store (as the crow flies) from the store catalogue. Print the store\n"
        "address as well as the distance to the store.\n"
        "\n"
        "usage: {} (--address <address> | --zip <zip>) [--units mi|km] [--output text|json]\n"
        "\n"
        "options:\n"
        "  -h, --help            show this help message and exit\n"
        "  --address ADDRESS     find nearest store to this address; the first best match is used\n"
        "  --zip ZIP             find nearest store to this zip code; the first best match is used\n"
        "  --units {{mi,km}}       display units in miles or kilometers [default: mi]\n"
        "  --output {{text,json}}  output in human-readable text or JSON [default: text]\n",
        k_version,
        program_name
    );
}

}  // namespace store_locator
