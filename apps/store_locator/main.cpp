#include <cstdlib>
#include <iostream>

#include "store_locator/command_line.hpp"
#include "store_locator/configuration.hpp"
#include "store_locator/errors.hpp"
#include "store_locator/http_client.hpp"
#include "store_locator/logging.hpp"
#include "store_locator/store_locator_runtime.hpp"

namespace {
// Matches the conventional exit status for command-line usage errors.
constexpr int k_usage_error_exit_code = 2;
}  // namespace

int main(int argc, char* argv[]) {
    using namespace store_locator;

    const char* program_name = argc > 0 ? argv[0] : "store_locator";

    try {
        Configuration configuration = ConfigurationLoader::load();
        set_log_level(configuration.log_level);

        CommandLineOptions options{};
        try {
            options = parse_command_line(argc, argv);
        } catch (const UsageError& exc) {
            std::cerr << usage_text(program_name) << '\n' << program_name << ": error: " << exc.what() << '\n';
            return k_usage_error_exit_code;
        }
        if (options.show_help) {
            std::cout << usage_text(program_name);
            return options.no_arguments ? EXIT_FAILURE : EXIT_SUCCESS;
        }

        CurlHttpClient http_client{configuration.geocoder.timeout_seconds, configuration.geocoder.user_agent};
        NominatimGeocoder geocoder{http_client, configuration.geocoder};
        StoreLocatorRuntime runtime{std::move(configuration), geocoder};

        std::cout << runtime.run(options) << '\n';
        get_logger()->flush();
    } catch (const std::exception& exc) {
        try {
            auto logger = get_logger();
            logger->critical("Fatal error: {}", exc.what());
        } catch (const std::exception&) {
            std::cerr << "Fatal error before logger initialization: " << exc.what() << '\n';
        }
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
