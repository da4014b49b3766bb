#include "store_locator/logging.hpp"

#include <ctime>
#include <filesystem>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace store_locator {

namespace {
std::once_flag logger_once_flag;
std::shared_ptr<spdlog::logger> shared_logger;
constexpr std::size_t k_max_file_size_bytes{10 * 1024 * 1024};
constexpr std::size_t k_max_files{5};
constexpr char k_logger_name[] = "store_locator";
constexpr char k_json_message_flag{'*'};

/** @brief Pattern flag writing the log payload as a quoted, escaped JSON string. */
class JsonMessageFlag final : public spdlog::custom_flag_formatter {
  public:
    void format(const spdlog::details::log_msg& msg, const std::tm&, spdlog::memory_buf_t& dest) override {
        const std::string payload(msg.payload.data(), msg.payload.size());
        const std::string escaped = nlohmann::json(payload).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        dest.append(escaped.data(), escaped.data() + escaped.size());
    }

    std::unique_ptr<custom_flag_formatter> clone() const override {
        return std::make_unique<JsonMessageFlag>();
    }
};
}  // namespace

std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory) {
    std::call_once(
        logger_once_flag,
        [&log_directory]() {
            const std::filesystem::path path_log_dir{log_directory};
            std::error_code error_directory;
            std::filesystem::create_directories(path_log_dir, error_directory);
            if (error_directory) {
                throw std::runtime_error("Unable to create log directory at " + path_log_dir.string());
            }

            const std::filesystem::path path_log_file = path_log_dir / k_log_file_name;

            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console_sink->set_pattern("[%l] %v");
            console_sink->set_level(spdlog::level::warn);
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                path_log_file.string(),
                k_max_file_size_bytes,
                k_max_files
            );
            auto file_formatter = std::make_unique<spdlog::pattern_formatter>(spdlog::pattern_time_type::utc);
            file_formatter->add_flag<JsonMessageFlag>(k_json_message_flag)
                .set_pattern(R"({"ts":"%Y-%m-%dT%H:%M:%S.%eZ","level":"%l","msg":%*})");
            file_sink->set_formatter(std::move(file_formatter));

            spdlog::sinks_init_list sinks{console_sink, file_sink};
            shared_logger = std::make_shared<spdlog::logger>(k_logger_name, sinks);
            shared_logger->set_level(spdlog::level::info);
            spdlog::register_logger(shared_logger);
        }
    );
    return shared_logger;
}

std::shared_ptr<spdlog::logger> get_logger() {
    if (!shared_logger) {
        throw std::runtime_error("Logger not initialized");
    }
    return shared_logger;
}

void set_log_level(const std::string& str_level) {
    if (!shared_logger) {
        return;
    }
    const auto level = spdlog::level::from_str(str_level);
    if (level == spdlog::level::off && str_level != "off") {
        shared_logger->warn("Unknown log level {}; defaulting to info", str_level);
        shared_logger->set_level(spdlog::level::info);
        return;
    }
    shared_logger->set_level(level);
}

}  // namespace store_locator
