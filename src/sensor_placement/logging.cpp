#include "sensor_placement/logging.hpp"

#include <array>
#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace sensor_placement {

namespace {

constexpr char k_log_file_name[] = "sensor_placement.log";
constexpr char k_console_pattern[] = "[%H:%M:%S.%e] [%^%l%$] %v";
constexpr char k_file_pattern[] = R"({"ts":"%Y-%m-%dT%H:%M:%S.%eZ","level":"%l","thread":%t,"msg":"%v"})";
constexpr std::size_t k_rotate_bytes{8 * 1024 * 1024};
constexpr std::size_t k_rotate_files{3};

constexpr std::array<std::pair<std::string_view, spdlog::level::level_enum>, 7> k_level_names{{
    {"trace", spdlog::level::trace},
    {"debug", spdlog::level::debug},
    {"info", spdlog::level::info},
    {"warn", spdlog::level::warn},
    {"error", spdlog::level::err},
    {"critical", spdlog::level::critical},
    {"off", spdlog::level::off},
}};

std::once_flag init_flag;
std::shared_ptr<spdlog::logger> process_logger;

std::shared_ptr<spdlog::logger> build_logger(const std::filesystem::path& directory) {
    std::error_code error;
    std::filesystem::create_directories(directory, error);
    if (error) {
        throw std::runtime_error(fmt::format(
            "Cannot create log directory '{}': {}",
            directory.string(),
            error.message()
        ));
    }

    // stdout carries result records, so the console sink writes to stderr.
    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_pattern(k_console_pattern);
    auto rotating = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        (directory / k_log_file_name).string(),
        k_rotate_bytes,
        k_rotate_files
    );
    rotating->set_pattern(k_file_pattern);

    auto logger = std::make_shared<spdlog::logger>(
        std::string{k_logger_name},
        spdlog::sinks_init_list{console, rotating}
    );
    logger->set_level(spdlog::level::info);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    return logger;
}

}  // namespace

std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory) {
    std::call_once(init_flag, [&log_directory]() {
        process_logger = build_logger(std::filesystem::path{log_directory});
    });
    return process_logger;
}

std::shared_ptr<spdlog::logger> get_logger() {
    if (process_logger == nullptr) {
        throw std::runtime_error("initialize_logger() must run before get_logger()");
    }
    return process_logger;
}

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view str_level) {
    for (const auto& [name, level] : k_level_names) {
        if (name == str_level) {
            return level;
        }
    }
    return std::nullopt;
}

bool set_log_level(const std::string& str_level) {
    const auto logger = get_logger();
    const auto level = parse_log_level(str_level);
    if (!level) {
        logger->set_level(spdlog::level::info);
        logger->warn("Unknown log level '{}', using info", str_level);
        return false;
    }
    logger->set_level(*level);
    return true;
}

}  // namespace sensor_placement
