#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/logger.h>

namespace sensor_placement {

/** @brief Name of the process-wide logger shared by the optimisers. */
inline constexpr std::string_view k_logger_name{"sensor_placement"};

/**
 * @brief Create the shared logger once, writing to stderr and to a rotating
 * JSON-lines file under @p log_directory. Later calls return the same logger.
 * @throws std::runtime_error if the directory cannot be created.
 */
std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory);

/** @throws std::runtime_error if initialize_logger() has not run. */
std::shared_ptr<spdlog::logger> get_logger();

/** @brief Level named by @p str_level ("trace" ... "off"), or nothing if unknown. */
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(std::string_view str_level);

/**
 * @brief Apply a level by name. Unknown names leave the logger at info and log a warning.
 * @return whether @p str_level was recognised.
 */
bool set_log_level(const std::string& str_level);

}  // namespace sensor_placement
