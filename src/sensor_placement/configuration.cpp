// === Configuration Loader ====================================================
//
// Parses environment-driven settings for placement runs. Unset variables take
// their defaults; values that cannot be parsed, or are not positive, are
// reported through the logger and replaced by the default.
//
// Note: nothing is read from disk; callers populate the process environment
// ahead of time (e.g. a shell-sourced `.env`).

#include "sensor_placement/configuration.hpp"

#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <string_view>

#include "sensor_placement/logging.hpp"

namespace sensor_placement {

namespace {
constexpr std::string_view k_default_log_directory{"logs"};
constexpr std::string_view k_default_log_level{"info"};
constexpr std::string_view k_default_decay{"exponential"};
constexpr double k_default_theta{500.0};
constexpr long long k_default_n_sensors{10};
constexpr long long k_default_population_size{200};
constexpr long long k_default_generations{1000};
constexpr long long k_default_log_every{100};
constexpr long long k_default_seed{123};

double parse_double(const char* name, double fallback) {
    const char* raw_value = std::getenv(name);
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const double parsed_value = std::stod(raw_value);
        if (!std::isfinite(parsed_value) || parsed_value <= 0.0) {
            get_logger()->warn("{}={} is not a positive number; using fallback {}", name, raw_value, fallback);
            return fallback;
        }
        return parsed_value;
    } catch (const std::exception&) {
        get_logger()->warn("Failed to parse {} as a number; using fallback {}", name, fallback);
        return fallback;
    }
}

long long parse_count(const char* name, long long fallback) {
    const char* raw_value = std::getenv(name);
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const long long parsed_value = std::stoll(raw_value);
        if (parsed_value <= 0) {
            get_logger()->warn("{}={} is not positive; using fallback {}", name, raw_value, fallback);
            return fallback;
        }
        return parsed_value;
    } catch (const std::exception&) {
        get_logger()->warn("Failed to parse {} as an integer; using fallback {}", name, fallback);
        return fallback;
    }
}

std::string parse_string(const char* name, std::string_view fallback) {
    const char* raw_value = std::getenv(name);
    if (raw_value == nullptr || std::string_view{raw_value}.empty()) {
        return std::string{fallback};
    }
    return std::string{raw_value};
}

}  // namespace

Configuration ConfigurationLoader::load() {
    Configuration config{};
    config.log_directory = parse_string("SENSOR_PLACEMENT_LOG_DIR", k_default_log_directory);

    auto logger = initialize_logger(config.log_directory);
    logger->info("Loading configuration from environment");

    config.log_level = parse_string("SENSOR_PLACEMENT_LOG_LEVEL", k_default_log_level);
    config.decay = load_decay();
    config.n_sensors = static_cast<std::size_t>(parse_count("SENSOR_PLACEMENT_N_SENSORS", k_default_n_sensors));
    config.population_size = static_cast<std::size_t>(parse_count("SENSOR_PLACEMENT_POPULATION_SIZE", k_default_population_size));
    config.generations = static_cast<std::size_t>(parse_count("SENSOR_PLACEMENT_GENERATIONS", k_default_generations));
    config.log_every = static_cast<std::size_t>(parse_count("SENSOR_PLACEMENT_LOG_EVERY", k_default_log_every));
    config.seed = static_cast<std::uint64_t>(parse_count("SENSOR_PLACEMENT_SEED", k_default_seed));

    logger->info("Configuration loaded: decay={}({}) n_sensors={} population_size={} generations={} log_every={} seed={}",
                 decay_kind_name(config.decay),
                 decay_parameter(config.decay),
                 config.n_sensors,
                 config.population_size,
                 config.generations,
                 config.log_every,
                 config.seed);

    return config;
}

DecayFunction ConfigurationLoader::load_decay() {
    std::string kind = parse_string("SENSOR_PLACEMENT_DECAY", k_default_decay);
    if (kind != "binary" && kind != "exponential") {
        get_logger()->warn("Unknown decay kind {}; using {}", kind, k_default_decay);
        kind = std::string{k_default_decay};
    }
    const double parameter = parse_double("SENSOR_PLACEMENT_THETA", k_default_theta);
    return make_decay(kind, parameter);
}

}  // namespace sensor_placement
