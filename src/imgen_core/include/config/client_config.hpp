#pragma once

#include "errors.hpp"
#include "types/constants.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/common.h>
#include <string>

namespace imgen_core::config {

    inline constexpr const char* DEFAULT_LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

    struct ClientConfig {
        spdlog::level::level_enum log_level = spdlog::level::info;
        std::string log_pattern = DEFAULT_LOG_PATTERN;
        bool verbose = false;           // log the estimated Anlas cost of each generation
        bool is_opus = false;           // privileged tier, used for cost estimation
        Model default_model = Model::V4_5;
        Resolution default_resolution = Resolution::NORMAL_SQUARE;
        bool stream = false;            // decode current-protocol responses incrementally
    };

    class ConfigParseError : public ImgenError {
    public:
        using ImgenError::ImgenError;
    };

    /**
     * @brief Reads a ClientConfig from a JSON file. Missing keys keep defaults.
     * @throws ConfigParseError if the file cannot be read or holds invalid values
     */
    ClientConfig parse_client_config(const std::string& config_path);

    /// Same as parse_client_config, from an in-memory document.
    ClientConfig parse_client_config_json(const nlohmann::json& config_json);

    /**
     * @brief Applies the configured level and pattern to the default spdlog logger.
     */
    void configure_logging(const ClientConfig& config);

} // namespace imgen_core::config
