#include "config/client_config.hpp"

#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>

namespace imgen_core::config {

    ClientConfig parse_client_config(const std::string& config_path) {
        namespace fs = std::filesystem;
        const fs::path config_file_path(config_path);

        std::ifstream config_stream(config_file_path);
        if (!config_stream.is_open()) {
            throw ConfigParseError("Failed to open config file: " + config_file_path.string());
        }

        nlohmann::json config_json;
        try {
            config_json = nlohmann::json::parse(config_stream);
        } catch (const nlohmann::json::parse_error& e) {
            throw ConfigParseError("Failed to parse config JSON: " + std::string(e.what()));
        }

        return parse_client_config_json(config_json);
    }

    ClientConfig parse_client_config_json(const nlohmann::json& config_json) {
        if (!config_json.is_object()) {
            throw ConfigParseError("Client config must be a JSON object");
        }

        ClientConfig config;
        try {
            if (config_json.contains("log_level")) {
                const auto level_name = config_json.at("log_level").get<std::string>();
                config.log_level = spdlog::level::from_str(level_name);
                // from_str maps unknown names to `off`
                if (config.log_level == spdlog::level::off && level_name != "off") {
                    throw ConfigParseError("Unknown log_level '" + level_name + "'");
                }
            }
            config.log_pattern = config_json.value("log_pattern", config.log_pattern);
            config.verbose = config_json.value("verbose", config.verbose);
            config.is_opus = config_json.value("is_opus", config.is_opus);
            config.stream = config_json.value("stream", config.stream);

            if (config_json.contains("default_model")) {
                config.default_model = parse_model(config_json.at("default_model").get<std::string>());
            }
            if (config_json.contains("default_resolution")) {
                config.default_resolution = parse_resolution(config_json.at("default_resolution").get<std::string>());
            }
        } catch (const nlohmann::json::exception& e) {
            throw ConfigParseError("Invalid value in client config: " + std::string(e.what()));
        } catch (const ValidationError& e) {
            throw ConfigParseError("Invalid value for '" + e.field() + "' in client config: " + e.what());
        }

        return config;
    }

    void configure_logging(const ClientConfig& config) {
        spdlog::set_level(config.log_level);
        spdlog::set_pattern(config.log_pattern);
        spdlog::debug("Logging configured: level={}", spdlog::level::to_string_view(config.log_level));
    }

} // namespace imgen_core::config
