#include "bulkup/config/config.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <utility>

namespace bulkup::config {
namespace {

using json = nlohmann::json;

Result<UploaderConfig> config_error(const std::string& message) {
    return Fail<UploaderConfig>(ErrorCode::Config, message);
}

} // namespace

Result<UploaderConfig> parse_config(const json& document) {
    if (!document.is_object()) {
        return config_error("Configuration must be a JSON object");
    }

    UploaderConfig config;

    if (const auto it = document.find("chunk_size"); it != document.end()) {
        if (!it->is_number_integer() || it->get<std::int64_t>() <= 0) {
            return config_error("chunk_size must be a positive integer");
        }
        config.chunk_size = it->get<std::uint64_t>();
    }

    if (const auto it = document.find("max_concurrency"); it != document.end() && !it->is_null()) {
        if (!it->is_number_integer() || it->get<std::int64_t>() <= 0) {
            return config_error("max_concurrency must be a positive integer");
        }
        config.max_concurrency = static_cast<std::uint32_t>(std::min<std::int64_t>(it->get<std::int64_t>(), 1024));
    }

    if (const auto it = document.find("downlink_mbps"); it != document.end() && !it->is_null()) {
        if (!it->is_number() || it->get<double>() < 0.0) {
            return config_error("downlink_mbps must be a non-negative number");
        }
        config.downlink_mbps = it->get<double>();
    }

    for (const auto& [key, target] : {std::pair<const char*, bool*>{"adaptive", &config.adaptive},
                                      std::pair<const char*, bool*>{"archive", &config.archive}}) {
        if (const auto it = document.find(key); it != document.end()) {
            if (!it->is_boolean()) {
                return config_error(std::string(key) + " must be a boolean");
            }
            *target = it->get<bool>();
        }
    }

    if (const auto it = document.find("log_level"); it != document.end()) {
        if (!it->is_string()) {
            return config_error("log_level must be a string");
        }
        config.log_level = it->get<std::string>();
        if (auto level = parse_log_level(config.log_level); level.is_error()) {
            return Err<UploaderConfig>(level.error());
        }
    }

    if (const auto it = document.find("log_pattern"); it != document.end()) {
        if (!it->is_string()) {
            return config_error("log_pattern must be a string");
        }
        config.log_pattern = it->get<std::string>();
    }

    return Ok(std::move(config));
}

Result<UploaderConfig> load_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return config_error("Failed to open config file: " + path.string());
    }

    auto document = json::parse(input, nullptr, false);
    if (document.is_discarded()) {
        return config_error("Invalid JSON in config file: " + path.string());
    }
    return parse_config(document);
}

Result<spdlog::level::level_enum> parse_log_level(const std::string& name) {
    const auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        return Fail<spdlog::level::level_enum>(ErrorCode::Config, "Unknown log level: " + name);
    }
    return Ok(level);
}

Result<void> apply_logging(const UploaderConfig& config) {
    auto level = parse_log_level(config.log_level);
    if (level.is_error()) {
        return Err<void>(level.error());
    }
    spdlog::set_level(level.value());
    spdlog::set_pattern(config.log_pattern);
    return Ok();
}

transfer::UploadOptions to_upload_options(const UploaderConfig& config) {
    transfer::UploadOptions options;
    options.chunk_size = config.chunk_size;
    options.max_concurrency = config.max_concurrency;
    if (config.downlink_mbps) {
        options.network_quality = transfer::NetworkQuality{*config.downlink_mbps};
    }
    options.adaptive = config.adaptive;
    return options;
}

} // namespace bulkup::config
