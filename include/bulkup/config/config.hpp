#pragma once

#include "bulkup/core/result.hpp"
#include "bulkup/transfer/types.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/common.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace bulkup::config {

/**
 * @brief Upload settings read from a JSON document
 *
 * Every key is optional:
 * {
 *   "chunk_size": 524288,
 *   "max_concurrency": 4,
 *   "downlink_mbps": 12.5,
 *   "adaptive": false,
 *   "archive": false,
 *   "log_level": "info",
 *   "log_pattern": "[%H:%M:%S] [%^%l%$] %v"
 * }
 */
struct UploaderConfig {
    std::uint64_t chunk_size = transfer::kDefaultChunkSize;
    std::optional<std::uint32_t> max_concurrency;
    std::optional<double> downlink_mbps;
    bool adaptive = false;
    bool archive = false;
    std::string log_level = "info";
    std::string log_pattern = "[%H:%M:%S] [%^%l%$] %v";
};

Result<UploaderConfig> parse_config(const nlohmann::json& document);

Result<UploaderConfig> load_config(const std::filesystem::path& path);

Result<spdlog::level::level_enum> parse_log_level(const std::string& name);

/**
 * @brief Apply log level and pattern to the default spdlog logger
 */
Result<void> apply_logging(const UploaderConfig& config);

transfer::UploadOptions to_upload_options(const UploaderConfig& config);

} // namespace bulkup::config
