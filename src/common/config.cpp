#include "common/config.hpp"
#include <spdlog/common.h>
#include <fstream>
#include "common/logging.hpp"

namespace tabula {

json LoggingConfig::to_json() const {
    json obj{{"level", level}};
    if (!file.empty())
        obj["file"] = file.string();
    return obj;
}

LoggingConfig LoggingConfig::from_json(const json& obj) {
    LoggingConfig config;
    config.level = obj.value("level", config.level);
    if (obj.contains("file"))
        config.file = obj.at("file").get<std::string>();
    return config;
}

json EngineConfig::to_json() const {
    return json{{"initial_scan_count", initialScanCount},
                {"background_batch_size", backgroundBatchSize},
                {"checkpoint_interval", checkpointInterval},
                {"csv_delimiter", std::string(1, csvDelimiter)},
                {"logging", logging.to_json()}};
}

EngineConfig EngineConfig::from_json(const json& obj) {
    EngineConfig config;
    config.initialScanCount = obj.value("initial_scan_count", config.initialScanCount);
    config.backgroundBatchSize = obj.value("background_batch_size", config.backgroundBatchSize);
    config.checkpointInterval = obj.value("checkpoint_interval", config.checkpointInterval);

    if (obj.contains("csv_delimiter")) {
        auto delimiter = obj.at("csv_delimiter").get<std::string>();
        // validated later, an empty string maps to NUL which validateConfig rejects
        config.csvDelimiter = delimiter.size() == 1 ? delimiter.front() : '\0';
    }

    if (obj.contains("logging"))
        config.logging = LoggingConfig::from_json(obj.at("logging"));

    return config;
}

std::expected<void, Error> validateConfig(const EngineConfig& config) {
    if (config.initialScanCount == 0)
        return std::unexpected(Error(ErrorCode::InvalidConfiguration, "initial_scan_count must be positive"));

    if (config.backgroundBatchSize == 0)
        return std::unexpected(Error(ErrorCode::InvalidConfiguration, "background_batch_size must be positive"));

    if (config.checkpointInterval == 0)
        return std::unexpected(Error(ErrorCode::InvalidConfiguration, "checkpoint_interval must be positive"));

    if (config.csvDelimiter == '\0' || config.csvDelimiter == '"' || config.csvDelimiter == '\n' ||
        config.csvDelimiter == '\r') {
        return std::unexpected(
            Error(ErrorCode::InvalidConfiguration, "csv_delimiter must be a single character other than quote or newline"));
    }

    // spdlog maps unknown names to "off", so anything but "off" itself has to round trip
    auto level = spdlog::level::from_str(config.logging.level);
    if (level == spdlog::level::off && config.logging.level != "off")
        return std::unexpected(
            Error::make(ErrorCode::InvalidConfiguration, "Unknown log level '{}'", config.logging.level));

    return {};
}

std::expected<EngineConfig, Error> loadConfig(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(Error::make(ErrorCode::NotFound, "Config file not found: {}", path.string()));
    }

    EngineConfig config;
    try {
        config = EngineConfig::from_json(json::parse(file));
    } catch (const json::exception& ex) {
        Logger::warn("Rejecting config '{}': {}", path.string(), ex.what());
        return std::unexpected(
            Error::make(ErrorCode::InvalidConfiguration, "Malformed config {}: {}", path.string(), ex.what()));
    }

    auto valid = validateConfig(config);
    if (!valid)
        return std::unexpected(valid.error());

    return config;
}

}  // namespace tabula
