#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include "common/errors.hpp"

namespace tabula {

using json = nlohmann::json;

struct LoggingConfig {
    std::string level = "warn";
    std::filesystem::path file;  // empty: console only

    json to_json() const;

    static LoggingConfig from_json(const json& obj);
};

/**
 * @brief Tunable constants of the data engine.
 *
 * initialScanCount records are scanned synchronously before anything is rendered,
 * the background scan then refines the schema backgroundBatchSize records at a time.
 * checkpointInterval trades row index memory against the forward scan done per seek.
 */
struct EngineConfig {
    std::size_t initialScanCount = 200;
    std::size_t backgroundBatchSize = 1000;
    std::uint64_t checkpointInterval = 1000;
    char csvDelimiter = ',';
    LoggingConfig logging;

    json to_json() const;

    /**
     * @brief Missing keys keep their defaults. Throws nlohmann::json::exception on wrongly typed values.
     */
    static EngineConfig from_json(const json& obj);
};

/**
 * @brief Reads and validates an EngineConfig from a JSON file.
 */
std::expected<EngineConfig, Error> loadConfig(const std::filesystem::path& path);

/**
 * @brief Checks value ranges, returns InvalidConfiguration describing the first offending key.
 */
std::expected<void, Error> validateConfig(const EngineConfig& config);

}  // namespace tabula
