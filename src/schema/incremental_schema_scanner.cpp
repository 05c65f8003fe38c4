#include "schema/incremental_schema_scanner.hpp"
#include <exception>
#include "common/assert.hpp"
#include "common/logging.hpp"
#include "storage/line_reader.hpp"

namespace tabula {

namespace {

LineMode lineModeFor(DataFormat format) noexcept {
    return format == DataFormat::Csv ? LineMode::QuotedRecord : LineMode::Physical;
}

}  // namespace

IncrementalSchemaScanner::IncrementalSchemaScanner(std::filesystem::path filePath, DataFormat format,
                                                   EngineConfig config)
    : file_path_(std::move(filePath)), format_(format), config_(std::move(config)) {
    if (isBlank(file_path_.native())) {
        throw ArgumentException("File path must not be blank", "filePath");
    }
}

IncrementalSchemaScanner::~IncrementalSchemaScanner() {
    if (worker_.joinable()) {
        worker_.request_stop();
        worker_.join();
    }
}

std::expected<SchemaPtr, Error> IncrementalSchemaScanner::initialScan() {
    Logger::info("Scanning schema of '{}' ({})", file_path_.string(), getDisplayName(format_));

    const std::size_t headerLines = format_ == DataFormat::Csv ? 1 : 0;
    LineReader reader(file_path_, lineModeFor(format_));

    auto batch = reader.readLineBytes(0, 0, headerLines + config_.initialScanCount);
    if (!batch) {
        return std::unexpected(batch.error());
    }

    std::expected<SchemaPtr, Error> schema;
    if (format_ == DataFormat::Csv) {
        CsvSchemaScanner scanner(config_.csvDelimiter);
        schema = scanner.scanSchema(batch->lines(), config_.initialScanCount);
    } else {
        schema = JsonLinesSchemaScanner().scanSchema(batch->lines(), config_.initialScanCount);
    }

    if (!schema) {
        Logger::warn("Initial schema scan of '{}' failed: {}", file_path_.string(), schema.error().message);
        return schema;
    }

    resume_offset_ = batch->endOffset();
    publisher_.store(*schema);

    Logger::debug("Initial scan of '{}' found {} columns", file_path_.string(), (*schema)->getColumnCount());
    return schema;
}

std::future<SchemaPtr> IncrementalSchemaScanner::startBackgroundScan(SchemaPtr schema, std::stop_token stopToken) {
    tbl_check(resume_offset_.has_value(), "Background scan of '{}' started before the initial scan",
              file_path_.string());
    tbl_check(schema != nullptr, "Background scan needs an initial schema");

    std::promise<SchemaPtr> promise;
    auto future = promise.get_future();

    // assigning stops and joins a previous worker
    worker_ = std::jthread([this, promise = std::move(promise), schema = std::move(schema),
                            offset = *resume_offset_, stopToken](std::stop_token ownerToken) mutable {
        promise.set_value(runBackgroundScan(std::move(schema), offset, stopToken, ownerToken));
    });

    return future;
}

SchemaPtr IncrementalSchemaScanner::runBackgroundScan(SchemaPtr schema, std::uint64_t offset,
                                                      std::stop_token stopToken, std::stop_token ownerToken) {
    auto stopRequested = [&] { return stopToken.stop_requested() || ownerToken.stop_requested(); };

    CsvSchemaScanner csvScanner(config_.csvDelimiter);
    JsonLinesSchemaScanner jsonScanner;
    LineReader reader(file_path_, lineModeFor(format_));

    std::uint64_t refinedRecords = 0;
    std::uint64_t skippedRecords = 0;

    try {
        while (!stopRequested()) {
            auto batch = reader.readLineBytes(offset, 0, config_.backgroundBatchSize);
            if (!batch) {
                Logger::warn("Background scan of '{}' stopped: {}", file_path_.string(), batch.error().message);
                break;
            }
            if (batch->empty()) {
                Logger::debug("Background scan of '{}' reached end of file after {} records ({} skipped)",
                              file_path_.string(), refinedRecords, skippedRecords);
                return schema;
            }

            SchemaPtr batchStart = schema;
            for (std::string_view record : batch->lines()) {
                if (stopRequested()) {
                    break;
                }

                auto refined = format_ == DataFormat::Csv ? csvScanner.refineSchema(schema, record)
                                                          : jsonScanner.refineSchema(schema, record);
                if (!refined) {
                    Logger::trace("Skipping record during refinement of '{}': {}", file_path_.string(),
                                  refined.error().message);
                    ++skippedRecords;
                    continue;
                }

                schema = std::move(*refined);
                ++refinedRecords;
            }

            if (schema != batchStart) {
                publisher_.store(schema);
            }
            offset = batch->endOffset();
        }
    } catch (const std::exception& e) {
        Logger::error("Background scan of '{}' aborted: {}", file_path_.string(), e.what());
        publisher_.store(schema);
        return schema;
    }

    if (stopRequested()) {
        Logger::debug("Background scan of '{}' cancelled after {} records", file_path_.string(), refinedRecords);
    }
    return schema;
}

}  // namespace tabula
