#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <future>
#include <optional>
#include <stop_token>
#include <string_view>
#include <thread>
#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/types.hpp"
#include "schema/csv_schema_scanner.hpp"
#include "schema/json_lines_schema_scanner.hpp"
#include "schema/schema_publisher.hpp"
#include "schema/table_schema.hpp"

namespace tabula {

/**
 * @brief Two-phase schema inference over one file.
 *
 * initialScan() reads the first initialScanCount records synchronously. startBackgroundScan()
 * then refines that schema on a worker thread, backgroundBatchSize records at a time, publishing
 * every change as a new immutable schema readable through current(). Both phases map the file
 * on their own and never share a read cursor.
 */
class IncrementalSchemaScanner {
public:
    /**
     * @throws ArgumentException if filePath is blank
     */
    IncrementalSchemaScanner(std::filesystem::path filePath, DataFormat format, EngineConfig config = {});

    IncrementalSchemaScanner(const IncrementalSchemaScanner&) = delete;
    IncrementalSchemaScanner& operator=(const IncrementalSchemaScanner&) = delete;

    /**
     * @brief Requests a running background scan to stop and waits for it.
     */
    ~IncrementalSchemaScanner();

    /**
     * @brief Blocking scan of the header (CSV) and the first initialScanCount records. Publishes
     * the result and remembers where the background scan continues.
     */
    std::expected<SchemaPtr, Error> initialScan();

    /**
     * @brief Refines schema with all records after the initial sample on a worker thread.
     *
     * The future always resolves with a schema: the fully refined one at end of file, or the
     * last complete one when stopToken is triggered or reading fails. It never holds an exception.
     * Must only be called after initialScan() succeeded. Starting a new scan stops the previous one.
     */
    std::future<SchemaPtr> startBackgroundScan(SchemaPtr schema, std::stop_token stopToken);

    /**
     * @brief Latest published schema, nullptr before initialScan() succeeded.
     */
    SchemaPtr current() const noexcept { return publisher_.load(); }

    const std::filesystem::path& getPath() const noexcept { return file_path_; }

    DataFormat getFormat() const noexcept { return format_; }

private:
    SchemaPtr runBackgroundScan(SchemaPtr schema, std::uint64_t offset, std::stop_token stopToken,
                                std::stop_token ownerToken);

    std::filesystem::path file_path_;
    DataFormat format_;
    EngineConfig config_;
    SchemaPublisher publisher_;
    std::optional<std::uint64_t> resume_offset_;
    std::jthread worker_;
};

}  // namespace tabula
