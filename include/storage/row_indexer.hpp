#pragma once

#include <atomic>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <vector>
#include "common/errors.hpp"
#include "common/types.hpp"
#include "storage/line_reader.hpp"
#include "storage/mapped_file.hpp"

namespace tabula {

struct RowIndexerOptions {
    std::uint64_t checkpointInterval = 1000;
    DataFormat format = DataFormat::Csv;
    bool skipHeader = false;  // the first record is a header and not counted as a row
};

struct Checkpoint {
    std::uint64_t row;
    std::uint64_t byteOffset;
};

/**
 * @brief Sparse index over record boundaries for random row access.
 *
 * One forward pass records the byte offset of every checkpointInterval-th row. A seek finds
 * the nearest checkpoint at or before the target by binary search and scans forward from
 * there. CSV records honor quoting, JSON Lines records are physical lines.
 *
 * buildIndex() is called once from a single thread. Afterwards the index is immutable and
 * may be shared freely. The file is assumed not to change while the index is in use.
 */
class RowIndexer {
public:
    /**
     * @throws ArgumentException if filePath is blank
     */
    explicit RowIndexer(std::filesystem::path filePath, RowIndexerOptions options = {});

    RowIndexer(const RowIndexer&) = delete;
    RowIndexer& operator=(const RowIndexer&) = delete;

    std::expected<void, Error> buildIndex();

    bool isBuilt() const noexcept { return built_.load(std::memory_order_acquire); }

    /**
     * @brief Number of rows, 0 until buildIndex() completed.
     */
    std::uint64_t totalRows() const noexcept { return isBuilt() ? total_rows_ : 0; }

    /**
     * @brief Nearest checkpoint at or before row, nullopt before the index is built.
     */
    std::optional<Checkpoint> checkpoint(std::uint64_t row) const noexcept;

    /**
     * @brief Byte offset where row starts, nullopt when row >= totalRows().
     */
    std::optional<std::uint64_t> seek(std::uint64_t row) const noexcept;

    const std::vector<Checkpoint>& getCheckpoints() const noexcept { return checkpoints_; }

    const std::filesystem::path& getPath() const noexcept { return file_path_; }

    const RowIndexerOptions& getOptions() const noexcept { return options_; }

    LineMode lineMode() const noexcept {
        return options_.format == DataFormat::Csv ? LineMode::QuotedRecord : LineMode::Physical;
    }

private:
    std::filesystem::path file_path_;
    RowIndexerOptions options_;
    std::unique_ptr<MappedFile> file_;
    std::vector<Checkpoint> checkpoints_;
    std::uint64_t total_rows_ = 0;
    std::atomic<bool> built_{false};
};

}  // namespace tabula
