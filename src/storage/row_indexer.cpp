#include "storage/row_indexer.hpp"
#include <algorithm>
#include "common/assert.hpp"
#include "common/logging.hpp"

namespace tabula {

RowIndexer::RowIndexer(std::filesystem::path filePath, RowIndexerOptions options)
    : file_path_(std::move(filePath)), options_(options) {
    if (isBlank(file_path_.native())) {
        throw ArgumentException("File path must not be blank", "filePath");
    }
    if (options_.checkpointInterval == 0) {
        throw ArgumentException("Checkpoint interval must be positive", "checkpointInterval");
    }
}

std::expected<void, Error> RowIndexer::buildIndex() {
    tbl_assert(!isBuilt(), "Index for '{}' is already built", file_path_.string());

    auto file = MappedFile::open(file_path_);
    if (!file) {
        return std::unexpected(file.error());
    }

    const std::string_view data = file->view();
    const LineMode mode = lineMode();
    const std::uint64_t size = data.size();

    std::uint64_t position = 0;
    if (options_.skipHeader && size > 0) {
        position = scanLine(data, 0, mode).nextStart;
    }

    std::vector<Checkpoint> checkpoints;
    std::uint64_t rowCount = 0;

    // scanLine closes a trailing row without terminator, including one inside an open quote
    while (position < size) {
        if (rowCount % options_.checkpointInterval == 0) {
            checkpoints.push_back(Checkpoint{rowCount, position});
        }
        position = scanLine(data, position, mode).nextStart;
        ++rowCount;
    }

    if (checkpoints.empty()) {
        checkpoints.push_back(Checkpoint{0, position});
    }

    Logger::debug("Indexed {} rows of '{}' with {} checkpoints", rowCount, file_path_.string(), checkpoints.size());

    file_ = std::make_unique<MappedFile>(std::move(*file));
    checkpoints_ = std::move(checkpoints);
    total_rows_ = rowCount;
    built_.store(true, std::memory_order_release);
    return {};
}

std::optional<Checkpoint> RowIndexer::checkpoint(std::uint64_t row) const noexcept {
    if (!isBuilt()) {
        return std::nullopt;
    }

    auto it = std::upper_bound(checkpoints_.begin(), checkpoints_.end(), row,
                               [](std::uint64_t target, const Checkpoint& cp) { return target < cp.row; });
    tbl_assert(it != checkpoints_.begin(), "First checkpoint must cover row 0");
    return *std::prev(it);
}

std::optional<std::uint64_t> RowIndexer::seek(std::uint64_t row) const noexcept {
    if (row >= totalRows()) {
        return std::nullopt;
    }

    auto nearest = checkpoint(row);
    if (!nearest) {
        return std::nullopt;
    }

    const std::string_view data = file_->view();
    const LineMode mode = lineMode();
    std::uint64_t position = nearest->byteOffset;

    for (std::uint64_t current = nearest->row; current < row; ++current) {
        position = scanLine(data, position, mode).nextStart;
    }

    return position;
}

}  // namespace tabula
