#include "filter/filter_row_indexer.hpp"
#include <algorithm>
#include "common/logging.hpp"
#include "filter/filter_evaluator.hpp"
#include "schema/json_lines_schema_scanner.hpp"
#include "storage/csv_parser.hpp"
#include "storage/line_reader.hpp"

namespace tabula {

namespace {

/**
 * @brief Raw text of a JSON value as a filter sees it: strings without quotes, null as empty,
 * everything else in its JSON form.
 */
std::string_view cellText(const ordered_json& value, std::string& buffer) {
    switch (value.type()) {
        case ordered_json::value_t::string:
            return value.get_ref<const std::string&>();
        case ordered_json::value_t::null:
            return {};
        case ordered_json::value_t::boolean:
            return value.get<bool>() ? "true" : "false";
        default:
            buffer = value.dump();
            return buffer;
    }
}

}  // namespace

FilterRowIndexer::FilterRowIndexer(const RowIndexer& indexer, SchemaPtr sourceSchema,
                                   std::vector<FilterSpec> filterSpecs, char delimiter, std::size_t batchSize)
    : indexer_(indexer),
      source_schema_(std::move(sourceSchema)),
      filter_specs_(std::move(filterSpecs)),
      delimiter_(delimiter),
      batch_size_(batchSize) {
    if (source_schema_ == nullptr) {
        throw ArgumentException("Source schema must not be null", "sourceSchema");
    }
    if (batch_size_ == 0) {
        throw ArgumentException("Batch size must be positive", "batchSize");
    }
    for (const auto& spec : filter_specs_) {
        if (spec.sourceColumnIndex >= source_schema_->getColumnCount()) {
            throw ArgumentException("Filter references column " + std::to_string(spec.sourceColumnIndex) +
                                        " outside the source schema",
                                    "filterSpecs");
        }
    }
}

std::expected<void, Error> FilterRowIndexer::buildIndex(std::stop_token stopToken) {
    if (!indexer_.isBuilt()) {
        return std::unexpected(Error(ErrorCode::InvalidArgument, "Row index has not been built"));
    }

    const std::uint64_t totalRows = indexer_.totalRows();
    auto start = indexer_.seek(0);
    if (!start) {
        std::lock_guard lock(mutex_);
        complete_ = true;
        return {};
    }

    const bool csv = indexer_.getOptions().format == DataFormat::Csv;
    LineReader reader(indexer_.getPath(), indexer_.lineMode());
    std::uint64_t offset = *start;
    std::uint64_t row = 0;

    while (row < totalRows) {
        if (stopToken.stop_requested()) {
            Logger::debug("Filtering '{}' cancelled at row {}", indexer_.getPath().string(), row);
            return {};
        }

        auto rowsToRead = static_cast<std::size_t>(std::min<std::uint64_t>(batch_size_, totalRows - row));
        auto batch = reader.readLineBytes(offset, 0, rowsToRead);
        if (!batch) {
            return std::unexpected(batch.error());
        }
        if (batch->empty()) {
            break;
        }

        std::vector<std::uint64_t> matched;
        for (std::size_t i = 0; i < batch->size(); ++i) {
            std::string_view record = (*batch)[i];
            if (csv ? matchesCsvRecord(record) : matchesJsonRecord(record)) {
                matched.push_back(row + i);
            }
        }

        {
            std::lock_guard lock(mutex_);
            matched_rows_.insert(matched_rows_.end(), matched.begin(), matched.end());
        }

        row += batch->size();
        offset = batch->endOffset();
    }

    std::lock_guard lock(mutex_);
    complete_ = true;
    Logger::debug("Filtering '{}' matched {} of {} rows", indexer_.getPath().string(), matched_rows_.size(),
                  totalRows);
    return {};
}

bool FilterRowIndexer::matchesCsvRecord(std::string_view record) {
    std::size_t count = parseCsvRecord(record, delimiter_, fields_);

    return std::all_of(filter_specs_.begin(), filter_specs_.end(), [&](const FilterSpec& spec) {
        std::string_view value = spec.sourceColumnIndex < count ? std::string_view(fields_[spec.sourceColumnIndex])
                                                                : std::string_view();
        return evaluateFilter(value, spec);
    });
}

bool FilterRowIndexer::matchesJsonRecord(std::string_view record) {
    auto parsed = parseJsonRecord(record);

    return std::all_of(filter_specs_.begin(), filter_specs_.end(), [&](const FilterSpec& spec) {
        std::string_view value;
        if (parsed) {
            auto it = parsed->find(source_schema_->getColumn(spec.sourceColumnIndex).name);
            if (it != parsed->end()) {
                value = cellText(*it, cell_);
            }
        }
        return evaluateFilter(value, spec);
    });
}

std::uint64_t FilterRowIndexer::totalMatchedRows() const {
    std::lock_guard lock(mutex_);
    return matched_rows_.size();
}

std::optional<std::uint64_t> FilterRowIndexer::sourceRow(std::uint64_t filteredRow) const {
    std::lock_guard lock(mutex_);
    if (filteredRow >= matched_rows_.size()) {
        return std::nullopt;
    }
    return matched_rows_[filteredRow];
}

bool FilterRowIndexer::isComplete() const {
    std::lock_guard lock(mutex_);
    return complete_;
}

}  // namespace tabula
