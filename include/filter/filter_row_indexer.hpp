#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>
#include "common/errors.hpp"
#include "filter/filter_spec.hpp"
#include "schema/table_schema.hpp"
#include "storage/row_indexer.hpp"

namespace tabula {

/**
 * @brief Maps rows of a filtered view to rows of the source file.
 *
 * buildIndex() reads every row once, batch by batch, and keeps the source row numbers of the
 * rows matching all filter specs. totalMatchedRows() and sourceRow() may be called from other
 * threads while the build is running and report the rows matched so far.
 */
class FilterRowIndexer {
public:
    /**
     * @param indexer built row index of the source file, must outlive this object
     * @param sourceSchema schema of the source file, used to find JSON Lines keys by column index
     * @param filterSpecs resolved filters, a row matches when it satisfies every one of them
     */
    FilterRowIndexer(const RowIndexer& indexer, SchemaPtr sourceSchema, std::vector<FilterSpec> filterSpecs,
                     char delimiter = ',', std::size_t batchSize = 1000);

    /**
     * @brief Scans all rows. Stops early without error when stopToken is triggered, in which case
     * isComplete() stays false.
     */
    std::expected<void, Error> buildIndex(std::stop_token stopToken = {});

    std::uint64_t totalMatchedRows() const;

    /**
     * @brief Source row shown as filteredRow, nullopt if there is no such matched row (yet).
     */
    std::optional<std::uint64_t> sourceRow(std::uint64_t filteredRow) const;

    bool isComplete() const;

    const std::vector<FilterSpec>& getFilterSpecs() const noexcept { return filter_specs_; }

private:
    bool matchesCsvRecord(std::string_view record);
    bool matchesJsonRecord(std::string_view record);

    const RowIndexer& indexer_;
    SchemaPtr source_schema_;
    std::vector<FilterSpec> filter_specs_;
    char delimiter_;
    std::size_t batch_size_;

    std::vector<std::string> fields_;
    std::string cell_;

    mutable std::mutex mutex_;
    std::vector<std::uint64_t> matched_rows_;
    bool complete_ = false;
};

}  // namespace tabula
