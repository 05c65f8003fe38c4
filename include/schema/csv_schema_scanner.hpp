#pragma once

#include <cstddef>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include "common/errors.hpp"
#include "schema/table_schema.hpp"

namespace tabula {

/**
 * @brief Infers a schema from delimited records. Columns come from the header record in order,
 * types from folding every sampled value through the widening rule.
 *
 * Keeps a field buffer between calls, so one instance must not be used by two threads at once.
 */
class CsvSchemaScanner {
public:
    explicit CsvSchemaScanner(char delimiter = ',') : delimiter_(delimiter) {}

    /**
     * @brief Builds a schema from sample[0] (the header) and up to sampleSize data records after it.
     * Records whose field count does not match the header are skipped.
     *
     * @return EmptySample if no data record could be used, InvalidData for a duplicate header name
     */
    std::expected<SchemaPtr, Error> scanSchema(std::span<const std::string_view> sample, std::size_t sampleSize);

    /**
     * @brief Folds one more data record into schema. Returns the same pointer when nothing changed
     * and a new schema otherwise; schema itself is never modified.
     *
     * @return InvalidData if the record's field count does not match the schema
     */
    std::expected<SchemaPtr, Error> refineSchema(const SchemaPtr& schema, std::string_view record);

    /**
     * @brief Column names of a header record. A leading UTF-8 BOM is dropped, blank names become
     * Column<N>, N counting from 1.
     */
    std::expected<std::vector<std::string>, Error> parseHeader(std::string_view header);

private:
    char delimiter_;
    std::vector<std::string> fields_;
};

}  // namespace tabula
