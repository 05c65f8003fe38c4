#pragma once

#include <cstddef>
#include <expected>
#include <nlohmann/json.hpp>
#include <optional>
#include <span>
#include <string_view>
#include "common/errors.hpp"
#include "schema/table_schema.hpp"

namespace tabula {

using ordered_json = nlohmann::ordered_json;

/**
 * @brief Parses one JSON Lines record. nullopt for malformed JSON and for values that are not
 * objects, both of which the scanners skip.
 */
std::optional<ordered_json> parseJsonRecord(std::string_view line);

/**
 * @brief Column type of one JSON value, nullopt for null. Integers that do not fit a signed
 * 64-bit value are Text, strings, objects and arrays are Text as well.
 */
std::optional<ColumnType> jsonValueType(const ordered_json& value) noexcept;

/**
 * @brief Infers a schema from JSON Lines records.
 *
 * The column set is the union of the keys of all objects in first-seen order. A record lacking
 * a key marks that column nullable, and so does discovering a key after the first record, since
 * every earlier record lacked it. Blank keys are ignored.
 */
class JsonLinesSchemaScanner {
public:
    /**
     * @brief Builds a schema from up to sampleSize records of sample.
     *
     * @return EmptySample if no record of the sample is a JSON object
     */
    std::expected<SchemaPtr, Error> scanSchema(std::span<const std::string_view> sample,
                                               std::size_t sampleSize) const;

    /**
     * @brief Folds one more record into schema. Returns the same pointer when nothing changed.
     *
     * @return InvalidData if the record is not a JSON object
     */
    std::expected<SchemaPtr, Error> refineSchema(const SchemaPtr& schema, std::string_view record) const;
};

}  // namespace tabula
