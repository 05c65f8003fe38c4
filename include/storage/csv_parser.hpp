#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace tabula {

/**
 * @brief Splits one delimited record into fields.
 * - Fields may be wrapped in double quotes, quoted fields may contain the delimiter and line breaks
 * - A doubled quote inside a quoted field is an escaped quote
 * - A quoted field left open at the end of the record runs to the end of the record
 *
 * The fields vector is reused: existing strings keep their capacity, so a caller parsing
 * record after record into the same vector stops allocating once the buffers are warm.
 *
 * @return number of fields written to fields
 */
std::size_t parseCsvRecord(std::string_view record, char delimiter, std::vector<std::string>& fields);

}  // namespace tabula
