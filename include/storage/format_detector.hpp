#pragma once

#include <expected>
#include <filesystem>
#include <string_view>
#include "common/errors.hpp"
#include "common/types.hpp"

namespace tabula {

/**
 * @brief content without a leading UTF-8 BOM.
 */
std::string_view stripByteOrderMark(std::string_view content) noexcept;

/**
 * @brief Format of the content, decided by its first significant character after an optional
 * UTF-8 BOM and leading whitespace: '{' is JSON Lines, everything else CSV.
 *
 * @return InvalidData for empty content or a JSON array ('['), which is not supported
 */
std::expected<DataFormat, Error> detectFormat(std::string_view content);

/**
 * @brief detectFormat over the content of the file at path.
 */
std::expected<DataFormat, Error> detectFormat(const std::filesystem::path& path);

}  // namespace tabula
