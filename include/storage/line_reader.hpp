#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string_view>
#include <vector>
#include "common/errors.hpp"
#include "storage/mapped_file.hpp"

namespace tabula {

enum class LineMode {
    Physical,     // every LF ends a line
    QuotedRecord  // an LF inside a double-quoted field belongs to the field
};

/**
 * @brief Position of the next line end found by scanLine.
 */
struct LineBounds {
    std::uint64_t contentEnd;  // one past the last content byte, line ending excluded
    std::uint64_t nextStart;   // first byte of the following line
};

/**
 * @brief Finds the end of the line starting at start. Without a terminator the line runs to
 * the end of data, which also closes an unterminated quoted field.
 */
LineBounds scanLine(std::string_view data, std::uint64_t start, LineMode mode) noexcept;

/**
 * @brief Lines produced by one LineReader call. Owns the mapping the lines point into, so the
 * views stay valid for as long as the batch lives (moving the batch keeps them valid too).
 */
class LineBatch {
public:
    LineBatch(MappedFile file, std::vector<std::string_view> lines, std::uint64_t endOffset)
        : file_(std::move(file)), lines_(std::move(lines)), end_offset_(endOffset) {}

    LineBatch(LineBatch&&) noexcept = default;
    LineBatch& operator=(LineBatch&&) noexcept = default;

    const std::vector<std::string_view>& lines() const noexcept { return lines_; }

    std::size_t size() const noexcept { return lines_.size(); }

    bool empty() const noexcept { return lines_.empty(); }

    std::string_view operator[](std::size_t index) const noexcept { return lines_[index]; }

    /**
     * @brief Byte offset just past the last returned line, where a follow-up read continues.
     */
    std::uint64_t endOffset() const noexcept { return end_offset_; }

private:
    MappedFile file_;
    std::vector<std::string_view> lines_;
    std::uint64_t end_offset_;
};

/**
 * @brief Decodes lines on demand from a file. Every call maps the file on its own, so
 * concurrent callers never share a read cursor.
 */
class LineReader {
public:
    explicit LineReader(std::filesystem::path filePath, LineMode mode = LineMode::Physical);

    /**
     * @brief Starting at byteOffset, discards linesToSkip complete lines and returns up to
     * linesToRead lines with their CRLF or LF ending stripped. Returns fewer lines when the
     * file ends first.
     */
    std::expected<LineBatch, Error> readLineBytes(std::uint64_t byteOffset, std::size_t linesToSkip,
                                                  std::size_t linesToRead) const;

    const std::filesystem::path& getPath() const noexcept { return file_path_; }

    LineMode getMode() const noexcept { return mode_; }

private:
    std::filesystem::path file_path_;
    LineMode mode_;
};

}  // namespace tabula
