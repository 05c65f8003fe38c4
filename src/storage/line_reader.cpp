#include "storage/line_reader.hpp"
#include <algorithm>
#include <cstring>
#include "common/logging.hpp"

namespace tabula {

LineBounds scanLine(std::string_view data, std::uint64_t start, LineMode mode) noexcept {
    const std::uint64_t size = data.size();
    std::uint64_t position = start;

    if (mode == LineMode::Physical) {
        const void* found = position < size ? std::memchr(data.data() + position, '\n', size - position) : nullptr;
        position = found == nullptr ? size : static_cast<std::uint64_t>(static_cast<const char*>(found) - data.data());
    } else {
        bool inQuotes = false;
        for (; position < size; ++position) {
            char c = data[position];
            if (c == '"') {
                // a doubled quote toggles twice and leaves the state unchanged
                inQuotes = !inQuotes;
            } else if (c == '\n' && !inQuotes) {
                break;
            }
        }
    }

    if (position >= size) {
        return LineBounds{size, size};
    }

    std::uint64_t contentEnd = position;
    if (contentEnd > start && data[contentEnd - 1] == '\r') {
        --contentEnd;
    }
    return LineBounds{contentEnd, position + 1};
}

LineReader::LineReader(std::filesystem::path filePath, LineMode mode)
    : file_path_(std::move(filePath)), mode_(mode) {}

std::expected<LineBatch, Error> LineReader::readLineBytes(std::uint64_t byteOffset, std::size_t linesToSkip,
                                                          std::size_t linesToRead) const {
    auto file = MappedFile::open(file_path_);
    if (!file) {
        return std::unexpected(file.error());
    }

    const std::string_view data = file->view();
    std::uint64_t position = std::min<std::uint64_t>(byteOffset, data.size());

    for (std::size_t skipped = 0; skipped < linesToSkip && position < data.size(); ++skipped) {
        position = scanLine(data, position, mode_).nextStart;
    }

    std::vector<std::string_view> lines;
    lines.reserve(std::min<std::size_t>(linesToRead, 4096));

    while (lines.size() < linesToRead && position < data.size()) {
        auto bounds = scanLine(data, position, mode_);
        lines.push_back(data.substr(position, bounds.contentEnd - position));
        position = bounds.nextStart;
    }

    Logger::trace("Read {} lines from '{}' ending at byte {}", lines.size(), file_path_.string(), position);
    return LineBatch(std::move(*file), std::move(lines), position);
}

}  // namespace tabula
