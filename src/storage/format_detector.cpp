#include "storage/format_detector.hpp"
#include "common/logging.hpp"
#include "storage/mapped_file.hpp"

namespace tabula {

namespace {

bool isSpace(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

}  // namespace

std::string_view stripByteOrderMark(std::string_view content) noexcept {
    constexpr std::string_view utf8Bom = "\xEF\xBB\xBF";
    if (content.starts_with(utf8Bom)) {
        content.remove_prefix(utf8Bom.size());
    }
    return content;
}

std::expected<DataFormat, Error> detectFormat(std::string_view content) {
    content = stripByteOrderMark(content);

    std::size_t position = 0;
    while (position < content.size() && isSpace(content[position])) {
        ++position;
    }

    if (position == content.size()) {
        return std::unexpected(Error(ErrorCode::InvalidData, "File is empty"));
    }

    switch (content[position]) {
        case '{':
            return DataFormat::JsonLines;
        case '[':
            return std::unexpected(
                Error(ErrorCode::InvalidData, "JSON array files are not supported, use JSON Lines instead"));
        default:
            return DataFormat::Csv;
    }
}

std::expected<DataFormat, Error> detectFormat(const std::filesystem::path& path) {
    auto file = MappedFile::open(path);
    if (!file) {
        return std::unexpected(file.error());
    }

    auto format = detectFormat(file->view());
    if (format) {
        Logger::debug("Detected {} content in '{}'", getDisplayName(*format), path.string());
    }
    return format;
}

}  // namespace tabula
