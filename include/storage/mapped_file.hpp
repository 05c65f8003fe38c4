#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <span>
#include <string_view>
#include "common/errors.hpp"

namespace tabula {

/**
 * @brief Read-only memory mapping of a whole file.
 *
 * The mapping covers the file length at open time and is released when the object is
 * destroyed or close() is called. No writer exists, so any number of threads may read
 * through the same instance without synchronization.
 */
class MappedFile {
public:
    /**
     * @brief Maps the file at path. A blank path yields InvalidArgument, a missing file
     * NotFound, missing permissions AccessDenied and every other failure IoError.
     */
    static std::expected<MappedFile, Error> open(const std::filesystem::path& path);

    MappedFile(MappedFile&& other) noexcept;
    MappedFile& operator=(MappedFile&& other) noexcept;

    MappedFile(const MappedFile&) = delete;
    MappedFile& operator=(const MappedFile&) = delete;

    ~MappedFile();

    /**
     * @brief Copies destination.size() bytes starting at offset. The whole range must lie
     * inside the mapping, anything else is a programming error and aborts.
     */
    void read(std::uint64_t offset, std::span<std::byte> destination) const;

    /**
     * @brief Copies up to destination.size() bytes starting at offset, clamped to the end of
     * the mapping. Returns the number of bytes copied, or InvalidArgument if offset lies
     * outside the mapping or the mapping has been released.
     */
    std::expected<std::size_t, Error> tryRead(std::uint64_t offset, std::span<std::byte> destination) const noexcept;

    /**
     * @brief Zero-copy view of the whole mapping. Valid until the mapping is released.
     */
    std::string_view view() const;

    std::uint64_t size() const noexcept { return size_; }

    bool isOpen() const noexcept { return open_; }

    const std::filesystem::path& getPath() const noexcept { return path_; }

    /**
     * @brief Unmaps the file. Reads afterwards abort.
     */
    void close() noexcept;

private:
    MappedFile(std::filesystem::path path, const char* data, std::uint64_t size) noexcept
        : path_(std::move(path)), data_(data), size_(size), open_(true) {}

    std::filesystem::path path_;
    const char* data_ = nullptr;
    std::uint64_t size_ = 0;
    bool open_ = false;
};

}  // namespace tabula
