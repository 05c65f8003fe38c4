#include "storage/mapped_file.hpp"
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include "common/assert.hpp"
#include "common/logging.hpp"

namespace tabula {

namespace {

Error errorFromErrno(int error, const std::filesystem::path& path) {
    switch (error) {
        case ENOENT:
        case ENOTDIR:
            return Error::make(ErrorCode::NotFound, "File not found: {}", path.string());
        case EACCES:
        case EPERM:
            return Error::make(ErrorCode::AccessDenied, "Access denied: {}", path.string());
        default:
            return Error::make(ErrorCode::IoError, "I/O error on {}: {}", path.string(), std::strerror(error));
    }
}

}  // namespace

std::expected<MappedFile, Error> MappedFile::open(const std::filesystem::path& path) {
    if (isBlank(path.native())) {
        return std::unexpected(Error(ErrorCode::InvalidArgument, "File path must not be blank"));
    }

    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd == -1) {
        auto error = errorFromErrno(errno, path);
        Logger::warn("Failed to open '{}': {}", path.string(), error.message);
        return std::unexpected(std::move(error));
    }

    struct stat sb;
    if (::fstat(fd, &sb) == -1) {
        auto error = errorFromErrno(errno, path);
        ::close(fd);
        return std::unexpected(std::move(error));
    }

    if (!S_ISREG(sb.st_mode)) {
        ::close(fd);
        return std::unexpected(Error::make(ErrorCode::IoError, "Not a regular file: {}", path.string()));
    }

    auto size = static_cast<std::uint64_t>(sb.st_size);
    if (size == 0) {
        // mmap rejects zero-length mappings, an empty file simply has nothing to read
        ::close(fd);
        return MappedFile(path, nullptr, 0);
    }

    void* addr = ::mmap(nullptr, size, PROT_READ, MAP_PRIVATE, fd, 0);
    int mmapErrno = errno;
    ::close(fd);

    if (addr == MAP_FAILED) {
        auto error = errorFromErrno(mmapErrno, path);
        Logger::warn("Failed to map '{}': {}", path.string(), error.message);
        return std::unexpected(std::move(error));
    }

    ::madvise(addr, size, MADV_SEQUENTIAL);
    return MappedFile(path, static_cast<const char*>(addr), size);
}

MappedFile::MappedFile(MappedFile&& other) noexcept
    : path_(std::move(other.path_)), data_(other.data_), size_(other.size_), open_(other.open_) {
    other.data_ = nullptr;
    other.size_ = 0;
    other.open_ = false;
}

MappedFile& MappedFile::operator=(MappedFile&& other) noexcept {
    if (this != &other) {
        close();
        path_ = std::move(other.path_);
        data_ = other.data_;
        size_ = other.size_;
        open_ = other.open_;
        other.data_ = nullptr;
        other.size_ = 0;
        other.open_ = false;
    }
    return *this;
}

MappedFile::~MappedFile() {
    close();
}

void MappedFile::close() noexcept {
    if (data_ != nullptr) {
        if (::munmap(const_cast<char*>(data_), size_) != 0)
            Logger::error("Error unmapping '{}': {}", path_.string(), std::strerror(errno));
    }
    data_ = nullptr;
    size_ = 0;
    open_ = false;
}

void MappedFile::read(std::uint64_t offset, std::span<std::byte> destination) const {
    tbl_check(open_, "Read from released mapping of '{}'", path_.string());

    if (destination.empty()) {
        return;
    }

    tbl_check(offset <= size_ && destination.size() <= size_ - offset,
              "Range [{}, {}) exceeds file length {}", offset, offset + destination.size(), size_);

    std::memcpy(destination.data(), data_ + offset, destination.size());
}

std::expected<std::size_t, Error> MappedFile::tryRead(std::uint64_t offset,
                                                      std::span<std::byte> destination) const noexcept {
    if (!open_) {
        return std::unexpected(Error(ErrorCode::InvalidArgument, "Mapping has been released"));
    }

    if (offset >= size_) {
        return std::unexpected(Error(ErrorCode::InvalidArgument, "Offset lies outside the mapped region"));
    }

    auto count = static_cast<std::size_t>(std::min<std::uint64_t>(destination.size(), size_ - offset));
    std::memcpy(destination.data(), data_ + offset, count);
    return count;
}

std::string_view MappedFile::view() const {
    tbl_check(open_, "View of released mapping of '{}'", path_.string());
    return std::string_view(data_, size_);
}

}  // namespace tabula
