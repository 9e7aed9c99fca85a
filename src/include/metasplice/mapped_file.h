#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * \file mapped_file.h
 * \brief Read-only whole-file mapping used by the tool and the bindings.
 */

namespace metasplice {

enum class MappedFileStatus : uint8_t {
    Ok,
    OpenFailed,
    StatFailed,
    /// Larger than the caller's cap or the address space.
    TooLarge,
    MapFailed,
};

/// Stable lowercase name for \p status.
const char*
mapped_file_status_name(MappedFileStatus status) noexcept;

/**
 * \brief Maps a file read-only and exposes it as a byte span.
 *
 * Writers take the whole original file; mapping it avoids a copy of large
 * media files. Empty files open successfully with an empty span.
 */
class MappedFile final {
public:
    MappedFile() noexcept = default;
    ~MappedFile() noexcept;

    MappedFile(const MappedFile&)            = delete;
    MappedFile& operator=(const MappedFile&) = delete;
    MappedFile(MappedFile&& other) noexcept;
    MappedFile& operator=(MappedFile&& other) noexcept;

    /// Maps \p path. \p max_file_bytes caps the size (0 = unlimited).
    MappedFileStatus open(const char* path,
                          uint64_t max_file_bytes = 0) noexcept;
    void close() noexcept;

    bool is_open() const noexcept { return open_; }
    std::span<const std::byte> bytes() const noexcept
    {
        return std::span<const std::byte>(data_, static_cast<size_t>(size_));
    }
    uint64_t size() const noexcept { return size_; }

private:
    void take(MappedFile* other) noexcept;

#if defined(_WIN32)
    void* file_ = nullptr;
    void* map_  = nullptr;
#else
    int fd_ = -1;
#endif
    const std::byte* data_ = nullptr;
    uint64_t size_         = 0;
    bool open_             = false;
};

}  // namespace metasplice
