#include "metasplice/mapped_file.h"

#include <limits>

#if defined(_WIN32)
#    define WIN32_LEAN_AND_MEAN
#    include <windows.h>
#else
#    include <fcntl.h>
#    include <sys/mman.h>
#    include <sys/stat.h>
#    include <unistd.h>
#endif

namespace metasplice {
namespace {

    static bool size_allowed(uint64_t size, uint64_t cap) noexcept
    {
        if (cap != 0U && size > cap) {
            return false;
        }
        return size <= static_cast<uint64_t>(
                   std::numeric_limits<size_t>::max());
    }

}  // namespace

const char*
mapped_file_status_name(MappedFileStatus status) noexcept
{
    switch (status) {
    case MappedFileStatus::Ok: return "ok";
    case MappedFileStatus::OpenFailed: return "open_failed";
    case MappedFileStatus::StatFailed: return "stat_failed";
    case MappedFileStatus::TooLarge: return "too_large";
    case MappedFileStatus::MapFailed: return "map_failed";
    }
    return "unknown";
}


MappedFile::~MappedFile() noexcept
{
    close();
}


MappedFile::MappedFile(MappedFile&& other) noexcept
{
    take(&other);
}


MappedFile&
MappedFile::operator=(MappedFile&& other) noexcept
{
    if (this != &other) {
        close();
        take(&other);
    }
    return *this;
}


void
MappedFile::take(MappedFile* other) noexcept
{
#if defined(_WIN32)
    file_        = other->file_;
    map_         = other->map_;
    other->file_ = nullptr;
    other->map_  = nullptr;
#else
    fd_        = other->fd_;
    other->fd_ = -1;
#endif
    data_        = other->data_;
    size_        = other->size_;
    open_        = other->open_;
    other->data_ = nullptr;
    other->size_ = 0;
    other->open_ = false;
}


MappedFileStatus
MappedFile::open(const char* path, uint64_t max_file_bytes) noexcept
{
    close();
    if (!path || !*path) {
        return MappedFileStatus::OpenFailed;
    }

#if defined(_WIN32)
    HANDLE file = ::CreateFileA(path, GENERIC_READ, FILE_SHARE_READ, nullptr,
                                OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (file == INVALID_HANDLE_VALUE) {
        return MappedFileStatus::OpenFailed;
    }
    LARGE_INTEGER li;
    if (!::GetFileSizeEx(file, &li) || li.QuadPart < 0) {
        ::CloseHandle(file);
        return MappedFileStatus::StatFailed;
    }
    const uint64_t size = static_cast<uint64_t>(li.QuadPart);
    if (!size_allowed(size, max_file_bytes)) {
        ::CloseHandle(file);
        return MappedFileStatus::TooLarge;
    }
    HANDLE map = nullptr;
    if (size != 0U) {
        map = ::CreateFileMappingA(file, nullptr, PAGE_READONLY, 0, 0,
                                   nullptr);
        void* view = map ? ::MapViewOfFile(map, FILE_MAP_READ, 0, 0, 0)
                         : nullptr;
        if (!view) {
            if (map) {
                ::CloseHandle(map);
            }
            ::CloseHandle(file);
            return MappedFileStatus::MapFailed;
        }
        data_ = static_cast<const std::byte*>(view);
    }
    file_ = file;
    map_  = map;
#else
    const int fd = ::open(path, O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return MappedFileStatus::OpenFailed;
    }
    struct stat st {};
    if (::fstat(fd, &st) != 0 || st.st_size < 0) {
        (void)::close(fd);
        return MappedFileStatus::StatFailed;
    }
    const uint64_t size = static_cast<uint64_t>(st.st_size);
    if (!size_allowed(size, max_file_bytes)) {
        (void)::close(fd);
        return MappedFileStatus::TooLarge;
    }
    if (size != 0U) {
        void* view = ::mmap(nullptr, static_cast<size_t>(size), PROT_READ,
                            MAP_PRIVATE, fd, 0);
        if (view == MAP_FAILED) {
            (void)::close(fd);
            return MappedFileStatus::MapFailed;
        }
        data_ = static_cast<const std::byte*>(view);
    }
    fd_ = fd;
#endif
    size_ = size;
    open_ = true;
    return MappedFileStatus::Ok;
}


void
MappedFile::close() noexcept
{
    void* view = const_cast<void*>(static_cast<const void*>(data_));
#if defined(_WIN32)
    if (view) {
        ::UnmapViewOfFile(view);
    }
    if (map_) {
        ::CloseHandle(static_cast<HANDLE>(map_));
    }
    if (file_) {
        ::CloseHandle(static_cast<HANDLE>(file_));
    }
    file_ = nullptr;
    map_  = nullptr;
#else
    if (view) {
        (void)::munmap(view, static_cast<size_t>(size_));
    }
    if (fd_ >= 0) {
        (void)::close(fd_);
    }
    fd_ = -1;
#endif
    data_ = nullptr;
    size_ = 0;
    open_ = false;
}

}  // namespace metasplice
