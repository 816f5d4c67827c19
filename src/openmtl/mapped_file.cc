#include "openmtl/mapped_file.h"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <utility>

#if defined(_WIN32)
#    define WIN32_LEAN_AND_MEAN
#    include <windows.h>
#else
#    include <fcntl.h>
#    include <sys/mman.h>
#    include <sys/stat.h>
#    include <unistd.h>
#endif

namespace openmtl {
namespace {

    /// Native handles of one file while it is opened, sized and mapped.
    struct NativeFile final {
#if defined(_WIN32)
        HANDLE file = nullptr;
        HANDLE map  = nullptr;
#else
        int fd = -1;
#endif
        const std::byte* data = nullptr;
        uint64_t size         = 0;
    };

    static MappedFileStatus open_regular(const char* path,
                                         NativeFile* f) noexcept
    {
#if defined(_WIN32)
        const DWORD attrs = ::GetFileAttributesA(path);
        if (attrs != INVALID_FILE_ATTRIBUTES
            && (attrs & FILE_ATTRIBUTE_DIRECTORY) != 0) {
            return MappedFileStatus::NotRegularFile;
        }
        HANDLE h = ::CreateFileA(path, GENERIC_READ, FILE_SHARE_READ,
                                 nullptr, OPEN_EXISTING,
                                 FILE_ATTRIBUTE_NORMAL, nullptr);
        if (h == INVALID_HANDLE_VALUE) {
            return MappedFileStatus::OpenFailed;
        }
        f->file = h;

        LARGE_INTEGER sz;
        if (!::GetFileSizeEx(h, &sz) || sz.QuadPart < 0) {
            return MappedFileStatus::StatFailed;
        }
        f->size = static_cast<uint64_t>(sz.QuadPart);
#else
        f->fd = ::open(path, O_RDONLY);
        if (f->fd < 0) {
            return MappedFileStatus::OpenFailed;
        }
        struct stat st {};
        if (::fstat(f->fd, &st) != 0 || st.st_size < 0) {
            return MappedFileStatus::StatFailed;
        }
        // Scene directories and devices are never metadata or archives.
        if (!S_ISREG(st.st_mode)) {
            return MappedFileStatus::NotRegularFile;
        }
        f->size = static_cast<uint64_t>(st.st_size);
#endif
        return MappedFileStatus::Ok;
    }

    static MappedFileStatus check_size(uint64_t size,
                                       uint64_t max_file_bytes) noexcept
    {
        if (max_file_bytes != 0U && size > max_file_bytes) {
            return MappedFileStatus::TooLarge;
        }
        if (size > static_cast<uint64_t>(
                std::numeric_limits<size_t>::max())) {
            return MappedFileStatus::TooLarge;
        }
        return MappedFileStatus::Ok;
    }

    // Empty files stay unmapped; they read as an empty span.
    static MappedFileStatus map_whole(NativeFile* f) noexcept
    {
        if (f->size == 0U) {
            return MappedFileStatus::Ok;
        }
#if defined(_WIN32)
        f->map = ::CreateFileMappingA(
            f->file, nullptr, PAGE_READONLY,
            static_cast<DWORD>((f->size >> 32) & 0xFFFFFFFFu),
            static_cast<DWORD>(f->size & 0xFFFFFFFFu), nullptr);
        if (!f->map) {
            return MappedFileStatus::MapFailed;
        }
        void* p = ::MapViewOfFile(f->map, FILE_MAP_READ, 0, 0, 0);
        if (!p) {
            return MappedFileStatus::MapFailed;
        }
#else
        void* p = ::mmap(nullptr, static_cast<size_t>(f->size), PROT_READ,
                         MAP_PRIVATE, f->fd, 0);
        if (p == MAP_FAILED) {
            return MappedFileStatus::MapFailed;
        }
#endif
        f->data = static_cast<const std::byte*>(p);
        return MappedFileStatus::Ok;
    }

    static void release(NativeFile* f) noexcept
    {
#if defined(_WIN32)
        if (f->data) {
            ::UnmapViewOfFile(const_cast<void*>(
                static_cast<const void*>(f->data)));
        }
        if (f->map) {
            ::CloseHandle(f->map);
        }
        if (f->file) {
            ::CloseHandle(f->file);
        }
        f->file = nullptr;
        f->map  = nullptr;
#else
        if (f->data) {
            (void)::munmap(const_cast<void*>(
                               static_cast<const void*>(f->data)),
                           static_cast<size_t>(f->size));
        }
        if (f->fd >= 0) {
            (void)::close(f->fd);
        }
        f->fd = -1;
#endif
        f->data = nullptr;
        f->size = 0;
    }

}  // namespace

MappedFile::MappedFile() noexcept = default;


MappedFile::~MappedFile() noexcept
{
    close();
}


MappedFile::MappedFile(MappedFile&& other) noexcept
{
    *this = std::move(other);
}


MappedFile&
MappedFile::operator=(MappedFile&& other) noexcept
{
    if (this == &other) {
        return *this;
    }
    close();

#if defined(_WIN32)
    file_handle_ = std::exchange(other.file_handle_, nullptr);
    map_handle_  = std::exchange(other.map_handle_, nullptr);
#else
    fd_ = std::exchange(other.fd_, -1);
#endif
    data_ = std::exchange(other.data_, nullptr);
    size_ = std::exchange(other.size_, 0);
    return *this;
}


MappedFileStatus
MappedFile::open(const char* path, uint64_t max_file_bytes) noexcept
{
    close();

    if (!path || !*path) {
        return MappedFileStatus::OpenFailed;
    }

    NativeFile f;
    MappedFileStatus st = open_regular(path, &f);
    if (st == MappedFileStatus::Ok) {
        st = check_size(f.size, max_file_bytes);
    }
    if (st == MappedFileStatus::Ok) {
        st = map_whole(&f);
    }
    if (st != MappedFileStatus::Ok) {
        release(&f);
        return st;
    }

#if defined(_WIN32)
    file_handle_ = static_cast<void*>(f.file);
    map_handle_  = static_cast<void*>(f.map);
#else
    fd_ = f.fd;
#endif
    data_ = f.data;
    size_ = f.size;
    return MappedFileStatus::Ok;
}


void
MappedFile::close() noexcept
{
    NativeFile f;
#if defined(_WIN32)
    f.file = static_cast<HANDLE>(std::exchange(file_handle_, nullptr));
    f.map  = static_cast<HANDLE>(std::exchange(map_handle_, nullptr));
#else
    f.fd = std::exchange(fd_, -1);
#endif
    f.data = std::exchange(data_, nullptr);
    f.size = std::exchange(size_, 0);
    release(&f);
}


void
MappedFile::advise_sequential() const noexcept
{
#if !defined(_WIN32)
    if (data_) {
        (void)::posix_madvise(const_cast<void*>(
                                  static_cast<const void*>(data_)),
                              static_cast<size_t>(size_),
                              POSIX_MADV_SEQUENTIAL);
    }
#endif
}


bool
MappedFile::is_open() const noexcept
{
#if defined(_WIN32)
    return file_handle_ != nullptr;
#else
    return fd_ >= 0;
#endif
}


uint64_t
MappedFile::size() const noexcept
{
    return size_;
}


std::span<const std::byte>
MappedFile::bytes() const noexcept
{
    if (size_ == 0U) {
        return {};
    }
    return std::span<const std::byte>(data_, static_cast<size_t>(size_));
}


std::string_view
MappedFile::text() const noexcept
{
    if (size_ == 0U) {
        return {};
    }
    return std::string_view(reinterpret_cast<const char*>(data_),
                            static_cast<size_t>(size_));
}

}  // namespace openmtl
