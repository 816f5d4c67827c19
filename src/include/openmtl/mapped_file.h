#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

/**
 * \file mapped_file.h
 * \brief Read-only file mapping helper.
 */

namespace openmtl {

/// Status code for \ref MappedFile operations.
enum class MappedFileStatus : uint8_t {
    Ok,
    OpenFailed,
    StatFailed,
    /// The path names a directory, device or other non-regular file.
    NotRegularFile,
    TooLarge,
    MapFailed,
};

/**
 * \brief Read-only, whole-file memory mapping.
 *
 * Scene archives are commonly several GB. Mapping lets the archive readers
 * walk entries in place and hand MTL text to the parser as a view, without
 * copying the file into memory.
 */
class MappedFile final {
public:
    MappedFile() noexcept;
    ~MappedFile() noexcept;

    MappedFile(const MappedFile&)            = delete;
    MappedFile& operator=(const MappedFile&) = delete;

    MappedFile(MappedFile&& other) noexcept;
    MappedFile& operator=(MappedFile&& other) noexcept;

    /// Opens and maps \p path (read-only). \p max_file_bytes is a hard cap (0 = unlimited).
    MappedFileStatus open(const char* path,
                          uint64_t max_file_bytes = 0) noexcept;

    /// Unmaps/closes the file (idempotent).
    void close() noexcept;

    /// Hints that the mapping is read front to back, as tar walks do.
    void advise_sequential() const noexcept;

    bool is_open() const noexcept;
    uint64_t size() const noexcept;
    std::span<const std::byte> bytes() const noexcept;
    /// The mapped bytes viewed as text.
    std::string_view text() const noexcept;

private:
#if defined(_WIN32)
    void* file_handle_ = nullptr;
    void* map_handle_  = nullptr;
#else
    int fd_ = -1;
#endif
    const std::byte* data_ = nullptr;
    uint64_t size_         = 0;
};

}  // namespace openmtl
