#pragma once

#include "openmtl/archive_reader.h"
#include "openmtl/mapped_file.h"

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace openmtl::archive_internal {

static constexpr size_t kTarBlockSize = 512;

uint16_t
read_u16le(std::span<const std::byte> bytes, uint64_t off) noexcept;
uint32_t
read_u32le(std::span<const std::byte> bytes, uint64_t off) noexcept;
uint64_t
read_u64le(std::span<const std::byte> bytes, uint64_t off) noexcept;

/// True when [off, off + size) lies within \p bytes.
bool
in_range(std::span<const std::byte> bytes, uint64_t off,
         uint64_t size) noexcept;

/// Locates the zip end-of-central-directory record.
bool
find_zip_eocd(std::span<const std::byte> bytes, uint64_t* eocd_off) noexcept;

/// True when \p block is a non-zero tar header with a valid checksum.
bool
is_tar_header(std::span<const std::byte> block) noexcept;

/// Maps a gzip, bzip2 or xz stream signature to the compressed tar format
/// it would carry; \ref ArchiveFormat::Unknown otherwise.
ArchiveFormat
compressed_stream_format(std::span<const std::byte> bytes) noexcept;

/// Decompresses up to \p out.size() bytes from the start of a \p format
/// stream. Returns the number of bytes produced (0 when the decompressor
/// is not built in).
size_t
decompress_prefix(ArchiveFormat format, std::span<const std::byte> bytes,
                  std::span<std::byte> out) noexcept;

/// Write-only file that is closed on destruction.
class OutputFile final {
public:
    OutputFile() noexcept = default;
    ~OutputFile() noexcept;

    OutputFile(const OutputFile&)            = delete;
    OutputFile& operator=(const OutputFile&) = delete;

    bool open(const std::string& path) noexcept;
    bool write(const std::byte* data, size_t size) noexcept;
    /// Flushes and closes; false when any write or the close failed.
    bool close() noexcept;

private:
    std::FILE* f_ = nullptr;
    bool failed_  = false;
};

/**
 * \brief Maps an entry name to a path below \p destination.
 *
 * Rejects unsafe names, creates the entry directory (for \p is_directory)
 * or the parent directory of a file entry.
 */
ArchiveReadStatus
prepare_entry_path(std::string_view destination, std::string_view name,
                   bool is_directory, std::string* out_path);

std::unique_ptr<ArchiveReader>
make_zip_reader(MappedFile&& file, const ArchiveLimits& limits);

std::unique_ptr<ArchiveReader>
make_tar_reader(MappedFile&& file, ArchiveFormat format,
                const ArchiveLimits& limits);

}  // namespace openmtl::archive_internal
