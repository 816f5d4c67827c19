#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file archive_reader.h
 * \brief Scene archive access (zip, and tar plain or compressed with gzip,
 * bzip2 or xz).
 *
 * The format is detected from file content, never from the extension.
 * After \ref open_archive_reader callers use the \ref ArchiveReader
 * interface only and never branch on the format again.
 */

namespace openmtl {

/// Archive container formats recognized by \ref sniff_archive.
enum class ArchiveFormat : uint8_t {
    Unknown,
    Zip,
    Tar,
    /// A tar stream wrapped in gzip.
    TarGzip,
    /// A tar stream wrapped in bzip2.
    TarBzip2,
    /// A tar stream wrapped in xz.
    TarXz,
};

/// Archive operation status.
enum class ArchiveReadStatus : uint8_t {
    Ok,
    /// The archive file could not be opened or mapped.
    OpenFailed,
    /// The bytes are not a recognized archive, or an entry uses a feature
    /// that is not supported (encryption, unknown compression, or a
    /// decompressor this build was configured without).
    Unsupported,
    /// The archive structure is malformed or inconsistent.
    Malformed,
    /// A budget in \ref ArchiveLimits was exceeded.
    LimitExceeded,
    /// An entry name is absolute or escapes the destination with `..`.
    UnsafePath,
    /// A destination directory or file could not be created or written.
    WriteFailed,
};

/// Resource limits applied to untrusted archives.
struct ArchiveLimits final {
    /// Optional archive file size cap (0 = unlimited).
    uint64_t max_file_bytes = 0;
    uint32_t max_entries    = 1U << 16;
    /// Largest single entry after decompression.
    uint64_t max_entry_bytes = 8ULL * 1024ULL * 1024ULL * 1024ULL;
    /// Sum of all entries after decompression.
    uint64_t max_total_bytes = 64ULL * 1024ULL * 1024ULL * 1024ULL;
};

struct ArchiveReadResult final {
    ArchiveReadStatus status = ArchiveReadStatus::Ok;
    /// Entries listed or extracted.
    uint32_t entries = 0;
    /// Bytes written to the destination.
    uint64_t bytes_written = 0;
};

/**
 * \brief Detects the archive format of \p bytes.
 *
 * - zip: an end-of-central-directory record within the trailing 64 KiB.
 * - tar: a first header block with a valid checksum.
 * - gzip, bzip2, xz: the stream signature, and a valid tar header after
 *   decompressing the first block (requires zlib, libbz2 or liblzma).
 */
ArchiveFormat
sniff_archive(std::span<const std::byte> bytes) noexcept;

/**
 * \brief Read access to one opened archive.
 *
 * Implementations own the mapped archive file. \ref close releases it and is
 * also called by the destructor, so the archive is released on every path.
 */
class ArchiveReader {
public:
    virtual ~ArchiveReader() = default;

    virtual ArchiveFormat format() const noexcept = 0;

    /// Appends all entry names (as stored, including directories) to \p out.
    virtual ArchiveReadResult
    list_entries(std::vector<std::string>* out) = 0;

    /// Writes all regular entries below \p destination, creating directories
    /// as needed. Existing files are overwritten.
    virtual ArchiveReadResult extract_all(std::string_view destination) = 0;

    /// Releases the archive file (idempotent).
    virtual void close() noexcept = 0;
};

/**
 * \brief Opens \p path, sniffs its format and creates the matching reader.
 *
 * On success \p out owns the reader; on failure \p out is reset.
 */
ArchiveReadResult
open_archive_reader(const char* path, const ArchiveLimits& limits,
                    std::unique_ptr<ArchiveReader>* out);

/// Returns true when \p name is relative and has no `..` component.
bool
is_safe_entry_name(std::string_view name) noexcept;

}  // namespace openmtl
