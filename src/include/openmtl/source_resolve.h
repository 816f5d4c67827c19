#pragma once

#include "openmtl/archive_reader.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

/**
 * \file source_resolve.h
 * \brief Classifies a scene source and locates its MTL file.
 */

namespace openmtl {

/// Default metadata file name pattern (`..._MTL.txt`, case-insensitive).
inline constexpr std::string_view kDefaultMetadataPattern = R"(.*_?MTL\.txt)";

/// Kind of source handed to \ref resolve_source.
enum class SourceKind : uint8_t {
    Unknown,
    Directory,
    /// A standalone `.txt` metadata file.
    MetadataFile,
    /// A zip or tar container, detected by content.
    Archive,
};

/// Source resolution status.
enum class ResolveStatus : uint8_t {
    Ok,
    /// Not a directory, not a `.txt` file and not a recognized archive.
    UnsupportedSource,
    /// No directory or archive entry matches the metadata pattern.
    MetadataFileMissing,
    /// The metadata pattern is not a valid regular expression.
    InvalidPattern,
    /// Listing or extracting the archive failed; see
    /// \ref ResolveResult::archive.
    ArchiveFailed,
};

struct SourceResolveOptions final {
    /// ECMAScript regular expression matched (case-insensitively) against
    /// the whole base name of each candidate.
    std::string metadata_pattern = std::string(kDefaultMetadataPattern);
    /// Extraction directory for archives. Empty selects a sibling directory
    /// named after the archive file name up to its first `.`.
    std::string extract_to;
    ArchiveLimits archive_limits;
};

/// Where the metadata of a source ended up.
struct ResolvedSource final {
    SourceKind kind              = SourceKind::Unknown;
    ArchiveFormat archive_format = ArchiveFormat::Unknown;
    /// Directory that band file names are relative to.
    std::string base_dir;
    /// Path of the MTL file to parse.
    std::string metadata_path;
    /// Extraction directory (archives only).
    std::string extracted_to;
};

struct ResolveResult final {
    ResolveStatus status = ResolveStatus::Ok;
    SourceKind kind      = SourceKind::Unknown;
    /// Archive detail (archives only).
    ArchiveReadResult archive;
};

/// Classifies \p path by filesystem type, suffix and content.
SourceKind
classify_source(std::string_view path);

/// Returns the directory an archive extracts to by default.
std::string
default_extract_dir(std::string_view archive_path);

/// Returns the part of \p name after the last `/` or `\`.
std::string_view
entry_base_name(std::string_view name) noexcept;

/**
 * \brief Finds the first of \p names whose base name matches \p pattern.
 *
 * \param index Receives the position in \p names of the match.
 */
ResolveStatus
find_metadata_entry(std::span<const std::string> names,
                    std::string_view pattern, size_t* index);

/**
 * \brief Returns the base name of the first metadata match in \p names.
 *
 * `sniff_metadata_name({"foo", "bar", "foo/bar/landsat_mtl.txt"},
 * ".+_mtl.txt", &out)` yields `landsat_mtl.txt`.
 */
ResolveStatus
sniff_metadata_name(std::span<const std::string> names,
                    std::string_view pattern, std::string* out);

/**
 * \brief Resolves \p source to an MTL file path.
 *
 * - directory: first entry (in listing order) matching the pattern.
 * - `.txt` file: used as is; its parent is the base directory.
 * - archive: entries are listed, the MTL entry located, then all entries
 *   are extracted. The archive is released before returning.
 *
 * \p out is written only on success.
 */
ResolveResult
resolve_source(std::string_view source, const SourceResolveOptions& options,
               ResolvedSource* out);

}  // namespace openmtl
