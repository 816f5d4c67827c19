#pragma once

#include "openmtl/band_map.h"
#include "openmtl/mtl_store.h"
#include "openmtl/source_resolve.h"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

/**
 * \file landsat_archive.h
 * \brief One-call pipeline: source -> MTL -> sensor -> band file index.
 */

namespace openmtl {

/// Inputs of \ref LandsatArchive::read.
struct LandsatReadOptions final {
    /// Archive extraction directory (empty = sibling named after the archive).
    std::string extract_to;
    /// Optional caller label stored on the archive.
    std::string alias;
    /// Metadata file name pattern; see \ref SourceResolveOptions.
    std::string metadata_pattern = std::string(kDefaultMetadataPattern);
    /// Sensor band tables. Empty selects \ref default_band_map. A custom
    /// table must outlive every archive read with it.
    std::span<const BandMapping> band_map;
    MtlParseLimits parse_limits;
    ArchiveLimits archive_limits;
};

/// Pipeline status.
enum class LandsatStatus : uint8_t {
    Ok,
    UnsupportedSource,
    /// No metadata file matches the pattern.
    MetadataFileMissing,
    InvalidPattern,
    /// See \ref LandsatReadResult::resolve.
    ArchiveFailed,
    /// The metadata file could not be opened or mapped.
    ReadFailed,
    /// Malformed metadata; see \ref LandsatReadResult::parse.
    ParseFailed,
    LimitExceeded,
    /// `SPACECRAFT_ID` or `SENSOR_ID` is missing.
    SensorIdentityMissing,
    /// No band table for \ref LandsatReadResult::sensor_key.
    BandMapMissing,
};

/// Last pipeline stage reached. Stages only move forward.
enum class LandsatStage : uint8_t {
    Unresolved,
    MetadataLocated,
    SensorIdentified,
    BandIndexReady,
};

struct LandsatReadResult final {
    LandsatStatus status = LandsatStatus::Ok;
    LandsatStage stage   = LandsatStage::Unresolved;
    ResolveResult resolve;
    MtlParseResult parse;
    /// `<SPACECRAFT_ID>_<SENSOR_ID>` once the sensor is identified.
    std::string sensor_key;
};

/**
 * \brief A resolved scene: base directory, parsed metadata, band table and
 * band file index.
 *
 * Only \ref read produces a populated instance; a failed read leaves the
 * target untouched.
 */
class LandsatArchive final {
public:
    LandsatArchive() = default;

    /// Runs the full pipeline over \p source and assigns \p out on success.
    static LandsatReadResult read(std::string_view source,
                                  const LandsatReadOptions& options,
                                  LandsatArchive* out);

    /// Directory band file names are relative to.
    const std::string& source_dir() const noexcept { return source_dir_; }
    const std::string& alias() const noexcept { return alias_; }
    const ResolvedSource& resolved() const noexcept { return resolved_; }
    const SensorIdentity& sensor() const noexcept { return sensor_; }

    const MtlStore& metadata() const noexcept { return metadata_; }
    const BandMapping* mapping() const noexcept { return mapping_; }
    const BandFileIndex& bands() const noexcept { return bands_; }

    /// Resolves a band code (`4`, `QUALITY`) or an alias (`red`).
    BandStatus resolve_band(std::string_view id,
                            std::string_view* file_name) const noexcept;
    /// Resolves a numeric band code.
    BandStatus resolve_band(uint32_t band, std::string_view* file_name) const;

    /// Resolves \p id and joins the file name with \ref source_dir.
    BandStatus band_path(std::string_view id, std::string* path) const;

private:
    std::string source_dir_;
    std::string alias_;
    ResolvedSource resolved_;
    SensorIdentity sensor_;
    MtlStore metadata_;
    const BandMapping* mapping_ = nullptr;
    BandFileIndex bands_;
};

}  // namespace openmtl
