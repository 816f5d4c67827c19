#pragma once

#include "openmtl/mtl_store.h"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file band_map.h
 * \brief Sensor identification and band name to file name resolution.
 */

namespace openmtl {

inline constexpr std::string_view kProductMetadataGroup = "PRODUCT_METADATA";
inline constexpr std::string_view kSpacecraftIdKey      = "SPACECRAFT_ID";
inline constexpr std::string_view kSensorIdKey          = "SENSOR_ID";
inline constexpr std::string_view kBandFileKeyPrefix    = "FILE_NAME_BAND_";

/// Human-readable band alias (e.g. `red`) and the band code it stands for
/// (e.g. `4`, `6_VCID_1`, `QUALITY`).
struct BandAlias final {
    std::string_view alias;
    std::string_view code;
};

/// Alias table of one `<SPACECRAFT_ID>_<SENSOR_ID>` combination.
struct BandMapping final {
    std::string_view sensor_key;
    std::span<const BandAlias> aliases;

    /// Returns the alias entry (case-insensitive), or null.
    const BandAlias* find(std::string_view alias) const noexcept;
};

/// Built-in process-wide table (Landsat 1-8). Read-only.
std::span<const BandMapping>
default_band_map() noexcept;

/// Returns the mapping for \p sensor_key in \p table, or null.
const BandMapping*
find_band_mapping(std::span<const BandMapping> table,
                  std::string_view sensor_key) noexcept;

/// Band dispatch / resolution status.
enum class BandStatus : uint8_t {
    Ok,
    /// `SPACECRAFT_ID` or `SENSOR_ID` is missing from `PRODUCT_METADATA`.
    SensorIdentityMissing,
    /// No table entry for the spacecraft + sensor combination.
    BandMapMissing,
    /// The identifier matches neither a band code nor an alias.
    BandNotFound,
};

struct SensorIdentity final {
    std::string spacecraft;
    std::string sensor;
    /// `<spacecraft>_<sensor>`.
    std::string key;
};

/// Reads `SPACECRAFT_ID` and `SENSOR_ID` from `PRODUCT_METADATA`.
BandStatus
read_sensor_identity(const MtlStore& store, SensorIdentity* out);

struct BandDispatchResult final {
    BandStatus status = BandStatus::Ok;
    SensorIdentity sensor;
    /// Points into the table passed to \ref dispatch_band_mapping.
    const BandMapping* mapping = nullptr;
};

/// Identifies the sensor of \p store and selects its entry in \p table.
BandDispatchResult
dispatch_band_mapping(const MtlStore& store,
                      std::span<const BandMapping> table);

/**
 * \brief Band code to file name index built from `FILE_NAME_BAND_<code>`.
 *
 * Codes are taken as written after the prefix (`4`, `6_VCID_1`, `QUALITY`).
 */
class BandFileIndex final {
public:
    struct Entry final {
        std::string code;
        std::string file_name;
    };

    /// Rebuilds the index from `PRODUCT_METADATA` of \p store.
    MtlGroupStatus build(const MtlStore& store);
    void clear() noexcept { entries_.clear(); }

    /// Returns the file name for \p code, or null.
    const std::string* find(std::string_view code) const noexcept;

    std::span<const Entry> entries() const noexcept;
    size_t size() const noexcept { return entries_.size(); }

private:
    std::vector<Entry> entries_;
};

/// Returns true when \p key is `FILE_NAME_BAND_<code>`; \p code receives
/// the suffix, which starts with a digit or a letter.
bool
match_band_file_key(std::string_view key, std::string_view* code) noexcept;

/**
 * \brief Resolves a band code or alias to a file name.
 *
 * \p id is looked up in \p index first; otherwise it is translated through
 * \p mapping (alias to code) and looked up again.
 */
BandStatus
resolve_band(const BandFileIndex& index, const BandMapping* mapping,
             std::string_view id, std::string_view* file_name) noexcept;

}  // namespace openmtl
