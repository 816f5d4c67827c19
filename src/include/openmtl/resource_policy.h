#pragma once

#include "openmtl/archive_reader.h"
#include "openmtl/landsat_archive.h"
#include "openmtl/mtl_text.h"
#include "openmtl/source_resolve.h"

#include <cstdint>

/**
 * \file resource_policy.h
 * \brief Resource budgets for untrusted scene sources.
 */

namespace openmtl {

/**
 * \brief Limits for untrusted metadata files and archives, in one place.
 *
 * Archive budgets are sized for full scenes (hundreds of MiB per band);
 * metadata budgets stay small since an MTL file is a few KiB.
 */
struct OpenMtlResourcePolicy final {
    /// MTL text budgets (file size, lines, nesting, records).
    MtlParseLimits parse_limits;

    /// Archive mapping, entry count and extraction budgets.
    ArchiveLimits archive_limits;
};

inline void
apply_resource_policy(const OpenMtlResourcePolicy& policy,
                      SourceResolveOptions* resolve) noexcept
{
    if (resolve) {
        resolve->archive_limits = policy.archive_limits;
    }
}

inline void
apply_resource_policy(const OpenMtlResourcePolicy& policy,
                      LandsatReadOptions* read) noexcept
{
    if (read) {
        read->parse_limits   = policy.parse_limits;
        read->archive_limits = policy.archive_limits;
    }
}

}  // namespace openmtl
