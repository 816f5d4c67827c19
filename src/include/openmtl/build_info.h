#pragma once

#include <string>
#include <string_view>

/**
 * \file build_info.h
 * \brief Runtime information about how OpenMTL was built.
 */

namespace openmtl {

/**
 * \brief OpenMTL build information.
 *
 * Values are compiled into the binary at configure time.
 */
struct BuildInfo final {
    /// OpenMTL version string (e.g. "0.1.0").
    std::string_view version;

    /// Build timestamp in UTC (ISO-8601), or empty if not recorded.
    std::string_view build_timestamp_utc;

    /// Build type string (e.g. "Release", "Debug", "multi-config").
    std::string_view build_type;

    /// CMake generator used to configure the build (e.g. "Ninja").
    std::string_view cmake_generator;

    /// Target platform and CPU architecture.
    std::string_view system_name;
    std::string_view system_processor;

    /// Compiler ID and version.
    std::string_view cxx_compiler_id;
    std::string_view cxx_compiler_version;

    bool linkage_static = false;
    bool linkage_shared = false;

    /// Whether zlib was requested at configure time.
    bool option_with_zlib = false;
    /// Whether libbz2 was requested at configure time.
    bool option_with_bzip2 = false;
    /// Whether liblzma was requested at configure time.
    bool option_with_lzma = false;

    /// Whether zlib (deflate zip entries, gzip tar) is compiled in.
    bool has_zlib = false;
    /// Whether libbz2 (bzip2 tar) is compiled in.
    bool has_bzip2 = false;
    /// Whether liblzma (xz tar) is compiled in.
    bool has_lzma = false;
};

/// Returns build information for the linked OpenMTL library.
const BuildInfo&
build_info() noexcept;

/**
 * \brief Formats a stable, human-readable build info header (2 lines).
 *
 * - `OpenMTL vX.Y.Z <build_type> [features] <linkage>`
 * - `built with <compiler> for <system>/<arch> (<timestamp>)`
 */
void
format_build_info_lines(const BuildInfo& info, std::string* line1,
                        std::string* line2);

void
format_build_info_lines(std::string* line1, std::string* line2);

}  // namespace openmtl
