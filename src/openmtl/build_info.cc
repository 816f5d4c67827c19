#include "openmtl/build_info.h"

#include "openmtl/build_info_generated.h"

namespace openmtl {
namespace {

    static constexpr bool linkage_static() noexcept
    {
#if defined(OPENMTL_BUILD_LINKAGE_STATIC) && OPENMTL_BUILD_LINKAGE_STATIC
        return true;
#else
        return false;
#endif
    }

    static constexpr bool linkage_shared() noexcept
    {
#if defined(OPENMTL_BUILD_LINKAGE_SHARED) && OPENMTL_BUILD_LINKAGE_SHARED
        return true;
#else
        return false;
#endif
    }

    static constexpr bool has_zlib() noexcept
    {
#if defined(OPENMTL_HAS_ZLIB) && OPENMTL_HAS_ZLIB
        return true;
#else
        return false;
#endif
    }

    static constexpr bool has_bzip2() noexcept
    {
#if defined(OPENMTL_HAS_BZIP2) && OPENMTL_HAS_BZIP2
        return true;
#else
        return false;
#endif
    }

    static constexpr bool has_lzma() noexcept
    {
#if defined(OPENMTL_HAS_LZMA) && OPENMTL_HAS_LZMA
        return true;
#else
        return false;
#endif
    }

    static constexpr BuildInfo kBuildInfo = {
        /*version=*/OPENMTL_BUILDINFO_VERSION,
        /*build_timestamp_utc=*/OPENMTL_BUILDINFO_BUILD_TIMESTAMP_UTC,
        /*build_type=*/OPENMTL_BUILDINFO_BUILD_TYPE,
        /*cmake_generator=*/OPENMTL_BUILDINFO_CMAKE_GENERATOR,
        /*system_name=*/OPENMTL_BUILDINFO_SYSTEM_NAME,
        /*system_processor=*/OPENMTL_BUILDINFO_SYSTEM_PROCESSOR,
        /*cxx_compiler_id=*/OPENMTL_BUILDINFO_CXX_COMPILER_ID,
        /*cxx_compiler_version=*/OPENMTL_BUILDINFO_CXX_COMPILER_VERSION,
        /*linkage_static=*/linkage_static(),
        /*linkage_shared=*/linkage_shared(),
        /*option_with_zlib=*/static_cast<bool>(OPENMTL_BUILDINFO_WITH_ZLIB),
        /*option_with_bzip2=*/static_cast<bool>(OPENMTL_BUILDINFO_WITH_BZIP2),
        /*option_with_lzma=*/static_cast<bool>(OPENMTL_BUILDINFO_WITH_LZMA),
        /*has_zlib=*/has_zlib(),
        /*has_bzip2=*/has_bzip2(),
        /*has_lzma=*/has_lzma(),
    };


    static const char* linkage_string(const BuildInfo& bi) noexcept
    {
        if (bi.linkage_static) {
            return "static";
        }
        if (bi.linkage_shared) {
            return "shared";
        }
        return "unknown";
    }

}  // namespace

const BuildInfo&
build_info() noexcept
{
    return kBuildInfo;
}


void
format_build_info_lines(const BuildInfo& bi, std::string* line1,
                        std::string* line2)
{
    if (line1) {
        line1->assign("OpenMTL v");
        line1->append(bi.version);
        line1->push_back(' ');
        line1->append(bi.build_type);
        line1->append(" [");
        bool first = true;
        if (bi.has_zlib) {
            line1->append("zlib");
            first = false;
        }
        if (bi.has_bzip2) {
            if (!first) {
                line1->append(",");
            }
            line1->append("bzip2");
            first = false;
        }
        if (bi.has_lzma) {
            if (!first) {
                line1->append(",");
            }
            line1->append("lzma");
        }
        line1->append("] ");
        line1->append(linkage_string(bi));
    }

    if (line2) {
        line2->assign("built with ");
        line2->append(bi.cxx_compiler_id);
        line2->push_back('-');
        line2->append(bi.cxx_compiler_version);
        line2->append(" for ");
        line2->append(bi.system_name);
        line2->push_back('/');
        line2->append(bi.system_processor);
        if (!bi.build_timestamp_utc.empty()) {
            line2->append(" (");
            line2->append(bi.build_timestamp_utc);
            line2->push_back(')');
        }
    }
}


void
format_build_info_lines(std::string* line1, std::string* line2)
{
    format_build_info_lines(build_info(), line1, line2);
}

}  // namespace openmtl
