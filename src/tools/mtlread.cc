#include "openmtl/build_info.h"
#include "openmtl/console_format.h"
#include "openmtl/landsat_archive.h"
#include "openmtl/resource_policy.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

namespace openmtl {
namespace {

    static const char* landsat_status_name(LandsatStatus status) noexcept
    {
        switch (status) {
        case LandsatStatus::Ok: return "ok";
        case LandsatStatus::UnsupportedSource: return "unsupported_source";
        case LandsatStatus::MetadataFileMissing: return "metadata_file_missing";
        case LandsatStatus::InvalidPattern: return "invalid_pattern";
        case LandsatStatus::ArchiveFailed: return "archive_failed";
        case LandsatStatus::ReadFailed: return "read_failed";
        case LandsatStatus::ParseFailed: return "parse_failed";
        case LandsatStatus::LimitExceeded: return "limit_exceeded";
        case LandsatStatus::SensorIdentityMissing:
            return "sensor_identity_missing";
        case LandsatStatus::BandMapMissing: return "band_map_missing";
        }
        return "unknown";
    }

    static const char* parse_status_name(MtlParseStatus status) noexcept
    {
        switch (status) {
        case MtlParseStatus::Ok: return "ok";
        case MtlParseStatus::ReadFailed: return "read_failed";
        case MtlParseStatus::LimitExceeded: return "limit_exceeded";
        case MtlParseStatus::DivergingTags: return "diverging_tags";
        case MtlParseStatus::UnbalancedGroup: return "unbalanced_group";
        case MtlParseStatus::StrayStatement: return "stray_statement";
        case MtlParseStatus::NoMetadata: return "no_metadata";
        }
        return "unknown";
    }

    static const char* archive_status_name(ArchiveReadStatus status) noexcept
    {
        switch (status) {
        case ArchiveReadStatus::Ok: return "ok";
        case ArchiveReadStatus::OpenFailed: return "open_failed";
        case ArchiveReadStatus::Unsupported: return "unsupported";
        case ArchiveReadStatus::Malformed: return "malformed";
        case ArchiveReadStatus::LimitExceeded: return "limit_exceeded";
        case ArchiveReadStatus::UnsafePath: return "unsafe_path";
        case ArchiveReadStatus::WriteFailed: return "write_failed";
        }
        return "unknown";
    }

    static const char* source_kind_name(SourceKind kind) noexcept
    {
        switch (kind) {
        case SourceKind::Unknown: return "unknown";
        case SourceKind::Directory: return "directory";
        case SourceKind::MetadataFile: return "metadata_file";
        case SourceKind::Archive: return "archive";
        }
        return "unknown";
    }

    static const char* archive_format_name(ArchiveFormat format) noexcept
    {
        switch (format) {
        case ArchiveFormat::Unknown: return "-";
        case ArchiveFormat::Zip: return "zip";
        case ArchiveFormat::Tar: return "tar";
        case ArchiveFormat::TarGzip: return "tar.gz";
        case ArchiveFormat::TarBzip2: return "tar.bz2";
        case ArchiveFormat::TarXz: return "tar.xz";
        }
        return "-";
    }

    static bool parse_u32_arg(const char* s, uint32_t* out)
    {
        if (!s || !*s) {
            return false;
        }
        char* end       = nullptr;
        unsigned long v = std::strtoul(s, &end, 10);
        if (!end || *end != '\0') {
            return false;
        }
        if (v > 0xFFFFFFFFUL) {
            return false;
        }
        *out = static_cast<uint32_t>(v);
        return true;
    }

    static bool parse_u64_arg(const char* s, uint64_t* out)
    {
        if (!s || !*s) {
            return false;
        }
        char* end            = nullptr;
        unsigned long long v = std::strtoull(s, &end, 10);
        if (!end || *end != '\0') {
            return false;
        }
        *out = static_cast<uint64_t>(v);
        return true;
    }

    static std::string escaped(std::string_view s, uint32_t max_bytes)
    {
        std::string out;
        (void)append_console_escaped_ascii(s, max_bytes, &out);
        return out;
    }

    static void print_failure(const char* source, const LandsatReadResult& r)
    {
        std::fprintf(stderr, "mtlread: `%s`: %s", source,
                     landsat_status_name(r.status));
        switch (r.status) {
        case LandsatStatus::ArchiveFailed:
            std::fprintf(stderr, " (archive=%s entries=%u)",
                         archive_status_name(r.resolve.archive.status),
                         r.resolve.archive.entries);
            break;
        case LandsatStatus::ParseFailed:
        case LandsatStatus::LimitExceeded:
            std::fprintf(stderr, " (parse=%s line=%u)",
                         parse_status_name(r.parse.status), r.parse.line);
            break;
        case LandsatStatus::BandMapMissing:
            std::fprintf(stderr, " (sensor=%s)",
                         escaped(r.sensor_key, 64).c_str());
            break;
        default: break;
        }
        std::fprintf(stderr, "\n");
    }

    static void print_record(const MtlRecord& rec, uint32_t max_bytes)
    {
        std::printf("GROUP %s\n", escaped(rec.group, max_bytes).c_str());
        std::string line;
        for (const MtlField& f : MtlGroupView(&rec)) {
            line.assign("  ");
            (void)append_console_escaped_ascii(f.key, max_bytes, &line);
            line.append(" = ");
            append_console_value(f.value, max_bytes, &line);
            line.append(" (");
            line.append(value_kind_name(f.value.kind));
            line.push_back(')');
            std::printf("%s\n", line.c_str());
        }
    }

    static void usage(const char* argv0)
    {
        std::printf("usage: %s [options] <source> [source...]\n", argv0);
        std::printf("  <source> is a scene directory, an MTL .txt file, or a zip/tar archive\n");
        std::printf("options:\n");
        std::printf("  --version            print build info and exit\n");
        std::printf("  --no-build-info      hide build info header\n");
        std::printf("  --no-groups          hide metadata groups\n");
        std::printf("  --group NAME         only print group NAME\n");
        std::printf("  --band ID            resolve band code or alias (repeatable)\n");
        std::printf("  --pattern REGEX      metadata file name pattern (default: %s)\n",
                    std::string(kDefaultMetadataPattern).c_str());
        std::printf("  --extract-to DIR     archive extraction directory\n");
        std::printf("  --alias NAME         label attached to the scene\n");
        std::printf(
            "  --max-bytes N        max bytes to print per value (default: 256)\n");
        std::printf(
            "  --max-file-bytes N   refuse MTL files larger than N bytes (default: 16777216; 0=unlimited)\n");
    }

    static bool takes_value(const char* arg) noexcept
    {
        static constexpr const char* kValueFlags[] = {
            "--group",   "--band",      "--pattern",        "--extract-to",
            "--alias",   "--max-bytes", "--max-file-bytes",
        };
        for (const char* flag : kValueFlags) {
            if (std::strcmp(arg, flag) == 0) {
                return true;
            }
        }
        return false;
    }

    static void print_build_info_header()
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(&line1, &line2);
        std::printf("%s\n", line1.c_str());
        std::printf("%s\n", line2.c_str());
    }

}  // namespace
}  // namespace openmtl

int
main(int argc, char** argv)
{
    using namespace openmtl;

    bool show_build_info = true;
    bool show_groups     = true;
    std::string only_group;
    std::vector<std::string> bands;
    uint32_t max_bytes = 256;

    OpenMtlResourcePolicy policy;
    LandsatReadOptions options;

    int first_path = 1;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (!arg) {
            continue;
        }
        if (std::strcmp(arg, "--help") == 0) {
            usage(argv[0]);
            return 0;
        }
        if (std::strcmp(arg, "--version") == 0) {
            print_build_info_header();
            return 0;
        }
        if (std::strcmp(arg, "--no-build-info") == 0) {
            show_build_info = false;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--no-groups") == 0) {
            show_groups = false;
            first_path += 1;
            continue;
        }
        if (takes_value(arg) && i + 1 >= argc) {
            std::fprintf(stderr, "missing value for %s\n", arg);
            return 2;
        }
        if (std::strcmp(arg, "--group") == 0 && i + 1 < argc) {
            only_group = argv[i + 1];
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--band") == 0 && i + 1 < argc) {
            bands.emplace_back(argv[i + 1]);
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--pattern") == 0 && i + 1 < argc) {
            options.metadata_pattern = argv[i + 1];
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--extract-to") == 0 && i + 1 < argc) {
            options.extract_to = argv[i + 1];
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--alias") == 0 && i + 1 < argc) {
            options.alias = argv[i + 1];
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--max-bytes") == 0 && i + 1 < argc) {
            uint32_t v = 0;
            if (!parse_u32_arg(argv[i + 1], &v)) {
                std::fprintf(stderr, "invalid --max-bytes value\n");
                return 2;
            }
            max_bytes = v;
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--max-file-bytes") == 0 && i + 1 < argc) {
            uint64_t v = 0;
            if (!parse_u64_arg(argv[i + 1], &v)) {
                std::fprintf(stderr, "invalid --max-file-bytes value\n");
                return 2;
            }
            policy.parse_limits.max_file_bytes = v;
            i += 1;
            first_path += 2;
            continue;
        }
        break;
    }

    if (argc <= first_path) {
        usage(argv[0]);
        return 2;
    }

    if (show_build_info) {
        print_build_info_header();
    }
    apply_resource_policy(policy, &options);

    int exit_code = 0;
    for (int argi = first_path; argi < argc; ++argi) {
        const char* source = argv[argi];
        if (!source || !*source) {
            continue;
        }

        LandsatArchive scene;
        const LandsatReadResult r = LandsatArchive::read(source, options,
                                                         &scene);
        if (r.status != LandsatStatus::Ok) {
            print_failure(source, r);
            exit_code = 1;
            continue;
        }

        const ResolvedSource& resolved = scene.resolved();
        std::printf("== %s\n", escaped(source, 0).c_str());
        std::printf("source=%s format=%s sensor=%s groups=%u records=%u\n",
                    source_kind_name(resolved.kind),
                    archive_format_name(resolved.archive_format),
                    escaped(scene.sensor().key, 64).c_str(),
                    static_cast<unsigned>(scene.metadata().group_count()),
                    r.parse.records);
        std::printf("metadata=%s\n",
                    escaped(resolved.metadata_path, 0).c_str());
        std::printf("base_dir=%s\n", escaped(scene.source_dir(), 0).c_str());
        if (!scene.alias().empty()) {
            std::printf("alias=%s\n", escaped(scene.alias(), 64).c_str());
        }

        if (show_groups) {
            if (!only_group.empty()) {
                const MtlRecord* rec = scene.metadata().get(only_group);
                if (!rec) {
                    std::fprintf(stderr, "mtlread: `%s`: group not found: %s\n",
                                 source, escaped(only_group, 64).c_str());
                    exit_code = 1;
                } else {
                    print_record(*rec, max_bytes);
                }
            } else {
                for (const MtlRecord& rec : scene.metadata().records()) {
                    print_record(rec, max_bytes);
                }
            }
        }

        std::printf("bands=%u\n",
                    static_cast<unsigned>(scene.bands().size()));
        for (const BandFileIndex::Entry& e : scene.bands().entries()) {
            std::printf("  %s -> %s\n", escaped(e.code, 64).c_str(),
                        escaped(e.file_name, max_bytes).c_str());
        }

        for (const std::string& id : bands) {
            std::string path;
            if (scene.band_path(id, &path) != BandStatus::Ok) {
                std::fprintf(stderr, "mtlread: `%s`: band not found: %s\n",
                             source, escaped(id, 64).c_str());
                exit_code = 1;
                continue;
            }
            std::printf("band %s = %s\n", escaped(id, 64).c_str(),
                        escaped(path, 0).c_str());
        }
    }
    return exit_code;
}
