#include "openmtl/source_resolve.h"

#include "openmtl/mapped_file.h"

#include <filesystem>
#include <memory>
#include <regex>
#include <system_error>
#include <vector>

namespace openmtl {
namespace {

    namespace fs = std::filesystem;

    static bool has_txt_suffix(const fs::path& p)
    {
        const std::string ext = p.extension().string();
        return ext.size() == 4 && ext[0] == '.'
               && (ext[1] == 't' || ext[1] == 'T')
               && (ext[2] == 'x' || ext[2] == 'X')
               && (ext[3] == 't' || ext[3] == 'T');
    }

    static bool compile_pattern(std::string_view pattern, std::regex* out)
    {
        try {
            *out = std::regex(pattern.begin(), pattern.end(),
                              std::regex::ECMAScript | std::regex::icase);
        } catch (const std::regex_error&) {
            return false;
        }
        return true;
    }

    static ResolveStatus list_directory(const fs::path& dir,
                                        std::vector<std::string>* names)
    {
        std::error_code ec;
        fs::directory_iterator it(dir, ec);
        if (ec) {
            return ResolveStatus::UnsupportedSource;
        }
        fs::directory_iterator end_it;
        for (; it != end_it; it.increment(ec)) {
            if (ec) {
                return ResolveStatus::UnsupportedSource;
            }
            std::error_code type_ec;
            if (!it->is_regular_file(type_ec)) {
                continue;
            }
            names->push_back(it->path().filename().string());
        }
        return ResolveStatus::Ok;
    }

    // Only an unrecognized container is an unsupported source; failures past
    // the sniff are archive failures.
    static ResolveStatus open_status(ArchiveReadStatus st) noexcept
    {
        if (st == ArchiveReadStatus::Unsupported) {
            return ResolveStatus::UnsupportedSource;
        }
        return ResolveStatus::ArchiveFailed;
    }

    static ResolveResult resolve_directory(const fs::path& dir,
                                           const SourceResolveOptions& options,
                                           ResolvedSource* out)
    {
        ResolveResult res;
        res.kind = SourceKind::Directory;

        std::vector<std::string> names;
        res.status = list_directory(dir, &names);
        if (res.status != ResolveStatus::Ok) {
            return res;
        }
        size_t index = 0;
        res.status   = find_metadata_entry(names, options.metadata_pattern,
                                           &index);
        if (res.status != ResolveStatus::Ok) {
            return res;
        }

        out->kind          = SourceKind::Directory;
        out->base_dir      = dir.string();
        out->metadata_path = (dir / names[index]).string();
        return res;
    }

    static ResolveResult resolve_archive(const fs::path& archive,
                                         const SourceResolveOptions& options,
                                         ResolvedSource* out)
    {
        ResolveResult res;
        res.kind = SourceKind::Archive;

        // Reject a bad pattern before listing a possibly large archive.
        std::regex pattern;
        if (!compile_pattern(options.metadata_pattern, &pattern)) {
            res.status = ResolveStatus::InvalidPattern;
            return res;
        }

        const std::string archive_path = archive.string();
        std::unique_ptr<ArchiveReader> reader;
        res.archive = open_archive_reader(archive_path.c_str(),
                                          options.archive_limits, &reader);
        if (res.archive.status != ArchiveReadStatus::Ok) {
            res.status = open_status(res.archive.status);
            return res;
        }

        std::vector<std::string> names;
        res.archive = reader->list_entries(&names);
        if (res.archive.status != ArchiveReadStatus::Ok) {
            res.status = ResolveStatus::ArchiveFailed;
            return res;
        }

        size_t index = 0;
        res.status   = find_metadata_entry(names, options.metadata_pattern,
                                           &index);
        if (res.status != ResolveStatus::Ok) {
            return res;
        }

        const std::string dest = options.extract_to.empty()
                                     ? default_extract_dir(archive_path)
                                     : options.extract_to;
        res.archive = reader->extract_all(dest);
        const ArchiveFormat format = reader->format();
        reader->close();
        if (res.archive.status != ArchiveReadStatus::Ok) {
            res.status = ResolveStatus::ArchiveFailed;
            return res;
        }

        const fs::path meta = fs::path(dest) / fs::path(names[index]);
        out->kind           = SourceKind::Archive;
        out->archive_format = format;
        out->base_dir       = meta.parent_path().string();
        out->metadata_path  = meta.string();
        out->extracted_to   = dest;
        return res;
    }

}  // namespace

SourceKind
classify_source(std::string_view path)
{
    const fs::path p(path);
    std::error_code ec;
    const fs::file_status st = fs::status(p, ec);
    if (ec) {
        return SourceKind::Unknown;
    }
    if (fs::is_directory(st)) {
        return SourceKind::Directory;
    }
    if (!fs::is_regular_file(st)) {
        return SourceKind::Unknown;
    }
    if (has_txt_suffix(p)) {
        return SourceKind::MetadataFile;
    }

    MappedFile file;
    const std::string s = p.string();
    if (file.open(s.c_str()) != MappedFileStatus::Ok) {
        return SourceKind::Unknown;
    }
    return (sniff_archive(file.bytes()) != ArchiveFormat::Unknown)
               ? SourceKind::Archive
               : SourceKind::Unknown;
}


std::string
default_extract_dir(std::string_view archive_path)
{
    const fs::path p(archive_path);
    const std::string name = p.filename().string();
    const size_t dot       = name.find('.');
    const std::string stem = (dot == std::string::npos) ? name
                                                        : name.substr(0, dot);
    return (p.parent_path() / stem).string();
}


std::string_view
entry_base_name(std::string_view name) noexcept
{
    const size_t sep = name.find_last_of("/\\");
    return (sep == std::string_view::npos) ? name : name.substr(sep + 1);
}


ResolveStatus
find_metadata_entry(std::span<const std::string> names,
                    std::string_view pattern, size_t* index)
{
    std::regex re;
    if (!compile_pattern(pattern, &re)) {
        return ResolveStatus::InvalidPattern;
    }
    for (size_t i = 0; i < names.size(); ++i) {
        const std::string_view base = entry_base_name(names[i]);
        if (base.empty()) {
            continue;
        }
        if (std::regex_match(base.begin(), base.end(), re)) {
            *index = i;
            return ResolveStatus::Ok;
        }
    }
    return ResolveStatus::MetadataFileMissing;
}


ResolveStatus
sniff_metadata_name(std::span<const std::string> names,
                    std::string_view pattern, std::string* out)
{
    size_t index           = 0;
    const ResolveStatus st = find_metadata_entry(names, pattern, &index);
    if (st != ResolveStatus::Ok) {
        return st;
    }
    const std::string_view base = entry_base_name(names[index]);
    out->assign(base.data(), base.size());
    return ResolveStatus::Ok;
}


ResolveResult
resolve_source(std::string_view source, const SourceResolveOptions& options,
               ResolvedSource* out)
{
    const fs::path p(source);
    ResolveResult res;
    res.kind = classify_source(source);

    switch (res.kind) {
    case SourceKind::Directory: return resolve_directory(p, options, out);
    case SourceKind::MetadataFile:
        out->kind           = SourceKind::MetadataFile;
        out->archive_format = ArchiveFormat::Unknown;
        out->base_dir       = p.parent_path().string();
        out->metadata_path  = p.string();
        out->extracted_to.clear();
        return res;
    case SourceKind::Archive: return resolve_archive(p, options, out);
    case SourceKind::Unknown: break;
    }
    res.status = ResolveStatus::UnsupportedSource;
    return res;
}

}  // namespace openmtl
