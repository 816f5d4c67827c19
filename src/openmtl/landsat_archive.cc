#include "openmtl/landsat_archive.h"

#include <filesystem>
#include <utility>

namespace openmtl {
namespace {

    static LandsatStatus map_resolve_status(ResolveStatus st) noexcept
    {
        switch (st) {
        case ResolveStatus::Ok: return LandsatStatus::Ok;
        case ResolveStatus::UnsupportedSource:
            return LandsatStatus::UnsupportedSource;
        case ResolveStatus::MetadataFileMissing:
            return LandsatStatus::MetadataFileMissing;
        case ResolveStatus::InvalidPattern:
            return LandsatStatus::InvalidPattern;
        case ResolveStatus::ArchiveFailed: return LandsatStatus::ArchiveFailed;
        }
        return LandsatStatus::UnsupportedSource;
    }


    static LandsatStatus map_parse_status(MtlParseStatus st) noexcept
    {
        switch (st) {
        case MtlParseStatus::Ok: return LandsatStatus::Ok;
        case MtlParseStatus::ReadFailed: return LandsatStatus::ReadFailed;
        case MtlParseStatus::LimitExceeded: return LandsatStatus::LimitExceeded;
        case MtlParseStatus::DivergingTags:
        case MtlParseStatus::UnbalancedGroup:
        case MtlParseStatus::StrayStatement:
        case MtlParseStatus::NoMetadata: return LandsatStatus::ParseFailed;
        }
        return LandsatStatus::ParseFailed;
    }

}  // namespace

LandsatReadResult
LandsatArchive::read(std::string_view source,
                     const LandsatReadOptions& options, LandsatArchive* out)
{
    LandsatReadResult res;

    SourceResolveOptions resolve_options;
    resolve_options.metadata_pattern = options.metadata_pattern;
    resolve_options.extract_to       = options.extract_to;
    resolve_options.archive_limits   = options.archive_limits;

    LandsatArchive archive;
    res.resolve = resolve_source(source, resolve_options, &archive.resolved_);
    if (res.resolve.status != ResolveStatus::Ok) {
        res.status = map_resolve_status(res.resolve.status);
        return res;
    }
    res.stage = LandsatStage::MetadataLocated;

    archive.metadata_.set_path(archive.resolved_.metadata_path);
    res.parse = archive.metadata_.parse(options.parse_limits);
    if (res.parse.status != MtlParseStatus::Ok) {
        res.status = map_parse_status(res.parse.status);
        return res;
    }

    const std::span<const BandMapping> table = options.band_map.empty()
                                                   ? default_band_map()
                                                   : options.band_map;
    BandDispatchResult dispatch = dispatch_band_mapping(archive.metadata_,
                                                        table);
    if (dispatch.status == BandStatus::SensorIdentityMissing) {
        res.status = LandsatStatus::SensorIdentityMissing;
        return res;
    }
    res.stage      = LandsatStage::SensorIdentified;
    res.sensor_key = dispatch.sensor.key;
    if (dispatch.status != BandStatus::Ok) {
        res.status = LandsatStatus::BandMapMissing;
        return res;
    }

    if (archive.bands_.build(archive.metadata_) != MtlGroupStatus::Ok) {
        res.status = LandsatStatus::SensorIdentityMissing;
        return res;
    }
    res.stage = LandsatStage::BandIndexReady;

    archive.source_dir_ = archive.resolved_.base_dir;
    archive.alias_      = options.alias;
    archive.sensor_     = std::move(dispatch.sensor);
    archive.mapping_    = dispatch.mapping;
    *out                = std::move(archive);
    return res;
}


BandStatus
LandsatArchive::resolve_band(std::string_view id,
                             std::string_view* file_name) const noexcept
{
    return openmtl::resolve_band(bands_, mapping_, id, file_name);
}


BandStatus
LandsatArchive::resolve_band(uint32_t band, std::string_view* file_name) const
{
    const std::string code = std::to_string(band);
    return resolve_band(std::string_view(code), file_name);
}


BandStatus
LandsatArchive::band_path(std::string_view id, std::string* path) const
{
    std::string_view file_name;
    const BandStatus st = resolve_band(id, &file_name);
    if (st != BandStatus::Ok) {
        return st;
    }
    const std::filesystem::path joined = std::filesystem::path(source_dir_)
                                         / std::filesystem::path(file_name);
    *path = joined.string();
    return BandStatus::Ok;
}

}  // namespace openmtl
