#include "openmtl/band_map.h"

#include <array>
#include <utility>

namespace openmtl {
namespace {

    static constexpr std::array<BandAlias, 4> kMss1To3 = { {
        { "green", "4" },
        { "red", "5" },
        { "nir1", "6" },
        { "nir2", "7" },
    } };

    static constexpr std::array<BandAlias, 4> kMss4To5 = { {
        { "green", "1" },
        { "red", "2" },
        { "nir1", "3" },
        { "nir2", "4" },
    } };

    static constexpr std::array<BandAlias, 7> kTm = { {
        { "blue", "1" },
        { "green", "2" },
        { "red", "3" },
        { "nir", "4" },
        { "swir1", "5" },
        { "tirs", "6" },
        { "swir2", "7" },
    } };

    static constexpr std::array<BandAlias, 10> kEtm = { {
        { "blue", "1" },
        { "green", "2" },
        { "red", "3" },
        { "nir", "4" },
        { "swir1", "5" },
        { "tirs_low", "6_VCID_1" },
        { "tirs_high", "6_VCID_2" },
        { "swir2", "7" },
        { "panchromatic", "8" },
        { "bq", "QUALITY" },
    } };

    static constexpr std::array<BandAlias, 12> kOliTirs = { {
        { "coastal", "1" },
        { "blue", "2" },
        { "green", "3" },
        { "red", "4" },
        { "nir", "5" },
        { "swir1", "6" },
        { "swir2", "7" },
        { "panchromatic", "8" },
        { "cirrus", "9" },
        { "tirs1", "10" },
        { "tirs2", "11" },
        { "bq", "QUALITY" },
    } };

    static constexpr std::array<BandMapping, 9> kBandMap = { {
        { "LANDSAT_1_MSS", kMss1To3 },
        { "LANDSAT_2_MSS", kMss1To3 },
        { "LANDSAT_3_MSS", kMss1To3 },
        { "LANDSAT_4_MSS", kMss4To5 },
        { "LANDSAT_5_MSS", kMss4To5 },
        { "LANDSAT_4_TM", kTm },
        { "LANDSAT_5_TM", kTm },
        { "LANDSAT_7_ETM", kEtm },
        { "LANDSAT_8_OLI_TIRS", kOliTirs },
    } };

    static bool is_alnum(char c) noexcept
    {
        return (c >= '0' && c <= '9') || (c >= 'A' && c <= 'Z')
               || (c >= 'a' && c <= 'z');
    }

    static std::string value_string(const MtlValue& v)
    {
        std::string out;
        append_value_string(v, &out);
        return out;
    }

}  // namespace

const BandAlias*
BandMapping::find(std::string_view alias) const noexcept
{
    for (size_t i = 0; i < aliases.size(); ++i) {
        if (iequals(aliases[i].alias, alias)) {
            return &aliases[i];
        }
    }
    return nullptr;
}


std::span<const BandMapping>
default_band_map() noexcept
{
    return kBandMap;
}


const BandMapping*
find_band_mapping(std::span<const BandMapping> table,
                  std::string_view sensor_key) noexcept
{
    for (size_t i = 0; i < table.size(); ++i) {
        if (table[i].sensor_key == sensor_key) {
            return &table[i];
        }
    }
    return nullptr;
}


BandStatus
read_sensor_identity(const MtlStore& store, SensorIdentity* out)
{
    const MtlValue* spacecraft = store.get(kProductMetadataGroup,
                                           kSpacecraftIdKey);
    const MtlValue* sensor     = store.get(kProductMetadataGroup,
                                           kSensorIdKey);
    if (!spacecraft || !sensor) {
        return BandStatus::SensorIdentityMissing;
    }

    out->spacecraft = value_string(*spacecraft);
    out->sensor     = value_string(*sensor);
    out->key        = out->spacecraft;
    out->key.push_back('_');
    out->key.append(out->sensor);
    return BandStatus::Ok;
}


BandDispatchResult
dispatch_band_mapping(const MtlStore& store,
                      std::span<const BandMapping> table)
{
    BandDispatchResult res;
    res.status = read_sensor_identity(store, &res.sensor);
    if (res.status != BandStatus::Ok) {
        return res;
    }
    res.mapping = find_band_mapping(table, res.sensor.key);
    if (!res.mapping) {
        res.status = BandStatus::BandMapMissing;
    }
    return res;
}


bool
match_band_file_key(std::string_view key, std::string_view* code) noexcept
{
    if (key.size() <= kBandFileKeyPrefix.size()
        || !iequals(key.substr(0, kBandFileKeyPrefix.size()),
                    kBandFileKeyPrefix)) {
        return false;
    }
    const std::string_view rest = key.substr(kBandFileKeyPrefix.size());
    if (!is_alnum(rest.front())) {
        return false;
    }
    *code = rest;
    return true;
}


MtlGroupStatus
BandFileIndex::build(const MtlStore& store)
{
    entries_.clear();

    const MtlGroupResult group = store.iter_group(kProductMetadataGroup);
    if (group.status != MtlGroupStatus::Ok) {
        return group.status;
    }
    for (const MtlField& field : group.fields) {
        std::string_view code;
        if (!match_band_file_key(field.key, &code)) {
            continue;
        }
        Entry entry;
        entry.code.assign(code.data(), code.size());
        entry.file_name = value_string(field.value);

        bool replaced = false;
        for (size_t i = 0; i < entries_.size(); ++i) {
            if (entries_[i].code == entry.code) {
                entries_[i] = std::move(entry);
                replaced    = true;
                break;
            }
        }
        if (!replaced) {
            entries_.push_back(std::move(entry));
        }
    }
    return MtlGroupStatus::Ok;
}


const std::string*
BandFileIndex::find(std::string_view code) const noexcept
{
    for (size_t i = 0; i < entries_.size(); ++i) {
        if (entries_[i].code == code) {
            return &entries_[i].file_name;
        }
    }
    for (size_t i = 0; i < entries_.size(); ++i) {
        if (iequals(entries_[i].code, code)) {
            return &entries_[i].file_name;
        }
    }
    return nullptr;
}


std::span<const BandFileIndex::Entry>
BandFileIndex::entries() const noexcept
{
    return std::span<const Entry>(entries_.data(), entries_.size());
}


BandStatus
resolve_band(const BandFileIndex& index, const BandMapping* mapping,
             std::string_view id, std::string_view* file_name) noexcept
{
    if (const std::string* direct = index.find(id)) {
        *file_name = *direct;
        return BandStatus::Ok;
    }
    if (mapping) {
        if (const BandAlias* alias = mapping->find(id)) {
            if (const std::string* mapped = index.find(alias->code)) {
                *file_name = *mapped;
                return BandStatus::Ok;
            }
        }
    }
    return BandStatus::BandNotFound;
}

}  // namespace openmtl
