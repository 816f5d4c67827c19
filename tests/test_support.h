#pragma once

#include <gtest/gtest.h>

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#if defined(OPENMTL_HAS_ZLIB) && OPENMTL_HAS_ZLIB
#    include <zlib.h>
#endif
#if defined(OPENMTL_HAS_BZIP2) && OPENMTL_HAS_BZIP2
#    include <bzlib.h>
#endif
#if defined(OPENMTL_HAS_LZMA) && OPENMTL_HAS_LZMA
#    include <lzma.h>
#endif

/**
 * \file test_support.h
 * \brief Scratch directories and in-memory zip/tar builders for tests, with
 * gzip, bzip2 and xz wrappers.
 */

namespace openmtl::test {

/// Per-test scratch directory, removed on destruction.
class ScratchDir final {
public:
    ScratchDir()
    {
        const ::testing::TestInfo* info
            = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = "openmtl_";
        if (info) {
            name.append(info->test_suite_name());
            name.push_back('_');
            name.append(info->name());
        }
        std::error_code ec;
        path_ = std::filesystem::temp_directory_path(ec) / name;
        std::filesystem::remove_all(path_, ec);
        std::filesystem::create_directories(path_, ec);
    }

    ~ScratchDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    ScratchDir(const ScratchDir&)            = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    const std::filesystem::path& path() const noexcept { return path_; }
    std::string str(std::string_view child = {}) const
    {
        if (child.empty()) {
            return path_.string();
        }
        return (path_ / std::filesystem::path(child)).string();
    }

private:
    std::filesystem::path path_;
};


inline bool
write_file(const std::string& path, std::string_view data)
{
    std::error_code ec;
    const std::filesystem::path parent
        = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }
    std::FILE* f = std::fopen(path.c_str(), "wb");
    if (!f) {
        return false;
    }
    const bool ok = data.empty()
                    || std::fwrite(data.data(), 1, data.size(), f)
                           == data.size();
    return std::fclose(f) == 0 && ok;
}


inline std::string
read_file(const std::string& path)
{
    std::string out;
    std::FILE* f = std::fopen(path.c_str(), "rb");
    if (!f) {
        return out;
    }
    char buf[4096];
    size_t n = 0;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) != 0) {
        out.append(buf, n);
    }
    std::fclose(f);
    return out;
}


inline void
append_u16le(std::string* out, uint32_t v)
{
    out->push_back(static_cast<char>(v & 0xFFU));
    out->push_back(static_cast<char>((v >> 8) & 0xFFU));
}


inline void
append_u32le(std::string* out, uint32_t v)
{
    append_u16le(out, v & 0xFFFFU);
    append_u16le(out, (v >> 16) & 0xFFFFU);
}


inline uint32_t
crc32_of(std::string_view data)
{
#if defined(OPENMTL_HAS_ZLIB) && OPENMTL_HAS_ZLIB
    const uLong c = crc32(0L, Z_NULL, 0);
    return static_cast<uint32_t>(
        crc32(c, reinterpret_cast<const Bytef*>(data.data()),
              static_cast<uInt>(data.size())));
#else
    (void)data;
    return 0;
#endif
}


#if defined(OPENMTL_HAS_ZLIB) && OPENMTL_HAS_ZLIB
/// Deflates \p data with the given window bits (negative = raw, 16+ = gzip).
inline std::string
deflate_bytes(std::string_view data, int window_bits)
{
    z_stream strm {};
    if (deflateInit2(&strm, Z_BEST_COMPRESSION, Z_DEFLATED, window_bits, 8,
                     Z_DEFAULT_STRATEGY)
        != Z_OK) {
        return {};
    }
    std::string out(deflateBound(&strm, static_cast<uLong>(data.size())) + 32,
                    '\0');
    strm.next_in   = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    strm.avail_in  = static_cast<uInt>(data.size());
    strm.next_out  = reinterpret_cast<Bytef*>(out.data());
    strm.avail_out = static_cast<uInt>(out.size());
    const int ret  = deflate(&strm, Z_FINISH);
    out.resize(out.size() - strm.avail_out);
    (void)deflateEnd(&strm);
    if (ret != Z_STREAM_END) {
        return {};
    }
    return out;
}


inline std::string
gzip_bytes(std::string_view data)
{
    return deflate_bytes(data, 16 + MAX_WBITS);
}
#endif


#if defined(OPENMTL_HAS_BZIP2) && OPENMTL_HAS_BZIP2
inline std::string
bzip2_bytes(std::string_view data)
{
    // Worst case per the libbz2 manual: input + 1% + 600 bytes.
    unsigned int out_len = static_cast<unsigned int>(data.size()
                                                     + data.size() / 100U
                                                     + 600U);
    std::string out(out_len, '\0');
    const int ret = BZ2_bzBuffToBuffCompress(
        out.data(), &out_len, const_cast<char*>(data.data()),
        static_cast<unsigned int>(data.size()), 9, 0, 0);
    if (ret != BZ_OK) {
        return {};
    }
    out.resize(out_len);
    return out;
}
#endif


#if defined(OPENMTL_HAS_LZMA) && OPENMTL_HAS_LZMA
inline std::string
xz_bytes(std::string_view data)
{
    std::string out(lzma_stream_buffer_bound(data.size()), '\0');
    size_t out_pos     = 0;
    const lzma_ret ret = lzma_easy_buffer_encode(
        6, LZMA_CHECK_CRC64, nullptr,
        reinterpret_cast<const uint8_t*>(data.data()), data.size(),
        reinterpret_cast<uint8_t*>(out.data()), &out_pos, out.size());
    if (ret != LZMA_OK) {
        return {};
    }
    out.resize(out_pos);
    return out;
}
#endif


struct ZipItem final {
    std::string name;
    std::string data;
    bool deflate = false;
};

/// Builds a single-disk zip archive (no zip64, no data descriptors).
inline std::string
build_zip(const std::vector<ZipItem>& items)
{
    std::string out;
    std::string central;
    for (const ZipItem& item : items) {
        std::string payload = item.data;
        uint16_t method     = 0;
#if defined(OPENMTL_HAS_ZLIB) && OPENMTL_HAS_ZLIB
        if (item.deflate) {
            payload = deflate_bytes(item.data, -MAX_WBITS);
            method  = 8;
        }
#endif
        const uint32_t crc    = crc32_of(item.data);
        const uint32_t offset = static_cast<uint32_t>(out.size());

        append_u32le(&out, 0x04034b50U);
        append_u16le(&out, 20);
        append_u16le(&out, 0);
        append_u16le(&out, method);
        append_u16le(&out, 0);
        append_u16le(&out, 0);
        append_u32le(&out, crc);
        append_u32le(&out, static_cast<uint32_t>(payload.size()));
        append_u32le(&out, static_cast<uint32_t>(item.data.size()));
        append_u16le(&out, static_cast<uint32_t>(item.name.size()));
        append_u16le(&out, 0);
        out.append(item.name);
        out.append(payload);

        append_u32le(&central, 0x02014b50U);
        append_u16le(&central, 20);
        append_u16le(&central, 20);
        append_u16le(&central, 0);
        append_u16le(&central, method);
        append_u16le(&central, 0);
        append_u16le(&central, 0);
        append_u32le(&central, crc);
        append_u32le(&central, static_cast<uint32_t>(payload.size()));
        append_u32le(&central, static_cast<uint32_t>(item.data.size()));
        append_u16le(&central, static_cast<uint32_t>(item.name.size()));
        append_u16le(&central, 0);
        append_u16le(&central, 0);
        append_u16le(&central, 0);
        append_u16le(&central, 0);
        append_u32le(&central, 0);
        append_u32le(&central, offset);
        central.append(item.name);
    }

    const uint32_t cd_off = static_cast<uint32_t>(out.size());
    out.append(central);
    append_u32le(&out, 0x06054b50U);
    append_u16le(&out, 0);
    append_u16le(&out, 0);
    append_u16le(&out, static_cast<uint32_t>(items.size()));
    append_u16le(&out, static_cast<uint32_t>(items.size()));
    append_u32le(&out, static_cast<uint32_t>(central.size()));
    append_u32le(&out, cd_off);
    append_u16le(&out, 0);
    return out;
}


struct TarItem final {
    std::string name;
    std::string data;
    /// ustar type flag ('0' file, '5' directory, '2' symlink, 'L' GNU long name).
    char type = '0';
};


inline void
tar_octal(char* field, size_t width, uint64_t v)
{
    // width - 1 digits followed by NUL.
    for (size_t i = width - 1; i-- > 0;) {
        field[i] = static_cast<char>('0' + (v & 7U));
        v >>= 3;
    }
    field[width - 1] = '\0';
}


inline std::string
tar_header(std::string_view name, char type, uint64_t size)
{
    std::string block(512, '\0');
    char* h = block.data();
    name.copy(h, name.size() < 100 ? name.size() : 100);
    tar_octal(h + 100, 8, 0644);
    tar_octal(h + 108, 8, 0);
    tar_octal(h + 116, 8, 0);
    tar_octal(h + 124, 12, size);
    tar_octal(h + 136, 12, 0);
    h[156] = type;
    std::string_view("ustar").copy(h + 257, 5);
    h[263] = '0';
    h[264] = '0';

    for (size_t i = 148; i < 156; ++i) {
        h[i] = ' ';
    }
    uint32_t sum = 0;
    for (size_t i = 0; i < 512; ++i) {
        sum += static_cast<unsigned char>(h[i]);
    }
    tar_octal(h + 148, 7, sum);
    h[155] = ' ';
    return block;
}


inline void
append_tar_payload(std::string* out, std::string_view data)
{
    out->append(data);
    const size_t pad = (512 - (data.size() % 512)) % 512;
    out->append(pad, '\0');
}


/// Builds a ustar archive terminated by two zero blocks.
inline std::string
build_tar(const std::vector<TarItem>& items)
{
    std::string out;
    for (const TarItem& item : items) {
        const bool has_data = item.type == '0' || item.type == 'L'
                              || item.type == 'x';
        out.append(tar_header(item.name, item.type,
                              has_data ? item.data.size() : 0));
        if (has_data) {
            append_tar_payload(&out, item.data);
        }
    }
    out.append(1024, '\0');
    return out;
}


/// A minimal Landsat 8 MTL document with three band files.
inline std::string
landsat8_mtl(std::string_view product_id = "LC08_SCENE")
{
    std::string text;
    text.append("GROUP = L1_METADATA_FILE\n");
    text.append("  GROUP = METADATA_FILE_INFO\n");
    text.append("    ORIGIN = \"Image courtesy of the U.S. Geological Survey\"\n");
    text.append("    REQUEST_ID = \"0501505014429_00011\"\n");
    text.append("    LANDSAT_PRODUCT_ID = \"");
    text.append(product_id);
    text.append("\"\n");
    text.append("  END_GROUP = METADATA_FILE_INFO\n");
    text.append("  GROUP = PRODUCT_METADATA\n");
    text.append("    DATA_TYPE = \"L1TP\"\n");
    text.append("    SPACECRAFT_ID = \"LANDSAT_8\"\n");
    text.append("    SENSOR_ID = \"OLI_TIRS\"\n");
    text.append("    WRS_PATH = 44\n");
    text.append("    WRS_ROW = 34\n");
    text.append("    SCENE_CENTER_TIME = \"18:46:33.5810010Z\"\n");
    text.append("    CORNER_UL_LAT_PRODUCT = 38.50313\n");
    text.append("    FILE_NAME_BAND_1 = \"scene_B1.TIF\"\n");
    text.append("    FILE_NAME_BAND_4 = \"scene_B4.TIF\"\n");
    text.append("    FILE_NAME_BAND_QUALITY = \"scene_BQA.TIF\"\n");
    text.append("    METADATA_FILE_NAME = \"scene_MTL.txt\"\n");
    text.append("  END_GROUP = PRODUCT_METADATA\n");
    text.append("  GROUP = IMAGE_ATTRIBUTES\n");
    text.append("    CLOUD_COVER = 7.43\n");
    text.append("    IMAGE_QUALITY_OLI = 9\n");
    text.append("  END_GROUP = IMAGE_ATTRIBUTES\n");
    text.append("END_GROUP = L1_METADATA_FILE\n");
    text.append("END\n");
    return text;
}

}  // namespace openmtl::test
