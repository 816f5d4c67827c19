#include "openmtl/archive_reader.h"

#include "archive_reader_internal.h"

#include <array>
#include <filesystem>
#include <system_error>
#include <utility>

#if defined(OPENMTL_HAS_ZLIB) && OPENMTL_HAS_ZLIB
#    include <zlib.h>
#endif
#if defined(OPENMTL_HAS_BZIP2) && OPENMTL_HAS_BZIP2
#    include <bzlib.h>
#endif
#if defined(OPENMTL_HAS_LZMA) && OPENMTL_HAS_LZMA
#    include <lzma.h>
#endif

namespace openmtl {
namespace archive_internal {
namespace {

    static uint8_t u8(std::byte b) noexcept { return static_cast<uint8_t>(b); }

    static constexpr uint32_t kZipEocdSig   = 0x06054b50U;
    static constexpr uint64_t kZipEocdSize  = 22;
    static constexpr uint64_t kZipMaxComment = 0xFFFFU;

    static uint64_t parse_tar_octal(std::span<const std::byte> field) noexcept
    {
        uint64_t v = 0;
        size_t i   = 0;
        while (i < field.size()
               && (u8(field[i]) == ' ' || u8(field[i]) == 0)) {
            ++i;
        }
        for (; i < field.size(); ++i) {
            const uint8_t c = u8(field[i]);
            if (c < '0' || c > '7') {
                break;
            }
            v = (v << 3) | static_cast<uint64_t>(c - '0');
        }
        return v;
    }

    static size_t gunzip_prefix(std::span<const std::byte> bytes,
                                std::span<std::byte> out) noexcept
    {
#if defined(OPENMTL_HAS_ZLIB) && OPENMTL_HAS_ZLIB
        z_stream strm {};
        strm.zalloc = Z_NULL;
        strm.zfree  = Z_NULL;
        strm.opaque = Z_NULL;
        if (inflateInit2(&strm, 16 + MAX_WBITS) != Z_OK) {
            return 0;
        }

        const uInt in_len = (bytes.size() > 0xFFFFFFFFU)
                                ? 0xFFFFFFFFU
                                : static_cast<uInt>(bytes.size());
        strm.next_in   = reinterpret_cast<Bytef*>(
            const_cast<std::byte*>(bytes.data()));
        strm.avail_in  = in_len;
        strm.next_out  = reinterpret_cast<Bytef*>(out.data());
        strm.avail_out = static_cast<uInt>(out.size());

        while (strm.avail_out != 0) {
            const int ret = inflate(&strm, Z_NO_FLUSH);
            if (ret != Z_OK) {
                break;
            }
        }
        const size_t produced = out.size() - strm.avail_out;
        (void)inflateEnd(&strm);
        return produced;
#else
        (void)bytes;
        (void)out;
        return 0;
#endif
    }

    static size_t bunzip2_prefix(std::span<const std::byte> bytes,
                                 std::span<std::byte> out) noexcept
    {
#if defined(OPENMTL_HAS_BZIP2) && OPENMTL_HAS_BZIP2
        bz_stream strm {};
        if (BZ2_bzDecompressInit(&strm, 0, 0) != BZ_OK) {
            return 0;
        }

        const unsigned int in_len
            = (bytes.size() > 0xFFFFFFFFU)
                  ? 0xFFFFFFFFU
                  : static_cast<unsigned int>(bytes.size());
        strm.next_in   = reinterpret_cast<char*>(
            const_cast<std::byte*>(bytes.data()));
        strm.avail_in  = in_len;
        strm.next_out  = reinterpret_cast<char*>(out.data());
        strm.avail_out = static_cast<unsigned int>(out.size());

        while (strm.avail_out != 0) {
            const unsigned int avail_in  = strm.avail_in;
            const unsigned int avail_out = strm.avail_out;
            const int ret                = BZ2_bzDecompress(&strm);
            if (ret != BZ_OK) {
                break;
            }
            // Truncated input: libbz2 keeps returning BZ_OK without progress.
            if (strm.avail_in == avail_in && strm.avail_out == avail_out) {
                break;
            }
        }
        const size_t produced = out.size() - strm.avail_out;
        (void)BZ2_bzDecompressEnd(&strm);
        return produced;
#else
        (void)bytes;
        (void)out;
        return 0;
#endif
    }

    static size_t unxz_prefix(std::span<const std::byte> bytes,
                              std::span<std::byte> out) noexcept
    {
#if defined(OPENMTL_HAS_LZMA) && OPENMTL_HAS_LZMA
        lzma_stream strm {};
        if (lzma_stream_decoder(&strm, UINT64_MAX, LZMA_CONCATENATED)
            != LZMA_OK) {
            return 0;
        }

        strm.next_in   = reinterpret_cast<const uint8_t*>(bytes.data());
        strm.avail_in  = bytes.size();
        strm.next_out  = reinterpret_cast<uint8_t*>(out.data());
        strm.avail_out = out.size();

        while (strm.avail_out != 0) {
            const lzma_ret ret = lzma_code(&strm, LZMA_FINISH);
            if (ret != LZMA_OK) {
                break;
            }
        }
        const size_t produced = out.size() - strm.avail_out;
        lzma_end(&strm);
        return produced;
#else
        (void)bytes;
        (void)out;
        return 0;
#endif
    }

}  // namespace

uint16_t
read_u16le(std::span<const std::byte> bytes, uint64_t off) noexcept
{
    return static_cast<uint16_t>(u8(bytes[off + 0])
                                 | (u8(bytes[off + 1]) << 8));
}


uint32_t
read_u32le(std::span<const std::byte> bytes, uint64_t off) noexcept
{
    return (static_cast<uint32_t>(u8(bytes[off + 0])) << 0)
           | (static_cast<uint32_t>(u8(bytes[off + 1])) << 8)
           | (static_cast<uint32_t>(u8(bytes[off + 2])) << 16)
           | (static_cast<uint32_t>(u8(bytes[off + 3])) << 24);
}


uint64_t
read_u64le(std::span<const std::byte> bytes, uint64_t off) noexcept
{
    return static_cast<uint64_t>(read_u32le(bytes, off))
           | (static_cast<uint64_t>(read_u32le(bytes, off + 4)) << 32);
}


bool
in_range(std::span<const std::byte> bytes, uint64_t off,
         uint64_t size) noexcept
{
    const uint64_t total = static_cast<uint64_t>(bytes.size());
    if (off > total) {
        return false;
    }
    return size <= total - off;
}


bool
find_zip_eocd(std::span<const std::byte> bytes, uint64_t* eocd_off) noexcept
{
    const uint64_t size = static_cast<uint64_t>(bytes.size());
    if (size < kZipEocdSize) {
        return false;
    }
    const uint64_t last  = size - kZipEocdSize;
    const uint64_t floor = (last > kZipMaxComment) ? last - kZipMaxComment
                                                   : 0;
    for (uint64_t off = last + 1; off-- > floor;) {
        if (read_u32le(bytes, off) != kZipEocdSig) {
            continue;
        }
        const uint16_t comment_len = read_u16le(bytes, off + 20);
        if (off + kZipEocdSize + comment_len > size) {
            continue;
        }
        *eocd_off = off;
        return true;
    }
    return false;
}


bool
is_tar_header(std::span<const std::byte> block) noexcept
{
    if (block.size() < kTarBlockSize) {
        return false;
    }
    uint64_t sum_unsigned = 0;
    int64_t sum_signed    = 0;
    bool all_zero         = true;
    for (size_t i = 0; i < kTarBlockSize; ++i) {
        uint8_t c = u8(block[i]);
        if (c != 0) {
            all_zero = false;
        }
        if (i >= 148 && i < 156) {
            c = ' ';
        }
        sum_unsigned += c;
        sum_signed += static_cast<int8_t>(c);
    }
    if (all_zero) {
        return false;
    }
    const std::span<const std::byte> chk = block.subspan(148, 8);
    size_t digits                        = 0;
    for (size_t i = 0; i < chk.size(); ++i) {
        const uint8_t c = u8(chk[i]);
        if (c >= '0' && c <= '7') {
            ++digits;
        }
    }
    if (digits == 0) {
        return false;
    }
    const uint64_t stored = parse_tar_octal(chk);
    return stored == sum_unsigned
           || static_cast<int64_t>(stored) == sum_signed;
}


ArchiveFormat
compressed_stream_format(std::span<const std::byte> bytes) noexcept
{
    if (bytes.size() >= 3 && u8(bytes[0]) == 0x1F && u8(bytes[1]) == 0x8B
        && u8(bytes[2]) == 0x08) {
        return ArchiveFormat::TarGzip;
    }
    // "BZh" followed by the block size digit.
    if (bytes.size() >= 4 && u8(bytes[0]) == 'B' && u8(bytes[1]) == 'Z'
        && u8(bytes[2]) == 'h' && u8(bytes[3]) >= '1'
        && u8(bytes[3]) <= '9') {
        return ArchiveFormat::TarBzip2;
    }
    static constexpr uint8_t kXzMagic[6] = { 0xFD, '7', 'z', 'X', 'Z', 0x00 };
    if (bytes.size() >= sizeof(kXzMagic)) {
        bool match = true;
        for (size_t i = 0; i < sizeof(kXzMagic); ++i) {
            if (u8(bytes[i]) != kXzMagic[i]) {
                match = false;
                break;
            }
        }
        if (match) {
            return ArchiveFormat::TarXz;
        }
    }
    return ArchiveFormat::Unknown;
}


size_t
decompress_prefix(ArchiveFormat format, std::span<const std::byte> bytes,
                  std::span<std::byte> out) noexcept
{
    switch (format) {
    case ArchiveFormat::TarGzip: return gunzip_prefix(bytes, out);
    case ArchiveFormat::TarBzip2: return bunzip2_prefix(bytes, out);
    case ArchiveFormat::TarXz: return unxz_prefix(bytes, out);
    case ArchiveFormat::Unknown:
    case ArchiveFormat::Zip:
    case ArchiveFormat::Tar: break;
    }
    return 0;
}


OutputFile::~OutputFile() noexcept
{
    (void)close();
}


bool
OutputFile::open(const std::string& path) noexcept
{
    (void)close();
    failed_ = false;
    f_      = std::fopen(path.c_str(), "wb");
    return f_ != nullptr;
}


bool
OutputFile::write(const std::byte* data, size_t size) noexcept
{
    if (!f_) {
        return false;
    }
    if (size != 0U && std::fwrite(data, 1, size, f_) != size) {
        failed_ = true;
        return false;
    }
    return true;
}


bool
OutputFile::close() noexcept
{
    if (!f_) {
        return !failed_;
    }
    if (std::fclose(f_) != 0) {
        failed_ = true;
    }
    f_ = nullptr;
    return !failed_;
}


ArchiveReadStatus
prepare_entry_path(std::string_view destination, std::string_view name,
                   bool is_directory, std::string* out_path)
{
    if (!is_safe_entry_name(name)) {
        return ArchiveReadStatus::UnsafePath;
    }

    const std::filesystem::path target = std::filesystem::path(destination)
                                         / std::filesystem::path(name);
    const std::filesystem::path dir = is_directory ? target
                                                   : target.parent_path();
    std::error_code ec;
    if (!dir.empty()) {
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            return ArchiveReadStatus::WriteFailed;
        }
    }
    *out_path = target.string();
    return ArchiveReadStatus::Ok;
}

}  // namespace archive_internal


bool
is_safe_entry_name(std::string_view name) noexcept
{
    if (name.empty() || name[0] == '/' || name[0] == '\\') {
        return false;
    }
    if (name.size() >= 2 && name[1] == ':') {
        return false;
    }
    size_t start = 0;
    while (start <= name.size()) {
        size_t end = start;
        while (end < name.size() && name[end] != '/' && name[end] != '\\') {
            ++end;
        }
        if (name.substr(start, end - start) == "..") {
            return false;
        }
        start = end + 1;
    }
    return true;
}


ArchiveFormat
sniff_archive(std::span<const std::byte> bytes) noexcept
{
    // A tar header checksum and the compression signatures sit at offset 0;
    // the zip directory sits at the end and is checked last.
    if (archive_internal::is_tar_header(bytes)) {
        return ArchiveFormat::Tar;
    }
    const ArchiveFormat packed = archive_internal::compressed_stream_format(
        bytes);
    if (packed != ArchiveFormat::Unknown) {
        std::array<std::byte, archive_internal::kTarBlockSize> head {};
        const size_t n = archive_internal::decompress_prefix(packed, bytes,
                                                             head);
        if (n == head.size() && archive_internal::is_tar_header(head)) {
            return packed;
        }
        return ArchiveFormat::Unknown;
    }
    uint64_t eocd = 0;
    if (archive_internal::find_zip_eocd(bytes, &eocd)) {
        return ArchiveFormat::Zip;
    }
    return ArchiveFormat::Unknown;
}


ArchiveReadResult
open_archive_reader(const char* path, const ArchiveLimits& limits,
                    std::unique_ptr<ArchiveReader>* out)
{
    ArchiveReadResult res;
    out->reset();

    MappedFile file;
    const MappedFileStatus st = file.open(path, limits.max_file_bytes);
    if (st != MappedFileStatus::Ok) {
        res.status = (st == MappedFileStatus::TooLarge)
                         ? ArchiveReadStatus::LimitExceeded
                         : ArchiveReadStatus::OpenFailed;
        return res;
    }

    const ArchiveFormat format = sniff_archive(file.bytes());
    switch (format) {
    case ArchiveFormat::Zip:
        *out = archive_internal::make_zip_reader(std::move(file), limits);
        return res;
    case ArchiveFormat::Tar:
    case ArchiveFormat::TarGzip:
    case ArchiveFormat::TarBzip2:
    case ArchiveFormat::TarXz:
        *out = archive_internal::make_tar_reader(std::move(file), format,
                                                 limits);
        return res;
    case ArchiveFormat::Unknown: break;
    }
    res.status = ArchiveReadStatus::Unsupported;
    return res;
}

}  // namespace openmtl
