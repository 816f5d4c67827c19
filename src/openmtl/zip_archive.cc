#include "archive_reader_internal.h"

#include <array>
#include <utility>
#include <vector>

#if defined(OPENMTL_HAS_ZLIB) && OPENMTL_HAS_ZLIB
#    include <zlib.h>
#endif

namespace openmtl::archive_internal {
namespace {

    static constexpr uint32_t kCentralSig      = 0x02014b50U;
    static constexpr uint32_t kLocalSig        = 0x04034b50U;
    static constexpr uint32_t kZip64EocdSig    = 0x06064b50U;
    static constexpr uint32_t kZip64LocatorSig = 0x07064b50U;
    static constexpr uint16_t kZip64ExtraId    = 0x0001U;

    static constexpr uint64_t kCentralHeaderSize = 46;
    static constexpr uint64_t kLocalHeaderSize   = 30;

    static constexpr uint16_t kMethodStored  = 0;
    static constexpr uint16_t kMethodDeflate = 8;
    static constexpr uint16_t kFlagEncrypted = 0x0001U;

    struct ZipEntry final {
        std::string name;
        uint16_t flags        = 0;
        uint16_t method       = 0;
        uint32_t crc32        = 0;
        uint64_t csize        = 0;
        uint64_t usize        = 0;
        uint64_t local_offset = 0;
    };

    // Replaces 0xFFFFFFFF placeholders with values from the zip64 extra field.
    static bool apply_zip64_extra(std::span<const std::byte> extra,
                                  bool need_usize, bool need_csize,
                                  bool need_offset, ZipEntry* e) noexcept
    {
        uint64_t off = 0;
        while (off + 4 <= extra.size()) {
            const uint16_t id   = read_u16le(extra, off);
            const uint16_t size = read_u16le(extra, off + 2);
            off += 4;
            if (!in_range(extra, off, size)) {
                return false;
            }
            if (id == kZip64ExtraId) {
                const std::span<const std::byte> f = extra.subspan(
                    static_cast<size_t>(off), size);
                uint64_t p = 0;
                if (need_usize) {
                    if (!in_range(f, p, 8)) {
                        return false;
                    }
                    e->usize = read_u64le(f, p);
                    p += 8;
                }
                if (need_csize) {
                    if (!in_range(f, p, 8)) {
                        return false;
                    }
                    e->csize = read_u64le(f, p);
                    p += 8;
                }
                if (need_offset) {
                    if (!in_range(f, p, 8)) {
                        return false;
                    }
                    e->local_offset = read_u64le(f, p);
                }
                return true;
            }
            off += size;
        }
        return !(need_usize || need_csize || need_offset);
    }


    class ZipArchiveReader final : public ArchiveReader {
    public:
        ZipArchiveReader(MappedFile&& file, const ArchiveLimits& limits)
            : file_(std::move(file))
            , limits_(limits)
        {
        }

        ~ZipArchiveReader() override { close(); }

        ArchiveFormat format() const noexcept override
        {
            return ArchiveFormat::Zip;
        }

        ArchiveReadResult list_entries(std::vector<std::string>* out) override
        {
            ArchiveReadResult res;
            res.status = load_directory();
            if (res.status != ArchiveReadStatus::Ok) {
                return res;
            }
            for (size_t i = 0; i < entries_.size(); ++i) {
                out->push_back(entries_[i].name);
            }
            res.entries = static_cast<uint32_t>(entries_.size());
            return res;
        }

        ArchiveReadResult extract_all(std::string_view destination) override
        {
            ArchiveReadResult res;
            res.status = load_directory();
            if (res.status != ArchiveReadStatus::Ok) {
                return res;
            }

            for (size_t i = 0; i < entries_.size(); ++i) {
                const ZipEntry& e = entries_[i];
                const bool is_dir = !e.name.empty() && e.name.back() == '/';

                std::string path;
                res.status = prepare_entry_path(destination, e.name, is_dir,
                                                &path);
                if (res.status != ArchiveReadStatus::Ok) {
                    return res;
                }
                if (!is_dir) {
                    if (res.bytes_written + e.usize
                        > limits_.max_total_bytes) {
                        res.status = ArchiveReadStatus::LimitExceeded;
                        return res;
                    }
                    res.status = extract_entry(e, path, &res.bytes_written);
                    if (res.status != ArchiveReadStatus::Ok) {
                        return res;
                    }
                }
                res.entries += 1;
            }
            return res;
        }

        void close() noexcept override { file_.close(); }

    private:
        ArchiveReadStatus load_directory();
        ArchiveReadStatus extract_entry(const ZipEntry& e,
                                        const std::string& path,
                                        uint64_t* written);

        MappedFile file_;
        ArchiveLimits limits_;
        std::vector<ZipEntry> entries_;
        bool loaded_ = false;
    };


    ArchiveReadStatus ZipArchiveReader::load_directory()
    {
        if (loaded_) {
            return ArchiveReadStatus::Ok;
        }
        if (!file_.is_open()) {
            return ArchiveReadStatus::OpenFailed;
        }
        const std::span<const std::byte> bytes = file_.bytes();

        uint64_t eocd = 0;
        if (!find_zip_eocd(bytes, &eocd)) {
            return ArchiveReadStatus::Malformed;
        }
        uint64_t count   = read_u16le(bytes, eocd + 10);
        uint64_t cd_size = read_u32le(bytes, eocd + 12);
        uint64_t cd_off  = read_u32le(bytes, eocd + 16);

        if (count == 0xFFFFU || cd_size == 0xFFFFFFFFU
            || cd_off == 0xFFFFFFFFU) {
            if (eocd < 20 || read_u32le(bytes, eocd - 20) != kZip64LocatorSig) {
                return ArchiveReadStatus::Malformed;
            }
            const uint64_t z64 = read_u64le(bytes, eocd - 20 + 8);
            if (!in_range(bytes, z64, 56)
                || read_u32le(bytes, z64) != kZip64EocdSig) {
                return ArchiveReadStatus::Malformed;
            }
            count   = read_u64le(bytes, z64 + 32);
            cd_size = read_u64le(bytes, z64 + 40);
            cd_off  = read_u64le(bytes, z64 + 48);
        }

        if (count > limits_.max_entries) {
            return ArchiveReadStatus::LimitExceeded;
        }
        if (!in_range(bytes, cd_off, cd_size)) {
            return ArchiveReadStatus::Malformed;
        }

        std::vector<ZipEntry> entries;
        entries.reserve(static_cast<size_t>(count));
        uint64_t off = cd_off;
        for (uint64_t i = 0; i < count; ++i) {
            if (!in_range(bytes, off, kCentralHeaderSize)
                || read_u32le(bytes, off) != kCentralSig) {
                return ArchiveReadStatus::Malformed;
            }
            ZipEntry e;
            e.flags                   = read_u16le(bytes, off + 8);
            e.method                  = read_u16le(bytes, off + 10);
            e.crc32                   = read_u32le(bytes, off + 16);
            e.csize                   = read_u32le(bytes, off + 20);
            e.usize                   = read_u32le(bytes, off + 24);
            const uint16_t name_len    = read_u16le(bytes, off + 28);
            const uint16_t extra_len   = read_u16le(bytes, off + 30);
            const uint16_t comment_len = read_u16le(bytes, off + 32);
            e.local_offset            = read_u32le(bytes, off + 42);

            const uint64_t name_off = off + kCentralHeaderSize;
            if (!in_range(bytes, name_off,
                          static_cast<uint64_t>(name_len) + extra_len
                              + comment_len)) {
                return ArchiveReadStatus::Malformed;
            }
            e.name.assign(reinterpret_cast<const char*>(
                              bytes.data() + name_off),
                          name_len);

            const bool need_usize  = e.usize == 0xFFFFFFFFU;
            const bool need_csize  = e.csize == 0xFFFFFFFFU;
            const bool need_offset = e.local_offset == 0xFFFFFFFFU;
            if (need_usize || need_csize || need_offset) {
                const std::span<const std::byte> extra = bytes.subspan(
                    static_cast<size_t>(name_off + name_len), extra_len);
                if (!apply_zip64_extra(extra, need_usize, need_csize,
                                       need_offset, &e)) {
                    return ArchiveReadStatus::Malformed;
                }
            }
            if (e.usize > limits_.max_entry_bytes) {
                return ArchiveReadStatus::LimitExceeded;
            }

            entries.push_back(std::move(e));
            off = name_off + name_len + extra_len + comment_len;
        }

        entries_ = std::move(entries);
        loaded_  = true;
        return ArchiveReadStatus::Ok;
    }


#if defined(OPENMTL_HAS_ZLIB) && OPENMTL_HAS_ZLIB
    static ArchiveReadStatus inflate_raw(std::span<const std::byte> in,
                                         uint64_t expected_size,
                                         OutputFile* out, uint32_t* crc,
                                         uint64_t* produced) noexcept
    {
        z_stream strm {};
        strm.zalloc = Z_NULL;
        strm.zfree  = Z_NULL;
        strm.opaque = Z_NULL;
        if (inflateInit2(&strm, -MAX_WBITS) != Z_OK) {
            return ArchiveReadStatus::Malformed;
        }

        std::array<std::byte, 65536> buf {};
        uint64_t in_off = 0;
        uLong c         = crc32(0L, Z_NULL, 0);
        uint64_t total  = 0;
        int ret         = Z_OK;

        while (ret != Z_STREAM_END) {
            if (strm.avail_in == 0 && in_off < in.size()) {
                const uint64_t remaining = in.size() - in_off;
                const uInt chunk = (remaining > 0x40000000U)
                                       ? 0x40000000U
                                       : static_cast<uInt>(remaining);
                strm.next_in  = reinterpret_cast<Bytef*>(
                    const_cast<std::byte*>(in.data() + in_off));
                strm.avail_in = chunk;
                in_off += chunk;
            }
            strm.next_out  = reinterpret_cast<Bytef*>(buf.data());
            strm.avail_out = static_cast<uInt>(buf.size());

            ret = inflate(&strm, Z_NO_FLUSH);
            if (ret != Z_OK && ret != Z_STREAM_END) {
                (void)inflateEnd(&strm);
                return ArchiveReadStatus::Malformed;
            }
            const size_t n = buf.size() - strm.avail_out;
            total += n;
            if (total > expected_size) {
                (void)inflateEnd(&strm);
                return ArchiveReadStatus::Malformed;
            }
            c = crc32(c, reinterpret_cast<const Bytef*>(buf.data()),
                      static_cast<uInt>(n));
            if (!out->write(buf.data(), n)) {
                (void)inflateEnd(&strm);
                return ArchiveReadStatus::WriteFailed;
            }
            if (ret != Z_STREAM_END && n == 0 && strm.avail_in == 0
                && in_off >= in.size()) {
                (void)inflateEnd(&strm);
                return ArchiveReadStatus::Malformed;
            }
        }
        (void)inflateEnd(&strm);
        *crc      = static_cast<uint32_t>(c);
        *produced = total;
        return ArchiveReadStatus::Ok;
    }
#endif


    ArchiveReadStatus ZipArchiveReader::extract_entry(const ZipEntry& e,
                                                      const std::string& path,
                                                      uint64_t* written)
    {
        if ((e.flags & kFlagEncrypted) != 0) {
            return ArchiveReadStatus::Unsupported;
        }
        if (e.method != kMethodStored && e.method != kMethodDeflate) {
            return ArchiveReadStatus::Unsupported;
        }

        const std::span<const std::byte> bytes = file_.bytes();
        if (!in_range(bytes, e.local_offset, kLocalHeaderSize)
            || read_u32le(bytes, e.local_offset) != kLocalSig) {
            return ArchiveReadStatus::Malformed;
        }
        const uint16_t name_len  = read_u16le(bytes, e.local_offset + 26);
        const uint16_t extra_len = read_u16le(bytes, e.local_offset + 28);
        const uint64_t data_off  = e.local_offset + kLocalHeaderSize
                                  + name_len + extra_len;
        if (!in_range(bytes, data_off, e.csize)) {
            return ArchiveReadStatus::Malformed;
        }
        const std::span<const std::byte> data = bytes.subspan(
            static_cast<size_t>(data_off), static_cast<size_t>(e.csize));

        OutputFile out;
        if (!out.open(path)) {
            return ArchiveReadStatus::WriteFailed;
        }

        if (e.method == kMethodStored) {
            if (e.csize != e.usize) {
                return ArchiveReadStatus::Malformed;
            }
#if defined(OPENMTL_HAS_ZLIB) && OPENMTL_HAS_ZLIB
            const uLong c = crc32_z(crc32(0L, Z_NULL, 0),
                                    reinterpret_cast<const Bytef*>(
                                        data.data()),
                                    static_cast<z_size_t>(data.size()));
            if (static_cast<uint32_t>(c) != e.crc32) {
                return ArchiveReadStatus::Malformed;
            }
#endif
            if (!out.write(data.data(), data.size()) || !out.close()) {
                return ArchiveReadStatus::WriteFailed;
            }
            *written += e.usize;
            return ArchiveReadStatus::Ok;
        }

#if defined(OPENMTL_HAS_ZLIB) && OPENMTL_HAS_ZLIB
        uint32_t crc      = 0;
        uint64_t produced = 0;
        const ArchiveReadStatus st = inflate_raw(data, e.usize, &out, &crc,
                                                 &produced);
        if (st != ArchiveReadStatus::Ok) {
            return st;
        }
        if (produced != e.usize || crc != e.crc32) {
            return ArchiveReadStatus::Malformed;
        }
        if (!out.close()) {
            return ArchiveReadStatus::WriteFailed;
        }
        *written += produced;
        return ArchiveReadStatus::Ok;
#else
        return ArchiveReadStatus::Unsupported;
#endif
    }

}  // namespace


std::unique_ptr<ArchiveReader>
make_zip_reader(MappedFile&& file, const ArchiveLimits& limits)
{
    return std::make_unique<ZipArchiveReader>(std::move(file), limits);
}

}  // namespace openmtl::archive_internal
