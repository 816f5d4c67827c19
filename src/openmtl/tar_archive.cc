#include "archive_reader_internal.h"

#include <array>
#include <cstring>
#include <utility>
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

namespace openmtl::archive_internal {
namespace {

    static uint8_t u8(std::byte b) noexcept { return static_cast<uint8_t>(b); }

    enum class TarEntryType : uint8_t {
        File,
        Directory,
        /// Links, devices, fifos: listed but never extracted.
        Other,
    };

    struct TarEntry final {
        std::string name;
        TarEntryType type = TarEntryType::Other;
        uint64_t size     = 0;
    };

    enum class TarStep : uint8_t {
        Entry,
        End,
        Error,
    };

    static std::string_view field_string(std::span<const std::byte> block,
                                         size_t off, size_t len) noexcept
    {
        const char* p = reinterpret_cast<const char*>(block.data() + off);
        size_t n      = 0;
        while (n < len && p[n] != '\0') {
            ++n;
        }
        return std::string_view(p, n);
    }

    // Octal, or GNU base-256 when the high bit of the first byte is set.
    static bool parse_size_field(std::span<const std::byte> field,
                                 uint64_t* out) noexcept
    {
        if (!field.empty() && (u8(field[0]) & 0x80U) != 0) {
            uint64_t v = u8(field[0]) & 0x7FU;
            for (size_t i = 1; i < field.size(); ++i) {
                if (v > (UINT64_MAX >> 8)) {
                    return false;
                }
                v = (v << 8) | u8(field[i]);
            }
            *out = v;
            return true;
        }
        uint64_t v       = 0;
        bool found_digit = false;
        for (size_t i = 0; i < field.size(); ++i) {
            const uint8_t c = u8(field[i]);
            if (c == 0 || c == ' ') {
                if (found_digit) {
                    break;
                }
                continue;
            }
            if (c < '0' || c > '7' || v > (UINT64_MAX >> 3)) {
                return false;
            }
            found_digit = true;
            v           = (v << 3) | static_cast<uint64_t>(c - '0');
        }
        *out = v;
        return true;
    }

    static bool is_zero_block(std::span<const std::byte> block) noexcept
    {
        for (size_t i = 0; i < block.size(); ++i) {
            if (u8(block[i]) != 0) {
                return false;
            }
        }
        return true;
    }

    // Extracts the `path` record from a pax extended header payload.
    static bool pax_path(std::string_view records, std::string* out)
    {
        size_t pos = 0;
        bool found = false;
        while (pos < records.size()) {
            size_t sp = pos;
            uint64_t len = 0;
            while (sp < records.size() && records[sp] >= '0'
                   && records[sp] <= '9') {
                len = len * 10U + static_cast<uint64_t>(records[sp] - '0');
                ++sp;
            }
            if (sp >= records.size() || records[sp] != ' ' || len == 0
                || len > records.size() - pos) {
                return found;
            }
            const std::string_view rec = records.substr(
                sp + 1, static_cast<size_t>(pos + len - sp - 1));
            const size_t eq = rec.find('=');
            if (eq != std::string_view::npos && rec.substr(0, eq) == "path") {
                std::string_view value = rec.substr(eq + 1);
                if (!value.empty() && value.back() == '\n') {
                    value.remove_suffix(1);
                }
                out->assign(value.data(), value.size());
                found = true;
            }
            pos += static_cast<size_t>(len);
        }
        return found;
    }


    /// Sequential byte source over a plain or compressed tar stream.
    class TarInput final {
    public:
        TarInput(std::span<const std::byte> bytes,
                 ArchiveFormat format) noexcept
            : bytes_(bytes)
            , format_(format)
        {
        }

        ~TarInput() noexcept { end_decoder(); }

        TarInput(const TarInput&)            = delete;
        TarInput& operator=(const TarInput&) = delete;

        /// False when the format is not a tar or its decompressor is not
        /// built in.
        bool init() noexcept
        {
            switch (format_) {
            case ArchiveFormat::Tar: return true;
            case ArchiveFormat::TarGzip:
#if defined(OPENMTL_HAS_ZLIB) && OPENMTL_HAS_ZLIB
                if (inflateInit2(&zstrm_, 16 + MAX_WBITS) != Z_OK) {
                    return false;
                }
                decoder_live_ = true;
                return true;
#else
                return false;
#endif
            case ArchiveFormat::TarBzip2:
#if defined(OPENMTL_HAS_BZIP2) && OPENMTL_HAS_BZIP2
                if (BZ2_bzDecompressInit(&bzstrm_, 0, 0) != BZ_OK) {
                    return false;
                }
                decoder_live_ = true;
                return true;
#else
                return false;
#endif
            case ArchiveFormat::TarXz:
#if defined(OPENMTL_HAS_LZMA) && OPENMTL_HAS_LZMA
                if (lzma_stream_decoder(&xzstrm_, UINT64_MAX,
                                        LZMA_CONCATENATED)
                    != LZMA_OK) {
                    return false;
                }
                decoder_live_ = true;
                return true;
#else
                return false;
#endif
            case ArchiveFormat::Unknown:
            case ArchiveFormat::Zip: break;
            }
            return false;
        }

        /// Reads up to \p n bytes; returns the count (short at end of data).
        size_t read(std::byte* out, size_t n) noexcept
        {
            switch (format_) {
            case ArchiveFormat::Tar: return copy_some(out, n);
            case ArchiveFormat::TarGzip: return inflate_some(out, n);
            case ArchiveFormat::TarBzip2: return bunzip2_some(out, n);
            case ArchiveFormat::TarXz: return unxz_some(out, n);
            case ArchiveFormat::Unknown:
            case ArchiveFormat::Zip: break;
            }
            return 0;
        }

        bool read_exact(std::byte* out, size_t n) noexcept
        {
            size_t got = 0;
            while (got < n) {
                const size_t r = read(out + got, n - got);
                if (r == 0) {
                    return false;
                }
                got += r;
            }
            return true;
        }

        /// Direct view of the next \p n bytes (plain tar only).
        std::span<const std::byte> view(uint64_t n) const noexcept
        {
            if (!plain() || !in_range(bytes_, pos_, n)) {
                return {};
            }
            return bytes_.subspan(static_cast<size_t>(pos_),
                                  static_cast<size_t>(n));
        }

        bool skip(uint64_t n) noexcept
        {
            if (plain()) {
                if (!in_range(bytes_, pos_, n)) {
                    return false;
                }
                pos_ += n;
                return true;
            }
            std::array<std::byte, 65536> scratch {};
            while (n != 0U) {
                const size_t step = (n < scratch.size())
                                        ? static_cast<size_t>(n)
                                        : scratch.size();
                if (!read_exact(scratch.data(), step)) {
                    return false;
                }
                n -= step;
            }
            return true;
        }

        bool plain() const noexcept { return format_ == ArchiveFormat::Tar; }

        /// True when no more data follows because the input really ended:
        /// always for plain tar, and for compressed input only once the
        /// decompressor saw the end of the last stream.
        bool clean_end() const noexcept { return plain() || ended_; }

    private:
        // Compressed input is fed in chunks of at most 1 GiB so the 32-bit
        // zlib and libbz2 counters never overflow.
        static constexpr uint64_t kChunk = 0x40000000U;

        size_t next_chunk(const std::byte** data) noexcept
        {
            const uint64_t remaining = bytes_.size() - pos_;
            const size_t chunk       = (remaining > kChunk)
                                           ? static_cast<size_t>(kChunk)
                                           : static_cast<size_t>(remaining);
            *data = bytes_.data() + pos_;
            pos_ += chunk;
            return chunk;
        }

        size_t copy_some(std::byte* out, size_t n) noexcept
        {
            const uint64_t avail = bytes_.size() - pos_;
            const size_t take    = (n < avail) ? n
                                               : static_cast<size_t>(avail);
            if (take != 0U) {
                std::memcpy(out, bytes_.data() + pos_, take);
            }
            pos_ += take;
            return take;
        }

        size_t inflate_some(std::byte* out, size_t n) noexcept
        {
#if defined(OPENMTL_HAS_ZLIB) && OPENMTL_HAS_ZLIB
            if (!decoder_live_ || failed_ || ended_) {
                return 0;
            }
            const uInt cap   = (n > kChunk) ? static_cast<uInt>(kChunk)
                                            : static_cast<uInt>(n);
            zstrm_.next_out  = reinterpret_cast<Bytef*>(out);
            zstrm_.avail_out = cap;
            while (zstrm_.avail_out == cap) {
                if (zstrm_.avail_in == 0) {
                    if (pos_ >= bytes_.size()) {
                        break;
                    }
                    const std::byte* data = nullptr;
                    zstrm_.avail_in = static_cast<uInt>(next_chunk(&data));
                    zstrm_.next_in  = reinterpret_cast<Bytef*>(
                        const_cast<std::byte*>(data));
                }
                const int ret = inflate(&zstrm_, Z_NO_FLUSH);
                if (ret == Z_STREAM_END) {
                    // Concatenated gzip members continue the same tar stream.
                    if (zstrm_.avail_in == 0 && pos_ >= bytes_.size()) {
                        ended_ = true;
                        break;
                    }
                    if (inflateReset(&zstrm_) != Z_OK) {
                        failed_ = true;
                        break;
                    }
                    continue;
                }
                if (ret != Z_OK) {
                    failed_ = true;
                    break;
                }
            }
            return static_cast<size_t>(cap - zstrm_.avail_out);
#else
            (void)out;
            (void)n;
            return 0;
#endif
        }

        size_t bunzip2_some(std::byte* out, size_t n) noexcept
        {
#if defined(OPENMTL_HAS_BZIP2) && OPENMTL_HAS_BZIP2
            if (!decoder_live_ || failed_ || ended_) {
                return 0;
            }
            const unsigned int cap = (n > kChunk)
                                         ? static_cast<unsigned int>(kChunk)
                                         : static_cast<unsigned int>(n);
            bzstrm_.next_out  = reinterpret_cast<char*>(out);
            bzstrm_.avail_out = cap;
            while (bzstrm_.avail_out == cap) {
                if (bzstrm_.avail_in == 0) {
                    if (pos_ >= bytes_.size()) {
                        break;
                    }
                    const std::byte* data = nullptr;
                    bzstrm_.avail_in = static_cast<unsigned int>(
                        next_chunk(&data));
                    bzstrm_.next_in  = reinterpret_cast<char*>(
                        const_cast<std::byte*>(data));
                }
                const unsigned int avail_in = bzstrm_.avail_in;
                const int ret               = BZ2_bzDecompress(&bzstrm_);
                if (ret == BZ_STREAM_END) {
                    // Parallel compressors emit one bzip2 stream per chunk.
                    if (bzstrm_.avail_in == 0 && pos_ >= bytes_.size()) {
                        ended_ = true;
                        break;
                    }
                    if (!restart_bzip2()) {
                        failed_ = true;
                        break;
                    }
                    continue;
                }
                if (ret != BZ_OK
                    || (bzstrm_.avail_in == avail_in && avail_in != 0U
                        && bzstrm_.avail_out == cap)) {
                    failed_ = true;
                    break;
                }
            }
            return static_cast<size_t>(cap - bzstrm_.avail_out);
#else
            (void)out;
            (void)n;
            return 0;
#endif
        }

        size_t unxz_some(std::byte* out, size_t n) noexcept
        {
#if defined(OPENMTL_HAS_LZMA) && OPENMTL_HAS_LZMA
            if (!decoder_live_ || failed_ || ended_) {
                return 0;
            }
            xzstrm_.next_out  = reinterpret_cast<uint8_t*>(out);
            xzstrm_.avail_out = n;
            while (xzstrm_.avail_out == n) {
                if (xzstrm_.avail_in == 0 && pos_ < bytes_.size()) {
                    const std::byte* data = nullptr;
                    xzstrm_.avail_in = next_chunk(&data);
                    xzstrm_.next_in  = reinterpret_cast<const uint8_t*>(data);
                }
                // LZMA_CONCATENATED needs LZMA_FINISH to detect the end.
                const lzma_action action = (pos_ >= bytes_.size())
                                               ? LZMA_FINISH
                                               : LZMA_RUN;
                const lzma_ret ret = lzma_code(&xzstrm_, action);
                if (ret == LZMA_STREAM_END) {
                    ended_ = true;
                    break;
                }
                if (ret != LZMA_OK) {
                    failed_ = true;
                    break;
                }
            }
            return n - xzstrm_.avail_out;
#else
            (void)out;
            (void)n;
            return 0;
#endif
        }

#if defined(OPENMTL_HAS_BZIP2) && OPENMTL_HAS_BZIP2
        bool restart_bzip2() noexcept
        {
            char* next_in           = bzstrm_.next_in;
            const unsigned avail_in = bzstrm_.avail_in;
            char* next_out          = bzstrm_.next_out;
            const unsigned avail    = bzstrm_.avail_out;
            (void)BZ2_bzDecompressEnd(&bzstrm_);
            bzstrm_ = bz_stream {};
            if (BZ2_bzDecompressInit(&bzstrm_, 0, 0) != BZ_OK) {
                decoder_live_ = false;
                return false;
            }
            bzstrm_.next_in   = next_in;
            bzstrm_.avail_in  = avail_in;
            bzstrm_.next_out  = next_out;
            bzstrm_.avail_out = avail;
            return true;
        }
#endif

        void end_decoder() noexcept
        {
            if (!decoder_live_) {
                return;
            }
            decoder_live_ = false;
            switch (format_) {
            case ArchiveFormat::TarGzip:
#if defined(OPENMTL_HAS_ZLIB) && OPENMTL_HAS_ZLIB
                (void)inflateEnd(&zstrm_);
#endif
                break;
            case ArchiveFormat::TarBzip2:
#if defined(OPENMTL_HAS_BZIP2) && OPENMTL_HAS_BZIP2
                (void)BZ2_bzDecompressEnd(&bzstrm_);
#endif
                break;
            case ArchiveFormat::TarXz:
#if defined(OPENMTL_HAS_LZMA) && OPENMTL_HAS_LZMA
                lzma_end(&xzstrm_);
#endif
                break;
            case ArchiveFormat::Unknown:
            case ArchiveFormat::Zip:
            case ArchiveFormat::Tar: break;
            }
        }

        std::span<const std::byte> bytes_;
        uint64_t pos_         = 0;
        ArchiveFormat format_ = ArchiveFormat::Tar;
        bool decoder_live_    = false;
        bool failed_          = false;
        bool ended_           = false;
#if defined(OPENMTL_HAS_ZLIB) && OPENMTL_HAS_ZLIB
        z_stream zstrm_ {};
#endif
#if defined(OPENMTL_HAS_BZIP2) && OPENMTL_HAS_BZIP2
        bz_stream bzstrm_ {};
#endif
#if defined(OPENMTL_HAS_LZMA) && OPENMTL_HAS_LZMA
        lzma_stream xzstrm_ {};
#endif
    };


    /// Walks tar headers; entry data must be consumed or skipped in order.
    class TarWalker final {
    public:
        TarWalker(TarInput* input, const ArchiveLimits& limits) noexcept
            : input_(input)
            , limits_(limits)
        {
        }

        TarStep next(TarEntry* out);

        /// Copies the data of the current entry into \p file.
        ArchiveReadStatus copy_data(OutputFile* file);

        ArchiveReadStatus error() const noexcept { return error_; }

    private:
        TarStep fail(ArchiveReadStatus status) noexcept
        {
            error_ = status;
            return TarStep::Error;
        }

        bool finish_entry() noexcept
        {
            if (remaining_ != 0U && !input_->skip(remaining_)) {
                return false;
            }
            remaining_ = 0;
            if (padding_ != 0U && !input_->skip(padding_)) {
                return false;
            }
            padding_ = 0;
            return true;
        }

        bool read_payload(uint64_t size, std::string* out);

        TarInput* input_ = nullptr;
        ArchiveLimits limits_;
        ArchiveReadStatus error_ = ArchiveReadStatus::Ok;
        uint64_t remaining_      = 0;
        uint64_t padding_        = 0;
        uint32_t entries_        = 0;
    };


    bool TarWalker::read_payload(uint64_t size, std::string* out)
    {
        // Long names and pax headers are small; cap them at 1 MiB.
        if (size > (1U << 20)) {
            return false;
        }
        out->resize(static_cast<size_t>(size));
        if (size != 0U
            && !input_->read_exact(reinterpret_cast<std::byte*>(out->data()),
                                   static_cast<size_t>(size))) {
            return false;
        }
        remaining_ = 0;
        padding_   = (kTarBlockSize - (size % kTarBlockSize)) % kTarBlockSize;
        return finish_entry();
    }


    TarStep TarWalker::next(TarEntry* out)
    {
        if (!finish_entry()) {
            return fail(ArchiveReadStatus::Malformed);
        }

        std::string long_name;
        bool have_long_name = false;

        std::array<std::byte, kTarBlockSize> block {};
        for (;;) {
            const size_t got = input_->read(block.data(), block.size());
            if (got == 0) {
                // A compressed stream that stops short is truncated.
                return input_->clean_end()
                           ? TarStep::End
                           : fail(ArchiveReadStatus::Malformed);
            }
            if (got != block.size() && !input_->read_exact(
                                           block.data() + got,
                                           block.size() - got)) {
                return fail(ArchiveReadStatus::Malformed);
            }
            if (is_zero_block(block)) {
                return TarStep::End;
            }
            if (!is_tar_header(block)) {
                return fail(ArchiveReadStatus::Malformed);
            }

            uint64_t size = 0;
            if (!parse_size_field(std::span<const std::byte>(block).subspan(
                                      124, 12),
                                  &size)) {
                return fail(ArchiveReadStatus::Malformed);
            }
            const char type = static_cast<char>(block[156]);

            if (type == 'L') {
                if (!read_payload(size, &long_name)) {
                    return fail(ArchiveReadStatus::Malformed);
                }
                const size_t nul = long_name.find('\0');
                if (nul != std::string::npos) {
                    long_name.resize(nul);
                }
                have_long_name = true;
                continue;
            }
            if (type == 'x') {
                std::string records;
                if (!read_payload(size, &records)) {
                    return fail(ArchiveReadStatus::Malformed);
                }
                if (pax_path(records, &long_name)) {
                    have_long_name = true;
                }
                continue;
            }
            if (type == 'g' || type == 'K') {
                std::string ignored;
                if (!read_payload(size, &ignored)) {
                    return fail(ArchiveReadStatus::Malformed);
                }
                continue;
            }

            entries_ += 1;
            if (limits_.max_entries != 0U && entries_ > limits_.max_entries) {
                return fail(ArchiveReadStatus::LimitExceeded);
            }

            out->name.clear();
            if (have_long_name) {
                out->name = long_name;
            } else {
                const std::string_view name   = field_string(block, 0, 100);
                const std::string_view magic  = field_string(block, 257, 6);
                const std::string_view prefix = field_string(block, 345, 155);
                if (magic.substr(0, 5) == "ustar" && !prefix.empty()) {
                    out->name.assign(prefix.data(), prefix.size());
                    out->name.push_back('/');
                }
                out->name.append(name.data(), name.size());
            }

            switch (type) {
            case '0':
            case '\0':
            case '7': out->type = TarEntryType::File; break;
            case '5': out->type = TarEntryType::Directory; break;
            default: out->type = TarEntryType::Other; break;
            }
            // Old tar marks directories with a trailing slash only.
            if (out->type == TarEntryType::File && !out->name.empty()
                && out->name.back() == '/') {
                out->type = TarEntryType::Directory;
            }
            // Hard links, symlinks and devices carry no data of their own.
            const bool has_data = out->type != TarEntryType::Other
                                  || type == 'S';
            out->size = has_data ? size : 0;

            if (out->type == TarEntryType::File
                && out->size > limits_.max_entry_bytes) {
                return fail(ArchiveReadStatus::LimitExceeded);
            }
            remaining_ = out->size;
            padding_   = (kTarBlockSize - (out->size % kTarBlockSize))
                       % kTarBlockSize;
            return TarStep::Entry;
        }
    }


    ArchiveReadStatus TarWalker::copy_data(OutputFile* file)
    {
        if (input_->plain()) {
            const std::span<const std::byte> data = input_->view(remaining_);
            if (data.size() != remaining_) {
                return ArchiveReadStatus::Malformed;
            }
            if (!file->write(data.data(), data.size())) {
                return ArchiveReadStatus::WriteFailed;
            }
            if (!input_->skip(remaining_)) {
                return ArchiveReadStatus::Malformed;
            }
            remaining_ = 0;
            return ArchiveReadStatus::Ok;
        }

        std::array<std::byte, 65536> buf {};
        while (remaining_ != 0U) {
            const size_t step = (remaining_ < buf.size())
                                    ? static_cast<size_t>(remaining_)
                                    : buf.size();
            if (!input_->read_exact(buf.data(), step)) {
                return ArchiveReadStatus::Malformed;
            }
            if (!file->write(buf.data(), step)) {
                return ArchiveReadStatus::WriteFailed;
            }
            remaining_ -= step;
        }
        return ArchiveReadStatus::Ok;
    }


    class TarArchiveReader final : public ArchiveReader {
    public:
        TarArchiveReader(MappedFile&& file, ArchiveFormat format,
                         const ArchiveLimits& limits)
            : file_(std::move(file))
            , format_(format)
            , limits_(limits)
        {
        }

        ~TarArchiveReader() override { close(); }

        ArchiveFormat format() const noexcept override { return format_; }

        ArchiveReadResult list_entries(std::vector<std::string>* out) override
        {
            ArchiveReadResult res;
            if (!file_.is_open()) {
                res.status = ArchiveReadStatus::OpenFailed;
                return res;
            }
            file_.advise_sequential();
            TarInput input(file_.bytes(), format_);
            if (!input.init()) {
                res.status = ArchiveReadStatus::Unsupported;
                return res;
            }
            TarWalker walker(&input, limits_);

            TarEntry entry;
            for (;;) {
                const TarStep step = walker.next(&entry);
                if (step == TarStep::End) {
                    return res;
                }
                if (step == TarStep::Error) {
                    res.status = walker.error();
                    return res;
                }
                out->push_back(entry.name);
                res.entries += 1;
            }
        }

        ArchiveReadResult extract_all(std::string_view destination) override
        {
            ArchiveReadResult res;
            if (!file_.is_open()) {
                res.status = ArchiveReadStatus::OpenFailed;
                return res;
            }
            file_.advise_sequential();
            TarInput input(file_.bytes(), format_);
            if (!input.init()) {
                res.status = ArchiveReadStatus::Unsupported;
                return res;
            }
            TarWalker walker(&input, limits_);

            TarEntry entry;
            for (;;) {
                const TarStep step = walker.next(&entry);
                if (step == TarStep::End) {
                    return res;
                }
                if (step == TarStep::Error) {
                    res.status = walker.error();
                    return res;
                }
                if (entry.type == TarEntryType::Other) {
                    continue;
                }

                const bool is_dir = entry.type == TarEntryType::Directory;
                std::string path;
                res.status = prepare_entry_path(destination, entry.name,
                                                is_dir, &path);
                if (res.status != ArchiveReadStatus::Ok) {
                    return res;
                }
                if (!is_dir) {
                    if (res.bytes_written + entry.size
                        > limits_.max_total_bytes) {
                        res.status = ArchiveReadStatus::LimitExceeded;
                        return res;
                    }
                    OutputFile out;
                    if (!out.open(path)) {
                        res.status = ArchiveReadStatus::WriteFailed;
                        return res;
                    }
                    res.status = walker.copy_data(&out);
                    if (res.status != ArchiveReadStatus::Ok) {
                        return res;
                    }
                    if (!out.close()) {
                        res.status = ArchiveReadStatus::WriteFailed;
                        return res;
                    }
                    res.bytes_written += entry.size;
                }
                res.entries += 1;
            }
        }

        void close() noexcept override { file_.close(); }

    private:
        MappedFile file_;
        ArchiveFormat format_ = ArchiveFormat::Tar;
        ArchiveLimits limits_;
    };

}  // namespace


std::unique_ptr<ArchiveReader>
make_tar_reader(MappedFile&& file, ArchiveFormat format,
                const ArchiveLimits& limits)
{
    return std::make_unique<TarArchiveReader>(std::move(file), format,
                                              limits);
}

}  // namespace openmtl::archive_internal
