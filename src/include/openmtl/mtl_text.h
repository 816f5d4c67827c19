#pragma once

#include "openmtl/mtl_value.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file mtl_text.h
 * \brief MTL text engine: line scanner, group lexer and record parser.
 *
 * The MTL grammar (one statement per line, whitespace-trimmed):
 * - `GROUP = <tag>` opens a group (groups nest).
 * - `END_GROUP = <tag>` closes the innermost open group; tags must match.
 * - `END` terminates the document; unclosed groups are discarded.
 * - `<key> = <value>` is an attribute of the innermost open group.
 *
 * The pipeline is pull based: \ref MtlLineScanner yields trimmed lines,
 * \ref MtlLexer turns them into \ref MtlRawGroup spans in close order and
 * \ref parse_mtl_groups converts each span into an \ref MtlRecord.
 */

namespace openmtl {

/// Status of the text engine and of \ref MtlStore::parse.
enum class MtlParseStatus : uint8_t {
    Ok,
    /// The metadata file could not be opened, mapped or read.
    ReadFailed,
    /// A budget in \ref MtlParseLimits was exceeded.
    LimitExceeded,
    /// `END_GROUP` tag differs from the tag of the innermost open `GROUP`.
    DivergingTags,
    /// `END_GROUP` with no open group.
    UnbalancedGroup,
    /// A non-blank statement appeared outside any group.
    StrayStatement,
    /// No group yielded a record.
    NoMetadata,
};

/// Returns true for the statuses that denote malformed MTL text.
constexpr bool
is_parsing_error(MtlParseStatus status) noexcept
{
    return status == MtlParseStatus::DivergingTags
           || status == MtlParseStatus::UnbalancedGroup
           || status == MtlParseStatus::StrayStatement
           || status == MtlParseStatus::NoMetadata;
}

/// Resource limits applied while parsing untrusted MTL text.
struct MtlParseLimits final {
    /// Maximum metadata file size (0 = unlimited).
    uint64_t max_file_bytes = 16ULL * 1024ULL * 1024ULL;
    uint32_t max_lines       = 1U << 20;
    uint32_t max_group_depth = 64;
    uint32_t max_records     = 1U << 14;
};

struct MtlParseResult final {
    MtlParseStatus status = MtlParseStatus::Ok;
    /// 1-based line of the failing statement (0 if not line specific).
    uint32_t line = 0;
    /// Groups closed by the lexer.
    uint32_t groups = 0;
    /// Records produced (groups with more than one attribute).
    uint32_t records = 0;
};

/**
 * \brief Splits text into whitespace-trimmed lines.
 *
 * Accepts `\n`, `\r\n` and `\r` line endings. Blank lines are produced as
 * empty views. Returned views point into the scanned text.
 */
class MtlLineScanner final {
public:
    explicit MtlLineScanner(std::string_view text) noexcept;

    /// Returns false once the text is exhausted.
    bool next(std::string_view* line) noexcept;
    /// 1-based number of the line last returned by \ref next.
    uint32_t line_number() const noexcept { return line_number_; }

private:
    std::string_view text_;
    size_t pos_            = 0;
    uint32_t line_number_  = 0;
};

/// One closed `GROUP`/`END_GROUP` span. The `GROUP = <tag>` line is the
/// first entry of \ref lines; nested groups are not part of their parent.
struct MtlRawGroup final {
    std::string_view tag;
    std::vector<std::string_view> lines;
    uint32_t first_line = 0;
};

/// Lexer step status.
enum class MtlLexStatus : uint8_t {
    /// A group was produced.
    Group,
    /// `END` or end of input reached; unclosed groups are dropped.
    End,
    /// Structural error; see \ref MtlLexer::error.
    Error,
};

/**
 * \brief Stack-based grouping pass over scanned lines.
 *
 * Groups are produced in close order, so an inner group is produced before
 * the group that contains it.
 */
class MtlLexer final {
public:
    MtlLexer(MtlLineScanner* scanner, const MtlParseLimits& limits) noexcept;

    MtlLexStatus next(MtlRawGroup* out);

    /// Error detail after \ref next returned \ref MtlLexStatus::Error.
    const MtlParseResult& error() const noexcept { return error_; }
    uint32_t groups_closed() const noexcept { return groups_closed_; }

private:
    MtlLexStatus fail(MtlParseStatus status) noexcept;

    MtlLineScanner* scanner_ = nullptr;
    MtlParseLimits limits_;
    std::vector<MtlRawGroup> stack_;
    MtlParseResult error_;
    uint32_t groups_closed_ = 0;
    bool done_              = false;
};

/// One `key = value` attribute of a record.
struct MtlField final {
    std::string key;
    MtlValue value;
};

/**
 * \brief A parsed group: ordered fields, including the `GROUP` field.
 *
 * Keys keep the case used in the file. Lookups are ASCII case-insensitive.
 */
struct MtlRecord final {
    std::string group;
    std::vector<MtlField> fields;

    /// Returns the field named \p key (case-insensitive), or null.
    const MtlField* find(std::string_view key) const noexcept;
};

/// Matches `<keyword> = <rest>` at the start of \p line; \p rest is trimmed
/// and non-empty on success.
bool
match_keyword_statement(std::string_view line, std::string_view keyword,
                        std::string_view* rest) noexcept;

/// Splits `key = value` at the first `=` that has whitespace on both sides.
/// Both parts are trimmed and must be non-empty.
bool
split_key_value(std::string_view line, std::string_view* key,
                std::string_view* value) noexcept;

/**
 * \brief Converts one raw group into a record.
 *
 * Lines that are not `key = value` are skipped. A later duplicate key
 * replaces the earlier value. Returns false when the group holds one
 * attribute or fewer (the record is dropped).
 */
bool
parse_mtl_group(const MtlRawGroup& group, MtlRecord* out);

/**
 * \brief Runs lexer + parser over \p text and appends records to \p out.
 *
 * Fails with \ref MtlParseStatus::NoMetadata when no record is produced.
 * On failure \p out may hold the records parsed before the error.
 */
MtlParseResult
parse_mtl_groups(std::string_view text, const MtlParseLimits& limits,
                 std::vector<MtlRecord>* out);

/// ASCII case-insensitive equality.
bool
iequals(std::string_view a, std::string_view b) noexcept;

/// Trims ASCII whitespace from both ends.
std::string_view
trim_ascii(std::string_view s) noexcept;

}  // namespace openmtl
