#include "openmtl/mtl_text.h"

#include <utility>

namespace openmtl {
namespace {

    static constexpr std::string_view kGroupKeyword    = "GROUP";
    static constexpr std::string_view kEndGroupKeyword = "END_GROUP";
    static constexpr std::string_view kEndStatement    = "END";

    static bool is_space(char c) noexcept
    {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f'
               || c == '\v';
    }

    static char ascii_upper(char c) noexcept
    {
        return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
    }

    static MtlField* find_field(MtlRecord* rec, std::string_view key) noexcept
    {
        for (size_t i = 0; i < rec->fields.size(); ++i) {
            if (iequals(rec->fields[i].key, key)) {
                return &rec->fields[i];
            }
        }
        return nullptr;
    }

}  // namespace

bool
iequals(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (ascii_upper(a[i]) != ascii_upper(b[i])) {
            return false;
        }
    }
    return true;
}


std::string_view
trim_ascii(std::string_view s) noexcept
{
    size_t b = 0;
    size_t e = s.size();
    while (b < e && is_space(s[b])) {
        ++b;
    }
    while (e > b && is_space(s[e - 1])) {
        --e;
    }
    return s.substr(b, e - b);
}


MtlLineScanner::MtlLineScanner(std::string_view text) noexcept
    : text_(text)
{
}


bool
MtlLineScanner::next(std::string_view* line) noexcept
{
    if (pos_ >= text_.size()) {
        return false;
    }
    size_t end = pos_;
    while (end < text_.size() && text_[end] != '\n' && text_[end] != '\r') {
        ++end;
    }
    const std::string_view raw = text_.substr(pos_, end - pos_);

    pos_ = end;
    if (pos_ < text_.size() && text_[pos_] == '\r') {
        ++pos_;
    }
    if (pos_ < text_.size() && text_[pos_] == '\n') {
        ++pos_;
    }

    line_number_ += 1;
    *line = trim_ascii(raw);
    return true;
}


bool
match_keyword_statement(std::string_view line, std::string_view keyword,
                        std::string_view* rest) noexcept
{
    if (line.size() <= keyword.size()
        || line.substr(0, keyword.size()) != keyword) {
        return false;
    }
    size_t p = keyword.size();
    if (!is_space(line[p])) {
        return false;
    }
    while (p < line.size() && is_space(line[p])) {
        ++p;
    }
    if (p >= line.size() || line[p] != '=') {
        return false;
    }
    p += 1;
    if (p >= line.size() || !is_space(line[p])) {
        return false;
    }
    const std::string_view tail = trim_ascii(line.substr(p));
    if (tail.empty()) {
        return false;
    }
    *rest = tail;
    return true;
}


bool
split_key_value(std::string_view line, std::string_view* key,
                std::string_view* value) noexcept
{
    for (size_t i = 1; i + 1 < line.size(); ++i) {
        if (line[i] != '=' || !is_space(line[i - 1])
            || !is_space(line[i + 1])) {
            continue;
        }
        const std::string_view k = trim_ascii(line.substr(0, i));
        const std::string_view v = trim_ascii(line.substr(i + 1));
        if (k.empty() || v.empty()) {
            return false;
        }
        *key   = k;
        *value = v;
        return true;
    }
    return false;
}


MtlLexer::MtlLexer(MtlLineScanner* scanner,
                   const MtlParseLimits& limits) noexcept
    : scanner_(scanner)
    , limits_(limits)
{
}


MtlLexStatus
MtlLexer::fail(MtlParseStatus status) noexcept
{
    error_.status = status;
    error_.line   = scanner_->line_number();
    error_.groups = groups_closed_;
    done_         = true;
    return MtlLexStatus::Error;
}


MtlLexStatus
MtlLexer::next(MtlRawGroup* out)
{
    if (done_ || !scanner_) {
        return (error_.status == MtlParseStatus::Ok) ? MtlLexStatus::End
                                                     : MtlLexStatus::Error;
    }

    std::string_view line;
    while (scanner_->next(&line)) {
        if (limits_.max_lines != 0U
            && scanner_->line_number() > limits_.max_lines) {
            return fail(MtlParseStatus::LimitExceeded);
        }

        if (line == kEndStatement) {
            done_ = true;
            return MtlLexStatus::End;
        }

        std::string_view tag;
        if (match_keyword_statement(line, kEndGroupKeyword, &tag)) {
            if (stack_.empty()) {
                return fail(MtlParseStatus::UnbalancedGroup);
            }
            if (stack_.back().tag != tag) {
                return fail(MtlParseStatus::DivergingTags);
            }
            *out = std::move(stack_.back());
            stack_.pop_back();
            groups_closed_ += 1;
            return MtlLexStatus::Group;
        }

        if (match_keyword_statement(line, kGroupKeyword, &tag)) {
            if (limits_.max_group_depth != 0U
                && stack_.size() >= limits_.max_group_depth) {
                return fail(MtlParseStatus::LimitExceeded);
            }
            MtlRawGroup group;
            group.tag        = tag;
            group.first_line = scanner_->line_number();
            group.lines.push_back(line);
            stack_.push_back(std::move(group));
            continue;
        }

        if (stack_.empty()) {
            if (line.empty()) {
                continue;
            }
            return fail(MtlParseStatus::StrayStatement);
        }
        stack_.back().lines.push_back(line);
    }

    done_ = true;
    return MtlLexStatus::End;
}


const MtlField*
MtlRecord::find(std::string_view key) const noexcept
{
    for (size_t i = 0; i < fields.size(); ++i) {
        if (iequals(fields[i].key, key)) {
            return &fields[i];
        }
    }
    return nullptr;
}


bool
parse_mtl_group(const MtlRawGroup& group, MtlRecord* out)
{
    // The record is named by the typed GROUP value, so a quoted tag names
    // the same group as a bare one. The raw tag only matches END_GROUP.
    out->group.clear();
    append_value_string(cast_to_best(group.tag), &out->group);
    out->fields.clear();

    bool have_group = false;
    for (size_t i = 0; i < group.lines.size(); ++i) {
        std::string_view key;
        std::string_view raw;
        if (!split_key_value(group.lines[i], &key, &raw)) {
            continue;
        }
        if (iequals(key, kGroupKeyword)) {
            // Only the opening statement may set GROUP.
            if (have_group) {
                continue;
            }
            have_group = true;
        }
        MtlValue value = cast_to_best(raw);
        if (MtlField* existing = find_field(out, key)) {
            existing->value = std::move(value);
            continue;
        }
        MtlField field;
        field.key.assign(key.data(), key.size());
        field.value = std::move(value);
        out->fields.push_back(std::move(field));
    }
    return out->fields.size() > 1;
}


MtlParseResult
parse_mtl_groups(std::string_view text, const MtlParseLimits& limits,
                 std::vector<MtlRecord>* out)
{
    MtlParseResult res;

    MtlLineScanner scanner(text);
    MtlLexer lexer(&scanner, limits);

    MtlRawGroup group;
    for (;;) {
        const MtlLexStatus st = lexer.next(&group);
        if (st == MtlLexStatus::Error) {
            const uint32_t records = res.records;
            res                    = lexer.error();
            res.records            = records;
            return res;
        }
        if (st == MtlLexStatus::End) {
            break;
        }

        MtlRecord rec;
        if (!parse_mtl_group(group, &rec)) {
            continue;
        }
        if (limits.max_records != 0U && res.records >= limits.max_records) {
            res.status = MtlParseStatus::LimitExceeded;
            res.line   = group.first_line;
            res.groups = lexer.groups_closed();
            return res;
        }
        out->push_back(std::move(rec));
        res.records += 1;
    }

    res.groups = lexer.groups_closed();
    if (res.records == 0U) {
        res.status = MtlParseStatus::NoMetadata;
    }
    return res;
}

}  // namespace openmtl
