#include "openmtl/mtl_store.h"

#include "openmtl/mapped_file.h"

#include <utility>

namespace openmtl {
namespace {

    static constexpr std::string_view kGroupKey = "GROUP";

}  // namespace

MtlGroupView::Iterator::Iterator(const MtlField* pos,
                                 const MtlField* end) noexcept
    : pos_(pos)
    , end_(end)
{
    skip_group_key();
}


MtlGroupView::Iterator&
MtlGroupView::Iterator::operator++() noexcept
{
    ++pos_;
    skip_group_key();
    return *this;
}


void
MtlGroupView::Iterator::skip_group_key() noexcept
{
    while (pos_ != end_ && iequals(pos_->key, kGroupKey)) {
        ++pos_;
    }
}


MtlGroupView::MtlGroupView(const MtlRecord* record) noexcept
    : record_(record)
{
}


MtlGroupView::Iterator
MtlGroupView::begin() const noexcept
{
    if (!record_) {
        return Iterator();
    }
    const MtlField* first = record_->fields.data();
    return Iterator(first, first + record_->fields.size());
}


MtlGroupView::Iterator
MtlGroupView::end() const noexcept
{
    if (!record_) {
        return Iterator();
    }
    const MtlField* last = record_->fields.data() + record_->fields.size();
    return Iterator(last, last);
}


size_t
MtlGroupView::size() const noexcept
{
    size_t n = 0;
    for (Iterator it = begin(); it != end(); ++it) {
        n += 1;
    }
    return n;
}


MtlStore::MtlStore(std::string path)
    : path_(std::move(path))
{
}


void
MtlStore::set_path(std::string path)
{
    path_ = std::move(path);
    records_.clear();
}


void
MtlStore::clear() noexcept
{
    records_.clear();
}


MtlParseResult
MtlStore::parse(const MtlParseLimits& limits)
{
    records_.clear();

    MtlParseResult res;
    MappedFile file;
    const MappedFileStatus st = file.open(path_.c_str(),
                                          limits.max_file_bytes);
    if (st != MappedFileStatus::Ok) {
        res.status = (st == MappedFileStatus::TooLarge)
                         ? MtlParseStatus::LimitExceeded
                         : MtlParseStatus::ReadFailed;
        return res;
    }
    return parse_text(file.text(), limits);
}


MtlParseResult
MtlStore::parse_text(std::string_view text, const MtlParseLimits& limits)
{
    records_.clear();

    std::vector<MtlRecord> parsed;
    const MtlParseResult res = parse_mtl_groups(text, limits, &parsed);
    if (res.status != MtlParseStatus::Ok) {
        return res;
    }

    records_.reserve(parsed.size());
    for (size_t i = 0; i < parsed.size(); ++i) {
        insert(std::move(parsed[i]));
    }
    return res;
}


void
MtlStore::insert(MtlRecord&& record)
{
    const int32_t idx = index_of(record.group);
    if (idx >= 0) {
        records_[static_cast<size_t>(idx)] = std::move(record);
        return;
    }
    records_.push_back(std::move(record));
}


int32_t
MtlStore::index_of(std::string_view group) const noexcept
{
    for (size_t i = 0; i < records_.size(); ++i) {
        if (iequals(records_[i].group, group)) {
            return static_cast<int32_t>(i);
        }
    }
    return -1;
}


const MtlRecord*
MtlStore::get(std::string_view group) const noexcept
{
    const int32_t idx = index_of(group);
    return (idx >= 0) ? &records_[static_cast<size_t>(idx)] : nullptr;
}


const MtlValue*
MtlStore::get(std::string_view group, std::string_view key) const noexcept
{
    const MtlRecord* rec = get(group);
    if (!rec) {
        return nullptr;
    }
    const MtlField* field = rec->find(key);
    return field ? &field->value : nullptr;
}


MtlValue
MtlStore::get(std::string_view group, std::string_view key,
              const MtlValue& fallback) const
{
    const MtlValue* v = get(group, key);
    return v ? *v : fallback;
}


MtlGroupResult
MtlStore::iter_group(std::string_view group) const noexcept
{
    MtlGroupResult res;
    const MtlRecord* rec = get(group);
    if (!rec) {
        res.status = MtlGroupStatus::GroupNotFound;
        return res;
    }
    res.fields = MtlGroupView(rec);
    return res;
}


bool
MtlStore::contains(std::string_view group) const noexcept
{
    return index_of(group) >= 0;
}


std::span<const MtlRecord>
MtlStore::records() const noexcept
{
    return std::span<const MtlRecord>(records_.data(), records_.size());
}

}  // namespace openmtl
