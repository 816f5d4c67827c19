#pragma once

#include "openmtl/mtl_text.h"
#include "openmtl/mtl_value.h"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file mtl_store.h
 * \brief Parsed MTL records indexed by group name.
 */

namespace openmtl {

/// Status of \ref MtlStore::iter_group.
enum class MtlGroupStatus : uint8_t {
    Ok,
    /// The requested group is not present in the store.
    GroupNotFound,
};

/**
 * \brief Restartable view over the fields of one record, skipping `GROUP`.
 *
 * The view borrows from the owning \ref MtlStore and is invalidated by
 * \ref MtlStore::parse, \ref MtlStore::set_path and \ref MtlStore::clear.
 */
class MtlGroupView final {
public:
    class Iterator final {
    public:
        Iterator() noexcept = default;
        Iterator(const MtlField* pos, const MtlField* end) noexcept;

        const MtlField& operator*() const noexcept { return *pos_; }
        const MtlField* operator->() const noexcept { return pos_; }
        Iterator& operator++() noexcept;
        bool operator==(const Iterator& other) const noexcept
        {
            return pos_ == other.pos_;
        }
        bool operator!=(const Iterator& other) const noexcept
        {
            return pos_ != other.pos_;
        }

    private:
        void skip_group_key() noexcept;

        const MtlField* pos_ = nullptr;
        const MtlField* end_ = nullptr;
    };

    MtlGroupView() noexcept = default;
    explicit MtlGroupView(const MtlRecord* record) noexcept;

    Iterator begin() const noexcept;
    Iterator end() const noexcept;
    /// Number of fields produced (excluding `GROUP`).
    size_t size() const noexcept;
    bool empty() const noexcept { return size() == 0U; }

private:
    const MtlRecord* record_ = nullptr;
};

/// Result of \ref MtlStore::iter_group: a view or an explicit error.
struct MtlGroupResult final {
    MtlGroupStatus status = MtlGroupStatus::Ok;
    MtlGroupView fields;
};

/**
 * \brief Owns the records parsed from one MTL file.
 *
 * Lifecycle:
 * - Configure the source with the constructor or \ref set_path.
 * - \ref parse replaces all records with a fresh parse (never merges).
 * - Treat as read-only afterwards; not safe for concurrent \ref parse.
 *
 * Group names are unique. When a file repeats a group name the later record
 * replaces the earlier one (keeping the earlier position in \ref records).
 */
class MtlStore final {
public:
    MtlStore() = default;
    explicit MtlStore(std::string path);

    /// Sets the metadata file path and drops all parsed records.
    void set_path(std::string path);
    const std::string& path() const noexcept { return path_; }

    /// Parses the file at \ref path (memory mapped, size-capped).
    MtlParseResult parse(const MtlParseLimits& limits = MtlParseLimits {});
    /// Parses \p text with the same pipeline as \ref parse.
    MtlParseResult parse_text(std::string_view text,
                              const MtlParseLimits& limits
                              = MtlParseLimits {});

    /// Drops all records (the path is kept).
    void clear() noexcept;

    /// Returns the record for \p group (case-insensitive), or null.
    const MtlRecord* get(std::string_view group) const noexcept;
    /// Returns the value of \p key in \p group (both case-insensitive), or null.
    const MtlValue* get(std::string_view group,
                        std::string_view key) const noexcept;
    /// Returns a copy of the value, or \p fallback when group or key is absent.
    MtlValue get(std::string_view group, std::string_view key,
                 const MtlValue& fallback) const;

    /// Fields of \p group excluding `GROUP`; \ref MtlGroupStatus::GroupNotFound
    /// when the group is absent.
    MtlGroupResult iter_group(std::string_view group) const noexcept;

    bool contains(std::string_view group) const noexcept;
    std::span<const MtlRecord> records() const noexcept;
    size_t group_count() const noexcept { return records_.size(); }

private:
    void insert(MtlRecord&& record);
    int32_t index_of(std::string_view group) const noexcept;

    std::string path_;
    std::vector<MtlRecord> records_;
};

}  // namespace openmtl
