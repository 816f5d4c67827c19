#include "openmtl/mtl_store.h"

#include "fuzztest/fuzztest.h"
#include "gtest/gtest.h"

#include <cstdint>
#include <string>
#include <vector>

namespace openmtl {

struct Statement final {
    uint8_t kind  = 0;
    uint8_t name  = 0;
    int32_t value = 0;
};

static std::string
group_name(uint8_t name)
{
    return "G" + std::to_string(static_cast<unsigned>(name % 4U));
}


static std::string
render(const std::vector<Statement>& statements)
{
    std::string text;
    std::vector<std::string> open;
    for (const Statement& s : statements) {
        switch (s.kind % 4U) {
        case 0:
            open.push_back(group_name(s.name));
            text += "GROUP = " + open.back() + "\n";
            break;
        case 1:
            if (!open.empty()) {
                text += "END_GROUP = " + open.back() + "\n";
                open.pop_back();
            }
            break;
        case 2:
            if (!open.empty()) {
                text += "K" + std::to_string(static_cast<unsigned>(s.name % 8U))
                        + " = " + std::to_string(s.value) + "\n";
            }
            break;
        default:
            if (!open.empty()) {
                text += "T = \"v" + std::to_string(s.value) + "\"\n";
            }
            break;
        }
    }
    while (!open.empty()) {
        text += "END_GROUP = " + open.back() + "\n";
        open.pop_back();
    }
    text += "END\n";
    return text;
}


static void
balanced_text_parses_consistently(const std::vector<Statement>& statements)
{
    const std::string text = render(statements);

    MtlStore a;
    MtlStore b;
    const MtlParseResult ra = a.parse_text(text);
    const MtlParseResult rb = b.parse_text(text);
    ASSERT_EQ(ra.status, rb.status);
    if (ra.status != MtlParseStatus::Ok) {
        ASSERT_EQ(ra.status, MtlParseStatus::NoMetadata);
        ASSERT_EQ(a.group_count(), 0U);
        return;
    }

    ASSERT_EQ(a.group_count(), b.group_count());
    for (const MtlRecord& rec : a.records()) {
        const MtlGroupResult it = a.iter_group(rec.group);
        ASSERT_EQ(it.status, MtlGroupStatus::Ok);
        ASSERT_EQ(it.fields.size() + 1U, rec.fields.size());
        for (const MtlField& f : it.fields) {
            const MtlValue* v = b.get(rec.group, f.key);
            ASSERT_NE(v, nullptr);
            ASSERT_TRUE(*v == f.value);
        }
    }

    // Re-parsing the same text replaces the records.
    const size_t before = a.group_count();
    ASSERT_EQ(a.parse_text(text).status, MtlParseStatus::Ok);
    ASSERT_EQ(a.group_count(), before);
}


FUZZ_TEST(MtlStoreFuzz, balanced_text_parses_consistently)
    .WithDomains(fuzztest::VectorOf(
                     fuzztest::StructOf<Statement>(
                         fuzztest::Arbitrary<uint8_t>(),
                         fuzztest::Arbitrary<uint8_t>(),
                         fuzztest::Arbitrary<int32_t>()))
                     .WithMaxSize(64));

}  // namespace openmtl
