#include "metasplice/splice.h"

#include "byte_io_internal.h"

#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <vector>

namespace metasplice {
namespace {

    static std::vector<std::byte> bytes_of(std::string_view s)
    {
        const std::span<const std::byte> b = detail::as_bytes(s);
        return std::vector<std::byte>(b.begin(), b.end());
    }


    static std::string text_of(const std::vector<std::byte>& b)
    {
        return std::string(detail::as_text(b));
    }

}  // namespace

TEST(Splice, EmptyEditCopiesInput)
{
    const std::vector<std::byte> base = bytes_of("abcdef");
    SpliceEdit edit;
    std::vector<std::byte> out;
    ASSERT_EQ(commit_splice(base, edit, &out), SpliceStatus::Ok);
    EXPECT_EQ(out, base);
    EXPECT_EQ(edit.size_delta(), 0);
}


TEST(Splice, OpsApplyInOffsetOrder)
{
    const std::vector<std::byte> base = bytes_of("0123456789");
    SpliceEdit edit;
    edit.replace(8, 2, detail::as_bytes("XYZ"));
    edit.remove(2, 3);
    edit.insert(0, detail::as_bytes("<"));
    edit.insert(10, detail::as_bytes(">"));

    std::vector<std::byte> out;
    ASSERT_EQ(commit_splice(base, edit, &out), SpliceStatus::Ok);
    EXPECT_EQ(text_of(out), "<01567XYZ>");
    EXPECT_EQ(edit.size_delta(), 0);
}


TEST(Splice, InsertsAtOneOffsetKeepRecordingOrder)
{
    const std::vector<std::byte> base = bytes_of("abcd");
    SpliceEdit edit;
    edit.remove(2, 2);
    edit.insert(2, detail::as_bytes("1"));
    edit.insert(2, detail::as_bytes("2"));

    std::vector<std::byte> out;
    ASSERT_EQ(commit_splice(base, edit, &out), SpliceStatus::Ok);
    EXPECT_EQ(text_of(out), "ab12");
}


TEST(Splice, OverlapAndRangeErrors)
{
    const std::vector<std::byte> base = bytes_of("abcdef");
    std::vector<std::byte> out = bytes_of("stale");

    SpliceEdit overlap;
    overlap.remove(1, 3);
    overlap.replace(2, 1, detail::as_bytes("x"));
    EXPECT_EQ(commit_splice(base, overlap, &out), SpliceStatus::Overlap);
    EXPECT_TRUE(out.empty());

    SpliceEdit range;
    range.remove(4, 3);
    out = bytes_of("stale");
    EXPECT_EQ(commit_splice(base, range, &out), SpliceStatus::OutOfRange);
    EXPECT_TRUE(out.empty());
}


TEST(Splice, MapOffset)
{
    SpliceEdit edit;
    edit.insert(4, detail::as_bytes("12345"));
    edit.remove(10, 6);
    edit.replace(20, 2, detail::as_bytes("abcd"));

    EXPECT_EQ(edit.map_offset(0), 0U);
    EXPECT_EQ(edit.map_offset(3), 3U);
    // Inserts exactly at the offset shift it.
    EXPECT_EQ(edit.map_offset(4), 9U);
    EXPECT_EQ(edit.map_offset(16), 15U);
    EXPECT_EQ(edit.map_offset(22), 23U);
    EXPECT_EQ(edit.map_offset(100), 101U);
}


TEST(Splice, BytesOutsideOpsAreUntouched)
{
    std::vector<std::byte> base(300);
    for (size_t i = 0; i < base.size(); ++i) {
        base[i] = std::byte { static_cast<uint8_t>(i) };
    }
    SpliceEdit edit;
    edit.replace(100, 10, detail::as_bytes("abc"));

    std::vector<std::byte> out;
    ASSERT_EQ(commit_splice(base, edit, &out), SpliceStatus::Ok);
    ASSERT_EQ(out.size(), base.size() - 7U);
    for (size_t i = 0; i < 100; ++i) {
        EXPECT_EQ(out[i], base[i]);
    }
    for (size_t i = 110; i < base.size(); ++i) {
        EXPECT_EQ(out[i - 7U], base[i]);
    }
}

}  // namespace metasplice
