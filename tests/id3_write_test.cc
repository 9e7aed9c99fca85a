#include "metasplice/container_layout.h"
#include "metasplice/meta_write.h"
#include "metasplice/var_int.h"

#include "byte_io_internal.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace metasplice {
namespace {

    constexpr std::string_view kAudio("\xFF\xFB\x90\x00" "frame", 9);

    static void append_frame(std::vector<std::byte>* out, const char* id,
                             std::string_view payload)
    {
        detail::append_text(out, std::string_view(id, 4));
        // Small sizes read the same as synchsafe and plain u32.
        detail::append_u32be(out, static_cast<uint32_t>(payload.size()));
        detail::append_u16be(out, 0);
        detail::append_text(out, payload);
    }


    static std::vector<std::byte> make_tag(uint8_t major, uint8_t flags,
                                           const std::vector<std::byte>& body)
    {
        std::vector<std::byte> tag;
        detail::append_text(&tag, "ID3");
        detail::append_u8(&tag, major);
        detail::append_u8(&tag, 0);
        detail::append_u8(&tag, flags);
        EXPECT_TRUE(append_synchsafe32(static_cast<uint32_t>(body.size()),
                                       &tag));
        detail::append_span(&tag, body);
        return tag;
    }


    static std::string_view frame_payload(const std::vector<std::byte>& file,
                                          const Id3Frame& f)
    {
        return detail::as_text(std::span<const std::byte>(file).subspan(
            static_cast<size_t>(f.payload_offset), f.payload_size));
    }

}  // namespace

TEST(Id3Write, CreatesVersion23TagWhenMissing)
{
    std::vector<std::byte> in;
    detail::append_text(&in, kAudio);

    MetadataRequest request;
    request.set("Title", "Song");
    request.set("Date", "2024");
    std::vector<std::byte> out;
    ASSERT_EQ(write_id3_metadata(in, request, WriteOptions {}, &out).status,
              WriteStatus::Ok);

    Id3Tag tag;
    ASSERT_EQ(parse_id3_tag(out, 0, kDefaultMaxBlocks, &tag).status,
              WriteStatus::Ok);
    EXPECT_EQ(tag.major, 3U);
    EXPECT_EQ(tag.size, out.size() - kAudio.size());
    ASSERT_EQ(tag.frames.size(), 2U);
    EXPECT_EQ(tag.frames[0].id, fourcc('T', 'I', 'T', '2'));
    EXPECT_EQ(frame_payload(out, tag.frames[0]),
              std::string_view("\0Song\0", 6));
    EXPECT_EQ(tag.frames[1].id, fourcc('T', 'Y', 'E', 'R'));
    EXPECT_TRUE(detail::match(out, tag.size, kAudio.data(), kAudio.size()));
}


TEST(Id3Write, RewritesVersion24TagKeepingOtherFrames)
{
    std::vector<std::byte> body;
    append_frame(&body, "TIT2", std::string_view("\0Old", 4));
    append_frame(&body, "APIC", "picture-bytes");
    append_frame(&body, "TIT2", std::string_view("\0Dup", 4));
    body.resize(body.size() + 32U);
    std::vector<std::byte> in = make_tag(4, 0, body);
    const uint64_t old_tag_size = in.size();
    detail::append_text(&in, kAudio);

    MetadataRequest request;
    request.set("ID3:TIT2", "New");
    request.set("XMP:CreateDate", "2024-05-01");
    std::vector<std::byte> out;
    ASSERT_EQ(write_id3_metadata(in, request, WriteOptions {}, &out).status,
              WriteStatus::Ok);

    Id3Tag tag;
    ASSERT_EQ(parse_id3_tag(out, 0, kDefaultMaxBlocks, &tag).status,
              WriteStatus::Ok);
    EXPECT_EQ(tag.major, 4U);
    ASSERT_EQ(tag.frames.size(), 3U);
    EXPECT_EQ(tag.frames[0].id, fourcc('T', 'I', 'T', '2'));
    EXPECT_EQ(frame_payload(out, tag.frames[0]),
              std::string_view("\0New\0", 5));
    EXPECT_EQ(tag.frames[1].id, fourcc('A', 'P', 'I', 'C'));
    EXPECT_EQ(frame_payload(out, tag.frames[1]), "picture-bytes");
    EXPECT_EQ(tag.frames[2].id, fourcc('T', 'D', 'R', 'C'));

    // Padding is not carried over.
    EXPECT_LT(tag.size, old_tag_size);
    EXPECT_TRUE(detail::match(out, tag.size, kAudio.data(), kAudio.size()));
}


TEST(Id3Write, UnsynchronisedTagIsReplaced)
{
    std::vector<std::byte> body(20, std::byte { 0x41 });
    std::vector<std::byte> in = make_tag(4, 0x80, body);
    detail::append_text(&in, kAudio);

    MetadataRequest request;
    request.set("Artist", "Band");
    std::vector<std::byte> out;
    ASSERT_EQ(write_id3_metadata(in, request, WriteOptions {}, &out).status,
              WriteStatus::Ok);
    Id3Tag tag;
    ASSERT_EQ(parse_id3_tag(out, 0, kDefaultMaxBlocks, &tag).status,
              WriteStatus::Ok);
    EXPECT_EQ(tag.major, 3U);
    EXPECT_EQ(tag.flags, 0U);
    ASSERT_EQ(tag.frames.size(), 1U);
    EXPECT_EQ(tag.frames[0].id, fourcc('T', 'P', 'E', '1'));
    EXPECT_EQ(out.size(), tag.size + kAudio.size());
}


TEST(Id3Write, HeaderSizeIsSynchsafe)
{
    std::vector<std::byte> in;
    detail::append_text(&in, kAudio);
    MetadataRequest request;
    request.set("Title", std::string(300, 'a'));
    std::vector<std::byte> out;
    ASSERT_EQ(write_id3_metadata(in, request, WriteOptions {}, &out).status,
              WriteStatus::Ok);
    // TIT2 header + encoding + text + NUL.
    const uint32_t body = 10U + 1U + 300U + 1U;
    EXPECT_EQ(detail::u8(out[6]), 0U);
    EXPECT_EQ(detail::u8(out[7]), 0U);
    EXPECT_EQ(detail::u8(out[8]), body >> 7);
    EXPECT_EQ(detail::u8(out[9]), body & 0x7FU);
}


TEST(Id3Write, RejectsNonTextFrames)
{
    std::vector<std::byte> in;
    detail::append_text(&in, kAudio);
    MetadataRequest request;
    request.set("ID3:APIC", "x");
    std::vector<std::byte> out;
    const WriteResult r = write_id3_metadata(in, request, WriteOptions {},
                                             &out);
    EXPECT_EQ(r.status, WriteStatus::UnsupportedField);
    EXPECT_TRUE(out.empty());
}


TEST(Id3Write, TagPastEndOfFileIsMalformed)
{
    std::vector<std::byte> in = make_tag(3, 0, std::vector<std::byte>(40));
    in.resize(20);
    MetadataRequest request;
    request.set("Title", "x");
    std::vector<std::byte> out;
    EXPECT_EQ(write_id3_metadata(in, request, WriteOptions {}, &out).status,
              WriteStatus::Malformed);
    EXPECT_TRUE(out.empty());
}

}  // namespace metasplice
