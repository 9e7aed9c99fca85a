#include "metasplice/block_build.h"
#include "metasplice/block_fields.h"
#include "metasplice/container_layout.h"

#include "byte_io_internal.h"

#include <gtest/gtest.h>

#include <span>
#include <string>
#include <vector>

namespace metasplice {

TEST(BlockFields, VorbisCommentsRoundTrip)
{
    VorbisComments in;
    in.vendor = "libVorbis";
    in.fields.push_back({ "TITLE", "a=b" });
    in.fields.push_back({ "EMPTY", "" });

    std::vector<std::byte> body;
    ASSERT_EQ(build_vorbis_comments(in, VorbisCommentFraming::FlacBlock,
                                    &body),
              WriteStatus::Ok);

    VorbisComments out;
    ASSERT_EQ(parse_vorbis_comments(body, &out), WriteStatus::Ok);
    EXPECT_EQ(out.vendor, "libVorbis");
    ASSERT_EQ(out.fields.size(), 2U);
    EXPECT_EQ(out.fields[0].name, "TITLE");
    EXPECT_EQ(out.fields[0].value, "a=b");
    EXPECT_EQ(out.fields[1].value, "");
}


TEST(BlockFields, VorbisCountBeyondBodyIsMalformed)
{
    std::vector<std::byte> body;
    detail::append_u32le(&body, 0);
    detail::append_u32le(&body, 1000);
    VorbisComments out;
    EXPECT_EQ(parse_vorbis_comments(body, &out), WriteStatus::Malformed);
}


TEST(BlockFields, AsfObjects)
{
    AsfContentDescription cd;
    cd.title     = "T\xC3\xADtulo";
    cd.copyright = "(c)";
    std::vector<std::byte> object;
    ASSERT_EQ(build_asf_content_description(cd, &object), WriteStatus::Ok);
    AsfContentDescription back;
    ASSERT_EQ(parse_asf_content_description(object, &back), WriteStatus::Ok);
    EXPECT_EQ(back.title, cd.title);
    EXPECT_EQ(back.copyright, "(c)");
    EXPECT_EQ(back.author, "");

    std::vector<AsfDescriptor> descriptors;
    descriptors.push_back(make_asf_string_descriptor("WM/Genre", "Jazz"));
    AsfDescriptor dword;
    dword.name  = "WM/TrackNumber";
    dword.type  = static_cast<uint16_t>(AsfValueType::Dword);
    dword.value = { std::byte { 7 }, std::byte { 0 }, std::byte { 0 },
                    std::byte { 0 } };
    descriptors.push_back(dword);
    object.clear();
    ASSERT_EQ(build_asf_extended_content_description(descriptors, &object),
              WriteStatus::Ok);
    std::vector<AsfDescriptor> parsed;
    ASSERT_EQ(parse_asf_extended_content_description(object, &parsed),
              WriteStatus::Ok);
    ASSERT_EQ(parsed.size(), 2U);
    EXPECT_EQ(parsed[0].name, "WM/Genre");
    EXPECT_EQ(parsed[1].type, static_cast<uint16_t>(AsfValueType::Dword));
    EXPECT_EQ(parsed[1].value, dword.value);
}


TEST(BlockFields, RiffInfoEntries)
{
    std::vector<std::byte> list;
    detail::append_text(&list, "INFO");
    detail::append_text(&list, "INAM");
    detail::append_u32le(&list, 3);
    detail::append_text(&list, std::string_view("ab\0\0", 4));
    detail::append_text(&list, "ICMT");
    detail::append_u32le(&list, 2);
    detail::append_text(&list, "hi");

    std::vector<RiffInfoEntry> entries;
    ASSERT_EQ(parse_riff_info_list(list, &entries), WriteStatus::Ok);
    ASSERT_EQ(entries.size(), 2U);
    EXPECT_EQ(entries[0].id, fourcc('I', 'N', 'A', 'M'));
    EXPECT_EQ(entries[0].text, "ab");
    EXPECT_EQ(entries[1].text, "hi");

    std::vector<std::byte> other;
    detail::append_text(&other, "adtl");
    EXPECT_EQ(parse_riff_info_list(other, &entries), WriteStatus::FormatError);
}


TEST(BlockFields, PhotoshopResources)
{
    std::vector<std::byte> payload;
    detail::append_text(&payload, std::string_view("Photoshop 3.0\0", 14));
    detail::append_text(&payload, "8BIM");
    detail::append_u16be(&payload, 0x0404);
    // Pascal name "ab": length byte + 2 chars, padded to 4.
    detail::append_u8(&payload, 2);
    detail::append_text(&payload, "ab");
    detail::append_u8(&payload, 0);
    detail::append_u32be(&payload, 3);
    detail::append_text(&payload, "xyz");
    detail::append_u8(&payload, 0);
    detail::append_text(&payload, "8BIM");
    detail::append_u16be(&payload, 0x0425);
    detail::append_u16be(&payload, 0);
    detail::append_u32be(&payload, 2);
    detail::append_text(&payload, "ok");

    std::vector<IrbResource> resources;
    ASSERT_EQ(parse_jpeg_irb_resources(payload, &resources), WriteStatus::Ok);
    ASSERT_EQ(resources.size(), 2U);
    EXPECT_EQ(resources[0].id, 0x0404U);
    EXPECT_EQ(resources[0].data.size(), 3U);
    EXPECT_EQ(resources[1].id, 0x0425U);

    std::vector<std::byte> segment;
    ASSERT_EQ(build_jpeg_irb_segment(resources, &segment), WriteStatus::Ok);
    std::vector<IrbResource> again;
    ASSERT_EQ(parse_jpeg_irb_resources(
                  std::span<const std::byte>(segment).subspan(4), &again),
              WriteStatus::Ok);
    ASSERT_EQ(again.size(), 2U);
    EXPECT_EQ(again[1].data, resources[1].data);
}


TEST(BlockFields, AfcpRecords)
{
    const AfcpField fields[] = { { "IPTC", "caption" }, { "Note", "" } };
    std::vector<std::byte> segment;
    ASSERT_EQ(build_jpeg_afcp_segment(fields, &segment), WriteStatus::Ok);

    std::vector<AfcpField> parsed;
    ASSERT_EQ(parse_jpeg_afcp_fields(
                  std::span<const std::byte>(segment).subspan(4), &parsed),
              WriteStatus::Ok);
    ASSERT_EQ(parsed.size(), 2U);
    EXPECT_EQ(parsed[0].key, "IPTC");
    EXPECT_EQ(parsed[0].value, "caption");
    EXPECT_EQ(parsed[1].value, "");

    std::vector<std::byte> bad;
    detail::append_text(&bad, "AFCP");
    detail::append_u32be(&bad, 0);
    detail::append_u16be(&bad, 40);
    EXPECT_EQ(parse_jpeg_afcp_fields(bad, &parsed), WriteStatus::Malformed);
}

}  // namespace metasplice
