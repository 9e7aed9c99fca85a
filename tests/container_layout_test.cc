#include "metasplice/container_layout.h"
#include "metasplice/var_int.h"

#include "byte_io_internal.h"

#include <gtest/gtest.h>

#include <string_view>
#include <vector>

namespace metasplice {
namespace {

    constexpr uint32_t kInfoId = 0x1549A966U;

    using detail::append_fourcc;
    using detail::append_text;
    using detail::append_u16be;
    using detail::append_u32be;
    using detail::append_u32le;
    using detail::append_u64le;
    using detail::append_u8;

    static void append_jpeg_segment(std::vector<std::byte>* out,
                                    uint8_t marker, std::string_view payload)
    {
        append_u8(out, 0xFF);
        append_u8(out, marker);
        append_u16be(out, static_cast<uint16_t>(payload.size() + 2U));
        append_text(out, payload);
    }


    static void append_riff_chunk(std::vector<std::byte>* out, uint32_t id,
                                  std::string_view data)
    {
        append_fourcc(out, id);
        append_u32le(out, static_cast<uint32_t>(data.size()));
        append_text(out, data);
        if ((data.size() & 1U) != 0U) {
            append_u8(out, 0);
        }
    }


    static void append_asf_object(std::vector<std::byte>* out,
                                  const AsfGuid& guid, uint64_t payload)
    {
        out->insert(out->end(), guid.begin(), guid.end());
        append_u64le(out, kAsfObjectHeaderSize + payload);
        for (uint64_t i = 0; i < payload; ++i) {
            append_u8(out, 0);
        }
    }

}  // namespace

TEST(JpegLayout, ClassifiesSegmentsAndStopsAtScan)
{
    std::vector<std::byte> file;
    append_u8(&file, 0xFF);
    append_u8(&file, 0xD8);
    append_jpeg_segment(&file, 0xE0, std::string_view("JFIF\0\x01\x02", 7));
    append_jpeg_segment(&file, 0xE1, std::string_view("Exif\0\0MM", 8));
    append_jpeg_segment(&file, 0xE1,
                        std::string_view("http://ns.adobe.com/xap/1.0/\0<x/>",
                                         33));
    append_jpeg_segment(&file, 0xE2,
                        std::string_view("ICC_PROFILE\0\x01\x02"
                                         "abc",
                                         17));
    append_jpeg_segment(&file, 0xFE, "hello");
    const uint64_t sos = file.size();
    append_jpeg_segment(&file, 0xDA, "scan");
    append_u8(&file, 0xFF);
    append_u8(&file, 0xD9);

    JpegLayout layout;
    const WriteResult r = parse_jpeg_layout(file, kDefaultMaxBlocks, &layout);
    ASSERT_EQ(r.status, WriteStatus::Ok);
    ASSERT_EQ(layout.segments.size(), 5U);
    EXPECT_EQ(layout.segments[0].kind, JpegSegmentKind::Jfif);
    EXPECT_EQ(layout.segments[0].offset, 2U);
    EXPECT_EQ(layout.segments[1].kind, JpegSegmentKind::Exif);
    EXPECT_EQ(layout.segments[2].kind, JpegSegmentKind::Xmp);
    EXPECT_EQ(layout.segments[3].kind, JpegSegmentKind::Icc);
    EXPECT_EQ(layout.segments[3].icc_seq, 1U);
    EXPECT_EQ(layout.segments[3].icc_total, 2U);
    EXPECT_EQ(layout.segments[4].kind, JpegSegmentKind::Comment);
    EXPECT_EQ(layout.scan_offset, sos);
}


TEST(JpegLayout, RejectsMissingSoiAndOverrun)
{
    std::vector<std::byte> file;
    append_text(&file, "GIF89a");
    JpegLayout layout;
    EXPECT_EQ(parse_jpeg_layout(file, kDefaultMaxBlocks, &layout).status,
              WriteStatus::FormatError);

    file.clear();
    append_u8(&file, 0xFF);
    append_u8(&file, 0xD8);
    append_u8(&file, 0xFF);
    append_u8(&file, 0xE1);
    append_u16be(&file, 100);
    append_text(&file, "short");
    const WriteResult r = parse_jpeg_layout(file, kDefaultMaxBlocks, &layout);
    EXPECT_EQ(r.status, WriteStatus::Malformed);
    EXPECT_EQ(r.offset, 2U);
}


TEST(PngLayout, WalksChunksToIend)
{
    std::vector<std::byte> file(kPngSignature.begin(), kPngSignature.end());
    append_u32be(&file, 13);
    append_fourcc(&file, fourcc('I', 'H', 'D', 'R'));
    file.resize(file.size() + 13U + 4U);
    append_u32be(&file, 0);
    append_fourcc(&file, fourcc('I', 'E', 'N', 'D'));
    append_u32be(&file, 0xAE426082U);
    const uint64_t iend_end = file.size();
    append_text(&file, "trailing");

    PngLayout layout;
    ASSERT_EQ(parse_png_layout(file, kDefaultMaxBlocks, &layout).status,
              WriteStatus::Ok);
    ASSERT_EQ(layout.chunks.size(), 2U);
    EXPECT_EQ(layout.chunks[0].offset, 8U);
    EXPECT_EQ(layout.chunks[0].total_size(), 25U);
    EXPECT_EQ(layout.end, iend_end);
}


TEST(RiffLayout, ChunksWithPadAndListType)
{
    std::vector<std::byte> body;
    append_fourcc(&body, fourcc('W', 'A', 'V', 'E'));
    append_riff_chunk(&body, fourcc('f', 'm', 't', ' '), "0123456789abcdef");
    append_riff_chunk(&body, fourcc('L', 'I', 'S', 'T'), "INFOabc");
    append_riff_chunk(&body, fourcc('d', 'a', 't', 'a'), "xy");

    std::vector<std::byte> file;
    append_fourcc(&file, fourcc('R', 'I', 'F', 'F'));
    append_u32le(&file, static_cast<uint32_t>(body.size()));
    file.insert(file.end(), body.begin(), body.end());

    RiffLayout layout;
    ASSERT_EQ(parse_riff_layout(file, kDefaultMaxBlocks, &layout).status,
              WriteStatus::Ok);
    EXPECT_EQ(layout.form, fourcc('W', 'A', 'V', 'E'));
    EXPECT_EQ(layout.end, file.size());
    ASSERT_EQ(layout.chunks.size(), 3U);
    EXPECT_EQ(layout.chunks[1].list_type, fourcc('I', 'N', 'F', 'O'));
    EXPECT_EQ(layout.chunks[1].data_size, 7U);
    EXPECT_EQ(layout.chunks[1].size, 16U);
    EXPECT_EQ(layout.chunks[2].offset, 12U + 24U + 16U);
}


TEST(RiffLayout, ChunkPastFormEndIsMalformed)
{
    std::vector<std::byte> file;
    append_fourcc(&file, fourcc('R', 'I', 'F', 'F'));
    append_u32le(&file, 16);
    append_fourcc(&file, fourcc('W', 'A', 'V', 'E'));
    append_fourcc(&file, fourcc('d', 'a', 't', 'a'));
    append_u32le(&file, 100);
    append_u32le(&file, 0);

    RiffLayout layout;
    EXPECT_EQ(parse_riff_layout(file, kDefaultMaxBlocks, &layout).status,
              WriteStatus::Malformed);
}


TEST(OggLayout, ParsesPagesAndLacing)
{
    std::vector<std::byte> file;
    for (uint32_t seq = 0; seq < 2; ++seq) {
        append_text(&file, "OggS");
        append_u8(&file, 0);
        append_u8(&file, seq == 0 ? 0x02 : 0x01);
        append_u64le(&file, 0);
        append_u32le(&file, 77);
        append_u32le(&file, seq);
        append_u32le(&file, 0);
        append_u8(&file, 2);
        append_u8(&file, 255);
        append_u8(&file, 5);
        file.resize(file.size() + 260U);
    }

    std::vector<OggPage> pages;
    ASSERT_EQ(parse_ogg_pages(file, kDefaultMaxBlocks, &pages).status,
              WriteStatus::Ok);
    ASSERT_EQ(pages.size(), 2U);
    EXPECT_EQ(pages[0].serial, 77U);
    EXPECT_EQ(pages[0].payload_size, 260U);
    EXPECT_EQ(pages[0].size, 27U + 2U + 260U);
    EXPECT_FALSE(pages[0].continued());
    EXPECT_TRUE(pages[1].continued());
    EXPECT_EQ(pages[1].offset, pages[0].size);

    const std::span<const uint8_t> lacing = ogg_page_lacing(file, pages[1]);
    ASSERT_EQ(lacing.size(), 2U);
    EXPECT_EQ(lacing[0], 255U);

    EXPECT_EQ(parse_ogg_pages(file, 1, &pages).status,
              WriteStatus::LimitExceeded);
}


TEST(FlacLayout, FindsLastBlockAfterId3)
{
    std::vector<std::byte> file;
    append_text(&file, "ID3");
    append_u8(&file, 3);
    append_u8(&file, 0);
    append_u8(&file, 0);
    ASSERT_TRUE(append_synchsafe32(4, &file));
    append_u32be(&file, 0);
    append_text(&file, "fLaC");
    append_u8(&file, 0x00);
    ASSERT_TRUE(append_u24be(34, &file));
    file.resize(file.size() + 34U);
    append_u8(&file, 0x81);
    ASSERT_TRUE(append_u24be(3, &file));
    append_text(&file, "padAUDIO");

    FlacLayout layout;
    ASSERT_EQ(parse_flac_layout(file, kDefaultMaxBlocks, &layout).status,
              WriteStatus::Ok);
    EXPECT_EQ(layout.signature_offset, 14U);
    ASSERT_EQ(layout.blocks.size(), 2U);
    EXPECT_EQ(layout.blocks[0].type, 0U);
    EXPECT_EQ(layout.blocks[1].type, 1U);
    EXPECT_TRUE(layout.blocks[1].last);
    EXPECT_EQ(layout.audio_offset, file.size() - 5U);
}


TEST(FlacLayout, MissingLastFlagIsMalformed)
{
    std::vector<std::byte> file;
    append_text(&file, "fLaC");
    append_u8(&file, 0x00);
    ASSERT_TRUE(append_u24be(2, &file));
    append_text(&file, "ab");

    FlacLayout layout;
    EXPECT_EQ(parse_flac_layout(file, kDefaultMaxBlocks, &layout).status,
              WriteStatus::Malformed);
}


TEST(Id3Layout, ListsFramesAndStopsAtPadding)
{
    std::vector<std::byte> frames;
    append_fourcc(&frames, fourcc('T', 'I', 'T', '2'));
    append_u32be(&frames, 4);
    append_u16be(&frames, 0);
    append_text(&frames, std::string_view("\0abc", 4));
    frames.resize(frames.size() + 6U);

    std::vector<std::byte> file;
    append_text(&file, "ID3");
    append_u8(&file, 3);
    append_u8(&file, 0);
    append_u8(&file, 0);
    ASSERT_TRUE(append_synchsafe32(static_cast<uint32_t>(frames.size()),
                                   &file));
    file.insert(file.end(), frames.begin(), frames.end());

    Id3Tag tag;
    ASSERT_EQ(parse_id3_tag(file, 0, kDefaultMaxBlocks, &tag).status,
              WriteStatus::Ok);
    EXPECT_EQ(tag.major, 3U);
    EXPECT_EQ(tag.size, file.size());
    ASSERT_EQ(tag.frames.size(), 1U);
    EXPECT_EQ(tag.frames[0].id, fourcc('T', 'I', 'T', '2'));
    EXPECT_EQ(tag.frames[0].payload_size, 4U);
}


TEST(AsfLayout, ResolvesReservedWidthByTiling)
{
    for (uint8_t width : { uint8_t { 2 }, uint8_t { 4 } }) {
        std::vector<std::byte> children;
        append_asf_object(&children, kAsfFileProperties, 80);
        append_asf_object(&children, kAsfContentDescription, 10);

        std::vector<std::byte> file(kAsfHeaderObject.begin(),
                                    kAsfHeaderObject.end());
        append_u64le(&file, 28U + width + children.size());
        append_u32le(&file, 2);
        for (uint8_t i = 0; i < width; ++i) {
            append_u8(&file, i == 0 ? 1 : 2);
        }
        file.insert(file.end(), children.begin(), children.end());

        AsfHeader header;
        ASSERT_EQ(parse_asf_header(file, kDefaultMaxBlocks, &header).status,
                  WriteStatus::Ok);
        EXPECT_EQ(header.reserved_width, width);
        EXPECT_EQ(header.children_offset, 28U + width);
        ASSERT_EQ(header.objects.size(), 2U);
        EXPECT_TRUE(asf_guid_matches(header.objects[1].guid,
                                     kAsfContentDescription));
    }
}


TEST(AsfLayout, GuidMatchesEitherByteOrder)
{
    const AsfGuid be = asf_guid_big_endian(kAsfHeaderObject);
    EXPECT_EQ(detail::u8(be[0]), 0x75U);
    EXPECT_EQ(detail::u8(be[3]), 0x30U);
    EXPECT_TRUE(asf_guid_matches(be, kAsfHeaderObject));
    EXPECT_FALSE(asf_guid_matches(kAsfFileProperties, kAsfHeaderObject));
}


TEST(BmffLayout, SizeForms)
{
    std::vector<std::byte> file;
    append_u32be(&file, 16);
    append_fourcc(&file, fourcc('f', 't', 'y', 'p'));
    append_text(&file, "isom\0\0\0\0");
    append_u32be(&file, 1);
    append_fourcc(&file, fourcc('f', 'r', 'e', 'e'));
    detail::append_u64be(&file, 20);
    append_u32be(&file, 0);
    append_u32be(&file, 0);
    append_fourcc(&file, fourcc('m', 'd', 'a', 't'));
    append_text(&file, "payload");

    std::vector<BmffAtom> atoms;
    ASSERT_EQ(parse_bmff_children(file, 0, file.size(), kDefaultMaxBlocks,
                                  &atoms)
                  .status,
              WriteStatus::Ok);
    ASSERT_EQ(atoms.size(), 3U);
    EXPECT_EQ(atoms[0].size, 16U);
    EXPECT_TRUE(atoms[1].large_size);
    EXPECT_EQ(atoms[1].header_size, 16U);
    EXPECT_EQ(atoms[1].size, 20U);
    EXPECT_TRUE(atoms[2].to_end);
    EXPECT_EQ(atoms[2].end(), file.size());
    EXPECT_EQ(atoms[2].payload_offset(), atoms[2].offset + 8U);
}


TEST(BmffLayout, OversizedChildIsMalformed)
{
    std::vector<std::byte> file;
    append_u32be(&file, 64);
    append_fourcc(&file, fourcc('m', 'o', 'o', 'v'));
    std::vector<BmffAtom> atoms;
    EXPECT_EQ(parse_bmff_children(file, 0, file.size(), kDefaultMaxBlocks,
                                  &atoms)
                  .status,
              WriteStatus::Malformed);
}


TEST(EbmlLayout, ElementsAndUnknownSize)
{
    std::vector<std::byte> file;
    append_ebml_id(kEbmlHeaderId, &file);
    ASSERT_TRUE(append_ebml_size(3, &file));
    append_text(&file, "abc");
    append_ebml_id(kMkvSegmentId, &file);
    append_u8(&file, 0x01);
    for (int i = 0; i < 7; ++i) {
        append_u8(&file, 0xFF);
    }
    append_ebml_id(kInfoId, &file);
    ASSERT_TRUE(append_ebml_size(2, &file));
    append_text(&file, "xy");

    std::vector<EbmlElement> top;
    ASSERT_EQ(parse_ebml_children(file, 0, file.size(), kDefaultMaxBlocks,
                                  &top)
                  .status,
              WriteStatus::Ok);
    ASSERT_EQ(top.size(), 2U);
    EXPECT_EQ(top[0].id, kEbmlHeaderId);
    EXPECT_EQ(top[0].header_size(), 5U);
    EXPECT_EQ(top[1].id, kMkvSegmentId);
    EXPECT_TRUE(top[1].unknown_size);
    EXPECT_EQ(top[1].size_width, 8U);
    EXPECT_EQ(top[1].end, file.size());

    EbmlElement bad;
    std::vector<std::byte> overrun;
    append_ebml_id(kInfoId, &overrun);
    ASSERT_TRUE(append_ebml_size(40, &overrun));
    EXPECT_EQ(parse_ebml_element(overrun, 0, overrun.size(), &bad).status,
              WriteStatus::UnsupportedLayout);
}

}  // namespace metasplice
