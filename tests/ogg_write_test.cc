#include "metasplice/block_build.h"
#include "metasplice/block_fields.h"
#include "metasplice/container_layout.h"
#include "metasplice/meta_write.h"
#include "metasplice/ogg_crc.h"
#include "metasplice/var_int.h"

#include "byte_io_internal.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <span>
#include <string>
#include <vector>

namespace metasplice {
namespace {

    static void append_page(std::vector<std::byte>* out, uint8_t header_type,
                            uint32_t sequence,
                            const std::vector<uint8_t>& lacing,
                            std::span<const std::byte> payload)
    {
        std::vector<std::byte> page;
        detail::append_text(&page, "OggS");
        detail::append_u8(&page, 0);
        detail::append_u8(&page, header_type);
        detail::append_u64le(&page, 0);
        detail::append_u32le(&page, 0x1234U);
        detail::append_u32le(&page, sequence);
        detail::append_u32le(&page, 0);
        detail::append_u8(&page, static_cast<uint8_t>(lacing.size()));
        for (uint8_t v : lacing) {
            detail::append_u8(&page, v);
        }
        detail::append_span(&page, payload);
        detail::store_u32le(page, kOggCrcOffset, ogg_crc32(page));
        detail::append_span(out, page);
    }


    static std::vector<uint8_t> lacing_for(uint64_t size)
    {
        std::vector<uint8_t> lacing;
        build_ogg_lacing(size, &lacing);
        return lacing;
    }


    static void append_ident_page(std::vector<std::byte>* out, bool opus)
    {
        std::vector<std::byte> ident;
        detail::append_text(&ident, opus ? "OpusHead" : "\x01vorbis");
        ident.resize(30, std::byte { 0x01 });
        append_page(out, 0x02, 0, lacing_for(ident.size()), ident);
    }


    struct Stream final {
        std::vector<std::byte> bytes;
        uint64_t audio_page = 0;
    };

    /// Identification page, comment page (comment packet followed by a
    /// 10-byte setup packet), one audio page.
    static Stream make_stream(bool opus, const VorbisComments& comments)
    {
        Stream s;
        append_ident_page(&s.bytes, opus);

        std::vector<std::byte> payload;
        EXPECT_EQ(build_vorbis_comments(
                      comments,
                      opus ? VorbisCommentFraming::OpusPacket
                           : VorbisCommentFraming::VorbisPacket,
                      &payload),
                  WriteStatus::Ok);
        std::vector<uint8_t> lacing = lacing_for(payload.size());
        lacing.push_back(10);
        detail::append_text(&payload, "\x05vorbisXYZ");
        append_page(&s.bytes, 0x00, 1, lacing, payload);

        s.audio_page = s.bytes.size();
        const std::vector<std::byte> audio(40, std::byte { 0x5A });
        append_page(&s.bytes, 0x04, 2, lacing_for(audio.size()), audio);
        return s;
    }


    static bool crc_valid(std::span<const std::byte> bytes, const OggPage& p)
    {
        std::vector<std::byte> copy(bytes.begin() + static_cast<long>(p.offset),
                                    bytes.begin()
                                        + static_cast<long>(p.offset + p.size));
        detail::store_u32le(copy, kOggCrcOffset, 0);
        return ogg_crc32(copy) == p.crc;
    }

}  // namespace

TEST(OggWrite, ShrinksMultiEntryCommentPacket)
{
    VorbisComments comments;
    comments.vendor = "v";
    comments.fields.push_back({ "TITLE", std::string(493, 'x') });
    const Stream in = make_stream(false, comments);

    std::vector<OggPage> pages;
    ASSERT_EQ(parse_ogg_pages(in.bytes, kDefaultMaxBlocks, &pages).status,
              WriteStatus::Ok);
    ASSERT_EQ(pages.size(), 3U);
    const std::span<const uint8_t> before = ogg_page_lacing(in.bytes,
                                                            pages[1]);
    ASSERT_EQ(std::vector<uint8_t>(before.begin(), before.end()),
              (std::vector<uint8_t> { 255, 255, 10, 10 }));

    MetadataRequest request;
    request.set("Title", std::string(53, 'y'));
    std::vector<std::byte> out;
    ASSERT_EQ(write_ogg_metadata(in.bytes, request, WriteOptions {}, &out)
                  .status,
              WriteStatus::Ok);

    ASSERT_EQ(parse_ogg_pages(out, kDefaultMaxBlocks, &pages).status,
              WriteStatus::Ok);
    ASSERT_EQ(pages.size(), 3U);
    const std::span<const uint8_t> after = ogg_page_lacing(out, pages[1]);
    EXPECT_EQ(std::vector<uint8_t>(after.begin(), after.end()),
              (std::vector<uint8_t> { 80, 10 }));
    EXPECT_EQ(pages[1].sequence, 1U);
    EXPECT_EQ(pages[1].serial, 0x1234U);
    EXPECT_TRUE(crc_valid(out, pages[1]));
    EXPECT_TRUE(detail::match(out, pages[1].payload_offset + 80U,
                              "\x05vorbisXYZ", 10));

    VorbisComments parsed;
    ASSERT_EQ(parse_vorbis_comments(
                  std::span<const std::byte>(out).subspan(
                      static_cast<size_t>(pages[1].payload_offset + 7U), 72U),
                  &parsed),
              WriteStatus::Ok);
    EXPECT_EQ(parsed.vendor, "v");
    ASSERT_EQ(parsed.fields.size(), 1U);
    EXPECT_EQ(parsed.fields[0].value, std::string(53, 'y'));

    // The audio page is carried over byte for byte.
    const uint64_t audio_size = in.bytes.size() - in.audio_page;
    ASSERT_EQ(pages[2].size, audio_size);
    EXPECT_TRUE(std::equal(in.bytes.begin()
                               + static_cast<long>(in.audio_page),
                           in.bytes.end(),
                           out.begin() + static_cast<long>(pages[2].offset)));
}


TEST(OggWrite, OpusTagsHaveNoFramingBit)
{
    VorbisComments comments;
    comments.vendor = "libopus";
    const Stream in = make_stream(true, comments);

    MetadataRequest request;
    request.set("Vorbis:ARTIST", "Band");
    std::vector<std::byte> out;
    const WriteResult r = write_ogg_metadata(in.bytes, request,
                                             WriteOptions {}, &out);
    ASSERT_EQ(r.status, WriteStatus::Ok);
    EXPECT_EQ(r.format, ContainerFormat::Ogg);

    std::vector<OggPage> pages;
    ASSERT_EQ(parse_ogg_pages(out, kDefaultMaxBlocks, &pages).status,
              WriteStatus::Ok);
    ASSERT_EQ(pages.size(), 3U);
    EXPECT_TRUE(detail::match(out, pages[1].payload_offset, "OpusTags", 8));
    // OpusTags + vendor + count + "ARTIST=Band".
    const uint64_t packet = 8U + 4U + 7U + 4U + 4U + 11U;
    const std::span<const uint8_t> lacing = ogg_page_lacing(out, pages[1]);
    ASSERT_EQ(lacing.size(), 2U);
    EXPECT_EQ(lacing[0], packet);
    EXPECT_TRUE(crc_valid(out, pages[1]));
}


TEST(OggWrite, LacingTableOverflowIsStructuralLimit)
{
    std::vector<std::byte> in;
    append_ident_page(&in, false);

    VorbisComments comments;
    comments.vendor = "v";
    std::vector<std::byte> payload;
    ASSERT_EQ(build_vorbis_comments(comments,
                                    VorbisCommentFraming::VorbisPacket,
                                    &payload),
              WriteStatus::Ok);
    std::vector<uint8_t> lacing = lacing_for(payload.size());
    ASSERT_EQ(lacing.size(), 1U);
    // 250 one-byte packets share the comment page.
    lacing.insert(lacing.end(), 250U, uint8_t { 1 });
    payload.resize(payload.size() + 250U, std::byte { 0x7E });
    append_page(&in, 0x00, 1, lacing, payload);

    MetadataRequest request;
    request.set("Title", std::string(3000, 't'));
    std::vector<std::byte> out;
    const WriteResult r = write_ogg_metadata(in, request, WriteOptions {},
                                             &out);
    EXPECT_EQ(r.status, WriteStatus::StructuralLimit);
    EXPECT_EQ(r.expected, 255U);
    EXPECT_GT(r.found, 255U);
    EXPECT_TRUE(out.empty());
}


TEST(OggWrite, CommentPacketSpanningPagesIsUnsupported)
{
    std::vector<std::byte> in;
    append_ident_page(&in, false);

    std::vector<std::byte> head;
    detail::append_text(&head, "\x03vorbis");
    head.resize(255, std::byte { 0x00 });
    append_page(&in, 0x00, 1, { 255 }, head);
    const std::vector<std::byte> tail(10, std::byte { 0x00 });
    append_page(&in, 0x01, 2, { 10 }, tail);

    MetadataRequest request;
    request.set("Title", "x");
    std::vector<std::byte> out;
    EXPECT_EQ(write_ogg_metadata(in, request, WriteOptions {}, &out).status,
              WriteStatus::UnsupportedLayout);
    EXPECT_TRUE(out.empty());
}


TEST(OggWrite, RejectsUnknownCodec)
{
    std::vector<std::byte> in;
    std::vector<std::byte> ident;
    detail::append_text(&ident, "\x80theora");
    append_page(&in, 0x02, 0, lacing_for(ident.size()), ident);

    MetadataRequest request;
    request.set("Title", "x");
    std::vector<std::byte> out;
    const WriteResult r = write_ogg_metadata(in, request, WriteOptions {},
                                             &out);
    EXPECT_EQ(r.status, WriteStatus::UnsupportedLayout);
    EXPECT_TRUE(out.empty());
}


TEST(OggWrite, CorruptCommentPacketIsMalformed)
{
    VorbisComments comments;
    comments.vendor = "v";
    Stream in = make_stream(false, comments);
    std::vector<OggPage> pages;
    ASSERT_EQ(parse_ogg_pages(in.bytes, kDefaultMaxBlocks, &pages).status,
              WriteStatus::Ok);
    // Vendor length far beyond the packet.
    detail::store_u32le(in.bytes, pages[1].payload_offset + 7U, 0x7FFFU);

    MetadataRequest request;
    request.set("Title", "x");
    std::vector<std::byte> out;
    EXPECT_EQ(write_ogg_metadata(in.bytes, request, WriteOptions {}, &out)
                  .status,
              WriteStatus::Malformed);
    EXPECT_TRUE(out.empty());
}

}  // namespace metasplice
