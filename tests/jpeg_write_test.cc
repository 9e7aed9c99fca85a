#include "metasplice/block_build.h"
#include "metasplice/block_fields.h"
#include "metasplice/container_layout.h"
#include "metasplice/meta_write.h"

#include "byte_io_internal.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace metasplice {
namespace {

    constexpr std::string_view kXmpSig("http://ns.adobe.com/xap/1.0/\0", 29);
    constexpr std::string_view kExtSig(
        "http://ns.adobe.com/xmp/extension/\0", 35);

    static void append_segment(std::vector<std::byte>* out, uint8_t marker,
                               std::string_view payload)
    {
        detail::append_u8(out, 0xFF);
        detail::append_u8(out, marker);
        detail::append_u16be(out, static_cast<uint16_t>(payload.size() + 2U));
        detail::append_text(out, payload);
    }


    static std::string jfif_payload(uint8_t units, uint16_t density)
    {
        std::string p("JFIF\0\x01\x01", 7);
        p.push_back(static_cast<char>(units));
        p.push_back(static_cast<char>(density >> 8));
        p.push_back(static_cast<char>(density & 0xFF));
        p.push_back(static_cast<char>(density >> 8));
        p.push_back(static_cast<char>(density & 0xFF));
        p.append(2, '\0');
        return p;
    }


    struct Image final {
        std::vector<std::byte> bytes;
        uint64_t scan = 0;
    };

    /// SOI, the given header segments, DQT, then SOS + entropy data + EOI.
    static Image make_jpeg(
        const std::vector<std::pair<uint8_t, std::string>>& segments)
    {
        Image img;
        detail::append_u8(&img.bytes, 0xFF);
        detail::append_u8(&img.bytes, 0xD8);
        for (const auto& s : segments) {
            append_segment(&img.bytes, s.first, s.second);
        }
        append_segment(&img.bytes, 0xDB, std::string(65, '\x01'));
        img.scan = img.bytes.size();
        append_segment(&img.bytes, 0xDA, std::string("\x01\x01\x00\x00\x3F\x00",
                                                     6));
        detail::append_text(&img.bytes, "\x12\x34\xFF\x00\x56");
        detail::append_u8(&img.bytes, 0xFF);
        detail::append_u8(&img.bytes, 0xD9);
        return img;
    }


    static JpegLayout layout_of(std::span<const std::byte> bytes)
    {
        JpegLayout layout;
        EXPECT_EQ(parse_jpeg_layout(bytes, kDefaultMaxBlocks, &layout).status,
                  WriteStatus::Ok);
        return layout;
    }


    static std::vector<JpegSegmentKind> kinds(const JpegLayout& layout)
    {
        std::vector<JpegSegmentKind> out;
        for (const JpegSegment& s : layout.segments) {
            out.push_back(s.kind);
        }
        return out;
    }


    static bool same_tail(const std::vector<std::byte>& a, uint64_t a_at,
                          const std::vector<std::byte>& b, uint64_t b_at)
    {
        return a.size() - a_at == b.size() - b_at
               && std::equal(a.begin() + static_cast<long>(a_at), a.end(),
                             b.begin() + static_cast<long>(b_at));
    }

    using K = JpegSegmentKind;

}  // namespace

TEST(JpegWrite, InsertsXmpAfterExif)
{
    const Image in = make_jpeg({ { 0xE0, jfif_payload(0, 1) },
                                 { 0xE1, std::string("Exif\0\0MM", 8) } });
    MetadataRequest request;
    request.set("XMP:Title", "Sunset");

    std::vector<std::byte> out;
    ASSERT_EQ(write_jpeg_metadata(in.bytes, request, WriteOptions {}, &out)
                  .status,
              WriteStatus::Ok);
    const JpegLayout layout = layout_of(out);
    EXPECT_EQ(kinds(layout),
              (std::vector<K> { K::Jfif, K::Exif, K::Xmp, K::Other }));
    EXPECT_TRUE(same_tail(in.bytes, in.scan, out, layout.scan_offset));

    const JpegSegment& xmp = layout.segments[2];
    const std::string_view packet = detail::as_text(
        std::span<const std::byte>(out).subspan(
            static_cast<size_t>(xmp.payload_offset + kXmpSig.size()),
            static_cast<size_t>(xmp.payload_size - kXmpSig.size())));
    EXPECT_NE(packet.find("Sunset"), std::string_view::npos);
    EXPECT_EQ(packet.rfind("<?xpacket end=\"w\"?>"),
              packet.size() - 19U);
}


TEST(JpegWrite, ReplacesXmpAndDropsExtendedSegments)
{
    std::string old_xmp(kXmpSig);
    old_xmp.append("<x:xmpmeta xmlns:x=\"adobe:ns:meta/\"/>");
    std::string ext(kExtSig);
    ext.append(40, 'e');
    const Image in = make_jpeg({ { 0xE0, jfif_payload(0, 1) },
                                 { 0xE1, old_xmp },
                                 { 0xFE, "comment" },
                                 { 0xE1, ext } });

    MetadataRequest request;
    request.set("Copyright", "(c) Someone");
    std::vector<std::byte> out;
    ASSERT_EQ(write_jpeg_metadata(in.bytes, request, WriteOptions {}, &out)
                  .status,
              WriteStatus::Ok);
    const JpegLayout layout = layout_of(out);
    EXPECT_EQ(kinds(layout),
              (std::vector<K> { K::Jfif, K::Xmp, K::Comment, K::Other }));
    EXPECT_NE(detail::as_text(out).find("(c) Someone"),
              std::string_view::npos);
}


TEST(JpegWrite, EmptyIccProfileRemovesTheRun)
{
    const Image in = make_jpeg(
        { { 0xE0, jfif_payload(0, 1) },
          { 0xE2, std::string("ICC_PROFILE\0\x01\x02" "aaaa", 18) },
          { 0xE2, std::string("ICC_PROFILE\0\x02\x02" "bbbb", 18) } });
    MetadataRequest request;
    request.set("ICC_Profile", "");
    std::vector<std::byte> out;
    ASSERT_EQ(write_jpeg_metadata(in.bytes, request, WriteOptions {}, &out)
                  .status,
              WriteStatus::Ok);
    EXPECT_EQ(kinds(layout_of(out)), (std::vector<K> { K::Jfif, K::Other }));
    EXPECT_EQ(out.size(), in.bytes.size() - 2U * 22U);
}


TEST(JpegWrite, ReinsertsIccAtTheOldPosition)
{
    const Image in = make_jpeg(
        { { 0xE0, jfif_payload(0, 1) },
          { 0xE2, std::string("ICC_PROFILE\0\x01\x01" "aaaa", 18) },
          { 0xE1, std::string("Exif\0\0II", 8) } });
    MetadataRequest request;
    request.set("ICC:Profile", std::string(100, 'p'));
    std::vector<std::byte> out;
    ASSERT_EQ(write_jpeg_metadata(in.bytes, request, WriteOptions {}, &out)
                  .status,
              WriteStatus::Ok);
    const JpegLayout layout = layout_of(out);
    EXPECT_EQ(kinds(layout),
              (std::vector<K> { K::Jfif, K::Icc, K::Exif, K::Other }));
    EXPECT_EQ(layout.segments[1].icc_seq, 1U);
    EXPECT_EQ(layout.segments[1].icc_total, 1U);
    EXPECT_EQ(layout.segments[1].payload_size, 14U + 100U);
}


TEST(JpegWrite, NewIccRunFollowsLeadingApp0)
{
    const Image in = make_jpeg({ { 0xE0, jfif_payload(0, 1) } });
    MetadataRequest request;
    request.set("ICC_Profile", "profile-bytes");
    std::vector<std::byte> out;
    ASSERT_EQ(write_jpeg_metadata(in.bytes, request, WriteOptions {}, &out)
                  .status,
              WriteStatus::Ok);
    EXPECT_EQ(kinds(layout_of(out)),
              (std::vector<K> { K::Jfif, K::Icc, K::Other }));
}


TEST(JpegWrite, UpdatesJfifDensity)
{
    const Image in = make_jpeg({ { 0xE0, jfif_payload(0, 1) },
                                 { 0xE1, std::string("Exif\0\0MM", 8) } });
    MetadataRequest request;
    request.set("JFIF:Units", "1");
    request.set("JFIF:XResolution", "300");
    request.set("JFIF:YResolution", "0x12C");
    std::vector<std::byte> out;
    ASSERT_EQ(write_jpeg_metadata(in.bytes, request, WriteOptions {}, &out)
                  .status,
              WriteStatus::Ok);
    ASSERT_EQ(out.size(), in.bytes.size());
    const JpegLayout layout = layout_of(out);
    ASSERT_EQ(layout.segments[0].kind, K::Jfif);
    const uint64_t p = layout.segments[0].payload_offset;
    EXPECT_EQ(detail::u8(out[p + 7U]), 1U);
    uint16_t x = 0;
    uint16_t y = 0;
    ASSERT_TRUE(detail::read_u16be(out, p + 8U, &x));
    ASSERT_TRUE(detail::read_u16be(out, p + 10U, &y));
    EXPECT_EQ(x, 300U);
    EXPECT_EQ(y, 300U);

    MetadataRequest bad;
    bad.set("JFIF:Units", "7");
    EXPECT_EQ(write_jpeg_metadata(in.bytes, bad, WriteOptions {}, &out)
                  .status,
              WriteStatus::UnsupportedField);
    EXPECT_TRUE(out.empty());
}


TEST(JpegWrite, MergesPhotoshopResourcesAndAfcpRecords)
{
    std::vector<std::byte> irb;
    const IrbResource keep[] = { { 0x0425, { std::byte { 1 } } } };
    ASSERT_EQ(build_jpeg_irb_segment(keep, &irb), WriteStatus::Ok);
    const std::string irb_payload(
        reinterpret_cast<const char*>(irb.data()) + 4, irb.size() - 4U);
    const Image in = make_jpeg({ { 0xE0, jfif_payload(0, 1) },
                                 { 0xED, irb_payload } });

    MetadataRequest request;
    request.set("Photoshop:0x0404", "iptc");
    request.set("AFCP:IPTC", "caption");
    std::vector<std::byte> out;
    ASSERT_EQ(write_jpeg_metadata(in.bytes, request, WriteOptions {}, &out)
                  .status,
              WriteStatus::Ok);
    const JpegLayout layout = layout_of(out);
    std::vector<IrbResource> resources;
    std::vector<AfcpField> afcp;
    for (const JpegSegment& s : layout.segments) {
        const std::span<const std::byte> payload
            = std::span<const std::byte>(out).subspan(
                static_cast<size_t>(s.payload_offset),
                static_cast<size_t>(s.payload_size));
        if (s.kind == K::PhotoshopIrb) {
            ASSERT_EQ(parse_jpeg_irb_resources(payload, &resources),
                      WriteStatus::Ok);
        } else if (s.kind == K::Afcp) {
            ASSERT_EQ(parse_jpeg_afcp_fields(payload, &afcp),
                      WriteStatus::Ok);
        }
    }
    ASSERT_EQ(resources.size(), 2U);
    EXPECT_EQ(resources[0].id, 0x0425U);
    EXPECT_EQ(resources[1].id, 0x0404U);
    EXPECT_EQ(resources[1].data.size(), 4U);
    ASSERT_EQ(afcp.size(), 1U);
    EXPECT_EQ(afcp[0].key, "IPTC");

    MetadataRequest bad;
    bad.set("PS:70000", "x");
    EXPECT_EQ(write_jpeg_metadata(in.bytes, bad, WriteOptions {}, &out)
                  .status,
              WriteStatus::UnsupportedField);
}


TEST(JpegWrite, RejectsNonJpegInput)
{
    const std::vector<std::byte> in(32, std::byte { 0x00 });
    MetadataRequest request;
    request.set("XMP:Title", "x");
    std::vector<std::byte> out;
    EXPECT_EQ(write_jpeg_metadata(in, request, WriteOptions {}, &out).status,
              WriteStatus::FormatError);
    EXPECT_TRUE(out.empty());
}

}  // namespace metasplice
