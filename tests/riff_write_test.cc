#include "metasplice/block_fields.h"
#include "metasplice/container_layout.h"
#include "metasplice/meta_write.h"

#include "byte_io_internal.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <span>
#include <string_view>
#include <vector>

namespace metasplice {
namespace {

    using detail::append_fourcc;
    using detail::append_text;
    using detail::append_u32le;
    using detail::append_u8;

    static void append_chunk(std::vector<std::byte>* out, uint32_t id,
                             std::string_view data)
    {
        append_fourcc(out, id);
        append_u32le(out, static_cast<uint32_t>(data.size()));
        append_text(out, data);
        if ((data.size() & 1U) != 0U) {
            append_u8(out, 0);
        }
    }


    static void finish_riff(std::vector<std::byte>* file)
    {
        const uint32_t size = static_cast<uint32_t>(file->size() - 8U);
        detail::store_u32le(*file, 4, size);
    }


    static std::vector<std::byte> make_wave()
    {
        std::vector<std::byte> file;
        append_text(&file, "RIFF");
        append_u32le(&file, 0);
        append_text(&file, "WAVE");
        append_chunk(&file, fourcc('f', 'm', 't', ' '),
                     std::string_view("0123456789abcdef", 16));
        append_chunk(&file, fourcc('d', 'a', 't', 'a'), "pcm");
        finish_riff(&file);
        return file;
    }


    static std::vector<RiffInfoEntry>
    info_entries(const std::vector<std::byte>& file)
    {
        RiffLayout layout;
        EXPECT_EQ(parse_riff_layout(file, kDefaultMaxBlocks, &layout).status,
                  WriteStatus::Ok);
        std::vector<RiffInfoEntry> entries;
        for (const RiffChunk& c : layout.chunks) {
            if (c.list_type == fourcc('I', 'N', 'F', 'O')) {
                EXPECT_EQ(parse_riff_info_list(
                              std::span<const std::byte>(file).subspan(
                                  static_cast<size_t>(c.offset + 8U),
                                  c.data_size),
                              &entries),
                          WriteStatus::Ok);
            }
        }
        return entries;
    }

}  // namespace

TEST(RiffWrite, AppendsInfoListAndUpdatesSize)
{
    const std::vector<std::byte> in = make_wave();
    MetadataRequest request;
    request.set("Title", "Song");

    std::vector<std::byte> out;
    const WriteResult r = write_riff_metadata(in, request, WriteOptions {},
                                              &out);
    ASSERT_EQ(r.status, WriteStatus::Ok);
    // LIST header + INFO + INAM entry ("Song\0" + pad).
    ASSERT_EQ(out.size(), in.size() + 26U);
    EXPECT_TRUE(std::equal(in.begin() + 8, in.end(), out.begin() + 8));

    uint32_t size = 0;
    ASSERT_TRUE(detail::read_u32le(out, 4, &size));
    EXPECT_EQ(size, out.size() - 8U);

    const std::vector<RiffInfoEntry> entries = info_entries(out);
    ASSERT_EQ(entries.size(), 1U);
    EXPECT_EQ(entries[0].id, fourcc('I', 'N', 'A', 'M'));
    EXPECT_EQ(entries[0].text, "Song");
}


TEST(RiffWrite, MergesExistingInfoAndMovesItToTheEnd)
{
    std::vector<std::byte> file;
    append_text(&file, "RIFF");
    append_u32le(&file, 0);
    append_text(&file, "WAVE");
    std::vector<std::byte> info;
    append_text(&info, "INFO");
    append_chunk(&info, fourcc('I', 'N', 'A', 'M'),
                 std::string_view("Old\0", 4));
    append_chunk(&info, fourcc('I', 'A', 'R', 'T'),
                 std::string_view("Band\0", 5));
    append_chunk(&file, fourcc('L', 'I', 'S', 'T'),
                 std::string_view(reinterpret_cast<const char*>(info.data()),
                                  info.size()));
    append_chunk(&file, fourcc('d', 'a', 't', 'a'), "pcm!");
    finish_riff(&file);

    MetadataRequest request;
    request.set("RIFF:INAM", "New");
    std::vector<std::byte> out;
    ASSERT_EQ(write_riff_metadata(file, request, WriteOptions {}, &out).status,
              WriteStatus::Ok);

    RiffLayout layout;
    ASSERT_EQ(parse_riff_layout(out, kDefaultMaxBlocks, &layout).status,
              WriteStatus::Ok);
    ASSERT_EQ(layout.chunks.size(), 2U);
    EXPECT_EQ(layout.chunks[0].id, fourcc('d', 'a', 't', 'a'));
    EXPECT_EQ(layout.chunks[1].list_type, fourcc('I', 'N', 'F', 'O'));

    const std::vector<RiffInfoEntry> entries = info_entries(out);
    ASSERT_EQ(entries.size(), 2U);
    EXPECT_EQ(entries[0].text, "New");
    EXPECT_EQ(entries[1].id, fourcc('I', 'A', 'R', 'T'));
    EXPECT_EQ(entries[1].text, "Band");
}


TEST(RiffWrite, KeepsBytesAfterTheForm)
{
    std::vector<std::byte> in = make_wave();
    append_text(&in, "junk");
    MetadataRequest request;
    request.set("Artist", "Me");
    std::vector<std::byte> out;
    ASSERT_EQ(write_riff_metadata(in, request, WriteOptions {}, &out).status,
              WriteStatus::Ok);
    ASSERT_GE(out.size(), 4U);
    EXPECT_TRUE(detail::match(out, out.size() - 4U, "junk", 4));
    uint32_t size = 0;
    ASSERT_TRUE(detail::read_u32le(out, 4, &size));
    EXPECT_EQ(size, out.size() - 12U);
}


TEST(RiffWrite, RejectsRequestsItCannotStore)
{
    const std::vector<std::byte> in = make_wave();
    std::vector<std::byte> out = { std::byte { 1 } };

    MetadataRequest none;
    none.set("PNG:Author", "x");
    EXPECT_EQ(write_riff_metadata(in, none, WriteOptions {}, &out).status,
              WriteStatus::NoApplicableFields);
    EXPECT_TRUE(out.empty());

    MetadataRequest bad;
    bad.set("RIFF:TOOLONG", "x");
    const WriteResult r = write_riff_metadata(in, bad, WriteOptions {}, &out);
    EXPECT_EQ(r.status, WriteStatus::UnsupportedField);
    EXPECT_EQ(r.format, ContainerFormat::Riff);
}


TEST(RiffWrite, TruncatedFormIsMalformed)
{
    std::vector<std::byte> in = make_wave();
    in.resize(in.size() - 2U);
    MetadataRequest request;
    request.set("Title", "x");
    std::vector<std::byte> out;
    EXPECT_EQ(write_riff_metadata(in, request, WriteOptions {}, &out).status,
              WriteStatus::Malformed);
    EXPECT_TRUE(out.empty());
}

}  // namespace metasplice
