#include "metasplice/meta_write.h"

#include "byte_io_internal.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <span>
#include <string_view>
#include <vector>

namespace metasplice {
namespace {

    using namespace detail;

    static std::vector<std::byte> bytes_of(std::string_view s)
    {
        const std::span<const std::byte> b = as_bytes(s);
        return std::vector<std::byte>(b.begin(), b.end());
    }


    static std::vector<std::byte> make_wave()
    {
        std::vector<std::byte> file;
        append_text(&file, "RIFF");
        append_u32le(&file, 0);
        append_text(&file, "WAVE");
        append_text(&file, "fmt ");
        append_u32le(&file, 16);
        append_text(&file, std::string_view("\x01\0\x01\0\x44\xAC\0\0"
                                            "\x88\x58\x01\0\x02\0\x10\0",
                                            16));
        append_text(&file, "data");
        append_u32le(&file, 4);
        append_text(&file, "PCM!");
        store_u32le(file, 4, static_cast<uint32_t>(file.size() - 8U));
        return file;
    }


    /// ID3v2.3 tag of 10 padding bytes in front of a FLAC stream.
    static std::vector<std::byte> make_tagged_flac()
    {
        std::vector<std::byte> file;
        append_text(&file, std::string_view("ID3\x03\0\0\0\0\0\x0A", 10));
        file.resize(file.size() + 10U);
        append_text(&file, "fLaC");
        append_u8(&file, 0x80);  // last block, STREAMINFO
        append_u8(&file, 0);
        append_u16be(&file, 34);
        file.resize(file.size() + 34U);
        append_text(&file, "\xFF\xF8" "frame");
        return file;
    }

}  // namespace

TEST(MetaWrite, DetectsContainersBySignature)
{
    EXPECT_EQ(detect_container_format(bytes_of("\xFF\xD8\xFF\xE0")),
              ContainerFormat::Jpeg);
    EXPECT_EQ(detect_container_format(std::vector<std::byte>(
                  kPngSignature.begin(), kPngSignature.end())),
              ContainerFormat::Png);
    EXPECT_EQ(detect_container_format(make_wave()), ContainerFormat::Riff);
    EXPECT_EQ(detect_container_format(bytes_of("OggS\0\x02")),
              ContainerFormat::Ogg);
    EXPECT_EQ(detect_container_format(bytes_of("fLaC")),
              ContainerFormat::Flac);
    EXPECT_EQ(detect_container_format(make_tagged_flac()),
              ContainerFormat::Flac);
    EXPECT_EQ(detect_container_format(bytes_of(
                  std::string_view("ID3\x04\0\0\0\0\0\0\xFF\xFB", 12))),
              ContainerFormat::Mp3);
    EXPECT_EQ(detect_container_format(bytes_of("\xFF\xFB\x90\x00")),
              ContainerFormat::Mp3);

    std::vector<std::byte> asf(kAsfHeaderObject.begin(),
                               kAsfHeaderObject.end());
    asf.resize(30U);
    EXPECT_EQ(detect_container_format(asf), ContainerFormat::Asf);

    EXPECT_EQ(detect_container_format(
                  bytes_of(std::string_view("\0\0\0\x18" "ftypisom", 12))),
              ContainerFormat::Bmff);
    EXPECT_EQ(detect_container_format(
                  bytes_of(std::string_view("\0\0\0\x08" "moov", 8))),
              ContainerFormat::Bmff);
    EXPECT_EQ(detect_container_format(bytes_of("\x1A\x45\xDF\xA3\x9F")),
              ContainerFormat::Matroska);

    EXPECT_EQ(detect_container_format(bytes_of("GIF89a")),
              ContainerFormat::Unknown);
    EXPECT_EQ(detect_container_format({}), ContainerFormat::Unknown);
}


TEST(MetaWrite, UnknownContainerIsFormatError)
{
    MetadataRequest request;
    request.set("Title", "x");
    std::vector<std::byte> out = bytes_of("stale");
    const WriteResult r = write_metadata(bytes_of("GIF89a-not-supported"),
                                         request, WriteOptions {}, &out);
    EXPECT_EQ(r.status, WriteStatus::FormatError);
    EXPECT_EQ(r.format, ContainerFormat::Unknown);
    EXPECT_TRUE(out.empty());
}


TEST(MetaWrite, DispatchesAndIsIdempotent)
{
    const std::vector<std::byte> in = make_wave();
    MetadataRequest request;
    request.set("Title", "Take 3");
    request.set("Artist", "Band");

    std::vector<std::byte> once;
    const WriteResult r = write_metadata(in, request, WriteOptions {}, &once);
    ASSERT_EQ(r.status, WriteStatus::Ok);
    EXPECT_EQ(r.format, ContainerFormat::Riff);
    EXPECT_TRUE(std::equal(in.begin() + 8, in.end(), once.begin() + 8));

    std::vector<std::byte> twice;
    ASSERT_EQ(write_metadata(once, request, WriteOptions {}, &twice).status,
              WriteStatus::Ok);
    EXPECT_EQ(once, twice);
}


TEST(MetaWrite, KeepsLeadingId3TagOnFlac)
{
    const std::vector<std::byte> in = make_tagged_flac();
    MetadataRequest request;
    request.set("Title", "Track");

    std::vector<std::byte> out;
    const WriteResult r = write_metadata(in, request, WriteOptions {}, &out);
    ASSERT_EQ(r.status, WriteStatus::Ok);
    EXPECT_EQ(r.format, ContainerFormat::Flac);
    ASSERT_GT(out.size(), in.size());
    EXPECT_TRUE(std::equal(in.begin(), in.begin() + 24, out.begin()));
    EXPECT_EQ(u8(out[24]) & 0x80U, 0U);
    EXPECT_TRUE(std::equal(in.end() - 7, in.end(), out.end() - 7));
    EXPECT_EQ(detect_container_format(out), ContainerFormat::Flac);
}


TEST(MetaWrite, OutputLimitLeavesNoPartialFile)
{
    const std::vector<std::byte> in = make_wave();
    MetadataRequest request;
    request.set("Title", "Take 3");

    WriteOptions options;
    options.limits.max_output_bytes = in.size();
    std::vector<std::byte> out;
    const WriteResult r = write_metadata(in, request, options, &out);
    EXPECT_EQ(r.status, WriteStatus::LimitExceeded);
    EXPECT_EQ(r.expected, in.size());
    EXPECT_GT(r.found, in.size());
    EXPECT_TRUE(out.empty());
}

}  // namespace metasplice
