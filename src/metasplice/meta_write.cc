#include "metasplice/meta_write.h"

#include "byte_io_internal.h"
#include "metasplice/var_int.h"
#include "write_result_internal.h"

namespace metasplice {
namespace {

    using detail::match;
    using detail::u8;

    static constexpr uint32_t kBmffLeadTypes[] = {
        fourcc('f', 't', 'y', 'p'), fourcc('m', 'o', 'o', 'v'),
        fourcc('m', 'd', 'a', 't'), fourcc('f', 'r', 'e', 'e'),
        fourcc('w', 'i', 'd', 'e'), fourcc('s', 'k', 'i', 'p'),
        fourcc('u', 'u', 'i', 'd'), fourcc('p', 'n', 'o', 't'),
    };

    /// ID3v2 tag size including header and optional footer, or 0.
    static uint64_t id3_tag_size(std::span<const std::byte> bytes) noexcept
    {
        uint32_t body = 0;
        if (bytes.size() < 10U || !match(bytes, 0, "ID3", 3)
            || !read_synchsafe32(bytes, 6, &body)) {
            return 0;
        }
        const bool footer = (u8(bytes[5]) & 0x10U) != 0U;
        return 10U + static_cast<uint64_t>(body) + (footer ? 10U : 0U);
    }


    static bool is_asf(std::span<const std::byte> bytes) noexcept
    {
        if (bytes.size() < 16U) {
            return false;
        }
        AsfGuid guid;
        for (size_t i = 0; i < guid.size(); ++i) {
            guid[i] = bytes[i];
        }
        return asf_guid_matches(guid, kAsfHeaderObject);
    }


    static bool is_bmff(std::span<const std::byte> bytes) noexcept
    {
        uint32_t type = 0;
        if (!detail::read_u32be(bytes, 4, &type)) {
            return false;
        }
        for (uint32_t t : kBmffLeadTypes) {
            if (t == type) {
                return true;
            }
        }
        return false;
    }

}  // namespace

ContainerFormat
detect_container_format(std::span<const std::byte> bytes) noexcept
{
    if (bytes.size() >= 3U && u8(bytes[0]) == 0xFFU && u8(bytes[1]) == 0xD8U
        && u8(bytes[2]) == 0xFFU) {
        return ContainerFormat::Jpeg;
    }
    if (detail::match_bytes(bytes, 0, kPngSignature.data(),
                            static_cast<uint32_t>(kPngSignature.size()))) {
        return ContainerFormat::Png;
    }
    if (bytes.size() >= 12U && match(bytes, 0, "RIFF", 4)) {
        return ContainerFormat::Riff;
    }
    if (match(bytes, 0, "OggS", 4)) {
        return ContainerFormat::Ogg;
    }
    if (match(bytes, 0, "fLaC", 4)) {
        return ContainerFormat::Flac;
    }
    const uint64_t id3 = id3_tag_size(bytes);
    if (id3 != 0U) {
        return match(bytes, id3, "fLaC", 4) ? ContainerFormat::Flac
                                            : ContainerFormat::Mp3;
    }
    if (is_asf(bytes)) {
        return ContainerFormat::Asf;
    }
    if (is_bmff(bytes)) {
        return ContainerFormat::Bmff;
    }
    if (match(bytes, 0, "\x1A\x45\xDF\xA3", 4)) {
        return ContainerFormat::Matroska;
    }
    // MPEG audio frame sync.
    if (bytes.size() >= 2U && u8(bytes[0]) == 0xFFU
        && (u8(bytes[1]) & 0xE0U) == 0xE0U) {
        return ContainerFormat::Mp3;
    }
    return ContainerFormat::Unknown;
}


WriteResult
write_metadata(std::span<const std::byte> bytes,
               const MetadataRequest& request, const WriteOptions& options,
               std::vector<std::byte>* out) noexcept
{
    const ContainerFormat format = detect_container_format(bytes);
    switch (format) {
    case ContainerFormat::Jpeg:
        return write_jpeg_metadata(bytes, request, options, out);
    case ContainerFormat::Png:
        return write_png_metadata(bytes, request, options, out);
    case ContainerFormat::Riff:
        return write_riff_metadata(bytes, request, options, out);
    case ContainerFormat::Ogg:
        return write_ogg_metadata(bytes, request, options, out);
    case ContainerFormat::Flac:
        return write_flac_metadata(bytes, request, options, out);
    case ContainerFormat::Mp3:
        return write_id3_metadata(bytes, request, options, out);
    case ContainerFormat::Asf:
        return write_asf_metadata(bytes, request, options, out);
    case ContainerFormat::Bmff:
        return write_bmff_metadata(bytes, request, options, out);
    case ContainerFormat::Matroska:
        return write_matroska_metadata(bytes, request, options, out);
    case ContainerFormat::Unknown: break;
    }
    out->clear();
    return detail::write_fail(format, WriteStatus::FormatError,
                              "unrecognized container signature");
}

}  // namespace metasplice
