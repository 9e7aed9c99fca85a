#pragma once

#include "metasplice/container_layout.h"
#include "metasplice/metadata_request.h"
#include "metasplice/write_status.h"
#include "metasplice/xmp_packet.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

/**
 * \file meta_write.h
 * \brief Container writers: rewrite embedded metadata, keep every other byte.
 *
 * Every writer takes the complete original file and a \ref MetadataRequest
 * and produces a complete new file in \p out. On failure \p out is empty and
 * the \ref WriteResult names the failing check. Writers keep no state between
 * calls and may run concurrently on different inputs.
 *
 * Each writer selects the request keys it can store. Explicit keys of its own
 * group (`QuickTime:`, `Vorbis:`, `RIFF:`, `ID3:`, `ASF:`, `Matroska:`,
 * `PNG:`) win over `XMP:` keys, which win over `EXIF:` keys, which win over
 * the bare names (`Title`, `Artist`, `Copyright`, ...).
 */

namespace metasplice {

/// Resource limits for one write call.
struct WriteLimits final {
    /// Largest output accepted (0 = unlimited).
    uint64_t max_output_bytes = 0;
    /// Cap on framing units a container scan may record.
    uint32_t max_blocks = kDefaultMaxBlocks;
};

/// ISO-BMFF writer settings.
struct BmffWriteOptions final {
    /// Alignment of the rewritten `udta` payload; filled with a `free` atom
    /// (0 = no padding).
    uint32_t padding = 0;
    /// `hdlr` handler type of the synthesized `meta` box.
    uint32_t handler_type = fourcc('m', 'd', 'i', 'r');
};

struct WriteOptions final {
    WriteLimits limits;
    BmffWriteOptions bmff;
    XmpPacketOptions xmp;
    /// Vorbis vendor string (when the stream has none) and Matroska
    /// `PROCESSING_SOFTWARE` tag (omitted when empty).
    std::string vendor = "metasplice";
};

/// Detects the container by its leading signature.
ContainerFormat
detect_container_format(std::span<const std::byte> bytes) noexcept;

/// Detects the container and dispatches to the matching writer.
WriteResult
write_metadata(std::span<const std::byte> bytes,
               const MetadataRequest& request, const WriteOptions& options,
               std::vector<std::byte>* out) noexcept;

/**
 * \brief JPEG: XMP (APP1), ICC profile (APP2), AFCP (APP2), Photoshop IRB
 * (APP13) and JFIF (APP0) segments.
 *
 * Keys: `XMP:*` (bare `Title`/`Artist`/`Copyright`/`Description` fill the
 * matching XMP properties when absent), `ICC_Profile` / `ICC:Profile`,
 * `AFCP:<key>`, `Photoshop:<id>` / `PS:<id>` (decimal or `0x` hex), and
 * `JFIF:Version` / `JFIF:Units` / `JFIF:XResolution` / `JFIF:YResolution`.
 */
WriteResult
write_jpeg_metadata(std::span<const std::byte> bytes,
                    const MetadataRequest& request,
                    const WriteOptions& options,
                    std::vector<std::byte>* out) noexcept;

/// PNG: `iTXt` XMP and `tEXt` chunks (requires zlib for chunk CRCs).
WriteResult
write_png_metadata(std::span<const std::byte> bytes,
                   const MetadataRequest& request, const WriteOptions& options,
                   std::vector<std::byte>* out) noexcept;

/// RIFF (WAV/AVI): rebuilds the `LIST/INFO` chunk at the end of the form.
WriteResult
write_riff_metadata(std::span<const std::byte> bytes,
                    const MetadataRequest& request,
                    const WriteOptions& options,
                    std::vector<std::byte>* out) noexcept;

/// Ogg Vorbis / Opus: replaces the comment packet within its page.
WriteResult
write_ogg_metadata(std::span<const std::byte> bytes,
                   const MetadataRequest& request, const WriteOptions& options,
                   std::vector<std::byte>* out) noexcept;

/// FLAC: replaces or appends the VORBIS_COMMENT metadata block.
WriteResult
write_flac_metadata(std::span<const std::byte> bytes,
                    const MetadataRequest& request,
                    const WriteOptions& options,
                    std::vector<std::byte>* out) noexcept;

/// MPEG audio: rebuilds the leading ID3v2 tag (creates one when missing).
WriteResult
write_id3_metadata(std::span<const std::byte> bytes,
                   const MetadataRequest& request, const WriteOptions& options,
                   std::vector<std::byte>* out) noexcept;

/// ASF/WMA/WMV: Content Description and Extended Content Description.
WriteResult
write_asf_metadata(std::span<const std::byte> bytes,
                   const MetadataRequest& request, const WriteOptions& options,
                   std::vector<std::byte>* out) noexcept;

/// ISO-BMFF / QuickTime: `moov/udta/meta/ilst` tags and the XMP `uuid` atom.
WriteResult
write_bmff_metadata(std::span<const std::byte> bytes,
                    const MetadataRequest& request,
                    const WriteOptions& options,
                    std::vector<std::byte>* out) noexcept;

/// Matroska/WebM: replaces the Segment's `Tags` element.
WriteResult
write_matroska_metadata(std::span<const std::byte> bytes,
                        const MetadataRequest& request,
                        const WriteOptions& options,
                        std::vector<std::byte>* out) noexcept;

}  // namespace metasplice
