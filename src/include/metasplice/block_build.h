#pragma once

#include "metasplice/write_status.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file block_build.h
 * \brief Pure builders for the metadata blocks written into containers.
 *
 * Each builder appends one complete framing unit (header included) to
 * \p out and keeps no state between calls. Builders that can hit a format
 * ceiling return \ref WriteStatus::StructuralLimit and leave \p out unchanged.
 */

namespace metasplice {

// ID3v2 ----------------------------------------------------------------------

/**
 * \brief Appends an ID3v2 text frame (`T***`).
 *
 * Text that fits ISO-8859-1 uses encoding 0. Other text uses UTF-16 with BOM
 * for \p major 3 and UTF-8 for \p major 4.
 */
WriteStatus
build_id3_text_frame(uint8_t major, uint32_t frame_id, std::string_view utf8,
                     std::vector<std::byte>* out);

/// Appends an ID3v2 header for \p body_size bytes of frames and padding.
WriteStatus
build_id3_header(uint8_t major, uint32_t body_size,
                 std::vector<std::byte>* out);

// RIFF -----------------------------------------------------------------------

/// One `LIST/INFO` entry; \p text is stored NUL-terminated.
struct RiffInfoEntry final {
    uint32_t id = 0;
    std::string text;
};

/// Appends a complete `LIST` chunk of type `INFO`, every entry even-padded.
WriteStatus
build_riff_info_list(std::span<const RiffInfoEntry> entries,
                     std::vector<std::byte>* out);

// Vorbis comments -------------------------------------------------------------

struct VorbisCommentField final {
    std::string name;
    std::string value;
};

struct VorbisComments final {
    std::string vendor;
    std::vector<VorbisCommentField> fields;
};

/// Where a comment block is stored; decides the prefix and the framing bit.
enum class VorbisCommentFraming : uint8_t {
    /// FLAC VORBIS_COMMENT block body: no prefix, no framing bit.
    FlacBlock,
    /// Ogg Vorbis comment packet: `\x03vorbis` prefix, framing bit 1.
    VorbisPacket,
    /// Ogg Opus comment packet: `OpusTags` prefix, no framing bit.
    OpusPacket,
};

/// Appends the comment block bytes (without any FLAC block header).
WriteStatus
build_vorbis_comments(const VorbisComments& comments,
                      VorbisCommentFraming framing,
                      std::vector<std::byte>* out);

// ASF ------------------------------------------------------------------------

/// The five Content Description strings (UTF-8; empty allowed).
struct AsfContentDescription final {
    std::string title;
    std::string author;
    std::string copyright;
    std::string description;
    std::string rating;
};

/// Extended Content Description value types.
enum class AsfValueType : uint16_t {
    String = 0,
    Bytes  = 1,
    Bool   = 2,
    Dword  = 3,
    Qword  = 4,
    Word   = 5,
};

/// One Extended Content Description descriptor; \p value holds the raw
/// stored bytes (UTF-16LE with terminator for strings).
struct AsfDescriptor final {
    std::string name;
    uint16_t type = 0;
    std::vector<std::byte> value;
};

/// Makes a string descriptor from UTF-8 text.
AsfDescriptor
make_asf_string_descriptor(std::string_view name, std::string_view utf8);

/// Appends a Content Description object (GUID + size + payload).
WriteStatus
build_asf_content_description(const AsfContentDescription& cd,
                              std::vector<std::byte>* out);

/// Appends an Extended Content Description object.
WriteStatus
build_asf_extended_content_description(
    std::span<const AsfDescriptor> descriptors, std::vector<std::byte>* out);

// ISO-BMFF -------------------------------------------------------------------

/// Appends an atom header + \p payload, using the 64-bit size form when the
/// atom does not fit a 32-bit size.
void
append_bmff_atom(uint32_t type, std::span<const std::byte> payload,
                 std::vector<std::byte>* out);

/// One `ilst` text item (`©nam`, `©ART`, `cprt`, ...).
struct BmffTextItem final {
    uint32_t type = 0;
    std::string value;
};

/// Appends an `ilst` item holding one UTF-8 `data` atom.
void
build_bmff_ilst_item(uint32_t type, std::string_view utf8,
                     std::vector<std::byte>* out);

/**
 * \brief Appends a `meta` full box holding `hdlr` (\p handler_type) and
 * `ilst`.
 *
 * \p kept_items are complete `ilst` children copied ahead of \p items.
 */
void
build_bmff_meta(std::span<const BmffTextItem> items, uint32_t handler_type,
                std::span<const std::byte> kept_items,
                std::vector<std::byte>* out);

/**
 * \brief Appends a zero-filled `free` atom that pads \p used bytes up to the
 * next multiple of \p alignment (nothing when already aligned or
 * \p alignment is 0).
 *
 * The filler is at least 8 bytes; when the gap is smaller the next multiple
 * is used.
 */
void
build_bmff_padding(uint64_t used, uint32_t alignment,
                   std::vector<std::byte>* out);

/// Appends a top-level `uuid` atom carrying an XMP packet.
void
build_bmff_xmp_uuid(std::span<const std::byte> packet,
                    std::vector<std::byte>* out);

// Matroska -------------------------------------------------------------------

struct MkvSimpleTag final {
    std::string name;
    std::string value;
};

/// Appends a `Tags` element with one `Tag` (empty `Targets`) holding the
/// given SimpleTags.
WriteStatus
build_mkv_tags(std::span<const MkvSimpleTag> tags,
               std::vector<std::byte>* out);

// JPEG -----------------------------------------------------------------------

/// Largest JPEG marker segment payload (length field is u16 incl. itself).
inline constexpr uint32_t kJpegMaxSegmentPayload = 65533;
/// Largest ICC profile slice per APP2 segment.
inline constexpr uint32_t kJpegIccChunkMax = 65519;

/// Appends a marker segment; fails when \p payload exceeds \ref kJpegMaxSegmentPayload.
WriteStatus
build_jpeg_segment(uint16_t marker, std::span<const std::byte> payload,
                   std::vector<std::byte>* out);

/// Appends an APP1 XMP segment (`http://ns.adobe.com/xap/1.0/\0` + packet).
WriteStatus
build_jpeg_xmp_segment(std::span<const std::byte> packet,
                       std::vector<std::byte>* out);

/**
 * \brief Appends the APP2 `ICC_PROFILE` run for \p profile.
 *
 * Each segment carries at most \p chunk_size profile bytes (capped at
 * 65504 and at \ref kJpegIccChunkMax) plus a 1-based (sequence, total) pair.
 * More than 255 segments is \ref WriteStatus::StructuralLimit.
 */
WriteStatus
build_jpeg_icc_segments(std::span<const std::byte> profile,
                        std::vector<std::byte>* out,
                        uint32_t chunk_size = 65504);

/// One Photoshop image resource.
struct IrbResource final {
    uint16_t id = 0;
    std::vector<std::byte> data;
};

/// Appends an APP13 `Photoshop 3.0` segment with `8BIM` resources.
WriteStatus
build_jpeg_irb_segment(std::span<const IrbResource> resources,
                       std::vector<std::byte>* out);

struct AfcpField final {
    std::string key;
    std::string value;
};

/// Appends an APP2 `AFCP` segment of key/value records.
WriteStatus
build_jpeg_afcp_segment(std::span<const AfcpField> fields,
                        std::vector<std::byte>* out);

struct JfifInfo final {
    uint8_t version_major = 1;
    uint8_t version_minor = 2;
    /// 0 = aspect ratio only, 1 = dots per inch, 2 = dots per cm.
    uint8_t units      = 0;
    uint16_t x_density = 1;
    uint16_t y_density = 1;
};

/// Appends an APP0 `JFIF` segment without thumbnail.
WriteStatus
build_jpeg_jfif_segment(const JfifInfo& info, std::vector<std::byte>* out);

// PNG ------------------------------------------------------------------------

/**
 * \brief Appends a PNG chunk with its CRC-32.
 *
 * Requires zlib; returns \ref WriteStatus::Unsupported when built without it.
 */
WriteStatus
build_png_chunk(uint32_t type, std::span<const std::byte> data,
                std::vector<std::byte>* out);

/// Appends a `tEXt` chunk (Latin-1 keyword and text).
WriteStatus
build_png_text_chunk(std::string_view keyword, std::string_view latin1,
                     std::vector<std::byte>* out);

/// Appends an uncompressed `iTXt` chunk (UTF-8 text, empty language tags).
WriteStatus
build_png_itxt_chunk(std::string_view keyword, std::string_view utf8,
                     std::vector<std::byte>* out);

}  // namespace metasplice
