#pragma once

#include "metasplice/write_status.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file container_layout.h
 * \brief Framing scanners: split container bytes into ordered framing units.
 *
 * Every scanner walks the bytes once, records each unit with its absolute
 * offset and total size, and stops at the format terminator. A unit whose
 * declared length runs past the buffer (or its parent) fails the scan; the
 * scanners never clamp or guess.
 *
 * All offsets are relative to the start of the buffer passed in.
 */

namespace metasplice {

/// Packs four ASCII characters into a big-endian FourCC integer.
static constexpr uint32_t
fourcc(char a, char b, char c, char d) noexcept
{
    return (static_cast<uint32_t>(static_cast<uint8_t>(a)) << 24)
           | (static_cast<uint32_t>(static_cast<uint8_t>(b)) << 16)
           | (static_cast<uint32_t>(static_cast<uint8_t>(c)) << 8)
           | (static_cast<uint32_t>(static_cast<uint8_t>(d)) << 0);
}

/// Default cap on framing units recorded by one scan.
inline constexpr uint32_t kDefaultMaxBlocks = 1U << 18;

// JPEG -----------------------------------------------------------------------

/// Metadata family of a JPEG marker segment, decided by marker and payload
/// signature.
enum class JpegSegmentKind : uint8_t {
    Other,
    /// APP0 `JFIF\0`.
    Jfif,
    /// APP1 `Exif\0`.
    Exif,
    /// APP1 `http://ns.adobe.com/xap/1.0/\0`.
    Xmp,
    /// APP1 `http://ns.adobe.com/xmp/extension/\0`.
    XmpExtended,
    /// APP2 `ICC_PROFILE\0` + sequence + total.
    Icc,
    /// APP2 `AFCP`.
    Afcp,
    /// APP13 `Photoshop 3.0\0`.
    PhotoshopIrb,
    /// COM.
    Comment,
};

struct JpegSegment final {
    /// Offset of the marker's 0xFF byte.
    uint64_t offset = 0;
    /// Marker + length field + payload.
    uint64_t size = 0;
    uint16_t marker = 0;
    uint64_t payload_offset = 0;
    uint64_t payload_size   = 0;
    JpegSegmentKind kind    = JpegSegmentKind::Other;
    /// ICC only: 1-based chunk number and chunk count.
    uint8_t icc_seq   = 0;
    uint8_t icc_total = 0;
};

struct JpegLayout final {
    std::vector<JpegSegment> segments;
    /// Offset of the SOS or EOI marker that ends the header segments (or the
    /// buffer size when neither was found). Everything from here on is the
    /// trailing region.
    uint64_t scan_offset = 0;
};

/// Walks JPEG marker segments after SOI. Missing SOI is \ref WriteStatus::FormatError.
WriteResult
parse_jpeg_layout(std::span<const std::byte> bytes, uint32_t max_blocks,
                  JpegLayout* out) noexcept;

// PNG ------------------------------------------------------------------------

inline constexpr std::array<std::byte, 8> kPngSignature = {
    std::byte { 0x89 }, std::byte { 'P' },  std::byte { 'N' },
    std::byte { 'G' },  std::byte { 0x0D }, std::byte { 0x0A },
    std::byte { 0x1A }, std::byte { 0x0A },
};

struct PngChunk final {
    uint64_t offset = 0;
    /// Length of the data field (excludes length, type and CRC).
    uint32_t length = 0;
    uint32_t type   = 0;

    uint64_t total_size() const noexcept
    {
        return 12U + static_cast<uint64_t>(length);
    }
};

struct PngLayout final {
    std::vector<PngChunk> chunks;
    /// One past the IEND chunk (or the buffer size when IEND is missing).
    uint64_t end = 0;
};

WriteResult
parse_png_layout(std::span<const std::byte> bytes, uint32_t max_blocks,
                 PngLayout* out) noexcept;

// RIFF -----------------------------------------------------------------------

struct RiffChunk final {
    uint64_t offset = 0;
    /// Header + data + pad byte.
    uint64_t size      = 0;
    uint32_t id        = 0;
    uint32_t data_size = 0;
    /// Sub-type of `LIST` chunks (e.g. `INFO`), 0 otherwise.
    uint32_t list_type = 0;
};

struct RiffLayout final {
    /// Form type (`WAVE`, `AVI `).
    uint32_t form = 0;
    /// The RIFF header size field.
    uint32_t declared_size = 0;
    std::vector<RiffChunk> chunks;
    /// 8 + declared size; bytes after this are outside RIFF framing.
    uint64_t end = 0;
};

WriteResult
parse_riff_layout(std::span<const std::byte> bytes, uint32_t max_blocks,
                  RiffLayout* out) noexcept;

// Ogg ------------------------------------------------------------------------

inline constexpr uint32_t kOggPageHeaderSize = 27;

/// Offset of the page checksum within the page header.
inline constexpr uint32_t kOggCrcOffset = 22;

struct OggPage final {
    uint64_t offset = 0;
    /// Header + lacing table + payload.
    uint64_t size          = 0;
    uint8_t header_type    = 0;
    uint64_t granule       = 0;
    uint32_t serial        = 0;
    uint32_t sequence      = 0;
    uint32_t crc           = 0;
    uint8_t segment_count  = 0;
    uint64_t payload_offset = 0;
    uint64_t payload_size   = 0;

    /// Header-type flag: the page starts with a continued packet.
    bool continued() const noexcept { return (header_type & 0x01U) != 0U; }
};

/// Parses the page at \p offset (`OggS` capture pattern, version 0).
WriteResult
parse_ogg_page(std::span<const std::byte> bytes, uint64_t offset,
               OggPage* out) noexcept;

/// Parses consecutive pages from the start of the buffer.
WriteResult
parse_ogg_pages(std::span<const std::byte> bytes, uint32_t max_blocks,
                std::vector<OggPage>* out) noexcept;

/// Lacing values of \p page as a view into \p bytes.
std::span<const uint8_t>
ogg_page_lacing(std::span<const std::byte> bytes,
                const OggPage& page) noexcept;

// FLAC -----------------------------------------------------------------------

enum class FlacBlockType : uint8_t {
    StreamInfo    = 0,
    Padding       = 1,
    Application   = 2,
    SeekTable     = 3,
    VorbisComment = 4,
    CueSheet      = 5,
    Picture       = 6,
};

struct FlacBlock final {
    uint64_t offset = 0;
    /// Block data length (excludes the 4-byte header).
    uint32_t length = 0;
    uint8_t type    = 0;
    bool last       = false;

    uint64_t total_size() const noexcept
    {
        return 4U + static_cast<uint64_t>(length);
    }
};

struct FlacLayout final {
    /// Offset of `fLaC` (non-zero when an ID3v2 tag precedes it).
    uint64_t signature_offset = 0;
    std::vector<FlacBlock> blocks;
    /// First byte after the last metadata block.
    uint64_t audio_offset = 0;
};

WriteResult
parse_flac_layout(std::span<const std::byte> bytes, uint32_t max_blocks,
                  FlacLayout* out) noexcept;

// ID3v2 ----------------------------------------------------------------------

struct Id3Frame final {
    uint64_t offset = 0;
    /// Frame header (10 bytes) + payload.
    uint64_t size            = 0;
    uint32_t id              = 0;
    uint16_t flags           = 0;
    uint64_t payload_offset  = 0;
    uint32_t payload_size    = 0;
};

struct Id3Tag final {
    uint8_t major    = 0;
    uint8_t revision = 0;
    uint8_t flags    = 0;
    /// Header + frames + padding (+ footer).
    uint64_t size = 0;
    std::vector<Id3Frame> frames;

    bool unsynchronised() const noexcept { return (flags & 0x80U) != 0U; }
    bool has_extended_header() const noexcept
    {
        return (flags & 0x40U) != 0U;
    }
};

/// Parses an ID3v2 tag at \p offset. No `ID3` there is \ref WriteStatus::FormatError.
/// Frames are only listed for versions 2.3 and 2.4 without extended header
/// or unsynchronisation.
WriteResult
parse_id3_tag(std::span<const std::byte> bytes, uint64_t offset,
              uint32_t max_blocks, Id3Tag* out) noexcept;

// ASF ------------------------------------------------------------------------

using AsfGuid = std::array<std::byte, 16>;

/// ASF GUIDs in their canonical (mixed-endian) on-disk byte order.
inline constexpr AsfGuid kAsfHeaderObject = {
    std::byte { 0x30 }, std::byte { 0x26 }, std::byte { 0xB2 },
    std::byte { 0x75 }, std::byte { 0x8E }, std::byte { 0x66 },
    std::byte { 0xCF }, std::byte { 0x11 }, std::byte { 0xA6 },
    std::byte { 0xD9 }, std::byte { 0x00 }, std::byte { 0xAA },
    std::byte { 0x00 }, std::byte { 0x62 }, std::byte { 0xCE },
    std::byte { 0x6C },
};

inline constexpr AsfGuid kAsfContentDescription = {
    std::byte { 0x33 }, std::byte { 0x26 }, std::byte { 0xB2 },
    std::byte { 0x75 }, std::byte { 0x8E }, std::byte { 0x66 },
    std::byte { 0xCF }, std::byte { 0x11 }, std::byte { 0xA6 },
    std::byte { 0xD9 }, std::byte { 0x00 }, std::byte { 0xAA },
    std::byte { 0x00 }, std::byte { 0x62 }, std::byte { 0xCE },
    std::byte { 0x6C },
};

inline constexpr AsfGuid kAsfExtendedContentDescription = {
    std::byte { 0x40 }, std::byte { 0xA4 }, std::byte { 0xD0 },
    std::byte { 0xD2 }, std::byte { 0x07 }, std::byte { 0xE3 },
    std::byte { 0xD2 }, std::byte { 0x11 }, std::byte { 0x97 },
    std::byte { 0xF0 }, std::byte { 0x00 }, std::byte { 0xA0 },
    std::byte { 0xC9 }, std::byte { 0x5E }, std::byte { 0xA8 },
    std::byte { 0x50 },
};

inline constexpr AsfGuid kAsfFileProperties = {
    std::byte { 0xA1 }, std::byte { 0xDC }, std::byte { 0xAB },
    std::byte { 0x8C }, std::byte { 0x47 }, std::byte { 0xA9 },
    std::byte { 0xCF }, std::byte { 0x11 }, std::byte { 0x8E },
    std::byte { 0xE4 }, std::byte { 0x00 }, std::byte { 0xC0 },
    std::byte { 0x0C }, std::byte { 0x20 }, std::byte { 0x53 },
    std::byte { 0x65 },
};

/// Converts a canonical ASF GUID to the plain big-endian literal order.
AsfGuid
asf_guid_big_endian(const AsfGuid& canonical) noexcept;

/// True when \p guid equals \p canonical in either byte order.
bool
asf_guid_matches(const AsfGuid& guid, const AsfGuid& canonical) noexcept;

/// Minimum ASF object size (GUID + size field).
inline constexpr uint64_t kAsfObjectHeaderSize = 24;

struct AsfObject final {
    uint64_t offset = 0;
    uint64_t size   = 0;
    AsfGuid guid {};
};

struct AsfHeader final {
    /// Header object size field.
    uint64_t size = 0;
    /// Header object count field.
    uint32_t declared_count = 0;
    /// Reserved bytes between the count and the first child (2 or 4).
    uint8_t reserved_width = 0;
    /// Offset of the first child object.
    uint64_t children_offset = 0;
    std::vector<AsfObject> objects;
};

/**
 * \brief Parses the ASF header object and its children.
 *
 * The reserved-field width is resolved by trial parsing: a width is accepted
 * when the children starting after it tile the header exactly. When both
 * widths qualify, the one whose child count matches the header's declared
 * count wins, then the 2-byte form. When neither qualifies the result is
 * \ref WriteStatus::UnsupportedLayout.
 */
WriteResult
parse_asf_header(std::span<const std::byte> bytes, uint32_t max_blocks,
                 AsfHeader* out) noexcept;

// ISO-BMFF -------------------------------------------------------------------

/// `uuid` user type carrying an XMP packet.
inline constexpr std::array<std::byte, 16> kBmffXmpUuid = {
    std::byte { 0xBE }, std::byte { 0x7A }, std::byte { 0xCF },
    std::byte { 0xCB }, std::byte { 0x97 }, std::byte { 0xA9 },
    std::byte { 0x42 }, std::byte { 0xE8 }, std::byte { 0x9C },
    std::byte { 0x71 }, std::byte { 0x99 }, std::byte { 0x94 },
    std::byte { 0x91 }, std::byte { 0xE3 }, std::byte { 0xAF },
    std::byte { 0xAC },
};

struct BmffAtom final {
    uint64_t offset      = 0;
    uint64_t size        = 0;
    /// 8, 16 for 64-bit sizes, +16 for `uuid` atoms.
    uint64_t header_size = 0;
    uint32_t type        = 0;
    /// Size field was 1 (64-bit size follows the type).
    bool large_size = false;
    /// Size field was 0 (atom extends to the end of its parent).
    bool to_end   = false;
    bool has_uuid = false;
    std::array<std::byte, 16> uuid {};

    uint64_t end() const noexcept { return offset + size; }
    uint64_t payload_offset() const noexcept { return offset + header_size; }
};

/// Parses one atom at \p offset that must end at or before \p parent_end.
bool
parse_bmff_atom(std::span<const std::byte> bytes, uint64_t offset,
                uint64_t parent_end, BmffAtom* out) noexcept;

/**
 * \brief Parses the atoms tiling [\p begin, \p end).
 *
 * A tail shorter than an atom header is tolerated (zero filler); an atom that
 * cannot be parsed is \ref WriteStatus::Malformed.
 */
WriteResult
parse_bmff_children(std::span<const std::byte> bytes, uint64_t begin,
                    uint64_t end, uint32_t max_blocks,
                    std::vector<BmffAtom>* out) noexcept;

// EBML -----------------------------------------------------------------------

inline constexpr uint32_t kEbmlHeaderId = 0x1A45DFA3U;
inline constexpr uint32_t kMkvSegmentId = 0x18538067U;
inline constexpr uint32_t kMkvSeekHeadId = 0x114D9B74U;
inline constexpr uint32_t kMkvCuesId = 0x1C53BB6BU;
inline constexpr uint32_t kMkvClusterId = 0x1F43B675U;
inline constexpr uint32_t kMkvTagsId = 0x1254C367U;
inline constexpr uint32_t kMkvTagId = 0x7373U;
inline constexpr uint32_t kMkvTargetsId = 0x63C0U;
inline constexpr uint32_t kMkvSimpleTagId = 0x67C8U;
inline constexpr uint32_t kMkvTagNameId = 0x45A3U;
inline constexpr uint32_t kMkvTagStringId = 0x4487U;
inline constexpr uint32_t kMkvSeekId = 0x4DBBU;
inline constexpr uint32_t kMkvSeekIdId = 0x53ABU;
inline constexpr uint32_t kMkvSeekPositionId = 0x53ACU;
inline constexpr uint32_t kMkvCuePointId = 0xBBU;
inline constexpr uint32_t kMkvCueTrackPositionsId = 0xB7U;
inline constexpr uint32_t kMkvCueClusterPositionId = 0xF1U;

struct EbmlElement final {
    uint64_t offset = 0;
    uint32_t id     = 0;
    uint8_t id_width   = 0;
    uint64_t size      = 0;
    uint8_t size_width = 0;
    bool unknown_size  = false;
    uint64_t payload_offset = 0;
    /// End of the element; for unknown sizes the parent end passed to the parser.
    uint64_t end = 0;

    uint64_t header_size() const noexcept
    {
        return static_cast<uint64_t>(id_width) + size_width;
    }
};

/**
 * \brief Parses one element header at \p offset inside [.., \p parent_end).
 *
 * A bounded payload running past \p parent_end is
 * \ref WriteStatus::UnsupportedLayout. An unknown size extends to
 * \p parent_end.
 */
WriteResult
parse_ebml_element(std::span<const std::byte> bytes, uint64_t offset,
                   uint64_t parent_end, EbmlElement* out) noexcept;

/// Parses the direct children in [\p begin, \p end). Stops after a child
/// with unknown size.
WriteResult
parse_ebml_children(std::span<const std::byte> bytes, uint64_t begin,
                    uint64_t end, uint32_t max_blocks,
                    std::vector<EbmlElement>* out) noexcept;

}  // namespace metasplice
