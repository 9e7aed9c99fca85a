#include "metasplice/container_layout.h"

#include "metasplice/var_int.h"

#include "byte_io_internal.h"
#include "write_result_internal.h"

namespace metasplice {

using detail::in_bounds;
using detail::match;
using detail::read_u16be;
using detail::read_u24be;
using detail::read_u32be;
using detail::read_u32le;
using detail::read_u64be;
using detail::read_u64le;
using detail::u8;
using detail::write_fail;
using detail::write_ok;

namespace {

    static JpegSegmentKind classify_jpeg_segment(
        std::span<const std::byte> bytes, uint16_t marker,
        uint64_t payload_off, uint64_t payload_size, uint8_t* icc_seq,
        uint8_t* icc_total) noexcept
    {
        if (marker == 0xFFE0) {
            if (payload_size >= 5 && match(bytes, payload_off, "JFIF\0", 5)) {
                return JpegSegmentKind::Jfif;
            }
            return JpegSegmentKind::Other;
        }
        if (marker == 0xFFE1) {
            if (payload_size >= 6 && match(bytes, payload_off, "Exif\0", 5)) {
                return JpegSegmentKind::Exif;
            }
            if (payload_size >= 29
                && match(bytes, payload_off, "http://ns.adobe.com/xap/1.0/\0",
                         29)) {
                return JpegSegmentKind::Xmp;
            }
            if (payload_size >= 35
                && match(bytes, payload_off,
                         "http://ns.adobe.com/xmp/extension/\0", 35)) {
                return JpegSegmentKind::XmpExtended;
            }
            return JpegSegmentKind::Other;
        }
        if (marker == 0xFFE2) {
            if (payload_size >= 14
                && match(bytes, payload_off, "ICC_PROFILE\0", 12)) {
                *icc_seq   = u8(bytes[payload_off + 12]);
                *icc_total = u8(bytes[payload_off + 13]);
                return JpegSegmentKind::Icc;
            }
            if (payload_size >= 4 && match(bytes, payload_off, "AFCP", 4)) {
                return JpegSegmentKind::Afcp;
            }
            return JpegSegmentKind::Other;
        }
        if (marker == 0xFFED) {
            if (payload_size >= 14
                && match(bytes, payload_off, "Photoshop 3.0\0", 14)) {
                return JpegSegmentKind::PhotoshopIrb;
            }
            return JpegSegmentKind::Other;
        }
        if (marker == 0xFFFE) {
            return JpegSegmentKind::Comment;
        }
        return JpegSegmentKind::Other;
    }

}  // namespace

WriteResult
parse_jpeg_layout(std::span<const std::byte> bytes, uint32_t max_blocks,
                  JpegLayout* out) noexcept
{
    constexpr ContainerFormat kFmt = ContainerFormat::Jpeg;
    out->segments.clear();
    out->scan_offset = bytes.size();

    if (bytes.size() < 2 || u8(bytes[0]) != 0xFF || u8(bytes[1]) != 0xD8) {
        return write_fail(kFmt, WriteStatus::FormatError, "missing SOI");
    }

    uint64_t offset = 2;
    while (offset < bytes.size()) {
        if (u8(bytes[offset]) != 0xFF) {
            return write_fail(kFmt, WriteStatus::Malformed,
                              "expected marker", offset);
        }
        const uint64_t prefix_off = offset;
        while (offset < bytes.size() && u8(bytes[offset]) == 0xFF) {
            offset += 1;
        }
        if (offset >= bytes.size()) {
            out->scan_offset = prefix_off;
            break;
        }
        const uint64_t marker_off = offset - 1;
        const uint8_t marker_lo   = u8(bytes[offset]);
        offset += 1;

        const uint16_t marker = static_cast<uint16_t>(
            0xFF00U | static_cast<uint16_t>(marker_lo));

        if (marker == 0xFFD9 || marker == 0xFFDA) {
            out->scan_offset = marker_off;
            break;
        }
        // Stuffed zero, TEM and RSTn carry no length field.
        if (marker_lo == 0x00 || marker == 0xFF01
            || (marker >= 0xFFD0 && marker <= 0xFFD7)) {
            continue;
        }

        uint16_t seg_len = 0;
        if (!read_u16be(bytes, offset, &seg_len)) {
            return write_fail(kFmt, WriteStatus::Malformed,
                              "truncated segment length", offset);
        }
        if (seg_len < 2) {
            return write_fail(kFmt, WriteStatus::Malformed,
                              "segment length below 2", offset, 2, seg_len);
        }
        const uint64_t payload_off  = offset + 2;
        const uint64_t payload_size = static_cast<uint64_t>(seg_len) - 2U;
        if (!in_bounds(bytes, payload_off, payload_size)) {
            return write_fail(kFmt, WriteStatus::Malformed,
                              "segment runs past end of file", marker_off,
                              payload_off + payload_size, bytes.size());
        }
        if (out->segments.size() >= max_blocks) {
            return write_fail(kFmt, WriteStatus::LimitExceeded,
                              "too many segments", marker_off, max_blocks,
                              out->segments.size() + 1U);
        }

        JpegSegment seg;
        seg.offset         = marker_off;
        seg.size           = 2U + static_cast<uint64_t>(seg_len);
        seg.marker         = marker;
        seg.payload_offset = payload_off;
        seg.payload_size   = payload_size;
        seg.kind = classify_jpeg_segment(bytes, marker, payload_off,
                                         payload_size, &seg.icc_seq,
                                         &seg.icc_total);
        out->segments.push_back(seg);
        offset = payload_off + payload_size;
    }
    return write_ok(kFmt);
}


WriteResult
parse_png_layout(std::span<const std::byte> bytes, uint32_t max_blocks,
                 PngLayout* out) noexcept
{
    constexpr ContainerFormat kFmt = ContainerFormat::Png;
    out->chunks.clear();
    out->end = bytes.size();

    if (!detail::match_bytes(bytes, 0, kPngSignature.data(),
                             static_cast<uint32_t>(kPngSignature.size()))) {
        return write_fail(kFmt, WriteStatus::FormatError,
                          "missing PNG signature");
    }

    uint64_t offset = kPngSignature.size();
    while (offset < bytes.size()) {
        PngChunk chunk;
        chunk.offset = offset;
        if (!read_u32be(bytes, offset, &chunk.length)
            || !read_u32be(bytes, offset + 4, &chunk.type)) {
            return write_fail(kFmt, WriteStatus::Malformed,
                              "truncated chunk header", offset);
        }
        if (chunk.length > 0x7FFFFFFFU) {
            return write_fail(kFmt, WriteStatus::Malformed,
                              "chunk length above 2^31-1", offset,
                              0x7FFFFFFFU, chunk.length);
        }
        if (!in_bounds(bytes, offset, chunk.total_size())) {
            return write_fail(kFmt, WriteStatus::Malformed,
                              "chunk runs past end of file", offset,
                              offset + chunk.total_size(), bytes.size());
        }
        if (out->chunks.size() >= max_blocks) {
            return write_fail(kFmt, WriteStatus::LimitExceeded,
                              "too many chunks", offset);
        }
        out->chunks.push_back(chunk);
        offset += chunk.total_size();
        if (chunk.type == fourcc('I', 'E', 'N', 'D')) {
            out->end = offset;
            break;
        }
    }
    return write_ok(kFmt);
}


WriteResult
parse_riff_layout(std::span<const std::byte> bytes, uint32_t max_blocks,
                  RiffLayout* out) noexcept
{
    constexpr ContainerFormat kFmt = ContainerFormat::Riff;
    out->chunks.clear();

    if (bytes.size() < 12 || !match(bytes, 0, "RIFF", 4)) {
        return write_fail(kFmt, WriteStatus::FormatError,
                          "missing RIFF signature");
    }
    (void)read_u32le(bytes, 4, &out->declared_size);
    (void)read_u32be(bytes, 8, &out->form);
    out->end = 8U + static_cast<uint64_t>(out->declared_size);
    if (out->declared_size < 4U || out->end > bytes.size()) {
        return write_fail(kFmt, WriteStatus::Malformed,
                          "RIFF size runs past end of file", 4, bytes.size(),
                          out->end);
    }

    uint64_t offset = 12;
    while (offset + 8U <= out->end) {
        RiffChunk chunk;
        chunk.offset = offset;
        (void)read_u32be(bytes, offset, &chunk.id);
        (void)read_u32le(bytes, offset + 4, &chunk.data_size);
        const uint64_t data_end = offset + 8U
                                  + static_cast<uint64_t>(chunk.data_size);
        if (data_end > out->end) {
            return write_fail(kFmt, WriteStatus::Malformed,
                              "chunk runs past RIFF end", offset, out->end,
                              data_end);
        }
        uint64_t pad = chunk.data_size & 1U;
        if (data_end + pad > out->end) {
            // Final odd chunk written without its pad byte.
            pad = 0;
        }
        chunk.size = data_end + pad - offset;
        if (chunk.id == fourcc('L', 'I', 'S', 'T') && chunk.data_size >= 4U) {
            (void)read_u32be(bytes, offset + 8, &chunk.list_type);
        }
        if (out->chunks.size() >= max_blocks) {
            return write_fail(kFmt, WriteStatus::LimitExceeded,
                              "too many chunks", offset);
        }
        out->chunks.push_back(chunk);
        offset += chunk.size;
    }
    return write_ok(kFmt);
}


WriteResult
parse_ogg_page(std::span<const std::byte> bytes, uint64_t offset,
               OggPage* out) noexcept
{
    constexpr ContainerFormat kFmt = ContainerFormat::Ogg;
    if (!match(bytes, offset, "OggS", 4)) {
        return write_fail(kFmt, WriteStatus::FormatError,
                          "missing OggS capture pattern", offset);
    }
    if (!in_bounds(bytes, offset, kOggPageHeaderSize)) {
        return write_fail(kFmt, WriteStatus::Malformed,
                          "truncated page header", offset,
                          kOggPageHeaderSize, bytes.size() - offset);
    }
    if (u8(bytes[offset + 4]) != 0) {
        return write_fail(kFmt, WriteStatus::FormatError,
                          "unknown page version", offset + 4, 0,
                          u8(bytes[offset + 4]));
    }

    OggPage page;
    page.offset        = offset;
    page.header_type   = u8(bytes[offset + 5]);
    (void)read_u64le(bytes, offset + 6, &page.granule);
    (void)read_u32le(bytes, offset + 14, &page.serial);
    (void)read_u32le(bytes, offset + 18, &page.sequence);
    (void)read_u32le(bytes, offset + kOggCrcOffset, &page.crc);
    page.segment_count = u8(bytes[offset + 26]);

    const uint64_t lacing_off = offset + kOggPageHeaderSize;
    if (!in_bounds(bytes, lacing_off, page.segment_count)) {
        return write_fail(kFmt, WriteStatus::Malformed,
                          "truncated lacing table", lacing_off);
    }
    uint64_t payload = 0;
    for (uint32_t i = 0; i < page.segment_count; ++i) {
        payload += u8(bytes[lacing_off + i]);
    }
    page.payload_offset = lacing_off + page.segment_count;
    page.payload_size   = payload;
    if (!in_bounds(bytes, page.payload_offset, payload)) {
        return write_fail(kFmt, WriteStatus::Malformed,
                          "page payload runs past end of file", offset,
                          page.payload_offset + payload, bytes.size());
    }
    page.size = page.payload_offset + payload - offset;
    *out      = page;
    return write_ok(kFmt);
}


WriteResult
parse_ogg_pages(std::span<const std::byte> bytes, uint32_t max_blocks,
                std::vector<OggPage>* out) noexcept
{
    out->clear();
    uint64_t offset = 0;
    while (offset < bytes.size()) {
        OggPage page;
        const WriteResult r = parse_ogg_page(bytes, offset, &page);
        if (r.status == WriteStatus::FormatError && !out->empty()) {
            // Data after the last page is outside Ogg framing.
            break;
        }
        if (r.status != WriteStatus::Ok) {
            return r;
        }
        if (out->size() >= max_blocks) {
            return write_fail(ContainerFormat::Ogg,
                              WriteStatus::LimitExceeded, "too many pages",
                              offset);
        }
        out->push_back(page);
        offset += page.size;
    }
    return write_ok(ContainerFormat::Ogg);
}


std::span<const uint8_t>
ogg_page_lacing(std::span<const std::byte> bytes,
                const OggPage& page) noexcept
{
    const uint64_t off = page.offset + kOggPageHeaderSize;
    if (!in_bounds(bytes, off, page.segment_count)) {
        return {};
    }
    return std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(bytes.data() + off),
        page.segment_count);
}


WriteResult
parse_flac_layout(std::span<const std::byte> bytes, uint32_t max_blocks,
                  FlacLayout* out) noexcept
{
    constexpr ContainerFormat kFmt = ContainerFormat::Flac;
    out->blocks.clear();

    uint64_t offset = 0;
    if (match(bytes, 0, "ID3", 3)) {
        Id3Tag tag;
        const WriteResult r = parse_id3_tag(bytes, 0, max_blocks, &tag);
        if (r.status != WriteStatus::Ok) {
            return write_fail(kFmt, r.status, r.what, r.offset, r.expected,
                              r.found);
        }
        offset = tag.size;
    }
    if (!match(bytes, offset, "fLaC", 4)) {
        return write_fail(kFmt, WriteStatus::FormatError,
                          "missing fLaC signature", offset);
    }
    out->signature_offset = offset;
    offset += 4;

    for (;;) {
        if (!in_bounds(bytes, offset, 4)) {
            return write_fail(kFmt, WriteStatus::Malformed,
                              "metadata ends without last-block flag",
                              offset);
        }
        FlacBlock block;
        block.offset = offset;
        block.last   = (u8(bytes[offset]) & 0x80U) != 0U;
        block.type   = static_cast<uint8_t>(u8(bytes[offset]) & 0x7FU);
        (void)read_u24be(bytes, offset + 1, &block.length);
        if (!in_bounds(bytes, offset, block.total_size())) {
            return write_fail(kFmt, WriteStatus::Malformed,
                              "metadata block runs past end of file", offset,
                              offset + block.total_size(), bytes.size());
        }
        if (out->blocks.size() >= max_blocks) {
            return write_fail(kFmt, WriteStatus::LimitExceeded,
                              "too many metadata blocks", offset);
        }
        out->blocks.push_back(block);
        offset += block.total_size();
        if (block.last) {
            break;
        }
    }
    out->audio_offset = offset;
    return write_ok(kFmt);
}


WriteResult
parse_id3_tag(std::span<const std::byte> bytes, uint64_t offset,
              uint32_t max_blocks, Id3Tag* out) noexcept
{
    constexpr ContainerFormat kFmt = ContainerFormat::Mp3;
    out->frames.clear();

    if (!match(bytes, offset, "ID3", 3)) {
        return write_fail(kFmt, WriteStatus::FormatError, "missing ID3 tag",
                          offset);
    }
    if (!in_bounds(bytes, offset, 10)) {
        return write_fail(kFmt, WriteStatus::Malformed,
                          "truncated ID3 header", offset);
    }
    out->major    = u8(bytes[offset + 3]);
    out->revision = u8(bytes[offset + 4]);
    out->flags    = u8(bytes[offset + 5]);
    uint32_t body = 0;
    if (!read_synchsafe32(bytes, offset + 6, &body)) {
        return write_fail(kFmt, WriteStatus::Malformed,
                          "ID3 size is not synchsafe", offset + 6);
    }
    const bool footer = out->major == 4 && (out->flags & 0x10U) != 0U;
    out->size = 10U + static_cast<uint64_t>(body) + (footer ? 10U : 0U);
    if (!in_bounds(bytes, offset, out->size)) {
        return write_fail(kFmt, WriteStatus::Malformed,
                          "ID3 tag runs past end of file", offset,
                          offset + out->size, bytes.size());
    }

    if ((out->major != 3 && out->major != 4) || out->unsynchronised()
        || out->has_extended_header()) {
        return write_ok(kFmt);
    }

    const uint64_t end = offset + 10U + body;
    uint64_t pos       = offset + 10U;
    while (pos + 10U <= end) {
        if (u8(bytes[pos]) == 0) {
            break;  // padding
        }
        Id3Frame frame;
        frame.offset = pos;
        (void)read_u32be(bytes, pos, &frame.id);
        if (out->major == 4) {
            if (!read_synchsafe32(bytes, pos + 4, &frame.payload_size)) {
                return write_fail(kFmt, WriteStatus::Malformed,
                                  "frame size is not synchsafe", pos + 4);
            }
        } else {
            (void)read_u32be(bytes, pos + 4, &frame.payload_size);
        }
        (void)read_u16be(bytes, pos + 8, &frame.flags);
        frame.payload_offset = pos + 10U;
        frame.size = 10U + static_cast<uint64_t>(frame.payload_size);
        if (frame.size > end - pos) {
            return write_fail(kFmt, WriteStatus::Malformed,
                              "frame runs past tag end", pos, end,
                              pos + frame.size);
        }
        if (out->frames.size() >= max_blocks) {
            return write_fail(kFmt, WriteStatus::LimitExceeded,
                              "too many frames", pos);
        }
        out->frames.push_back(frame);
        pos += frame.size;
    }
    return write_ok(kFmt);
}


AsfGuid
asf_guid_big_endian(const AsfGuid& canonical) noexcept
{
    AsfGuid out = canonical;
    out[0]      = canonical[3];
    out[1]      = canonical[2];
    out[2]      = canonical[1];
    out[3]      = canonical[0];
    out[4]      = canonical[5];
    out[5]      = canonical[4];
    out[6]      = canonical[7];
    out[7]      = canonical[6];
    return out;
}


bool
asf_guid_matches(const AsfGuid& guid, const AsfGuid& canonical) noexcept
{
    return guid == canonical || guid == asf_guid_big_endian(canonical);
}

namespace {

    static AsfGuid read_guid(std::span<const std::byte> bytes,
                             uint64_t offset) noexcept
    {
        AsfGuid g {};
        for (uint32_t i = 0; i < 16; ++i) {
            g[i] = bytes[offset + i];
        }
        return g;
    }


    // Children must tile [first, header_end) exactly.
    static bool asf_trial_children(std::span<const std::byte> bytes,
                                   uint64_t first, uint64_t header_end,
                                   uint32_t max_blocks,
                                   std::vector<AsfObject>* out) noexcept
    {
        out->clear();
        uint64_t pos = first;
        if (pos > header_end) {
            return false;
        }
        while (pos < header_end) {
            if (header_end - pos < kAsfObjectHeaderSize) {
                return false;
            }
            uint64_t size = 0;
            (void)read_u64le(bytes, pos + 16, &size);
            if (size < kAsfObjectHeaderSize || size > header_end - pos) {
                return false;
            }
            if (out->size() >= max_blocks) {
                return false;
            }
            AsfObject obj;
            obj.offset = pos;
            obj.size   = size;
            obj.guid   = read_guid(bytes, pos);
            out->push_back(obj);
            pos += size;
        }
        return true;
    }

}  // namespace

WriteResult
parse_asf_header(std::span<const std::byte> bytes, uint32_t max_blocks,
                 AsfHeader* out) noexcept
{
    constexpr ContainerFormat kFmt = ContainerFormat::Asf;
    out->objects.clear();

    if (bytes.size() < 30
        || !asf_guid_matches(read_guid(bytes, 0), kAsfHeaderObject)) {
        return write_fail(kFmt, WriteStatus::FormatError,
                          "missing ASF header object");
    }
    (void)read_u64le(bytes, 16, &out->size);
    (void)read_u32le(bytes, 24, &out->declared_count);
    if (out->size < 30U || out->size > bytes.size()) {
        return write_fail(kFmt, WriteStatus::Malformed,
                          "header object size out of range", 16,
                          bytes.size(), out->size);
    }

    std::vector<AsfObject> two;
    std::vector<AsfObject> four;
    const bool ok2 = asf_trial_children(bytes, 30, out->size, max_blocks,
                                        &two);
    const bool ok4 = asf_trial_children(bytes, 32, out->size, max_blocks,
                                        &four);

    uint8_t width = 0;
    if (ok2 && ok4) {
        const bool count2 = two.size() == out->declared_count;
        const bool count4 = four.size() == out->declared_count;
        width             = (count4 && !count2) ? 4 : 2;
    } else if (ok2) {
        width = 2;
    } else if (ok4) {
        width = 4;
    } else {
        return write_fail(kFmt, WriteStatus::UnsupportedLayout,
                          "header children do not parse at reserved width 2 "
                          "or 4",
                          28, out->size, 0);
    }

    out->reserved_width  = width;
    out->children_offset = 28U + width;
    out->objects         = (width == 2) ? std::move(two) : std::move(four);
    return write_ok(kFmt);
}


bool
parse_bmff_atom(std::span<const std::byte> bytes, uint64_t offset,
                uint64_t parent_end, BmffAtom* out) noexcept
{
    if (parent_end > bytes.size() || offset > parent_end
        || parent_end - offset < 8U) {
        return false;
    }
    uint32_t size32 = 0;
    uint32_t type   = 0;
    (void)read_u32be(bytes, offset + 0, &size32);
    (void)read_u32be(bytes, offset + 4, &type);

    BmffAtom atom;
    atom.offset      = offset;
    atom.type        = type;
    atom.header_size = 8;
    atom.size        = size32;
    if (size32 == 1) {
        uint64_t size64 = 0;
        if (parent_end - offset < 16U
            || !read_u64be(bytes, offset + 8, &size64)) {
            return false;
        }
        atom.header_size = 16;
        atom.size        = size64;
        atom.large_size  = true;
    } else if (size32 == 0) {
        atom.size   = parent_end - offset;
        atom.to_end = true;
    }

    if (atom.size < atom.header_size || atom.size > parent_end - offset) {
        return false;
    }

    if (type == fourcc('u', 'u', 'i', 'd')) {
        if (atom.header_size + 16U > atom.size) {
            return false;
        }
        const uint64_t uuid_off = offset + atom.header_size;
        for (uint32_t i = 0; i < 16; ++i) {
            atom.uuid[i] = bytes[uuid_off + i];
        }
        atom.has_uuid = true;
        atom.header_size += 16U;
    }
    *out = atom;
    return true;
}


WriteResult
parse_bmff_children(std::span<const std::byte> bytes, uint64_t begin,
                    uint64_t end, uint32_t max_blocks,
                    std::vector<BmffAtom>* out) noexcept
{
    constexpr ContainerFormat kFmt = ContainerFormat::Bmff;
    out->clear();
    uint64_t pos = begin;
    while (pos < end) {
        if (end - pos < 8U) {
            break;
        }
        BmffAtom atom;
        if (!parse_bmff_atom(bytes, pos, end, &atom)) {
            return write_fail(kFmt, WriteStatus::Malformed,
                              "atom runs past its parent", pos, end);
        }
        if (out->size() >= max_blocks) {
            return write_fail(kFmt, WriteStatus::LimitExceeded,
                              "too many atoms", pos);
        }
        out->push_back(atom);
        pos = atom.end();
    }
    return write_ok(kFmt);
}


WriteResult
parse_ebml_element(std::span<const std::byte> bytes, uint64_t offset,
                   uint64_t parent_end, EbmlElement* out) noexcept
{
    constexpr ContainerFormat kFmt = ContainerFormat::Matroska;
    const std::span<const std::byte> view
        = bytes.first(static_cast<size_t>(
            parent_end < bytes.size() ? parent_end : bytes.size()));

    EbmlVint id;
    if (!read_ebml_id(view, offset, &id)) {
        return write_fail(kFmt, WriteStatus::UnsupportedLayout,
                          "invalid element ID", offset);
    }
    EbmlVint size;
    if (!read_ebml_size(view, offset + id.width, &size)) {
        return write_fail(kFmt, WriteStatus::UnsupportedLayout,
                          "invalid element size", offset + id.width);
    }

    EbmlElement e;
    e.offset         = offset;
    e.id             = static_cast<uint32_t>(id.value);
    e.id_width       = id.width;
    e.size_width     = size.width;
    e.unknown_size   = size.unknown;
    e.payload_offset = offset + id.width + size.width;
    const uint64_t room = view.size() - e.payload_offset;
    if (size.unknown) {
        e.size = room;
    } else {
        if (size.value > room) {
            return write_fail(kFmt, WriteStatus::UnsupportedLayout,
                              "element size runs past its parent", offset,
                              room, size.value);
        }
        e.size = size.value;
    }
    e.end = e.payload_offset + e.size;
    *out  = e;
    return write_ok(kFmt);
}


WriteResult
parse_ebml_children(std::span<const std::byte> bytes, uint64_t begin,
                    uint64_t end, uint32_t max_blocks,
                    std::vector<EbmlElement>* out) noexcept
{
    out->clear();
    uint64_t pos = begin;
    while (pos < end) {
        EbmlElement e;
        const WriteResult r = parse_ebml_element(bytes, pos, end, &e);
        if (r.status != WriteStatus::Ok) {
            return r;
        }
        if (out->size() >= max_blocks) {
            return write_fail(ContainerFormat::Matroska,
                              WriteStatus::LimitExceeded, "too many elements",
                              pos);
        }
        out->push_back(e);
        if (e.unknown_size) {
            break;
        }
        pos = e.end;
    }
    return write_ok(ContainerFormat::Matroska);
}

}  // namespace metasplice
