#include "metasplice/block_build.h"

#include "byte_io_internal.h"
#include "metasplice/container_layout.h"
#include "metasplice/var_int.h"
#include "text_encode_internal.h"

#include <algorithm>

#if defined(METASPLICE_HAS_ZLIB) && METASPLICE_HAS_ZLIB
#    include <zlib.h>
#endif

namespace metasplice {
namespace {

    using detail::append_fourcc;
    using detail::append_span;
    using detail::append_text;
    using detail::append_u16be;
    using detail::append_u16le;
    using detail::append_u32be;
    using detail::append_u32le;
    using detail::append_u64be;
    using detail::append_u64le;
    using detail::append_u8;

    static constexpr uint64_t kU16Max = 0xFFFFU;
    static constexpr uint64_t kU32Max = 0xFFFFFFFFU;

    static void append_guid(std::vector<std::byte>* out, const AsfGuid& g)
    {
        out->insert(out->end(), g.begin(), g.end());
    }


    // UTF-16LE with a 2-byte terminator.
    static std::vector<std::byte> utf16le_z(std::string_view utf8)
    {
        std::vector<std::byte> v;
        detail::append_utf16le(utf8, &v);
        append_u16le(&v, 0);
        return v;
    }


    static void append_ebml_element(uint32_t id,
                                    std::span<const std::byte> payload,
                                    std::vector<std::byte>* out)
    {
        append_ebml_id(id, out);
        (void)append_ebml_size(payload.size(), out);
        append_span(out, payload);
    }

}  // namespace

// ID3v2 ----------------------------------------------------------------------

WriteStatus
build_id3_text_frame(uint8_t major, uint32_t frame_id, std::string_view utf8,
                     std::vector<std::byte>* out)
{
    if (major != 3U && major != 4U) {
        return WriteStatus::Unsupported;
    }
    std::vector<std::byte> body;
    std::string latin1;
    if (detail::latin1_from_utf8(utf8, &latin1)) {
        append_u8(&body, 0);
        append_text(&body, latin1);
        append_u8(&body, 0);
    } else if (major == 3U) {
        append_u8(&body, 1);
        append_u8(&body, 0xFF);
        append_u8(&body, 0xFE);
        detail::append_utf16le(utf8, &body);
        append_u16le(&body, 0);
    } else {
        append_u8(&body, 3);
        append_text(&body, utf8);
        append_u8(&body, 0);
    }

    if (body.size() > kSynchsafeMax) {
        return WriteStatus::StructuralLimit;
    }
    const uint32_t size = static_cast<uint32_t>(body.size());
    append_fourcc(out, frame_id);
    if (major == 4U) {
        (void)append_synchsafe32(size, out);
    } else {
        append_u32be(out, size);
    }
    append_u16be(out, 0);
    append_span(out, body);
    return WriteStatus::Ok;
}


WriteStatus
build_id3_header(uint8_t major, uint32_t body_size,
                 std::vector<std::byte>* out)
{
    if (body_size > kSynchsafeMax) {
        return WriteStatus::StructuralLimit;
    }
    append_text(out, "ID3");
    append_u8(out, major);
    append_u8(out, 0);
    append_u8(out, 0);
    (void)append_synchsafe32(body_size, out);
    return WriteStatus::Ok;
}

// RIFF -----------------------------------------------------------------------

WriteStatus
build_riff_info_list(std::span<const RiffInfoEntry> entries,
                     std::vector<std::byte>* out)
{
    std::vector<std::byte> body;
    append_fourcc(&body, fourcc('I', 'N', 'F', 'O'));
    for (const RiffInfoEntry& e : entries) {
        const uint64_t data_size = static_cast<uint64_t>(e.text.size()) + 1U;
        if (data_size > kU32Max) {
            return WriteStatus::StructuralLimit;
        }
        append_fourcc(&body, e.id);
        append_u32le(&body, static_cast<uint32_t>(data_size));
        append_text(&body, e.text);
        append_u8(&body, 0);
        if ((data_size & 1U) != 0U) {
            append_u8(&body, 0);
        }
    }
    if (body.size() > kU32Max) {
        return WriteStatus::StructuralLimit;
    }
    append_fourcc(out, fourcc('L', 'I', 'S', 'T'));
    append_u32le(out, static_cast<uint32_t>(body.size()));
    append_span(out, body);
    return WriteStatus::Ok;
}

// Vorbis comments -------------------------------------------------------------

WriteStatus
build_vorbis_comments(const VorbisComments& comments,
                      VorbisCommentFraming framing,
                      std::vector<std::byte>* out)
{
    if (comments.vendor.size() > kU32Max || comments.fields.size() > kU32Max) {
        return WriteStatus::StructuralLimit;
    }
    for (const VorbisCommentField& f : comments.fields) {
        if (f.name.size() + 1U + f.value.size() > kU32Max) {
            return WriteStatus::StructuralLimit;
        }
    }

    switch (framing) {
    case VorbisCommentFraming::FlacBlock: break;
    case VorbisCommentFraming::VorbisPacket:
        append_u8(out, 0x03);
        append_text(out, "vorbis");
        break;
    case VorbisCommentFraming::OpusPacket: append_text(out, "OpusTags"); break;
    }

    append_u32le(out, static_cast<uint32_t>(comments.vendor.size()));
    append_text(out, comments.vendor);
    append_u32le(out, static_cast<uint32_t>(comments.fields.size()));
    for (const VorbisCommentField& f : comments.fields) {
        const size_t len = f.name.size() + 1U + f.value.size();
        append_u32le(out, static_cast<uint32_t>(len));
        append_text(out, f.name);
        append_u8(out, '=');
        append_text(out, f.value);
    }
    if (framing == VorbisCommentFraming::VorbisPacket) {
        append_u8(out, 0x01);
    }
    return WriteStatus::Ok;
}

// ASF ------------------------------------------------------------------------

AsfDescriptor
make_asf_string_descriptor(std::string_view name, std::string_view utf8)
{
    AsfDescriptor d;
    d.name  = std::string(name);
    d.type  = static_cast<uint16_t>(AsfValueType::String);
    d.value = utf16le_z(utf8);
    return d;
}


WriteStatus
build_asf_content_description(const AsfContentDescription& cd,
                              std::vector<std::byte>* out)
{
    const std::vector<std::byte> parts[5] = {
        utf16le_z(cd.title),       utf16le_z(cd.author),
        utf16le_z(cd.copyright),   utf16le_z(cd.description),
        utf16le_z(cd.rating),
    };
    uint64_t payload = 0;
    for (const std::vector<std::byte>& p : parts) {
        if (p.size() > kU16Max) {
            return WriteStatus::StructuralLimit;
        }
        payload += 2U + p.size();
    }
    append_guid(out, kAsfContentDescription);
    append_u64le(out, kAsfObjectHeaderSize + payload);
    for (const std::vector<std::byte>& p : parts) {
        append_u16le(out, static_cast<uint16_t>(p.size()));
    }
    for (const std::vector<std::byte>& p : parts) {
        append_span(out, p);
    }
    return WriteStatus::Ok;
}


WriteStatus
build_asf_extended_content_description(
    std::span<const AsfDescriptor> descriptors, std::vector<std::byte>* out)
{
    if (descriptors.size() > kU16Max) {
        return WriteStatus::StructuralLimit;
    }
    std::vector<std::byte> body;
    append_u16le(&body, static_cast<uint16_t>(descriptors.size()));
    for (const AsfDescriptor& d : descriptors) {
        const std::vector<std::byte> name = utf16le_z(d.name);
        if (name.size() > kU16Max || d.value.size() > kU16Max) {
            return WriteStatus::StructuralLimit;
        }
        append_u16le(&body, static_cast<uint16_t>(name.size()));
        append_span(&body, name);
        append_u16le(&body, d.type);
        append_u16le(&body, static_cast<uint16_t>(d.value.size()));
        append_span(&body, d.value);
    }
    append_guid(out, kAsfExtendedContentDescription);
    append_u64le(out, kAsfObjectHeaderSize + body.size());
    append_span(out, body);
    return WriteStatus::Ok;
}

// ISO-BMFF -------------------------------------------------------------------

void
append_bmff_atom(uint32_t type, std::span<const std::byte> payload,
                 std::vector<std::byte>* out)
{
    const uint64_t small = 8U + static_cast<uint64_t>(payload.size());
    if (small <= kU32Max) {
        append_u32be(out, static_cast<uint32_t>(small));
        append_fourcc(out, type);
    } else {
        append_u32be(out, 1);
        append_fourcc(out, type);
        append_u64be(out, small + 8U);
    }
    append_span(out, payload);
}


void
build_bmff_ilst_item(uint32_t type, std::string_view utf8,
                     std::vector<std::byte>* out)
{
    std::vector<std::byte> data;
    append_u32be(&data, 1);  // well-known type: UTF-8
    append_u32be(&data, 0);  // locale
    append_text(&data, utf8);

    std::vector<std::byte> item;
    append_bmff_atom(fourcc('d', 'a', 't', 'a'), data, &item);
    append_bmff_atom(type, item, out);
}


void
build_bmff_meta(std::span<const BmffTextItem> items, uint32_t handler_type,
                std::span<const std::byte> kept_items,
                std::vector<std::byte>* out)
{
    std::vector<std::byte> hdlr;
    append_u32be(&hdlr, 0);  // version + flags
    append_u32be(&hdlr, 0);  // pre_defined
    append_fourcc(&hdlr, handler_type);
    append_u32be(&hdlr, 0);
    append_u32be(&hdlr, 0);
    append_u32be(&hdlr, 0);
    append_u8(&hdlr, 0);  // empty name

    std::vector<std::byte> ilst;
    append_span(&ilst, kept_items);
    for (const BmffTextItem& it : items) {
        build_bmff_ilst_item(it.type, it.value, &ilst);
    }

    std::vector<std::byte> meta;
    append_u32be(&meta, 0);
    append_bmff_atom(fourcc('h', 'd', 'l', 'r'), hdlr, &meta);
    append_bmff_atom(fourcc('i', 'l', 's', 't'), ilst, &meta);
    append_bmff_atom(fourcc('m', 'e', 't', 'a'), meta, out);
}


void
build_bmff_padding(uint64_t used, uint32_t alignment,
                   std::vector<std::byte>* out)
{
    if (alignment == 0U) {
        return;
    }
    uint64_t gap = (alignment - (used % alignment)) % alignment;
    if (gap == 0U) {
        return;
    }
    while (gap < 8U) {
        gap += alignment;
    }
    const std::vector<std::byte> zeros(static_cast<size_t>(gap - 8U),
                                       std::byte { 0 });
    append_bmff_atom(fourcc('f', 'r', 'e', 'e'), zeros, out);
}


void
build_bmff_xmp_uuid(std::span<const std::byte> packet,
                    std::vector<std::byte>* out)
{
    std::vector<std::byte> payload;
    payload.reserve(16U + packet.size());
    payload.insert(payload.end(), kBmffXmpUuid.begin(), kBmffXmpUuid.end());
    append_span(&payload, packet);
    append_bmff_atom(fourcc('u', 'u', 'i', 'd'), payload, out);
}

// Matroska -------------------------------------------------------------------

WriteStatus
build_mkv_tags(std::span<const MkvSimpleTag> tags,
               std::vector<std::byte>* out)
{
    std::vector<std::byte> tag;
    append_ebml_element(kMkvTargetsId, {}, &tag);
    for (const MkvSimpleTag& t : tags) {
        std::vector<std::byte> simple;
        append_ebml_element(kMkvTagNameId, detail::as_bytes(t.name), &simple);
        append_ebml_element(kMkvTagStringId, detail::as_bytes(t.value),
                            &simple);
        append_ebml_element(kMkvSimpleTagId, simple, &tag);
    }
    if (ebml_size_min_width(tag.size()) == 0U) {
        return WriteStatus::StructuralLimit;
    }
    std::vector<std::byte> body;
    append_ebml_element(kMkvTagId, tag, &body);
    if (ebml_size_min_width(body.size()) == 0U) {
        return WriteStatus::StructuralLimit;
    }
    append_ebml_element(kMkvTagsId, body, out);
    return WriteStatus::Ok;
}

// JPEG -----------------------------------------------------------------------

WriteStatus
build_jpeg_segment(uint16_t marker, std::span<const std::byte> payload,
                   std::vector<std::byte>* out)
{
    if (payload.size() > kJpegMaxSegmentPayload) {
        return WriteStatus::StructuralLimit;
    }
    append_u16be(out, marker);
    append_u16be(out, static_cast<uint16_t>(payload.size() + 2U));
    append_span(out, payload);
    return WriteStatus::Ok;
}


WriteStatus
build_jpeg_xmp_segment(std::span<const std::byte> packet,
                       std::vector<std::byte>* out)
{
    std::vector<std::byte> payload;
    append_text(&payload, "http://ns.adobe.com/xap/1.0/");
    append_u8(&payload, 0);
    append_span(&payload, packet);
    return build_jpeg_segment(0xFFE1, payload, out);
}


WriteStatus
build_jpeg_icc_segments(std::span<const std::byte> profile,
                        std::vector<std::byte>* out, uint32_t chunk_size)
{
    if (chunk_size == 0U) {
        chunk_size = 65504U;
    }
    chunk_size = std::min(chunk_size, kJpegIccChunkMax);
    const uint64_t total = profile.empty()
                               ? 1U
                               : (profile.size() + chunk_size - 1U)
                                     / chunk_size;
    if (total > 255U) {
        return WriteStatus::StructuralLimit;
    }

    std::vector<std::byte> run;
    for (uint64_t i = 0; i < total; ++i) {
        const size_t begin = static_cast<size_t>(i * chunk_size);
        const size_t len   = std::min<size_t>(chunk_size,
                                              profile.size() - begin);
        std::vector<std::byte> payload;
        payload.reserve(14U + len);
        append_text(&payload, "ICC_PROFILE");
        append_u8(&payload, 0);
        append_u8(&payload, static_cast<uint8_t>(i + 1U));
        append_u8(&payload, static_cast<uint8_t>(total));
        append_span(&payload, profile.subspan(begin, len));
        const WriteStatus st = build_jpeg_segment(0xFFE2, payload, &run);
        if (st != WriteStatus::Ok) {
            return st;
        }
    }
    append_span(out, run);
    return WriteStatus::Ok;
}


WriteStatus
build_jpeg_irb_segment(std::span<const IrbResource> resources,
                       std::vector<std::byte>* out)
{
    std::vector<std::byte> payload;
    append_text(&payload, "Photoshop 3.0");
    append_u8(&payload, 0);
    for (const IrbResource& r : resources) {
        if (r.data.size() > kU32Max) {
            return WriteStatus::StructuralLimit;
        }
        append_text(&payload, "8BIM");
        append_u16be(&payload, r.id);
        append_u16be(&payload, 0);  // empty Pascal name, padded to even
        append_u32be(&payload, static_cast<uint32_t>(r.data.size()));
        append_span(&payload, r.data);
        if ((r.data.size() & 1U) != 0U) {
            append_u8(&payload, 0);
        }
    }
    return build_jpeg_segment(0xFFED, payload, out);
}


WriteStatus
build_jpeg_afcp_segment(std::span<const AfcpField> fields,
                        std::vector<std::byte>* out)
{
    std::vector<std::byte> payload;
    append_text(&payload, "AFCP");
    append_u32be(&payload, 0);
    for (const AfcpField& f : fields) {
        if (f.key.size() > kU16Max || f.value.size() > kU32Max) {
            return WriteStatus::StructuralLimit;
        }
        append_u16be(&payload, static_cast<uint16_t>(f.key.size()));
        append_text(&payload, f.key);
        append_u32be(&payload, static_cast<uint32_t>(f.value.size()));
        append_text(&payload, f.value);
    }
    return build_jpeg_segment(0xFFE2, payload, out);
}


WriteStatus
build_jpeg_jfif_segment(const JfifInfo& info, std::vector<std::byte>* out)
{
    std::vector<std::byte> payload;
    append_text(&payload, "JFIF");
    append_u8(&payload, 0);
    append_u8(&payload, info.version_major);
    append_u8(&payload, info.version_minor);
    append_u8(&payload, info.units);
    append_u16be(&payload, info.x_density);
    append_u16be(&payload, info.y_density);
    append_u8(&payload, 0);
    append_u8(&payload, 0);
    return build_jpeg_segment(0xFFE0, payload, out);
}

// PNG ------------------------------------------------------------------------

WriteStatus
build_png_chunk(uint32_t type, std::span<const std::byte> data,
                std::vector<std::byte>* out)
{
#if defined(METASPLICE_HAS_ZLIB) && METASPLICE_HAS_ZLIB
    if (data.size() > 0x7FFFFFFFU) {
        return WriteStatus::StructuralLimit;
    }
    const size_t start = out->size();
    append_u32be(out, static_cast<uint32_t>(data.size()));
    append_fourcc(out, type);
    append_span(out, data);

    uLong crc = crc32(0L, Z_NULL, 0);
    const size_t crc_len = 4U + data.size();
    crc = crc32(crc, reinterpret_cast<const Bytef*>(out->data() + start + 4U),
                static_cast<uInt>(crc_len));
    append_u32be(out, static_cast<uint32_t>(crc));
    return WriteStatus::Ok;
#else
    (void)type;
    (void)data;
    (void)out;
    return WriteStatus::Unsupported;
#endif
}


WriteStatus
build_png_text_chunk(std::string_view keyword, std::string_view latin1,
                     std::vector<std::byte>* out)
{
    if (keyword.empty() || keyword.size() > 79U) {
        return WriteStatus::StructuralLimit;
    }
    std::vector<std::byte> data;
    append_text(&data, keyword);
    append_u8(&data, 0);
    append_text(&data, latin1);
    return build_png_chunk(fourcc('t', 'E', 'X', 't'), data, out);
}


WriteStatus
build_png_itxt_chunk(std::string_view keyword, std::string_view utf8,
                     std::vector<std::byte>* out)
{
    if (keyword.empty() || keyword.size() > 79U) {
        return WriteStatus::StructuralLimit;
    }
    std::vector<std::byte> data;
    append_text(&data, keyword);
    append_u8(&data, 0);
    append_u8(&data, 0);  // compression flag
    append_u8(&data, 0);  // compression method
    append_u8(&data, 0);  // language tag
    append_u8(&data, 0);  // translated keyword
    append_text(&data, utf8);
    return build_png_chunk(fourcc('i', 'T', 'X', 't'), data, out);
}

}  // namespace metasplice
