#include "metasplice/block_fields.h"

#include "byte_io_internal.h"
#include "metasplice/container_layout.h"
#include "text_encode_internal.h"

#include <string>
#include <utility>

namespace metasplice {
namespace {

    using detail::in_bounds;
    using detail::read_u16be;
    using detail::read_u16le;
    using detail::read_u32be;
    using detail::read_u32le;

    static std::string text_at(std::span<const std::byte> bytes, uint64_t off,
                               uint64_t len)
    {
        const std::string_view s = detail::as_text(
            bytes.subspan(static_cast<size_t>(off), static_cast<size_t>(len)));
        return std::string(s);
    }


    // RIFF INFO strings are NUL-terminated inside their declared size.
    static std::string trim_nul(std::string s)
    {
        const size_t nul = s.find('\0');
        if (nul != std::string::npos) {
            s.resize(nul);
        }
        return s;
    }

}  // namespace

WriteStatus
parse_vorbis_comments(std::span<const std::byte> body,
                      VorbisComments* out) noexcept
{
    out->vendor.clear();
    out->fields.clear();

    uint32_t vendor_len = 0;
    if (!read_u32le(body, 0, &vendor_len)
        || !in_bounds(body, 4, vendor_len)) {
        return WriteStatus::Malformed;
    }
    out->vendor = text_at(body, 4, vendor_len);

    uint64_t off   = 4U + static_cast<uint64_t>(vendor_len);
    uint32_t count = 0;
    if (!read_u32le(body, off, &count)) {
        return WriteStatus::Malformed;
    }
    off += 4U;
    // Each entry needs at least its 4-byte length.
    if (static_cast<uint64_t>(count) * 4U > body.size() - off) {
        return WriteStatus::Malformed;
    }
    out->fields.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        uint32_t len = 0;
        if (!read_u32le(body, off, &len) || !in_bounds(body, off + 4U, len)) {
            return WriteStatus::Malformed;
        }
        const std::string entry = text_at(body, off + 4U, len);
        off += 4U + static_cast<uint64_t>(len);

        VorbisCommentField f;
        const size_t eq = entry.find('=');
        if (eq == std::string::npos) {
            f.name = entry;
        } else {
            f.name  = entry.substr(0, eq);
            f.value = entry.substr(eq + 1U);
        }
        out->fields.push_back(std::move(f));
    }
    return WriteStatus::Ok;
}


WriteStatus
parse_asf_content_description(std::span<const std::byte> object,
                              AsfContentDescription* out) noexcept
{
    *out = AsfContentDescription {};
    uint16_t lens[5] = {};
    for (uint32_t i = 0; i < 5U; ++i) {
        if (!read_u16le(object, kAsfObjectHeaderSize + 2U * i, &lens[i])) {
            return WriteStatus::Malformed;
        }
    }
    uint64_t off = kAsfObjectHeaderSize + 10U;
    std::string* const dst[5] = { &out->title, &out->author, &out->copyright,
                                  &out->description, &out->rating };
    for (uint32_t i = 0; i < 5U; ++i) {
        if (!in_bounds(object, off, lens[i])) {
            return WriteStatus::Malformed;
        }
        *dst[i] = detail::utf8_from_utf16le(
            object.subspan(static_cast<size_t>(off), lens[i]));
        off += lens[i];
    }
    return WriteStatus::Ok;
}


WriteStatus
parse_asf_extended_content_description(
    std::span<const std::byte> object,
    std::vector<AsfDescriptor>* out) noexcept
{
    out->clear();
    uint16_t count = 0;
    if (!read_u16le(object, kAsfObjectHeaderSize, &count)) {
        return WriteStatus::Malformed;
    }
    uint64_t off = kAsfObjectHeaderSize + 2U;
    out->reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        uint16_t name_len = 0;
        if (!read_u16le(object, off, &name_len)
            || !in_bounds(object, off + 2U, name_len)) {
            return WriteStatus::Malformed;
        }
        AsfDescriptor d;
        d.name = detail::utf8_from_utf16le(
            object.subspan(static_cast<size_t>(off + 2U), name_len));
        off += 2U + static_cast<uint64_t>(name_len);

        uint16_t value_len = 0;
        if (!read_u16le(object, off, &d.type)
            || !read_u16le(object, off + 2U, &value_len)
            || !in_bounds(object, off + 4U, value_len)) {
            return WriteStatus::Malformed;
        }
        const std::span<const std::byte> value
            = object.subspan(static_cast<size_t>(off + 4U), value_len);
        d.value.assign(value.begin(), value.end());
        off += 4U + static_cast<uint64_t>(value_len);
        out->push_back(std::move(d));
    }
    return WriteStatus::Ok;
}


WriteStatus
parse_riff_info_list(std::span<const std::byte> list_data,
                     std::vector<RiffInfoEntry>* out) noexcept
{
    out->clear();
    uint32_t list_type = 0;
    if (!read_u32be(list_data, 0, &list_type)
        || list_type != fourcc('I', 'N', 'F', 'O')) {
        return WriteStatus::FormatError;
    }
    uint64_t off = 4;
    while (off + 8U <= list_data.size()) {
        RiffInfoEntry e;
        uint32_t size = 0;
        if (!read_u32be(list_data, off, &e.id)
            || !read_u32le(list_data, off + 4U, &size)) {
            return WriteStatus::Malformed;
        }
        const uint64_t padded = static_cast<uint64_t>(size) + (size & 1U);
        if (!in_bounds(list_data, off + 8U, size)) {
            return WriteStatus::Malformed;
        }
        e.text = trim_nul(text_at(list_data, off + 8U, size));
        out->push_back(std::move(e));
        off += 8U + padded;
    }
    return WriteStatus::Ok;
}


WriteStatus
parse_jpeg_irb_resources(std::span<const std::byte> payload,
                         std::vector<IrbResource>* out) noexcept
{
    if (!detail::match(payload, 0, "Photoshop 3.0\0", 14)) {
        return WriteStatus::FormatError;
    }
    uint64_t off = 14;
    while (off + 4U <= payload.size()
           && detail::match(payload, off, "8BIM", 4)) {
        IrbResource r;
        if (!read_u16be(payload, off + 4U, &r.id)
            || !in_bounds(payload, off + 6U, 1)) {
            return WriteStatus::Malformed;
        }
        // Pascal name, padded so that length byte + name is even.
        const uint64_t name_len = detail::u8(payload[off + 6U]);
        const uint64_t name_field = (name_len + 2U) & ~uint64_t { 1 };
        const uint64_t size_off   = off + 6U + name_field;
        uint32_t size             = 0;
        if (!read_u32be(payload, size_off, &size)
            || !in_bounds(payload, size_off + 4U, size)) {
            return WriteStatus::Malformed;
        }
        const std::span<const std::byte> data = payload.subspan(
            static_cast<size_t>(size_off + 4U), size);
        r.data.assign(data.begin(), data.end());
        out->push_back(std::move(r));
        off = size_off + 4U + size + (size & 1U);
    }
    return WriteStatus::Ok;
}


WriteStatus
parse_jpeg_afcp_fields(std::span<const std::byte> payload,
                       std::vector<AfcpField>* out) noexcept
{
    if (!detail::match(payload, 0, "AFCP", 4) || payload.size() < 8U) {
        return WriteStatus::FormatError;
    }
    uint64_t off = 8;
    while (off < payload.size()) {
        uint16_t key_len = 0;
        uint32_t val_len = 0;
        if (!read_u16be(payload, off, &key_len)
            || !read_u32be(payload, off + 2U + key_len, &val_len)
            || !in_bounds(payload, off + 6U + key_len, val_len)) {
            return WriteStatus::Malformed;
        }
        AfcpField f;
        f.key   = text_at(payload, off + 2U, key_len);
        f.value = text_at(payload, off + 6U + key_len, val_len);
        out->push_back(std::move(f));
        off += 6U + static_cast<uint64_t>(key_len) + val_len;
    }
    return WriteStatus::Ok;
}

}  // namespace metasplice
