#include "metasplice/var_int.h"

#include "byte_io_internal.h"

namespace metasplice {

using detail::in_bounds;
using detail::u8;

bool
read_synchsafe32(std::span<const std::byte> bytes, uint64_t offset,
                 uint32_t* out) noexcept
{
    if (!in_bounds(bytes, offset, 4)) {
        return false;
    }
    uint32_t v = 0;
    for (uint32_t i = 0; i < 4; ++i) {
        const uint8_t b = u8(bytes[offset + i]);
        if ((b & 0x80U) != 0U) {
            return false;
        }
        v = (v << 7) | static_cast<uint32_t>(b);
    }
    *out = v;
    return true;
}


bool
append_synchsafe32(uint32_t value, std::vector<std::byte>* out)
{
    if (value > kSynchsafeMax) {
        return false;
    }
    for (int shift = 21; shift >= 0; shift -= 7) {
        detail::append_u8(out, static_cast<uint8_t>((value >> shift) & 0x7F));
    }
    return true;
}


bool
append_u24be(uint32_t value, std::vector<std::byte>* out)
{
    if (value > kU24Max) {
        return false;
    }
    detail::append_u8(out, static_cast<uint8_t>((value >> 16) & 0xFF));
    detail::append_u8(out, static_cast<uint8_t>((value >> 8) & 0xFF));
    detail::append_u8(out, static_cast<uint8_t>((value >> 0) & 0xFF));
    return true;
}

namespace {

    // Width of a vint from its first byte: position of the first set bit.
    static uint8_t vint_width(uint8_t first, uint8_t max_width) noexcept
    {
        for (uint8_t w = 1; w <= max_width; ++w) {
            if ((first & static_cast<uint8_t>(0x80U >> (w - 1))) != 0U) {
                return w;
            }
        }
        return 0;
    }

}  // namespace

bool
read_ebml_id(std::span<const std::byte> bytes, uint64_t offset,
             EbmlVint* out) noexcept
{
    if (!in_bounds(bytes, offset, 1)) {
        return false;
    }
    const uint8_t width = vint_width(u8(bytes[offset]), 4);
    if (width == 0 || !in_bounds(bytes, offset, width)) {
        return false;
    }
    uint64_t v = 0;
    for (uint8_t i = 0; i < width; ++i) {
        v = (v << 8) | static_cast<uint64_t>(u8(bytes[offset + i]));
    }
    out->value   = v;
    out->width   = width;
    out->unknown = false;
    return true;
}


bool
read_ebml_size(std::span<const std::byte> bytes, uint64_t offset,
               EbmlVint* out) noexcept
{
    if (!in_bounds(bytes, offset, 1)) {
        return false;
    }
    const uint8_t first = u8(bytes[offset]);
    const uint8_t width = vint_width(first, 8);
    if (width == 0 || !in_bounds(bytes, offset, width)) {
        return false;
    }
    const uint8_t marker = static_cast<uint8_t>(0x80U >> (width - 1));
    uint64_t v = static_cast<uint64_t>(first & static_cast<uint8_t>(marker - 1));
    for (uint8_t i = 1; i < width; ++i) {
        v = (v << 8) | static_cast<uint64_t>(u8(bytes[offset + i]));
    }
    const uint64_t all_ones = (uint64_t { 1 } << (7U * width)) - 1U;
    out->value   = v;
    out->width   = width;
    out->unknown = (v == all_ones);
    return true;
}


uint8_t
ebml_id_width(uint32_t id) noexcept
{
    if (id <= 0xFFU) {
        return 1;
    }
    if (id <= 0xFFFFU) {
        return 2;
    }
    if (id <= 0xFFFFFFU) {
        return 3;
    }
    return 4;
}


void
append_ebml_id(uint32_t id, std::vector<std::byte>* out)
{
    const uint8_t width = ebml_id_width(id);
    for (int i = width - 1; i >= 0; --i) {
        detail::append_u8(out, static_cast<uint8_t>((id >> (8 * i)) & 0xFF));
    }
}


bool
ebml_size_fits(uint64_t value, uint8_t width) noexcept
{
    if (width == 0 || width > 8) {
        return false;
    }
    const uint64_t all_ones = (uint64_t { 1 } << (7U * width)) - 1U;
    return value < all_ones;
}


uint8_t
ebml_size_min_width(uint64_t value) noexcept
{
    for (uint8_t w = 1; w <= 8; ++w) {
        if (ebml_size_fits(value, w)) {
            return w;
        }
    }
    return 0;
}


bool
encode_ebml_size(uint64_t value, uint8_t width,
                 std::span<std::byte> dst) noexcept
{
    if (!ebml_size_fits(value, width) || dst.size() < width) {
        return false;
    }
    const uint64_t marked = value | (uint64_t { 1 } << (7U * width));
    for (uint8_t i = 0; i < width; ++i) {
        const uint32_t shift = 8U * static_cast<uint32_t>(width - 1 - i);
        dst[i] = std::byte { static_cast<uint8_t>((marked >> shift) & 0xFF) };
    }
    return true;
}


bool
append_ebml_size(uint64_t value, std::vector<std::byte>* out)
{
    const uint8_t width = ebml_size_min_width(value);
    if (width == 0) {
        return false;
    }
    const size_t at = out->size();
    out->resize(at + width);
    return encode_ebml_size(value, width,
                            std::span<std::byte>(out->data() + at, width));
}


void
build_ogg_lacing(uint64_t packet_size, std::vector<uint8_t>* out)
{
    out->clear();
    out->reserve(static_cast<size_t>(packet_size / 255U + 1U));
    uint64_t left = packet_size;
    while (left >= 255U) {
        out->push_back(255);
        left -= 255U;
    }
    out->push_back(static_cast<uint8_t>(left));
}


bool
ogg_first_packet(std::span<const uint8_t> lacing, uint32_t* entries,
                 uint64_t* packet_bytes) noexcept
{
    uint64_t total = 0;
    for (size_t i = 0; i < lacing.size(); ++i) {
        total += lacing[i];
        if (lacing[i] < 255U) {
            *entries      = static_cast<uint32_t>(i + 1);
            *packet_bytes = total;
            return true;
        }
    }
    return false;
}

}  // namespace metasplice
