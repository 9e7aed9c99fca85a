#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string_view>
#include <vector>

namespace metasplice::detail {

inline constexpr uint8_t
u8(std::byte b) noexcept
{
    return static_cast<uint8_t>(b);
}


inline bool
in_bounds(std::span<const std::byte> bytes, uint64_t offset,
          uint64_t size) noexcept
{
    const uint64_t total = static_cast<uint64_t>(bytes.size());
    return offset <= total && size <= total - offset;
}


inline bool
match(std::span<const std::byte> bytes, uint64_t offset, const char* s,
      uint32_t s_len) noexcept
{
    if (!in_bounds(bytes, offset, s_len)) {
        return false;
    }
    return std::memcmp(bytes.data() + static_cast<size_t>(offset), s,
                       static_cast<size_t>(s_len))
           == 0;
}


inline bool
match_bytes(std::span<const std::byte> bytes, uint64_t offset,
            const std::byte* data, uint32_t data_len) noexcept
{
    if (!in_bounds(bytes, offset, data_len)) {
        return false;
    }
    return std::memcmp(bytes.data() + static_cast<size_t>(offset), data,
                       static_cast<size_t>(data_len))
           == 0;
}


inline bool
read_u16be(std::span<const std::byte> bytes, uint64_t offset,
           uint16_t* out) noexcept
{
    if (!in_bounds(bytes, offset, 2)) {
        return false;
    }
    *out = static_cast<uint16_t>((u8(bytes[offset + 0]) << 8)
                                 | (u8(bytes[offset + 1]) << 0));
    return true;
}


inline bool
read_u16le(std::span<const std::byte> bytes, uint64_t offset,
           uint16_t* out) noexcept
{
    if (!in_bounds(bytes, offset, 2)) {
        return false;
    }
    *out = static_cast<uint16_t>((u8(bytes[offset + 0]) << 0)
                                 | (u8(bytes[offset + 1]) << 8));
    return true;
}


inline bool
read_u24be(std::span<const std::byte> bytes, uint64_t offset,
           uint32_t* out) noexcept
{
    if (!in_bounds(bytes, offset, 3)) {
        return false;
    }
    *out = (static_cast<uint32_t>(u8(bytes[offset + 0])) << 16)
           | (static_cast<uint32_t>(u8(bytes[offset + 1])) << 8)
           | (static_cast<uint32_t>(u8(bytes[offset + 2])) << 0);
    return true;
}


inline bool
read_u32be(std::span<const std::byte> bytes, uint64_t offset,
           uint32_t* out) noexcept
{
    if (!in_bounds(bytes, offset, 4)) {
        return false;
    }
    *out = (static_cast<uint32_t>(u8(bytes[offset + 0])) << 24)
           | (static_cast<uint32_t>(u8(bytes[offset + 1])) << 16)
           | (static_cast<uint32_t>(u8(bytes[offset + 2])) << 8)
           | (static_cast<uint32_t>(u8(bytes[offset + 3])) << 0);
    return true;
}


inline bool
read_u32le(std::span<const std::byte> bytes, uint64_t offset,
           uint32_t* out) noexcept
{
    if (!in_bounds(bytes, offset, 4)) {
        return false;
    }
    *out = (static_cast<uint32_t>(u8(bytes[offset + 0])) << 0)
           | (static_cast<uint32_t>(u8(bytes[offset + 1])) << 8)
           | (static_cast<uint32_t>(u8(bytes[offset + 2])) << 16)
           | (static_cast<uint32_t>(u8(bytes[offset + 3])) << 24);
    return true;
}


inline bool
read_u64be(std::span<const std::byte> bytes, uint64_t offset,
           uint64_t* out) noexcept
{
    if (!in_bounds(bytes, offset, 8)) {
        return false;
    }
    uint64_t v = 0;
    for (uint32_t i = 0; i < 8; ++i) {
        v = (v << 8) | static_cast<uint64_t>(u8(bytes[offset + i]));
    }
    *out = v;
    return true;
}


inline bool
read_u64le(std::span<const std::byte> bytes, uint64_t offset,
           uint64_t* out) noexcept
{
    if (!in_bounds(bytes, offset, 8)) {
        return false;
    }
    uint64_t v = 0;
    for (uint32_t i = 0; i < 8; ++i) {
        v |= static_cast<uint64_t>(u8(bytes[offset + i])) << (i * 8);
    }
    *out = v;
    return true;
}


inline void
append_u8(std::vector<std::byte>* out, uint8_t v)
{
    out->push_back(std::byte { v });
}


inline void
append_u16be(std::vector<std::byte>* out, uint16_t v)
{
    append_u8(out, static_cast<uint8_t>((v >> 8) & 0xFF));
    append_u8(out, static_cast<uint8_t>((v >> 0) & 0xFF));
}


inline void
append_u16le(std::vector<std::byte>* out, uint16_t v)
{
    append_u8(out, static_cast<uint8_t>((v >> 0) & 0xFF));
    append_u8(out, static_cast<uint8_t>((v >> 8) & 0xFF));
}


inline void
append_u32be(std::vector<std::byte>* out, uint32_t v)
{
    for (int shift = 24; shift >= 0; shift -= 8) {
        append_u8(out, static_cast<uint8_t>((v >> shift) & 0xFF));
    }
}


inline void
append_u32le(std::vector<std::byte>* out, uint32_t v)
{
    for (int shift = 0; shift <= 24; shift += 8) {
        append_u8(out, static_cast<uint8_t>((v >> shift) & 0xFF));
    }
}


inline void
append_u64be(std::vector<std::byte>* out, uint64_t v)
{
    for (int shift = 56; shift >= 0; shift -= 8) {
        append_u8(out, static_cast<uint8_t>((v >> shift) & 0xFF));
    }
}


inline void
append_u64le(std::vector<std::byte>* out, uint64_t v)
{
    for (int shift = 0; shift <= 56; shift += 8) {
        append_u8(out, static_cast<uint8_t>((v >> shift) & 0xFF));
    }
}


inline void
append_fourcc(std::vector<std::byte>* out, uint32_t f)
{
    append_u32be(out, f);
}


inline void
append_text(std::vector<std::byte>* out, std::string_view s)
{
    const std::byte* p = reinterpret_cast<const std::byte*>(s.data());
    out->insert(out->end(), p, p + s.size());
}


inline void
append_span(std::vector<std::byte>* out, std::span<const std::byte> s)
{
    out->insert(out->end(), s.begin(), s.end());
}


inline void
store_u32be(std::span<std::byte> dst, uint64_t offset, uint32_t v) noexcept
{
    for (uint32_t i = 0; i < 4; ++i) {
        dst[offset + i] = std::byte { static_cast<uint8_t>(
            (v >> (24 - 8 * i)) & 0xFF) };
    }
}


inline void
store_u32le(std::span<std::byte> dst, uint64_t offset, uint32_t v) noexcept
{
    for (uint32_t i = 0; i < 4; ++i) {
        dst[offset + i] = std::byte { static_cast<uint8_t>((v >> (8 * i))
                                                           & 0xFF) };
    }
}


inline void
store_u64be(std::span<std::byte> dst, uint64_t offset, uint64_t v) noexcept
{
    for (uint32_t i = 0; i < 8; ++i) {
        dst[offset + i] = std::byte { static_cast<uint8_t>(
            (v >> (56 - 8 * i)) & 0xFF) };
    }
}


inline void
store_u64le(std::span<std::byte> dst, uint64_t offset, uint64_t v) noexcept
{
    for (uint32_t i = 0; i < 8; ++i) {
        dst[offset + i] = std::byte { static_cast<uint8_t>((v >> (8 * i))
                                                           & 0xFF) };
    }
}


inline std::string_view
as_text(std::span<const std::byte> bytes) noexcept
{
    return std::string_view(reinterpret_cast<const char*>(bytes.data()),
                            bytes.size());
}


inline std::span<const std::byte>
as_bytes(std::string_view s) noexcept
{
    return std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(s.data()), s.size());
}

}  // namespace metasplice::detail
