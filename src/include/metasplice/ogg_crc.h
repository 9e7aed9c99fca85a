#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

/**
 * \file ogg_crc.h
 * \brief CRC-32 used by Ogg page checksums.
 *
 * Polynomial 0x04C11DB7, MSB-first, initial value 0, no final XOR.
 */

namespace metasplice {

inline constexpr uint32_t kOggCrcPolynomial = 0x04C11DB7U;

constexpr std::array<uint32_t, 256>
make_ogg_crc_table() noexcept
{
    std::array<uint32_t, 256> table {};
    for (uint32_t i = 0; i < 256U; ++i) {
        uint32_t r = i << 24;
        for (uint32_t bit = 0; bit < 8U; ++bit) {
            r = (r & 0x80000000U) ? ((r << 1) ^ kOggCrcPolynomial) : (r << 1);
        }
        table[i] = r;
    }
    return table;
}

/// Lookup table, computed at compile time.
inline constexpr std::array<uint32_t, 256> kOggCrcTable = make_ogg_crc_table();

/// Continues a checksum over \p bytes starting from \p crc.
uint32_t
ogg_crc32_update(uint32_t crc, std::span<const std::byte> bytes) noexcept;

/// Checksum of \p bytes (a whole page with its checksum field zeroed).
inline uint32_t
ogg_crc32(std::span<const std::byte> bytes) noexcept
{
    return ogg_crc32_update(0U, bytes);
}

}  // namespace metasplice
