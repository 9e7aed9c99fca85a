#include "metasplice/ogg_crc.h"

namespace metasplice {

static_assert(kOggCrcTable[1] == kOggCrcPolynomial);

uint32_t
ogg_crc32_update(uint32_t crc, std::span<const std::byte> bytes) noexcept
{
    for (size_t i = 0; i < bytes.size(); ++i) {
        const uint32_t idx = ((crc >> 24) ^ static_cast<uint32_t>(bytes[i]))
                             & 0xFFU;
        crc = (crc << 8) ^ kOggCrcTable[idx];
    }
    return crc;
}

}  // namespace metasplice
