#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file var_int.h
 * \brief Variable-length integer and size-field codecs used by container framing.
 *
 * Covers ID3v2 synchsafe integers, EBML self-describing IDs and sizes, the
 * 24-bit big-endian FLAC block length and Ogg lacing tables.
 */

namespace metasplice {

/// Largest value representable by a 4-byte synchsafe integer (28 bits).
inline constexpr uint32_t kSynchsafeMax = 0x0FFFFFFFU;

/// Decodes a 4-byte synchsafe integer; fails on overrun or a set high bit.
bool
read_synchsafe32(std::span<const std::byte> bytes, uint64_t offset,
                 uint32_t* out) noexcept;

/// Appends \p value as a 4-byte synchsafe integer; fails above \ref kSynchsafeMax.
bool
append_synchsafe32(uint32_t value, std::vector<std::byte>* out);


/// Largest FLAC metadata block length (24-bit field).
inline constexpr uint32_t kU24Max = 0x00FFFFFFU;

/// Appends a 24-bit big-endian value; fails above \ref kU24Max.
bool
append_u24be(uint32_t value, std::vector<std::byte>* out);


/// A decoded EBML variable-length field.
struct EbmlVint final {
    /// For IDs: the raw value including the width marker (e.g. 0x18538067).
    /// For sizes: the value with the width marker removed.
    uint64_t value = 0;
    /// Encoded width in bytes.
    uint8_t width = 0;
    /// Size fields only: all value bits set (the "unknown size" sentinel).
    bool unknown = false;
};

/// Reads an EBML element ID (1-4 bytes).
bool
read_ebml_id(std::span<const std::byte> bytes, uint64_t offset,
             EbmlVint* out) noexcept;

/// Reads an EBML element size (1-8 bytes).
bool
read_ebml_size(std::span<const std::byte> bytes, uint64_t offset,
               EbmlVint* out) noexcept;

/// Number of bytes \p id occupies when written (the ID keeps its marker bit).
uint8_t
ebml_id_width(uint32_t id) noexcept;

/// Appends an EBML element ID.
void
append_ebml_id(uint32_t id, std::vector<std::byte>* out);

/// Smallest width able to encode \p value as a known size (0 if none).
uint8_t
ebml_size_min_width(uint64_t value) noexcept;

/// True when \p value fits a known-size field of \p width bytes.
bool
ebml_size_fits(uint64_t value, uint8_t width) noexcept;

/**
 * \brief Encodes \p value as an EBML size of exactly \p width bytes into \p dst.
 *
 * Fails when \p width is outside 1..8, \p dst is too small, or \p value does
 * not fit (the all-ones pattern is reserved for unknown sizes).
 */
bool
encode_ebml_size(uint64_t value, uint8_t width,
                 std::span<std::byte> dst) noexcept;

/// Appends an EBML size using \ref ebml_size_min_width.
bool
append_ebml_size(uint64_t value, std::vector<std::byte>* out);


/**
 * \brief Builds the Ogg lacing values for one packet of \p packet_size bytes.
 *
 * The packet is written as a run of 255 values followed by one value below
 * 255. A size that is an exact multiple of 255 therefore ends in an explicit
 * 0 entry.
 */
void
build_ogg_lacing(uint64_t packet_size, std::vector<uint8_t>* out);

/**
 * \brief Measures the first packet described by an Ogg lacing table.
 *
 * Returns false when no value below 255 terminates the packet on this page
 * (it continues on the next page).
 */
bool
ogg_first_packet(std::span<const uint8_t> lacing, uint32_t* entries,
                 uint64_t* packet_bytes) noexcept;

}  // namespace metasplice
