#pragma once

#include "metasplice/block_build.h"

#include <cstddef>
#include <span>
#include <vector>

/**
 * \file block_fields.h
 * \brief Decoders for existing metadata blocks whose fields are carried over
 * when a block is rebuilt.
 *
 * Each decoder is the inverse of the matching builder in block_build.h and
 * returns \ref WriteStatus::Malformed when a length runs past the block.
 */

namespace metasplice {

/// Decodes a Vorbis comment body (after any `\x03vorbis` / `OpusTags` prefix).
WriteStatus
parse_vorbis_comments(std::span<const std::byte> body,
                      VorbisComments* out) noexcept;

/// Decodes a Content Description object (including its 24-byte header).
WriteStatus
parse_asf_content_description(std::span<const std::byte> object,
                              AsfContentDescription* out) noexcept;

/// Decodes an Extended Content Description object (including its header).
WriteStatus
parse_asf_extended_content_description(
    std::span<const std::byte> object,
    std::vector<AsfDescriptor>* out) noexcept;

/// Decodes the entries of a `LIST` chunk data area that starts with `INFO`.
WriteStatus
parse_riff_info_list(std::span<const std::byte> list_data,
                     std::vector<RiffInfoEntry>* out) noexcept;

/**
 * \brief Decodes the `8BIM` resources of an APP13 payload (starting with
 * `Photoshop 3.0\0`), appending to \p out. Resource names are dropped.
 */
WriteStatus
parse_jpeg_irb_resources(std::span<const std::byte> payload,
                         std::vector<IrbResource>* out) noexcept;

/// Decodes the records of an APP2 `AFCP` payload, appending to \p out.
WriteStatus
parse_jpeg_afcp_fields(std::span<const std::byte> payload,
                       std::vector<AfcpField>* out) noexcept;

}  // namespace metasplice
