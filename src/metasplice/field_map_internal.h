#pragma once

#include "metasplice/block_build.h"
#include "metasplice/metadata_request.h"
#include "metasplice/splice.h"
#include "metasplice/write_status.h"

#include <cstdint>
#include <initializer_list>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace metasplice {
struct WriteLimits;
}

namespace metasplice::detail {

/// Fields that several key groups can name.
enum class LogicalField : uint8_t {
    Title,
    Artist,
    Album,
    Comment,
    Date,
    Genre,
    Copyright,
    Software,
};

/**
 * \brief Resolves \p field: \p format_keys first, then the `XMP:`, `EXIF:`
 * and bare fallbacks for that field. Returns nullptr when none is set.
 *
 * Writers that store `XMP:*` keys in a packet of their own pass
 * \p xmp_fallback = false so those keys are not written twice.
 */
const std::string*
resolve_field(const MetadataRequest& request, LogicalField field,
              std::initializer_list<std::string_view> format_keys,
              bool xmp_fallback = true) noexcept;

/// Case-insensitive ASCII comparison.
bool
iequals(std::string_view a, std::string_view b) noexcept;

/// Parses a decimal or `0x` hexadecimal unsigned integer.
bool
parse_u32(std::string_view s, uint32_t* out) noexcept;

/// Collects Vorbis comment updates (`Vorbis:<NAME>` keys and the logical
/// fields mapped to TITLE, ARTIST, ALBUM, ...).
void
collect_vorbis_updates(const MetadataRequest& request,
                       std::vector<VorbisCommentField>* out);

/**
 * \brief Overlays \p updates onto \p comments.
 *
 * Names compare case-insensitively. The first existing field with an updated
 * name takes the new value, later ones with that name are dropped, and new
 * names are appended.
 */
void
merge_vorbis_fields(std::span<const VorbisCommentField> updates,
                    VorbisComments* comments);

/**
 * \brief Applies \p edit to \p base and enforces \p limits.
 *
 * Splice range failures map to \ref WriteStatus::IntegrityCheck; they mean a
 * writer produced inconsistent edits.
 */
WriteResult
commit_write(ContainerFormat format, std::span<const std::byte> base,
             const SpliceEdit& edit, const WriteLimits& limits,
             std::vector<std::byte>* out) noexcept;

}  // namespace metasplice::detail
