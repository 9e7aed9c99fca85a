#pragma once

#include <cstdint>

/**
 * \file write_status.h
 * \brief Status and diagnostic types shared by all container writers.
 */

namespace metasplice {

/// Container families handled by the writers.
enum class ContainerFormat : uint8_t {
    Unknown,
    Jpeg,
    Png,
    /// RIFF forms (`WAVE`, `AVI `).
    Riff,
    /// Ogg Vorbis or Ogg Opus.
    Ogg,
    Flac,
    /// MPEG audio with a leading ID3v2 tag.
    Mp3,
    /// ASF/WMA/WMV.
    Asf,
    /// ISO-BMFF / QuickTime (MP4, MOV, M4A).
    Bmff,
    /// Matroska / WebM (EBML).
    Matroska,
};

/// Write result status.
enum class WriteStatus : uint8_t {
    Ok,
    /// The request names nothing this container writer can store.
    NoApplicableFields,
    /// Missing or invalid container signature.
    FormatError,
    /// A declared length or size runs past the buffer or its parent.
    Malformed,
    /// A protocol ceiling would be exceeded (lacing entries, chunk counts,
    /// size-field width).
    StructuralLimit,
    /// The container layout cannot be edited safely (ambiguous header,
    /// packet spanning pages, inconsistent element size).
    UnsupportedLayout,
    /// A recomputed length does not agree with the original framing.
    IntegrityCheck,
    /// The request names a tag class this writer rejects.
    UnsupportedField,
    /// The writer needs an optional dependency that was not compiled in.
    Unsupported,
    /// A \ref WriteLimits budget was hit.
    LimitExceeded,
};

/**
 * \brief Outcome of a write call.
 *
 * On failure, \ref offset points at the byte where the problem was found and
 * \ref expected / \ref found carry the conflicting values when the check
 * compares two quantities.
 */
struct WriteResult final {
    WriteStatus status     = WriteStatus::Ok;
    ContainerFormat format = ContainerFormat::Unknown;
    uint64_t offset        = 0;
    uint64_t expected      = 0;
    uint64_t found         = 0;
    /// Static, human-readable description of the failing check (or nullptr).
    const char* what = nullptr;
};

/// Stable lowercase name for \p status (e.g. "structural_limit").
const char*
write_status_name(WriteStatus status) noexcept;

/// Stable lowercase name for \p format (e.g. "matroska").
const char*
container_format_name(ContainerFormat format) noexcept;

}  // namespace metasplice
