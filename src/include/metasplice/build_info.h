#pragma once

#include <string>
#include <string_view>

/**
 * \file build_info.h
 * \brief Configure-time facts about the linked metasplice library.
 */

namespace metasplice {

/**
 * \brief How this copy of metasplice was built.
 *
 * Every field is baked in from the generated `build_info_generated.h`.
 */
struct BuildInfo final {
    /// Library version ("0.1.0").
    std::string_view version;
    /// UTC build time (ISO-8601); empty when reproducible builds hide it.
    std::string_view build_timestamp_utc;
    /// "Release", "Debug", ... or "multi-config".
    std::string_view build_type;
    std::string_view cmake_generator;
    std::string_view system_name;
    std::string_view system_processor;
    std::string_view cxx_compiler_id;
    std::string_view cxx_compiler_version;

    /// Configure options as requested.
    bool option_with_zlib  = false;
    bool option_with_expat = false;

    /// zlib found and linked: PNG chunk CRCs are available.
    bool has_zlib = false;
    /// Expat found and linked: existing XMP packets are merged.
    bool has_expat = false;
};

const BuildInfo&
build_info() noexcept;

/**
 * \brief Formats the two-line banner printed by the tools.
 *
 * - `metasplice vX.Y.Z <build_type> [zlib,expat]`
 * - `built with <compiler>-<version> for <system>/<arch> (<timestamp>)`
 */
void
format_build_info_lines(const BuildInfo& info, std::string* line1,
                        std::string* line2) noexcept;

/// Same, for the linked library.
void
format_build_info_lines(std::string* line1, std::string* line2) noexcept;

}  // namespace metasplice
