#include "metasplice/build_info.h"

#include "metasplice/build_info_generated.h"

#include <string>

namespace metasplice {
namespace {

    static constexpr bool compiled_with_zlib() noexcept
    {
#if defined(METASPLICE_HAS_ZLIB) && METASPLICE_HAS_ZLIB
        return true;
#else
        return false;
#endif
    }

    static constexpr bool compiled_with_expat() noexcept
    {
#if defined(METASPLICE_HAS_EXPAT) && METASPLICE_HAS_EXPAT
        return true;
#else
        return false;
#endif
    }

    static constexpr BuildInfo kBuildInfo = {
        /*version=*/METASPLICE_BUILDINFO_VERSION,
        /*build_timestamp_utc=*/METASPLICE_BUILDINFO_BUILD_TIMESTAMP_UTC,
        /*build_type=*/METASPLICE_BUILDINFO_BUILD_TYPE,
        /*cmake_generator=*/METASPLICE_BUILDINFO_CMAKE_GENERATOR,
        /*system_name=*/METASPLICE_BUILDINFO_SYSTEM_NAME,
        /*system_processor=*/METASPLICE_BUILDINFO_SYSTEM_PROCESSOR,
        /*cxx_compiler_id=*/METASPLICE_BUILDINFO_CXX_COMPILER_ID,
        /*cxx_compiler_version=*/METASPLICE_BUILDINFO_CXX_COMPILER_VERSION,
        /*option_with_zlib=*/static_cast<bool>(METASPLICE_BUILDINFO_WITH_ZLIB),
        /*option_with_expat=*/static_cast<bool>(METASPLICE_BUILDINFO_WITH_EXPAT),
        /*has_zlib=*/compiled_with_zlib(),
        /*has_expat=*/compiled_with_expat(),
    };

    static void append_feature(std::string* line, bool* first,
                               const char* name)
    {
        if (!*first) {
            line->push_back(',');
        }
        line->append(name);
        *first = false;
    }

}  // namespace

const BuildInfo&
build_info() noexcept
{
    return kBuildInfo;
}


void
format_build_info_lines(const BuildInfo& info, std::string* line1,
                        std::string* line2) noexcept
{
    if (line1) {
        line1->clear();
        line1->append("metasplice v");
        line1->append(info.version);
        line1->push_back(' ');
        line1->append(info.build_type);
        line1->append(" [");
        bool first = true;
        if (info.has_zlib) {
            append_feature(line1, &first, "zlib");
        }
        if (info.has_expat) {
            append_feature(line1, &first, "expat");
        }
        line1->push_back(']');
    }
    if (line2) {
        line2->clear();
        line2->append("built with ");
        line2->append(info.cxx_compiler_id);
        line2->push_back('-');
        line2->append(info.cxx_compiler_version);
        line2->append(" for ");
        line2->append(info.system_name);
        line2->push_back('/');
        line2->append(info.system_processor);
        if (!info.build_timestamp_utc.empty()) {
            line2->append(" (");
            line2->append(info.build_timestamp_utc);
            line2->push_back(')');
        }
    }
}


void
format_build_info_lines(std::string* line1, std::string* line2) noexcept
{
    format_build_info_lines(build_info(), line1, line2);
}

}  // namespace metasplice
