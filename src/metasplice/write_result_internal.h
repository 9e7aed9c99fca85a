#pragma once

#include "metasplice/write_status.h"

#include <cstdint>

namespace metasplice::detail {

inline WriteResult
write_ok(ContainerFormat format) noexcept
{
    WriteResult r;
    r.format = format;
    return r;
}


inline WriteResult
write_fail(ContainerFormat format, WriteStatus status, const char* what,
           uint64_t offset = 0, uint64_t expected = 0,
           uint64_t found = 0) noexcept
{
    WriteResult r;
    r.status   = status;
    r.format   = format;
    r.offset   = offset;
    r.expected = expected;
    r.found    = found;
    r.what     = what;
    return r;
}

}  // namespace metasplice::detail
