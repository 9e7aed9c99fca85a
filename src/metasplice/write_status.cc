#include "metasplice/write_status.h"

namespace metasplice {

const char*
write_status_name(WriteStatus status) noexcept
{
    switch (status) {
    case WriteStatus::Ok: return "ok";
    case WriteStatus::NoApplicableFields: return "no_applicable_fields";
    case WriteStatus::FormatError: return "format_error";
    case WriteStatus::Malformed: return "malformed";
    case WriteStatus::StructuralLimit: return "structural_limit";
    case WriteStatus::UnsupportedLayout: return "unsupported_layout";
    case WriteStatus::IntegrityCheck: return "integrity_check";
    case WriteStatus::UnsupportedField: return "unsupported_field";
    case WriteStatus::Unsupported: return "unsupported";
    case WriteStatus::LimitExceeded: return "limit_exceeded";
    }
    return "unknown";
}


const char*
container_format_name(ContainerFormat format) noexcept
{
    switch (format) {
    case ContainerFormat::Unknown: return "unknown";
    case ContainerFormat::Jpeg: return "jpeg";
    case ContainerFormat::Png: return "png";
    case ContainerFormat::Riff: return "riff";
    case ContainerFormat::Ogg: return "ogg";
    case ContainerFormat::Flac: return "flac";
    case ContainerFormat::Mp3: return "mp3";
    case ContainerFormat::Asf: return "asf";
    case ContainerFormat::Bmff: return "bmff";
    case ContainerFormat::Matroska: return "matroska";
    }
    return "unknown";
}

}  // namespace metasplice
