#include "metasplice/meta_write.h"

#include "byte_io_internal.h"
#include "field_map_internal.h"
#include "metasplice/block_build.h"
#include "metasplice/block_fields.h"
#include "metasplice/splice.h"
#include "write_result_internal.h"

namespace metasplice {
namespace {

    using detail::LogicalField;

    constexpr ContainerFormat kFmt = ContainerFormat::Asf;

    /// File Properties: GUID + size + File ID, then the u64 file size.
    constexpr uint64_t kFilePropertiesFileSizeOffset = 40;

    struct CdoUpdate final {
        const std::string* title       = nullptr;
        const std::string* author      = nullptr;
        const std::string* copyright   = nullptr;
        const std::string* description = nullptr;
        const std::string* rating      = nullptr;

        bool any() const noexcept
        {
            return title || author || copyright || description || rating;
        }
    };

    struct EcdField final {
        std::string_view name;
        LogicalField field;
        std::string_view key;
    };

    static constexpr EcdField kEcdFields[] = {
        { "WM/AlbumTitle", LogicalField::Album, "ASF:WM/AlbumTitle" },
        { "WM/Genre", LogicalField::Genre, "ASF:WM/Genre" },
        { "WM/Year", LogicalField::Date, "ASF:WM/Year" },
        { "WM/ToolName", LogicalField::Software, "ASF:WM/ToolName" },
    };

    static void set_descriptor(std::vector<AsfDescriptor>* list,
                               AsfDescriptor d)
    {
        for (AsfDescriptor& e : *list) {
            if (e.name == d.name) {
                e = std::move(d);
                return;
            }
        }
        list->push_back(std::move(d));
    }


    static void collect_descriptors(const MetadataRequest& request,
                                    const std::string* artist,
                                    std::vector<AsfDescriptor>* out)
    {
        for (const EcdField& f : kEcdFields) {
            const std::string* v = detail::resolve_field(request, f.field,
                                                         { f.key });
            if (v) {
                set_descriptor(out, make_asf_string_descriptor(f.name, *v));
            }
        }
        if (artist) {
            set_descriptor(out, make_asf_string_descriptor("WM/Author",
                                                           *artist));
        }
        for (const MetadataField& f : request.with_prefix("ASF:WM/")) {
            const std::string_view name = std::string_view(f.key).substr(4);
            set_descriptor(out, make_asf_string_descriptor(name, f.value));
        }
    }


    static void overlay(std::string* dst, const std::string* v)
    {
        if (v) {
            *dst = *v;
        }
    }

}  // namespace

WriteResult
write_asf_metadata(std::span<const std::byte> bytes,
                   const MetadataRequest& request, const WriteOptions& options,
                   std::vector<std::byte>* out) noexcept
{
    out->clear();

    CdoUpdate cdo;
    cdo.title  = detail::resolve_field(request, LogicalField::Title,
                                       { "ASF:Title" });
    cdo.author = detail::resolve_field(request, LogicalField::Artist,
                                       { "ASF:Author" });
    cdo.copyright   = detail::resolve_field(request, LogicalField::Copyright,
                                            { "ASF:Copyright" });
    cdo.description = detail::resolve_field(request, LogicalField::Comment,
                                            { "ASF:Description" });
    cdo.rating      = request.find("ASF:Rating");

    std::vector<AsfDescriptor> updates;
    collect_descriptors(request, cdo.author, &updates);
    if (!cdo.any() && updates.empty()) {
        return detail::write_fail(kFmt, WriteStatus::NoApplicableFields,
                                  "no ASF content fields in request");
    }

    AsfHeader header;
    WriteResult r = parse_asf_header(bytes, options.limits.max_blocks,
                                     &header);
    if (r.status != WriteStatus::Ok) {
        return r;
    }

    const AsfObject* cdo_obj   = nullptr;
    const AsfObject* ecd_obj   = nullptr;
    const AsfObject* props_obj = nullptr;
    SpliceEdit edit;
    int64_t count_delta = 0;
    for (const AsfObject& o : header.objects) {
        if (asf_guid_matches(o.guid, kAsfContentDescription) && cdo.any()) {
            if (cdo_obj) {
                edit.remove(o.offset, o.size);
                count_delta -= 1;
            } else {
                cdo_obj = &o;
            }
        } else if (asf_guid_matches(o.guid, kAsfExtendedContentDescription)
                   && !updates.empty()) {
            if (ecd_obj) {
                edit.remove(o.offset, o.size);
                count_delta -= 1;
            } else {
                ecd_obj = &o;
            }
        } else if (asf_guid_matches(o.guid, kAsfFileProperties) && !props_obj) {
            props_obj = &o;
        }
    }

    if (cdo.any()) {
        AsfContentDescription cd;
        if (cdo_obj) {
            const std::span<const std::byte> obj = bytes.subspan(
                static_cast<size_t>(cdo_obj->offset),
                static_cast<size_t>(cdo_obj->size));
            if (parse_asf_content_description(obj, &cd) != WriteStatus::Ok) {
                return detail::write_fail(kFmt, WriteStatus::Malformed,
                                          "content description runs past "
                                          "its object",
                                          cdo_obj->offset);
            }
        }
        overlay(&cd.title, cdo.title);
        overlay(&cd.author, cdo.author);
        overlay(&cd.copyright, cdo.copyright);
        overlay(&cd.description, cdo.description);
        overlay(&cd.rating, cdo.rating);

        std::vector<std::byte> obj;
        const WriteStatus st = build_asf_content_description(cd, &obj);
        if (st != WriteStatus::Ok) {
            return detail::write_fail(kFmt, st,
                                      "content description string too long");
        }
        if (cdo_obj) {
            edit.replace(cdo_obj->offset, cdo_obj->size, obj);
        } else {
            edit.insert(header.size, obj);
            count_delta += 1;
        }
    }

    if (!updates.empty()) {
        std::vector<AsfDescriptor> descriptors;
        if (ecd_obj) {
            const std::span<const std::byte> obj = bytes.subspan(
                static_cast<size_t>(ecd_obj->offset),
                static_cast<size_t>(ecd_obj->size));
            if (parse_asf_extended_content_description(obj, &descriptors)
                != WriteStatus::Ok) {
                return detail::write_fail(kFmt, WriteStatus::Malformed,
                                          "descriptor runs past its object",
                                          ecd_obj->offset);
            }
        }
        for (AsfDescriptor& d : updates) {
            set_descriptor(&descriptors, std::move(d));
        }

        std::vector<std::byte> obj;
        const WriteStatus st
            = build_asf_extended_content_description(descriptors, &obj);
        if (st != WriteStatus::Ok) {
            return detail::write_fail(kFmt, st, "descriptor too large");
        }
        if (ecd_obj) {
            edit.replace(ecd_obj->offset, ecd_obj->size, obj);
        } else {
            edit.insert(header.size, obj);
            count_delta += 1;
        }
    }

    // Every edit so far lies inside the header object.
    const int64_t delta    = edit.size_delta();
    const int64_t new_size = static_cast<int64_t>(header.size) + delta;
    const int64_t new_count = static_cast<int64_t>(header.declared_count)
                              + count_delta;
    if (new_count < 0 || new_count > static_cast<int64_t>(0xFFFFFFFFU)) {
        return detail::write_fail(kFmt, WriteStatus::StructuralLimit,
                                  "header object count out of range", 24);
    }
    std::vector<std::byte> fields;
    detail::append_u64le(&fields, static_cast<uint64_t>(new_size));
    detail::append_u32le(&fields, static_cast<uint32_t>(new_count));
    edit.replace(16, 12, fields);

    if (props_obj
        && props_obj->size >= kFilePropertiesFileSizeOffset + 8U) {
        const uint64_t at = props_obj->offset + kFilePropertiesFileSizeOffset;
        uint64_t file_size = 0;
        (void)detail::read_u64le(bytes, at, &file_size);
        if (file_size != 0U) {
            std::vector<std::byte> patched;
            detail::append_u64le(&patched,
                                 static_cast<uint64_t>(
                                     static_cast<int64_t>(file_size) + delta));
            edit.replace(at, 8, patched);
        }
    }

    return detail::commit_write(kFmt, bytes, edit, options.limits, out);
}

}  // namespace metasplice
