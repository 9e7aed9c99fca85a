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

    struct InfoField final {
        uint32_t id;
        LogicalField field;
        std::string_view key;
    };

    static constexpr InfoField kInfoFields[] = {
        { fourcc('I', 'N', 'A', 'M'), LogicalField::Title, "RIFF:INAM" },
        { fourcc('I', 'A', 'R', 'T'), LogicalField::Artist, "RIFF:IART" },
        { fourcc('I', 'P', 'R', 'D'), LogicalField::Album, "RIFF:IPRD" },
        { fourcc('I', 'C', 'M', 'T'), LogicalField::Comment, "RIFF:ICMT" },
        { fourcc('I', 'C', 'R', 'D'), LogicalField::Date, "RIFF:ICRD" },
        { fourcc('I', 'G', 'N', 'R'), LogicalField::Genre, "RIFF:IGNR" },
        { fourcc('I', 'C', 'O', 'P'), LogicalField::Copyright, "RIFF:ICOP" },
        { fourcc('I', 'S', 'F', 'T'), LogicalField::Software, "RIFF:ISFT" },
    };

    static bool is_info_list(const RiffChunk& c) noexcept
    {
        return c.id == fourcc('L', 'I', 'S', 'T')
               && c.list_type == fourcc('I', 'N', 'F', 'O');
    }


    static void set_entry(std::vector<RiffInfoEntry>* entries, uint32_t id,
                          std::string_view text)
    {
        for (RiffInfoEntry& e : *entries) {
            if (e.id == id) {
                e.text = std::string(text);
                return;
            }
        }
        entries->push_back(RiffInfoEntry { id, std::string(text) });
    }


    static WriteResult collect_updates(const MetadataRequest& request,
                                       std::vector<RiffInfoEntry>* updates)
    {
        for (const InfoField& f : kInfoFields) {
            const std::string* v = detail::resolve_field(request, f.field,
                                                         { f.key });
            if (v) {
                set_entry(updates, f.id, *v);
            }
        }
        for (const MetadataField& f : request.with_prefix("RIFF:")) {
            const std::string_view id = std::string_view(f.key).substr(5);
            if (id.size() != 4U) {
                return detail::write_fail(ContainerFormat::Riff,
                                          WriteStatus::UnsupportedField,
                                          "RIFF key is not a FourCC");
            }
            set_entry(updates, fourcc(id[0], id[1], id[2], id[3]), f.value);
        }
        return detail::write_ok(ContainerFormat::Riff);
    }

}  // namespace

WriteResult
write_riff_metadata(std::span<const std::byte> bytes,
                    const MetadataRequest& request,
                    const WriteOptions& options,
                    std::vector<std::byte>* out) noexcept
{
    constexpr ContainerFormat kFmt = ContainerFormat::Riff;
    out->clear();

    std::vector<RiffInfoEntry> updates;
    WriteResult r = collect_updates(request, &updates);
    if (r.status != WriteStatus::Ok) {
        return r;
    }
    if (updates.empty()) {
        return detail::write_fail(kFmt, WriteStatus::NoApplicableFields,
                                  "no RIFF INFO fields in request");
    }

    RiffLayout layout;
    r = parse_riff_layout(bytes, options.limits.max_blocks, &layout);
    if (r.status != WriteStatus::Ok) {
        return r;
    }

    // Existing entries survive unless overwritten; every INFO list goes.
    std::vector<RiffInfoEntry> entries;
    SpliceEdit edit;
    for (const RiffChunk& c : layout.chunks) {
        if (!is_info_list(c)) {
            continue;
        }
        std::vector<RiffInfoEntry> old;
        const std::span<const std::byte> data
            = bytes.subspan(static_cast<size_t>(c.offset + 8U), c.data_size);
        if (parse_riff_info_list(data, &old) != WriteStatus::Ok) {
            return detail::write_fail(kFmt, WriteStatus::Malformed,
                                      "INFO entry runs past its list",
                                      c.offset);
        }
        for (const RiffInfoEntry& e : old) {
            set_entry(&entries, e.id, e.text);
        }
        edit.remove(c.offset, c.size);
    }
    for (const RiffInfoEntry& e : updates) {
        set_entry(&entries, e.id, e.text);
    }

    std::vector<std::byte> list;
    // An unpadded odd final chunk needs its pad byte before the new list.
    bool odd_tail = (layout.end & 1U) != 0U;
    if (!layout.chunks.empty()) {
        const RiffChunk& last = layout.chunks.back();
        if (is_info_list(last) && last.offset + last.size == layout.end) {
            odd_tail = false;
        }
    }
    if (odd_tail) {
        detail::append_u8(&list, 0);
    }
    const WriteStatus st = build_riff_info_list(entries, &list);
    if (st != WriteStatus::Ok) {
        return detail::write_fail(kFmt, st, "INFO entry too large");
    }
    edit.insert(layout.end, list);

    const int64_t new_size = static_cast<int64_t>(layout.declared_size)
                             + edit.size_delta();
    if (new_size > static_cast<int64_t>(0xFFFFFFFFU)) {
        return detail::write_fail(kFmt, WriteStatus::StructuralLimit,
                                  "RIFF size exceeds 32 bits", 4, 0xFFFFFFFFU,
                                  static_cast<uint64_t>(new_size));
    }
    std::vector<std::byte> size_field;
    detail::append_u32le(&size_field, static_cast<uint32_t>(new_size));
    edit.replace(4, 4, size_field);

    return detail::commit_write(kFmt, bytes, edit, options.limits, out);
}

}  // namespace metasplice
