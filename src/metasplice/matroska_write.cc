#include "metasplice/meta_write.h"

#include "byte_io_internal.h"
#include "field_map_internal.h"
#include "metasplice/block_build.h"
#include "metasplice/splice.h"
#include "metasplice/var_int.h"
#include "write_result_internal.h"

#include <array>

namespace metasplice {
namespace {

    using detail::LogicalField;

    constexpr ContainerFormat kFmt = ContainerFormat::Matroska;

    struct TagField final {
        LogicalField field;
        std::string_view name;
        std::string_view key;
    };

    static constexpr TagField kTagFields[] = {
        { LogicalField::Title, "TITLE", "Matroska:TITLE" },
        { LogicalField::Artist, "ARTIST", "Matroska:ARTIST" },
        { LogicalField::Album, "ALBUM", "Matroska:ALBUM" },
        { LogicalField::Comment, "COMMENT", "Matroska:COMMENT" },
        { LogicalField::Date, "DATE_RELEASED", "Matroska:DATE_RELEASED" },
        { LogicalField::Genre, "GENRE", "Matroska:GENRE" },
        { LogicalField::Copyright, "COPYRIGHT", "Matroska:COPYRIGHT" },
        { LogicalField::Software, "ENCODER", "Matroska:ENCODER" },
    };

    /// A same-width rewrite of one unsigned integer element.
    struct PositionPatch final {
        uint64_t offset = 0;
        std::vector<std::byte> bytes;
    };

    static void set_tag(std::vector<MkvSimpleTag>* tags, std::string_view name,
                        std::string_view value)
    {
        for (MkvSimpleTag& t : *tags) {
            if (t.name == name) {
                t.value = std::string(value);
                return;
            }
        }
        tags->push_back(MkvSimpleTag { std::string(name), std::string(value) });
    }


    static void collect_tags(const MetadataRequest& request,
                             std::vector<MkvSimpleTag>* tags)
    {
        for (const TagField& f : kTagFields) {
            const std::string* v = detail::resolve_field(request, f.field,
                                                         { f.key });
            if (v) {
                set_tag(tags, f.name, *v);
            }
        }
        for (const MetadataField& f : request.with_prefix("Matroska:")) {
            const std::string_view name = key_local_name(f.key);
            if (!name.empty()) {
                set_tag(tags, name, f.value);
            }
        }
    }


    static bool read_uint(std::span<const std::byte> bytes,
                          const EbmlElement& e, uint64_t* out) noexcept
    {
        if (e.size > 8U) {
            return false;
        }
        uint64_t v = 0;
        for (uint64_t i = 0; i < e.size; ++i) {
            v = (v << 8)
                | detail::u8(bytes[static_cast<size_t>(e.payload_offset + i)]);
        }
        *out = v;
        return true;
    }


    /// Rewrites \p e (a segment-relative position) as \p value.
    static WriteResult patch_position(const EbmlElement& e, uint64_t value,
                                      std::vector<PositionPatch>* out)
    {
        if (e.size < 8U && (value >> (8U * e.size)) != 0U) {
            return detail::write_fail(kFmt, WriteStatus::StructuralLimit,
                                      "position outgrows its element",
                                      e.offset, e.size, value);
        }
        PositionPatch p;
        p.offset = e.payload_offset;
        for (uint64_t i = e.size; i > 0; --i) {
            detail::append_u8(&p.bytes,
                              static_cast<uint8_t>(value >> (8U * (i - 1U))));
        }
        out->push_back(std::move(p));
        return detail::write_ok(kFmt);
    }


    /**
     * \brief Re-maps the SeekHead and Cues positions of \p index through
     * \p edit.
     *
     * A SeekHead entry naming `Tags` is pointed at \p tags_position.
     */
    static WriteResult collect_index_patches(std::span<const std::byte> bytes,
                                             const EbmlElement& segment,
                                             const EbmlElement& index,
                                             uint32_t max_blocks,
                                             const SpliceEdit& edit,
                                             uint64_t tags_position,
                                             std::vector<PositionPatch>* out)
    {
        const bool seek_head = index.id == kMkvSeekHeadId;
        const uint32_t entry_id = seek_head ? kMkvSeekId : kMkvCuePointId;

        std::vector<EbmlElement> entries;
        WriteResult r = parse_ebml_children(bytes, index.payload_offset,
                                            index.end, max_blocks, &entries);
        if (r.status != WriteStatus::Ok) {
            return r;
        }
        std::vector<EbmlElement> fields;
        std::vector<EbmlElement> track_fields;
        for (const EbmlElement& entry : entries) {
            if (entry.id != entry_id) {
                continue;
            }
            r = parse_ebml_children(bytes, entry.payload_offset, entry.end,
                                    max_blocks, &fields);
            if (r.status != WriteStatus::Ok) {
                return r;
            }

            if (seek_head) {
                uint64_t target = 0;
                const EbmlElement* position = nullptr;
                for (const EbmlElement& f : fields) {
                    if (f.id == kMkvSeekIdId) {
                        (void)read_uint(bytes, f, &target);
                    } else if (f.id == kMkvSeekPositionId) {
                        position = &f;
                    }
                }
                uint64_t old_pos = 0;
                if (!position || !read_uint(bytes, *position, &old_pos)) {
                    continue;
                }
                const uint64_t new_pos
                    = target == kMkvTagsId
                          ? tags_position
                          : edit.map_offset(segment.payload_offset + old_pos)
                                - segment.payload_offset;
                if (new_pos != old_pos) {
                    r = patch_position(*position, new_pos, out);
                    if (r.status != WriteStatus::Ok) {
                        return r;
                    }
                }
                continue;
            }

            for (const EbmlElement& f : fields) {
                if (f.id != kMkvCueTrackPositionsId) {
                    continue;
                }
                r = parse_ebml_children(bytes, f.payload_offset, f.end,
                                        max_blocks, &track_fields);
                if (r.status != WriteStatus::Ok) {
                    return r;
                }
                for (const EbmlElement& t : track_fields) {
                    uint64_t old_pos = 0;
                    if (t.id != kMkvCueClusterPositionId
                        || !read_uint(bytes, t, &old_pos)) {
                        continue;
                    }
                    const uint64_t new_pos
                        = edit.map_offset(segment.payload_offset + old_pos)
                          - segment.payload_offset;
                    if (new_pos != old_pos) {
                        r = patch_position(t, new_pos, out);
                        if (r.status != WriteStatus::Ok) {
                            return r;
                        }
                    }
                }
            }
        }
        return detail::write_ok(kFmt);
    }


    static WriteResult find_segment(std::span<const std::byte> bytes,
                                    uint32_t max_blocks, EbmlElement* out)
    {
        EbmlElement header;
        WriteResult r = parse_ebml_element(bytes, 0, bytes.size(), &header);
        if (r.status != WriteStatus::Ok || header.id != kEbmlHeaderId) {
            return detail::write_fail(kFmt, WriteStatus::FormatError,
                                      "missing EBML header");
        }
        if (header.unknown_size) {
            return detail::write_fail(kFmt, WriteStatus::UnsupportedLayout,
                                      "EBML header has unknown size");
        }
        uint64_t pos = header.end;
        for (uint32_t n = 0; n < max_blocks && pos < bytes.size(); ++n) {
            EbmlElement e;
            r = parse_ebml_element(bytes, pos, bytes.size(), &e);
            if (r.status != WriteStatus::Ok) {
                return r;
            }
            if (e.id == kMkvSegmentId) {
                *out = e;
                return detail::write_ok(kFmt);
            }
            if (e.unknown_size) {
                break;
            }
            pos = e.end;
        }
        return detail::write_fail(kFmt, WriteStatus::UnsupportedLayout,
                                  "no Segment element", pos);
    }

}  // namespace

WriteResult
write_matroska_metadata(std::span<const std::byte> bytes,
                        const MetadataRequest& request,
                        const WriteOptions& options,
                        std::vector<std::byte>* out) noexcept
{
    out->clear();

    std::vector<MkvSimpleTag> tags;
    collect_tags(request, &tags);
    if (tags.empty()) {
        return detail::write_fail(kFmt, WriteStatus::NoApplicableFields,
                                  "no Matroska tag fields in request");
    }
    if (!options.vendor.empty()) {
        bool named = false;
        for (const MkvSimpleTag& t : tags) {
            named = named || t.name == "PROCESSING_SOFTWARE";
        }
        if (!named) {
            tags.push_back(MkvSimpleTag { "PROCESSING_SOFTWARE",
                                          options.vendor });
        }
    }

    EbmlElement segment;
    WriteResult r = find_segment(bytes, options.limits.max_blocks, &segment);
    if (r.status != WriteStatus::Ok) {
        return r;
    }
    std::vector<EbmlElement> children;
    r = parse_ebml_children(bytes, segment.payload_offset, segment.end,
                            options.limits.max_blocks, &children);
    if (r.status != WriteStatus::Ok) {
        return r;
    }

    std::vector<std::byte> element;
    const WriteStatus st = build_mkv_tags(tags, &element);
    if (st != WriteStatus::Ok) {
        return detail::write_fail(kFmt, st, "Tags element too large");
    }

    SpliceEdit edit;
    uint64_t insert_at = segment.end;
    bool have_cluster  = false;
    for (const EbmlElement& c : children) {
        if (c.id == kMkvTagsId) {
            edit.remove(c.offset, c.end - c.offset);
        } else if (c.id == kMkvClusterId && !have_cluster) {
            insert_at    = c.offset;
            have_cluster = true;
        }
    }
    // An open-ended last child runs to the end of the segment.
    if (!have_cluster && !children.empty() && children.back().unknown_size) {
        insert_at = children.back().offset;
    }
    edit.insert(insert_at, element);

    const uint64_t tags_position = edit.map_offset(insert_at) - element.size()
                                   - segment.payload_offset;
    std::vector<PositionPatch> patches;
    for (const EbmlElement& c : children) {
        if (c.id != kMkvSeekHeadId && c.id != kMkvCuesId) {
            continue;
        }
        r = collect_index_patches(bytes, segment, c, options.limits.max_blocks,
                                  edit, tags_position, &patches);
        if (r.status != WriteStatus::Ok) {
            return r;
        }
    }

    if (!segment.unknown_size) {
        const uint64_t new_size = static_cast<uint64_t>(
            static_cast<int64_t>(segment.size) + edit.size_delta());
        std::array<std::byte, 8> field {};
        if (!encode_ebml_size(new_size, segment.size_width,
                              std::span<std::byte>(field.data(),
                                                   segment.size_width))) {
            return detail::write_fail(kFmt, WriteStatus::StructuralLimit,
                                      "Segment size outgrows its field",
                                      segment.offset + segment.id_width,
                                      segment.size_width,
                                      ebml_size_min_width(new_size));
        }
        edit.replace(segment.offset + segment.id_width, segment.size_width,
                     std::span<const std::byte>(field.data(),
                                                segment.size_width));
    }
    for (const PositionPatch& p : patches) {
        edit.replace(p.offset, p.bytes.size(), p.bytes);
    }
    return detail::commit_write(kFmt, bytes, edit, options.limits, out);
}

}  // namespace metasplice
