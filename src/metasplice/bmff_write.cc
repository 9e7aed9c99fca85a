#include "metasplice/meta_write.h"

#include "byte_io_internal.h"
#include "field_map_internal.h"
#include "metasplice/block_build.h"
#include "metasplice/splice.h"
#include "write_result_internal.h"

namespace metasplice {
namespace {

    using detail::LogicalField;

    constexpr ContainerFormat kFmt = ContainerFormat::Bmff;

    static constexpr uint64_t kU32Max = 0xFFFFFFFFU;
    /// trak > mdia > minf > stbl.
    static constexpr uint32_t kMaxOffsetDepth = 4;

    static constexpr uint32_t kMoov = fourcc('m', 'o', 'o', 'v');
    static constexpr uint32_t kUdta = fourcc('u', 'd', 't', 'a');
    static constexpr uint32_t kMeta = fourcc('m', 'e', 't', 'a');
    static constexpr uint32_t kHdlr = fourcc('h', 'd', 'l', 'r');
    static constexpr uint32_t kIlst = fourcc('i', 'l', 's', 't');
    static constexpr uint32_t kUuid = fourcc('u', 'u', 'i', 'd');
    static constexpr uint32_t kStco = fourcc('s', 't', 'c', 'o');
    static constexpr uint32_t kCo64 = fourcc('c', 'o', '6', '4');

    /// `©xxx` item codes.
    static constexpr uint32_t qt_code(char b, char c, char d) noexcept
    {
        return fourcc('\0', b, c, d) | 0xA9000000U;
    }

    struct IlstName final {
        std::string_view name;
        uint32_t type;
    };

    static constexpr IlstName kIlstNames[] = {
        { "Title", qt_code('n', 'a', 'm') },
        { "Artist", qt_code('A', 'R', 'T') },
        { "Album", qt_code('a', 'l', 'b') },
        { "Comment", qt_code('c', 'm', 't') },
        { "Date", qt_code('d', 'a', 'y') },
        { "Genre", qt_code('g', 'e', 'n') },
        { "Copyright", fourcc('c', 'p', 'r', 't') },
        { "Software", qt_code('t', 'o', 'o') },
        { "Encoder", qt_code('t', 'o', 'o') },
        { "Description", fourcc('d', 'e', 's', 'c') },
        { "Composer", qt_code('w', 'r', 't') },
        { "AlbumArtist", fourcc('a', 'A', 'R', 'T') },
    };

    struct IlstField final {
        LogicalField field;
        uint32_t type;
        std::string_view key;
    };

    static constexpr IlstField kIlstFields[] = {
        { LogicalField::Title, qt_code('n', 'a', 'm'), "QuickTime:Title" },
        { LogicalField::Artist, qt_code('A', 'R', 'T'), "QuickTime:Artist" },
        { LogicalField::Album, qt_code('a', 'l', 'b'), "QuickTime:Album" },
        { LogicalField::Comment, qt_code('c', 'm', 't'), "QuickTime:Comment" },
        { LogicalField::Date, qt_code('d', 'a', 'y'), "QuickTime:Date" },
        { LogicalField::Genre, qt_code('g', 'e', 'n'), "QuickTime:Genre" },
        { LogicalField::Copyright, fourcc('c', 'p', 'r', 't'),
          "QuickTime:Copyright" },
        { LogicalField::Software, qt_code('t', 'o', 'o'),
          "QuickTime:Software" },
    };

    /// Tag classes stored outside `moov/udta/meta/ilst`.
    static constexpr std::string_view kRejectedGroups[] = {
        "QuickTimeKeys:", "Keys:",      "MicrosoftXtra:",
        "Xtra:",          "AudioKeys:", "VideoKeys:",
    };

    struct OffsetPatch final {
        uint64_t offset = 0;
        std::vector<std::byte> bytes;
    };

    static void set_item(std::vector<BmffTextItem>* items, uint32_t type,
                         std::string_view value)
    {
        for (BmffTextItem& it : *items) {
            if (it.type == type) {
                it.value = std::string(value);
                return;
            }
        }
        items->push_back(BmffTextItem { type, std::string(value) });
    }


    static bool contains_type(std::span<const BmffTextItem> items,
                              uint32_t type) noexcept
    {
        for (const BmffTextItem& it : items) {
            if (it.type == type) {
                return true;
            }
        }
        return false;
    }


    static bool item_type_for_name(std::string_view name,
                                   uint32_t* type) noexcept
    {
        for (const IlstName& n : kIlstNames) {
            if (detail::iequals(n.name, name)) {
                *type = n.type;
                return true;
            }
        }
        if (name.size() == 4U) {
            *type = fourcc(name[0], name[1], name[2], name[3]);
            return true;
        }
        // "©nam" spelled in UTF-8.
        if (name.size() == 5U && static_cast<uint8_t>(name[0]) == 0xC2U
            && static_cast<uint8_t>(name[1]) == 0xA9U) {
            *type = qt_code(name[2], name[3], name[4]);
            return true;
        }
        return false;
    }


    static WriteResult collect_items(const MetadataRequest& request,
                                     std::vector<BmffTextItem>* items)
    {
        // XMP:* keys go to the XMP uuid atom only.
        for (const IlstField& f : kIlstFields) {
            const std::string* v = detail::resolve_field(request, f.field,
                                                         { f.key }, false);
            if (v) {
                set_item(items, f.type, *v);
            }
        }
        for (const MetadataField& f : request.with_prefix("QuickTime:")) {
            uint32_t type = 0;
            if (!item_type_for_name(key_local_name(f.key), &type)) {
                return detail::write_fail(kFmt, WriteStatus::UnsupportedField,
                                          "unknown QuickTime item name");
            }
            set_item(items, type, f.value);
        }
        return detail::write_ok(kFmt);
    }


    static bool is_xmp_uuid(const BmffAtom& a) noexcept
    {
        return a.type == kUuid && a.has_uuid && a.uuid == kBmffXmpUuid;
    }


    /**
     * \brief Records a size change of \p delta for \p atom.
     *
     * 64-bit atoms stay 64-bit; a 32-bit atom that outgrows its field is
     * rewritten in the 64-bit form and \p grown receives the 8 extra header
     * bytes. An open-ended atom stays open when \p keep_open is set.
     */
    static void resize_atom(const BmffAtom& atom, int64_t delta,
                            bool keep_open, SpliceEdit* edit, int64_t* grown)
    {
        *grown = 0;
        if (atom.to_end && keep_open) {
            return;
        }
        const uint64_t new_size = static_cast<uint64_t>(
            static_cast<int64_t>(atom.size) + delta);
        std::vector<std::byte> field;
        if (atom.large_size) {
            detail::append_u64be(&field, new_size);
            edit->replace(atom.offset + 8U, 8, field);
        } else if (new_size <= kU32Max) {
            detail::append_u32be(&field, static_cast<uint32_t>(new_size));
            edit->replace(atom.offset, 4, field);
        } else {
            detail::append_u32be(&field, 1);
            detail::append_fourcc(&field, atom.type);
            detail::append_u64be(&field, new_size + 8U);
            edit->replace(atom.offset, 8, field);
            *grown = 8;
        }
    }


    /// Copies the `ilst` children of \p meta whose type is not rewritten.
    static WriteResult collect_kept_items(std::span<const std::byte> bytes,
                                          const BmffAtom& meta,
                                          std::span<const BmffTextItem> items,
                                          uint32_t max_blocks,
                                          std::vector<std::byte>* kept)
    {
        if (meta.size < meta.header_size + 4U) {
            return detail::write_ok(kFmt);
        }
        // ISO `meta` is a full box; older QuickTime files omit the version.
        uint64_t begin = meta.payload_offset() + 4U;
        uint32_t type  = 0;
        if (detail::read_u32be(bytes, meta.payload_offset() + 4U, &type)
            && type == kHdlr) {
            begin = meta.payload_offset();
        }

        std::vector<BmffAtom> children;
        WriteResult r = parse_bmff_children(bytes, begin, meta.end(),
                                            max_blocks, &children);
        if (r.status != WriteStatus::Ok) {
            return r;
        }
        for (const BmffAtom& c : children) {
            if (c.type != kIlst) {
                continue;
            }
            std::vector<BmffAtom> entries;
            r = parse_bmff_children(bytes, c.payload_offset(), c.end(),
                                    max_blocks, &entries);
            if (r.status != WriteStatus::Ok) {
                return r;
            }
            for (const BmffAtom& e : entries) {
                if (!contains_type(items, e.type)) {
                    detail::append_span(
                        kept, bytes.subspan(static_cast<size_t>(e.offset),
                                            static_cast<size_t>(e.size)));
                }
            }
            break;
        }
        return detail::write_ok(kFmt);
    }


    static WriteResult rewrite_udta(std::span<const std::byte> bytes,
                                    const BmffAtom& moov,
                                    std::span<const BmffTextItem> items,
                                    const WriteOptions& options,
                                    bool keep_open, SpliceEdit* edit)
    {
        const uint32_t max_blocks = options.limits.max_blocks;
        std::vector<BmffAtom> children;
        WriteResult r = parse_bmff_children(bytes, moov.payload_offset(),
                                            moov.end(), max_blocks,
                                            &children);
        if (r.status != WriteStatus::Ok) {
            return r;
        }

        const BmffAtom* udta = nullptr;
        for (const BmffAtom& c : children) {
            if (c.type == kUdta) {
                udta = &c;
                break;
            }
        }

        std::vector<std::byte> kept;
        uint64_t used    = 0;
        int64_t removed  = 0;
        uint64_t insert_at = children.empty() ? moov.payload_offset()
                                              : children.back().end();
        if (udta) {
            std::vector<BmffAtom> entries;
            r = parse_bmff_children(bytes, udta->payload_offset(),
                                    udta->end(), max_blocks, &entries);
            if (r.status != WriteStatus::Ok) {
                return r;
            }
            bool first_meta = true;
            for (const BmffAtom& e : entries) {
                if (e.type == kMeta) {
                    if (first_meta) {
                        r = collect_kept_items(bytes, e, items, max_blocks,
                                               &kept);
                        if (r.status != WriteStatus::Ok) {
                            return r;
                        }
                        first_meta = false;
                    }
                } else if (e.type != fourcc('f', 'r', 'e', 'e')
                           && e.type != fourcc('s', 'k', 'i', 'p')) {
                    used += e.size;
                    continue;
                }
                edit->remove(e.offset, e.size);
                removed += static_cast<int64_t>(e.size);
            }
            // Insert ahead of a trailing zero terminator, if any.
            insert_at = entries.empty() ? udta->payload_offset()
                                        : entries.back().end();
        }

        std::vector<std::byte> meta;
        build_bmff_meta(items, options.bmff.handler_type, kept, &meta);
        used += meta.size();
        build_bmff_padding(used, options.bmff.padding, &meta);

        int64_t moov_delta = 0;
        int64_t grown      = 0;
        if (udta) {
            edit->insert(insert_at, meta);
            const int64_t delta = static_cast<int64_t>(meta.size()) - removed;
            resize_atom(*udta, delta, false, edit, &grown);
            moov_delta = delta + grown;
        } else {
            std::vector<std::byte> atom;
            append_bmff_atom(kUdta, meta, &atom);
            edit->insert(insert_at, atom);
            moov_delta = static_cast<int64_t>(atom.size());
        }
        resize_atom(moov, moov_delta, keep_open, edit, &grown);
        return detail::write_ok(kFmt);
    }


    static bool is_offset_container(uint32_t type) noexcept
    {
        return type == fourcc('t', 'r', 'a', 'k')
               || type == fourcc('m', 'd', 'i', 'a')
               || type == fourcc('m', 'i', 'n', 'f')
               || type == fourcc('s', 't', 'b', 'l');
    }


    /// Re-maps every `stco`/`co64` entry below \p parent through \p edit.
    static WriteResult collect_chunk_offsets(std::span<const std::byte> bytes,
                                             const BmffAtom& parent,
                                             uint32_t max_blocks,
                                             uint32_t depth,
                                             const SpliceEdit& edit,
                                             std::vector<OffsetPatch>* out)
    {
        std::vector<BmffAtom> children;
        WriteResult r = parse_bmff_children(bytes, parent.payload_offset(),
                                            parent.end(), max_blocks,
                                            &children);
        if (r.status != WriteStatus::Ok) {
            return r;
        }
        for (const BmffAtom& a : children) {
            if (is_offset_container(a.type) && depth < kMaxOffsetDepth) {
                r = collect_chunk_offsets(bytes, a, max_blocks, depth + 1U,
                                          edit, out);
                if (r.status != WriteStatus::Ok) {
                    return r;
                }
                continue;
            }
            const bool wide = a.type == kCo64;
            if (a.type != kStco && !wide) {
                continue;
            }

            uint32_t count = 0;
            if (a.size < a.header_size + 8U
                || !detail::read_u32be(bytes, a.payload_offset() + 4U,
                                       &count)) {
                return detail::write_fail(kFmt, WriteStatus::Malformed,
                                          "chunk offset table truncated",
                                          a.offset);
            }
            const uint64_t first = a.payload_offset() + 8U;
            const uint64_t width = wide ? 8U : 4U;
            if ((a.end() - first) / width < count) {
                return detail::write_fail(kFmt, WriteStatus::Malformed,
                                          "chunk offset table runs past its "
                                          "atom",
                                          a.offset, count,
                                          (a.end() - first) / width);
            }

            OffsetPatch patch;
            patch.offset = first;
            patch.bytes.reserve(static_cast<size_t>(count * width));
            bool changed = false;
            for (uint32_t i = 0; i < count; ++i) {
                const uint64_t at = first + i * width;
                uint64_t v        = 0;
                if (wide) {
                    (void)detail::read_u64be(bytes, at, &v);
                } else {
                    uint32_t v32 = 0;
                    (void)detail::read_u32be(bytes, at, &v32);
                    v = v32;
                }
                const uint64_t mapped = edit.map_offset(v);
                changed               = changed || mapped != v;
                if (wide) {
                    detail::append_u64be(&patch.bytes, mapped);
                } else if (mapped > kU32Max) {
                    return detail::write_fail(kFmt,
                                              WriteStatus::StructuralLimit,
                                              "chunk offset exceeds 32 bits",
                                              at, kU32Max, mapped);
                } else {
                    detail::append_u32be(&patch.bytes,
                                         static_cast<uint32_t>(mapped));
                }
            }
            if (changed) {
                out->push_back(std::move(patch));
            }
        }
        return detail::write_ok(kFmt);
    }

}  // namespace

WriteResult
write_bmff_metadata(std::span<const std::byte> bytes,
                    const MetadataRequest& request,
                    const WriteOptions& options,
                    std::vector<std::byte>* out) noexcept
{
    out->clear();

    for (std::string_view group : kRejectedGroups) {
        if (request.has_prefix(group)) {
            return detail::write_fail(kFmt, WriteStatus::UnsupportedField,
                                      "tag class is not written");
        }
    }
    std::vector<BmffTextItem> items;
    WriteResult r = collect_items(request, &items);
    if (r.status != WriteStatus::Ok) {
        return r;
    }

    std::vector<BmffAtom> top;
    r = parse_bmff_children(bytes, 0, bytes.size(), options.limits.max_blocks,
                            &top);
    if (r.status != WriteStatus::Ok) {
        return r;
    }
    if (top.empty()) {
        return detail::write_fail(kFmt, WriteStatus::FormatError,
                                  "no top-level atoms");
    }

    std::span<const std::byte> old_xmp;
    const BmffAtom* moov = nullptr;
    for (const BmffAtom& a : top) {
        if (is_xmp_uuid(a) && old_xmp.empty()) {
            old_xmp = bytes.subspan(static_cast<size_t>(a.payload_offset()),
                                    static_cast<size_t>(a.end()
                                                        - a.payload_offset()));
        } else if (a.type == kMoov && !moov) {
            moov = &a;
        }
    }

    std::vector<std::byte> packet;
    const bool write_xmp = build_xmp_packet(request, old_xmp, options.xmp,
                                            &packet);
    if (!write_xmp && items.empty()) {
        return detail::write_fail(kFmt, WriteStatus::NoApplicableFields,
                                  "no QuickTime or XMP fields in request");
    }

    SpliceEdit edit;
    if (!items.empty()) {
        if (!moov) {
            return detail::write_fail(kFmt, WriteStatus::UnsupportedLayout,
                                      "no moov atom");
        }
        r = rewrite_udta(bytes, *moov, items, options, !write_xmp, &edit);
        if (r.status != WriteStatus::Ok) {
            return r;
        }
    }

    if (write_xmp) {
        for (const BmffAtom& a : top) {
            if (is_xmp_uuid(a)) {
                edit.remove(a.offset, a.size);
            }
        }
        // An open-ended last atom would swallow the appended packet.
        const BmffAtom& last = top.back();
        const bool resized   = !items.empty() && &last == moov;
        if (last.to_end && !is_xmp_uuid(last) && !resized) {
            if (last.size > kU32Max) {
                return detail::write_fail(kFmt, WriteStatus::StructuralLimit,
                                          "open-ended atom too large to "
                                          "close",
                                          last.offset, kU32Max, last.size);
            }
            std::vector<std::byte> field;
            detail::append_u32be(&field, static_cast<uint32_t>(last.size));
            edit.replace(last.offset, 4, field);
        }
        std::vector<std::byte> atom;
        build_bmff_xmp_uuid(packet, &atom);
        edit.insert(bytes.size(), atom);
    }

    if (moov) {
        std::vector<OffsetPatch> patches;
        r = collect_chunk_offsets(bytes, *moov, options.limits.max_blocks, 0,
                                  edit, &patches);
        if (r.status != WriteStatus::Ok) {
            return r;
        }
        for (const OffsetPatch& p : patches) {
            edit.replace(p.offset, p.bytes.size(), p.bytes);
        }
    }
    return detail::commit_write(kFmt, bytes, edit, options.limits, out);
}

}  // namespace metasplice
