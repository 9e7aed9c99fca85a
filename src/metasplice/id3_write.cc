#include "metasplice/meta_write.h"

#include "byte_io_internal.h"
#include "field_map_internal.h"
#include "metasplice/block_build.h"
#include "metasplice/splice.h"
#include "metasplice/var_int.h"
#include "write_result_internal.h"

namespace metasplice {
namespace {

    using detail::LogicalField;

    constexpr ContainerFormat kFmt = ContainerFormat::Mp3;

    struct TextFrame final {
        uint32_t id = 0;
        std::string value;
    };

    struct FrameField final {
        uint32_t id;
        LogicalField field;
        std::string_view key;
    };

    static constexpr FrameField kFrameFields[] = {
        { fourcc('T', 'I', 'T', '2'), LogicalField::Title, "ID3:TIT2" },
        { fourcc('T', 'P', 'E', '1'), LogicalField::Artist, "ID3:TPE1" },
        { fourcc('T', 'A', 'L', 'B'), LogicalField::Album, "ID3:TALB" },
        { fourcc('T', 'C', 'O', 'N'), LogicalField::Genre, "ID3:TCON" },
        { fourcc('T', 'C', 'O', 'P'), LogicalField::Copyright, "ID3:TCOP" },
        { fourcc('T', 'S', 'S', 'E'), LogicalField::Software, "ID3:TSSE" },
    };

    static void set_frame(std::vector<TextFrame>* frames, uint32_t id,
                          std::string_view value)
    {
        for (TextFrame& f : *frames) {
            if (f.id == id) {
                f.value = std::string(value);
                return;
            }
        }
        frames->push_back(TextFrame { id, std::string(value) });
    }


    static bool is_frame_id(std::string_view id) noexcept
    {
        if (id.size() != 4U) {
            return false;
        }
        for (char c : id) {
            if (!((c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9'))) {
                return false;
            }
        }
        return true;
    }


    static WriteResult collect_updates(const MetadataRequest& request,
                                       uint8_t major,
                                       std::vector<TextFrame>* updates)
    {
        for (const FrameField& f : kFrameFields) {
            const std::string* v = detail::resolve_field(request, f.field,
                                                         { f.key });
            if (v) {
                set_frame(updates, f.id, *v);
            }
        }
        // The recording date frame changed between 2.3 and 2.4.
        const uint32_t date_id = major == 4U ? fourcc('T', 'D', 'R', 'C')
                                             : fourcc('T', 'Y', 'E', 'R');
        const std::string* date = detail::resolve_field(
            request, LogicalField::Date, { "ID3:TDRC", "ID3:TYER" });
        if (date) {
            set_frame(updates, date_id, *date);
        }

        for (const MetadataField& f : request.with_prefix("ID3:")) {
            const std::string_view id = std::string_view(f.key).substr(4);
            if (!is_frame_id(id) || id[0] != 'T' || id == "TXXX") {
                return detail::write_fail(kFmt, WriteStatus::UnsupportedField,
                                          "only ID3 text frames are written");
            }
            if (id == "TDRC" || id == "TYER") {
                continue;
            }
            set_frame(updates, fourcc(id[0], id[1], id[2], id[3]), f.value);
        }
        return detail::write_ok(kFmt);
    }

}  // namespace

WriteResult
write_id3_metadata(std::span<const std::byte> bytes,
                   const MetadataRequest& request, const WriteOptions& options,
                   std::vector<std::byte>* out) noexcept
{
    out->clear();

    Id3Tag tag;
    bool have_tag = false;
    if (detail::match(bytes, 0, "ID3", 3)) {
        const WriteResult r = parse_id3_tag(bytes, 0, options.limits.max_blocks,
                                            &tag);
        if (r.status != WriteStatus::Ok) {
            return r;
        }
        have_tag = true;
    }
    // Tags we cannot walk frame by frame are replaced by a fresh 2.3 tag.
    const bool keep_frames = have_tag && (tag.major == 3U || tag.major == 4U)
                             && !tag.unsynchronised()
                             && !tag.has_extended_header();
    const uint8_t major = keep_frames ? tag.major : 3U;

    std::vector<TextFrame> updates;
    WriteResult r = collect_updates(request, major, &updates);
    if (r.status != WriteStatus::Ok) {
        return r;
    }
    if (updates.empty()) {
        return detail::write_fail(kFmt, WriteStatus::NoApplicableFields,
                                  "no ID3 text fields in request");
    }

    std::vector<std::byte> frames;
    std::vector<bool> written(updates.size(), false);
    const auto emit = [&](size_t i) -> WriteStatus {
        written[i] = true;
        return build_id3_text_frame(major, updates[i].id, updates[i].value,
                                    &frames);
    };

    if (keep_frames) {
        for (const Id3Frame& f : tag.frames) {
            size_t hit = updates.size();
            for (size_t i = 0; i < updates.size(); ++i) {
                if (updates[i].id == f.id) {
                    hit = i;
                    break;
                }
            }
            if (hit == updates.size()) {
                detail::append_span(&frames,
                                    bytes.subspan(static_cast<size_t>(
                                                      f.offset),
                                                  static_cast<size_t>(f.size)));
                continue;
            }
            if (!written[hit]) {
                const WriteStatus st = emit(hit);
                if (st != WriteStatus::Ok) {
                    return detail::write_fail(kFmt, st, "text frame too large",
                                              f.offset);
                }
            }
        }
    }
    for (size_t i = 0; i < updates.size(); ++i) {
        if (written[i]) {
            continue;
        }
        const WriteStatus st = emit(i);
        if (st != WriteStatus::Ok) {
            return detail::write_fail(kFmt, st, "text frame too large");
        }
    }

    if (frames.size() > kSynchsafeMax) {
        return detail::write_fail(kFmt, WriteStatus::StructuralLimit,
                                  "ID3 tag exceeds 28-bit size", 6,
                                  kSynchsafeMax, frames.size());
    }
    std::vector<std::byte> new_tag;
    new_tag.reserve(10U + frames.size());
    (void)build_id3_header(major, static_cast<uint32_t>(frames.size()),
                           &new_tag);
    detail::append_span(&new_tag, frames);

    SpliceEdit edit;
    if (have_tag) {
        edit.replace(0, tag.size, new_tag);
    } else {
        edit.insert(0, new_tag);
    }
    return detail::commit_write(kFmt, bytes, edit, options.limits, out);
}

}  // namespace metasplice
