#include "metasplice/meta_write.h"

#include "byte_io_internal.h"
#include "field_map_internal.h"
#include "metasplice/block_build.h"
#include "metasplice/block_fields.h"
#include "metasplice/splice.h"
#include "metasplice/var_int.h"
#include "write_result_internal.h"

namespace metasplice {
namespace {

    static void append_block_header(std::vector<std::byte>* out, bool last,
                                    uint8_t type, uint32_t length)
    {
        detail::append_u8(out, static_cast<uint8_t>((last ? 0x80U : 0x00U)
                                                    | (type & 0x7FU)));
        (void)append_u24be(length, out);
    }

}  // namespace

WriteResult
write_flac_metadata(std::span<const std::byte> bytes,
                    const MetadataRequest& request,
                    const WriteOptions& options,
                    std::vector<std::byte>* out) noexcept
{
    constexpr ContainerFormat kFmt = ContainerFormat::Flac;
    out->clear();

    std::vector<VorbisCommentField> updates;
    detail::collect_vorbis_updates(request, &updates);
    if (updates.empty()) {
        return detail::write_fail(kFmt, WriteStatus::NoApplicableFields,
                                  "no Vorbis comment fields in request");
    }

    FlacLayout layout;
    WriteResult r = parse_flac_layout(bytes, options.limits.max_blocks,
                                      &layout);
    if (r.status != WriteStatus::Ok) {
        return r;
    }
    if (layout.blocks.empty()) {
        return detail::write_fail(kFmt, WriteStatus::Malformed,
                                  "no metadata blocks",
                                  layout.signature_offset);
    }

    const FlacBlock* target = nullptr;
    for (const FlacBlock& b : layout.blocks) {
        if (b.type == static_cast<uint8_t>(FlacBlockType::VorbisComment)) {
            target = &b;
            break;
        }
    }

    VorbisComments comments;
    if (target) {
        const std::span<const std::byte> body
            = bytes.subspan(static_cast<size_t>(target->offset + 4U),
                            target->length);
        if (parse_vorbis_comments(body, &comments) != WriteStatus::Ok) {
            return detail::write_fail(kFmt, WriteStatus::Malformed,
                                      "VORBIS_COMMENT field runs past block",
                                      target->offset);
        }
    }
    if (comments.vendor.empty()) {
        comments.vendor = options.vendor;
    }
    detail::merge_vorbis_fields(updates, &comments);

    std::vector<std::byte> body;
    const WriteStatus st = build_vorbis_comments(
        comments, VorbisCommentFraming::FlacBlock, &body);
    if (st != WriteStatus::Ok) {
        return detail::write_fail(kFmt, st, "comment field too large");
    }
    if (body.size() > kU24Max) {
        return detail::write_fail(kFmt, WriteStatus::StructuralLimit,
                                  "VORBIS_COMMENT exceeds 24-bit length",
                                  target ? target->offset : 0, kU24Max,
                                  body.size());
    }

    const uint8_t type = static_cast<uint8_t>(FlacBlockType::VorbisComment);
    std::vector<std::byte> block;
    SpliceEdit edit;
    if (target) {
        append_block_header(&block, target->last, type,
                            static_cast<uint32_t>(body.size()));
        detail::append_span(&block, body);
        edit.replace(target->offset, target->total_size(), block);
    } else {
        const FlacBlock& last = layout.blocks.back();
        const std::byte cleared = static_cast<std::byte>(
            detail::u8(bytes[static_cast<size_t>(last.offset)]) & 0x7FU);
        edit.replace(last.offset, 1, std::span<const std::byte>(&cleared, 1));
        append_block_header(&block, true, type,
                            static_cast<uint32_t>(body.size()));
        detail::append_span(&block, body);
        edit.insert(last.offset + last.total_size(), block);
    }
    return detail::commit_write(kFmt, bytes, edit, options.limits, out);
}

}  // namespace metasplice
