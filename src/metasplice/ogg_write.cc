#include "metasplice/meta_write.h"

#include "byte_io_internal.h"
#include "field_map_internal.h"
#include "metasplice/block_build.h"
#include "metasplice/block_fields.h"
#include "metasplice/ogg_crc.h"
#include "metasplice/splice.h"
#include "metasplice/var_int.h"
#include "write_result_internal.h"

namespace metasplice {
namespace {

    constexpr ContainerFormat kFmt = ContainerFormat::Ogg;

    struct OggCodec final {
        bool opus = false;
        /// Comment packet signature.
        const char* prefix = nullptr;
        uint32_t prefix_size = 0;
    };

    static bool payload_starts_with(std::span<const std::byte> bytes,
                                    const OggPage& page, const char* sig,
                                    uint32_t sig_size) noexcept
    {
        return page.payload_size >= sig_size
               && detail::match(bytes, page.payload_offset, sig, sig_size);
    }


    static WriteResult find_comment_page(std::span<const std::byte> bytes,
                                         uint32_t max_blocks,
                                         OggCodec* codec, OggPage* out)
    {
        OggPage first;
        WriteResult r = parse_ogg_page(bytes, 0, &first);
        if (r.status != WriteStatus::Ok) {
            return r;
        }
        if (payload_starts_with(bytes, first, "OpusHead", 8)) {
            *codec = OggCodec { true, "OpusTags", 8 };
        } else if (payload_starts_with(bytes, first, "\x01vorbis", 7)) {
            *codec = OggCodec { false, "\x03vorbis", 7 };
        } else {
            return detail::write_fail(kFmt, WriteStatus::UnsupportedLayout,
                                      "first packet is not Vorbis or Opus",
                                      first.payload_offset);
        }

        uint64_t offset = first.size;
        for (uint32_t n = 1; n < max_blocks && offset < bytes.size(); ++n) {
            OggPage page;
            r = parse_ogg_page(bytes, offset, &page);
            if (r.status != WriteStatus::Ok) {
                return r;
            }
            if (page.serial == first.serial && !page.continued()
                && payload_starts_with(bytes, page, codec->prefix,
                                       codec->prefix_size)) {
                *out = page;
                return detail::write_ok(kFmt);
            }
            offset += page.size;
        }
        return detail::write_fail(kFmt, WriteStatus::UnsupportedLayout,
                                  "comment packet does not start a page",
                                  offset);
    }

}  // namespace

WriteResult
write_ogg_metadata(std::span<const std::byte> bytes,
                   const MetadataRequest& request, const WriteOptions& options,
                   std::vector<std::byte>* out) noexcept
{
    out->clear();

    std::vector<VorbisCommentField> updates;
    detail::collect_vorbis_updates(request, &updates);
    if (updates.empty()) {
        return detail::write_fail(kFmt, WriteStatus::NoApplicableFields,
                                  "no Vorbis comment fields in request");
    }

    OggCodec codec;
    OggPage page;
    WriteResult r = find_comment_page(bytes, options.limits.max_blocks,
                                      &codec, &page);
    if (r.status != WriteStatus::Ok) {
        return r;
    }

    const std::span<const uint8_t> lacing = ogg_page_lacing(bytes, page);
    uint32_t packet_entries = 0;
    uint64_t packet_size    = 0;
    if (!ogg_first_packet(lacing, &packet_entries, &packet_size)) {
        return detail::write_fail(kFmt, WriteStatus::UnsupportedLayout,
                                  "comment packet spans pages", page.offset);
    }
    if (packet_size < codec.prefix_size) {
        return detail::write_fail(kFmt, WriteStatus::Malformed,
                                  "comment packet shorter than its signature",
                                  page.payload_offset, codec.prefix_size,
                                  packet_size);
    }

    // Leading lacing entries belong to the comment packet; the rest of the
    // page (usually the start of the setup packet) is kept as is.
    const std::span<const uint8_t> rest_lacing = lacing.subspan(
        packet_entries);
    uint64_t rest_sum = 0;
    for (uint8_t v : rest_lacing) {
        rest_sum += v;
    }
    const uint64_t rest_size = page.payload_size - packet_size;
    if (rest_sum != rest_size) {
        return detail::write_fail(kFmt, WriteStatus::IntegrityCheck,
                                  "page remainder does not match its lacing",
                                  page.offset, rest_sum, rest_size);
    }

    VorbisComments comments;
    const std::span<const std::byte> old_body = bytes.subspan(
        static_cast<size_t>(page.payload_offset + codec.prefix_size),
        static_cast<size_t>(packet_size - codec.prefix_size));
    if (parse_vorbis_comments(old_body, &comments) != WriteStatus::Ok) {
        return detail::write_fail(kFmt, WriteStatus::Malformed,
                                  "comment field runs past packet",
                                  page.payload_offset);
    }
    if (comments.vendor.empty()) {
        comments.vendor = options.vendor;
    }
    detail::merge_vorbis_fields(updates, &comments);

    std::vector<std::byte> packet;
    const WriteStatus st = build_vorbis_comments(
        comments,
        codec.opus ? VorbisCommentFraming::OpusPacket
                   : VorbisCommentFraming::VorbisPacket,
        &packet);
    if (st != WriteStatus::Ok) {
        return detail::write_fail(kFmt, st, "comment field too large");
    }

    std::vector<uint8_t> new_lacing;
    build_ogg_lacing(packet.size(), &new_lacing);
    new_lacing.insert(new_lacing.end(), rest_lacing.begin(),
                      rest_lacing.end());
    if (new_lacing.size() > 255U) {
        return detail::write_fail(kFmt, WriteStatus::StructuralLimit,
                                  "lacing table exceeds 255 entries",
                                  page.offset, 255U, new_lacing.size());
    }

    std::vector<std::byte> new_page;
    new_page.reserve(kOggPageHeaderSize + new_lacing.size() + packet.size()
                     + rest_size);
    const std::span<const std::byte> header
        = bytes.subspan(static_cast<size_t>(page.offset), kOggPageHeaderSize);
    detail::append_span(&new_page, header.first(26));
    detail::append_u8(&new_page, static_cast<uint8_t>(new_lacing.size()));
    for (uint8_t v : new_lacing) {
        detail::append_u8(&new_page, v);
    }
    detail::append_span(&new_page, packet);
    detail::append_span(
        &new_page, bytes.subspan(static_cast<size_t>(page.payload_offset
                                                     + packet_size),
                                 static_cast<size_t>(rest_size)));

    detail::store_u32le(new_page, kOggCrcOffset, 0);
    detail::store_u32le(new_page, kOggCrcOffset, ogg_crc32(new_page));

    SpliceEdit edit;
    edit.replace(page.offset, page.size, new_page);
    return detail::commit_write(kFmt, bytes, edit, options.limits, out);
}

}  // namespace metasplice
