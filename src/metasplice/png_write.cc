#include "metasplice/meta_write.h"

#include "byte_io_internal.h"
#include "field_map_internal.h"
#include "metasplice/block_build.h"
#include "metasplice/splice.h"
#include "text_encode_internal.h"
#include "write_result_internal.h"

namespace metasplice {
namespace {

    using detail::LogicalField;

    constexpr ContainerFormat kFmt = ContainerFormat::Png;

    constexpr std::string_view kXmpKeyword = "XML:com.adobe.xmp";

    static constexpr uint32_t kText = fourcc('t', 'E', 'X', 't');
    static constexpr uint32_t kItxt = fourcc('i', 'T', 'X', 't');
    static constexpr uint32_t kZtxt = fourcc('z', 'T', 'X', 't');

    struct KeywordField final {
        LogicalField field;
        std::string_view keyword;
        std::string_view key;
    };

    static constexpr KeywordField kKeywordFields[] = {
        { LogicalField::Title, "Title", "PNG:Title" },
        { LogicalField::Artist, "Author", "PNG:Author" },
        { LogicalField::Copyright, "Copyright", "PNG:Copyright" },
        { LogicalField::Comment, "Description", "PNG:Description" },
        { LogicalField::Software, "Software", "PNG:Software" },
    };

    struct TextUpdate final {
        std::string keyword;
        std::string value;
        /// Set once the chunk replaced an existing one.
        bool placed = false;
        std::vector<std::byte> chunk;
    };

    static void set_update(std::vector<TextUpdate>* updates,
                           std::string_view keyword, std::string_view value)
    {
        for (TextUpdate& u : *updates) {
            if (u.keyword == keyword) {
                u.value = std::string(value);
                return;
            }
        }
        TextUpdate u;
        u.keyword = std::string(keyword);
        u.value   = std::string(value);
        updates->push_back(std::move(u));
    }


    static bool valid_keyword(std::string_view k) noexcept
    {
        if (k.empty() || k.size() > 79U || k.front() == ' '
            || k.back() == ' ') {
            return false;
        }
        for (char c : k) {
            const uint8_t b = static_cast<uint8_t>(c);
            if (b < 0x20U || (b > 0x7EU && b < 0xA1U)) {
                return false;
            }
        }
        return true;
    }


    /// Keyword of a tEXt/zTXt/iTXt chunk (empty when unterminated).
    static std::string_view chunk_keyword(std::span<const std::byte> bytes,
                                          const PngChunk& c) noexcept
    {
        const std::string_view data = detail::as_text(
            bytes.subspan(static_cast<size_t>(c.offset + 8U), c.length));
        const size_t nul = data.find('\0');
        if (nul == std::string_view::npos || nul > 79U) {
            return {};
        }
        return data.substr(0, nul);
    }


    /// Text of an uncompressed iTXt chunk, or empty.
    static std::span<const std::byte>
    itxt_text(std::span<const std::byte> bytes, const PngChunk& c) noexcept
    {
        const std::span<const std::byte> data = bytes.subspan(
            static_cast<size_t>(c.offset + 8U), c.length);
        const std::string_view s = detail::as_text(data);
        size_t pos = s.find('\0');
        if (pos == std::string_view::npos || pos + 3U > s.size()
            || s[pos + 1U] != '\0') {
            return {};
        }
        pos += 3U;  // NUL, compression flag, compression method
        for (int field = 0; field < 2; ++field) {
            const size_t nul = s.find('\0', pos);
            if (nul == std::string_view::npos) {
                return {};
            }
            pos = nul + 1U;
        }
        return data.subspan(pos);
    }


    static WriteResult collect_updates(std::span<const std::byte> bytes,
                                       const PngLayout& layout,
                                       const MetadataRequest& request,
                                       const WriteOptions& options,
                                       std::vector<TextUpdate>* updates)
    {
        for (const KeywordField& f : kKeywordFields) {
            const std::string* v = detail::resolve_field(request, f.field,
                                                         { f.key });
            if (v) {
                set_update(updates, f.keyword, *v);
            }
        }
        for (const MetadataField& f : request.with_prefix("PNG:")) {
            const std::string_view keyword = key_local_name(f.key);
            if (!valid_keyword(keyword) || keyword == kXmpKeyword) {
                return detail::write_fail(kFmt, WriteStatus::UnsupportedField,
                                          "invalid PNG text keyword");
            }
            set_update(updates, keyword, f.value);
        }

        std::span<const std::byte> existing;
        for (const PngChunk& c : layout.chunks) {
            if (c.type == kItxt && chunk_keyword(bytes, c) == kXmpKeyword) {
                existing = itxt_text(bytes, c);
                break;
            }
        }
        std::vector<std::byte> packet;
        if (build_xmp_packet(request, existing, options.xmp, &packet)) {
            set_update(updates, kXmpKeyword, detail::as_text(packet));
        }
        return detail::write_ok(kFmt);
    }

}  // namespace

WriteResult
write_png_metadata(std::span<const std::byte> bytes,
                   const MetadataRequest& request, const WriteOptions& options,
                   std::vector<std::byte>* out) noexcept
{
    out->clear();

    PngLayout layout;
    WriteResult r = parse_png_layout(bytes, options.limits.max_blocks,
                                     &layout);
    if (r.status != WriteStatus::Ok) {
        return r;
    }

    std::vector<TextUpdate> updates;
    r = collect_updates(bytes, layout, request, options, &updates);
    if (r.status != WriteStatus::Ok) {
        return r;
    }
    if (updates.empty()) {
        return detail::write_fail(kFmt, WriteStatus::NoApplicableFields,
                                  "no PNG text fields in request");
    }

    for (TextUpdate& u : updates) {
        std::string latin1;
        const bool plain = u.keyword != kXmpKeyword
                           && detail::latin1_from_utf8(u.value, &latin1);
        const WriteStatus st
            = plain ? build_png_text_chunk(u.keyword, latin1, &u.chunk)
                    : build_png_itxt_chunk(u.keyword, u.value, &u.chunk);
        if (st != WriteStatus::Ok) {
            return detail::write_fail(kFmt, st, "cannot build text chunk");
        }
    }

    SpliceEdit edit;
    uint64_t insert_at = layout.end;
    bool have_idat     = false;
    for (const PngChunk& c : layout.chunks) {
        if (c.type == fourcc('I', 'D', 'A', 'T') && !have_idat) {
            insert_at = c.offset;
            have_idat = true;
        } else if (c.type == fourcc('I', 'E', 'N', 'D') && !have_idat) {
            insert_at = c.offset;
        }
        if (c.type != kText && c.type != kItxt && c.type != kZtxt) {
            continue;
        }
        const std::string_view keyword = chunk_keyword(bytes, c);
        for (TextUpdate& u : updates) {
            if (u.keyword != keyword) {
                continue;
            }
            if (u.placed) {
                edit.remove(c.offset, c.total_size());
            } else {
                edit.replace(c.offset, c.total_size(), u.chunk);
                u.placed = true;
            }
            break;
        }
    }
    for (const TextUpdate& u : updates) {
        if (!u.placed) {
            edit.insert(insert_at, u.chunk);
        }
    }
    return detail::commit_write(kFmt, bytes, edit, options.limits, out);
}

}  // namespace metasplice
