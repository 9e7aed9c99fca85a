#include "field_map_internal.h"

#include "metasplice/block_build.h"
#include "metasplice/meta_write.h"
#include "write_result_internal.h"

namespace metasplice::detail {
namespace {

    static char ascii_lower(char c) noexcept
    {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    }


    static char ascii_upper(char c) noexcept
    {
        return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
    }

    struct VorbisName final {
        std::string_view name;
        LogicalField field;
    };

    static constexpr VorbisName kVorbisNames[] = {
        { "TITLE", LogicalField::Title },
        { "ARTIST", LogicalField::Artist },
        { "ALBUM", LogicalField::Album },
        { "COMMENT", LogicalField::Comment },
        { "DATE", LogicalField::Date },
        { "GENRE", LogicalField::Genre },
        { "COPYRIGHT", LogicalField::Copyright },
        { "ENCODER", LogicalField::Software },
    };

    static void set_vorbis(std::vector<VorbisCommentField>* fields,
                           std::string_view name, std::string_view value)
    {
        for (VorbisCommentField& f : *fields) {
            if (iequals(f.name, name)) {
                f.value = std::string(value);
                return;
            }
        }
        VorbisCommentField f;
        f.name.reserve(name.size());
        for (char c : name) {
            f.name.push_back(ascii_upper(c));
        }
        f.value = std::string(value);
        fields->push_back(std::move(f));
    }

}  // namespace

const std::string*
resolve_field(const MetadataRequest& request, LogicalField field,
              std::initializer_list<std::string_view> format_keys,
              bool xmp_fallback) noexcept
{
    const std::string* v = request.first_of(format_keys);
    if (v) {
        return v;
    }
    if (xmp_fallback) {
        switch (field) {
        case LogicalField::Title: v = request.find("XMP:Title"); break;
        case LogicalField::Artist:
            v = request.first_of({ "XMP:Artist", "XMP:Creator" });
            break;
        case LogicalField::Album: v = request.find("XMP:Album"); break;
        case LogicalField::Comment: v = request.find("XMP:Description"); break;
        case LogicalField::Date: v = request.find("XMP:CreateDate"); break;
        case LogicalField::Genre: v = request.find("XMP:Genre"); break;
        case LogicalField::Copyright: v = request.find("XMP:Rights"); break;
        case LogicalField::Software: v = request.find("XMP:CreatorTool"); break;
        }
        if (v) {
            return v;
        }
    }
    switch (field) {
    case LogicalField::Title: return request.find("Title");
    case LogicalField::Artist:
        return request.first_of({ "EXIF:Artist", "Artist" });
    case LogicalField::Album: return request.find("Album");
    case LogicalField::Comment:
        return request.first_of({ "EXIF:ImageDescription", "EXIF:UserComment",
                                  "Comment", "Description" });
    case LogicalField::Date:
        return request.first_of({ "EXIF:DateTimeOriginal", "Date" });
    case LogicalField::Genre: return request.find("Genre");
    case LogicalField::Copyright:
        return request.first_of({ "EXIF:Copyright", "Copyright" });
    case LogicalField::Software:
        return request.first_of({ "EXIF:Software", "Software" });
    }
    return nullptr;
}

bool
iequals(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (ascii_lower(a[i]) != ascii_lower(b[i])) {
            return false;
        }
    }
    return true;
}


bool
parse_u32(std::string_view s, uint32_t* out) noexcept
{
    uint32_t base = 10;
    if (s.size() > 2U && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
        base = 16;
        s.remove_prefix(2);
    }
    if (s.empty()) {
        return false;
    }
    uint64_t v = 0;
    for (char c : s) {
        uint32_t d = 0;
        if (c >= '0' && c <= '9') {
            d = static_cast<uint32_t>(c - '0');
        } else if (base == 16U && c >= 'a' && c <= 'f') {
            d = static_cast<uint32_t>(c - 'a' + 10);
        } else if (base == 16U && c >= 'A' && c <= 'F') {
            d = static_cast<uint32_t>(c - 'A' + 10);
        } else {
            return false;
        }
        v = v * base + d;
        if (v > 0xFFFFFFFFU) {
            return false;
        }
    }
    *out = static_cast<uint32_t>(v);
    return true;
}


void
collect_vorbis_updates(const MetadataRequest& request,
                       std::vector<VorbisCommentField>* out)
{
    out->clear();
    for (const VorbisName& n : kVorbisNames) {
        std::string key = "Vorbis:";
        key.append(n.name);
        const std::string* v = resolve_field(request, n.field, { key });
        if (v) {
            set_vorbis(out, n.name, *v);
        }
    }
    for (const MetadataField& f : request.with_prefix("Vorbis:")) {
        const std::string_view name = std::string_view(f.key).substr(7);
        // '=' and control bytes cannot appear in a field name.
        bool valid = !name.empty();
        for (char c : name) {
            if (c < 0x20 || c > 0x7D || c == '=') {
                valid = false;
            }
        }
        if (valid) {
            set_vorbis(out, name, f.value);
        }
    }
}


void
merge_vorbis_fields(std::span<const VorbisCommentField> updates,
                    VorbisComments* comments)
{
    std::vector<VorbisCommentField> merged;
    merged.reserve(comments->fields.size() + updates.size());
    std::vector<bool> used(updates.size(), false);
    for (VorbisCommentField& f : comments->fields) {
        size_t hit = updates.size();
        for (size_t i = 0; i < updates.size(); ++i) {
            if (iequals(f.name, updates[i].name)) {
                hit = i;
                break;
            }
        }
        if (hit == updates.size()) {
            merged.push_back(std::move(f));
        } else if (!used[hit]) {
            used[hit] = true;
            merged.push_back(updates[hit]);
        }
    }
    for (size_t i = 0; i < updates.size(); ++i) {
        if (!used[i]) {
            merged.push_back(updates[i]);
        }
    }
    comments->fields = std::move(merged);
}


WriteResult
commit_write(ContainerFormat format, std::span<const std::byte> base,
             const SpliceEdit& edit, const WriteLimits& limits,
             std::vector<std::byte>* out) noexcept
{
    if (limits.max_output_bytes != 0U) {
        const int64_t projected = static_cast<int64_t>(base.size())
                                  + edit.size_delta();
        if (projected > 0
            && static_cast<uint64_t>(projected) > limits.max_output_bytes) {
            out->clear();
            return write_fail(format, WriteStatus::LimitExceeded,
                              "output exceeds max_output_bytes", 0,
                              limits.max_output_bytes,
                              static_cast<uint64_t>(projected));
        }
    }
    const SpliceStatus st = commit_splice(base, edit, out);
    switch (st) {
    case SpliceStatus::Ok: return write_ok(format);
    case SpliceStatus::OutOfRange:
        return write_fail(format, WriteStatus::IntegrityCheck,
                          "edit outside the input buffer");
    case SpliceStatus::Overlap:
        return write_fail(format, WriteStatus::IntegrityCheck,
                          "overlapping edits");
    }
    out->clear();
    return write_fail(format, WriteStatus::IntegrityCheck, "splice failed");
}

}  // namespace metasplice::detail
