#include "metasplice/meta_write.h"

#include "byte_io_internal.h"
#include "field_map_internal.h"
#include "metasplice/block_build.h"
#include "metasplice/block_fields.h"
#include "metasplice/splice.h"
#include "write_result_internal.h"

namespace metasplice {
namespace {

    constexpr ContainerFormat kFmt = ContainerFormat::Jpeg;

    constexpr uint64_t kXmpSignatureSize = 29;

    /// Bare names that fill XMP properties when the request has no XMP
    /// value for them.
    struct XmpFallback final {
        std::string_view bare;
        std::string_view xmp;
    };

    static constexpr XmpFallback kXmpFallbacks[] = {
        { "Title", "XMP:Title" },
        { "Artist", "XMP:Creator" },
        { "Copyright", "XMP:Rights" },
        { "Description", "XMP:Description" },
    };

    /// Where a segment run goes when the file has none of its kind.
    enum class Anchor : uint8_t {
        App0,
        JfifOrExif,
        ExifOrXmp,
    };

    struct SegmentRun final {
        JpegSegmentKind kind = JpegSegmentKind::Other;
        Anchor anchor        = Anchor::ExifOrXmp;
        std::vector<std::byte> bytes;
    };

    static bool replaces(JpegSegmentKind run, JpegSegmentKind seg) noexcept
    {
        if (run == JpegSegmentKind::Xmp) {
            return seg == JpegSegmentKind::Xmp
                   || seg == JpegSegmentKind::XmpExtended;
        }
        return run == seg;
    }


    static bool anchors(Anchor anchor, const JpegSegment& seg) noexcept
    {
        switch (anchor) {
        case Anchor::App0: return seg.marker == 0xFFE0;
        case Anchor::JfifOrExif:
            return seg.kind == JpegSegmentKind::Jfif
                   || seg.kind == JpegSegmentKind::Exif;
        case Anchor::ExifOrXmp:
            return seg.kind == JpegSegmentKind::Exif
                   || seg.kind == JpegSegmentKind::Xmp
                   || seg.kind == JpegSegmentKind::XmpExtended;
        }
        return false;
    }


    static std::span<const std::byte>
    segment_payload(std::span<const std::byte> bytes, const JpegSegment& seg)
    {
        return bytes.subspan(static_cast<size_t>(seg.payload_offset),
                             static_cast<size_t>(seg.payload_size));
    }


    /// End of the APP0 segments that directly follow SOI.
    static uint64_t leading_app0_end(const JpegLayout& layout) noexcept
    {
        uint64_t end = 2;
        for (const JpegSegment& seg : layout.segments) {
            if (seg.marker != 0xFFE0 || seg.offset != end) {
                break;
            }
            end = seg.offset + seg.size;
        }
        return end;
    }


    /**
     * \brief Removes every segment \p run replaces and records the new run at
     * the first removed position, else after the last anchor segment, else
     * right after SOI (and the APP0 segments heading the file).
     */
    static void place_run(const JpegLayout& layout, const SegmentRun& run,
                          SpliceEdit* edit)
    {
        bool have_slot = false;
        uint64_t slot  = 2;
        uint64_t after = run.anchor == Anchor::App0 ? 2
                                                    : leading_app0_end(layout);
        for (const JpegSegment& seg : layout.segments) {
            if (replaces(run.kind, seg.kind)) {
                if (!have_slot) {
                    slot      = seg.offset;
                    have_slot = true;
                }
                edit->remove(seg.offset, seg.size);
            } else if (anchors(run.anchor, seg)) {
                after = seg.offset + seg.size;
            }
        }
        if (run.bytes.empty()) {
            return;
        }
        edit->insert(have_slot ? slot : after, run.bytes);
    }


    static WriteResult build_xmp_run(std::span<const std::byte> bytes,
                                     const JpegLayout& layout,
                                     const MetadataRequest& request,
                                     const WriteOptions& options,
                                     std::vector<SegmentRun>* runs)
    {
        MetadataRequest xmp_request = request;
        for (const XmpFallback& f : kXmpFallbacks) {
            const std::string* v = request.find(f.bare);
            if (v && !request.find(f.xmp)) {
                xmp_request.set(f.xmp, *v);
            }
        }

        std::span<const std::byte> existing;
        for (const JpegSegment& seg : layout.segments) {
            if (seg.kind == JpegSegmentKind::Xmp) {
                existing = segment_payload(bytes, seg)
                               .subspan(static_cast<size_t>(
                                   kXmpSignatureSize));
                break;
            }
        }

        std::vector<std::byte> packet;
        if (!build_xmp_packet(xmp_request, existing, options.xmp, &packet)) {
            return detail::write_ok(kFmt);
        }
        SegmentRun run;
        run.kind   = JpegSegmentKind::Xmp;
        run.anchor = Anchor::JfifOrExif;
        const WriteStatus st = build_jpeg_xmp_segment(packet, &run.bytes);
        if (st != WriteStatus::Ok) {
            return detail::write_fail(kFmt, st,
                                      "XMP packet exceeds one APP1 segment", 0,
                                      kJpegMaxSegmentPayload - kXmpSignatureSize,
                                      packet.size());
        }
        runs->push_back(std::move(run));
        return detail::write_ok(kFmt);
    }


    static WriteResult build_icc_run(const MetadataRequest& request,
                                     std::vector<SegmentRun>* runs)
    {
        const std::string* profile = request.first_of(
            { "ICC:Profile", "ICC_Profile" });
        if (!profile) {
            return detail::write_ok(kFmt);
        }
        SegmentRun run;
        run.kind = JpegSegmentKind::Icc;
        // An empty profile only removes the existing one.
        if (!profile->empty()) {
            const WriteStatus st = build_jpeg_icc_segments(
                detail::as_bytes(*profile), &run.bytes);
            if (st != WriteStatus::Ok) {
                return detail::write_fail(kFmt, st,
                                          "ICC profile needs more than 255 "
                                          "segments",
                                          0, 255U * 65504U, profile->size());
            }
        }
        runs->push_back(std::move(run));
        return detail::write_ok(kFmt);
    }


    static WriteResult build_afcp_run(std::span<const std::byte> bytes,
                                      const JpegLayout& layout,
                                      const MetadataRequest& request,
                                      std::vector<SegmentRun>* runs)
    {
        const std::span<const MetadataField> updates = request.with_prefix(
            "AFCP:");
        if (updates.empty()) {
            return detail::write_ok(kFmt);
        }
        std::vector<AfcpField> fields;
        for (const JpegSegment& seg : layout.segments) {
            if (seg.kind == JpegSegmentKind::Afcp) {
                if (parse_jpeg_afcp_fields(segment_payload(bytes, seg),
                                           &fields)
                    != WriteStatus::Ok) {
                    return detail::write_fail(kFmt, WriteStatus::Malformed,
                                              "AFCP record runs past segment",
                                              seg.offset);
                }
                break;
            }
        }
        for (const MetadataField& u : updates) {
            const std::string_view key = key_local_name(u.key);
            bool found = false;
            for (AfcpField& f : fields) {
                if (f.key == key) {
                    f.value = u.value;
                    found   = true;
                    break;
                }
            }
            if (!found) {
                fields.push_back(AfcpField { std::string(key), u.value });
            }
        }

        SegmentRun run;
        run.kind             = JpegSegmentKind::Afcp;
        const WriteStatus st = build_jpeg_afcp_segment(fields, &run.bytes);
        if (st != WriteStatus::Ok) {
            return detail::write_fail(kFmt, st, "AFCP records exceed one "
                                                "APP2 segment");
        }
        runs->push_back(std::move(run));
        return detail::write_ok(kFmt);
    }


    static WriteResult collect_irb_update(std::span<const MetadataField> keys,
                                          std::vector<IrbResource>* updates)
    {
        for (const MetadataField& f : keys) {
            uint32_t id = 0;
            if (!detail::parse_u32(key_local_name(f.key), &id)
                || id > 0xFFFFU) {
                return detail::write_fail(kFmt, WriteStatus::UnsupportedField,
                                          "Photoshop resource ID must be a "
                                          "16-bit number");
            }
            IrbResource r;
            r.id = static_cast<uint16_t>(id);
            const std::span<const std::byte> data = detail::as_bytes(f.value);
            r.data.assign(data.begin(), data.end());
            updates->push_back(std::move(r));
        }
        return detail::write_ok(kFmt);
    }


    static WriteResult build_irb_run(std::span<const std::byte> bytes,
                                     const JpegLayout& layout,
                                     const MetadataRequest& request,
                                     std::vector<SegmentRun>* runs)
    {
        std::vector<IrbResource> updates;
        WriteResult r = collect_irb_update(request.with_prefix("Photoshop:"),
                                           &updates);
        if (r.status == WriteStatus::Ok) {
            r = collect_irb_update(request.with_prefix("PS:"), &updates);
        }
        if (r.status != WriteStatus::Ok || updates.empty()) {
            return r;
        }

        // Resources are spread over every APP13 segment in order.
        std::vector<IrbResource> resources;
        for (const JpegSegment& seg : layout.segments) {
            if (seg.kind == JpegSegmentKind::PhotoshopIrb
                && parse_jpeg_irb_resources(segment_payload(bytes, seg),
                                            &resources)
                       != WriteStatus::Ok) {
                return detail::write_fail(kFmt, WriteStatus::Malformed,
                                          "8BIM resource runs past segment",
                                          seg.offset);
            }
        }
        for (IrbResource& u : updates) {
            bool found = false;
            for (IrbResource& e : resources) {
                if (e.id == u.id) {
                    e.data = std::move(u.data);
                    found  = true;
                    break;
                }
            }
            if (!found) {
                resources.push_back(std::move(u));
            }
        }

        SegmentRun run;
        run.kind             = JpegSegmentKind::PhotoshopIrb;
        const WriteStatus st = build_jpeg_irb_segment(resources, &run.bytes);
        if (st != WriteStatus::Ok) {
            return detail::write_fail(kFmt, st, "Photoshop resources exceed "
                                                "one APP13 segment");
        }
        runs->push_back(std::move(run));
        return detail::write_ok(kFmt);
    }


    static bool parse_version(std::string_view s, JfifInfo* info) noexcept
    {
        const size_t dot = s.find('.');
        uint32_t major   = 0;
        uint32_t minor   = 0;
        if (dot == std::string_view::npos
            || !detail::parse_u32(s.substr(0, dot), &major)
            || !detail::parse_u32(s.substr(dot + 1), &minor) || major > 0xFFU
            || minor > 0xFFU) {
            return false;
        }
        info->version_major = static_cast<uint8_t>(major);
        info->version_minor = static_cast<uint8_t>(minor);
        return true;
    }


    static WriteResult build_jfif_run(std::span<const std::byte> bytes,
                                      const JpegLayout& layout,
                                      const MetadataRequest& request,
                                      std::vector<SegmentRun>* runs)
    {
        const std::span<const MetadataField> updates = request.with_prefix(
            "JFIF:");
        if (updates.empty()) {
            return detail::write_ok(kFmt);
        }

        JfifInfo info;
        for (const JpegSegment& seg : layout.segments) {
            if (seg.kind == JpegSegmentKind::Jfif && seg.payload_size >= 12U) {
                const uint64_t p = seg.payload_offset;
                info.version_major = detail::u8(bytes[p + 5U]);
                info.version_minor = detail::u8(bytes[p + 6U]);
                info.units         = detail::u8(bytes[p + 7U]);
                (void)detail::read_u16be(bytes, p + 8U, &info.x_density);
                (void)detail::read_u16be(bytes, p + 10U, &info.y_density);
                break;
            }
        }

        for (const MetadataField& f : updates) {
            const std::string_view name = key_local_name(f.key);
            uint32_t v = 0;
            bool ok    = false;
            if (name == "Version") {
                ok = parse_version(f.value, &info);
            } else if (name == "Units") {
                ok = detail::parse_u32(f.value, &v) && v <= 2U;
                info.units = static_cast<uint8_t>(v);
            } else if (name == "XResolution") {
                ok = detail::parse_u32(f.value, &v) && v >= 1U && v <= 0xFFFFU;
                info.x_density = static_cast<uint16_t>(v);
            } else if (name == "YResolution") {
                ok = detail::parse_u32(f.value, &v) && v >= 1U && v <= 0xFFFFU;
                info.y_density = static_cast<uint16_t>(v);
            }
            if (!ok) {
                return detail::write_fail(kFmt, WriteStatus::UnsupportedField,
                                          "unknown JFIF field or value");
            }
        }

        SegmentRun run;
        run.kind   = JpegSegmentKind::Jfif;
        run.anchor = Anchor::App0;
        (void)build_jpeg_jfif_segment(info, &run.bytes);
        runs->push_back(std::move(run));
        return detail::write_ok(kFmt);
    }

}  // namespace

WriteResult
write_jpeg_metadata(std::span<const std::byte> bytes,
                    const MetadataRequest& request,
                    const WriteOptions& options,
                    std::vector<std::byte>* out) noexcept
{
    out->clear();

    JpegLayout layout;
    WriteResult r = parse_jpeg_layout(bytes, options.limits.max_blocks,
                                      &layout);
    if (r.status != WriteStatus::Ok) {
        return r;
    }

    // Runs sharing an insertion point keep this order.
    std::vector<SegmentRun> runs;
    r = build_jfif_run(bytes, layout, request, &runs);
    if (r.status == WriteStatus::Ok) {
        r = build_xmp_run(bytes, layout, request, options, &runs);
    }
    if (r.status == WriteStatus::Ok) {
        r = build_icc_run(request, &runs);
    }
    if (r.status == WriteStatus::Ok) {
        r = build_afcp_run(bytes, layout, request, &runs);
    }
    if (r.status == WriteStatus::Ok) {
        r = build_irb_run(bytes, layout, request, &runs);
    }
    if (r.status != WriteStatus::Ok) {
        return r;
    }
    if (runs.empty()) {
        return detail::write_fail(kFmt, WriteStatus::NoApplicableFields,
                                  "no JPEG metadata fields in request");
    }

    SpliceEdit edit;
    for (const SegmentRun& run : runs) {
        place_run(layout, run, &edit);
    }
    return detail::commit_write(kFmt, bytes, edit, options.limits, out);
}

}  // namespace metasplice
