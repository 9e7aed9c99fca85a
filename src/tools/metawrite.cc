#include "metasplice/build_info.h"
#include "metasplice/console_format.h"
#include "metasplice/container_layout.h"
#include "metasplice/mapped_file.h"
#include "metasplice/meta_write.h"
#include "metasplice/metadata_request.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

namespace metasplice {
namespace {

    static void usage(const char* argv0)
    {
        std::printf(
            "Usage: %s [options] <file>\n"
            "\n"
            "Rewrites the embedded metadata of a media file and copies every\n"
            "other byte unchanged.\n"
            "\n"
            "Options:\n"
            "  --help                 Show this help\n"
            "  --version              Print metasplice build info\n"
            "  -t KEY=VALUE           Field to write (repeatable), e.g.\n"
            "                         -t XMP:Title=Sunset -t Vorbis:ALBUM=Live\n"
            "  -T KEY=@FILE           Field whose value is the content of FILE\n"
            "                         (e.g. -T ICC_Profile=@sRGB.icc)\n"
            "  -o, --out <path>       Output file\n"
            "  --in-place             Replace the input file\n"
            "  --list                 Print the container layout and exit\n"
            "  --pad N                ISO-BMFF: align udta payload to N bytes\n"
            "  --handler TYPE         ISO-BMFF: hdlr handler type (default mdir)\n"
            "  --no-merge             Do not carry over existing XMP properties\n"
            "  --xmp-padding N        XMP: whitespace padding bytes\n"
            "  --vendor S             Vorbis vendor / Matroska PROCESSING_SOFTWARE\n"
            "  --max-file-bytes N     Refuse inputs larger than N (0=unlimited)\n"
            "  --max-output-bytes N   Refuse outputs larger than N (0=unlimited)\n"
            "  --max-blocks N         Max framing units per container scan\n",
            argv0 ? argv0 : "metawrite");
    }


    static bool parse_u64_arg(const char* s, uint64_t* out)
    {
        if (!s || !*s) {
            return false;
        }
        char* end            = nullptr;
        unsigned long long v = std::strtoull(s, &end, 10);
        if (!end || *end != '\0') {
            return false;
        }
        *out = static_cast<uint64_t>(v);
        return true;
    }


    static bool parse_u32_arg(const char* s, uint32_t* out)
    {
        uint64_t v = 0;
        if (!parse_u64_arg(s, &v) || v > 0xFFFFFFFFULL) {
            return false;
        }
        *out = static_cast<uint32_t>(v);
        return true;
    }


    /// Splits `KEY=VALUE`; the key must not be empty.
    static bool split_assignment(const char* arg, std::string_view* key,
                                 std::string_view* value)
    {
        const std::string_view s(arg ? arg : "");
        const size_t eq = s.find('=');
        if (eq == std::string_view::npos || eq == 0U) {
            return false;
        }
        *key   = s.substr(0, eq);
        *value = s.substr(eq + 1U);
        return true;
    }


    static void print_build_info_header()
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(&line1, &line2);
        std::printf("%s\n%s\n", line1.c_str(), line2.c_str());
    }


    static std::string fourcc_text(uint32_t v)
    {
        const char raw[4] = {
            static_cast<char>(v >> 24),
            static_cast<char>(v >> 16),
            static_cast<char>(v >> 8),
            static_cast<char>(v),
        };
        std::string out;
        (void)append_console_escaped_ascii(std::string_view(raw, 4), 0, &out);
        return out;
    }


    static const char* jpeg_kind_name(JpegSegmentKind kind) noexcept
    {
        switch (kind) {
        case JpegSegmentKind::Other: return "other";
        case JpegSegmentKind::Jfif: return "jfif";
        case JpegSegmentKind::Exif: return "exif";
        case JpegSegmentKind::Xmp: return "xmp";
        case JpegSegmentKind::XmpExtended: return "xmp_extended";
        case JpegSegmentKind::Icc: return "icc";
        case JpegSegmentKind::Afcp: return "afcp";
        case JpegSegmentKind::PhotoshopIrb: return "photoshop_irb";
        case JpegSegmentKind::Comment: return "comment";
        }
        return "unknown";
    }


    static void print_failure(const char* path, const WriteResult& r)
    {
        std::fprintf(stderr,
                     "metawrite: %s: %s %s at offset %llu: %s "
                     "(expected %llu, found %llu)\n",
                     path, container_format_name(r.format),
                     write_status_name(r.status),
                     static_cast<unsigned long long>(r.offset),
                     r.what ? r.what : "",
                     static_cast<unsigned long long>(r.expected),
                     static_cast<unsigned long long>(r.found));
    }


    static WriteResult list_bmff(std::span<const std::byte> bytes,
                                 uint64_t begin, uint64_t end, int depth,
                                 uint32_t max_blocks)
    {
        std::vector<BmffAtom> atoms;
        WriteResult r = parse_bmff_children(bytes, begin, end, max_blocks,
                                            &atoms);
        if (r.status != WriteStatus::Ok) {
            return r;
        }
        for (const BmffAtom& a : atoms) {
            std::printf("  %*s0x%llx %s size=%llu%s\n", depth * 2, "",
                        static_cast<unsigned long long>(a.offset),
                        fourcc_text(a.type).c_str(),
                        static_cast<unsigned long long>(a.size),
                        a.large_size ? " (64-bit)" : "");
            const bool descend = a.type == fourcc('m', 'o', 'o', 'v')
                                 || a.type == fourcc('u', 'd', 't', 'a')
                                 || a.type == fourcc('t', 'r', 'a', 'k');
            if (descend && depth < 3) {
                r = list_bmff(bytes, a.payload_offset(), a.end(), depth + 1,
                              max_blocks);
                if (r.status != WriteStatus::Ok) {
                    return r;
                }
            }
        }
        return r;
    }


    static WriteResult list_matroska(std::span<const std::byte> bytes,
                                     uint32_t max_blocks)
    {
        std::vector<EbmlElement> top;
        WriteResult r = parse_ebml_children(bytes, 0, bytes.size(),
                                            max_blocks, &top);
        if (r.status != WriteStatus::Ok) {
            return r;
        }
        for (const EbmlElement& e : top) {
            std::printf("  0x%llx id=%X size=%llu%s\n",
                        static_cast<unsigned long long>(e.offset), e.id,
                        static_cast<unsigned long long>(e.size),
                        e.unknown_size ? " (unknown)" : "");
            if (e.id != kMkvSegmentId) {
                continue;
            }
            std::vector<EbmlElement> children;
            r = parse_ebml_children(bytes, e.payload_offset, e.end,
                                    max_blocks, &children);
            if (r.status != WriteStatus::Ok) {
                return r;
            }
            for (const EbmlElement& c : children) {
                std::printf("    0x%llx id=%X size=%llu width=%u\n",
                            static_cast<unsigned long long>(c.offset), c.id,
                            static_cast<unsigned long long>(c.size),
                            static_cast<unsigned>(c.size_width));
            }
        }
        return r;
    }


    static WriteResult list_layout(std::span<const std::byte> bytes,
                                   uint32_t max_blocks)
    {
        const ContainerFormat format = detect_container_format(bytes);
        std::printf("format=%s size=%llu\n", container_format_name(format),
                    static_cast<unsigned long long>(bytes.size()));
        WriteResult r;
        switch (format) {
        case ContainerFormat::Jpeg: {
            JpegLayout layout;
            r = parse_jpeg_layout(bytes, max_blocks, &layout);
            for (const JpegSegment& s : layout.segments) {
                std::printf("  0x%llx %04X size=%llu %s\n",
                            static_cast<unsigned long long>(s.offset),
                            static_cast<unsigned>(s.marker),
                            static_cast<unsigned long long>(s.size),
                            jpeg_kind_name(s.kind));
            }
            break;
        }
        case ContainerFormat::Png: {
            PngLayout layout;
            r = parse_png_layout(bytes, max_blocks, &layout);
            for (const PngChunk& c : layout.chunks) {
                std::printf("  0x%llx %s length=%u\n",
                            static_cast<unsigned long long>(c.offset),
                            fourcc_text(c.type).c_str(), c.length);
            }
            break;
        }
        case ContainerFormat::Riff: {
            RiffLayout layout;
            r = parse_riff_layout(bytes, max_blocks, &layout);
            for (const RiffChunk& c : layout.chunks) {
                std::printf("  0x%llx %s size=%u%s%s\n",
                            static_cast<unsigned long long>(c.offset),
                            fourcc_text(c.id).c_str(), c.data_size,
                            c.list_type ? " list=" : "",
                            c.list_type ? fourcc_text(c.list_type).c_str()
                                        : "");
            }
            break;
        }
        case ContainerFormat::Ogg: {
            std::vector<OggPage> pages;
            r = parse_ogg_pages(bytes, max_blocks, &pages);
            for (const OggPage& p : pages) {
                std::printf("  0x%llx serial=%u seq=%u segments=%u "
                            "payload=%llu%s\n",
                            static_cast<unsigned long long>(p.offset),
                            p.serial, p.sequence,
                            static_cast<unsigned>(p.segment_count),
                            static_cast<unsigned long long>(p.payload_size),
                            p.continued() ? " continued" : "");
            }
            break;
        }
        case ContainerFormat::Flac: {
            FlacLayout layout;
            r = parse_flac_layout(bytes, max_blocks, &layout);
            for (const FlacBlock& b : layout.blocks) {
                std::printf("  0x%llx type=%u length=%u%s\n",
                            static_cast<unsigned long long>(b.offset),
                            static_cast<unsigned>(b.type), b.length,
                            b.last ? " last" : "");
            }
            break;
        }
        case ContainerFormat::Mp3: {
            Id3Tag tag;
            r = parse_id3_tag(bytes, 0, max_blocks, &tag);
            if (r.status == WriteStatus::FormatError) {
                std::printf("  (no ID3v2 tag)\n");
                r = WriteResult {};
                break;
            }
            std::printf("  ID3v2.%u size=%llu\n",
                        static_cast<unsigned>(tag.major),
                        static_cast<unsigned long long>(tag.size));
            for (const Id3Frame& f : tag.frames) {
                std::printf("    0x%llx %s size=%u\n",
                            static_cast<unsigned long long>(f.offset),
                            fourcc_text(f.id).c_str(), f.payload_size);
            }
            break;
        }
        case ContainerFormat::Asf: {
            AsfHeader header;
            r = parse_asf_header(bytes, max_blocks, &header);
            std::printf("  header size=%llu objects=%u reserved=%u\n",
                        static_cast<unsigned long long>(header.size),
                        header.declared_count,
                        static_cast<unsigned>(header.reserved_width));
            for (const AsfObject& o : header.objects) {
                std::string guid;
                append_hex_bytes(o.guid, 0, &guid);
                std::printf("    0x%llx %s size=%llu\n",
                            static_cast<unsigned long long>(o.offset),
                            guid.c_str(),
                            static_cast<unsigned long long>(o.size));
            }
            break;
        }
        case ContainerFormat::Bmff:
            r = list_bmff(bytes, 0, bytes.size(), 0, max_blocks);
            break;
        case ContainerFormat::Matroska:
            r = list_matroska(bytes, max_blocks);
            break;
        case ContainerFormat::Unknown:
            r.status = WriteStatus::FormatError;
            r.what   = "unrecognized container signature";
            break;
        }
        r.format = format;
        return r;
    }


    static bool write_file_atomic(const std::string& path,
                                  std::span<const std::byte> bytes)
    {
        const std::string tmp = path + ".metawrite.tmp";
        std::FILE* f          = std::fopen(tmp.c_str(), "wb");
        if (!f) {
            return false;
        }
        size_t written = 0;
        if (!bytes.empty()) {
            written = std::fwrite(bytes.data(), 1, bytes.size(), f);
        }
        const bool flushed = std::fclose(f) == 0;
        if (!flushed || written != bytes.size()
            || std::rename(tmp.c_str(), path.c_str()) != 0) {
            (void)std::remove(tmp.c_str());
            return false;
        }
        return true;
    }

}  // namespace
}  // namespace metasplice


int
main(int argc, char** argv)
{
    using namespace metasplice;

    MetadataRequest request;
    WriteOptions options;
    std::string out_path;
    bool in_place           = false;
    bool list               = false;
    uint64_t max_file_bytes = 0;
    const char* input       = nullptr;

    for (int i = 1; i < argc; ++i) {
        const char* arg  = argv[i];
        const char* next = (i + 1 < argc) ? argv[i + 1] : nullptr;
        if (std::strcmp(arg, "--help") == 0) {
            usage(argv[0]);
            return 0;
        }
        if (std::strcmp(arg, "--version") == 0) {
            print_build_info_header();
            return 0;
        }
        if (std::strcmp(arg, "-t") == 0 && next) {
            std::string_view key;
            std::string_view value;
            if (!split_assignment(next, &key, &value)) {
                std::fprintf(stderr, "metawrite: expected KEY=VALUE after -t\n");
                return 2;
            }
            request.set(key, value);
            i += 1;
            continue;
        }
        if (std::strcmp(arg, "-T") == 0 && next) {
            std::string_view key;
            std::string_view value;
            if (!split_assignment(next, &key, &value) || value.size() < 2U
                || value[0] != '@') {
                std::fprintf(stderr, "metawrite: expected KEY=@FILE after -T\n");
                return 2;
            }
            const std::string file_path(value.substr(1));
            MappedFile value_file;
            const MappedFileStatus st = value_file.open(file_path.c_str());
            if (st != MappedFileStatus::Ok) {
                std::fprintf(stderr, "metawrite: cannot read `%s` (%s)\n",
                             file_path.c_str(), mapped_file_status_name(st));
                return 2;
            }
            const std::span<const std::byte> data = value_file.bytes();
            request.set(key,
                        std::string_view(reinterpret_cast<const char*>(
                                             data.data()),
                                         data.size()));
            i += 1;
            continue;
        }
        if ((std::strcmp(arg, "-o") == 0 || std::strcmp(arg, "--out") == 0)
            && next) {
            out_path = next;
            i += 1;
            continue;
        }
        if (std::strcmp(arg, "--in-place") == 0) {
            in_place = true;
            continue;
        }
        if (std::strcmp(arg, "--list") == 0) {
            list = true;
            continue;
        }
        if (std::strcmp(arg, "--no-merge") == 0) {
            options.xmp.merge_existing = false;
            continue;
        }
        if (std::strcmp(arg, "--pad") == 0 && next) {
            if (!parse_u32_arg(next, &options.bmff.padding)) {
                std::fprintf(stderr, "metawrite: invalid --pad value\n");
                return 2;
            }
            i += 1;
            continue;
        }
        if (std::strcmp(arg, "--handler") == 0 && next) {
            if (std::strlen(next) != 4U) {
                std::fprintf(stderr,
                             "metawrite: --handler needs a four-character "
                             "code\n");
                return 2;
            }
            options.bmff.handler_type = fourcc(next[0], next[1], next[2],
                                               next[3]);
            i += 1;
            continue;
        }
        if (std::strcmp(arg, "--xmp-padding") == 0 && next) {
            if (!parse_u32_arg(next, &options.xmp.padding_bytes)) {
                std::fprintf(stderr, "metawrite: invalid --xmp-padding value\n");
                return 2;
            }
            i += 1;
            continue;
        }
        if (std::strcmp(arg, "--vendor") == 0 && next) {
            options.vendor = next;
            i += 1;
            continue;
        }
        if (std::strcmp(arg, "--max-file-bytes") == 0 && next) {
            if (!parse_u64_arg(next, &max_file_bytes)) {
                std::fprintf(stderr,
                             "metawrite: invalid --max-file-bytes value\n");
                return 2;
            }
            i += 1;
            continue;
        }
        if (std::strcmp(arg, "--max-output-bytes") == 0 && next) {
            if (!parse_u64_arg(next, &options.limits.max_output_bytes)) {
                std::fprintf(stderr,
                             "metawrite: invalid --max-output-bytes value\n");
                return 2;
            }
            i += 1;
            continue;
        }
        if (std::strcmp(arg, "--max-blocks") == 0 && next) {
            if (!parse_u32_arg(next, &options.limits.max_blocks)
                || options.limits.max_blocks == 0U) {
                std::fprintf(stderr, "metawrite: invalid --max-blocks value\n");
                return 2;
            }
            i += 1;
            continue;
        }
        if (arg[0] == '-' && arg[1] != '\0') {
            std::fprintf(stderr, "metawrite: unknown option `%s`\n", arg);
            return 2;
        }
        if (input) {
            std::fprintf(stderr, "metawrite: only one input file is accepted\n");
            return 2;
        }
        input = arg;
    }

    if (!input) {
        usage(argv[0]);
        return 2;
    }

    MappedFile file;
    const MappedFileStatus st = file.open(input, max_file_bytes);
    if (st != MappedFileStatus::Ok) {
        std::fprintf(stderr, "metawrite: failed to read `%s` (%s)\n", input,
                     mapped_file_status_name(st));
        return 1;
    }

    if (list) {
        const WriteResult r = list_layout(file.bytes(),
                                          options.limits.max_blocks);
        if (r.status != WriteStatus::Ok) {
            print_failure(input, r);
            return 1;
        }
        return 0;
    }

    if (request.empty()) {
        std::fprintf(stderr, "metawrite: nothing to write (use -t or -T)\n");
        return 2;
    }
    if (out_path.empty() == !in_place) {
        std::fprintf(stderr, "metawrite: give exactly one of -o or --in-place\n");
        return 2;
    }
    if (in_place) {
        out_path = input;
    }

    std::vector<std::byte> out;
    const WriteResult r = write_metadata(file.bytes(), request, options, &out);
    if (r.status != WriteStatus::Ok) {
        print_failure(input, r);
        return 1;
    }
    // The rename may replace the mapped input.
    file.close();
    if (!write_file_atomic(out_path, out)) {
        std::fprintf(stderr, "metawrite: failed to write `%s`\n",
                     out_path.c_str());
        return 1;
    }
    std::printf("%s: wrote %llu bytes (%s)\n", out_path.c_str(),
                static_cast<unsigned long long>(out.size()),
                container_format_name(r.format));
    return 0;
}
