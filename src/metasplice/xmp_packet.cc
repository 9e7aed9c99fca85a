#include "metasplice/xmp_packet.h"

#include <cstdint>
#include <map>
#include <string>
#include <utility>

#if defined(METASPLICE_HAS_EXPAT) && METASPLICE_HAS_EXPAT
#    include <expat.h>
#endif

namespace metasplice {
namespace {

    static constexpr std::string_view kXmpNsX = "adobe:ns:meta/";
    static constexpr std::string_view kXmpNsRdf
        = "http://www.w3.org/1999/02/22-rdf-syntax-ns#";
    static constexpr std::string_view kXmlNs
        = "http://www.w3.org/XML/1998/namespace";
    static constexpr std::string_view kXmpNsDc
        = "http://purl.org/dc/elements/1.1/";
    static constexpr std::string_view kXmpNsXmp = "http://ns.adobe.com/xap/1.0/";

    static constexpr const char* kIndent1 = "  ";
    static constexpr const char* kIndent2 = "    ";
    static constexpr const char* kIndent3 = "      ";
    static constexpr const char* kIndent4 = "        ";
    static constexpr const char* kIndent5 = "          ";

    struct XmpNsDecl final {
        std::string_view prefix;
        std::string_view uri;
    };

    static constexpr XmpNsDecl kKnownNamespaces[] = {
        { "dc", kXmpNsDc },
        { "xmp", kXmpNsXmp },
        { "xmpRights", "http://ns.adobe.com/xap/1.0/rights/" },
        { "xmpMM", "http://ns.adobe.com/xap/1.0/mm/" },
        { "xmpDM", "http://ns.adobe.com/xmp/1.0/DynamicMedia/" },
        { "exif", "http://ns.adobe.com/exif/1.0/" },
        { "exifEX", "http://cipa.jp/exif/1.0/" },
        { "tiff", "http://ns.adobe.com/tiff/1.0/" },
        { "aux", "http://ns.adobe.com/exif/1.0/aux/" },
        { "photoshop", "http://ns.adobe.com/photoshop/1.0/" },
        { "Iptc4xmpCore", "http://iptc.org/std/Iptc4xmpCore/1.0/xmlns/" },
        { "crs", "http://ns.adobe.com/camera-raw-settings/1.0/" },
        { "pdf", "http://ns.adobe.com/pdf/1.3/" },
    };

    struct DcShape final {
        std::string_view key;
        std::string_view name;
        XmpArrayKind array;
    };

    // Bare request names with a fixed dc property and value shape.
    static constexpr DcShape kDcShapes[] = {
        { "Title", "title", XmpArrayKind::Alt },
        { "Description", "description", XmpArrayKind::Alt },
        { "Rights", "rights", XmpArrayKind::Alt },
        { "Creator", "creator", XmpArrayKind::Seq },
        { "Subject", "subject", XmpArrayKind::Bag },
    };

    static std::string_view known_prefix_for_uri(std::string_view uri) noexcept
    {
        for (const XmpNsDecl& d : kKnownNamespaces) {
            if (d.uri == uri) {
                return d.prefix;
            }
        }
        return {};
    }


    static XmpArrayKind dc_array_kind(std::string_view uri,
                                      std::string_view name) noexcept
    {
        if (uri != kXmpNsDc) {
            return XmpArrayKind::None;
        }
        for (const DcShape& s : kDcShapes) {
            if (s.name == name) {
                return s.array;
            }
        }
        return XmpArrayKind::None;
    }


    static bool is_ascii_ws(char c) noexcept
    {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n';
    }


    static std::string_view trim_ascii_ws(std::string_view s) noexcept
    {
        size_t b = 0;
        while (b < s.size() && is_ascii_ws(s[b])) {
            b += 1;
        }
        size_t e = s.size();
        while (e > b && is_ascii_ws(s[e - 1])) {
            e -= 1;
        }
        return s.substr(b, e - b);
    }

    // Output helpers ---------------------------------------------------------

    struct ByteWriter final {
        std::vector<std::byte>* out = nullptr;

        void append(std::string_view s)
        {
            const std::byte* p = reinterpret_cast<const std::byte*>(s.data());
            out->insert(out->end(), p, p + s.size());
        }

        void append_char(char c) { out->push_back(static_cast<std::byte>(c)); }
    };


    static void append_xml_safe_utf8(std::string_view s, ByteWriter* w)
    {
        for (size_t i = 0; i < s.size(); ++i) {
            const uint8_t c = static_cast<uint8_t>(s[i]);
            if (c == static_cast<uint8_t>('&')) {
                w->append("&amp;");
                continue;
            }
            if (c == static_cast<uint8_t>('<')) {
                w->append("&lt;");
                continue;
            }
            if (c == static_cast<uint8_t>('>')) {
                w->append("&gt;");
                continue;
            }
            if (c == static_cast<uint8_t>('\"')) {
                w->append("&quot;");
                continue;
            }
            if (c == static_cast<uint8_t>('\'')) {
                w->append("&apos;");
                continue;
            }
            if (c == 0x09U || c == 0x0AU || c == 0x0DU
                || (c >= 0x20U && c != 0x7FU)) {
                w->append_char(static_cast<char>(c));
                continue;
            }
            // Control bytes are not representable in XML 1.0 text.
            w->append("&#xFFFD;");
        }
    }


    static void emit_xmp_packet_begin(ByteWriter* w, std::string_view toolkit,
                                      std::span<const XmpNsDecl> decls)
    {
        w->append("<?xpacket begin=\"\xEF\xBB\xBF\" "
                  "id=\"W5M0MpCehiHzreSzNTczkc9d\"?>\n");
        w->append("<x:xmpmeta xmlns:x=\"");
        w->append(kXmpNsX);
        w->append("\" x:xmptk=\"");
        append_xml_safe_utf8(toolkit, w);
        w->append("\">\n");
        w->append(kIndent1);
        w->append("<rdf:RDF xmlns:rdf=\"");
        w->append(kXmpNsRdf);
        w->append("\">\n");
        w->append(kIndent2);
        w->append("<rdf:Description rdf:about=\"\"");
        for (const XmpNsDecl& d : decls) {
            w->append("\n");
            w->append(kIndent4);
            w->append("xmlns:");
            w->append(d.prefix);
            w->append("=\"");
            append_xml_safe_utf8(d.uri, w);
            w->append("\"");
        }
        w->append(">\n");
    }


    static void emit_xmp_packet_end(ByteWriter* w, uint32_t padding)
    {
        w->append(kIndent2);
        w->append("</rdf:Description>\n");
        w->append(kIndent1);
        w->append("</rdf:RDF>\n");
        w->append("</x:xmpmeta>\n");
        // Padding is written as lines of at most 100 bytes.
        uint32_t left = padding;
        while (left > 0U) {
            const uint32_t line = left < 100U ? left : 100U;
            for (uint32_t i = 0; i + 1U < line; ++i) {
                w->append_char(' ');
            }
            w->append_char('\n');
            left -= line;
        }
        w->append("<?xpacket end=\"w\"?>");
    }


    static const char* array_element(XmpArrayKind k) noexcept
    {
        switch (k) {
        case XmpArrayKind::Alt: return "rdf:Alt";
        case XmpArrayKind::Seq: return "rdf:Seq";
        case XmpArrayKind::Bag: return "rdf:Bag";
        case XmpArrayKind::None: break;
        }
        return "";
    }


    static void emit_property(ByteWriter* w, std::string_view prefix,
                              const XmpProperty& p)
    {
        std::string qname(prefix);
        qname.push_back(':');
        qname.append(p.name);

        w->append(kIndent3);
        w->append("<");
        w->append(qname);
        w->append(">");
        if (p.array == XmpArrayKind::None) {
            if (!p.values.empty()) {
                append_xml_safe_utf8(p.values.front(), w);
            }
        } else {
            const char* arr = array_element(p.array);
            w->append("\n");
            w->append(kIndent4);
            w->append("<");
            w->append(arr);
            w->append(">\n");
            for (size_t i = 0; i < p.values.size(); ++i) {
                w->append(kIndent5);
                w->append("<rdf:li");
                if (p.array == XmpArrayKind::Alt) {
                    const std::string_view lang = i < p.langs.size()
                                                      ? std::string_view(
                                                            p.langs[i])
                                                      : std::string_view {};
                    w->append(" xml:lang=\"");
                    append_xml_safe_utf8(lang.empty() ? "x-default" : lang, w);
                    w->append("\"");
                }
                w->append(">");
                append_xml_safe_utf8(p.values[i], w);
                w->append("</rdf:li>\n");
            }
            w->append(kIndent4);
            w->append("</");
            w->append(arr);
            w->append(">\n");
            w->append(kIndent3);
        }
        w->append("</");
        w->append(qname);
        w->append(">\n");
    }

#if defined(METASPLICE_HAS_EXPAT) && METASPLICE_HAS_EXPAT

    struct NameParts final {
        std::string_view uri;
        std::string_view local;
    };

    static NameParts split_name(std::string_view name) noexcept
    {
        const size_t sep = name.find('|');
        if (sep == std::string_view::npos) {
            return NameParts { std::string_view {}, name };
        }
        return NameParts { name.substr(0, sep), name.substr(sep + 1) };
    }


    enum class FrameKind : uint8_t {
        Other,
        Description,
        Property,
        Array,
        Li,
    };

    struct ReadCtx final {
        XML_Parser parser = nullptr;
        XmpReadStatus status = XmpReadStatus::Ok;
        std::vector<XmpProperty>* out = nullptr;

        // Prefix declared for each namespace URI in the packet.
        std::map<std::string, std::string, std::less<>> prefixes;
        std::vector<FrameKind> stack;

        bool in_prop   = false;
        bool prop_skip = false;
        size_t prop_depth = 0;
        std::string text;
        XmpProperty cur;
    };

    static void stop_parser(ReadCtx* ctx, XmpReadStatus status) noexcept
    {
        if (ctx->status == XmpReadStatus::Ok) {
            ctx->status = status;
        }
        if (ctx->parser) {
            XML_StopParser(ctx->parser, XML_FALSE);
        }
    }


    static std::string prefix_for(const ReadCtx* ctx, std::string_view uri)
    {
        const auto it = ctx->prefixes.find(uri);
        if (it != ctx->prefixes.end()) {
            return it->second;
        }
        return std::string(known_prefix_for_uri(uri));
    }


    static void XMLCALL start_ns(void* user_data, const XML_Char* prefix,
                                 const XML_Char* uri)
    {
        ReadCtx* ctx = reinterpret_cast<ReadCtx*>(user_data);
        if (!prefix || !uri) {
            return;
        }
        ctx->prefixes.emplace(std::string(uri), std::string(prefix));
    }


    static void XMLCALL start_element(void* user_data, const XML_Char* name_c,
                                      const XML_Char** atts)
    {
        ReadCtx* ctx = reinterpret_cast<ReadCtx*>(user_data);
        if (ctx->status != XmpReadStatus::Ok || !name_c) {
            return;
        }
        const NameParts parts = split_name(name_c);
        const bool is_rdf     = parts.uri == kXmpNsRdf;

        if (ctx->in_prop) {
            const size_t rel = ctx->stack.size() - ctx->prop_depth;
            const bool is_arr = is_rdf
                                && (parts.local == "Alt" || parts.local == "Seq"
                                    || parts.local == "Bag");
            if (rel == 1U && is_arr && ctx->cur.array == XmpArrayKind::None
                && !ctx->prop_skip) {
                ctx->cur.array = parts.local == "Alt"   ? XmpArrayKind::Alt
                                 : parts.local == "Seq" ? XmpArrayKind::Seq
                                                        : XmpArrayKind::Bag;
                ctx->stack.push_back(FrameKind::Array);
                return;
            }
            if (rel == 2U && is_rdf && parts.local == "li"
                && ctx->stack.back() == FrameKind::Array) {
                std::string lang;
                for (int i = 0; atts && atts[i] && atts[i + 1]; i += 2) {
                    const NameParts ap = split_name(atts[i]);
                    if (ap.uri == kXmlNs && ap.local == "lang") {
                        lang = atts[i + 1];
                    }
                }
                ctx->cur.values.emplace_back();
                ctx->cur.langs.push_back(std::move(lang));
                ctx->stack.push_back(FrameKind::Li);
                return;
            }
            ctx->prop_skip = true;
            ctx->stack.push_back(FrameKind::Other);
            return;
        }

        if (is_rdf && parts.local == "Description") {
            ctx->stack.push_back(FrameKind::Description);
            for (int i = 0; atts && atts[i] && atts[i + 1]; i += 2) {
                const NameParts ap = split_name(atts[i]);
                if (ap.uri.empty() || ap.uri == kXmpNsRdf || ap.uri == kXmlNs) {
                    continue;
                }
                XmpProperty p;
                p.ns_uri = std::string(ap.uri);
                p.prefix = prefix_for(ctx, ap.uri);
                p.name   = std::string(ap.local);
                p.values.emplace_back(trim_ascii_ws(atts[i + 1]));
                ctx->out->push_back(std::move(p));
            }
            return;
        }

        if (!ctx->stack.empty() && ctx->stack.back() == FrameKind::Description
            && !is_rdf && !parts.uri.empty()) {
            ctx->in_prop    = true;
            ctx->prop_skip  = false;
            ctx->prop_depth = ctx->stack.size();
            ctx->text.clear();
            ctx->cur        = XmpProperty {};
            ctx->cur.ns_uri = std::string(parts.uri);
            ctx->cur.prefix = prefix_for(ctx, parts.uri);
            ctx->cur.name   = std::string(parts.local);
            for (int i = 0; atts && atts[i] && atts[i + 1]; i += 2) {
                const NameParts ap = split_name(atts[i]);
                if (ap.uri != kXmpNsRdf) {
                    continue;
                }
                if (ap.local == "resource") {
                    ctx->text = atts[i + 1];
                } else if (ap.local == "parseType") {
                    ctx->prop_skip = true;
                }
            }
            ctx->stack.push_back(FrameKind::Property);
            return;
        }

        ctx->stack.push_back(FrameKind::Other);
    }


    static void XMLCALL end_element(void* user_data, const XML_Char* /*name*/)
    {
        ReadCtx* ctx = reinterpret_cast<ReadCtx*>(user_data);
        if (ctx->status != XmpReadStatus::Ok) {
            return;
        }
        if (ctx->stack.empty()) {
            stop_parser(ctx, XmpReadStatus::Malformed);
            return;
        }
        const FrameKind kind = ctx->stack.back();
        ctx->stack.pop_back();
        if (kind != FrameKind::Property || !ctx->in_prop) {
            return;
        }

        ctx->in_prop = false;
        if (ctx->prop_skip) {
            return;
        }
        if (ctx->cur.array == XmpArrayKind::None) {
            ctx->cur.values.clear();
            ctx->cur.values.emplace_back(trim_ascii_ws(ctx->text));
        } else {
            for (std::string& v : ctx->cur.values) {
                v = std::string(trim_ascii_ws(v));
            }
            if (ctx->cur.array != XmpArrayKind::Alt) {
                ctx->cur.langs.clear();
            }
        }
        ctx->out->push_back(std::move(ctx->cur));
        ctx->cur = XmpProperty {};
    }


    static void XMLCALL char_data(void* user_data, const XML_Char* s, int len)
    {
        ReadCtx* ctx = reinterpret_cast<ReadCtx*>(user_data);
        if (ctx->status != XmpReadStatus::Ok || !ctx->in_prop || !s
            || len <= 0 || ctx->stack.empty()) {
            return;
        }
        const FrameKind top = ctx->stack.back();
        if (top == FrameKind::Property) {
            ctx->text.append(s, static_cast<size_t>(len));
        } else if (top == FrameKind::Li && !ctx->cur.values.empty()) {
            ctx->cur.values.back().append(s, static_cast<size_t>(len));
        }
    }

#endif  // METASPLICE_HAS_EXPAT

}  // namespace

std::string
xmp_namespace_uri(std::string_view prefix)
{
    for (const XmpNsDecl& d : kKnownNamespaces) {
        if (d.prefix == prefix) {
            return std::string(d.uri);
        }
    }
    std::string uri = "http://ns.adobe.com/";
    uri.append(prefix);
    uri.append("/1.0/");
    return uri;
}


XmpProperty
xmp_property_for_key(std::string_view local_key, std::string_view value)
{
    XmpProperty p;
    const size_t colon = local_key.find(':');
    if (colon != std::string_view::npos) {
        p.prefix = std::string(local_key.substr(0, colon));
        p.name   = std::string(local_key.substr(colon + 1U));
        p.ns_uri = xmp_namespace_uri(p.prefix);
        p.array  = dc_array_kind(p.ns_uri, p.name);
    } else {
        p.prefix = "xmp";
        p.ns_uri = std::string(kXmpNsXmp);
        p.name   = std::string(local_key);
        for (const DcShape& s : kDcShapes) {
            if (s.key == local_key) {
                p.prefix = "dc";
                p.ns_uri = std::string(kXmpNsDc);
                p.name   = std::string(s.name);
                p.array  = s.array;
                break;
            }
        }
    }
    p.values.emplace_back(value);
    if (p.array == XmpArrayKind::Alt) {
        p.langs.emplace_back("x-default");
    }
    return p;
}


void
collect_xmp_properties(const MetadataRequest& request,
                       std::vector<XmpProperty>* out)
{
    for (const MetadataField& f : request.with_prefix("XMP:")) {
        const std::string_view local = std::string_view(f.key).substr(4);
        if (local.empty()) {
            continue;
        }
        XmpProperty p = xmp_property_for_key(local, f.value);
        // A later key for the same property wins.
        merge_xmp_properties(std::span<const XmpProperty>(&p, 1), out);
    }
}


XmpReadStatus
read_xmp_properties(std::span<const std::byte> packet,
                    std::vector<XmpProperty>* out) noexcept
{
    out->clear();
    if (packet.empty()) {
        return XmpReadStatus::Unsupported;
    }
#if defined(METASPLICE_HAS_EXPAT) && METASPLICE_HAS_EXPAT
    if (packet.size() > static_cast<size_t>(INT32_MAX)) {
        return XmpReadStatus::Unsupported;
    }
    ReadCtx ctx;
    ctx.out    = out;
    ctx.parser = XML_ParserCreateNS(nullptr, '|');
    if (!ctx.parser) {
        return XmpReadStatus::Malformed;
    }
    XML_SetUserData(ctx.parser, &ctx);
    XML_SetElementHandler(ctx.parser, &start_element, &end_element);
    XML_SetCharacterDataHandler(ctx.parser, &char_data);
    XML_SetStartNamespaceDeclHandler(ctx.parser, &start_ns);

    const XML_Status st
        = XML_Parse(ctx.parser, reinterpret_cast<const char*>(packet.data()),
                    static_cast<int>(packet.size()), XML_TRUE);
    if (st == XML_STATUS_ERROR && ctx.status == XmpReadStatus::Ok) {
        const enum XML_Error err = XML_GetErrorCode(ctx.parser);
        ctx.status = (err == XML_ERROR_SYNTAX || err == XML_ERROR_NO_ELEMENTS)
                         ? XmpReadStatus::Unsupported
                         : XmpReadStatus::Malformed;
    }
    XML_ParserFree(ctx.parser);
    ctx.parser = nullptr;
    if (ctx.status != XmpReadStatus::Ok) {
        out->clear();
    }
    return ctx.status;
#else
    return XmpReadStatus::Unsupported;
#endif
}


void
merge_xmp_properties(std::span<const XmpProperty> updates,
                     std::vector<XmpProperty>* props)
{
    for (const XmpProperty& u : updates) {
        bool replaced = false;
        for (XmpProperty& p : *props) {
            if (p.ns_uri == u.ns_uri && p.name == u.name) {
                std::string prefix = std::move(p.prefix);
                p = u;
                if (!prefix.empty()) {
                    p.prefix = std::move(prefix);
                }
                replaced = true;
                break;
            }
        }
        if (!replaced) {
            props->push_back(u);
        }
    }
}


void
append_xmp_packet(std::span<const XmpProperty> props,
                  const XmpPacketOptions& options,
                  std::vector<std::byte>* out)
{
    // Bind one prefix per namespace, in first-use order.
    std::vector<std::pair<std::string, std::string>> bound;  // (uri, prefix)
    std::vector<std::string> prop_prefix;
    prop_prefix.reserve(props.size());
    uint32_t generated = 0;
    for (const XmpProperty& p : props) {
        std::string prefix;
        for (const auto& b : bound) {
            if (b.first == p.ns_uri) {
                prefix = b.second;
                break;
            }
        }
        if (prefix.empty()) {
            std::string want = p.prefix;
            if (want.empty() || want == "rdf" || want == "x" || want == "xml") {
                want = std::string(known_prefix_for_uri(p.ns_uri));
            }
            const auto taken = [&bound](std::string_view s) {
                for (const auto& b : bound) {
                    if (b.second == s) {
                        return true;
                    }
                }
                return false;
            };
            while (want.empty() || taken(want)) {
                generated += 1;
                want = "ns" + std::to_string(generated);
            }
            bound.emplace_back(p.ns_uri, want);
            prefix = want;
        }
        prop_prefix.push_back(std::move(prefix));
    }

    std::vector<XmpNsDecl> decls;
    decls.reserve(bound.size());
    for (const auto& b : bound) {
        decls.push_back(XmpNsDecl { b.second, b.first });
    }

    ByteWriter w { out };
    emit_xmp_packet_begin(&w, options.toolkit, decls);
    for (size_t i = 0; i < props.size(); ++i) {
        emit_property(&w, prop_prefix[i], props[i]);
    }
    emit_xmp_packet_end(&w, options.padding_bytes);
}


bool
build_xmp_packet(const MetadataRequest& request,
                 std::span<const std::byte> existing,
                 const XmpPacketOptions& options, std::vector<std::byte>* out)
{
    std::vector<XmpProperty> updates;
    collect_xmp_properties(request, &updates);
    if (updates.empty()) {
        return false;
    }

    std::vector<XmpProperty> props;
    if (options.merge_existing && !existing.empty()) {
        if (read_xmp_properties(existing, &props) != XmpReadStatus::Ok) {
            props.clear();
        }
    }
    merge_xmp_properties(updates, &props);
    append_xmp_packet(props, options, out);
    return true;
}

}  // namespace metasplice
