#include "text_encode_internal.h"

#include <cstdint>

namespace metasplice::detail {
namespace {

    static constexpr uint32_t kReplacement = 0xFFFDU;

    // Decodes one code point at s[*i]; advances *i past it.
    static uint32_t next_code_point(std::string_view s, size_t* i) noexcept
    {
        const uint8_t c0 = static_cast<uint8_t>(s[*i]);
        *i += 1;
        if (c0 < 0x80U) {
            return c0;
        }
        uint32_t cp    = 0;
        uint32_t extra = 0;
        uint32_t min   = 0;
        if ((c0 & 0xE0U) == 0xC0U) {
            cp    = c0 & 0x1FU;
            extra = 1;
            min   = 0x80U;
        } else if ((c0 & 0xF0U) == 0xE0U) {
            cp    = c0 & 0x0FU;
            extra = 2;
            min   = 0x800U;
        } else if ((c0 & 0xF8U) == 0xF0U) {
            cp    = c0 & 0x07U;
            extra = 3;
            min   = 0x10000U;
        } else {
            return kReplacement;
        }
        for (uint32_t k = 0; k < extra; ++k) {
            if (*i >= s.size()) {
                return kReplacement;
            }
            const uint8_t cn = static_cast<uint8_t>(s[*i]);
            if ((cn & 0xC0U) != 0x80U) {
                return kReplacement;
            }
            cp = (cp << 6) | (cn & 0x3FU);
            *i += 1;
        }
        if (cp < min || cp > 0x10FFFFU || (cp >= 0xD800U && cp <= 0xDFFFU)) {
            return kReplacement;
        }
        return cp;
    }


    static void append_unit(std::vector<std::byte>* out, uint32_t u)
    {
        out->push_back(std::byte { static_cast<uint8_t>(u & 0xFFU) });
        out->push_back(std::byte { static_cast<uint8_t>((u >> 8) & 0xFFU) });
    }


    static void append_utf8(std::string* out, uint32_t cp)
    {
        if (cp < 0x80U) {
            out->push_back(static_cast<char>(cp));
        } else if (cp < 0x800U) {
            out->push_back(static_cast<char>(0xC0U | (cp >> 6)));
            out->push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
        } else if (cp < 0x10000U) {
            out->push_back(static_cast<char>(0xE0U | (cp >> 12)));
            out->push_back(static_cast<char>(0x80U | ((cp >> 6) & 0x3FU)));
            out->push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
        } else {
            out->push_back(static_cast<char>(0xF0U | (cp >> 18)));
            out->push_back(static_cast<char>(0x80U | ((cp >> 12) & 0x3FU)));
            out->push_back(static_cast<char>(0x80U | ((cp >> 6) & 0x3FU)));
            out->push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
        }
    }

}  // namespace

void
append_utf16le(std::string_view utf8, std::vector<std::byte>* out)
{
    out->reserve(out->size() + utf8.size() * 2U);
    size_t i = 0;
    while (i < utf8.size()) {
        const uint32_t cp = next_code_point(utf8, &i);
        if (cp >= 0x10000U) {
            const uint32_t v = cp - 0x10000U;
            append_unit(out, 0xD800U | (v >> 10));
            append_unit(out, 0xDC00U | (v & 0x3FFU));
        } else {
            append_unit(out, cp);
        }
    }
}


std::string
utf8_from_utf16le(std::span<const std::byte> bytes)
{
    std::string out;
    out.reserve(bytes.size() / 2U);
    size_t i = 0;
    while (i + 1 < bytes.size()) {
        uint32_t u = static_cast<uint32_t>(bytes[i])
                     | (static_cast<uint32_t>(bytes[i + 1]) << 8);
        i += 2;
        if (u == 0U) {
            break;
        }
        if (u >= 0xD800U && u <= 0xDBFFU && i + 1 < bytes.size()) {
            const uint32_t lo = static_cast<uint32_t>(bytes[i])
                                | (static_cast<uint32_t>(bytes[i + 1]) << 8);
            if (lo >= 0xDC00U && lo <= 0xDFFFU) {
                u = 0x10000U + ((u - 0xD800U) << 10) + (lo - 0xDC00U);
                i += 2;
            } else {
                u = kReplacement;
            }
        } else if (u >= 0xD800U && u <= 0xDFFFU) {
            u = kReplacement;
        }
        append_utf8(&out, u);
    }
    return out;
}


bool
latin1_from_utf8(std::string_view utf8, std::string* out)
{
    out->clear();
    out->reserve(utf8.size());
    size_t i = 0;
    while (i < utf8.size()) {
        const uint32_t cp = next_code_point(utf8, &i);
        if (cp > 0xFFU) {
            return false;
        }
        out->push_back(static_cast<char>(cp));
    }
    return true;
}


std::string
utf8_from_latin1(std::string_view latin1)
{
    std::string out;
    out.reserve(latin1.size());
    for (char c : latin1) {
        append_utf8(&out, static_cast<uint8_t>(c));
    }
    return out;
}

}  // namespace metasplice::detail
