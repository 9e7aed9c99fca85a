#include "metasplice/console_format.h"

namespace metasplice {
namespace {

    constexpr char kHexDigits[] = "0123456789ABCDEF";

    static void append_hex_pair(std::string* out, uint8_t v)
    {
        out->push_back(kHexDigits[v >> 4]);
        out->push_back(kHexDigits[v & 0x0FU]);
    }


    static size_t clamp_count(size_t size, uint32_t max_bytes) noexcept
    {
        if (max_bytes == 0U || size <= max_bytes) {
            return size;
        }
        return max_bytes;
    }

}  // namespace

bool
append_console_escaped_ascii(std::string_view s, uint32_t max_bytes,
                             std::string* out) noexcept
{
    const size_t n = clamp_count(s.size(), max_bytes);
    bool escaped   = n < s.size();
    out->reserve(out->size() + n);
    for (size_t i = 0; i < n; ++i) {
        const uint8_t c = static_cast<uint8_t>(s[i]);
        switch (c) {
        case '\\':
        case '"':
            out->push_back('\\');
            out->push_back(static_cast<char>(c));
            continue;
        case '\n': out->append("\\n"); break;
        case '\r': out->append("\\r"); break;
        case '\t': out->append("\\t"); break;
        default:
            if (c >= 0x20U && c < 0x7FU) {
                out->push_back(static_cast<char>(c));
                continue;
            }
            out->append("\\x");
            append_hex_pair(out, c);
            break;
        }
        escaped = true;
    }
    if (n < s.size()) {
        out->append("...");
    }
    return escaped;
}


void
append_hex_bytes(std::span<const std::byte> bytes, uint32_t max_bytes,
                 std::string* out) noexcept
{
    const size_t n = clamp_count(bytes.size(), max_bytes);
    out->reserve(out->size() + n * 2U);
    for (size_t i = 0; i < n; ++i) {
        append_hex_pair(out, static_cast<uint8_t>(bytes[i]));
    }
    if (n < bytes.size()) {
        out->append("...");
    }
}

}  // namespace metasplice
