#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace metasplice {

// Appends `s` to `out` as printable ASCII.
//
// Quotes and backslashes are backslash-escaped, `\n` `\r` `\t` use their
// short forms and every other control or non-ASCII byte becomes `\xNN`.
// Input beyond `max_bytes` (0 = unlimited) is dropped and "..." appended.
// Returns true when anything was escaped or dropped.
bool
append_console_escaped_ascii(std::string_view s, uint32_t max_bytes,
                             std::string* out) noexcept;

// Appends `bytes` as uppercase hex pairs, at most `max_bytes` of them
// (0 = unlimited), followed by "..." when cut short.
void
append_hex_bytes(std::span<const std::byte> bytes, uint32_t max_bytes,
                 std::string* out) noexcept;

}  // namespace metasplice
