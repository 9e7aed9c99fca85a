#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace metasplice::detail {

/// Appends UTF-16LE code units for \p utf8 (no terminator, no BOM).
/// Invalid UTF-8 sequences become U+FFFD.
void
append_utf16le(std::string_view utf8, std::vector<std::byte>* out);

/// Decodes UTF-16LE up to the first NUL code unit (or the end).
std::string
utf8_from_utf16le(std::span<const std::byte> bytes);

/// Converts \p utf8 to ISO-8859-1; false when a code point is above U+00FF.
bool
latin1_from_utf8(std::string_view utf8, std::string* out);

/// Converts ISO-8859-1 text to UTF-8.
std::string
utf8_from_latin1(std::string_view latin1);

}  // namespace metasplice::detail
