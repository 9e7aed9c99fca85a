#include "metasplice/console_format.h"

#include <gtest/gtest.h>

#include <array>
#include <string>

namespace metasplice {

TEST(ConsoleFormat, EscapesControlAndQuoteBytes)
{
    std::string out;
    EXPECT_FALSE(append_console_escaped_ascii("plain text", 0, &out));
    EXPECT_EQ(out, "plain text");

    out.clear();
    EXPECT_TRUE(append_console_escaped_ascii(
        std::string_view("a\"b\\\n\t\x01\xC3", 8), 0, &out));
    EXPECT_EQ(out, "a\\\"b\\\\\\n\\t\\x01\\xC3");
}


TEST(ConsoleFormat, TruncatesAtMaxBytes)
{
    std::string out = "> ";
    EXPECT_TRUE(append_console_escaped_ascii("abcdef", 3, &out));
    EXPECT_EQ(out, "> abc...");
}


TEST(ConsoleFormat, HexBytes)
{
    const std::array<std::byte, 3> raw = { std::byte { 0x00 },
                                           std::byte { 0xAB },
                                           std::byte { 0x7F } };
    std::string out;
    append_hex_bytes(raw, 0, &out);
    EXPECT_EQ(out, "00AB7F");

    out.clear();
    append_hex_bytes(raw, 2, &out);
    EXPECT_EQ(out, "00AB...");
}

}  // namespace metasplice
