//# Unicode Utilities Header File

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace hc::unicode {

constexpr uint32_t kMaxCodePoint = 0x10FFFF;
constexpr uint32_t kReplacementCharacter = 0xFFFD;

// One decoded code point and the span it occupies in its source text.
// offset and length are in the addressing unit of the source: bytes for
// UTF-8, code units for UTF-16.
struct CodePoint {
    uint32_t value = 0;
    size_t offset = 0;
    size_t length = 0;
};

// Split UTF-8 text into code points. Each maximal ill-formed subsequence
// decodes to U+FFFD spanning the bytes it covers.
std::vector<CodePoint> to_code_points(const std::string& text);

// Split UTF-16 text into code points. Unpaired surrogates are returned as-is.
std::vector<CodePoint> to_code_points(const std::u16string& text);

// Append one code point in the target encoding
void append_code_point(std::string& out, uint32_t code_point);
void append_code_point(std::u16string& out, uint32_t code_point);

// UTF-8 form of a single code point (surrogates become U+FFFD)
std::string to_utf8(uint32_t code_point);

std::string to_utf8(const std::u16string& text);
std::u16string to_utf16(const std::string& text);

size_t code_point_count(const std::string& text);
size_t code_point_count(const std::u16string& text);

} // namespace hc::unicode
