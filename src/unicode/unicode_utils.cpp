// src/unicode/unicode_utils.cpp
#include "hc/unicode/unicode_utils.hpp"
#include <unicode/utf8.h>
#include <unicode/utf16.h>

namespace hc::unicode {

namespace {

bool is_surrogate(uint32_t code_point) {
    return code_point >= 0xD800 && code_point <= 0xDFFF;
}

} // anonymous namespace

std::vector<CodePoint> to_code_points(const std::string& text) {
    std::vector<CodePoint> code_points;
    code_points.reserve(text.size());

    const auto* bytes = reinterpret_cast<const uint8_t*>(text.data());
    const int32_t length = static_cast<int32_t>(text.size());
    int32_t i = 0;
    while (i < length) {
        const int32_t start = i;
        UChar32 c;
        U8_NEXT(bytes, i, length, c);

        CodePoint cp;
        // Ill-formed input: substitute the replacement character for the
        // bytes U8_NEXT skipped
        cp.value = c < 0 ? kReplacementCharacter : static_cast<uint32_t>(c);
        cp.offset = static_cast<size_t>(start);
        cp.length = static_cast<size_t>(i - start);
        code_points.push_back(cp);
    }

    return code_points;
}

std::vector<CodePoint> to_code_points(const std::u16string& text) {
    std::vector<CodePoint> code_points;
    code_points.reserve(text.size());

    const int32_t length = static_cast<int32_t>(text.size());
    int32_t i = 0;
    while (i < length) {
        const int32_t start = i;
        UChar32 c;
        U16_NEXT(text.data(), i, length, c);

        CodePoint cp;
        cp.value = static_cast<uint32_t>(c);
        cp.offset = static_cast<size_t>(start);
        cp.length = static_cast<size_t>(i - start);
        code_points.push_back(cp);
    }

    return code_points;
}

void append_code_point(std::string& out, uint32_t code_point) {
    if (code_point > kMaxCodePoint || is_surrogate(code_point)) {
        code_point = kReplacementCharacter;
    }

    uint8_t utf8_buf[U8_MAX_LENGTH] = {0};
    int32_t offset = 0;
    U8_APPEND_UNSAFE(utf8_buf, offset, static_cast<UChar32>(code_point));
    out.append(reinterpret_cast<const char*>(utf8_buf), static_cast<size_t>(offset));
}

void append_code_point(std::u16string& out, uint32_t code_point) {
    if (code_point > kMaxCodePoint) {
        code_point = kReplacementCharacter;
    }

    // Lone surrogates read from UTF-16 input are written back unchanged
    if (is_surrogate(code_point)) {
        out.push_back(static_cast<char16_t>(code_point));
        return;
    }

    char16_t utf16_buf[U16_MAX_LENGTH] = {0};
    int32_t offset = 0;
    U16_APPEND_UNSAFE(utf16_buf, offset, static_cast<UChar32>(code_point));
    out.append(utf16_buf, static_cast<size_t>(offset));
}

std::string to_utf8(uint32_t code_point) {
    std::string result;
    append_code_point(result, code_point);
    return result;
}

std::string to_utf8(const std::u16string& text) {
    std::string result;
    result.reserve(text.size());
    for (const auto& cp : to_code_points(text)) {
        append_code_point(result, cp.value);
    }
    return result;
}

std::u16string to_utf16(const std::string& text) {
    std::u16string result;
    result.reserve(text.size());
    for (const auto& cp : to_code_points(text)) {
        append_code_point(result, cp.value);
    }
    return result;
}

size_t code_point_count(const std::string& text) {
    return to_code_points(text).size();
}

size_t code_point_count(const std::u16string& text) {
    return to_code_points(text).size();
}

} // namespace hc::unicode
