// src/unicode/classifier.cpp
#include "hc/unicode/classifier.hpp"
#include "hc/unicode/unicode_utils.hpp"
#include <unicode/uchar.h>
#include <algorithm>
#include <array>
#include <iomanip>
#include <sstream>

namespace hc {

const char* const kUnknownCategory = "C*";

namespace {

struct NamedCodePoint {
    uint32_t code_point;
    const char* name;
    const char* category;
};

// Sorted by code point for binary search
constexpr std::array<NamedCodePoint, 23> kNamed = {{
    {0x0000, "NULL", "Cc"},
    {0x0009, "TAB", "Cc"},
    {0x000A, "LINE FEED", "Cc"},
    {0x000D, "CARRIAGE RETURN", "Cc"},
    {0x00A0, "NO-BREAK SPACE", "Zs"},
    {0x00AD, "SOFT HYPHEN", "Cf"},
    {0x061C, "ARABIC LETTER MARK", "Cf"},
    {0x200B, "ZERO WIDTH SPACE", "Cf"},
    {0x200C, "ZERO WIDTH NON-JOINER", "Cf"},
    {0x200D, "ZERO WIDTH JOINER", "Cf"},
    {0x200E, "LEFT-TO-RIGHT MARK", "Cf"},
    {0x200F, "RIGHT-TO-LEFT MARK", "Cf"},
    {0x2028, "LINE SEPARATOR", "Zl"},
    {0x2029, "PARAGRAPH SEPARATOR", "Zp"},
    {0x202A, "LEFT-TO-RIGHT EMBEDDING", "Cf"},
    {0x202B, "RIGHT-TO-LEFT EMBEDDING", "Cf"},
    {0x202C, "POP DIRECTIONAL FORMATTING", "Cf"},
    {0x202D, "LEFT-TO-RIGHT OVERRIDE", "Cf"},
    {0x202E, "RIGHT-TO-LEFT OVERRIDE", "Cf"},
    {0x2066, "LEFT-TO-RIGHT ISOLATE", "Cf"},
    {0x2067, "RIGHT-TO-LEFT ISOLATE", "Cf"},
    {0x2068, "FIRST STRONG ISOLATE", "Cf"},
    {0x2069, "POP DIRECTIONAL ISOLATE", "Cf"},
}};

const NamedCodePoint* find_named(uint32_t code_point) {
    auto it = std::lower_bound(kNamed.begin(), kNamed.end(), code_point,
        [](const NamedCodePoint& entry, uint32_t value) { return entry.code_point < value; });
    if (it != kNamed.end() && it->code_point == code_point) {
        return &*it;
    }
    return nullptr;
}

void check_range(uint32_t code_point) {
    if (code_point > unicode::kMaxCodePoint) {
        throw InvalidCodePoint(code_point);
    }
}

bool is_bidi_control(uint32_t code_point) {
    switch (code_point) {
        case 0x200E: case 0x200F:
        case 0x202A: case 0x202B: case 0x202C: case 0x202D: case 0x202E:
        case 0x2066: case 0x2067: case 0x2068: case 0x2069:
            return true;
        default:
            return false;
    }
}

const char* category_code(int8_t type) {
    switch (static_cast<UCharCategory>(type)) {
        case U_UPPERCASE_LETTER: return "Lu";
        case U_LOWERCASE_LETTER: return "Ll";
        case U_TITLECASE_LETTER: return "Lt";
        case U_MODIFIER_LETTER: return "Lm";
        case U_OTHER_LETTER: return "Lo";
        case U_NON_SPACING_MARK: return "Mn";
        case U_ENCLOSING_MARK: return "Me";
        case U_COMBINING_SPACING_MARK: return "Mc";
        case U_DECIMAL_DIGIT_NUMBER: return "Nd";
        case U_LETTER_NUMBER: return "Nl";
        case U_OTHER_NUMBER: return "No";
        case U_SPACE_SEPARATOR: return "Zs";
        case U_LINE_SEPARATOR: return "Zl";
        case U_PARAGRAPH_SEPARATOR: return "Zp";
        case U_CONTROL_CHAR: return "Cc";
        case U_FORMAT_CHAR: return "Cf";
        case U_PRIVATE_USE_CHAR: return "Co";
        case U_SURROGATE: return "Cs";
        case U_DASH_PUNCTUATION: return "Pd";
        case U_START_PUNCTUATION: return "Ps";
        case U_END_PUNCTUATION: return "Pe";
        case U_CONNECTOR_PUNCTUATION: return "Pc";
        case U_OTHER_PUNCTUATION: return "Po";
        case U_MATH_SYMBOL: return "Sm";
        case U_CURRENCY_SYMBOL: return "Sc";
        case U_MODIFIER_SYMBOL: return "Sk";
        case U_OTHER_SYMBOL: return "So";
        case U_INITIAL_PUNCTUATION: return "Pi";
        case U_FINAL_PUNCTUATION: return "Pf";
        case U_UNASSIGNED:
        default:
            return "Cn";
    }
}

std::string hex_message(uint32_t code_point) {
    std::ostringstream oss;
    oss << "Invalid code point: 0x" << std::hex << std::uppercase << code_point
        << " is outside [0, 0x10FFFF]";
    return oss.str();
}

} // anonymous namespace

InvalidCodePoint::InvalidCodePoint(uint32_t code_point)
    : std::invalid_argument(hex_message(code_point)), code_point_(code_point) {}

std::string general_category(uint32_t code_point) {
    check_range(code_point);
    return category_code(u_charType(static_cast<UChar32>(code_point)));
}

bool is_non_printable(uint32_t code_point) {
    check_range(code_point);
    const uint32_t mask = U_GET_GC_MASK(static_cast<UChar32>(code_point));
    return (mask & U_GC_C_MASK) != 0;
}

bool is_hidden(uint32_t code_point) {
    if (is_non_printable(code_point)) {
        return true;
    }
    return code_point == 0x00A0 || code_point == 0x2028 || code_point == 0x2029;
}

CodePointInfo describe(uint32_t code_point) {
    check_range(code_point);
    if (const NamedCodePoint* named = find_named(code_point)) {
        return {named->name, named->category};
    }
    return {to_hex(code_point), kUnknownCategory};
}

std::string to_hex(uint32_t code_point) {
    std::ostringstream oss;
    oss << "U+" << std::hex << std::uppercase << std::setw(4) << std::setfill('0') << code_point;
    return oss.str();
}

TokenClass classify_token(uint32_t code_point, const std::string& category) {
    check_range(code_point);
    if (code_point == 0x200B) return TokenClass::ZeroWidthSpace;
    if (code_point == 0x00A0) return TokenClass::NoBreakSpace;
    if (code_point == 0x00AD) return TokenClass::SoftHyphen;
    if (is_bidi_control(code_point)) return TokenClass::Bidi;

    auto starts_with = [&category](const char* prefix) {
        return category.compare(0, 2, prefix) == 0;
    };
    if (starts_with("Cc")) return TokenClass::Control;
    if (starts_with("Cf")) return TokenClass::Format;
    if (starts_with("Cs")) return TokenClass::Surrogate;
    if (starts_with("Co")) return TokenClass::PrivateUse;
    if (starts_with("Cn")) return TokenClass::Unassigned;
    return TokenClass::Format;
}

const char* token_class_name(TokenClass token_class) {
    switch (token_class) {
        case TokenClass::ZeroWidthSpace: return "token-zwsp";
        case TokenClass::NoBreakSpace: return "token-nbsp";
        case TokenClass::SoftHyphen: return "token-soft";
        case TokenClass::Bidi: return "token-bidi";
        case TokenClass::Control: return "token-cc";
        case TokenClass::Format: return "token-cf";
        case TokenClass::Surrogate: return "token-cs";
        case TokenClass::PrivateUse: return "token-co";
        case TokenClass::Unassigned: return "token-cn";
    }
    return "token-cf";
}

uint32_t sanitize_code_point(uint32_t code_point) noexcept {
    if (code_point > unicode::kMaxCodePoint || (code_point >= 0xD800 && code_point <= 0xDFFF)) {
        return unicode::kReplacementCharacter;
    }
    return code_point;
}

} // namespace hc
