#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace hc {

// Thrown for numeric values outside the Unicode code space [0, 0x10FFFF]
class InvalidCodePoint : public std::invalid_argument {
public:
    explicit InvalidCodePoint(uint32_t code_point);

    uint32_t code_point() const noexcept { return code_point_; }

private:
    uint32_t code_point_;
};

struct CodePointInfo {
    std::string name;
    std::string category;
};

// Presentation grouping for the annotated rendering
enum class TokenClass {
    ZeroWidthSpace,
    NoBreakSpace,
    SoftHyphen,
    Bidi,
    Control,      // Cc
    Format,       // Cf
    Surrogate,    // Cs
    PrivateUse,   // Co
    Unassigned    // Cn
};

// Placeholder category for code points outside the well-known table
extern const char* const kUnknownCategory;

// Two-letter Unicode general category ("Cc", "Lu", "Zs", ...) from ICU data
std::string general_category(uint32_t code_point);

// True iff the general category is Cc, Cf, Cs, Co or Cn.
// Surrogate values are inside the code space and classify as Cs.
bool is_non_printable(uint32_t code_point);

// Non-printable, or one of the visually ambiguous separators of the
// well-known table (NO-BREAK SPACE, LINE SEPARATOR, PARAGRAPH SEPARATOR).
bool is_hidden(uint32_t code_point);

// Well-known table entry, else { "U+XXXX", "C*" }
CodePointInfo describe(uint32_t code_point);

// "U+" + uppercase hex, zero padded to at least four digits
std::string to_hex(uint32_t code_point);

TokenClass classify_token(uint32_t code_point, const std::string& category);
const char* token_class_name(TokenClass token_class);

// Normalizing alternative to the throwing checks: out-of-range and surrogate
// values become U+FFFD.
uint32_t sanitize_code_point(uint32_t code_point) noexcept;

} // namespace hc
