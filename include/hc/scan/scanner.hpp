#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace hc {

// One detected hidden character.
// index and length are in the addressing unit of the scanned text: bytes for
// UTF-8 std::string, code units for std::u16string. text.substr(index, length)
// selects exactly the matched code point.
struct Occurrence {
    size_t index = 0;
    size_t length = 0;
    std::string character;  // UTF-8 form of the code point
    uint32_t code_point = 0;
    std::string name;
    std::string category;
};

struct PositionedOccurrence : Occurrence {
    size_t line = 1;    // 1-based
    size_t column = 1;  // 1-based, counts code points since the line start
};

struct TextPosition {
    size_t line = 1;
    size_t column = 1;

    bool operator==(const TextPosition& other) const {
        return line == other.line && column == other.column;
    }
    bool operator!=(const TextPosition& other) const { return !(*this == other); }
};

// Forward line/column bookkeeping shared by every view of a text.
// CR LF is one break: the CR occupies a column and the LF ends the line.
// A lone CR, LF, LINE SEPARATOR or PARAGRAPH SEPARATOR each end a line.
class LineTracker {
public:
    const TextPosition& position() const { return position_; }

    // Moves past code_point. has_next/next describe the following code point.
    void advance(uint32_t code_point, bool has_next, uint32_t next);

    // True if code_point (followed by next) terminates the current line
    static bool ends_line(uint32_t code_point, bool has_next, uint32_t next);

private:
    TextPosition position_;
};

std::vector<PositionedOccurrence> scan(const std::string& text);
std::vector<PositionedOccurrence> scan(const std::u16string& text);

// Offset of the code point at (line, column). Positions before the start map
// to 0; a column past the end of a line clamps to that line's terminator and
// a line past the end of the text clamps to text.size().
size_t position_to_offset(const std::string& text, size_t line, size_t column);
size_t position_to_offset(const std::u16string& text, size_t line, size_t column);

// Position of the code point starting at offset (or the end-of-text position)
TextPosition offset_to_position(const std::string& text, size_t offset);
TextPosition offset_to_position(const std::u16string& text, size_t offset);

} // namespace hc
