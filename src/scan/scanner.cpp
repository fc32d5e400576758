// src/scan/scanner.cpp
#include "hc/scan/scanner.hpp"
#include "hc/unicode/classifier.hpp"
#include "hc/unicode/unicode_utils.hpp"

namespace hc {

namespace {

constexpr uint32_t kCarriageReturn = 0x0D;
constexpr uint32_t kLineFeed = 0x0A;
constexpr uint32_t kLineSeparator = 0x2028;
constexpr uint32_t kParagraphSeparator = 0x2029;

template <typename Text>
std::vector<PositionedOccurrence> scan_impl(const Text& text) {
    std::vector<PositionedOccurrence> results;
    const auto code_points = unicode::to_code_points(text);

    LineTracker tracker;
    for (size_t i = 0; i < code_points.size(); ++i) {
        const auto& cp = code_points[i];

        if (is_hidden(cp.value)) {
            const CodePointInfo info = describe(cp.value);
            PositionedOccurrence occurrence;
            occurrence.index = cp.offset;
            occurrence.length = cp.length;
            occurrence.character = unicode::to_utf8(cp.value);
            occurrence.code_point = cp.value;
            occurrence.name = info.name;
            occurrence.category = info.category;
            occurrence.line = tracker.position().line;
            occurrence.column = tracker.position().column;
            results.push_back(std::move(occurrence));
        }

        const bool has_next = i + 1 < code_points.size();
        tracker.advance(cp.value, has_next, has_next ? code_points[i + 1].value : 0);
    }

    return results;
}

template <typename Text>
size_t position_to_offset_impl(const Text& text, size_t line, size_t column) {
    if (line < 1 || column < 1) {
        return 0;
    }

    const auto code_points = unicode::to_code_points(text);
    LineTracker tracker;
    for (size_t i = 0; i < code_points.size(); ++i) {
        const auto& cp = code_points[i];
        const TextPosition& here = tracker.position();
        if (here.line == line && here.column == column) {
            return cp.offset;
        }

        const bool has_next = i + 1 < code_points.size();
        const uint32_t next = has_next ? code_points[i + 1].value : 0;
        if (here.line == line && LineTracker::ends_line(cp.value, has_next, next)) {
            return cp.offset;
        }
        tracker.advance(cp.value, has_next, next);
    }

    return text.size();
}

template <typename Text>
TextPosition offset_to_position_impl(const Text& text, size_t offset) {
    const auto code_points = unicode::to_code_points(text);
    LineTracker tracker;
    for (size_t i = 0; i < code_points.size(); ++i) {
        const auto& cp = code_points[i];
        if (cp.offset + cp.length > offset) {
            return tracker.position();
        }
        const bool has_next = i + 1 < code_points.size();
        tracker.advance(cp.value, has_next, has_next ? code_points[i + 1].value : 0);
    }
    return tracker.position();
}

} // anonymous namespace

bool LineTracker::ends_line(uint32_t code_point, bool has_next, uint32_t next) {
    if (code_point == kCarriageReturn) {
        return !(has_next && next == kLineFeed);
    }
    return code_point == kLineFeed || code_point == kLineSeparator ||
           code_point == kParagraphSeparator;
}

void LineTracker::advance(uint32_t code_point, bool has_next, uint32_t next) {
    if (ends_line(code_point, has_next, next)) {
        position_.line += 1;
        position_.column = 1;
    } else {
        position_.column += 1;
    }
}

std::vector<PositionedOccurrence> scan(const std::string& text) {
    return scan_impl(text);
}

std::vector<PositionedOccurrence> scan(const std::u16string& text) {
    return scan_impl(text);
}

size_t position_to_offset(const std::string& text, size_t line, size_t column) {
    return position_to_offset_impl(text, line, column);
}

size_t position_to_offset(const std::u16string& text, size_t line, size_t column) {
    return position_to_offset_impl(text, line, column);
}

TextPosition offset_to_position(const std::string& text, size_t offset) {
    return offset_to_position_impl(text, offset);
}

TextPosition offset_to_position(const std::u16string& text, size_t offset) {
    return offset_to_position_impl(text, offset);
}

} // namespace hc
