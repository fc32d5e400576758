#pragma once

#include "hc/scan/scanner.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace hc {

struct FrequencyEntry {
    uint32_t code_point = 0;
    std::string name;
    std::string category;
    size_t count = 0;
};

struct Visualization {
    std::string markup;
    size_t count = 0;
};

// All three views of one text, produced by a single pass
struct Report {
    std::vector<PositionedOccurrence> occurrences;
    std::vector<FrequencyEntry> frequencies;
    Visualization visualization;
};

// Flat occurrence list, left to right
std::vector<Occurrence> find_hidden(const std::string& text);
std::vector<Occurrence> find_hidden(const std::u16string& text);

// One entry per distinct code point, by count descending then code point
std::vector<FrequencyEntry> summarize(const std::string& text);
std::vector<FrequencyEntry> summarize(const std::u16string& text);

// Markup with every hidden character replaced by a titled placeholder span.
// The markup is UTF-8 regardless of the input encoding.
Visualization visualize(const std::string& text);
Visualization visualize(const std::u16string& text);

Report analyze(const std::string& text);
Report analyze(const std::u16string& text);

// Escapes &, < and >
std::string escape_markup(const std::string& text);

} // namespace hc
