// src/scan/aggregator.cpp
#include "hc/scan/aggregator.hpp"
#include "hc/unicode/classifier.hpp"
#include "hc/unicode/unicode_utils.hpp"
#include <algorithm>
#include <map>

namespace hc {

namespace {

// U+25CC DOTTED CIRCLE
const char* const kPlaceholder = "&#9676;";

std::vector<FrequencyEntry> tally(const std::vector<PositionedOccurrence>& occurrences) {
    std::map<uint32_t, FrequencyEntry> freq;
    for (const auto& occurrence : occurrences) {
        auto it = freq.find(occurrence.code_point);
        if (it == freq.end()) {
            FrequencyEntry entry;
            entry.code_point = occurrence.code_point;
            entry.name = occurrence.name;
            entry.category = occurrence.category;
            it = freq.emplace(occurrence.code_point, std::move(entry)).first;
        }
        it->second.count += 1;
    }

    std::vector<FrequencyEntry> entries;
    entries.reserve(freq.size());
    for (auto& kv : freq) {
        entries.push_back(std::move(kv.second));
    }

    // Map iteration is already ascending by code point; stable sort keeps
    // that order among equal counts
    std::stable_sort(entries.begin(), entries.end(),
        [](const FrequencyEntry& a, const FrequencyEntry& b) { return a.count > b.count; });
    return entries;
}

std::string token_markup(const PositionedOccurrence& occurrence) {
    const TokenClass cls = classify_token(occurrence.code_point, occurrence.category);
    const std::string title = occurrence.name + " (" + to_hex(occurrence.code_point) +
        ") — Category " + occurrence.category + " — at " +
        std::to_string(occurrence.line) + ":" + std::to_string(occurrence.column);

    std::string span = "<span class=\"token ";
    span += token_class_name(cls);
    span += "\" title=\"";
    span += escape_markup(title);
    span += "\">";
    span += kPlaceholder;
    span += "</span>";
    return span;
}

template <typename Text>
Report analyze_impl(const Text& text) {
    Report report;
    const auto code_points = unicode::to_code_points(text);
    std::string& markup = report.visualization.markup;
    markup.reserve(text.size());

    LineTracker tracker;
    std::string run;
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

            markup += escape_markup(run);
            run.clear();
            markup += token_markup(occurrence);
            report.occurrences.push_back(std::move(occurrence));
        } else {
            unicode::append_code_point(run, cp.value);
        }

        const bool has_next = i + 1 < code_points.size();
        tracker.advance(cp.value, has_next, has_next ? code_points[i + 1].value : 0);
    }
    markup += escape_markup(run);

    report.visualization.count = report.occurrences.size();
    report.frequencies = tally(report.occurrences);
    return report;
}

template <typename Text>
std::vector<Occurrence> find_hidden_impl(const Text& text) {
    const auto positioned = scan(text);
    return std::vector<Occurrence>(positioned.begin(), positioned.end());
}

} // anonymous namespace

std::vector<Occurrence> find_hidden(const std::string& text) {
    return find_hidden_impl(text);
}

std::vector<Occurrence> find_hidden(const std::u16string& text) {
    return find_hidden_impl(text);
}

std::vector<FrequencyEntry> summarize(const std::string& text) {
    return tally(scan(text));
}

std::vector<FrequencyEntry> summarize(const std::u16string& text) {
    return tally(scan(text));
}

Visualization visualize(const std::string& text) {
    return analyze_impl(text).visualization;
}

Visualization visualize(const std::u16string& text) {
    return analyze_impl(text).visualization;
}

Report analyze(const std::string& text) {
    return analyze_impl(text);
}

Report analyze(const std::u16string& text) {
    return analyze_impl(text);
}

std::string escape_markup(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': result += "&amp;"; break;
            case '<': result += "&lt;"; break;
            case '>': result += "&gt;"; break;
            default: result += c; break;
        }
    }
    return result;
}

} // namespace hc
