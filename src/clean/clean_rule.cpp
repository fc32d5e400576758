// src/clean/clean_rule.cpp
#include "hc/clean/clean_rule.hpp"
#include "hc/unicode/classifier.hpp"
#include <utility>

namespace hc {

ReplacementRule::ReplacementRule(std::string name, std::map<uint32_t, char32_t> table)
    : name_(std::move(name)), table_(std::move(table)) {}

std::optional<std::u32string> ReplacementRule::apply(uint32_t code_point) const {
    auto it = table_.find(code_point);
    if (it == table_.end()) {
        return std::nullopt;
    }
    return std::u32string(1, it->second);
}

ReplacementRule ReplacementRule::no_break_space() {
    return ReplacementRule("nbsp-to-space", {{0x00A0, U' '}});
}

ReplacementRule ReplacementRule::dashes() {
    return ReplacementRule("normalize-dashes", {
        {0x2010, U'-'},  // HYPHEN
        {0x2011, U'-'},  // NON-BREAKING HYPHEN
        {0x2012, U'-'},  // FIGURE DASH
        {0x2013, U'-'},  // EN DASH
        {0x2014, U'-'},  // EM DASH
        {0x2212, U'-'},  // MINUS SIGN
    });
}

ReplacementRule ReplacementRule::quotes() {
    return ReplacementRule("normalize-quotes", {
        {0x2018, U'\''},
        {0x2019, U'\''},
        {0x201A, U'\''},
        {0x201B, U'\''},
        {0x2032, U'\''},  // PRIME
        {0x201C, U'"'},
        {0x201D, U'"'},
        {0x201E, U'"'},
        {0x201F, U'"'},
        {0x2033, U'"'},   // DOUBLE PRIME
    });
}

RemovalRule::RemovalRule(std::string name, std::set<uint32_t> code_points)
    : name_(std::move(name)), code_points_(std::move(code_points)) {}

std::optional<std::u32string> RemovalRule::apply(uint32_t code_point) const {
    if (code_points_.count(code_point) == 0) {
        return std::nullopt;
    }
    return std::u32string();
}

RemovalRule RemovalRule::zero_width_space() {
    return RemovalRule("remove-zwsp", {0x200B});
}

CategoryRule::CategoryRule(const CleanOptions& options) : options_(options) {}

std::optional<std::u32string> CategoryRule::apply(uint32_t code_point) const {
    if (!is_non_printable(code_point)) {
        return std::nullopt;
    }

    const std::u32string keep(1, static_cast<char32_t>(code_point));
    if (code_point == 0x09 && options_.preserve_tab) return keep;
    if (code_point == 0x0A && options_.preserve_lf) return keep;
    if (code_point == 0x0D && options_.preserve_cr) return keep;

    if (should_remove(general_category(code_point))) {
        return std::u32string();
    }
    return keep;
}

bool CategoryRule::should_remove(const std::string& category) const {
    if (category == "Cc") return options_.remove_cc;
    if (category == "Cf") return options_.remove_cf;
    if (category == "Cs") return options_.remove_cs;
    if (category == "Co") return options_.remove_co;
    if (category == "Cn") return options_.remove_cn;
    return false;
}

} // namespace hc
