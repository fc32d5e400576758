#pragma once

#include "hc/clean/clean_options.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>

namespace hc {

// A rewrite rule applied to one code point at a time.
// apply() returns std::nullopt when the rule does not fire, otherwise the
// code points to emit in place of the input (empty to drop it).
class CleanRule {
public:
    virtual ~CleanRule() = default;
    virtual std::optional<std::u32string> apply(uint32_t code_point) const = 0;
    virtual std::string name() const = 0;
};

// Exact one-to-one replacement from a fixed table
class ReplacementRule : public CleanRule {
public:
    ReplacementRule(std::string name, std::map<uint32_t, char32_t> table);
    ~ReplacementRule() override = default;

    std::optional<std::u32string> apply(uint32_t code_point) const override;
    std::string name() const override { return name_; }

    // NO-BREAK SPACE -> SPACE
    static ReplacementRule no_break_space();
    // Hyphen and dash variants, MINUS SIGN -> HYPHEN-MINUS
    static ReplacementRule dashes();
    // Curly, low-9 and prime quotes -> ' and "
    static ReplacementRule quotes();

private:
    std::string name_;
    std::map<uint32_t, char32_t> table_;
};

// Drops every code point of a fixed set
class RemovalRule : public CleanRule {
public:
    RemovalRule(std::string name, std::set<uint32_t> code_points);
    ~RemovalRule() override = default;

    std::optional<std::u32string> apply(uint32_t code_point) const override;
    std::string name() const override { return name_; }

    static RemovalRule zero_width_space();

private:
    std::string name_;
    std::set<uint32_t> code_points_;
};

// Handles non-printable code points: TAB/LF/CR preservation first, then
// removal by general category. Printable code points do not fire.
class CategoryRule : public CleanRule {
public:
    explicit CategoryRule(const CleanOptions& options);
    ~CategoryRule() override = default;

    std::optional<std::u32string> apply(uint32_t code_point) const override;
    std::string name() const override { return "category"; }

private:
    bool should_remove(const std::string& category) const;

    CleanOptions options_;
};

} // namespace hc
