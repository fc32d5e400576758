#pragma once

#include "hc/clean/clean_options.hpp"
#include "hc/clean/clean_rule.hpp"
#include <memory>
#include <string>

namespace hc {

// Rule-driven rewrite pass. Each code point goes through the rule list in
// priority order and the first rule that fires decides its output; a code
// point no rule handles is copied unchanged.
//
// Built-in order: nbsp-to-space, normalize-dashes, normalize-quotes,
// remove-zwsp (each present only when its flag is set), rules added with
// add_rule(), then category handling.
class Cleaner {
public:
    explicit Cleaner(const CleanOptions& options = default_options());
    ~Cleaner();

    Cleaner(Cleaner&&) noexcept;
    Cleaner& operator=(Cleaner&&) noexcept;

    // Inserts a rule ahead of category handling, after earlier added rules
    void add_rule(std::unique_ptr<CleanRule> rule);

    std::string clean(const std::string& text) const;
    std::u16string clean(const std::u16string& text) const;

    const CleanOptions& options() const;
    size_t rule_count() const;

    // Debug methods
    void enable_debug_logging(bool enable);
    void dump_rules() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

std::string clean(const std::string& text, const CleanOptions& options);
std::u16string clean(const std::u16string& text, const CleanOptions& options);

// Removes every non-printable code point, with no preservation overrides
std::string strip_non_printable(const std::string& text);

// Export name for cleaned text: "notes.md" -> "notes-clean.txt",
// "" -> "cleaned.txt"
std::string cleaned_file_name(const std::string& file_name);

} // namespace hc
