// src/clean/cleaner.cpp
#include "hc/clean/cleaner.hpp"
#include "hc/unicode/classifier.hpp"
#include "hc/unicode/unicode_utils.hpp"
#include <iostream>
#include <stdexcept>
#include <vector>

namespace hc {

CleanOptions default_options() {
    return CleanOptions{};
}

class Cleaner::Impl {
public:
    explicit Impl(const CleanOptions& opts) : options(opts), category_rule(opts) {
        if (options.nbsp_to_space) {
            rules.push_back(std::make_unique<ReplacementRule>(ReplacementRule::no_break_space()));
        }
        if (options.normalize_dashes) {
            rules.push_back(std::make_unique<ReplacementRule>(ReplacementRule::dashes()));
        }
        if (options.normalize_quotes) {
            rules.push_back(std::make_unique<ReplacementRule>(ReplacementRule::quotes()));
        }
        if (options.remove_zwsp) {
            rules.push_back(std::make_unique<RemovalRule>(RemovalRule::zero_width_space()));
        }
    }

    template <typename Text>
    Text run(const Text& text) const;

    void log_start(size_t units) const;
    void log_rule(const unicode::CodePoint& cp, const CleanRule& rule,
                  const std::u32string& replacement) const;
    void log_done(size_t in_count, size_t out_count) const;

    CleanOptions options;
    std::vector<std::unique_ptr<CleanRule>> rules;
    CategoryRule category_rule;
    bool debug_logging = false;
};

template <typename Text>
Text Cleaner::Impl::run(const Text& text) const {
    log_start(text.size());

    Text out;
    out.reserve(text.size());
    size_t out_count = 0;

    const auto code_points = unicode::to_code_points(text);
    for (const auto& cp : code_points) {
        std::optional<std::u32string> replacement;
        const CleanRule* fired = nullptr;

        for (const auto& rule : rules) {
            replacement = rule->apply(cp.value);
            if (replacement) {
                fired = rule.get();
                break;
            }
        }
        if (!replacement) {
            replacement = category_rule.apply(cp.value);
            if (replacement) {
                fired = &category_rule;
            }
        }

        if (!replacement) {
            unicode::append_code_point(out, cp.value);
            ++out_count;
            continue;
        }

        log_rule(cp, *fired, *replacement);
        for (char32_t c : *replacement) {
            unicode::append_code_point(out, static_cast<uint32_t>(c));
            ++out_count;
        }
    }

    log_done(code_points.size(), out_count);
    return out;
}

void Cleaner::Impl::log_start(size_t units) const {
    if (!debug_logging) return;
    std::cout << "[CLEAN] Starting clean of " << units << " code units with "
              << rules.size() + 1 << " rules" << std::endl;
}

void Cleaner::Impl::log_rule(const unicode::CodePoint& cp, const CleanRule& rule,
                             const std::u32string& replacement) const {
    if (!debug_logging) return;
    std::cout << "[CLEAN] " << to_hex(cp.value) << " at offset " << cp.offset
              << " -> rule '" << rule.name() << "': ";
    if (replacement.empty()) {
        std::cout << "dropped";
    } else if (replacement.size() == 1 && replacement[0] == static_cast<char32_t>(cp.value)) {
        std::cout << "kept";
    } else {
        std::cout << "replaced with";
        for (char32_t c : replacement) {
            std::cout << " " << to_hex(static_cast<uint32_t>(c));
        }
    }
    std::cout << std::endl;
}

void Cleaner::Impl::log_done(size_t in_count, size_t out_count) const {
    if (!debug_logging) return;
    std::cout << "[CLEAN] Done: " << in_count << " code points in, "
              << out_count << " out" << std::endl;
}

Cleaner::Cleaner(const CleanOptions& options) : pimpl_(std::make_unique<Impl>(options)) {}

Cleaner::~Cleaner() = default;
Cleaner::Cleaner(Cleaner&&) noexcept = default;
Cleaner& Cleaner::operator=(Cleaner&&) noexcept = default;

void Cleaner::add_rule(std::unique_ptr<CleanRule> rule) {
    if (!rule) {
        throw std::invalid_argument("Cleaner::add_rule: rule must not be null");
    }
    pimpl_->rules.push_back(std::move(rule));
}

std::string Cleaner::clean(const std::string& text) const {
    return pimpl_->run(text);
}

std::u16string Cleaner::clean(const std::u16string& text) const {
    return pimpl_->run(text);
}

const CleanOptions& Cleaner::options() const {
    return pimpl_->options;
}

size_t Cleaner::rule_count() const {
    return pimpl_->rules.size() + 1;
}

void Cleaner::enable_debug_logging(bool enable) {
    pimpl_->debug_logging = enable;
}

void Cleaner::dump_rules() const {
    size_t priority = 1;
    for (const auto& rule : pimpl_->rules) {
        std::cout << priority++ << ": " << rule->name() << std::endl;
    }
    std::cout << priority << ": " << pimpl_->category_rule.name() << std::endl;
}

std::string clean(const std::string& text, const CleanOptions& options) {
    return Cleaner(options).clean(text);
}

std::u16string clean(const std::u16string& text, const CleanOptions& options) {
    return Cleaner(options).clean(text);
}

std::string strip_non_printable(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (const auto& cp : unicode::to_code_points(text)) {
        if (!is_non_printable(cp.value)) {
            unicode::append_code_point(out, cp.value);
        }
    }
    return out;
}

std::string cleaned_file_name(const std::string& file_name) {
    if (file_name.empty()) {
        return "cleaned.txt";
    }

    // Only a trailing ".word" extension on the last path component is replaced
    const size_t slash = file_name.find_last_of("/\\");
    const size_t dot = file_name.find_last_of('.');
    const bool has_extension = dot != std::string::npos &&
        (slash == std::string::npos || dot > slash) &&
        dot + 1 < file_name.size() &&
        file_name.find_first_not_of(
            "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789_", dot + 1) ==
            std::string::npos;

    if (has_extension) {
        return file_name.substr(0, dot) + "-clean.txt";
    }
    return file_name + "-clean.txt";
}

} // namespace hc
