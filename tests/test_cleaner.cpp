#include "hc/clean/cleaner.hpp"
#include "hc/unicode/unicode_utils.hpp"
#include "check.hpp"
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace hc;
using hc::test::check;
using hc::test::check_equal;

namespace {

CleanOptions all_off() {
    CleanOptions options;
    options.remove_cc = options.remove_cf = options.remove_cs = false;
    options.remove_co = options.remove_cn = false;
    options.preserve_tab = options.preserve_lf = options.preserve_cr = false;
    options.remove_zwsp = options.nbsp_to_space = false;
    options.normalize_dashes = options.normalize_quotes = false;
    return options;
}

// Replaces LATIN SMALL LETTER SHARP S with "ss"
class SharpSRule : public CleanRule {
public:
    std::optional<std::u32string> apply(uint32_t code_point) const override {
        if (code_point != 0x00DF) return std::nullopt;
        return std::u32string(U"ss");
    }
    std::string name() const override { return "sharp-s"; }
};

} // anonymous namespace

void run_default_options_test() {
    std::cout << "=== DEFAULT OPTIONS TEST ===" << std::endl;

    CleanOptions options = default_options();
    check(options.remove_cc && options.remove_cf && options.remove_cs &&
          options.remove_co && options.remove_cn, "all removal flags on");
    check(options.preserve_tab && options.preserve_lf, "TAB and LF preserved");
    check(!options.preserve_cr, "CR not preserved");
    check(options.remove_zwsp && options.nbsp_to_space &&
          options.normalize_dashes && options.normalize_quotes, "smart replace on");
}

void run_scenario_test() {
    std::cout << "=== SCENARIO TEST ===" << std::endl;

    CleanOptions options = default_options();
    check_equal(clean("A\xE2\x80\x8B" "B", options), std::string("AB"), "ZWSP removed");

    check_equal(clean("caf\xC3\xA9\r\n\xC2\xA0word", options),
                std::string("caf\xC3\xA9\n word"), "NBSP to space, CR dropped by default");
    CleanOptions keep_cr = options;
    keep_cr.preserve_cr = true;
    check_equal(clean("caf\xC3\xA9\r\n\xC2\xA0word", keep_cr),
                std::string("caf\xC3\xA9\r\n word"), "NBSP to space with CR kept");

    check_equal(clean("2020\xE2\x80\x94" "2021", options), std::string("2020-2021"), "EM DASH");
    check_equal(clean("He said \xE2\x80\x9Chello\xE2\x80\x9D", options),
                std::string("He said \"hello\""), "smart double quotes");

    check_equal(clean("\t\n", options), std::string("\t\n"), "TAB and LF kept by default");
    CleanOptions drop_tab = options;
    drop_tab.preserve_tab = false;
    drop_tab.remove_cc = true;
    check_equal(clean("\t\n", drop_tab), std::string("\n"), "TAB removed");

    check_equal(clean("", options), std::string(), "empty input");
    check_equal(clean("", all_off()), std::string(), "empty input, no rules");
}

void run_replacement_table_test() {
    std::cout << "=== REPLACEMENT TABLE TEST ===" << std::endl;

    CleanOptions options = default_options();
    // HYPHEN, NB HYPHEN, FIGURE DASH, EN DASH, EM DASH, MINUS SIGN
    const std::u16string dashes = u"\u2010\u2011\u2012\u2013\u2014\u2212";
    check(clean(dashes, options) == u"------", "every dash variant");

    const std::u16string quotes = u"\u2018\u2019\u201A\u201B\u2032\u201C\u201D\u201E\u201F\u2033";
    check(clean(quotes, options) == u"'''''\"\"\"\"\"", "every quote variant");

    // HORIZONTAL BAR is not in the dash table
    check(clean(std::u16string(u"\u2015"), options) == u"\u2015", "HORIZONTAL BAR untouched");
}

void run_flag_test() {
    std::cout << "=== FLAG TEST ===" << std::endl;

    CleanOptions options = all_off();
    const std::string text = "a\xC2\xA0" "b\xE2\x80\x93" "c\xE2\x80\x99" "d\xE2\x80\x8B" "e\x01";
    check_equal(clean(text, options), text, "nothing fires with every flag off");

    // ZWSP is Cf: with remove_zwsp off it still goes through category removal
    options.remove_cf = true;
    check_equal(clean("x\xE2\x80\x8By", options), std::string("xy"), "ZWSP removed as Cf");
    options.remove_cf = false;
    options.remove_zwsp = true;
    check_equal(clean("x\xE2\x80\x8By\xE2\x80\x8Dz", options), std::string("xy\xE2\x80\x8Dz"),
                "remove_zwsp leaves other Cf alone");

    // Separators are not non-printable and always pass through
    CleanOptions strict = default_options();
    check_equal(clean("a\xE2\x80\xA8" "b", strict), std::string("a\xE2\x80\xA8" "b"),
                "LINE SEPARATOR passes through");

    CleanOptions no_nbsp = default_options();
    no_nbsp.nbsp_to_space = false;
    check_equal(clean("a\xC2\xA0" "b", no_nbsp), std::string("a\xC2\xA0" "b"),
                "NBSP passes through without nbsp_to_space");
}

void run_category_removal_test() {
    std::cout << "=== CATEGORY REMOVAL TEST ===" << std::endl;

    // U+0001 (Cc), U+FEFF (Cf), U+E000 (Co), U+0378 (Cn)
    const std::string text = "a\x01" "b\xEF\xBB\xBF" "c\xEE\x80\x80" "d\xCD\xB8" "e";

    CleanOptions only_cc = all_off();
    only_cc.remove_cc = true;
    check_equal(clean(text, only_cc), std::string("ab\xEF\xBB\xBF" "c\xEE\x80\x80" "d\xCD\xB8" "e"), "Cc only");

    CleanOptions only_co = all_off();
    only_co.remove_co = true;
    check_equal(clean(text, only_co), std::string("a\x01" "b\xEF\xBB\xBF" "cd\xCD\xB8" "e"), "Co only");

    CleanOptions only_cn = all_off();
    only_cn.remove_cn = true;
    check_equal(clean(text, only_cn), std::string("a\x01" "b\xEF\xBB\xBF" "c\xEE\x80\x80" "de"), "Cn only");

    check_equal(clean(text, default_options()), std::string("abcde"), "all categories");

    // Lone surrogates only exist in UTF-16 text
    std::u16string wide = u"xy";
    wide.insert(wide.begin() + 1, static_cast<char16_t>(0xD800));
    CleanOptions only_cs = all_off();
    only_cs.remove_cs = true;
    check(clean(wide, only_cs) == u"xy", "Cs removed from UTF-16 text");
    check(clean(wide, all_off()) == wide, "Cs kept when remove_cs is off");

    CleanOptions keep_all_controls = default_options();
    keep_all_controls.preserve_cr = true;
    check_equal(clean("a\r\n\tb\x07", keep_all_controls), std::string("a\r\n\tb"),
                "preserved controls survive, BEL removed");
}

void run_strip_test() {
    std::cout << "=== STRIP TEST ===" << std::endl;

    check_equal(strip_non_printable("a\tb\r\nc\xE2\x80\x8B\xC2\xA0" "d"),
                std::string("abc\xC2\xA0" "d"), "strip removes every C* code point");
    check_equal(strip_non_printable(""), std::string(), "strip empty");
}

void run_custom_rule_test() {
    std::cout << "=== CUSTOM RULE TEST ===" << std::endl;

    Cleaner cleaner(default_options());
    const size_t built_in = cleaner.rule_count();
    cleaner.add_rule(std::make_unique<SharpSRule>());
    check_equal(cleaner.rule_count(), built_in + 1, "rule added");
    check_equal(cleaner.clean("Stra\xC3\x9F" "e\xE2\x80\x8B"), std::string("Strasse"), "custom rule fires");

    // Custom rules run before category handling: a rule for TAB overrides preservation
    Cleaner tab_cleaner(default_options());
    tab_cleaner.add_rule(std::make_unique<ReplacementRule>(
        "tab-to-space", std::map<uint32_t, char32_t>{{0x09, U' '}}));
    check_equal(tab_cleaner.clean("a\tb"), std::string("a b"), "custom rule ahead of category rule");

    bool threw = false;
    try {
        cleaner.add_rule(nullptr);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    check(threw, "null rule rejected");

    Cleaner logged(default_options());
    logged.enable_debug_logging(true);
    check_equal(logged.clean("x\xE2\x80\x94y"), std::string("x-y"), "debug logging does not alter output");
    logged.dump_rules();
}

void run_property_test() {
    std::cout << "=== PROPERTY TEST ===" << std::endl;

    const std::vector<std::string> samples = {
        "",
        "plain ascii",
        "tab\there\r\nand\rthere\n",
        "\xE2\x80\x8B\xE2\x80\x8C\xE2\x80\x8D\xEF\xBB\xBF",
        "\xE2\x80\x9Cq\xE2\x80\x9D \xE2\x80\x93 \xC2\xA0\xC2\xAD\x7F",
        "emoji \xF0\x9F\x98\x80\xE2\x80\x8D\xF0\x9F\x98\x80 \xF3\xB0\x80\x80",
        "bad \x80\xFF utf8",
    };

    std::vector<CleanOptions> option_sets = {default_options(), all_off()};
    CleanOptions mixed = default_options();
    mixed.preserve_tab = false;
    mixed.remove_cf = false;
    mixed.normalize_quotes = false;
    option_sets.push_back(mixed);

    for (const auto& text : samples) {
        for (const auto& options : option_sets) {
            const std::string once = clean(text, options);
            check(unicode::code_point_count(once) <= unicode::code_point_count(text),
                  "cleaning never grows the code point count");
        }
    }

    // Idempotence on printable ASCII
    std::string ascii;
    for (char c = 0x20; c < 0x7F; ++c) {
        ascii += c;
    }
    for (const auto& options : option_sets) {
        const std::string once = clean(ascii, options);
        check_equal(once, ascii, "printable ASCII unchanged");
        check_equal(clean(once, options), once, "cleaning is idempotent");
    }
}

void run_file_name_test() {
    std::cout << "=== FILE NAME TEST ===" << std::endl;

    check_equal(cleaned_file_name("notes.md"), std::string("notes-clean.txt"), "extension replaced");
    check_equal(cleaned_file_name("data.tar.gz"), std::string("data.tar-clean.txt"), "last extension only");
    check_equal(cleaned_file_name("README"), std::string("README-clean.txt"), "no extension");
    check_equal(cleaned_file_name("dir.v2/README"), std::string("dir.v2/README-clean.txt"), "dot in directory");
    check_equal(cleaned_file_name(""), std::string("cleaned.txt"), "no file name");
}

int main() {
    std::cout << "Cleaner Test Application" << std::endl;
    std::cout << "========================" << std::endl;

    try {
        run_default_options_test();
        run_scenario_test();
        run_replacement_table_test();
        run_flag_test();
        run_category_removal_test();
        run_strip_test();
        run_custom_rule_test();
        run_property_test();
        run_file_name_test();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return hc::test::report("cleaner");
}
