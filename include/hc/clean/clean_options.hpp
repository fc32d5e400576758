#pragma once

#include <iostream>

namespace hc {

struct CleanOptions {
    // Category removal
    bool remove_cc = true;
    bool remove_cf = true;
    bool remove_cs = true;
    bool remove_co = true;
    bool remove_cn = true;

    // Control preservation, checked before category removal
    bool preserve_tab = true;
    bool preserve_lf = true;
    bool preserve_cr = false;

    // Smart replace
    bool remove_zwsp = true;
    bool nbsp_to_space = true;
    bool normalize_dashes = true;
    bool normalize_quotes = true;

    bool operator==(const CleanOptions& other) const {
        return remove_cc == other.remove_cc && remove_cf == other.remove_cf &&
               remove_cs == other.remove_cs && remove_co == other.remove_co &&
               remove_cn == other.remove_cn && preserve_tab == other.preserve_tab &&
               preserve_lf == other.preserve_lf && preserve_cr == other.preserve_cr &&
               remove_zwsp == other.remove_zwsp && nbsp_to_space == other.nbsp_to_space &&
               normalize_dashes == other.normalize_dashes &&
               normalize_quotes == other.normalize_quotes;
    }
    bool operator!=(const CleanOptions& other) const { return !(*this == other); }

    // Display all flags
    void print(std::ostream& os = std::cout) const {
        auto flag = [](bool value) { return value ? "true" : "false"; };
        os << "=== Clean Options ===" << std::endl;
        os << "Remove Cc: " << flag(remove_cc) << std::endl;
        os << "Remove Cf: " << flag(remove_cf) << std::endl;
        os << "Remove Cs: " << flag(remove_cs) << std::endl;
        os << "Remove Co: " << flag(remove_co) << std::endl;
        os << "Remove Cn: " << flag(remove_cn) << std::endl;
        os << "Preserve TAB: " << flag(preserve_tab) << std::endl;
        os << "Preserve LF: " << flag(preserve_lf) << std::endl;
        os << "Preserve CR: " << flag(preserve_cr) << std::endl;
        os << "Remove ZWSP: " << flag(remove_zwsp) << std::endl;
        os << "NBSP to Space: " << flag(nbsp_to_space) << std::endl;
        os << "Normalize Dashes: " << flag(normalize_dashes) << std::endl;
        os << "Normalize Quotes: " << flag(normalize_quotes) << std::endl;
        os << "=====================" << std::endl;
    }
};

// Every removal flag on, TAB and LF kept, CR dropped, every smart replace on
CleanOptions default_options();

} // namespace hc
