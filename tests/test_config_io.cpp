#include "hc/config/config_io.hpp"
#include "check.hpp"
#include <cstdio>
#include <fstream>
#include <iostream>
#include <stdexcept>

using namespace hc;
using hc::test::check;
using hc::test::check_equal;

void run_json_conversion_test() {
    std::cout << "=== JSON CONVERSION TEST ===" << std::endl;

    nlohmann::json json = config::options_to_json(default_options());
    check_equal(json.size(), size_t(12), "twelve keys");
    check(json["removeCc"].get<bool>(), "removeCc default");
    check(json["preserveLF"].get<bool>(), "preserveLF default");
    check(!json["preserveCR"].get<bool>(), "preserveCR default");
    check(json["removeZWSP"].get<bool>(), "removeZWSP default");

    nlohmann::json partial = {{"preserveCR", true}, {"normalizeQuotes", false}, {"theme", "dark"}};
    CleanOptions options = config::options_from_json(partial);
    check(options.preserve_cr, "preserveCR read");
    check(!options.normalize_quotes, "normalizeQuotes read");
    check(options.remove_cc && options.nbsp_to_space, "missing keys keep defaults");

    bool threw = false;
    try {
        config::options_from_json(nlohmann::json{{"removeCf", "yes"}});
    } catch (const std::runtime_error&) {
        threw = true;
    }
    check(threw, "non-boolean value rejected");

    threw = false;
    try {
        config::options_from_json(nlohmann::json::array());
    } catch (const std::runtime_error&) {
        threw = true;
    }
    check(threw, "non-object rejected");
}

void run_file_test() {
    std::cout << "=== FILE TEST ===" << std::endl;

    const std::string path = "test_clean_options.json";
    CleanOptions options = default_options();
    options.preserve_tab = false;
    options.remove_co = false;
    config::save_options(options, path);

    CleanOptions loaded = config::load_options_strict(path);
    check(loaded == options, "saved options load back");
    check(config::load_options(path) == options, "lenient load reads the file");

    std::remove(path.c_str());
}

void run_fallback_test() {
    std::cout << "=== FALLBACK TEST ===" << std::endl;

    const std::string missing = "does_not_exist_options.json";
    check(config::load_options(missing) == default_options(), "missing file falls back to defaults");

    bool threw = false;
    try {
        config::load_options_strict(missing);
    } catch (const std::runtime_error& e) {
        threw = std::string(e.what()).find(missing) != std::string::npos;
    }
    check(threw, "strict load reports the path");

    const std::string broken = "broken_options.json";
    {
        std::ofstream file(broken);
        file << "{ \"removeCc\": ";
    }
    check(config::load_options(broken) == default_options(), "malformed JSON falls back to defaults");
    threw = false;
    try {
        config::load_options_strict(broken);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    check(threw, "strict load rejects malformed JSON");
    std::remove(broken.c_str());
}

int main() {
    std::cout << "Config IO Test Application" << std::endl;
    std::cout << "==========================" << std::endl;

    try {
        run_json_conversion_test();
        run_file_test();
        run_fallback_test();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return hc::test::report("config io");
}
