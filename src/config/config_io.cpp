#include "hc/config/config_io.hpp"
#include <fstream>
#include <stdexcept>

namespace hc::config {

namespace {

struct OptionKey {
    const char* key;
    bool CleanOptions::*member;
};

const OptionKey kOptionKeys[] = {
    {"removeCc", &CleanOptions::remove_cc},
    {"removeCf", &CleanOptions::remove_cf},
    {"removeCs", &CleanOptions::remove_cs},
    {"removeCo", &CleanOptions::remove_co},
    {"removeCn", &CleanOptions::remove_cn},
    {"preserveTab", &CleanOptions::preserve_tab},
    {"preserveLF", &CleanOptions::preserve_lf},
    {"preserveCR", &CleanOptions::preserve_cr},
    {"removeZWSP", &CleanOptions::remove_zwsp},
    {"nbspToSpace", &CleanOptions::nbsp_to_space},
    {"normalizeDashes", &CleanOptions::normalize_dashes},
    {"normalizeQuotes", &CleanOptions::normalize_quotes},
};

} // anonymous namespace

nlohmann::json options_to_json(const CleanOptions& options) {
    nlohmann::json json = nlohmann::json::object();
    for (const auto& option : kOptionKeys) {
        json[option.key] = options.*(option.member);
    }
    return json;
}

CleanOptions options_from_json(const nlohmann::json& json, const CleanOptions& base) {
    if (!json.is_object()) {
        throw std::runtime_error("Invalid options: expected a JSON object");
    }

    CleanOptions options = base;
    for (const auto& option : kOptionKeys) {
        if (!json.contains(option.key)) {
            continue;
        }
        const auto& value = json[option.key];
        if (!value.is_boolean()) {
            throw std::runtime_error(std::string("Config value is not a boolean: ") + option.key);
        }
        options.*(option.member) = value.get<bool>();
    }
    return options;
}

CleanOptions load_options_strict(const std::string& path) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open config file: " + path);
        }

        nlohmann::json json = nlohmann::json::parse(file);
        return options_from_json(json);

    } catch (const std::exception& e) {
        throw std::runtime_error("Failed to load options: " + std::string(e.what()));
    }
}

CleanOptions load_options(const std::string& path) {
    try {
        return load_options_strict(path);
    } catch (const std::runtime_error&) {
        // Fallback to defaults if the file doesn't exist or is invalid
        return default_options();
    }
}

void save_options(const CleanOptions& options, const std::string& path) {
    try {
        std::ofstream file(path);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open file for writing: " + path);
        }

        file << options_to_json(options).dump(2);

    } catch (const std::exception& e) {
        throw std::runtime_error("Failed to save options: " + std::string(e.what()));
    }
}

} // namespace hc::config
