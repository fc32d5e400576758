#pragma once

#include "hc/clean/clean_options.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace hc::config {

// JSON keys match the option names of the cleaning UI: removeCc, removeCf,
// removeCs, removeCo, removeCn, preserveTab, preserveLF, preserveCR,
// removeZWSP, nbspToSpace, normalizeDashes, normalizeQuotes.
nlohmann::json options_to_json(const CleanOptions& options);

// Keys missing from json keep their value from base; unknown keys are
// ignored. Throws std::runtime_error if json is not an object or a known key
// holds a non-boolean.
CleanOptions options_from_json(const nlohmann::json& json,
                               const CleanOptions& base = default_options());

// Throws std::runtime_error if the file cannot be read or parsed
CleanOptions load_options_strict(const std::string& path);

// Falls back to default_options() when the file is missing or invalid
CleanOptions load_options(const std::string& path);

void save_options(const CleanOptions& options, const std::string& path);

} // namespace hc::config
