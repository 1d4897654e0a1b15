#pragma once

/**
 * Settings persistence for mkquarto.
 *
 * Handles loading and saving of project defaults to a local JSON file:
 * where converted documents go, which inputs to convert when none are given
 * on the command line, and the nesting cap of the transformer.
 */

#include "config.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace mkq {

/**
 * Project settings stored in .mkquarto.json.
 *
 * Command-line options override every field.
 */
struct Settings {
    std::string output_extension = DEFAULT_OUTPUT_EXTENSION;  // Replaces the source extension.
    std::string output_dir;                                   // Empty: next to the source.
    size_t max_nesting_depth = DEFAULT_MAX_NESTING_DEPTH;     // Transformer nesting cap.
    std::vector<std::string> input_patterns;                  // Used when no inputs are given.
    bool verbose = false;                                     // Enable verbose logging.

    // Returns true if the settings can drive a conversion.
    bool is_valid() const {
        return !output_extension.empty() && max_nesting_depth > 0 &&
               max_nesting_depth <= MAX_NESTING_DEPTH_LIMIT;
    }
};

// Loads settings from a JSON file. Returns empty optional if the file doesn't
// exist or is not valid JSON. Missing keys keep their defaults.
std::optional<Settings> load_settings(const std::string& path = SETTINGS_FILE);

// Saves settings to a JSON file. Returns false if the file can't be written.
bool save_settings(const Settings& settings, const std::string& path = SETTINGS_FILE);

} // namespace mkq
