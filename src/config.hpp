#pragma once

/**
 * Application configuration constants.
 *
 * Defines the settings file, conversion defaults, recognized input types and
 * the fixed mapping from Quarto output classes to MkDocs admonitions.
 */

#include <cstddef>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace mkq {

// ========== File Paths ==========

constexpr const char* SETTINGS_FILE = ".mkquarto.json";  // Local settings file.

// ========== Conversion Defaults ==========

constexpr const char* DEFAULT_OUTPUT_EXTENSION = ".mkdocs.md";  // Appended to the source stem.
constexpr size_t DEFAULT_MAX_NESTING_DEPTH = 64;                // Deepest accepted block nesting.
constexpr size_t MAX_NESTING_DEPTH_LIMIT = 4096;                // Upper bound for --max-depth.

// Indentation unit of an admonition body.
constexpr const char* ADMONITION_INDENT = "    ";

// Marker that turns raw HTML inside an admonition back into markdown.
constexpr const char* MARKDOWN_DIV = "<div markdown=\"block\">";

// Prefix shared by every colon fence.
constexpr const char* COLON_FENCE = ":::";

// Longest line still considered as a block opening. Longer fence lines are
// never classified and only go through colon-fence normalization.
constexpr size_t MAX_OPENING_LINE_LENGTH = 2048;

// ========== Supported File Extensions ==========

// Extensions of Quarto-rendered markdown documents.
inline const std::unordered_set<std::string> SUPPORTED_EXTENSIONS = {
    ".md", ".markdown"
};

// ========== Output Admonitions ==========

// Maps Quarto output classes to admonition opening lines.
// "???+" is a collapsible block rendered open by default.
inline const std::unordered_map<std::string, std::string> OUTPUT_ADMONITIONS = {
    {".cell-output-stdout", "???+ note \"output\""},
    {".cell-output-stderr", "???+ warning \"stderr\""},
    {".cell-output-error", "???+ danger \"error\""},
    {".cell-output-display", "???+ note \"Display\""},
    {"cell-output-display", "???+ note"}
};

} // namespace mkq
