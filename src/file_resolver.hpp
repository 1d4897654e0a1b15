#pragma once

/**
 * Input resolution for glob-style document arguments.
 *
 * Resolves user-provided patterns (globs, directories, literal paths) to a
 * list of absolute paths of Quarto-rendered markdown documents.
 */

#include <string>
#include <vector>

namespace mkq {

class Console;

// Returns true if the file has a rendered-markdown extension (.md, .markdown).
bool is_supported_extension(const std::string& filepath);

/**
 * Returns true if the file is a previous conversion result: its name ends
 * with the output extension and it could have been written by a conversion.
 *
 * When an output directory is set and the output extension is itself a
 * source extension (e.g. "-e .md -o site"), only files under that directory
 * count as outputs.
 */
bool is_conversion_output(const std::string& filepath, const std::string& output_extension,
                          const std::string& output_dir = "");

// Converts a glob pattern (*, **, ?, [...]) to an anchored regex pattern.
std::string glob_to_regex(const std::string& glob);

/**
 * Resolves patterns to a de-duplicated, ordered list of absolute paths.
 *
 * Supports:
 *   - Literal file paths (e.g., "docs/example.md")
 *   - Single * wildcard (matches any characters in a file name)
 *   - ** recursive wildcard (matches any directory depth)
 *   - Directory paths (walks all supported files recursively)
 *
 * Previous conversion outputs (see is_conversion_output) are skipped.
 * Warnings are printed to the console for missing files, unsupported types
 * and unmatched patterns.
 */
std::vector<std::string> resolve_file_patterns(
    const std::vector<std::string>& patterns,
    const std::string& output_extension,
    const Console& console,
    const std::string& output_dir = ""
);

} // namespace mkq
