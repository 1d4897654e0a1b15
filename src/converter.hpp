#pragma once

/**
 * File-level conversion of Quarto-rendered documents.
 *
 * Reads a rendered document, runs it through a Transformer and writes the
 * result next to the source (or into an output directory) under a different
 * extension. A document that fails to transform produces no output file.
 */

#include "transformer.hpp"
#include <string>
#include <vector>

namespace mkq {

// Splits text into lines, dropping "\n" and a trailing "\r". A final newline
// does not produce an extra empty line.
std::vector<std::string> split_lines(const std::string& text);

// Joins lines with "\n", ending with a newline unless there are no lines.
std::string join_lines(const std::vector<std::string>& lines);

struct ConvertOptions {
    std::string output_extension = DEFAULT_OUTPUT_EXTENSION;
    std::string output_dir;   // Empty: write next to the source.
    std::string source_root;  // Sources under it keep their relative folder in output_dir.
    bool dry_run = false;     // Transform only, do not write.
};

// Result of converting one file.
struct ConvertResult {
    std::string source;
    std::string target;
    TransformStats stats;
    bool written = false;
};

/**
 * Target path for a source document: the source file name with its
 * extension replaced by the output extension.
 *
 * Without an output directory the target sits next to the source. With one,
 * a source under `source_root` keeps its folder relative to that root
 * ("docs/a/index.md" with root "docs" goes to "<out>/a/index.mkdocs.md");
 * any other source lands directly in the output directory.
 * Throws std::runtime_error when the target equals the source.
 */
std::string target_path_for(const std::string& source, const ConvertOptions& options);

// Deepest directory containing every file. Empty for an empty list.
std::string common_base_dir(const std::vector<std::string>& files);

// Throws std::runtime_error naming every target path that more than one
// source would write. Sources without a valid target are left to convert_file.
void ensure_distinct_targets(const std::vector<std::string>& sources, const ConvertOptions& options);

// Transforms a whole document held in memory.
std::string convert_document(const std::string& text, const Transformer& transformer,
                             TransformStats& stats);

/**
 * Converts one file on disk.
 *
 * Throws std::runtime_error on I/O failures and TransformError subclasses on
 * malformed documents.
 */
ConvertResult convert_file(const std::string& source, const Transformer& transformer,
                           const ConvertOptions& options);

} // namespace mkq
