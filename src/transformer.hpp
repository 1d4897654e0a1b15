#pragma once

/**
 * Document-level driver of the Quarto to MkDocs conversion.
 *
 * Walks a rendered document top to bottom. Lines that open a recognized
 * block are replaced by the block's rendering; every other line is copied,
 * with mkdocstrings colon fences narrowed back to ":::". The final output is
 * checked for Quarto syntax that escaped processing.
 *
 * Usage:
 *   Transformer transformer;
 *   std::vector<std::string> out = transformer.transform(split_lines(text));
 */

#include "config.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace mkq {

struct TransformOptions {
    size_t max_nesting_depth = DEFAULT_MAX_NESTING_DEPTH;  // Top-level blocks are depth 1.
};

/**
 * Counters gathered during one transform, for reporting.
 * Block counts cover document-level blocks only.
 */
struct TransformStats {
    size_t cells = 0;
    size_t output_blocks = 0;     // CellElement and CellElementAlternate.
    size_t code_blocks = 0;
    size_t normalized_lines = 0;  // mkdocstrings fences rewritten to ":::".
    size_t output_lines = 0;
};

/**
 * Rewrites a colon fence that is not Quarto syntax to exactly three colons,
 * keeping whatever follows the colons. Quarto widens mkdocstrings fences
 * ("::::: pathlib.Path") when they sit inside nested divs; mkdocstrings only
 * accepts ":::". Any other line is returned unchanged.
 */
std::string normalize_colon_fence(const std::string& line);

/**
 * Throws UnprocessedSyntaxError if any line still opens a Quarto colon block.
 * Unrelated colon-fence lines are accepted.
 */
void ensure_no_unprocessed_syntax(const std::vector<std::string>& lines);

class Transformer {
public:
    explicit Transformer(TransformOptions options = TransformOptions());

    /**
     * Converts one document. Throws a TransformError subclass on malformed
     * input; no partial output is ever returned.
     */
    std::vector<std::string> transform(const std::vector<std::string>& lines) const;

    // Same as above, also filling in counters.
    std::vector<std::string> transform(const std::vector<std::string>& lines,
                                       TransformStats& stats) const;

    const TransformOptions& options() const { return options_; }

private:
    TransformOptions options_;
};

} // namespace mkq
