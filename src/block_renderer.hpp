#pragma once

/**
 * Re-emits resolved Quarto blocks in the MkDocs dialect.
 *
 * - Cell: fences dropped, interior rendered in place.
 * - CodeBlock: "```{.python .cell-code}" becomes "```python".
 * - CellElement / CellElementAlternate: becomes a collapsible admonition
 *   whose body is the interior indented by one level.
 *
 * Every kind re-scans its own interior for nested blocks, so the interior is
 * partitioned left to right into plain-text runs (copied verbatim) and nested
 * blocks (rendered recursively).
 */

#include "block.hpp"
#include "line_table.hpp"
#include <optional>
#include <string>
#include <vector>

namespace mkq {

// Admonition opening line for a set of output classes: the mapping of the
// first attribute that has one, or nullopt when none does.
std::optional<std::string> admonition_header(const std::vector<std::string>& attributes);

class BlockRenderer {
public:
    /**
     * @param table Document being transformed; must outlive the renderer.
     * @param max_depth Deepest nesting level accepted (top-level blocks are 1).
     */
    BlockRenderer(const LineTable& table, size_t max_depth);

    /**
     * Renders a block and everything nested inside it.
     *
     * Throws UnmappableOutputError, UnterminatedBlockError (for nested
     * blocks), NestingTooDeepError and EscapedSyntaxError.
     */
    std::vector<std::string> render(const Block& block, size_t depth = 1) const;

private:
    const LineTable& table_;
    size_t max_depth_;

    std::vector<std::string> render_cell(const Block& block, size_t depth) const;
    std::vector<std::string> render_code_block(const Block& block, size_t depth) const;
    std::vector<std::string> render_cell_element(const Block& block, size_t depth) const;

    // Interior of a block with nested blocks substituted by their rendering.
    std::vector<std::string> render_interior(const Block& block, size_t depth) const;

    // First block opening in [from, limit), with its end resolved within limit.
    std::optional<Block> find_nested_block(const Cursor& from, const Cursor& limit) const;

    // Raw HTML output ("<div>" ... "</div>") is kept as is instead of being
    // scanned for nested fences. Returns nullopt for anything else.
    std::optional<std::vector<std::string>> html_interior(const Block& block) const;

    // Rejects output lines that still start with a colon fence.
    void check_output(const Block& block, const std::vector<std::string>& out) const;
};

} // namespace mkq
