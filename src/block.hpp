#pragma once

/**
 * Quarto block model: classification of fence-opening lines and matching of
 * their close fences.
 *
 * Quarto (`quarto render --to=markdown`) wraps every executed cell in a
 * colon-fenced div, with nested divs for each output stream and backtick
 * fences for the source code. A block is first an OpenBlock (its end is not
 * known yet) and becomes a Block once its close fence has been found. Only
 * Blocks can be rendered.
 */

#include "line_table.hpp"
#include <optional>
#include <string>
#include <vector>

namespace mkq {

// Kinds of blocks the scanner understands.
enum class BlockKind {
    Cell,                  // :::: {.cell execution_count="1"}
    CellElement,           // ::: {.cell-output .cell-output-stdout}
    CellElementAlternate,  // ::::: cell-output-display
    CodeBlock,             // ``` {.python .cell-code}
    Html                   // Reserved. Never produced by the classifier.
};

// Human-readable name of a block kind, for diagnostics.
const char* kind_name(BlockKind kind);

/**
 * A block whose opening fence has been recognized but whose end is unknown.
 */
struct OpenBlock {
    BlockKind kind = BlockKind::Cell;
    std::string delimiter;                // Exact fence run, e.g. "::::" or "```".
    std::vector<std::string> attributes;  // Language tag or output classes.
    Cursor start;                         // Opening fence line, column 0.
};

/**
 * A block with a resolved end.
 *
 * `end` points just after the close fence, at column 0 of the following
 * line, and is always greater than `start`.
 */
struct Block {
    BlockKind kind = BlockKind::Cell;
    std::string delimiter;
    std::vector<std::string> attributes;
    Cursor start;
    Cursor end;

    Block(OpenBlock open, const Cursor& end_cursor);

    // Line index of the close fence.
    size_t close_line() const { return end.line - 1; }

    // First position inside the block (line after the opening fence).
    Cursor interior_begin() const { return start.advance_line(1); }

    // Position of the close fence; the interior stops right before it.
    Cursor interior_end() const { return Cursor{close_line(), 0}; }
};

/**
 * Tries the opening patterns in priority order (Cell, CellElement,
 * CellElementAlternate, CodeBlock) against a line and returns the opened
 * block, or nullopt when the line opens nothing. Lines that do not start with
 * a fence run of at least three characters, or that are longer than
 * MAX_OPENING_LINE_LENGTH, open nothing.
 */
std::optional<OpenBlock> classify_line(const std::string& line, const Cursor& at);

// Number of leading `fence_char` characters of the line.
size_t fence_run_length(const std::string& line, char fence_char);

// True if the line opens a Cell, CellElement or CellElementAlternate block.
bool is_quarto_colon_open(const std::string& line);

// True if the line, minus one optional trailing whitespace character, is
// exactly the delimiter.
bool is_close_fence(const std::string& line, const std::string& delimiter);

/**
 * Finds the close fence of an opened block, scanning from the line after the
 * opening fence up to (but excluding) `limit`.
 *
 * Throws UnterminatedBlockError when no close fence is found before the limit
 * and UnsupportedBlockError for the reserved Html kind.
 */
Block find_block_end(const LineTable& table, OpenBlock open, const Cursor& limit);

// Classifies the line at `at` and, when it opens a block, resolves its end
// within `limit`.
std::optional<Block> try_block_at(const LineTable& table, const Cursor& at, const Cursor& limit);

} // namespace mkq
