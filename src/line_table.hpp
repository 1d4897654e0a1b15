#pragma once

/**
 * Line-addressed view of a rendered document.
 *
 * A document is a flat list of lines without newline characters. Positions
 * are (line, column) cursors. Block boundaries are always whole lines, so the
 * cursors produced while scanning sit at column 0.
 */

#include <cstddef>
#include <string>
#include <vector>

namespace mkq {

/**
 * A (line, column) position inside a LineTable.
 *
 * Ordered lexicographically: by line first, then by column.
 */
struct Cursor {
    size_t line = 0;
    size_t col = 0;

    // Returns the cursor n lines further down, at column 0.
    Cursor advance_line(size_t n = 1) const {
        return Cursor{line + n, 0};
    }

    // Returns the cursor n columns to the right on the same line.
    Cursor advance_col(size_t n) const {
        return Cursor{line, col + n};
    }
};

inline bool operator==(const Cursor& a, const Cursor& b) {
    return a.line == b.line && a.col == b.col;
}

inline bool operator!=(const Cursor& a, const Cursor& b) {
    return !(a == b);
}

inline bool operator<(const Cursor& a, const Cursor& b) {
    return a.line < b.line || (a.line == b.line && a.col < b.col);
}

inline bool operator>(const Cursor& a, const Cursor& b) {
    return b < a;
}

inline bool operator<=(const Cursor& a, const Cursor& b) {
    return !(b < a);
}

inline bool operator>=(const Cursor& a, const Cursor& b) {
    return !(a < b);
}

/**
 * Read-only table of document lines.
 *
 * The table does not own its lines; the vector it was built from must
 * outlive it. Ranges are half-open in (line, col) space with an implicit
 * line break after every line, so a range ending at column 0 of line L
 * stops at the break that terminates line L - 1.
 */
class LineTable {
public:
    explicit LineTable(const std::vector<std::string>& lines);

    // Number of lines in the table.
    size_t size() const { return lines_.size(); }

    bool empty() const { return lines_.empty(); }

    // Returns the full text of a line. Throws std::out_of_range.
    const std::string& line(size_t index) const;

    // Returns the text of the cursor's line starting at the cursor's column.
    std::string line_from(const Cursor& cursor) const;

    // True if the cursor lies beyond the last line.
    bool past_end(const Cursor& cursor) const;

    // First position past the last line.
    Cursor end() const { return Cursor{lines_.size(), 0}; }

    /**
     * Extracts the lines covered by [start, end).
     *
     * - start >= end: no lines.
     * - same line: the single substring [start.col, end.col).
     * - otherwise: the tail of the start line, every line strictly between,
     *   and the head of the end line when end.col > 0.
     */
    std::vector<std::string> slice(const Cursor& start, const Cursor& end) const;

private:
    const std::vector<std::string>& lines_;
};

} // namespace mkq
