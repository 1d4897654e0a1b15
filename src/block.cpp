#include "block.hpp"
#include "config.hpp"
#include "transform_error.hpp"
#include "verbose.hpp"
#include <cctype>
#include <regex>
#include <utility>

namespace mkq {

namespace {
    // :::: {.cell execution_count="1"}
    // :::::: {.cell layout-align="default"}   (mermaid diagrams)
    const std::regex& cell_regex() {
        static const std::regex re(R"(^(:{3,}) \{\.cell(\s[^}]*)?\}\s*$)");
        return re;
    }

    // ::: {.cell-output .cell-output-stdout}
    // ::: {.cell-output .cell-output-display execution_count="3"}
    const std::regex& cell_element_regex() {
        static const std::regex re(
            R"(^(:{3,}) \{(\.cell-\w+)\s?(\.cell-[-\w]+)?( execution_count="\d+")?\}$)");
        return re;
    }

    // ::::: cell-output-display
    const std::regex& cell_element_alt_regex() {
        static const std::regex re(R"(^(:{3,})\s*(cell-output-display)\s*$)");
        return re;
    }

    // ``` {.python .cell-code}
    const std::regex& code_block_regex() {
        static const std::regex re(R"(^(`{3,})\s?\{\.([-\w]+)(\s[^}]*)?\}\s*$)");
        return re;
    }

    // Kinds a line can open, judged from its fence run alone. The regexes
    // are only run on lines of bounded length.
    enum class FenceShape { None, Colon, Backtick };

    FenceShape fence_shape(const std::string& line) {
        if (line.size() > MAX_OPENING_LINE_LENGTH) {
            return FenceShape::None;
        }
        if (fence_run_length(line, ':') >= 3) {
            return FenceShape::Colon;
        }
        if (fence_run_length(line, '`') >= 3) {
            return FenceShape::Backtick;
        }
        return FenceShape::None;
    }

    bool matches_colon_open(const std::string& line) {
        return std::regex_search(line, cell_regex()) ||
               std::regex_search(line, cell_element_regex()) ||
               std::regex_search(line, cell_element_alt_regex());
    }

    std::string trim(const std::string& s) {
        size_t start = s.find_first_not_of(" \t");
        if (start == std::string::npos) return "";
        size_t end = s.find_last_not_of(" \t");
        return s.substr(start, end - start + 1);
    }

    // Adds the non-empty captures [first, last] of a match as attributes.
    std::vector<std::string> captured_attributes(const std::smatch& m, size_t first, size_t last) {
        std::vector<std::string> attributes;
        for (size_t i = first; i <= last && i < m.size(); ++i) {
            if (!m[i].matched) continue;
            std::string value = trim(m[i].str());
            if (!value.empty()) {
                attributes.push_back(value);
            }
        }
        return attributes;
    }
}

const char* kind_name(BlockKind kind) {
    switch (kind) {
        case BlockKind::Cell: return "cell";
        case BlockKind::CellElement: return "cell-element";
        case BlockKind::CellElementAlternate: return "cell-element-alt";
        case BlockKind::CodeBlock: return "code-block";
        case BlockKind::Html: return "html";
    }
    return "unknown";
}

Block::Block(OpenBlock open, const Cursor& end_cursor)
    : kind(open.kind),
      delimiter(std::move(open.delimiter)),
      attributes(std::move(open.attributes)),
      start(open.start),
      end(end_cursor) {}

size_t fence_run_length(const std::string& line, char fence_char) {
    size_t count = 0;
    while (count < line.size() && line[count] == fence_char) {
        count++;
    }
    return count;
}

std::optional<OpenBlock> classify_line(const std::string& line, const Cursor& at) {
    const FenceShape shape = fence_shape(line);
    if (shape == FenceShape::None) {
        return std::nullopt;
    }

    std::smatch m;
    OpenBlock block;
    block.start = at;

    if (shape == FenceShape::Colon && std::regex_search(line, m, cell_regex())) {
        block.kind = BlockKind::Cell;
        block.delimiter = m[1].str();
        block.attributes = captured_attributes(m, 2, 2);
    } else if (shape == FenceShape::Colon && std::regex_search(line, m, cell_element_regex())) {
        block.kind = BlockKind::CellElement;
        block.delimiter = m[1].str();
        block.attributes = captured_attributes(m, 2, 4);
    } else if (shape == FenceShape::Colon && std::regex_search(line, m, cell_element_alt_regex())) {
        block.kind = BlockKind::CellElementAlternate;
        block.delimiter = m[1].str();
        block.attributes = captured_attributes(m, 2, 2);
    } else if (shape == FenceShape::Backtick && std::regex_search(line, m, code_block_regex())) {
        block.kind = BlockKind::CodeBlock;
        block.delimiter = m[1].str();
        block.attributes = captured_attributes(m, 2, 2);
    } else {
        return std::nullopt;
    }

    if (is_verbose()) {
        verbose_log("classify", std::string(kind_name(block.kind)) + " at line " +
                    std::to_string(at.line + 1) + ": " + truncate(line));
    }
    return block;
}

bool is_quarto_colon_open(const std::string& line) {
    return fence_shape(line) == FenceShape::Colon && matches_colon_open(line);
}

bool is_close_fence(const std::string& line, const std::string& delimiter) {
    size_t len = line.size();
    if (len > 0 && std::isspace(static_cast<unsigned char>(line[len - 1]))) {
        --len;
    }
    return line.compare(0, len, delimiter) == 0 && len == delimiter.size();
}

Block find_block_end(const LineTable& table, OpenBlock open, const Cursor& limit) {
    switch (open.kind) {
        case BlockKind::Cell:
        case BlockKind::CellElement:
        case BlockKind::CellElementAlternate:
        case BlockKind::CodeBlock:
            break;
        case BlockKind::Html:
            throw UnsupportedBlockError(open.kind, open.start.line + 1);
    }

    Cursor cursor = open.start.advance_line(1);
    while (cursor < limit && !table.past_end(cursor)) {
        if (is_close_fence(table.line_from(cursor), open.delimiter)) {
            if (is_verbose()) {
                verbose_log("match", std::string(kind_name(open.kind)) + " '" + open.delimiter +
                            "' lines " + std::to_string(open.start.line + 1) + "-" +
                            std::to_string(cursor.line + 1));
            }
            return Block(std::move(open), cursor.advance_line(1));
        }
        cursor = cursor.advance_line(1);
    }

    verbose_err("match", "no close fence for '" + open.delimiter + "' opened at line " +
                std::to_string(open.start.line + 1));
    throw UnterminatedBlockError(open.kind, open.delimiter, open.start.line + 1);
}

std::optional<Block> try_block_at(const LineTable& table, const Cursor& at, const Cursor& limit) {
    std::optional<OpenBlock> open = classify_line(table.line_from(at), at);
    if (!open) {
        return std::nullopt;
    }
    return find_block_end(table, std::move(*open), limit);
}

} // namespace mkq
