#include "transformer.hpp"
#include "block.hpp"
#include "block_renderer.hpp"
#include "line_table.hpp"
#include "transform_error.hpp"
#include "verbose.hpp"
#include <cctype>
#include <iterator>
#include <optional>
#include <utility>

namespace mkq {

namespace {
    bool is_space(char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }

    // Matches `::::: pathlib.Path` and bare `:::::` closers, but not
    // `:::: {...}`: the colon run is followed by nothing, or by whitespace and
    // text that does not start right after a single space with "{".
    // Returns the text after the colon run on a match.
    std::optional<std::string> colon_fence_tail(const std::string& line) {
        const size_t colons = fence_run_length(line, ':');
        if (colons < 3) {
            return std::nullopt;
        }

        std::string tail = line.substr(colons);
        if (tail.empty()) {
            return tail;
        }
        if (!is_space(tail[0])) {
            return std::nullopt;
        }
        if (tail.size() > 1 && tail[1] == '{') {
            return std::nullopt;
        }
        return tail;
    }

    void count_block(const Block& block, TransformStats& stats) {
        switch (block.kind) {
            case BlockKind::Cell:
                ++stats.cells;
                break;
            case BlockKind::CellElement:
            case BlockKind::CellElementAlternate:
                ++stats.output_blocks;
                break;
            case BlockKind::CodeBlock:
                ++stats.code_blocks;
                break;
            case BlockKind::Html:
                break;
        }
    }
}

std::string normalize_colon_fence(const std::string& line) {
    std::optional<std::string> tail = colon_fence_tail(line);
    if (!tail || is_quarto_colon_open(line)) {
        return line;
    }
    return std::string(COLON_FENCE) + *tail;
}

void ensure_no_unprocessed_syntax(const std::vector<std::string>& lines) {
    std::vector<std::pair<size_t, std::string>> escaped;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (lines[i].compare(0, 3, COLON_FENCE) == 0 && is_quarto_colon_open(lines[i])) {
            escaped.emplace_back(i + 1, lines[i]);
        }
    }
    if (!escaped.empty()) {
        throw UnprocessedSyntaxError(std::move(escaped));
    }
}

Transformer::Transformer(TransformOptions options) : options_(options) {}

std::vector<std::string> Transformer::transform(const std::vector<std::string>& lines) const {
    TransformStats stats;
    return transform(lines, stats);
}

std::vector<std::string> Transformer::transform(const std::vector<std::string>& lines,
                                                TransformStats& stats) const {
    LineTable table(lines);
    BlockRenderer renderer(table, options_.max_nesting_depth);

    // Document-level blocks, in the order they were processed.
    std::vector<Block> context;
    std::vector<std::string> out;
    out.reserve(lines.size());

    Cursor cursor;
    while (!table.past_end(cursor)) {
        if (auto block = try_block_at(table, cursor, table.end())) {
            std::vector<std::string> rendered = renderer.render(*block);
            out.insert(out.end(), std::make_move_iterator(rendered.begin()),
                       std::make_move_iterator(rendered.end()));
            cursor = block->end;
            count_block(*block, stats);
            context.push_back(std::move(*block));
            continue;
        }

        std::string line = table.line_from(cursor);
        std::string normalized = normalize_colon_fence(line);
        if (normalized != line) {
            ++stats.normalized_lines;
            if (is_verbose()) {
                verbose_log("transform", "normalized line " + std::to_string(cursor.line + 1) +
                            ": '" + truncate(line) + "' -> '" + truncate(normalized) + "'");
            }
        }
        out.push_back(std::move(normalized));
        cursor = cursor.advance_line(1);
    }

    ensure_no_unprocessed_syntax(out);

    stats.output_lines = out.size();
    if (is_verbose()) {
        verbose_log("transform", std::to_string(lines.size()) + " lines in, " +
                    std::to_string(out.size()) + " lines out, " +
                    std::to_string(context.size()) + " top-level blocks");
    }
    return out;
}

} // namespace mkq
