#include "block_renderer.hpp"
#include "config.hpp"
#include "transform_error.hpp"
#include "verbose.hpp"
#include <iterator>
#include <utility>

namespace mkq {

namespace {
    // Lines of context shown around an escaped colon fence.
    constexpr size_t ESCAPE_CONTEXT_LINES = 2;

    bool starts_with(const std::string& s, const std::string& prefix) {
        return s.compare(0, prefix.size(), prefix) == 0;
    }

    bool ends_with(const std::string& s, const std::string& suffix) {
        return s.size() >= suffix.size() &&
               s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    bool is_blank(const std::string& s) {
        return s.find_first_not_of(" \t\r") == std::string::npos;
    }

    std::string rtrim(const std::string& s) {
        size_t end = s.find_last_not_of(" \t\r");
        return end == std::string::npos ? std::string() : s.substr(0, end + 1);
    }

    void append(std::vector<std::string>& out, std::vector<std::string> lines) {
        out.insert(out.end(), std::make_move_iterator(lines.begin()),
                   std::make_move_iterator(lines.end()));
    }
}

std::optional<std::string> admonition_header(const std::vector<std::string>& attributes) {
    for (const auto& attribute : attributes) {
        auto it = OUTPUT_ADMONITIONS.find(attribute);
        if (it != OUTPUT_ADMONITIONS.end()) {
            return it->second;
        }
    }
    return std::nullopt;
}

BlockRenderer::BlockRenderer(const LineTable& table, size_t max_depth)
    : table_(table), max_depth_(max_depth) {}

std::vector<std::string> BlockRenderer::render(const Block& block, size_t depth) const {
    if (depth > max_depth_) {
        throw NestingTooDeepError(depth, max_depth_, block.start.line + 1);
    }

    std::vector<std::string> out;
    switch (block.kind) {
        case BlockKind::Cell:
            out = render_cell(block, depth);
            break;
        case BlockKind::CodeBlock:
            out = render_code_block(block, depth);
            break;
        case BlockKind::CellElement:
        case BlockKind::CellElementAlternate:
            out = render_cell_element(block, depth);
            break;
        case BlockKind::Html:
            throw UnsupportedBlockError(block.kind, block.start.line + 1);
    }

    check_output(block, out);

    if (is_verbose()) {
        verbose_log("render", std::string(kind_name(block.kind)) + " at line " +
                    std::to_string(block.start.line + 1) + " (depth " + std::to_string(depth) +
                    ") -> " + std::to_string(out.size()) + " lines");
    }
    return out;
}

std::vector<std::string> BlockRenderer::render_cell(const Block& block, size_t depth) const {
    return render_interior(block, depth);
}

std::vector<std::string> BlockRenderer::render_code_block(const Block& block, size_t depth) const {
    std::string language = block.attributes.empty() ? std::string() : block.attributes.front();

    std::vector<std::string> out;
    out.push_back(block.delimiter + language);
    append(out, render_interior(block, depth));
    out.push_back(block.delimiter);
    return out;
}

std::vector<std::string> BlockRenderer::render_cell_element(const Block& block, size_t depth) const {
    std::optional<std::string> header = admonition_header(block.attributes);
    if (!header) {
        throw UnmappableOutputError(block.attributes, block.start.line + 1);
    }

    std::vector<std::string> body;
    if (auto html = html_interior(block)) {
        body = std::move(*html);
    } else {
        body = render_interior(block, depth);
    }

    std::vector<std::string> out;
    out.reserve(body.size() + 3);
    out.push_back(*header);
    out.push_back("");
    for (auto& line : body) {
        out.push_back(line.empty() ? std::move(line) : ADMONITION_INDENT + line);
    }
    out.push_back("");
    return out;
}

std::vector<std::string> BlockRenderer::render_interior(const Block& block, size_t depth) const {
    std::vector<std::string> out;
    const Cursor limit = block.interior_end();
    Cursor last_end = block.interior_begin();

    while (auto nested = find_nested_block(last_end, limit)) {
        append(out, table_.slice(last_end, nested->start));
        append(out, render(*nested, depth + 1));
        last_end = nested->end;
    }

    append(out, table_.slice(last_end, limit));
    return out;
}

std::optional<Block> BlockRenderer::find_nested_block(const Cursor& from, const Cursor& limit) const {
    for (Cursor cursor = from; cursor < limit; cursor = cursor.advance_line(1)) {
        if (auto block = try_block_at(table_, cursor, limit)) {
            return block;
        }
    }
    return std::nullopt;
}

std::optional<std::vector<std::string>> BlockRenderer::html_interior(const Block& block) const {
    std::vector<std::string> lines = table_.slice(block.interior_begin(), block.interior_end());

    size_t first = 0;
    while (first < lines.size() && is_blank(lines[first])) ++first;
    if (first == lines.size() || !starts_with(lines[first], "<div>")) {
        return std::nullopt;
    }

    size_t last = lines.size() - 1;
    while (last > first && is_blank(lines[last])) --last;
    if (!ends_with(rtrim(lines[last]), "</div>")) {
        return std::nullopt;
    }

    // Styled HTML (e.g. pandas tables) needs md_in_html to keep its markdown.
    if (first + 1 < lines.size() && lines[first + 1].find("style") != std::string::npos) {
        lines[first] = MARKDOWN_DIV + lines[first].substr(5);
    }
    return lines;
}

void BlockRenderer::check_output(const Block& block, const std::vector<std::string>& out) const {
    std::vector<size_t> bad;
    for (size_t i = 0; i < out.size(); ++i) {
        if (starts_with(out[i], COLON_FENCE)) {
            bad.push_back(i);
        }
    }
    if (bad.empty()) {
        return;
    }

    std::vector<std::string> context;
    for (size_t i = 0; i < out.size(); ++i) {
        for (size_t b : bad) {
            size_t distance = i > b ? i - b : b - i;
            if (distance <= ESCAPE_CONTEXT_LINES) {
                context.push_back(std::to_string(i) + ": " + out[i]);
                break;
            }
        }
    }
    verbose_err("render", std::to_string(bad.size()) + " escaped colon fence(s) in block at line " +
                std::to_string(block.start.line + 1));
    throw EscapedSyntaxError(block.kind, block.start.line + 1, std::move(context));
}

} // namespace mkq
