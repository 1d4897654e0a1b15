#include "line_table.hpp"
#include <algorithm>
#include <stdexcept>

namespace mkq {

LineTable::LineTable(const std::vector<std::string>& lines) : lines_(lines) {}

const std::string& LineTable::line(size_t index) const {
    if (index >= lines_.size()) {
        throw std::out_of_range("Line " + std::to_string(index) + " is past the end of a " +
                                std::to_string(lines_.size()) + "-line document");
    }
    return lines_[index];
}

std::string LineTable::line_from(const Cursor& cursor) const {
    const std::string& text = line(cursor.line);
    if (cursor.col >= text.size()) {
        return std::string();
    }
    return text.substr(cursor.col);
}

bool LineTable::past_end(const Cursor& cursor) const {
    return cursor.line >= lines_.size();
}

std::vector<std::string> LineTable::slice(const Cursor& start, const Cursor& end) const {
    std::vector<std::string> out;
    if (end <= start) {
        return out;
    }

    if (start.line == end.line) {
        const std::string& text = line(start.line);
        size_t from = std::min(start.col, text.size());
        out.push_back(text.substr(from, end.col - start.col));
        return out;
    }

    out.push_back(line_from(start));
    for (size_t i = start.line + 1; i < end.line; ++i) {
        out.push_back(line(i));
    }
    if (end.col > 0) {
        out.push_back(line(end.line).substr(0, end.col));
    }
    return out;
}

} // namespace mkq
