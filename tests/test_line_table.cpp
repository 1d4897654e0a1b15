#include <catch2/catch.hpp>
#include "line_table.hpp"
#include <stdexcept>
#include <string>
#include <vector>

using namespace mkq;

// ============================================================================
// Cursor ordering
// ============================================================================

TEST_CASE("Cursors order by line then column", "[line_table]") {
    REQUIRE(Cursor{1, 5} < Cursor{2, 0});
    REQUIRE(Cursor{2, 0} < Cursor{2, 1});
    REQUIRE(Cursor{3, 0} > Cursor{2, 9});
    REQUIRE(Cursor{2, 4} == Cursor{2, 4});
    REQUIRE(Cursor{2, 4} <= Cursor{2, 4});
    REQUIRE(Cursor{2, 4} != Cursor{2, 5});
}

TEST_CASE("Advancing lines resets the column", "[line_table]") {
    Cursor c{4, 7};
    REQUIRE(c.advance_line(2) == Cursor{6, 0});
    REQUIRE(c.advance_col(3) == Cursor{4, 10});
    // Advancing returns a new cursor.
    REQUIRE(c == Cursor{4, 7});
}

TEST_CASE("Past-end is relative to the last line", "[line_table]") {
    std::vector<std::string> lines = {"a", "b", "c"};
    LineTable table(lines);

    REQUIRE_FALSE(table.past_end(Cursor{2, 0}));
    REQUIRE(table.past_end(Cursor{3, 0}));
    REQUIRE(table.end() == Cursor{3, 0});

    std::vector<std::string> none;
    LineTable empty(none);
    REQUIRE(empty.empty());
    REQUIRE(empty.past_end(Cursor{0, 0}));
}

// ============================================================================
// Text extraction
// ============================================================================

TEST_CASE("Line content starts at the cursor column", "[line_table]") {
    std::vector<std::string> lines = {"::: {.cell}", "body"};
    LineTable table(lines);

    REQUIRE(table.line_from(Cursor{0, 0}) == "::: {.cell}");
    REQUIRE(table.line_from(Cursor{0, 4}) == "{.cell}");
    REQUIRE(table.line_from(Cursor{1, 10}) == "");
    REQUIRE_THROWS_AS(table.line_from(Cursor{2, 0}), std::out_of_range);
}

TEST_CASE("Slice on a single line is a substring", "[line_table]") {
    std::vector<std::string> lines = {"hello world"};
    LineTable table(lines);

    auto out = table.slice(Cursor{0, 6}, Cursor{0, 11});
    REQUIRE(out == std::vector<std::string>{"world"});
}

TEST_CASE("Empty slices", "[line_table]") {
    std::vector<std::string> lines = {"a", "b"};
    LineTable table(lines);

    REQUIRE(table.slice(Cursor{1, 0}, Cursor{1, 0}).empty());
    REQUIRE(table.slice(Cursor{1, 0}, Cursor{0, 0}).empty());
}

TEST_CASE("Slice ending at column 0 stops at the previous line", "[line_table]") {
    std::vector<std::string> lines = {"open", "one", "two", "close"};
    LineTable table(lines);

    auto out = table.slice(Cursor{1, 0}, Cursor{3, 0});
    REQUIRE(out == std::vector<std::string>{"one", "two"});
}

TEST_CASE("Slice across lines keeps the head of the end line", "[line_table]") {
    std::vector<std::string> lines = {"abcdef", "middle", "uvwxyz"};
    LineTable table(lines);

    auto out = table.slice(Cursor{0, 3}, Cursor{2, 2});
    REQUIRE(out == std::vector<std::string>{"def", "middle", "uv"});
}

TEST_CASE("Slice may end at the table end", "[line_table]") {
    std::vector<std::string> lines = {"x", "y"};
    LineTable table(lines);

    auto out = table.slice(Cursor{0, 0}, table.end());
    REQUIRE(out == lines);
}
