#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "transformer.hpp"
#include "transform_error.hpp"
#include "verbose.hpp"
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace mkq;

// ============================================================================
// Whole documents
// ============================================================================

TEST_CASE("Cell with code and stderr output", "[transform]") {
    std::vector<std::string> input = {
        ":::: {.cell execution_count=\"1\"}",
        "``` {.python .cell-code}",
        "import warnings",
        "warnings.warn(\"This is a warning\")",
        "```",
        "",
        "::: {.cell-output .cell-output-stderr}",
        "    ... UserWarning: This is a warning",
        "      warnings.warn(\"This is a warning\")",
        ":::",
        "::::"
    };

    TransformStats stats;
    auto out = Transformer().transform(input, stats);

    REQUIRE(out == std::vector<std::string>{
        "```python",
        "import warnings",
        "warnings.warn(\"This is a warning\")",
        "```",
        "",
        "???+ warning \"stderr\"",
        "",
        "        ... UserWarning: This is a warning",
        "          warnings.warn(\"This is a warning\")",
        ""
    });
    REQUIRE(stats.cells == 1);
    REQUIRE(stats.output_blocks == 0);
    REQUIRE(stats.code_blocks == 0);
    REQUIRE(stats.output_lines == out.size());
}

TEST_CASE("Plain markdown passes through", "[transform]") {
    std::vector<std::string> input = {
        "# Title",
        "",
        "Some *text* with `code`.",
        "",
        "```python",
        "x = 1",
        "```"
    };
    REQUIRE(Transformer().transform(input) == input);
}

TEST_CASE("Empty document", "[transform]") {
    REQUIRE(Transformer().transform({}).empty());
}

TEST_CASE("Text around blocks is kept in order", "[transform]") {
    std::vector<std::string> input = {
        "before",
        "::: {.cell}",
        "``` {.r .cell-code}",
        "1 + 1",
        "```",
        ":::",
        "between",
        "::: {.cell-output .cell-output-stdout}",
        "    [1] 2",
        ":::",
        "after"
    };

    TransformStats stats;
    auto out = Transformer().transform(input, stats);

    REQUIRE(out == std::vector<std::string>{
        "before",
        "```r",
        "1 + 1",
        "```",
        "between",
        "???+ note \"output\"",
        "",
        "        [1] 2",
        "",
        "after"
    });
    REQUIRE(stats.cells == 1);
    REQUIRE(stats.output_blocks == 1);
}

TEST_CASE("Transforming twice is stable on plain output", "[transform]") {
    std::vector<std::string> input = {
        ":::: {.cell}",
        "``` {.python .cell-code}",
        "print(1)",
        "```",
        "::::",
        "::::: pathlib.Path"
    };
    Transformer transformer;
    auto once = transformer.transform(input);
    REQUIRE(transformer.transform(once) == once);
}

TEST_CASE("Errors abort the whole document", "[transform]") {
    Transformer transformer;

    REQUIRE_THROWS_AS(transformer.transform({":::: {.cell}", "text"}), UnterminatedBlockError);
    REQUIRE_THROWS_AS(transformer.transform({
        "::: {.cell-output .cell-output-weird}", "x", ":::"
    }), UnmappableOutputError);
    REQUIRE_THROWS_AS(transformer.transform({":::: {.cell}", "::: foo.bar", "::::"}), EscapedSyntaxError);
}

TEST_CASE("Unterminated document block reports its opening line", "[transform]") {
    try {
        Transformer().transform({"intro", "", ":::: {.cell}", "text"});
        FAIL("expected UnterminatedBlockError");
    } catch (const UnterminatedBlockError& e) {
        REQUIRE(e.line() == 3);
        REQUIRE(e.delimiter() == "::::");
        REQUIRE(std::string(e.what()).find("line 3") != std::string::npos);
    }
}

TEST_CASE("Nesting cap comes from the options", "[transform]") {
    std::vector<std::string> input = {
        ":::: {.cell}",
        "``` {.python .cell-code}",
        "x",
        "```",
        "::::"
    };

    TransformOptions options;
    options.max_nesting_depth = 1;
    try {
        Transformer(options).transform(input);
        FAIL("expected NestingTooDeepError");
    } catch (const NestingTooDeepError& e) {
        REQUIRE(e.depth() == 2);
        REQUIRE(e.line() == 2);
    }

    options.max_nesting_depth = 2;
    REQUIRE(Transformer(options).transform(input).size() == 3);
}

TEST_CASE("Transform summary is only logged in verbose mode", "[transform]") {
    std::ostringstream captured;
    std::streambuf* old = std::cerr.rdbuf(captured.rdbuf());

    Transformer().transform({"::: {.cell}", "x", ":::"});
    std::string quiet = captured.str();

    set_verbose(true);
    Transformer().transform({"::: {.cell}", "x", ":::"});
    set_verbose(false);
    std::cerr.rdbuf(old);

    REQUIRE(quiet.empty());
    REQUIRE(captured.str().find("3 lines in, 1 lines out, 1 top-level blocks") != std::string::npos);
}

// ============================================================================
// mkdocstrings fences
// ============================================================================

TEST_CASE("Three-colon fences are unchanged", "[transform]") {
    REQUIRE(normalize_colon_fence("::: foo.main.hello") == "::: foo.main.hello");
    REQUIRE(normalize_colon_fence(":::") == ":::");
}

TEST_CASE("Wide colon fences are narrowed", "[transform]") {
    REQUIRE(normalize_colon_fence("::::: pathlib.Path") == "::: pathlib.Path");
    REQUIRE(normalize_colon_fence(":::::") == ":::");
    REQUIRE(normalize_colon_fence("::::    options") == ":::    options");
}

TEST_CASE("Other lines are not normalized", "[transform]") {
    REQUIRE(normalize_colon_fence("text ::::: here") == "text ::::: here");
    REQUIRE(normalize_colon_fence("::") == "::");
    REQUIRE(normalize_colon_fence(":::::pathlib") == ":::::pathlib");
    REQUIRE(normalize_colon_fence(":::: {.cell}") == ":::: {.cell}");
    REQUIRE(normalize_colon_fence("::::: {.callout-note}") == "::::: {.callout-note}");
}

TEST_CASE("Normalizing is idempotent", "[transform]") {
    for (const std::string line : {"::::: pathlib.Path", ":::::", "::: x", "plain"}) {
        std::string once = normalize_colon_fence(line);
        REQUIRE(normalize_colon_fence(once) == once);
    }
}

TEST_CASE("Very long colon lines are normalized", "[transform]") {
    const std::string text(100000, 'x');
    REQUIRE(normalize_colon_fence("::: " + text) == "::: " + text);
    REQUIRE(normalize_colon_fence("::::: " + text) == "::: " + text);
    REQUIRE(normalize_colon_fence(std::string(100000, ':')) == ":::");
    REQUIRE(normalize_colon_fence(":::: {" + text) == ":::: {" + text);

    TransformStats stats;
    auto out = Transformer().transform({"::: foo" + text, std::string(100000, ':'), "::::: " + text}, stats);
    REQUIRE(out == std::vector<std::string>{"::: foo" + text, ":::", "::: " + text});
    REQUIRE(stats.normalized_lines == 2);
}

TEST_CASE("Document-level mkdocstrings fences are normalized", "[transform]") {
    TransformStats stats;
    auto out = Transformer().transform({"::::: pathlib.Path", "text", ":::::"}, stats);
    REQUIRE(out == std::vector<std::string>{"::: pathlib.Path", "text", ":::"});
    REQUIRE(stats.normalized_lines == 2);
}

// ============================================================================
// Final check
// ============================================================================

TEST_CASE("Output without Quarto openings passes the final check", "[transform]") {
    REQUIRE_NOTHROW(ensure_no_unprocessed_syntax({"::: foo.bar", ":::", "text"}));
    REQUIRE_NOTHROW(ensure_no_unprocessed_syntax({}));
}

TEST_CASE("Leftover Quarto openings fail the final check", "[transform]") {
    try {
        ensure_no_unprocessed_syntax({
            "text",
            ":::: {.cell}",
            "more",
            "::: {.cell-output .cell-output-stdout}"
        });
        FAIL("expected UnprocessedSyntaxError");
    } catch (const UnprocessedSyntaxError& e) {
        REQUIRE(e.escaped().size() == 2);
        REQUIRE(e.escaped()[0].first == 2);
        REQUIRE(e.escaped()[1].first == 4);
        REQUIRE(e.escaped()[1].second == "::: {.cell-output .cell-output-stdout}");
    }
}
