#include <catch2/catch.hpp>
#include "converter.hpp"
#include "transform_error.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace mkq;

namespace fs = std::filesystem;

namespace {
    // Fresh scratch directory, removed when the test ends.
    class TempDir {
    public:
        explicit TempDir(const std::string& name)
            : path_(fs::temp_directory_path() / name) {
            fs::remove_all(path_);
            fs::create_directories(path_);
        }
        ~TempDir() {
            std::error_code ec;
            fs::remove_all(path_, ec);
        }

        const fs::path& path() const { return path_; }

    private:
        fs::path path_;
    };

    void write_file(const fs::path& path, const std::string& content) {
        std::ofstream out(path, std::ios::binary);
        out << content;
    }

    std::string read_file(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        std::ostringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }
}

// ============================================================================
// Line handling
// ============================================================================

TEST_CASE("Split drops line endings", "[convert]") {
    REQUIRE(split_lines("a\nb\n") == std::vector<std::string>{"a", "b"});
    REQUIRE(split_lines("a\r\nb") == std::vector<std::string>{"a", "b"});
    REQUIRE(split_lines("a\n\nb\n") == std::vector<std::string>{"a", "", "b"});
    REQUIRE(split_lines("\n") == std::vector<std::string>{""});
    REQUIRE(split_lines("").empty());
}

TEST_CASE("Join ends every line with a newline", "[convert]") {
    REQUIRE(join_lines({"a", "", "b"}) == "a\n\nb\n");
    REQUIRE(join_lines({}).empty());
}

TEST_CASE("Converting a document in memory", "[convert]") {
    std::string input =
        "::: {.cell}\r\n"
        "``` {.python .cell-code}\r\n"
        "x = 1\r\n"
        "```\r\n"
        ":::\r\n";

    TransformStats stats;
    REQUIRE(convert_document(input, Transformer(), stats) == "```python\nx = 1\n```\n");
    REQUIRE(stats.cells == 1);
}

// ============================================================================
// Target paths
// ============================================================================

TEST_CASE("Target sits next to the source by default", "[convert]") {
    ConvertOptions options;
    REQUIRE(target_path_for("docs/example.md", options) == "docs/example.mkdocs.md");
    REQUIRE(target_path_for("example.markdown", options) == "example.mkdocs.md");
}

TEST_CASE("Target goes to the output directory when set", "[convert]") {
    ConvertOptions options;
    options.output_dir = "site";
    options.output_extension = ".md";
    REQUIRE(target_path_for("docs/example.md", options) == "site/example.md");
}

TEST_CASE("Target keeps the folder below the source root", "[convert]") {
    ConvertOptions options;
    options.output_dir = "site";
    options.source_root = "docs";
    REQUIRE(target_path_for("docs/a/index.md", options) == "site/a/index.mkdocs.md");
    REQUIRE(target_path_for("docs/index.md", options) == "site/index.mkdocs.md");
    // Sources outside the root go straight into the output directory.
    REQUIRE(target_path_for("other/index.md", options) == "site/index.mkdocs.md");
}

TEST_CASE("Common base directory of inputs", "[convert]") {
    fs::path root = fs::absolute("docs").lexically_normal();
    REQUIRE(common_base_dir({}).empty());
    REQUIRE(common_base_dir({"docs/a/index.md"}) == (root / "a").string());
    REQUIRE(common_base_dir({"docs/a/index.md", "docs/b/index.md"}) == root.string());
    REQUIRE(common_base_dir({"docs/a/x/1.md", "docs/a/2.md"}) == (root / "a").string());
}

TEST_CASE("Colliding targets are rejected", "[convert]") {
    ConvertOptions options;
    options.output_dir = "site";
    REQUIRE_THROWS_AS(ensure_distinct_targets({"docs/a/index.md", "docs/b/index.md"}, options),
                      std::runtime_error);
    REQUIRE_THROWS_AS(ensure_distinct_targets({"docs/page.md", "docs/page.markdown"}, ConvertOptions()),
                      std::runtime_error);

    options.source_root = "docs";
    REQUIRE_NOTHROW(ensure_distinct_targets({"docs/a/index.md", "docs/b/index.md"}, options));
}

TEST_CASE("Target may not replace its source", "[convert]") {
    ConvertOptions options;
    options.output_extension = ".md";
    REQUIRE_THROWS_AS(target_path_for("docs/example.md", options), std::runtime_error);
}

// ============================================================================
// Files
// ============================================================================

TEST_CASE("Converting a file writes the target", "[convert]") {
    TempDir dir("mkquarto_convert_write");
    fs::path source = dir.path() / "page.md";
    write_file(source,
               "# Page\n"
               "::: {.cell-output .cell-output-stdout}\n"
               "    42\n"
               ":::\n");

    ConvertResult result = convert_file(source.string(), Transformer(), ConvertOptions());

    REQUIRE(result.written);
    REQUIRE(result.target == (dir.path() / "page.mkdocs.md").string());
    REQUIRE(result.stats.output_blocks == 1);
    REQUIRE(read_file(result.target) ==
            "# Page\n"
            "???+ note \"output\"\n"
            "\n"
            "        42\n"
            "\n");
}

TEST_CASE("Output directory is created on demand", "[convert]") {
    TempDir dir("mkquarto_convert_outdir");
    fs::path source = dir.path() / "page.md";
    write_file(source, "text\n");

    ConvertOptions options;
    options.output_dir = (dir.path() / "out" / "nested").string();
    ConvertResult result = convert_file(source.string(), Transformer(), options);

    REQUIRE(fs::exists(dir.path() / "out" / "nested" / "page.mkdocs.md"));
    REQUIRE(read_file(result.target) == "text\n");
}

TEST_CASE("Same-named documents in different folders get separate targets", "[convert]") {
    TempDir dir("mkquarto_convert_tree");
    fs::create_directories(dir.path() / "docs" / "a");
    fs::create_directories(dir.path() / "docs" / "b");
    std::vector<std::string> sources = {
        (dir.path() / "docs" / "a" / "index.md").string(),
        (dir.path() / "docs" / "b" / "index.md").string()
    };
    write_file(sources[0], "first\n");
    write_file(sources[1], "second\n");

    ConvertOptions options;
    options.output_dir = (dir.path() / "out").string();
    options.source_root = common_base_dir(sources);
    REQUIRE_NOTHROW(ensure_distinct_targets(sources, options));

    ConvertResult first = convert_file(sources[0], Transformer(), options);
    ConvertResult second = convert_file(sources[1], Transformer(), options);

    REQUIRE(first.target != second.target);
    REQUIRE(read_file(dir.path() / "out" / "a" / "index.mkdocs.md") == "first\n");
    REQUIRE(read_file(dir.path() / "out" / "b" / "index.mkdocs.md") == "second\n");
}

TEST_CASE("Dry run writes nothing", "[convert]") {
    TempDir dir("mkquarto_convert_dry");
    fs::path source = dir.path() / "page.md";
    write_file(source, "::::: pathlib.Path\n");

    ConvertOptions options;
    options.dry_run = true;
    ConvertResult result = convert_file(source.string(), Transformer(), options);

    REQUIRE_FALSE(result.written);
    REQUIRE(result.stats.normalized_lines == 1);
    REQUIRE_FALSE(fs::exists(result.target));
}

TEST_CASE("Failed documents produce no output file", "[convert]") {
    TempDir dir("mkquarto_convert_fail");
    fs::path source = dir.path() / "broken.md";
    write_file(source, ":::: {.cell}\nno close\n");

    REQUIRE_THROWS_AS(convert_file(source.string(), Transformer(), ConvertOptions()),
                      UnterminatedBlockError);
    REQUIRE_FALSE(fs::exists(dir.path() / "broken.mkdocs.md"));
}

TEST_CASE("Missing source is an I/O error", "[convert]") {
    TempDir dir("mkquarto_convert_missing");
    REQUIRE_THROWS_AS(convert_file((dir.path() / "absent.md").string(), Transformer(), ConvertOptions()),
                      std::runtime_error);
}
