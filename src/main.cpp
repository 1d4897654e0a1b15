#include "config.hpp"
#include "console.hpp"
#include "converter.hpp"
#include "file_resolver.hpp"
#include "settings.hpp"
#include "transform_error.hpp"
#include "transformer.hpp"
#include "verbose.hpp"

#include <CLI/CLI.hpp>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

using namespace mkq;

// ========== Reporting ==========

// Formats the counters of one conversion for display.
std::string describe(const TransformStats& stats) {
    return std::to_string(stats.cells) + " cells, " +
           std::to_string(stats.output_blocks) + " outputs, " +
           std::to_string(stats.code_blocks) + " code blocks";
}

// ========== Stdin Mode ==========

// Converts a document read from stdin and writes it to stdout.
int convert_stdin(const Transformer& transformer, const Console& console) {
    std::string input((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());

    try {
        TransformStats stats;
        std::string output = convert_document(input, transformer, stats);
        std::cout << output << std::flush;
        verbose_log("convert", "stdin: " + describe(stats));
    } catch (const TransformError& e) {
        console.print_error("Error: " + std::string(e.what()));
        return 1;
    }
    return 0;
}

// ========== Main Entry Point ==========

int main(int argc, char* argv[]) {
    CLI::App app{"Convert Quarto-rendered markdown into MkDocs-ready markdown"};
    app.footer("\nExamples:\n"
               "  mkquarto docs/example.md             Write docs/example.mkdocs.md\n"
               "  mkquarto 'docs/**/*.md' -o site_md   Convert a tree into site_md/\n"
               "  mkquarto --check docs/               Validate without writing\n"
               "  mkquarto < in.md > out.md            Filter stdin to stdout\n");

    std::vector<std::string> inputs;
    app.add_option("inputs", inputs, "Rendered documents, directories or glob patterns (default: stdin)");

    std::string output_dir;
    app.add_option("-o,--output-dir", output_dir, "Directory for converted documents");

    std::string output_extension;
    app.add_option("-e,--ext", output_extension,
                   std::string("Extension of converted documents (default: ") + DEFAULT_OUTPUT_EXTENSION + ")");

    size_t max_depth = 0;
    app.add_option("--max-depth", max_depth, "Deepest accepted block nesting")
        ->check(CLI::Range(size_t(1), MAX_NESTING_DEPTH_LIMIT));

    bool verbose = false;
    app.add_flag("-v,--verbose", verbose, "Trace classification, matching and rendering to stderr");

    bool fail_fast = false;
    app.add_flag("--fail-fast", fail_fast, "Stop at the first document that fails");

    bool check_only = false;
    app.add_flag("--check", check_only, "Transform documents without writing any output");

    bool save = false;
    app.add_flag("--save-settings", save,
                 std::string("Store the effective options in ") + SETTINGS_FILE);

    CLI11_PARSE(app, argc, argv);

    auto loaded = load_settings();
    Settings settings = loaded.value_or(Settings());
    if (!output_dir.empty()) settings.output_dir = output_dir;
    if (!output_extension.empty()) settings.output_extension = output_extension;
    if (max_depth > 0) settings.max_nesting_depth = max_depth;
    if (verbose) settings.verbose = true;
    if (!inputs.empty()) settings.input_patterns = inputs;

    set_verbose(settings.verbose);

    // Stdout carries the document in stdin mode, so status goes to stderr.
    const bool stdin_mode = settings.input_patterns.empty();
    Console console(stdin_mode ? std::cerr : std::cout);

    if (!loaded.has_value() && std::filesystem::exists(SETTINGS_FILE)) {
        console.print_warning(std::string("Warning: Ignoring malformed ") + SETTINGS_FILE);
    }

    if (!settings.is_valid()) {
        console.print_error(std::string("Error: Invalid settings in ") + SETTINGS_FILE);
        return 1;
    }

    if (save) {
        if (!save_settings(settings)) {
            console.print_error(std::string("Error: Cannot write ") + SETTINGS_FILE);
            return 1;
        }
        console.print_success(std::string("Saved ") + SETTINGS_FILE);
    }

    TransformOptions transform_options;
    transform_options.max_nesting_depth = settings.max_nesting_depth;
    Transformer transformer(transform_options);

    if (stdin_mode) {
        return convert_stdin(transformer, console);
    }

    std::vector<std::string> files = resolve_file_patterns(
        settings.input_patterns, settings.output_extension, console, settings.output_dir);
    if (files.empty()) {
        console.print_error("Error: No documents to convert");
        return 1;
    }

    ConvertOptions convert_options;
    convert_options.output_extension = settings.output_extension;
    convert_options.output_dir = settings.output_dir;
    convert_options.dry_run = check_only;
    if (!settings.output_dir.empty()) {
        convert_options.source_root = common_base_dir(files);
    }

    try {
        ensure_distinct_targets(files, convert_options);
    } catch (const std::runtime_error& e) {
        console.print_error("Error: " + std::string(e.what()));
        return 1;
    }

    console.print_info((check_only ? "Checking " : "Converting ") + std::to_string(files.size()) +
                       " document(s)");

    size_t converted = 0;
    size_t failures = 0;
    for (const auto& file : files) {
        try {
            ConvertResult result = convert_file(file, transformer, convert_options);
            if (result.written) {
                console.print_success(result.source + " -> " + result.target + " (" + describe(result.stats) + ")");
            } else {
                console.print_success(result.source + " OK (" + describe(result.stats) + ")");
            }
            ++converted;
        } catch (const std::exception& e) {
            ++failures;
            console.print_error(file + ": " + e.what());
            if (fail_fast) {
                break;
            }
        }
    }

    console.println();
    console.print_colored(check_only ? "Checked: " : "Converted: ", failures > 0 ? ansi::RED : ansi::GREEN);
    console.println(std::to_string(converted) + "/" + std::to_string(files.size()));
    return failures > 0 ? 1 : 0;
}
