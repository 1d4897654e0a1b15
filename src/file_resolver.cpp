#include "file_resolver.hpp"
#include "config.hpp"
#include "console.hpp"
#include "verbose.hpp"
#include <filesystem>
#include <algorithm>
#include <cctype>
#include <utility>
#include <unordered_set>
#include <regex>

namespace fs = std::filesystem;

namespace mkq {

bool is_supported_extension(const std::string& filepath) {
    fs::path p(filepath);
    std::string ext = p.extension().string();
    // Convert to lowercase for case-insensitive comparison.
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
    return SUPPORTED_EXTENSIONS.count(ext) > 0;
}

namespace {
    // True if `path` lies inside `dir` (compared as absolute, normalized paths).
    bool is_under(const fs::path& path, const fs::path& dir) {
        fs::path p = fs::absolute(path).lexically_normal();
        fs::path d = fs::absolute(dir).lexically_normal();
        if (!d.empty() && d.filename().empty()) {
            d = d.parent_path();  // Drop a trailing separator.
        }
        auto pi = p.begin();
        for (auto di = d.begin(); di != d.end(); ++di, ++pi) {
            if (pi == p.end() || *pi != *di) {
                return false;
            }
        }
        return true;
    }

    // True if the output extension is itself a source extension such as ".md".
    bool is_source_extension(std::string ext) {
        std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
        return SUPPORTED_EXTENSIONS.count(ext) > 0;
    }
}

bool is_conversion_output(const std::string& filepath, const std::string& output_extension,
                          const std::string& output_dir) {
    if (output_extension.empty() || filepath.size() < output_extension.size()) {
        return false;
    }
    if (filepath.compare(filepath.size() - output_extension.size(),
                         output_extension.size(), output_extension) != 0) {
        return false;
    }
    if (output_dir.empty() || !is_source_extension(output_extension)) {
        return true;
    }
    return is_under(filepath, output_dir);
}

std::string glob_to_regex(const std::string& glob) {
    std::string regex;
    regex.reserve(glob.size() * 2);

    size_t i = 0;
    while (i < glob.size()) {
        char c = glob[i];

        if (c == '*') {
            if (i + 1 < glob.size() && glob[i + 1] == '*') {
                // ** matches any path components
                if (i + 2 < glob.size() && glob[i + 2] == '/') {
                    regex += "(?:.*/)?";
                    i += 3;
                } else {
                    regex += ".*";
                    i += 2;
                }
            } else {
                // * matches any characters except /
                regex += "[^/]*";
                i++;
            }
        } else if (c == '?') {
            regex += "[^/]";
            i++;
        } else if (c == '[') {
            // Character class - pass through
            regex += '[';
            i++;
            while (i < glob.size() && glob[i] != ']') {
                if (glob[i] == '\\' && i + 1 < glob.size()) {
                    regex += '\\';
                    regex += glob[i + 1];
                    i += 2;
                } else {
                    regex += glob[i];
                    i++;
                }
            }
            if (i < glob.size()) {
                regex += ']';
                i++;
            }
        } else if (c == '.' || c == '(' || c == ')' || c == '{' || c == '}' ||
                   c == '+' || c == '|' || c == '^' || c == '$' || c == '\\') {
            // Escape regex special characters
            regex += '\\';
            regex += c;
            i++;
        } else {
            regex += c;
            i++;
        }
    }

    return "^" + regex + "$";
}

namespace {
    bool matches_glob(const std::string& path, const std::regex& re) {
        return std::regex_match(path, re);
    }

    bool is_glob_pattern(const std::string& pattern) {
        return pattern.find('*') != std::string::npos ||
               pattern.find('?') != std::string::npos ||
               pattern.find('[') != std::string::npos;
    }

    // Collects files in insertion order, ignoring duplicates.
    class FileList {
    public:
        void add(const fs::path& path) {
            std::string abs_path = fs::absolute(path).lexically_normal().string();
            if (seen_.insert(abs_path).second) {
                files_.push_back(abs_path);
            }
        }

        std::vector<std::string> take() { return std::move(files_); }

    private:
        std::vector<std::string> files_;
        std::unordered_set<std::string> seen_;
    };

    // Where previously converted documents may live.
    struct OutputLocation {
        const std::string& extension;
        const std::string& dir;
    };

    bool is_candidate(const fs::path& path, const OutputLocation& output) {
        std::string name = path.string();
        return is_supported_extension(name) && !is_conversion_output(name, output.extension, output.dir);
    }

    // Directory walks are sorted so conversions run in a stable order.
    void add_sorted(std::vector<fs::path> paths, FileList& files) {
        std::sort(paths.begin(), paths.end());
        for (const auto& path : paths) {
            files.add(path);
        }
    }

    void collect_directory(const fs::path& dir, const OutputLocation& output, FileList& files) {
        std::vector<fs::path> found;
        try {
            for (const auto& entry : fs::recursive_directory_iterator(dir)) {
                if (entry.is_regular_file() && is_candidate(entry.path(), output)) {
                    found.push_back(entry.path());
                }
            }
        } catch (const fs::filesystem_error& e) {
            verbose_err("resolve", e.what());
        }
        add_sorted(std::move(found), files);
    }

    // Longest leading run of path components without glob characters.
    fs::path glob_base_dir(const std::string& pattern) {
        fs::path accumulated;
        for (const auto& component : fs::path(pattern)) {
            if (is_glob_pattern(component.string())) {
                break;
            }
            accumulated /= component;
        }
        if (!accumulated.empty() && fs::is_directory(accumulated)) {
            return accumulated;
        }
        return ".";
    }
}

std::vector<std::string> resolve_file_patterns(
    const std::vector<std::string>& patterns,
    const std::string& output_extension,
    const Console& console,
    const std::string& output_dir
) {
    const OutputLocation output{output_extension, output_dir};
    FileList files;

    for (const auto& pattern : patterns) {
        if (!is_glob_pattern(pattern)) {
            fs::path p(pattern);

            if (!fs::exists(p)) {
                console.print_warning("Warning: File not found: " + pattern);
                continue;
            }

            if (fs::is_directory(p)) {
                collect_directory(p, output, files);
            } else if (!is_supported_extension(pattern)) {
                console.print_warning("Warning: Not a markdown document: " + pattern);
            } else if (is_conversion_output(pattern, output_extension, output_dir)) {
                console.print_warning("Warning: Skipping conversion output: " + pattern);
            } else {
                files.add(p);
            }
            continue;
        }

        std::regex re;
        try {
            re = std::regex(glob_to_regex(pattern));
        } catch (const std::regex_error&) {
            console.print_warning("Warning: Invalid pattern: " + pattern);
            continue;
        }

        fs::path base_dir = glob_base_dir(pattern);
        std::vector<fs::path> matched;
        try {
            for (const auto& entry : fs::recursive_directory_iterator(base_dir)) {
                if (!entry.is_regular_file()) continue;

                std::string rel_path = entry.path().string();
                if (base_dir == "." && rel_path.compare(0, 2, "./") == 0) {
                    rel_path = rel_path.substr(2);
                }

                if (matches_glob(rel_path, re) && is_candidate(entry.path(), output)) {
                    matched.push_back(entry.path());
                }
            }
        } catch (const fs::filesystem_error& e) {
            verbose_err("resolve", e.what());
        }

        if (matched.empty()) {
            console.print_warning("Warning: No matches for pattern: " + pattern);
        }
        add_sorted(std::move(matched), files);
    }

    return files.take();
}

} // namespace mkq
