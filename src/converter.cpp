#include "converter.hpp"
#include "verbose.hpp"
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace mkq {

namespace fs = std::filesystem;

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t nl = text.find('\n', start);
        size_t end = nl == std::string::npos ? text.size() : nl;
        std::string line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
        if (nl == std::string::npos) break;
        start = nl + 1;
    }
    return lines;
}

std::string join_lines(const std::vector<std::string>& lines) {
    std::string out;
    for (const auto& line : lines) {
        out += line;
        out += '\n';
    }
    return out;
}

namespace {
    fs::path normalized(const fs::path& path) {
        fs::path p = fs::absolute(path).lexically_normal();
        if (!p.filename().empty() || p == p.root_path()) {
            return p;
        }
        return p.parent_path();  // Drop a trailing separator.
    }

    // Folder of the source relative to the root, or empty when the source is
    // not under the root.
    fs::path relative_folder(const fs::path& source, const std::string& root) {
        if (root.empty()) {
            return fs::path();
        }
        fs::path rel = normalized(source).parent_path().lexically_relative(normalized(root));
        if (rel.empty() || rel == "." || *rel.begin() == "..") {
            return fs::path();
        }
        return rel;
    }
}

std::string target_path_for(const std::string& source, const ConvertOptions& options) {
    fs::path src(source);
    fs::path dir = options.output_dir.empty()
        ? src.parent_path()
        : fs::path(options.output_dir) / relative_folder(src, options.source_root);
    fs::path target = (dir / (src.stem().string() + options.output_extension)).lexically_normal();

    if (fs::absolute(target).lexically_normal() == fs::absolute(src).lexically_normal()) {
        throw std::runtime_error("Refusing to overwrite source document: " + source);
    }
    return target.string();
}

std::string common_base_dir(const std::vector<std::string>& files) {
    if (files.empty()) {
        return std::string();
    }

    fs::path base = normalized(files.front()).parent_path();
    for (size_t i = 1; i < files.size(); ++i) {
        fs::path dir = normalized(files[i]).parent_path();
        fs::path common;
        auto bi = base.begin();
        for (auto di = dir.begin(); bi != base.end() && di != dir.end() && *bi == *di; ++bi, ++di) {
            common /= *bi;
        }
        base = common;
    }
    return base.string();
}

void ensure_distinct_targets(const std::vector<std::string>& sources, const ConvertOptions& options) {
    std::map<std::string, std::string> claimed;
    std::string conflicts;
    for (const auto& source : sources) {
        std::string target;
        try {
            target = normalized(target_path_for(source, options)).string();
        } catch (const std::runtime_error& e) {
            // Reported when that source is converted.
            verbose_err("convert", e.what());
            continue;
        }
        auto [it, inserted] = claimed.emplace(target, source);
        if (!inserted) {
            conflicts += "\n  " + target + " <- " + it->second + ", " + source;
        }
    }
    if (!conflicts.empty()) {
        throw std::runtime_error("Several documents would be written to the same target:" + conflicts);
    }
}

std::string convert_document(const std::string& text, const Transformer& transformer,
                             TransformStats& stats) {
    return join_lines(transformer.transform(split_lines(text), stats));
}

ConvertResult convert_file(const std::string& source, const Transformer& transformer,
                           const ConvertOptions& options) {
    ConvertResult result;
    result.source = source;
    result.target = target_path_for(source, options);

    std::ifstream in(source, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open " + source);
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    verbose_log("convert", source + " -> " + result.target);
    std::string output = convert_document(buffer.str(), transformer, result.stats);

    if (options.dry_run) {
        return result;
    }

    fs::path target(result.target);
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path());
    }

    std::ofstream out(result.target, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot write " + result.target);
    }
    out << output;
    out.flush();
    if (!out) {
        throw std::runtime_error("Failed while writing " + result.target);
    }

    result.written = true;
    return result;
}

} // namespace mkq
