#include "transform_error.hpp"

namespace mkq {

namespace {
    std::string join(const std::vector<std::string>& parts, const std::string& sep) {
        std::string out;
        for (size_t i = 0; i < parts.size(); ++i) {
            if (i > 0) out += sep;
            out += parts[i];
        }
        return out;
    }

    std::string escaped_message(const std::vector<std::pair<size_t, std::string>>& escaped) {
        std::string msg = "Unprocessed Quarto cell syntax found:";
        for (const auto& [line, text] : escaped) {
            msg += "\n  " + std::to_string(line) + ": " + text;
        }
        return msg;
    }
}

TransformError::TransformError(const std::string& message, size_t line)
    : std::runtime_error(message), line_(line) {}

UnterminatedBlockError::UnterminatedBlockError(BlockKind kind, const std::string& delimiter, size_t line)
    : TransformError("Unterminated " + std::string(kind_name(kind)) + " block opened with '" +
                         delimiter + "' at line " + std::to_string(line),
                     line),
      kind_(kind),
      delimiter_(delimiter) {}

UnmappableOutputError::UnmappableOutputError(const std::vector<std::string>& attributes, size_t line)
    : TransformError("Could not map output attributes [" + join(attributes, ", ") +
                         "] to an admonition type at line " + std::to_string(line),
                     line),
      attributes_(attributes) {}

EscapedSyntaxError::EscapedSyntaxError(BlockKind kind, size_t line, std::vector<std::string> context)
    : TransformError(std::string(kind_name(kind)) + " block at line " + std::to_string(line) +
                         " produced lines starting with ':::':\n" + join(context, "\n"),
                     line),
      context_(std::move(context)) {}

UnprocessedSyntaxError::UnprocessedSyntaxError(std::vector<std::pair<size_t, std::string>> escaped)
    : TransformError(escaped_message(escaped), escaped.empty() ? 0 : escaped.front().first),
      escaped_(std::move(escaped)) {}

UnsupportedBlockError::UnsupportedBlockError(BlockKind kind, size_t line)
    : TransformError(std::string(kind_name(kind)) + " blocks are not supported (line " +
                         std::to_string(line) + ")",
                     line) {}

NestingTooDeepError::NestingTooDeepError(size_t depth, size_t max_depth, size_t line)
    : TransformError("Blocks nested " + std::to_string(depth) + " levels deep at line " +
                         std::to_string(line) + " (limit is " + std::to_string(max_depth) + ")",
                     line),
      depth_(depth) {}

} // namespace mkq
