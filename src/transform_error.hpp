#pragma once

/**
 * Errors raised while transforming a document.
 *
 * Every failure aborts the whole document: callers never see partial output.
 * Line numbers are 1-based and refer to the input document, except for
 * UnprocessedSyntaxError which reports positions in the produced output.
 */

#include "block.hpp"
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace mkq {

// Base class of every transformation failure.
class TransformError : public std::runtime_error {
public:
    TransformError(const std::string& message, size_t line);

    // 1-based line the error refers to, 0 when it has no single location.
    size_t line() const { return line_; }

private:
    size_t line_;
};

// An opening fence without a matching close fence.
class UnterminatedBlockError : public TransformError {
public:
    UnterminatedBlockError(BlockKind kind, const std::string& delimiter, size_t line);

    BlockKind kind() const { return kind_; }
    const std::string& delimiter() const { return delimiter_; }

private:
    BlockKind kind_;
    std::string delimiter_;
};

// An output block whose classes have no admonition mapping.
class UnmappableOutputError : public TransformError {
public:
    UnmappableOutputError(const std::vector<std::string>& attributes, size_t line);

    const std::vector<std::string>& attributes() const { return attributes_; }

private:
    std::vector<std::string> attributes_;
};

// A rendered block still contains lines starting with ":::".
class EscapedSyntaxError : public TransformError {
public:
    EscapedSyntaxError(BlockKind kind, size_t line, std::vector<std::string> context);

    // Offending lines with their neighbours, formatted as "<index>: <text>".
    const std::vector<std::string>& context() const { return context_; }

private:
    std::vector<std::string> context_;
};

// A recognized Quarto opening fence survived to the final output.
class UnprocessedSyntaxError : public TransformError {
public:
    explicit UnprocessedSyntaxError(std::vector<std::pair<size_t, std::string>> escaped);

    // (1-based output line, text) of every escaped fence.
    const std::vector<std::pair<size_t, std::string>>& escaped() const { return escaped_; }

private:
    std::vector<std::pair<size_t, std::string>> escaped_;
};

// A block kind that has no matching or rendering rules.
class UnsupportedBlockError : public TransformError {
public:
    UnsupportedBlockError(BlockKind kind, size_t line);
};

// Blocks nested deeper than the configured cap.
class NestingTooDeepError : public TransformError {
public:
    NestingTooDeepError(size_t depth, size_t max_depth, size_t line);

    size_t depth() const { return depth_; }

private:
    size_t depth_;
};

} // namespace mkq
