#pragma once

#include <memory>
#include <optional>
#include <string>
#include "analysis_types.hpp"
#include "syntax_tree.hpp"

struct ExtractResult {
    std::optional<SyntaxTree> tree;
    std::optional<ParseFailure> failure;
    int errorLine = 0;      // first line with a syntax error, 0 if unknown

    bool ok() const { return tree.has_value(); }
};

// Parses one Python source file with tree-sitter and converts the result into
// a SyntaxTree. A parser instance is not thread-safe; give each worker its own.
class TreeExtractor {
public:
    // Throws std::runtime_error if the tree-sitter parser cannot be set up
    TreeExtractor();
    ~TreeExtractor();

    TreeExtractor(const TreeExtractor&) = delete;
    TreeExtractor& operator=(const TreeExtractor&) = delete;

    // Never throws for problems with the file itself; those come back as a
    // ParseFailure in the result.
    ExtractResult extract(const std::string& path, const std::string& content) const;

private:
    struct TreeSitterImpl;
    std::unique_ptr<TreeSitterImpl> impl_;
};

bool isValidUtf8(const std::string& content);
