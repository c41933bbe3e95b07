#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>
#include "analysis_types.hpp"
#include "syntax_tree.hpp"

// Records extracted from one file. Ids are local to the file: module id is 0,
// class and function ids index the vectors below. The analyzer renumbers them
// when the file is merged into the run result.
struct IndexedFile {
    Module module;
    std::vector<ClassInfo> classes;
    std::vector<FunctionInfo> functions;

    // Definition node of each function, parallel to `functions`.
    // Valid only while the SyntaxTree that produced them is alive.
    std::vector<const SyntaxNode*> functionNodes;
};

// Nested functions and classes become entities of their own
class StructuralIndexer {
public:
    IndexedFile index(const SyntaxTree& tree) const;

private:
    struct Scope {
        std::string qualifiedPrefix;        // "Outer.inner." or empty at module level
        std::optional<ClassId> ownerClass;  // set when the scope is a class body
    };

    void visit(const SyntaxTree& tree, const SyntaxNode& node, const Scope& scope, IndexedFile& out) const;

    void indexFunction(const SyntaxTree& tree, const SyntaxNode& node, const Scope& scope,
                       const std::vector<std::string>& decorators, IndexedFile& out) const;
    void indexClass(const SyntaxTree& tree, const SyntaxNode& node, const Scope& scope,
                    const std::vector<std::string>& decorators, IndexedFile& out) const;

    void collectImport(const SyntaxTree& tree, const SyntaxNode& node, IndexedFile& out) const;
    std::vector<Parameter> collectParameters(const SyntaxTree& tree, const SyntaxNode& parameters) const;
    void collectCallees(const SyntaxTree& tree, const SyntaxNode& node, std::set<std::string>& callees) const;

    std::string decoratorName(const SyntaxTree& tree, const SyntaxNode& decorator) const;
    bool isMainGuard(const SyntaxTree& tree, const SyntaxNode& node) const;
};

// Docstring of a module root or a definition body, cleaned like Python's
// inspect.cleandoc. Empty optional if the first statement is not a string.
std::optional<std::string> extractDocstring(const SyntaxTree& tree, const SyntaxNode& body);

// Strips prefix and quotes from a string literal and normalizes indentation
std::string cleanDocstring(const std::string& literal);

// Newline count, plus one for a final line without a terminator
size_t countLines(const std::string& content);

// Text after the last '.', or the whole string
std::string lastDottedSegment(const std::string& dotted);
