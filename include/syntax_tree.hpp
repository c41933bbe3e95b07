#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// Closed set of node kinds the analyzer reasons about. Every grammar node type
// maps onto exactly one of these; anything without meaning for the analysis is
// Other. Code that folds over the tree switches on NodeKind without a default
// so that adding a kind is flagged at every use site.
enum class NodeKind {
    Module,
    FunctionDefinition,
    ClassDefinition,
    DecoratedDefinition,
    Decorator,
    Parameters,
    Block,
    IfStatement,
    ElifClause,
    ElseClause,
    ForStatement,
    WhileStatement,
    TryStatement,
    ExceptClause,
    FinallyClause,
    WithStatement,
    MatchStatement,
    BooleanOperator,
    ComprehensionFilter,
    ComprehensionFor,
    ConditionalExpression,
    Lambda,
    Call,
    Attribute,
    Identifier,
    String,
    ExpressionStatement,
    ImportStatement,
    ImportFromStatement,
    Comment,
    Error,
    Other
};

// Map a tree-sitter-python node type name onto its NodeKind
NodeKind nodeKindFromType(std::string_view type);

struct SyntaxNode {
    NodeKind kind = NodeKind::Other;
    std::string type;           // grammar node type, e.g. "if_statement" or "and"
    std::string field;          // field name in the parent, empty if none
    bool named = false;
    bool missing = false;       // inserted by error recovery
    uint32_t startByte = 0;
    uint32_t endByte = 0;
    int startLine = 0;          // 1-based
    int endLine = 0;
    std::vector<SyntaxNode> children;

    const SyntaxNode* childByField(std::string_view fieldName) const;
    std::vector<const SyntaxNode*> childrenByField(std::string_view fieldName) const;
    std::vector<const SyntaxNode*> namedChildren() const;
    const SyntaxNode* firstNamedChild() const;

    // True for definitions that open their own scope
    bool isScope() const {
        return kind == NodeKind::FunctionDefinition || kind == NodeKind::ClassDefinition;
    }
};

// A parsed file: the node tree plus the source it indexes into.
class SyntaxTree {
public:
    SyntaxTree(std::string path, std::string source, SyntaxNode root);

    const std::string& path() const { return path_; }
    const std::string& source() const { return source_; }
    const SyntaxNode& root() const { return root_; }

    std::string text(const SyntaxNode& node) const;

private:
    std::string path_;
    std::string source_;
    SyntaxNode root_;
};
