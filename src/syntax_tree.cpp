#include "syntax_tree.hpp"
#include <algorithm>
#include <unordered_map>
#include <utility>

NodeKind nodeKindFromType(std::string_view type) {
    static const std::unordered_map<std::string_view, NodeKind> kinds = {
        {"module", NodeKind::Module},
        {"function_definition", NodeKind::FunctionDefinition},
        {"class_definition", NodeKind::ClassDefinition},
        {"decorated_definition", NodeKind::DecoratedDefinition},
        {"decorator", NodeKind::Decorator},
        {"parameters", NodeKind::Parameters},
        {"block", NodeKind::Block},
        {"if_statement", NodeKind::IfStatement},
        {"elif_clause", NodeKind::ElifClause},
        {"else_clause", NodeKind::ElseClause},
        {"for_statement", NodeKind::ForStatement},
        {"while_statement", NodeKind::WhileStatement},
        {"try_statement", NodeKind::TryStatement},
        {"except_clause", NodeKind::ExceptClause},
        {"except_group_clause", NodeKind::ExceptClause},
        {"finally_clause", NodeKind::FinallyClause},
        {"with_statement", NodeKind::WithStatement},
        {"match_statement", NodeKind::MatchStatement},
        {"boolean_operator", NodeKind::BooleanOperator},
        {"if_clause", NodeKind::ComprehensionFilter},
        {"for_in_clause", NodeKind::ComprehensionFor},
        {"conditional_expression", NodeKind::ConditionalExpression},
        {"lambda", NodeKind::Lambda},
        {"call", NodeKind::Call},
        {"attribute", NodeKind::Attribute},
        {"identifier", NodeKind::Identifier},
        {"string", NodeKind::String},
        {"expression_statement", NodeKind::ExpressionStatement},
        {"import_statement", NodeKind::ImportStatement},
        {"import_from_statement", NodeKind::ImportFromStatement},
        {"comment", NodeKind::Comment},
        {"ERROR", NodeKind::Error},
    };

    auto it = kinds.find(type);
    return it == kinds.end() ? NodeKind::Other : it->second;
}

const SyntaxNode* SyntaxNode::childByField(std::string_view fieldName) const {
    for (const auto& child : children) {
        if (child.field == fieldName) {
            return &child;
        }
    }
    return nullptr;
}

std::vector<const SyntaxNode*> SyntaxNode::childrenByField(std::string_view fieldName) const {
    std::vector<const SyntaxNode*> matches;
    for (const auto& child : children) {
        if (child.field == fieldName) {
            matches.push_back(&child);
        }
    }
    return matches;
}

std::vector<const SyntaxNode*> SyntaxNode::namedChildren() const {
    std::vector<const SyntaxNode*> named;
    for (const auto& child : children) {
        if (child.named) {
            named.push_back(&child);
        }
    }
    return named;
}

const SyntaxNode* SyntaxNode::firstNamedChild() const {
    for (const auto& child : children) {
        if (child.named && child.kind != NodeKind::Comment) {
            return &child;
        }
    }
    return nullptr;
}

SyntaxTree::SyntaxTree(std::string path, std::string source, SyntaxNode root)
    : path_(std::move(path)), source_(std::move(source)), root_(std::move(root)) {}

std::string SyntaxTree::text(const SyntaxNode& node) const {
    if (node.startByte >= source_.size() || node.endByte <= node.startByte) {
        return "";
    }
    const size_t end = std::min<size_t>(node.endByte, source_.size());
    return source_.substr(node.startByte, end - node.startByte);
}
