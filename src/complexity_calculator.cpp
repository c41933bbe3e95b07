#include "complexity_calculator.hpp"
#include <algorithm>

int ComplexityCalculator::complexity(const SyntaxNode& definition) const {
    const SyntaxNode* body = definition.childByField("body");
    if (!body) {
        return 1;
    }
    return 1 + countBranchPoints(*body);
}

int ComplexityCalculator::countBranchPoints(const SyntaxNode& node) const {
    int count = 0;
    for (const auto& child : node.children) {
        // Nested definitions are scored on their own
        if (child.isScope()) {
            continue;
        }
        if (isBranchPoint(child.kind)) {
            ++count;
        }
        count += countBranchPoints(child);
    }
    return count;
}

bool ComplexityCalculator::isBranchPoint(NodeKind kind) {
    switch (kind) {
        case NodeKind::IfStatement:
        case NodeKind::ElifClause:
        case NodeKind::ForStatement:
        case NodeKind::WhileStatement:
        case NodeKind::ExceptClause:
        case NodeKind::BooleanOperator:
        case NodeKind::ComprehensionFilter:
        case NodeKind::ConditionalExpression:
            return true;

        case NodeKind::Module:
        case NodeKind::FunctionDefinition:
        case NodeKind::ClassDefinition:
        case NodeKind::DecoratedDefinition:
        case NodeKind::Decorator:
        case NodeKind::Parameters:
        case NodeKind::Block:
        case NodeKind::ElseClause:
        case NodeKind::TryStatement:
        case NodeKind::FinallyClause:
        case NodeKind::WithStatement:
        case NodeKind::MatchStatement:
        case NodeKind::ComprehensionFor:
        case NodeKind::Lambda:
        case NodeKind::Call:
        case NodeKind::Attribute:
        case NodeKind::Identifier:
        case NodeKind::String:
        case NodeKind::ExpressionStatement:
        case NodeKind::ImportStatement:
        case NodeKind::ImportFromStatement:
        case NodeKind::Comment:
        case NodeKind::Error:
        case NodeKind::Other:
            return false;
    }
    return false;
}

ComplexitySummary summarizeComplexity(const std::vector<FunctionInfo>& functions, int highThreshold) {
    ComplexitySummary summary;
    summary.totalFunctions = functions.size();
    if (functions.empty()) {
        return summary;
    }

    long long total = 0;
    for (const auto& function : functions) {
        total += function.complexity;
        summary.maximum = std::max(summary.maximum, function.complexity);
        if (function.complexity > highThreshold) {
            summary.highComplexity.push_back(function.id);
        }
    }
    summary.average = static_cast<double>(total) / static_cast<double>(functions.size());

    return summary;
}
