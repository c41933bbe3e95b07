#pragma once

#include <vector>
#include "analysis_types.hpp"
#include "syntax_tree.hpp"

// complexity = 1 + branch points in the body, excluding nested definitions
class ComplexityCalculator {
public:
    // `definition` is a function_definition node
    int complexity(const SyntaxNode& definition) const;

    // Number of branch points in `node` and its descendants, stopping at
    // nested definitions
    int countBranchPoints(const SyntaxNode& node) const;

    static bool isBranchPoint(NodeKind kind);
};

// Run-level statistics over every indexed function
ComplexitySummary summarizeComplexity(const std::vector<FunctionInfo>& functions, int highThreshold);
