#pragma once

#include <string>
#include <vector>
#include "analysis_types.hpp"

// Function rules are evaluated in a fixed order, first match wins:
// dunder, entry point, private, then `prefixRules` top to bottom, then General.
struct FunctionPrefixRule {
    std::vector<std::string> prefixes;
    FunctionCategory category;
};

struct FunctionRuleTable {
    std::vector<std::string> entryPointNames;
    std::vector<std::string> entryPointDecorators;  // matched on the last dotted segment
    std::vector<FunctionPrefixRule> prefixRules;
};

enum class ClassRuleSource {
    Name,
    Base,
    Docstring
};

// Case-insensitive substring match of any keyword against the given source
struct ClassRule {
    ClassRuleSource source;
    std::vector<std::string> keywords;
    ClassCategory category;
};

// Evaluated top to bottom; General when nothing matches
struct ClassRuleTable {
    std::vector<ClassRule> rules;
};

FunctionRuleTable defaultFunctionRules();
ClassRuleTable defaultClassRules();

class RoleClassifier {
public:
    RoleClassifier();
    RoleClassifier(FunctionRuleTable functionRules, ClassRuleTable classRules);

    FunctionCategory classifyFunction(const FunctionInfo& function) const;
    ClassCategory classifyClass(const ClassInfo& cls) const;

    const FunctionRuleTable& functionRules() const { return functionRules_; }
    const ClassRuleTable& classRules() const { return classRules_; }

private:
    bool isEntryPoint(const FunctionInfo& function) const;

    FunctionRuleTable functionRules_;
    ClassRuleTable classRules_;
};
