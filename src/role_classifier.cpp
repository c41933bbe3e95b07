#include "role_classifier.hpp"
#include <algorithm>
#include <cctype>
#include <utility>
#include "structural_indexer.hpp"

namespace {

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool startsWith(const std::string& text, const std::string& prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

bool containsAny(const std::string& lowerText, const std::vector<std::string>& keywords) {
    return std::any_of(keywords.begin(), keywords.end(), [&lowerText](const std::string& keyword) {
        return lowerText.find(keyword) != std::string::npos;
    });
}

} // namespace

FunctionRuleTable defaultFunctionRules() {
    FunctionRuleTable table;
    table.entryPointNames = {"main"};
    table.entryPointDecorators = {"command", "group", "entrypoint", "entry_point", "script"};
    table.prefixRules = {
        {{"get_", "fetch_", "load_", "retrieve_"}, FunctionCategory::Getter},
        {{"set_", "save_", "update_", "write_"}, FunctionCategory::Setter},
        {{"create_", "generate_", "build_", "make_"}, FunctionCategory::Creator},
        {{"process_", "transform_", "analyze_", "convert_"}, FunctionCategory::Processor},
    };
    return table;
}

ClassRuleTable defaultClassRules() {
    const std::vector<std::pair<std::vector<std::string>, ClassCategory>> nameKeywords = {
        {{"analyzer", "parser"}, ClassCategory::Analyzer},
        {{"generator", "builder", "factory"}, ClassCategory::Generator},
        {{"manager", "service", "handler", "controller", "client"}, ClassCategory::Service},
        {{"model", "schema"}, ClassCategory::Model},
        {{"entity"}, ClassCategory::Entity},
        {{"pipeline", "workflow"}, ClassCategory::Pipeline},
    };

    ClassRuleTable table;
    for (const auto& [keywords, category] : nameKeywords) {
        table.rules.push_back({ClassRuleSource::Name, keywords, category});
    }
    for (const auto& [keywords, category] : nameKeywords) {
        table.rules.push_back({ClassRuleSource::Base, keywords, category});
    }

    table.rules.push_back({ClassRuleSource::Docstring, {"analyze", "analyse", "parse"}, ClassCategory::Analyzer});
    table.rules.push_back({ClassRuleSource::Docstring, {"generate", "build"}, ClassCategory::Generator});
    table.rules.push_back({ClassRuleSource::Docstring, {"service", "manage", "handle"}, ClassCategory::Service});
    table.rules.push_back({ClassRuleSource::Docstring, {"data model", "schema"}, ClassCategory::Model});
    table.rules.push_back({ClassRuleSource::Docstring, {"entity"}, ClassCategory::Entity});
    table.rules.push_back({ClassRuleSource::Docstring, {"pipeline", "workflow"}, ClassCategory::Pipeline});
    return table;
}

RoleClassifier::RoleClassifier()
    : functionRules_(defaultFunctionRules()), classRules_(defaultClassRules()) {}

RoleClassifier::RoleClassifier(FunctionRuleTable functionRules, ClassRuleTable classRules)
    : functionRules_(std::move(functionRules)), classRules_(std::move(classRules)) {}

FunctionCategory RoleClassifier::classifyFunction(const FunctionInfo& function) const {
    const std::string& name = function.name;

    if (name.size() > 4 && startsWith(name, "__") &&
        name.compare(name.size() - 2, 2, "__") == 0) {
        return FunctionCategory::Dunder;
    }

    if (isEntryPoint(function)) {
        return FunctionCategory::EntryPoint;
    }

    if (startsWith(name, "_")) {
        return FunctionCategory::Private;
    }

    const std::string lower = toLower(name);
    for (const auto& rule : functionRules_.prefixRules) {
        for (const auto& prefix : rule.prefixes) {
            if (startsWith(lower, prefix)) {
                return rule.category;
            }
        }
    }

    return FunctionCategory::General;
}

ClassCategory RoleClassifier::classifyClass(const ClassInfo& cls) const {
    const std::string name = toLower(cls.name);
    const std::string docstring = toLower(cls.docstring.value_or(""));

    std::vector<std::string> bases;
    bases.reserve(cls.bases.size());
    for (const auto& base : cls.bases) {
        bases.push_back(toLower(base));
    }

    for (const auto& rule : classRules_.rules) {
        switch (rule.source) {
            case ClassRuleSource::Name:
                if (containsAny(name, rule.keywords)) {
                    return rule.category;
                }
                break;
            case ClassRuleSource::Base:
                for (const auto& base : bases) {
                    if (containsAny(base, rule.keywords)) {
                        return rule.category;
                    }
                }
                break;
            case ClassRuleSource::Docstring:
                if (containsAny(docstring, rule.keywords)) {
                    return rule.category;
                }
                break;
        }
    }

    return ClassCategory::General;
}

bool RoleClassifier::isEntryPoint(const FunctionInfo& function) const {
    const auto& names = functionRules_.entryPointNames;
    if (std::find(names.begin(), names.end(), function.name) != names.end()) {
        return true;
    }

    const auto& decorators = functionRules_.entryPointDecorators;
    for (const auto& decorator : function.decorators) {
        const std::string segment = toLower(lastDottedSegment(decorator));
        if (std::find(decorators.begin(), decorators.end(), segment) != decorators.end()) {
            return true;
        }
    }
    return false;
}
