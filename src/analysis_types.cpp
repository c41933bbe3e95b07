#include "analysis_types.hpp"
#include <tuple>

std::string toString(ClassCategory category) {
    switch (category) {
        case ClassCategory::Model: return "Model";
        case ClassCategory::Pipeline: return "Pipeline";
        case ClassCategory::Generator: return "Generator";
        case ClassCategory::Analyzer: return "Analyzer";
        case ClassCategory::Entity: return "Entity";
        case ClassCategory::Service: return "Service";
        case ClassCategory::General: return "General";
    }
    return "General";
}

std::string toString(FunctionCategory category) {
    switch (category) {
        case FunctionCategory::Dunder: return "Dunder";
        case FunctionCategory::EntryPoint: return "Entry_Point";
        case FunctionCategory::Private: return "Private";
        case FunctionCategory::Getter: return "Getter";
        case FunctionCategory::Setter: return "Setter";
        case FunctionCategory::Creator: return "Creator";
        case FunctionCategory::Processor: return "Processor";
        case FunctionCategory::General: return "General";
    }
    return "General";
}

std::string toString(FlowRole role) {
    switch (role) {
        case FlowRole::EntryPoint: return "EntryPoint";
        case FlowRole::Transformation: return "Transformation";
        case FlowRole::Output: return "Output";
        case FlowRole::DataStore: return "DataStore";
    }
    return "Transformation";
}

std::string toString(LayerKind layer) {
    switch (layer) {
        case LayerKind::Presentation: return "presentation";
        case LayerKind::Interface: return "interface";
        case LayerKind::Business: return "business";
        case LayerKind::Data: return "data";
        case LayerKind::Infrastructure: return "infrastructure";
        case LayerKind::Test: return "test";
    }
    return "business";
}

std::string toString(DiagnosticKind kind) {
    switch (kind) {
        case DiagnosticKind::ParseFailure: return "ParseFailure";
        case DiagnosticKind::UnreadableFile: return "UnreadableFile";
        case DiagnosticKind::ResolutionAmbiguity: return "ResolutionAmbiguity";
        case DiagnosticKind::UnresolvedImport: return "UnresolvedImport";
        case DiagnosticKind::DepthExceeded: return "DepthExceeded";
        case DiagnosticKind::ChainLimitReached: return "ChainLimitReached";
    }
    return "ParseFailure";
}

bool ImportRecord::operator==(const ImportRecord& other) const {
    return std::tie(module, names, level, isFrom, line) ==
           std::tie(other.module, other.names, other.level, other.isFrom, other.line);
}

bool Parameter::operator==(const Parameter& other) const {
    return std::tie(name, type, defaultValue) == std::tie(other.name, other.type, other.defaultValue);
}

bool Module::operator==(const Module& other) const {
    return std::tie(id, path, name, docstring, lineCount, imports, classes, functions, isMain) ==
           std::tie(other.id, other.path, other.name, other.docstring, other.lineCount,
                    other.imports, other.classes, other.functions, other.isMain);
}

bool ClassInfo::operator==(const ClassInfo& other) const {
    return std::tie(id, name, qualifiedName, module, file, line, endLine, docstring,
                    bases, methods, decorators, category, isAbstract, isException) ==
           std::tie(other.id, other.name, other.qualifiedName, other.module, other.file,
                    other.line, other.endLine, other.docstring, other.bases, other.methods,
                    other.decorators, other.category, other.isAbstract, other.isException);
}

bool FunctionInfo::operator==(const FunctionInfo& other) const {
    return std::tie(id, name, qualifiedName, module, file, line, endLine, parameters,
                    returnType, docstring, complexity, category, callees, decorators,
                    ownerClass, isMethod, isAsync, isProperty, isClassMethod, isStaticLike) ==
           std::tie(other.id, other.name, other.qualifiedName, other.module, other.file,
                    other.line, other.endLine, other.parameters, other.returnType,
                    other.docstring, other.complexity, other.category, other.callees,
                    other.decorators, other.ownerClass, other.isMethod, other.isAsync,
                    other.isProperty, other.isClassMethod, other.isStaticLike);
}

bool DependencyEdge::operator==(const DependencyEdge& other) const {
    return std::tie(source, targetModule, externalPackage) ==
           std::tie(other.source, other.targetModule, other.externalPackage);
}

bool FlowNode::operator==(const FlowNode& other) const {
    return function == other.function && role == other.role;
}

bool FlowPoint::operator==(const FlowPoint& other) const {
    return std::tie(function, role, kind) == std::tie(other.function, other.role, other.kind);
}

bool Validator::operator==(const Validator& other) const {
    return function == other.function && returnsBoolean == other.returnsBoolean;
}

bool FlowChain::operator==(const FlowChain& other) const {
    return nodes == other.nodes;
}

bool ArchitectureLayer::operator==(const ArchitectureLayer& other) const {
    return std::tie(directory, layer, fileCount) ==
           std::tie(other.directory, other.layer, other.fileCount);
}

bool ParseFailure::operator==(const ParseFailure& other) const {
    return path == other.path && reason == other.reason;
}

bool Diagnostic::operator==(const Diagnostic& other) const {
    return std::tie(kind, path, message, line) ==
           std::tie(other.kind, other.path, other.message, other.line);
}

bool Overview::operator==(const Overview& other) const {
    return std::tie(totalFiles, failedFiles, totalLines, totalFunctions, totalClasses,
                    languagesDetected, projectType) ==
           std::tie(other.totalFiles, other.failedFiles, other.totalLines,
                    other.totalFunctions, other.totalClasses, other.languagesDetected,
                    other.projectType);
}

bool ComplexitySummary::operator==(const ComplexitySummary& other) const {
    return std::tie(average, maximum, totalFunctions, highComplexity) ==
           std::tie(other.average, other.maximum, other.totalFunctions, other.highComplexity);
}

const Module* AnalysisResult::findModule(const std::string& path) const {
    auto it = moduleByPath_.find(path);
    if (it == moduleByPath_.end() || it->second >= modules.size()) {
        return nullptr;
    }
    return &modules[it->second];
}

std::vector<const FunctionInfo*> AnalysisResult::functionsOf(ModuleId module) const {
    std::vector<const FunctionInfo*> owned;
    if (module >= modules.size()) {
        return owned;
    }
    for (FunctionId id : modules[module].functions) {
        if (id < functions.size()) {
            owned.push_back(&functions[id]);
        }
    }
    return owned;
}

std::vector<const DependencyEdge*> AnalysisResult::dependenciesOf(ModuleId module) const {
    std::vector<const DependencyEdge*> edges;
    for (const auto& edge : dependencies) {
        if (edge.source == module) {
            edges.push_back(&edge);
        }
    }
    return edges;
}

void AnalysisResult::reindex() {
    moduleByPath_.clear();
    for (const auto& module : modules) {
        moduleByPath_[module.path] = module.id;
    }
}
