#pragma once

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

// Entities are stored in flat tables owned by AnalysisResult and refer to each
// other through these indices, never through pointers.
using ModuleId = std::size_t;
using ClassId = std::size_t;
using FunctionId = std::size_t;

enum class ClassCategory {
    Model,
    Pipeline,
    Generator,
    Analyzer,
    Entity,
    Service,
    General
};

enum class FunctionCategory {
    Dunder,
    EntryPoint,     // serialized as "Entry_Point"
    Private,
    Getter,
    Setter,
    Creator,
    Processor,
    General
};

enum class FlowRole {
    EntryPoint,
    Transformation,
    Output,
    DataStore
};

enum class LayerKind {
    Presentation,
    Interface,
    Business,
    Data,
    Infrastructure,
    Test
};

enum class DiagnosticKind {
    ParseFailure,
    UnreadableFile,
    ResolutionAmbiguity,
    UnresolvedImport,
    DepthExceeded,
    ChainLimitReached
};

// Contract spellings used by serialization and reports
std::string toString(ClassCategory category);
std::string toString(FunctionCategory category);
std::string toString(FlowRole role);
std::string toString(LayerKind layer);
std::string toString(DiagnosticKind kind);

struct ImportRecord {
    std::string module;                 // dotted module text, without leading dots
    std::vector<std::string> names;     // members of a from-import ("*" for wildcard)
    int level = 0;                      // leading dots of a relative import
    bool isFrom = false;
    int line = 0;

    bool operator==(const ImportRecord& other) const;
};

struct Parameter {
    std::string name;
    std::optional<std::string> type;
    std::optional<std::string> defaultValue;

    bool operator==(const Parameter& other) const;
};

struct Module {
    ModuleId id = 0;
    std::string path;                   // root-relative, '/'-separated
    std::string name;                   // file stem
    std::optional<std::string> docstring;
    std::size_t lineCount = 0;
    std::vector<ImportRecord> imports;
    std::vector<ClassId> classes;
    std::vector<FunctionId> functions;
    bool isMain = false;

    bool operator==(const Module& other) const;
};

struct ClassInfo {
    ClassId id = 0;
    std::string name;
    std::string qualifiedName;
    ModuleId module = 0;
    std::string file;
    int line = 0;
    int endLine = 0;
    std::optional<std::string> docstring;
    std::vector<std::string> bases;
    std::vector<std::string> methods;
    std::vector<std::string> decorators;
    ClassCategory category = ClassCategory::General;
    bool isAbstract = false;
    bool isException = false;

    bool operator==(const ClassInfo& other) const;
};

struct FunctionInfo {
    FunctionId id = 0;
    std::string name;
    std::string qualifiedName;
    ModuleId module = 0;
    std::string file;
    int line = 0;
    int endLine = 0;
    std::vector<Parameter> parameters;
    std::optional<std::string> returnType;
    std::optional<std::string> docstring;
    int complexity = 1;
    FunctionCategory category = FunctionCategory::General;
    std::set<std::string> callees;
    std::vector<std::string> decorators;
    std::optional<ClassId> ownerClass;
    bool isMethod = false;
    bool isAsync = false;
    bool isProperty = false;
    bool isClassMethod = false;
    bool isStaticLike = false;

    bool operator==(const FunctionInfo& other) const;
};

// Exactly one of targetModule / externalPackage is meaningful.
struct DependencyEdge {
    ModuleId source = 0;
    std::optional<ModuleId> targetModule;
    std::string externalPackage;

    bool isInternal() const { return targetModule.has_value(); }
    bool operator==(const DependencyEdge& other) const;
};

struct FlowNode {
    FunctionId function = 0;
    FlowRole role = FlowRole::Transformation;

    bool operator==(const FlowNode& other) const;
};

// Flow role of one function, with a finer label for transformations
// ("parser", "cleaner", ...), outputs ("storage", "export", ...) and data
// stores ("file_reader", "data_fetcher", ...). Entry points have no label.
struct FlowPoint {
    FunctionId function = 0;
    FlowRole role = FlowRole::Transformation;
    std::optional<std::string> kind;

    bool operator==(const FlowPoint& other) const;
};

struct Validator {
    FunctionId function = 0;
    bool returnsBoolean = true;     // true unless an annotation names another type

    bool operator==(const Validator& other) const;
};

// A heuristic pipeline guess, not a verified call path.
struct FlowChain {
    std::vector<FlowNode> nodes;

    bool operator==(const FlowChain& other) const;
};

struct ArchitectureLayer {
    std::string directory;
    LayerKind layer = LayerKind::Business;
    std::size_t fileCount = 0;

    bool operator==(const ArchitectureLayer& other) const;
};

struct ParseFailure {
    std::string path;
    std::string reason;

    bool operator==(const ParseFailure& other) const;
};

struct Diagnostic {
    DiagnosticKind kind = DiagnosticKind::ParseFailure;
    std::string path;
    std::string message;
    int line = 0;

    bool operator==(const Diagnostic& other) const;
};

struct Overview {
    std::size_t totalFiles = 0;
    std::size_t failedFiles = 0;
    std::size_t totalLines = 0;
    std::size_t totalFunctions = 0;
    std::size_t totalClasses = 0;
    std::vector<std::string> languagesDetected;
    std::string projectType;

    bool operator==(const Overview& other) const;
};

struct ComplexitySummary {
    double average = 0.0;
    int maximum = 0;
    std::size_t totalFunctions = 0;
    std::vector<FunctionId> highComplexity;

    bool operator==(const ComplexitySummary& other) const;
};

// Everything one analysis run produces. Created at run start, handed to the
// caller at completion, never shared between runs.
struct AnalysisResult {
    std::vector<Module> modules;
    std::vector<ClassInfo> classes;
    std::vector<FunctionInfo> functions;
    std::vector<DependencyEdge> dependencies;
    std::vector<FlowChain> flowChains;
    std::vector<FlowPoint> flowPoints;
    std::vector<Validator> validators;
    std::vector<ArchitectureLayer> layers;
    std::vector<std::string> architecturePatterns;
    std::vector<ParseFailure> parseFailures;
    std::vector<Diagnostic> diagnostics;
    Overview overview;
    ComplexitySummary complexity;

    // Lookup by root-relative path; rebuilt by reindex()
    const Module* findModule(const std::string& path) const;
    std::vector<const FunctionInfo*> functionsOf(ModuleId module) const;
    std::vector<const DependencyEdge*> dependenciesOf(ModuleId module) const;

    void reindex();

private:
    std::unordered_map<std::string, ModuleId> moduleByPath_;
};
