#include "result_json.hpp"
#include <initializer_list>
#include <stdexcept>

using json = nlohmann::json;

namespace {

template <typename E>
void enumFromJson(const json& j, E& value, std::initializer_list<E> all, const char* typeName) {
    const std::string text = j.get<std::string>();
    for (E candidate : all) {
        if (toString(candidate) == text) {
            value = candidate;
            return;
        }
    }
    throw std::invalid_argument(std::string("Unknown ") + typeName + " '" + text + "'");
}

template <typename T>
json optionalToJson(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

template <typename T>
void optionalFromJson(const json& j, const char* key, std::optional<T>& value) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        value.reset();
    } else {
        value = it->get<T>();
    }
}

} // namespace

void to_json(json& j, ClassCategory value) { j = toString(value); }
void to_json(json& j, FunctionCategory value) { j = toString(value); }
void to_json(json& j, FlowRole value) { j = toString(value); }
void to_json(json& j, LayerKind value) { j = toString(value); }
void to_json(json& j, DiagnosticKind value) { j = toString(value); }

void from_json(const json& j, ClassCategory& value) {
    enumFromJson(j, value,
                 {ClassCategory::Model, ClassCategory::Pipeline, ClassCategory::Generator, ClassCategory::Analyzer,
                  ClassCategory::Entity, ClassCategory::Service, ClassCategory::General},
                 "class category");
}

void from_json(const json& j, FunctionCategory& value) {
    enumFromJson(j, value,
                 {FunctionCategory::Dunder, FunctionCategory::EntryPoint, FunctionCategory::Private,
                  FunctionCategory::Getter, FunctionCategory::Setter, FunctionCategory::Creator,
                  FunctionCategory::Processor, FunctionCategory::General},
                 "function category");
}

void from_json(const json& j, FlowRole& value) {
    enumFromJson(j, value,
                 {FlowRole::EntryPoint, FlowRole::Transformation, FlowRole::Output, FlowRole::DataStore},
                 "flow role");
}

void from_json(const json& j, LayerKind& value) {
    enumFromJson(j, value,
                 {LayerKind::Presentation, LayerKind::Interface, LayerKind::Business, LayerKind::Data,
                  LayerKind::Infrastructure, LayerKind::Test},
                 "layer");
}

void from_json(const json& j, DiagnosticKind& value) {
    enumFromJson(j, value,
                 {DiagnosticKind::ParseFailure, DiagnosticKind::UnreadableFile, DiagnosticKind::ResolutionAmbiguity,
                  DiagnosticKind::UnresolvedImport, DiagnosticKind::DepthExceeded,
                  DiagnosticKind::ChainLimitReached},
                 "diagnostic kind");
}

void to_json(json& j, const ImportRecord& record) {
    j = json{
        {"module",  record.module},
        {"names",   record.names},
        {"level",   record.level},
        {"is_from", record.isFrom},
        {"line",    record.line}
    };
}

void from_json(const json& j, ImportRecord& record) {
    j.at("module").get_to(record.module);
    j.at("names").get_to(record.names);
    j.at("level").get_to(record.level);
    j.at("is_from").get_to(record.isFrom);
    j.at("line").get_to(record.line);
}

void to_json(json& j, const Parameter& parameter) {
    j = json{
        {"name",    parameter.name},
        {"type",    optionalToJson(parameter.type)},
        {"default", optionalToJson(parameter.defaultValue)}
    };
}

void from_json(const json& j, Parameter& parameter) {
    j.at("name").get_to(parameter.name);
    optionalFromJson(j, "type", parameter.type);
    optionalFromJson(j, "default", parameter.defaultValue);
}

void to_json(json& j, const Module& module) {
    j = json{
        {"id",         module.id},
        {"path",       module.path},
        {"name",       module.name},
        {"docstring",  optionalToJson(module.docstring)},
        {"line_count", module.lineCount},
        {"imports",    module.imports},
        {"classes",    module.classes},
        {"functions",  module.functions},
        {"is_main",    module.isMain}
    };
}

void from_json(const json& j, Module& module) {
    j.at("id").get_to(module.id);
    j.at("path").get_to(module.path);
    j.at("name").get_to(module.name);
    optionalFromJson(j, "docstring", module.docstring);
    j.at("line_count").get_to(module.lineCount);
    j.at("imports").get_to(module.imports);
    j.at("classes").get_to(module.classes);
    j.at("functions").get_to(module.functions);
    j.at("is_main").get_to(module.isMain);
}

void to_json(json& j, const ClassInfo& cls) {
    j = json{
        {"id",             cls.id},
        {"name",           cls.name},
        {"qualified_name", cls.qualifiedName},
        {"module",         cls.module},
        {"file",           cls.file},
        {"line",           cls.line},
        {"end_line",       cls.endLine},
        {"docstring",      optionalToJson(cls.docstring)},
        {"bases",          cls.bases},
        {"methods",        cls.methods},
        {"decorators",     cls.decorators},
        {"category",       cls.category},
        {"is_abstract",    cls.isAbstract},
        {"is_exception",   cls.isException}
    };
}

void from_json(const json& j, ClassInfo& cls) {
    j.at("id").get_to(cls.id);
    j.at("name").get_to(cls.name);
    j.at("qualified_name").get_to(cls.qualifiedName);
    j.at("module").get_to(cls.module);
    j.at("file").get_to(cls.file);
    j.at("line").get_to(cls.line);
    j.at("end_line").get_to(cls.endLine);
    optionalFromJson(j, "docstring", cls.docstring);
    j.at("bases").get_to(cls.bases);
    j.at("methods").get_to(cls.methods);
    j.at("decorators").get_to(cls.decorators);
    j.at("category").get_to(cls.category);
    j.at("is_abstract").get_to(cls.isAbstract);
    j.at("is_exception").get_to(cls.isException);
}

void to_json(json& j, const FunctionInfo& function) {
    j = json{
        {"id",             function.id},
        {"name",           function.name},
        {"qualified_name", function.qualifiedName},
        {"module",         function.module},
        {"file",           function.file},
        {"line",           function.line},
        {"end_line",       function.endLine},
        {"parameters",     function.parameters},
        {"return_type",    optionalToJson(function.returnType)},
        {"docstring",      optionalToJson(function.docstring)},
        {"complexity",     function.complexity},
        {"category",       function.category},
        {"callees",        function.callees},
        {"decorators",     function.decorators},
        {"owner_class",    optionalToJson(function.ownerClass)},
        {"is_method",      function.isMethod},
        {"is_async",       function.isAsync},
        {"is_property",    function.isProperty},
        {"is_classmethod", function.isClassMethod},
        {"is_static_like", function.isStaticLike}
    };
}

void from_json(const json& j, FunctionInfo& function) {
    j.at("id").get_to(function.id);
    j.at("name").get_to(function.name);
    j.at("qualified_name").get_to(function.qualifiedName);
    j.at("module").get_to(function.module);
    j.at("file").get_to(function.file);
    j.at("line").get_to(function.line);
    j.at("end_line").get_to(function.endLine);
    j.at("parameters").get_to(function.parameters);
    optionalFromJson(j, "return_type", function.returnType);
    optionalFromJson(j, "docstring", function.docstring);
    j.at("complexity").get_to(function.complexity);
    j.at("category").get_to(function.category);
    j.at("callees").get_to(function.callees);
    j.at("decorators").get_to(function.decorators);
    optionalFromJson(j, "owner_class", function.ownerClass);
    j.at("is_method").get_to(function.isMethod);
    j.at("is_async").get_to(function.isAsync);
    j.at("is_property").get_to(function.isProperty);
    j.at("is_classmethod").get_to(function.isClassMethod);
    j.at("is_static_like").get_to(function.isStaticLike);
}

void to_json(json& j, const DependencyEdge& edge) {
    j = json{
        {"source",   edge.source},
        {"internal", edge.isInternal()},
        {"target",   edge.isInternal() ? json(*edge.targetModule) : json(edge.externalPackage)}
    };
}

void from_json(const json& j, DependencyEdge& edge) {
    j.at("source").get_to(edge.source);
    if (j.at("internal").get<bool>()) {
        edge.targetModule = j.at("target").get<ModuleId>();
        edge.externalPackage.clear();
    } else {
        edge.targetModule.reset();
        j.at("target").get_to(edge.externalPackage);
    }
}

void to_json(json& j, const FlowNode& node) {
    j = json{
        {"function", node.function},
        {"role",     node.role}
    };
}

void from_json(const json& j, FlowNode& node) {
    j.at("function").get_to(node.function);
    j.at("role").get_to(node.role);
}

void to_json(json& j, const FlowChain& chain) {
    j = json{{"nodes", chain.nodes}};
}

void from_json(const json& j, FlowChain& chain) {
    j.at("nodes").get_to(chain.nodes);
}

void to_json(json& j, const FlowPoint& point) {
    j = json{
        {"function", point.function},
        {"role",     point.role},
        {"kind",     optionalToJson(point.kind)}
    };
}

void from_json(const json& j, FlowPoint& point) {
    j.at("function").get_to(point.function);
    j.at("role").get_to(point.role);
    optionalFromJson(j, "kind", point.kind);
}

void to_json(json& j, const Validator& validator) {
    j = json{
        {"function",        validator.function},
        {"returns_boolean", validator.returnsBoolean}
    };
}

void from_json(const json& j, Validator& validator) {
    j.at("function").get_to(validator.function);
    j.at("returns_boolean").get_to(validator.returnsBoolean);
}

void to_json(json& j, const ArchitectureLayer& layer) {
    j = json{
        {"directory",  layer.directory},
        {"layer",      layer.layer},
        {"file_count", layer.fileCount}
    };
}

void from_json(const json& j, ArchitectureLayer& layer) {
    j.at("directory").get_to(layer.directory);
    j.at("layer").get_to(layer.layer);
    j.at("file_count").get_to(layer.fileCount);
}

void to_json(json& j, const ParseFailure& failure) {
    j = json{
        {"path",   failure.path},
        {"reason", failure.reason}
    };
}

void from_json(const json& j, ParseFailure& failure) {
    j.at("path").get_to(failure.path);
    j.at("reason").get_to(failure.reason);
}

void to_json(json& j, const Diagnostic& diagnostic) {
    j = json{
        {"kind",    diagnostic.kind},
        {"path",    diagnostic.path},
        {"message", diagnostic.message},
        {"line",    diagnostic.line}
    };
}

void from_json(const json& j, Diagnostic& diagnostic) {
    j.at("kind").get_to(diagnostic.kind);
    j.at("path").get_to(diagnostic.path);
    j.at("message").get_to(diagnostic.message);
    j.at("line").get_to(diagnostic.line);
}

void to_json(json& j, const Overview& overview) {
    j = json{
        {"total_files",        overview.totalFiles},
        {"failed_files",       overview.failedFiles},
        {"total_lines",        overview.totalLines},
        {"total_functions",    overview.totalFunctions},
        {"total_classes",      overview.totalClasses},
        {"languages_detected", overview.languagesDetected},
        {"project_type",       overview.projectType}
    };
}

void from_json(const json& j, Overview& overview) {
    j.at("total_files").get_to(overview.totalFiles);
    j.at("failed_files").get_to(overview.failedFiles);
    j.at("total_lines").get_to(overview.totalLines);
    j.at("total_functions").get_to(overview.totalFunctions);
    j.at("total_classes").get_to(overview.totalClasses);
    j.at("languages_detected").get_to(overview.languagesDetected);
    j.at("project_type").get_to(overview.projectType);
}

void to_json(json& j, const ComplexitySummary& summary) {
    j = json{
        {"average",         summary.average},
        {"maximum",         summary.maximum},
        {"total_functions", summary.totalFunctions},
        {"high_complexity", summary.highComplexity}
    };
}

void from_json(const json& j, ComplexitySummary& summary) {
    j.at("average").get_to(summary.average);
    j.at("maximum").get_to(summary.maximum);
    j.at("total_functions").get_to(summary.totalFunctions);
    j.at("high_complexity").get_to(summary.highComplexity);
}

json resultToJson(const AnalysisResult& result) {
    return json{
        {"overview",              result.overview},
        {"modules",               result.modules},
        {"classes",               result.classes},
        {"functions",             result.functions},
        {"dependencies",          result.dependencies},
        {"flow_chains",           result.flowChains},
        {"flow_points",           result.flowPoints},
        {"validators",            result.validators},
        {"layers",                result.layers},
        {"architecture_patterns", result.architecturePatterns},
        {"complexity",            result.complexity},
        {"parse_failures",        result.parseFailures},
        {"diagnostics",           result.diagnostics}
    };
}

AnalysisResult resultFromJson(const json& j) {
    AnalysisResult result;
    j.at("overview").get_to(result.overview);
    j.at("modules").get_to(result.modules);
    j.at("classes").get_to(result.classes);
    j.at("functions").get_to(result.functions);
    j.at("dependencies").get_to(result.dependencies);
    j.at("flow_chains").get_to(result.flowChains);
    j.at("flow_points").get_to(result.flowPoints);
    j.at("validators").get_to(result.validators);
    j.at("layers").get_to(result.layers);
    j.at("architecture_patterns").get_to(result.architecturePatterns);
    j.at("complexity").get_to(result.complexity);
    j.at("parse_failures").get_to(result.parseFailures);
    j.at("diagnostics").get_to(result.diagnostics);
    result.reindex();
    return result;
}
