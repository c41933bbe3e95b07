#pragma once

#include <nlohmann/json.hpp>
#include "analysis_types.hpp"

// JSON encoding of an analysis result. Field names are snake_case and enum
// values use their contract spellings ("Entry_Point", "interface", ...).
// Decoding throws nlohmann::json::exception for missing keys or wrong types and
// std::invalid_argument for an unknown enum spelling.
nlohmann::json resultToJson(const AnalysisResult& result);
AnalysisResult resultFromJson(const nlohmann::json& j);

void to_json(nlohmann::json& j, ClassCategory value);
void from_json(const nlohmann::json& j, ClassCategory& value);
void to_json(nlohmann::json& j, FunctionCategory value);
void from_json(const nlohmann::json& j, FunctionCategory& value);
void to_json(nlohmann::json& j, FlowRole value);
void from_json(const nlohmann::json& j, FlowRole& value);
void to_json(nlohmann::json& j, LayerKind value);
void from_json(const nlohmann::json& j, LayerKind& value);
void to_json(nlohmann::json& j, DiagnosticKind value);
void from_json(const nlohmann::json& j, DiagnosticKind& value);

void to_json(nlohmann::json& j, const ImportRecord& record);
void from_json(const nlohmann::json& j, ImportRecord& record);
void to_json(nlohmann::json& j, const Parameter& parameter);
void from_json(const nlohmann::json& j, Parameter& parameter);
void to_json(nlohmann::json& j, const Module& module);
void from_json(const nlohmann::json& j, Module& module);
void to_json(nlohmann::json& j, const ClassInfo& cls);
void from_json(const nlohmann::json& j, ClassInfo& cls);
void to_json(nlohmann::json& j, const FunctionInfo& function);
void from_json(const nlohmann::json& j, FunctionInfo& function);
void to_json(nlohmann::json& j, const DependencyEdge& edge);
void from_json(const nlohmann::json& j, DependencyEdge& edge);
void to_json(nlohmann::json& j, const FlowNode& node);
void from_json(const nlohmann::json& j, FlowNode& node);
void to_json(nlohmann::json& j, const FlowChain& chain);
void from_json(const nlohmann::json& j, FlowChain& chain);
void to_json(nlohmann::json& j, const FlowPoint& point);
void from_json(const nlohmann::json& j, FlowPoint& point);
void to_json(nlohmann::json& j, const Validator& validator);
void from_json(const nlohmann::json& j, Validator& validator);
void to_json(nlohmann::json& j, const ArchitectureLayer& layer);
void from_json(const nlohmann::json& j, ArchitectureLayer& layer);
void to_json(nlohmann::json& j, const ParseFailure& failure);
void from_json(const nlohmann::json& j, ParseFailure& failure);
void to_json(nlohmann::json& j, const Diagnostic& diagnostic);
void from_json(const nlohmann::json& j, Diagnostic& diagnostic);
void to_json(nlohmann::json& j, const Overview& overview);
void from_json(const nlohmann::json& j, Overview& overview);
void to_json(nlohmann::json& j, const ComplexitySummary& summary);
void from_json(const nlohmann::json& j, ComplexitySummary& summary);
