#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "analysis_types.hpp"

struct DependencyGraph {
    std::vector<DependencyEdge> edges;
    std::vector<Diagnostic> diagnostics;
};

// An absolute import resolves to a module whose dotted name equals the target
// or ends with it on a segment boundary; relative imports resolve against the
// importing module's package. Anything else is external, keyed by its
// top-level name. `modules` must outlive the builder and ids must equal indices.
class DependencyGraphBuilder {
public:
    explicit DependencyGraphBuilder(const std::vector<Module>& modules);

    DependencyGraph build() const;

    // Edges of a single module, in import order, deduplicated, no self-loops
    std::vector<DependencyEdge> resolveModule(const Module& module, std::vector<Diagnostic>& diagnostics) const;

    // Dotted module name for a root-relative path
    static std::string dottedName(const std::string& path);

private:
    std::optional<ModuleId> resolveAbsolute(const std::string& dotted, const Module& importer,
                                            int line, std::vector<Diagnostic>& diagnostics) const;
    std::optional<ModuleId> resolveExact(const std::string& dotted, const Module& importer,
                                         int line, std::vector<Diagnostic>& diagnostics) const;
    std::optional<ModuleId> choose(std::vector<ModuleId> candidates, const std::string& target,
                                   const Module& importer, int line,
                                   std::vector<Diagnostic>& diagnostics) const;

    // Package a relative import of `level` dots starts from, or nullopt if it
    // climbs above the analysis root
    static std::optional<std::string> relativeBase(const std::string& importerPath, int level);

    const std::vector<Module>& modules_;
    std::unordered_map<std::string, std::vector<ModuleId>> bySuffix_;
    std::unordered_map<std::string, std::vector<ModuleId>> byName_;
};

// First segment of a dotted name
std::string topLevelPackage(const std::string& dotted);
