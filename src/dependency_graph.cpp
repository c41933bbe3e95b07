#include "dependency_graph.hpp"
#include <algorithm>
#include <iterator>
#include <set>

DependencyGraphBuilder::DependencyGraphBuilder(const std::vector<Module>& modules)
    : modules_(modules) {
    // Index every module under its full dotted name and under each
    // segment-boundary suffix of it
    for (const auto& module : modules_) {
        const std::string dotted = dottedName(module.path);
        if (dotted.empty()) {
            continue;
        }

        byName_[dotted].push_back(module.id);

        size_t start = 0;
        while (true) {
            bySuffix_[dotted.substr(start)].push_back(module.id);
            const size_t dot = dotted.find('.', start);
            if (dot == std::string::npos) {
                break;
            }
            start = dot + 1;
        }
    }
}

DependencyGraph DependencyGraphBuilder::build() const {
    DependencyGraph graph;
    for (const auto& module : modules_) {
        auto edges = resolveModule(module, graph.diagnostics);
        graph.edges.insert(graph.edges.end(), std::make_move_iterator(edges.begin()),
                           std::make_move_iterator(edges.end()));
    }
    return graph;
}

std::vector<DependencyEdge> DependencyGraphBuilder::resolveModule(const Module& module,
                                                                  std::vector<Diagnostic>& diagnostics) const {
    std::vector<DependencyEdge> edges;
    std::set<ModuleId> internalSeen;
    std::set<std::string> externalSeen;

    auto addInternal = [&](ModuleId target) {
        if (target != module.id && internalSeen.insert(target).second) {
            edges.push_back({module.id, target, ""});
        }
    };
    auto addExternal = [&](const std::string& dotted) {
        const std::string package = topLevelPackage(dotted);
        if (!package.empty() && externalSeen.insert(package).second) {
            edges.push_back({module.id, std::nullopt, package});
        }
    };

    for (const auto& record : module.imports) {
        if (!record.isFrom) {
            if (auto target = resolveAbsolute(record.module, module, record.line, diagnostics)) {
                addInternal(*target);
            } else {
                addExternal(record.module);
            }
            continue;
        }

        if (record.level > 0) {
            auto base = relativeBase(module.path, record.level);
            if (!base) {
                diagnostics.push_back({DiagnosticKind::UnresolvedImport, module.path,
                                       "relative import climbs above the analysis root", record.line});
                continue;
            }

            std::string package = *base;
            if (!record.module.empty()) {
                package = package.empty() ? record.module : package + "." + record.module;
            }

            bool resolved = false;
            bool needPackage = record.names.empty();
            for (const auto& name : record.names) {
                if (name == "*") {
                    needPackage = true;
                    continue;
                }
                const std::string submodule = package.empty() ? name : package + "." + name;
                if (auto target = resolveExact(submodule, module, record.line, diagnostics)) {
                    addInternal(*target);
                    resolved = true;
                } else {
                    needPackage = true;
                }
            }

            if (needPackage && !package.empty()) {
                if (auto target = resolveExact(package, module, record.line, diagnostics)) {
                    addInternal(*target);
                    resolved = true;
                }
            }

            if (!resolved) {
                diagnostics.push_back({DiagnosticKind::UnresolvedImport, module.path,
                                       "relative import '" + std::string(record.level, '.') + record.module +
                                           "' does not match any analyzed module",
                                       record.line});
            }
            continue;
        }

        // from pkg import name: each name may be a submodule or a member of pkg
        bool resolved = false;
        bool needPackage = record.names.empty();
        for (const auto& name : record.names) {
            if (name == "*") {
                needPackage = true;
                continue;
            }
            if (auto target = resolveAbsolute(record.module + "." + name, module, record.line, diagnostics)) {
                addInternal(*target);
                resolved = true;
            } else {
                needPackage = true;
            }
        }

        if (needPackage) {
            if (auto target = resolveAbsolute(record.module, module, record.line, diagnostics)) {
                addInternal(*target);
                resolved = true;
            }
        }

        if (!resolved) {
            addExternal(record.module);
        }
    }

    return edges;
}

std::string DependencyGraphBuilder::dottedName(const std::string& path) {
    std::string dotted = path;
    const std::string extension = ".py";
    if (dotted.size() >= extension.size() &&
        dotted.compare(dotted.size() - extension.size(), extension.size(), extension) == 0) {
        dotted.erase(dotted.size() - extension.size());
    }

    const std::string init = "__init__";
    if (dotted == init) {
        return "";
    }
    if (dotted.size() > init.size() &&
        dotted.compare(dotted.size() - init.size() - 1, init.size() + 1, "/" + init) == 0) {
        dotted.erase(dotted.size() - init.size() - 1);
    }

    std::replace(dotted.begin(), dotted.end(), '/', '.');
    return dotted;
}

std::optional<ModuleId> DependencyGraphBuilder::resolveAbsolute(const std::string& dotted, const Module& importer,
                                                                int line, std::vector<Diagnostic>& diagnostics) const {
    auto it = bySuffix_.find(dotted);
    if (it == bySuffix_.end()) {
        return std::nullopt;
    }
    return choose(it->second, dotted, importer, line, diagnostics);
}

std::optional<ModuleId> DependencyGraphBuilder::resolveExact(const std::string& dotted, const Module& importer,
                                                             int line, std::vector<Diagnostic>& diagnostics) const {
    auto it = byName_.find(dotted);
    if (it == byName_.end()) {
        return std::nullopt;
    }
    return choose(it->second, dotted, importer, line, diagnostics);
}

std::optional<ModuleId> DependencyGraphBuilder::choose(std::vector<ModuleId> candidates, const std::string& target,
                                                       const Module& importer, int line,
                                                       std::vector<Diagnostic>& diagnostics) const {
    // A module that only matches itself is shadowing an external package
    candidates.erase(std::remove(candidates.begin(), candidates.end(), importer.id), candidates.end());
    if (candidates.empty()) {
        return std::nullopt;
    }

    if (candidates.size() > 1) {
        std::sort(candidates.begin(), candidates.end(), [this](ModuleId a, ModuleId b) {
            const std::string& pathA = modules_[a].path;
            const std::string& pathB = modules_[b].path;
            if (pathA.size() != pathB.size()) {
                return pathA.size() < pathB.size();
            }
            return pathA < pathB;
        });

        diagnostics.push_back({DiagnosticKind::ResolutionAmbiguity, importer.path,
                               "import '" + target + "' matches " + std::to_string(candidates.size()) +
                                   " modules, using " + modules_[candidates.front()].path,
                               line});
    }

    return candidates.front();
}

std::optional<std::string> DependencyGraphBuilder::relativeBase(const std::string& importerPath, int level) {
    std::vector<std::string> segments;
    size_t start = 0;
    while (true) {
        const size_t slash = importerPath.find('/', start);
        if (slash == std::string::npos) {
            break;
        }
        segments.push_back(importerPath.substr(start, slash - start));
        start = slash + 1;
    }

    // One dot is the importer's own package
    const size_t climb = static_cast<size_t>(level - 1);
    if (climb > segments.size()) {
        return std::nullopt;
    }
    segments.resize(segments.size() - climb);

    std::string base;
    for (const auto& segment : segments) {
        if (!base.empty()) {
            base += '.';
        }
        base += segment;
    }
    return base;
}

std::string topLevelPackage(const std::string& dotted) {
    const size_t dot = dotted.find('.');
    return dot == std::string::npos ? dotted : dotted.substr(0, dot);
}
