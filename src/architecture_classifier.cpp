#include "architecture_classifier.hpp"
#include <algorithm>
#include <cctype>
#include <map>
#include <set>
#include <utility>

namespace {

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

// First path segment, or empty for files at the root and hidden directories
std::string topLevelDirectory(const std::string& path) {
    const size_t slash = path.find('/');
    if (slash == std::string::npos || slash == 0 || path[0] == '.') {
        return "";
    }
    return path.substr(0, slash);
}

} // namespace

LayerRuleTable defaultLayerRules() {
    LayerRuleTable table;
    table.rules = {
        {{"api", "server", "router", "endpoint"}, LayerKind::Interface},
        {{"model", "schema", "entity", "db", "database"}, LayerKind::Data},
        {{"util", "helper", "lib", "common", "config"}, LayerKind::Infrastructure},
        {{"ui", "view", "component"}, LayerKind::Presentation},
        {{"test", "spec"}, LayerKind::Test},
    };
    return table;
}

std::vector<PatternIndicator> defaultPatternIndicators() {
    return {
        {"MVC", {"models", "views", "controllers"}},
        {"Layered", {"presentation", "business", "data", "services"}},
        {"Microservices", {"services", "api", "gateway"}},
        {"Repository", {"repositories", "models", "entities"}},
        {"Clean Architecture", {"domain", "infrastructure", "application", "interface"}},
    };
}

ArchitectureClassifier::ArchitectureClassifier()
    : layerRules_(defaultLayerRules()), patterns_(defaultPatternIndicators()) {}

ArchitectureClassifier::ArchitectureClassifier(LayerRuleTable layerRules, std::vector<PatternIndicator> patterns)
    : layerRules_(std::move(layerRules)), patterns_(std::move(patterns)) {}

std::vector<ArchitectureLayer> ArchitectureClassifier::classifyLayers(const std::vector<std::string>& paths) const {
    std::map<std::string, size_t> fileCounts;
    for (const auto& path : paths) {
        const std::string directory = topLevelDirectory(path);
        if (!directory.empty()) {
            ++fileCounts[directory];
        }
    }

    std::vector<ArchitectureLayer> layers;
    layers.reserve(fileCounts.size());
    for (const auto& [directory, count] : fileCounts) {
        layers.push_back({directory, classifyDirectory(directory), count});
    }
    return layers;
}

LayerKind ArchitectureClassifier::classifyDirectory(const std::string& directory) const {
    const std::string lower = toLower(directory);
    for (const auto& rule : layerRules_.rules) {
        for (const auto& keyword : rule.keywords) {
            if (lower.find(keyword) != std::string::npos) {
                return rule.layer;
            }
        }
    }
    return LayerKind::Business;
}

std::vector<std::string> ArchitectureClassifier::detectPatterns(const std::vector<std::string>& paths) const {
    std::vector<std::string> directories = topLevelDirectories(paths);
    for (auto& directory : directories) {
        directory = toLower(directory);
    }

    std::vector<std::string> detected;
    for (const auto& indicator : patterns_) {
        const bool present = std::any_of(
            indicator.indicators.begin(), indicator.indicators.end(), [&directories](const std::string& keyword) {
                return std::any_of(directories.begin(), directories.end(), [&keyword](const std::string& directory) {
                    return directory.find(keyword) != std::string::npos;
                });
            });
        if (present) {
            detected.push_back(indicator.pattern);
        }
    }
    return detected;
}

std::vector<std::string> ArchitectureClassifier::topLevelDirectories(const std::vector<std::string>& paths) {
    std::set<std::string> directories;
    for (const auto& path : paths) {
        const std::string directory = topLevelDirectory(path);
        if (!directory.empty()) {
            directories.insert(directory);
        }
    }
    return {directories.begin(), directories.end()};
}
