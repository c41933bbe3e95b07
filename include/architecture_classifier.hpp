#pragma once

#include <string>
#include <vector>
#include "analysis_types.hpp"

struct LayerRule {
    std::vector<std::string> keywords;
    LayerKind layer;
};

// Ordered; first rule with a keyword contained in the lowercased directory
// name wins. Directories matching nothing are Business.
struct LayerRuleTable {
    std::vector<LayerRule> rules;
};

struct PatternIndicator {
    std::string pattern;
    std::vector<std::string> indicators;
};

LayerRuleTable defaultLayerRules();
std::vector<PatternIndicator> defaultPatternIndicators();

class ArchitectureClassifier {
public:
    ArchitectureClassifier();
    ArchitectureClassifier(LayerRuleTable layerRules, std::vector<PatternIndicator> patterns);

    // One layer record per top-level directory holding at least one of the
    // given root-relative paths, sorted by directory name
    std::vector<ArchitectureLayer> classifyLayers(const std::vector<std::string>& paths) const;

    LayerKind classifyDirectory(const std::string& directory) const;

    // Architecture styles suggested by the top-level directory names
    std::vector<std::string> detectPatterns(const std::vector<std::string>& paths) const;

    static std::vector<std::string> topLevelDirectories(const std::vector<std::string>& paths);

private:
    LayerRuleTable layerRules_;
    std::vector<PatternIndicator> patterns_;
};
