#include "analyzer_options.hpp"
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace {

std::string joinPatterns(const json& patterns, const char* key) {
    if (patterns.is_string()) {
        return patterns.get<std::string>();
    }
    if (!patterns.is_array()) {
        throw std::runtime_error(std::string("Config key '") + key + "' must be a string or an array");
    }

    std::string joined;
    for (const auto& pattern : patterns) {
        if (!pattern.is_string()) {
            throw std::runtime_error(std::string("Config key '") + key + "' must contain only strings");
        }
        if (!joined.empty()) {
            joined += ",";
        }
        joined += pattern.get<std::string>();
    }
    return joined;
}

template <typename T>
void readValue(const json& section, const char* key, T& target) {
    auto it = section.find(key);
    if (it == section.end() || it->is_null()) {
        return;
    }
    try {
        target = it->get<T>();
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid value for config key '") + key + "': " + e.what());
    }
}

} // namespace

AnalyzerOptions analyzerOptionsFromJson(const json& config) {
    AnalyzerOptions options;

    if (!config.is_object()) {
        throw std::runtime_error("Analyzer configuration must be a JSON object");
    }

    // The original tool nested everything under "analysis"
    const json& section = config.contains("analysis") ? config.at("analysis") : config;
    if (!section.is_object()) {
        throw std::runtime_error("Config key 'analysis' must be an object");
    }

    if (section.contains("include_patterns")) {
        options.includePatterns = joinPatterns(section.at("include_patterns"), "include_patterns");
    }
    if (section.contains("exclude_patterns")) {
        options.excludePatterns = joinPatterns(section.at("exclude_patterns"), "exclude_patterns");
    }

    readValue(section, "source_extensions", options.sourceExtensions);
    readValue(section, "num_threads", options.numThreads);
    readValue(section, "respect_gitignore", options.respectGitignore);
    readValue(section, "max_file_size", options.maxFileSize);
    readValue(section, "verbose", options.verbose);
    readValue(section, "max_flow_depth", options.maxFlowDepth);
    readValue(section, "max_flow_chains", options.maxFlowChains);
    readValue(section, "high_complexity_threshold", options.highComplexityThreshold);

    if (options.maxFlowDepth < 2) {
        throw std::runtime_error("max_flow_depth must be at least 2");
    }
    if (options.numThreads == 0) {
        options.numThreads = 1;
    }

    return options;
}

AnalyzerOptions loadAnalyzerOptions(const fs::path& configPath) {
    std::ifstream file(configPath);
    if (!file) {
        throw std::runtime_error("Failed to open config file: " + configPath.string());
    }

    json config;
    try {
        config = json::parse(file);
    } catch (const json::exception& e) {
        throw std::runtime_error("Invalid JSON in config file " + configPath.string() + ": " + e.what());
    }

    return analyzerOptionsFromJson(config);
}
