#pragma once

#include <string>
#include <vector>
#include <thread>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

struct AnalyzerOptions {
    std::string includePatterns = "*.py";   // Comma-separated glob patterns to include
    std::string excludePatterns;            // Comma-separated glob patterns to exclude
    std::vector<std::string> sourceExtensions = {".py"};  // Extension allow-list checked before parsing
    unsigned int numThreads = std::thread::hardware_concurrency();
    bool respectGitignore = true;           // Load <root>/.gitignore into the pattern matcher
    size_t maxFileSize = 10 * 1024 * 1024;  // Larger files are skipped by the loader
    bool verbose = false;

    // Aggregation phase limits
    int maxFlowDepth = 4;                   // Edges per flow chain
    size_t maxFlowChains = 200;             // Chains kept per run
    int highComplexityThreshold = 10;       // Functions above this are listed in the summary
};

// Reads options from a JSON document. Keys may sit at top level or under
// "analysis"; missing keys keep their defaults.
AnalyzerOptions analyzerOptionsFromJson(const nlohmann::json& config);

// Throws std::runtime_error if the file cannot be read or parsed.
AnalyzerOptions loadAnalyzerOptions(const fs::path& configPath);
