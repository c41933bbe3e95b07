#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <regex>

namespace fs = std::filesystem;

// Glob filter applied to root-relative paths before a file is read.
class PatternMatcher {
public:
    // Default constructor with the standard Python-tree ignores
    PatternMatcher();

    // Constructor with extra ignore patterns on top of the defaults
    explicit PatternMatcher(const std::vector<std::string>& ignorePatterns);

    void addIgnorePattern(const std::string& pattern);
    void addIncludePattern(const std::string& pattern);

    // Ignore a directory name at any depth (e.g. "venv" -> "**/venv/**")
    void addIgnoredDirectory(const std::string& directoryName);

    // Set include patterns from a comma-separated string (e.g., "*.py,scripts/*")
    void setIncludePatterns(const std::string& patternsStr);

    // Add exclude patterns from a comma-separated string
    void setExcludePatterns(const std::string& patternsStr);

    // Load patterns from a .gitignore file
    void loadGitignore(const fs::path& gitignorePath);

    // Matches include patterns (if any) and no ignore pattern
    bool shouldProcess(const fs::path& filePath) const;

    bool isIgnored(const fs::path& filePath) const;
    bool isIncluded(const fs::path& filePath) const;

    bool hasIncludePatterns() const { return !includePatterns_.empty(); }

private:
    struct Pattern {
        std::string glob;
        std::regex regex;
    };

    std::vector<Pattern> ignorePatterns_;
    std::vector<Pattern> includePatterns_;

    static bool matchesAny(const std::string& pathStr, const std::vector<Pattern>& patterns);
    std::regex patternToRegex(const std::string& pattern) const;
    std::vector<std::string> splitPatternString(const std::string& patternsStr) const;
};
