#include "pattern_matcher.hpp"
#include <fstream>
#include <iostream>
#include <algorithm>
#include <sstream>
#include <cctype>

namespace {

// Directories never worth parsing in a Python tree
const char* const kIgnoredDirectories[] = {
    "venv", ".venv", "env", ".env", "__pycache__", ".git",
    "node_modules", "site-packages", "build", "dist", ".tox"
};

std::string trim(std::string value) {
    value.erase(value.begin(), std::find_if(value.begin(), value.end(),
        [](unsigned char ch) { return !std::isspace(ch); }));
    value.erase(std::find_if(value.rbegin(), value.rend(),
        [](unsigned char ch) { return !std::isspace(ch); }).base(), value.end());
    return value;
}

} // namespace

PatternMatcher::PatternMatcher() {
    for (const char* directory : kIgnoredDirectories) {
        addIgnoredDirectory(directory);
    }
    addIgnorePattern("*.pyc");
    addIgnorePattern("*.pyo");
}

PatternMatcher::PatternMatcher(const std::vector<std::string>& ignorePatterns)
    : PatternMatcher() {
    for (const auto& pattern : ignorePatterns) {
        addIgnorePattern(pattern);
    }
}

void PatternMatcher::addIgnorePattern(const std::string& pattern) {
    ignorePatterns_.push_back({pattern, patternToRegex(pattern)});
}

void PatternMatcher::addIncludePattern(const std::string& pattern) {
    includePatterns_.push_back({pattern, patternToRegex(pattern)});
}

void PatternMatcher::addIgnoredDirectory(const std::string& directoryName) {
    addIgnorePattern("**/" + directoryName + "/**");
}

void PatternMatcher::setIncludePatterns(const std::string& patternsStr) {
    includePatterns_.clear();
    for (const auto& pattern : splitPatternString(patternsStr)) {
        addIncludePattern(pattern);
    }
}

void PatternMatcher::setExcludePatterns(const std::string& patternsStr) {
    for (const auto& pattern : splitPatternString(patternsStr)) {
        addIgnorePattern(pattern);
    }
}

std::vector<std::string> PatternMatcher::splitPatternString(const std::string& patternsStr) const {
    std::vector<std::string> patterns;
    std::stringstream ss(patternsStr);
    std::string pattern;

    while (std::getline(ss, pattern, ',')) {
        pattern = trim(pattern);
        if (!pattern.empty()) {
            patterns.push_back(pattern);
        }
    }

    return patterns;
}

void PatternMatcher::loadGitignore(const fs::path& gitignorePath) {
    std::ifstream file(gitignorePath);
    if (!file) {
        std::cerr << "Warning: Failed to open .gitignore file: " << gitignorePath << std::endl;
        return;
    }

    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);

        // Negations are not supported
        if (line.empty() || line[0] == '#' || line[0] == '!') {
            continue;
        }

        // "dir/" in a .gitignore means the directory anywhere in the tree
        if (line.back() == '/') {
            line.pop_back();
            if (line.find('/') == std::string::npos) {
                addIgnoredDirectory(line);
            } else {
                addIgnorePattern(line + "/**");
            }
            continue;
        }

        addIgnorePattern(line);
    }
}

bool PatternMatcher::shouldProcess(const fs::path& filePath) const {
    if (isIgnored(filePath)) {
        return false;
    }
    return isIncluded(filePath);
}

bool PatternMatcher::isIgnored(const fs::path& filePath) const {
    return matchesAny(filePath.generic_string(), ignorePatterns_);
}

bool PatternMatcher::isIncluded(const fs::path& filePath) const {
    if (includePatterns_.empty()) {
        return true;
    }
    return matchesAny(filePath.generic_string(), includePatterns_);
}

bool PatternMatcher::matchesAny(const std::string& pathStr, const std::vector<Pattern>& patterns) {
    for (const auto& pattern : patterns) {
        const std::string& glob = pattern.glob;

        // Fast path for plain extension globs like "*.py"
        bool extensionGlob = glob.size() >= 2 && glob[0] == '*' && glob[1] == '.' &&
                             glob.find_first_of("*?/", 1) == std::string::npos;
        if (extensionGlob) {
            const std::string extension = glob.substr(1);
            if (pathStr.size() >= extension.size() &&
                pathStr.compare(pathStr.size() - extension.size(), extension.size(), extension) == 0) {
                return true;
            }
            continue;
        }

        if (std::regex_match(pathStr, pattern.regex)) {
            return true;
        }

        // Patterns without a directory part also match the bare filename
        if (glob.find('/') == std::string::npos) {
            const std::string filename = fs::path(pathStr).filename().string();
            if (filename != pathStr && std::regex_match(filename, pattern.regex)) {
                return true;
            }
        }
    }

    return false;
}

std::regex PatternMatcher::patternToRegex(const std::string& pattern) const {
    std::string regexStr = "^";

    // A leading "/" anchors the glob at the root, which every regex here already is
    size_t start = (!pattern.empty() && pattern[0] == '/') ? 1 : 0;

    for (size_t i = start; i < pattern.size(); ++i) {
        const char c = pattern[i];

        if (c == '*') {
            if (i + 1 < pattern.size() && pattern[i + 1] == '*') {
                if (i + 2 < pattern.size() && pattern[i + 2] == '/') {
                    // **/ matches any directory depth, including none
                    regexStr += "(?:.*?/)?";
                    i += 2;
                } else {
                    regexStr += ".*";
                    i++;
                }
            } else {
                // * stops at directory separators
                regexStr += "[^/]*";
            }
        } else if (c == '?') {
            regexStr += "[^/]";
        } else if (c == '.' || c == '(' || c == ')' || c == '[' || c == ']' || c == '{' ||
                   c == '}' || c == '+' || c == '^' || c == '$' || c == '|' || c == '\\') {
            regexStr += '\\';
            regexStr += c;
        } else {
            regexStr += c;
        }
    }

    regexStr += "$";
    return std::regex(regexStr);
}
