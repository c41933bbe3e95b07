#include "project_profile.hpp"
#include <algorithm>
#include <cctype>
#include <set>
#include <unordered_map>
#include <utility>

namespace {

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string extensionOf(const std::string& path) {
    const size_t slash = path.rfind('/');
    const size_t dot = path.rfind('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash) ||
        dot == (slash == std::string::npos ? 0 : slash + 1)) {
        return "";
    }
    return path.substr(dot);
}

bool anyPathContains(const std::vector<std::string>& paths, const std::string& needle) {
    for (const auto& path : paths) {
        if (toLower(path).find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

} // namespace

std::string languageForExtension(const std::string& extension) {
    static const std::unordered_map<std::string, std::string> languages = {
        {".py",   "Python"},
        {".js",   "JavaScript"},
        {".ts",   "TypeScript"},
        {".jsx",  "React"},
        {".tsx",  "React TypeScript"},
        {".java", "Java"},
        {".cpp",  "C++"},
        {".c",    "C"},
        {".go",   "Go"},
        {".rs",   "Rust"}
    };

    auto it = languages.find(extension);
    return it != languages.end() ? it->second : std::string();
}

ProjectProfile profileProject(const std::vector<std::string>& paths) {
    ProjectProfile profile;

    std::set<std::string> languages;
    std::set<std::string> rootFiles;
    for (const auto& path : paths) {
        std::string language = languageForExtension(extensionOf(path));
        if (!language.empty()) {
            languages.insert(std::move(language));
        }
        if (path.find('/') == std::string::npos) {
            rootFiles.insert(path);
        }
    }
    profile.languages.assign(languages.begin(), languages.end());

    const bool pythonProject = rootFiles.count("requirements.txt") > 0 || rootFiles.count("setup.py") > 0 ||
                               rootFiles.count("pyproject.toml") > 0;

    if (pythonProject) {
        if (rootFiles.count("app.py") > 0 || anyPathContains(paths, "flask")) {
            profile.projectType = "Flask Web Application";
        } else if (anyPathContains(paths, "django")) {
            profile.projectType = "Django Web Application";
        } else if (anyPathContains(paths, "fastapi")) {
            profile.projectType = "FastAPI Application";
        } else if (anyPathContains(paths, "streamlit")) {
            profile.projectType = "Streamlit Application";
        } else {
            profile.projectType = "Python Library/Package";
        }
    } else if (rootFiles.count("package.json") > 0) {
        profile.projectType = "Node.js Application";
    } else {
        profile.projectType = "General Software Project";
    }

    return profile;
}
