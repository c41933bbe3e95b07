#pragma once

#include <string>
#include <vector>

struct ProjectProfile {
    std::vector<std::string> languages;     // sorted, unique
    std::string projectType;
};

// Language name for a file extension such as ".py"; empty if unknown
std::string languageForExtension(const std::string& extension);

// Languages and project kind guessed from root-relative file paths.
// Python markers (requirements.txt, setup.py, pyproject.toml at the root)
// select a framework by app.py or by a path component naming flask, django,
// fastapi or streamlit; package.json marks a Node.js project.
ProjectProfile profileProject(const std::vector<std::string>& paths);
