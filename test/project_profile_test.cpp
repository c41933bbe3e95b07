#include <catch2/catch_test_macros.hpp>
#include "project_profile.hpp"
#include <string>
#include <vector>

TEST_CASE("Languages by extension", "[ProjectProfile]") {
    REQUIRE(languageForExtension(".py") == "Python");
    REQUIRE(languageForExtension(".tsx") == "React TypeScript");
    REQUIRE(languageForExtension(".rs") == "Rust");
    REQUIRE(languageForExtension(".md").empty());
    REQUIRE(languageForExtension("").empty());
}

TEST_CASE("ProjectProfile detects languages", "[ProjectProfile]") {
    ProjectProfile profile = profileProject({
        "src/app.py", "web/index.js", "web/widget.tsx", "tools/build.go", "README.md", ".gitignore", "Makefile",
        "src/util.py"
    });

    REQUIRE(profile.languages == std::vector<std::string>{"Go", "JavaScript", "Python", "React TypeScript"});
    REQUIRE(profileProject({}).languages.empty());
}

TEST_CASE("ProjectProfile detects the project type", "[ProjectProfile]") {
    SECTION("Python package without a framework") {
        REQUIRE(profileProject({"setup.py", "pkg/__init__.py"}).projectType == "Python Library/Package");
        REQUIRE(profileProject({"pyproject.toml", "pkg/core.py"}).projectType == "Python Library/Package");
    }

    SECTION("Web frameworks") {
        REQUIRE(profileProject({"requirements.txt", "app.py"}).projectType == "Flask Web Application");
        REQUIRE(profileProject({"requirements.txt", "server/flask_routes.py"}).projectType ==
                "Flask Web Application");
        REQUIRE(profileProject({"requirements.txt", "site/Django/settings.py"}).projectType ==
                "Django Web Application");
        REQUIRE(profileProject({"setup.py", "api/fastapi_app.py"}).projectType == "FastAPI Application");
        REQUIRE(profileProject({"setup.py", "dashboard/streamlit_main.py"}).projectType ==
                "Streamlit Application");
    }

    SECTION("Markers must sit at the root") {
        REQUIRE(profileProject({"docs/requirements.txt", "app.py"}).projectType == "General Software Project");
        REQUIRE(profileProject({"frontend/package.json"}).projectType == "General Software Project");
    }

    SECTION("Node.js and everything else") {
        REQUIRE(profileProject({"package.json", "index.js"}).projectType == "Node.js Application");
        REQUIRE(profileProject({"main.py"}).projectType == "General Software Project");
    }
}
