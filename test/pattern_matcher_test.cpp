#include <catch2/catch_test_macros.hpp>
#include "pattern_matcher.hpp"
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

TEST_CASE("PatternMatcher constructor adds default patterns", "[PatternMatcher]") {
    PatternMatcher matcher;

    SECTION("Default ignore patterns work") {
        REQUIRE(matcher.isIgnored(".git/config"));
        REQUIRE(matcher.isIgnored("venv/lib/python3.11/site.py"));
        REQUIRE(matcher.isIgnored(".venv/bin/activate.py"));
        REQUIRE(matcher.isIgnored("pkg/__pycache__/module.cpython-311.pyc"));
        REQUIRE(matcher.isIgnored("web/node_modules/left-pad/index.js"));
        REQUIRE(matcher.isIgnored("build/lib/pkg/mod.py"));
        REQUIRE(matcher.isIgnored("module.pyc"));
    }

    SECTION("Ignored directories match at any depth") {
        REQUIRE(matcher.isIgnored("services/api/venv/x.py"));
        REQUIRE(matcher.isIgnored("venv/"));
    }

    SECTION("Non-ignored files are not matched") {
        REQUIRE_FALSE(matcher.isIgnored("src/main.py"));
        REQUIRE_FALSE(matcher.isIgnored("README.md"));
        REQUIRE_FALSE(matcher.isIgnored("environment/settings.py"));
        REQUIRE_FALSE(matcher.isIgnored("pkg/builder.py"));
    }
}

TEST_CASE("PatternMatcher can add custom patterns", "[PatternMatcher]") {
    PatternMatcher matcher;

    SECTION("Adding wildcard patterns") {
        matcher.addIgnorePattern("*.txt");
        REQUIRE(matcher.isIgnored("file.txt"));
        REQUIRE(matcher.isIgnored("path/to/file.txt"));
        REQUIRE_FALSE(matcher.isIgnored("file.md"));
    }

    SECTION("Adding directory patterns") {
        matcher.addIgnorePattern("migrations/**");
        REQUIRE(matcher.isIgnored("migrations/0001_initial.py"));
        REQUIRE(matcher.isIgnored("migrations/old/0002.py"));
        REQUIRE_FALSE(matcher.isIgnored("app/migrations.py"));
    }

    SECTION("Adding specific file patterns") {
        matcher.addIgnorePattern("src/secrets.py");
        REQUIRE(matcher.isIgnored("src/secrets.py"));
        REQUIRE_FALSE(matcher.isIgnored("secrets.py"));
        REQUIRE_FALSE(matcher.isIgnored("src/not_secrets.py"));
    }

    SECTION("Constructor patterns are added to the defaults") {
        PatternMatcher custom(std::vector<std::string>{"docs/**"});
        REQUIRE(custom.isIgnored("docs/conf.py"));
        REQUIRE(custom.isIgnored(".git/HEAD"));
    }
}

TEST_CASE("PatternMatcher properly converts patterns to regex", "[PatternMatcher]") {
    PatternMatcher matcher;

    SECTION("* wildcard") {
        matcher.addIgnorePattern("*.py");
        REQUIRE(matcher.isIgnored("main.py"));
        REQUIRE(matcher.isIgnored("helper.py"));
        REQUIRE_FALSE(matcher.isIgnored("main.pyi"));
        REQUIRE_FALSE(matcher.isIgnored("main.py/something"));
    }

    SECTION("* stops at directory separators") {
        matcher.addIgnorePattern("scripts/*.py");
        REQUIRE(matcher.isIgnored("scripts/run.py"));
        REQUIRE_FALSE(matcher.isIgnored("scripts/nested/run.py"));
    }

    SECTION("? wildcard") {
        matcher.addIgnorePattern("file?.txt");
        REQUIRE(matcher.isIgnored("file1.txt"));
        REQUIRE(matcher.isIgnored("fileA.txt"));
        REQUIRE_FALSE(matcher.isIgnored("file.txt"));
        REQUIRE_FALSE(matcher.isIgnored("file12.txt"));
    }

    SECTION("** wildcard") {
        matcher.addIgnorePattern("src/**/test");
        REQUIRE(matcher.isIgnored("src/test"));
        REQUIRE(matcher.isIgnored("src/foo/test"));
        REQUIRE(matcher.isIgnored("src/foo/bar/test"));
        REQUIRE_FALSE(matcher.isIgnored("foo/test"));
        REQUIRE_FALSE(matcher.isIgnored("src/test/foo"));
    }
}

TEST_CASE("PatternMatcher include patterns", "[PatternMatcher]") {
    PatternMatcher matcher;

    SECTION("No include patterns means everything is included") {
        REQUIRE_FALSE(matcher.hasIncludePatterns());
        REQUIRE(matcher.isIncluded("anything.txt"));
    }

    SECTION("Comma-separated include patterns") {
        matcher.setIncludePatterns(" *.py , scripts/* ");
        REQUIRE(matcher.hasIncludePatterns());
        REQUIRE(matcher.isIncluded("pkg/mod.py"));
        REQUIRE(matcher.isIncluded("scripts/deploy"));
        REQUIRE_FALSE(matcher.isIncluded("README.md"));
    }

    SECTION("Setting include patterns replaces earlier ones") {
        matcher.setIncludePatterns("*.md");
        matcher.setIncludePatterns("*.py");
        REQUIRE_FALSE(matcher.isIncluded("README.md"));
        REQUIRE(matcher.isIncluded("main.py"));
    }

    SECTION("shouldProcess needs an include match and no ignore match") {
        matcher.setIncludePatterns("*.py");
        matcher.setExcludePatterns("tests/**");
        REQUIRE(matcher.shouldProcess("pkg/mod.py"));
        REQUIRE_FALSE(matcher.shouldProcess("tests/test_mod.py"));
        REQUIRE_FALSE(matcher.shouldProcess("venv/site.py"));
        REQUIRE_FALSE(matcher.shouldProcess("notes.txt"));
    }
}

TEST_CASE("PatternMatcher loads .gitignore files", "[PatternMatcher]") {
    fs::path tempDir = fs::temp_directory_path() / "flowmap_gitignore_test";
    fs::create_directories(tempDir);
    fs::path gitignore = tempDir / ".gitignore";

    {
        std::ofstream file(gitignore);
        file << "# generated code\n"
             << "\n"
             << "generated/\n"
             << "config/local/\n"
             << "*.log\n"
             << "!keep.log\n";
    }

    PatternMatcher matcher;
    matcher.loadGitignore(gitignore);

    SECTION("Directory entries match at any depth") {
        REQUIRE(matcher.isIgnored("generated/models.py"));
        REQUIRE(matcher.isIgnored("pkg/generated/models.py"));
    }

    SECTION("Directory entries with a path are anchored") {
        REQUIRE(matcher.isIgnored("config/local/settings.py"));
        REQUIRE_FALSE(matcher.isIgnored("other/config/local/settings.py"));
    }

    SECTION("File globs and skipped lines") {
        REQUIRE(matcher.isIgnored("debug.log"));
        REQUIRE(matcher.isIgnored("keep.log"));
        REQUIRE_FALSE(matcher.isIgnored("generated.py"));
    }

    SECTION("A missing file leaves the matcher unchanged") {
        PatternMatcher untouched;
        untouched.loadGitignore(tempDir / "does_not_exist");
        REQUIRE_FALSE(untouched.isIgnored("debug.log"));
    }

    fs::remove_all(tempDir);
}
