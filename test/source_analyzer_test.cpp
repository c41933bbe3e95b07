#include <catch2/catch_test_macros.hpp>
#include "source_analyzer.hpp"
#include "result_json.hpp"
#include "test_helpers.hpp"
#include <algorithm>
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

const char* const kPipelineSource = R"PY(def main():
    data = process_data()
    return data


def process_data():
    return save_results([1, 2])


def save_results(values):
    return values
)PY";

AnalyzerOptions testOptions(unsigned int threads = 1) {
    AnalyzerOptions options;
    options.numThreads = threads;
    return options;
}

std::vector<std::string> chainNames(const AnalysisResult& result, const FlowChain& chain) {
    std::vector<std::string> names;
    for (const auto& node : chain.nodes) {
        names.push_back(result.functions[node.function].name);
    }
    return names;
}

} // namespace

TEST_CASE("SourceAnalyzer analyzes a directory", "[SourceAnalyzer]") {
    fs::path tempDir = fs::temp_directory_path() / "flowmap_analyzer_test";
    fs::remove_all(tempDir);
    fs::create_directory(tempDir);

    createTestFile(tempDir / "a.py", "import b\nimport requests\n");
    createTestFile(tempDir / "b.py", "x = 1\n");
    createTestFile(tempDir / "broken.py", "def broken(:\n    pass\n");
    createTestFile(tempDir / "app" / "pipeline.py", kPipelineSource);
    createTestFile(tempDir / "venv" / "lib" / "site.py", "def vendored():\n    pass\n");
    createTestFile(tempDir / "generated" / "models.py", "class Generated:\n    pass\n");
    createTestFile(tempDir / ".gitignore", "generated/\n");
    createTestFile(tempDir / "requirements.txt", "requests\n");
    createTestFile(tempDir / "web" / "index.js", "console.log('hi');\n");

    SourceAnalyzer analyzer(testOptions());
    auto result = analyzer.analyzeDirectory(tempDir);
    REQUIRE(result.has_value());

    SECTION("Modules are ordered by path and skip ignored directories") {
        REQUIRE(result->modules.size() == 3);
        REQUIRE(result->modules[0].path == "a.py");
        REQUIRE(result->modules[1].path == "app/pipeline.py");
        REQUIRE(result->modules[2].path == "b.py");
        for (size_t i = 0; i < result->modules.size(); ++i) {
            REQUIRE(result->modules[i].id == i);
        }
    }

    SECTION("A file that fails to parse does not stop the run") {
        REQUIRE(result->parseFailures.size() == 1);
        REQUIRE(result->parseFailures[0].path == "broken.py");
        REQUIRE(result->findModule("broken.py") == nullptr);

        auto failure = std::find_if(result->diagnostics.begin(), result->diagnostics.end(),
                                    [](const Diagnostic& d) { return d.kind == DiagnosticKind::ParseFailure; });
        REQUIRE(failure != result->diagnostics.end());
        REQUIRE(failure->path == "broken.py");

        for (const auto& function : result->functions) {
            REQUIRE(function.file != "broken.py");
        }
    }

    SECTION("Overview counts") {
        REQUIRE(result->overview.totalFiles == 4);
        REQUIRE(result->overview.failedFiles == 1);
        REQUIRE(result->overview.totalFunctions == 3);
        REQUIRE(result->overview.totalClasses == 0);
        REQUIRE(result->overview.totalLines == 2 + 11 + 1);
    }

    SECTION("Languages and project type come from every file in the tree") {
        REQUIRE(result->overview.languagesDetected == std::vector<std::string>{"JavaScript", "Python"});
        REQUIRE(result->overview.projectType == "Python Library/Package");
    }

    SECTION("Dependencies") {
        const Module* a = result->findModule("a.py");
        const Module* b = result->findModule("b.py");
        REQUIRE(a != nullptr);
        REQUIRE(b != nullptr);

        auto edges = result->dependenciesOf(a->id);
        REQUIRE(edges.size() == 2);
        REQUIRE(edges[0]->targetModule == std::optional<ModuleId>(b->id));
        REQUIRE(edges[1]->externalPackage == "requests");
        REQUIRE_FALSE(edges[1]->isInternal());

        for (const auto& edge : result->dependencies) {
            REQUIRE(edge.targetModule != std::optional<ModuleId>(edge.source));
        }
    }

    SECTION("Functions are classified and scored") {
        const Module* pipeline = result->findModule("app/pipeline.py");
        REQUIRE(pipeline != nullptr);

        auto functions = result->functionsOf(pipeline->id);
        REQUIRE(functions.size() == 3);
        REQUIRE(functions[0]->name == "main");
        REQUIRE(functions[0]->category == FunctionCategory::EntryPoint);
        REQUIRE(functions[1]->category == FunctionCategory::Processor);
        REQUIRE(functions[2]->category == FunctionCategory::Setter);
        for (const auto* function : functions) {
            REQUIRE(function->complexity == 1);
            REQUIRE(function->module == pipeline->id);
        }

        for (size_t i = 0; i < result->functions.size(); ++i) {
            REQUIRE(result->functions[i].id == i);
        }
    }

    SECTION("Flow chains") {
        REQUIRE(result->flowChains.size() == 1);
        REQUIRE(chainNames(*result, result->flowChains[0]) ==
                std::vector<std::string>{"main", "process_data", "save_results"});

        REQUIRE(result->flowPoints.size() == 3);
        REQUIRE(result->flowPoints[2].role == FlowRole::Output);
        REQUIRE(result->flowPoints[2].kind == std::string("storage"));
        REQUIRE(result->validators.empty());
    }

    SECTION("Layers and complexity summary") {
        REQUIRE(result->layers.size() == 1);
        REQUIRE(result->layers[0].directory == "app");
        REQUIRE(result->layers[0].layer == LayerKind::Business);

        REQUIRE(result->complexity.totalFunctions == 3);
        REQUIRE(result->complexity.maximum == 1);
        REQUIRE(result->complexity.highComplexity.empty());
    }

    SECTION("Timing information is available after a run") {
        REQUIRE(analyzer.getTimingInfo().find("Total time") != std::string::npos);
    }

    SECTION(".gitignore can be switched off") {
        AnalyzerOptions options = testOptions();
        options.respectGitignore = false;
        auto unfiltered = SourceAnalyzer(options).analyzeDirectory(tempDir);
        REQUIRE(unfiltered.has_value());
        REQUIRE(unfiltered->findModule("generated/models.py") != nullptr);
    }

    SECTION("Invalid root throws") {
        REQUIRE_THROWS_AS(analyzer.analyzeDirectory(tempDir / "missing"), std::runtime_error);
    }

    fs::remove_all(tempDir);
}

TEST_CASE("SourceAnalyzer results do not depend on thread count or input order", "[SourceAnalyzer]") {
    std::vector<SourceFile> files = {
        {"pkg/pipeline.py", kPipelineSource, 0},
        {"pkg/__init__.py", "from .pipeline import main\n", 0},
        {"cli.py", "import pkg\n\n\ndef run():\n    pkg.main()\n", 0},
        {"models/user.py", "class UserModel(Base):\n    def get_name(self):\n        return self.name\n", 0},
        {"broken.py", "class (:\n", 0},
    };

    auto single = SourceAnalyzer(testOptions(1)).analyze(files);
    REQUIRE(single.has_value());

    std::vector<SourceFile> reversed(files.rbegin(), files.rend());
    auto parallel = SourceAnalyzer(testOptions(4)).analyze(reversed);
    REQUIRE(parallel.has_value());

    REQUIRE(resultToJson(*single) == resultToJson(*parallel));

    REQUIRE(single->modules.size() == 4);
    REQUIRE(single->modules[0].path == "cli.py");
    REQUIRE(single->classes.size() == 1);
    REQUIRE(single->classes[0].category == ClassCategory::Model);
    REQUIRE(single->classes[0].module == single->findModule("models/user.py")->id);
}

TEST_CASE("SourceAnalyzer honors cancellation", "[SourceAnalyzer]") {
    std::vector<SourceFile> files = {
        {"a.py", "def a():\n    pass\n", 0},
        {"b.py", "def b():\n    pass\n", 0},
    };

    CancellationToken token;
    token.cancel();
    REQUIRE(token.isCancelled());

    SourceAnalyzer analyzer(testOptions(2));
    REQUIRE_FALSE(analyzer.analyze(files, &token).has_value());

    SECTION("A token that is never cancelled changes nothing") {
        CancellationToken idle;
        auto result = analyzer.analyze(files, &idle);
        REQUIRE(result.has_value());
        REQUIRE(result->functions.size() == 2);
    }
}

TEST_CASE("SourceAnalyzer handles an empty input", "[SourceAnalyzer]") {
    auto result = SourceAnalyzer(testOptions()).analyze({});
    REQUIRE(result.has_value());
    REQUIRE(result->modules.empty());
    REQUIRE(result->overview.totalFiles == 0);
    REQUIRE(result->flowChains.empty());
}
