#include <catch2/catch_test_macros.hpp>
#include "analyzer_options.hpp"
#include "test_helpers.hpp"
#include <filesystem>
#include <stdexcept>

using json = nlohmann::json;
namespace fs = std::filesystem;

TEST_CASE("AnalyzerOptions defaults", "[AnalyzerOptions]") {
    AnalyzerOptions options;

    REQUIRE(options.includePatterns == "*.py");
    REQUIRE(options.excludePatterns.empty());
    REQUIRE(options.sourceExtensions == std::vector<std::string>{".py"});
    REQUIRE(options.respectGitignore);
    REQUIRE_FALSE(options.verbose);
    REQUIRE(options.maxFlowDepth == 4);
    REQUIRE(options.maxFlowChains == 200);
    REQUIRE(options.highComplexityThreshold == 10);
}

TEST_CASE("AnalyzerOptions from JSON", "[AnalyzerOptions]") {
    SECTION("Keys under an analysis section") {
        json config = {
            {"analysis", {
                {"include_patterns", {"*.py", "scripts/*"}},
                {"exclude_patterns", "tests/**"},
                {"max_flow_depth", 6},
                {"num_threads", 3},
                {"verbose", true}
            }}
        };

        AnalyzerOptions options = analyzerOptionsFromJson(config);
        REQUIRE(options.includePatterns == "*.py,scripts/*");
        REQUIRE(options.excludePatterns == "tests/**");
        REQUIRE(options.maxFlowDepth == 6);
        REQUIRE(options.numThreads == 3);
        REQUIRE(options.verbose);
        REQUIRE(options.maxFlowChains == 200);
    }

    SECTION("Keys at top level") {
        json config = {
            {"respect_gitignore", false},
            {"source_extensions", {".py", ".pyi"}},
            {"high_complexity_threshold", 15}
        };

        AnalyzerOptions options = analyzerOptionsFromJson(config);
        REQUIRE_FALSE(options.respectGitignore);
        REQUIRE(options.sourceExtensions == std::vector<std::string>{".py", ".pyi"});
        REQUIRE(options.highComplexityThreshold == 15);
        REQUIRE(options.includePatterns == "*.py");
    }

    SECTION("Zero threads means one") {
        AnalyzerOptions options = analyzerOptionsFromJson(json{{"num_threads", 0}});
        REQUIRE(options.numThreads == 1);
    }

    SECTION("Invalid values are rejected") {
        REQUIRE_THROWS_AS(analyzerOptionsFromJson(json::array()), std::runtime_error);
        REQUIRE_THROWS_AS(analyzerOptionsFromJson(json{{"analysis", 5}}), std::runtime_error);
        REQUIRE_THROWS_AS(analyzerOptionsFromJson(json{{"max_flow_depth", "deep"}}), std::runtime_error);
        REQUIRE_THROWS_AS(analyzerOptionsFromJson(json{{"max_flow_depth", 1}}), std::runtime_error);
        REQUIRE_THROWS_AS(analyzerOptionsFromJson(json{{"include_patterns", {1, 2}}}), std::runtime_error);
    }
}

TEST_CASE("AnalyzerOptions from a config file", "[AnalyzerOptions]") {
    fs::path tempDir = fs::temp_directory_path() / "flowmap_options_test";
    fs::remove_all(tempDir);
    fs::create_directory(tempDir);

    SECTION("Valid file") {
        createTestFile(tempDir / "flowmap.json", R"({"analysis": {"max_flow_chains": 50}})");
        AnalyzerOptions options = loadAnalyzerOptions(tempDir / "flowmap.json");
        REQUIRE(options.maxFlowChains == 50);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(loadAnalyzerOptions(tempDir / "missing.json"), std::runtime_error);
    }

    SECTION("Malformed JSON") {
        createTestFile(tempDir / "broken.json", "{\"analysis\": ");
        REQUIRE_THROWS_AS(loadAnalyzerOptions(tempDir / "broken.json"), std::runtime_error);
    }

    fs::remove_all(tempDir);
}
