#include <catch2/catch_test_macros.hpp>
#include "architecture_classifier.hpp"
#include <algorithm>
#include <string>
#include <vector>

TEST_CASE("ArchitectureClassifier classifies directories", "[ArchitectureClassifier]") {
    ArchitectureClassifier classifier;

    REQUIRE(classifier.classifyDirectory("api") == LayerKind::Interface);
    REQUIRE(classifier.classifyDirectory("API_Server") == LayerKind::Interface);
    REQUIRE(classifier.classifyDirectory("models") == LayerKind::Data);
    REQUIRE(classifier.classifyDirectory("database") == LayerKind::Data);
    REQUIRE(classifier.classifyDirectory("utils") == LayerKind::Infrastructure);
    REQUIRE(classifier.classifyDirectory("config") == LayerKind::Infrastructure);
    REQUIRE(classifier.classifyDirectory("components") == LayerKind::Presentation);
    REQUIRE(classifier.classifyDirectory("tests") == LayerKind::Test);
    REQUIRE(classifier.classifyDirectory("core") == LayerKind::Business);
}

TEST_CASE("ArchitectureClassifier builds layer records", "[ArchitectureClassifier]") {
    ArchitectureClassifier classifier;

    const std::vector<std::string> paths = {
        "tests/test_engine.py",
        "api/routes.py",
        "core/engine.py",
        "api/views/home.py",
        "main.py",
        ".hidden/tool.py",
    };

    auto layers = classifier.classifyLayers(paths);

    REQUIRE(layers.size() == 3);
    REQUIRE(layers[0] == ArchitectureLayer{"api", LayerKind::Interface, 2});
    REQUIRE(layers[1] == ArchitectureLayer{"core", LayerKind::Business, 1});
    REQUIRE(layers[2] == ArchitectureLayer{"tests", LayerKind::Test, 1});

    SECTION("Files at the root produce no layers") {
        REQUIRE(classifier.classifyLayers({"main.py", "setup.py"}).empty());
    }
}

TEST_CASE("ArchitectureClassifier detects architecture patterns", "[ArchitectureClassifier]") {
    ArchitectureClassifier classifier;

    SECTION("MVC layout") {
        auto patterns = classifier.detectPatterns({"models/user.py", "views/home.py", "controllers/auth.py"});
        REQUIRE(patterns == std::vector<std::string>{"MVC", "Repository"});
    }

    SECTION("Clean architecture layout") {
        auto patterns = classifier.detectPatterns({"domain/order.py", "Infrastructure/db.py"});
        REQUIRE(patterns == std::vector<std::string>{"Clean Architecture"});
    }

    SECTION("Nothing recognizable") {
        REQUIRE(classifier.detectPatterns({"core/engine.py", "main.py"}).empty());
    }
}

TEST_CASE("ArchitectureClassifier accepts custom rules", "[ArchitectureClassifier]") {
    LayerRuleTable rules;
    rules.rules.push_back({{"core"}, LayerKind::Data});

    std::vector<PatternIndicator> patterns = {PatternIndicator{"Plugins", {"plugins"}}};
    ArchitectureClassifier classifier(rules, patterns);

    REQUIRE(classifier.classifyDirectory("core") == LayerKind::Data);
    REQUIRE(classifier.classifyDirectory("api") == LayerKind::Business);
    REQUIRE(classifier.detectPatterns({"plugins/csv.py"}) == std::vector<std::string>{"Plugins"});
}

TEST_CASE("Top-level directories", "[ArchitectureClassifier]") {
    auto directories = ArchitectureClassifier::topLevelDirectories({"b/x.py", "a/y.py", "b/z/w.py", "root.py"});
    REQUIRE(directories == std::vector<std::string>{"a", "b"});
}
