#include <catch2/catch_test_macros.hpp>
#include "tree_extractor.hpp"
#include <string>

TEST_CASE("TreeExtractor parses valid source", "[TreeExtractor]") {
    TreeExtractor extractor;

    SECTION("Module root with definitions") {
        auto result = extractor.extract("pkg/mod.py", "import os\n\n\ndef run():\n    return os.getcwd()\n");

        REQUIRE(result.ok());
        REQUIRE_FALSE(result.failure.has_value());
        REQUIRE(result.tree->path() == "pkg/mod.py");

        const SyntaxNode& root = result.tree->root();
        REQUIRE(root.kind == NodeKind::Module);
        REQUIRE(root.children.size() == 2);
        REQUIRE(root.children[0].kind == NodeKind::ImportStatement);

        const SyntaxNode& function = root.children[1];
        REQUIRE(function.kind == NodeKind::FunctionDefinition);
        REQUIRE(function.startLine == 4);
        REQUIRE(function.endLine == 5);

        const SyntaxNode* name = function.childByField("name");
        REQUIRE(name != nullptr);
        REQUIRE(result.tree->text(*name) == "run");
        REQUIRE(function.childByField("body") != nullptr);
    }

    SECTION("Empty file is a valid module") {
        auto result = extractor.extract("empty.py", "");

        REQUIRE(result.ok());
        REQUIRE(result.tree->root().kind == NodeKind::Module);
        REQUIRE(result.tree->root().children.empty());
    }

    SECTION("The extractor can be reused") {
        REQUIRE(extractor.extract("a.py", "x = 1\n").ok());
        REQUIRE_FALSE(extractor.extract("b.py", "def broken(:\n    pass\n").ok());
        REQUIRE(extractor.extract("c.py", "y = 2\n").ok());
    }
}

TEST_CASE("TreeExtractor reports parse failures", "[TreeExtractor]") {
    TreeExtractor extractor;

    SECTION("Syntax error") {
        auto result = extractor.extract("broken.py", "def broken(:\n    pass\n");

        REQUIRE_FALSE(result.ok());
        REQUIRE(result.failure.has_value());
        REQUIRE(result.failure->path == "broken.py");
        REQUIRE(result.failure->reason.find("syntax error") != std::string::npos);
        REQUIRE(result.errorLine >= 1);
    }

    SECTION("Python 2 print statement") {
        auto result = extractor.extract("legacy.py", "import sys\n\nprint \"hello\"\n");

        REQUIRE_FALSE(result.ok());
        REQUIRE(result.failure.has_value());
        REQUIRE(result.errorLine == 3);
        REQUIRE(result.failure->reason == "syntax error at line 3: Python 2 print statement");
    }

    SECTION("Python 2 exec statement") {
        auto result = extractor.extract("legacy.py", "exec \"x = 1\"\n");

        REQUIRE_FALSE(result.ok());
        REQUIRE(result.errorLine == 1);
        REQUIRE(result.failure->reason.find("exec statement") != std::string::npos);
    }

    SECTION("print and exec calls are Python 3") {
        REQUIRE(extractor.extract("modern.py", "print(\"hello\")\nexec(\"x = 1\")\n").ok());
    }

    SECTION("Invalid UTF-8") {
        auto result = extractor.extract("latin1.py", "name = '\xe9t\xe9'\n");

        REQUIRE_FALSE(result.ok());
        REQUIRE(result.failure.has_value());
        REQUIRE(result.failure->path == "latin1.py");
        REQUIRE(result.failure->reason == "file is not valid UTF-8");
    }
}

TEST_CASE("UTF-8 validation", "[TreeExtractor]") {
    REQUIRE(isValidUtf8(""));
    REQUIRE(isValidUtf8("plain ascii"));
    REQUIRE(isValidUtf8("caf\xc3\xa9"));
    REQUIRE(isValidUtf8("\xe2\x82\xac and \xf0\x9f\x98\x80"));

    // Truncated sequence
    REQUIRE_FALSE(isValidUtf8("\xe2\x82"));
    // Overlong encoding of '/'
    REQUIRE_FALSE(isValidUtf8("\xc0\xaf"));
    // UTF-16 surrogate
    REQUIRE_FALSE(isValidUtf8("\xed\xa0\x80"));
    // Stray continuation byte
    REQUIRE_FALSE(isValidUtf8("\x80"));
}
