#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "complexity_calculator.hpp"
#include "test_helpers.hpp"
#include <string>

namespace {

int complexityOf(const std::string& source, const std::string& qualifiedName) {
    ParsedSource parsed(source);
    REQUIRE(parsed.ok());
    const SyntaxNode* node = parsed.functionNode(qualifiedName);
    REQUIRE(node != nullptr);
    return ComplexityCalculator().complexity(*node);
}

FunctionInfo functionWithComplexity(FunctionId id, int complexity) {
    FunctionInfo function;
    function.id = id;
    function.name = "f" + std::to_string(id);
    function.complexity = complexity;
    return function;
}

} // namespace

TEST_CASE("ComplexityCalculator counts branch points", "[ComplexityCalculator]") {
    SECTION("Straight-line body") {
        REQUIRE(complexityOf("def f():\n    pass\n", "f") == 1);
    }

    SECTION("One per if statement") {
        const std::string source =
            "def f(a, b, c):\n"
            "    if a:\n"
            "        pass\n"
            "    if b:\n"
            "        pass\n"
            "    if c:\n"
            "        pass\n";
        REQUIRE(complexityOf(source, "f") == 4);
    }

    SECTION("elif counts, else does not") {
        const std::string source =
            "def f(x):\n"
            "    if x == 1:\n"
            "        return 1\n"
            "    elif x == 2:\n"
            "        return 2\n"
            "    else:\n"
            "        return 3\n";
        REQUIRE(complexityOf(source, "f") == 3);
    }

    SECTION("Loops") {
        const std::string source =
            "def f(items, n):\n"
            "    for item in items:\n"
            "        print(item)\n"
            "    while n:\n"
            "        n -= 1\n";
        REQUIRE(complexityOf(source, "f") == 3);
    }

    SECTION("Each except clause counts, finally does not") {
        const std::string source =
            "def f():\n"
            "    try:\n"
            "        run()\n"
            "    except ValueError:\n"
            "        pass\n"
            "    except KeyError:\n"
            "        pass\n"
            "    finally:\n"
            "        cleanup()\n";
        REQUIRE(complexityOf(source, "f") == 3);
    }

    SECTION("Boolean operators") {
        REQUIRE(complexityOf("def f(a, b, c):\n    return a and b or c\n", "f") == 3);
    }

    SECTION("Comprehension filters and conditional expressions") {
        REQUIRE(complexityOf("def f(xs):\n    return [x for x in xs if x] if xs else []\n", "f") == 3);
    }

    SECTION("Private helper with an if and a loop") {
        const std::string source =
            "def _save_report(items):\n"
            "    if items:\n"
            "        pass\n"
            "    for item in items:\n"
            "        print(item)\n";
        REQUIRE(complexityOf(source, "_save_report") == 3);
    }
}

TEST_CASE("ComplexityCalculator scores nested definitions separately", "[ComplexityCalculator]") {
    const std::string source =
        "def outer(a):\n"
        "    if a:\n"
        "        pass\n"
        "\n"
        "    def inner(b, c):\n"
        "        if b:\n"
        "            pass\n"
        "        if c:\n"
        "            pass\n"
        "\n"
        "    class Local:\n"
        "        def method(self, d):\n"
        "            while d:\n"
        "                d -= 1\n"
        "\n"
        "    return inner\n";

    ParsedSource parsed(source);
    REQUIRE(parsed.ok());

    ComplexityCalculator calculator;
    REQUIRE(calculator.complexity(*parsed.functionNode("outer")) == 2);
    REQUIRE(calculator.complexity(*parsed.functionNode("outer.inner")) == 3);
    REQUIRE(calculator.complexity(*parsed.functionNode("outer.Local.method")) == 2);
}

TEST_CASE("Branch point kinds", "[ComplexityCalculator]") {
    REQUIRE(ComplexityCalculator::isBranchPoint(NodeKind::IfStatement));
    REQUIRE(ComplexityCalculator::isBranchPoint(NodeKind::ExceptClause));
    REQUIRE_FALSE(ComplexityCalculator::isBranchPoint(NodeKind::ElseClause));
    REQUIRE_FALSE(ComplexityCalculator::isBranchPoint(NodeKind::WithStatement));
    REQUIRE_FALSE(ComplexityCalculator::isBranchPoint(NodeKind::FunctionDefinition));
}

TEST_CASE("Complexity summary", "[ComplexityCalculator]") {
    SECTION("No functions") {
        auto summary = summarizeComplexity({}, 10);
        REQUIRE(summary.totalFunctions == 0);
        REQUIRE(summary.maximum == 0);
        REQUIRE(summary.highComplexity.empty());
    }

    SECTION("Average, maximum and high-complexity list") {
        std::vector<FunctionInfo> functions = {
            functionWithComplexity(0, 1),
            functionWithComplexity(1, 3),
            functionWithComplexity(2, 12),
            functionWithComplexity(3, 10),
        };

        auto summary = summarizeComplexity(functions, 10);
        REQUIRE(summary.totalFunctions == 4);
        REQUIRE(summary.maximum == 12);
        REQUIRE_THAT(summary.average, Catch::Matchers::WithinAbs(6.5, 1e-9));
        // Strictly above the threshold
        REQUIRE(summary.highComplexity == std::vector<FunctionId>{2});
    }
}
